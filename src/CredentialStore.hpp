/*
	Copyright (c) 2018 Ereb @ habrahabr.ru

	This source code is distributed under the MIT license.
	See LICENSE.MIT for details.
*/
#pragma once
#include "Precompiled.hpp"

/*
	Provides user verification and registration for the Lobby.
	See UserDatabase class for the file backed implementation.
*/
class CredentialStore
{
public:
	//values double as LOGIN acknowledgement codes
	enum Verdict { Ok = 0, NoSuchUser = 1, WrongPassword = 2 };

	virtual ~CredentialStore() {};
	virtual Verdict verify( const std::string& username, const std::string& password ) const = 0;
	virtual bool    exists( const std::string& username ) const = 0;

	//persists a new user; throws std::runtime_error if that fails,
	//in which case the user is not added
	virtual void add( const std::string& username, const std::string& password ) = 0;
};
