/*
	Copyright (c) 2018 Ereb @ habrahabr.ru

	This source code is distributed under the MIT license.
	See LICENSE.MIT for details.
*/
#pragma once
#include "Precompiled.hpp"

#include <nlohmann/json.hpp>

#include "CredentialStore.hpp"

/*
	UserDatabase keeps the registered users in a JSON file:

	[
	    { "username": "alice", "password": "pbkdf2-sha256$100000$<salt>$<hash>" },
	    ...
	]

	The whole file is loaded on construction and rewritten after every
	registration. Passwords are stored as salted PBKDF2-HMAC-SHA256 hashes.
*/
class UserDatabase : public CredentialStore
{
public:
	//throws std::runtime_error if the file cannot be read or is no JSON array
	explicit UserDatabase( const std::string& path );

	Verdict verify( const std::string& username, const std::string& password ) const override;
	bool    exists( const std::string& username ) const override;
	void    add   ( const std::string& username, const std::string& password ) override;

	size_t size() const { return m_users.size(); };

	//hashing runs on the io_service thread: every LOGIN and REGISTER holds
	//up all other connections for the duration of one PBKDF2 run
	enum { pbkdf2_iterations = 100000, salt_size = 16, hash_size = 32 };

	//"pbkdf2-sha256$<iterations>$<salt hex>$<hash hex>" with a random salt
	static std::string hash_password( const std::string& password );
	//false for wrong passwords and for hashes in an unknown format
	static bool check_password( const std::string& password, const std::string& stored );

private:
	const nlohmann::json* find_user( const std::string& username ) const;
	void save() const;

	const std::string m_path;
	nlohmann::json    m_users;//array of { username, password }
};
