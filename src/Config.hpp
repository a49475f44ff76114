/*
	Copyright (c) 2018 Ereb @ habrahabr.ru

	This source code is distributed under the MIT license.
	See LICENSE.MIT for details.
*/
#pragma once
#include "Precompiled.hpp"

/*
	Server configuration, read from a JSON file:

	{
	    "port": 31524,
	    "userDatabase": "~/tictactoe/users.json"
	}
*/
struct Config
{
	//TCP port to listen on, 1024..65535
	unsigned short port;
	//path of the UserDatabase file, "~" already expanded
	std::string user_database;
};

//throws std::runtime_error with a printable message on any problem
Config load_config( const std::string& path );
