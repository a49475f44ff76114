/*
	A networked tic-tac-toe game server: user accounts, named game rooms
	with two players and any number of viewers, turn-based matches.

	Copyright (c) 2018 Ereb @ habrahabr.ru
	This source code is distributed under the MIT license.
	See LICENSE.MIT for details.

	Asio C++ Library (c) 2003-2018 Christopher M. Kohlhoff
*/
#include "Precompiled.hpp"

#include <csignal>

#include "Config.hpp"
#include "Server.hpp"
#include "UserDatabase.hpp"

int main( int argc, char* argv[] )
{
	if ( 2 != argc )
	{
		std::cerr << "Error: Expecting 1 argument: <server config path>" << std::endl;
		return 1;
	}

	std::cout << "Tic-Tac-Toe Server starting up...";
	try
	{
		const auto config = load_config( argv[1] );
		UserDatabase users( config.user_database );

		//see asio examples for details about library usage
		//https://github.com/chriskohlhoff/asio/tree/master/asio/src/examples
		asio::io_service io_service;
		Server server( io_service, config, users );

		asio::signal_set signals( io_service, SIGINT, SIGTERM );
		signals.async_wait(
		[&]( const asio::error_code&, int )
		{
			std::cout << "Server shutting down." << std::endl;
			server.stop();
			io_service.stop();
		} );

		std::cout << " running on port " << server.port()
		          << " with " << users.size() << " registered users" << std::endl;
		io_service.run();
	}
	catch ( std::exception& e )
	{
		std::cout << std::endl;
		std::cerr << e.what() << "\n";
		return 1;
	}

	return 0;
}
