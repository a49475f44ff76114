/*
	Copyright (c) 2018 Ereb @ habrahabr.ru

	This source code is distributed under the MIT license.
	See LICENSE.MIT for details.
*/
#include "Precompiled.hpp"

#include "Server.hpp"
#include "Session.hpp"

using namespace asio::ip;

/*
	Creates Asio TCP acceptor on the configured port, starts recursive
	asynchronous connection acceptor.
*/
Server::Server( asio::io_service& io_service, const Config& config, CredentialStore& credentials ) :
	m_acceptor( io_service ),
	m_socket  ( io_service ),
	m_lobby   ( credentials )
{
	const tcp::endpoint endpoint( tcp::v4(), config.port );
	m_acceptor.open( endpoint.protocol() );
	m_acceptor.set_option( tcp::acceptor::reuse_address( true ) );
	m_acceptor.bind( endpoint );
	m_acceptor.listen();
	do_accept();
}


void Server::stop()
{
	asio::error_code ec;
	m_acceptor.close( ec );
}


/*
	Recursive asynchronous connection acceptor. For details see
	https://github.com/chriskohlhoff/asio/tree/master/asio/src/examples
*/
void Server::do_accept()
{
	m_acceptor.async_accept( m_socket,
	[this]( std::error_code ec )
	{
		if ( !ec )
		{
			auto session = std::make_shared<Session>( std::move( m_socket ), m_lobby );
			std::cout << "Client connected:    " << std::setfill(' ') << std::setw(15) << std::right
			          << session->address() << std::endl;
			session->start();
		}
		else if ( asio::error::operation_aborted == ec )
		{
			//acceptor closed on shutdown
			return;
		}
		else
		{
			std::cerr << "[ERROR] Could not accept connection: " << ec.message() << "\n";
		}
		do_accept();
	} );
}
