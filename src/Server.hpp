/*
	Copyright (c) 2018 Ereb @ habrahabr.ru

	This source code is distributed under the MIT license.
	See LICENSE.MIT for details.
*/
#pragma once
#include "Precompiled.hpp"

#include "Config.hpp"
#include "Session.hpp"

using namespace asio::ip;

class Server
{
public:
	Server( asio::io_service& io_service, const Config& config, CredentialStore& credentials );

	unsigned short port() const { return m_acceptor.local_endpoint().port(); };

	//stops accepting; running Sessions are not touched
	void stop();

private:
	void do_accept();

	tcp::acceptor m_acceptor;
	tcp::socket   m_socket;
	Lobby         m_lobby;
};
