/*
	Copyright (c) 2018 Ereb @ habrahabr.ru

	This source code is distributed under the MIT license.
	See LICENSE.MIT for details.
*/
#pragma once
#include "Precompiled.hpp"

#include "Client.hpp"
#include "Lobby.hpp"
#include "Packet.hpp"

using namespace asio::ip;

/*
	Session class provides asynchronous reading and writing for one TCP
	connection. Every read delivers whatever bytes are available; the
	FrameReader cuts them into frames which are handed to the Lobby one
	after another before the next read is started. It stores the Client ID
	(assigned by the Lobby on connection), and a local queue of shared
	pointers to outgoing frames. The pointers are shared with other targeted
	Clients and ensure that the frame stays alive until every Session
	finishes the async_write() and pop's the pointer from it's local queue.
*/
class Session : public Client, public std::enable_shared_from_this<Session>
{
public:
	Session( tcp::socket socket, Lobby& lobby );

	void start();

	void set_id( unsigned int id ) override { m_client_id = id; };

	unsigned int       id()      const override { return m_client_id;      };
	const std::string& address() const override { return m_client_address; };

	void queue_frame( const FramePtr& frame ) override;
	void close() override;

	enum { read_chunk_size = 8192 };

private:
	void do_read();
	void do_send_frame();
	void drop( const char* what, const asio::error_code& ec );

	unsigned int m_client_id;
	std::string  m_client_address;
	tcp::socket  m_socket;
	Lobby&       m_lobby;
	bool         m_closed;

	std::array<char, read_chunk_size> m_chunk;
	FrameReader                       m_reader;

	std::deque<FramePtr> m_frame_queue;
};
