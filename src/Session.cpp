/*
	Copyright (c) 2018 Ereb @ habrahabr.ru

	This source code is distributed under the MIT license.
	See LICENSE.MIT for details.
*/
#include "Precompiled.hpp"

#include "Session.hpp"

using namespace asio::ip;

/*
	Obtains Asio socket, stores Lobby reference.
*/
Session::Session( tcp::socket socket, Lobby& lobby ) :
	m_client_id( 0 ),
	m_socket   ( std::move( socket ) ),
	m_lobby    ( lobby ),
	m_closed   ( false )
{
	//store IP address as string for easier output
	asio::error_code ec;
	const auto endpoint = m_socket.remote_endpoint( ec );
	m_client_address = ec ? "unknown" : endpoint.address().to_string();
}


/*
	Passes Client interface of own instance to Lobby, starts
	recursive reading.
*/
void Session::start()
{
	m_lobby.connect( shared_from_this() );
	do_read();
}


/*
	Pushes received shared pointer to local queue, starts recursive
	sending if necessary. The queue will ensure that the frame
	will live until the async_write() completes.
*/
void Session::queue_frame( const FramePtr& frame )
{
	if ( m_closed ) return;

#ifndef NDEBUG //display sent frames
	std::cout << "     " << frame->substr( 0, frame->size() - 1 ) << " --> " << id() << std::endl;
#endif

	bool queue_is_empty = m_frame_queue.empty();
	m_frame_queue.push_back( frame );
	if ( queue_is_empty )
	{
		do_send_frame();
	}
}


/*
	Shuts the socket down. Pending handlers complete with an error
	and stop the read and write chains.
*/
void Session::close()
{
	if ( m_closed ) return;
	m_closed = true;
	m_frame_queue.clear();

	asio::error_code ec;
	m_socket.shutdown( tcp::socket::shutdown_both, ec );
	m_socket.close( ec );
}


/*
	Recursively iterates through queue and calls async_write() on every
	frame. The queue element gets pop'ed after the write completes and
	allows the frame to be destroyed (if no other Session queue holds
	shared ownership to it).
*/
void Session::do_send_frame()
{
	auto self( shared_from_this() );
	const auto frame = m_frame_queue.front();
	asio::async_write( m_socket, asio::buffer( frame->data(), frame->size() ),
	[this, self, frame]( asio::error_code ec, std::size_t bytes_sent )
	{
		if ( m_closed ) return;

		if ( !ec )
		{
			if ( frame->size() != bytes_sent )
			{
				std::cerr << "[WARNING] Incomplete frame sent to " << m_client_address << "\n";
			}
			m_frame_queue.pop_front();
			if ( !m_frame_queue.empty() )
			{
				do_send_frame();
			}
		}
		else
		{
			drop( "send frame to", ec );
		}
	} );
}


/*
	Reads whatever the peer sent so far and processes every complete
	frame in it, then reads again. Detects disconnection and reports to
	Lobby, which turns it into a forfeit if a match is running.
*/
void Session::do_read()
{
	auto self( shared_from_this() );
	m_socket.async_read_some( asio::buffer( m_chunk ),
	[this, self]( asio::error_code ec, std::size_t bytes_read )
	{
		if ( m_closed ) return;

		if ( ec )
		{
			drop( "read from", ec );
			return;
		}

		m_reader.append( m_chunk.data(), bytes_read );

		std::string frame;
		while ( !m_closed && m_reader.next( frame ) )
		{
			try
			{
				m_lobby.process_frame( self, frame );
			}
			catch ( const std::out_of_range& e )
			{
				std::cerr << "[WARNING] Lobby::process_frame() -- lookup failed: " << e.what() << "\n";
			}
		}
		if ( m_closed ) return;

		if ( m_reader.overflow() )
		{
			std::cerr << "[ERROR] Frame from " << m_client_address << " exceeds "
			          << FrameReader::max_frame_size << " bytes\n";
			m_lobby.disconnect( self );
			return;
		}

		do_read();
	} );
}


/*
	Ends the Session after a transport error. EOF, reset and abort are
	ordinary disconnects and are not reported as errors. The Lobby closes
	the socket.
*/
void Session::drop( const char* what, const asio::error_code& ec )
{
	if ( asio::error::eof != ec && asio::error::connection_reset != ec &&
	     asio::error::connection_aborted != ec && asio::error::operation_aborted != ec )
	{
		std::cerr << "[ERROR] Could not " << what << " " << m_client_address << ": " << ec.message() << "\n";
	}
	m_lobby.disconnect( shared_from_this() );
}
