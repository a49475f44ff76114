/*
	Copyright (c) 2018 Ereb @ habrahabr.ru

	This source code is distributed under the MIT license.
	See LICENSE.MIT for details.
*/
#pragma once
#include "Precompiled.hpp"

#include "Client.hpp"
#include "CredentialStore.hpp"
#include "Packet.hpp"
#include "RoomDirectory.hpp"
#include "SessionRegistry.hpp"

/*
	The Lobby routes every decoded command to the SessionRegistry, the
	RoomDirectory or a Room and sends the resulting frames. All calls
	come from the io_service thread, one frame at a time, so each command
	sees and leaves the rooms in a consistent state.
*/
class Lobby
{
public:
	explicit Lobby( CredentialStore& credentials ) : m_credentials( credentials ) {};

	void connect      ( std::shared_ptr<Client> client );
	void disconnect   ( std::shared_ptr<Client> client );
	void process_frame( std::shared_ptr<Client> client, const std::string& frame );

	const SessionRegistry& sessions() const { return m_sessions; };
	const RoomDirectory&   rooms()    const { return m_rooms;    };

	enum { min_password_length = 6 };

	//extra acknowledgement codes beyond the RoomDirectory/CredentialStore ones
	enum { create_malformed = 4, create_already_seated = 5 };
	enum { join_ok = 0, join_no_room = 1, join_full = 2, join_bad_mode = 3, join_already_seated = 4 };
	enum { register_ok = 0, register_duplicate = 1, register_malformed = 2, register_short_password = 3, register_not_alnum = 4 };
	enum { login_malformed = 3 };
	enum { roomlist_bad_mode = 1 };

private:
	void handle_login   ( Packet& p );
	void handle_register( Packet& p );
	void handle_roomlist( Packet& p );
	void handle_create  ( Packet& p );
	void handle_join    ( Packet& p );
	void handle_place   ( Packet& p );
	void handle_forfeit ( Packet& p );

	//sends BADAUTH and returns nullptr for anonymous connections
	const std::string* require_login( unsigned int id ) const;

	//broadcasts GAMEEND for a Finished room and removes it
	void end_match( Room& room );

	void send( const std::string& frame, unsigned int id ) const;
	void send( const std::string& frame, const Room& room ) const;

	CredentialStore& m_credentials;
	SessionRegistry  m_sessions;
	RoomDirectory    m_rooms;
};
