/*
	Copyright (c) 2018 Ereb @ habrahabr.ru

	This source code is distributed under the MIT license.
	See LICENSE.MIT for details.
*/
#include "Precompiled.hpp"

#include "Lobby.hpp"

namespace
{
	bool is_alnum( const std::string& s )
	{
		return std::all_of( s.begin(), s.end(),
			[]( const char c ) { return 0 != std::isalnum( static_cast<unsigned char>( c ) ); } );
	}

	//PLAYER or VIEWER, any case
	bool parse_mode( const std::string& field, RoomDirectory::Mode& mode )
	{
		std::string upper( field );
		std::transform( upper.begin(), upper.end(), upper.begin(),
			[]( const char c ) { return static_cast<char>( std::toupper( static_cast<unsigned char>( c ) ) ); } );

		if      ( "PLAYER" == upper ) mode = RoomDirectory::PlayerMode;
		else if ( "VIEWER" == upper ) mode = RoomDirectory::ViewerMode;
		else return false;
		return true;
	}
}


/*
	Stores the Client in the SessionRegistry, which assigns its ID.
	The connection starts out anonymous.
*/
void Lobby::connect( std::shared_ptr<Client> client )
{
	m_sessions.add( client );
}


/*
	Gracefully removes the Client from the Lobby and Rooms. A player in a
	running match forfeits it, a player alone in a waiting room closes the
	room. The Client is closed. Safe to call more than once for the same
	Client.
*/
void Lobby::disconnect( std::shared_ptr<Client> client )
{
	client->close();

	const auto id = client->id();
	if ( !m_sessions.contains( id ) ) return;

	std::cout << "Client disconnected: " << std::setfill(' ') << std::setw(15)
	          << std::right << client->address() << std::endl;

	//first, delete session so nothing is queued on the closing connection
	m_sessions.remove( id );
	m_rooms.remove_viewer( id );

	auto room = m_rooms.find_containing( id );
	if ( !room ) return;

	const auto result = room->forfeit( id );
	if ( Room::Forfeited == result )
	{
		end_match( *room );
	}
	else if ( Room::Abandoned == result )
	{
		m_rooms.remove( room->name() );
	}
}


/*
	Contains server logic regarding parsing and reaction to frames.
	Wraps the frame in a Packet and dispatches on its command.
*/
void Lobby::process_frame( std::shared_ptr<Client> client, const std::string& frame )
{
	const auto c_id = client->id();
	if ( !m_sessions.contains( c_id ) ) return;//already disconnected

	Packet p( frame, c_id );

#ifndef NDEBUG //display received frames
	std::cout << c_id << ": " << frame << std::endl;
#endif

	switch ( p.cmd() )
	{
	case Packet::Login:    handle_login   ( p ); break;
	case Packet::Register: handle_register( p ); break;
	case Packet::RoomList: handle_roomlist( p ); break;
	case Packet::Create:   handle_create  ( p ); break;
	case Packet::Join:     handle_join    ( p ); break;
	case Packet::Place:    handle_place   ( p ); break;
	case Packet::Forfeit:  handle_forfeit ( p ); break;
	case Packet::Unknown:
#ifndef NDEBUG //print frames with unknown keywords
		std::cout << "Unknown frame:\n" << p << std::endl;
#endif
		send( Packet::unknown_command(), c_id );
		break;
	}
}


/*
	LOGIN:<user>:<pass>
*/
void Lobby::handle_login( Packet& p )
{
	const auto c_id = p.source();
	if ( 2 != p.size() || p.arg( 0 ).empty() || p.arg( 1 ).empty() )
	{
		send( Packet::ack( Packet::Login, login_malformed ), c_id );
		return;
	}
	const auto username = p.read_field();
	const auto password = p.read_field();

	const auto verdict = m_credentials.verify( username, password );
	if ( CredentialStore::Ok == verdict )
	{
		m_sessions.authenticate( c_id, username );
	}
	send( Packet::ack( Packet::Login, verdict ), c_id );
}


/*
	REGISTER:<user>:<pass>
	Does not log the connection in.
*/
void Lobby::handle_register( Packet& p )
{
	const auto c_id = p.source();
	if ( 2 != p.size() || p.arg( 0 ).empty() || p.arg( 1 ).empty() )
	{
		send( Packet::ack( Packet::Register, register_malformed ), c_id );
		return;
	}
	const auto username = p.read_field();
	const auto password = p.read_field();

	unsigned int status = register_ok;
	if      ( !is_alnum( username ) || !is_alnum( password ) ) status = register_not_alnum;
	else if ( min_password_length > password.size() )         status = register_short_password;
	else if ( m_credentials.exists( username ) )                status = register_duplicate;
	else
	{
		try
		{
			m_credentials.add( username, password );
			std::cout << "User registered: " << username << std::endl;
		}
		catch ( const std::runtime_error& e )
		{
			std::cerr << "[ERROR] Could not register " << username << ": " << e.what() << "\n";
			status = register_malformed;
		}
	}
	send( Packet::ack( Packet::Register, status ), c_id );
}


/*
	ROOMLIST:<PLAYER|VIEWER>
	PLAYER lists rooms with a free seat, VIEWER every room; sorted by name.
*/
void Lobby::handle_roomlist( Packet& p )
{
	const auto c_id = p.source();
	if ( !require_login( c_id ) ) return;

	RoomDirectory::Mode mode;
	if ( 1 != p.size() || !parse_mode( p.read_field(), mode ) )
	{
		send( Packet::ack( Packet::RoomList, roomlist_bad_mode ), c_id );
		return;
	}
	send( Packet::room_list( m_rooms.list( mode ) ), c_id );
}


/*
	CREATE:<room>
	The creator takes the first seat and will move first.
*/
void Lobby::handle_create( Packet& p )
{
	const auto c_id = p.source();
	const auto username = require_login( c_id );
	if ( !username ) return;

	if ( 1 != p.size() )
	{
		send( Packet::ack( Packet::Create, create_malformed ), c_id );
		return;
	}
	if ( m_rooms.find_containing( c_id ) )
	{
		send( Packet::ack( Packet::Create, create_already_seated ), c_id );
		return;
	}

	RoomDirectory::Status status;
	const auto room = m_rooms.create( p.read_field(), c_id, *username, status );
	if ( room )
	{
		std::cout << "Room created:        '" << room->name() << "' by " << *username << std::endl;
	}
	send( Packet::ack( Packet::Create, status ), c_id );
}


/*
	JOIN:<room>:<PLAYER|VIEWER>
	The second player starts the match: BEGIN goes to everyone in the room.
	A viewer joining a running match is told whose turn it is.
*/
void Lobby::handle_join( Packet& p )
{
	const auto c_id = p.source();
	const auto username = require_login( c_id );
	if ( !username ) return;

	RoomDirectory::Mode mode;
	if ( 2 != p.size() || !parse_mode( p.arg( 1 ), mode ) )
	{
		send( Packet::ack( Packet::Join, join_bad_mode ), c_id );
		return;
	}

	const auto room = m_rooms.find( p.read_field() );
	if ( !room )
	{
		send( Packet::ack( Packet::Join, join_no_room ), c_id );
		return;
	}

	if ( RoomDirectory::ViewerMode == mode )
	{
		send( Packet::ack( Packet::Join, join_ok ), c_id );
		room->add_viewer( c_id );
		if ( Room::InProgress == room->status() )
		{
			send( Packet::in_progress( room->turn()->name(), room->opponent()->name() ), c_id );
		}
		return;
	}

	if ( m_rooms.find_containing( c_id ) )
	{
		send( Packet::ack( Packet::Join, join_already_seated ), c_id );
		return;
	}
	if ( room->is_full() )
	{
		send( Packet::ack( Packet::Join, join_full ), c_id );
		return;
	}

	send( Packet::ack( Packet::Join, join_ok ), c_id );
	if ( Room::Started == room->add_player( c_id, *username ) )
	{
		const auto& players = room->players();
		std::cout << "Match started:       '" << room->name() << "' "
		          << players[0].name() << " vs " << players[1].name() << std::endl;
		send( Packet::begin( players[0].name(), players[1].name() ), *room );
	}
}


/*
	PLACE:<col>:<row>
	A move out of turn changes nothing; the board
	is broadcast again so the sender can resync.
*/
void Lobby::handle_place( Packet& p )
{
	const auto c_id = p.source();
	if ( !require_login( c_id ) ) return;

	const auto room = m_rooms.find_containing( c_id );
	if ( !room )
	{
		send( Packet::no_room(), c_id );
		return;
	}

	unsigned int column = 0, row = 0;
	if ( 2 != p.size() || !Packet::parse_cell( p.arg( 0 ), column ) || !Packet::parse_cell( p.arg( 1 ), row ) )
	{
		send( Packet::unknown_command(), c_id );
		return;
	}

	switch ( room->place( c_id, column, row ) )
	{
	case Room::Won:
	case Room::Drawn:
		end_match( *room );
		break;
	case Room::AlreadyFinished:
		send( Packet::game_over(), c_id );
		break;
	default:
		send( Packet::board_status( room->board() ), *room );
		break;
	}
}


/*
	FORFEIT
	The opponent wins. Leaving a room that still waits for an opponent
	closes it.
*/
void Lobby::handle_forfeit( Packet& p )
{
	const auto c_id = p.source();
	if ( !require_login( c_id ) ) return;

	const auto room = m_rooms.find_containing( c_id );
	if ( !room )
	{
		send( Packet::no_room(), c_id );
		return;
	}

	switch ( room->forfeit( c_id ) )
	{
	case Room::Forfeited:
		end_match( *room );
		break;
	case Room::Abandoned:
		m_rooms.remove( room->name() );
		break;
	default:
		send( Packet::game_over(), c_id );
		break;
	}
}


const std::string* Lobby::require_login( unsigned int id ) const
{
	const auto username = m_sessions.username_of( id );
	if ( !username ) send( Packet::bad_auth(), id );
	return username;
}


void Lobby::end_match( Room& room )
{
	if ( Room::Finished != room.status() ) return;

	Packet::EndKind kind = Packet::Draw;
	if      ( Room::Win        == room.outcome() ) kind = Packet::Win;
	else if ( Room::ForfeitWin == room.outcome() ) kind = Packet::ForfeitWin;

	send( Packet::game_end( room.board(), kind, room.winner() ), room );

	std::cout << "Match finished:      '" << room.name() << "' "
	          << ( Packet::Draw == kind ? std::string( "draw" ) : room.winner() + " won" ) << std::endl;

	//copy: the name dies with the room
	const std::string name = room.name();
	m_rooms.remove( name );
}


/*
	Queues the frame for the targeted Clients. The frame is allocated once
	with shared ownership and lives until the last Session wrote it.
	Targets which are already disconnected are skipped.
*/
void Lobby::send( const std::string& frame, unsigned int id ) const
{
	const auto client = m_sessions.client( id );
	if ( !client ) return;
	client->queue_frame( std::make_shared<const std::string>( frame ) );
}

void Lobby::send( const std::string& frame, const Room& room ) const
{
	const auto frame_ptr = std::make_shared<const std::string>( frame );
	for ( const auto id : room.members() )
	{
		const auto client = m_sessions.client( id );
		if ( !client ) continue;
		client->queue_frame( frame_ptr );
	}
}
