/*
	Copyright (c) 2018 Ereb @ habrahabr.ru

	This source code is distributed under the MIT license.
	See LICENSE.MIT for details.
*/
#include "Precompiled.hpp"

#include "Packet.hpp"

namespace
{
	const char separator = ':';

	bool is_blank( const char c )
	{
		return ' ' == c || '\t' == c || '\r' == c || '\n' == c || '\f' == c || '\v' == c;
	}
}


/*
	Cuts the next frame from the pending bytes. Leading and trailing
	whitespace (including the '\r' of CRLF line ends) is dropped.
*/
bool FrameReader::next( std::string& frame )
{
	for ( ;; )
	{
		const auto eol = m_pending.find( '\n' );
		if ( std::string::npos == eol ) return false;

		auto first = m_pending.begin();
		auto last  = m_pending.begin() + eol;
		while ( first != last && is_blank( *first ) ) ++first;
		while ( last != first && is_blank( *( last - 1 ) ) ) --last;

		frame.assign( first, last );
		m_pending.erase( 0, eol + 1 );

		if ( !frame.empty() ) return true;
	}
}


/*
	Splits the frame at every colon and resolves the command keyword.
	Empty fields are kept: "CREATE:" has one (empty) argument.
*/
Packet::Packet( const std::string& frame, unsigned int source_id ):
	m_source_id( source_id ),
	m_seek_pos ( 1 )
{
	size_t start = 0;
	for ( ;; )
	{
		const auto pos = frame.find( separator, start );
		if ( std::string::npos == pos )
		{
			m_fields.push_back( frame.substr( start ) );
			break;
		}
		m_fields.push_back( frame.substr( start, pos - start ) );
		start = pos + 1;
	}
	m_cmd = command_of( m_fields[0] );
}


/*
	Overloaded output operator for debug purposes:
	Packet p(...);
	std::cout << "Packet: " << p << std::endl;
*/
#ifndef NDEBUG
std::ostream& operator<< ( std::ostream &out, const Packet &p )
{
	out << "Command: " << p.keyword() << " (" << p.size() << " args) from " << p.source();
	for ( size_t i = 0; i < p.size(); ++i ) out << "\n  [" << i << "] '" << p.arg( i ) << "'";
	out << '\n' << std::flush;
	return out;
}
#endif


/*
	Returns the field at the seek position and advances it.
	Throws std::out_of_range past the last field.
*/
const std::string& Packet::read_field()
{
	return m_fields.at( m_seek_pos++ );
}


//keywords are compared case-sensitively
Packet::Command Packet::command_of( const std::string& keyword )
{
	if      ( "LOGIN"    == keyword ) return Login;
	else if ( "REGISTER" == keyword ) return Register;
	else if ( "ROOMLIST" == keyword ) return RoomList;
	else if ( "CREATE"   == keyword ) return Create;
	else if ( "JOIN"     == keyword ) return Join;
	else if ( "PLACE"    == keyword ) return Place;
	else if ( "FORFEIT"  == keyword ) return Forfeit;
	return Unknown;
}


const char* Packet::keyword_of( Command cmd )
{
	switch ( cmd )
	{
	case Login:    return "LOGIN";
	case Register: return "REGISTER";
	case RoomList: return "ROOMLIST";
	case Create:   return "CREATE";
	case Join:     return "JOIN";
	case Place:    return "PLACE";
	case Forfeit:  return "FORFEIT";
	case Unknown:  break;
	}
	return "";
}


bool Packet::parse_cell( const std::string& field, unsigned int& value )
{
	if ( 1 != field.size() || field[0] < '0' || '2' < field[0] ) return false;
	value = static_cast<unsigned int>( field[0] - '0' );
	return true;
}


std::string Packet::join( const std::vector<std::string>& fields )
{
	std::string out;
	for ( size_t i = 0; i < fields.size(); ++i )
	{
		if ( 0 != i ) out.push_back( separator );
		out += fields[i];
	}
	out.push_back( '\n' );
	return out;
}


/*
	Frame builders. Every frame the server writes is produced here.
*/
std::string Packet::ack( Command cmd, unsigned int status )
{
	return join( { keyword_of( cmd ), "ACKSTATUS", std::to_string( status ) } );
}

std::string Packet::room_list( const std::vector<std::string>& names )
{
	std::string list;
	for ( const auto& name : names )
	{
		if ( !list.empty() ) list.push_back( ',' );
		list += name;
	}
	return join( { "ROOMLIST", "ACKSTATUS", "0", list } );
}

std::string Packet::begin( const std::string& player1, const std::string& player2 )
{
	return join( { "BEGIN", player1, player2 } );
}

std::string Packet::in_progress( const std::string& current, const std::string& opponent )
{
	return join( { "INPROGRESS", current, opponent } );
}

std::string Packet::board_status( const std::string& board )
{
	return join( { "BOARDSTATUS", board } );
}

std::string Packet::game_end( const std::string& board, EndKind kind, const std::string& winner )
{
	if ( Draw == kind ) return join( { "GAMEEND", board, std::to_string( kind ) } );
	return join( { "GAMEEND", board, std::to_string( kind ), winner } );
}

std::string Packet::game_over()       { return "GAMEEND\n";         }
std::string Packet::bad_auth()        { return "BADAUTH\n";         }
std::string Packet::no_room()         { return "NOROOM\n";          }
std::string Packet::unknown_command() { return "Unknown command\n"; }
