/*
	Copyright (c) 2018 Ereb @ habrahabr.ru

	This source code is distributed under the MIT license.
	See LICENSE.MIT for details.
*/
#pragma once
#include "Precompiled.hpp"

/*
	The FrameReader collects the raw bytes a Session receives and cuts them
	into newline terminated frames. A read may deliver half a frame or
	several frames at once; everything after the last newline stays pending
	until the next read.
*/
class FrameReader
{
public:
	enum { max_frame_size = 8192 };

	void append( const char* data, size_t size ) { m_pending.append( data, size ); };

	//extracts the next complete frame without newline and surrounding
	//whitespace, skips blank lines; returns false if no frame is complete
	bool next( std::string& frame );

	//true if the pending bytes can no longer become a legal frame
	bool overflow() const { return max_frame_size < m_pending.size(); };

private:
	std::string m_pending;
};


/*
	The Packet class wraps one text frame: "KEYWORD:field:field...".
	Inbound, it splits the frame at colons, maps the keyword onto the closed
	Command set and provides sequential reading of the remaining fields.
	Outbound, the static functions build every frame the server sends,
	always terminated by a single newline.

	Clients (and tests) can wrap server events the same way; keyword()
	returns the raw first field for frames that are no client command.
*/
class Packet
{
public:
	Packet( const std::string& frame, unsigned int source_id = 0 );

	enum Command { Unknown, Login, Register, RoomList, Create, Join, Place, Forfeit };

	//client ID of the sender, set in constructor
	unsigned int source() const { return m_source_id; };

	Command            cmd()     const { return m_cmd;       };
	const std::string& keyword() const { return m_fields[0]; };

	//number of fields after the keyword
	size_t size() const { return m_fields.size() - 1; };

	//fields after the keyword, 0-based
	const std::string& arg( size_t i ) const { return m_fields.at( i + 1 ); };

	//sequential access to the fields after the keyword
	const std::string& read_field();

	static Command command_of( const std::string& keyword );
	static const char* keyword_of( Command cmd );

	//accepts exactly one digit 0..2 (board column or row)
	static bool parse_cell( const std::string& field, unsigned int& value );

	//<KEYWORD>:ACKSTATUS:<status>
	static std::string ack( Command cmd, unsigned int status );
	//ROOMLIST:ACKSTATUS:0:<name>,<name>...
	static std::string room_list( const std::vector<std::string>& names );

	static std::string begin      ( const std::string& player1, const std::string& player2 );
	static std::string in_progress( const std::string& current, const std::string& opponent );
	static std::string board_status( const std::string& board );

	enum EndKind { Win = 0, Draw = 1, ForfeitWin = 2 };
	//winner is omitted for Draw
	static std::string game_end( const std::string& board, EndKind kind, const std::string& winner = "" );

	static std::string game_over();//terminal-state notice
	static std::string bad_auth();
	static std::string no_room();
	static std::string unknown_command();

#ifndef NDEBUG
	friend std::ostream& operator<< ( std::ostream &out, const Packet &p );
#endif

private:
	static std::string join( const std::vector<std::string>& fields );

	const unsigned int m_source_id;//from client session id

	std::vector<std::string> m_fields;//keyword included, never empty
	Command                  m_cmd;
	size_t                   m_seek_pos;
};
