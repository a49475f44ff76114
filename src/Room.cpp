/*
	Copyright (c) 2018 Ereb @ habrahabr.ru

	This source code is distributed under the MIT license.
	See LICENSE.MIT for details.
*/
#include "Precompiled.hpp"

#include "Room.hpp"

namespace
{
	//board indices of the three rows, three columns and two diagonals
	const unsigned int triples[8][3] =
	{
		{ 0, 1, 2 }, { 3, 4, 5 }, { 6, 7, 8 },
		{ 0, 3, 6 }, { 1, 4, 7 }, { 2, 5, 8 },
		{ 0, 4, 8 }, { 2, 4, 6 }
	};
}


Room::Room( const std::string& name ) :
	m_name( name ), m_status( Waiting ), m_turn( 0 ), m_outcome( NoOutcome )
{
	m_players.reserve( max_players );
	m_board.fill( Player::Empty );
}


bool Room::has_player( unsigned int id ) const
{
	return m_players.end() != std::find_if( m_players.begin(), m_players.end(),
		[id]( const Player& p ) { return p.id() == id; } );
}

bool Room::has_viewer( unsigned int id ) const
{
	return m_viewers.end() != std::find( m_viewers.begin(), m_viewers.end(), id );
}


Room::IdVector Room::members() const
{
	IdVector ids;
	ids.reserve( m_players.size() + m_viewers.size() );
	for ( const auto& p : m_players ) ids.push_back( p.id() );
	for ( const auto v_id : m_viewers )
	{
		if ( has_player( v_id ) ) continue;
		ids.push_back( v_id );
	}
	return ids;
}


std::string Room::board() const
{
	std::string s( cell_count, '0' );
	for ( size_t i = 0; i < cell_count; ++i )
	{
		s[i] = static_cast<char>( '0' + m_board[i] );
	}
	return s;
}

Player::Marker Room::cell( unsigned int column, unsigned int row ) const
{
	if ( board_size <= column || board_size <= row ) throw std::out_of_range( "Room::cell() -- no such cell" );
	return m_board[row * board_size + column];
}


const Player* Room::turn() const
{
	if ( InProgress != m_status ) return nullptr;
	return &m_players[m_turn];
}

const Player* Room::opponent() const
{
	if ( InProgress != m_status ) return nullptr;
	return &m_players[1 - m_turn];
}


/*
	Seats a player. The second player starts the match, the player who
	joined first has the first turn.
*/
Room::Result Room::add_player( unsigned int id, const std::string& name )
{
	if ( Finished == m_status ) return AlreadyFinished;
	if ( is_full() )            return RoomFull;

	//a viewer taking a seat stops being a viewer
	remove_viewer( id );

	const auto marker = m_players.empty() ? Player::Marker1 : Player::Marker2;
	m_players.emplace_back( id, name, marker );

	if ( !is_full() ) return Seated;

	m_turn   = 0;
	m_status = InProgress;
	return Started;
}


Room::Result Room::add_viewer( unsigned int id )
{
	if ( Finished == m_status ) return AlreadyFinished;
	if ( !has_viewer( id ) ) m_viewers.push_back( id );
	return Watching;
}


void Room::remove_viewer( unsigned int id )
{
	m_viewers.erase( std::remove( m_viewers.begin(), m_viewers.end(), id ), m_viewers.end() );
}


/*
	Applies a move of the connection holding the turn. Cell occupancy is
	not checked: a marker placed onto a taken cell replaces the one there.
	Moves from anyone else and moves before the match started leave the
	board untouched; the caller re-broadcasts the board in that case.
*/
Room::Result Room::place( unsigned int id, unsigned int column, unsigned int row )
{
	if ( board_size <= column || board_size <= row ) throw std::out_of_range( "Room::place() -- no such cell" );

	if ( Finished   == m_status ) return AlreadyFinished;
	if ( InProgress != m_status ) return Ignored;

	const auto& mover = m_players[m_turn];
	if ( mover.id() != id ) return Ignored;

	m_board[row * board_size + column] = mover.marker();

	if ( has_triple( mover.marker() ) )
	{
		finish( Win, &mover );
		return Won;
	}
	if ( board_full() )
	{
		finish( Draw, nullptr );
		return Drawn;
	}

	m_turn = 1 - m_turn;
	return Placed;
}


/*
	The opponent of a forfeiting player wins. A player leaving a room
	which is still waiting for an opponent closes it without outcome.
*/
Room::Result Room::forfeit( unsigned int id )
{
	if ( Finished == m_status ) return AlreadyFinished;
	if ( !has_player( id ) )    return NotAPlayer;

	if ( Waiting == m_status )
	{
		finish( NoOutcome, nullptr );
		return Abandoned;
	}

	const auto& winner = m_players[0].id() == id ? m_players[1] : m_players[0];
	finish( ForfeitWin, &winner );
	return Forfeited;
}


void Room::close()
{
	m_status = Finished;
	m_players.clear();
	m_viewers.clear();
}


bool Room::has_triple( Player::Marker marker ) const
{
	for ( const auto& t : triples )
	{
		if ( m_board[t[0]] == marker && m_board[t[1]] == marker && m_board[t[2]] == marker ) return true;
	}
	return false;
}

bool Room::board_full() const
{
	return m_board.end() == std::find( m_board.begin(), m_board.end(), Player::Empty );
}


void Room::finish( Outcome outcome, const Player* winner )
{
	m_status  = Finished;
	m_outcome = outcome;
	if ( winner ) m_winner = winner->name();
}
