/*
	Copyright (c) 2018 Ereb @ habrahabr.ru

	This source code is distributed under the MIT license.
	See LICENSE.MIT for details.
*/
#pragma once
#include "Precompiled.hpp"

#include "Player.hpp"

/*
	Room class runs one tic-tac-toe match. It stores up to two Players in
	join order, the Client IDs of all viewers, the 3x3 board and the turn.

	A Room is Waiting until the second player sits down, InProgress while
	the match runs and Finished after a win, a draw or a forfeit. Finished
	is terminal: every operation after it answers AlreadyFinished.

	The Room does not talk to Clients. Every operation returns a Result and
	the Lobby composes and sends the frames, using members() as the target
	list for broadcasts.
*/
class Room
{
private:
	typedef std::vector<unsigned int> IdVector;

public:
	explicit Room( const std::string& name );

	enum { board_size = 3, cell_count = board_size * board_size, max_players = 2 };

	enum Status { Waiting, InProgress, Finished };

	enum Outcome { NoOutcome, Win, Draw, ForfeitWin };

	enum Result
	{
		Seated,         //player added, still waiting for an opponent
		Started,        //second player added, match begun
		RoomFull,
		Watching,       //viewer added
		Ignored,        //move not applied (not this connection's turn, not started)
		Placed,         //move applied, turn passed to the opponent
		Won,
		Drawn,
		Forfeited,
		Abandoned,      //only player left a waiting room
		NotAPlayer,
		AlreadyFinished
	};

	const std::string&       name() const { return m_name;    };
	Status                 status() const { return m_status;  };
	const std::vector<Player>& players() const { return m_players; };
	const IdVector&       viewers() const { return m_viewers; };
	Outcome               outcome() const { return m_outcome; };

	//user name of the winner, empty unless outcome is Win or ForfeitWin
	const std::string& winner() const { return m_winner; };

	bool is_full() const { return max_players == m_players.size(); };
	bool has_player( unsigned int id ) const;
	bool has_viewer( unsigned int id ) const;

	//players first (join order), then viewers; every ID once
	IdVector members() const;

	//nine characters, row by row: '0' empty, '1' Marker1, '2' Marker2
	std::string board() const;
	Player::Marker cell( unsigned int column, unsigned int row ) const;

	//nullptr unless InProgress
	const Player* turn()     const;
	const Player* opponent() const;

	Result add_player( unsigned int id, const std::string& name );
	Result add_viewer( unsigned int id );
	void   remove_viewer( unsigned int id );

	//column and row must be 0..2, throws std::out_of_range otherwise
	Result place  ( unsigned int id, unsigned int column, unsigned int row );
	Result forfeit( unsigned int id );

	//drops all players and viewers, the Room stays Finished
	void close();

private:
	bool has_triple( Player::Marker marker ) const;
	bool board_full() const;
	void finish( Outcome outcome, const Player* winner );

	const std::string m_name;
	Status            m_status;
	std::vector<Player> m_players;
	IdVector          m_viewers;

	std::array<Player::Marker, cell_count> m_board;

	//index into m_players, valid while InProgress
	size_t m_turn;

	Outcome     m_outcome;
	std::string m_winner;
};
