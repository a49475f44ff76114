/*
	Copyright (c) 2018 Ereb @ habrahabr.ru

	This source code is distributed under the MIT license.
	See LICENSE.MIT for details.
*/
#pragma once
#include "Precompiled.hpp"

/*
	Player class stores one seat of a Room: the Client ID of the connection
	and the user name it was authenticated with when it sat down. The marker
	is fixed by the seat order: the first player to join plays Marker1 and
	moves first, the second one plays Marker2.
*/
class Player
{
public:
	enum Marker { Empty = 0, Marker1 = 1, Marker2 = 2 };

	Player( unsigned int id, const std::string& name, Marker marker ) :
		m_id( id ), m_name( name ), m_marker( marker )
	{};

	unsigned int       id()     const { return m_id;     };
	const std::string& name()   const { return m_name;   };
	Marker             marker() const { return m_marker; };

	//'1' or '2', as written into the board string
	char symbol() const { return static_cast<char>( '0' + m_marker ); };

private:
	unsigned int m_id;
	std::string  m_name;
	Marker       m_marker;
};
