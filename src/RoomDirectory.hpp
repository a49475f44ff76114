/*
	Copyright (c) 2018 Ereb @ habrahabr.ru

	This source code is distributed under the MIT license.
	See LICENSE.MIT for details.
*/
#pragma once
#include "Precompiled.hpp"

#include "Room.hpp"

/*
	The RoomDirectory owns all Rooms, keyed by name. Names are unique, at
	most 20 characters of letters, digits, dashes, underscores and spaces.
	At most 256 Rooms exist at a time; a Finished Room is removed and its
	name becomes free again.
*/
class RoomDirectory
{
public:
	enum { max_rooms = 256, max_name_length = 20 };

	//values double as CREATE acknowledgement codes
	enum Status { Ok = 0, InvalidName = 1, DuplicateName = 2, DirectoryFull = 3 };

	//Player lists rooms with a free seat, Viewer lists every room
	enum Mode { PlayerMode, ViewerMode };

	static bool is_valid_name( const std::string& name );

	//creates the Room and seats the owner as first player;
	//returns nullptr and sets status on failure
	Room* create( const std::string& name, unsigned int owner_id, const std::string& owner_name, Status& status );

	Room* find( const std::string& name ) const;

	//the Room in which the connection holds a seat, nullptr if none
	Room* find_containing( unsigned int id ) const;

	//sorted room names
	std::vector<std::string> list( Mode mode ) const;

	//closes and deletes the Room; does nothing if the name is unknown
	void remove( const std::string& name );

	//drops the connection from the viewers of every Room
	void remove_viewer( unsigned int id );

	size_t size() const { return m_rooms.size(); };

private:
	std::map<std::string, std::unique_ptr<Room>> m_rooms;//key: room name
};
