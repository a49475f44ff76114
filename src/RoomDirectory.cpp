/*
	Copyright (c) 2018 Ereb @ habrahabr.ru

	This source code is distributed under the MIT license.
	See LICENSE.MIT for details.
*/
#include "Precompiled.hpp"

#include "RoomDirectory.hpp"

bool RoomDirectory::is_valid_name( const std::string& name )
{
	if ( name.empty() || max_name_length < name.size() ) return false;

	return std::all_of( name.begin(), name.end(),
	[]( const char c )
	{
		return std::isalnum( static_cast<unsigned char>( c ) ) || '-' == c || '_' == c || ' ' == c;
	} );
}


Room* RoomDirectory::create( const std::string& name, unsigned int owner_id, const std::string& owner_name, Status& status )
{
	if ( !is_valid_name( name ) )
	{
		status = InvalidName;
		return nullptr;
	}
	if ( m_rooms.count( name ) )
	{
		status = DuplicateName;
		return nullptr;
	}
	if ( max_rooms <= m_rooms.size() )
	{
		status = DirectoryFull;
		return nullptr;
	}

	//create room object and get reference at one go
	auto& room = m_rooms.emplace( name, std::make_unique<Room>( name ) ).first->second;
	room->add_player( owner_id, owner_name );
	status = Ok;
	return room.get();
}


Room* RoomDirectory::find( const std::string& name ) const
{
	auto it = m_rooms.find( name );
	if ( m_rooms.end() == it ) return nullptr;
	return it->second.get();
}


Room* RoomDirectory::find_containing( unsigned int id ) const
{
	for ( const auto& it : m_rooms )
	{
		if ( it.second->has_player( id ) ) return it.second.get();
	}
	return nullptr;
}


/*
	The map is ordered by name, so both lists come out sorted.
*/
std::vector<std::string> RoomDirectory::list( Mode mode ) const
{
	std::vector<std::string> names;
	for ( const auto& it : m_rooms )
	{
		if ( PlayerMode == mode && it.second->is_full() ) continue;
		names.push_back( it.first );
	}
	return names;
}


void RoomDirectory::remove( const std::string& name )
{
	auto it = m_rooms.find( name );
	if ( m_rooms.end() == it ) return;

	it->second->close();
	m_rooms.erase( it );
}


void RoomDirectory::remove_viewer( unsigned int id )
{
	for ( auto& it : m_rooms )
	{
		it.second->remove_viewer( id );
	}
}
