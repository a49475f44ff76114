/*
	Copyright (c) 2018 Ereb @ habrahabr.ru

	This source code is distributed under the MIT license.
	See LICENSE.MIT for details.
*/
#include "Precompiled.hpp"

#include "SessionRegistry.hpp"

unsigned int SessionRegistry::add( std::shared_ptr<Client> client )
{
	const auto id = ++m_last_issued_id;
	client->set_id( id );
	m_sessions.emplace( id, Entry{ std::move( client ), false, std::string() } );
	return id;
}


void SessionRegistry::remove( unsigned int id )
{
	m_sessions.erase( id );
}


bool SessionRegistry::authenticate( unsigned int id, const std::string& username )
{
	auto it = m_sessions.find( id );
	if ( m_sessions.end() == it ) return false;

	it->second.authenticated = true;
	it->second.username      = username;
	return true;
}


const std::string* SessionRegistry::username_of( unsigned int id ) const
{
	auto it = m_sessions.find( id );
	if ( m_sessions.end() == it || !it->second.authenticated ) return nullptr;
	return &it->second.username;
}


Client* SessionRegistry::client( unsigned int id ) const
{
	auto it = m_sessions.find( id );
	if ( m_sessions.end() == it ) return nullptr;
	return it->second.client.get();
}
