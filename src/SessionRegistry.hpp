/*
	Copyright (c) 2018 Ereb @ habrahabr.ru

	This source code is distributed under the MIT license.
	See LICENSE.MIT for details.
*/
#pragma once
#include "Precompiled.hpp"

#include "Client.hpp"

/*
	The SessionRegistry issues Client IDs and keeps every live connection
	together with its authentication state. A connection is anonymous until
	a successful LOGIN sets its user name. Only the Lobby mutates it, from
	the io_service thread.
*/
class SessionRegistry
{
public:
	SessionRegistry() : m_last_issued_id( 0 ) {};

	//assigns a fresh ID to the Client, stores it unauthenticated, returns the ID
	unsigned int add( std::shared_ptr<Client> client );
	void remove( unsigned int id );

	bool contains( unsigned int id ) const { return m_sessions.count( id ) != 0; };
	size_t size() const { return m_sessions.size(); };

	//returns false if the ID is unknown
	bool authenticate( unsigned int id, const std::string& username );

	bool is_authenticated( unsigned int id ) const { return nullptr != username_of( id ); };

	//nullptr for unknown or anonymous connections
	const std::string* username_of( unsigned int id ) const;

	//nullptr for unknown IDs
	Client* client( unsigned int id ) const;

private:
	struct Entry
	{
		std::shared_ptr<Client> client;
		bool                    authenticated;
		std::string             username;
	};

	std::map<unsigned int, Entry> m_sessions;//key: Client ID

	//increment IDs independent of current map size
	unsigned int m_last_issued_id;
};
