/*
	Copyright (c) 2018 Ereb @ habrahabr.ru

	This source code is distributed under the MIT license.
	See LICENSE.MIT for details.
*/
#pragma once
#include "Precompiled.hpp"

#include "Client.hpp"
#include "CredentialStore.hpp"

/*
	In-memory Client: records every frame the Lobby queues for it.
*/
class FakeClient : public Client
{
public:
	explicit FakeClient( const std::string& address = "127.0.0.1" ) :
		m_id( 0 ), m_address( address ), m_closed( false )
	{};

	void queue_frame( const FramePtr& frame ) override { m_frames.push_back( *frame ); };
	void close() override { m_closed = true; };
	void set_id( unsigned int id ) override { m_id = id; };

	unsigned int       id()      const override { return m_id;      };
	const std::string& address() const override { return m_address; };

	const std::vector<std::string>& frames() const { return m_frames; };
	const std::string& last() const { return m_frames.back(); };
	bool closed() const { return m_closed; };
	void clear() { m_frames.clear(); };

private:
	unsigned int m_id;
	std::string  m_address;
	bool         m_closed;
	std::vector<std::string> m_frames;
};


/*
	In-memory CredentialStore with plain text passwords.
*/
class FakeCredentials : public CredentialStore
{
public:
	FakeCredentials() : m_fail_writes( false ) {};

	Verdict verify( const std::string& username, const std::string& password ) const override
	{
		auto it = m_users.find( username );
		if ( m_users.end() == it ) return NoSuchUser;
		return it->second == password ? Ok : WrongPassword;
	};

	bool exists( const std::string& username ) const override { return m_users.count( username ) != 0; };

	void add( const std::string& username, const std::string& password ) override
	{
		if ( m_fail_writes ) throw std::runtime_error( "disk full" );
		m_users[username] = password;
	};

	void fail_writes() { m_fail_writes = true; };

private:
	std::map<std::string, std::string> m_users;
	bool m_fail_writes;
};
