/*
	Copyright (c) 2018 Ereb @ habrahabr.ru

	This source code is distributed under the MIT license.
	See LICENSE.MIT for details.
*/
#include "Precompiled.hpp"

#include <fstream>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include "UserDatabase.hpp"

using json = nlohmann::json;

namespace
{
	const char hash_scheme[] = "pbkdf2-sha256";

	std::string to_hex( const unsigned char* data, size_t size )
	{
		std::ostringstream out;
		for ( size_t i = 0; i < size; ++i )
		{
			out << std::hex << std::setw( 2 ) << std::setfill( '0' ) << static_cast<unsigned int>( data[i] );
		}
		return out.str();
	}

	bool from_hex( const std::string& hex, std::vector<unsigned char>& out )
	{
		if ( hex.size() % 2 ) return false;
		out.clear();
		for ( size_t i = 0; i < hex.size(); i += 2 )
		{
			unsigned int byte = 0;
			for ( size_t j = i; j < i + 2; ++j )
			{
				const char c = hex[j];
				byte <<= 4;
				if      ( '0' <= c && c <= '9' ) byte |= static_cast<unsigned int>( c - '0' );
				else if ( 'a' <= c && c <= 'f' ) byte |= static_cast<unsigned int>( c - 'a' + 10 );
				else if ( 'A' <= c && c <= 'F' ) byte |= static_cast<unsigned int>( c - 'A' + 10 );
				else return false;
			}
			out.push_back( static_cast<unsigned char>( byte ) );
		}
		return true;
	}

	void derive( const std::string& password, const std::vector<unsigned char>& salt,
	             int iterations, std::vector<unsigned char>& hash )
	{
		if ( 1 != PKCS5_PBKDF2_HMAC( password.data(), static_cast<int>( password.size() ),
		                             salt.data(), static_cast<int>( salt.size() ), iterations,
		                             EVP_sha256(), static_cast<int>( hash.size() ), hash.data() ) )
		{
			throw std::runtime_error( "PKCS5_PBKDF2_HMAC() failed" );
		}
	}
}


/*
	Loads the whole user file. A missing or empty file is an error,
	start with "[]" for an empty database.
*/
UserDatabase::UserDatabase( const std::string& path ) :
	m_path( path )
{
	std::ifstream in( m_path );
	if ( !in )
	{
		throw std::runtime_error( "Error: " + m_path + " doesn't exist." );
	}

	try
	{
		m_users = json::parse( in );
	}
	catch ( const json::parse_error& )
	{
		throw std::runtime_error( "Error: " + m_path + " is not in a valid JSON format." );
	}

	if ( !m_users.is_array() )
	{
		throw std::runtime_error( "Error: user database is not a JSON array." );
	}
}


CredentialStore::Verdict UserDatabase::verify( const std::string& username, const std::string& password ) const
{
	const auto user = find_user( username );
	if ( !user ) return NoSuchUser;

	const auto stored = user->find( "password" );
	if ( user->end() == stored || !stored->is_string() ) return WrongPassword;

	return check_password( password, stored->get<std::string>() ) ? Ok : WrongPassword;
}


bool UserDatabase::exists( const std::string& username ) const
{
	return nullptr != find_user( username );
}


/*
	Appends the user and rewrites the file. If writing fails the user is
	taken out again, so memory and file never disagree.
*/
void UserDatabase::add( const std::string& username, const std::string& password )
{
	m_users.push_back( { { "username", username }, { "password", hash_password( password ) } } );
	try
	{
		save();
	}
	catch ( const std::runtime_error& )
	{
		m_users.erase( m_users.size() - 1 );
		throw;
	}
}


std::string UserDatabase::hash_password( const std::string& password )
{
	std::vector<unsigned char> salt( salt_size );
	if ( 1 != RAND_bytes( salt.data(), static_cast<int>( salt.size() ) ) )
	{
		throw std::runtime_error( "RAND_bytes() failed" );
	}

	std::vector<unsigned char> hash( hash_size );
	derive( password, salt, pbkdf2_iterations, hash );

	std::ostringstream out;
	out << hash_scheme << '$' << pbkdf2_iterations << '$'
	    << to_hex( salt.data(), salt.size() ) << '$'
	    << to_hex( hash.data(), hash.size() );
	return out.str();
}


bool UserDatabase::check_password( const std::string& password, const std::string& stored )
{
	//scheme $ iterations $ salt $ hash
	std::vector<std::string> parts;
	std::istringstream in( stored );
	for ( std::string part; std::getline( in, part, '$' ); ) parts.push_back( part );
	if ( 4 != parts.size() || hash_scheme != parts[0] ) return false;

	if ( parts[1].empty() || !std::all_of( parts[1].begin(), parts[1].end(), []( const char c ) { return '0' <= c && c <= '9'; } ) || 9 < parts[1].size() ) return false;
	const int iterations = std::stoi( parts[1] );
	if ( 0 >= iterations ) return false;

	std::vector<unsigned char> salt, expected;
	if ( !from_hex( parts[2], salt ) || !from_hex( parts[3], expected ) || expected.empty() ) return false;

	std::vector<unsigned char> hash( expected.size() );
	derive( password, salt, iterations, hash );
	return 0 == CRYPTO_memcmp( hash.data(), expected.data(), hash.size() );
}


const json* UserDatabase::find_user( const std::string& username ) const
{
	for ( const auto& user : m_users )
	{
		const auto name = user.find( "username" );
		if ( user.end() != name && name->is_string() && name->get<std::string>() == username ) return &user;
	}
	return nullptr;
}


void UserDatabase::save() const
{
	std::ofstream out( m_path, std::ios::trunc );
	if ( !out )
	{
		throw std::runtime_error( "Error: cannot write " + m_path );
	}
	out << m_users.dump( 4 ) << std::endl;
	if ( !out )
	{
		throw std::runtime_error( "Error: cannot write " + m_path );
	}
}
