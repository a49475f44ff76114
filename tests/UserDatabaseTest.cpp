/*
	Copyright (c) 2018 Ereb @ habrahabr.ru

	This source code is distributed under the MIT license.
	See LICENSE.MIT for details.
*/
#include "Precompiled.hpp"

#include <cstdio>
#include <fstream>

#include <gtest/gtest.h>

#include "UserDatabase.hpp"

class UserDatabaseTest : public ::testing::Test
{
protected:
	UserDatabaseTest() : path( ::testing::TempDir() + "tictactoe_users_test.json" ) {}
	~UserDatabaseTest() override { std::remove( path.c_str() ); }

	void write( const std::string& content )
	{
		std::ofstream( path ) << content;
	}

	std::string read() const
	{
		std::ifstream in( path );
		std::stringstream ss;
		ss << in.rdbuf();
		return ss.str();
	}

	const std::string path;
};


TEST( PasswordHashTest, HashVerifiesOnlyOriginalPassword )
{
	const auto stored = UserDatabase::hash_password( "secret1" );
	EXPECT_EQ( 0u, stored.find( "pbkdf2-sha256$" ) );
	EXPECT_TRUE ( UserDatabase::check_password( "secret1", stored ) );
	EXPECT_FALSE( UserDatabase::check_password( "secret2", stored ) );
	EXPECT_FALSE( UserDatabase::check_password( "", stored ) );
}

TEST( PasswordHashTest, SaltDiffersBetweenHashes )
{
	EXPECT_NE( UserDatabase::hash_password( "secret1" ), UserDatabase::hash_password( "secret1" ) );
}

TEST( PasswordHashTest, RejectsUnknownFormats )
{
	EXPECT_FALSE( UserDatabase::check_password( "secret1", "secret1" ) );
	EXPECT_FALSE( UserDatabase::check_password( "secret1", "$2b$12$abcdefghijklmnopqrstuv" ) );
	EXPECT_FALSE( UserDatabase::check_password( "secret1", "pbkdf2-sha256$x$00$00" ) );
	EXPECT_FALSE( UserDatabase::check_password( "secret1", "pbkdf2-sha256$10$zz$00" ) );
	EXPECT_FALSE( UserDatabase::check_password( "secret1", "pbkdf2-sha256$10$00$" ) );
}

TEST_F( UserDatabaseTest, LoadsEmptyArray )
{
	write( "[]" );
	UserDatabase users( path );
	EXPECT_EQ( 0u, users.size() );
	EXPECT_FALSE( users.exists( "alice" ) );
	EXPECT_EQ( CredentialStore::NoSuchUser, users.verify( "alice", "secret1" ) );
}

TEST_F( UserDatabaseTest, RejectsBrokenFiles )
{
	EXPECT_THROW( { UserDatabase users( path + ".missing" ); }, std::runtime_error );

	write( "{ not json" );
	EXPECT_THROW( { UserDatabase users( path ); }, std::runtime_error );

	write( "{ \"username\": \"alice\" }" );
	EXPECT_THROW( { UserDatabase users( path ); }, std::runtime_error );
}

TEST_F( UserDatabaseTest, AddPersistsHashedUser )
{
	write( "[]" );
	{
		UserDatabase users( path );
		users.add( "alice", "secret1" );
		EXPECT_TRUE( users.exists( "alice" ) );
		EXPECT_EQ( CredentialStore::Ok, users.verify( "alice", "secret1" ) );
	}

	const auto content = read();
	EXPECT_NE( std::string::npos, content.find( "\"alice\"" ) );
	EXPECT_EQ( std::string::npos, content.find( "secret1" ) );

	UserDatabase reloaded( path );
	EXPECT_EQ( 1u, reloaded.size() );
	EXPECT_EQ( CredentialStore::Ok,            reloaded.verify( "alice", "secret1" ) );
	EXPECT_EQ( CredentialStore::WrongPassword, reloaded.verify( "alice", "secret2" ) );
	EXPECT_EQ( CredentialStore::NoSuchUser,    reloaded.verify( "bob",   "secret1" ) );
}

TEST_F( UserDatabaseTest, ForeignHashIsWrongPassword )
{
	write( "[ { \"username\": \"alice\", \"password\": \"$2b$12$R9h/cIPz0gi.URNNX3kh2OPST9/PgBkqquzi.Ss7KIUgO2t0jWMUW\" } ]" );
	UserDatabase users( path );
	EXPECT_TRUE( users.exists( "alice" ) );
	EXPECT_EQ( CredentialStore::WrongPassword, users.verify( "alice", "secret1" ) );
}
