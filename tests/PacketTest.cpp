/*
	Copyright (c) 2018 Ereb @ habrahabr.ru

	This source code is distributed under the MIT license.
	See LICENSE.MIT for details.
*/
#include "Precompiled.hpp"

#include <gtest/gtest.h>

#include "Packet.hpp"

TEST( FrameReaderTest, SplitsChunkIntoFrames )
{
	FrameReader reader;
	const std::string chunk = "LOGIN:alice:secret1\nROOMLIST:PLAYER\n";
	reader.append( chunk.data(), chunk.size() );

	std::string frame;
	ASSERT_TRUE( reader.next( frame ) );
	EXPECT_EQ( "LOGIN:alice:secret1", frame );
	ASSERT_TRUE( reader.next( frame ) );
	EXPECT_EQ( "ROOMLIST:PLAYER", frame );
	EXPECT_FALSE( reader.next( frame ) );
}

TEST( FrameReaderTest, KeepsPartialFrameUntilNewline )
{
	FrameReader reader;
	reader.append( "PLA", 3 );

	std::string frame;
	EXPECT_FALSE( reader.next( frame ) );

	reader.append( "CE:1:2\nFOR", 10 );
	ASSERT_TRUE( reader.next( frame ) );
	EXPECT_EQ( "PLACE:1:2", frame );
	EXPECT_FALSE( reader.next( frame ) );

	reader.append( "FEIT\n", 5 );
	ASSERT_TRUE( reader.next( frame ) );
	EXPECT_EQ( "FORFEIT", frame );
}

TEST( FrameReaderTest, TrimsCarriageReturnAndSkipsBlankLines )
{
	FrameReader reader;
	const std::string chunk = "\r\n   \n  FORFEIT \r\n";
	reader.append( chunk.data(), chunk.size() );

	std::string frame;
	ASSERT_TRUE( reader.next( frame ) );
	EXPECT_EQ( "FORFEIT", frame );
	EXPECT_FALSE( reader.next( frame ) );
}

TEST( FrameReaderTest, ReportsOverflow )
{
	FrameReader reader;
	const std::string junk( FrameReader::max_frame_size + 1, 'x' );
	reader.append( junk.data(), junk.size() );
	EXPECT_TRUE( reader.overflow() );
}

TEST( PacketTest, DecodesCommandKeywords )
{
	EXPECT_EQ( Packet::Login,    Packet( "LOGIN:a:b" ).cmd() );
	EXPECT_EQ( Packet::Register, Packet( "REGISTER:a:b" ).cmd() );
	EXPECT_EQ( Packet::RoomList, Packet( "ROOMLIST:VIEWER" ).cmd() );
	EXPECT_EQ( Packet::Create,   Packet( "CREATE:Arena" ).cmd() );
	EXPECT_EQ( Packet::Join,     Packet( "JOIN:Arena:PLAYER" ).cmd() );
	EXPECT_EQ( Packet::Place,    Packet( "PLACE:0:2" ).cmd() );
	EXPECT_EQ( Packet::Forfeit,  Packet( "FORFEIT" ).cmd() );
}

TEST( PacketTest, KeywordsAreCaseSensitive )
{
	EXPECT_EQ( Packet::Unknown, Packet( "login:a:b" ).cmd() );
	EXPECT_EQ( Packet::Unknown, Packet( "Forfeit" ).cmd() );
	EXPECT_EQ( Packet::Unknown, Packet( "HELLO" ).cmd() );
}

TEST( PacketTest, SplitsFieldsAndKeepsEmptyOnes )
{
	Packet p( "JOIN:My Room:viewer", 7 );
	EXPECT_EQ( 7u, p.source() );
	EXPECT_EQ( "JOIN", p.keyword() );
	ASSERT_EQ( 2u, p.size() );
	EXPECT_EQ( "My Room", p.arg( 0 ) );
	EXPECT_EQ( "viewer", p.arg( 1 ) );

	Packet empty( "CREATE:" );
	ASSERT_EQ( 1u, empty.size() );
	EXPECT_EQ( "", empty.arg( 0 ) );

	EXPECT_EQ( 0u, Packet( "FORFEIT" ).size() );
}

TEST( PacketTest, ReadsFieldsSequentially )
{
	Packet p( "LOGIN:alice:secret1" );
	EXPECT_EQ( "alice", p.read_field() );
	EXPECT_EQ( "secret1", p.read_field() );
	EXPECT_THROW( p.read_field(), std::out_of_range );
}

TEST( PacketTest, ParsesCellCoordinates )
{
	unsigned int v = 9;
	EXPECT_TRUE( Packet::parse_cell( "0", v ) );
	EXPECT_EQ( 0u, v );
	EXPECT_TRUE( Packet::parse_cell( "2", v ) );
	EXPECT_EQ( 2u, v );

	EXPECT_FALSE( Packet::parse_cell( "3", v ) );
	EXPECT_FALSE( Packet::parse_cell( "-1", v ) );
	EXPECT_FALSE( Packet::parse_cell( "01", v ) );
	EXPECT_FALSE( Packet::parse_cell( "x", v ) );
	EXPECT_FALSE( Packet::parse_cell( "", v ) );
}

TEST( PacketTest, EncodesAcknowledgements )
{
	EXPECT_EQ( "LOGIN:ACKSTATUS:0\n",    Packet::ack( Packet::Login, 0 ) );
	EXPECT_EQ( "REGISTER:ACKSTATUS:3\n", Packet::ack( Packet::Register, 3 ) );
	EXPECT_EQ( "CREATE:ACKSTATUS:2\n",   Packet::ack( Packet::Create, 2 ) );
	EXPECT_EQ( "JOIN:ACKSTATUS:1\n",     Packet::ack( Packet::Join, 1 ) );
	EXPECT_EQ( "ROOMLIST:ACKSTATUS:1\n", Packet::ack( Packet::RoomList, 1 ) );
}

TEST( PacketTest, EncodesRoomList )
{
	EXPECT_EQ( "ROOMLIST:ACKSTATUS:0:\n", Packet::room_list( {} ) );
	EXPECT_EQ( "ROOMLIST:ACKSTATUS:0:Arena,Big Room,zeta\n", Packet::room_list( { "Arena", "Big Room", "zeta" } ) );
}

TEST( PacketTest, EncodesMatchEvents )
{
	EXPECT_EQ( "BEGIN:alice:bob\n", Packet::begin( "alice", "bob" ) );
	EXPECT_EQ( "INPROGRESS:bob:alice\n", Packet::in_progress( "bob", "alice" ) );
	EXPECT_EQ( "BOARDSTATUS:100000000\n", Packet::board_status( "100000000" ) );
	EXPECT_EQ( "GAMEEND:121212212:1\n", Packet::game_end( "121212212", Packet::Draw, "ignored" ) );
	EXPECT_EQ( "GAMEEND:100020000:2:bob\n", Packet::game_end( "100020000", Packet::ForfeitWin, "bob" ) );
	EXPECT_EQ( "GAMEEND\n", Packet::game_over() );
	EXPECT_EQ( "BADAUTH\n", Packet::bad_auth() );
	EXPECT_EQ( "NOROOM\n", Packet::no_room() );
	EXPECT_EQ( "Unknown command\n", Packet::unknown_command() );
}

TEST( PacketTest, ClientRecoversWinFromGameEnd )
{
	const auto wire = Packet::game_end( "111022000", Packet::Win, "alice" );

	FrameReader reader;
	reader.append( wire.data(), wire.size() );
	std::string frame;
	ASSERT_TRUE( reader.next( frame ) );

	Packet p( frame );
	EXPECT_EQ( Packet::Unknown, p.cmd() );
	EXPECT_EQ( "GAMEEND", p.keyword() );
	ASSERT_EQ( 3u, p.size() );
	EXPECT_EQ( "111022000", p.read_field() );
	EXPECT_EQ( std::to_string( Packet::Win ), p.read_field() );
	EXPECT_EQ( "alice", p.read_field() );
}
