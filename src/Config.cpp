/*
	Copyright (c) 2018 Ereb @ habrahabr.ru

	This source code is distributed under the MIT license.
	See LICENSE.MIT for details.
*/
#include "Precompiled.hpp"

#include <cstdlib>
#include <fstream>

#include <nlohmann/json.hpp>

#include "Config.hpp"

using json = nlohmann::json;

namespace
{
	std::string expand_home( const std::string& path )
	{
		if ( path.empty() || '~' != path[0] ) return path;
		if ( 1 < path.size() && '/' != path[1] ) return path;//~user is not supported

		const char* home = std::getenv( "HOME" );
		if ( !home ) return path;
		return std::string( home ) + path.substr( 1 );
	}
}


Config load_config( const std::string& path )
{
	std::ifstream in( path );
	if ( !in )
	{
		throw std::runtime_error( "Error: " + path + " doesn't exist." );
	}

	json j;
	try
	{
		j = json::parse( in );
	}
	catch ( const json::parse_error& )
	{
		throw std::runtime_error( "Error: " + path + " is not in a valid JSON format." );
	}

	if ( !j.is_object() || !j.contains( "port" ) || !j.contains( "userDatabase" ) )
	{
		throw std::runtime_error( "Error: " + path + " missing key(s): port, userDatabase" );
	}

	const auto& port = j["port"];
	if ( !port.is_number_integer() )
	{
		throw std::runtime_error( "Error: port is not an integer" );
	}
	const auto value = port.get<long long>();
	if ( 1024 > value || 65535 < value )
	{
		throw std::runtime_error( "Error: port number out of range" );
	}

	const auto& db = j["userDatabase"];
	if ( !db.is_string() )
	{
		throw std::runtime_error( "Error: userDatabase is not a string" );
	}

	Config config;
	config.port          = static_cast<unsigned short>( value );
	config.user_database = expand_home( db.get<std::string>() );

	if ( !std::ifstream( config.user_database ) )
	{
		throw std::runtime_error( "Error: " + config.user_database + " doesn't exist." );
	}
	return config;
}
