//------------------------------------------------------------------------------
// Copyright (c) 2024 by European Organization for Nuclear Research (CERN)
//------------------------------------------------------------------------------
// This file is part of the GsiCred software suite.
//
// GsiCred is free software: you can redistribute it and/or modify
// it under the terms of the GNU Lesser General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// GsiCred is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU Lesser General Public License
// along with GsiCred.  If not, see <http://www.gnu.org/licenses/>.
//
// In applying this licence, CERN does not waive the privileges and immunities
// granted to it by virtue of its status as an Intergovernmental Organization
// or submit itself to any jurisdiction.
//------------------------------------------------------------------------------

#include "GsiCred/GsiCredUtils.hh"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <fstream>

#include <sys/types.h>
#include <sys/stat.h>

namespace
{
  bool isNotSpace( char c )
  {
    return !isspace( (unsigned char)c );
  }

  //----------------------------------------------------------------------------
  // Multiplier for a duration unit, 0 if the unit is unknown
  //----------------------------------------------------------------------------
  uint64_t unitToSeconds( char unit )
  {
    switch( tolower( (unsigned char)unit ) )
    {
      case 'd': return 86400;
      case 'h': return 3600;
      case 'm': return 60;
      case 's': return 1;
      default:  return 0;
    }
  }
}

namespace GsiCred
{
  //----------------------------------------------------------------------------
  // Process a config file and return key-value pairs
  //----------------------------------------------------------------------------
  Status Utils::ProcessConfig( std::map<std::string, std::string> &config,
                               const std::string                  &file )
  {
    config.clear();
    std::ifstream inFile( file.c_str() );
    if( !inFile.good() )
      return Status( stError, errOSError, errno );

    errno = 0;
    std::string line;
    int lineNo = 0;
    while( std::getline( inFile, line ) )
    {
      ++lineNo;
      Trim( line );
      if( line.empty() || line[0] == '#' )
        continue;

      std::string::size_type pos = line.find( '=' );
      if( pos == std::string::npos || pos == 0 )
        return Status( stError, errConfig, 0, file + ": malformed line " +
                       std::to_string( lineNo ) );
      std::string key   = line.substr( 0, pos ); Trim( key );
      std::string value = line.substr( pos+1 );  Trim( value );
      if( key.empty() )
        return Status( stError, errConfig, 0, file + ": malformed line " +
                       std::to_string( lineNo ) );
      config[key] = value;
    }

    if( inFile.bad() )
      return Status( stError, errOSError, errno );
    return Status();
  }

  //----------------------------------------------------------------------------
  // Trim a string
  //----------------------------------------------------------------------------
  void Utils::Trim( std::string &str )
  {
    str.erase( str.begin(),
               std::find_if( str.begin(), str.end(), isNotSpace ) );
    str.erase( std::find_if( str.rbegin(), str.rend(), isNotSpace ).base(),
               str.end() );
  }

  //----------------------------------------------------------------------------
  // Parse a duration
  //----------------------------------------------------------------------------
  bool Utils::ParseDuration( const std::string &str, uint64_t &seconds )
  {
    std::string s = str;
    Trim( s );
    if( s.empty() )
      return false;

    uint64_t total = 0;
    size_t   i     = 0;
    while( i < s.length() )
    {
      if( !isdigit( (unsigned char)s[i] ) )
        return false;

      uint64_t number = 0;
      while( i < s.length() && isdigit( (unsigned char)s[i] ) )
      {
        uint64_t digit = s[i] - '0';
        if( number > ( UINT64_MAX - digit ) / 10 )
          return false;
        number = number * 10 + digit;
        ++i;
      }

      //------------------------------------------------------------------------
      // A bare number is only allowed as the whole string
      //------------------------------------------------------------------------
      if( i == s.length() )
      {
        if( total != 0 || s.find_first_not_of( "0123456789" ) != std::string::npos )
          return false;
        seconds = number;
        return true;
      }

      uint64_t mult = unitToSeconds( s[i] );
      if( !mult )
        return false;
      if( number > UINT64_MAX / mult || total > UINT64_MAX - number * mult )
        return false;
      total += number * mult;
      ++i;
    }

    seconds = total;
    return true;
  }

  //----------------------------------------------------------------------------
  // Parse a boolean
  //----------------------------------------------------------------------------
  bool Utils::ParseBool( const std::string &str, bool &value )
  {
    std::string s = str;
    Trim( s );
    std::transform( s.begin(), s.end(), s.begin(), ::tolower );
    if( s == "true" || s == "yes" || s == "1" )
      value = true;
    else if( s == "false" || s == "no" || s == "0" )
      value = false;
    else
      return false;
    return true;
  }

  //----------------------------------------------------------------------------
  // Current time in milliseconds
  //----------------------------------------------------------------------------
  uint64_t Utils::NowMs()
  {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
             system_clock::now().time_since_epoch() ).count();
  }

  //----------------------------------------------------------------------------
  // Check for a directory
  //----------------------------------------------------------------------------
  bool Utils::IsDirectory( const std::string &path )
  {
    struct stat st;
    if( stat( path.c_str(), &st ) != 0 )
      return false;
    return S_ISDIR( st.st_mode );
  }

  //----------------------------------------------------------------------------
  // Check for a regular file
  //----------------------------------------------------------------------------
  bool Utils::IsRegularFile( const std::string &path )
  {
    struct stat st;
    if( stat( path.c_str(), &st ) != 0 )
      return false;
    return S_ISREG( st.st_mode );
  }
}
