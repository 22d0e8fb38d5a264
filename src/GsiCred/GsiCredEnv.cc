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

#include <cerrno>
#include <climits>
#include <cstdlib>

#include "GsiCred/GsiCredEnv.hh"
#include "GsiCred/GsiCredDefaultEnv.hh"
#include "GsiCred/GsiCredLog.hh"
#include "GsiCred/GsiCredConstants.hh"

namespace GsiCred
{
  //----------------------------------------------------------------------------
  // Look up an entry of either kind
  //----------------------------------------------------------------------------
  template<typename T>
  bool Env::Get( const std::map<std::string, Entry<T> > &entries,
                 const std::string &key, T &value, const char *kind )
  {
    typename std::map<std::string, Entry<T> >::const_iterator it;
    it = entries.find( key );
    if( it == entries.end() )
    {
      DefaultEnv::GetLog()->Debug( UtilityMsg, "Env: no %s setting for %s",
                                   kind, key.c_str() );
      return false;
    }
    value = it->second.value;
    return true;
  }

  //----------------------------------------------------------------------------
  // Set an entry unless the shell already provided one
  //----------------------------------------------------------------------------
  template<typename T>
  bool Env::Put( std::map<std::string, Entry<T> > &entries,
                 const std::string &key, const T &value, const char *kind )
  {
    Log *log = DefaultEnv::GetLog();
    typename std::map<std::string, Entry<T> >::iterator it;
    it = entries.find( key );
    if( it != entries.end() )
    {
      if( it->second.imported )
      {
        log->Debug( UtilityMsg, "Env: %s keeps the %s value from the shell, "
                    "ignoring %s", key.c_str(), kind,
                    ToString( value ).c_str() );
        return false;
      }
      log->Debug( UtilityMsg, "Env: %s changes from %s to %s", key.c_str(),
                  ToString( it->second.value ).c_str(),
                  ToString( value ).c_str() );
    }

    Entry<T> &entry = entries[key];
    entry.value    = value;
    entry.imported = false;
    return true;
  }

  bool Env::GetString( const std::string &key, std::string &value )
  {
    std::lock_guard<std::mutex> scopedLock( pMutex );
    return Get( pStrings, key, value, "string" );
  }

  bool Env::PutString( const std::string &key, const std::string &value )
  {
    std::lock_guard<std::mutex> scopedLock( pMutex );
    return Put( pStrings, key, value, "string" );
  }

  bool Env::GetInt( const std::string &key, int &value )
  {
    std::lock_guard<std::mutex> scopedLock( pMutex );
    return Get( pInts, key, value, "integer" );
  }

  bool Env::PutInt( const std::string &key, int value )
  {
    std::lock_guard<std::mutex> scopedLock( pMutex );
    return Put( pInts, key, value, "integer" );
  }

  //----------------------------------------------------------------------------
  // Import an integer, the shell value must be a complete number
  //----------------------------------------------------------------------------
  bool Env::ImportInt( const std::string &key, const std::string &shellKey )
  {
    std::string text = GetEnv( shellKey );
    if( text.empty() )
      return false;

    Log  *log = DefaultEnv::GetLog();
    char *end = 0;
    errno = 0;
    long  number = strtol( text.c_str(), &end, 0 );
    if( *end || errno == ERANGE || number < INT_MIN || number > INT_MAX )
    {
      log->Error( UtilityMsg, "Env: %s=%s is not a valid integer for %s",
                  shellKey.c_str(), text.c_str(), key.c_str() );
      return false;
    }

    log->Info( UtilityMsg, "Env: %s=%ld taken from the shell as %s",
               shellKey.c_str(), number, key.c_str() );
    std::lock_guard<std::mutex> scopedLock( pMutex );
    Entry<int> &entry = pInts[key];
    entry.value    = (int)number;
    entry.imported = true;
    return true;
  }

  bool Env::ImportString( const std::string &key, const std::string &shellKey )
  {
    std::string text = GetEnv( shellKey );
    if( text.empty() )
      return false;

    DefaultEnv::GetLog()->Info( UtilityMsg, "Env: %s=%s taken from the shell "
                                "as %s", shellKey.c_str(), text.c_str(),
                                key.c_str() );
    std::lock_guard<std::mutex> scopedLock( pMutex );
    Entry<std::string> &entry = pStrings[key];
    entry.value    = text;
    entry.imported = true;
    return true;
  }

  std::string Env::GetEnv( const std::string &key )
  {
    const char *var = getenv( key.c_str() );
    return var ? std::string( var ) : std::string();
  }

  std::string Env::ToString( const std::string &value )
  {
    return "\"" + value + "\"";
  }

  std::string Env::ToString( int value )
  {
    return std::to_string( value );
  }
}
