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

#include "GsiCred/GsiCredLog.hh"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace
{
  const char *const kLevelNames[] =
  {
    "None", "Error", "Warning", "Info", "Debug", "Dump"
  };

  //----------------------------------------------------------------------------
  // printf into a string of the right size
  //----------------------------------------------------------------------------
  std::string FormatMessage( const char *format, va_list list )
  {
    va_list cp;
    va_copy( cp, list );
    int len = vsnprintf( 0, 0, format, cp );
    va_end( cp );
    if( len < 0 )
      return std::string( "Unable to format log message: " ) + format;

    std::vector<char> buffer( len + 1 );
    va_copy( cp, list );
    vsnprintf( buffer.data(), buffer.size(), format, cp );
    va_end( cp );
    return std::string( buffer.data(), len );
  }

  //----------------------------------------------------------------------------
  // Local time with microseconds and the UTC offset
  //----------------------------------------------------------------------------
  std::string Timestamp()
  {
    using namespace std::chrono;
    system_clock::time_point now  = system_clock::now();
    time_t                   secs = system_clock::to_time_t( now );
    long usec = (long)( duration_cast<microseconds>(
                          now.time_since_epoch() ).count() % 1000000 );
    tm local;
    localtime_r( &secs, &local );

    char date[32], zone[8], out[64];
    strftime( date, sizeof( date ), "%Y-%m-%d %H:%M:%S", &local );
    strftime( zone, sizeof( zone ), "%z", &local );
    snprintf( out, sizeof( out ), "%s.%06ld %s", date, usec, zone );
    return out;
  }
}

namespace GsiCred
{
  //----------------------------------------------------------------------------
  // File output
  //----------------------------------------------------------------------------
  bool LogOutFile::Open( const std::string &fileName )
  {
    Close();
    int fd = open( fileName.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC,
                   S_IRUSR | S_IWUSR );
    if( fd < 0 )
    {
      std::cerr << "Unable to open the log file " << fileName << ": ";
      std::cerr << strerror( errno ) << std::endl;
      return false;
    }
    pFileDes = fd;
    return true;
  }

  void LogOutFile::Close()
  {
    if( pFileDes < 0 )
      return;
    close( pFileDes );
    pFileDes = -1;
  }

  void LogOutFile::Write( const std::string &message )
  {
    if( pFileDes < 0 )
    {
      std::cerr << message;
      return;
    }

    //--------------------------------------------------------------------------
    // O_APPEND keeps concurrent writes from interleaving within one call
    //--------------------------------------------------------------------------
    const char *data = message.data();
    size_t      left = message.size();
    while( left > 0 )
    {
      ssize_t ret = write( pFileDes, data, left );
      if( ret < 0 )
      {
        if( errno == EINTR )
          continue;
        std::cerr << "Unable to write to the log file: " << strerror( errno );
        std::cerr << std::endl;
        return;
      }
      data += ret;
      left -= ret;
    }
  }

  //----------------------------------------------------------------------------
  // Stderr output
  //----------------------------------------------------------------------------
  void LogOutCerr::Write( const std::string &message )
  {
    std::lock_guard<std::mutex> scopedLock( pMutex );
    std::cerr << message << std::flush;
  }

  //----------------------------------------------------------------------------
  // Constructor
  //----------------------------------------------------------------------------
  Log::Log(): pLevel( ErrorMsg ), pOutput( new LogOutCerr() ), pTopicWidth( 10 )
  {
    for( int i = 0; i <= DumpMsg; ++i )
      pMask[i] = ~uint64_t( 0 );
  }

  //----------------------------------------------------------------------------
  // Destructor
  //----------------------------------------------------------------------------
  Log::~Log()
  {
    delete pOutput;
  }

  //----------------------------------------------------------------------------
  // Level entry points
  //----------------------------------------------------------------------------
  void Log::Error( uint64_t topic, const char *format, ... )
  {
    if( !IsEnabled( ErrorMsg, topic ) )
      return;
    va_list argList;
    va_start( argList, format );
    Say( ErrorMsg, topic, format, argList );
    va_end( argList );
  }

  void Log::Warning( uint64_t topic, const char *format, ... )
  {
    if( !IsEnabled( WarningMsg, topic ) )
      return;
    va_list argList;
    va_start( argList, format );
    Say( WarningMsg, topic, format, argList );
    va_end( argList );
  }

  void Log::Info( uint64_t topic, const char *format, ... )
  {
    if( !IsEnabled( InfoMsg, topic ) )
      return;
    va_list argList;
    va_start( argList, format );
    Say( InfoMsg, topic, format, argList );
    va_end( argList );
  }

  void Log::Debug( uint64_t topic, const char *format, ... )
  {
    if( !IsEnabled( DebugMsg, topic ) )
      return;
    va_list argList;
    va_start( argList, format );
    Say( DebugMsg, topic, format, argList );
    va_end( argList );
  }

  void Log::Dump( uint64_t topic, const char *format, ... )
  {
    if( !IsEnabled( DumpMsg, topic ) )
      return;
    va_list argList;
    va_start( argList, format );
    Say( DumpMsg, topic, format, argList );
    va_end( argList );
  }

  //----------------------------------------------------------------------------
  // Format and write a message
  //----------------------------------------------------------------------------
  void Log::Say( LogLevel    level,
                 uint64_t    topic,
                 const char *format,
                 va_list     list )
  {
    std::string message = FormatMessage( format, list );
    std::string prefix  = "[" + Timestamp() + "][";

    std::ostringstream out;
    std::istringstream lines( message );
    std::string        line;
    while( std::getline( lines, line ) )
    {
      out << prefix << std::left << std::setw( 7 ) << kLevelNames[level];
      out << "][" << TopicToString( topic ) << "] " << line << "\n";
    }
    pOutput->Write( out.str() );
  }

  //----------------------------------------------------------------------------
  // Settings
  //----------------------------------------------------------------------------
  void Log::SetLevel( const std::string &level )
  {
    LogLevel lvl;
    if( StringToLogLevel( level, lvl ) )
      SetLevel( lvl );
  }

  void Log::SetOutput( LogOut *output )
  {
    delete pOutput;
    pOutput = output;
  }

  void Log::SetMask( const std::string &level, uint64_t mask )
  {
    LogLevel lvl;
    if( StringToLogLevel( level, lvl ) )
      pMask[lvl] = mask;
  }

  void Log::SetTopicName( uint64_t topic, const std::string &name )
  {
    pTopicMap[topic] = name;
    if( name.length() > pTopicWidth )
      pTopicWidth = name.length();
  }

  bool Log::StringToLogLevel( const std::string &str, LogLevel &level )
  {
    for( int i = ErrorMsg; i <= DumpMsg; ++i )
    {
      if( str == kLevelNames[i] )
      {
        level = (LogLevel)i;
        return true;
      }
    }
    return false;
  }

  //----------------------------------------------------------------------------
  // Topic name padded to the widest one
  //----------------------------------------------------------------------------
  std::string Log::TopicToString( uint64_t topic ) const
  {
    std::ostringstream o;
    std::map<uint64_t, std::string>::const_iterator it = pTopicMap.find( topic );
    if( it != pTopicMap.end() )
      o << std::left << std::setw( pTopicWidth ) << it->second;
    else
      o << "0x" << std::right << std::setfill( '0' )
        << std::setw( pTopicWidth - 2 ) << std::hex << topic;
    return o.str();
  }
}
