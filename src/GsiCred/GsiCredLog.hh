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

#ifndef __GSI_CRED_LOG_HH__
#define __GSI_CRED_LOG_HH__

#include <stdarg.h>
#include <stdint.h>
#include <atomic>
#include <map>
#include <mutex>
#include <string>

namespace GsiCred
{
  //----------------------------------------------------------------------------
  //! Interface for logger outputs
  //----------------------------------------------------------------------------
  class LogOut
  {
    public:
      virtual ~LogOut() {}

      //------------------------------------------------------------------------
      //! Write a formatted message, may be called from many threads
      //------------------------------------------------------------------------
      virtual void Write( const std::string &message ) = 0;
  };

  //----------------------------------------------------------------------------
  //! Append messages to a file
  //----------------------------------------------------------------------------
  class LogOutFile: public LogOut
  {
    public:
      LogOutFile(): pFileDes( -1 ) {}
      virtual ~LogOutFile() { Close(); }

      //------------------------------------------------------------------------
      //! Open (or create, mode 0600) the log file for appending
      //------------------------------------------------------------------------
      bool Open( const std::string &fileName );

      void Close();
      virtual void Write( const std::string &message );

    private:
      int pFileDes;
  };

  //----------------------------------------------------------------------------
  //! Write messages to stderr
  //----------------------------------------------------------------------------
  class LogOutCerr: public LogOut
  {
    public:
      virtual ~LogOutCerr() {}
      virtual void Write( const std::string &message );

    private:
      std::mutex pMutex;
  };

  //----------------------------------------------------------------------------
  //! Leveled logger. Every message belongs to a topic, each level has a mask
  //! selecting the topics that get printed.
  //----------------------------------------------------------------------------
  class Log
  {
    public:
      enum LogLevel
      {
        NoMsg       = 0,  //!< report nothing
        ErrorMsg    = 1,  //!< report errors
        WarningMsg  = 2,  //!< report warnings
        InfoMsg     = 3,  //!< print info
        DebugMsg    = 4,  //!< print debug info
        DumpMsg     = 5   //!< print details of the certificates and requests
      };

      Log();
      ~Log();

      void Error( uint64_t topic, const char *format, ... );
      void Warning( uint64_t topic, const char *format, ... );
      void Info( uint64_t topic, const char *format, ... );
      void Debug( uint64_t topic, const char *format, ... );
      void Dump( uint64_t topic, const char *format, ... );

      //------------------------------------------------------------------------
      //! Format and write the message regardless of the level and masks.
      //! Multi-line messages get the prefix on every line.
      //------------------------------------------------------------------------
      void Say( LogLevel level, uint64_t topic, const char *format,
                va_list list );

      //------------------------------------------------------------------------
      //! True if a message of the given level and topic would be printed
      //------------------------------------------------------------------------
      bool IsEnabled( LogLevel level, uint64_t topic ) const
      {
        return level <= GetLevel() && ( topic & pMask[level] );
      }

      void SetLevel( LogLevel level )
      {
        pLevel.store( level, std::memory_order_relaxed );
      }

      //------------------------------------------------------------------------
      //! Set the level by name (Error, Warning, Info, Debug, Dump), unknown
      //! names are ignored
      //------------------------------------------------------------------------
      void SetLevel( const std::string &level );

      LogLevel GetLevel() const
      {
        return pLevel.load( std::memory_order_relaxed );
      }

      //------------------------------------------------------------------------
      //! Replace the output, the logger takes ownership
      //------------------------------------------------------------------------
      void SetOutput( LogOut *output );

      void SetMask( LogLevel level, uint64_t mask ) { pMask[level] = mask; }
      void SetMask( const std::string &level, uint64_t mask );

      //------------------------------------------------------------------------
      //! Name printed for the topic, unnamed topics are printed in hex
      //------------------------------------------------------------------------
      void SetTopicName( uint64_t topic, const std::string &name );

      //------------------------------------------------------------------------
      //! Parse a level name
      //------------------------------------------------------------------------
      static bool StringToLogLevel( const std::string &str, LogLevel &level );

    private:
      Log( const Log & );
      Log &operator = ( const Log & );

      std::string TopicToString( uint64_t topic ) const;

      std::atomic<LogLevel>             pLevel;
      uint64_t                          pMask[DumpMsg+1];
      LogOut                           *pOutput;
      std::map<uint64_t, std::string>   pTopicMap;
      size_t                            pTopicWidth;
  };
}

#endif // __GSI_CRED_LOG_HH__
