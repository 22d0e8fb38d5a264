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

#ifndef __GSI_CRED_UTILS_HH__
#define __GSI_CRED_UTILS_HH__

#include <stdint.h>
#include <unistd.h>
#include <functional>
#include <map>
#include <string>

#include "GsiCred/GsiCredStatus.hh"

namespace GsiCred
{
  //----------------------------------------------------------------------------
  //! Source of the current time in milliseconds
  //----------------------------------------------------------------------------
  typedef std::function<uint64_t()> Clock;

  //----------------------------------------------------------------------------
  //! Random utilities
  //----------------------------------------------------------------------------
  class Utils
  {
    public:
      //------------------------------------------------------------------------
      //! Split a string
      //------------------------------------------------------------------------
      template<class Container>
      static void splitString( Container         &result,
                               const std::string &input,
                               const std::string &delimiter )
      {
        size_t start  = 0;
        size_t end    = 0;
        size_t length = 0;

        do
        {
          end = input.find( delimiter, start );

          if( end != std::string::npos )
            length = end - start;
          else
            length = input.length() - start;

          if( length )
            result.push_back( input.substr( start, length ) );

          start = end + delimiter.size();
        }
        while( end != std::string::npos );
      }

      //------------------------------------------------------------------------
      //! Process a config file and return key-value pairs
      //------------------------------------------------------------------------
      static Status ProcessConfig( std::map<std::string, std::string> &config,
                                   const std::string                  &file );

      //------------------------------------------------------------------------
      //! Trim a string
      //------------------------------------------------------------------------
      static void Trim( std::string &str );

      //------------------------------------------------------------------------
      //! Parse a duration, either plain seconds or a sequence of number-unit
      //! pairs with units d, h, m and s (ie. "1h30m")
      //!
      //! @param str     the string to be parsed
      //! @param seconds the parsed duration
      //! @return        true on success, false if the string is malformed
      //!                or the value does not fit in 64 bits
      //------------------------------------------------------------------------
      static bool ParseDuration( const std::string &str, uint64_t &seconds );

      //------------------------------------------------------------------------
      //! Seconds to milliseconds, saturating at the largest value
      //------------------------------------------------------------------------
      static uint64_t SecondsToMs( uint64_t seconds )
      {
        if( seconds > UINT64_MAX / 1000 )
          return UINT64_MAX;
        return seconds * 1000;
      }

      //------------------------------------------------------------------------
      //! Parse a boolean: true/false, yes/no, 1/0 (case insensitive)
      //------------------------------------------------------------------------
      static bool ParseBool( const std::string &str, bool &value );

      //------------------------------------------------------------------------
      //! Current wall clock time in milliseconds since the epoch
      //------------------------------------------------------------------------
      static uint64_t NowMs();

      //------------------------------------------------------------------------
      //! Check whether a path exists and is a directory
      //------------------------------------------------------------------------
      static bool IsDirectory( const std::string &path );

      //------------------------------------------------------------------------
      //! Check whether a path exists and is a regular file
      //------------------------------------------------------------------------
      static bool IsRegularFile( const std::string &path );
  };

  //----------------------------------------------------------------------------
  //! Smart descriptor - closes the descriptor on destruction
  //----------------------------------------------------------------------------
  class ScopedDescriptor
  {
    public:
      //------------------------------------------------------------------------
      //! Constructor
      //------------------------------------------------------------------------
      ScopedDescriptor( int descriptor ): pDescriptor( descriptor ) {}

      //------------------------------------------------------------------------
      //! Destructor
      //------------------------------------------------------------------------
      ~ScopedDescriptor() { if( pDescriptor >= 0 ) close( pDescriptor ); }

      //------------------------------------------------------------------------
      //! Release the descriptor being held
      //------------------------------------------------------------------------
      int Release()
      {
        int desc = pDescriptor;
        pDescriptor = -1;
        return desc;
      }

      //------------------------------------------------------------------------
      //! Get the descriptor
      //------------------------------------------------------------------------
      int GetDescriptor()
      {
        return pDescriptor;
      }

    private:
      int pDescriptor;
  };
}

#endif // __GSI_CRED_UTILS_HH__
