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

#ifndef __GSI_CRED_ENV_HH__
#define __GSI_CRED_ENV_HH__

#include <map>
#include <mutex>
#include <string>

namespace GsiCred
{
  //----------------------------------------------------------------------------
  //! A simple key value store intended to hold the credential manager
  //! configuration. It is able to import the settings from the shell
  //! environment, the variables imported this way supersede these provided
  //! from the C++ code or from configuration files.
  //----------------------------------------------------------------------------
  class Env
  {
    public:
      //------------------------------------------------------------------------
      //! Destructor
      //------------------------------------------------------------------------
      virtual ~Env() {}

      //------------------------------------------------------------------------
      //! Get a string associated to the given key
      //!
      //! @return true if the value was found, false otherwise
      //------------------------------------------------------------------------
      bool GetString( const std::string &key, std::string &value );

      //------------------------------------------------------------------------
      //! Associate a string with the given key
      //!
      //! @return false if there is already a shell-imported setting for this
      //!         key, true otherwise
      //------------------------------------------------------------------------
      bool PutString( const std::string &key, const std::string &value );

      //------------------------------------------------------------------------
      //! Get an int associated to the given key
      //!
      //! @return true if the value was found, false otherwise
      //------------------------------------------------------------------------
      bool GetInt( const std::string &key, int &value );

      //------------------------------------------------------------------------
      //! Associate an int with the given key
      //!
      //! @return false if there is already a shell-imported setting for this
      //!         key, true otherwise
      //------------------------------------------------------------------------
      bool PutInt( const std::string &key, int value );

      //------------------------------------------------------------------------
      //! Import an int from the shell environment. Any imported setting
      //! takes precedence over the one set by other means.
      //!
      //! @return true if the setting exists in the shell, false otherwise
      //------------------------------------------------------------------------
      bool ImportInt( const std::string &key, const std::string &shellKey );

      //------------------------------------------------------------------------
      //! Import a string from the shell environment. Any imported setting
      //! takes precedence over the one set by other means.
      //!
      //! @return true if the setting exists in the shell, false otherwise
      //------------------------------------------------------------------------
      bool ImportString( const std::string &key, const std::string &shellKey );

    private:
      //------------------------------------------------------------------------
      // A setting and whether it came from the shell
      //------------------------------------------------------------------------
      template<typename T>
      struct Entry
      {
        T    value;
        bool imported;
      };

      template<typename T>
      bool Get( const std::map<std::string, Entry<T> > &entries,
                const std::string &key, T &value, const char *kind );

      template<typename T>
      bool Put( std::map<std::string, Entry<T> > &entries,
                const std::string &key, const T &value, const char *kind );

      static std::string GetEnv( const std::string &key );
      static std::string ToString( const std::string &value );
      static std::string ToString( int value );

      std::mutex                                pMutex;
      std::map<std::string, Entry<std::string> > pStrings;
      std::map<std::string, Entry<int> >         pInts;
  };
}

#endif // __GSI_CRED_ENV_HH__
