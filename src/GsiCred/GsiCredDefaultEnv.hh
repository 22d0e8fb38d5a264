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

#ifndef __GSI_CRED_DEFAULT_ENV_HH__
#define __GSI_CRED_DEFAULT_ENV_HH__

#include "GsiCred/GsiCredEnv.hh"

#include <string>

namespace GsiCred
{
  class Log;

  //----------------------------------------------------------------------------
  //! Default environment for the credential manager. Responsible for
  //! setting/importing defaults for the configuration variables and holding
  //! the process-wide log.
  //----------------------------------------------------------------------------
  class DefaultEnv: public Env
  {
    public:
      //------------------------------------------------------------------------
      //! Constructor
      //------------------------------------------------------------------------
      DefaultEnv();

      //------------------------------------------------------------------------
      //! Get default environment
      //------------------------------------------------------------------------
      static Env *GetEnv();

      //------------------------------------------------------------------------
      //! Get default log
      //------------------------------------------------------------------------
      static Log *GetLog();

      //------------------------------------------------------------------------
      //! Create the log and load the environment
      //------------------------------------------------------------------------
      static void Initialize();

      //------------------------------------------------------------------------
      //! Finalize the environment
      //------------------------------------------------------------------------
      static void Finalize();

      //------------------------------------------------------------------------
      //! Rebuild the log from GSICRED_LOGLEVEL, GSICRED_LOGFILE and
      //! GSICRED_LOGMASK
      //------------------------------------------------------------------------
      static void ReInitializeLogging();

      //------------------------------------------------------------------------
      //! True for the names of the settings DefaultEnv registers
      //------------------------------------------------------------------------
      static bool IsKnownSetting( const std::string &name );

    private:
      static void SetUpLog();

      static Env *sEnv;
      static Log *sLog;
  };
}

#endif // __GSI_CRED_DEFAULT_ENV_HH__
