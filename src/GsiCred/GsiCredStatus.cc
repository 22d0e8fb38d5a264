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

#include "GsiCred/GsiCredStatus.hh"

#include <cstring>
#include <sstream>

namespace
{
  using namespace GsiCred;
  struct ErrorMap
  {
    uint16_t    code;
    const char *msg;
  };

  ErrorMap errors[] = {
    { errUnknown,              "Unknown error"        },
    { errInvalidOp,            "Invalid operation"    },
    { errConfig,               "Configuration error"  },
    { errInternal,             "Internal error"       },
    { errInvalidArgs,          "Invalid arguments"    },
    { errUninitialized,        "Initialization error" },
    { errOSError,              "OS Error"             },
    { errNotSupported,         "Operation not supported" },
    { errDataError,            "Received corrupted data" },
    { errCredentialLoad,       "Credential load error" },
    { errProxyGeneration,      "Proxy generation error" },
    { errValidation,           "Certificate chain validation error" },
    { errIdentityMismatch,     "Identity mismatch"    },
    { errInvalidCaPath,        "Invalid CA path"      },
    { errSigning,              "Signing error"        },
    { errDelegationState,      "Invalid delegation state" },
    { errStoreUnavailable,     "Credential store unavailable" },
    { errStoreError,           "Credential store error" },
    { errNotFound,             "Resource not found"   },
    { 0, 0 } };

  //----------------------------------------------------------------------------
  // Get error code
  //----------------------------------------------------------------------------
  std::string GetErrorMessage( uint16_t code )
  {
    for( int i = 0; errors[i].msg != 0; ++i )
      if( errors[i].code == code )
        return errors[i].msg;
    return "Unknown error code";
  }
}

namespace GsiCred
{
  //----------------------------------------------------------------------------
  // Create a string representation
  //----------------------------------------------------------------------------
  std::string Status::ToString() const
  {
    std::ostringstream o;

    if( IsOK() )
    {
      o << "[SUCCESS]";
      return o.str();
    }

    if( IsFatal() )
      o << "[FATAL] ";
    else
      o << "[ERROR] ";

    o << ::GetErrorMessage( code );

    //--------------------------------------------------------------------------
    // Protocol error numbers start at kGsiArgInvalid, anything below is
    // a plain errno
    //--------------------------------------------------------------------------
    if( errNo >= kGsiArgInvalid )
      o << " (" << errNo << ")";
    else if( errNo )
      o << ": " << strerror( errNo );

    return o.str();
  }
}
