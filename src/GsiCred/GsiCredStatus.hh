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

#ifndef __GSI_CRED_STATUS_HH__
#define __GSI_CRED_STATUS_HH__

#include <stdint.h>
#include <errno.h>
#include <string>

namespace GsiCred
{
  //----------------------------------------------------------------------------
  // Constants
  //----------------------------------------------------------------------------
  const uint16_t stOK    = 0x0000;  //!< Everything went OK
  const uint16_t stError = 0x0001;  //!< An error occurred that could potentially be retried
  const uint16_t stFatal = 0x0003;  //!< Fatal error, it's still an error

  //----------------------------------------------------------------------------
  // Generic errors
  //----------------------------------------------------------------------------
  const uint16_t errNone           = 0; //!< No error
  const uint16_t errUnknown        = 2; //!< Unknown error
  const uint16_t errInvalidOp      = 3; //!< The operation cannot be performed in the
                                        //!< given circumstances
  const uint16_t errConfig         = 6; //!< System misconfigured
  const uint16_t errInternal       = 7; //!< Internal error
  const uint16_t errInvalidArgs    = 9;
  const uint16_t errUninitialized  = 11;
  const uint16_t errOSError        = 12;
  const uint16_t errNotSupported   = 13;
  const uint16_t errDataError      = 14; //!< data is corrupted

  //----------------------------------------------------------------------------
  // Credential related errors
  //----------------------------------------------------------------------------
  const uint16_t errCredentialLoad   = 101; //!< cert/key could not be loaded
  const uint16_t errProxyGeneration  = 102; //!< proxy could not be derived
  const uint16_t errValidation       = 103; //!< chain rejected by the trust store
  const uint16_t errIdentityMismatch = 104; //!< host name not in the certificate
  const uint16_t errInvalidCaPath    = 105; //!< CA hash not in the trust directory
  const uint16_t errSigning          = 106; //!< proxy request could not be signed

  //----------------------------------------------------------------------------
  // Delegation related errors
  //----------------------------------------------------------------------------
  const uint16_t errDelegationState  = 201; //!< no proxy request outstanding
  const uint16_t errStoreUnavailable = 202; //!< no credential store configured
  const uint16_t errStoreError       = 203; //!< credential store call failed
  const uint16_t errNotFound         = 204;

  //----------------------------------------------------------------------------
  // xrootd protocol error numbers carried in errNo, so that the
  // authentication handler can answer with them directly
  //----------------------------------------------------------------------------
  const uint32_t kGsiArgInvalid    = 3000;
  const uint32_t kGsiNotAuthorized = 3010;
  const uint32_t kGsiServerError   = 3012;
  const uint32_t kGsiAuthFailed    = 3030;

  //----------------------------------------------------------------------------
  //! Procedure execution status
  //----------------------------------------------------------------------------
  struct Status
  {
    //--------------------------------------------------------------------------
    //! Constructor
    //--------------------------------------------------------------------------
    Status( uint16_t           st      = stOK,
            uint16_t           cod     = errNone,
            uint32_t           errN    = 0,
            const std::string &message = "" ):
      status(st), code(cod), errNo( errN ), pMessage( message ) {}

    bool IsError() const { return status & stError; }           //!< Error
    bool IsFatal() const { return (status&0x0002) & stFatal; }  //!< Fatal error
    bool IsOK()    const { return status == stOK; }             //!< We're fine

    //--------------------------------------------------------------------------
    //! Get error message
    //--------------------------------------------------------------------------
    const std::string &GetErrorMessage() const
    {
      return pMessage;
    }

    //--------------------------------------------------------------------------
    //! Set the error message
    //--------------------------------------------------------------------------
    void SetErrorMessage( const std::string &message )
    {
      pMessage = message;
    }

    //--------------------------------------------------------------------------
    //! Create a string representation of the status alone
    //--------------------------------------------------------------------------
    std::string ToString() const;

    //--------------------------------------------------------------------------
    //! Create a string representation including the error message
    //--------------------------------------------------------------------------
    std::string ToStr() const
    {
      std::string str = ToString();
      if( !pMessage.empty() )
        str += ": " + pMessage;
      return str;
    }

    uint16_t status;     //!< Status of the execution
    uint16_t code;       //!< Error type, or additional hints on what to do
    uint32_t errNo;      //!< Protocol error number or errno, if any

    private:
      std::string pMessage;
  };
}

#endif // __GSI_CRED_STATUS_HH__
