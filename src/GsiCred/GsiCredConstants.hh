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

#ifndef __GSI_CRED_CONSTANTS_HH__
#define __GSI_CRED_CONSTANTS_HH__

#include <cstdint>
#include <string>

namespace GsiCred
{
  //----------------------------------------------------------------------------
  // Log message types
  //----------------------------------------------------------------------------
  const uint64_t AppMsg        = 0x0000000000000001ULL;
  const uint64_t UtilityMsg    = 0x0000000000000002ULL;
  const uint64_t CredentialMsg = 0x0000000000000004ULL;
  const uint64_t TrustMsg      = 0x0000000000000008ULL;
  const uint64_t DelegationMsg = 0x0000000000000010ULL;
  const uint64_t StoreMsg      = 0x0000000000000020ULL;
  const uint64_t PKIMsg        = 0x0000000000000040ULL;

  //----------------------------------------------------------------------------
  // Environment settings
  //----------------------------------------------------------------------------
  static const char * const DefaultCACertDir        = "/etc/grid-security/certificates";
  static const char * const DefaultCARefresh        = "12h";
  static const char * const DefaultNamespaceMode    = "EUGRIDPMA_GLOBUS";
  static const char * const DefaultCRLMode          = "IF_VALID";
  static const char * const DefaultOCSPMode         = "IF_AVAILABLE";
  static const char * const DefaultHostCert         = "/etc/grid-security/hostcert.pem";
  static const char * const DefaultHostKey          = "/etc/grid-security/hostkey.pem";
  static const char * const DefaultHostCertRefresh  = "12h";
  static const char * const DefaultHostCertVerify   = "true";
  static const char * const DefaultTpcCredRefresh   = "1h";
  static const char * const DefaultTpcCredVerify    = "true";
  static const char * const DefaultProxyMinValidFor = "10m";
  static const char * const DefaultProxyLifetime    = "12h";
  const int                 DefaultProxyBits        = 2048;
  const int                 DefaultProxyDepth       = -1;

  //----------------------------------------------------------------------------
  //! Longest configurable duration in seconds, intervals are kept in
  //! milliseconds
  //----------------------------------------------------------------------------
  const uint64_t MaxDuration = UINT64_MAX / 1000;

  static const char * const DefaultConfigFile       = "/etc/gsicred/gsicred.conf";
  static const char * const EnvPrefix               = "GSICRED_";

  //----------------------------------------------------------------------------
  //! Separator of CA hashes when exchanged as a single string
  //----------------------------------------------------------------------------
  const char CAHashSeparator = '|';

  //----------------------------------------------------------------------------
  //! Suffix of CA certificate files in a hashed trust directory
  //----------------------------------------------------------------------------
  static const char * const DefaultCASuffix = ".0";

  //----------------------------------------------------------------------------
  //! Prefix of the proxy files written by the local credential store
  //----------------------------------------------------------------------------
  static const char * const ProxyFilePrefix = "x509up_";
}

#endif // __GSI_CRED_CONSTANTS_HH__
