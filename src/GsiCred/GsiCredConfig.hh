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

#ifndef __GSI_CRED_CONFIG_HH__
#define __GSI_CRED_CONFIG_HH__

#include <stdint.h>
#include <string>

#include "GsiCred/GsiCredStatus.hh"

namespace GsiCred
{
  class Env;

  //----------------------------------------------------------------------------
  //! CRL checking modes
  //----------------------------------------------------------------------------
  enum CrlCheckingMode
  {
    CrlRequire,     //!< CRLs must be present and valid for the whole chain
    CrlIfValid,     //!< check CRLs, tolerate missing or out of date ones
    CrlIgnore       //!< do not check CRLs
  };

  //----------------------------------------------------------------------------
  //! OCSP checking modes
  //----------------------------------------------------------------------------
  enum OcspCheckingMode
  {
    OcspRequire,
    OcspIfAvailable,
    OcspIgnore
  };

  //----------------------------------------------------------------------------
  //! Namespace policy checking modes
  //----------------------------------------------------------------------------
  enum NamespaceCheckingMode
  {
    NsGlobusEugridpma,
    NsEugridpmaGlobus,
    NsGlobus,
    NsEugridpma,
    NsGlobusEugridpmaRequire,
    NsEugridpmaGlobusRequire,
    NsGlobusRequire,
    NsEugridpmaRequire,
    NsEugridpmaAndGlobus,
    NsEugridpmaAndGlobusRequire,
    NsIgnore
  };

  //----------------------------------------------------------------------------
  //! Typed configuration of the credential manager
  //----------------------------------------------------------------------------
  struct Config
  {
    //--------------------------------------------------------------------------
    //! Constructor, sets the compiled-in defaults
    //--------------------------------------------------------------------------
    Config();

    //--------------------------------------------------------------------------
    //! Build the configuration from an environment
    //!
    //! @param env    source of the settings
    //! @param config the resulting configuration
    //! @return       errConfig if any setting is malformed or the CA
    //!               directory does not exist
    //--------------------------------------------------------------------------
    static Status FromEnv( Env &env, Config &config );

    //--------------------------------------------------------------------------
    //! Mode name conversions, return false for unknown names
    //--------------------------------------------------------------------------
    static bool ParseCrlMode( const std::string &name, CrlCheckingMode &mode );
    static bool ParseOcspMode( const std::string &name, OcspCheckingMode &mode );
    static bool ParseNamespaceMode( const std::string     &name,
                                    NamespaceCheckingMode &mode );
    static const char *CrlModeToString( CrlCheckingMode mode );
    static const char *OcspModeToString( OcspCheckingMode mode );
    static const char *NamespaceModeToString( NamespaceCheckingMode mode );

    std::string           caCertDir;
    uint64_t              caRefresh;           //!< seconds
    NamespaceCheckingMode namespaceMode;
    CrlCheckingMode       crlMode;
    OcspCheckingMode      ocspMode;

    std::string           hostCert;
    std::string           hostKey;
    uint64_t              hostCertRefresh;     //!< seconds
    bool                  hostCertVerify;

    std::string           tpcCert;
    std::string           tpcKey;
    std::string           tpcProxy;            //!< empty if not prefetched
    uint64_t              tpcCredRefresh;      //!< seconds
    bool                  tpcCredVerify;

    uint64_t              proxyMinValidFor;    //!< seconds
    uint64_t              proxyLifetime;       //!< seconds
    int                   proxyBits;
    int                   proxyDepth;          //!< -1 for unlimited
  };
}

#endif // __GSI_CRED_CONFIG_HH__
