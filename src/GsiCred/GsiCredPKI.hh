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

#ifndef __GSI_CRED_PKI_HH__
#define __GSI_CRED_PKI_HH__

#include <stdint.h>
#include <string>

#include "GsiCred/GsiCredConstants.hh"
#include "GsiCred/GsiCredStatus.hh"
#include "GsiCred/GsiCredX509.hh"

namespace GsiCred
{
  //----------------------------------------------------------------------------
  //! Options of the generated proxies
  //----------------------------------------------------------------------------
  struct ProxyOptions
  {
    ProxyOptions(): bits( DefaultProxyBits ), lifetime( 43200 ),
                    depth( DefaultProxyDepth ) {}
    int      bits;       //!< RSA key size
    uint64_t lifetime;   //!< seconds, capped by the issuer lifetime
    int      depth;      //!< path length constraint, -1 for unlimited
  };

  //----------------------------------------------------------------------------
  //! The PKIX capabilities needed by the credential manager
  //----------------------------------------------------------------------------
  class PKIFactory
  {
    public:
      virtual ~PKIFactory() {}

      //------------------------------------------------------------------------
      //! Load an end entity credential from PEM files
      //!
      //! @param certPath certificate, possibly followed by its chain
      //! @param keyPath  unencrypted private key of the certificate
      //! @param cred     the loaded credential
      //------------------------------------------------------------------------
      virtual Status LoadCredential( const std::string &certPath,
                                     const std::string &keyPath,
                                     Credential        &cred ) = 0;

      //------------------------------------------------------------------------
      //! Load a GSI proxy file (proxy certificate, key, issuer chain)
      //------------------------------------------------------------------------
      virtual Status LoadProxy( const std::string &path,
                                Credential        &proxy ) = 0;

      //------------------------------------------------------------------------
      //! Derive a new proxy from a credential
      //------------------------------------------------------------------------
      virtual Status CreateProxy( const Credential   &issuer,
                                  const ProxyOptions &options,
                                  Credential         &proxy ) = 0;

      //------------------------------------------------------------------------
      //! Create a proxy certificate request for the leaf of the chain
      //!
      //! @param chain  chain of the party the proxy is requested for
      //! @param csrPem the PEM encoded request
      //! @param key    the private key matching the request
      //------------------------------------------------------------------------
      virtual Status CreateProxyRequest( const X509Chain &chain,
                                         std::string     &csrPem,
                                         PrivateKey      &key ) = 0;

      //------------------------------------------------------------------------
      //! Sign a proxy certificate request with a credential
      //!
      //! @param csr      PEM or DER encoded request
      //! @param issuer   the signing credential
      //! @param newChain the signed certificate followed by the issuer chain
      //------------------------------------------------------------------------
      virtual Status SignProxyRequest( const std::string &csr,
                                       const Credential  &issuer,
                                       X509Chain         &newChain ) = 0;
  };
}

#endif // __GSI_CRED_PKI_HH__
