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

#ifndef __GSI_CRED_SSL_PKI_HH__
#define __GSI_CRED_SSL_PKI_HH__

#include "GsiCred/GsiCredPKI.hh"

namespace GsiCred
{
  //----------------------------------------------------------------------------
  //! OpenSSL implementation of the PKIX capabilities
  //----------------------------------------------------------------------------
  class SslPKIFactory: public PKIFactory
  {
    public:
      virtual ~SslPKIFactory() {}

      virtual Status LoadCredential( const std::string &certPath,
                                     const std::string &keyPath,
                                     Credential        &cred );

      virtual Status LoadProxy( const std::string &path,
                                Credential        &proxy );

      virtual Status CreateProxy( const Credential   &issuer,
                                  const ProxyOptions &options,
                                  Credential         &proxy );

      virtual Status CreateProxyRequest( const X509Chain &chain,
                                         std::string     &csrPem,
                                         PrivateKey      &key );

      virtual Status SignProxyRequest( const std::string &csr,
                                       const Credential  &issuer,
                                       X509Chain         &newChain );
  };
}

#endif // __GSI_CRED_SSL_PKI_HH__
