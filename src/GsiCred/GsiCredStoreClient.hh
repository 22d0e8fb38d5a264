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

#ifndef __GSI_CRED_STORE_CLIENT_HH__
#define __GSI_CRED_STORE_CLIENT_HH__

#include <stdint.h>
#include <memory>
#include <string>

#include "GsiCred/GsiCredStatus.hh"
#include "GsiCred/GsiCredX509.hh"

namespace GsiCred
{
  //----------------------------------------------------------------------------
  //! A proxy request issued by the credential store
  //----------------------------------------------------------------------------
  struct ProxyRequest
  {
    std::string id;        //!< identifier assigned by the store
    std::string request;   //!< PEM encoded certificate request
    X509Chain   key;       //!< chain of the client the request was made for
  };

  //----------------------------------------------------------------------------
  //! Client of the store holding the delegated proxies
  //----------------------------------------------------------------------------
  class CredentialStoreClient
  {
    public:
      virtual ~CredentialStoreClient() {}

      //------------------------------------------------------------------------
      //! Fetch the proxy stored for the owner of the chain
      //!
      //! @param chain       chain identifying the client
      //! @param minValidFor seconds the proxy must still be valid for
      //! @param credential  the proxy, null if there is no suitable one
      //------------------------------------------------------------------------
      virtual Status FetchCredential( const X509Chain             &chain,
                                      uint64_t                     minValidFor,
                                      std::unique_ptr<Credential> &credential ) = 0;

      //------------------------------------------------------------------------
      //! Issue a proxy request for the owner of the chain
      //------------------------------------------------------------------------
      virtual Status GetProxyRequest( const X509Chain &chain,
                                      ProxyRequest    &request ) = 0;

      //------------------------------------------------------------------------
      //! Store a signed proxy
      //!
      //! @param chain the chain the request was made for
      //! @param id    identifier of the request
      //! @param pem   the proxy chain, signed certificate first
      //------------------------------------------------------------------------
      virtual Status StoreCredential( const X509Chain   &chain,
                                      const std::string &id,
                                      const std::string &pem ) = 0;

      //------------------------------------------------------------------------
      //! Drop a pending request
      //------------------------------------------------------------------------
      virtual Status CancelProxyRequest( const ProxyRequest &request ) = 0;
  };
}

#endif // __GSI_CRED_STORE_CLIENT_HH__
