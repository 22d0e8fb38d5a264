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

#ifndef __GSI_CRED_FILE_STORE_HH__
#define __GSI_CRED_FILE_STORE_HH__

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "GsiCred/GsiCredPKI.hh"
#include "GsiCred/GsiCredStoreClient.hh"

namespace GsiCred
{
  //----------------------------------------------------------------------------
  //! Credential store keeping the delegated proxies as GSI proxy files in a
  //! local directory, one file per end entity subject. The private keys of
  //! the pending requests are kept in memory only.
  //----------------------------------------------------------------------------
  class LocalCredentialStore: public CredentialStoreClient
  {
    public:
      //------------------------------------------------------------------------
      //! Constructor
      //!
      //! @param directory where the proxy files are written
      //! @param pki       used to create the requests and read the proxies
      //------------------------------------------------------------------------
      LocalCredentialStore( const std::string           &directory,
                            std::shared_ptr<PKIFactory>  pki );

      virtual ~LocalCredentialStore() {}

      virtual Status FetchCredential( const X509Chain             &chain,
                                      uint64_t                     minValidFor,
                                      std::unique_ptr<Credential> &credential );

      virtual Status GetProxyRequest( const X509Chain &chain,
                                      ProxyRequest    &request );

      virtual Status StoreCredential( const X509Chain   &chain,
                                      const std::string &id,
                                      const std::string &pem );

      virtual Status CancelProxyRequest( const ProxyRequest &request );

      //------------------------------------------------------------------------
      //! Path of the proxy file of the owner of the chain
      //------------------------------------------------------------------------
      std::string GetProxyPath( const X509Chain &chain ) const;

      //------------------------------------------------------------------------
      //! Number of requests waiting for a signed proxy
      //------------------------------------------------------------------------
      size_t GetPendingCount();

      const std::string &GetDirectory() const { return pDirectory; }

    private:
      Status WriteProxy( const std::string &path, const Credential &proxy );

      std::string                        pDirectory;
      std::shared_ptr<PKIFactory>        pPKI;
      std::mutex                         pMutex;
      std::map<std::string, PrivateKey>  pPending;
  };
}

#endif // __GSI_CRED_FILE_STORE_HH__
