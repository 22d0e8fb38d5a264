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

#ifndef __GSI_CRED_DELEGATION_HH__
#define __GSI_CRED_DELEGATION_HH__

#include <stdint.h>
#include <memory>
#include <string>

#include <openssl/x509.h>

#include "GsiCred/GsiCredPKI.hh"
#include "GsiCred/GsiCredStatus.hh"
#include "GsiCred/GsiCredStoreClient.hh"
#include "GsiCred/GsiCredX509.hh"

namespace GsiCred
{
  //----------------------------------------------------------------------------
  //! Drives the proxy delegation exchange against the credential store.
  //! At most one proxy request is outstanding at any time.
  //!
  //! The coordinator is not thread safe, the owner serializes the calls.
  //----------------------------------------------------------------------------
  class ProxyDelegationCoordinator
  {
    public:
      //------------------------------------------------------------------------
      //! Delegation state
      //------------------------------------------------------------------------
      enum State
      {
        Idle,               //!< no request outstanding
        AwaitingSignature   //!< a request has been sent to the client
      };

      ProxyDelegationCoordinator() {}

      //------------------------------------------------------------------------
      //! Set the credential store, may be null
      //------------------------------------------------------------------------
      void SetCredentialStoreClient( std::shared_ptr<CredentialStoreClient> store )
      {
        pStore = store;
      }

      std::shared_ptr<CredentialStoreClient> GetCredentialStoreClient() const
      {
        return pStore;
      }

      //------------------------------------------------------------------------
      //! Obtain a proxy request for the client chain. A request that is
      //! still outstanding is cancelled at the store first.
      //!
      //! @param chain chain of the authenticated client
      //! @param csr   the PEM encoded request to be sent to the client
      //------------------------------------------------------------------------
      Status Prepare( const X509Chain &chain, std::string &csr );

      //------------------------------------------------------------------------
      //! Store the proxy signed by the client. The request stays outstanding
      //! if the store refuses the proxy.
      //!
      //! @param signedCert the certificate signed by the client
      //! @return errDelegationState (kGsiServerError) if no request is
      //!         outstanding
      //------------------------------------------------------------------------
      Status Finalize( X509 *signedCert );

      //------------------------------------------------------------------------
      //! Drop the outstanding request, if any. Failures to notify the store
      //! are logged only.
      //------------------------------------------------------------------------
      void Cancel();

      //------------------------------------------------------------------------
      //! Check whether the store holds a proxy for the owner of the chain
      //! that is valid for at least minValidFor seconds
      //------------------------------------------------------------------------
      Status HasValidDelegatedProxy( const X509Chain &chain,
                                     uint64_t         minValidFor,
                                     bool            &valid );

      //------------------------------------------------------------------------
      //! Sign a proxy request of a peer with our own proxy
      //!
      //! @param pki      the signing capability
      //! @param csr      request received from the peer, PEM or DER
      //! @param proxy    our own proxy
      //! @param newChain the signed certificate followed by our chain
      //------------------------------------------------------------------------
      static Status GetSignedProxyRequest( PKIFactory        &pki,
                                           const std::string &csr,
                                           const Credential  &proxy,
                                           X509Chain         &newChain );

      State GetState() const
      {
        return pRequest ? AwaitingSignature : Idle;
      }

      //------------------------------------------------------------------------
      //! The outstanding request, 0 if idle
      //------------------------------------------------------------------------
      const ProxyRequest *GetPendingRequest() const
      {
        return pRequest.get();
      }

    private:
      ProxyDelegationCoordinator( const ProxyDelegationCoordinator& );
      ProxyDelegationCoordinator &operator=( const ProxyDelegationCoordinator& );

      Status CheckStore() const;
      void   CancelPending();

      std::shared_ptr<CredentialStoreClient> pStore;
      std::unique_ptr<ProxyRequest>          pRequest;
  };
}

#endif // __GSI_CRED_DELEGATION_HH__
