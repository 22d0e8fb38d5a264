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

#ifndef __GSI_CRED_MANAGER_HH__
#define __GSI_CRED_MANAGER_HH__

#include <stdint.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "GsiCred/GsiCredCache.hh"
#include "GsiCred/GsiCredConfig.hh"
#include "GsiCred/GsiCredDelegation.hh"
#include "GsiCred/GsiCredPKI.hh"
#include "GsiCred/GsiCredStatus.hh"
#include "GsiCred/GsiCredStoreClient.hh"
#include "GsiCred/GsiCredTrustStore.hh"
#include "GsiCred/GsiCredUtils.hh"
#include "GsiCred/GsiCredX509.hh"

namespace GsiCred
{
  //----------------------------------------------------------------------------
  //! The credentials used when acting as a client: the credential loaded
  //! from disk and the proxy derived from it (both are the same when a
  //! prefetched proxy is used)
  //----------------------------------------------------------------------------
  struct ClientCredentials
  {
    Credential credential;
    Credential proxy;
  };

  //----------------------------------------------------------------------------
  //! Credential and delegated proxy manager of the GSI authentication
  //! handler.
  //!
  //! The operations changing the state (credential refresh, delegation) are
  //! serialized, the accessors read the last published state without
  //! locking.
  //----------------------------------------------------------------------------
  class CredentialManager
  {
    public:
      //------------------------------------------------------------------------
      //! Constructor
      //!
      //! @param config validated configuration, see Config::FromEnv
      //! @param pki    the PKIX capabilities
      //! @param clock  time source in milliseconds
      //------------------------------------------------------------------------
      CredentialManager( const Config                &config,
                         std::shared_ptr<PKIFactory>  pki,
                         Clock                        clock = Utils::NowMs );

      //------------------------------------------------------------------------
      //! Constructor, OpenSSL backed
      //------------------------------------------------------------------------
      explicit CredentialManager( const Config &config );

      ~CredentialManager();

      //------------------------------------------------------------------------
      //! Load the host credential if absent or stale. Errors are returned
      //! and the previously loaded credential, if any, stays in place.
      //------------------------------------------------------------------------
      Status LoadServerCredentials();

      //------------------------------------------------------------------------
      //! Load the client credential and its proxy if absent or stale.
      //! Errors are logged only, the previously loaded credentials stay in
      //! place. The issuer hashes are recomputed in any case.
      //------------------------------------------------------------------------
      void LoadClientCredentials();

      //------------------------------------------------------------------------
      //! Validate a chain against the trust anchors
      //------------------------------------------------------------------------
      Status Validate( const X509Chain &chain );

      //------------------------------------------------------------------------
      //! Check that the certificate has been issued to the host
      //------------------------------------------------------------------------
      Status CheckIdentity( X509 *cert, const std::string &host ) const;

      //------------------------------------------------------------------------
      //! Check that the CAs are present in the CA directory
      //------------------------------------------------------------------------
      Status CheckCaIdentities( const std::vector<std::string> &cas ) const;
      Status CheckCaIdentities( const std::string &cas ) const;

      //------------------------------------------------------------------------
      //! Set the store holding the delegated proxies
      //------------------------------------------------------------------------
      void SetCredentialStoreClient( std::shared_ptr<CredentialStoreClient> store );

      //------------------------------------------------------------------------
      //! Server side: obtain a proxy request for the authenticated client
      //!
      //! @param chain chain of the client
      //! @param csr   the PEM encoded request to send to the client
      //------------------------------------------------------------------------
      Status PrepareSerializedProxyRequest( const X509Chain &chain,
                                            std::string     &csr );

      //------------------------------------------------------------------------
      //! Server side: store the proxy signed by the client
      //------------------------------------------------------------------------
      Status FinalizeDelegatedProxy( X509 *signedCert );

      //------------------------------------------------------------------------
      //! Server side: drop the outstanding proxy request, if any
      //------------------------------------------------------------------------
      void CancelOutstandingProxyRequest();

      //------------------------------------------------------------------------
      //! Server side: check whether a usable delegated proxy of the client
      //! is already stored
      //------------------------------------------------------------------------
      Status HasValidDelegatedProxy( const X509Chain &chain, bool &valid );

      //------------------------------------------------------------------------
      //! Client side: sign the proxy request of a server with our proxy
      //!
      //! @return errUninitialized if no proxy has been loaded
      //------------------------------------------------------------------------
      Status GetSignedProxyRequest( const std::string &csr,
                                    X509Chain         &newChain );

      ProxyDelegationCoordinator::State GetDelegationState();

      //------------------------------------------------------------------------
      // Snapshots
      //------------------------------------------------------------------------
      std::shared_ptr<const Credential> GetHostCredential() const;
      std::shared_ptr<const Credential> GetClientCredential() const;
      std::shared_ptr<const Credential> GetProxy() const;
      uint64_t GetHostCredRefreshTimestamp() const;
      uint64_t GetProxyRefreshTimestamp() const;

      //------------------------------------------------------------------------
      //! Hashes of the issuers of the proxy chain joined with '|', empty
      //! if there is no proxy
      //------------------------------------------------------------------------
      std::string GetClientCredIssuerHashes() const;

      //------------------------------------------------------------------------
      // Configuration
      //------------------------------------------------------------------------
      const Config &GetConfig() const { return pConfig; }
      const std::string &GetCACertificatePath() const { return pConfig.caCertDir; }
      uint64_t GetTrustAnchorRefreshInterval() const { return pConfig.caRefresh; }
      const std::string &GetHostCertificatePath() const { return pConfig.hostCert; }
      const std::string &GetHostKeyPath() const { return pConfig.hostKey; }
      uint64_t GetHostCertRefreshInterval() const { return pConfig.hostCertRefresh; }
      bool IsVerifyHostCertificate() const { return pConfig.hostCertVerify; }
      const std::string &GetClientCertificatePath() const { return pConfig.tpcCert; }
      const std::string &GetClientKeyPath() const { return pConfig.tpcKey; }
      const std::string &GetProxyPath() const { return pConfig.tpcProxy; }
      uint64_t GetProxyRefreshInterval() const { return pConfig.tpcCredRefresh; }
      bool IsVerifyClientCertificate() const { return pConfig.tpcCredVerify; }
      uint64_t GetProxyMinValidFor() const { return pConfig.proxyMinValidFor; }

      TrustStore &GetTrustStore() { return pTrustStore; }

    private:
      CredentialManager( const CredentialManager& );
      CredentialManager &operator=( const CredentialManager& );

      Status LoadHost( std::shared_ptr<const Credential> &cred );
      Status LoadClient( std::shared_ptr<const ClientCredentials> &cred );
      void   UpdateIssuerHashes();
      std::string GetCredentialValues() const;

      Config                              pConfig;
      std::shared_ptr<PKIFactory>         pPKI;
      TrustStore                          pTrustStore;
      CredentialCache<Credential>         pHostCache;
      CredentialCache<ClientCredentials>  pClientCache;
      std::shared_ptr<const std::string>  pIssuerHashes;
      std::mutex                          pMutex;
      ProxyDelegationCoordinator          pDelegation;
  };
}

#endif // __GSI_CRED_MANAGER_HH__
