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

#include "GsiCred/GsiCredManager.hh"
#include "GsiCred/GsiCredConstants.hh"
#include "GsiCred/GsiCredDefaultEnv.hh"
#include "GsiCred/GsiCredIdentity.hh"
#include "GsiCred/GsiCredLog.hh"
#include "GsiCred/GsiCredSslPKI.hh"

#include <atomic>

namespace GsiCred
{
  //----------------------------------------------------------------------------
  // Constructor
  //----------------------------------------------------------------------------
  CredentialManager::CredentialManager( const Config                &config,
                                        std::shared_ptr<PKIFactory>  pki,
                                        Clock                        clock ):
    pConfig( config ),
    pPKI( pki ),
    pTrustStore( config.caCertDir, config.caRefresh, config.crlMode,
                 config.ocspMode, config.namespaceMode, clock ),
    pHostCache( Utils::SecondsToMs( config.hostCertRefresh ), clock ),
    pClientCache( Utils::SecondsToMs( config.tpcCredRefresh ), clock ),
    pIssuerHashes( std::make_shared<const std::string>() )
  {
    if( !pPKI )
      pPKI = std::make_shared<SslPKIFactory>();
  }

  CredentialManager::CredentialManager( const Config &config ):
    CredentialManager( config, std::make_shared<SslPKIFactory>() )
  {
  }

  //----------------------------------------------------------------------------
  // Destructor
  //----------------------------------------------------------------------------
  CredentialManager::~CredentialManager()
  {
    CancelOutstandingProxyRequest();
  }

  //----------------------------------------------------------------------------
  // Host credential
  //----------------------------------------------------------------------------
  Status CredentialManager::LoadServerCredentials()
  {
    std::lock_guard<std::mutex> scopedLock( pMutex );
    if( !pHostCache.NeedsRefresh() )
      return Status();

    Log *log = DefaultEnv::GetLog();
    log->Info( CredentialMsg, "Refreshing host credential, refresh interval: "
               "%llu s", (unsigned long long)pConfig.hostCertRefresh );

    Status st = pHostCache.Refresh(
        [this]( std::shared_ptr<const Credential> &cred )
        {
          return LoadHost( cred );
        } );
    if( !st.IsOK() )
    {
      log->Error( CredentialMsg, "Unable to load the host credential %s, %s: "
                  "%s", pConfig.hostCert.c_str(), pConfig.hostKey.c_str(),
                  st.ToStr().c_str() );
      return st;
    }
    return Status();
  }

  //----------------------------------------------------------------------------
  // Client credential and proxy
  //----------------------------------------------------------------------------
  void CredentialManager::LoadClientCredentials()
  {
    std::lock_guard<std::mutex> scopedLock( pMutex );
    Log *log = DefaultEnv::GetLog();

    if( pClientCache.NeedsRefresh() )
    {
      log->Info( CredentialMsg, "Refreshing proxy credential, refresh "
                 "interval: %llu s",
                 (unsigned long long)pConfig.tpcCredRefresh );

      Status st = pClientCache.Refresh(
          [this]( std::shared_ptr<const ClientCredentials> &cred )
          {
            return LoadClient( cred );
          } );
      if( !st.IsOK() )
        log->Error( CredentialMsg, "Could not load client credentials; %s: %s",
                    GetCredentialValues().c_str(), st.ToStr().c_str() );
    }

    UpdateIssuerHashes();
  }

  //----------------------------------------------------------------------------
  // Validation passthrough
  //----------------------------------------------------------------------------
  Status CredentialManager::Validate( const X509Chain &chain )
  {
    return pTrustStore.Validate( chain );
  }

  //----------------------------------------------------------------------------
  // Identity checks
  //----------------------------------------------------------------------------
  Status CredentialManager::CheckIdentity( X509              *cert,
                                           const std::string &host ) const
  {
    return IdentityChecker::CheckIdentity( cert, host );
  }

  Status CredentialManager::CheckCaIdentities(
                                 const std::vector<std::string> &cas ) const
  {
    return IdentityChecker::CheckCaIdentities( pConfig.caCertDir, cas );
  }

  Status CredentialManager::CheckCaIdentities( const std::string &cas ) const
  {
    return IdentityChecker::CheckCaIdentities( pConfig.caCertDir, cas );
  }

  //----------------------------------------------------------------------------
  // Delegation
  //----------------------------------------------------------------------------
  void CredentialManager::SetCredentialStoreClient(
                                 std::shared_ptr<CredentialStoreClient> store )
  {
    std::lock_guard<std::mutex> scopedLock( pMutex );
    pDelegation.SetCredentialStoreClient( store );
  }

  Status CredentialManager::PrepareSerializedProxyRequest(
                                                      const X509Chain &chain,
                                                      std::string     &csr )
  {
    std::lock_guard<std::mutex> scopedLock( pMutex );
    return pDelegation.Prepare( chain, csr );
  }

  Status CredentialManager::FinalizeDelegatedProxy( X509 *signedCert )
  {
    std::lock_guard<std::mutex> scopedLock( pMutex );
    return pDelegation.Finalize( signedCert );
  }

  void CredentialManager::CancelOutstandingProxyRequest()
  {
    std::lock_guard<std::mutex> scopedLock( pMutex );
    pDelegation.Cancel();
  }

  Status CredentialManager::HasValidDelegatedProxy( const X509Chain &chain,
                                                    bool            &valid )
  {
    std::lock_guard<std::mutex> scopedLock( pMutex );
    return pDelegation.HasValidDelegatedProxy( chain, pConfig.proxyMinValidFor,
                                               valid );
  }

  Status CredentialManager::GetSignedProxyRequest( const std::string &csr,
                                                   X509Chain         &newChain )
  {
    std::lock_guard<std::mutex> scopedLock( pMutex );
    std::shared_ptr<const ClientCredentials> client = pClientCache.Get();
    if( !client )
      return Status( stError, errUninitialized, kGsiServerError,
                     "no proxy credential has been loaded" );
    return ProxyDelegationCoordinator::GetSignedProxyRequest( *pPKI, csr,
                                                              client->proxy,
                                                              newChain );
  }

  ProxyDelegationCoordinator::State CredentialManager::GetDelegationState()
  {
    std::lock_guard<std::mutex> scopedLock( pMutex );
    return pDelegation.GetState();
  }

  //----------------------------------------------------------------------------
  // Snapshots
  //----------------------------------------------------------------------------
  std::shared_ptr<const Credential> CredentialManager::GetHostCredential() const
  {
    return pHostCache.Get();
  }

  std::shared_ptr<const Credential> CredentialManager::GetClientCredential() const
  {
    std::shared_ptr<const ClientCredentials> client = pClientCache.Get();
    if( !client )
      return std::shared_ptr<const Credential>();
    return std::shared_ptr<const Credential>( client, &client->credential );
  }

  std::shared_ptr<const Credential> CredentialManager::GetProxy() const
  {
    std::shared_ptr<const ClientCredentials> client = pClientCache.Get();
    if( !client )
      return std::shared_ptr<const Credential>();
    return std::shared_ptr<const Credential>( client, &client->proxy );
  }

  uint64_t CredentialManager::GetHostCredRefreshTimestamp() const
  {
    return pHostCache.GetTimestamp();
  }

  uint64_t CredentialManager::GetProxyRefreshTimestamp() const
  {
    return pClientCache.GetTimestamp();
  }

  std::string CredentialManager::GetClientCredIssuerHashes() const
  {
    return *std::atomic_load( &pIssuerHashes );
  }

  //----------------------------------------------------------------------------
  // Load the host credential
  //----------------------------------------------------------------------------
  Status CredentialManager::LoadHost( std::shared_ptr<const Credential> &cred )
  {
    Log *log = DefaultEnv::GetLog();
    std::shared_ptr<Credential> host = std::make_shared<Credential>();
    Status st = pPKI->LoadCredential( pConfig.hostCert, pConfig.hostKey, *host );
    if( !st.IsOK() )
      return st;

    if( pConfig.hostCertVerify )
    {
      log->Debug( CredentialMsg, "Verifying host certificate %s",
                  X509Utils::Subject( host->chain.Leaf() ).c_str() );
      st = pTrustStore.Validate( host->chain );
      if( !st.IsOK() )
        return st;
    }

    log->Info( CredentialMsg, "Loaded host credential %s",
               X509Utils::Subject( host->chain.Leaf() ).c_str() );
    cred = host;
    return Status();
  }

  //----------------------------------------------------------------------------
  // Load the client credential and derive the proxy
  //----------------------------------------------------------------------------
  Status CredentialManager::LoadClient(
                               std::shared_ptr<const ClientCredentials> &cred )
  {
    Log *log = DefaultEnv::GetLog();
    std::shared_ptr<ClientCredentials> client =
      std::make_shared<ClientCredentials>();

    if( !pConfig.tpcProxy.empty() )
    {
      Status st = pPKI->LoadProxy( pConfig.tpcProxy, client->proxy );
      if( !st.IsOK() )
        return st;
      client->credential = client->proxy;
      log->Info( CredentialMsg, "Loaded prefetched proxy %s from %s",
                 X509Utils::Subject( client->proxy.chain.Leaf() ).c_str(),
                 pConfig.tpcProxy.c_str() );
      cred = client;
      return Status();
    }

    Status st = pPKI->LoadCredential( pConfig.tpcCert, pConfig.tpcKey,
                                      client->credential );
    if( !st.IsOK() )
      return st;

    if( pConfig.tpcCredVerify )
    {
      log->Debug( CredentialMsg, "Verifying client certificate %s",
                  X509Utils::Subject( client->credential.chain.Leaf() ).c_str() );
      st = pTrustStore.Validate( client->credential.chain );
      if( !st.IsOK() )
        return st;
    }

    //--------------------------------------------------------------------------
    // Some servers refuse chains of length one, always use a real proxy
    //--------------------------------------------------------------------------
    ProxyOptions options;
    options.bits     = pConfig.proxyBits;
    options.lifetime = pConfig.proxyLifetime;
    options.depth    = pConfig.proxyDepth;
    st = pPKI->CreateProxy( client->credential, options, client->proxy );
    if( !st.IsOK() )
      return Status( stError, errProxyGeneration, st.errNo,
                     "could not generate host proxy credential: " + st.ToStr() );

    if( client->proxy.chain.Size() < 2 )
      return Status( stError, errProxyGeneration, 0,
                     "generated proxy chain has a single certificate" );

    log->Info( CredentialMsg, "Generated proxy %s",
               X509Utils::Subject( client->proxy.chain.Leaf() ).c_str() );
    cred = client;
    return Status();
  }

  //----------------------------------------------------------------------------
  // Recompute the issuer hashes of the current proxy
  //----------------------------------------------------------------------------
  void CredentialManager::UpdateIssuerHashes()
  {
    Log *log = DefaultEnv::GetLog();
    std::shared_ptr<const ClientCredentials> client = pClientCache.Get();
    std::shared_ptr<const std::string> hashes;
    if( client )
      hashes = std::make_shared<const std::string>(
        X509Utils::JoinHashes( X509Utils::IssuerHashes( client->proxy.chain ) ) );
    else
      hashes = std::make_shared<const std::string>();
    log->Debug( CredentialMsg, "Client issuer hashes: %s", hashes->c_str() );
    std::atomic_store( &pIssuerHashes, hashes );
  }

  //----------------------------------------------------------------------------
  // Describe the client credential sources
  //----------------------------------------------------------------------------
  std::string CredentialManager::GetCredentialValues() const
  {
    std::string values = "proxy: " + ( pConfig.tpcProxy.empty() ?
                                       std::string( "none" ) :
                                       pConfig.tpcProxy );
    values += ", cert: " + pConfig.tpcCert;
    values += ", key: " + pConfig.tpcKey;
    return values;
  }
}
