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

#include "GsiCred/GsiCredDelegation.hh"
#include "GsiCred/GsiCredConstants.hh"
#include "GsiCred/GsiCredDefaultEnv.hh"
#include "GsiCred/GsiCredLog.hh"

namespace GsiCred
{
  //----------------------------------------------------------------------------
  // Issue a proxy request
  //----------------------------------------------------------------------------
  Status ProxyDelegationCoordinator::Prepare( const X509Chain &chain,
                                              std::string     &csr )
  {
    Log *log = DefaultEnv::GetLog();

    Status st = CheckStore();
    if( !st.IsOK() )
      return st;

    if( chain.Empty() )
      return Status( stError, errInvalidArgs, kGsiArgInvalid,
                     "empty certificate chain" );

    if( pRequest )
    {
      log->Warning( DelegationMsg, "Proxy request %s for %s is still "
                    "outstanding, cancelling it", pRequest->id.c_str(),
                    X509Utils::Subject( pRequest->key.Leaf() ).c_str() );
      CancelPending();
    }

    std::unique_ptr<ProxyRequest> request( new ProxyRequest() );
    st = pStore->GetProxyRequest( chain, *request );
    if( !st.IsOK() )
    {
      log->Error( DelegationMsg, "Unable to get a proxy request for %s: %s",
                  X509Utils::Subject( chain.Leaf() ).c_str(),
                  st.ToStr().c_str() );
      if( st.code != errStoreError )
        return Status( stError, errStoreError, kGsiServerError,
                       "cannot get proxy request: " + st.ToStr() );
      return st;
    }

    //--------------------------------------------------------------------------
    // The chain the proxy will be appended to is the one of the client,
    // whatever the store gave back
    //--------------------------------------------------------------------------
    request->key = chain;
    csr          = request->request;
    log->Debug( DelegationMsg, "Proxy request %s prepared for %s",
                request->id.c_str(), X509Utils::Subject( chain.Leaf() ).c_str() );
    pRequest = std::move( request );
    return Status();
  }

  //----------------------------------------------------------------------------
  // Store the signed proxy
  //----------------------------------------------------------------------------
  Status ProxyDelegationCoordinator::Finalize( X509 *signedCert )
  {
    Log *log = DefaultEnv::GetLog();

    if( !pRequest )
      return Status( stError, errDelegationState, kGsiServerError,
                     "cannot finalize proxy: proxy request was not sent." );

    Status st = CheckStore();
    if( !st.IsOK() )
      return st;

    if( !signedCert )
      return Status( stError, errInvalidArgs, kGsiArgInvalid,
                     "no signed proxy certificate" );

    X509Chain proxyChain;
    proxyChain.PushBack( signedCert );
    proxyChain.Append( pRequest->key );

    st = pStore->StoreCredential( pRequest->key, pRequest->id,
                                  proxyChain.ToPEM() );
    if( !st.IsOK() )
    {
      log->Error( DelegationMsg, "Unable to store the proxy of request %s: %s",
                  pRequest->id.c_str(), st.ToStr().c_str() );
      if( st.code != errStoreError )
        return Status( stError, errStoreError, kGsiServerError,
                       "cannot store proxy: " + st.ToStr() );
      return st;
    }

    log->Info( DelegationMsg, "Delegated proxy of %s stored, request %s",
               X509Utils::Subject( pRequest->key.Leaf() ).c_str(),
               pRequest->id.c_str() );
    pRequest.reset();
    return Status();
  }

  //----------------------------------------------------------------------------
  // Cancel the outstanding request
  //----------------------------------------------------------------------------
  void ProxyDelegationCoordinator::Cancel()
  {
    if( !pRequest )
      return;
    CancelPending();
  }

  //----------------------------------------------------------------------------
  // Look for a usable proxy in the store
  //----------------------------------------------------------------------------
  Status ProxyDelegationCoordinator::HasValidDelegatedProxy(
                                                  const X509Chain &chain,
                                                  uint64_t         minValidFor,
                                                  bool            &valid )
  {
    valid = false;
    Status st = CheckStore();
    if( !st.IsOK() )
      return st;

    std::unique_ptr<Credential> proxy;
    st = pStore->FetchCredential( chain, minValidFor, proxy );
    if( !st.IsOK() )
    {
      if( st.code != errStoreError )
        return Status( stError, errStoreError, kGsiServerError,
                       "cannot fetch proxy: " + st.ToStr() );
      return st;
    }
    valid = (bool)proxy;
    return Status();
  }

  //----------------------------------------------------------------------------
  // Sign a peer's proxy request
  //----------------------------------------------------------------------------
  Status ProxyDelegationCoordinator::GetSignedProxyRequest(
                                                   PKIFactory        &pki,
                                                   const std::string &csr,
                                                   const Credential  &proxy,
                                                   X509Chain         &newChain )
  {
    Log *log = DefaultEnv::GetLog();
    Status st = pki.SignProxyRequest( csr, proxy, newChain );
    if( !st.IsOK() )
    {
      log->Error( DelegationMsg, "Unable to sign the proxy request: %s",
                  st.ToStr().c_str() );
      return st;
    }
    log->Debug( DelegationMsg, "Signed proxy request, new leaf %s",
                X509Utils::Subject( newChain.Leaf() ).c_str() );
    return Status();
  }

  //----------------------------------------------------------------------------
  // The store must have been set
  //----------------------------------------------------------------------------
  Status ProxyDelegationCoordinator::CheckStore() const
  {
    if( !pStore )
      return Status( stError, errStoreUnavailable, kGsiServerError,
                     "no client to credential store has been provided." );
    return Status();
  }

  //----------------------------------------------------------------------------
  // Notify the store and forget the request
  //----------------------------------------------------------------------------
  void ProxyDelegationCoordinator::CancelPending()
  {
    Log *log = DefaultEnv::GetLog();
    if( pStore && !pRequest->id.empty() )
    {
      Status st = pStore->CancelProxyRequest( *pRequest );
      if( !st.IsOK() )
        log->Warning( DelegationMsg, "Problem cancelling proxy delegation "
                      "request %s %s: %s",
                      X509Utils::Subject( pRequest->key.Leaf() ).c_str(),
                      pRequest->id.c_str(), st.ToStr().c_str() );
      else
        log->Debug( DelegationMsg, "Proxy request %s cancelled",
                    pRequest->id.c_str() );
    }
    pRequest.reset();
  }
}
