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

#include "GsiCred/GsiCredTrustStore.hh"
#include "GsiCred/GsiCredConstants.hh"
#include "GsiCred/GsiCredDefaultEnv.hh"
#include "GsiCred/GsiCredLog.hh"

#include <openssl/err.h>
#include <openssl/x509.h>

namespace
{
  using namespace GsiCred;

  //----------------------------------------------------------------------------
  // Proxies are not covered by CRLs of their own
  //----------------------------------------------------------------------------
  bool missingProxyCrl( int err, X509_STORE_CTX *ctx )
  {
    if( err != X509_V_ERR_UNABLE_TO_GET_CRL )
      return false;
    return X509Utils::IsProxy( X509_STORE_CTX_get_current_cert( ctx ) );
  }

  //----------------------------------------------------------------------------
  // Verification callback for the REQUIRE mode
  //----------------------------------------------------------------------------
  int verifyCrlRequire( int ok, X509_STORE_CTX *ctx )
  {
    if( ok )
      return ok;
    if( missingProxyCrl( X509_STORE_CTX_get_error( ctx ), ctx ) )
    {
      X509_STORE_CTX_set_error( ctx, X509_V_OK );
      return 1;
    }
    return ok;
  }

  //----------------------------------------------------------------------------
  // Verification callback for the IF_VALID mode, CRLs that are missing or
  // out of their validity period are skipped
  //----------------------------------------------------------------------------
  int verifyCrlIfValid( int ok, X509_STORE_CTX *ctx )
  {
    if( ok )
      return ok;
    int err = X509_STORE_CTX_get_error( ctx );
    if( err == X509_V_ERR_UNABLE_TO_GET_CRL ||
        err == X509_V_ERR_CRL_HAS_EXPIRED   ||
        err == X509_V_ERR_CRL_NOT_YET_VALID )
    {
      X509_STORE_CTX_set_error( ctx, X509_V_OK );
      return 1;
    }
    return ok;
  }
}

namespace GsiCred
{
  //----------------------------------------------------------------------------
  // Constructor
  //----------------------------------------------------------------------------
  TrustStore::TrustStore( const std::string     &caDir,
                          uint64_t               refresh,
                          CrlCheckingMode        crlMode,
                          OcspCheckingMode       ocspMode,
                          NamespaceCheckingMode  namespaceMode,
                          Clock                  clock ):
    pCADir( caDir ),
    pRefresh( refresh ),
    pCrlMode( crlMode ),
    pOcspMode( ocspMode ),
    pNamespaceMode( namespaceMode ),
    pClock( clock ),
    pStoreTimestamp( 0 )
  {
    Log *log = DefaultEnv::GetLog();
    if( pOcspMode != OcspIgnore )
      log->Debug( TrustMsg, "OCSP mode %s: no responder is queried",
                  Config::OcspModeToString( pOcspMode ) );
    if( pNamespaceMode != NsIgnore )
      log->Debug( TrustMsg, "Namespace mode %s: no signing policy is "
                  "enforced", Config::NamespaceModeToString( pNamespaceMode ) );
  }

  //----------------------------------------------------------------------------
  // Validate a chain
  //----------------------------------------------------------------------------
  Status TrustStore::Validate( const X509Chain &chain )
  {
    Log *log = DefaultEnv::GetLog();
    if( chain.Empty() )
      return Status( stError, errInvalidArgs, 0, "empty certificate chain" );

    StorePtr store;
    Status st = GetStore( store );
    if( !st.IsOK() )
      return st;

    X509_STORE_CTX *ctx = X509_STORE_CTX_new();
    STACK_OF(X509) *untrusted = sk_X509_new_null();
    if( !ctx || !untrusted )
    {
      X509_STORE_CTX_free( ctx );
      sk_X509_free( untrusted );
      return Status( stError, errInternal, 0,
                     "cannot allocate the verification context" );
    }
    for( size_t i = 1; i < chain.Size(); ++i )
      sk_X509_push( untrusted, chain.At( i ) );

    std::string subject = X509Utils::Subject( chain.Leaf() );
    if( X509_STORE_CTX_init( ctx, store.get(), chain.Leaf(), untrusted ) != 1 )
    {
      X509_STORE_CTX_free( ctx );
      sk_X509_free( untrusted );
      return Status( stError, errInternal, 0, "cannot initialize the "
                     "verification context: " + X509Utils::SslError() );
    }

    int rc = X509_verify_cert( ctx );
    Status result;
    if( rc != 1 )
    {
      int         err   = X509_STORE_CTX_get_error( ctx );
      int         depth = X509_STORE_CTX_get_error_depth( ctx );
      std::string where = X509Utils::Subject(
                            X509_STORE_CTX_get_current_cert( ctx ) );
      std::string msg   = "certificate chain of " + subject +
                          " is not trusted: " +
                          X509_verify_cert_error_string( err ) +
                          " at depth " + std::to_string( depth );
      if( !where.empty() )
        msg += " (" + where + ")";
      log->Debug( TrustMsg, "%s", msg.c_str() );
      result = Status( stError, errValidation, kGsiNotAuthorized, msg );
      ERR_clear_error();
    }
    else
      log->Dump( TrustMsg, "Validated certificate chain of %s",
                 subject.c_str() );

    X509_STORE_CTX_free( ctx );
    sk_X509_free( untrusted );
    return result;
  }

  //----------------------------------------------------------------------------
  // Get the current store, rebuild it if it is stale
  //----------------------------------------------------------------------------
  Status TrustStore::GetStore( StorePtr &store )
  {
    std::lock_guard<std::mutex> scopedLock( pMutex );
    uint64_t now = pClock();
    if( pStore && now - pStoreTimestamp < Utils::SecondsToMs( pRefresh ) )
    {
      store = pStore;
      return Status();
    }

    StorePtr newStore;
    Status st = BuildStore( newStore );
    if( !st.IsOK() )
      return st;
    pStore          = newStore;
    pStoreTimestamp = now;
    store           = pStore;
    return Status();
  }

  //----------------------------------------------------------------------------
  // Build a store over the CA directory
  //----------------------------------------------------------------------------
  Status TrustStore::BuildStore( StorePtr &store )
  {
    Log *log = DefaultEnv::GetLog();
    StorePtr newStore( X509_STORE_new(), X509_STORE_free );
    if( !newStore )
      return Status( stError, errInternal, 0, "cannot allocate the store" );

    X509_LOOKUP *lookup = X509_STORE_add_lookup( newStore.get(),
                                                 X509_LOOKUP_hash_dir() );
    if( !lookup ||
        X509_LOOKUP_add_dir( lookup, pCADir.c_str(), X509_FILETYPE_PEM ) != 1 )
      return Status( stError, errValidation, kGsiServerError,
                     "cannot use the CA directory " + pCADir + ": " +
                     X509Utils::SslError() );

    unsigned long flags = X509_V_FLAG_ALLOW_PROXY_CERTS;
    switch( pCrlMode )
    {
      case CrlRequire:
        flags |= X509_V_FLAG_CRL_CHECK | X509_V_FLAG_CRL_CHECK_ALL;
        X509_STORE_set_verify_cb( newStore.get(), verifyCrlRequire );
        break;
      case CrlIfValid:
        flags |= X509_V_FLAG_CRL_CHECK | X509_V_FLAG_CRL_CHECK_ALL;
        X509_STORE_set_verify_cb( newStore.get(), verifyCrlIfValid );
        break;
      case CrlIgnore:
        break;
    }
    X509_STORE_set_flags( newStore.get(), flags );

    log->Debug( TrustMsg, "Loaded trust anchors from %s (CRL mode %s)",
                pCADir.c_str(), Config::CrlModeToString( pCrlMode ) );
    store = newStore;
    return Status();
  }
}
