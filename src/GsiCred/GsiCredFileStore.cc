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

#include "GsiCred/GsiCredFileStore.hh"
#include "GsiCred/GsiCredConstants.hh"
#include "GsiCred/GsiCredDefaultEnv.hh"
#include "GsiCred/GsiCredLog.hh"
#include "GsiCred/GsiCredUtils.hh"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <openssl/rand.h>

namespace
{
  //----------------------------------------------------------------------------
  // Random request identifier
  //----------------------------------------------------------------------------
  bool newRequestId( std::string &id )
  {
    unsigned char bytes[16];
    if( RAND_bytes( bytes, sizeof( bytes ) ) != 1 )
      return false;
    char hex[sizeof( bytes ) * 2 + 1];
    for( size_t i = 0; i < sizeof( bytes ); ++i )
      snprintf( hex + 2*i, 3, "%02x", bytes[i] );
    id = hex;
    return true;
  }
}

namespace GsiCred
{
  //----------------------------------------------------------------------------
  // Constructor
  //----------------------------------------------------------------------------
  LocalCredentialStore::LocalCredentialStore(
                                   const std::string           &directory,
                                   std::shared_ptr<PKIFactory>  pki ):
    pDirectory( directory ),
    pPKI( pki )
  {
  }

  //----------------------------------------------------------------------------
  // Fetch a stored proxy
  //----------------------------------------------------------------------------
  Status LocalCredentialStore::FetchCredential(
                                   const X509Chain             &chain,
                                   uint64_t                     minValidFor,
                                   std::unique_ptr<Credential> &credential )
  {
    Log *log = DefaultEnv::GetLog();
    credential.reset();
    if( chain.Empty() )
      return Status( stError, errInvalidArgs, 0, "empty certificate chain" );

    std::string path = GetProxyPath( chain );
    if( !Utils::IsRegularFile( path ) )
    {
      log->Debug( StoreMsg, "No proxy stored at %s", path.c_str() );
      return Status();
    }

    std::unique_ptr<Credential> proxy( new Credential() );
    Status st = pPKI->LoadProxy( path, *proxy );
    if( !st.IsOK() )
    {
      //------------------------------------------------------------------------
      // An expired proxy is not an error, just not usable
      //------------------------------------------------------------------------
      log->Info( StoreMsg, "Stored proxy %s is not usable: %s", path.c_str(),
                 st.ToStr().c_str() );
      return Status();
    }

    int64_t remaining = proxy->chain.RemainingLifetime();
    if( remaining < (int64_t)minValidFor )
    {
      log->Debug( StoreMsg, "Stored proxy %s is valid for %lld seconds only, "
                  "%llu needed", path.c_str(), (long long)remaining,
                  (unsigned long long)minValidFor );
      return Status();
    }

    credential = std::move( proxy );
    return Status();
  }

  //----------------------------------------------------------------------------
  // Issue a proxy request
  //----------------------------------------------------------------------------
  Status LocalCredentialStore::GetProxyRequest( const X509Chain &chain,
                                                ProxyRequest    &request )
  {
    Log *log = DefaultEnv::GetLog();
    if( chain.Empty() )
      return Status( stError, errInvalidArgs, 0, "empty certificate chain" );

    std::string csr;
    PrivateKey  key;
    Status st = pPKI->CreateProxyRequest( chain, csr, key );
    if( !st.IsOK() )
      return Status( stError, errStoreError, kGsiServerError,
                     "cannot create the proxy request: " + st.ToStr() );

    std::string id;
    if( !newRequestId( id ) )
      return Status( stError, errStoreError, kGsiServerError,
                     "cannot generate a request identifier" );

    {
      std::lock_guard<std::mutex> scopedLock( pMutex );
      pPending[id] = key;
    }

    request.id      = id;
    request.request = csr;
    request.key     = chain;
    log->Debug( StoreMsg, "Issued proxy request %s for %s", id.c_str(),
                X509Utils::Subject( chain.Leaf() ).c_str() );
    return Status();
  }

  //----------------------------------------------------------------------------
  // Store a signed proxy
  //----------------------------------------------------------------------------
  Status LocalCredentialStore::StoreCredential( const X509Chain   &chain,
                                                const std::string &id,
                                                const std::string &pem )
  {
    Log *log = DefaultEnv::GetLog();
    PrivateKey key;
    {
      std::lock_guard<std::mutex> scopedLock( pMutex );
      std::map<std::string, PrivateKey>::iterator it = pPending.find( id );
      if( it == pPending.end() )
        return Status( stError, errNotFound, kGsiServerError,
                       "unknown proxy request " + id );
      key = it->second;
    }

    Credential proxy;
    Status st = X509Chain::FromPEM( pem, proxy.chain );
    if( !st.IsOK() )
      return Status( stError, errStoreError, kGsiServerError,
                     "cannot parse the signed proxy: " + st.ToStr() );

    if( proxy.chain.Size() < 2 || !X509Utils::IsProxy( proxy.chain.Leaf() ) )
      return Status( stError, errStoreError, kGsiServerError,
                     "the signed chain does not start with a proxy" );

    if( !key.Matches( proxy.chain.Leaf() ) )
      return Status( stError, errStoreError, kGsiServerError,
                     "the signed proxy does not match request " + id );
    proxy.key = key;

    std::string path = GetProxyPath( chain );
    st = WriteProxy( path, proxy );
    if( !st.IsOK() )
      return st;

    {
      std::lock_guard<std::mutex> scopedLock( pMutex );
      pPending.erase( id );
    }
    log->Info( StoreMsg, "Stored delegated proxy %s in %s",
               X509Utils::Subject( proxy.chain.Leaf() ).c_str(),
               path.c_str() );
    return Status();
  }

  //----------------------------------------------------------------------------
  // Cancel a request
  //----------------------------------------------------------------------------
  Status LocalCredentialStore::CancelProxyRequest( const ProxyRequest &request )
  {
    Log *log = DefaultEnv::GetLog();
    std::lock_guard<std::mutex> scopedLock( pMutex );
    if( pPending.erase( request.id ) == 0 )
      return Status( stError, errNotFound, kGsiServerError,
                     "unknown proxy request " + request.id );
    log->Debug( StoreMsg, "Cancelled proxy request %s", request.id.c_str() );
    return Status();
  }

  //----------------------------------------------------------------------------
  // Proxy file of a client
  //----------------------------------------------------------------------------
  std::string LocalCredentialStore::GetProxyPath( const X509Chain &chain ) const
  {
    X509 *eec = chain.EndEntity();
    if( !eec )
      eec = chain.Leaf();
    return pDirectory + "/" + ProxyFilePrefix + X509Utils::SubjectHash( eec );
  }

  //----------------------------------------------------------------------------
  // Pending requests
  //----------------------------------------------------------------------------
  size_t LocalCredentialStore::GetPendingCount()
  {
    std::lock_guard<std::mutex> scopedLock( pMutex );
    return pPending.size();
  }

  //----------------------------------------------------------------------------
  // Write a proxy file, readable by the owner only
  //----------------------------------------------------------------------------
  Status LocalCredentialStore::WriteProxy( const std::string &path,
                                           const Credential  &proxy )
  {
    //--------------------------------------------------------------------------
    // Every writer gets its own temporary file, the last rename wins
    //--------------------------------------------------------------------------
    std::string content = proxy.ToPEM();
    std::vector<char> tmpName( path.begin(), path.end() );
    const char suffix[] = ".XXXXXX";
    tmpName.insert( tmpName.end(), suffix, suffix + sizeof( suffix ) );

    ScopedDescriptor fd( mkstemp( tmpName.data() ) );
    std::string tmpPath( tmpName.data() );
    if( fd.GetDescriptor() < 0 )
      return Status( stError, errOSError, errno, "cannot create " + tmpPath );

    if( fchmod( fd.GetDescriptor(), 0600 ) != 0 )
    {
      int err = errno;
      unlink( tmpPath.c_str() );
      return Status( stError, errOSError, err,
                     "cannot set permissions on " + tmpPath );
    }

    size_t written = 0;
    while( written < content.size() )
    {
      ssize_t rc = write( fd.GetDescriptor(), content.data() + written,
                          content.size() - written );
      if( rc < 0 )
      {
        if( errno == EINTR )
          continue;
        int err = errno;
        unlink( tmpPath.c_str() );
        return Status( stError, errOSError, err, "cannot write " + tmpPath );
      }
      written += rc;
    }

    if( close( fd.Release() ) != 0 || rename( tmpPath.c_str(), path.c_str() ) != 0 )
    {
      int err = errno;
      unlink( tmpPath.c_str() );
      return Status( stError, errOSError, err, "cannot write " + path );
    }
    return Status();
  }
}
