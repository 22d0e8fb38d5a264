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

#include "GsiCred/GsiCredX509.hh"
#include "GsiCred/GsiCredConstants.hh"

#include <cerrno>
#include <cstdio>
#include <fstream>
#include <sstream>

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509v3.h>

namespace
{
  //----------------------------------------------------------------------------
  // Read a whole file into memory
  //----------------------------------------------------------------------------
  GsiCred::Status readFile( const std::string &path, std::string &content )
  {
    using namespace GsiCred;
    std::ifstream in( path.c_str(), std::ios::in | std::ios::binary );
    if( !in.good() )
      return Status( stError, errOSError, errno, "cannot open " + path );
    std::ostringstream o;
    o << in.rdbuf();
    if( in.bad() )
      return Status( stError, errOSError, errno, "cannot read " + path );
    content = o.str();
    return Status();
  }

  //----------------------------------------------------------------------------
  // Get the content of a memory BIO
  //----------------------------------------------------------------------------
  std::string bioToString( BIO *bio )
  {
    char *data = 0;
    long  len  = BIO_get_mem_data( bio, &data );
    if( len <= 0 || !data )
      return "";
    return std::string( data, len );
  }
}

namespace GsiCred
{
  //----------------------------------------------------------------------------
  // Copy constructor
  //----------------------------------------------------------------------------
  X509Chain::X509Chain( const X509Chain &other )
  {
    Append( other );
  }

  //----------------------------------------------------------------------------
  // Assignment
  //----------------------------------------------------------------------------
  X509Chain &X509Chain::operator=( const X509Chain &other )
  {
    if( this == &other )
      return *this;
    Clear();
    Append( other );
    return *this;
  }

  //----------------------------------------------------------------------------
  // Destructor
  //----------------------------------------------------------------------------
  X509Chain::~X509Chain()
  {
    Clear();
  }

  //----------------------------------------------------------------------------
  // Drop all the references
  //----------------------------------------------------------------------------
  void X509Chain::Clear()
  {
    for( size_t i = 0; i < pCerts.size(); ++i )
      X509_free( pCerts[i] );
    pCerts.clear();
  }

  //----------------------------------------------------------------------------
  // Append a certificate
  //----------------------------------------------------------------------------
  void X509Chain::PushBack( X509 *cert )
  {
    if( !cert ) return;
    X509_up_ref( cert );
    pCerts.push_back( cert );
  }

  //----------------------------------------------------------------------------
  // Prepend a certificate
  //----------------------------------------------------------------------------
  void X509Chain::PushFront( X509 *cert )
  {
    if( !cert ) return;
    X509_up_ref( cert );
    pCerts.insert( pCerts.begin(), cert );
  }

  //----------------------------------------------------------------------------
  // Append a chain
  //----------------------------------------------------------------------------
  void X509Chain::Append( const X509Chain &other )
  {
    for( size_t i = 0; i < other.pCerts.size(); ++i )
      PushBack( other.pCerts[i] );
  }

  //----------------------------------------------------------------------------
  // Find the end entity certificate
  //----------------------------------------------------------------------------
  X509 *X509Chain::EndEntity() const
  {
    for( size_t i = 0; i < pCerts.size(); ++i )
      if( !X509Utils::IsProxy( pCerts[i] ) )
        return pCerts[i];
    return 0;
  }

  //----------------------------------------------------------------------------
  // Remaining lifetime of the chain
  //----------------------------------------------------------------------------
  int64_t X509Chain::RemainingLifetime() const
  {
    if( pCerts.empty() )
      return -1;
    int64_t remaining = X509Utils::RemainingLifetime( pCerts[0] );
    for( size_t i = 1; i < pCerts.size(); ++i )
    {
      int64_t r = X509Utils::RemainingLifetime( pCerts[i] );
      if( r < remaining )
        remaining = r;
    }
    return remaining;
  }

  //----------------------------------------------------------------------------
  // Compare
  //----------------------------------------------------------------------------
  bool X509Chain::operator==( const X509Chain &other ) const
  {
    if( pCerts.size() != other.pCerts.size() )
      return false;
    for( size_t i = 0; i < pCerts.size(); ++i )
      if( X509_cmp( pCerts[i], other.pCerts[i] ) != 0 )
        return false;
    return true;
  }

  //----------------------------------------------------------------------------
  // Serialize
  //----------------------------------------------------------------------------
  std::string X509Chain::ToPEM() const
  {
    BIO *bio = BIO_new( BIO_s_mem() );
    if( !bio )
      return "";
    for( size_t i = 0; i < pCerts.size(); ++i )
      PEM_write_bio_X509( bio, pCerts[i] );
    std::string pem = bioToString( bio );
    BIO_free( bio );
    return pem;
  }

  //----------------------------------------------------------------------------
  // Parse
  //----------------------------------------------------------------------------
  Status X509Chain::FromPEM( const std::string &pem, X509Chain &chain )
  {
    BIO *bio = BIO_new_mem_buf( pem.data(), (int)pem.size() );
    if( !bio )
      return Status( stError, errInternal, 0, "cannot allocate a BIO" );

    X509Chain result;
    X509     *cert = 0;
    while( ( cert = PEM_read_bio_X509( bio, 0, 0, 0 ) ) )
    {
      result.PushBack( cert );
      X509_free( cert );
    }
    BIO_free( bio );

    //--------------------------------------------------------------------------
    // Reaching the end of the buffer leaves a "no start line" error behind
    //--------------------------------------------------------------------------
    ERR_clear_error();

    if( result.Empty() )
      return Status( stError, errDataError, 0, "no certificate found" );
    chain = result;
    return Status();
  }

  //----------------------------------------------------------------------------
  // Read from file
  //----------------------------------------------------------------------------
  Status X509Chain::FromFile( const std::string &path, X509Chain &chain )
  {
    std::string content;
    Status st = readFile( path, content );
    if( !st.IsOK() )
      return st;
    st = FromPEM( content, chain );
    if( !st.IsOK() )
      st.SetErrorMessage( path + ": " + st.GetErrorMessage() );
    return st;
  }

  //----------------------------------------------------------------------------
  // Private key
  //----------------------------------------------------------------------------
  PrivateKey::PrivateKey( EVP_PKEY *key ): pKey( key )
  {
  }

  PrivateKey::PrivateKey( const PrivateKey &other ): pKey( other.pKey )
  {
    if( pKey )
      EVP_PKEY_up_ref( pKey );
  }

  PrivateKey &PrivateKey::operator=( const PrivateKey &other )
  {
    if( this == &other )
      return *this;
    if( other.pKey )
      EVP_PKEY_up_ref( other.pKey );
    EVP_PKEY_free( pKey );
    pKey = other.pKey;
    return *this;
  }

  PrivateKey::~PrivateKey()
  {
    EVP_PKEY_free( pKey );
  }

  //----------------------------------------------------------------------------
  // Check the key against a certificate
  //----------------------------------------------------------------------------
  bool PrivateKey::Matches( X509 *cert ) const
  {
    if( !pKey || !cert )
      return false;
    bool ok = X509_check_private_key( cert, pKey ) == 1;
    ERR_clear_error();
    return ok;
  }

  //----------------------------------------------------------------------------
  // Serialize
  //----------------------------------------------------------------------------
  std::string PrivateKey::ToPEM() const
  {
    if( !pKey )
      return "";
    BIO *bio = BIO_new( BIO_s_mem() );
    if( !bio )
      return "";
    PEM_write_bio_PrivateKey( bio, pKey, 0, 0, 0, 0, 0 );
    std::string pem = bioToString( bio );
    BIO_free( bio );
    return pem;
  }

  //----------------------------------------------------------------------------
  // Parse
  //----------------------------------------------------------------------------
  Status PrivateKey::FromPEM( const std::string &pem, PrivateKey &key )
  {
    BIO *bio = BIO_new_mem_buf( pem.data(), (int)pem.size() );
    if( !bio )
      return Status( stError, errInternal, 0, "cannot allocate a BIO" );
    EVP_PKEY *pkey = PEM_read_bio_PrivateKey( bio, 0, 0, 0 );
    BIO_free( bio );
    if( !pkey )
      return Status( stError, errDataError, 0, "no private key found: " +
                     X509Utils::SslError() );
    key = PrivateKey( pkey );
    return Status();
  }

  //----------------------------------------------------------------------------
  // Read from file
  //----------------------------------------------------------------------------
  Status PrivateKey::FromFile( const std::string &path, PrivateKey &key )
  {
    std::string content;
    Status st = readFile( path, content );
    if( !st.IsOK() )
      return st;
    st = FromPEM( content, key );
    if( !st.IsOK() )
      st.SetErrorMessage( path + ": " + st.GetErrorMessage() );
    return st;
  }

  //----------------------------------------------------------------------------
  // Serialize a credential in the proxy file layout
  //----------------------------------------------------------------------------
  std::string Credential::ToPEM() const
  {
    if( chain.Empty() )
      return "";
    X509Chain leaf;
    leaf.PushBack( chain.Leaf() );
    X509Chain rest;
    for( size_t i = 1; i < chain.Size(); ++i )
      rest.PushBack( chain.At( i ) );
    return leaf.ToPEM() + key.ToPEM() + rest.ToPEM();
  }

  //----------------------------------------------------------------------------
  // Parse a credential
  //----------------------------------------------------------------------------
  Status Credential::FromPEM( const std::string &pem, Credential &cred )
  {
    Credential result;
    Status st = X509Chain::FromPEM( pem, result.chain );
    if( !st.IsOK() )
      return st;
    st = PrivateKey::FromPEM( pem, result.key );
    if( !st.IsOK() )
      return st;
    cred = result;
    return Status();
  }

  //----------------------------------------------------------------------------
  // Name in one line
  //----------------------------------------------------------------------------
  std::string X509Utils::NameOneLine( X509_NAME *name )
  {
    if( !name )
      return "";
    char *buf = X509_NAME_oneline( name, 0, 0 );
    if( !buf )
      return "";
    std::string result( buf );
    OPENSSL_free( buf );
    return result;
  }

  std::string X509Utils::Subject( X509 *cert )
  {
    return cert ? NameOneLine( X509_get_subject_name( cert ) ) : "";
  }

  std::string X509Utils::Issuer( X509 *cert )
  {
    return cert ? NameOneLine( X509_get_issuer_name( cert ) ) : "";
  }

  //----------------------------------------------------------------------------
  // Hashes
  //----------------------------------------------------------------------------
  std::string X509Utils::NameHash( X509_NAME *name )
  {
    if( !name )
      return "";
    char chash[16];
    snprintf( chash, sizeof( chash ), "%08lx", X509_NAME_hash( name ) );
    return chash;
  }

  std::string X509Utils::SubjectHash( X509 *cert )
  {
    return cert ? NameHash( X509_get_subject_name( cert ) ) : "";
  }

  std::string X509Utils::IssuerHash( X509 *cert )
  {
    return cert ? NameHash( X509_get_issuer_name( cert ) ) : "";
  }

  std::set<std::string> X509Utils::IssuerHashes( const X509Chain &chain )
  {
    std::set<std::string> hashes;
    for( size_t i = 0; i < chain.Size(); ++i )
      hashes.insert( IssuerHash( chain.At( i ) ) );
    return hashes;
  }

  std::string X509Utils::JoinHashes( const std::set<std::string> &hashes )
  {
    std::string result;
    std::set<std::string>::const_iterator it;
    for( it = hashes.begin(); it != hashes.end(); ++it )
    {
      if( !result.empty() )
        result += CAHashSeparator;
      result += *it;
    }
    return result;
  }

  //----------------------------------------------------------------------------
  // Proxy information
  //----------------------------------------------------------------------------
  bool X509Utils::IsProxy( X509 *cert )
  {
    if( !cert )
      return false;
    return ( X509_get_extension_flags( cert ) & EXFLAG_PROXY ) != 0;
  }

  int X509Utils::ProxyPathLength( X509 *cert )
  {
    if( !cert )
      return -1;
    PROXY_CERT_INFO_EXTENSION *pci = (PROXY_CERT_INFO_EXTENSION *)
      X509_get_ext_d2i( cert, NID_proxyCertInfo, 0, 0 );
    if( !pci )
      return -1;
    int pathlen = -1;
    if( pci->pcPathLengthConstraint )
      pathlen = (int)ASN1_INTEGER_get( pci->pcPathLengthConstraint );
    PROXY_CERT_INFO_EXTENSION_free( pci );
    return pathlen;
  }

  //----------------------------------------------------------------------------
  // Remaining lifetime
  //----------------------------------------------------------------------------
  int64_t X509Utils::RemainingLifetime( X509 *cert )
  {
    if( !cert )
      return -1;
    int day = 0, sec = 0;
    if( !ASN1_TIME_diff( &day, &sec, 0, X509_get0_notAfter( cert ) ) )
      return -1;
    return (int64_t)day * 86400 + sec;
  }

  //----------------------------------------------------------------------------
  // OpenSSL errors
  //----------------------------------------------------------------------------
  std::string X509Utils::SslError()
  {
    std::string   result;
    unsigned long err;
    char          buf[256];
    while( ( err = ERR_get_error() ) != 0 )
    {
      ERR_error_string_n( err, buf, sizeof( buf ) );
      if( !result.empty() )
        result += "; ";
      result += buf;
    }
    if( result.empty() )
      result = "unknown OpenSSL error";
    return result;
  }
}
