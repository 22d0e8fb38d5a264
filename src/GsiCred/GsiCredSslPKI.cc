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

#include "GsiCred/GsiCredSslPKI.hh"
#include "GsiCred/GsiCredDefaultEnv.hh"
#include "GsiCred/GsiCredLog.hh"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/objects.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>
#include <openssl/x509v3.h>

namespace
{
  using namespace GsiCred;

  typedef std::unique_ptr<X509, decltype(&X509_free)>           X509Ptr;
  typedef std::unique_ptr<X509_REQ, decltype(&X509_REQ_free)>   X509ReqPtr;
  typedef std::unique_ptr<X509_NAME, decltype(&X509_NAME_free)> X509NamePtr;
  typedef std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>   EvpPKeyPtr;

  //----------------------------------------------------------------------------
  // Create a new RSA key (exponent 65537)
  //----------------------------------------------------------------------------
  EVP_PKEY *generateKey( int bits )
  {
    BIGNUM *e = BN_new();
    if( !e )
      return 0;
    BN_set_word( e, 0x10001 );
    EVP_PKEY_CTX *pkctx = EVP_PKEY_CTX_new_id( EVP_PKEY_RSA, 0 );
    if( !pkctx )
    {
      BN_free( e );
      return 0;
    }
    EVP_PKEY *key = 0;
    EVP_PKEY_keygen_init( pkctx );
    EVP_PKEY_CTX_set_rsa_keygen_bits( pkctx, bits );
#if OPENSSL_VERSION_NUMBER >= 0x30000000L
    EVP_PKEY_CTX_set1_rsa_keygen_pubexp( pkctx, e );
    BN_free( e );
#else
    EVP_PKEY_CTX_set_rsa_keygen_pubexp( pkctx, e );
#endif
    EVP_PKEY_keygen( pkctx, &key );
    EVP_PKEY_CTX_free( pkctx );
    return key;
  }

  //----------------------------------------------------------------------------
  // Draw a positive random serial number
  //----------------------------------------------------------------------------
  bool randomSerial( unsigned int &serial )
  {
    serial = 0;
    while( serial == 0 )
    {
      if( RAND_bytes( (unsigned char *)&serial, sizeof( serial ) ) != 1 )
        return false;
      serial &= 0x7fffffff;
    }
    return true;
  }

  //----------------------------------------------------------------------------
  // The subject name of a proxy is the issuer subject + /CN=<serial>
  //----------------------------------------------------------------------------
  X509_NAME *proxyName( X509_NAME *issuer, unsigned int serial )
  {
    X509_NAME *name = X509_NAME_dup( issuer );
    if( !name )
      return 0;
    std::string sn = std::to_string( serial );
    if( !X509_NAME_add_entry_by_txt( name, "CN", MBSTRING_ASC,
                                     (const unsigned char *)sn.c_str(),
                                     -1, -1, 0 ) )
    {
      X509_NAME_free( name );
      return 0;
    }
    return name;
  }

  //----------------------------------------------------------------------------
  // ProxyCertInfo with the inherit-all policy
  //----------------------------------------------------------------------------
  PROXY_CERT_INFO_EXTENSION *newProxyCertInfo( int pathlen )
  {
    PROXY_CERT_INFO_EXTENSION *pci = PROXY_CERT_INFO_EXTENSION_new();
    if( !pci )
      return 0;
    ASN1_OBJECT_free( pci->proxyPolicy->policyLanguage );
    pci->proxyPolicy->policyLanguage = OBJ_nid2obj( NID_id_ppl_inheritAll );
    if( pathlen > -1 )
    {
      pci->pcPathLengthConstraint = ASN1_INTEGER_new();
      if( !pci->pcPathLengthConstraint ||
          ASN1_INTEGER_set( pci->pcPathLengthConstraint, pathlen ) != 1 )
      {
        PROXY_CERT_INFO_EXTENSION_free( pci );
        return 0;
      }
    }
    return pci;
  }

  //----------------------------------------------------------------------------
  // Copy the extensions of the issuer that make sense for a proxy. Alternative
  // names are not allowed in proxies and the key identifiers refer to the
  // issuer key pair.
  //----------------------------------------------------------------------------
  bool copyIssuerExtensions( X509 *from, X509 *to, bool &hasKeyUsage )
  {
    Log *log = DefaultEnv::GetLog();
    hasKeyUsage = false;
    int n = X509_get_ext_count( from );
    for( int i = 0; i < n; ++i )
    {
      X509_EXTENSION *ext = X509_get_ext( from, i );
      int nid = OBJ_obj2nid( X509_EXTENSION_get_object( ext ) );
      if( nid == NID_key_usage )
        hasKeyUsage = true;
      if( nid == NID_subject_alt_name || nid == NID_issuer_alt_name ||
          nid == NID_subject_key_identifier ||
          nid == NID_authority_key_identifier || nid == NID_proxyCertInfo )
        continue;
      if( X509_add_ext( to, ext, -1 ) != 1 )
        return false;
      log->Dump( PKIMsg, "Added extension %s, critical: %d",
                 nid != NID_undef ? OBJ_nid2sn( nid ) : "unknown",
                 X509_EXTENSION_get_critical( ext ) );
    }
    return true;
  }

  //----------------------------------------------------------------------------
  // Build and sign a proxy certificate
  //----------------------------------------------------------------------------
  X509 *buildProxy( X509        *issuerCert,
                    EVP_PKEY    *issuerKey,
                    X509_NAME   *subject,
                    EVP_PKEY    *publicKey,
                    unsigned int serial,
                    int64_t      validity,
                    int          pathlen,
                    std::string &error )
  {
    Log *log = DefaultEnv::GetLog();
    X509Ptr cert( X509_new(), &X509_free );
    if( !cert )
    {
      error = "could not create certificate object for proxies";
      return 0;
    }

    if( X509_set_version( cert.get(), 2L ) != 1 ||
        ASN1_INTEGER_set( X509_get_serialNumber( cert.get() ), serial ) != 1 ||
        X509_set_subject_name( cert.get(), subject ) != 1 ||
        X509_set_issuer_name( cert.get(),
                              X509_get_subject_name( issuerCert ) ) != 1 ||
        X509_set_pubkey( cert.get(), publicKey ) != 1 )
    {
      error = "could not set the certificate attributes";
      return 0;
    }

    if( !X509_gmtime_adj( X509_getm_notBefore( cert.get() ), 0 ) ||
        !X509_gmtime_adj( X509_getm_notAfter( cert.get() ), (long)validity ) )
    {
      error = "could not set the validity period";
      return 0;
    }

    bool hasKeyUsage = false;
    if( !copyIssuerExtensions( issuerCert, cert.get(), hasKeyUsage ) )
    {
      error = "could not copy the issuer extensions";
      return 0;
    }
    if( !hasKeyUsage )
      log->Warning( PKIMsg, "Critical extension 'Key Usage' not found in "
                    "the issuer certificate, the proxy may not be accepted "
                    "by some parsers" );

    PROXY_CERT_INFO_EXTENSION *pci = newProxyCertInfo( pathlen );
    if( !pci )
    {
      error = "could not create the proxyCertInfo extension";
      return 0;
    }
    int rc = X509_add1_ext_i2d( cert.get(), NID_proxyCertInfo, pci, 1,
                                X509V3_ADD_DEFAULT );
    PROXY_CERT_INFO_EXTENSION_free( pci );
    if( rc != 1 )
    {
      error = "could not add the proxyCertInfo extension";
      return 0;
    }

    if( !X509_sign( cert.get(), issuerKey, EVP_sha256() ) )
    {
      error = "problems signing the certificate: " + X509Utils::SslError();
      return 0;
    }
    return cert.release();
  }

  //----------------------------------------------------------------------------
  // Parse a PEM or DER proxy request
  //----------------------------------------------------------------------------
  X509_REQ *parseRequest( const std::string &csr )
  {
    if( csr.compare( 0, 10, "-----BEGIN" ) == 0 )
    {
      BIO *bio = BIO_new_mem_buf( csr.data(), (int)csr.size() );
      if( !bio )
        return 0;
      X509_REQ *req = PEM_read_bio_X509_REQ( bio, 0, 0, 0 );
      BIO_free( bio );
      return req;
    }
    const unsigned char *p = (const unsigned char *)csr.data();
    return d2i_X509_REQ( 0, &p, (long)csr.size() );
  }

  //----------------------------------------------------------------------------
  // Path length constraint carried by a request, -2 if it has no
  // proxyCertInfo
  //----------------------------------------------------------------------------
  int requestPathLength( X509_REQ *req )
  {
    STACK_OF(X509_EXTENSION) *exts = X509_REQ_get_extensions( req );
    if( !exts )
      return -2;
    int pathlen = -2;
    for( int i = 0; i < sk_X509_EXTENSION_num( exts ); ++i )
    {
      X509_EXTENSION *ext = sk_X509_EXTENSION_value( exts, i );
      if( OBJ_obj2nid( X509_EXTENSION_get_object( ext ) ) != NID_proxyCertInfo )
        continue;
      PROXY_CERT_INFO_EXTENSION *pci =
        (PROXY_CERT_INFO_EXTENSION *)X509V3_EXT_d2i( ext );
      if( !pci )
        break;
      pathlen = -1;
      if( pci->pcPathLengthConstraint )
        pathlen = (int)ASN1_INTEGER_get( pci->pcPathLengthConstraint );
      PROXY_CERT_INFO_EXTENSION_free( pci );
      break;
    }
    sk_X509_EXTENSION_pop_free( exts, X509_EXTENSION_free );
    return pathlen;
  }

  //----------------------------------------------------------------------------
  // Read a file
  //----------------------------------------------------------------------------
  Status readFile( const std::string &path, std::string &content )
  {
    std::ifstream in( path.c_str(), std::ios::in | std::ios::binary );
    if( !in.good() )
      return Status( stError, errCredentialLoad, errno,
                     "cannot open " + path );
    std::ostringstream o;
    o << in.rdbuf();
    content = o.str();
    return Status();
  }
}

namespace GsiCred
{
  //----------------------------------------------------------------------------
  // Load an end entity credential
  //----------------------------------------------------------------------------
  Status SslPKIFactory::LoadCredential( const std::string &certPath,
                                        const std::string &keyPath,
                                        Credential        &cred )
  {
    Log *log = DefaultEnv::GetLog();
    Credential result;
    result.certPath = certPath;
    result.keyPath  = keyPath;

    Status st = X509Chain::FromFile( certPath, result.chain );
    if( !st.IsOK() )
      return Status( stError, errCredentialLoad, 0,
                     "unable to load certificate: " + st.ToStr() );

    st = PrivateKey::FromFile( keyPath, result.key );
    if( !st.IsOK() )
      return Status( stError, errCredentialLoad, 0,
                     "unable to load private key: " + st.ToStr() );

    if( !result.key.Matches( result.chain.Leaf() ) )
      return Status( stError, errCredentialLoad, 0, "private key " + keyPath +
                     " does not match certificate " + certPath );

    if( X509Utils::RemainingLifetime( result.chain.Leaf() ) <= 0 )
      return Status( stError, errCredentialLoad, 0, "certificate " +
                     certPath + " has expired" );

    log->Debug( PKIMsg, "Loaded credential %s from %s",
                X509Utils::Subject( result.chain.Leaf() ).c_str(),
                certPath.c_str() );
    cred = result;
    return Status();
  }

  //----------------------------------------------------------------------------
  // Load a proxy file
  //----------------------------------------------------------------------------
  Status SslPKIFactory::LoadProxy( const std::string &path, Credential &proxy )
  {
    Log *log = DefaultEnv::GetLog();
    std::string content;
    Status st = readFile( path, content );
    if( !st.IsOK() )
      return st;

    Credential result;
    st = Credential::FromPEM( content, result );
    if( !st.IsOK() )
      return Status( stError, errCredentialLoad, 0,
                     "unable to load proxy " + path + ": " + st.ToStr() );
    result.certPath = path;
    result.keyPath  = path;

    //--------------------------------------------------------------------------
    // A proxy file holds at least the proxy and its issuer
    //--------------------------------------------------------------------------
    if( result.chain.Size() < 2 )
      return Status( stError, errCredentialLoad, 0, "proxy file " + path +
                     " must contain at least two certificates" );

    if( !X509Utils::IsProxy( result.chain.Leaf() ) )
      return Status( stError, errCredentialLoad, 0, "first certificate in " +
                     path + " is not a proxy certificate" );

    if( !result.key.Matches( result.chain.Leaf() ) )
      return Status( stError, errCredentialLoad, 0, "private key in " + path +
                     " does not match the proxy certificate" );

    if( result.chain.RemainingLifetime() <= 0 )
      return Status( stError, errCredentialLoad, 0, "proxy " + path +
                     " has expired" );

    log->Debug( PKIMsg, "Loaded proxy %s from %s",
                X509Utils::Subject( result.chain.Leaf() ).c_str(),
                path.c_str() );
    proxy = result;
    return Status();
  }

  //----------------------------------------------------------------------------
  // Create a proxy following RFC 3820
  //----------------------------------------------------------------------------
  Status SslPKIFactory::CreateProxy( const Credential   &issuer,
                                     const ProxyOptions &options,
                                     Credential         &proxy )
  {
    Log  *log        = DefaultEnv::GetLog();
    X509 *issuerCert = issuer.chain.Leaf();
    if( !issuerCert || issuer.key.Empty() )
      return Status( stError, errProxyGeneration, 0, "invalid inputs" );

    int64_t timeleft = X509Utils::RemainingLifetime( issuerCert );
    if( timeleft <= 0 )
      return Status( stError, errProxyGeneration, 0,
                     "issuer certificate has expired" );

    //--------------------------------------------------------------------------
    // Path length, can only shrink along the chain
    //--------------------------------------------------------------------------
    int pathlen = options.depth;
    if( X509Utils::IsProxy( issuerCert ) )
    {
      int inpathlen = X509Utils::ProxyPathLength( issuerCert );
      if( inpathlen == 0 )
        return Status( stError, errProxyGeneration, 0,
                       "issuer proxy does not allow further delegation" );
      if( inpathlen > 0 && ( pathlen < 0 || pathlen > inpathlen - 1 ) )
        pathlen = inpathlen - 1;
    }

    int bits = options.bits >= 1024 ? options.bits : DefaultProxyBits;
    EvpPKeyPtr key( generateKey( bits ), &EVP_PKEY_free );
    if( !key )
      return Status( stError, errProxyGeneration, 0,
                     "proxy key could not be generated: " +
                     X509Utils::SslError() );

    unsigned int serial;
    if( !randomSerial( serial ) )
      return Status( stError, errProxyGeneration, 0,
                     "could not draw a serial number" );

    X509NamePtr subject( proxyName( X509_get_subject_name( issuerCert ),
                                    serial ), &X509_NAME_free );
    if( !subject )
      return Status( stError, errProxyGeneration, 0,
                     "could not build the subject name" );

    int64_t validity = (int64_t)options.lifetime;
    if( validity > timeleft )
      validity = timeleft;

    std::string error;
    X509 *cert = buildProxy( issuerCert, issuer.key.Get(), subject.get(),
                             key.get(), serial, validity, pathlen, error );
    if( !cert )
      return Status( stError, errProxyGeneration, 0, error );

    Credential result;
    result.chain.PushBack( cert );
    X509_free( cert );
    result.chain.Append( issuer.chain );
    result.key = PrivateKey( key.release() );

    log->Debug( PKIMsg, "Created proxy %s valid for %lld seconds",
                X509Utils::Subject( result.chain.Leaf() ).c_str(),
                (long long)validity );
    proxy = result;
    return Status();
  }

  //----------------------------------------------------------------------------
  // Create a proxy request
  //----------------------------------------------------------------------------
  Status SslPKIFactory::CreateProxyRequest( const X509Chain &chain,
                                            std::string     &csrPem,
                                            PrivateKey      &key )
  {
    Log  *log  = DefaultEnv::GetLog();
    X509 *leaf = chain.Leaf();
    if( !leaf )
      return Status( stError, errProxyGeneration, 0, "empty chain" );

    if( X509Utils::RemainingLifetime( leaf ) <= 0 )
      return Status( stError, errProxyGeneration, 0,
                     "certificate has expired" );

    //--------------------------------------------------------------------------
    // Use the same number of bits as the certificate, with a lower bound
    //--------------------------------------------------------------------------
    int bits = EVP_PKEY_bits( X509_get0_pubkey( leaf ) );
    if( bits < DefaultProxyBits )
      bits = DefaultProxyBits;

    EvpPKeyPtr reqKey( generateKey( bits ), &EVP_PKEY_free );
    if( !reqKey )
      return Status( stError, errProxyGeneration, 0,
                     "proxy key could not be generated: " +
                     X509Utils::SslError() );

    X509ReqPtr req( X509_REQ_new(), &X509_REQ_free );
    if( !req )
      return Status( stError, errProxyGeneration, 0,
                     "cannot create the certificate request" );

    unsigned int serial;
    if( !randomSerial( serial ) )
      return Status( stError, errProxyGeneration, 0,
                     "could not draw a serial number" );

    X509NamePtr subject( proxyName( X509_get_subject_name( leaf ), serial ),
                         &X509_NAME_free );
    if( !subject ||
        X509_REQ_set_subject_name( req.get(), subject.get() ) != 1 ||
        X509_REQ_set_pubkey( req.get(), reqKey.get() ) != 1 )
      return Status( stError, errProxyGeneration, 0,
                     "could not set the request attributes" );

    int pathlen = -1;
    if( X509Utils::IsProxy( leaf ) )
    {
      int inpathlen = X509Utils::ProxyPathLength( leaf );
      if( inpathlen > -1 )
        pathlen = inpathlen > 0 ? inpathlen - 1 : 0;
    }

    PROXY_CERT_INFO_EXTENSION *pci = newProxyCertInfo( pathlen );
    if( !pci )
      return Status( stError, errProxyGeneration, 0,
                     "could not create the proxyCertInfo extension" );
    STACK_OF(X509_EXTENSION) *exts = 0;
    int rc = X509V3_add1_i2d( &exts, NID_proxyCertInfo, pci, 1,
                              X509V3_ADD_DEFAULT );
    PROXY_CERT_INFO_EXTENSION_free( pci );
    if( rc != 1 || !X509_REQ_add_extensions( req.get(), exts ) )
    {
      sk_X509_EXTENSION_pop_free( exts, X509_EXTENSION_free );
      return Status( stError, errProxyGeneration, 0,
                     "problem adding the request extensions" );
    }
    sk_X509_EXTENSION_pop_free( exts, X509_EXTENSION_free );

    if( !X509_REQ_sign( req.get(), reqKey.get(), EVP_sha256() ) )
      return Status( stError, errProxyGeneration, 0,
                     "problems signing the request: " + X509Utils::SslError() );

    BIO *bio = BIO_new( BIO_s_mem() );
    if( !bio || PEM_write_bio_X509_REQ( bio, req.get() ) != 1 )
    {
      BIO_free( bio );
      return Status( stError, errProxyGeneration, 0,
                     "could not encode the request" );
    }
    char *data = 0;
    long  len  = BIO_get_mem_data( bio, &data );
    csrPem.assign( data, len );
    BIO_free( bio );

    key = PrivateKey( reqKey.release() );
    log->Debug( PKIMsg, "Created proxy request for %s",
                X509Utils::NameOneLine( subject.get() ).c_str() );
    return Status();
  }

  //----------------------------------------------------------------------------
  // Sign a proxy request
  //----------------------------------------------------------------------------
  Status SslPKIFactory::SignProxyRequest( const std::string &csr,
                                          const Credential  &issuer,
                                          X509Chain         &newChain )
  {
    Log  *log        = DefaultEnv::GetLog();
    X509 *issuerCert = issuer.chain.Leaf();
    if( !issuerCert || issuer.key.Empty() )
      return Status( stError, errSigning, 0, "invalid inputs" );

    int64_t timeleft = X509Utils::RemainingLifetime( issuerCert );
    if( timeleft <= 0 )
      return Status( stError, errSigning, 0,
                     "signing certificate has expired" );

    X509ReqPtr req( parseRequest( csr ), &X509_REQ_free );
    if( !req )
      return Status( stError, errSigning, 0, "cannot parse the request: " +
                     X509Utils::SslError() );

    EVP_PKEY *reqKey = X509_REQ_get0_pubkey( req.get() );
    if( !reqKey || X509_REQ_verify( req.get(), reqKey ) != 1 )
    {
      ERR_clear_error();
      return Status( stError, errSigning, 0, "bad request signature" );
    }

    //--------------------------------------------------------------------------
    // The request subject must be '<issuer subject> + /CN=<serial>'
    //--------------------------------------------------------------------------
    std::string psbj = X509Utils::Subject( issuerCert );
    std::string rsbj = X509Utils::NameOneLine(
                         X509_REQ_get_subject_name( req.get() ) );
    std::string::size_type pos = rsbj.rfind( "/CN=" );
    if( psbj.empty() || pos == std::string::npos ||
        rsbj.substr( 0, pos ) != psbj )
    {
      log->Error( PKIMsg, "Request subject not in the form "
                  "'<issuer subject> + /CN=<serial>'" );
      log->Error( PKIMsg, "   Proxy: %s", psbj.c_str() );
      log->Error( PKIMsg, "   SubRq: %s", rsbj.c_str() );
      return Status( stError, errSigning, 0, "request subject " + rsbj +
                     " does not extend " + psbj );
    }

    std::string sserial = rsbj.substr( pos + 4 );
    if( sserial.empty() ||
        sserial.find_first_not_of( "0123456789" ) != std::string::npos )
      return Status( stError, errSigning, 0, "request serial " + sserial +
                     " is not a number" );
    char *endPtr = 0;
    errno = 0;
    unsigned long serial = strtoul( sserial.c_str(), &endPtr, 10 );
    if( *endPtr || errno == ERANGE || serial > UINT_MAX )
      return Status( stError, errSigning, 0, "request serial " + sserial +
                     " is out of range" );

    if( X509_get_ext_by_NID( issuerCert, NID_subject_alt_name, -1 ) >= 0 )
      return Status( stError, errSigning, 0, "subject alternative name "
                     "extension not allowed in the signing certificate" );

    //--------------------------------------------------------------------------
    // Path length: at most one less than the signer allows
    //--------------------------------------------------------------------------
    int reqpathlen = requestPathLength( req.get() );
    if( reqpathlen == -2 )
      return Status( stError, errSigning, 0,
                     "request carries no proxyCertInfo extension" );

    int inpathlen = X509Utils::ProxyPathLength( issuerCert );
    if( X509Utils::IsProxy( issuerCert ) && inpathlen == 0 )
      return Status( stError, errSigning, 0,
                     "signing proxy does not allow further delegation" );

    int outpathlen = reqpathlen;
    if( inpathlen > 0 && ( outpathlen < 0 || outpathlen > inpathlen - 1 ) )
      outpathlen = inpathlen - 1;

    std::string error;
    X509 *cert = buildProxy( issuerCert, issuer.key.Get(),
                             X509_REQ_get_subject_name( req.get() ), reqKey,
                             (unsigned int)serial, timeleft, outpathlen,
                             error );
    if( !cert )
      return Status( stError, errSigning, 0, error );

    X509Chain result;
    result.PushBack( cert );
    X509_free( cert );
    result.Append( issuer.chain );

    log->Debug( PKIMsg, "Signed proxy request for %s", rsbj.c_str() );
    newChain = result;
    return Status();
  }
}
