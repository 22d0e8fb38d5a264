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

#ifndef __GSI_CRED_X509_HH__
#define __GSI_CRED_X509_HH__

#include <stdint.h>
#include <set>
#include <string>
#include <vector>

#include <openssl/evp.h>
#include <openssl/x509.h>

#include "GsiCred/GsiCredStatus.hh"

namespace GsiCred
{
  //----------------------------------------------------------------------------
  //! Certificate chain, leaf first. Holds one reference to every certificate,
  //! copies share the certificates.
  //----------------------------------------------------------------------------
  class X509Chain
  {
    public:
      X509Chain() {}
      X509Chain( const X509Chain &other );
      X509Chain &operator=( const X509Chain &other );
      ~X509Chain();

      //------------------------------------------------------------------------
      //! Append a certificate, a new reference is taken
      //------------------------------------------------------------------------
      void PushBack( X509 *cert );

      //------------------------------------------------------------------------
      //! Prepend a certificate, a new reference is taken
      //------------------------------------------------------------------------
      void PushFront( X509 *cert );

      //------------------------------------------------------------------------
      //! Append all the certificates of another chain
      //------------------------------------------------------------------------
      void Append( const X509Chain &other );

      X509  *At( size_t i ) const { return pCerts[i]; }
      size_t Size() const         { return pCerts.size(); }
      bool   Empty() const        { return pCerts.empty(); }

      //------------------------------------------------------------------------
      //! The first certificate, 0 for an empty chain
      //------------------------------------------------------------------------
      X509 *Leaf() const { return pCerts.empty() ? 0 : pCerts.front(); }

      //------------------------------------------------------------------------
      //! The first certificate that is not a proxy, 0 if none
      //------------------------------------------------------------------------
      X509 *EndEntity() const;

      //------------------------------------------------------------------------
      //! Seconds until the first certificate of the chain expires, negative
      //! if one of them already has
      //------------------------------------------------------------------------
      int64_t RemainingLifetime() const;

      //------------------------------------------------------------------------
      //! Same certificates in the same order
      //------------------------------------------------------------------------
      bool operator==( const X509Chain &other ) const;
      bool operator!=( const X509Chain &other ) const
      {
        return !( *this == other );
      }

      //------------------------------------------------------------------------
      //! Concatenated PEM encoding of all the certificates
      //------------------------------------------------------------------------
      std::string ToPEM() const;

      //------------------------------------------------------------------------
      //! Parse all the PEM certificates in the buffer, at least one is needed
      //------------------------------------------------------------------------
      static Status FromPEM( const std::string &pem, X509Chain &chain );

      //------------------------------------------------------------------------
      //! Read all the PEM certificates from a file
      //------------------------------------------------------------------------
      static Status FromFile( const std::string &path, X509Chain &chain );

    private:
      void Clear();
      std::vector<X509*> pCerts;
  };

  //----------------------------------------------------------------------------
  //! Private key, copies share the key
  //----------------------------------------------------------------------------
  class PrivateKey
  {
    public:
      PrivateKey(): pKey( 0 ) {}
      explicit PrivateKey( EVP_PKEY *key );   //!< takes ownership
      PrivateKey( const PrivateKey &other );
      PrivateKey &operator=( const PrivateKey &other );
      ~PrivateKey();

      EVP_PKEY *Get() const   { return pKey; }
      bool      Empty() const { return pKey == 0; }

      //------------------------------------------------------------------------
      //! Check whether the key matches the public key of the certificate
      //------------------------------------------------------------------------
      bool Matches( X509 *cert ) const;

      //------------------------------------------------------------------------
      //! Unencrypted PEM encoding
      //------------------------------------------------------------------------
      std::string ToPEM() const;

      static Status FromPEM( const std::string &pem, PrivateKey &key );
      static Status FromFile( const std::string &path, PrivateKey &key );

    private:
      EVP_PKEY *pKey;
  };

  //----------------------------------------------------------------------------
  //! A certificate chain with the private key of its leaf
  //----------------------------------------------------------------------------
  struct Credential
  {
    X509Chain   chain;
    PrivateKey  key;
    std::string certPath;   //!< source of the chain, if loaded from disk
    std::string keyPath;    //!< source of the key, if loaded from disk

    //--------------------------------------------------------------------------
    //! GSI proxy file layout: leaf certificate, private key, rest of the
    //! chain
    //--------------------------------------------------------------------------
    std::string ToPEM() const;

    //--------------------------------------------------------------------------
    //! Parse the GSI proxy file layout, certificates and key may come in any
    //! order
    //--------------------------------------------------------------------------
    static Status FromPEM( const std::string &pem, Credential &cred );
  };

  //----------------------------------------------------------------------------
  //! Certificate helpers
  //----------------------------------------------------------------------------
  class X509Utils
  {
    public:
      //------------------------------------------------------------------------
      //! One line representation of a name, ie. /C=CH/O=CERN/CN=host
      //------------------------------------------------------------------------
      static std::string NameOneLine( X509_NAME *name );
      static std::string Subject( X509 *cert );
      static std::string Issuer( X509 *cert );

      //------------------------------------------------------------------------
      //! OpenSSL CA directory hash of a name, 8 hex digits
      //------------------------------------------------------------------------
      static std::string NameHash( X509_NAME *name );
      static std::string SubjectHash( X509 *cert );
      static std::string IssuerHash( X509 *cert );

      //------------------------------------------------------------------------
      //! Distinct issuer hashes of the certificates of the chain
      //------------------------------------------------------------------------
      static std::set<std::string> IssuerHashes( const X509Chain &chain );

      //------------------------------------------------------------------------
      //! Join hashes with the CA hash separator
      //------------------------------------------------------------------------
      static std::string JoinHashes( const std::set<std::string> &hashes );

      //------------------------------------------------------------------------
      //! Check whether the certificate is an RFC 3820 proxy
      //------------------------------------------------------------------------
      static bool IsProxy( X509 *cert );

      //------------------------------------------------------------------------
      //! Proxy path length constraint, -1 if unlimited or not a proxy
      //------------------------------------------------------------------------
      static int ProxyPathLength( X509 *cert );

      //------------------------------------------------------------------------
      //! Seconds until the certificate expires, negative if it did
      //------------------------------------------------------------------------
      static int64_t RemainingLifetime( X509 *cert );

      //------------------------------------------------------------------------
      //! Drain the OpenSSL error queue into a string
      //------------------------------------------------------------------------
      static std::string SslError();
  };
}

#endif // __GSI_CRED_X509_HH__
