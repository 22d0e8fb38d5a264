//------------------------------------------------------------------------------
// Copyright (c) 2024 by European Organization for Nuclear Research (CERN)
// See the LICENCE file for details.
//------------------------------------------------------------------------------

#ifndef __GSI_CRED_TEST_PKI_HH__
#define __GSI_CRED_TEST_PKI_HH__

#include <stdint.h>
#include <string>
#include <vector>

#include <openssl/evp.h>
#include <openssl/x509.h>

#include "GsiCred/GsiCredConfig.hh"

//------------------------------------------------------------------------------
//! A throw-away certificate authority living in a temporary directory
//------------------------------------------------------------------------------
class TestPKI
{
  public:
    //--------------------------------------------------------------------------
    //! Create the temporary directory, the CA directory and the CA
    //--------------------------------------------------------------------------
    TestPKI();

    //--------------------------------------------------------------------------
    //! Remove everything
    //--------------------------------------------------------------------------
    ~TestPKI();

    bool IsValid() const { return pValid; }

    //--------------------------------------------------------------------------
    //! Issue an end entity certificate signed by the CA
    //!
    //! @param cn        common name of the subject
    //! @param dnsNames  subject alternative names, none if empty
    //! @param notBefore offset from now in seconds
    //! @param notAfter  offset from now in seconds
    //! @param certFile  file name in the temporary directory
    //! @param keyFile   file name in the temporary directory
    //--------------------------------------------------------------------------
    bool IssueCertificate( const std::string              &cn,
                           const std::vector<std::string> &dnsNames,
                           long                            notBefore,
                           long                            notAfter,
                           const std::string              &certFile,
                           const std::string              &keyFile );

    bool IssueCertificate( const std::string              &cn,
                           const std::vector<std::string> &dnsNames,
                           const std::string              &certFile,
                           const std::string              &keyFile )
    {
      return IssueCertificate( cn, dnsNames, -3600, 86400, certFile, keyFile );
    }

    //--------------------------------------------------------------------------
    //! Write an empty CRL of the CA valid until now + nextUpdate
    //--------------------------------------------------------------------------
    bool WriteCRL( long nextUpdate );

    //--------------------------------------------------------------------------
    //! Write a file in the temporary directory
    //--------------------------------------------------------------------------
    bool WriteFile( const std::string &name, const std::string &content );

    //--------------------------------------------------------------------------
    //! Path of a file in the temporary directory
    //--------------------------------------------------------------------------
    std::string Path( const std::string &name ) const
    {
      return pDir + "/" + name;
    }

    const std::string &GetDir() const    { return pDir; }
    const std::string &GetCADir() const  { return pCADir; }
    const std::string &GetCAHash() const { return pCAHash; }
    X509 *GetCACert() const              { return pCACert; }

    //--------------------------------------------------------------------------
    //! Subject of a certificate issued with the given common name
    //--------------------------------------------------------------------------
    static std::string Subject( const std::string &cn );

    //--------------------------------------------------------------------------
    //! A configuration pointing at this PKI, host credential in
    //! hostcert.pem/hostkey.pem, client credential in
    //! usercert.pem/userkey.pem
    //--------------------------------------------------------------------------
    GsiCred::Config MakeConfig() const;

  private:
    TestPKI( const TestPKI& );
    TestPKI &operator=( const TestPKI& );

    bool CreateCA();

    bool        pValid;
    std::string pDir;
    std::string pCADir;
    std::string pCAHash;
    X509       *pCACert;
    EVP_PKEY   *pCAKey;
    uint64_t    pSerial;
};

#endif // __GSI_CRED_TEST_PKI_HH__
