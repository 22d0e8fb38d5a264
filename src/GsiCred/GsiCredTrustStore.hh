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

#ifndef __GSI_CRED_TRUST_STORE_HH__
#define __GSI_CRED_TRUST_STORE_HH__

#include <stdint.h>
#include <memory>
#include <mutex>
#include <string>

#include <openssl/x509_vfy.h>

#include "GsiCred/GsiCredConfig.hh"
#include "GsiCred/GsiCredStatus.hh"
#include "GsiCred/GsiCredUtils.hh"
#include "GsiCred/GsiCredX509.hh"

namespace GsiCred
{
  //----------------------------------------------------------------------------
  //! Validates certificate chains against the trust anchors of a hashed CA
  //! directory. The underlying store is rebuilt when the refresh interval
  //! elapses, validations running concurrently keep using the store they
  //! started with.
  //----------------------------------------------------------------------------
  class TrustStore
  {
    public:
      //------------------------------------------------------------------------
      //! Constructor
      //!
      //! @param caDir         the trust anchor directory
      //! @param refresh       seconds after which the store is rebuilt
      //! @param crlMode       CRL checking mode
      //! @param ocspMode      OCSP checking mode, reported only
      //! @param namespaceMode namespace checking mode, reported only
      //! @param clock         time source in milliseconds
      //------------------------------------------------------------------------
      TrustStore( const std::string     &caDir,
                  uint64_t               refresh,
                  CrlCheckingMode        crlMode,
                  OcspCheckingMode       ocspMode,
                  NamespaceCheckingMode  namespaceMode,
                  Clock                  clock = Utils::NowMs );

      //------------------------------------------------------------------------
      //! Validate a chain, leaf first
      //!
      //! @return errValidation (kGsiNotAuthorized) if the chain is not trusted
      //------------------------------------------------------------------------
      Status Validate( const X509Chain &chain );

      const std::string &GetCADir() const          { return pCADir; }
      uint64_t GetRefreshInterval() const          { return pRefresh; }
      CrlCheckingMode GetCrlMode() const           { return pCrlMode; }
      OcspCheckingMode GetOcspMode() const         { return pOcspMode; }
      NamespaceCheckingMode GetNamespaceMode() const { return pNamespaceMode; }

    private:
      typedef std::shared_ptr<X509_STORE> StorePtr;

      Status GetStore( StorePtr &store );
      Status BuildStore( StorePtr &store );

      std::string            pCADir;
      uint64_t               pRefresh;
      CrlCheckingMode        pCrlMode;
      OcspCheckingMode       pOcspMode;
      NamespaceCheckingMode  pNamespaceMode;
      Clock                  pClock;

      std::mutex             pMutex;
      StorePtr               pStore;
      uint64_t               pStoreTimestamp;
  };
}

#endif // __GSI_CRED_TRUST_STORE_HH__
