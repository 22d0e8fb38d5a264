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

#ifndef __GSI_CRED_IDENTITY_HH__
#define __GSI_CRED_IDENTITY_HH__

#include <string>
#include <vector>

#include <openssl/x509.h>

#include "GsiCred/GsiCredStatus.hh"

namespace GsiCred
{
  //----------------------------------------------------------------------------
  //! Host name and CA identity checks
  //----------------------------------------------------------------------------
  class IdentityChecker
  {
    public:
      //------------------------------------------------------------------------
      //! Check that the certificate has been issued to the host. The check
      //! passes if the subject contains the name or if the name matches the
      //! certificate according to the X.509 host name rules (subject
      //! alternative names, IP addresses, common name).
      //!
      //! @return errIdentityMismatch (kGsiNotAuthorized) otherwise
      //------------------------------------------------------------------------
      static Status CheckIdentity( X509 *cert, const std::string &host );

      //------------------------------------------------------------------------
      //! Check that every CA identity is present in the CA directory. An
      //! identity without an extension gets the default ".0" suffix. The
      //! check stops at the first missing entry.
      //!
      //! @return errInvalidCaPath (kGsiArgInvalid) naming the first missing
      //!         entry
      //------------------------------------------------------------------------
      static Status CheckCaIdentities( const std::string              &caDir,
                                       const std::vector<std::string> &cas );

      //------------------------------------------------------------------------
      //! Same as above, the identities being separated by '|'
      //------------------------------------------------------------------------
      static Status CheckCaIdentities( const std::string &caDir,
                                       const std::string &cas );

      //------------------------------------------------------------------------
      //! File name of a CA identity in the CA directory
      //------------------------------------------------------------------------
      static std::string CaFileName( const std::string &ca );
  };
}

#endif // __GSI_CRED_IDENTITY_HH__
