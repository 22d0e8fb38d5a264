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

#include "GsiCred/GsiCredIdentity.hh"
#include "GsiCred/GsiCredConstants.hh"
#include "GsiCred/GsiCredDefaultEnv.hh"
#include "GsiCred/GsiCredLog.hh"
#include "GsiCred/GsiCredUtils.hh"
#include "GsiCred/GsiCredX509.hh"

#include <sys/stat.h>

#include <openssl/x509v3.h>

namespace GsiCred
{
  //----------------------------------------------------------------------------
  // Host identity
  //----------------------------------------------------------------------------
  Status IdentityChecker::CheckIdentity( X509 *cert, const std::string &host )
  {
    Log *log = DefaultEnv::GetLog();
    if( !cert )
      return Status( stError, errInvalidArgs, kGsiArgInvalid,
                     "no certificate to check" );

    std::string subject = X509Utils::Subject( cert );
    if( !host.empty() && subject.find( host ) != std::string::npos )
    {
      log->Dump( CredentialMsg, "Subject %s contains %s", subject.c_str(),
                 host.c_str() );
      return Status();
    }

    if( !host.empty() )
    {
      int rc = X509_check_host( cert, host.c_str(), host.size(), 0, 0 );
      if( rc != 1 )
        rc = X509_check_ip_asc( cert, host.c_str(), 0 );
      if( rc == 1 )
      {
        log->Dump( CredentialMsg, "Certificate %s matches %s", subject.c_str(),
                   host.c_str() );
        return Status();
      }
      if( rc < 0 )
        log->Warning( CredentialMsg, "Unable to match %s against %s: %s",
                      host.c_str(), subject.c_str(),
                      X509Utils::SslError().c_str() );
    }

    log->Debug( CredentialMsg, "Certificate %s was not issued to %s",
                subject.c_str(), host.c_str() );
    return Status( stError, errIdentityMismatch, kGsiNotAuthorized,
                   "The name of the source server does not match any subject "
                   "name of the received credential." );
  }

  //----------------------------------------------------------------------------
  // CA identities
  //----------------------------------------------------------------------------
  Status IdentityChecker::CheckCaIdentities(
                                        const std::string              &caDir,
                                        const std::vector<std::string> &cas )
  {
    Log *log = DefaultEnv::GetLog();
    std::vector<std::string>::const_iterator it;
    for( it = cas.begin(); it != cas.end(); ++it )
    {
      std::string name = CaFileName( *it );
      std::string path = caDir + "/" + name;
      struct stat st;
      if( name.find( '/' ) != std::string::npos ||
          stat( path.c_str(), &st ) != 0 || !S_ISREG( st.st_mode ) )
      {
        log->Debug( TrustMsg, "CA %s not found in %s", it->c_str(),
                    caDir.c_str() );
        return Status( stError, errInvalidCaPath, kGsiArgInvalid,
                       *it + " is not a valid ca cert path." );
      }
    }
    return Status();
  }

  Status IdentityChecker::CheckCaIdentities( const std::string &caDir,
                                             const std::string &cas )
  {
    std::vector<std::string> entries;
    Utils::splitString( entries, cas, std::string( 1, CAHashSeparator ) );
    return CheckCaIdentities( caDir, entries );
  }

  //----------------------------------------------------------------------------
  // Resolve the file name of a CA
  //----------------------------------------------------------------------------
  std::string IdentityChecker::CaFileName( const std::string &ca )
  {
    std::string name = ca;
    Utils::Trim( name );
    size_t pos = name.find( '.' );
    if( pos == std::string::npos || pos < 1 )
      name += DefaultCASuffix;
    return name;
  }
}
