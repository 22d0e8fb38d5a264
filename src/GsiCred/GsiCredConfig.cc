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

#include "GsiCred/GsiCredConfig.hh"
#include "GsiCred/GsiCredConstants.hh"
#include "GsiCred/GsiCredDefaultEnv.hh"
#include "GsiCred/GsiCredEnv.hh"
#include "GsiCred/GsiCredLog.hh"
#include "GsiCred/GsiCredUtils.hh"

#include <algorithm>
#include <cctype>

namespace
{
  using namespace GsiCred;

  struct NamespaceName
  {
    NamespaceCheckingMode  mode;
    const char            *name;
  };

  NamespaceName namespaceNames[] = {
    { NsGlobusEugridpma,           "GLOBUS_EUGRIDPMA"             },
    { NsEugridpmaGlobus,           "EUGRIDPMA_GLOBUS"             },
    { NsGlobus,                    "GLOBUS"                       },
    { NsEugridpma,                 "EUGRIDPMA"                    },
    { NsGlobusEugridpmaRequire,    "GLOBUS_EUGRIDPMA_REQUIRE"     },
    { NsEugridpmaGlobusRequire,    "EUGRIDPMA_GLOBUS_REQUIRE"     },
    { NsGlobusRequire,             "GLOBUS_REQUIRE"               },
    { NsEugridpmaRequire,          "EUGRIDPMA_REQUIRE"            },
    { NsEugridpmaAndGlobus,        "EUGRIDPMA_AND_GLOBUS"         },
    { NsEugridpmaAndGlobusRequire, "EUGRIDPMA_AND_GLOBUS_REQUIRE" },
    { NsIgnore,                    "IGNORE"                       },
    { NsIgnore,                    0                              } };

  std::string toUpper( std::string str )
  {
    Utils::Trim( str );
    std::transform( str.begin(), str.end(), str.begin(), ::toupper );
    return str;
  }

  Status configError( const std::string &key, const std::string &value,
                      const char *what )
  {
    return Status( stError, errConfig, 0,
                   "invalid " + key + " \"" + value + "\": " + what );
  }

  //----------------------------------------------------------------------------
  // Fetch a duration setting
  //----------------------------------------------------------------------------
  Status getDuration( Env &env, const char *key, const char *def,
                      uint64_t &result )
  {
    std::string value = def;
    env.GetString( key, value );
    if( !Utils::ParseDuration( value, result ) )
      return configError( key, value, "not a duration" );
    if( result > MaxDuration )
    {
      DefaultEnv::GetLog()->Warning( UtilityMsg, "%s = %s is too long, using "
                                     "%llu s", key, value.c_str(),
                                     (unsigned long long)MaxDuration );
      result = MaxDuration;
    }
    return Status();
  }

  //----------------------------------------------------------------------------
  // Fetch a boolean setting
  //----------------------------------------------------------------------------
  Status getBool( Env &env, const char *key, const char *def, bool &result )
  {
    std::string value = def;
    env.GetString( key, value );
    if( !Utils::ParseBool( value, result ) )
      return configError( key, value, "not a boolean" );
    return Status();
  }
}

namespace GsiCred
{
  //----------------------------------------------------------------------------
  // Constructor
  //----------------------------------------------------------------------------
  Config::Config():
    caCertDir( DefaultCACertDir ),
    caRefresh( 12*3600 ),
    namespaceMode( NsEugridpmaGlobus ),
    crlMode( CrlIfValid ),
    ocspMode( OcspIfAvailable ),
    hostCert( DefaultHostCert ),
    hostKey( DefaultHostKey ),
    hostCertRefresh( 12*3600 ),
    hostCertVerify( true ),
    tpcCert( DefaultHostCert ),
    tpcKey( DefaultHostKey ),
    tpcCredRefresh( 3600 ),
    tpcCredVerify( true ),
    proxyMinValidFor( 600 ),
    proxyLifetime( 12*3600 ),
    proxyBits( DefaultProxyBits ),
    proxyDepth( DefaultProxyDepth )
  {
  }

  //----------------------------------------------------------------------------
  // Build the configuration from an environment
  //----------------------------------------------------------------------------
  Status Config::FromEnv( Env &env, Config &config )
  {
    Log   *log = DefaultEnv::GetLog();
    Config cfg;
    Status st;

    //--------------------------------------------------------------------------
    // Trust anchors
    //--------------------------------------------------------------------------
    env.GetString( "CACertDir", cfg.caCertDir );
    if( !Utils::IsDirectory( cfg.caCertDir ) )
      return configError( "CACertDir", cfg.caCertDir, "not a directory" );

    st = getDuration( env, "CARefresh", DefaultCARefresh, cfg.caRefresh );
    if( !st.IsOK() ) return st;

    std::string mode = DefaultNamespaceMode;
    env.GetString( "NamespaceMode", mode );
    if( !ParseNamespaceMode( mode, cfg.namespaceMode ) )
      return configError( "NamespaceMode", mode, "unknown mode" );

    mode = DefaultCRLMode;
    env.GetString( "CRLMode", mode );
    if( !ParseCrlMode( mode, cfg.crlMode ) )
      return configError( "CRLMode", mode, "unknown mode" );

    mode = DefaultOCSPMode;
    env.GetString( "OCSPMode", mode );
    if( !ParseOcspMode( mode, cfg.ocspMode ) )
      return configError( "OCSPMode", mode, "unknown mode" );

    //--------------------------------------------------------------------------
    // Host credential
    //--------------------------------------------------------------------------
    env.GetString( "HostCert", cfg.hostCert );
    env.GetString( "HostKey",  cfg.hostKey );
    st = getDuration( env, "HostCertRefresh", DefaultHostCertRefresh,
                      cfg.hostCertRefresh );
    if( !st.IsOK() ) return st;
    st = getBool( env, "HostCertVerify", DefaultHostCertVerify,
                  cfg.hostCertVerify );
    if( !st.IsOK() ) return st;

    //--------------------------------------------------------------------------
    // Client (third party copy) credential, falls back to the host one
    //--------------------------------------------------------------------------
    cfg.tpcCert = cfg.hostCert;
    cfg.tpcKey  = cfg.hostKey;
    std::string value;
    if( env.GetString( "TpcCert", value ) && !value.empty() )
      cfg.tpcCert = value;
    value.clear();
    if( env.GetString( "TpcKey", value ) && !value.empty() )
      cfg.tpcKey = value;
    env.GetString( "TpcProxy", cfg.tpcProxy );
    Utils::Trim( cfg.tpcProxy );

    st = getDuration( env, "TpcCredRefresh", DefaultTpcCredRefresh,
                      cfg.tpcCredRefresh );
    if( !st.IsOK() ) return st;
    st = getBool( env, "TpcCredVerify", DefaultTpcCredVerify,
                  cfg.tpcCredVerify );
    if( !st.IsOK() ) return st;

    //--------------------------------------------------------------------------
    // Proxies
    //--------------------------------------------------------------------------
    st = getDuration( env, "ProxyMinValidFor", DefaultProxyMinValidFor,
                      cfg.proxyMinValidFor );
    if( !st.IsOK() ) return st;
    st = getDuration( env, "ProxyLifetime", DefaultProxyLifetime,
                      cfg.proxyLifetime );
    if( !st.IsOK() ) return st;
    if( cfg.proxyLifetime == 0 )
      return configError( "ProxyLifetime", "0", "must be positive" );

    env.GetInt( "ProxyBits",  cfg.proxyBits );
    env.GetInt( "ProxyDepth", cfg.proxyDepth );
    if( cfg.proxyBits < 1024 )
      return configError( "ProxyBits", std::to_string( cfg.proxyBits ),
                          "must be at least 1024" );
    if( cfg.proxyDepth < -1 )
      return configError( "ProxyDepth", std::to_string( cfg.proxyDepth ),
                          "must be -1 or more" );

    log->Debug( UtilityMsg, "CA directory %s (refresh %llus), namespace %s, "
                "CRL %s, OCSP %s", cfg.caCertDir.c_str(),
                (unsigned long long)cfg.caRefresh,
                NamespaceModeToString( cfg.namespaceMode ),
                CrlModeToString( cfg.crlMode ),
                OcspModeToString( cfg.ocspMode ) );
    log->Debug( UtilityMsg, "Host credential %s, %s (refresh %llus, "
                "verify %d)", cfg.hostCert.c_str(), cfg.hostKey.c_str(),
                (unsigned long long)cfg.hostCertRefresh, cfg.hostCertVerify );
    log->Debug( UtilityMsg, "Client credential %s, %s, proxy \"%s\" "
                "(refresh %llus, verify %d)", cfg.tpcCert.c_str(),
                cfg.tpcKey.c_str(), cfg.tpcProxy.c_str(),
                (unsigned long long)cfg.tpcCredRefresh, cfg.tpcCredVerify );

    config = cfg;
    return Status();
  }

  //----------------------------------------------------------------------------
  // CRL modes
  //----------------------------------------------------------------------------
  bool Config::ParseCrlMode( const std::string &name, CrlCheckingMode &mode )
  {
    std::string n = toUpper( name );
    if( n == "REQUIRE" )       mode = CrlRequire;
    else if( n == "IF_VALID" ) mode = CrlIfValid;
    else if( n == "IGNORE" )   mode = CrlIgnore;
    else return false;
    return true;
  }

  const char *Config::CrlModeToString( CrlCheckingMode mode )
  {
    switch( mode )
    {
      case CrlRequire: return "REQUIRE";
      case CrlIfValid: return "IF_VALID";
      case CrlIgnore:  return "IGNORE";
    }
    return "UNKNOWN";
  }

  //----------------------------------------------------------------------------
  // OCSP modes
  //----------------------------------------------------------------------------
  bool Config::ParseOcspMode( const std::string &name, OcspCheckingMode &mode )
  {
    std::string n = toUpper( name );
    if( n == "REQUIRE" )           mode = OcspRequire;
    else if( n == "IF_AVAILABLE" ) mode = OcspIfAvailable;
    else if( n == "IGNORE" )       mode = OcspIgnore;
    else return false;
    return true;
  }

  const char *Config::OcspModeToString( OcspCheckingMode mode )
  {
    switch( mode )
    {
      case OcspRequire:     return "REQUIRE";
      case OcspIfAvailable: return "IF_AVAILABLE";
      case OcspIgnore:      return "IGNORE";
    }
    return "UNKNOWN";
  }

  //----------------------------------------------------------------------------
  // Namespace modes
  //----------------------------------------------------------------------------
  bool Config::ParseNamespaceMode( const std::string     &name,
                                   NamespaceCheckingMode &mode )
  {
    std::string n = toUpper( name );
    for( int i = 0; namespaceNames[i].name != 0; ++i )
      if( n == namespaceNames[i].name )
      {
        mode = namespaceNames[i].mode;
        return true;
      }
    return false;
  }

  const char *Config::NamespaceModeToString( NamespaceCheckingMode mode )
  {
    for( int i = 0; namespaceNames[i].name != 0; ++i )
      if( namespaceNames[i].mode == mode )
        return namespaceNames[i].name;
    return "UNKNOWN";
  }
}
