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

#include "GsiCred/GsiCredDefaultEnv.hh"
#include "GsiCred/GsiCredConstants.hh"
#include "GsiCred/GsiCredLog.hh"
#include "GsiCred/GsiCredUtils.hh"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <map>
#include <vector>

namespace
{
  //----------------------------------------------------------------------------
  // Log topics and the names used to print them and to select them in
  // GSICRED_LOGMASK, either as "Credential" or "CredentialMsg"
  //----------------------------------------------------------------------------
  struct Topic
  {
    const char *name;
    uint64_t    mask;
  };

  const Topic kTopics[] =
  {
    { "App",        GsiCred::AppMsg        },
    { "Utility",    GsiCred::UtilityMsg    },
    { "Credential", GsiCred::CredentialMsg },
    { "Trust",      GsiCred::TrustMsg      },
    { "Delegation", GsiCred::DelegationMsg },
    { "Store",      GsiCred::StoreMsg      },
    { "PKI",        GsiCred::PKIMsg        }
  };

  bool FindTopic( std::string name, uint64_t &mask )
  {
    const std::string suffix = "Msg";
    if( name.size() > suffix.size() &&
        name.compare( name.size() - suffix.size(), suffix.size(), suffix ) == 0 )
      name.erase( name.size() - suffix.size() );

    for( size_t i = 0; i < sizeof( kTopics ) / sizeof( kTopics[0] ); ++i )
    {
      if( name == kTopics[i].name )
      {
        mask = kTopics[i].mask;
        return true;
      }
    }
    return false;
  }

  //----------------------------------------------------------------------------
  // Evaluate a '|' separated list of topics from left to right. "All" and
  // "None" reset the mask, a leading '^' removes a topic, unknown topics
  // are skipped.
  //----------------------------------------------------------------------------
  uint64_t TranslateMask( const std::string &topics )
  {
    if( topics.empty() )
      return ~uint64_t( 0 );

    std::vector<std::string> items;
    GsiCred::Utils::splitString( items, topics, "|" );

    uint64_t result = 0;
    for( size_t i = 0; i < items.size(); ++i )
    {
      const std::string &item = items[i];
      if( item == "All" )
        result = ~uint64_t( 0 );
      else if( item == "None" )
        result = 0;
      else
      {
        bool        remove = !item.empty() && item[0] == '^';
        uint64_t    mask   = 0;
        if( !FindTopic( remove ? item.substr( 1 ) : item, mask ) )
          continue;
        if( remove )
          result &= ~mask;
        else
          result |= mask;
      }
    }
    return result;
  }

  //----------------------------------------------------------------------------
  // Registered settings with their defaults. The TPC credential falls back
  // to the host one when empty, see Config::FromEnv.
  //----------------------------------------------------------------------------
  struct StringSetting
  {
    const char *name;
    const char *def;
  };

  const StringSetting kStringSettings[] =
  {
    { "CACertDir",        GsiCred::DefaultCACertDir        },
    { "CARefresh",        GsiCred::DefaultCARefresh        },
    { "NamespaceMode",    GsiCred::DefaultNamespaceMode    },
    { "CRLMode",          GsiCred::DefaultCRLMode          },
    { "OCSPMode",         GsiCred::DefaultOCSPMode         },
    { "HostCert",         GsiCred::DefaultHostCert         },
    { "HostKey",          GsiCred::DefaultHostKey          },
    { "HostCertRefresh",  GsiCred::DefaultHostCertRefresh  },
    { "HostCertVerify",   GsiCred::DefaultHostCertVerify   },
    { "TpcCert",          ""                               },
    { "TpcKey",           ""                               },
    { "TpcProxy",         ""                               },
    { "TpcCredRefresh",   GsiCred::DefaultTpcCredRefresh   },
    { "TpcCredVerify",    GsiCred::DefaultTpcCredVerify    },
    { "ProxyMinValidFor", GsiCred::DefaultProxyMinValidFor },
    { "ProxyLifetime",    GsiCred::DefaultProxyLifetime    }
  };

  struct IntSetting
  {
    const char *name;
    int         def;
  };

  const IntSetting kIntSettings[] =
  {
    { "ProxyBits",  GsiCred::DefaultProxyBits  },
    { "ProxyDepth", GsiCred::DefaultProxyDepth }
  };

  //----------------------------------------------------------------------------
  // GSICRED_<NAME>
  //----------------------------------------------------------------------------
  std::string ShellName( const std::string &name )
  {
    std::string shell = GsiCred::EnvPrefix + name;
    std::transform( shell.begin(), shell.end(), shell.begin(), ::toupper );
    return shell;
  }

  bool ParseInt( const std::string &text, int &value )
  {
    char *end = 0;
    errno = 0;
    long number = strtol( text.c_str(), &end, 0 );
    if( text.empty() || *end || errno == ERANGE ||
        number < INT_MIN || number > INT_MAX )
      return false;
    value = (int)number;
    return true;
  }
}

namespace GsiCred
{
  Env *DefaultEnv::sEnv = 0;
  Log *DefaultEnv::sLog = 0;

  //----------------------------------------------------------------------------
  // Constructor: defaults, then the config file, then the shell
  //----------------------------------------------------------------------------
  DefaultEnv::DefaultEnv()
  {
    Log *log = GetLog();

    std::string configFile = DefaultConfigFile;
    const char *envConfig  = getenv( "GSICRED_CONFIG" );
    if( envConfig && *envConfig )
      configFile = envConfig;

    std::map<std::string, std::string> config;
    Status st = Utils::ProcessConfig( config, configFile );
    if( !st.IsOK() )
      log->Debug( UtilityMsg, "Not using the config file %s: %s",
                  configFile.c_str(), st.ToStr().c_str() );

    std::map<std::string, std::string>::const_iterator it;
    for( it = config.begin(); it != config.end(); ++it )
      log->Debug( UtilityMsg, "[Config] %s = %s", it->first.c_str(),
                  it->second.c_str() );

    for( size_t i = 0; i < sizeof( kIntSettings ) / sizeof( kIntSettings[0] ); ++i )
    {
      const IntSetting &s = kIntSettings[i];
      PutInt( s.name, s.def );
      it = config.find( s.name );
      if( it != config.end() )
      {
        int value = 0;
        if( ParseInt( it->second, value ) )
          PutInt( s.name, value );
        else
          log->Warning( UtilityMsg, "Ignoring %s = %s from %s: not an "
                        "integer", s.name, it->second.c_str(),
                        configFile.c_str() );
      }
      ImportInt( s.name, ShellName( s.name ) );
    }

    for( size_t i = 0; i < sizeof( kStringSettings ) / sizeof( kStringSettings[0] ); ++i )
    {
      const StringSetting &s = kStringSettings[i];
      PutString( s.name, s.def );
      it = config.find( s.name );
      if( it != config.end() )
        PutString( s.name, it->second );
      ImportString( s.name, ShellName( s.name ) );
    }

    for( it = config.begin(); it != config.end(); ++it )
    {
      if( !IsKnownSetting( it->first ) )
        log->Warning( UtilityMsg, "Unknown setting %s in %s",
                      it->first.c_str(), configFile.c_str() );
    }
  }

  Env *DefaultEnv::GetEnv()
  {
    return sEnv;
  }

  Log *DefaultEnv::GetLog()
  {
    return sLog;
  }

  //----------------------------------------------------------------------------
  // Create the log first, the environment logs while loading
  //----------------------------------------------------------------------------
  void DefaultEnv::Initialize()
  {
    sLog = new Log();
    SetUpLog();
    sEnv = new DefaultEnv();
  }

  void DefaultEnv::Finalize()
  {
    delete sEnv;
    sEnv = 0;
    delete sLog;
    sLog = 0;
  }

  //----------------------------------------------------------------------------
  // Re-read GSICRED_LOGLEVEL, GSICRED_LOGFILE and GSICRED_LOGMASK. Not
  // safe while other threads are logging.
  //----------------------------------------------------------------------------
  void DefaultEnv::ReInitializeLogging()
  {
    Log *old = sLog;
    sLog = new Log();
    SetUpLog();
    delete old;
  }

  //----------------------------------------------------------------------------
  // Is the name one of the registered settings
  //----------------------------------------------------------------------------
  bool DefaultEnv::IsKnownSetting( const std::string &name )
  {
    for( size_t i = 0; i < sizeof( kIntSettings ) / sizeof( kIntSettings[0] ); ++i )
      if( name == kIntSettings[i].name )
        return true;
    for( size_t i = 0; i < sizeof( kStringSettings ) / sizeof( kStringSettings[0] ); ++i )
      if( name == kStringSettings[i].name )
        return true;
    return false;
  }

  //----------------------------------------------------------------------------
  // Set up the log from the shell
  //----------------------------------------------------------------------------
  void DefaultEnv::SetUpLog()
  {
    Log *log = GetLog();

    const char *level = getenv( "GSICRED_LOGLEVEL" );
    if( level )
      log->SetLevel( level );

    const char *file = getenv( "GSICRED_LOGFILE" );
    if( file && *file )
    {
      LogOutFile *out = new LogOutFile();
      if( out->Open( file ) )
        log->SetOutput( out );
      else
        delete out;
    }

    const char *logMask = getenv( "GSICRED_LOGMASK" );
    if( logMask )
    {
      uint64_t mask = TranslateMask( logMask );
      for( int l = Log::ErrorMsg; l <= Log::DumpMsg; ++l )
        log->SetMask( (Log::LogLevel)l, mask );
    }

    for( size_t i = 0; i < sizeof( kTopics ) / sizeof( kTopics[0] ); ++i )
      log->SetTopicName( kTopics[i].mask, kTopics[i].name );
  }
}

//------------------------------------------------------------------------------
// Static initialization and finalization
//------------------------------------------------------------------------------
namespace
{
  static struct EnvInitializer
  {
    EnvInitializer()
    {
      GsiCred::DefaultEnv::Initialize();
    }

    ~EnvInitializer()
    {
      GsiCred::DefaultEnv::Finalize();
    }
  } initializer;
}
