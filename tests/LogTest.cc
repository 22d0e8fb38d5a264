//------------------------------------------------------------------------------
// Copyright (c) 2024 by European Organization for Nuclear Research (CERN)
// See the LICENCE file for details.
//------------------------------------------------------------------------------

#include <cppunit/extensions/HelperMacros.h>
#include "GsiCred/GsiCredLog.hh"
#include "GsiCred/GsiCredDefaultEnv.hh"
#include "GsiCred/GsiCredConstants.hh"

#include <cstdlib>
#include <string>
#include <vector>

namespace
{
  //----------------------------------------------------------------------------
  // Keep the written messages
  //----------------------------------------------------------------------------
  class LogOutCapture: public GsiCred::LogOut
  {
    public:
      LogOutCapture( std::vector<std::string> &lines ): pLines( lines ) {}

      virtual void Write( const std::string &message )
      {
        pLines.push_back( message );
      }

    private:
      std::vector<std::string> &pLines;
  };
}

//------------------------------------------------------------------------------
// Declaration
//------------------------------------------------------------------------------
class LogTest: public CppUnit::TestCase
{
  public:
    CPPUNIT_TEST_SUITE( LogTest );
      CPPUNIT_TEST( FormatTest );
      CPPUNIT_TEST( FilterTest );
      CPPUNIT_TEST( DefaultLogTest );
    CPPUNIT_TEST_SUITE_END();
    void FormatTest();
    void FilterTest();
    void DefaultLogTest();
};

CPPUNIT_TEST_SUITE_REGISTRATION( LogTest );

//------------------------------------------------------------------------------
// Message layout
//------------------------------------------------------------------------------
void LogTest::FormatTest()
{
  using namespace GsiCred;
  std::vector<std::string> lines;
  Log log;
  log.SetOutput( new LogOutCapture( lines ) );
  log.SetLevel( Log::DumpMsg );
  log.SetTopicName( CredentialMsg, "Credential" );

  log.Warning( CredentialMsg, "proxy %s expires in %d s", "/CN=alice", 42 );
  CPPUNIT_ASSERT( lines.size() == 1 );
  CPPUNIT_ASSERT( lines[0].find( "][Warning][Credential] proxy /CN=alice "
                                 "expires in 42 s\n" ) != std::string::npos );
  CPPUNIT_ASSERT( lines[0][0] == '[' );

  lines.clear();
  log.Dump( CredentialMsg, "first\nsecond" );
  CPPUNIT_ASSERT( lines.size() == 1 );
  std::string::size_type first  = lines[0].find( "[Dump   ][Credential] first\n" );
  std::string::size_type second = lines[0].find( "[Dump   ][Credential] second\n" );
  CPPUNIT_ASSERT( first != std::string::npos );
  CPPUNIT_ASSERT( second != std::string::npos && second > first );

  lines.clear();
  log.Info( 0x100, "unnamed" );
  CPPUNIT_ASSERT( lines.size() == 1 );
  CPPUNIT_ASSERT( lines[0].find( "[0x00000100] unnamed" ) != std::string::npos );

  std::string longText( 5000, 'x' );
  lines.clear();
  log.Error( CredentialMsg, "%s", longText.c_str() );
  CPPUNIT_ASSERT( lines.size() == 1 );
  CPPUNIT_ASSERT( lines[0].find( longText + "\n" ) != std::string::npos );
}

//------------------------------------------------------------------------------
// Levels and topic masks
//------------------------------------------------------------------------------
void LogTest::FilterTest()
{
  using namespace GsiCred;
  std::vector<std::string> lines;
  Log log;
  log.SetOutput( new LogOutCapture( lines ) );

  CPPUNIT_ASSERT( log.GetLevel() == Log::ErrorMsg );
  log.Warning( TrustMsg, "hidden" );
  log.Error( TrustMsg, "shown" );
  CPPUNIT_ASSERT( lines.size() == 1 );

  log.SetLevel( "Debug" );
  CPPUNIT_ASSERT( log.GetLevel() == Log::DebugMsg );
  log.SetLevel( "Loud" );
  CPPUNIT_ASSERT( log.GetLevel() == Log::DebugMsg );
  CPPUNIT_ASSERT( log.IsEnabled( Log::DebugMsg, TrustMsg ) );
  CPPUNIT_ASSERT( !log.IsEnabled( Log::DumpMsg, TrustMsg ) );

  log.SetMask( "Debug", StoreMsg );
  CPPUNIT_ASSERT( !log.IsEnabled( Log::DebugMsg, TrustMsg ) );
  CPPUNIT_ASSERT( log.IsEnabled( Log::DebugMsg, StoreMsg ) );
  CPPUNIT_ASSERT( log.IsEnabled( Log::InfoMsg, TrustMsg ) );

  lines.clear();
  log.Debug( TrustMsg, "hidden" );
  log.Debug( StoreMsg, "shown" );
  CPPUNIT_ASSERT( lines.size() == 1 );

  Log::LogLevel level;
  CPPUNIT_ASSERT( Log::StringToLogLevel( "Warning", level ) );
  CPPUNIT_ASSERT( level == Log::WarningMsg );
  CPPUNIT_ASSERT( !Log::StringToLogLevel( "warning", level ) );
}

//------------------------------------------------------------------------------
// Process-wide log configured from the shell
//------------------------------------------------------------------------------
void LogTest::DefaultLogTest()
{
  using namespace GsiCred;
  CPPUNIT_ASSERT( DefaultEnv::GetLog() );
  CPPUNIT_ASSERT( DefaultEnv::GetEnv() );

  setenv( "GSICRED_LOGLEVEL", "Info", 1 );
  setenv( "GSICRED_LOGMASK", "All|^TrustMsg|^Store", 1 );
  DefaultEnv::ReInitializeLogging();
  Log *log = DefaultEnv::GetLog();
  CPPUNIT_ASSERT( log->GetLevel() == Log::InfoMsg );
  CPPUNIT_ASSERT( log->IsEnabled( Log::InfoMsg, CredentialMsg ) );
  CPPUNIT_ASSERT( !log->IsEnabled( Log::InfoMsg, TrustMsg ) );
  CPPUNIT_ASSERT( !log->IsEnabled( Log::ErrorMsg, StoreMsg ) );

  setenv( "GSICRED_LOGMASK", "None|Delegation", 1 );
  DefaultEnv::ReInitializeLogging();
  log = DefaultEnv::GetLog();
  CPPUNIT_ASSERT( log->IsEnabled( Log::InfoMsg, DelegationMsg ) );
  CPPUNIT_ASSERT( !log->IsEnabled( Log::InfoMsg, CredentialMsg ) );

  unsetenv( "GSICRED_LOGLEVEL" );
  unsetenv( "GSICRED_LOGMASK" );
  DefaultEnv::ReInitializeLogging();
  CPPUNIT_ASSERT( DefaultEnv::GetLog()->GetLevel() == Log::ErrorMsg );

  CPPUNIT_ASSERT( DefaultEnv::IsKnownSetting( "HostCertRefresh" ) );
  CPPUNIT_ASSERT( DefaultEnv::IsKnownSetting( "ProxyBits" ) );
  CPPUNIT_ASSERT( !DefaultEnv::IsKnownSetting( "HostCertRefreshed" ) );
}
