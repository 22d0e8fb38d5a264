//------------------------------------------------------------------------------
// Copyright (c) 2024 by European Organization for Nuclear Research (CERN)
// See the LICENCE file for details.
//------------------------------------------------------------------------------

#include <cppunit/extensions/HelperMacros.h>
#include "CppUnitGsiCredHelpers.hh"
#include "GsiCredTestDoubles.hh"
#include "GsiCredTestPKI.hh"
#include "GsiCred/GsiCredFileStore.hh"
#include "GsiCred/GsiCredManager.hh"

#include <sys/stat.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace GsiCred;

//------------------------------------------------------------------------------
// Declaration
//------------------------------------------------------------------------------
class ManagerTest: public CppUnit::TestCase
{
  public:
    CPPUNIT_TEST_SUITE( ManagerTest );
      CPPUNIT_TEST( HostRefreshTest );
      CPPUNIT_TEST( HostFailFastTest );
      CPPUNIT_TEST( ClientFailSoftTest );
      CPPUNIT_TEST( PrefetchedProxyTest );
      CPPUNIT_TEST( DelegationRoundTripTest );
      CPPUNIT_TEST( ChecksTest );
      CPPUNIT_TEST( ConcurrentAccessTest );
    CPPUNIT_TEST_SUITE_END();
    void setUp();
    void tearDown();
    void HostRefreshTest();
    void HostFailFastTest();
    void ClientFailSoftTest();
    void PrefetchedProxyTest();
    void DelegationRoundTripTest();
    void ChecksTest();
    void ConcurrentAccessTest();

  private:
    TestPKI *pPKI;
};

CPPUNIT_TEST_SUITE_REGISTRATION( ManagerTest );

//------------------------------------------------------------------------------
// Host and user credentials
//------------------------------------------------------------------------------
void ManagerTest::setUp()
{
  pPKI = new TestPKI();
  CPPUNIT_ASSERT( pPKI->IsValid() );
  std::vector<std::string> sans;
  sans.push_back( "xfer.example.org" );
  CPPUNIT_ASSERT( pPKI->IssueCertificate( "host.example.org", sans,
                                          "hostcert.pem", "hostkey.pem" ) );
  std::vector<std::string> none;
  CPPUNIT_ASSERT( pPKI->IssueCertificate( "alice", none, "usercert.pem",
                                          "userkey.pem" ) );
}

void ManagerTest::tearDown()
{
  delete pPKI;
  pPKI = 0;
}

//------------------------------------------------------------------------------
// The host credential is loaded once per interval
//------------------------------------------------------------------------------
void ManagerTest::HostRefreshTest()
{
  ManualClock clock;
  std::shared_ptr<CountingPKI> pki = std::make_shared<CountingPKI>();
  Config config = pPKI->MakeConfig();
  config.hostCertRefresh = 3600;
  CredentialManager manager( config, pki, clock );

  CPPUNIT_ASSERT( !manager.GetHostCredential() );
  CPPUNIT_ASSERT_GSIST( manager.LoadServerCredentials() );
  CPPUNIT_ASSERT( pki->loadCount == 1 );
  std::shared_ptr<const Credential> first = manager.GetHostCredential();
  CPPUNIT_ASSERT( first );
  CPPUNIT_ASSERT( X509Utils::Subject( first->chain.Leaf() ) ==
                  TestPKI::Subject( "host.example.org" ) );
  uint64_t stamp = manager.GetHostCredRefreshTimestamp();
  CPPUNIT_ASSERT( stamp == clock() );

  clock.Advance( 3600*1000 - 1 );
  CPPUNIT_ASSERT_GSIST( manager.LoadServerCredentials() );
  CPPUNIT_ASSERT( pki->loadCount == 1 );
  CPPUNIT_ASSERT( manager.GetHostCredential() == first );
  CPPUNIT_ASSERT( manager.GetHostCredRefreshTimestamp() == stamp );

  clock.Advance( 1 );
  CPPUNIT_ASSERT_GSIST( manager.LoadServerCredentials() );
  CPPUNIT_ASSERT( pki->loadCount == 2 );
  CPPUNIT_ASSERT( manager.GetHostCredential() != first );
  CPPUNIT_ASSERT( manager.GetHostCredRefreshTimestamp() == stamp + 3600*1000 );
}

//------------------------------------------------------------------------------
// Host failures reach the caller
//------------------------------------------------------------------------------
void ManagerTest::HostFailFastTest()
{
  ManualClock clock;
  std::shared_ptr<CountingPKI> pki = std::make_shared<CountingPKI>();
  pki->failLoad = true;
  {
    CredentialManager manager( pPKI->MakeConfig(), pki, clock );
    CPPUNIT_ASSERT_GSIERR( manager.LoadServerCredentials(), errCredentialLoad );
    CPPUNIT_ASSERT( !manager.GetHostCredential() );
    CPPUNIT_ASSERT( manager.GetHostCredRefreshTimestamp() == 0 );
  }

  //----------------------------------------------------------------------------
  // A host certificate from an unknown CA
  //----------------------------------------------------------------------------
  TestPKI other;
  CPPUNIT_ASSERT( other.IsValid() );
  std::vector<std::string> none;
  CPPUNIT_ASSERT( other.IssueCertificate( "rogue.example.org", none,
                                          "hostcert.pem", "hostkey.pem" ) );
  Config config = pPKI->MakeConfig();
  config.hostCert = other.Path( "hostcert.pem" );
  config.hostKey  = other.Path( "hostkey.pem" );
  {
    CredentialManager manager( config, std::make_shared<SslPKIFactory>(), clock );
    Status st = manager.LoadServerCredentials();
    CPPUNIT_ASSERT( st.code == errValidation );
    CPPUNIT_ASSERT( st.errNo == kGsiNotAuthorized );
    CPPUNIT_ASSERT( !manager.GetHostCredential() );
  }

  config.hostCertVerify = false;
  {
    CredentialManager manager( config, std::make_shared<SslPKIFactory>(), clock );
    CPPUNIT_ASSERT_GSIST( manager.LoadServerCredentials() );
    CPPUNIT_ASSERT( manager.GetHostCredential() );
  }
}

//------------------------------------------------------------------------------
// Client failures are absorbed, the previous proxy stays
//------------------------------------------------------------------------------
void ManagerTest::ClientFailSoftTest()
{
  ManualClock clock;
  std::shared_ptr<CountingPKI> pki = std::make_shared<CountingPKI>();
  Config config = pPKI->MakeConfig();
  config.tpcCredRefresh = 600;
  CredentialManager manager( config, pki, clock );

  //----------------------------------------------------------------------------
  // Nothing loaded yet
  //----------------------------------------------------------------------------
  pki->failLoad = true;
  manager.LoadClientCredentials();
  CPPUNIT_ASSERT( !manager.GetProxy() );
  CPPUNIT_ASSERT( !manager.GetClientCredential() );
  CPPUNIT_ASSERT( manager.GetClientCredIssuerHashes().empty() );

  pki->failLoad = false;
  manager.LoadClientCredentials();
  std::shared_ptr<const Credential> proxy = manager.GetProxy();
  CPPUNIT_ASSERT( proxy );
  CPPUNIT_ASSERT( proxy->chain.Size() == 2 );
  CPPUNIT_ASSERT( X509Utils::IsProxy( proxy->chain.Leaf() ) );
  CPPUNIT_ASSERT( manager.GetClientCredential()->chain.Size() == 1 );
  CPPUNIT_ASSERT( pki->proxyCount == 1 );

  std::string hashes = manager.GetClientCredIssuerHashes();
  CPPUNIT_ASSERT( hashes.find( pPKI->GetCAHash() ) != std::string::npos );
  CPPUNIT_ASSERT( hashes.find( '|' ) != std::string::npos );
  uint64_t stamp = manager.GetProxyRefreshTimestamp();

  //----------------------------------------------------------------------------
  // Within the interval nothing is reloaded
  //----------------------------------------------------------------------------
  clock.Advance( 1000 );
  manager.LoadClientCredentials();
  CPPUNIT_ASSERT( pki->loadCount == 2 );
  CPPUNIT_ASSERT( manager.GetProxy() == proxy );

  //----------------------------------------------------------------------------
  // Failures after the interval keep the old state
  //----------------------------------------------------------------------------
  clock.Advance( 600*1000 );
  pki->failLoad = true;
  manager.LoadClientCredentials();
  CPPUNIT_ASSERT( manager.GetProxy() == proxy );
  CPPUNIT_ASSERT( manager.GetProxyRefreshTimestamp() == stamp );
  CPPUNIT_ASSERT( manager.GetClientCredIssuerHashes() == hashes );

  pki->failLoad  = false;
  pki->failProxy = true;
  manager.LoadClientCredentials();
  CPPUNIT_ASSERT( manager.GetProxy() == proxy );
  CPPUNIT_ASSERT( manager.GetProxyRefreshTimestamp() == stamp );

  pki->failProxy = false;
  manager.LoadClientCredentials();
  CPPUNIT_ASSERT( manager.GetProxy() != proxy );
  CPPUNIT_ASSERT( manager.GetProxy()->chain.Size() == 2 );
  CPPUNIT_ASSERT( manager.GetProxyRefreshTimestamp() == clock() );

  //----------------------------------------------------------------------------
  // An untrusted client certificate is not used
  //----------------------------------------------------------------------------
  TestPKI other;
  CPPUNIT_ASSERT( other.IsValid() );
  std::vector<std::string> none;
  CPPUNIT_ASSERT( other.IssueCertificate( "eve", none, "usercert.pem",
                                          "userkey.pem" ) );
  config.tpcCert = other.Path( "usercert.pem" );
  config.tpcKey  = other.Path( "userkey.pem" );
  CredentialManager untrusted( config, pki, clock );
  untrusted.LoadClientCredentials();
  CPPUNIT_ASSERT( !untrusted.GetProxy() );
}

//------------------------------------------------------------------------------
// A prefetched proxy is used as is
//------------------------------------------------------------------------------
void ManagerTest::PrefetchedProxyTest()
{
  ManualClock clock;
  SslPKIFactory factory;
  Credential alice, proxy;
  CPPUNIT_ASSERT_GSIST( factory.LoadCredential( pPKI->Path( "usercert.pem" ),
                                                pPKI->Path( "userkey.pem" ),
                                                alice ) );
  CPPUNIT_ASSERT_GSIST( factory.CreateProxy( alice, ProxyOptions(), proxy ) );
  CPPUNIT_ASSERT( pPKI->WriteFile( "x509up_u500", proxy.ToPEM() ) );

  std::shared_ptr<CountingPKI> pki = std::make_shared<CountingPKI>();
  Config config = pPKI->MakeConfig();
  config.tpcProxy = pPKI->Path( "x509up_u500" );
  CredentialManager manager( config, pki, clock );
  CPPUNIT_ASSERT( manager.GetProxyPath() == config.tpcProxy );

  manager.LoadClientCredentials();
  CPPUNIT_ASSERT( manager.GetProxy() );
  CPPUNIT_ASSERT( manager.GetProxy()->chain == proxy.chain );
  CPPUNIT_ASSERT( manager.GetClientCredential()->chain == proxy.chain );
  CPPUNIT_ASSERT( pki->proxyCount == 0 );
}

//------------------------------------------------------------------------------
// Server and client managers delegating through a local store
//------------------------------------------------------------------------------
void ManagerTest::DelegationRoundTripTest()
{
  ManualClock clock;
  std::shared_ptr<PKIFactory> pki = std::make_shared<SslPKIFactory>();
  Config config = pPKI->MakeConfig();

  CredentialManager client( config, pki, clock );
  CredentialManager server( config, pki, clock );

  X509Chain newChain;
  CPPUNIT_ASSERT_GSIERR( client.GetSignedProxyRequest( "csr", newChain ),
                         errUninitialized );

  client.LoadClientCredentials();
  std::shared_ptr<const Credential> proxy = client.GetProxy();
  CPPUNIT_ASSERT( proxy );
  CPPUNIT_ASSERT_GSIST( server.LoadServerCredentials() );
  CPPUNIT_ASSERT_GSIST( server.Validate( proxy->chain ) );

  std::string csr;
  CPPUNIT_ASSERT_GSIERR( server.PrepareSerializedProxyRequest( proxy->chain, csr ),
                         errStoreUnavailable );

  std::string storeDir = pPKI->Path( "store" );
  CPPUNIT_ASSERT_ERRNO( mkdir( storeDir.c_str(), 0700 ) == 0 );
  server.SetCredentialStoreClient(
    std::make_shared<LocalCredentialStore>( storeDir, pki ) );

  bool valid = true;
  CPPUNIT_ASSERT_GSIST( server.HasValidDelegatedProxy( proxy->chain, valid ) );
  CPPUNIT_ASSERT( !valid );

  CPPUNIT_ASSERT_GSIST( server.PrepareSerializedProxyRequest( proxy->chain, csr ) );
  CPPUNIT_ASSERT( server.GetDelegationState() ==
                  ProxyDelegationCoordinator::AwaitingSignature );

  CPPUNIT_ASSERT_GSIST( client.GetSignedProxyRequest( csr, newChain ) );
  CPPUNIT_ASSERT( newChain.Size() == proxy->chain.Size() + 1 );
  CPPUNIT_ASSERT_GSIST( server.Validate( newChain ) );

  CPPUNIT_ASSERT_GSIST( server.FinalizeDelegatedProxy( newChain.Leaf() ) );
  CPPUNIT_ASSERT( server.GetDelegationState() == ProxyDelegationCoordinator::Idle );
  CPPUNIT_ASSERT_GSIST( server.HasValidDelegatedProxy( proxy->chain, valid ) );
  CPPUNIT_ASSERT( valid );

  CPPUNIT_ASSERT_GSIERR( server.FinalizeDelegatedProxy( newChain.Leaf() ),
                         errDelegationState );
  server.CancelOutstandingProxyRequest();
  CPPUNIT_ASSERT( server.GetDelegationState() == ProxyDelegationCoordinator::Idle );
}

//------------------------------------------------------------------------------
// Identity checks and accessors
//------------------------------------------------------------------------------
void ManagerTest::ChecksTest()
{
  Config config = pPKI->MakeConfig();
  CredentialManager manager( config );

  CPPUNIT_ASSERT( manager.GetCACertificatePath() == pPKI->GetCADir() );
  CPPUNIT_ASSERT( manager.GetHostCertificatePath() == pPKI->Path( "hostcert.pem" ) );
  CPPUNIT_ASSERT( manager.GetHostKeyPath() == pPKI->Path( "hostkey.pem" ) );
  CPPUNIT_ASSERT( manager.GetClientCertificatePath() == pPKI->Path( "usercert.pem" ) );
  CPPUNIT_ASSERT( manager.GetClientKeyPath() == pPKI->Path( "userkey.pem" ) );
  CPPUNIT_ASSERT( manager.GetProxyPath().empty() );
  CPPUNIT_ASSERT( manager.GetHostCertRefreshInterval() == config.hostCertRefresh );
  CPPUNIT_ASSERT( manager.GetProxyRefreshInterval() == config.tpcCredRefresh );
  CPPUNIT_ASSERT( manager.GetTrustAnchorRefreshInterval() == config.caRefresh );
  CPPUNIT_ASSERT( manager.GetProxyMinValidFor() == config.proxyMinValidFor );
  CPPUNIT_ASSERT( manager.IsVerifyHostCertificate() );
  CPPUNIT_ASSERT( manager.IsVerifyClientCertificate() );
  CPPUNIT_ASSERT( manager.GetTrustStore().GetCADir() == pPKI->GetCADir() );

  CPPUNIT_ASSERT_GSIST( manager.LoadServerCredentials() );
  X509 *host = manager.GetHostCredential()->chain.Leaf();
  CPPUNIT_ASSERT_GSIST( manager.CheckIdentity( host, "host.example.org" ) );
  CPPUNIT_ASSERT_GSIST( manager.CheckIdentity( host, "xfer.example.org" ) );
  CPPUNIT_ASSERT_GSIERR( manager.CheckIdentity( host, "elsewhere.org" ),
                         errIdentityMismatch );

  std::vector<std::string> cas;
  cas.push_back( pPKI->GetCAHash() );
  CPPUNIT_ASSERT_GSIST( manager.CheckCaIdentities( cas ) );
  CPPUNIT_ASSERT_GSIST( manager.CheckCaIdentities( pPKI->GetCAHash() + ".0" ) );
  CPPUNIT_ASSERT_GSIERR( manager.CheckCaIdentities( "12345678" ),
                         errInvalidCaPath );
}

//------------------------------------------------------------------------------
// Sessions refreshing and delegating through one manager at the same time
//------------------------------------------------------------------------------
void ManagerTest::ConcurrentAccessTest()
{
  ManualClock clock;
  std::shared_ptr<CountingPKI>    pki   = std::make_shared<CountingPKI>();
  std::shared_ptr<RecordingStore> store = std::make_shared<RecordingStore>();
  Config config = pPKI->MakeConfig();
  config.hostCertRefresh = 3600;
  config.tpcCredRefresh  = 3600;
  CredentialManager manager( config, pki, clock );
  manager.SetCredentialStoreClient( store );

  SslPKIFactory factory;
  Credential    alice;
  CPPUNIT_ASSERT_GSIST( factory.LoadCredential( pPKI->Path( "usercert.pem" ),
                                                pPKI->Path( "userkey.pem" ),
                                                alice ) );

  const int         sessions   = 6;
  const int         iterations = 25;
  std::atomic<int>  failures( 0 );
  std::atomic<int>  inconsistent( 0 );
  std::atomic<bool> done( false );
  const uint64_t    start = clock();
  std::shared_ptr<const Credential> seenProxy;
  std::shared_ptr<const Credential> seenHost;

  //----------------------------------------------------------------------------
  // Snapshots are read without the lock while the sessions run
  //----------------------------------------------------------------------------
  std::thread reader( [&]()
  {
    do
    {
      std::shared_ptr<const Credential> proxy = manager.GetProxy();
      uint64_t proxyStamp = manager.GetProxyRefreshTimestamp();
      std::shared_ptr<const Credential> host = manager.GetHostCredential();
      uint64_t hostStamp = manager.GetHostCredRefreshTimestamp();
      if( proxy )
      {
        if( proxyStamp != start || proxy->chain.Size() != 2 ||
            !proxy->key.Matches( proxy->chain.Leaf() ) )
          ++inconsistent;
        if( !seenProxy )
          seenProxy = proxy;
        else if( seenProxy != proxy )
          ++inconsistent;
      }
      if( host )
      {
        if( hostStamp != start )
          ++inconsistent;
        if( !seenHost )
          seenHost = host;
        else if( seenHost != host )
          ++inconsistent;
      }
    }
    while( !done );
  } );

  std::vector<std::thread> workers;
  for( int i = 0; i < sessions; ++i )
  {
    workers.push_back( std::thread( [&]()
    {
      for( int j = 0; j < iterations; ++j )
      {
        if( !manager.LoadServerCredentials().IsOK() )
          ++failures;
        manager.LoadClientCredentials();
        std::string csr;
        if( !manager.PrepareSerializedProxyRequest( alice.chain, csr ).IsOK() )
          ++failures;
        manager.CancelOutstandingProxyRequest();
      }
    } ) );
  }
  for( size_t i = 0; i < workers.size(); ++i )
    workers[i].join();
  done = true;
  reader.join();

  CPPUNIT_ASSERT( failures == 0 );
  CPPUNIT_ASSERT( inconsistent == 0 );
  CPPUNIT_ASSERT( !pki->overlapped );

  //----------------------------------------------------------------------------
  // One host and one client load for the interval, one proxy
  //----------------------------------------------------------------------------
  CPPUNIT_ASSERT( pki->loadCount == 2 );
  CPPUNIT_ASSERT( pki->proxyCount == 1 );
  CPPUNIT_ASSERT( manager.GetProxy() );
  CPPUNIT_ASSERT( manager.GetProxyRefreshTimestamp() == start );
  CPPUNIT_ASSERT( manager.GetHostCredRefreshTimestamp() == start );

  //----------------------------------------------------------------------------
  // Never more than one request outstanding at the store, none left over
  //----------------------------------------------------------------------------
  CPPUNIT_ASSERT( store->requestCount == sessions * iterations );
  CPPUNIT_ASSERT( store->maxOutstanding == 1 );
  CPPUNIT_ASSERT( store->outstanding == 0 );
  CPPUNIT_ASSERT( store->cancelCount == store->requestCount );
  CPPUNIT_ASSERT( manager.GetDelegationState() ==
                  ProxyDelegationCoordinator::Idle );

  //----------------------------------------------------------------------------
  // After the interval the next wave reloads exactly once more
  //----------------------------------------------------------------------------
  clock.Advance( 3600*1000 );
  workers.clear();
  for( int i = 0; i < sessions; ++i )
  {
    workers.push_back( std::thread( [&]()
    {
      if( !manager.LoadServerCredentials().IsOK() )
        ++failures;
      manager.LoadClientCredentials();
    } ) );
  }
  for( size_t i = 0; i < workers.size(); ++i )
    workers[i].join();

  CPPUNIT_ASSERT( failures == 0 );
  CPPUNIT_ASSERT( !pki->overlapped );
  CPPUNIT_ASSERT( pki->loadCount == 4 );
  CPPUNIT_ASSERT( pki->proxyCount == 2 );
  CPPUNIT_ASSERT( manager.GetProxy() != seenProxy );
  CPPUNIT_ASSERT( manager.GetProxyRefreshTimestamp() == start + 3600*1000 );
  CPPUNIT_ASSERT( manager.GetHostCredRefreshTimestamp() == start + 3600*1000 );
}
