//------------------------------------------------------------------------------
// Copyright (c) 2024 by European Organization for Nuclear Research (CERN)
// See the LICENCE file for details.
//------------------------------------------------------------------------------

#include <cppunit/extensions/HelperMacros.h>
#include "CppUnitGsiCredHelpers.hh"
#include "GsiCredTestDoubles.hh"
#include "GsiCredTestPKI.hh"
#include "GsiCred/GsiCredDelegation.hh"
#include "GsiCred/GsiCredSslPKI.hh"

using namespace GsiCred;

//------------------------------------------------------------------------------
// Declaration
//------------------------------------------------------------------------------
class DelegationTest: public CppUnit::TestCase
{
  public:
    CPPUNIT_TEST_SUITE( DelegationTest );
      CPPUNIT_TEST( NoStoreTest );
      CPPUNIT_TEST( RoundTripTest );
      CPPUNIT_TEST( CancelTest );
      CPPUNIT_TEST( SecondPrepareTest );
      CPPUNIT_TEST( StoreFailureTest );
      CPPUNIT_TEST( ValidProxyTest );
      CPPUNIT_TEST( SignRequestTest );
    CPPUNIT_TEST_SUITE_END();
    void setUp();
    void tearDown();
    void NoStoreTest();
    void RoundTripTest();
    void CancelTest();
    void SecondPrepareTest();
    void StoreFailureTest();
    void ValidProxyTest();
    void SignRequestTest();

  private:
    TestPKI   *pPKI;
    X509Chain  pAlice;
    X509Chain  pSigned;
};

CPPUNIT_TEST_SUITE_REGISTRATION( DelegationTest );

//------------------------------------------------------------------------------
// A client chain and a certificate standing for the signed proxy
//------------------------------------------------------------------------------
void DelegationTest::setUp()
{
  pPKI = new TestPKI();
  CPPUNIT_ASSERT( pPKI->IsValid() );
  std::vector<std::string> none;
  CPPUNIT_ASSERT( pPKI->IssueCertificate( "alice", none, "alice.pem",
                                          "alice.key" ) );
  CPPUNIT_ASSERT( pPKI->IssueCertificate( "signed", none, "signed.pem",
                                          "signed.key" ) );
  pAlice  = X509Chain();
  pSigned = X509Chain();
  CPPUNIT_ASSERT_GSIST( X509Chain::FromFile( pPKI->Path( "alice.pem" ), pAlice ) );
  CPPUNIT_ASSERT_GSIST( X509Chain::FromFile( pPKI->Path( "signed.pem" ),
                                             pSigned ) );
  pAlice.PushBack( pPKI->GetCACert() );
}

void DelegationTest::tearDown()
{
  delete pPKI;
  pPKI = 0;
}

//------------------------------------------------------------------------------
// Nothing works without a store
//------------------------------------------------------------------------------
void DelegationTest::NoStoreTest()
{
  ProxyDelegationCoordinator coordinator;
  std::string csr;
  Status st = coordinator.Prepare( pAlice, csr );
  CPPUNIT_ASSERT( st.code == errStoreUnavailable );
  CPPUNIT_ASSERT( st.errNo == kGsiServerError );
  CPPUNIT_ASSERT( st.GetErrorMessage() ==
                  "no client to credential store has been provided." );
  CPPUNIT_ASSERT( coordinator.GetState() == ProxyDelegationCoordinator::Idle );

  bool valid = true;
  CPPUNIT_ASSERT_GSIERR( coordinator.HasValidDelegatedProxy( pAlice, 600, valid ),
                         errStoreUnavailable );
  CPPUNIT_ASSERT( !valid );

  CPPUNIT_ASSERT_GSIERR( coordinator.Finalize( pSigned.Leaf() ),
                         errDelegationState );
  coordinator.Cancel();
}

//------------------------------------------------------------------------------
// prepare, finalize, then finalize again
//------------------------------------------------------------------------------
void DelegationTest::RoundTripTest()
{
  std::shared_ptr<RecordingStore> store = std::make_shared<RecordingStore>();
  ProxyDelegationCoordinator coordinator;
  coordinator.SetCredentialStoreClient( store );

  std::string csr;
  CPPUNIT_ASSERT_GSIST( coordinator.Prepare( pAlice, csr ) );
  CPPUNIT_ASSERT( csr == "CSR-1" );
  CPPUNIT_ASSERT( coordinator.GetState() ==
                  ProxyDelegationCoordinator::AwaitingSignature );
  CPPUNIT_ASSERT( coordinator.GetPendingRequest() );
  CPPUNIT_ASSERT( coordinator.GetPendingRequest()->id == "request-1" );
  CPPUNIT_ASSERT( coordinator.GetPendingRequest()->key == pAlice );

  CPPUNIT_ASSERT_GSIST( coordinator.Finalize( pSigned.Leaf() ) );
  CPPUNIT_ASSERT( coordinator.GetState() == ProxyDelegationCoordinator::Idle );
  CPPUNIT_ASSERT( store->storedIds.size() == 1 );
  CPPUNIT_ASSERT( store->storedIds[0] == "request-1" );
  CPPUNIT_ASSERT( store->storedChains[0] == pAlice );

  X509Chain expected = pSigned;
  expected.Append( pAlice );
  CPPUNIT_ASSERT( store->storedPems[0] == expected.ToPEM() );
  X509Chain stored;
  CPPUNIT_ASSERT_GSIST( X509Chain::FromPEM( store->storedPems[0], stored ) );
  CPPUNIT_ASSERT( stored.Size() == 3 );
  CPPUNIT_ASSERT( X509_cmp( stored.Leaf(), pSigned.Leaf() ) == 0 );

  Status st = coordinator.Finalize( pSigned.Leaf() );
  CPPUNIT_ASSERT( st.code == errDelegationState );
  CPPUNIT_ASSERT( st.errNo == kGsiServerError );
  CPPUNIT_ASSERT( st.GetErrorMessage() ==
                  "cannot finalize proxy: proxy request was not sent." );
  CPPUNIT_ASSERT( store->storedIds.size() == 1 );
  CPPUNIT_ASSERT( store->cancelCount == 0 );
}

//------------------------------------------------------------------------------
// Cancelling twice notifies the store once, failures are absorbed
//------------------------------------------------------------------------------
void DelegationTest::CancelTest()
{
  std::shared_ptr<RecordingStore> store = std::make_shared<RecordingStore>();
  ProxyDelegationCoordinator coordinator;
  coordinator.SetCredentialStoreClient( store );

  coordinator.Cancel();
  CPPUNIT_ASSERT( store->cancelCount == 0 );

  std::string csr;
  CPPUNIT_ASSERT_GSIST( coordinator.Prepare( pAlice, csr ) );
  coordinator.Cancel();
  coordinator.Cancel();
  CPPUNIT_ASSERT( store->cancelCount == 1 );
  CPPUNIT_ASSERT( store->cancelledIds[0] == "request-1" );
  CPPUNIT_ASSERT( coordinator.GetState() == ProxyDelegationCoordinator::Idle );

  store->failCancel = true;
  CPPUNIT_ASSERT_GSIST( coordinator.Prepare( pAlice, csr ) );
  coordinator.Cancel();
  CPPUNIT_ASSERT( store->cancelCount == 2 );
  CPPUNIT_ASSERT( coordinator.GetState() == ProxyDelegationCoordinator::Idle );
  CPPUNIT_ASSERT_GSIERR( coordinator.Finalize( pSigned.Leaf() ),
                         errDelegationState );
}

//------------------------------------------------------------------------------
// A second prepare replaces the outstanding request
//------------------------------------------------------------------------------
void DelegationTest::SecondPrepareTest()
{
  std::shared_ptr<RecordingStore> store = std::make_shared<RecordingStore>();
  ProxyDelegationCoordinator coordinator;
  coordinator.SetCredentialStoreClient( store );

  std::string csr;
  CPPUNIT_ASSERT_GSIST( coordinator.Prepare( pAlice, csr ) );
  CPPUNIT_ASSERT_GSIST( coordinator.Prepare( pAlice, csr ) );
  CPPUNIT_ASSERT( csr == "CSR-2" );
  CPPUNIT_ASSERT( store->cancelCount == 1 );
  CPPUNIT_ASSERT( store->cancelledIds[0] == "request-1" );
  CPPUNIT_ASSERT( coordinator.GetPendingRequest()->id == "request-2" );

  CPPUNIT_ASSERT_GSIST( coordinator.Finalize( pSigned.Leaf() ) );
  CPPUNIT_ASSERT( store->storedIds[0] == "request-2" );

  //----------------------------------------------------------------------------
  // A refused request leaves the coordinator idle
  //----------------------------------------------------------------------------
  store->failRequest = true;
  Status st = coordinator.Prepare( pAlice, csr );
  CPPUNIT_ASSERT( st.code == errStoreError );
  CPPUNIT_ASSERT( st.errNo == kGsiServerError );
  CPPUNIT_ASSERT( coordinator.GetState() == ProxyDelegationCoordinator::Idle );
}

//------------------------------------------------------------------------------
// The request survives a store failure
//------------------------------------------------------------------------------
void DelegationTest::StoreFailureTest()
{
  std::shared_ptr<RecordingStore> store = std::make_shared<RecordingStore>();
  ProxyDelegationCoordinator coordinator;
  coordinator.SetCredentialStoreClient( store );

  std::string csr;
  CPPUNIT_ASSERT_GSIST( coordinator.Prepare( pAlice, csr ) );
  store->failStore = true;
  CPPUNIT_ASSERT_GSIERR( coordinator.Finalize( pSigned.Leaf() ), errStoreError );
  CPPUNIT_ASSERT( coordinator.GetState() ==
                  ProxyDelegationCoordinator::AwaitingSignature );

  store->failStore = false;
  CPPUNIT_ASSERT_GSIST( coordinator.Finalize( pSigned.Leaf() ) );
  CPPUNIT_ASSERT( store->storedIds[0] == "request-1" );
  CPPUNIT_ASSERT( coordinator.GetState() == ProxyDelegationCoordinator::Idle );
}

//------------------------------------------------------------------------------
// Lookup of stored proxies
//------------------------------------------------------------------------------
void DelegationTest::ValidProxyTest()
{
  std::shared_ptr<RecordingStore> store = std::make_shared<RecordingStore>();
  ProxyDelegationCoordinator coordinator;
  coordinator.SetCredentialStoreClient( store );

  bool valid = true;
  CPPUNIT_ASSERT_GSIST( coordinator.HasValidDelegatedProxy( pAlice, 600, valid ) );
  CPPUNIT_ASSERT( !valid );
  CPPUNIT_ASSERT( store->fetchedMinValid == 600 );
  CPPUNIT_ASSERT( store->fetchedChain == pAlice );

  store->hasProxy = true;
  CPPUNIT_ASSERT_GSIST( coordinator.HasValidDelegatedProxy( pAlice, 60, valid ) );
  CPPUNIT_ASSERT( valid );
  CPPUNIT_ASSERT( store->fetchCount == 2 );
  CPPUNIT_ASSERT( coordinator.GetState() == ProxyDelegationCoordinator::Idle );
}

//------------------------------------------------------------------------------
// Client side signing
//------------------------------------------------------------------------------
void DelegationTest::SignRequestTest()
{
  SslPKIFactory factory;
  Credential alice, proxy;
  CPPUNIT_ASSERT_GSIST( factory.LoadCredential( pPKI->Path( "alice.pem" ),
                                                pPKI->Path( "alice.key" ),
                                                alice ) );
  CPPUNIT_ASSERT_GSIST( factory.CreateProxy( alice, ProxyOptions(), proxy ) );

  std::string csr;
  PrivateKey  key;
  CPPUNIT_ASSERT_GSIST( factory.CreateProxyRequest( proxy.chain, csr, key ) );

  X509Chain newChain;
  CPPUNIT_ASSERT_GSIST( ProxyDelegationCoordinator::GetSignedProxyRequest(
                          factory, csr, proxy, newChain ) );
  CPPUNIT_ASSERT( newChain.Size() == proxy.chain.Size() + 1 );
  CPPUNIT_ASSERT( key.Matches( newChain.Leaf() ) );

  CPPUNIT_ASSERT_GSIERR( ProxyDelegationCoordinator::GetSignedProxyRequest(
                           factory, "junk", proxy, newChain ), errSigning );
}
