//------------------------------------------------------------------------------
// Copyright (c) 2024 by European Organization for Nuclear Research (CERN)
// See the LICENCE file for details.
//------------------------------------------------------------------------------

#include <cppunit/extensions/HelperMacros.h>
#include "CppUnitGsiCredHelpers.hh"
#include "GsiCredTestDoubles.hh"
#include "GsiCred/GsiCredCache.hh"

#include <functional>
#include <string>

using namespace GsiCred;

//------------------------------------------------------------------------------
// Declaration
//------------------------------------------------------------------------------
class CredentialCacheTest: public CppUnit::TestCase
{
  public:
    CPPUNIT_TEST_SUITE( CredentialCacheTest );
      CPPUNIT_TEST( RefreshTimingTest );
      CPPUNIT_TEST( FailureTest );
      CPPUNIT_TEST( SnapshotTest );
    CPPUNIT_TEST_SUITE_END();
    void RefreshTimingTest();
    void FailureTest();
    void SnapshotTest();
};

CPPUNIT_TEST_SUITE_REGISTRATION( CredentialCacheTest );

namespace
{
  //----------------------------------------------------------------------------
  // Loader producing numbered values
  //----------------------------------------------------------------------------
  struct CountingLoader
  {
    CountingLoader(): calls( 0 ), fail( false ) {}

    Status operator()( std::shared_ptr<const std::string> &value )
    {
      ++calls;
      if( fail )
        return Status( stError, errCredentialLoad, 0, "no luck" );
      value = std::make_shared<const std::string>( "value-" +
                                                   std::to_string( calls ) );
      return Status();
    }

    int  calls;
    bool fail;
  };
}

//------------------------------------------------------------------------------
// The loader runs once per interval
//------------------------------------------------------------------------------
void CredentialCacheTest::RefreshTimingTest()
{
  ManualClock clock;
  CredentialCache<std::string> cache( 10000, clock );
  CountingLoader loader;
  CredentialCache<std::string>::Loader fn = std::ref( loader );

  CPPUNIT_ASSERT( cache.NeedsRefresh() );
  CPPUNIT_ASSERT( !cache.Get() );
  CPPUNIT_ASSERT( cache.GetTimestamp() == 0 );

  CPPUNIT_ASSERT_GSIST( cache.Refresh( fn ) );
  CPPUNIT_ASSERT( loader.calls == 1 );
  std::shared_ptr<const std::string> first = cache.Get();
  uint64_t stamp = cache.GetTimestamp();
  CPPUNIT_ASSERT( *first == "value-1" );
  CPPUNIT_ASSERT( stamp == clock() );

  clock.Advance( 9999 );
  CPPUNIT_ASSERT_GSIST( cache.Refresh( fn ) );
  CPPUNIT_ASSERT( loader.calls == 1 );
  CPPUNIT_ASSERT( cache.Get() == first );
  CPPUNIT_ASSERT( cache.GetTimestamp() == stamp );

  clock.Advance( 1 );
  CPPUNIT_ASSERT( cache.NeedsRefresh() );
  CPPUNIT_ASSERT_GSIST( cache.Refresh( fn ) );
  CPPUNIT_ASSERT( loader.calls == 2 );
  CPPUNIT_ASSERT( *cache.Get() == "value-2" );
  CPPUNIT_ASSERT( cache.GetTimestamp() == stamp + 10000 );
}

//------------------------------------------------------------------------------
// A failed load keeps the previous value and is retried
//------------------------------------------------------------------------------
void CredentialCacheTest::FailureTest()
{
  ManualClock clock;
  CredentialCache<std::string> cache( 1000, clock );
  CountingLoader loader;
  CredentialCache<std::string>::Loader fn = std::ref( loader );

  loader.fail = true;
  CPPUNIT_ASSERT_GSIERR( cache.Refresh( fn ), errCredentialLoad );
  CPPUNIT_ASSERT( !cache.Get() );
  CPPUNIT_ASSERT( cache.NeedsRefresh() );

  loader.fail = false;
  CPPUNIT_ASSERT_GSIST( cache.Refresh( fn ) );
  std::shared_ptr<const std::string> good = cache.Get();
  uint64_t stamp = cache.GetTimestamp();
  CPPUNIT_ASSERT( good );

  clock.Advance( 1000 );
  loader.fail = true;
  CPPUNIT_ASSERT_GSIERR( cache.Refresh( fn ), errCredentialLoad );
  CPPUNIT_ASSERT( cache.Get() == good );
  CPPUNIT_ASSERT( cache.GetTimestamp() == stamp );

  //----------------------------------------------------------------------------
  // Still stale, the next access tries again
  //----------------------------------------------------------------------------
  int calls = loader.calls;
  CPPUNIT_ASSERT( cache.NeedsRefresh() );
  CPPUNIT_ASSERT_GSIERR( cache.Refresh( fn ), errCredentialLoad );
  CPPUNIT_ASSERT( loader.calls == calls + 1 );

  //----------------------------------------------------------------------------
  // A loader claiming success without a value
  //----------------------------------------------------------------------------
  CredentialCache<std::string> other( 1000, clock );
  CPPUNIT_ASSERT_GSIERR( other.Refresh(
    []( std::shared_ptr<const std::string> & ) { return Status(); } ),
    errInternal );
  CPPUNIT_ASSERT( !other.Get() );
}

//------------------------------------------------------------------------------
// Snapshots stay consistent after a replacement
//------------------------------------------------------------------------------
void CredentialCacheTest::SnapshotTest()
{
  ManualClock clock;
  CredentialCache<std::string> cache( 1000, clock );
  cache.Publish( std::make_shared<const std::string>( "one" ) );
  CredentialCache<std::string>::EntryPtr snap = cache.Snapshot();
  uint64_t stamp = snap->timestamp;

  clock.Advance( 5000 );
  cache.Publish( std::make_shared<const std::string>( "two" ) );

  CPPUNIT_ASSERT( *snap->value == "one" );
  CPPUNIT_ASSERT( snap->timestamp == stamp );
  CPPUNIT_ASSERT( *cache.Get() == "two" );
  CPPUNIT_ASSERT( cache.GetTimestamp() == stamp + 5000 );
  CPPUNIT_ASSERT( cache.GetRefreshInterval() == 1000 );
}
