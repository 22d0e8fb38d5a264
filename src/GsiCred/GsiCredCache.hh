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

#ifndef __GSI_CRED_CACHE_HH__
#define __GSI_CRED_CACHE_HH__

#include <stdint.h>
#include <atomic>
#include <functional>
#include <memory>

#include "GsiCred/GsiCredStatus.hh"
#include "GsiCred/GsiCredUtils.hh"

namespace GsiCred
{
  //----------------------------------------------------------------------------
  //! Timed refresh cache holding a single value. The value and the time it
  //! was loaded are published together, readers take lock-free snapshots.
  //! Refreshing is not synchronized, the owner serializes the writers.
  //----------------------------------------------------------------------------
  template<typename T>
  class CredentialCache
  {
    public:
      //------------------------------------------------------------------------
      //! A published value with its load time (milliseconds)
      //------------------------------------------------------------------------
      struct Entry
      {
        Entry(): timestamp( 0 ) {}
        std::shared_ptr<const T> value;
        uint64_t                 timestamp;
      };

      typedef std::shared_ptr<const Entry>                         EntryPtr;
      typedef std::function<Status( std::shared_ptr<const T> & )> Loader;

      //------------------------------------------------------------------------
      //! Constructor
      //!
      //! @param refresh interval in milliseconds after which the value is
      //!                considered stale
      //! @param clock   time source in milliseconds
      //------------------------------------------------------------------------
      CredentialCache( uint64_t refresh, Clock clock ):
        pRefresh( refresh ), pClock( clock ) {}

      //------------------------------------------------------------------------
      //! Current entry, null if nothing has been published yet
      //------------------------------------------------------------------------
      EntryPtr Snapshot() const
      {
        return std::atomic_load( &pEntry );
      }

      //------------------------------------------------------------------------
      //! Current value, null if absent
      //------------------------------------------------------------------------
      std::shared_ptr<const T> Get() const
      {
        EntryPtr entry = Snapshot();
        return entry ? entry->value : std::shared_ptr<const T>();
      }

      //------------------------------------------------------------------------
      //! Load time of the current value, 0 if absent
      //------------------------------------------------------------------------
      uint64_t GetTimestamp() const
      {
        EntryPtr entry = Snapshot();
        return entry ? entry->timestamp : 0;
      }

      //------------------------------------------------------------------------
      //! True when there is no value or the refresh interval has elapsed
      //------------------------------------------------------------------------
      bool NeedsRefresh() const
      {
        EntryPtr entry = Snapshot();
        if( !entry || !entry->value )
          return true;
        return pClock() - entry->timestamp >= pRefresh;
      }

      //------------------------------------------------------------------------
      //! Replace the value, stamped with the current time
      //------------------------------------------------------------------------
      void Publish( const std::shared_ptr<const T> &value )
      {
        std::shared_ptr<Entry> entry = std::make_shared<Entry>();
        entry->value     = value;
        entry->timestamp = pClock();
        std::atomic_store( &pEntry, EntryPtr( entry ) );
      }

      //------------------------------------------------------------------------
      //! Run the loader if the value is stale and publish its result. On
      //! failure the current entry is left untouched and the status is
      //! returned.
      //------------------------------------------------------------------------
      Status Refresh( const Loader &loader )
      {
        if( !NeedsRefresh() )
          return Status();

        std::shared_ptr<const T> value;
        Status st = loader( value );
        if( !st.IsOK() )
          return st;
        if( !value )
          return Status( stError, errInternal, 0, "loader produced no value" );
        Publish( value );
        return Status();
      }

      uint64_t GetRefreshInterval() const { return pRefresh; }

    private:
      uint64_t pRefresh;
      Clock    pClock;
      EntryPtr pEntry;
  };
}

#endif // __GSI_CRED_CACHE_HH__
