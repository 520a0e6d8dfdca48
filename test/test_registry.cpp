//
//  Copyright (c) 2026 the dlnacast authors
//
//  This file is part of dlnacast.
//
//  dlnacast is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License, or
//  (at your option) any later version.
//
//  dlnacast is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//  GNU General Public License for more details.
//
//  You should have received a copy of the GNU General Public License
//  along with dlnacast. If not, see <http://www.gnu.org/licenses/>.
//

#include <gtest/gtest.h>

#include "deviceregistry.hpp"

#include <boost/thread/thread.hpp>
#include <boost/atomic.hpp>

using namespace dlnacast;


static Device device(const string &aUuid, MLMicroSeconds aSeen, const char *aLocation = "http://10.0.0.5/desc.xml")
{
  Device d;
  d.uuid = aUuid;
  d.location = aLocation;
  d.friendlyName = "Renderer " + aUuid;
  d.controlURL = "http://10.0.0.5/ctrl";
  d.lastSeen = aSeen;
  return d;
}


TEST(DeviceRegistry, InsertAndCopyOut)
{
  DeviceRegistryPtr r = DeviceRegistryPtr(new DeviceRegistry);
  DeviceVector inserts;
  inserts.push_back(device("uuid:a", 100));
  IdentitySet found;
  found.insert("uuid:a");
  r->applyRound(found, LastSeenMap(), inserts);
  EXPECT_EQ(1u, r->size());
  EXPECT_TRUE(r->contains("uuid:a"));
  Device d;
  ASSERT_TRUE(r->get("uuid:a", d));
  // copies do not alias the registry
  d.friendlyName = "changed";
  Device d2;
  ASSERT_TRUE(r->get("uuid:a", d2));
  EXPECT_EQ("Renderer uuid:a", d2.friendlyName);
  EXPECT_FALSE(r->get("uuid:b", d2));
}


TEST(DeviceRegistry, SweepsWhatWasNotFound)
{
  DeviceRegistryPtr r = DeviceRegistryPtr(new DeviceRegistry);
  DeviceVector inserts;
  inserts.push_back(device("uuid:a", 100));
  inserts.push_back(device("uuid:b", 100));
  IdentitySet found;
  found.insert("uuid:a");
  found.insert("uuid:b");
  r->applyRound(found, LastSeenMap(), inserts);
  ASSERT_EQ(2u, r->size());
  // next round only sees a
  found.clear();
  found.insert("uuid:a");
  LastSeenMap seen;
  seen["uuid:a"] = 200;
  r->applyRound(found, seen, DeviceVector());
  EXPECT_EQ(1u, r->size());
  EXPECT_FALSE(r->contains("uuid:b"));
  Device d;
  ASSERT_TRUE(r->get("uuid:a", d));
  EXPECT_EQ(200, d.lastSeen);
  // an empty round removes everything
  r->applyRound(IdentitySet(), LastSeenMap(), DeviceVector());
  EXPECT_EQ(0u, r->size());
}


TEST(DeviceRegistry, RefreshNeverGoesBack)
{
  DeviceRegistryPtr r = DeviceRegistryPtr(new DeviceRegistry);
  DeviceVector inserts;
  inserts.push_back(device("uuid:a", 500));
  IdentitySet found;
  found.insert("uuid:a");
  r->applyRound(found, LastSeenMap(), inserts);
  LastSeenMap seen;
  seen["uuid:a"] = 300;
  r->applyRound(found, seen, DeviceVector());
  Device d;
  ASSERT_TRUE(r->get("uuid:a", d));
  EXPECT_EQ(500, d.lastSeen);
}


TEST(DeviceRegistry, ReResolutionReplacesLocation)
{
  DeviceRegistryPtr r = DeviceRegistryPtr(new DeviceRegistry);
  DeviceVector inserts;
  inserts.push_back(device("uuid:a", 500, "http://10.0.0.5/desc.xml"));
  IdentitySet found;
  found.insert("uuid:a");
  r->applyRound(found, LastSeenMap(), inserts);
  inserts.clear();
  inserts.push_back(device("uuid:a", 400, "http://10.0.0.6/desc.xml"));
  r->applyRound(found, LastSeenMap(), inserts);
  Device d;
  ASSERT_TRUE(r->get("uuid:a", d));
  EXPECT_EQ("http://10.0.0.6/desc.xml", d.location);
  EXPECT_EQ(500, d.lastSeen);
  EXPECT_EQ(1u, r->size());
}


#pragma mark - concurrency

namespace {

  // keeps reading snapshots, checks that each one is completely from one generation
  class SnapshotReader
  {
    DeviceRegistryPtr registry;
    boost::atomic<bool> &stop;
    boost::atomic<int> &mixed;
    boost::atomic<int> &reads;

  public:
    SnapshotReader(DeviceRegistryPtr aRegistry, boost::atomic<bool> &aStop, boost::atomic<int> &aMixed, boost::atomic<int> &aReads) :
      registry(aRegistry), stop(aStop), mixed(aMixed), reads(aReads)
    {
    }

    void operator()()
    {
      while (!stop.load()) {
        DeviceVector snapshot = registry->listAll();
        if (snapshot.empty()) {
          mixed++;
          continue;
        }
        char generation = snapshot[0].uuid[5];
        for (DeviceVector::iterator pos = snapshot.begin(); pos!=snapshot.end(); ++pos) {
          if (pos->uuid[5]!=generation) {
            mixed++;
            break;
          }
        }
        if (snapshot.size()!=50) mixed++;
        reads++;
      }
    }
  };

  void generation(char aGen, IdentitySet &aFound, DeviceVector &aDevices)
  {
    aFound.clear();
    aDevices.clear();
    for (int i=0; i<50; i++) {
      string uuid = string_format("uuid:%c%02d", aGen, i);
      aFound.insert(uuid);
      aDevices.push_back(device(uuid, 100));
    }
  }

}


TEST(DeviceRegistry, ConcurrentReadsSeeWholeRounds)
{
  DeviceRegistryPtr r = DeviceRegistryPtr(new DeviceRegistry);
  IdentitySet foundA, foundB;
  DeviceVector devA, devB;
  generation('A', foundA, devA);
  generation('B', foundB, devB);
  SETLOGLEVEL(LOG_WARNING);
  r->applyRound(foundA, LastSeenMap(), devA);

  boost::atomic<bool> stop(false);
  boost::atomic<int> mixed(0);
  boost::atomic<int> reads(0);
  boost::thread_group readers;
  for (int i=0; i<4; i++) {
    readers.create_thread(SnapshotReader(r, stop, mixed, reads));
  }
  // every round replaces the whole population
  for (int round=0; round<500; round++) {
    if (round%2==0)
      r->applyRound(foundB, LastSeenMap(), devB);
    else
      r->applyRound(foundA, LastSeenMap(), devA);
  }
  // make sure the readers got a chance to run at all
  for (int i=0; i<200 && reads.load()<10; i++) {
    boost::this_thread::sleep_for(boost::chrono::milliseconds(5));
  }
  stop = true;
  readers.join_all();
  SETLOGLEVEL(LOG_NOTICE);
  EXPECT_EQ(0, mixed.load());
  EXPECT_GT(reads.load(), 0);
}
