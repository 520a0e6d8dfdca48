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

#include "testfakes.hpp"

using namespace dlnacast;


class DiscoveryFixture : public ::testing::Test
{
protected:
  FakeResolverPtr resolver;
  FakeSearchPtr search;
  DiscoveryServicePtr discovery;

  virtual void SetUp()
  {
    resolver = FakeResolverPtr(new FakeResolver);
    search = FakeSearchPtr(new FakeSearch);
    discovery = DiscoveryServicePtr(new DiscoveryService(fastDiscoveryConfig(), resolver, search));
    search->setQueue(discovery->candidates());
  }

  virtual void TearDown()
  {
    discovery->stop();
  }

  bool present(const string &aUuid)
  {
    Device d;
    return discovery->getDevice(aUuid, d);
  }
};


TEST_F(DiscoveryFixture, DuplicateAdvertisementsResolveOnce)
{
  for (int i=0; i<5; i++) search->advertise("uuid:a");
  for (int i=0; i<3; i++) search->advertise("uuid:b");
  discovery->runRound();
  EXPECT_EQ(1, search->triggers.load());
  EXPECT_EQ(1, resolver->callsFor("uuid:a"));
  EXPECT_EQ(1, resolver->callsFor("uuid:b"));
  DeviceVector devices = discovery->listDevices();
  ASSERT_EQ(2u, devices.size());
  Device d;
  ASSERT_TRUE(discovery->getDevice("uuid:a", d));
  EXPECT_EQ("Renderer uuid:a", d.friendlyName);
  EXPECT_EQ("http://10.0.0.5:80/dir/desc.xml", d.location);
  EXPECT_EQ(1, discovery->rounds());
}


TEST_F(DiscoveryFixture, RegisteredDevicesAreNotResolvedAgain)
{
  search->advertise("uuid:a");
  discovery->runRound();
  ASSERT_TRUE(present("uuid:a"));
  Device before;
  ASSERT_TRUE(discovery->getDevice("uuid:a", before));
  for (int round=0; round<3; round++) {
    boost::this_thread::sleep_for(boost::chrono::milliseconds(2));
    search->advertise("uuid:a");
    search->advertise("uuid:a");
    discovery->runRound();
    EXPECT_TRUE(present("uuid:a"));
  }
  EXPECT_EQ(1, resolver->callsFor("uuid:a"));
  EXPECT_EQ(4, search->triggers.load());
  // the refresh moved lastSeen forward
  Device after;
  ASSERT_TRUE(discovery->getDevice("uuid:a", after));
  EXPECT_GT(after.lastSeen, before.lastSeen);
}


TEST_F(DiscoveryFixture, SilentDevicesAreEvictedAfterOneRound)
{
  search->advertise("uuid:a");
  search->advertise("uuid:b");
  discovery->runRound();
  ASSERT_TRUE(present("uuid:a"));
  ASSERT_TRUE(present("uuid:b"));
  // only a stays
  search->advertise("uuid:a");
  discovery->runRound();
  EXPECT_TRUE(present("uuid:a"));
  EXPECT_FALSE(present("uuid:b"));
  // nobody advertises
  discovery->runRound();
  EXPECT_TRUE(discovery->listDevices().empty());
  // b comes back and needs to be resolved again
  search->advertise("uuid:b");
  discovery->runRound();
  EXPECT_TRUE(present("uuid:b"));
  EXPECT_EQ(2, resolver->callsFor("uuid:b"));
}


TEST_F(DiscoveryFixture, FailedResolutionRegistersNothing)
{
  resolver->setFailing("uuid:bad");
  search->advertise("uuid:bad");
  search->advertise("uuid:good");
  discovery->runRound();
  EXPECT_FALSE(present("uuid:bad"));
  EXPECT_TRUE(present("uuid:good"));
  // no retries within the round, but the next advertisement tries again
  EXPECT_EQ(1, resolver->callsFor("uuid:bad"));
  search->advertise("uuid:bad");
  discovery->runRound();
  EXPECT_FALSE(present("uuid:bad"));
  EXPECT_EQ(2, resolver->callsFor("uuid:bad"));
}


TEST_F(DiscoveryFixture, LocationChangeIsResolvedAgain)
{
  search->advertise("uuid:a", "http://10.0.0.5:80/desc.xml");
  discovery->runRound();
  ASSERT_TRUE(present("uuid:a"));
  search->advertise("uuid:a", "http://10.0.0.6:80/desc.xml");
  search->advertise("uuid:a", "http://10.0.0.6:80/desc.xml");
  discovery->runRound();
  Device d;
  ASSERT_TRUE(discovery->getDevice("uuid:a", d));
  EXPECT_EQ("http://10.0.0.6:80/desc.xml", d.location);
  EXPECT_EQ(2, resolver->callsFor("uuid:a"));
  EXPECT_EQ(1u, discovery->listDevices().size());
}


TEST_F(DiscoveryFixture, LateResolutionCountsInRoundThatReceivesIt)
{
  resolver->setDelay("uuid:slow", 300*MilliSecond);
  search->advertise("uuid:slow");
  discovery->runRound();
  EXPECT_FALSE(present("uuid:slow"));
  boost::this_thread::sleep_for(boost::chrono::milliseconds(300));
  discovery->runRound();
  EXPECT_TRUE(present("uuid:slow"));
}


TEST(DiscoveryConfig, WindowIsClampedBelowInterval)
{
  DiscoveryConfig cfg;
  cfg.interval = 5*Second;
  cfg.window = 10*Second;
  DiscoveryServicePtr d = DiscoveryServicePtr(new DiscoveryService(cfg, FakeResolverPtr(new FakeResolver), SearchTriggerPtr()));
  EXPECT_EQ(4*Second, d->getConfig().window);
  cfg.interval = 2*Second;
  cfg.window = 2*Second;
  d = DiscoveryServicePtr(new DiscoveryService(cfg, FakeResolverPtr(new FakeResolver), SearchTriggerPtr()));
  EXPECT_EQ(1*Second, d->getConfig().window);
  cfg.interval = 10*Second;
  cfg.window = 3*Second;
  d = DiscoveryServicePtr(new DiscoveryService(cfg, FakeResolverPtr(new FakeResolver), SearchTriggerPtr()));
  EXPECT_EQ(3*Second, d->getConfig().window);
}


TEST(DiscoveryService, RunsRoundsInBackground)
{
  FakeResolverPtr resolver = FakeResolverPtr(new FakeResolver);
  FakeSearchPtr search = FakeSearchPtr(new FakeSearch);
  DiscoveryConfig cfg;
  cfg.interval = 100*MilliSecond;
  cfg.window = 50*MilliSecond;
  DiscoveryServicePtr discovery = DiscoveryServicePtr(new DiscoveryService(cfg, resolver, search));
  search->setQueue(discovery->candidates());
  search->advertise("uuid:a");
  ErrorPtr err = discovery->start();
  ASSERT_TRUE(Error::isOK(err));
  for (int i=0; i<200 && discovery->rounds()<3; i++) {
    boost::this_thread::sleep_for(boost::chrono::milliseconds(10));
  }
  discovery->stop();
  EXPECT_GE(discovery->rounds(), 3);
  EXPECT_GE(search->triggers.load(), 3);
  // advertised only once, so it was found in the first round and evicted later
  EXPECT_TRUE(discovery->listDevices().empty());
  EXPECT_EQ(1, resolver->callsFor("uuid:a"));
}
