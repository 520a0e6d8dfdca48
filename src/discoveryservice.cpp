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

// File scope debugging options
// - Set ALWAYS_DEBUG to 1 to enable DBGLOG output even in non-DEBUG builds of this file
#define ALWAYS_DEBUG 0
// - set FOCUSLOGLEVEL to non-zero log level (usually, 5,6, or 7==LOG_DEBUG) to get focus (extensive logging) for this file
//   Note: must be before including "logger.hpp" (or anything that includes "logger.hpp")
#define FOCUSLOGLEVEL 0

#include "discoveryservice.hpp"

#include <algorithm>

using namespace dlnacast;

typedef boost::unique_lock<boost::mutex> Lock;

#define COLLECT_SLICE (20*MilliSecond) // max latency for noticing resolved devices while waiting for candidates


#pragma mark - resolution

// runs on a detached thread, must only use what it holds references to
static void resolveCandidate(DeviceResolverPtr aResolver, ResultQueuePtr aResults, Candidate aCandidate)
{
  Device device;
  ErrorPtr err = aResolver->resolve(aCandidate, device);
  if (!Error::isOK(err)) {
    // malformed descriptions are normal noise, network problems are worth noting
    int level = err->isDomain(DescriptionError::domain()) ? LOG_DEBUG : LOG_INFO;
    LOG(level, "Cannot resolve %s at %s: %s\n", aCandidate.uuid.c_str(), aCandidate.location.c_str(), err->description().c_str());
    return;
  }
  if (!aResults->send(device, RESULT_SEND_TIMEOUT)) {
    if (aResults->isClosed()) {
      LOG(LOG_DEBUG, "Discovery stopped, discarded resolution of %s\n", device.shortDesc().c_str());
    }
    else {
      LOG(LOG_WARNING, "Result queue full, dropped resolution of %s\n", device.shortDesc().c_str());
    }
  }
}


#pragma mark - DiscoveryService


DiscoveryService::DiscoveryService(const DiscoveryConfig &aConfig)
{
  init(aConfig);
  resolver = DeviceResolverPtr(new DescriptionResolver());
}


DiscoveryService::DiscoveryService(const DiscoveryConfig &aConfig, DeviceResolverPtr aResolver, SearchTriggerPtr aSearchTrigger)
{
  init(aConfig);
  resolver = aResolver;
  searchTrigger = aSearchTrigger;
}


void DiscoveryService::init(const DiscoveryConfig &aConfig)
{
  config = aConfig;
  if (config.interval<=0) config.interval = DiscoveryConfig().interval;
  if (config.window>=config.interval || config.window<=0) {
    // collect window must leave time between rounds
    MLMicroSeconds w = config.interval>2*Second ? config.interval-Second : config.interval/2;
    LOG(LOG_WARNING, "Collect window clamped to %lld mS (interval is %lld mS)\n", w/MilliSecond, config.interval/MilliSecond);
    config.window = w;
  }
  registry = DeviceRegistryPtr(new DeviceRegistry);
  candidateQueue = CandidateQueuePtr(new CandidateQueue(CANDIDATE_QUEUE_SIZE));
  resultQueue = ResultQueuePtr(new ResultQueue(RESULT_QUEUE_SIZE));
  stopRequested = false;
  roundCount = 0;
}


DiscoveryService::~DiscoveryService()
{
  stop();
}


ErrorPtr DiscoveryService::start()
{
  ErrorPtr err;
  if (!searchTrigger) {
    // real network discovery
    BindSelector bindSelector = BindSelector::parse(config.bindSelector);
    listener = SsdpListenerPtr(new SsdpListener(bindSelector, candidateQueue));
    err = listener->start();
    if (!Error::isOK(err)) {
      listener.reset();
      return err;
    }
    searcher = SsdpSearcherPtr(new SsdpSearcher(bindSelector, config.interval));
    searcher->setResponseHandler(boost::bind(&SsdpListener::handleDatagram, listener.get(), _1));
    searcher->start();
    searchTrigger = searcher;
  }
  Lock lock(stateMutex);
  stopRequested = false;
  if (!roundThread) {
    roundThread.reset(new boost::thread(boost::bind(&DiscoveryService::roundLoop, this)));
  }
  LOG(LOG_NOTICE, "Discovery started: interval %lld S, collect window %lld mS\n", config.interval/Second, config.window/MilliSecond);
  return err;
}


void DiscoveryService::stop()
{
  {
    Lock lock(stateMutex);
    stopRequested = true;
    stopCond.notify_all();
  }
  if (roundThread) {
    roundThread->join();
    roundThread.reset();
  }
  if (searcher) {
    searcher->stop();
    searchTrigger.reset();
    searcher.reset();
  }
  if (listener) {
    listener->stop();
    listener.reset();
  }
  // late resolutions get their results discarded
  resultQueue->close();
}


bool DiscoveryService::isStopping()
{
  Lock lock(stateMutex);
  return stopRequested;
}


void DiscoveryService::roundLoop()
{
  while (!isStopping()) {
    runRound();
    // sleep until next round
    Lock lock(stateMutex);
    boost::chrono::steady_clock::time_point wakeAt = boost::chrono::steady_clock::now()+chronoDuration(config.interval);
    while (!stopRequested) {
      if (stopCond.wait_until(lock, wakeAt)==boost::cv_status::timeout) break;
    }
  }
}


void DiscoveryService::spawnResolution(const Candidate &aCandidate)
{
  FOCUSLOG("Resolving %s at %s\n", aCandidate.uuid.c_str(), aCandidate.location.c_str());
  try {
    boost::thread t(boost::bind(&resolveCandidate, resolver, resultQueue, aCandidate));
    t.detach();
  }
  catch (boost::thread_resource_error &e) {
    LOG(LOG_ERR, "Cannot start resolution of %s: %s\n", aCandidate.uuid.c_str(), e.what());
  }
}


void DiscoveryService::runRound()
{
  IdentitySet found; // identities seen this round
  IdentitySet pending; // identities with a resolution started this round
  LastSeenMap lastSeen; // refreshes for registered devices
  map<string, Device> resolved; // devices to insert, by identity
  // Search
  if (searchTrigger) searchTrigger->trigger();
  // Collect
  MLMicroSeconds until = monotonicTime()+config.window;
  while (true) {
    // resolved devices
    Device device;
    while (resultQueue->tryReceive(device)) {
      FOCUSLOG("Resolved %s\n", device.shortDesc().c_str());
      found.insert(device.uuid);
      resolved[device.uuid] = device;
    }
    MLMicroSeconds now = monotonicTime();
    if (now>=until || isStopping()) break;
    // advertisements
    Candidate c;
    if (!candidateQueue->receive(c, min(until-now, COLLECT_SLICE))) continue;
    Device registered;
    if (registry->get(c.uuid, registered)) {
      // known device: mark it found, no need to resolve again...
      found.insert(c.uuid);
      LastSeenMap::iterator pos = lastSeen.find(c.uuid);
      if (pos==lastSeen.end() || pos->second<c.seen) lastSeen[c.uuid] = c.seen;
      // ...unless it moved
      if (registered.location!=c.location && pending.insert(c.uuid).second) {
        LOG(LOG_INFO, "%s moved from %s to %s\n", registered.shortDesc().c_str(), registered.location.c_str(), c.location.c_str());
        spawnResolution(c);
      }
    }
    else if (pending.insert(c.uuid).second) {
      // new device
      spawnResolution(c);
    }
  }
  // Sync
  DeviceVector inserts;
  for (map<string, Device>::iterator pos = resolved.begin(); pos!=resolved.end(); ++pos) {
    inserts.push_back(pos->second);
  }
  registry->applyRound(found, lastSeen, inserts);
  roundCount++;
  FOCUSLOG("Round %ld done: %d found, %d resolved, %d registered\n", roundCount.load(), (int)found.size(), (int)inserts.size(), (int)registry->size());
}


DeviceVector DiscoveryService::listDevices()
{
  return registry->listAll();
}


bool DiscoveryService::getDevice(const string &aUuid, Device &aDevice)
{
  return registry->get(aUuid, aDevice);
}
