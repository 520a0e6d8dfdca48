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

#ifndef __dlnacast__discoveryservice__
#define __dlnacast__discoveryservice__

#include "dc_common.hpp"
#include "deviceregistry.hpp"
#include "descriptionresolver.hpp"
#include "ssdplistener.hpp"
#include "ssdpsearcher.hpp"

#include <boost/thread/thread.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/scoped_ptr.hpp>

using namespace std;

namespace dlnacast {

  #define CANDIDATE_QUEUE_SIZE 256
  #define RESULT_QUEUE_SIZE 64
  #define RESULT_SEND_TIMEOUT (1*Second)

  /// discovery parameters
  class DiscoveryConfig
  {
  public:
    string bindSelector; ///< "all", an address literal or an interface name
    MLMicroSeconds interval; ///< search period and pause between rounds
    MLMicroSeconds window; ///< collect window of a round, must be shorter than interval

    DiscoveryConfig() :
      bindSelector("all"),
      interval(10*Second),
      window(3*Second)
    {};
  };


  typedef BoundedQueue<Device> ResultQueue;
  typedef boost::shared_ptr<ResultQueue> ResultQueuePtr;

  class DiscoveryService;
  typedef boost::intrusive_ptr<DiscoveryService> DiscoveryServicePtr;

  /// keeps the device registry in sync with the devices present on the network
  /// @note works in rounds: trigger a search, collect advertisements and resolved devices for the
  ///   collect window, then apply all changes to the registry at once. Registered devices that did
  ///   not advertise during a round are removed at the end of that round.
  class DiscoveryService : public DcObj
  {
    typedef DcObj inherited;

    DiscoveryConfig config;
    DeviceRegistryPtr registry;
    DeviceResolverPtr resolver;
    SearchTriggerPtr searchTrigger;
    CandidateQueuePtr candidateQueue;
    ResultQueuePtr resultQueue;

    SsdpListenerPtr listener;
    SsdpSearcherPtr searcher;

    boost::mutex stateMutex;
    boost::condition_variable stopCond;
    bool stopRequested;
    boost::scoped_ptr<boost::thread> roundThread;
    boost::atomic<long> roundCount;

  public:

    /// create discovery service using SSDP and description documents
    /// @param aConfig the discovery parameters
    DiscoveryService(const DiscoveryConfig &aConfig);

    /// create discovery service with custom resolver and search trigger
    /// @param aConfig the discovery parameters
    /// @param aResolver resolves candidates into devices
    /// @param aSearchTrigger triggered at the start of every round, can be NULL
    /// @note start() will not create the SSDP searcher and listener
    DiscoveryService(const DiscoveryConfig &aConfig, DeviceResolverPtr aResolver, SearchTriggerPtr aSearchTrigger);

    virtual ~DiscoveryService();

    /// start listening, searching and running rounds
    /// @return error if no SSDP listener could be started at all
    ErrorPtr start();

    /// stop all activity, waits for the listener, searcher and round threads to terminate
    /// @note resolutions still in progress finish in the background, their results are discarded
    void stop();

    /// run a single round (search, collect, sync) on the calling thread
    void runRound();

    /// @return copies of all currently known devices
    DeviceVector listDevices();

    /// get a device
    /// @param aUuid the device identity
    /// @param aDevice receives a copy of the device
    /// @return false if no such device is known
    bool getDevice(const string &aUuid, Device &aDevice);

    /// @return the queue advertisements are delivered to
    CandidateQueuePtr candidates() { return candidateQueue; };

    /// @return the number of rounds completed so far
    long rounds() { return roundCount.load(); };

    /// @return the effective configuration (window clamped below interval)
    const DiscoveryConfig &getConfig() { return config; };

  private:

    void init(const DiscoveryConfig &aConfig);
    bool isStopping();
    void roundLoop();
    void spawnResolution(const Candidate &aCandidate);

  };

} // namespace dlnacast


#endif /* defined(__dlnacast__discoveryservice__) */
