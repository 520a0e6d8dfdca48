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

#ifndef __dlnacast__testfakes__
#define __dlnacast__testfakes__

#include "discoveryservice.hpp"

#include <boost/thread/thread.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/atomic.hpp>

using namespace std;

namespace dlnacast {

  /// resolver that does not use the network
  class FakeResolver : public DeviceResolver
  {
    typedef boost::lock_guard<boost::mutex> Guard;

    boost::mutex fakeMutex;
    map<string, int> callsByUuid;
    set<string> failing;
    map<string, MLMicroSeconds> delays;
    map<string, string> names;
    string controlURL;

  public:

    boost::atomic<int> calls;

    FakeResolver() :
      controlURL("http://127.0.0.1:9/ctrl"),
      calls(0)
    {
    }

    void setFailing(const string &aUuid) { Guard g(fakeMutex); failing.insert(aUuid); }
    void setDelay(const string &aUuid, MLMicroSeconds aDelay) { Guard g(fakeMutex); delays[aUuid] = aDelay; }
    void setName(const string &aUuid, const string &aName) { Guard g(fakeMutex); names[aUuid] = aName; }
    void setControlURL(const string &aControlURL) { Guard g(fakeMutex); controlURL = aControlURL; }

    int callsFor(const string &aUuid)
    {
      Guard g(fakeMutex);
      map<string, int>::iterator pos = callsByUuid.find(aUuid);
      return pos==callsByUuid.end() ? 0 : pos->second;
    }

    virtual ErrorPtr resolve(const Candidate &aCandidate, Device &aDevice)
    {
      MLMicroSeconds delay = 0;
      bool fail;
      {
        Guard g(fakeMutex);
        callsByUuid[aCandidate.uuid]++;
        fail = failing.count(aCandidate.uuid)>0;
        if (delays.count(aCandidate.uuid)) delay = delays[aCandidate.uuid];
        aDevice.friendlyName = names.count(aCandidate.uuid) ? names[aCandidate.uuid] : "Renderer " + aCandidate.uuid;
        aDevice.controlURL = controlURL;
      }
      calls++;
      if (delay>0) boost::this_thread::sleep_for(chronoDuration(delay));
      if (fail) {
        return ErrorPtr(new DescriptionError(DescriptionErrorNoAVTransport, "no AVTransport"));
      }
      aDevice.uuid = aCandidate.uuid;
      aDevice.location = aCandidate.location;
      aDevice.server = aCandidate.server;
      aDevice.lastSeen = aCandidate.seen;
      return ErrorPtr();
    }
  };
  typedef boost::intrusive_ptr<FakeResolver> FakeResolverPtr;


  /// search trigger delivering scripted advertisements into the candidate queue
  class FakeSearch : public SearchTrigger
  {
    typedef boost::lock_guard<boost::mutex> Guard;

    boost::mutex fakeMutex;
    CandidateQueuePtr candidates;
    vector<Candidate> nextRound;

  public:

    boost::atomic<int> triggers;

    FakeSearch() : triggers(0) {}

    void setQueue(CandidateQueuePtr aCandidates) { candidates = aCandidates; }

    /// queue an advertisement to be delivered at the next trigger
    void advertise(const string &aUuid, const string &aLocation = "http://10.0.0.5:80/dir/desc.xml")
    {
      Guard g(fakeMutex);
      Candidate c;
      c.uuid = aUuid;
      c.location = aLocation;
      c.server = "FakeOS/1.0 UPnP/1.0";
      c.seen = unixTime();
      nextRound.push_back(c);
    }

    virtual void trigger()
    {
      triggers++;
      Guard g(fakeMutex);
      for (vector<Candidate>::iterator pos = nextRound.begin(); pos!=nextRound.end(); ++pos) {
        candidates->trySend(*pos);
      }
      nextRound.clear();
    }
  };
  typedef boost::intrusive_ptr<FakeSearch> FakeSearchPtr;


  /// discovery parameters for fast test rounds
  inline DiscoveryConfig fastDiscoveryConfig()
  {
    DiscoveryConfig cfg;
    cfg.interval = 1*Second;
    cfg.window = 150*MilliSecond;
    return cfg;
  }

} // namespace dlnacast

#endif /* defined(__dlnacast__testfakes__) */
