//
//  Copyright (c) 2013-2015 plan44.ch / Lukas Zeller, Zurich, Switzerland
//
//  Author: Lukas Zeller <luz@plan44.ch>
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

#ifndef __dlnacast__ssdplistener__
#define __dlnacast__ssdplistener__

#include "dc_common.hpp"
#include "ssdp.hpp"
#include "udpcomm.hpp"
#include "upnpdevice.hpp"
#include "boundedqueue.hpp"

#include <boost/thread/thread.hpp>

using namespace std;

namespace dlnacast {

  #define SSDP_RCVBUF_SIZE (256*1024)
  #define SSDP_POLL_INTERVAL (500*MilliSecond)

  typedef BoundedQueue<Candidate> CandidateQueue;
  typedef boost::shared_ptr<CandidateQueue> CandidateQueuePtr;

  class SsdpListener;
  typedef boost::intrusive_ptr<SsdpListener> SsdpListenerPtr;

  /// receives SSDP advertisements on the multicast group(s) and queues them as candidates
  class SsdpListener : public DcObj
  {
    typedef DcObj inherited;

    BindSelector bindSelector;
    CandidateQueuePtr candidates;
    boost::atomic<bool> stopRequested;
    boost::thread_group listenThreads;

  public:

    /// @param aBindSelector selects address families and interfaces
    /// @param aCandidates queue to put received advertisements into
    SsdpListener(const BindSelector &aBindSelector, CandidateQueuePtr aCandidates);
    virtual ~SsdpListener();

    /// open the multicast socket(s) and start one listener thread per address family
    /// @return error only if no address family could be started at all
    /// @note failure to open one address family is logged, the other family is started anyway
    ErrorPtr start();

    /// stop listening, waits for the listener threads to terminate
    void stop();

    /// process a received datagram
    /// @param aDatagram the datagram
    /// @return true if the datagram was a valid advertisement and has been queued
    bool handleDatagram(const string &aDatagram);

  protected:

    /// open the receiving socket for one address family
    /// @param aFamily AF_INET or AF_INET6
    /// @param aSocket will receive the open socket
    /// @return error if the family cannot be listened on
    virtual ErrorPtr openFamily(int aFamily, UdpCommPtr &aSocket);

  private:

    void listenThread(UdpCommPtr aSocket, int aFamily);

  };

} // namespace dlnacast


#endif /* defined(__dlnacast__ssdplistener__) */
