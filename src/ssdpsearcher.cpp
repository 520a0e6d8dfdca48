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

// File scope debugging options
// - Set ALWAYS_DEBUG to 1 to enable DBGLOG output even in non-DEBUG builds of this file
#define ALWAYS_DEBUG 0
// - set FOCUSLOGLEVEL to non-zero log level (usually, 5,6, or 7==LOG_DEBUG) to get focus (extensive logging) for this file
//   Note: must be before including "logger.hpp" (or anything that includes "logger.hpp")
#define FOCUSLOGLEVEL 0

#include "ssdpsearcher.hpp"

using namespace dlnacast;

typedef boost::unique_lock<boost::mutex> Lock;

#define SSDP_RESPONSE_TIME ((SSDP_MX+1)*Second) // devices answer within MX seconds
#define SSDP_RESPONSE_SLICE (50*MilliSecond)


SsdpSearcher::SsdpSearcher(const BindSelector &aBindSelector, MLMicroSeconds aInterval) :
  bindSelector(aBindSelector),
  interval(aInterval),
  triggered(false),
  stopRequested(false)
{
}


SsdpSearcher::~SsdpSearcher()
{
  stop();
}


void SsdpSearcher::setResponseHandler(SsdpResponseCB aResponseHandler)
{
  responseHandler = aResponseHandler;
}


void SsdpSearcher::start()
{
  Lock lock(stateMutex);
  if (searchThread) return; // already running
  stopRequested = false;
  searchThread.reset(new boost::thread(boost::bind(&SsdpSearcher::searchThreadRoutine, this)));
}


void SsdpSearcher::stop()
{
  {
    Lock lock(stateMutex);
    stopRequested = true;
    wakeUp.notify_all();
  }
  if (searchThread) {
    searchThread->join();
    searchThread.reset();
  }
}


void SsdpSearcher::trigger()
{
  Lock lock(stateMutex);
  triggered = true;
  wakeUp.notify_all();
}


bool SsdpSearcher::isStopping()
{
  Lock lock(stateMutex);
  return stopRequested;
}


void SsdpSearcher::searchThreadRoutine()
{
  Lock lock(stateMutex);
  MLMicroSeconds nextSearch = monotonicTime(); // first search right away
  while (!stopRequested) {
    MLMicroSeconds now = monotonicTime();
    if (triggered || now>=nextSearch) {
      triggered = false;
      if (now>=nextSearch) {
        // periodic search, keep the period fixed unless we are late
        nextSearch += interval;
        if (nextSearch<=now) nextSearch = now+interval;
      }
      lock.unlock();
      search(responseHandler ? SSDP_RESPONSE_TIME : 0);
      lock.lock();
      continue;
    }
    wakeUp.wait_for(lock, chronoDuration(nextSearch-now));
  }
}


ErrorPtr SsdpSearcher::searchAddresses(int aFamily, NetIfAddressVector &aAddresses)
{
  return bindSelector.eligibleAddresses(aFamily, aAddresses);
}


ErrorPtr SsdpSearcher::sendSearch(const NetIfAddress &aAddr, const string &aMessage, UdpCommPtr &aSocket)
{
  aSocket = UdpCommPtr(new UdpComm);
  ErrorPtr err = aSocket->openSender(aAddr.addr, aAddr.ifIndex);
  if (!Error::isOK(err)) return err;
  return aSocket->sendTo(aMessage, ssdpGroup(aAddr.family), SSDP_PORT, aAddr.ifIndex);
}


int SsdpSearcher::search(MLMicroSeconds aResponseTime)
{
  int sent = 0;
  vector<UdpCommPtr> sockets;
  const int families[2] = { AF_INET, AF_INET6 };
  for (int i=0; i<2; i++) {
    int family = families[i];
    if (!bindSelector.usesFamily(family)) continue;
    NetIfAddressVector addrs;
    ErrorPtr err = searchAddresses(family, addrs);
    if (!Error::isOK(err)) {
      LOG(LOG_INFO, "SSDP search: %s\n", err->description().c_str());
      continue;
    }
    string msg = ssdpSearchMessage(family);
    for (NetIfAddressVector::iterator pos = addrs.begin(); pos!=addrs.end(); ++pos) {
      UdpCommPtr sock;
      err = sendSearch(*pos, msg, sock);
      if (!Error::isOK(err)) {
        // other addresses might still work
        LOG(LOG_WARNING, "SSDP search: sending M-SEARCH from %s (%s) failed: %s\n", pos->addrString.c_str(), pos->ifName.c_str(), err->description().c_str());
        continue;
      }
      FOCUSLOG("SSDP search: sent M-SEARCH from %s port %hu (%s)\n", pos->addrString.c_str(), sock->localPort(), pos->ifName.c_str());
      sent++;
      sockets.push_back(sock);
    }
  }
  // collect unicast responses
  if (aResponseTime>0 && !sockets.empty() && responseHandler) {
    MLMicroSeconds until = monotonicTime()+aResponseTime;
    MLMicroSeconds slice = SSDP_RESPONSE_SLICE/(MLMicroSeconds)sockets.size();
    if (slice<5*MilliSecond) slice = 5*MilliSecond;
    string datagram;
    size_t openSockets = sockets.size();
    while (openSockets>0 && monotonicTime()<until && !isStopping()) {
      for (vector<UdpCommPtr>::iterator pos = sockets.begin(); pos!=sockets.end(); ++pos) {
        if (!(*pos)->isOpen()) continue;
        ErrorPtr err = (*pos)->receive(datagram, SSDP_MAX_DATAGRAM, slice);
        if (!Error::isOK(err)) {
          LOG(LOG_INFO, "SSDP search: receiving responses failed: %s\n", err->description().c_str());
          (*pos)->closeSocket();
          openSockets--;
          continue;
        }
        if (!datagram.empty()) {
          responseHandler(datagram);
        }
      }
    }
  }
  return sent;
}
