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

#include "ssdplistener.hpp"

using namespace dlnacast;


SsdpListener::SsdpListener(const BindSelector &aBindSelector, CandidateQueuePtr aCandidates) :
  bindSelector(aBindSelector),
  candidates(aCandidates),
  stopRequested(false)
{
}


SsdpListener::~SsdpListener()
{
  stop();
}


ErrorPtr SsdpListener::openFamily(int aFamily, UdpCommPtr &aSocket)
{
  string ifName;
  const struct sockaddr_storage *ifAddr = NULL;
  NetIfAddressVector addrs;
  if (bindSelector.mode==BindInterface) {
    ifName = bindSelector.selector;
  }
  else if (bindSelector.mode==BindAddress && !isUnspecifiedAddress(bindSelector.address)) {
    // join on the interface owning the address
    ErrorPtr err = bindSelector.eligibleAddresses(aFamily, addrs);
    if (!Error::isOK(err)) return err;
    ifName = addrs[0].ifName;
    ifAddr = &addrs[0].addr;
  }
  aSocket = UdpCommPtr(new UdpComm);
  return aSocket->openMulticastReceiver(aFamily, ssdpGroup(aFamily), SSDP_PORT, ifName, ifAddr, SSDP_RCVBUF_SIZE);
}


ErrorPtr SsdpListener::start()
{
  ErrorPtr err;
  int started = 0;
  stopRequested = false;
  const int families[2] = { AF_INET, AF_INET6 };
  for (int i=0; i<2; i++) {
    int family = families[i];
    if (!bindSelector.usesFamily(family)) continue;
    UdpCommPtr sock;
    ErrorPtr ferr = openFamily(family, sock);
    if (!Error::isOK(ferr)) {
      LOG(LOG_ERR, "SSDP listener: cannot listen on IPv%d for '%s': %s\n", family==AF_INET6 ? 6 : 4, bindSelector.selector.c_str(), ferr->description().c_str());
      err = ferr;
      continue;
    }
    LOG(LOG_NOTICE, "SSDP listener: listening on %s port %d\n", ssdpGroup(family), SSDP_PORT);
    listenThreads.create_thread(boost::bind(&SsdpListener::listenThread, this, sock, family));
    started++;
  }
  if (started>0) return ErrorPtr();
  if (Error::isOK(err)) {
    err = ErrorPtr(new SsdpError(SsdpErrorNoInterface, string_format("'%s' selects no address family", bindSelector.selector.c_str())));
  }
  return err;
}


void SsdpListener::stop()
{
  stopRequested = true;
  listenThreads.join_all();
}


void SsdpListener::listenThread(UdpCommPtr aSocket, int aFamily)
{
  string datagram;
  while (!stopRequested) {
    ErrorPtr err = aSocket->receive(datagram, SSDP_MAX_DATAGRAM, SSDP_POLL_INTERVAL);
    if (!Error::isOK(err)) {
      LOG(LOG_ERR, "SSDP listener: IPv%d socket failed, listener ends: %s\n", aFamily==AF_INET6 ? 6 : 4, err->description().c_str());
      break;
    }
    if (datagram.empty()) continue; // poll timeout, check for stop
    handleDatagram(datagram);
  }
  aSocket->closeSocket();
}


bool SsdpListener::handleDatagram(const string &aDatagram)
{
  SsdpPacket packet;
  ErrorPtr err = parseSsdpPacket(aDatagram, packet);
  if (!Error::isOK(err)) {
    LOG(LOG_DEBUG, "SSDP listener: ignored datagram: %s\n", err->description().c_str());
    return false;
  }
  Candidate c;
  c.uuid = uuidFromUSN(packet.usn);
  c.location = packet.location;
  c.server = packet.server;
  c.seen = unixTime();
  FOCUSLOG("SSDP listener: %s from %s: %s\n", packet.isResponse ? "response" : packet.method.c_str(), c.location.c_str(), c.uuid.c_str());
  if (!candidates->trySend(c)) {
    LOG(LOG_DEBUG, "SSDP listener: candidate queue full, dropped advertisement of %s\n", c.uuid.c_str());
    return false;
  }
  return true;
}
