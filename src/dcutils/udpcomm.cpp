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

#include "udpcomm.hpp"

#include <string.h>
#include <unistd.h>
#include <poll.h>
#include <arpa/inet.h>

using namespace dlnacast;


UdpComm::UdpComm() :
  socketFD(-1),
  protocolFamily(AF_UNSPEC)
{
}


UdpComm::~UdpComm()
{
  closeSocket();
}


void UdpComm::closeSocket()
{
  if (socketFD>=0) {
    close(socketFD);
    socketFD = -1;
  }
}


ErrorPtr UdpComm::createSocket(int aFamily)
{
  closeSocket();
  protocolFamily = aFamily;
  socketFD = socket(aFamily, SOCK_DGRAM, IPPROTO_UDP);
  if (socketFD<0) {
    return SysError::errNo("Cannot create UDP socket: ");
  }
  return ErrorPtr();
}


static socklen_t sockaddrLen(const struct sockaddr_storage &aAddr)
{
  return aAddr.ss_family==AF_INET6 ? sizeof(struct sockaddr_in6) : sizeof(struct sockaddr_in);
}


static void setSockaddrPort(struct sockaddr_storage &aAddr, uint16_t aPort)
{
  if (aAddr.ss_family==AF_INET6)
    ((struct sockaddr_in6 *)&aAddr)->sin6_port = htons(aPort);
  else
    ((struct sockaddr_in *)&aAddr)->sin_port = htons(aPort);
}


ErrorPtr UdpComm::joinGroup(const struct sockaddr_storage &aGroupAddr, unsigned int aIfIndex, const struct sockaddr_storage *aIfAddr)
{
  if (aGroupAddr.ss_family==AF_INET6) {
    struct ipv6_mreq mreq6;
    memset(&mreq6, 0, sizeof(mreq6));
    mreq6.ipv6mr_multiaddr = ((const struct sockaddr_in6 *)&aGroupAddr)->sin6_addr;
    mreq6.ipv6mr_interface = aIfIndex;
    if (setsockopt(socketFD, IPPROTO_IPV6, IPV6_JOIN_GROUP, &mreq6, sizeof(mreq6))<0) {
      return SysError::errNo("Cannot join IPv6 multicast group: ");
    }
  }
  else {
    struct ip_mreqn mreq;
    memset(&mreq, 0, sizeof(mreq));
    mreq.imr_multiaddr = ((const struct sockaddr_in *)&aGroupAddr)->sin_addr;
    if (aIfAddr && aIfAddr->ss_family==AF_INET)
      mreq.imr_address = ((const struct sockaddr_in *)aIfAddr)->sin_addr;
    else
      mreq.imr_address.s_addr = htonl(INADDR_ANY);
    mreq.imr_ifindex = (int)aIfIndex;
    if (setsockopt(socketFD, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq))<0) {
      return SysError::errNo("Cannot join IPv4 multicast group: ");
    }
  }
  return ErrorPtr();
}


ErrorPtr UdpComm::openMulticastReceiver(int aFamily, const char *aGroup, uint16_t aPort, const string &aIfName, const struct sockaddr_storage *aIfAddr, int aRcvBufSize)
{
  ErrorPtr err;
  struct sockaddr_storage groupAddr;
  if (!parseAddressLiteral(nonNullCStr(aGroup), groupAddr) || groupAddr.ss_family!=aFamily) {
    return ErrorPtr(new UdpCommError(UdpCommErrorInvalidAddress, string_format("invalid multicast group '%s'", nonNullCStr(aGroup))));
  }
  unsigned int ifIndex = 0;
  if (!aIfName.empty()) {
    ifIndex = interfaceIndex(aIfName);
    if (ifIndex==0) {
      return ErrorPtr(new UdpCommError(UdpCommErrorNoInterface, string_format("no network interface named '%s'", aIfName.c_str())));
    }
  }
  err = createSocket(aFamily);
  if (!Error::isOK(err)) return err;
  int one = 1;
  if (setsockopt(socketFD, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one))<0) {
    err = SysError::errNo("Cannot SETSOCKOPT SO_REUSEADDR: ");
    goto done;
  }
  #ifdef SO_REUSEPORT
  // other SSDP stacks on the same host might hold the port as well
  setsockopt(socketFD, SOL_SOCKET, SO_REUSEPORT, &one, sizeof(one));
  #endif
  if (aRcvBufSize>0) {
    if (setsockopt(socketFD, SOL_SOCKET, SO_RCVBUF, &aRcvBufSize, sizeof(aRcvBufSize))<0) {
      LOG(LOG_WARNING, "UdpComm: cannot enlarge receive buffer to %d bytes\n", aRcvBufSize);
    }
  }
  {
    // bind to wildcard address, group port
    struct sockaddr_storage bindAddr;
    memset(&bindAddr, 0, sizeof(bindAddr));
    bindAddr.ss_family = (sa_family_t)aFamily;
    if (aFamily==AF_INET6) {
      // IPv6 socket must not grab the IPv4 port as well
      if (setsockopt(socketFD, IPPROTO_IPV6, IPV6_V6ONLY, &one, sizeof(one))<0) {
        err = SysError::errNo("Cannot SETSOCKOPT IPV6_V6ONLY: ");
        goto done;
      }
      ((struct sockaddr_in6 *)&bindAddr)->sin6_addr = in6addr_any;
    }
    else {
      ((struct sockaddr_in *)&bindAddr)->sin_addr.s_addr = htonl(INADDR_ANY);
    }
    setSockaddrPort(bindAddr, aPort);
    if (::bind(socketFD, (struct sockaddr *)&bindAddr, sockaddrLen(bindAddr))<0) {
      err = SysError::errNo("Cannot bind multicast socket: ");
      goto done;
    }
  }
  // join the group
  if (ifIndex!=0 || aIfAddr) {
    // specific interface
    err = joinGroup(groupAddr, ifIndex, aIfAddr);
  }
  else {
    // all multicast capable interfaces
    NetIfAddressVector addrs;
    set<unsigned int> joined;
    err = getMulticastAddresses(addrs);
    if (Error::isOK(err)) {
      for (NetIfAddressVector::iterator pos = addrs.begin(); pos!=addrs.end(); ++pos) {
        if (pos->family!=aFamily || joined.count(pos->ifIndex)>0) continue;
        ErrorPtr jerr = joinGroup(groupAddr, pos->ifIndex, NULL);
        if (Error::isOK(jerr)) {
          FOCUSLOG("UdpComm: joined %s on interface %s\n", aGroup, pos->ifName.c_str());
          joined.insert(pos->ifIndex);
        }
        else {
          LOG(LOG_INFO, "UdpComm: cannot join %s on interface %s: %s\n", aGroup, pos->ifName.c_str(), jerr->description().c_str());
        }
      }
    }
    if (joined.empty()) {
      // let the kernel choose the default interface
      err = joinGroup(groupAddr, 0, NULL);
    }
    else {
      err.reset();
    }
  }
done:
  if (!Error::isOK(err)) {
    closeSocket();
  }
  return err;
}


ErrorPtr UdpComm::openSender(const struct sockaddr_storage &aLocalAddr, unsigned int aIfIndex, int aHops)
{
  ErrorPtr err = createSocket(aLocalAddr.ss_family);
  if (!Error::isOK(err)) return err;
  struct sockaddr_storage bindAddr = aLocalAddr;
  setSockaddrPort(bindAddr, 0); // ephemeral port
  if (::bind(socketFD, (struct sockaddr *)&bindAddr, sockaddrLen(bindAddr))<0) {
    err = SysError::errNo("Cannot bind send socket: ");
    goto done;
  }
  if (aLocalAddr.ss_family==AF_INET6) {
    if (setsockopt(socketFD, IPPROTO_IPV6, IPV6_MULTICAST_IF, &aIfIndex, sizeof(aIfIndex))<0) {
      err = SysError::errNo("Cannot SETSOCKOPT IPV6_MULTICAST_IF: ");
      goto done;
    }
    setsockopt(socketFD, IPPROTO_IPV6, IPV6_MULTICAST_HOPS, &aHops, sizeof(aHops));
  }
  else {
    struct in_addr ifAddr = ((const struct sockaddr_in *)&aLocalAddr)->sin_addr;
    if (setsockopt(socketFD, IPPROTO_IP, IP_MULTICAST_IF, &ifAddr, sizeof(ifAddr))<0) {
      err = SysError::errNo("Cannot SETSOCKOPT IP_MULTICAST_IF: ");
      goto done;
    }
    unsigned char ttl = (unsigned char)aHops;
    setsockopt(socketFD, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));
  }
done:
  if (!Error::isOK(err)) {
    closeSocket();
  }
  return err;
}


uint16_t UdpComm::localPort()
{
  if (socketFD<0) return 0;
  struct sockaddr_storage addr;
  socklen_t len = sizeof(addr);
  if (getsockname(socketFD, (struct sockaddr *)&addr, &len)<0) return 0;
  if (addr.ss_family==AF_INET6)
    return ntohs(((struct sockaddr_in6 *)&addr)->sin6_port);
  return ntohs(((struct sockaddr_in *)&addr)->sin_port);
}


ErrorPtr UdpComm::sendTo(const string &aData, const char *aHost, uint16_t aPort, unsigned int aIfIndex)
{
  if (socketFD<0) return ErrorPtr(new UdpCommError(UdpCommErrorNotOpen, "socket not open"));
  struct sockaddr_storage dest;
  if (!parseAddressLiteral(nonNullCStr(aHost), dest)) {
    return ErrorPtr(new UdpCommError(UdpCommErrorInvalidAddress, string_format("invalid destination '%s'", nonNullCStr(aHost))));
  }
  setSockaddrPort(dest, aPort);
  if (dest.ss_family==AF_INET6 && aIfIndex!=0) {
    ((struct sockaddr_in6 *)&dest)->sin6_scope_id = aIfIndex;
  }
  ssize_t res = sendto(socketFD, aData.c_str(), aData.size(), 0, (struct sockaddr *)&dest, sockaddrLen(dest));
  if (res<0) {
    return SysError::errNo("Cannot send datagram: ");
  }
  return ErrorPtr();
}


ErrorPtr UdpComm::receive(string &aData, size_t aMaxSize, MLMicroSeconds aTimeout, string *aFromAddr)
{
  aData.clear();
  if (socketFD<0) return ErrorPtr(new UdpCommError(UdpCommErrorNotOpen, "socket not open"));
  struct pollfd pfd;
  pfd.fd = socketFD;
  pfd.events = POLLIN;
  pfd.revents = 0;
  int res = poll(&pfd, 1, aTimeout==Infinite ? -1 : (int)(aTimeout/MilliSecond));
  if (res<0) {
    if (errno==EINTR) return ErrorPtr(); // interrupted, just no data
    return SysError::errNo("poll failed: ");
  }
  if (res==0) return ErrorPtr(); // timeout, no data
  if (pfd.revents & (POLLERR|POLLNVAL)) {
    return ErrorPtr(new UdpCommError(UdpCommErrorNotOpen, "socket reported error"));
  }
  vector<char> buffer(aMaxSize);
  struct sockaddr_storage from;
  socklen_t fromLen = sizeof(from);
  ssize_t n = recvfrom(socketFD, &buffer[0], aMaxSize, 0, (struct sockaddr *)&from, &fromLen);
  if (n<0) {
    if (errno==EINTR || errno==EAGAIN) return ErrorPtr();
    return SysError::errNo("Cannot receive datagram: ");
  }
  aData.assign(&buffer[0], (size_t)n);
  if (aFromAddr) *aFromAddr = addressString((struct sockaddr *)&from);
  return ErrorPtr();
}
