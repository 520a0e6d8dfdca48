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

#include "netif.hpp"

#include <string.h>
#include <net/if.h>
#include <ifaddrs.h>
#include <netdb.h>
#include <arpa/inet.h>

using namespace dlnacast;


ErrorPtr dlnacast::getMulticastAddresses(NetIfAddressVector &aAddresses, const string &aIfName)
{
  struct ifaddrs *interfaces = NULL;

  aAddresses.clear();
  // retrieve the current interfaces - returns 0 on success
  if (getifaddrs(&interfaces)!=0) {
    return SysError::errNo("Cannot enumerate network interfaces: ");
  }
  // Loop through linked list of interfaces
  for (struct ifaddrs *ifa = interfaces; ifa!=NULL; ifa = ifa->ifa_next) {
    if (!ifa->ifa_addr) continue; // no address
    int family = ifa->ifa_addr->sa_family;
    if (family!=AF_INET && family!=AF_INET6) continue;
    // must be up and multicast capable, but not loopback
    if ((ifa->ifa_flags & IFF_UP)==0) continue;
    if ((ifa->ifa_flags & IFF_MULTICAST)==0) continue;
    if ((ifa->ifa_flags & IFF_LOOPBACK)!=0) continue;
    if (!aIfName.empty() && aIfName!=ifa->ifa_name) continue;
    NetIfAddress a;
    a.ifName = ifa->ifa_name;
    a.ifIndex = if_nametoindex(ifa->ifa_name);
    a.family = family;
    memset(&a.addr, 0, sizeof(a.addr));
    memcpy(&a.addr, ifa->ifa_addr, family==AF_INET ? sizeof(struct sockaddr_in) : sizeof(struct sockaddr_in6));
    a.addrString = addressString(ifa->ifa_addr);
    aAddresses.push_back(a);
  }
  // Free memory
  freeifaddrs(interfaces);
  return ErrorPtr();
}


unsigned int dlnacast::interfaceIndex(const string &aIfName)
{
  return if_nametoindex(aIfName.c_str());
}


bool dlnacast::parseAddressLiteral(const string &aLiteral, struct sockaddr_storage &aAddr)
{
  struct addrinfo hint;
  struct addrinfo *res = NULL;
  memset(&hint, 0, sizeof(hint));
  hint.ai_flags = AI_NUMERICHOST;
  hint.ai_family = AF_UNSPEC;
  hint.ai_socktype = SOCK_DGRAM;
  if (aLiteral.empty() || getaddrinfo(aLiteral.c_str(), NULL, &hint, &res)!=0 || !res) {
    return false;
  }
  memset(&aAddr, 0, sizeof(aAddr));
  memcpy(&aAddr, res->ai_addr, res->ai_addrlen);
  freeaddrinfo(res);
  return true;
}


string dlnacast::addressString(const struct sockaddr *aAddr)
{
  char hbuf[NI_MAXHOST];
  socklen_t len = aAddr->sa_family==AF_INET6 ? sizeof(struct sockaddr_in6) : sizeof(struct sockaddr_in);
  if (getnameinfo(aAddr, len, hbuf, sizeof(hbuf), NULL, 0, NI_NUMERICHOST)!=0) {
    return "<unknown>";
  }
  return hbuf;
}


bool dlnacast::sameHostAddress(const struct sockaddr_storage &aAddr1, const struct sockaddr_storage &aAddr2)
{
  if (aAddr1.ss_family!=aAddr2.ss_family) return false;
  if (aAddr1.ss_family==AF_INET6) {
    return memcmp(
      &((const struct sockaddr_in6 *)&aAddr1)->sin6_addr,
      &((const struct sockaddr_in6 *)&aAddr2)->sin6_addr,
      sizeof(struct in6_addr)
    )==0;
  }
  return ((const struct sockaddr_in *)&aAddr1)->sin_addr.s_addr==((const struct sockaddr_in *)&aAddr2)->sin_addr.s_addr;
}


bool dlnacast::isUnspecifiedAddress(const struct sockaddr_storage &aAddr)
{
  if (aAddr.ss_family==AF_INET6) {
    return IN6_IS_ADDR_UNSPECIFIED(&((const struct sockaddr_in6 *)&aAddr)->sin6_addr);
  }
  return ((const struct sockaddr_in *)&aAddr)->sin_addr.s_addr==htonl(INADDR_ANY);
}
