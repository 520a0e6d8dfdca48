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

#ifndef __dlnacast__netif__
#define __dlnacast__netif__

#include "dc_common.hpp"

#include <sys/socket.h>
#include <netinet/in.h>

using namespace std;

namespace dlnacast {

  /// one address of a local network interface
  typedef struct {
    string ifName; ///< interface name, like "eth0"
    unsigned int ifIndex; ///< interface index (for IPv6 scope and multicast interface selection)
    int family; ///< AF_INET or AF_INET6
    struct sockaddr_storage addr; ///< the address, port is 0
    string addrString; ///< numeric representation of the address
  } NetIfAddress;

  typedef vector<NetIfAddress> NetIfAddressVector;


  /// get addresses of local interfaces usable for multicasting
  /// @param aAddresses will receive the addresses of all interfaces which are up, multicast capable and not loopback
  /// @param aIfName if not empty, only addresses of the interface with this name are returned
  /// @return error if interfaces could not be enumerated
  ErrorPtr getMulticastAddresses(NetIfAddressVector &aAddresses, const string &aIfName = "");

  /// get the index of a network interface
  /// @param aIfName interface name
  /// @return interface index, 0 if no such interface exists
  unsigned int interfaceIndex(const string &aIfName);

  /// parse a numeric IPv4 or IPv6 address literal
  /// @param aLiteral address like "192.168.1.2" or "fe80::1" (optionally with %scope)
  /// @param aAddr will receive the address, port set to 0
  /// @return true if aLiteral is a valid numeric address
  bool parseAddressLiteral(const string &aLiteral, struct sockaddr_storage &aAddr);

  /// get numeric string representation of an address
  string addressString(const struct sockaddr *aAddr);

  /// compare the host part of two addresses (port and IPv6 scope are ignored)
  /// @return true if both addresses are of the same family and have the same host address
  bool sameHostAddress(const struct sockaddr_storage &aAddr1, const struct sockaddr_storage &aAddr2);

  /// check for wildcard address
  /// @return true if aAddr is 0.0.0.0 or ::
  bool isUnspecifiedAddress(const struct sockaddr_storage &aAddr);

} // namespace dlnacast


#endif /* defined(__dlnacast__netif__) */
