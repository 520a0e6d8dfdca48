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

#ifndef __dlnacast__ssdp__
#define __dlnacast__ssdp__

#include "dc_common.hpp"
#include "netif.hpp"

using namespace std;

namespace dlnacast {

  #define SSDP_PORT 1900
  #define SSDP_GROUP_V4 "239.255.255.250"
  #define SSDP_GROUP_V6 "ff02::c"
  #define SSDP_MAX_DATAGRAM 4096 // datagram read buffer size
  #define SSDP_MX 1 // seconds devices may delay their search response

  // Errors
  typedef enum {
    SsdpErrorOK,
    SsdpErrorInvalidPacket, ///< datagram is neither a HTTP response nor a HTTP request
    SsdpErrorMissingHeader, ///< USN or LOCATION missing
    SsdpErrorNoInterface, ///< bind selector does not match any usable interface
  } SsdpErrors;

  class SsdpError : public Error
  {
  public:
    static const char *domain() { return "Ssdp"; }
    virtual const char *getErrorDomain() const { return SsdpError::domain(); };
    SsdpError(SsdpErrors aError) : Error(ErrorCode(aError)) {};
    SsdpError(SsdpErrors aError, std::string aErrorMessage) : Error(ErrorCode(aError), aErrorMessage) {};
  };


  /// the parts of a SSDP datagram we are interested in
  typedef struct {
    bool isResponse; ///< set if datagram was a HTTP response (search answer), otherwise it was a request (NOTIFY, M-SEARCH)
    int statusCode; ///< for responses: the HTTP status
    string method; ///< for requests: the method
    string uri; ///< for requests: the request URI
    string usn; ///< USN header
    string location; ///< LOCATION header
    string server; ///< SERVER header, empty if none
  } SsdpPacket;


  /// parse a SSDP datagram
  /// @param aDatagram the raw datagram
  /// @param aPacket will receive the parsed packet
  /// @return OK if datagram could be parsed as HTTP response or request and has USN and LOCATION headers
  /// @note HTTP response framing is tried first, then HTTP request framing. Header names are case insensitive.
  ErrorPtr parseSsdpPacket(const string &aDatagram, SsdpPacket &aPacket);

  /// get the device identity from an USN
  /// @param aUSN unique service name like "uuid:abcd::urn:schemas-upnp-org:service:AVTransport:1"
  /// @return the USN up to the first "::", i.e. "uuid:abcd"
  string uuidFromUSN(const string &aUSN);

  /// @param aFamily AF_INET or AF_INET6
  /// @return numeric SSDP multicast group address for the family
  const char *ssdpGroup(int aFamily);

  /// @param aFamily AF_INET or AF_INET6
  /// @return the M-SEARCH datagram searching for all devices via the family's group
  string ssdpSearchMessage(int aFamily);


  typedef enum {
    BindAll, ///< all interfaces, both address families
    BindAddress, ///< one local address, its address family only
    BindInterface, ///< one named interface, both address families
  } BindMode;

  /// selects the interfaces and address families used for SSDP
  class BindSelector
  {
  public:
    BindMode mode;
    string selector; ///< the selector as specified
    struct sockaddr_storage address; ///< for BindAddress: the address

    BindSelector();

    /// parse a selector
    /// @param aSelector "all", "" or "0.0.0.0" for all interfaces, an IPv4 or IPv6 literal, or an interface name
    /// @note whether a named interface exists is only checked when it is used
    static BindSelector parse(const string &aSelector);

    /// @return true if the given address family is in use with this selector
    bool usesFamily(int aFamily) const;

    /// @return true if the given local interface address is eligible with this selector
    bool matches(const NetIfAddress &aIfAddr) const;

    /// get the eligible local interface addresses of a family
    /// @param aFamily AF_INET or AF_INET6
    /// @param aAddresses will receive the matching addresses
    /// @return error if interfaces cannot be enumerated or no address matches the selector
    ErrorPtr eligibleAddresses(int aFamily, NetIfAddressVector &aAddresses) const;
  };

} // namespace dlnacast


#endif /* defined(__dlnacast__ssdp__) */
