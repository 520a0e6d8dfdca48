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

#include "ssdp.hpp"

#include <ctype.h>
#include <string.h>

using namespace dlnacast;


// M-SEARCH response
//  HTTP/1.1 200 OK
//  CACHE-CONTROL: max-age=100
//  EXT:
//  LOCATION: http://192.168.59.107:80/description.xml
//  SERVER: FreeRTOS/6.0.5, UPnP/1.0, IpBridge/0.1
//  ST: urn:schemas-upnp-org:device:basic:1
//  USN: uuid:2f402f80-da50-11e1-9b23-0017880979ae

// NOTIFY request
//  NOTIFY * HTTP/1.1
//  HOST: 239.255.255.250:1900
//  CACHE-CONTROL: max-age=1800
//  LOCATION: http://192.168.1.20:49152/description.xml
//  NT: urn:schemas-upnp-org:service:AVTransport:1
//  NTS: ssdp:alive
//  USN: uuid:4d696e69-444c-164e-9d41-b827eb3a2f4c::urn:schemas-upnp-org:service:AVTransport:1


#pragma mark - packet parsing

// "HTTP/1.x" with a single digit minor version
static bool isHttp1Version(const char *aText, size_t aLen)
{
  return aLen==8 && strncmp(aText, "HTTP/1.", 7)==0 && isdigit((unsigned char)aText[7]);
}


// status line: HTTP/1.x <3 digit code> [reason]
static bool parseStatusLine(const string &aLine, int &aStatusCode)
{
  size_t sp = aLine.find(' ');
  if (sp==string::npos || !isHttp1Version(aLine.c_str(), sp)) return false;
  const char *p = aLine.c_str()+sp+1;
  int code = 0;
  int digits = 0;
  while (isdigit((unsigned char)*p)) {
    code = code*10 + (*p-'0');
    digits++;
    p++;
  }
  if (digits!=3 || (*p!=0 && *p!=' ')) return false;
  aStatusCode = code;
  return true;
}


// request line: <METHOD> <uri> HTTP/1.x
static bool parseRequestLine(const string &aLine, string &aMethod, string &aURI)
{
  size_t sp1 = aLine.find(' ');
  if (sp1==string::npos || sp1==0) return false;
  size_t sp2 = aLine.find(' ', sp1+1);
  if (sp2==string::npos || sp2==sp1+1) return false;
  if (!isHttp1Version(aLine.c_str()+sp2+1, aLine.size()-sp2-1)) return false;
  // method must be a token
  for (size_t i=0; i<sp1; i++) {
    char c = aLine[i];
    if (!isalnum((unsigned char)c) && c!='-' && c!='_') return false;
  }
  aMethod = aLine.substr(0, sp1);
  aURI = aLine.substr(sp1+1, sp2-sp1-1);
  return true;
}


// header lines up to the empty line (or end of datagram)
static ErrorPtr parseHeaders(const char *aCursor, SsdpPacket &aPacket)
{
  string line;
  bool usnFound = false;
  bool locFound = false;
  bool serverFound = false;
  while (nextLine(aCursor, line)) {
    if (line.empty()) break; // end of headers
    if (line[0]==' ' || line[0]=='\t') continue; // folded continuation, not used for the headers we need
    string key, value;
    if (!keyAndValue(line, key, value)) {
      return ErrorPtr(new SsdpError(SsdpErrorInvalidPacket, string_format("malformed header line '%s'", line.c_str())));
    }
    key = upperCase(key);
    value = trimWhiteSpace(value);
    // first occurrence counts
    if (key=="USN" && !usnFound) {
      aPacket.usn = value;
      usnFound = true;
    }
    else if (key=="LOCATION" && !locFound) {
      aPacket.location = value;
      locFound = true;
    }
    else if (key=="SERVER" && !serverFound) {
      aPacket.server = value;
      serverFound = true;
    }
  }
  if (aPacket.usn.empty() || aPacket.location.empty()) {
    return ErrorPtr(new SsdpError(SsdpErrorMissingHeader, "USN or LOCATION missing"));
  }
  return ErrorPtr();
}


ErrorPtr dlnacast::parseSsdpPacket(const string &aDatagram, SsdpPacket &aPacket)
{
  aPacket.isResponse = false;
  aPacket.statusCode = 0;
  aPacket.method.clear();
  aPacket.uri.clear();
  aPacket.usn.clear();
  aPacket.location.clear();
  aPacket.server.clear();
  const char *p = aDatagram.c_str();
  string startLine;
  if (!nextLine(p, startLine)) {
    return ErrorPtr(new SsdpError(SsdpErrorInvalidPacket, "empty datagram"));
  }
  // first attempt: response framing (answer to our M-SEARCH)
  if (parseStatusLine(startLine, aPacket.statusCode)) {
    aPacket.isResponse = true;
    return parseHeaders(p, aPacket);
  }
  // second attempt: request framing (NOTIFY, or other controller's M-SEARCH)
  if (parseRequestLine(startLine, aPacket.method, aPacket.uri)) {
    return parseHeaders(p, aPacket);
  }
  return ErrorPtr(new SsdpError(SsdpErrorInvalidPacket, string_format("not a HTTP start line: '%.40s'", startLine.c_str())));
}


string dlnacast::uuidFromUSN(const string &aUSN)
{
  size_t i = aUSN.find("::");
  if (i!=string::npos)
    return aUSN.substr(0,i);
  return aUSN;
}


#pragma mark - search message


const char *dlnacast::ssdpGroup(int aFamily)
{
  return aFamily==AF_INET6 ? SSDP_GROUP_V6 : SSDP_GROUP_V4;
}


string dlnacast::ssdpSearchMessage(int aFamily)
{
  string host;
  if (aFamily==AF_INET6)
    host = string_format("[%s]:%d", SSDP_GROUP_V6, SSDP_PORT);
  else
    host = string_format("%s:%d", SSDP_GROUP_V4, SSDP_PORT);
  return string_format(
    "M-SEARCH * HTTP/1.1\r\n"
    "HOST: %s\r\n"
    "MAN: \"ssdp:discover\"\r\n"
    "MX: %d\r\n"
    "ST: ssdp:all\r\n"
    "\r\n",
    host.c_str(),
    SSDP_MX
  );
}


#pragma mark - BindSelector


BindSelector::BindSelector() :
  mode(BindAll)
{
  memset(&address, 0, sizeof(address));
}


BindSelector BindSelector::parse(const string &aSelector)
{
  BindSelector b;
  b.selector = trimWhiteSpace(aSelector);
  if (b.selector.empty() || b.selector=="all" || b.selector=="0.0.0.0") {
    b.mode = BindAll;
  }
  else if (parseAddressLiteral(b.selector, b.address)) {
    b.mode = BindAddress;
  }
  else {
    b.mode = BindInterface;
  }
  return b;
}


bool BindSelector::usesFamily(int aFamily) const
{
  if (mode==BindAddress) return address.ss_family==aFamily;
  return aFamily==AF_INET || aFamily==AF_INET6;
}


bool BindSelector::matches(const NetIfAddress &aIfAddr) const
{
  if (!usesFamily(aIfAddr.family)) return false;
  switch (mode) {
    case BindAddress:
      // "::" means all IPv6 addresses
      return isUnspecifiedAddress(address) || sameHostAddress(address, aIfAddr.addr);
    case BindInterface:
      return aIfAddr.ifName==selector;
    default:
      return true;
  }
}


ErrorPtr BindSelector::eligibleAddresses(int aFamily, NetIfAddressVector &aAddresses) const
{
  aAddresses.clear();
  if (!usesFamily(aFamily)) {
    return ErrorPtr(new SsdpError(SsdpErrorNoInterface, string_format("'%s' does not select IPv%d", selector.c_str(), aFamily==AF_INET6 ? 6 : 4)));
  }
  NetIfAddressVector all;
  ErrorPtr err = getMulticastAddresses(all, mode==BindInterface ? selector : "");
  if (!Error::isOK(err)) return err;
  for (NetIfAddressVector::iterator pos = all.begin(); pos!=all.end(); ++pos) {
    if (pos->family==aFamily && matches(*pos)) {
      aAddresses.push_back(*pos);
    }
  }
  if (aAddresses.empty()) {
    return ErrorPtr(new SsdpError(SsdpErrorNoInterface, string_format("no usable IPv%d interface address for '%s'", aFamily==AF_INET6 ? 6 : 4, selector.c_str())));
  }
  return ErrorPtr();
}
