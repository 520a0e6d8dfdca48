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

#include <gtest/gtest.h>

#include "ssdp.hpp"
#include "ssdplistener.hpp"
#include "ssdpsearcher.hpp"

#include <arpa/inet.h>

using namespace dlnacast;


static const char *searchResponse =
  "HTTP/1.1 200 OK\r\n"
  "CACHE-CONTROL: max-age=1800\r\n"
  "EXT:\r\n"
  "LOCATION: http://192.168.1.20:49152/description.xml\r\n"
  "SERVER: Linux/5.10 UPnP/1.0 UnPlay/1.2\r\n"
  "ST: urn:schemas-upnp-org:service:AVTransport:1\r\n"
  "USN: uuid:4d696e69-444c-164e-9d41-b827eb3a2f4c::urn:schemas-upnp-org:service:AVTransport:1\r\n"
  "\r\n";

static const char *notifyRequest =
  "NOTIFY * HTTP/1.1\r\n"
  "HOST: 239.255.255.250:1900\r\n"
  "CACHE-CONTROL: max-age=1800\r\n"
  "location: http://192.168.1.21:8080/dmr.xml\r\n"
  "NT: upnp:rootdevice\r\n"
  "NTS: ssdp:alive\r\n"
  "usn: uuid:abcd-1234::upnp:rootdevice\r\n"
  "\r\n";


TEST(SsdpPacket, ResponseFraming)
{
  SsdpPacket p;
  ErrorPtr err = parseSsdpPacket(searchResponse, p);
  ASSERT_TRUE(Error::isOK(err));
  EXPECT_TRUE(p.isResponse);
  EXPECT_EQ(200, p.statusCode);
  EXPECT_EQ("http://192.168.1.20:49152/description.xml", p.location);
  EXPECT_EQ("Linux/5.10 UPnP/1.0 UnPlay/1.2", p.server);
  EXPECT_EQ("uuid:4d696e69-444c-164e-9d41-b827eb3a2f4c::urn:schemas-upnp-org:service:AVTransport:1", p.usn);
}


TEST(SsdpPacket, RequestFramingCaseInsensitiveHeaders)
{
  SsdpPacket p;
  ErrorPtr err = parseSsdpPacket(notifyRequest, p);
  ASSERT_TRUE(Error::isOK(err));
  EXPECT_FALSE(p.isResponse);
  EXPECT_EQ("NOTIFY", p.method);
  EXPECT_EQ("*", p.uri);
  EXPECT_EQ("http://192.168.1.21:8080/dmr.xml", p.location);
  EXPECT_EQ("uuid:abcd-1234::upnp:rootdevice", p.usn);
  EXPECT_EQ("", p.server);
}


TEST(SsdpPacket, LenientLineEndsAndFirstHeaderWins)
{
  SsdpPacket p;
  // LF only, no terminating empty line, duplicate LOCATION
  ErrorPtr err = parseSsdpPacket(
    "HTTP/1.0 200 OK\n"
    "Location:   http://10.0.0.5/a.xml  \n"
    "LOCATION: http://10.0.0.5/b.xml\n"
    "Usn: uuid:x",
    p
  );
  ASSERT_TRUE(Error::isOK(err));
  EXPECT_EQ("http://10.0.0.5/a.xml", p.location);
  EXPECT_EQ("uuid:x", p.usn);
}


TEST(SsdpPacket, MissingHeaders)
{
  SsdpPacket p;
  ErrorPtr err = parseSsdpPacket("HTTP/1.1 200 OK\r\nUSN: uuid:x\r\n\r\n", p);
  ASSERT_FALSE(Error::isOK(err));
  EXPECT_TRUE(err->isDomain(SsdpError::domain()));
  EXPECT_EQ(SsdpErrorMissingHeader, err->getErrorCode());

  err = parseSsdpPacket("NOTIFY * HTTP/1.1\r\nLOCATION: http://x/\r\n\r\n", p);
  ASSERT_FALSE(Error::isOK(err));
  EXPECT_EQ(SsdpErrorMissingHeader, err->getErrorCode());

  // headers after the empty line do not count
  err = parseSsdpPacket("HTTP/1.1 200 OK\r\nUSN: uuid:x\r\n\r\nLOCATION: http://x/\r\n", p);
  ASSERT_FALSE(Error::isOK(err));
  EXPECT_EQ(SsdpErrorMissingHeader, err->getErrorCode());
}


TEST(SsdpPacket, Garbage)
{
  SsdpPacket p;
  const char *bad[] = {
    "",
    "hello world",
    "HTTP/2 200 OK\r\nUSN: uuid:x\r\nLOCATION: http://x/\r\n\r\n",
    "HTTP/1.1 20 OK\r\nUSN: uuid:x\r\nLOCATION: http://x/\r\n\r\n",
    "NOTIFY * FTP/1.1\r\nUSN: uuid:x\r\nLOCATION: http://x/\r\n\r\n",
    "NOTIFY *\r\nUSN: uuid:x\r\nLOCATION: http://x/\r\n\r\n",
    "HTTP/1.1 200 OK\r\nthis is no header\r\n\r\n",
    // bytes above 0x7F where digits or token characters are expected
    "HTTP/1.\xb9 200 OK\r\nUSN: uuid:x\r\nLOCATION: http://x/\r\n\r\n",
    "HTTP/1.1 2\xb9" "0 OK\r\nUSN: uuid:x\r\nLOCATION: http://x/\r\n\r\n",
    "NOT\xc3\xa9" "FY * HTTP/1.1\r\nUSN: uuid:x\r\nLOCATION: http://x/\r\n\r\n",
    NULL
  };
  for (const char **d = bad; *d; ++d) {
    ErrorPtr err = parseSsdpPacket(*d, p);
    EXPECT_FALSE(Error::isOK(err)) << "accepted: " << *d;
  }
}


TEST(SsdpPacket, UuidFromUSN)
{
  EXPECT_EQ("uuid:abcd", uuidFromUSN("uuid:abcd::urn:schemas-upnp-org:service:AVTransport:1"));
  EXPECT_EQ("uuid:abcd", uuidFromUSN("uuid:abcd::upnp:rootdevice"));
  EXPECT_EQ("uuid:abcd", uuidFromUSN("uuid:abcd"));
}


TEST(SsdpSearch, MessageLiterals)
{
  EXPECT_EQ(
    "M-SEARCH * HTTP/1.1\r\n"
    "HOST: 239.255.255.250:1900\r\n"
    "MAN: \"ssdp:discover\"\r\n"
    "MX: 1\r\n"
    "ST: ssdp:all\r\n"
    "\r\n",
    ssdpSearchMessage(AF_INET)
  );
  EXPECT_EQ(
    "M-SEARCH * HTTP/1.1\r\n"
    "HOST: [ff02::c]:1900\r\n"
    "MAN: \"ssdp:discover\"\r\n"
    "MX: 1\r\n"
    "ST: ssdp:all\r\n"
    "\r\n",
    ssdpSearchMessage(AF_INET6)
  );
  EXPECT_STREQ("239.255.255.250", ssdpGroup(AF_INET));
  EXPECT_STREQ("ff02::c", ssdpGroup(AF_INET6));
}


#pragma mark - BindSelector

static NetIfAddress ifAddr(const char *aName, const char *aLiteral)
{
  NetIfAddress a;
  a.ifName = aName;
  a.ifIndex = 2;
  a.addrString = aLiteral;
  EXPECT_TRUE(parseAddressLiteral(aLiteral, a.addr));
  a.family = a.addr.ss_family;
  return a;
}


TEST(BindSelector, All)
{
  const char *allSelectors[] = { "", "all", "0.0.0.0", NULL };
  for (const char **s = allSelectors; *s; ++s) {
    BindSelector b = BindSelector::parse(*s);
    EXPECT_EQ(BindAll, b.mode) << *s;
    EXPECT_TRUE(b.usesFamily(AF_INET));
    EXPECT_TRUE(b.usesFamily(AF_INET6));
    EXPECT_TRUE(b.matches(ifAddr("eth0", "192.168.1.2")));
    EXPECT_TRUE(b.matches(ifAddr("wlan0", "fe80::1")));
  }
}


TEST(BindSelector, Address)
{
  BindSelector b = BindSelector::parse("192.168.1.2");
  EXPECT_EQ(BindAddress, b.mode);
  EXPECT_TRUE(b.usesFamily(AF_INET));
  EXPECT_FALSE(b.usesFamily(AF_INET6));
  EXPECT_TRUE(b.matches(ifAddr("eth0", "192.168.1.2")));
  EXPECT_FALSE(b.matches(ifAddr("eth0", "192.168.1.3")));
  EXPECT_FALSE(b.matches(ifAddr("eth0", "fe80::1")));
  NetIfAddressVector addrs;
  ErrorPtr err = b.eligibleAddresses(AF_INET6, addrs);
  ASSERT_FALSE(Error::isOK(err));
  EXPECT_EQ(SsdpErrorNoInterface, err->getErrorCode());
  EXPECT_TRUE(addrs.empty());

  b = BindSelector::parse("::");
  EXPECT_EQ(BindAddress, b.mode);
  EXPECT_FALSE(b.usesFamily(AF_INET));
  EXPECT_TRUE(b.matches(ifAddr("eth0", "fe80::1")));
  EXPECT_TRUE(b.matches(ifAddr("eth1", "2001:db8::5")));
}


TEST(BindSelector, Interface)
{
  BindSelector b = BindSelector::parse("eth0");
  EXPECT_EQ(BindInterface, b.mode);
  EXPECT_TRUE(b.usesFamily(AF_INET));
  EXPECT_TRUE(b.usesFamily(AF_INET6));
  EXPECT_TRUE(b.matches(ifAddr("eth0", "192.168.1.2")));
  EXPECT_FALSE(b.matches(ifAddr("eth1", "192.168.1.2")));
  // nonexistent interface is an error of the family, not a crash
  b = BindSelector::parse("nosuchif9");
  NetIfAddressVector addrs;
  ErrorPtr err = b.eligibleAddresses(AF_INET, addrs);
  EXPECT_FALSE(Error::isOK(err));
}


#pragma mark - SsdpListener

TEST(SsdpListener, QueuesValidAdvertisementsOnly)
{
  CandidateQueuePtr q = CandidateQueuePtr(new CandidateQueue(1));
  SsdpListenerPtr l = SsdpListenerPtr(new SsdpListener(BindSelector::parse("all"), q));
  EXPECT_FALSE(l->handleDatagram("garbage"));
  EXPECT_TRUE(l->handleDatagram(searchResponse));
  // queue full: dropped, not blocking
  EXPECT_FALSE(l->handleDatagram(notifyRequest));
  Candidate c;
  ASSERT_TRUE(q->tryReceive(c));
  EXPECT_EQ("uuid:4d696e69-444c-164e-9d41-b827eb3a2f4c", c.uuid);
  EXPECT_EQ("http://192.168.1.20:49152/description.xml", c.location);
  EXPECT_EQ("Linux/5.10 UPnP/1.0 UnPlay/1.2", c.server);
  EXPECT_GT(c.seen, 0);
  EXPECT_FALSE(q->tryReceive(c));
}


#pragma mark - failure isolation

static NetIfAddress loopbackAddress(const char *aIfName = "lo")
{
  NetIfAddress a;
  a.ifName = aIfName;
  a.ifIndex = 0;
  a.family = AF_INET;
  parseAddressLiteral("127.0.0.1", a.addr);
  a.addrString = "127.0.0.1";
  return a;
}


namespace {

  // IPv6 cannot be opened, IPv4 (if it works at all) receives unicast on loopback
  class IPv6FailingListener : public SsdpListener
  {
    typedef SsdpListener inherited;
    bool ipv4Works;

  public:
    int familiesTried;
    uint16_t ipv4Port;

    IPv6FailingListener(CandidateQueuePtr aCandidates, bool aIPv4Works) :
      inherited(BindSelector::parse("all"), aCandidates),
      ipv4Works(aIPv4Works),
      familiesTried(0),
      ipv4Port(0)
    {
    }

  protected:

    virtual ErrorPtr openFamily(int aFamily, UdpCommPtr &aSocket)
    {
      familiesTried++;
      if (aFamily==AF_INET6 || !ipv4Works) {
        return ErrorPtr(new UdpCommError(UdpCommErrorJoinFailed, "no interface joined the group"));
      }
      aSocket = UdpCommPtr(new UdpComm);
      ErrorPtr err = aSocket->openSender(loopbackAddress().addr, 0);
      if (Error::isOK(err)) ipv4Port = aSocket->localPort();
      return err;
    }
  };


  // three IPv4 addresses of which the second cannot send, no IPv6 addresses at all
  class PartlyFailingSearcher : public SsdpSearcher
  {
    typedef SsdpSearcher inherited;
    uint16_t targetPort;

  public:
    int sendAttempts;

    PartlyFailingSearcher(uint16_t aTargetPort) :
      inherited(BindSelector::parse("all"), 10*Second),
      targetPort(aTargetPort),
      sendAttempts(0)
    {
    }

  protected:

    virtual ErrorPtr searchAddresses(int aFamily, NetIfAddressVector &aAddresses)
    {
      if (aFamily==AF_INET6) {
        return ErrorPtr(new SsdpError(SsdpErrorNoInterface, "no IPv6 address"));
      }
      aAddresses.push_back(loopbackAddress("lo0"));
      aAddresses.push_back(loopbackAddress("lo1"));
      aAddresses.push_back(loopbackAddress("lo2"));
      return ErrorPtr();
    }

    virtual ErrorPtr sendSearch(const NetIfAddress &aAddr, const string &aMessage, UdpCommPtr &aSocket)
    {
      sendAttempts++;
      if (aAddr.ifName=="lo1") {
        return ErrorPtr(new UdpCommError(UdpCommErrorInvalidAddress, "network is unreachable"));
      }
      aSocket = UdpCommPtr(new UdpComm);
      ErrorPtr err = aSocket->openSender(aAddr.addr, 0);
      if (!Error::isOK(err)) return err;
      return aSocket->sendTo(aMessage, "127.0.0.1", targetPort);
    }
  };

}


TEST(SsdpListener, FailingFamilyDoesNotStopTheOther)
{
  CandidateQueuePtr q = CandidateQueuePtr(new CandidateQueue(4));
  boost::intrusive_ptr<IPv6FailingListener> l = boost::intrusive_ptr<IPv6FailingListener>(new IPv6FailingListener(q, true));
  ErrorPtr err = l->start();
  ASSERT_TRUE(Error::isOK(err)) << err->description();
  EXPECT_EQ(2, l->familiesTried);
  ASSERT_NE(0, l->ipv4Port);
  // the IPv4 side is really listening
  UdpCommPtr device = UdpCommPtr(new UdpComm);
  ASSERT_TRUE(Error::isOK(device->openSender(loopbackAddress().addr, 0)));
  ASSERT_TRUE(Error::isOK(device->sendTo(searchResponse, "127.0.0.1", l->ipv4Port)));
  Candidate c;
  ASSERT_TRUE(q->receive(c, 2*Second));
  EXPECT_EQ("uuid:4d696e69-444c-164e-9d41-b827eb3a2f4c", c.uuid);
  l->stop();
}


TEST(SsdpListener, NoFamilyIsAnError)
{
  CandidateQueuePtr q = CandidateQueuePtr(new CandidateQueue(4));
  boost::intrusive_ptr<IPv6FailingListener> l = boost::intrusive_ptr<IPv6FailingListener>(new IPv6FailingListener(q, false));
  ErrorPtr err = l->start();
  EXPECT_FALSE(Error::isOK(err));
  EXPECT_EQ(2, l->familiesTried);
  l->stop();
}


TEST(SsdpSearch, FailingAddressDoesNotStopTheOthers)
{
  UdpCommPtr group = UdpCommPtr(new UdpComm);
  ASSERT_TRUE(Error::isOK(group->openSender(loopbackAddress().addr, 0)));
  boost::intrusive_ptr<PartlyFailingSearcher> s = boost::intrusive_ptr<PartlyFailingSearcher>(new PartlyFailingSearcher(group->localPort()));
  EXPECT_EQ(2, s->search(0));
  EXPECT_EQ(3, s->sendAttempts);
  string datagram;
  for (int i=0; i<2; i++) {
    ASSERT_TRUE(Error::isOK(group->receive(datagram, SSDP_MAX_DATAGRAM, 2*Second)));
    EXPECT_EQ(0u, datagram.find("M-SEARCH * HTTP/1.1\r\n"));
    EXPECT_NE(string::npos, datagram.find("HOST: 239.255.255.250:1900\r\n"));
  }
  EXPECT_TRUE(Error::isOK(group->receive(datagram, SSDP_MAX_DATAGRAM, 100*MilliSecond)));
  EXPECT_TRUE(datagram.empty());
}
