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

#include "avtransport.hpp"
#include "soapfixture.hpp"

using namespace dlnacast;

#define FIXTURE_PORT 18931


static string between(const string &aText, const string &aStart, const string &aEnd)
{
  size_t s = aText.find(aStart);
  if (s==string::npos) return "<missing>";
  s += aStart.size();
  size_t e = aText.find(aEnd, s);
  if (e==string::npos) return "<unterminated>";
  return aText.substr(s, e-s);
}


TEST(AVTransportMessages, MetadataIsEscapedTwice)
{
  string args = AVTransportClient::setAVTransportURIArgs("http://media/a.mp4?x=1&y=2", "Tom & Jerry");
  EXPECT_EQ("0", between(args, "<InstanceID>", "</InstanceID>"));
  EXPECT_EQ("http://media/a.mp4?x=1&amp;y=2", between(args, "<CurrentURI>", "</CurrentURI>"));
  string meta = between(args, "<CurrentURIMetaData>", "</CurrentURIMetaData>");
  ASSERT_FALSE(meta.empty());
  // markup escaped once, text content twice
  EXPECT_EQ(0u, meta.find("&lt;DIDL-Lite xmlns=&quot;urn:schemas-upnp-org:metadata-1-0/DIDL-Lite/&quot;"));
  EXPECT_NE(string::npos, meta.find("&lt;dc:title&gt;Tom &amp;amp; Jerry&lt;/dc:title&gt;"));
  EXPECT_NE(string::npos, meta.find("http://media/a.mp4?x=1&amp;amp;y=2&lt;/res&gt;"));
  EXPECT_EQ(string::npos, meta.find('<'));
  EXPECT_EQ(string::npos, meta.find('\n'));
}


TEST(AVTransportMessages, EmptyTitleGivesEmptyMetadata)
{
  string args = AVTransportClient::setAVTransportURIArgs("http://media/a.mp4", "");
  EXPECT_NE(string::npos, args.find("<CurrentURIMetaData></CurrentURIMetaData>"));
}


TEST(AVTransportMessages, Envelope)
{
  string env = AVTransportClient::soapEnvelope("Play", "<InstanceID>0</InstanceID><Speed>1</Speed>");
  EXPECT_EQ(0u, env.find("<?xml version=\"1.0\" encoding=\"utf-8\"?>"));
  EXPECT_NE(string::npos, env.find("s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\""));
  EXPECT_NE(string::npos, env.find("<u:Play xmlns:u=\"urn:schemas-upnp-org:service:AVTransport:1\"><InstanceID>0</InstanceID><Speed>1</Speed></u:Play>"));
}


class AVTransportFixture : public ::testing::Test
{
protected:
  SoapFixtureServer *renderer;
  AVTransportClientPtr client;

  virtual void SetUp()
  {
    renderer = new SoapFixtureServer(FIXTURE_PORT);
    ASSERT_TRUE(renderer->start());
    client = AVTransportClientPtr(new AVTransportClient(5*Second));
  }

  virtual void TearDown()
  {
    delete renderer;
  }
};


TEST_F(AVTransportFixture, PlaySendsTwoActions)
{
  ErrorPtr err = client->play(renderer->controlURL(), "http://media/a.mp4", "Clip");
  ASSERT_TRUE(Error::isOK(err)) << err->description();
  vector<RecordedRequest> reqs = renderer->received();
  ASSERT_EQ(2u, reqs.size());
  EXPECT_EQ("POST", reqs[0].method);
  EXPECT_EQ("/AVTransport/ctrl", reqs[0].uri);
  EXPECT_EQ("\"urn:schemas-upnp-org:service:AVTransport:1#SetAVTransportURI\"", reqs[0].soapAction);
  EXPECT_NE(string::npos, reqs[0].body.find("<CurrentURI>http://media/a.mp4</CurrentURI>"));
  EXPECT_EQ(string::npos, reqs[0].body.find("<CurrentURIMetaData></CurrentURIMetaData>"));
  EXPECT_EQ("POST", reqs[1].method);
  EXPECT_EQ("\"urn:schemas-upnp-org:service:AVTransport:1#Play\"", reqs[1].soapAction);
  EXPECT_NE(string::npos, reqs[1].body.find("<Speed>1</Speed>"));
}


TEST_F(AVTransportFixture, FailedSetURISkipsPlay)
{
  renderer->setAnswer("SetAVTransportURI", 500, "<errorCode>714</errorCode>");
  ErrorPtr err = client->play(renderer->controlURL(), "http://media/a.mp4", "");
  ASSERT_FALSE(Error::isOK(err));
  EXPECT_TRUE(err->isDomain(WebError::domain()));
  EXPECT_EQ(500, err->getErrorCode());
  EXPECT_NE(string::npos, err->description().find("<errorCode>714</errorCode>"));
  EXPECT_NE(string::npos, err->description().find("SetAVTransportURI"));
  vector<RecordedRequest> reqs = renderer->received();
  ASSERT_EQ(1u, reqs.size());
  EXPECT_NE(string::npos, reqs[0].body.find("<CurrentURIMetaData></CurrentURIMetaData>"));
}


TEST_F(AVTransportFixture, FailedPlayIsReported)
{
  renderer->setAnswer("Play", 501, "not implemented");
  ErrorPtr err = client->play(renderer->controlURL(), "http://media/a.mp4", "");
  ASSERT_FALSE(Error::isOK(err));
  EXPECT_EQ(501, err->getErrorCode());
  EXPECT_NE(string::npos, err->description().find("Play failed"));
  EXPECT_EQ(2u, renderer->received().size());
}


TEST(AVTransportClient, UnreachableRenderer)
{
  AVTransportClientPtr client = AVTransportClientPtr(new AVTransportClient(2*Second));
  // nothing listens on the discard port
  ErrorPtr err = client->play("http://127.0.0.1:9/ctrl", "http://media/a.mp4", "");
  EXPECT_FALSE(Error::isOK(err));
}
