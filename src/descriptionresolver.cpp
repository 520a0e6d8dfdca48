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

// File scope debugging options
// - Set ALWAYS_DEBUG to 1 to enable DBGLOG output even in non-DEBUG builds of this file
#define ALWAYS_DEBUG 0
// - set FOCUSLOGLEVEL to non-zero log level (usually, 5,6, or 7==LOG_DEBUG) to get focus (extensive logging) for this file
//   Note: must be before including "logger.hpp" (or anything that includes "logger.hpp")
#define FOCUSLOGLEVEL 0

#include "descriptionresolver.hpp"

#include "httpcomm.hpp"

#include <string.h>
#include <expat.h>

using namespace dlnacast;


#pragma mark - description parser

// namespace URI and local name are separated by this in element names
#define NS_SEPARATOR '|'

namespace {

  /// builds a DeviceDescription from expat events
  /// @note element paths are matched on local names, below the document element (whatever its name is)
  class DeviceDescriptionParser
  {
    DeviceDescription &description;
    vector<string> path;
    XML_Parser parser;

  public:

    DeviceDescriptionParser(DeviceDescription &aDescription) :
      description(aDescription)
    {
      parser = XML_ParserCreateNS(NULL, NS_SEPARATOR);
      XML_SetUserData(parser, this);
      XML_SetElementHandler(parser, &startElementHandler, &endElementHandler);
      XML_SetCharacterDataHandler(parser, &characterDataHandler);
    }

    ~DeviceDescriptionParser()
    {
      XML_ParserFree(parser);
    }

    ErrorPtr parse(const string &aXml)
    {
      if (!parser) {
        return ErrorPtr(new DescriptionError(DescriptionErrorXml, "cannot create XML parser"));
      }
      if (XML_Parse(parser, aXml.c_str(), (int)aXml.size(), 1)==XML_STATUS_ERROR) {
        return ErrorPtr(new DescriptionError(DescriptionErrorXml, string_format(
          "XML error at line %lu: %s",
          (unsigned long)XML_GetCurrentLineNumber(parser),
          XML_ErrorString(XML_GetErrorCode(parser))
        )));
      }
      // trim collected texts
      description.friendlyName = trimWhiteSpace(description.friendlyName);
      for (ServiceDescriptionVector::iterator pos = description.services.begin(); pos!=description.services.end(); ++pos) {
        pos->serviceType = trimWhiteSpace(pos->serviceType);
        pos->controlURL = trimWhiteSpace(pos->controlURL);
      }
      return ErrorPtr();
    }

  private:

    static string localName(const XML_Char *aName)
    {
      const char *p = strrchr(aName, NS_SEPARATOR);
      return p ? p+1 : aName;
    }

    // path below the document element matches
    bool pathIs(const char *aLevel1, const char *aLevel2, const char *aLevel3 = NULL, const char *aLevel4 = NULL)
    {
      const char *levels[4] = { aLevel1, aLevel2, aLevel3, aLevel4 };
      size_t depth = 0;
      while (depth<4 && levels[depth]) depth++;
      if (path.size()!=depth+1) return false;
      for (size_t i=0; i<depth; i++) {
        if (path[i+1]!=levels[i]) return false;
      }
      return true;
    }

    void startElement(const XML_Char *aName)
    {
      path.push_back(localName(aName));
      if (pathIs("device", "serviceList", "service")) {
        description.services.push_back(ServiceDescription());
      }
    }

    void endElement(const XML_Char *aName)
    {
      if (!path.empty()) path.pop_back();
    }

    void characterData(const XML_Char *aText, int aLen)
    {
      if (pathIs("device", "friendlyName")) {
        description.friendlyName.append(aText, aLen);
      }
      else if (!description.services.empty()) {
        if (pathIs("device", "serviceList", "service", "serviceType")) {
          description.services.back().serviceType.append(aText, aLen);
        }
        else if (pathIs("device", "serviceList", "service", "controlURL")) {
          description.services.back().controlURL.append(aText, aLen);
        }
      }
    }

    static void XMLCALL startElementHandler(void *aUserData, const XML_Char *aName, const XML_Char **aAttrs)
    {
      static_cast<DeviceDescriptionParser *>(aUserData)->startElement(aName);
    }

    static void XMLCALL endElementHandler(void *aUserData, const XML_Char *aName)
    {
      static_cast<DeviceDescriptionParser *>(aUserData)->endElement(aName);
    }

    static void XMLCALL characterDataHandler(void *aUserData, const XML_Char *aText, int aLen)
    {
      static_cast<DeviceDescriptionParser *>(aUserData)->characterData(aText, aLen);
    }

  };

} // namespace


ErrorPtr dlnacast::parseDeviceDescription(const string &aXml, DeviceDescription &aDescription)
{
  aDescription.friendlyName.clear();
  aDescription.services.clear();
  DeviceDescriptionParser parser(aDescription);
  return parser.parse(aXml);
}


#pragma mark - device from description


string dlnacast::normalizeControlURL(const string &aLocation, const string &aControlURL)
{
  if (aControlURL.compare(0, 4, "http")==0) {
    // already absolute
    return aControlURL;
  }
  if (!aControlURL.empty() && aControlURL[0]=='/') {
    // absolute path: use scheme and host of location
    string proto, host;
    splitURL(aLocation.c_str(), &proto, &host, NULL);
    return string_format("%s://%s%s", proto.c_str(), host.c_str(), aControlURL.c_str());
  }
  // relative: join with the location's directory
  string base = aLocation;
  size_t i = base.rfind('/');
  if (i!=string::npos) base.erase(i);
  return base + "/" + aControlURL;
}


ErrorPtr dlnacast::deviceFromDescription(const Candidate &aCandidate, const string &aXml, Device &aDevice)
{
  DeviceDescription desc;
  ErrorPtr err = parseDeviceDescription(aXml, desc);
  if (!Error::isOK(err)) return err;
  // first AVTransport service counts
  const ServiceDescription *avTransport = NULL;
  for (ServiceDescriptionVector::const_iterator pos = desc.services.begin(); pos!=desc.services.end(); ++pos) {
    if (containsString(pos->serviceType, "AVTransport")) {
      avTransport = &(*pos);
      break;
    }
  }
  if (!avTransport || avTransport->controlURL.empty()) {
    return ErrorPtr(new DescriptionError(DescriptionErrorNoAVTransport, "device has no AVTransport service"));
  }
  aDevice.uuid = aCandidate.uuid;
  aDevice.location = aCandidate.location;
  aDevice.server = aCandidate.server;
  aDevice.lastSeen = aCandidate.seen;
  aDevice.friendlyName = desc.friendlyName;
  aDevice.controlURL = normalizeControlURL(aCandidate.location, avTransport->controlURL);
  return ErrorPtr();
}


#pragma mark - DescriptionResolver


DescriptionResolver::DescriptionResolver(MLMicroSeconds aTimeout) :
  timeout(aTimeout)
{
}


ErrorPtr DescriptionResolver::resolve(const Candidate &aCandidate, Device &aDevice)
{
  HttpCommPtr http = HttpCommPtr(new HttpComm);
  http->setTimeout(timeout);
  int status = 0;
  string xml;
  FOCUSLOG("fetching description for %s from %s\n", aCandidate.uuid.c_str(), aCandidate.location.c_str());
  ErrorPtr err = http->httpRequest(aCandidate.location.c_str(), status, xml);
  if (!Error::isOK(err)) {
    err->prefixMessage(string_format("fetching %s: ", aCandidate.location.c_str()));
    return err;
  }
  if (status!=200) {
    return ErrorPtr(new WebError(status, string_format("fetching %s returned status %d", aCandidate.location.c_str(), status)));
  }
  return deviceFromDescription(aCandidate, xml, aDevice);
}
