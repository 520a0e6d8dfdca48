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

#include "avtransport.hpp"

#include "httpcomm.hpp"

using namespace dlnacast;


AVTransportClient::AVTransportClient(MLMicroSeconds aTimeout) :
  timeout(aTimeout)
{
}


AVTransportClient::~AVTransportClient()
{
}


string AVTransportClient::didlLiteMetadata(const string &aMediaURL, const string &aTitle)
{
  return string_format(
    "<DIDL-Lite xmlns=\"urn:schemas-upnp-org:metadata-1-0/DIDL-Lite/\" "
    "xmlns:dc=\"http://purl.org/dc/elements/1.1/\" "
    "xmlns:upnp=\"urn:schemas-upnp-org:metadata-1-0/upnp/\">"
    "<item id=\"0\" parentID=\"0\" restricted=\"1\">"
    "<dc:title>%s</dc:title>"
    "<upnp:class>object.item.videoItem</upnp:class>"
    "<res protocolInfo=\"http-get:*:*:*\">%s</res>"
    "</item>"
    "</DIDL-Lite>",
    xmlEscape(aTitle).c_str(),
    xmlEscape(aMediaURL).c_str()
  );
}


string AVTransportClient::setAVTransportURIArgs(const string &aMediaURL, const string &aTitle)
{
  string metadata;
  if (!aTitle.empty()) {
    // DIDL-Lite is passed as text content, so it is escaped once more
    metadata = xmlEscape(didlLiteMetadata(aMediaURL, aTitle));
  }
  return string_format(
    "<InstanceID>0</InstanceID>"
    "<CurrentURI>%s</CurrentURI>"
    "<CurrentURIMetaData>%s</CurrentURIMetaData>",
    xmlEscape(aMediaURL).c_str(),
    metadata.c_str()
  );
}


string AVTransportClient::soapEnvelope(const char *aAction, const string &aArguments)
{
  return string_format(
    "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
    "<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\" s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\">\n"
    "<s:Body>\n"
    "<u:%s xmlns:u=\"" AVTRANSPORT_SERVICE_TYPE "\">%s</u:%s>\n"
    "</s:Body>\n"
    "</s:Envelope>\n",
    aAction,
    aArguments.c_str(),
    aAction
  );
}


ErrorPtr AVTransportClient::soapAction(const string &aControlURL, const char *aAction, const string &aArguments)
{
  HttpCommPtr http = HttpCommPtr(new HttpComm);
  http->setTimeout(timeout);
  http->addRequestHeader("SOAPAction", string_format("\"" AVTRANSPORT_SERVICE_TYPE "#%s\"", aAction));
  string envelope = soapEnvelope(aAction, aArguments);
  FOCUSLOG("%s to %s:\n%s\n", aAction, aControlURL.c_str(), envelope.c_str());
  int status = 0;
  string response;
  ErrorPtr err = http->httpRequest(aControlURL.c_str(), status, response, "POST", envelope.c_str(), "text/xml; charset=\"utf-8\"");
  if (!Error::isOK(err)) {
    err->prefixMessage(string_format("%s failed: ", aAction));
    return err;
  }
  if (status!=200) {
    return ErrorPtr(new WebError(status, string_format("%s failed: SOAP request failed with status %d: %s", aAction, status, response.c_str())));
  }
  return ErrorPtr();
}


ErrorPtr AVTransportClient::play(const string &aControlURL, const string &aMediaURL, const string &aTitle)
{
  LOG(LOG_INFO, "Casting %s to %s\n", aMediaURL.c_str(), aControlURL.c_str());
  ErrorPtr err = soapAction(aControlURL, "SetAVTransportURI", setAVTransportURIArgs(aMediaURL, aTitle));
  if (Error::isOK(err)) {
    err = soapAction(aControlURL, "Play", "<InstanceID>0</InstanceID><Speed>1</Speed>");
  }
  if (!Error::isOK(err)) {
    LOG(LOG_WARNING, "Cast to %s failed: %s\n", aControlURL.c_str(), err->description().c_str());
  }
  return err;
}
