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

#include "httpcomm.hpp"

#include <stdlib.h>

using namespace dlnacast;

#define DEFAULT_HTTP_TIMEOUT (10*Second)
// time a timed out request gets to close its connection after being interrupted
#define HTTP_TERMINATE_GRACE (2*Second)


HttpComm::HttpComm() :
  timeout(DEFAULT_HTTP_TIMEOUT),
  responseStatus(0)
{
}


HttpComm::~HttpComm()
{
}


void HttpComm::addRequestHeader(const string &aName, const string &aValue)
{
  requestHeaders[aName] = aValue;
}


//  mg_download establishes the http connection, sends the request and reads the response
//  headers. mg_read then gets the response body. The entire request head (and body, if any)
//  must be passed in the format string of mg_download.

void HttpComm::requestThread(ChildThread &aThread)
{
  string protocol, hostSpec, host, doc;
  uint16_t port = 80;

  requestError.reset();
  response.clear();
  responseStatus = 0;
  splitURL(requestURL.c_str(), &protocol, &hostSpec, &doc, NULL, NULL);
  bool useSSL = false;
  if (protocol=="http") {
    port = 80;
    useSSL = false;
  }
  else if (protocol=="https") {
    port = 443;
    useSSL = true;
  }
  else {
    requestError = ErrorPtr(new HttpCommError(HttpCommError_invalidParameters, "invalid protocol"));
    return;
  }
  splitHost(hostSpec.c_str(), &host, &port);
  if (host.empty()) {
    requestError = ErrorPtr(new HttpCommError(HttpCommError_invalidParameters, "missing host"));
    return;
  }
  // compose the request
  string req = string_format(
    "%s /%s HTTP/1.1\r\n"
    "Host: %s\r\n"
    "Connection: close\r\n",
    method.c_str(),
    doc.c_str(),
    hostSpec.c_str()
  );
  for (HttpHeaderMap::iterator pos = requestHeaders.begin(); pos!=requestHeaders.end(); ++pos) {
    string_format_append(req, "%s: %s\r\n", pos->first.c_str(), pos->second.c_str());
  }
  if (requestBody.length()>0) {
    // is a request which sends data in the HTTP message body (e.g. POST)
    string_format_append(req,
      "Content-Type: %s\r\n"
      "Content-Length: %lu\r\n",
      contentType.c_str(),
      (unsigned long)requestBody.length()
    );
  }
  req += "\r\n";
  req += requestBody;
  FOCUSLOG("HttpComm: sending request to %s:%hu:\n%s\n", host.c_str(), port, req.c_str());
  // now issue request
  const size_t ebufSz = 100;
  char ebuf[ebufSz];
  ebuf[0] = 0;
  struct mg_connection *mgConn = mg_download(
    host.c_str(),
    port,
    useSSL,
    ebuf, ebufSz,
    "%s",
    req.c_str()
  );
  if (!mgConn) {
    requestError = ErrorPtr(new HttpCommError(HttpCommError_mongooseError, ebuf));
    return;
  }
  // successfully initiated connection
  struct mg_request_info *requestInfo = mg_get_request_info(mgConn);
  if (requestInfo) {
    // for responses, mongoose puts the status code where the URI of a request would be
    responseStatus = atoi(nonNullCStr(requestInfo->uri));
    // - get headers if requested
    if (responseHeaders) {
      for (int i=0; i<requestInfo->num_headers; i++) {
        (*responseHeaders)[requestInfo->http_headers[i].name] = requestInfo->http_headers[i].value;
      }
    }
  }
  // - read data
  char buffer[2048];
  while (!aThread.shouldTerminate()) {
    int res = mg_read(mgConn, buffer, sizeof(buffer));
    if (res==0) {
      // connection has closed, all bytes read
      break;
    }
    else if (res<0) {
      // read error, or interrupted by a timeout
      requestError = ErrorPtr(new HttpCommError(HttpCommError_read, "error reading response"));
      break;
    }
    else {
      // collect in string
      response.append(buffer, (size_t)res);
    }
  }
  mg_close_connection(mgConn);
}


ErrorPtr HttpComm::httpRequest(
  const char *aURL,
  int &aStatus,
  string &aResponse,
  const char *aMethod,
  const char* aRequestBody,
  const char* aContentType,
  bool aSaveHeaders
)
{
  if (!aURL)
    return ErrorPtr(new HttpCommError(HttpCommError_invalidParameters, "no URL"));
  responseHeaders.reset();
  if (aSaveHeaders)
    responseHeaders = HttpHeaderMapPtr(new HttpHeaderMap);
  requestURL = aURL;
  method = nonNullCStr(aMethod);
  requestBody = nonNullCStr(aRequestBody);
  if (aContentType)
    contentType = aContentType; // use specified content type
  else
    contentType = defaultContentType(); // use default for the class
  // now let subthread handle this
  ChildThreadPtr childThread = ChildThreadPtr(new ChildThread(boost::bind(&HttpComm::requestThread, this, _1)));
  ErrorPtr err = childThread->start();
  if (!Error::isOK(err)) return err;
  if (!childThread->waitCompletion(timeout)) {
    // timed out, make the request fail so it closes its connection
    childThread->terminate(HTTP_TERMINATE_GRACE);
    DBGLOG(LOG_DEBUG, "HttpComm: request to %s timed out\n", aURL);
    return ErrorPtr(new HttpCommError(HttpCommError_timeout, string_format("request to %s timed out", aURL)));
  }
  // completed
  if (Error::isOK(requestError)) {
    aStatus = responseStatus;
    aResponse = response;
    FOCUSLOG("HttpComm: got status %d, response:\n%s\n", aStatus, aResponse.c_str());
  }
  return requestError;
}
