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

#include "castapi.hpp"

#include "jsonobject.hpp"

#include <string.h>

using namespace dlnacast;

typedef boost::lock_guard<boost::mutex> Guard;

#define MAX_REQUEST_BODY (64*1024)
#define API_THREADS "4"

#define CONTENT_TYPE_TEXT "text/plain; charset=utf-8"
#define CONTENT_TYPE_JSON "application/json"


static void setResponse(ApiResponse &aResponse, int aStatus, const string &aBody, const char *aContentType = CONTENT_TYPE_TEXT)
{
  aResponse.status = aStatus;
  aResponse.body = aBody;
  aResponse.contentType = aContentType;
}


static const char *statusText(int aStatus)
{
  switch (aStatus) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 500: return "Internal Server Error";
    default: return "Unknown";
  }
}


// parse a request body, which must be a JSON object
static JsonObjectPtr parseBody(const string &aBody, ErrorPtr &aError)
{
  JsonObjectPtr o = JsonObject::objFromText(aBody.c_str(), aBody.size(), &aError);
  if (o && !o->isType(json_type_object)) {
    aError = TextError::err("request body must be a JSON object");
    o.reset();
  }
  return o;
}


// get an optional string field
// @return false if the field exists but is not a string
static bool stringField(JsonObjectPtr aObj, const char *aKey, string &aValue)
{
  JsonObjectPtr f;
  aValue.clear();
  if (!aObj->get(aKey, f) || !f) return true; // absent or null: empty
  if (!f->isType(json_type_string)) return false;
  aValue = f->stringValue();
  return true;
}


CastApi::CastApi(const CastApiConfig &aConfig, DiscoveryServicePtr aDiscovery, AVTransportClientPtr aAVTransport) :
  config(aConfig),
  discovery(aDiscovery),
  avTransport(aAVTransport),
  mgContext(NULL)
{
}


CastApi::~CastApi()
{
  stop();
}


#pragma mark - HTTP server


ErrorPtr CastApi::start()
{
  if (mgContext) return ErrorPtr(); // already running
  // mongoose wants "port" or "host:port"
  string ports = config.listenAddress;
  if (!ports.empty() && ports[0]==':') ports.erase(0,1);
  if (ports.empty()) {
    return TextError::err("invalid listen address '%s'", config.listenAddress.c_str());
  }
  const char *options[] = {
    "listening_ports", ports.c_str(),
    "num_threads", API_THREADS,
    NULL
  };
  struct mg_callbacks callbacks;
  memset(&callbacks, 0, sizeof(callbacks));
  callbacks.begin_request = &CastApi::beginRequestHandler;
  mgContext = mg_start(&callbacks, this, options);
  if (!mgContext) {
    return TextError::err("cannot start HTTP server on '%s'", config.listenAddress.c_str());
  }
  LOG(LOG_NOTICE, "API listening on %s\n", config.listenAddress.c_str());
  return ErrorPtr();
}


void CastApi::stop()
{
  if (mgContext) {
    mg_stop(mgContext);
    mgContext = NULL;
  }
}


int CastApi::beginRequestHandler(struct mg_connection *aConn)
{
  struct mg_request_info *requestInfo = mg_get_request_info(aConn);
  CastApi *api = static_cast<CastApi *>(requestInfo->user_data);
  // read the body
  string body;
  if (mg_get_header(aConn, "Content-Length")) {
    char buffer[2048];
    int n;
    while ((n = mg_read(aConn, buffer, sizeof(buffer)))>0) {
      if (body.size()<MAX_REQUEST_BODY) body.append(buffer, (size_t)n);
    }
  }
  ApiResponse response;
  api->handleRequest(nonNullCStr(requestInfo->request_method), nonNullCStr(requestInfo->uri), body, response);
  mg_printf(aConn,
    "HTTP/1.1 %d %s\r\n"
    "Content-Type: %s\r\n"
    "Content-Length: %lu\r\n"
    "Connection: close\r\n"
    "\r\n",
    response.status, statusText(response.status),
    response.contentType.c_str(),
    (unsigned long)response.body.size()
  );
  mg_write(aConn, response.body.c_str(), response.body.size());
  return 1; // handled
}


#pragma mark - API


void CastApi::handleRequest(const string &aMethod, const string &aPath, const string &aBody, ApiResponse &aResponse)
{
  FOCUSLOG("API: %s %s %s\n", aMethod.c_str(), aPath.c_str(), aBody.c_str());
  if (aPath=="/api/devices") {
    if (aMethod!="GET") goto wrongMethod;
    listDevices(aResponse);
  }
  else if (aPath=="/api/device/default") {
    if (aMethod!="POST") goto wrongMethod;
    setDefaultDevice(aBody, aResponse);
  }
  else if (aPath=="/api/cast") {
    if (aMethod!="POST") goto wrongMethod;
    cast(aBody, aResponse);
  }
  else {
    setResponse(aResponse, 404, "404 page not found");
  }
  LOG(LOG_INFO, "API: %s %s -> %d\n", aMethod.c_str(), aPath.c_str(), aResponse.status);
  return;
wrongMethod:
  setResponse(aResponse, 405, "Method not allowed");
  LOG(LOG_INFO, "API: %s %s -> %d\n", aMethod.c_str(), aPath.c_str(), aResponse.status);
}


void CastApi::listDevices(ApiResponse &aResponse)
{
  DeviceVector devices = discovery->listDevices();
  JsonObjectPtr a = JsonObject::newArray();
  for (DeviceVector::iterator pos = devices.begin(); pos!=devices.end(); ++pos) {
    a->arrayAppend(pos->toJson());
  }
  setResponse(aResponse, 200, a->json_str(), CONTENT_TYPE_JSON);
}


string CastApi::getDefaultDevice()
{
  Guard g(defaultMutex);
  return defaultUuid;
}


void CastApi::setDefaultDevice(const string &aBody, ApiResponse &aResponse)
{
  ErrorPtr err;
  string uuid;
  JsonObjectPtr req = parseBody(aBody, err);
  if (!req || !stringField(req, "usn", uuid)) {
    setResponse(aResponse, 400, Error::isOK(err) ? "usn must be a string" : err->description());
    return;
  }
  {
    Guard g(defaultMutex);
    defaultUuid = uuid;
  }
  LOG(LOG_NOTICE, "Default device set to '%s'\n", uuid.c_str());
  setResponse(aResponse, 200, "Default device set to " + uuid);
}


string CastApi::findTarget(const string &aRequestedUuid)
{
  // explicit
  if (!aRequestedUuid.empty()) return aRequestedUuid;
  // default
  string uuid = getDefaultDevice();
  if (!uuid.empty()) return uuid;
  // first device matching the player pattern
  if (!config.playerPattern.empty()) {
    DeviceVector devices = discovery->listDevices();
    for (DeviceVector::iterator pos = devices.begin(); pos!=devices.end(); ++pos) {
      if (containsString(pos->uuid, config.playerPattern) || containsString(pos->friendlyName, config.playerPattern)) {
        return pos->uuid;
      }
    }
  }
  return "";
}


void CastApi::cast(const string &aBody, ApiResponse &aResponse)
{
  ErrorPtr err;
  string url, uuid, title;
  JsonObjectPtr req = parseBody(aBody, err);
  if (!req) {
    setResponse(aResponse, 400, err->description());
    return;
  }
  if (!stringField(req, "url", url) || !stringField(req, "usn", uuid) || !stringField(req, "title", title)) {
    setResponse(aResponse, 400, "url, usn and title must be strings");
    return;
  }
  if (url.empty()) {
    setResponse(aResponse, 400, "Missing url");
    return;
  }
  string target = findTarget(uuid);
  if (target.empty()) {
    setResponse(aResponse, 400, "Please specify a device or set a default device first.");
    return;
  }
  Device device;
  if (!discovery->getDevice(target, device)) {
    setResponse(aResponse, 404, "Device not found");
    return;
  }
  err = avTransport->play(device.controlURL, url, title);
  if (!Error::isOK(err)) {
    setResponse(aResponse, 500, "Failed to cast: " + err->description());
    return;
  }
  LOG(LOG_NOTICE, "Casting %s to %s\n", url.c_str(), device.shortDesc().c_str());
  setResponse(aResponse, 200, "Casting to " + device.friendlyName);
}
