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

#ifndef __dlnacast__soapfixture__
#define __dlnacast__soapfixture__

#include "dc_common.hpp"

#include <boost/thread/mutex.hpp>

#include <string.h>

#include "mongoose.h"

using namespace std;

namespace dlnacast {

  /// one request received by the fixture
  typedef struct {
    string method;
    string uri;
    string soapAction;
    string body;
  } RecordedRequest;

  /// local HTTP server standing in for a renderer's AVTransport control endpoint
  class SoapFixtureServer
  {
    typedef boost::lock_guard<boost::mutex> Guard;

    struct mg_context *mgContext;
    boost::mutex fixtureMutex;
    vector<RecordedRequest> requests;
    map<string, int> statusByAction;
    map<string, string> bodyByAction;
    int port;

  public:

    SoapFixtureServer(int aPort) :
      mgContext(NULL),
      port(aPort)
    {
    }

    ~SoapFixtureServer()
    {
      stop();
    }

    bool start()
    {
      string ports = string_format("127.0.0.1:%d", port);
      const char *options[] = {
        "listening_ports", ports.c_str(),
        "num_threads", "2",
        NULL
      };
      struct mg_callbacks callbacks;
      memset(&callbacks, 0, sizeof(callbacks));
      callbacks.begin_request = &SoapFixtureServer::beginRequestHandler;
      mgContext = mg_start(&callbacks, this, options);
      return mgContext!=NULL;
    }

    void stop()
    {
      if (mgContext) {
        mg_stop(mgContext);
        mgContext = NULL;
      }
    }

    /// @return URL of the control endpoint
    string controlURL()
    {
      return string_format("http://127.0.0.1:%d/AVTransport/ctrl", port);
    }

    /// answer an action with a given status and body
    void setAnswer(const string &aAction, int aStatus, const string &aBody)
    {
      Guard g(fixtureMutex);
      statusByAction[aAction] = aStatus;
      bodyByAction[aAction] = aBody;
    }

    vector<RecordedRequest> received()
    {
      Guard g(fixtureMutex);
      return requests;
    }

  private:

    static int beginRequestHandler(struct mg_connection *aConn)
    {
      struct mg_request_info *requestInfo = mg_get_request_info(aConn);
      SoapFixtureServer *fixture = static_cast<SoapFixtureServer *>(requestInfo->user_data);
      RecordedRequest req;
      req.method = nonNullCStr(requestInfo->request_method);
      req.uri = nonNullCStr(requestInfo->uri);
      req.soapAction = nonNullCStr(mg_get_header(aConn, "SOAPAction"));
      char buffer[1024];
      int n;
      while ((n = mg_read(aConn, buffer, sizeof(buffer)))>0) {
        req.body.append(buffer, (size_t)n);
      }
      // action name is after the '#' in the quoted SOAPAction
      string action = req.soapAction;
      size_t i = action.find('#');
      if (i!=string::npos) action.erase(0, i+1);
      if (!action.empty() && action[action.size()-1]=='"') action.erase(action.size()-1);
      int status = 200;
      string body = "<?xml version=\"1.0\"?><s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\"><s:Body/></s:Envelope>";
      {
        Guard g(fixture->fixtureMutex);
        fixture->requests.push_back(req);
        if (fixture->statusByAction.count(action)) {
          status = fixture->statusByAction[action];
          body = fixture->bodyByAction[action];
        }
      }
      mg_printf(aConn,
        "HTTP/1.1 %d %s\r\n"
        "Content-Type: text/xml\r\n"
        "Content-Length: %lu\r\n"
        "Connection: close\r\n"
        "\r\n",
        status, status==200 ? "OK" : "Error",
        (unsigned long)body.size()
      );
      mg_write(aConn, body.c_str(), body.size());
      return 1;
    }

  };

} // namespace dlnacast

#endif /* defined(__dlnacast__soapfixture__) */
