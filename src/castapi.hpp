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

#ifndef __dlnacast__castapi__
#define __dlnacast__castapi__

#include "dc_common.hpp"
#include "discoveryservice.hpp"
#include "avtransport.hpp"

#include <boost/thread/mutex.hpp>

#include "mongoose.h"

using namespace std;

namespace dlnacast {

  /// API parameters
  class CastApiConfig
  {
  public:
    string listenAddress; ///< [host:]port to listen on
    string playerPattern; ///< devices whose identity or friendly name contains this are cast to when no target is given

    CastApiConfig() :
      listenAddress(":8072"),
      playerPattern("UnPlay")
    {};
  };


  /// an API answer
  typedef struct {
    int status; ///< HTTP status
    string contentType;
    string body;
  } ApiResponse;


  class CastApi;
  typedef boost::intrusive_ptr<CastApi> CastApiPtr;

  /// HTTP JSON API for listing devices and casting media to them
  class CastApi : public DcObj
  {
    typedef DcObj inherited;

    CastApiConfig config;
    DiscoveryServicePtr discovery;
    AVTransportClientPtr avTransport;

    boost::mutex defaultMutex;
    string defaultUuid; ///< default target set via API

    struct mg_context *mgContext;

  public:

    /// @param aConfig API parameters
    /// @param aDiscovery where the devices come from
    /// @param aAVTransport the client used to cast
    CastApi(const CastApiConfig &aConfig, DiscoveryServicePtr aDiscovery, AVTransportClientPtr aAVTransport);
    virtual ~CastApi();

    /// start the HTTP server
    /// @return error if server cannot listen on the configured address
    ErrorPtr start();

    /// stop the HTTP server, waits for requests in progress to complete
    void stop();

    /// handle an API request
    /// @param aMethod HTTP method
    /// @param aPath the request path, without query
    /// @param aBody the request body
    /// @param aResponse will receive status and body of the answer
    void handleRequest(const string &aMethod, const string &aPath, const string &aBody, ApiResponse &aResponse);

    /// @return the default target identity, empty if none is set
    string getDefaultDevice();

  private:

    void listDevices(ApiResponse &aResponse);
    void setDefaultDevice(const string &aBody, ApiResponse &aResponse);
    void cast(const string &aBody, ApiResponse &aResponse);
    string findTarget(const string &aRequestedUuid);

    static int beginRequestHandler(struct mg_connection *aConn);

  };

} // namespace dlnacast


#endif /* defined(__dlnacast__castapi__) */
