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

#ifndef __dlnacast__httpcomm__
#define __dlnacast__httpcomm__

#include "dc_common.hpp"
#include "childthread.hpp"

#include "mongoose.h"

using namespace std;

namespace dlnacast {


  // Errors
  typedef uint16_t HttpCommErrors;

  enum {
    HttpCommError_invalidParameters = 10000,
    HttpCommError_noConnection = 10001,
    HttpCommError_read = 10002,
    HttpCommError_write = 10003,
    HttpCommError_timeout = 10004,
    HttpCommError_mongooseError = 20000
  };

  class HttpCommError : public Error
  {
  public:
    static const char *domain() { return "HttpComm"; }
    virtual const char *getErrorDomain() const { return HttpCommError::domain(); };
    HttpCommError(HttpCommErrors aError) : Error(ErrorCode(aError)) {};
    HttpCommError(HttpCommErrors aError, std::string aErrorMessage) : Error(ErrorCode(aError), aErrorMessage) {};
  };


  class HttpComm;

  typedef boost::intrusive_ptr<HttpComm> HttpCommPtr;

  typedef std::map<string,string> HttpHeaderMap;
  typedef boost::shared_ptr<HttpHeaderMap> HttpHeaderMapPtr;


  /// wrapper for blocking http client communication with a timeout
  /// @note this class' implementation is not suitable for handling huge http requests and answers. It is
  ///   intended for accessing web APIs and device descriptions with short messages.
  /// @note the request is executed on a child thread, the calling thread waits for it at most for the timeout.
  ///   Each HttpComm object can only run one request at a time; use separate objects for parallel requests.
  class HttpComm : public DcObj
  {
    typedef DcObj inherited;

    MLMicroSeconds timeout;
    HttpHeaderMap requestHeaders;

    // vars used in subthread, only access while no request is in progress
    string requestURL;
    string method;
    string contentType;
    string requestBody;
    int responseStatus;
    string response;
    ErrorPtr requestError;

  public:

    HttpHeaderMapPtr responseHeaders; ///< the response headers when httpRequest is called with aSaveHeaders

    HttpComm();
    virtual ~HttpComm();

    /// set the timeout for subsequent requests
    /// @param aTimeout max time for a request from connecting to having received the full answer, Infinite for none
    void setTimeout(MLMicroSeconds aTimeout) { timeout = aTimeout; };

    /// add a header to be sent with all subsequent requests
    /// @param aName header name
    /// @param aValue header value
    void addRequestHeader(const string &aName, const string &aValue);

    /// send a HTTP request and wait for the answer
    /// @param aURL the http URL to access
    /// @param aStatus will be set to the HTTP status code of the response
    /// @param aResponse will be set to the response body
    /// @param aMethod the HTTP method to use (defaults to "GET")
    /// @param aRequestBody a C string containing the request body to send, or NULL if none
    /// @param aContentType the content type for the body to send (including charset if needed), or NULL to use default
    /// @param aSaveHeaders if true, responseHeaders will be set to a string,string map containing the headers
    /// @return error if the request could not be sent or the response could not be read within the timeout.
    ///   A HTTP status other than 200 is NOT an error at this level, check aStatus.
    ErrorPtr httpRequest(
      const char *aURL,
      int &aStatus,
      string &aResponse,
      const char *aMethod = "GET",
      const char *aRequestBody = NULL,
      const char *aContentType = NULL,
      bool aSaveHeaders = false
    );

  protected:
    virtual const char *defaultContentType() { return "text/html; charset=UTF-8"; };

  private:
    void requestThread(ChildThread &aThread);

  };


} // namespace dlnacast


#endif /* defined(__dlnacast__httpcomm__) */
