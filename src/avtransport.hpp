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

#ifndef __dlnacast__avtransport__
#define __dlnacast__avtransport__

#include "dc_common.hpp"

using namespace std;

namespace dlnacast {

  #define AVTRANSPORT_SERVICE_TYPE "urn:schemas-upnp-org:service:AVTransport:1"

  class AVTransportClient;
  typedef boost::intrusive_ptr<AVTransportClient> AVTransportClientPtr;

  /// UPnP AVTransport control point, makes a renderer play a media URL
  class AVTransportClient : public DcObj
  {
    typedef DcObj inherited;

    MLMicroSeconds timeout;

  public:

    /// @param aTimeout timeout for each SOAP request
    AVTransportClient(MLMicroSeconds aTimeout = 10*Second);
    virtual ~AVTransportClient();

    /// set the media URL and start playing it
    /// @param aControlURL the absolute AVTransport control URL of the renderer
    /// @param aMediaURL the media to play
    /// @param aTitle title to show on the renderer, empty for none
    /// @return OK if both SetAVTransportURI and Play succeeded. A non-200 answer is returned as
    ///   WebError with the HTTP status as code and the response body in the message.
    ///   Play is not attempted if SetAVTransportURI fails.
    ErrorPtr play(const string &aControlURL, const string &aMediaURL, const string &aTitle);

    /// DIDL-Lite item describing the media, not yet escaped for embedding
    /// @param aMediaURL the media URL
    /// @param aTitle the title
    /// @return single line DIDL-Lite document
    static string didlLiteMetadata(const string &aMediaURL, const string &aTitle);

    /// @return arguments of SetAVTransportURI
    static string setAVTransportURIArgs(const string &aMediaURL, const string &aTitle);

    /// @return complete SOAP envelope for an AVTransport action
    static string soapEnvelope(const char *aAction, const string &aArguments);

  private:

    ErrorPtr soapAction(const string &aControlURL, const char *aAction, const string &aArguments);

  };

} // namespace dlnacast


#endif /* defined(__dlnacast__avtransport__) */
