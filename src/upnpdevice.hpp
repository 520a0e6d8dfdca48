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

#ifndef __dlnacast__upnpdevice__
#define __dlnacast__upnpdevice__

#include "dc_common.hpp"
#include "jsonobject.hpp"

using namespace std;

namespace dlnacast {

  /// a resolved media renderer
  /// @note plain value type, the registry owns its copies and hands out copies to readers
  class Device
  {
  public:
    string uuid; ///< identity: the USN up to the first "::"
    string location; ///< URL of the description document
    string friendlyName; ///< from the description document
    string server; ///< SERVER banner from the advertisement, may be empty
    string controlURL; ///< absolute AVTransport control URL
    MLMicroSeconds lastSeen; ///< unix time of the most recent advertisement

    Device();

    /// @return JSON representation for the API
    JsonObjectPtr toJson() const;

    /// @return short description for logging
    string shortDesc() const;
  };

  typedef vector<Device> DeviceVector;


  /// an advertisement waiting to be deduplicated and resolved
  typedef struct {
    string uuid; ///< identity
    string location; ///< description URL
    string server; ///< SERVER banner
    MLMicroSeconds seen; ///< unix time when the advertisement was received
  } Candidate;

} // namespace dlnacast


#endif /* defined(__dlnacast__upnpdevice__) */
