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

#ifndef __dlnacast__deviceregistry__
#define __dlnacast__deviceregistry__

#include "dc_common.hpp"
#include "upnpdevice.hpp"

#include <boost/thread/shared_mutex.hpp>

using namespace std;

namespace dlnacast {

  typedef set<string> IdentitySet;
  typedef map<string, MLMicroSeconds> LastSeenMap;

  class DeviceRegistry;
  typedef boost::intrusive_ptr<DeviceRegistry> DeviceRegistryPtr;

  /// the set of currently known devices, keyed by identity
  /// @note all readers get copies. Changes are applied once per discovery round as a whole,
  ///   so readers see either the state before or after a round, never a mix.
  class DeviceRegistry : public DcObj
  {
    typedef DcObj inherited;
    typedef map<string, Device> DeviceMap;

    DeviceMap devices;
    boost::shared_mutex registryMutex;

  public:

    DeviceRegistry();
    virtual ~DeviceRegistry();

    /// @return copies of all devices, in no particular order
    DeviceVector listAll();

    /// get a device
    /// @param aUuid identity of the device
    /// @param aDevice will receive a copy of the device if found
    /// @return false if no device with this identity is registered
    bool get(const string &aUuid, Device &aDevice);

    /// @return true if a device with this identity is registered
    bool contains(const string &aUuid);

    /// @return number of registered devices
    size_t size();

    /// apply the outcome of a discovery round
    /// @param aFound identities seen during the round. All other registered devices are removed,
    ///   except those in aInserts
    /// @param aLastSeen new lastSeen times for registered devices
    /// @param aInserts resolved devices, added or replacing the registered device with the same identity
    void applyRound(const IdentitySet &aFound, const LastSeenMap &aLastSeen, const DeviceVector &aInserts);
  };

} // namespace dlnacast


#endif /* defined(__dlnacast__deviceregistry__) */
