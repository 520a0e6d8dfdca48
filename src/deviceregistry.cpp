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

#include "deviceregistry.hpp"

#include <boost/thread/locks.hpp>

using namespace dlnacast;

typedef boost::shared_lock<boost::shared_mutex> ReadLock;
typedef boost::unique_lock<boost::shared_mutex> WriteLock;


DeviceRegistry::DeviceRegistry()
{
}


DeviceRegistry::~DeviceRegistry()
{
}


DeviceVector DeviceRegistry::listAll()
{
  ReadLock lock(registryMutex);
  DeviceVector all;
  all.reserve(devices.size());
  for (DeviceMap::iterator pos = devices.begin(); pos!=devices.end(); ++pos) {
    all.push_back(pos->second);
  }
  return all;
}


bool DeviceRegistry::get(const string &aUuid, Device &aDevice)
{
  ReadLock lock(registryMutex);
  DeviceMap::iterator pos = devices.find(aUuid);
  if (pos==devices.end()) return false;
  aDevice = pos->second;
  return true;
}


bool DeviceRegistry::contains(const string &aUuid)
{
  ReadLock lock(registryMutex);
  return devices.find(aUuid)!=devices.end();
}


size_t DeviceRegistry::size()
{
  ReadLock lock(registryMutex);
  return devices.size();
}


void DeviceRegistry::applyRound(const IdentitySet &aFound, const LastSeenMap &aLastSeen, const DeviceVector &aInserts)
{
  WriteLock lock(registryMutex);
  // sweep everything not seen this round
  DeviceMap::iterator pos = devices.begin();
  while (pos!=devices.end()) {
    if (aFound.count(pos->first)==0) {
      LOG(LOG_NOTICE, "Device removed: %s\n", pos->second.shortDesc().c_str());
      devices.erase(pos++);
    }
    else {
      ++pos;
    }
  }
  // refresh the survivors
  for (LastSeenMap::const_iterator rpos = aLastSeen.begin(); rpos!=aLastSeen.end(); ++rpos) {
    DeviceMap::iterator dpos = devices.find(rpos->first);
    if (dpos!=devices.end() && rpos->second>dpos->second.lastSeen) {
      dpos->second.lastSeen = rpos->second;
    }
  }
  // add newly resolved devices
  for (DeviceVector::const_iterator ipos = aInserts.begin(); ipos!=aInserts.end(); ++ipos) {
    DeviceMap::iterator dpos = devices.find(ipos->uuid);
    if (dpos==devices.end()) {
      LOG(LOG_NOTICE, "Device added: %s at %s\n", ipos->shortDesc().c_str(), ipos->location.c_str());
      devices[ipos->uuid] = *ipos;
    }
    else {
      LOG(LOG_INFO, "Device updated: %s now at %s\n", ipos->shortDesc().c_str(), ipos->location.c_str());
      MLMicroSeconds seen = dpos->second.lastSeen;
      dpos->second = *ipos;
      if (seen>dpos->second.lastSeen) dpos->second.lastSeen = seen;
    }
  }
}
