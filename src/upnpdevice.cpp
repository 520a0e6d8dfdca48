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

#include "upnpdevice.hpp"

using namespace dlnacast;


Device::Device() :
  lastSeen(Never)
{
}


JsonObjectPtr Device::toJson() const
{
  JsonObjectPtr o = JsonObject::newObj();
  o->add("usn", JsonObject::newString(uuid));
  o->add("location", JsonObject::newString(location));
  o->add("server", JsonObject::newString(server));
  o->add("friendly_name", JsonObject::newString(friendlyName));
  o->add("last_seen", JsonObject::newString(rfc3339Time(lastSeen)));
  o->add("control_url", JsonObject::newString(controlURL));
  return o;
}


string Device::shortDesc() const
{
  return string_format("'%s' (%s)", friendlyName.c_str(), uuid.c_str());
}
