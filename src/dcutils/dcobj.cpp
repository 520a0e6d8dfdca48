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

#include "dcobj.hpp"

using namespace dlnacast;

namespace dlnacast {

  void intrusive_ptr_add_ref(DcObj* o)
  {
    o->refCount.fetch_add(1, boost::memory_order_relaxed);
  }

  void intrusive_ptr_release(DcObj* o)
  {
    if (o->refCount.fetch_sub(1, boost::memory_order_release)==1) {
      // last reference gone
      boost::atomic_thread_fence(boost::memory_order_acquire);
      delete o;
    }
  }

}
