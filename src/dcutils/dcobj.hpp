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

#ifndef __dlnacast__dcobj__
#define __dlnacast__dcobj__

#include <boost/intrusive_ptr.hpp>
#include <boost/atomic.hpp>

namespace dlnacast {

  class DcObj;

  void intrusive_ptr_add_ref(DcObj* o);
  void intrusive_ptr_release(DcObj* o);

  /// base class for all reference counted objects
  /// @note the reference count is atomic, so DcObj based objects (errors, devices)
  ///   can be handed between threads. The object itself is not otherwise synchronized.
  class DcObj {
    friend void intrusive_ptr_add_ref(DcObj* o);
    friend void intrusive_ptr_release(DcObj* o);

    boost::atomic<int> refCount;

  protected:
    DcObj() : refCount(0) {};
    virtual ~DcObj() {}; // important for multiple inheritance

  private:
    // copying would duplicate the reference count
    DcObj(const DcObj &);
    DcObj &operator=(const DcObj &);
  };

  typedef boost::intrusive_ptr<DcObj> DcObjPtr;

} // namespace dlnacast


#endif /* defined(__dlnacast__dcobj__) */
