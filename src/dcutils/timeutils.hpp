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

#ifndef __dlnacast__timeutils__
#define __dlnacast__timeutils__

#include <string>

#include <boost/chrono.hpp>

using namespace std;

namespace dlnacast {

  // timing unit
  typedef long long MLMicroSeconds;
  const MLMicroSeconds Never = 0;
  const MLMicroSeconds Infinite = -1;
  const MLMicroSeconds MicroSecond = 1;
  const MLMicroSeconds MilliSecond = 1000;
  const MLMicroSeconds Second = 1000*MilliSecond;
  const MLMicroSeconds Minute = 60*Second;

  /// @return monotonic time in microseconds, only useful for measuring intervals
  MLMicroSeconds monotonicTime();

  /// @return current wall clock time as microseconds since the unix epoch
  MLMicroSeconds unixTime();

  /// format a unix time as RFC 3339 UTC timestamp
  /// @param aUnixTime microseconds since the unix epoch
  /// @return timestamp like "2015-03-04T12:34:56Z"
  string rfc3339Time(MLMicroSeconds aUnixTime);

  /// convert to a boost chrono duration, for use with boost::thread timed waits
  inline boost::chrono::microseconds chronoDuration(MLMicroSeconds aDuration)
  {
    return boost::chrono::microseconds(aDuration<0 ? 0 : aDuration);
  }

} // namespace dlnacast

#endif /* defined(__dlnacast__timeutils__) */
