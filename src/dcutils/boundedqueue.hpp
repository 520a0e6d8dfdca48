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

#ifndef __dlnacast__boundedqueue__
#define __dlnacast__boundedqueue__

#include "dc_common.hpp"

#include <deque>

#include <boost/thread/mutex.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/condition_variable.hpp>

using namespace std;

namespace dlnacast {

  /// bounded FIFO for handing items from producer threads to a consumer thread
  /// @note senders never wait longer than they ask for, so a slow consumer can never stall a producer
  ///   (such as a socket receive loop) indefinitely.
  /// @note after close(), all sends fail and receives only return what is still queued.
  template <class T>
  class BoundedQueue
  {
    typedef boost::unique_lock<boost::mutex> Lock;

    size_t capacity;
    bool closed;
    std::deque<T> items;
    boost::mutex queueMutex;
    boost::condition_variable notEmpty;
    boost::condition_variable notFull;

  public:

    /// create a queue
    /// @param aCapacity max number of items the queue can hold
    BoundedQueue(size_t aCapacity) :
      capacity(aCapacity),
      closed(false)
    {
    }

    /// put an item into the queue without waiting
    /// @param aItem the item
    /// @return false if the queue is full or closed, item was dropped then
    bool trySend(const T &aItem)
    {
      Lock lock(queueMutex);
      if (closed || items.size()>=capacity) return false;
      items.push_back(aItem);
      notEmpty.notify_one();
      return true;
    }

    /// put an item into the queue, waiting for room if needed
    /// @param aItem the item
    /// @param aTimeout max time to wait for room in the queue
    /// @return false if the queue did not have room within aTimeout, or is closed
    bool send(const T &aItem, MLMicroSeconds aTimeout)
    {
      Lock lock(queueMutex);
      boost::chrono::steady_clock::time_point deadline = boost::chrono::steady_clock::now() + chronoDuration(aTimeout);
      while (!closed && items.size()>=capacity) {
        if (notFull.wait_until(lock, deadline)==boost::cv_status::timeout) break;
      }
      if (closed || items.size()>=capacity) return false;
      items.push_back(aItem);
      notEmpty.notify_one();
      return true;
    }

    /// take the oldest item out of the queue, waiting for one if needed
    /// @param aItem will receive the item
    /// @param aTimeout max time to wait for an item, Infinite to wait until an item arrives or the queue is closed
    /// @return false if no item arrived within aTimeout or the queue is closed and empty
    bool receive(T &aItem, MLMicroSeconds aTimeout)
    {
      Lock lock(queueMutex);
      if (aTimeout==Infinite) {
        while (!closed && items.empty()) notEmpty.wait(lock);
      }
      else {
        boost::chrono::steady_clock::time_point deadline = boost::chrono::steady_clock::now() + chronoDuration(aTimeout);
        while (!closed && items.empty()) {
          if (notEmpty.wait_until(lock, deadline)==boost::cv_status::timeout) break;
        }
      }
      if (items.empty()) return false;
      aItem = items.front();
      items.pop_front();
      notFull.notify_one();
      return true;
    }

    /// take the oldest item out of the queue if there is one
    /// @param aItem will receive the item
    /// @return false if queue is empty
    bool tryReceive(T &aItem)
    {
      return receive(aItem, 0);
    }

    /// close the queue, waking up all waiting senders and receivers
    void close()
    {
      Lock lock(queueMutex);
      closed = true;
      notEmpty.notify_all();
      notFull.notify_all();
    }

    /// @return true if queue has been closed
    bool isClosed()
    {
      Lock lock(queueMutex);
      return closed;
    }

    /// @return number of items currently queued
    size_t size()
    {
      Lock lock(queueMutex);
      return items.size();
    }

  };

} // namespace dlnacast


#endif /* defined(__dlnacast__boundedqueue__) */
