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

#ifndef __dlnacast__childthread__
#define __dlnacast__childthread__

#include "dc_common.hpp"

#include <pthread.h>

#include <boost/atomic.hpp>

using namespace std;

namespace dlnacast {

  class ChildThread;

  typedef boost::intrusive_ptr<ChildThread> ChildThreadPtr;

  /// thread routine, will be called on a separate thread
  /// @param aThread the object that wraps the thread
  typedef boost::function<void (ChildThread &aThread)> ThreadRoutine;


  /// wrapper for a pthread, used to run blocking calls that have no timeout of their own
  /// @note terminate() interrupts blocking system calls of the routine by a signal, so these return EINTR.
  ///   The routine must treat that as an error and return, releasing what it holds.
  class ChildThread : public DcObj
  {
    typedef DcObj inherited;

    pthread_t pthread; ///< the pthread
    bool threadRunning; ///< set if thread is started and not yet joined
    bool completed; ///< set by the child when the routine has returned
    boost::atomic<bool> terminationRequested;

    pthread_mutex_t stateMutex;
    pthread_cond_t completedCond;

    ThreadRoutine threadRoutine; ///< the actual thread routine to run

  public:

    /// constructor
    /// @param aThreadRoutine the routine to run in the thread
    ChildThread(ThreadRoutine aThreadRoutine);

    /// destructor, cancels the thread if still running
    virtual ~ChildThread();

    /// start the thread
    /// @return error if thread could not be created
    ErrorPtr start();

    /// wait for the thread routine to complete
    /// @param aTimeout max time to wait, Infinite to wait forever
    /// @return true if thread has completed (and is joined), false on timeout
    bool waitCompletion(MLMicroSeconds aTimeout);

    /// ask the routine to end and interrupt its blocking calls until it does
    /// @param aGracePeriod max time to wait for the routine to return
    /// @return true if the routine has returned by itself, false if it had to be cancelled
    bool terminate(MLMicroSeconds aGracePeriod);

    /// @return true when terminate() has been called, to be checked by the routine between blocking calls
    bool shouldTerminate() { return terminationRequested.load(); };

    /// cancel execution and wait for cancellation to complete
    /// @note the routine does not get a chance to release its resources, use terminate() where possible
    void cancel();

    /// method called from thread_start_function from this child thread
    void *startFunction();

  private:

    void finalizeThreadExecution();

  };

} // namespace dlnacast


#endif /* defined(__dlnacast__childthread__) */
