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

#include "childthread.hpp"

#include <time.h>
#include <errno.h>
#include <signal.h>
#include <string.h>

using namespace dlnacast;

// sent to the child to make its blocking calls return with EINTR
#define INTERRUPT_SIGNAL SIGUSR2
// blocking calls entered after a signal arrived are interrupted by the next one
#define INTERRUPT_REPEAT (50*MilliSecond)


static void interrupt_signal_handler(int aSignal)
{
  // nop, only needs to be there so the signal does not terminate the process
}


static pthread_once_t interruptHandlerOnce = PTHREAD_ONCE_INIT;

static void install_interrupt_handler()
{
  struct sigaction sa;
  memset(&sa, 0, sizeof(sa));
  sa.sa_handler = interrupt_signal_handler;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0; // no SA_RESTART, interrupted calls must fail
  if (sigaction(INTERRUPT_SIGNAL, &sa, NULL)<0) {
    LOG(LOG_ERR, "ChildThread: cannot install interrupt signal handler: %s\n", strerror(errno));
  }
}


static void *thread_start_function(void *arg)
{
  // pass into method of wrapper
  return static_cast<ChildThread *>(arg)->startFunction();
}


ChildThread::ChildThread(ThreadRoutine aThreadRoutine) :
  threadRunning(false),
  completed(false),
  terminationRequested(false),
  threadRoutine(aThreadRoutine)
{
  pthread_once(&interruptHandlerOnce, install_interrupt_handler);
  pthread_mutex_init(&stateMutex, NULL);
  // completion wait uses the monotonic clock, so wall clock changes do not affect timeouts
  pthread_condattr_t attr;
  pthread_condattr_init(&attr);
  pthread_condattr_setclock(&attr, CLOCK_MONOTONIC);
  pthread_cond_init(&completedCond, &attr);
  pthread_condattr_destroy(&attr);
}


ChildThread::~ChildThread()
{
  // cancel thread
  cancel();
  pthread_cond_destroy(&completedCond);
  pthread_mutex_destroy(&stateMutex);
}


ErrorPtr ChildThread::start()
{
  if (threadRunning) return TextError::err("thread already running");
  completed = false;
  terminationRequested = false;
  threadRunning = true; // before creating it, to make sure it is set when child starts to run
  int res = pthread_create(&pthread, NULL, thread_start_function, this);
  if (res!=0) {
    threadRunning = false;
    return SysError::err(res, "Cannot create thread: ");
  }
  return ErrorPtr();
}


void *ChildThread::startFunction()
{
  // the creating thread might block the interrupt signal
  sigset_t interruptSet;
  sigemptyset(&interruptSet);
  sigaddset(&interruptSet, INTERRUPT_SIGNAL);
  pthread_sigmask(SIG_UNBLOCK, &interruptSet, NULL);
  // run the routine
  threadRoutine(*this);
  // signal termination
  pthread_mutex_lock(&stateMutex);
  completed = true;
  pthread_cond_signal(&completedCond);
  pthread_mutex_unlock(&stateMutex);
  return NULL;
}


bool ChildThread::waitCompletion(MLMicroSeconds aTimeout)
{
  if (!threadRunning) return true; // nothing to wait for
  struct timespec deadline;
  clock_gettime(CLOCK_MONOTONIC, &deadline);
  if (aTimeout!=Infinite) {
    deadline.tv_sec += aTimeout/Second;
    deadline.tv_nsec += (aTimeout%Second)*1000;
    if (deadline.tv_nsec>=1000000000) {
      deadline.tv_sec++;
      deadline.tv_nsec -= 1000000000;
    }
  }
  pthread_mutex_lock(&stateMutex);
  while (!completed) {
    int res;
    if (aTimeout==Infinite)
      res = pthread_cond_wait(&completedCond, &stateMutex);
    else
      res = pthread_cond_timedwait(&completedCond, &stateMutex, &deadline);
    if (res==ETIMEDOUT) break;
  }
  bool done = completed;
  pthread_mutex_unlock(&stateMutex);
  if (done) {
    finalizeThreadExecution();
  }
  return done;
}


// synchronize with actual end of thread execution
void ChildThread::finalizeThreadExecution()
{
  pthread_join(pthread, NULL);
  threadRunning = false;
}


bool ChildThread::terminate(MLMicroSeconds aGracePeriod)
{
  if (!threadRunning) return true;
  terminationRequested = true;
  MLMicroSeconds deadline = monotonicTime()+aGracePeriod;
  do {
    // until joined, the thread id stays valid even if the routine has returned already
    int res = pthread_kill(pthread, INTERRUPT_SIGNAL);
    if (res!=0) {
      LOG(LOG_ERR, "ChildThread: cannot interrupt thread: %s\n", strerror(res));
      break;
    }
    if (waitCompletion(INTERRUPT_REPEAT)) return true;
  } while (monotonicTime()<deadline);
  if (waitCompletion(0)) return true;
  LOG(LOG_WARNING, "ChildThread: routine did not return within %lld mS after being interrupted, cancelling it\n", (long long)(aGracePeriod/MilliSecond));
  cancel();
  return false;
}


void ChildThread::cancel()
{
  if (threadRunning) {
    // cancel it
    pthread_cancel(pthread);
    // wait for cancellation to complete
    finalizeThreadExecution();
  }
}
