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

#ifndef __dlnacast__logger__
#define __dlnacast__logger__

#include <sys/time.h>
#include <pthread.h>
#include <stdarg.h>
#include <stdio.h>
#include <errno.h>
#include <string>

#include <syslog.h>

#include "dcobj.hpp"

using namespace std;

#if defined(DEBUG) || ALWAYS_DEBUG
#define DEBUGLOGGING 1
#define DBGLOGENABLED(lvl) globalLogger.logEnabled(lvl)
#define DBGLOG(lvl,...) { if (globalLogger.logEnabled(lvl)) globalLogger.log(lvl,##__VA_ARGS__); }
#define DBGFOCUSLOG FOCUSLOG
#define LOGGER_DEFAULT_LOGLEVEL LOG_DEBUG
#else
#define DEBUGLOGGING 0
#define DBGLOGENABLED(lvl) false
#define DBGLOG(lvl,...)
#define DBGFOCUSLOG(...)
#define LOGGER_DEFAULT_LOGLEVEL LOG_NOTICE
#endif

#if FOCUSLOGLEVEL
#define FOCUSLOG(...) LOG(FOCUSLOGLEVEL,##__VA_ARGS__)
#define FOCUSLOGGING 1
#define FOCUSLOGENABLED globalLogger.logEnabled(FOCUSLOGLEVEL)
#else
#define FOCUSLOGGING 0
#define FOCUSLOG(...)
#define FOCUSLOGENABLED false
#endif

#define LOGENABLED(lvl) globalLogger.logEnabled(lvl)
#define LOG(lvl,...) { if (globalLogger.logEnabled(lvl)) globalLogger.log(lvl,##__VA_ARGS__); }

#define SETLOGLEVEL(lvl) globalLogger.setLogLevel(lvl)
#define SETERRLEVEL(lvl, dup) globalLogger.setErrLevel(lvl, dup)
#define LOGLEVEL (globalLogger.getLogLevel())


namespace dlnacast {

  class Logger : public DcObj
  {
    pthread_mutex_t reportMutex;
    int logLevel;
    int stderrLevel;
    bool errToStdout;
  public:
    Logger();
    virtual ~Logger();

    /// test if log is enabled at a given level
    /// @param aErrLevel level to check
    /// @return true if any logging (stderr or stdout) is enabled at the specified level
    bool logEnabled(int aErrLevel);

    /// log a message
    /// @param aErrLevel error level of the message
    /// @param aFmt, ... printf style error message
    void log(int aErrLevel, const char *aFmt, ... );

    /// set log level
    /// @param aLogLevel the new log level
    /// @note even if aLogLevel is set to suppress messages, messages that qualify for going to stderr
    ///   (see setErrLevel) will still be shown on stderr, but not on stdout.
    void setLogLevel(int aLogLevel);

    /// return current log level
    /// @return current log level
    int getLogLevel() { return logLevel; }

    /// set level required to send messages to stderr
    /// @param aStderrLevel any messages with this or a lower (=higher priority) level will be sent to stderr (default = LOG_ERR)
    /// @param aErrToStdout if set, messages that qualify for stderr will STILL be duplicated to stdout as well (default = true)
    void setErrLevel(int aStderrLevel, bool aErrToStdout);

  private:
    void writeLine(FILE *aStream, const char *aTimeStamp, char aLevelChar, bool aMultiline, const string &aMessage);

  };

} // namespace dlnacast


extern dlnacast::Logger globalLogger;



#endif /* defined(__dlnacast__logger__) */
