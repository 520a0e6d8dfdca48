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

#include "logger.hpp"

#include <string.h>
#include <ctype.h>
#include <time.h>

#include "utils.hpp"

using namespace dlnacast;

dlnacast::Logger globalLogger;

// single letter shown after the timestamp, indexed by syslog level
static const char levelChars[] = "XACEWNID";


Logger::Logger()
{
  pthread_mutex_init(&reportMutex, NULL);
  logLevel = LOGGER_DEFAULT_LOGLEVEL;
  stderrLevel = LOG_ERR;
  errToStdout = true;
}


Logger::~Logger()
{
  pthread_mutex_destroy(&reportMutex);
}


#define LOGBUFSIZ 1024


bool Logger::logEnabled(int aErrLevel)
{
  return (aErrLevel<=logLevel);
}


void Logger::log(int aErrLevel, const char *aFmt, ... )
{
  if (logEnabled(aErrLevel) || aErrLevel<=stderrLevel) {
    va_list args;
    va_start(args, aFmt);
    // format the message
    string message;
    string_format_v(message, false, aFmt, args);
    va_end(args);
    // escape non-printables and detect multiline
    bool isMultiline = false;
    string::size_type i=0;
    while (i<message.length()) {
      char c = message[i];
      if (c=='\n') {
        if (i!=message.length()-1)
          isMultiline = true; // not just trailing LF
      }
      else if (!isprint((unsigned char)c) && (uint8_t)c<0x80) {
        // ASCII control character, but not bit 7 set (UTF8 component char)
        string esc = string_format("\\x%02x", (unsigned)(c & 0xFF));
        message.replace(i, 1, esc);
        i += esc.size()-1;
      }
      i++;
    }
    // make sure message is terminated by exactly one LF
    if (message.empty() || message[message.length()-1]!='\n') message += '\n';
    // create date
    char tsbuf[40];
    char *p = tsbuf;
    struct timeval t;
    struct tm tmbuf;
    gettimeofday(&t, NULL);
    p += strftime(p, sizeof(tsbuf), "[%Y-%m-%d %H:%M:%S", localtime_r(&t.tv_sec, &tmbuf));
    sprintf(p, ".%03d]", (int)(t.tv_usec/1000));
    char levelChar = aErrLevel>=LOG_EMERG && aErrLevel<=LOG_DEBUG ? levelChars[aErrLevel] : '?';
    // output
    pthread_mutex_lock(&reportMutex);
    if (aErrLevel<=stderrLevel) {
      // must go to stderr anyway
      writeLine(stderr, tsbuf, levelChar, isMultiline, message);
    }
    if (logEnabled(aErrLevel) && (aErrLevel>stderrLevel || errToStdout)) {
      // must go to stdout as well
      writeLine(stdout, tsbuf, levelChar, isMultiline, message);
    }
    pthread_mutex_unlock(&reportMutex);
  }
}


void Logger::writeLine(FILE *aStream, const char *aTimeStamp, char aLevelChar, bool aMultiline, const string &aMessage)
{
  fprintf(aStream, "%s %c", aTimeStamp, aLevelChar);
  if (aMultiline)
    fputs("\n", aStream);
  else
    fputs(" ", aStream);
  fputs(aMessage.c_str(), aStream);
  fflush(aStream);
}


void Logger::setLogLevel(int aLogLevel)
{
  if (aLogLevel<LOG_EMERG || aLogLevel>LOG_DEBUG) return;
  logLevel = aLogLevel;
}


void Logger::setErrLevel(int aStderrLevel, bool aErrToStdout)
{
  if (aStderrLevel<LOG_EMERG || aStderrLevel>LOG_DEBUG) return;
  stderrLevel = aStderrLevel;
  errToStdout = aErrToStdout;
}
