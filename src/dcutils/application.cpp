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

#include "application.hpp"

#include <stdlib.h>
#include <string.h>
#include <pthread.h>

using namespace dlnacast;

#pragma mark - Application base class

Application::Application()
{
  sigemptyset(&terminationSignals);
  sigaddset(&terminationSignals, SIGINT);
  sigaddset(&terminationSignals, SIGTERM);
  sigaddset(&terminationSignals, SIGHUP);
  pthread_sigmask(SIG_BLOCK, &terminationSignals, NULL);
}


Application::~Application()
{
}


int Application::main(int argc, char **argv)
{
  // NOP application
  return EXIT_SUCCESS;
}


ErrorPtr Application::initialize()
{
  // NOP
  return ErrorPtr();
}


void Application::cleanup(int aSignal)
{
  // NOP
}


int Application::run()
{
  ErrorPtr err = initialize();
  if (!Error::isOK(err)) {
    LOG(LOG_ERR, "Cannot start: %s\n", err->description().c_str());
    return EXIT_FAILURE;
  }
  // wait for termination
  int sig = 0;
  while (true) {
    int res = sigwait(&terminationSignals, &sig);
    if (res==0) break;
    if (res!=EINTR) {
      LOG(LOG_ERR, "sigwait failed: %s\n", strerror(res));
      break;
    }
  }
  LOG(LOG_NOTICE, "Terminating on signal %d\n", sig);
  cleanup(sig);
  return EXIT_SUCCESS;
}


void Application::terminateApp(int aExitCode)
{
  exit(aExitCode);
}


#pragma mark - CmdLineApp command line application


CmdLineApp::CmdLineApp() :
  optionDescriptors(NULL)
{
}


CmdLineApp::~CmdLineApp()
{
}


void CmdLineApp::setCommandDescriptors(const char *aSynopsis, const CmdLineOptionDescriptor *aOptionDescriptors)
{
  optionDescriptors = aOptionDescriptors;
  synopsis = aSynopsis ? aSynopsis : "Usage: %1$s";
}


#define MAX_INDENT 20

static void printSpaces(size_t aNum)
{
  while (aNum>0) {
    fprintf(stderr, " ");
    aNum--;
  }
}


void CmdLineApp::showUsage()
{
  // print synopsis
  fprintf(stderr, synopsis.c_str(), invocationName.c_str());
  // print options
  // - calculate indent
  size_t indent = 0;
  const CmdLineOptionDescriptor *optionDescP = optionDescriptors;
  bool anyShortOpts = false;
  while (optionDescP && (optionDescP->longOptionName!=NULL || optionDescP->shortOptionChar!='\x00')) {
    if (optionDescP->shortOptionChar) {
      anyShortOpts = true;
    }
    size_t n = 0;
    if (optionDescP->longOptionName) {
      n += strlen(optionDescP->longOptionName)+2; // "--XXXXX"
    }
    const char *desc = optionDescP->optionDescription;
    if (optionDescP->withArgument && desc) {
      const char *p = strchr(desc, ':');
      if (p) {
        n += 1 + (p-desc); // add room for argument description
      }
    }
    if (n>MAX_INDENT) n = MAX_INDENT;
    if (n>indent) indent = n; // new max
    optionDescP++;
  }
  if (anyShortOpts) indent += 4; // "-X, " prefix
  indent += 2 + 2; // two at beginning, two at end
  // - print options
  fprintf(stderr, "Options:\n");
  optionDescP = optionDescriptors;
  while (optionDescP && (optionDescP->longOptionName!=NULL || optionDescP->shortOptionChar!='\x00')) {
    size_t used = 2;
    fprintf(stderr, "  "); // start indent
    if (anyShortOpts) {
      // short names exist, print them for those options that have them
      if (optionDescP->shortOptionChar)
        fprintf(stderr, "-%c", optionDescP->shortOptionChar);
      else
        fprintf(stderr, "  ");
      used += 2;
      if (optionDescP->longOptionName) {
        // long option follows, fill up
        fprintf(stderr, optionDescP->shortOptionChar ? ", " : "  ");
        used += 2;
      }
    }
    // long name
    if (optionDescP->longOptionName) {
      fprintf(stderr, "--%s", optionDescP->longOptionName);
      used += strlen(optionDescP->longOptionName)+2;
    }
    // argument
    const char *desc = optionDescP->optionDescription;
    if (optionDescP->withArgument && desc) {
      const char *p = strchr(desc, ':');
      if (p) {
        size_t n = (p-desc);
        string argDesc(desc,n);
        fprintf(stderr, " %s", argDesc.c_str());
        used += argDesc.length()+1;
        desc += n+1; // desc starts after colon
      }
    }
    // complete first line indent, or start description on next line if name is too long
    if (used<indent) {
      printSpaces(indent-used);
    }
    else {
      fprintf(stderr, "\n");
      printSpaces(indent);
    }
    // print option description, properly indented
    if (desc) {
      while (*desc) {
        if (*desc=='\n') {
          // next line
          fprintf(stderr, "\n");
          printSpaces(indent);
        }
        else {
          fprintf(stderr, "%c", *desc);
        }
        desc++;
      }
    }
    // end of option, next line
    fprintf(stderr, "\n");
    optionDescP++;
  }
  fprintf(stderr, "\n");
}


bool CmdLineApp::parseCommandLine(int aArgc, char **aArgv)
{
  if (aArgc>0) {
    invocationName = aArgv[0];
    int rawArgIndex=1;
    while(rawArgIndex<aArgc) {
      const char *argP = aArgv[rawArgIndex];
      if (*argP=='-' && argP[1]!=0) {
        // option argument
        argP++;
        bool longOpt = false;
        string optName;
        string optArg;
        bool optArgFound = false;
        if (*argP=='-') {
          // long option
          longOpt = true;
          optName = argP+1;
          if (optName=="help") {
            showUsage();
            terminateApp(EXIT_SUCCESS);
          }
        }
        else {
          // short option
          optName = argP;
          if (optName.length()>1 && optName[1]!='=') {
            // option argument follows directly after single char option
            optArgFound = true; // is non-empty by definition
            optArg = optName.substr(1,string::npos);
            optName.erase(1,string::npos);
          }
        }
        // search for option argument directly following option separated by equal sign
        string::size_type n = optName.find_first_of('=');
        if (n!=string::npos) {
          optArgFound = true; // explicit specification, counts as option argument even if empty string
          optArg = optName.substr(n+1,string::npos);
          optName.erase(n,string::npos);
        }
        // search for option descriptor
        const CmdLineOptionDescriptor *optionDescP = optionDescriptors;
        bool optionFound = false;
        while (optionDescP && (optionDescP->longOptionName!=NULL || optionDescP->shortOptionChar!='\x00')) {
          // not yet end of descriptor list
          if (
            (longOpt && optionDescP->longOptionName && optName==optionDescP->longOptionName) ||
            (!longOpt && optionDescP->shortOptionChar && optName[0]==optionDescP->shortOptionChar)
          ) {
            // option match found
            if (!optionDescP->withArgument) {
              // option without argument
              if (optArgFound) {
                fprintf(stderr, "Option '%s' does not expect an argument\n", optName.c_str());
                showUsage();
                return false;
              }
            }
            else {
              // option with argument
              if (!optArgFound) {
                // check for next arg as option arg
                if (rawArgIndex<aArgc-1) {
                  // there is a next argument, use it as option argument
                  optArgFound = true;
                  optArg = aArgv[++rawArgIndex];
                }
              }
              if (!optArgFound) {
                fprintf(stderr, "Option '%s' requires an argument\n", optName.c_str());
                showUsage();
                return false;
              }
            }
            // now have option processed by subclass
            if (!processOption(*optionDescP, optArg.c_str())) {
              // not processed, store instead
              if (optionDescP->longOptionName)
                optName = optionDescP->longOptionName;
              else
                optName = string(1, optionDescP->shortOptionChar);
              // save in map
              options[optName] = optArg;
            }
            optionFound = true;
            break;
          }
          // next in list
          optionDescP++;
        }
        if (!optionFound) {
          fprintf(stderr, "Unknown Option '%s'\n", optName.c_str());
          showUsage();
          return false;
        }
      }
      else {
        // non-option argument
        // - have argument processed by subclass
        if (!processArgument(argP)) {
          // not processed, store instead
          arguments.push_back(argP);
        }
      }
      // next argument
      rawArgIndex++;
    }
  }
  return true;
}


size_t CmdLineApp::numArguments()
{
  return arguments.size();
}


const char *CmdLineApp::getOption(const char *aOptionName)
{
  const char *opt = NULL;
  OptionsMap::iterator pos = options.find(aOptionName);
  if (pos!=options.end()) {
    opt = pos->second.c_str();
  }
  return opt;
}


bool CmdLineApp::getIntOption(const char *aOptionName, int &aInteger)
{
  const char *opt = getOption(aOptionName);
  if (opt) {
    char *end = NULL;
    long v = strtol(opt, &end, 10);
    if (end!=opt && *end==0) {
      aInteger = (int)v;
      return true;
    }
  }
  return false;
}


bool CmdLineApp::getStringOption(const char *aOptionName, string &aString)
{
  const char *opt = getOption(aOptionName);
  if (opt && *opt) {
    aString = opt;
    return true;
  }
  return false;
}
