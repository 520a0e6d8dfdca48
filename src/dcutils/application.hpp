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

#ifndef __dlnacast__application__
#define __dlnacast__application__

#include "dc_common.hpp"

#include <signal.h>

using namespace std;

namespace dlnacast {

  class Application : public DcObj
  {
    sigset_t terminationSignals;

  public:
    /// constructor
    /// @note blocks the termination signals (SIGINT, SIGTERM, SIGHUP) for the calling thread, so threads
    ///   created afterwards inherit the mask and the signals are only handled in run()
    Application();

    /// destructor
    virtual ~Application();

    /// main routine
    /// @param argc argument count as passed to C-level main() entry point
    /// @param argv argument pointer array as passed to C-level main() entry point
    virtual int main(int argc, char **argv);

    /// terminate app immediately
    /// @param aExitCode the exit code to return to the parent
    void terminateApp(int aExitCode);

  protected:

    /// run the app: calls initialize(), then waits for a termination signal, then calls cleanup()
    /// @return exit code
    int run();

    /// called from run() before waiting for termination
    /// @return error if app cannot run. run() will then return EXIT_FAILURE without waiting
    virtual ErrorPtr initialize();

    /// called from run() after a termination signal has been received
    /// @param aSignal the signal that caused termination
    virtual void cleanup(int aSignal);
  };


  /// Command line option descriptor
  /// @note a descriptor with both longOptionName==NULL and shortOptionChar=0 terminates a list of option descriptors
  typedef struct {
    char shortOptionChar; ///< the short option name (single character) or 0/NUL if none
    const char *longOptionName; ///< the long option name (string) or NULL if none
    bool withArgument; ///< true if option has an argument (separated by = or next argument)
    const char *optionDescription; ///< the description of the option, can have multiple lines separated by \n
  } CmdLineOptionDescriptor;

  typedef vector<string> ArgumentsVector;
  typedef map<string,string> OptionsMap;

  class CmdLineApp : public Application
  {
    typedef Application inherited;

    const CmdLineOptionDescriptor *optionDescriptors;

    string invocationName;
    string synopsis;
    OptionsMap options;
    ArgumentsVector arguments;

  public:

    /// constructor
    CmdLineApp();

    /// destructor
    virtual ~CmdLineApp();

    /// parse command line.
    /// @param aArgc argument count as passed to C-level main() entry point
    /// @param aArgv argument pointer array as passed to C-level main() entry point
    /// @return false if the command line has syntax errors (usage has been shown then)
    /// @note setCommandDescriptors() must be called before using this method
    /// @note "--help" shows usage and terminates the app with EXIT_SUCCESS
    bool parseCommandLine(int aArgc, char **aArgv);

    /// get option
    /// @param aOptionName the name of the option (longOptionName if exists, shortOptionChar if no longOptionName exists)
    /// @return NULL if option was not specified on the command line, empty string for options without argument, option's argument otherwise
    /// @note parseCommandLine() must be called before using this method
    const char *getOption(const char *aOptionName);

    /// @param aOptionName the name of the option (longOptionName if exists, shortOptionChar if no longOptionName exists)
    /// @param aInteger will be set with the integer value of the option, if any
    /// @return true if option was specified and had a valid integer argument, false otherwise (aInteger will be untouched then)
    /// @note parseCommandLine() must be called before using this method
    bool getIntOption(const char *aOptionName, int &aInteger);

    /// @param aOptionName the name of the option (longOptionName if exists, shortOptionChar if no longOptionName exists)
    /// @param aString will be set to the option argument, if any
    /// @return true if option was specified and had an option argument
    /// @note parseCommandLine() must be called before using this method
    bool getStringOption(const char *aOptionName, string &aString);

    /// get number of (non-processed) arguments
    size_t numArguments();

  protected:

    /// set command description constants (option definitions and synopsis)
    /// @param aSynopsis short usage description, used in showUsage(). %1$s will be replaced by invocationName
    /// @param aOptionDescriptors pointer to array of descriptors for the options
    void setCommandDescriptors(const char *aSynopsis, const CmdLineOptionDescriptor *aOptionDescriptors);

    /// show usage, consisting of invocationName + synopsis + option descriptions
    void showUsage();

    /// process a command line option. Override this to implement processing command line options
    /// @param aOptionDescriptor the descriptor of the option
    /// @param aOptionValue the value of the option, empty string if option has no value
    /// @return true if option has been processed; false if option should be stored for later reference via getOption()
    virtual bool processOption(const CmdLineOptionDescriptor &aOptionDescriptor, const char *aOptionValue) { return false; /* not processed, store */ };

    /// process a non-option command line argument
    /// @param aArgument non-option argument
    /// @return true if argument has been processed; false if argument should be stored (counted by numArguments())
    virtual bool processArgument(const char *aArgument) { return false; /* not processed, store */ };

  };


} // namespace dlnacast


#endif /* defined(__dlnacast__application__) */
