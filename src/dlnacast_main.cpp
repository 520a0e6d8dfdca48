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

#include "discoveryservice.hpp"
#include "avtransport.hpp"
#include "castapi.hpp"

#define DEFAULT_LOGLEVEL LOG_NOTICE
#define DEFAULT_ERRLEVEL LOG_ERR

using namespace dlnacast;


/// Main program for the DLNA cast daemon
class DlnaCastApp : public CmdLineApp
{
  typedef CmdLineApp inherited;

  DiscoveryConfig discoveryConfig;
  CastApiConfig apiConfig;

  DiscoveryServicePtr discovery;
  AVTransportClientPtr avTransport;
  CastApiPtr castApi;

public:

  DlnaCastApp()
  {
  }

  virtual int main(int argc, char **argv)
  {
    const char *usageText =
      "Usage: %1$s [options]\n";
    const CmdLineOptionDescriptor options[] = {
      { 'h', "httpaddr",      true,  "address:[host:]port for the HTTP API, default :8072" },
      { 'i', "interface",     true,  "selector:network interface name or address to search on, default all" },
      { 's', "interval",      true,  "seconds:search interval, default 10" },
      { 'w', "window",        true,  "seconds:collect window of a discovery round, default 3" },
      { 'p', "player",        true,  "pattern:cast to first device whose USN or name contains pattern\nif no device is specified, default UnPlay" },
      { 'l', "loglevel",      true,  "level:set max level of log message detail to show on stdout" },
      { 0  , "errlevel",      true,  "level:set max level for log messages to go to stderr as well" },
      { 0  , "dontlogerrors", false, "don't duplicate error messages (see --errlevel) on stdout" },
      { 0  , "help",          false, "show this text" },
      { 0  , NULL } // list terminator
    };

    // parse the command line, exits when syntax errors occur
    setCommandDescriptors(usageText, options);
    if (!parseCommandLine(argc, argv)) {
      return EXIT_FAILURE;
    }
    if (numArguments()>0) {
      // no non-option arguments expected
      showUsage();
      return EXIT_FAILURE;
    }

    // log level
    int loglevel = DEFAULT_LOGLEVEL;
    getIntOption("loglevel", loglevel);
    SETLOGLEVEL(loglevel);
    int errlevel = DEFAULT_ERRLEVEL;
    getIntOption("errlevel", errlevel);
    SETERRLEVEL(errlevel, !getOption("dontlogerrors"));

    // discovery
    getStringOption("interface", discoveryConfig.bindSelector);
    int secs;
    if (getIntOption("interval", secs)) {
      if (secs<1) {
        fprintf(stderr, "interval must be at least 1 second\n");
        return EXIT_FAILURE;
      }
      discoveryConfig.interval = secs*Second;
    }
    if (getIntOption("window", secs)) {
      if (secs<1) {
        fprintf(stderr, "window must be at least 1 second\n");
        return EXIT_FAILURE;
      }
      discoveryConfig.window = secs*Second;
    }
    // API
    getStringOption("httpaddr", apiConfig.listenAddress);
    getStringOption("player", apiConfig.playerPattern);

    // app now ready to run
    return run();
  }


  virtual ErrorPtr initialize()
  {
    LOG(LOG_NOTICE, "dlnacast starting\n");
    discovery = DiscoveryServicePtr(new DiscoveryService(discoveryConfig));
    ErrorPtr err = discovery->start();
    if (!Error::isOK(err)) {
      // API still serves (an empty device list) without discovery
      LOG(LOG_ERR, "Discovery could not be started: %s\n", err->description().c_str());
    }
    avTransport = AVTransportClientPtr(new AVTransportClient);
    castApi = CastApiPtr(new CastApi(apiConfig, discovery, avTransport));
    err = castApi->start();
    if (!Error::isOK(err)) {
      discovery->stop();
      return err;
    }
    return ErrorPtr();
  }


  virtual void cleanup(int aSignal)
  {
    if (castApi) castApi->stop();
    if (discovery) discovery->stop();
    LOG(LOG_NOTICE, "dlnacast terminated\n");
  }

};


int main(int argc, char **argv)
{
  // create the app
  DlnaCastApp *application = new(DlnaCastApp);
  // pass control
  int status = application->main(argc, argv);
  // done
  delete application;
  return status;
}
