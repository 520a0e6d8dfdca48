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

#ifndef __dlnacast__ssdpsearcher__
#define __dlnacast__ssdpsearcher__

#include "dc_common.hpp"
#include "ssdp.hpp"
#include "udpcomm.hpp"

#include <boost/thread/thread.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/scoped_ptr.hpp>

using namespace std;

namespace dlnacast {

  class SearchTrigger;
  typedef boost::intrusive_ptr<SearchTrigger> SearchTriggerPtr;

  /// something that can be asked to search for devices now
  class SearchTrigger : public DcObj
  {
  public:
    /// request an immediate search
    /// @note must not block, the search happens asynchronously
    virtual void trigger() = 0;
  };


  /// callback for datagrams received in response to a search
  typedef boost::function<void (const string &aDatagram)> SsdpResponseCB;

  class SsdpSearcher;
  typedef boost::intrusive_ptr<SsdpSearcher> SsdpSearcherPtr;

  /// periodically sends M-SEARCH on all eligible local addresses
  class SsdpSearcher : public SearchTrigger
  {
    typedef SearchTrigger inherited;

    BindSelector bindSelector;
    MLMicroSeconds interval;
    SsdpResponseCB responseHandler;

    boost::mutex stateMutex;
    boost::condition_variable wakeUp;
    bool triggered;
    bool stopRequested;
    boost::scoped_ptr<boost::thread> searchThread;

  public:

    /// @param aBindSelector selects the local addresses to search from
    /// @param aInterval period of the searches
    SsdpSearcher(const BindSelector &aBindSelector, MLMicroSeconds aInterval);
    virtual ~SsdpSearcher();

    /// set handler for search responses
    /// @param aResponseHandler called on the search thread for every datagram received on the search sockets
    /// @note responses to M-SEARCH are sent unicast to the searching socket, not to the multicast group
    void setResponseHandler(SsdpResponseCB aResponseHandler);

    /// start searching. The first search is sent immediately
    void start();

    /// stop searching, waits for the search thread to terminate
    void stop();

    /// request an extra search now
    virtual void trigger();

    /// send one M-SEARCH from every eligible local address and collect responses for a while
    /// @param aResponseTime how long to wait for responses on the search sockets, 0 for not waiting at all
    /// @return number of M-SEARCH datagrams sent
    int search(MLMicroSeconds aResponseTime);

  protected:

    /// get the local addresses to search from
    /// @param aFamily AF_INET or AF_INET6
    /// @param aAddresses will receive the addresses
    /// @return error if no address of this family can be used
    virtual ErrorPtr searchAddresses(int aFamily, NetIfAddressVector &aAddresses);

    /// open a socket on a local address and send the M-SEARCH from it
    /// @param aAddr the local address
    /// @param aMessage the M-SEARCH datagram
    /// @param aSocket will receive the socket, which stays open to receive the responses
    /// @return error if the socket could not be opened or the datagram not sent
    virtual ErrorPtr sendSearch(const NetIfAddress &aAddr, const string &aMessage, UdpCommPtr &aSocket);

  private:

    void searchThreadRoutine();
    bool isStopping();

  };

} // namespace dlnacast


#endif /* defined(__dlnacast__ssdpsearcher__) */
