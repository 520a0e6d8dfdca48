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

#ifndef __dlnacast__udpcomm__
#define __dlnacast__udpcomm__

#include "dc_common.hpp"
#include "netif.hpp"

using namespace std;

namespace dlnacast {

  // Errors
  typedef enum {
    UdpCommErrorOK,
    UdpCommErrorInvalidAddress, ///< address is not a valid multicast group or local address
    UdpCommErrorNoInterface, ///< requested interface does not exist
    UdpCommErrorNotOpen, ///< socket is not open
    UdpCommErrorJoinFailed, ///< could not join multicast group on any interface
  } UdpCommErrors;

  class UdpCommError : public Error
  {
  public:
    static const char *domain() { return "UdpComm"; }
    virtual const char *getErrorDomain() const { return UdpCommError::domain(); };
    UdpCommError(UdpCommErrors aError) : Error(ErrorCode(aError)) {};
    UdpCommError(UdpCommErrors aError, std::string aErrorMessage) : Error(ErrorCode(aError), aErrorMessage) {};
  };


  class UdpComm;

  typedef boost::intrusive_ptr<UdpComm> UdpCommPtr;

  /// wrapper for a blocking UDP socket, for multicast listening and sending
  class UdpComm : public DcObj
  {
    typedef DcObj inherited;

    int socketFD;
    int protocolFamily;

  public:

    UdpComm();
    virtual ~UdpComm();

    /// open a socket receiving datagrams sent to a multicast group
    /// @param aFamily AF_INET or AF_INET6
    /// @param aGroup numeric multicast group address
    /// @param aPort the port to listen on
    /// @param aIfName interface to join the group on. If empty, the group is joined on all multicast capable interfaces
    /// @param aIfAddr for IPv4, if not NULL, the group is joined on the interface with this address only
    /// @param aRcvBufSize if>0, size of the socket receive buffer to request
    /// @return error if socket could not be opened, bound, or the group could not be joined on any interface
    ErrorPtr openMulticastReceiver(int aFamily, const char *aGroup, uint16_t aPort, const string &aIfName, const struct sockaddr_storage *aIfAddr, int aRcvBufSize);

    /// open a socket for sending multicast datagrams from a specific local address
    /// @param aLocalAddr the local address to bind to (ephemeral port)
    /// @param aIfIndex the interface to send multicasts through (needed for IPv6)
    /// @param aHops multicast TTL / hop limit
    /// @return error if socket could not be opened or bound
    ErrorPtr openSender(const struct sockaddr_storage &aLocalAddr, unsigned int aIfIndex, int aHops = 2);

    /// send a datagram to a numeric address
    /// @param aData the data to send
    /// @param aHost numeric destination address
    /// @param aPort destination port
    /// @param aIfIndex for link local IPv6 destinations: the scope (interface index)
    /// @return error if sending failed
    ErrorPtr sendTo(const string &aData, const char *aHost, uint16_t aPort, unsigned int aIfIndex = 0);

    /// wait for and receive a datagram
    /// @param aData will receive the datagram
    /// @param aMaxSize max datagram size
    /// @param aTimeout max time to wait for a datagram
    /// @param aFromAddr if not NULL, receives the numeric sender address
    /// @return error if socket failed, otherwise OK. If no datagram arrived within aTimeout, aData is empty
    ErrorPtr receive(string &aData, size_t aMaxSize, MLMicroSeconds aTimeout, string *aFromAddr = NULL);

    /// close the socket
    void closeSocket();

    /// @return true if socket is open
    bool isOpen() { return socketFD>=0; };

    /// @return the local port the socket is bound to, 0 if not open or not bound
    uint16_t localPort();

  private:

    ErrorPtr createSocket(int aFamily);
    ErrorPtr joinGroup(const struct sockaddr_storage &aGroupAddr, unsigned int aIfIndex, const struct sockaddr_storage *aIfAddr);

  };

} // namespace dlnacast


#endif /* defined(__dlnacast__udpcomm__) */
