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

#ifndef __dlnacast__descriptionresolver__
#define __dlnacast__descriptionresolver__

#include "dc_common.hpp"
#include "upnpdevice.hpp"

using namespace std;

namespace dlnacast {

  // Errors
  typedef enum {
    DescriptionErrorOK,
    DescriptionErrorXml, ///< description is not well-formed XML
    DescriptionErrorNoAVTransport, ///< description has no AVTransport service
  } DescriptionErrors;

  class DescriptionError : public Error
  {
  public:
    static const char *domain() { return "Description"; }
    virtual const char *getErrorDomain() const { return DescriptionError::domain(); };
    DescriptionError(DescriptionErrors aError) : Error(ErrorCode(aError)) {};
    DescriptionError(DescriptionErrors aError, std::string aErrorMessage) : Error(ErrorCode(aError), aErrorMessage) {};
  };


  /// a service entry of the description's root device
  typedef struct {
    string serviceType;
    string controlURL;
  } ServiceDescription;

  typedef vector<ServiceDescription> ServiceDescriptionVector;

  /// the parts of a UPnP device description document we use
  typedef struct {
    string friendlyName; ///< root/device/friendlyName
    ServiceDescriptionVector services; ///< root/device/serviceList/service
  } DeviceDescription;


  /// parse a UPnP device description
  /// @param aXml the description document
  /// @param aDescription will receive friendly name and services of the root device
  /// @return error if aXml is not well-formed
  /// @note elements other than the ones in DeviceDescription are ignored, as are embedded devices
  ErrorPtr parseDeviceDescription(const string &aXml, DeviceDescription &aDescription);

  /// make a control URL absolute
  /// @param aLocation URL of the description document the control URL comes from
  /// @param aControlURL control URL as found in the description
  /// @return absolute control URL
  string normalizeControlURL(const string &aLocation, const string &aControlURL);

  /// build a device from its description
  /// @param aCandidate the advertisement the description was fetched for
  /// @param aXml the description document
  /// @param aDevice will receive the device
  /// @return error if description is not well-formed or has no AVTransport service
  ErrorPtr deviceFromDescription(const Candidate &aCandidate, const string &aXml, Device &aDevice);


  class DeviceResolver;
  typedef boost::intrusive_ptr<DeviceResolver> DeviceResolverPtr;

  /// turns advertisements into devices
  class DeviceResolver : public DcObj
  {
  public:
    /// resolve a candidate
    /// @param aCandidate the advertisement
    /// @param aDevice will receive the device
    /// @return error if the candidate cannot be resolved into a castable device
    /// @note called on a separate thread per candidate, implementations must be thread safe
    virtual ErrorPtr resolve(const Candidate &aCandidate, Device &aDevice) = 0;
  };


  /// resolver fetching the device description document via HTTP
  class DescriptionResolver : public DeviceResolver
  {
    typedef DeviceResolver inherited;

    MLMicroSeconds timeout;

  public:

    /// @param aTimeout timeout for fetching the description
    DescriptionResolver(MLMicroSeconds aTimeout = 5*Second);

    virtual ErrorPtr resolve(const Candidate &aCandidate, Device &aDevice);
  };

} // namespace dlnacast


#endif /* defined(__dlnacast__descriptionresolver__) */
