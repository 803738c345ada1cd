#ifndef USBMON_WINDOWS_EXTRACTION_HPP
#define USBMON_WINDOWS_EXTRACTION_HPP

#include <usbmon/devicesource.hpp>

#include <boost/regex.hpp>

#include <string>
#include <vector>

namespace usbmon { namespace setupapi {

// What SetupAPI tells us about one device, before normalization.
struct RawDevice {
    std::string instanceId;     // USB\VID_0781&PID_5567\4C530001230314117283
    std::string friendlyName;
    std::string description;
    std::string manufacturer;
    std::string setupClass;
    AttributeList hardwareIds;
    AttributeList compatibleIds;
};

std::string driverType (const std::string& instanceId);
// First segment of the instance id: "USB", "USBSTOR", ...

bool isPseudoDevice (const std::string& instanceId);
// Root hubs are reported by SetupAPI but are not devices anyone plugged in.

std::string extractAttribute (const AttributeList& candidates, const std::string& attribute,
        const boost::regex& pattern);
// Search every candidate for `pattern` and return its first capture group. With no match at all,
// logs a warning and returns the first candidate unchanged. Throws
// AttributeExtractionInconsistency if candidates yield different captures.

DeviceRecord normalize (const RawDevice& raw);

Snapshot snapshotFromRawDevices (const std::vector<RawDevice>& raws);
// Drops pseudo-devices and keys the rest by instance id.

class SetupApiDeviceSource : public DeviceSource {
public:
    SetupApiDeviceSource ();

    Snapshot devices () override;
    bool threadAffine () const override { return true; }
};

}} // usbmon::setupapi

#endif
