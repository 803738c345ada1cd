#ifndef USBMON_LINUX_UDEVADM_HPP
#define USBMON_LINUX_UDEVADM_HPP

#include <usbmon/devicesource.hpp>

#include <boost/filesystem/path.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace usbmon { namespace udev {

using Properties = std::map<std::string, std::string>;

bool parseUdevadm (const std::string& paragraph, Properties& properties);
// Parse one record of `udevadm info --export-db` ("E: KEY=value" lines) or of
// `udevadm monitor --property` ("KEY=value" lines). Lines without a property are skipped. Returns
// false on parse failure.

std::vector<Properties> parseUdevadmDatabase (const std::string& output);
// Split `udevadm info --export-db` output into records and parse each one. Records that fail to
// parse are logged and skipped.

bool parseUdevadm (const std::string& paragraph, DeviceEvent& event);
// Parse one `udevadm monitor --udev --property` record into an event. Returns false if the record
// is not an add or remove of a USB device-level node.

bool isUsbDevice (const Properties& properties);
// SUBSYSTEM=usb, DEVTYPE=usb_device and a device node. Interfaces and endpoints are not devices.

bool isRootHub (const Properties& properties);
// Root hubs live at a device path ending in "usbN".

Snapshot snapshotFromDatabase (const std::string& output);

// Enumerates through `udevadm info --export-db` and follows `udevadm monitor` for events.
class UdevDeviceSource : public DeviceSource {
public:
    UdevDeviceSource ();
    // Throws SourceQueryError if udevadm is not on the PATH.

    Snapshot devices () override;
    std::unique_ptr<DeviceEventStream> openEventStream (boost::asio::io_context& context) override;

private:
    boost::filesystem::path mUdevadm;
};

bool udevadmAvailable ();

}} // usbmon::udev

#endif
