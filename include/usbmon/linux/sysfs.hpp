#ifndef USBMON_LINUX_SYSFS_HPP
#define USBMON_LINUX_SYSFS_HPP

#include <usbmon/devicesource.hpp>

#include <boost/filesystem/path.hpp>

namespace usbmon { namespace sysfs {

boost::filesystem::path sysRoot ();
// $SYSFS_PATH, or /sys.

// Reads USB devices straight out of sysfs. Used where udev is not available, e.g. in containers.
// Database names (ID_*_FROM_DATABASE) come from udev's hwdb and stay empty here.
class SysfsDeviceSource : public DeviceSource {
public:
    explicit SysfsDeviceSource (boost::filesystem::path root = sysRoot());

    Snapshot devices () override;

private:
    boost::filesystem::path mRoot;
};

}} // usbmon::sysfs

#endif
