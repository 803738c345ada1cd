#include <usbmon/platform.hpp>

#include <usbmon/error.hpp>
#include <usbmon/log.hpp>

#include <boost/predef.h>

#if BOOST_OS_LINUX
#include <usbmon/linux/sysfs.hpp>
#include <usbmon/linux/udevadm.hpp>
#elif BOOST_OS_WINDOWS
#include <usbmon/windows/extraction.hpp>
#elif BOOST_OS_MACOS
#include <usbmon/macos/ioreg.hpp>
#endif

namespace usbmon {

const char* platformName () {
#if BOOST_OS_LINUX
    return "linux";
#elif BOOST_OS_WINDOWS
    return "windows";
#elif BOOST_OS_MACOS
    return "macos";
#else
    return "unknown";
#endif
}

SourceFactory makePlatformSourceFactory () {
#if BOOST_OS_LINUX
    if (udev::udevadmAvailable()) {
        return [] { return std::make_unique<udev::UdevDeviceSource>(); };
    }
    log::Logger lg;
    BOOST_LOG_SEV(lg, log::info) << "udevadm not found, reading USB devices from "
        << sysfs::sysRoot() << " without hot-plug events";
    return [] { return std::make_unique<sysfs::SysfsDeviceSource>(); };
#elif BOOST_OS_WINDOWS
    return [] { return std::make_unique<setupapi::SetupApiDeviceSource>(); };
#elif BOOST_OS_MACOS
    return [] { return std::make_unique<ioreg::IoregDeviceSource>(); };
#else
    throw UnsupportedPlatformError{platformName()};
#endif
}

} // namespace usbmon
