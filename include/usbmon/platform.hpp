#ifndef USBMON_PLATFORM_HPP
#define USBMON_PLATFORM_HPP

#include <usbmon/devicesource.hpp>

namespace usbmon {

const char* platformName ();

SourceFactory makePlatformSourceFactory ();
// The device source for the platform we were built for. Throws UnsupportedPlatformError elsewhere.

} // namespace usbmon

#endif
