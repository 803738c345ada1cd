#ifndef USBMON_MACOS_IOREG_HPP
#define USBMON_MACOS_IOREG_HPP

#include <usbmon/devicesource.hpp>

#include <string>

namespace usbmon { namespace ioreg {

Snapshot parseIoreg (const std::string& output);
// Parse `ioreg -p IOUSB -w0 -l`. Each "+-o" entry becomes one device keyed by its entry name; the
// plane root and root hub simulations are dropped.

std::string hexId (const std::string& decimal);
// "1452" -> "05ac". Logs a warning and returns the input unchanged if it is not a number.

class IoregDeviceSource : public DeviceSource {
public:
    Snapshot devices () override;
};

}} // usbmon::ioreg

#endif
