#include <usbmon/devices.hpp>

#include <ostream>
#include <sstream>

namespace usbmon {

std::string describeDevice (const std::string& id, const DeviceRecord& record) {
    auto os = std::ostringstream{};
    os << '\'' << stringAttribute(record, attr::kModel) << "' ("
       << stringAttribute(record, attr::kVendorId) << ':'
       << stringAttribute(record, attr::kModelId) << ")@" << id;
    return os.str();
}

std::ostream& operator<< (std::ostream& os, const DeviceEvent& event) {
    return os << (event.type == DeviceEvent::ADD ? "ADD " : "REMOVE ")
              << describeDevice(event.id, event.record);
}

} // usbmon
