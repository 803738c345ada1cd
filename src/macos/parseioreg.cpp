#include <usbmon/macos/ioreg.hpp>

#include <usbmon/log.hpp>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/regex.hpp>

#include <iomanip>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace usbmon { namespace ioreg {

namespace {

const std::map<std::string, std::string>& ioregToUdev () {
    static const auto table = std::map<std::string, std::string>{
        {"USB Product Name", attr::kModel},
        {"USB Vendor Name", attr::kVendor},
        {"USB Serial Number", attr::kSerial},
        {"kUSBProductString", attr::kModelFromDatabase},
        {"kUSBVendorString", attr::kVendorFromDatabase},
        {"idVendor", attr::kVendorId},
        {"idProduct", attr::kModelId},
        {"bDeviceClass", attr::kUsbClassFromDatabase}
    };
    return table;
}

// http://www.usb.org/developers/defined_class
std::string usbClassName (const std::string& code) {
    static const auto names = std::map<unsigned, std::string>{
        {0x00, "(Defined at Interface level)"},
        {0x01, "Audio"},
        {0x02, "Communications"},
        {0x03, "Human Interface Device"},
        {0x05, "Physical Interface Device"},
        {0x06, "Imaging"},
        {0x07, "Printer"},
        {0x08, "Mass Storage"},
        {0x09, "Hub"},
        {0x0a, "CDC Data"},
        {0x0b, "Chip/SmartCard"},
        {0x0d, "Content Security"},
        {0x0e, "Video"},
        {0x0f, "Personal Healthcare"},
        {0x10, "Audio/Video"},
        {0x11, "Billboard"},
        {0xdc, "Diagnostic"},
        {0xe0, "Wireless"},
        {0xef, "Miscellaneous Device"},
        {0xfe, "Application Specific Interface"},
        {0xff, "Vendor Specific Class"}
    };
    auto value = 0u;
    if (boost::conversion::try_lexical_convert(code, value)) {
        auto it = names.find(value);
        if (it != names.end()) {
            return it->second;
        }
    }
    log::Logger lg;
    BOOST_LOG_SEV(lg, log::warning) << "Unknown USB device class '" << code
        << "', keeping the raw value";
    return code;
}

std::string unquote (std::string value) {
    boost::algorithm::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }
    return value;
}

bool isPseudoDevice (const std::string& name, const std::string& className) {
    return className == "IORegistryEntry"
        || className == "AppleUSBRootHubDevice"
        || boost::algorithm::contains(name, "Root Hub Simulation");
}

struct Entry {
    std::string name;
    std::string className;
    std::map<std::string, std::string> properties;
};

void addEntry (Snapshot& devices, const Entry& entry) {
    if (entry.name.empty() || entry.properties.empty()
            || isPseudoDevice(entry.name, entry.className)) {
        return;
    }

    auto record = blankRecord();
    for (const auto& property : entry.properties) {
        const auto& key = property.first;
        if (key == attr::kVendorId || key == attr::kModelId) {
            record[key] = hexId(property.second);
        }
        else if (key == attr::kUsbClassFromDatabase) {
            record[key] = usbClassName(property.second);
        }
        else {
            record[key] = property.second;
        }
    }
    record[attr::kDevName] = entry.name;
    record[attr::kDevType] = entry.className;
    devices[entry.name] = std::move(record);
}

} // <anonymous>

std::string hexId (const std::string& decimal) {
    auto value = 0u;
    if (!boost::conversion::try_lexical_convert(decimal, value) || value > 0xffff) {
        log::Logger lg;
        BOOST_LOG_SEV(lg, log::warning) << "Could not read '" << decimal
            << "' as a USB id, keeping the raw value";
        return decimal;
    }
    auto os = std::ostringstream{};
    os << std::hex << std::setw(4) << std::setfill('0') << value;
    return os.str();
}

Snapshot parseIoreg (const std::string& output) {
    static const auto header = boost::regex{R"(\+-o\s+(.+?)\s+<class\s+([^,>]+))"};
    static const auto property = boost::regex{R"re("([^"]+)"\s*=\s*(.*)$)re"};

    auto lines = std::vector<std::string>{};
    boost::algorithm::split(lines, output, [] (char c) { return c == '\n'; });

    auto devices = Snapshot{};
    auto entry = Entry{};
    for (const auto& line : lines) {
        auto match = boost::smatch{};
        if (boost::regex_search(line, match, header)) {
            addEntry(devices, entry);
            entry = Entry{match[1], match[2], {}};
        }
        else if (boost::regex_search(line, match, property)) {
            const auto& table = ioregToUdev();
            auto it = table.find(match[1]);
            if (it != table.end()) {
                entry.properties[it->second] = unquote(match[2]);
            }
        }
    }
    addEntry(devices, entry);
    return devices;
}

}} // usbmon::ioreg
