#include <usbmon/linux/sysfs.hpp>

#include <usbmon/error.hpp>
#include <usbmon/log.hpp>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

#include <boost/range/adaptor/filtered.hpp>
#include <boost/range/iterator_range.hpp>

#include <algorithm>
#include <cstdlib>
#include <map>
#include <string>
#include <vector>

namespace fs = boost::filesystem;
using namespace boost::adaptors;

namespace usbmon { namespace sysfs {

fs::path sysRoot () {
    auto sysEnv = std::getenv("SYSFS_PATH");
    return fs::path{sysEnv ? sysEnv : "/sys"};
}

namespace {

std::vector<fs::path> listDir (const fs::path& dir) {
    auto entries = std::vector<fs::path>(fs::directory_iterator{dir}, fs::directory_iterator{});
    std::sort(entries.begin(), entries.end());
    return entries;
}

// First line of a sysfs attribute file, or empty if there is no such attribute.
std::string readAttribute (const fs::path& p) {
    auto line = std::string{};
    if (fs::exists(p)) {
        fs::ifstream stream{p};
        if (std::getline(stream, line)) {
            boost::algorithm::trim(line);
        }
    }
    return line;
}

std::map<std::string, std::string> readUevent (const fs::path& p) {
    auto properties = std::map<std::string, std::string>{};
    fs::ifstream stream{p / "uevent"};
    auto line = std::string{};
    while (std::getline(stream, line)) {
        auto eq = line.find('=');
        if (eq != std::string::npos) {
            properties[line.substr(0, eq)] = line.substr(eq + 1);
        }
    }
    return properties;
}

// udev replaces whitespace in vendor and model strings the same way.
std::string udevString (std::string s) {
    boost::algorithm::replace_all(s, " ", "_");
    return s;
}

// Device directories look like "1-1" or "1-1.4". Interfaces ("1-1:1.0") and root hubs ("usb1")
// share the same directory.
bool isDeviceDir (const fs::path& p) {
    auto name = p.filename().string();
    return name.find(':') == std::string::npos
        && !boost::algorithm::starts_with(name, "usb")
        && fs::exists(p / "idVendor");
}

bool isInterfaceDir (const fs::path& p) {
    return fs::exists(p / "bInterfaceClass");
}

AttributeList interfaces (const fs::path& device) {
    auto result = AttributeList{};
    auto entries = listDir(device);
    for (const auto& p : entries | filtered(isInterfaceDir)) {
        auto triple = readAttribute(p / "bInterfaceClass")
            + readAttribute(p / "bInterfaceSubClass")
            + readAttribute(p / "bInterfaceProtocol");
        if (std::find(result.begin(), result.end(), triple) == result.end()) {
            result.push_back(triple);
        }
    }
    return result;
}

} // <anonymous>

SysfsDeviceSource::SysfsDeviceSource (fs::path root)
    : mRoot(std::move(root))
{}

Snapshot SysfsDeviceSource::devices () {
    auto dir = mRoot / "bus" / "usb" / "devices";
    try {
        if (!fs::exists(dir) || !fs::is_directory(dir)) {
            throw SourceQueryError{"sysfs", "no USB devices directory under " + mRoot.string()};
        }

        auto devices = Snapshot{};
        auto entries = listDir(dir);
        for (const auto& p : entries | filtered(isDeviceDir)) {
            auto uevent = readUevent(p);
            auto devName = uevent[attr::kDevName];
            if (devName.empty()) {
                log::Logger lg;
                BOOST_LOG_SEV(lg, log::debug) << "Skipping " << p << ": no device node";
                continue;
            }

            auto record = blankRecord();
            auto vendor = udevString(readAttribute(p / "manufacturer"));
            auto model = udevString(readAttribute(p / "product"));
            auto serial = udevString(readAttribute(p / "serial"));

            record[attr::kVendorId] = readAttribute(p / "idVendor");
            record[attr::kModelId] = readAttribute(p / "idProduct");
            record[attr::kVendor] = vendor;
            record[attr::kModel] = model;
            record[attr::kSerial] = serial.empty() ? vendor + '_' + model
                                                   : vendor + '_' + model + '_' + serial;
            record[attr::kUsbInterfaces] = interfaces(p);
            record[attr::kDevName] = "/dev/" + devName;
            record[attr::kDevType] = uevent[attr::kDevType];

            devices["/dev/" + devName] = std::move(record);
        }
        return devices;
    }
    catch (const fs::filesystem_error& e) {
        throw SourceQueryError{"sysfs", e.what()};
    }
}

}} // usbmon::sysfs
