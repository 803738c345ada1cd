#ifndef USBMON_ATTRIBUTES_HPP
#define USBMON_ATTRIBUTES_HPP

#include <boost/variant.hpp>

#include <map>
#include <string>
#include <vector>

namespace usbmon {

// Device record keys. These are the udev property names, used on every platform.
namespace attr {

constexpr const char kVendorId[] = "ID_VENDOR_ID";
constexpr const char kVendor[] = "ID_VENDOR";
constexpr const char kModel[] = "ID_MODEL";
constexpr const char kModelId[] = "ID_MODEL_ID";
constexpr const char kSerial[] = "ID_SERIAL";
constexpr const char kUsbInterfaces[] = "ID_USB_INTERFACES";
constexpr const char kUsbClassFromDatabase[] = "ID_USB_CLASS_FROM_DATABASE";
constexpr const char kVendorFromDatabase[] = "ID_VENDOR_FROM_DATABASE";
constexpr const char kModelFromDatabase[] = "ID_MODEL_FROM_DATABASE";
constexpr const char kDevName[] = "DEVNAME";
constexpr const char kDevType[] = "DEVTYPE";

} // namespace attr

using AttributeList = std::vector<std::string>;
using AttributeValue = boost::variant<std::string, AttributeList>;

using DeviceRecord = std::map<std::string, AttributeValue>;
using Snapshot = std::map<std::string, DeviceRecord>;
// Device identifier -> record.

const std::vector<std::string>& deviceAttributes ();
// Every key a DeviceRecord carries, in schema order.

bool isListAttribute (const std::string& key);

DeviceRecord blankRecord ();
// A record with every schema key, all empty.

DeviceRecord makeRecord (const std::map<std::string, std::string>& properties);
// Build a complete record from raw string properties already named by the schema. Missing keys
// become empty, list-valued keys are split on ':'. Keys outside the schema are dropped.

AttributeList splitAttributeList (const std::string& value, char separator = ':');
// Split, dropping empty pieces, so ":0e0100:0e0200:" becomes {"0e0100", "0e0200"}.

const std::string& stringAttribute (const DeviceRecord& record, const std::string& key);
// Value of a string attribute, or a reference to an empty string if the key is absent or
// list-valued.

AttributeList listAttribute (const DeviceRecord& record, const std::string& key);

std::string toString (const AttributeValue& value);

} // namespace usbmon

#endif
