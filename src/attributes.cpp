#include <usbmon/attributes.hpp>

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/split.hpp>

#include <algorithm>

namespace usbmon {

const std::vector<std::string>& deviceAttributes () {
    static const auto attributes = std::vector<std::string>{
        attr::kModelId,
        attr::kModel,
        attr::kModelFromDatabase,
        attr::kVendor,
        attr::kVendorId,
        attr::kVendorFromDatabase,
        attr::kUsbInterfaces,
        attr::kUsbClassFromDatabase,
        attr::kDevName,
        attr::kDevType,
        attr::kSerial
    };
    return attributes;
}

bool isListAttribute (const std::string& key) {
    return key == attr::kUsbInterfaces;
}

DeviceRecord blankRecord () {
    auto record = DeviceRecord{};
    for (const auto& key : deviceAttributes()) {
        if (isListAttribute(key)) {
            record[key] = AttributeList{};
        }
        else {
            record[key] = std::string{};
        }
    }
    return record;
}

DeviceRecord makeRecord (const std::map<std::string, std::string>& properties) {
    auto record = blankRecord();
    for (auto& entry : record) {
        auto it = properties.find(entry.first);
        if (it == properties.end()) {
            continue;
        }
        if (isListAttribute(entry.first)) {
            entry.second = splitAttributeList(it->second);
        }
        else {
            entry.second = it->second;
        }
    }
    return record;
}

AttributeList splitAttributeList (const std::string& value, char separator) {
    auto pieces = AttributeList{};
    boost::algorithm::split(pieces, value, [separator] (char c) { return c == separator; });
    pieces.erase(std::remove(pieces.begin(), pieces.end(), std::string{}), pieces.end());
    return pieces;
}

const std::string& stringAttribute (const DeviceRecord& record, const std::string& key) {
    static const std::string empty;
    auto it = record.find(key);
    if (it == record.end()) {
        return empty;
    }
    auto value = boost::get<std::string>(&it->second);
    return value ? *value : empty;
}

AttributeList listAttribute (const DeviceRecord& record, const std::string& key) {
    auto it = record.find(key);
    if (it == record.end()) {
        return {};
    }
    if (auto value = boost::get<AttributeList>(&it->second)) {
        return *value;
    }
    const auto& value = boost::get<std::string>(it->second);
    return value.empty() ? AttributeList{} : AttributeList{value};
}

namespace {

struct ToString : boost::static_visitor<std::string> {
    std::string operator() (const std::string& s) const { return s; }
    std::string operator() (const AttributeList& l) const {
        return '[' + boost::algorithm::join(l, ", ") + ']';
    }
};

} // <anonymous>

std::string toString (const AttributeValue& value) {
    return boost::apply_visitor(ToString{}, value);
}

} // namespace usbmon
