#include <usbmon/windows/extraction.hpp>

#include <usbmon/error.hpp>
#include <usbmon/log.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <map>
#include <utility>
#include <vector>

namespace usbmon { namespace setupapi {

namespace {

using PatternTable = std::vector<std::pair<std::string, boost::regex>>;

// Instance ids encode vendor and product differently depending on the driver that enumerated the
// device: USB\VID_0781&PID_5567\... for plain USB devices, and
// USBSTOR\DISK&VEN_SANDISK&PROD_CRUZER_BLADE&REV_1.00\... for mass storage.
const std::map<std::string, PatternTable>& patternsByDriver () {
    static const auto table = std::map<std::string, PatternTable>{
        {"USB", {
            {attr::kVendorId, boost::regex{R"(VID_([0-9A-Fa-f]{4}))"}},
            {attr::kModelId, boost::regex{R"(PID_([0-9A-Fa-f]{4}))"}},
            {attr::kDevType, boost::regex{R"(^(.+?)\\)"}}
        }},
        {"USBSTOR", {
            {attr::kVendorId, boost::regex{R"(VEN_([^&\\]+))"}},
            {attr::kModelId, boost::regex{R"(PROD_([^&\\]+))"}},
            {attr::kDevType, boost::regex{R"(^(.+?)\\)"}}
        }}
    };
    return table;
}

const PatternTable& patternsFor (const std::string& driver) {
    const auto& table = patternsByDriver();
    auto it = table.find(driver);
    if (it == table.end()) {
        log::Logger lg;
        BOOST_LOG_SEV(lg, log::warning) << "No attribute patterns for driver type '" << driver
            << "', reading it like a plain USB device";
        return table.at("USB");
    }
    return it->second;
}

const char* const kPseudoDevices[] = {"ROOT_HUB20", "ROOT_HUB30"};

} // <anonymous>

std::string driverType (const std::string& instanceId) {
    return instanceId.substr(0, instanceId.find('\\'));
}

bool isPseudoDevice (const std::string& instanceId) {
    for (auto pseudo : kPseudoDevices) {
        if (boost::algorithm::icontains(instanceId, pseudo)) {
            return true;
        }
    }
    return false;
}

std::string extractAttribute (const AttributeList& candidates, const std::string& attribute,
        const boost::regex& pattern) {
    auto found = std::vector<std::string>{};
    for (const auto& candidate : candidates) {
        auto match = boost::smatch{};
        if (boost::regex_search(candidate, match, pattern)) {
            found.push_back(match[1]);
        }
    }

    if (found.empty()) {
        auto raw = candidates.empty() ? std::string{} : candidates.front();
        log::Logger lg;
        BOOST_LOG_SEV(lg, log::warning) << "Could not find " << attribute << " with pattern '"
            << pattern.str() << "' in '" << raw << "', keeping the raw value";
        return raw;
    }

    for (const auto& value : found) {
        if (!boost::algorithm::iequals(value, found.front())) {
            throw AttributeExtractionInconsistency{attribute, pattern.str()};
        }
    }
    return found.front();
}

DeviceRecord normalize (const RawDevice& raw) {
    auto record = blankRecord();
    auto name = raw.friendlyName.empty() ? raw.description : raw.friendlyName;

    record[attr::kModel] = name;
    record[attr::kVendor] = name;
    record[attr::kModelFromDatabase] = raw.description;
    record[attr::kVendorFromDatabase] = raw.manufacturer;
    record[attr::kUsbInterfaces] = raw.compatibleIds;
    record[attr::kUsbClassFromDatabase] = raw.setupClass;
    record[attr::kDevName] = raw.instanceId;

    // Hardware ids repeat the vendor and product of the instance id, so they must agree with it.
    auto candidates = AttributeList{raw.instanceId};
    candidates.insert(candidates.end(), raw.hardwareIds.begin(), raw.hardwareIds.end());

    for (const auto& entry : patternsFor(driverType(raw.instanceId))) {
        record[entry.first] = extractAttribute(candidates, entry.first, entry.second);
    }

    for (auto key : {attr::kVendorId, attr::kModelId}) {
        record[key] = boost::algorithm::to_lower_copy(stringAttribute(record, key));
    }
    return record;
}

Snapshot snapshotFromRawDevices (const std::vector<RawDevice>& raws) {
    auto devices = Snapshot{};
    for (const auto& raw : raws) {
        if (isPseudoDevice(raw.instanceId)) {
            continue;
        }
        devices[raw.instanceId] = normalize(raw);
    }
    return devices;
}

}} // usbmon::setupapi
