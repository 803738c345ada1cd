#include <usbmon/devices.hpp>

#include <algorithm>
#include <iterator>

namespace usbmon {

namespace {

bool byId (const Snapshot::value_type& a, const Snapshot::value_type& b) {
    return a.first < b.first;
}

bool matchesTemplate (const DeviceRecord& record, const FilterTemplate& filterTemplate) {
    return std::all_of(filterTemplate.cbegin(), filterTemplate.cend(),
        [&record] (const FilterTemplate::value_type& required) {
            auto it = record.find(required.first);
            return it != record.end() && it->second == required.second;
        });
}

} // <anonymous>

bool DeviceFilter::matches (const DeviceRecord& record) const {
    if (mTemplates.empty()) {
        return true;
    }
    return std::any_of(mTemplates.cbegin(), mTemplates.cend(),
        [&record] (const FilterTemplate& t) { return matchesTemplate(record, t); });
}

Snapshot DeviceFilter::apply (const Snapshot& devices) const {
    auto kept = Snapshot{};
    std::copy_if(devices.cbegin(), devices.cend(), std::inserter(kept, kept.end()),
        [this] (const Snapshot::value_type& d) { return matches(d.second); });
    return kept;
}

SnapshotDifferences snapshotDifferences (const Snapshot& previous, const Snapshot& current) {
    auto devicesRemoved = Snapshot{};
    std::set_difference(previous.cbegin(), previous.cend(),
        current.cbegin(), current.cend(),
        std::inserter(devicesRemoved, devicesRemoved.end()), byId);
    // Compute `previous - current` by id, with the records we last saw.

    auto devicesAdded = Snapshot{};
    std::set_difference(current.cbegin(), current.cend(),
        previous.cbegin(), previous.cend(),
        std::inserter(devicesAdded, devicesAdded.end()), byId);
    // Compute `current - previous` by id, with the fresh records.

    return {std::move(devicesAdded), std::move(devicesRemoved)};
}

}  // usbmon
