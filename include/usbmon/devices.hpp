#ifndef USBMON_DEVICES_HPP
#define USBMON_DEVICES_HPP

#include <usbmon/attributes.hpp>

#include <initializer_list>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace usbmon {

using FilterTemplate = std::map<std::string, AttributeValue>;

// A device passes if it matches every key/value pair of at least one template. With no templates
// at all, every device passes.
class DeviceFilter {
public:
    DeviceFilter () = default;
    DeviceFilter (std::initializer_list<FilterTemplate> templates)
        : mTemplates(templates)
    {}
    explicit DeviceFilter (std::vector<FilterTemplate> templates)
        : mTemplates(std::move(templates))
    {}

    bool matches (const DeviceRecord& record) const;
    Snapshot apply (const Snapshot& devices) const;

    bool empty () const { return mTemplates.empty(); }
    const std::vector<FilterTemplate>& templates () const { return mTemplates; }

private:
    std::vector<FilterTemplate> mTemplates;
};

struct SnapshotDifferences {
    Snapshot added;
    Snapshot removed;
};

SnapshotDifferences snapshotDifferences (const Snapshot& previous, const Snapshot& current);
// Returns `added` (devices whose id is in `current` but not `previous`) and `removed` (devices
// whose id is in `previous` but not `current`). Devices present in both are not reported, even if
// their attributes changed.

struct DeviceEvent {
    enum {
        ADD,
        REMOVE
    } type;
    std::string id;
    DeviceRecord record;
};

std::ostream& operator<< (std::ostream& os, const DeviceEvent& event);

std::string describeDevice (const std::string& id, const DeviceRecord& record);
// "'<model>' (<vendor id>:<model id>)@<id>", for log lines.

} // namespace usbmon

#endif
