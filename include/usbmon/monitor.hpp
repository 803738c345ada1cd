#ifndef USBMON_MONITOR_HPP
#define USBMON_MONITOR_HPP

#include <usbmon/devices.hpp>
#include <usbmon/devicesource.hpp>
#include <usbmon/watcher.hpp>

#include <chrono>
#include <memory>

namespace usbmon {

// Cross-platform USB device monitor. Picks the device source for the platform we were built for
// and exposes one set of operations on top of it.
//
//     auto logitech = usbmon::FilterTemplate{{usbmon::attr::kVendorId, std::string{"046d"}}};
//     usbmon::Monitor monitor{usbmon::DeviceFilter{logitech}};
//     monitor.startMonitoring(
//         [](const std::string& id, const usbmon::DeviceRecord& record) { ... },
//         [](const std::string& id, const usbmon::DeviceRecord& record) { ... });
class Monitor {
public:
    explicit Monitor (DeviceFilter filter = {});
    // Throws UnsupportedPlatformError if this platform has no device source, SourceQueryError if
    // the initial query fails.

    explicit Monitor (SourceFactory factory, DeviceFilter filter = {});

    Snapshot devices () { return mWatcher->devices(); }

    SnapshotDifferences changesFromLastCheck (bool updateLastCheck = true) {
        return mWatcher->changesFromLastCheck(updateLastCheck);
    }

    void checkChanges (const DeviceCallback& onConnect = {}, const DeviceCallback& onDisconnect = {},
            bool updateLastCheck = true) {
        mWatcher->checkChanges(onConnect, onDisconnect, updateLastCheck);
    }

    void startMonitoring (DeviceCallback onConnect = {}, DeviceCallback onDisconnect = {},
            std::chrono::milliseconds interval = kPollInterval, ErrorCallback onError = {});

    void stopMonitoring (std::chrono::milliseconds timeout = kStopTimeout,
            bool warnIfAlreadyStopped = true) {
        mWatcher->stopMonitoring(timeout, warnIfAlreadyStopped);
    }

    MonitorState state () const { return mWatcher->state(); }
    bool running () const { return MonitorState::NotRunning != mWatcher->state(); }

    const Snapshot& initialDevices () const { return mWatcher->initialDevices(); }
    // The devices present when this monitor was constructed.

private:
    std::unique_ptr<Watcher> mWatcher;
};

} // namespace usbmon

#endif
