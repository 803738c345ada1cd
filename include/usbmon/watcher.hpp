#ifndef USBMON_WATCHER_HPP
#define USBMON_WATCHER_HPP

#include <usbmon/devices.hpp>
#include <usbmon/devicesource.hpp>

#include <boost/asio/io_context.hpp>

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <iosfwd>
#include <memory>
#include <string>
#include <thread>

namespace usbmon {

using DeviceCallback = std::function<void(const std::string& id, const DeviceRecord& record)>;
using ErrorCallback = std::function<void(std::exception_ptr)>;

enum class MonitorState {
    NotRunning,
    Running,
    StopRequested
};

std::ostream& operator<< (std::ostream& os, MonitorState state);

static constexpr const std::chrono::milliseconds kPollInterval{500};
static constexpr const std::chrono::milliseconds kStopTimeout{5000};
static constexpr const unsigned kFailuresBeforeError = 5;
// Consecutive failed checks before the monitor thread reports to the error callback.

// Keeps the last known snapshot of a device source and turns differences into callbacks, either on
// demand or from a background thread. The background thread polls the source, or follows its event
// stream if it has one.
class Watcher {
public:
    explicit Watcher (SourceFactory factory, DeviceFilter filter = {});
    ~Watcher ();

    Watcher (const Watcher&) = delete;
    Watcher& operator= (const Watcher&) = delete;

    Snapshot devices ();
    // Filtered devices present right now. Does not touch the last known snapshot.

    SnapshotDifferences changesFromLastCheck (bool updateLastCheck = true);
    // Devices added and removed since the last known snapshot. Pass false to peek without
    // consuming the changes.

    void checkChanges (const DeviceCallback& onConnect, const DeviceCallback& onDisconnect,
            bool updateLastCheck = true);
    // Calls onDisconnect for every removed device, then onConnect for every added one, on the
    // calling thread. Either callback may be empty.

    void startMonitoring (DeviceCallback onConnect, DeviceCallback onDisconnect,
            std::chrono::milliseconds interval = kPollInterval, ErrorCallback onError = {});
    // Throws AlreadyRunningError unless the monitor is stopped. Callbacks run on the monitor thread
    // and must not block for long.

    void stopMonitoring (std::chrono::milliseconds timeout = kStopTimeout,
            bool warnIfAlreadyStopped = true);
    // Waits up to `timeout` for the monitor thread. If it does not finish, logs a warning and
    // forgets about it; the monitor is stopped either way.

    MonitorState state () const;
    // NotRunning also once the monitor thread has given up on its own, for example because the
    // source could not be built on it. Call stopMonitoring or startMonitoring to collect it.

    const Snapshot& initialDevices () const { return mInitialDevices; }
    Snapshot lastCheckDevices () const;

private:
    struct Shared;
    class Loop;

    std::shared_ptr<Shared> mShared;
    Snapshot mInitialDevices;

    std::atomic<MonitorState> mState{MonitorState::NotRunning};
    std::atomic<unsigned> mRun{0};
    std::shared_ptr<boost::asio::io_context> mContext;
    std::thread mThread;
    std::future<void> mDone;
};

} // namespace usbmon

#endif
