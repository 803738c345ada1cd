#include <usbmon/watcher.hpp>

#include <usbmon/error.hpp>
#include <usbmon/log.hpp>

#include <boost/asio/coroutine.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <future>
#include <mutex>
#include <ostream>
#include <system_error>
#include <utility>

#include <boost/asio/yield.hpp>

namespace usbmon {

namespace {

const unsigned kNoRun = unsigned(-1);

} // <anonymous>

// Everything the monitor thread shares with the Watcher. Held by shared_ptr so a thread we gave up
// waiting for can finish its cycle without touching a destroyed Watcher.
struct Watcher::Shared {
    Shared (SourceFactory f, DeviceFilter fl)
        : factory(std::move(f))
        , filter(std::move(fl))
        , source(factory())
        , threadAffine(source->threadAffine())
    {}

    SnapshotDifferences changes (DeviceSource* own, bool update) {
        std::lock_guard<std::mutex> lock{mutex};
        auto current = filter.apply((own ? *own : *source).devices());
        auto diff = snapshotDifferences(lastCheckDevices, current);
        if (update) {
            lastCheckDevices = std::move(current);
        }
        return diff;
    }

    const SourceFactory factory;
    const DeviceFilter filter;

    std::mutex mutex;
    std::unique_ptr<DeviceSource> source;
    const bool threadAffine;
    Snapshot lastCheckDevices;

    // Number of the last monitor run whose thread gave up before it got going.
    std::atomic<unsigned> deadRun{kNoRun};
};

// Runs on the monitor thread. Lives as long as that thread does, even if the Watcher does not.
class Watcher::Loop {
public:
    Loop (std::shared_ptr<Shared> shared, std::shared_ptr<boost::asio::io_context> context,
            unsigned run, DeviceCallback onConnect, DeviceCallback onDisconnect,
            std::chrono::milliseconds interval, ErrorCallback onError)
        : mContext(std::move(context))
        , mShared(std::move(shared))
        , mRun(run)
        , mTimer(*mContext)
        , mOnConnect(std::move(onConnect))
        , mOnDisconnect(std::move(onDisconnect))
        , mOnError(std::move(onError))
        , mInterval(interval)
    {}

    void run ();

private:
    struct PollOp;
    struct EventOp;

    void check ();
    void handleEvent (const DeviceEvent& event);
    void notify (const DeviceCallback& callback, const std::string& id, const DeviceRecord& record,
            const char* what);
    void report (std::exception_ptr eptr, const std::exception& e);

    // Declared first: the timer and the event stream must be destroyed while the context exists.
    std::shared_ptr<boost::asio::io_context> mContext;
    std::shared_ptr<Shared> mShared;
    unsigned mRun;
    boost::asio::steady_timer mTimer;

    std::unique_ptr<DeviceSource> mOwnSource;
    std::unique_ptr<DeviceEventStream> mStream;

    DeviceCallback mOnConnect;
    DeviceCallback mOnDisconnect;
    ErrorCallback mOnError;
    std::chrono::milliseconds mInterval;
    unsigned mFailures = 0;

    log::Logger mLog;
};

struct Watcher::Loop::PollOp : boost::asio::coroutine {
    Loop* self;

    explicit PollOp (Loop* l) : self(l) {}

    void operator() (boost::system::error_code ec = {}) {
        reenter (this) {
            for (;;) {
                self->check();
                self->mTimer.expires_after(self->mInterval);
                yield self->mTimer.async_wait(*this);
                if (ec) {
                    yield break;
                }
            }
        }
    }
};

struct Watcher::Loop::EventOp : boost::asio::coroutine {
    Loop* self;

    explicit EventOp (Loop* l) : self(l) {}

    void operator() (boost::system::error_code ec = {}, DeviceEvent event = {}) {
        reenter (this) {
            for (;;) {
                yield self->mStream->asyncReceiveDeviceEvent(*this);
                if (ec) {
                    break;
                }
                self->handleEvent(event);
            }
            if (boost::asio::error::operation_aborted != ec) {
                BOOST_LOG_SEV(self->mLog, log::warning) << "Lost the device event stream ("
                    << ec.message() << "), polling every " << self->mInterval.count() << " ms instead";
                self->mStream->close();
                PollOp{self}();
            }
        }
    }
};

void Watcher::Loop::run () {
    try {
        if (mShared->threadAffine) {
            mOwnSource = mShared->factory();
        }
        auto& source = mOwnSource ? *mOwnSource : *mShared->source;
        try {
            std::lock_guard<std::mutex> lock{mShared->mutex};
            mStream = source.openEventStream(*mContext);
        }
        catch (const SourceQueryError& e) {
            BOOST_LOG_SEV(mLog, log::warning) << "Could not open a device event stream ("
                << e.what() << "), polling instead";
        }
    }
    catch (const std::exception& e) {
        mShared->deadRun = mRun;
        report(std::current_exception(), e);
        return;
    }

    if (mStream) {
        // Catch up with whatever changed between the last check and the first event.
        check();
        EventOp{this}();
    }
    else {
        PollOp{this}();
    }

    mContext->run();

    if (mStream) {
        mStream->close();
    }
    BOOST_LOG_SEV(mLog, log::debug) << "USB monitor thread exiting";
}

void Watcher::Loop::check () {
    auto diff = SnapshotDifferences{};
    try {
        diff = mShared->changes(mOwnSource.get(), true);
        mFailures = 0;
    }
    catch (const std::logic_error& e) {
        report(std::current_exception(), e);
        return;
    }
    catch (const std::exception& e) {
        BOOST_LOG_SEV(mLog, log::warning) << "USB device check failed: " << e.what();
        if (++mFailures >= kFailuresBeforeError) {
            mFailures = 0;
            report(std::current_exception(), e);
        }
        return;
    }

    for (const auto& device : diff.removed) {
        notify(mOnDisconnect, device.first, device.second, "Disconnected");
    }
    for (const auto& device : diff.added) {
        notify(mOnConnect, device.first, device.second, "Connected");
    }
}

void Watcher::Loop::handleEvent (const DeviceEvent& event) {
    auto lock = std::unique_lock<std::mutex>{mShared->mutex};
    auto& reference = mShared->lastCheckDevices;

    if (DeviceEvent::ADD == event.type) {
        if (reference.count(event.id) || !mShared->filter.matches(event.record)) {
            return;
        }
        reference[event.id] = event.record;
        lock.unlock();
        notify(mOnConnect, event.id, event.record, "Connected");
    }
    else {
        auto it = reference.find(event.id);
        if (it == reference.end()) {
            return;
        }
        auto record = std::move(it->second);
        reference.erase(it);
        lock.unlock();
        notify(mOnDisconnect, event.id, record, "Disconnected");
    }
}

void Watcher::Loop::notify (const DeviceCallback& callback, const std::string& id,
        const DeviceRecord& record, const char* what) {
    BOOST_LOG_SEV(mLog, log::debug) << what << " " << describeDevice(id, record);
    if (!callback) {
        return;
    }
    try {
        callback(id, record);
    }
    catch (const std::exception& e) {
        BOOST_LOG_SEV(mLog, log::error) << "Device callback threw: " << e.what();
    }
    catch (...) {
        BOOST_LOG_SEV(mLog, log::error) << "Device callback threw a non-standard exception";
    }
}

void Watcher::Loop::report (std::exception_ptr eptr, const std::exception& e) {
    if (!mOnError) {
        BOOST_LOG_SEV(mLog, log::error) << "USB monitor error: " << e.what();
        return;
    }
    try {
        mOnError(eptr);
    }
    catch (const std::exception& callbackError) {
        BOOST_LOG_SEV(mLog, log::error) << "Error callback threw: " << callbackError.what();
    }
    catch (...) {
        BOOST_LOG_SEV(mLog, log::error) << "Error callback threw a non-standard exception";
    }
}

// =======================================================================================
// Watcher

Watcher::Watcher (SourceFactory factory, DeviceFilter filter)
    : mShared(std::make_shared<Shared>(std::move(factory), std::move(filter)))
    , mInitialDevices(mShared->changes(nullptr, true).added)
{}

Watcher::~Watcher () {
    stopMonitoring(kStopTimeout, false);
}

Snapshot Watcher::devices () {
    std::lock_guard<std::mutex> lock{mShared->mutex};
    return mShared->filter.apply(mShared->source->devices());
}

SnapshotDifferences Watcher::changesFromLastCheck (bool updateLastCheck) {
    return mShared->changes(nullptr, updateLastCheck);
}

void Watcher::checkChanges (const DeviceCallback& onConnect, const DeviceCallback& onDisconnect,
        bool updateLastCheck) {
    auto diff = changesFromLastCheck(updateLastCheck);
    if (onDisconnect) {
        for (const auto& device : diff.removed) {
            onDisconnect(device.first, device.second);
        }
    }
    if (onConnect) {
        for (const auto& device : diff.added) {
            onConnect(device.first, device.second);
        }
    }
}

void Watcher::startMonitoring (DeviceCallback onConnect, DeviceCallback onDisconnect,
        std::chrono::milliseconds interval, ErrorCallback onError) {
    if (MonitorState::NotRunning == state() && MonitorState::Running == mState) {
        // The last thread already gave up. Collect it before starting over.
        stopMonitoring(kStopTimeout, false);
    }

    auto expected = MonitorState::NotRunning;
    if (!mState.compare_exchange_strong(expected, MonitorState::Running)) {
        throw AlreadyRunningError{};
    }

    auto go = std::promise<void>{};
    try {
        mContext = std::make_shared<boost::asio::io_context>();
        auto loop = std::make_shared<Loop>(mShared, mContext, ++mRun,
            std::move(onConnect), std::move(onDisconnect), interval, std::move(onError));
        auto done = std::promise<void>{};
        mDone = done.get_future();
        // Callbacks may stop the monitor, which needs mThread, so the loop waits until it is set.
        mThread = std::thread{[loop, started = go.get_future(), done = std::move(done)] () mutable {
            started.wait();
            loop->run();
            done.set_value();
        }};
    }
    catch (const std::system_error&) {
        mContext.reset();
        mState = MonitorState::NotRunning;
        throw;
    }
    go.set_value();

    log::Logger lg;
    BOOST_LOG_SEV(lg, log::info) << "Started monitoring USB devices";
}

void Watcher::stopMonitoring (std::chrono::milliseconds timeout, bool warnIfAlreadyStopped) {
    log::Logger lg;
    auto expected = MonitorState::Running;
    if (!mState.compare_exchange_strong(expected, MonitorState::StopRequested)) {
        if (warnIfAlreadyStopped) {
            BOOST_LOG_SEV(lg, log::warning) << "USB monitor can not be stopped because it is not running";
        }
        return;
    }

    mContext->stop();

    if (std::this_thread::get_id() == mThread.get_id()) {
        // Stopping from a callback. The thread finishes on its own once the callback returns.
        mThread.detach();
    }
    else if (std::future_status::ready == mDone.wait_for(timeout)) {
        mThread.join();
    }
    else {
        BOOST_LOG_SEV(lg, log::warning) << "USB monitor thread did not stop within "
            << timeout.count() << " ms, detaching it";
        mThread.detach();
    }

    mContext.reset();
    mDone = std::future<void>{};
    mShared->deadRun = kNoRun;
    mState = MonitorState::NotRunning;
    BOOST_LOG_SEV(lg, log::info) << "Stopped monitoring USB devices";
}

MonitorState Watcher::state () const {
    auto state = mState.load();
    if (MonitorState::Running == state && mShared->deadRun.load() == mRun.load()) {
        return MonitorState::NotRunning;
    }
    return state;
}

Snapshot Watcher::lastCheckDevices () const {
    std::lock_guard<std::mutex> lock{mShared->mutex};
    return mShared->lastCheckDevices;
}

std::ostream& operator<< (std::ostream& os, MonitorState state) {
    switch (state) {
        case MonitorState::NotRunning: return os << "NotRunning";
        case MonitorState::Running: return os << "Running";
        case MonitorState::StopRequested: return os << "StopRequested";
    }
    return os << "MonitorState(" << static_cast<int>(state) << ")";
}

} // namespace usbmon

#include <boost/asio/unyield.hpp>
