#include <usbmon/monitor.hpp>

#include <usbmon/log.hpp>
#include <usbmon/platform.hpp>

namespace usbmon {

Monitor::Monitor (DeviceFilter filter)
    : Monitor(makePlatformSourceFactory(), std::move(filter))
{}

Monitor::Monitor (SourceFactory factory, DeviceFilter filter)
    : mWatcher(std::make_unique<Watcher>(std::move(factory), std::move(filter)))
{}

void Monitor::startMonitoring (DeviceCallback onConnect, DeviceCallback onDisconnect,
        std::chrono::milliseconds interval, ErrorCallback onError) {
    if (!onConnect && !onDisconnect) {
        log::Logger lg;
        BOOST_LOG_SEV(lg, log::warning) << "Monitoring USB devices without a connect or "
            "disconnect callback, changes will only be logged";
    }
    mWatcher->startMonitoring(std::move(onConnect), std::move(onDisconnect), interval,
        std::move(onError));
}

} // namespace usbmon
