#ifndef USBMON_DEVICESOURCE_HPP
#define USBMON_DEVICESOURCE_HPP

#include <usbmon/attributes.hpp>
#include <usbmon/devices.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <functional>
#include <memory>

namespace usbmon {

// Push notifications from a native device subsystem. Handlers run on the io_context the stream was
// opened with.
class DeviceEventStream {
public:
    using Handler = std::function<void(boost::system::error_code, DeviceEvent)>;

    virtual ~DeviceEventStream () = default;

    virtual void asyncReceiveDeviceEvent (Handler handler) = 0;
    // Complete `handler` with the next ADD or REMOVE of a device-level node. Only one receive may
    // be outstanding at a time. The stream ending is reported as boost::asio::error::eof.

    virtual void close () = 0;
};

class DeviceSource {
public:
    virtual ~DeviceSource () = default;

    virtual Snapshot devices () = 0;
    // Every USB device currently present, unfiltered. Throws SourceQueryError if the native query
    // itself fails; finding nothing is not an error.

    virtual std::unique_ptr<DeviceEventStream> openEventStream (boost::asio::io_context&) {
        return nullptr;
    }
    // Sources that can only be polled return null.

    virtual bool threadAffine () const { return false; }
    // True if the native handle must be created on the thread that uses it. The monitor then builds
    // a separate source inside its own thread.
};

using SourceFactory = std::function<std::unique_ptr<DeviceSource>()>;

} // namespace usbmon

#endif
