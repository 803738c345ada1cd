#include <usbmon/linux/udevadm.hpp>

#include <usbmon/error.hpp>
#include <usbmon/log.hpp>

#include <boost/process.hpp>
#include <boost/process/async_pipe.hpp>

#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/coroutine.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>

#include <boost/asio/yield.hpp>

#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace bp = boost::process;

namespace usbmon { namespace udev {

namespace {

bp::child executeUdevadmMonitor (const boost::filesystem::path& udevadm, bp::async_pipe& out) {
    auto args = std::vector<std::string>{
        "monitor",
        "--udev",  // Only receive post-processed udev events
        "--property",  // Dump every property, so we can build a record from the event alone
        "--subsystem-match=usb"
    };
    // When run in a terminal, `udevadm` has line-buffered output. In a pipeline it is
    // block-buffered, and its output buffer is flushed much less frequently. Since `udevadm`
    // demarcates its event records with blank lines, we must force its stdout to be line-buffered
    // to receive events in real-time. `stdbuf -oL <cmd...>` is an easy way of doing this.
    auto exe = bp::search_path("stdbuf");
    if (exe.empty()) {
        exe = udevadm;
    }
    else {
        args.insert(args.begin(), {"-oL", udevadm.string()});
    }
    return bp::child{bp::exe = exe, bp::args = args,
        bp::std_out > out,
        bp::std_err > bp::null,
        bp::std_in < bp::null};
}

class UdevadmMonitor : public DeviceEventStream {
public:
    UdevadmMonitor (boost::asio::io_context& context, const boost::filesystem::path& udevadm)
        : mPipe(context)
        , mChild(executeUdevadmMonitor(udevadm, mPipe))
    {}

    ~UdevadmMonitor () override {
        close();
    }

    void asyncReceiveDeviceEvent (Handler handler) override;

    void close () override {
        auto ec = std::error_code{};
        if (mChild.valid() && mChild.running(ec)) {
            mChild.terminate(ec);
            // Boost.Process implements terminate() with SIGKILL on Linux; udevadm keeps no
            // state worth a graceful shutdown.
        }
        auto pipeEc = boost::system::error_code{};
        mPipe.close(pipeEc);
    }

private:
    struct ReceiveOp;

    bp::async_pipe mPipe;
    bp::child mChild;
    boost::asio::streambuf mBuf;
};

struct UdevadmMonitor::ReceiveOp : boost::asio::coroutine {
    UdevadmMonitor* self;
    Handler handler;

    ReceiveOp (UdevadmMonitor* m, Handler h)
        : self(m), handler(std::move(h))
    {}

    void operator() (boost::system::error_code ec = {}, std::size_t n = 0) {
        reenter (this) {
            for (;;) {
                yield boost::asio::async_read_until(self->mPipe, self->mBuf, "\n\n", std::move(*this));
                if (ec) {
                    break;
                }
                {
                    auto begin = boost::asio::buffers_begin(self->mBuf.data());
                    auto paragraph = std::string(begin, begin + n);
                    self->mBuf.consume(n);
                    auto event = DeviceEvent{};
                    if (parseUdevadm(paragraph, event)) {
                        handler({}, std::move(event));
                        return;
                    }
                    // Interface nodes, "bind" actions and the banner udevadm prints on startup.
                }
            }
            handler(ec, DeviceEvent{});
        }
    }
};

void UdevadmMonitor::asyncReceiveDeviceEvent (Handler handler) {
    ReceiveOp{this, std::move(handler)}();
}

} // <anonymous>

UdevDeviceSource::UdevDeviceSource ()
    : mUdevadm(bp::search_path("udevadm"))
{
    if (mUdevadm.empty()) {
        throw SourceQueryError{"udevadm", "not found on the PATH"};
    }
}

Snapshot UdevDeviceSource::devices () {
    try {
        bp::ipstream out;
        bp::child child{mUdevadm, "info", "--export-db",
            bp::std_out > out,
            bp::std_err > bp::null,
            bp::std_in < bp::null};

        auto output = std::ostringstream{};
        output << out.rdbuf();
        child.wait();

        if (child.exit_code()) {
            throw SourceQueryError{"udevadm info --export-db",
                "exited with status " + std::to_string(child.exit_code())};
        }
        return snapshotFromDatabase(output.str());
    }
    catch (const bp::process_error& e) {
        throw SourceQueryError{"udevadm info --export-db", e.what()};
    }
}

std::unique_ptr<DeviceEventStream> UdevDeviceSource::openEventStream (boost::asio::io_context& context) {
    try {
        auto stream = std::make_unique<UdevadmMonitor>(context, mUdevadm);
        log::Logger lg;
        BOOST_LOG_SEV(lg, log::debug) << "Following udev events through " << mUdevadm;
        return std::move(stream);
    }
    catch (const bp::process_error& e) {
        throw SourceQueryError{"udevadm monitor", e.what()};
    }
}

bool udevadmAvailable () {
    return !bp::search_path("udevadm").empty();
}

}} // usbmon::udev

#include <boost/asio/unyield.hpp>
