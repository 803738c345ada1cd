#include <usbmon/macos/ioreg.hpp>

#include <usbmon/error.hpp>

#include <boost/process.hpp>

#include <sstream>
#include <string>

namespace bp = boost::process;

namespace usbmon { namespace ioreg {

Snapshot IoregDeviceSource::devices () {
    auto ioreg = bp::search_path("ioreg");
    if (ioreg.empty()) {
        throw SourceQueryError{"ioreg", "not found on the PATH"};
    }

    try {
        bp::ipstream out;
        // The IOUSB plane holds only USB devices, and -w0 keeps long property lines unwrapped.
        bp::child child{ioreg, "-p", "IOUSB", "-w0", "-l",
            bp::std_out > out,
            bp::std_err > bp::null,
            bp::std_in < bp::null};

        auto output = std::ostringstream{};
        output << out.rdbuf();
        child.wait();

        if (child.exit_code()) {
            throw SourceQueryError{"ioreg", "exited with status " + std::to_string(child.exit_code())};
        }
        return parseIoreg(output.str());
    }
    catch (const bp::process_error& e) {
        throw SourceQueryError{"ioreg", e.what()};
    }
}

}} // usbmon::ioreg
