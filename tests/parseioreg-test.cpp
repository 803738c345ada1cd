#include <doctest/doctest.h>

#include <usbmon/macos/ioreg.hpp>

#include "fakesource.hpp"

#include <string>

namespace {

using namespace usbmon;

// Trimmed `ioreg -p IOUSB -w0 -l` with a flash drive and a keyboard behind the XHCI root hub.
const std::string kIoreg =
    "+-o Root  <class IORegistryEntry, id 0x100000100, retain 11>\n"
    "  {\n"
    "    \"IOKitBuildVersion\" = \"Darwin Kernel Version 17.7.0\"\n"
    "  }\n"
    "  \n"
    "+-o AppleUSBXHCI Root Hub Simulation@14000000  <class AppleUSBRootHubDevice, id 0x100000a3e, registered, matched, active, busy 0 (0 ms), retain 11>\n"
    "  | {\n"
    "  |   \"idProduct\" = 32776\n"
    "  |   \"idVendor\" = 1452\n"
    "  |   \"USB Product Name\" = \"XHCI Root Hub SS Simulation\"\n"
    "  | }\n"
    "  | \n"
    "  +-o Cruzer Blade@14100000  <class AppleUSBDevice, id 0x100000c4a, registered, matched, active, busy 0 (0 ms), retain 20>\n"
    "  |   {\n"
    "  |     \"sessionID\" = 1234567890\n"
    "  |     \"idProduct\" = 21863\n"
    "  |     \"USB Vendor Name\" = \"SanDisk\"\n"
    "  |     \"kUSBVendorString\" = \"SanDisk\"\n"
    "  |     \"USB Product Name\" = \"Cruzer Blade\"\n"
    "  |     \"kUSBProductString\" = \"Cruzer Blade\"\n"
    "  |     \"USB Serial Number\" = \"4C530001230314117283\"\n"
    "  |     \"idVendor\" = 1921\n"
    "  |     \"bDeviceClass\" = 0\n"
    "  |   }\n"
    "  |   \n"
    "  +-o Apple Keyboard@14200000  <class AppleUSBDevice, id 0x100000c70, registered, matched, active, busy 0 (0 ms), retain 18>\n"
    "      {\n"
    "        \"idProduct\" = 544\n"
    "        \"USB Vendor Name\" = \"Apple, Inc\"\n"
    "        \"USB Product Name\" = \"Apple Keyboard\"\n"
    "        \"idVendor\" = 1452\n"
    "        \"bDeviceClass\" = 66\n"
    "      }\n"
    "      \n";

TEST_CASE("ioreg output becomes one record per USB device") {
    auto devices = ioreg::parseIoreg(kIoreg);
    REQUIRE(devices.size() == 2);

    const auto& drive = devices.at("Cruzer Blade@14100000");
    CHECK(drive.size() == deviceAttributes().size());
    CHECK(stringAttribute(drive, attr::kVendorId) == "0781");
    CHECK(stringAttribute(drive, attr::kModelId) == "5567");
    CHECK(stringAttribute(drive, attr::kVendor) == "SanDisk");
    CHECK(stringAttribute(drive, attr::kModel) == "Cruzer Blade");
    CHECK(stringAttribute(drive, attr::kModelFromDatabase) == "Cruzer Blade");
    CHECK(stringAttribute(drive, attr::kSerial) == "4C530001230314117283");
    CHECK(stringAttribute(drive, attr::kUsbClassFromDatabase) == "(Defined at Interface level)");
    CHECK(stringAttribute(drive, attr::kDevName) == "Cruzer Blade@14100000");
    CHECK(stringAttribute(drive, attr::kDevType) == "AppleUSBDevice");

    const auto& keyboard = devices.at("Apple Keyboard@14200000");
    CHECK(stringAttribute(keyboard, attr::kVendorId) == "05ac");
    CHECK(stringAttribute(keyboard, attr::kVendor) == "Apple, Inc");
    // 0x42 is not a class code we know.
    CHECK(stringAttribute(keyboard, attr::kUsbClassFromDatabase) == "66");
}

TEST_CASE("no output means no devices") {
    CHECK(ioreg::parseIoreg("").empty());
    CHECK(ioreg::parseIoreg("+-o Root  <class IORegistryEntry, id 0x100000100, retain 11>\n").empty());
}

TEST_CASE("USB ids are printed as four hex digits") {
    CHECK(ioreg::hexId("1452") == "05ac");
    CHECK(ioreg::hexId("0") == "0000");
    CHECK(ioreg::hexId("65535") == "ffff");
}

TEST_CASE("ids that are not numbers pass through with a warning") {
    test::LogCapture log;
    CHECK(ioreg::hexId("0x05ac") == "0x05ac");
    CHECK(ioreg::hexId("70000") == "70000");
    CHECK(log.contains("keeping the raw value"));
}

} // <anonymous>
