#include <doctest/doctest.h>

#include <usbmon/error.hpp>
#include <usbmon/windows/extraction.hpp>

#include "fakesource.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/predef/os.h>

namespace {

using namespace usbmon;

setupapi::RawDevice flashDrive () {
    auto raw = setupapi::RawDevice{};
    raw.instanceId = R"(USB\VID_0781&PID_5567\4C530001230314117283)";
    raw.description = "USB Mass Storage Device";
    raw.manufacturer = "Compatible USB storage device";
    raw.setupClass = "USB";
    raw.hardwareIds = {R"(USB\VID_0781&PID_5567&REV_0100)", R"(USB\VID_0781&PID_5567)"};
    raw.compatibleIds = {R"(USB\Class_08&SubClass_06&Prot_50)", R"(USB\Class_08&SubClass_06)", R"(USB\Class_08)"};
    return raw;
}

setupapi::RawDevice flashDisk () {
    auto raw = setupapi::RawDevice{};
    raw.instanceId = R"(USBSTOR\DISK&VEN_SANDISK&PROD_CRUZER_BLADE&REV_1.00\4C530001230314117283&0)";
    raw.friendlyName = "SanDisk Cruzer Blade USB Device";
    raw.description = "Disk drive";
    raw.manufacturer = "(Standard disk drives)";
    raw.setupClass = "DiskDrive";
    raw.hardwareIds = {R"(USBSTOR\DiskSanDisk_Cruzer_Blade___1.00)", "GenDisk"};
    return raw;
}

TEST_CASE("the driver type is the first segment of the instance id") {
    CHECK(setupapi::driverType(R"(USB\VID_0781&PID_5567\4C53)") == "USB");
    CHECK(setupapi::driverType(R"(USBSTOR\DISK&VEN_SANDISK\4C53&0)") == "USBSTOR");
    CHECK(setupapi::driverType("HID") == "HID");
}

TEST_CASE("root hubs are pseudo-devices") {
    CHECK(setupapi::isPseudoDevice(R"(USB\ROOT_HUB30\4&1B2C3D4E&0&0)"));
    CHECK(setupapi::isPseudoDevice(R"(USB\root_hub20\4&1B2C3D4E&0)"));
    CHECK_FALSE(setupapi::isPseudoDevice(flashDrive().instanceId));
}

TEST_CASE("plain USB devices carry vendor and product ids in the instance id") {
    auto record = setupapi::normalize(flashDrive());

    CHECK(record.size() == deviceAttributes().size());
    CHECK(stringAttribute(record, attr::kVendorId) == "0781");
    CHECK(stringAttribute(record, attr::kModelId) == "5567");
    CHECK(stringAttribute(record, attr::kDevType) == "USB");
    CHECK(stringAttribute(record, attr::kDevName) == flashDrive().instanceId);
    // No friendly name, so the description stands in.
    CHECK(stringAttribute(record, attr::kModel) == "USB Mass Storage Device");
    CHECK(stringAttribute(record, attr::kVendorFromDatabase) == "Compatible USB storage device");
    CHECK(stringAttribute(record, attr::kUsbClassFromDatabase) == "USB");
    CHECK(listAttribute(record, attr::kUsbInterfaces).size() == 3);
}

TEST_CASE("mass storage devices carry vendor and product names instead") {
    auto record = setupapi::normalize(flashDisk());

    CHECK(stringAttribute(record, attr::kVendorId) == "sandisk");
    CHECK(stringAttribute(record, attr::kModelId) == "cruzer_blade");
    CHECK(stringAttribute(record, attr::kDevType) == "USBSTOR");
    CHECK(stringAttribute(record, attr::kModel) == "SanDisk Cruzer Blade USB Device");
    CHECK(stringAttribute(record, attr::kModelFromDatabase) == "Disk drive");
}

TEST_CASE("a pattern that matches nowhere passes the raw value through") {
    test::LogCapture log;
    auto value = setupapi::extractAttribute({R"(HID\CONVERTEDDEVICE)"}, attr::kVendorId,
        boost::regex{R"(VID_([0-9A-Fa-f]{4}))"});
    CHECK(value == R"(HID\CONVERTEDDEVICE)");
    CHECK(log.contains("keeping the raw value"));
}

TEST_CASE("matches may differ in case") {
    auto value = setupapi::extractAttribute({R"(USB\VID_04D8&PID_000A)", R"(USB\vid_04d8)"},
        attr::kVendorId, boost::regex{R"((?i)VID_([0-9A-F]{4}))"});
    CHECK(value == "04D8");
}

TEST_CASE("disagreeing matches are an inconsistency") {
    CHECK_THROWS_AS(setupapi::extractAttribute({R"(USB\VID_0781&PID_5567)", R"(USB\VID_046D&PID_C52B)"},
        attr::kVendorId, boost::regex{R"(VID_([0-9A-Fa-f]{4}))"}), AttributeExtractionInconsistency);
}

TEST_CASE("snapshots skip pseudo-devices and key devices by instance id") {
    auto hub = setupapi::RawDevice{};
    hub.instanceId = R"(USB\ROOT_HUB30\4&1B2C3D4E&0&0)";
    hub.description = "USB Root Hub (USB 3.0)";

    auto devices = setupapi::snapshotFromRawDevices({flashDrive(), flashDisk(), hub});
    CHECK(devices.size() == 2);
    CHECK(devices.count(flashDrive().instanceId));
    CHECK(devices.count(flashDisk().instanceId));
}

TEST_CASE("unknown driver types are read like plain USB devices") {
    test::LogCapture log;
    auto raw = flashDrive();
    raw.instanceId = R"(USBPRINT\VID_04F9&PID_0042\7&1A2B3C&0&USB001)";
    raw.hardwareIds = {};

    auto record = setupapi::normalize(raw);
    CHECK(stringAttribute(record, attr::kVendorId) == "04f9");
    CHECK(stringAttribute(record, attr::kDevType) == "USBPRINT");
    CHECK(log.contains("No attribute patterns for driver type 'USBPRINT'"));
}

#if BOOST_OS_WINDOWS
TEST_CASE("SetupAPI failures surface as query errors") {
    auto source = setupapi::SetupApiDeviceSource{};
    try {
        for (const auto& device : source.devices()) {
            CHECK(boost::algorithm::istarts_with(device.first, "USB"));
        }
    }
    catch (const SourceQueryError& e) {
        MESSAGE("SetupAPI query failed: " << e.what());
    }
}
#endif

} // <anonymous>
