#ifndef USBMON_ERROR_HPP
#define USBMON_ERROR_HPP

#include <stdexcept>
#include <string>

namespace usbmon {

struct UnsupportedPlatformError : std::runtime_error {
    explicit UnsupportedPlatformError (const std::string& platform)
        : std::runtime_error{"USB monitoring is not supported on this platform: " + platform}
    {}
};

struct SourceQueryError : std::runtime_error {
    SourceQueryError (const std::string& prefix, const std::string& what)
        : std::runtime_error{prefix + ": " + what}
    {}
};

// An extraction pattern matched several different values inside one composite field. This means
// the pattern table is wrong, not that the device is unusual.
struct AttributeExtractionInconsistency : std::logic_error {
    AttributeExtractionInconsistency (const std::string& attribute, const std::string& pattern)
        : std::logic_error{"Pattern '" + pattern + "' found disagreeing values for " + attribute}
    {}
};

struct AlreadyRunningError : std::logic_error {
    AlreadyRunningError ()
        : std::logic_error{"The USB monitor is already running"}
    {}
};

} // namespace usbmon

#endif
