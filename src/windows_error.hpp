#ifndef USBMON_WINDOWS_ERROR_HPP
#define USBMON_WINDOWS_ERROR_HPP

#ifndef _WIN32
#error windows_error.hpp is a Windows-specific header file.
#endif

#include <windows.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace usbmon { namespace setupapi {

inline std::string windowsErrorString (DWORD code) {
    char* text = nullptr;
    auto length = FormatMessageA(FORMAT_MESSAGE_FROM_SYSTEM
            | FORMAT_MESSAGE_ALLOCATE_BUFFER
            | FORMAT_MESSAGE_IGNORE_INSERTS,
            nullptr, code,
            MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
            LPSTR(&text),
            0, nullptr);
    if (!text || !length) {
        return "error " + std::to_string(code)
            + " (FormatMessage failed with " + std::to_string(GetLastError()) + ")";
    }
    auto guard = std::unique_ptr<char, decltype(&LocalFree)>{text, &LocalFree};
    auto message = std::string(text, text + length);
    // System messages end in "\r\n".
    message.erase(message.find_last_not_of("\r\n .") + 1);
    return message + " (" + std::to_string(code) + ")";
}

// A failed SetupAPI call. Translated to SourceQueryError before it leaves the device source.
struct WindowsError : std::runtime_error {
    WindowsError (const std::string& function, DWORD code)
        : std::runtime_error{function + ": " + windowsErrorString(code)}
    {}
};

}} // usbmon::setupapi

#endif
