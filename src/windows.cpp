#include <usbmon/windows/extraction.hpp>

#include <usbmon/error.hpp>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/iterator/iterator_facade.hpp>

#include <memory>
#include <vector>

#include "windows_error.hpp"

#include <windows.h>
#include <setupapi.h>

namespace usbmon { namespace setupapi {

namespace {

std::shared_ptr<void> openPresentDevices () {
    auto handle = SetupDiGetClassDevsA(nullptr, nullptr, nullptr, DIGCF_ALLCLASSES | DIGCF_PRESENT);
    if (INVALID_HANDLE_VALUE == handle) {
        auto err = GetLastError();
        throw WindowsError{"SetupDiGetClassDevs", err};
    }
    return std::shared_ptr<void>(handle, SetupDiDestroyDeviceInfoList);
}

// One element of a device information set.
class DevInfo : public SP_DEVINFO_DATA {
public:
    explicit DevInfo (std::shared_ptr<void> set = {}) : mSet(std::move(set)) {}

    HDEVINFO set () const { return mSet.get(); }

    std::string instanceId () const {
        DWORD size = 0;
        if (!SetupDiGetDeviceInstanceIdA(set(), self(), nullptr, 0, &size)) {
            auto err = GetLastError();
            if (ERROR_INSUFFICIENT_BUFFER != err) {
                throw WindowsError{"SetupDiGetDeviceInstanceId", err};
            }
        }
        auto result = std::vector<char>(size + 1);
        if (!SetupDiGetDeviceInstanceIdA(set(), self(), result.data(), DWORD(result.size()),
                                         nullptr)) {
            throw WindowsError{"SetupDiGetDeviceInstanceId", GetLastError()};
        }
        return result.data();
    }

    std::string stringProperty (DWORD key) const {
        auto values = registryProperty(key, REG_SZ);
        return values.empty() ? std::string{} : values.front();
    }

    AttributeList listProperty (DWORD key) const {
        return registryProperty(key, REG_MULTI_SZ);
    }

private:
    PSP_DEVINFO_DATA self () const {
        return const_cast<PSP_DEVINFO_DATA>(static_cast<const SP_DEVINFO_DATA*>(this));
    }

    // Devices simply lack some properties (no friendly name, no compatible ids); those read as
    // empty rather than as errors.
    AttributeList registryProperty (DWORD key, DWORD expectedType) const {
        DWORD type;
        DWORD size = 0;
        if (!SetupDiGetDeviceRegistryPropertyA(set(), self(), key, &type, nullptr, 0, &size)) {
            auto err = GetLastError();
            if (ERROR_INVALID_DATA == err) {
                return {};
            }
            if (ERROR_INSUFFICIENT_BUFFER != err) {
                throw WindowsError{"SetupDiGetDeviceRegistryProperty", err};
            }
        }

        auto result = std::vector<char>(size + 2);
        if (!SetupDiGetDeviceRegistryPropertyA(set(), self(), key, &type,
                                               PBYTE(result.data()), size, nullptr)) {
            throw WindowsError{"SetupDiGetDeviceRegistryProperty", GetLastError()};
        }

        if (expectedType != type) {
            throw WindowsError{"SetupDiGetDeviceRegistryProperty", ERROR_DATATYPE_MISMATCH};
        }

        // REG_MULTI_SZ is a sequence of NUL-terminated strings ending in an empty one; REG_SZ is
        // the one-element case.
        auto values = AttributeList{};
        for (auto p = result.data(); *p; p += values.back().size() + 1) {
            values.emplace_back(p);
        }
        return values;
    }

    std::shared_ptr<void> mSet;
};

// Every present device of every class. The USB ones are picked out by instance id, the same way
// as `PNPDeviceID LIKE 'USB%'`.
class DeviceInfoSet {
public:
    class Iterator : public boost::iterator_facade<
            Iterator, const DevInfo, boost::single_pass_traversal_tag> {
    public:
        Iterator () = default;

        explicit Iterator (std::shared_ptr<void> set)
            : mAtEnd(false), mDevInfo(std::move(set))
        {
            fetch();
        }

    private:
        friend class boost::iterator_core_access;

        void increment () {
            ++mIndex;
            fetch();
        }

        void fetch () {
            mDevInfo.cbSize = sizeof(SP_DEVINFO_DATA);
            if (SetupDiEnumDeviceInfo(mDevInfo.set(), mIndex, &mDevInfo)) {
                return;
            }
            auto err = GetLastError();
            if (ERROR_NO_MORE_ITEMS != err) {
                throw WindowsError{"SetupDiEnumDeviceInfo", err};
            }
            mAtEnd = true;
        }

        bool equal (const Iterator& other) const {
            return mAtEnd == other.mAtEnd && (mAtEnd || mIndex == other.mIndex);
        }

        const DevInfo& dereference () const { return mDevInfo; }

        DWORD mIndex = 0;
        bool mAtEnd = true;
        DevInfo mDevInfo;
    };

    DeviceInfoSet () : mSet(openPresentDevices()) {}

    Iterator begin () const { return Iterator{mSet}; }
    Iterator end () const { return Iterator{}; }

private:
    std::shared_ptr<void> mSet;
};

RawDevice toRawDevice (const DevInfo& di, std::string instanceId) {
    auto raw = RawDevice{};
    raw.instanceId = std::move(instanceId);
    raw.friendlyName = di.stringProperty(SPDRP_FRIENDLYNAME);
    raw.description = di.stringProperty(SPDRP_DEVICEDESC);
    raw.manufacturer = di.stringProperty(SPDRP_MFG);
    raw.setupClass = di.stringProperty(SPDRP_CLASS);
    raw.hardwareIds = di.listProperty(SPDRP_HARDWAREID);
    raw.compatibleIds = di.listProperty(SPDRP_COMPATIBLEIDS);
    return raw;
}

} // <anonymous>

SetupApiDeviceSource::SetupApiDeviceSource () = default;

Snapshot SetupApiDeviceSource::devices () {
    try {
        auto raws = std::vector<RawDevice>{};
        for (const auto& di : DeviceInfoSet{}) {
            auto instanceId = di.instanceId();
            if (boost::algorithm::istarts_with(instanceId, "USB")) {
                raws.push_back(toRawDevice(di, std::move(instanceId)));
            }
        }
        return snapshotFromRawDevices(raws);
    }
    catch (const WindowsError& e) {
        throw SourceQueryError{"SetupAPI", e.what()};
    }
}

}} // usbmon::setupapi
