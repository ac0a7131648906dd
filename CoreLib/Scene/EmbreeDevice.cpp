#include "EmbreeDevice.hpp"

#include <iostream>
#include <string>

#include "CoreUtilities.hpp"

namespace
{
    void onDeviceError(void* /*userPtr*/, RTCError code, const char* str)
    {
        std::cerr << "EmbreeDevice: error " << static_cast<int>(code) << ": " << (str ? str : "") << "\n";
    }

} // namespace

EmbreeDevice::EmbreeDevice(const char* config)
{
    m_device = rtcNewDevice(config);

    if (!m_device)
    {
        const RTCError code = rtcGetDeviceError(nullptr);
        throw lw::core_exception("rtcNewDevice failed with error " + std::to_string(static_cast<int>(code)));
    }

    rtcSetDeviceErrorFunction(m_device, onDeviceError, nullptr);

    const auto tasking = rtcGetDeviceProperty(m_device, RTC_DEVICE_PROPERTY_TASKING_SYSTEM);

    if (tasking == 1)
    {
        std::cerr << "EmbreeDevice: tasking system: TBB\n";
    }
    else if (tasking == 0)
    {
        std::cerr << "EmbreeDevice: tasking system: internal\n";
    }
    else if (tasking == 2)
    {
        std::cerr << "EmbreeDevice: tasking system: PPL\n";
    }
}

EmbreeDevice::~EmbreeDevice()
{
    if (m_device)
        rtcReleaseDevice(m_device);
}

RTCError EmbreeDevice::takeError() const noexcept
{
    return rtcGetDeviceError(m_device);
}
