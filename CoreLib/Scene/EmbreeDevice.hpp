#pragma once

#include <embree4/rtcore.h>

/**
 * @brief Owns one Embree device for the lifetime of the simulation core.
 *
 * Device errors are reported to std::cerr through an error callback, and
 * creation failure throws.
 */
class EmbreeDevice
{
public:
    /// @param config Embree device configuration string (nullptr = defaults).
    explicit EmbreeDevice(const char* config = nullptr);
    ~EmbreeDevice();

    EmbreeDevice(const EmbreeDevice&)            = delete;
    EmbreeDevice& operator=(const EmbreeDevice&) = delete;

    [[nodiscard]] RTCDevice handle() const noexcept
    {
        return m_device;
    }

    /// Reads and resets the device's sticky error code.
    [[nodiscard]] RTCError takeError() const noexcept;

private:
    RTCDevice m_device = nullptr;
};
