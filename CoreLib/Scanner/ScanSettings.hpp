//============================================================
// ScanSettings.hpp
//============================================================
#pragma once

#include <array>
#include <cstdint>
#include <glm/vec3.hpp>

#include "SurfaceClass.hpp"

/// 0xRRGGBB to [0,1] RGB.
inline glm::vec3 colorFromHex(uint32_t hex)
{
    return glm::vec3(static_cast<float>((hex >> 16) & 0xFF) / 255.0f,
                     static_cast<float>((hex >> 8) & 0xFF) / 255.0f,
                     static_cast<float>(hex & 0xFF) / 255.0f);
}

struct ScanSettings
{
    // --------------------------------------------------------
    // Sensor
    // --------------------------------------------------------
    bool  enabled     = true;
    float maxDistance = 200.0f;
    int   burstRays   = 4000;

    // Burst raster: azimuth wraps every azimuthSteps rays, then elevation advances
    int   azimuthSteps   = 720; // 0.5 degrees
    int   elevationSteps = 100;
    float elevationMin   = -0.35f; // radians
    float elevationMax   = 0.25f;

    // --------------------------------------------------------
    // Point storage
    // --------------------------------------------------------
    uint32_t pointLimit = 120000;

    float    densityCell       = 0.1f; // metres; <= 0 disables the gate
    uint32_t densityMaxPerCell = 100;

    // --------------------------------------------------------
    // Appearance
    // --------------------------------------------------------
    glm::vec3 baseColor    = glm::vec3(1.0f);
    float     minIntensity = 0.15f;
    float     maxIntensity = 3.0f;

    bool  fade          = true;
    float lifetime      = 10.0f; // seconds
    float fadeThreshold = 0.002f;

    // Tint points by the hit mesh's surface class instead of baseColor
    bool colorBySurface = false;

    std::array<glm::vec3, static_cast<size_t>(SurfaceClass::Count)> surfaceColors = {
        colorFromHex(0x00ff88), // default
        colorFromHex(0x8b4513), // ground
        colorFromHex(0x708090), // wall
        colorFromHex(0xffd700), // object
        colorFromHex(0x228b22), // vegetation
        colorFromHex(0x4169e1), // water
        colorFromHex(0xc0c0c0), // metal
        colorFromHex(0xdaa520), // wood
    };

    // --------------------------------------------------------
    // Sweep beam (presentation only)
    // --------------------------------------------------------
    glm::vec3 handOffset           = glm::vec3(0.25f, -0.2f, -0.3f); // camera space
    float     beamFallbackFraction = 0.2f;                           // of maxDistance when nothing is hit

    uint32_t seed = 0x5eed;
};
