#pragma once

#include <cstdint>
#include <string_view>

/**
 * @brief Coarse surface category of a static mesh.
 *
 * Derived from keywords in the mesh name at load time. The scanner can tint
 * points by category instead of using a single base color.
 */
enum class SurfaceClass : uint8_t
{
    Default = 0,
    Ground,
    Wall,
    Object,
    Vegetation,
    Water,
    Metal,
    Wood,
    Count
};

/**
 * @brief Classify a mesh by name (case-insensitive keyword match).
 *
 * Checked in priority order: ground/floor, wall/ceiling, object/furniture,
 * tree/plant/vegetation, water/lake/river, metal/steel/iron, wood/timber.
 */
[[nodiscard]] SurfaceClass classifySurface(std::string_view meshName);

[[nodiscard]] const char* surfaceClassName(SurfaceClass cls) noexcept;
