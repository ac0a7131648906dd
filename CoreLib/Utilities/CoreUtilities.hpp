#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <glm/ext/scalar_constants.hpp>
#include <glm/glm.hpp>
#include <glm/gtc/epsilon.hpp>
#include <glm/gtx/norm.hpp>
#include <iostream>
#include <source_location>
#include <stdexcept>
#include <string>

/**
 * @defgroup MathUtils Math / Geometry Utilities
 * @brief Small utilities for float comparisons, rays, intersections and errors.
 *
 * Helpers here are lightweight wrappers around GLM or simple algorithms shared
 * by the world query, the player controller and the scanner.
 */
namespace lw
{

    /**
     * @brief Simple ray type used for collision probes and scan rays.
     * @ingroup MathUtils
     *
     * @note `dir` should be normalized. `inv` is the component-wise inverse of `dir`
     * (i.e., `1.0f / dir`) and is cached for slab tests.
     */
    struct ray
    {
        glm::vec3 org; ///< Origin of the ray in world space.
        glm::vec3 dir; ///< Direction vector (should be normalized).
        glm::vec3 inv; ///< 1.0f / dir (component-wise).
    };

    /**
     * @brief Build a ray, filling in the cached inverse direction.
     * @param org Ray origin.
     * @param dir Ray direction (expected normalized).
     * @ingroup MathUtils
     */
    inline ray make_ray(const glm::vec3& org, const glm::vec3& dir) noexcept
    {
        return ray{org, dir, 1.0f / dir};
    }

    /**
     * @brief Generic floating-point equality check using GLM epsilon.
     * @tparam T A floating-point type.
     * @return True if |a - b| <= epsilon(T).
     * @ingroup MathUtils
     */
    template<std::floating_point T>
    constexpr bool equal(T a, T b)
    {
        return glm::epsilonEqual(a, b, glm::epsilon<T>());
    }

    /**
     * @brief vec3 equality using squared length and epsilon.
     * @ingroup MathUtils
     */
    inline bool equal(const glm::vec3& a, const glm::vec3& b)
    {
        return glm::length2(a - b) <= glm::epsilon<float>();
    }

    /**
     * @brief Zero check for vec3 using squared length and epsilon.
     * @param v Vector to test.
     * @return True if length²(v) <= 10 * epsilon(float).
     * @ingroup MathUtils
     */
    inline bool is_zero(const glm::vec3& v)
    {
        return glm::length2(v) <= (10 * glm::epsilon<float>());
    }

    /**
     * @brief True if every component of @p v is finite.
     * @ingroup MathUtils
     */
    inline bool is_finite(const glm::vec3& v) noexcept
    {
        return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
    }

    /**
     * @brief Convert a string to lowercase (ASCII).
     *
     * Used for case-insensitive mesh name matching.
     *
     * @param str Input string (copied by value).
     * @return Lowercase version of @p str.
     * @ingroup MathUtils
     */
    inline std::string to_lower(std::string str)
    {
        std::ranges::transform(str, str.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return str;
    }

    /**
     * @brief Normalize a vector safely (avoids NaNs for tiny/invalid inputs).
     *
     * Behaves like `glm::normalize()` but returns (0,0,0) if the vector length
     * is near zero or non-finite.
     *
     * @param v   Input vector.
     * @param eps Threshold under which the vector is treated as zero.
     * @return Normalized vector, or zero on degenerate input.
     * @ingroup MathUtils
     */
    inline glm::vec3 safe_normalize(const glm::vec3& v, float eps = 1e-8f)
    {
        float len2 = glm::dot(v, v);
        if (len2 > eps * eps && std::isfinite(len2))
            return v / std::sqrt(len2);
        return glm::vec3(0.0f);
    }

    /**
     * @brief Normalize a vector safely with a fallback.
     *
     * @param v        Input vector.
     * @param fallback Vector to return if @p v is degenerate.
     * @param eps      Threshold under which the vector is treated as zero.
     * @return Normalized vector, or @p fallback on degenerate input.
     * @ingroup MathUtils
     */
    inline glm::vec3 safe_normalize(const glm::vec3& v,
                                    const glm::vec3& fallback,
                                    float            eps = 1e-8f)
    {
        float len2 = glm::dot(v, v);
        if (len2 > eps * eps && std::isfinite(len2))
            return v / std::sqrt(len2);
        return fallback;
    }

    /**
     * @brief Intersect a ray with a triangle (Möller–Trumbore, double sided).
     *
     * @param r     Input ray (org/dir/inv).
     * @param a     Triangle vertex A.
     * @param b     Triangle vertex B.
     * @param c     Triangle vertex C.
     * @param out_t Distance along the ray to the hit point (if any).
     * @return True if the ray intersects the triangle at t >= 0.
     * @ingroup MathUtils
     */
    bool ray_triangle_intersect(const ray&       r,
                                const glm::vec3& a,
                                const glm::vec3& b,
                                const glm::vec3& c,
                                float&           out_t) noexcept;

    /**
     * @brief View rotation for (yaw, pitch), applied yaw-then-pitch ("YXZ" Euler order).
     *
     * Maps the camera-space forward (0,0,-1) to
     * (-sin(yaw)cos(pitch), sin(pitch), -cos(yaw)cos(pitch)).
     * @ingroup MathUtils
     */
    inline glm::mat3 yaw_pitch_rotation(float yaw, float pitch) noexcept
    {
        const float cy = std::cos(yaw);
        const float sy = std::sin(yaw);
        const float cp = std::cos(pitch);
        const float sp = std::sin(pitch);

        // Columns: camera right, camera up, camera back
        return glm::mat3(glm::vec3(cy, 0.0f, -sy),
                         glm::vec3(sy * sp, cp, cy * sp),
                         glm::vec3(sy * cp, -sp, cy * cp));
    }

    /**
     * @brief Pack three signed 21-bit cell coordinates into one 64-bit key.
     *
     * Coordinates outside [-2^20, 2^20) wrap, which only merges very distant
     * cells and is harmless for density bookkeeping.
     * @ingroup MathUtils
     */
    constexpr uint64_t pack_cell_i21(int32_t x, int32_t y, int32_t z) noexcept
    {
        constexpr uint64_t mask = (uint64_t(1) << 21) - 1;
        return ((uint64_t(uint32_t(x)) & mask) << 42) |
               ((uint64_t(uint32_t(y)) & mask) << 21) |
               (uint64_t(uint32_t(z)) & mask);
    }

    /**
     * @brief Create a runtime_error enriched with source location info.
     *
     * Example output:
     *   collision radius must be > 0 [at PlayerController.cpp:42 in PlayerController::PlayerController(...)]
     */
    inline std::runtime_error core_exception(
        const std::string&   msg,
        std::source_location loc = std::source_location::current())
    {
        // --- Shorten file name ---
        std::string file = loc.file_name();
        if (auto pos = file.find_last_of("/\\"); pos != std::string::npos)
            file = file.substr(pos + 1);

        // --- Simplify the function signature ---
        std::string func = loc.function_name();

        // Replace parameter list with "..."
        if (auto open = func.find('('); open != std::string::npos)
        {
            if (auto close = func.rfind(')'); close != std::string::npos && close > open)
                func.replace(open + 1, close - open - 1, "...");
        }

        return std::runtime_error(
            msg + " [at " + file + ":" + std::to_string(loc.line()) +
            " in " + func + "]");
    }

} // namespace lw

#define TICK(NAME) \
    const auto __tick_##NAME = std::chrono::high_resolution_clock::now();

#define TOCK(NAME)                                                            \
    do                                                                        \
    {                                                                         \
        const auto __tock_##NAME = std::chrono::high_resolution_clock::now(); \
        const auto __dt_##NAME =                                              \
            std::chrono::duration_cast<std::chrono::microseconds>(            \
                __tock_##NAME - __tick_##NAME)                                \
                .count();                                                     \
        std::cerr << #NAME << " took: " << __dt_##NAME / 1000.0 << " ms\n";   \
    }                                                                         \
    while (0)
