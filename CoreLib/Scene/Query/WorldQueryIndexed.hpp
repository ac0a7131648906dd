#pragma once

#include <cstdint>
#include <vector>

#include "WorldQuery.hpp"

class StaticMesh;

namespace lw
{
    struct ray;
} // namespace lw

/**
 * @brief Per-query counters, mainly for diagnostics and tests.
 */
struct WorldQueryStats
{
    uint64_t casts           = 0; ///< cast() calls
    uint64_t indexedTests    = 0; ///< mesh tests answered by a MeshIndex
    uint64_t bruteForceTests = 0; ///< mesh tests answered by triangle iteration
};

/**
 * @brief WorldQuery that uses each mesh's MeshIndex when one is Ready.
 *
 * Meshes without a usable index (not built yet, failed, or not indexable)
 * fall back to brute-force triangle testing, O(triangle count), so the world
 * is never "partially solid" while indices warm up. The search length shrinks
 * to the best hit found so far as meshes are visited.
 */
class WorldQueryIndexed final : public WorldQuery
{
public:
    WorldQueryIndexed()           = default;
    ~WorldQueryIndexed() override = default;

    WorldHit cast(const lw::ray&                  ray,
                  float                           maxDistance,
                  const std::vector<StaticMesh*>& meshes) const override;

    [[nodiscard]] const WorldQueryStats& stats() const noexcept
    {
        return m_stats;
    }

    void resetStats() noexcept
    {
        m_stats = {};
    }

private:
    mutable WorldQueryStats m_stats;
};
