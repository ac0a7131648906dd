#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <unordered_set>
#include <vector>

#include "MeshIndex.hpp"

class StaticMesh;

/**
 * @brief Incremental, time-budgeted builder of per-mesh spatial indices.
 *
 * Meshes are registered at world-load time and built cheapest first
 * (ascending triangle count) so partial coverage becomes useful sooner.
 * build() yields once the wall-clock budget is exceeded; the budget is only
 * checked between meshes, a single build is never interrupted.
 *
 * A mesh whose build throws is logged and marked IndexState::Failed. It is
 * never queued again and ray queries keep answering it by brute force.
 *
 * Not thread-safe. A background builder would need to publish indices to
 * the query side under synchronization.
 */
class MeshIndexBuilder
{
public:
    /// Monotonic time source in milliseconds.
    using Clock = std::function<double()>;

    /// Builds an index for a mesh; throws on failure.
    using IndexFactory = std::function<std::unique_ptr<MeshIndex>(const StaticMesh&)>;

    static constexpr double kDefaultBudgetMs = 6.0;

    /**
     * @param factory Index factory (e.g. Embree backed).
     * @param clock   Time source; defaults to std::chrono::steady_clock.
     */
    explicit MeshIndexBuilder(IndexFactory factory, Clock clock = {});

    /**
     * @brief Queue a mesh for indexing.
     * @return True if the mesh was queued. False for null meshes, meshes
     *         already queued, indexed or failed, and non-indexable geometry.
     */
    bool registerMesh(StaticMesh* mesh);

    /**
     * @brief Build queued indices until the budget is exceeded.
     * @param budgetMs Wall-clock budget for this call.
     * @return Number of meshes processed (built or failed).
     */
    size_t build(double budgetMs = kDefaultBudgetMs);

    /** @brief Drop the queue (world replaced). Counters are kept. */
    void clear();

    [[nodiscard]] size_t pending() const noexcept;
    [[nodiscard]] bool   isQueued(const StaticMesh* mesh) const noexcept;

    /** @brief Queue contents in build order. */
    [[nodiscard]] const std::vector<StaticMesh*>& queue() const noexcept;

    [[nodiscard]] size_t   builtCount() const noexcept;
    [[nodiscard]] size_t   failedCount() const noexcept;
    [[nodiscard]] uint64_t trianglesBuilt() const noexcept;

private:
    void logProgress(double now);

    IndexFactory m_factory;
    Clock        m_clock;

    std::vector<StaticMesh*>              m_queue; // sorted by triangle count, ascending
    std::unordered_set<const StaticMesh*> m_queued;

    size_t   m_built          = 0;
    size_t   m_failed         = 0;
    uint64_t m_trianglesBuilt = 0;
    double   m_lastLogMs      = -1.0e9;
};
