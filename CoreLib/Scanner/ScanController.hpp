#pragma once

#include <cstddef>
#include <cstdint>
#include <glm/glm.hpp>
#include <optional>
#include <random>
#include <vector>

#include "CoreTypes.hpp"
#include "PointBuffer.hpp"
#include "ScanSettings.hpp"

class StaticMesh;
class ViewSource;
class WorldQuery;
struct WorldHit;

/**
 * @brief The one beam line shown while a sweep is running.
 */
struct BeamSegment
{
    glm::vec3 start = glm::vec3(0.0f); ///< Hand position (world)
    glm::vec3 end   = glm::vec3(0.0f); ///< Hit point, or a fixed-length fallback
    bool      hit   = false;
};

struct ScanStats
{
    uint64_t raysFired      = 0;
    uint64_t hits           = 0;
    uint64_t rejected       = 0; ///< hits dropped by the density gate
    uint64_t linesProcessed = 0;
    uint64_t bursts         = 0;
    uint64_t viewScans      = 0;
    uint64_t sweeps         = 0;
};

/**
 * @brief Drives the scanning sensor: burst, view scan and animated sweep.
 *
 * Every pattern casts rays from the current view pose through the world
 * query and writes hits into the owned PointBuffer. All work happens
 * synchronously inside the calling tick.
 *
 * Scans are no-ops while the scan layer is disabled or no meshes are set.
 * Malformed sample counts or durations throw.
 */
class ScanController
{
public:
    ScanController(const WorldQuery& query, const ViewSource& view, ScanSettings settings = {});

    ScanController(const ScanController&)            = delete;
    ScanController& operator=(const ScanController&) = delete;

    void setMeshes(std::vector<StaticMesh*> meshes);

    /** @brief Camera lens used for view scans and sweeps; throws on invalid fov/aspect. */
    void setLens(const CameraLens& lens);

    void setEnabled(bool enabled) noexcept;

    // ------------------------------------------------------------
    // Patterns
    // ------------------------------------------------------------

    /**
     * @brief Fire burstRays rays along the persistent azimuth/elevation raster.
     * @return Number of hits.
     */
    size_t fireBurst();

    /**
     * @brief One pass over a samplesX x samplesY grid spanning the view frustum.
     * @return Number of hits.
     */
    size_t scanView(int samplesX = 80, int samplesY = 45);

    /**
     * @brief Start a top-to-bottom sweep; replaces any sweep in progress.
     */
    void startSweep(int samplesX = 80, int lines = 60, float duration = 0.5f);

    /** @brief Stop the active sweep and clear its beam. */
    void cancelSweep() noexcept;

    /**
     * @brief Advance time: process due sweep lines, then fade points.
     */
    void update(float dt);

    // ------------------------------------------------------------
    // Runtime tuning
    // ------------------------------------------------------------

    void clear();
    void setFade(bool enabled) noexcept;
    void setLifetime(float seconds);
    void setMaxIntensity(float value);
    void setDensityParams(float cell, uint32_t maxPerCell);

    // ------------------------------------------------------------
    // State
    // ------------------------------------------------------------

    [[nodiscard]] bool  enabled() const noexcept { return m_settings.enabled; }
    [[nodiscard]] float elapsed() const noexcept { return m_elapsed; }

    [[nodiscard]] bool sweepActive() const noexcept { return m_sweep.active; }
    [[nodiscard]] int  sweepLines() const noexcept { return m_sweep.lines; }
    [[nodiscard]] int  sweepLinesDone() const noexcept { return m_sweep.linesDone; }

    [[nodiscard]] const std::optional<BeamSegment>& beam() const noexcept { return m_beam; }

    /** @brief Raster cursor of the next burst ray as {azimuth, elevation}. */
    [[nodiscard]] glm::ivec2 burstCursor() const noexcept { return {m_azimuth, m_elevation}; }

    [[nodiscard]] const PointBuffer&  points() const noexcept { return m_points; }
    [[nodiscard]] const ScanStats&    stats() const noexcept { return m_stats; }
    [[nodiscard]] const ScanSettings& settings() const noexcept { return m_settings; }

private:
    struct SweepState
    {
        bool   active    = false;
        int    samplesX  = 0;
        int    lines     = 0;
        int    linesDone = 0;
        float  duration  = 0.0f;
        double elapsed   = 0.0;
    };

    [[nodiscard]] bool canScan() const noexcept;

    WorldHit  castAndWrite(const glm::vec3& origin, const glm::vec3& dir);
    void      processSweepLine(const ViewPose& pose, int lineIndex);
    glm::vec3 pointColor(const StaticMesh* mesh) const;

    const WorldQuery&        m_query;
    const ViewSource&        m_view;
    ScanSettings             m_settings;
    CameraLens               m_lens;
    std::vector<StaticMesh*> m_meshes;

    PointBuffer  m_points;
    std::mt19937 m_rng;
    float        m_elapsed = 0.0f;

    int m_azimuth   = 0;
    int m_elevation = 0;

    SweepState                 m_sweep;
    std::optional<BeamSegment> m_beam;
    ScanStats                  m_stats;
};
