#include "ScanController.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>
#include <utility>

#include "CoreUtilities.hpp"
#include "StaticMesh.hpp"
#include "ViewSource.hpp"
#include "WorldQuery.hpp"

namespace
{
    constexpr float kTwoPi = 6.28318530718f;

    void requirePositive(int value, const char* what)
    {
        if (value <= 0)
            throw lw::core_exception(std::string(what) + " must be > 0 (got " + std::to_string(value) + ")");
    }

    /// Camera-space direction through the normalized view offset (vx, vy) in [-0.5, 0.5].
    glm::vec3 frustumDirection(const CameraLens& lens, float vx, float vy)
    {
        const float tanV = std::tan(glm::radians(lens.vFovDeg) * 0.5f);
        const float tanH = tanV * lens.aspect;

        return glm::normalize(glm::vec3(2.0f * vx * tanH, 2.0f * vy * tanV, -1.0f));
    }
} // namespace

ScanController::ScanController(const WorldQuery& query, const ViewSource& view, ScanSettings settings) :
    m_query(query),
    m_view(view),
    m_settings(std::move(settings)),
    m_points(m_settings.pointLimit, m_settings.densityCell, m_settings.densityMaxPerCell),
    m_rng(m_settings.seed)
{
    if (!(m_settings.maxDistance > 0.0f) || !std::isfinite(m_settings.maxDistance))
        throw lw::core_exception("scan max distance must be finite and > 0");

    requirePositive(m_settings.burstRays, "burst rays");
    requirePositive(m_settings.azimuthSteps, "azimuth steps");
    requirePositive(m_settings.elevationSteps, "elevation steps");

    if (!std::isfinite(m_settings.lifetime) || m_settings.lifetime < 0.0f)
        throw lw::core_exception("point lifetime must be finite and >= 0");
}

void ScanController::setMeshes(std::vector<StaticMesh*> meshes)
{
    // A sweep never spans two mesh sets
    cancelSweep();
    m_meshes = std::move(meshes);
}

void ScanController::setLens(const CameraLens& lens)
{
    if (!(lens.vFovDeg > 0.0f && lens.vFovDeg < 180.0f))
        throw lw::core_exception("vertical fov must be in (0, 180) degrees");

    if (!(lens.aspect > 0.0f) || !std::isfinite(lens.aspect))
        throw lw::core_exception("aspect ratio must be finite and > 0");

    m_lens = lens;
}

void ScanController::setEnabled(bool enabled) noexcept
{
    m_settings.enabled = enabled;

    if (!enabled)
        cancelSweep();
}

bool ScanController::canScan() const noexcept
{
    return m_settings.enabled && !m_meshes.empty();
}

// ------------------------------------------------------------
// Patterns
// ------------------------------------------------------------

size_t ScanController::fireBurst()
{
    if (!canScan())
        return 0;

    const ViewPose  pose = m_view.viewPose();
    const glm::mat3 rot  = lw::yaw_pitch_rotation(pose.yaw, pose.pitch);

    size_t hits = 0;

    for (int i = 0; i < m_settings.burstRays; ++i)
    {
        const float az = kTwoPi * static_cast<float>(m_azimuth) / static_cast<float>(m_settings.azimuthSteps);
        const float t  = m_settings.elevationSteps > 1
                             ? static_cast<float>(m_elevation) / static_cast<float>(m_settings.elevationSteps - 1)
                             : 0.5f;
        const float el = glm::mix(m_settings.elevationMin, m_settings.elevationMax, t);

        const glm::vec3 local(std::cos(el) * std::sin(az), std::sin(el), -std::cos(el) * std::cos(az));

        if (castAndWrite(pose.eye, rot * local).valid())
            ++hits;

        if (++m_azimuth >= m_settings.azimuthSteps)
        {
            m_azimuth   = 0;
            m_elevation = (m_elevation + 1) % m_settings.elevationSteps;
        }
    }

    ++m_stats.bursts;

    std::cerr << "ScanController: burst rays=" << m_settings.burstRays << " hits=" << hits
              << " points=" << m_points.liveCount() << "\n";

    return hits;
}

size_t ScanController::scanView(int samplesX, int samplesY)
{
    requirePositive(samplesX, "view scan samplesX");
    requirePositive(samplesY, "view scan samplesY");

    if (!canScan())
        return 0;

    const ViewPose  pose = m_view.viewPose();
    const glm::mat3 rot  = lw::yaw_pitch_rotation(pose.yaw, pose.pitch);

    size_t hits = 0;

    for (int y = 0; y < samplesY; ++y)
    {
        const float vy = (static_cast<float>(y) + 0.5f) / static_cast<float>(samplesY) - 0.5f;

        for (int x = 0; x < samplesX; ++x)
        {
            const float vx = (static_cast<float>(x) + 0.5f) / static_cast<float>(samplesX) - 0.5f;

            if (castAndWrite(pose.eye, rot * frustumDirection(m_lens, vx, vy)).valid())
                ++hits;
        }
    }

    ++m_stats.viewScans;

    std::cerr << "ScanController: view scan " << samplesX << "x" << samplesY << " hits=" << hits
              << " points=" << m_points.liveCount() << "\n";

    return hits;
}

void ScanController::startSweep(int samplesX, int lines, float duration)
{
    requirePositive(samplesX, "sweep samplesX");
    requirePositive(lines, "sweep lines");

    if (!(duration > 0.0f) || !std::isfinite(duration))
        throw lw::core_exception("sweep duration must be finite and > 0");

    // Last call wins
    cancelSweep();

    if (!canScan())
        return;

    m_sweep.active   = true;
    m_sweep.samplesX = samplesX;
    m_sweep.lines    = lines;
    m_sweep.duration = duration;

    ++m_stats.sweeps;
}

void ScanController::cancelSweep() noexcept
{
    m_sweep = SweepState{};
    m_beam.reset();
}

void ScanController::update(float dt)
{
    if (!(dt >= 0.0f) || !std::isfinite(dt))
        return;

    m_elapsed += dt;

    if (m_sweep.active && canScan())
    {
        m_sweep.elapsed += dt;

        const double progress = m_sweep.elapsed / static_cast<double>(m_sweep.duration);
        const int    target   = static_cast<int>(std::min<double>(m_sweep.lines, std::floor(progress * m_sweep.lines)));

        if (target > m_sweep.linesDone)
        {
            const ViewPose pose = m_view.viewPose();

            // Top line first
            while (m_sweep.linesDone < target)
            {
                processSweepLine(pose, m_sweep.lines - 1 - m_sweep.linesDone);
                ++m_sweep.linesDone;
                ++m_stats.linesProcessed;
            }
        }

        if (m_sweep.linesDone >= m_sweep.lines)
        {
            std::cerr << "ScanController: sweep done lines=" << m_sweep.lines
                      << " points=" << m_points.liveCount() << "\n";
            cancelSweep();
        }
    }

    if (m_settings.enabled && m_settings.fade)
        m_points.fade(m_elapsed, m_settings.lifetime, m_settings.fadeThreshold);
}

void ScanController::processSweepLine(const ViewPose& pose, int lineIndex)
{
    const glm::mat3 rot = lw::yaw_pitch_rotation(pose.yaw, pose.pitch);
    const float     vy  = (static_cast<float>(lineIndex) + 0.5f) / static_cast<float>(m_sweep.lines) - 0.5f;

    std::uniform_int_distribution<int> pick(0, m_sweep.samplesX - 1);
    const int                          beamColumn = pick(m_rng);

    for (int x = 0; x < m_sweep.samplesX; ++x)
    {
        const float     vx  = (static_cast<float>(x) + 0.5f) / static_cast<float>(m_sweep.samplesX) - 0.5f;
        const glm::vec3 dir = rot * frustumDirection(m_lens, vx, vy);
        const WorldHit  hit = castAndWrite(pose.eye, dir);

        if (x != beamColumn)
            continue;

        BeamSegment beam;
        beam.start = pose.eye + rot * m_settings.handOffset;
        beam.hit   = hit.valid();
        beam.end   = beam.hit ? hit.point : beam.start + dir * (m_settings.beamFallbackFraction * m_settings.maxDistance);
        m_beam     = beam;
    }
}

WorldHit ScanController::castAndWrite(const glm::vec3& origin, const glm::vec3& dir)
{
    ++m_stats.raysFired;

    WorldHit hit = m_query.castFrom(origin, dir, m_settings.maxDistance, m_meshes);
    if (!hit.valid())
        return hit;

    ++m_stats.hits;

    const float intensity = PointBuffer::intensityFor(hit.dist,
                                                      m_settings.maxDistance,
                                                      m_settings.minIntensity,
                                                      m_settings.maxIntensity);

    if (!m_points.write(hit.point, pointColor(hit.mesh), intensity, m_elapsed))
        ++m_stats.rejected;

    return hit;
}

glm::vec3 ScanController::pointColor(const StaticMesh* mesh) const
{
    if (!m_settings.colorBySurface || !mesh)
        return m_settings.baseColor;

    return m_settings.surfaceColors[static_cast<size_t>(mesh->surfaceClass())];
}

// ------------------------------------------------------------
// Runtime tuning
// ------------------------------------------------------------

void ScanController::clear()
{
    m_points.clear();
}

void ScanController::setFade(bool enabled) noexcept
{
    m_settings.fade = enabled;
}

void ScanController::setLifetime(float seconds)
{
    if (!std::isfinite(seconds) || seconds < 0.0f)
        throw lw::core_exception("point lifetime must be finite and >= 0");

    m_settings.lifetime = seconds;
}

void ScanController::setMaxIntensity(float value)
{
    if (!std::isfinite(value) || value < 0.0f)
        throw lw::core_exception("max intensity must be finite and >= 0");

    m_settings.maxIntensity = value;
}

void ScanController::setDensityParams(float cell, uint32_t maxPerCell)
{
    m_points.setDensity(cell, maxPerCell);

    m_settings.densityCell       = cell;
    m_settings.densityMaxPerCell = maxPerCell;
}
