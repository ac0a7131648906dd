#include "PointBuffer.hpp"

#include <algorithm>
#include <cmath>
#include <glm/glm.hpp>
#include <string>

#include "CoreUtilities.hpp"

PointBuffer::PointBuffer(uint32_t capacity, float densityCell, uint32_t maxPerCell)
    : m_capacity(capacity),
      m_densityCell(0.0f),
      m_maxPerCell(0)
{
    if (m_capacity == 0)
        throw lw::core_exception("point buffer capacity must be > 0");

    setDensity(densityCell, maxPerCell);

    m_positions.assign(m_capacity, glm::vec3(0.0f));
    m_colors.assign(m_capacity, glm::vec3(0.0f));
    m_baseColors.assign(m_capacity, glm::vec3(0.0f));
    m_spawnTimes.assign(m_capacity, 0.0f);
    m_baseIntensities.assign(m_capacity, 0.0f);
}

float PointBuffer::intensityFor(float dist, float maxDistance, float minIntensity, float maxIntensity) noexcept
{
    const float f = maxDistance > 0.0f ? std::max(0.0f, 1.0f - dist / maxDistance) : 0.0f;
    float       b = f * f;

    // min then max: with min > max the result is max
    if (b < minIntensity)
        b = minIntensity;
    if (b > maxIntensity)
        b = maxIntensity;

    return b;
}

float PointBuffer::remainingFor(float age, float lifetime) noexcept
{
    if (!(lifetime > 0.0f) || age >= lifetime)
        return 0.0f;

    return std::clamp(1.0f - age / lifetime, 0.0f, 1.0f);
}

std::optional<uint32_t> PointBuffer::write(const glm::vec3& position, const glm::vec3& baseColor, float intensity, float spawnTime)
{
    if (m_densityCell > 0.0f)
    {
        uint32_t& count = m_density[voxelKey(position)];
        if (count >= m_maxPerCell)
        {
            ++m_rejected;
            return std::nullopt;
        }
        ++count;
    }

    const uint32_t slot = cursorSlot();

    m_positions[slot]       = position;
    m_baseColors[slot]      = baseColor;
    m_colors[slot]          = baseColor * intensity;
    m_spawnTimes[slot]      = spawnTime;
    m_baseIntensities[slot] = intensity;

    ++m_written;
    return slot;
}

size_t PointBuffer::fade(float elapsed, float lifetime, float threshold)
{
    const uint32_t count     = liveCount();
    size_t         rewritten = 0;

    for (uint32_t i = 0; i < count; ++i)
    {
        const float age = elapsed - m_spawnTimes[i];
        if (age < 0.0f)
            continue;

        const float     remaining = remainingFor(age, lifetime);
        const glm::vec3 target    = m_baseColors[i] * (m_baseIntensities[i] * remaining);
        const glm::vec3 delta     = glm::abs(m_colors[i] - target);

        const bool moved   = delta.x > threshold || delta.y > threshold || delta.z > threshold;
        const bool wentOut = remaining == 0.0f && m_colors[i] != target;

        if (moved || wentOut)
        {
            m_colors[i] = target;
            ++rewritten;
        }
    }

    return rewritten;
}

void PointBuffer::clear()
{
    std::fill(m_positions.begin(), m_positions.end(), glm::vec3(0.0f));
    std::fill(m_colors.begin(), m_colors.end(), glm::vec3(0.0f));
    std::fill(m_baseColors.begin(), m_baseColors.end(), glm::vec3(0.0f));
    std::fill(m_spawnTimes.begin(), m_spawnTimes.end(), 0.0f);
    std::fill(m_baseIntensities.begin(), m_baseIntensities.end(), 0.0f);

    m_written  = 0;
    m_rejected = 0;
    m_density.clear();
}

void PointBuffer::setDensity(float densityCell, uint32_t maxPerCell)
{
    if (!std::isfinite(densityCell))
        throw lw::core_exception("density cell size must be finite");

    if (densityCell > 0.0f && maxPerCell == 0)
        throw lw::core_exception("density cap must be > 0 when the density gate is enabled");

    m_densityCell = densityCell;
    m_maxPerCell  = maxPerCell;
    m_density.clear();
}

uint32_t PointBuffer::liveCount() const noexcept
{
    return static_cast<uint32_t>(std::min<uint64_t>(m_written, m_capacity));
}

uint32_t PointBuffer::cursorSlot() const noexcept
{
    return static_cast<uint32_t>(m_written % m_capacity);
}

uint32_t PointBuffer::densityCount(const glm::vec3& p) const
{
    if (!(m_densityCell > 0.0f))
        return 0;

    auto it = m_density.find(voxelKey(p));
    return it == m_density.end() ? 0 : it->second;
}

ScanPoint PointBuffer::point(uint32_t slot) const
{
    checkSlot(slot);

    ScanPoint p;
    p.position      = m_positions[slot];
    p.baseIntensity = m_baseIntensities[slot];
    p.spawnTime     = m_spawnTimes[slot];
    p.slot          = slot;
    return p;
}

const glm::vec3& PointBuffer::position(uint32_t slot) const
{
    checkSlot(slot);
    return m_positions[slot];
}

const glm::vec3& PointBuffer::color(uint32_t slot) const
{
    checkSlot(slot);
    return m_colors[slot];
}

const glm::vec3& PointBuffer::baseColor(uint32_t slot) const
{
    checkSlot(slot);
    return m_baseColors[slot];
}

uint64_t PointBuffer::voxelKey(const glm::vec3& p) const noexcept
{
    const glm::vec3 cell = glm::floor(p / m_densityCell);
    return lw::pack_cell_i21(static_cast<int32_t>(cell.x), static_cast<int32_t>(cell.y), static_cast<int32_t>(cell.z));
}

void PointBuffer::checkSlot(uint32_t slot) const
{
    if (slot >= m_capacity)
        throw lw::core_exception("slot " + std::to_string(slot) + " out of range (capacity " + std::to_string(m_capacity) + ")");
}
