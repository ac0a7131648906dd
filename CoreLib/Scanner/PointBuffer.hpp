#pragma once

#include <cstddef>
#include <cstdint>
#include <glm/vec3.hpp>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

/**
 * @brief One resident scan point, as read back from its slot.
 */
struct ScanPoint
{
    glm::vec3 position      = glm::vec3(0.0f);
    float     baseIntensity = 0.0f;
    float     spawnTime     = 0.0f;
    uint32_t  slot          = 0;
};

/**
 * @brief Fixed-capacity ring of scan points with a per-voxel density gate.
 *
 * Storage is a set of parallel arrays allocated once at construction and
 * addressed by slot index; nothing is ever erased, the write cursor simply
 * wraps and overwrites the oldest slot. Positions and colors are laid out
 * contiguously so a renderer can upload them as-is.
 *
 * The density gate counts accepted points per voxel of densityCell metres
 * and rejects writes once a voxel holds maxPerCell. Counts are only reset
 * by clear() or setDensity(), not when a slot is overwritten.
 */
class PointBuffer
{
public:
    /**
     * @param capacity    Number of slots (> 0).
     * @param densityCell Voxel edge length; <= 0 disables the gate.
     * @param maxPerCell  Points accepted per voxel (> 0 when the gate is on).
     */
    explicit PointBuffer(uint32_t capacity, float densityCell = 0.1f, uint32_t maxPerCell = 100);

    PointBuffer(const PointBuffer&)            = delete;
    PointBuffer& operator=(const PointBuffer&) = delete;

    /**
     * @brief Intensity for a hit at @p dist: clamp((1 - dist/maxDistance)^2, minI, maxI).
     */
    [[nodiscard]] static float intensityFor(float dist, float maxDistance, float minIntensity, float maxIntensity) noexcept;

    /**
     * @brief Fraction of a point's brightness left at @p age: clamp(1 - age/lifetime, 0, 1).
     *
     * Exactly 0 once age >= lifetime.
     */
    [[nodiscard]] static float remainingFor(float age, float lifetime) noexcept;

    /**
     * @brief Store one point at slot (cursor mod capacity).
     * @return The slot written, or nullopt if the density gate rejected it.
     */
    std::optional<uint32_t> write(const glm::vec3& position, const glm::vec3& baseColor, float intensity, float spawnTime);

    /**
     * @brief Recompute displayed colors for aging points.
     *
     * Slots with negative age are skipped. A slot is rewritten only when a
     * channel moved by more than @p threshold, or when it just went dark.
     * @return Number of slots rewritten.
     */
    size_t fade(float elapsed, float lifetime, float threshold);

    /** @brief Reset cursor, zero all storage and forget density counts. */
    void clear();

    /** @brief Change the density gate; also forgets current counts. */
    void setDensity(float densityCell, uint32_t maxPerCell);

    // ------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------

    [[nodiscard]] uint32_t capacity() const noexcept { return m_capacity; }
    [[nodiscard]] uint32_t liveCount() const noexcept;
    [[nodiscard]] uint64_t written() const noexcept { return m_written; }
    [[nodiscard]] uint64_t rejected() const noexcept { return m_rejected; }

    /** @brief Slot the next accepted write will use. */
    [[nodiscard]] uint32_t cursorSlot() const noexcept;

    [[nodiscard]] float    densityCell() const noexcept { return m_densityCell; }
    [[nodiscard]] uint32_t densityMaxPerCell() const noexcept { return m_maxPerCell; }

    /** @brief Accepted points counted in the voxel containing @p p. */
    [[nodiscard]] uint32_t densityCount(const glm::vec3& p) const;

    [[nodiscard]] ScanPoint        point(uint32_t slot) const;
    [[nodiscard]] const glm::vec3& position(uint32_t slot) const;
    [[nodiscard]] const glm::vec3& color(uint32_t slot) const;
    [[nodiscard]] const glm::vec3& baseColor(uint32_t slot) const;

    [[nodiscard]] std::span<const glm::vec3> positions() const noexcept { return m_positions; }
    [[nodiscard]] std::span<const glm::vec3> colors() const noexcept { return m_colors; }

private:
    [[nodiscard]] uint64_t voxelKey(const glm::vec3& p) const noexcept;
    void                   checkSlot(uint32_t slot) const;

    uint32_t m_capacity;
    uint64_t m_written  = 0; // accepted writes since clear(); cursor = m_written % capacity
    uint64_t m_rejected = 0;

    std::vector<glm::vec3> m_positions;
    std::vector<glm::vec3> m_colors;     // displayed
    std::vector<glm::vec3> m_baseColors; // color at full brightness
    std::vector<float>     m_spawnTimes;
    std::vector<float>     m_baseIntensities;

    float                                  m_densityCell;
    uint32_t                               m_maxPerCell;
    std::unordered_map<uint64_t, uint32_t> m_density;
};
