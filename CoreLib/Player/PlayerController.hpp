#pragma once

#include <cstdint>
#include <glm/glm.hpp>
#include <optional>
#include <vector>

#include "CoreTypes.hpp"
#include "PlayerSettings.hpp"
#include "ViewSource.hpp"

class StaticMesh;
class WorldQuery;

/**
 * @brief Counters accumulated over the controller's lifetime.
 */
struct PlayerStats
{
    uint64_t subSteps  = 0;
    uint64_t rollbacks = 0;
    uint64_t stepUps   = 0;
    uint64_t landings  = 0;
    uint64_t takeoffs  = 0; // walked off an edge or jumped
    uint64_t respawns  = 0;
};

/**
 * @brief First-person capsule controller built on ray probes only.
 *
 * The player is a vertical capsule of collisionHeight/collisionRadius whose
 * sole sits eyeHeight below the eye. Each update() is sliced into sub-steps
 * of at most maxSubStep. Every sub-step blends velocity toward the input,
 * applies gravity, probes the ground, sweeps along the horizontal velocity,
 * integrates, then resolves penetration with two rings of horizontal ray
 * samples. Deep penetration rolls back to the last safe position and small
 * obstructions can be climbed with a step-up.
 *
 * With no collision meshes every probe is skipped and the player flies
 * freely under gravity.
 */
class PlayerController : public ViewSource
{
public:
    /**
     * @param query    Ray query service used for every probe
     * @param settings Validated here; throws for non-positive radius, sub-step,
     *                 iteration count or fewer than 3 ring segments
     * @param spawnEye Initial eye position (also the respawn point)
     */
    PlayerController(const WorldQuery& query, PlayerSettings settings = {}, const glm::vec3& spawnEye = glm::vec3(0.0f, 1.6f, 0.0f));

    PlayerController(const PlayerController&)            = delete;
    PlayerController& operator=(const PlayerController&) = delete;

    // ------------------------------------------------------------
    // Inputs
    // ------------------------------------------------------------

    /** @brief Replace the collision set. An empty set means free flight. */
    void setCollisionMeshes(std::vector<StaticMesh*> meshes);

    /** @brief Advance by @p dt seconds with the given held inputs. */
    void update(float dt, const MoveInput& input);

    /** @brief Apply accumulated look deltas; pitch is clamped to the limit. */
    void look(float dYaw, float dPitch) noexcept;

    /** @brief Move the eye, clear velocity and grounded, and mark the spot safe. */
    void teleport(const glm::vec3& eye, std::optional<float> yaw = std::nullopt, std::optional<float> pitch = std::nullopt);

    void setSpawn(const glm::vec3& eye) noexcept;

    void setFreeFly(bool enabled) noexcept;

    // ------------------------------------------------------------
    // State
    // ------------------------------------------------------------

    [[nodiscard]] const glm::vec3& position() const noexcept { return m_position; }
    [[nodiscard]] const glm::vec3& velocity() const noexcept { return m_velocity; }
    [[nodiscard]] const glm::vec3& safePosition() const noexcept { return m_lastSafe; }
    [[nodiscard]] float            yaw() const noexcept { return m_yaw; }
    [[nodiscard]] float            pitch() const noexcept { return m_pitch; }
    [[nodiscard]] bool             grounded() const noexcept { return m_grounded; }
    [[nodiscard]] bool             freeFly() const noexcept { return m_freeFly; }

    [[nodiscard]] const PlayerSettings& settings() const noexcept { return m_settings; }
    [[nodiscard]] const PlayerStats&    stats() const noexcept { return m_stats; }

    /** @brief Transform for presentation sync, refreshed at the end of each sub-step. */
    [[nodiscard]] const PlayerTransform& transform() const noexcept { return m_transform; }

    [[nodiscard]] ViewPose viewPose() const override;

    /** @brief Sole height (eye minus eyeHeight). */
    [[nodiscard]] float soleY() const noexcept;

    /**
     * @brief Smallest ring-sample distance from the ring centers to geometry.
     *
     * Uses the same probes as penetration resolution. Returns +infinity when
     * nothing is within reach or there are no collision meshes.
     */
    [[nodiscard]] float minRingClearance() const;

private:
    void step(float dt, const MoveInput& input);
    void stepFreeFly(float dt, const MoveInput& input);

    glm::vec3 wishVelocity(const MoveInput& input) const;
    float     blendFactor(float dt) const noexcept;

    void  probeGround();
    void  sweepVelocity(float dt);
    float resolvePenetration();
    bool  ringsBlocked(const glm::vec3& eye) const;

    float ringCenterY(const glm::vec3& eye, float fraction) const noexcept;
    void  publish() noexcept;

    const WorldQuery&        m_query;
    PlayerSettings           m_settings;
    std::vector<StaticMesh*> m_meshes;
    std::vector<glm::vec3>   m_ringDirs;

    glm::vec3 m_position;
    glm::vec3 m_velocity = glm::vec3(0.0f);
    glm::vec3 m_lastSafe;
    glm::vec3 m_spawn;
    float     m_yaw      = 0.0f;
    float     m_pitch    = 0.0f;
    bool      m_grounded = false;
    bool      m_freeFly  = false;

    PlayerTransform m_transform;
    PlayerStats     m_stats;
};
