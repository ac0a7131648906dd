//
//  CoreTypes.hpp
//  Core
//
// Public enums and types that are visible to both the simulation core and
// the host application (input layer, renderer, HUD).

#pragma once

#include <cstddef>
#include <cstdint>
#include <glm/vec3.hpp>

/**
 * @brief Held movement keys for one tick, already mapped from raw devices.
 */
struct MoveInput
{
    bool forward = false;
    bool back    = false;
    bool left    = false;
    bool right   = false;
    bool sprint  = false;
    bool jump    = false;
    bool ascend  = false; // free-fly only
    bool descend = false; // free-fly only
};

/**
 * @brief Accumulated, sensitivity-scaled look deltas in radians.
 */
struct LookDelta
{
    float yaw   = 0.0f;
    float pitch = 0.0f;
};

/**
 * @brief Explicit mode flags supplied by the host each tick.
 */
struct PlayerModes
{
    bool freeFly = false; ///< Creative flight: no gravity, no collision
};

/**
 * @brief Camera projection parameters that shape scan sampling grids.
 */
struct CameraLens
{
    float vFovDeg = 75.0f;
    float aspect  = 16.0f / 9.0f;
};

/**
 * @brief Eye position and orientation (Y up, yaw about Y, pitch about X).
 */
struct ViewPose
{
    glm::vec3 eye   = glm::vec3(0.0f);
    float     yaw   = 0.0f;
    float     pitch = 0.0f;
};

/**
 * @brief Player transform published to presentation each tick.
 */
struct PlayerTransform
{
    glm::vec3 position = glm::vec3(0.0f);
    float     yaw      = 0.0f;
    float     pitch    = 0.0f;
};

/**
 * @brief Counters for HUD/diagnostic overlays.
 */
struct CoreDiagnostics
{
    size_t    meshes         = 0;
    size_t    indexPending   = 0;
    size_t    indexBuilt     = 0;
    size_t    indexFailed    = 0;
    uint64_t  raysFired      = 0;
    uint64_t  rayHits        = 0;
    uint64_t  pointsRejected = 0;
    size_t    livePoints     = 0;
    bool      grounded       = false;
    glm::vec3 velocity       = glm::vec3(0.0f);
};
