//============================================================
// PlayerSettings.hpp
//============================================================
#pragma once

#include <cstdint>
#include <optional>

struct PlayerSettings
{
    // --------------------------------------------------------
    // Body
    // --------------------------------------------------------
    float eyeHeight       = 1.6f;  // eye above the sole
    float collisionHeight = 1.0f;  // capsule height; lower than the eye so door frames don't catch
    float collisionRadius = 0.45f; // horizontal radius, must be > 0

    // --------------------------------------------------------
    // Motion
    // --------------------------------------------------------
    float walkSpeed   = 4.0f;
    float sprintSpeed = 7.0f;
    float flySpeed    = 10.0f;
    float gravity     = -18.0f;
    float jumpSpeed   = 7.0f;

    enum class VelocitySmoothing : uint8_t
    {
        PerSubStep = 0, // fixed blend per sub-step (frame-rate dependent)
        TimeScaled = 1  // blend rescaled by dt / maxSubStep
    };

    float             velocityBlend = 0.15f;
    VelocitySmoothing smoothing     = VelocitySmoothing::PerSubStep;

    // --------------------------------------------------------
    // Integration
    // --------------------------------------------------------
    float maxSubStep    = 0.02f; // seconds
    int   maxIterations = 2;     // penetration passes per sub-step

    // --------------------------------------------------------
    // Collision probes
    // --------------------------------------------------------
    int   collisionSegments = 24;    // ring directions
    float ringLowFraction   = 0.15f; // of collisionHeight, above the sole
    float ringHighFraction  = 0.85f;
    float ringBackOffset    = 0.72f; // of radius, behind the ring center
    float verticalNormalY   = 0.85f; // |n.y| at or above this is treated as floor/ceiling

    float groundProbeLift   = 0.2f;
    float groundProbeLength = 3.0f;
    float groundTolerance   = 1e-3f;

    // Ignore ground hits above the eye (overhangs, ceilings crossed while jumping)
    bool groundProbeBelowEyeOnly = false;

    bool  enableVelocitySweep = true;
    float sweepSkin           = 0.02f;

    // --------------------------------------------------------
    // Recovery
    // --------------------------------------------------------
    float rollbackPushFraction = 0.6f;  // of radius
    float safePushEpsilon      = 0.01f; // push below this records a safe position

    bool  enableStepUp       = true;
    float stepHeight         = 0.3f;
    float stepHeightFraction = 0.8f; // of collisionHeight, caps stepHeight

    // Teleport back to spawn when the eye drops below this (only with collision meshes)
    std::optional<float> respawnBelowY;

    // --------------------------------------------------------
    // Look
    // --------------------------------------------------------
    float pitchLimit = 1.5607963f; // pi/2 - 0.01
};
