#include "PlayerController.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <iostream>
#include <limits>
#include <utility>

#include "CoreUtilities.hpp"
#include "StaticMesh.hpp"
#include "WorldQuery.hpp"

namespace
{
    constexpr float kMinSubStep = 1e-6f;
    constexpr float kTwoPi      = 6.28318530717958647692f;

    const glm::vec3 kUp(0.0f, 1.0f, 0.0f);
    const glm::vec3 kDown(0.0f, -1.0f, 0.0f);

} // namespace

// --------------------------------------------------------
// Construction
// --------------------------------------------------------

PlayerController::PlayerController(const WorldQuery& query, PlayerSettings settings, const glm::vec3& spawnEye)
    : m_query(query),
      m_settings(std::move(settings)),
      m_position(spawnEye),
      m_lastSafe(spawnEye),
      m_spawn(spawnEye)
{
    if (!(m_settings.collisionRadius > 0.0f))
        throw lw::core_exception("collision radius must be > 0");

    if (!(m_settings.collisionHeight > 0.0f))
        throw lw::core_exception("collision height must be > 0");

    if (!(m_settings.maxSubStep > 0.0f))
        throw lw::core_exception("max sub-step must be > 0");

    if (m_settings.maxIterations < 1)
        throw lw::core_exception("penetration iterations must be >= 1");

    if (m_settings.collisionSegments < 3)
        throw lw::core_exception("collision segments must be >= 3");

    // Eye must not sit below the capsule top
    if (m_settings.eyeHeight < m_settings.collisionHeight)
    {
        const float repaired = m_settings.collisionHeight + 0.05f;
        std::cerr << "PlayerController: eyeHeight " << m_settings.eyeHeight
                  << " is below collisionHeight, raised to " << repaired << "\n";
        m_settings.eyeHeight = repaired;
    }

    m_ringDirs.reserve(static_cast<size_t>(m_settings.collisionSegments));
    for (int i = 0; i < m_settings.collisionSegments; ++i)
    {
        const float a = static_cast<float>(i) / static_cast<float>(m_settings.collisionSegments) * kTwoPi;
        m_ringDirs.emplace_back(std::cos(a), 0.0f, std::sin(a));
    }

    publish();
}

// --------------------------------------------------------
// Inputs
// --------------------------------------------------------

void PlayerController::setCollisionMeshes(std::vector<StaticMesh*> meshes)
{
    m_meshes = std::move(meshes);

    // Rollback must never return to a spot from the previous mesh set
    m_lastSafe = m_position;
}

void PlayerController::update(float dt, const MoveInput& input)
{
    if (!(dt > 0.0f) || !std::isfinite(dt))
        return;

    // Sub-steps bound how far one integration can tunnel into thin geometry
    float remaining = dt;
    while (remaining > kMinSubStep)
    {
        const float h = std::min(m_settings.maxSubStep, remaining);

        if (m_freeFly)
            stepFreeFly(h, input);
        else
            step(h, input);

        remaining -= h;
        ++m_stats.subSteps;
    }
}

void PlayerController::look(float dYaw, float dPitch) noexcept
{
    if (!std::isfinite(dYaw) || !std::isfinite(dPitch))
        return;

    m_yaw   = std::remainder(m_yaw + dYaw, kTwoPi);
    m_pitch = std::clamp(m_pitch + dPitch, -m_settings.pitchLimit, m_settings.pitchLimit);
    publish();
}

void PlayerController::teleport(const glm::vec3& eye, std::optional<float> yaw, std::optional<float> pitch)
{
    if (!lw::is_finite(eye))
        throw lw::core_exception("teleport target must be finite");

    m_position = eye;
    m_lastSafe = eye;
    m_velocity = glm::vec3(0.0f);
    m_grounded = false;

    if (yaw)
        m_yaw = std::remainder(*yaw, kTwoPi);
    if (pitch)
        m_pitch = std::clamp(*pitch, -m_settings.pitchLimit, m_settings.pitchLimit);

    publish();
}

void PlayerController::setSpawn(const glm::vec3& eye) noexcept
{
    m_spawn = eye;
}

void PlayerController::setFreeFly(bool enabled) noexcept
{
    if (m_freeFly == enabled)
        return;

    m_freeFly = enabled;
    m_grounded = false;

    // Vertical flight speed is dropped when gravity resumes
    m_velocity.y = 0.0f;
}

// --------------------------------------------------------
// State
// --------------------------------------------------------

ViewPose PlayerController::viewPose() const
{
    ViewPose pose;
    pose.eye   = m_position;
    pose.yaw   = m_yaw;
    pose.pitch = m_pitch;
    return pose;
}

float PlayerController::soleY() const noexcept
{
    return m_position.y - m_settings.eyeHeight;
}

float PlayerController::minRingClearance() const
{
    float best = std::numeric_limits<float>::infinity();
    if (m_meshes.empty())
        return best;

    const float r    = m_settings.collisionRadius;
    const float back = m_settings.ringBackOffset * r;

    for (const float frac : {m_settings.ringLowFraction, m_settings.ringHighFraction})
    {
        const glm::vec3 center(m_position.x, ringCenterY(m_position, frac), m_position.z);
        for (const glm::vec3& d : m_ringDirs)
        {
            const WorldHit hit = m_query.castFrom(center - d * back, d, back + 2.0f * r, m_meshes);
            if (hit.valid())
                best = std::min(best, hit.dist - back);
        }
    }

    return best;
}

// --------------------------------------------------------
// Sub-step
// --------------------------------------------------------

void PlayerController::step(float dt, const MoveInput& input)
{
    const bool collide = !m_meshes.empty();

    // 1-2. Horizontal velocity eases toward the wish velocity
    const glm::vec3 wish = wishVelocity(input);
    const float     a    = blendFactor(dt);
    m_velocity.x         = glm::mix(m_velocity.x, wish.x, a);
    m_velocity.z         = glm::mix(m_velocity.z, wish.z, a);

    // 3. Gravity
    m_velocity.y += m_settings.gravity * dt;

    if (collide)
    {
        // 4. Ground
        probeGround();

        // 5. Jump
        if (m_grounded && input.jump)
        {
            m_velocity.y = m_settings.jumpSpeed;
            m_grounded   = false;
            ++m_stats.takeoffs;
        }

        // 6. Keep fast horizontal motion from entering a surface this step
        if (m_settings.enableVelocitySweep)
            sweepVelocity(dt);
    }

    // 7. Integrate
    const glm::vec3 preResolvePos = m_position + m_velocity * dt;
    const glm::vec3 preResolveVel = m_velocity;
    m_position                    = preResolvePos;

    if (collide)
    {
        // 8. Push out of anything the rings overlap
        const float totalPush = resolvePenetration();

        // 9-10. Recovery
        if (totalPush > m_settings.rollbackPushFraction * m_settings.collisionRadius)
        {
            m_position   = m_lastSafe;
            m_velocity.x = 0.0f;
            m_velocity.z = 0.0f;
            ++m_stats.rollbacks;
        }
        else if (totalPush < m_settings.safePushEpsilon)
        {
            m_lastSafe = m_position;
        }
        else if (m_settings.enableStepUp && m_grounded)
        {
            const float     raise = std::min(m_settings.stepHeight, m_settings.stepHeightFraction * m_settings.collisionHeight);
            const glm::vec3 raised(preResolvePos.x, preResolvePos.y + raise, preResolvePos.z);

            if (!ringsBlocked(raised))
            {
                m_position   = raised;
                m_velocity.x = preResolveVel.x;
                m_velocity.z = preResolveVel.z;
                m_lastSafe   = raised;
                ++m_stats.stepUps;
            }
        }

        if (m_settings.respawnBelowY && m_position.y < *m_settings.respawnBelowY)
        {
            std::cerr << "PlayerController: fell below " << *m_settings.respawnBelowY << ", respawning\n";
            teleport(m_spawn);
            ++m_stats.respawns;
        }
    }

    // 11. Publish
    publish();
}

void PlayerController::stepFreeFly(float dt, const MoveInput& input)
{
    const glm::mat3 rot     = lw::yaw_pitch_rotation(m_yaw, m_pitch);
    const glm::vec3 forward = -rot[2];
    const glm::vec3 right   = rot[0];

    glm::vec3 wish(0.0f);
    if (input.forward)
        wish += forward;
    if (input.back)
        wish -= forward;
    if (input.right)
        wish += right;
    if (input.left)
        wish -= right;
    if (input.ascend)
        wish += kUp;
    if (input.descend)
        wish -= kUp;

    if (glm::dot(wish, wish) > 0.0f)
        wish = glm::normalize(wish);

    float speed = m_settings.flySpeed;
    if (input.sprint && m_settings.walkSpeed > 0.0f)
        speed *= m_settings.sprintSpeed / m_settings.walkSpeed;

    m_velocity = glm::mix(m_velocity, wish * speed, blendFactor(dt));
    m_position += m_velocity * dt;
    m_grounded = false;

    publish();
}

glm::vec3 PlayerController::wishVelocity(const MoveInput& input) const
{
    // Yaw-only basis so looking up or down doesn't slow walking
    const glm::vec3 forward(-std::sin(m_yaw), 0.0f, -std::cos(m_yaw));
    const glm::vec3 right(std::cos(m_yaw), 0.0f, -std::sin(m_yaw));

    glm::vec3 wish(0.0f);
    if (input.forward)
        wish += forward;
    if (input.back)
        wish -= forward;
    if (input.right)
        wish += right;
    if (input.left)
        wish -= right;

    if (glm::dot(wish, wish) > 0.0f)
        wish = glm::normalize(wish);

    return wish * (input.sprint ? m_settings.sprintSpeed : m_settings.walkSpeed);
}

float PlayerController::blendFactor(float dt) const noexcept
{
    const float blend = std::clamp(m_settings.velocityBlend, 0.0f, 1.0f);

    if (m_settings.smoothing == PlayerSettings::VelocitySmoothing::TimeScaled)
        return 1.0f - std::pow(1.0f - blend, dt / m_settings.maxSubStep);

    return blend;
}

// --------------------------------------------------------
// Probes
// --------------------------------------------------------

void PlayerController::probeGround()
{
    const bool wasGrounded = m_grounded;

    const glm::vec3 origin = m_position + kUp * m_settings.groundProbeLift;
    const WorldHit  hit    = m_query.castFrom(origin, kDown, m_settings.groundProbeLength, m_meshes);

    m_grounded = false;

    // The probe starts above the eye, so by default anything between the sole
    // and the probe origin counts as floor, overhangs included
    const bool accepted = hit.valid() && !(m_settings.groundProbeBelowEyeOnly && hit.point.y > m_position.y);

    if (accepted)
    {
        const float capsuleTop = m_position.y - (m_settings.eyeHeight - m_settings.collisionHeight);
        if (capsuleTop - hit.point.y <= m_settings.collisionHeight + m_settings.groundTolerance)
        {
            m_position.y = hit.point.y + m_settings.eyeHeight;
            m_velocity.y = 0.0f;
            m_grounded   = true;
        }
    }

    if (m_grounded && !wasGrounded)
        ++m_stats.landings;
    else if (!m_grounded && wasGrounded)
        ++m_stats.takeoffs;
}

void PlayerController::sweepVelocity(float dt)
{
    const glm::vec3 horiz(m_velocity.x, 0.0f, m_velocity.z);
    const float     speed = glm::length(horiz);
    if (!(speed > 0.0f))
        return;

    const float travel = speed * dt;
    const float r      = m_settings.collisionRadius;

    const glm::vec3 mid(m_position.x, ringCenterY(m_position, 0.5f), m_position.z);
    const WorldHit  hit = m_query.castFrom(mid, horiz / speed, travel + r, m_meshes);
    if (!hit.valid())
        return;

    const float hitDist = hit.dist - r;
    if (hitDist >= travel)
        return;

    const float ratio = std::max(0.0f, hitDist - m_settings.sweepSkin) / travel;
    if (ratio < 1.0f)
    {
        m_velocity.x *= ratio;
        m_velocity.z *= ratio;
    }
}

float PlayerController::resolvePenetration()
{
    const float r    = m_settings.collisionRadius;
    const float back = m_settings.ringBackOffset * r;

    float totalPush = 0.0f;

    for (int iter = 0; iter < m_settings.maxIterations; ++iter)
    {
        bool penetrated = false;

        for (const float frac : {m_settings.ringLowFraction, m_settings.ringHighFraction})
        {
            for (const glm::vec3& d : m_ringDirs)
            {
                // Center follows every push made so far
                const glm::vec3 center(m_position.x, ringCenterY(m_position, frac), m_position.z);

                const WorldHit hit = m_query.castFrom(center - d * back, d, back + r, m_meshes);
                if (!hit.valid())
                    continue;

                const float dist = hit.dist - back;
                if (dist >= r)
                    continue;

                const float push = r - dist;

                // Normal faces the ray origin; walls push horizontally, floors/ceilings along -d
                glm::vec3 out = -d;
                if (hit.normal && std::abs(hit.normal->y) < m_settings.verticalNormalY)
                    out = lw::safe_normalize(glm::vec3(hit.normal->x, 0.0f, hit.normal->z), -d);

                m_position += out * push;
                totalPush += push;

                // Slide: drop the horizontal velocity component pointing into the surface
                const glm::vec3 into = -out;
                const float     proj = m_velocity.x * into.x + m_velocity.z * into.z;
                if (proj > 0.0f)
                {
                    m_velocity.x -= into.x * proj;
                    m_velocity.z -= into.z * proj;
                }

                penetrated = true;
            }
        }

        if (!penetrated)
            break;
    }

    return totalPush;
}

bool PlayerController::ringsBlocked(const glm::vec3& eye) const
{
    const float r    = m_settings.collisionRadius;
    const float back = m_settings.ringBackOffset * r;

    for (const float frac : {m_settings.ringLowFraction, m_settings.ringHighFraction})
    {
        const glm::vec3 center(eye.x, ringCenterY(eye, frac), eye.z);
        for (const glm::vec3& d : m_ringDirs)
        {
            const WorldHit hit = m_query.castFrom(center - d * back, d, back + r, m_meshes);
            if (hit.valid() && hit.dist - back < r)
                return true;
        }
    }

    return false;
}

float PlayerController::ringCenterY(const glm::vec3& eye, float fraction) const noexcept
{
    return eye.y - m_settings.eyeHeight + fraction * m_settings.collisionHeight;
}

void PlayerController::publish() noexcept
{
    m_transform.position = m_position;
    m_transform.yaw      = m_yaw;
    m_transform.pitch    = m_pitch;
}
