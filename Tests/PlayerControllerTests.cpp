#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <memory>

#include "PlayerController.hpp"
#include "StaticMesh.hpp"
#include "TestWorld.hpp"

namespace
{
    constexpr float kDt = 0.02f;

    // Clear of the ground grid's internal edges for straight -Z walks
    const glm::vec3 kStart(-1.3f, 1.6f, 0.7f);

    MoveInput forward()
    {
        MoveInput in;
        in.forward = true;
        return in;
    }

    void run(PlayerController& player, float seconds, const MoveInput& input)
    {
        const int frames = static_cast<int>(std::lround(seconds / kDt));
        for (int i = 0; i < frames; ++i)
            player.update(kDt, input);
    }

} // namespace

class PlayerControllerTest : public ::testing::Test
{
protected:
    PlayerController& makePlayer(const PlayerSettings& settings = {}, const glm::vec3& eye = kStart)
    {
        owned = std::make_unique<PlayerController>(scene.query, settings, eye);
        owned->setCollisionMeshes(scene.meshes());
        return *owned;
    }

    TestWorld                         scene;
    std::unique_ptr<PlayerController> owned;
};

// ------------------------------------------------------------
// Settings
// ------------------------------------------------------------

TEST_F(PlayerControllerTest, RejectsInvalidSettings)
{
    auto expectThrow = [this](auto mutate) {
        PlayerSettings s;
        mutate(s);
        EXPECT_THROW({ PlayerController p(scene.query, s); }, std::runtime_error);
    };

    expectThrow([](PlayerSettings& s) { s.collisionRadius = 0.0f; });
    expectThrow([](PlayerSettings& s) { s.collisionHeight = -1.0f; });
    expectThrow([](PlayerSettings& s) { s.maxSubStep = 0.0f; });
    expectThrow([](PlayerSettings& s) { s.maxIterations = 0; });
    expectThrow([](PlayerSettings& s) { s.collisionSegments = 2; });
}

TEST_F(PlayerControllerTest, EyeBelowCapsuleTopIsRaised)
{
    PlayerSettings s;
    s.eyeHeight       = 0.5f;
    s.collisionHeight = 1.0f;

    const PlayerController player(scene.query, s);
    EXPECT_FLOAT_EQ(player.settings().eyeHeight, 1.05f);
    EXPECT_GE(player.settings().eyeHeight, player.settings().collisionHeight);
}

// ------------------------------------------------------------
// Free flight (no collision meshes)
// ------------------------------------------------------------

TEST_F(PlayerControllerTest, WithoutMeshesPositionIsTheIntegralOfVelocity)
{
    PlayerController& player = makePlayer();
    player.setCollisionMeshes({});

    glm::vec3 expected = player.position();

    MoveInput in;
    for (int i = 0; i < 120; ++i)
    {
        in.forward = i < 60;
        in.sprint  = i > 30 && i < 90;
        in.left    = i % 7 == 0;
        in.jump    = true;

        if (i == 40)
            player.look(0.5f, 0.0f);

        player.update(kDt, in);
        expected += player.velocity() * kDt;
    }

    EXPECT_NEAR(player.position().x, expected.x, 1e-3f);
    EXPECT_NEAR(player.position().y, expected.y, 1e-3f);
    EXPECT_NEAR(player.position().z, expected.z, 1e-3f);

    // Nothing held it up
    EXPECT_FALSE(player.grounded());
    EXPECT_LT(player.velocity().y, -20.0f);
    EXPECT_EQ(player.stats().rollbacks, 0u);
}

TEST_F(PlayerControllerTest, FrameIsSlicedIntoSubSteps)
{
    PlayerController& player = makePlayer();

    player.update(0.05f, MoveInput{});
    EXPECT_EQ(player.stats().subSteps, 3u);

    player.update(0.0f, MoveInput{});
    player.update(-1.0f, MoveInput{});
    player.update(std::numeric_limits<float>::quiet_NaN(), MoveInput{});
    EXPECT_EQ(player.stats().subSteps, 3u);
}

TEST_F(PlayerControllerTest, TimeScaledSmoothingIsIndependentOfStepSize)
{
    PlayerSettings s;
    s.smoothing = PlayerSettings::VelocitySmoothing::TimeScaled;

    PlayerController coarse(scene.query, s);
    PlayerController fine(scene.query, s);

    coarse.update(0.02f, forward());
    fine.update(0.01f, forward());
    fine.update(0.01f, forward());

    EXPECT_NEAR(coarse.velocity().z, fine.velocity().z, 1e-4f);
    EXPECT_LT(coarse.velocity().z, 0.0f);
}

TEST_F(PlayerControllerTest, FreeFlyModeIgnoresGravity)
{
    scene.addGround();
    PlayerController& player = makePlayer();
    player.setFreeFly(true);

    MoveInput in;
    in.ascend = true;
    run(player, 1.0f, in);

    EXPECT_GT(player.position().y, kStart.y + 5.0f);
    EXPECT_GT(player.velocity().y, 0.0f);
    EXPECT_FALSE(player.grounded());

    player.setFreeFly(false);
    EXPECT_FLOAT_EQ(player.velocity().y, 0.0f);
}

// ------------------------------------------------------------
// Ground, jump, landing
// ------------------------------------------------------------

TEST_F(PlayerControllerTest, StandsOnGround)
{
    scene.addGround();
    PlayerController& player = makePlayer();

    run(player, 0.5f, MoveInput{});

    EXPECT_TRUE(player.grounded());
    EXPECT_NEAR(player.soleY(), 0.0f, 1e-4f);
    EXPECT_FLOAT_EQ(player.velocity().y, 0.0f);
    EXPECT_TRUE(lw::equal(player.safePosition(), player.position()));
}

TEST_F(PlayerControllerTest, JumpSetsJumpSpeedAndLeavesGround)
{
    scene.addGround();
    PlayerController& player = makePlayer();

    player.update(kDt, MoveInput{});
    ASSERT_TRUE(player.grounded());

    MoveInput jump;
    jump.jump = true;
    player.update(kDt, jump);

    EXPECT_FLOAT_EQ(player.velocity().y, player.settings().jumpSpeed);
    EXPECT_FLOAT_EQ(player.velocity().y, 7.0f);
    EXPECT_FALSE(player.grounded());
    EXPECT_EQ(player.stats().takeoffs, 1u);

    player.update(kDt, MoveInput{});
    EXPECT_FALSE(player.grounded());
    EXPECT_GT(player.soleY(), 0.1f);
    EXPECT_LT(player.velocity().y, 7.0f);
}

TEST_F(PlayerControllerTest, FallsAndLandsOnce)
{
    scene.addGround();
    PlayerController& player = makePlayer({}, glm::vec3(kStart.x, 5.0f, kStart.z));

    run(player, 2.0f, MoveInput{});

    EXPECT_TRUE(player.grounded());
    EXPECT_NEAR(player.soleY(), 0.0f, 1e-4f);
    EXPECT_EQ(player.stats().landings, 1u);
}

TEST_F(PlayerControllerTest, RespawnsAfterFallingOutOfTheWorld)
{
    scene.addBox("far_object", glm::vec3(100.0f, 0.0f, 100.0f), glm::vec3(1.0f));

    PlayerSettings s;
    s.respawnBelowY = -5.0f;

    PlayerController& player = makePlayer(s);
    run(player, 1.0f, MoveInput{});

    EXPECT_GE(player.stats().respawns, 1u);
    EXPECT_GT(player.position().y, -5.0f);
}

// ------------------------------------------------------------
// Walls, rollback, step-up
// ------------------------------------------------------------

TEST_F(PlayerControllerTest, WallStopsMovementAtRadius)
{
    scene.addGround();
    scene.addBox("wall", glm::vec3(0.0f, 1.5f, -3.0f), glm::vec3(5.0f, 1.5f, 0.25f));

    PlayerController& player = makePlayer();
    run(player, 2.0f, forward());

    const float r    = player.settings().collisionRadius;
    const float face = -2.75f;

    EXPECT_GE(player.position().z - face, r - 1e-3f);
    EXPECT_LT(player.position().z - face, r + 0.1f);
    EXPECT_GE(player.minRingClearance(), r - 1e-3f);
    EXPECT_EQ(player.stats().rollbacks, 0u);
    EXPECT_TRUE(player.grounded());
}

TEST_F(PlayerControllerTest, PenetrationIsResolvedWithoutSweep)
{
    scene.addGround();
    scene.addBox("wall", glm::vec3(0.0f, 1.5f, -3.0f), glm::vec3(5.0f, 1.5f, 0.25f));

    PlayerSettings s;
    s.enableVelocitySweep = false;

    PlayerController& player = makePlayer(s);
    run(player, 2.0f, forward());

    const float r = player.settings().collisionRadius;

    EXPECT_GE(player.position().z + 2.75f, r - 1e-3f);
    EXPECT_GE(player.minRingClearance(), r - 1e-3f);
    EXPECT_EQ(player.stats().rollbacks, 0u);

    // Sliding: nothing left pushing into the wall
    EXPECT_GE(player.velocity().z, -0.7f);
}

TEST_F(PlayerControllerTest, DeepPenetrationRollsBackToSafePosition)
{
    scene.addGround();
    PlayerController& player = makePlayer();

    run(player, 0.2f, MoveInput{});
    const glm::vec3 safe = player.safePosition();
    ASSERT_TRUE(lw::equal(safe, player.position()));

    // A pillar appears around the player
    scene.addBox("pillar", glm::vec3(kStart.x, 2.0f, kStart.z), glm::vec3(0.3f, 2.0f, 0.3f));
    player.setCollisionMeshes(scene.meshes());

    player.update(kDt, forward());

    EXPECT_GE(player.stats().rollbacks, 1u);
    EXPECT_TRUE(lw::equal(player.position(), safe));
    EXPECT_FLOAT_EQ(player.velocity().x, 0.0f);
    EXPECT_FLOAT_EQ(player.velocity().z, 0.0f);
}

TEST_F(PlayerControllerTest, StepsUpOntoLowLedge)
{
    scene.addGround();
    scene.addBox("step", glm::vec3(0.0f, 0.1f, -5.5f), glm::vec3(3.0f, 0.1f, 5.0f));

    PlayerController& player = makePlayer();
    run(player, 1.0f, forward());

    EXPECT_GE(player.stats().stepUps, 1u);
    EXPECT_LT(player.position().z, -0.5f);
    EXPECT_TRUE(player.grounded());
    EXPECT_NEAR(player.soleY(), 0.2f, 1e-3f);
    EXPECT_EQ(player.stats().rollbacks, 0u);
}

TEST_F(PlayerControllerTest, LedgeBlocksWhenStepUpIsDisabled)
{
    scene.addGround();
    scene.addBox("step", glm::vec3(0.0f, 0.1f, -5.5f), glm::vec3(3.0f, 0.1f, 5.0f));

    PlayerSettings s;
    s.enableStepUp = false;

    PlayerController& player = makePlayer(s);
    run(player, 1.0f, forward());

    EXPECT_EQ(player.stats().stepUps, 0u);
    EXPECT_GE(player.position().z, -0.5f + player.settings().collisionRadius - 1e-3f);
    EXPECT_NEAR(player.soleY(), 0.0f, 1e-4f);
}

// ------------------------------------------------------------
// Orientation and teleport
// ------------------------------------------------------------

TEST_F(PlayerControllerTest, LookClampsPitchAndWrapsYaw)
{
    PlayerController& player = makePlayer();

    player.look(0.0f, 10.0f);
    EXPECT_FLOAT_EQ(player.pitch(), player.settings().pitchLimit);

    player.look(0.0f, -20.0f);
    EXPECT_FLOAT_EQ(player.pitch(), -player.settings().pitchLimit);

    player.look(7.0f, 0.0f);
    EXPECT_NEAR(player.yaw(), 7.0f - 6.28318530718f, 1e-5f);

    EXPECT_FLOAT_EQ(player.transform().yaw, player.yaw());
    EXPECT_FLOAT_EQ(player.viewPose().pitch, player.pitch());
}

TEST_F(PlayerControllerTest, ForwardFollowsYaw)
{
    PlayerController& player = makePlayer();
    player.setCollisionMeshes({});

    player.look(1.5707963f, 0.0f); // face -X
    run(player, 0.5f, forward());

    EXPECT_LT(player.position().x, kStart.x - 0.5f);
    EXPECT_NEAR(player.position().z, kStart.z, 1e-3f);
}

TEST_F(PlayerControllerTest, TeleportResetsMotion)
{
    scene.addGround();
    PlayerController& player = makePlayer();
    run(player, 0.5f, forward());

    player.teleport(glm::vec3(3.0f, 4.0f, 5.0f), 1.0f);

    EXPECT_TRUE(lw::equal(player.position(), glm::vec3(3.0f, 4.0f, 5.0f)));
    EXPECT_TRUE(lw::equal(player.safePosition(), player.position()));
    EXPECT_TRUE(lw::is_zero(player.velocity()));
    EXPECT_FALSE(player.grounded());
    EXPECT_FLOAT_EQ(player.yaw(), 1.0f);

    EXPECT_THROW(player.teleport(glm::vec3(std::numeric_limits<float>::infinity())), std::runtime_error);
}

// ------------------------------------------------------------
// Mesh set changes and ground probe options
// ------------------------------------------------------------

TEST_F(PlayerControllerTest, NewMeshSetMovesTheSafePosition)
{
    PlayerController& player = makePlayer();

    // No meshes yet: free flight never records a safe position
    run(player, 0.5f, MoveInput{});
    ASSERT_NE(player.safePosition(), player.position());

    scene.addGround(-50.0f);
    player.setCollisionMeshes(scene.meshes());
    EXPECT_EQ(player.safePosition(), player.position());
}

TEST_F(PlayerControllerTest, OverheadSlabCountsAsGroundByDefault)
{
    // Top face at 1.75: above the eye, below the probe origin
    scene.addBox("slab", glm::vec3(kStart.x, 1.7f, kStart.z), glm::vec3(5.0f, 0.05f, 5.0f));

    PlayerController& player = makePlayer();
    player.update(kDt, MoveInput{});

    EXPECT_TRUE(player.grounded());
    EXPECT_NEAR(player.soleY(), 1.75f, 1e-4f);
}

TEST_F(PlayerControllerTest, GroundAboveTheEyeCanBeIgnored)
{
    scene.addBox("slab", glm::vec3(kStart.x, 1.7f, kStart.z), glm::vec3(5.0f, 0.05f, 5.0f));

    PlayerSettings s;
    s.groundProbeBelowEyeOnly = true;

    PlayerController& player = makePlayer(s);
    player.update(kDt, MoveInput{});

    EXPECT_FALSE(player.grounded());
    EXPECT_LT(player.position().y, kStart.y);
}
