#include <gtest/gtest.h>

#include <glm/gtc/matrix_transform.hpp>
#include <vector>

#include "Core.hpp"
#include "MeshIndexBuilder.hpp"
#include "PlayerController.hpp"
#include "ScanController.hpp"
#include "StaticMesh.hpp"
#include "TriMeshUtils.hpp"
#include "World.hpp"

namespace
{
    constexpr float kFrame = 1.0f / 60.0f;

    std::vector<WorldMeshDesc> smallLevel()
    {
        std::vector<WorldMeshDesc> level;
        level.push_back({"ground", tmu::make_grid(glm::vec3(0.0f), 40.0f, 40.0f, 8, 8)});
        level.push_back({"crate_wood",
                         tmu::make_box(glm::vec3(0.0f), glm::vec3(0.5f)),
                         glm::translate(glm::mat4(1.0f), glm::vec3(3.0f, 0.5f, -6.0f))});
        return level;
    }

    CoreSettings testSettings()
    {
        CoreSettings s;
        s.spawnEye = glm::vec3(0.3f, 1.6f, 0.7f);
        return s;
    }

} // namespace

TEST(Core, LoadWorldQueuesEveryMesh)
{
    Core core(testSettings());
    core.loadWorld(smallLevel());

    const CoreDiagnostics d = core.diagnostics();
    EXPECT_EQ(d.meshes, 2u);
    EXPECT_EQ(d.indexPending, 2u);
    EXPECT_EQ(d.indexBuilt, 0u);

    // Placement transform is baked into the mesh
    const StaticMesh* crate = core.world().meshes()[1];
    EXPECT_NEAR(crate->geometry().bounds()[0].x, 2.5f, 1e-5f);
    EXPECT_NEAR(crate->geometry().bounds()[1].y, 1.0f, 1e-5f);
    EXPECT_EQ(crate->surfaceClass(), SurfaceClass::Wood);
}

TEST(Core, TicksBuildIndicesAndKeepThePlayerOnTheGround)
{
    Core core(testSettings());
    core.loadWorld(smallLevel());

    for (int i = 0; i < 60; ++i)
        core.tick(kFrame, MoveInput{});

    const CoreDiagnostics d = core.diagnostics();
    EXPECT_EQ(d.indexPending, 0u);
    EXPECT_EQ(d.indexBuilt, 2u);
    EXPECT_EQ(d.indexFailed, 0u);

    for (const StaticMesh* mesh : core.world().meshes())
        EXPECT_EQ(mesh->indexState(), IndexState::Ready);

    EXPECT_TRUE(d.grounded);
    EXPECT_NEAR(core.player().position().y, 1.6f, 1e-2f);
}

TEST(Core, ScannerSeesTheLoadedWorld)
{
    Core core(testSettings());
    core.loadWorld(smallLevel());
    core.tick(kFrame, MoveInput{});

    // Level view: the lower half of the grid lands on the ground
    const size_t hits = core.scanner().scanView(16, 9);
    EXPECT_GE(hits, 64u);

    const CoreDiagnostics d = core.diagnostics();
    EXPECT_EQ(d.raysFired, 144u);
    EXPECT_EQ(d.rayHits, hits);
    EXPECT_EQ(d.livePoints + d.pointsRejected, hits);
}

TEST(Core, FreeFlyModeComesFromTheHost)
{
    Core core(testSettings());
    core.loadWorld(smallLevel());

    PlayerModes modes;
    modes.freeFly = true;

    MoveInput up;
    up.ascend = true;

    const float startY = core.player().position().y;
    for (int i = 0; i < 30; ++i)
        core.tick(kFrame, up, {}, modes);

    EXPECT_TRUE(core.player().freeFly());
    EXPECT_GT(core.player().position().y, startY + 1.0f);

    core.tick(kFrame, MoveInput{});
    EXPECT_FALSE(core.player().freeFly());
}

TEST(Core, LookDeltasTurnThePlayer)
{
    Core core(testSettings());

    LookDelta look;
    look.yaw = 0.5f;
    core.tick(kFrame, MoveInput{}, look);

    EXPECT_NEAR(core.player().yaw(), 0.5f, 1e-6f);
    EXPECT_NEAR(core.player().viewPose().yaw, 0.5f, 1e-6f);
}

TEST(Core, UnloadedWorldStopsCollision)
{
    Core core(testSettings());
    core.loadWorld(smallLevel());

    for (int i = 0; i < 30; ++i)
        core.tick(kFrame, MoveInput{});
    ASSERT_TRUE(core.diagnostics().grounded);

    core.unloadWorld();

    const CoreDiagnostics d = core.diagnostics();
    EXPECT_EQ(d.meshes, 0u);
    EXPECT_EQ(d.indexPending, 0u);

    // Nothing to stand on: gravity pulls the player through where the ground was
    for (int i = 0; i < 60; ++i)
        core.tick(kFrame, MoveInput{});

    EXPECT_FALSE(core.diagnostics().grounded);
    EXPECT_LT(core.player().position().y, 0.0f);

    EXPECT_EQ(core.scanner().fireBurst(), 0u);
}

TEST(Core, WorldSwapDropsScanStateAndRollbackAnchor)
{
    Core core(testSettings());
    core.loadWorld(smallLevel());

    // Three of four lines: the third one looks down at the ground
    core.scanner().startSweep(16, 4, 0.5f);
    core.tick(0.375f, MoveInput{});
    ASSERT_TRUE(core.scanner().sweepActive());
    ASSERT_TRUE(core.scanner().beam().has_value());
    ASSERT_GT(core.diagnostics().livePoints, 0u);

    core.unloadWorld();

    EXPECT_FALSE(core.scanner().sweepActive());
    EXPECT_FALSE(core.scanner().beam().has_value());
    EXPECT_EQ(core.diagnostics().livePoints, 0u);
    EXPECT_EQ(core.player().safePosition(), core.player().position());

    // Falling with no world, then a reload re-anchors at the new position
    core.tick(0.5f, MoveInput{});
    core.loadWorld(smallLevel());
    EXPECT_EQ(core.player().safePosition(), core.player().position());
    EXPECT_FALSE(core.scanner().sweepActive());
}

TEST(Core, ReloadReplacesTheMeshSet)
{
    Core core(testSettings());
    core.loadWorld(smallLevel());
    core.tick(kFrame, MoveInput{});

    std::vector<WorldMeshDesc> other;
    other.push_back({"floor_stone", tmu::make_grid(glm::vec3(0.0f), 10.0f, 10.0f, 2, 2)});
    core.loadWorld(other);

    EXPECT_EQ(core.world().size(), 1u);
    EXPECT_EQ(core.indexBuilder().pending(), 1u);
    EXPECT_EQ(core.world().meshes().front()->surfaceClass(), SurfaceClass::Ground);
}

TEST(Core, LensIsValidated)
{
    Core core(testSettings());

    CameraLens lens;
    lens.vFovDeg = 200.0f;
    EXPECT_THROW(core.setLens(lens), std::runtime_error);

    lens.vFovDeg = 60.0f;
    lens.aspect  = 2.0f;
    EXPECT_NO_THROW(core.setLens(lens));
}
