//=============================================================================
// main.cpp
//
// ScanBench: headless walk-and-scan run over a small generated level.
//=============================================================================
#include <chrono>
#include <exception>
#include <glm/gtc/matrix_transform.hpp>
#include <iostream>
#include <utility>
#include <vector>

#include "Core.hpp"
#include "CoreUtilities.hpp"
#include "PlayerController.hpp"
#include "ScanController.hpp"
#include "TriMeshUtils.hpp"
#include "WorldQueryIndexed.hpp"

namespace
{
    constexpr float kFrameDt = 1.0f / 60.0f;

    std::vector<WorldMeshDesc> buildLevel()
    {
        std::vector<WorldMeshDesc> level;

        level.push_back({"ground", tmu::make_grid(glm::vec3(0.0f), 60.0f, 60.0f, 60, 60)});

        // Four walls around a 40 x 40 courtyard
        level.push_back({"wall_north", tmu::make_box(glm::vec3(0.0f, 1.5f, -20.0f), glm::vec3(20.0f, 1.5f, 0.25f))});
        level.push_back({"wall_south", tmu::make_box(glm::vec3(0.0f, 1.5f, 20.0f), glm::vec3(20.0f, 1.5f, 0.25f))});
        level.push_back({"wall_east", tmu::make_box(glm::vec3(20.0f, 1.5f, 0.0f), glm::vec3(0.25f, 1.5f, 20.0f))});
        level.push_back({"wall_west", tmu::make_box(glm::vec3(-20.0f, 1.5f, 0.0f), glm::vec3(0.25f, 1.5f, 20.0f))});

        // A few props, one of them low enough to step onto
        level.push_back({"crate_wood", tmu::make_box(glm::vec3(3.0f, 0.5f, -6.0f), glm::vec3(0.5f))});
        level.push_back({"step_metal", tmu::make_box(glm::vec3(0.0f, 0.1f, -4.0f), glm::vec3(1.0f, 0.1f, 0.5f))});
        level.push_back({"tree_trunk", tmu::make_box(glm::vec3(-5.0f, 2.0f, -8.0f), glm::vec3(0.3f, 2.0f, 0.3f))});

        WorldMeshDesc pond{"pond_water", tmu::make_plane(glm::vec3(0.0f), 4.0f, 4.0f)};
        pond.transform = glm::translate(glm::mat4(1.0f), glm::vec3(8.0f, 0.01f, 6.0f));
        level.push_back(std::move(pond));

        return level;
    }

    void printDiagnostics(Core& core)
    {
        const CoreDiagnostics d = core.diagnostics();

        std::cout << "meshes=" << d.meshes << " indexed=" << d.indexBuilt << " pending=" << d.indexPending
                  << " failed=" << d.indexFailed << "\n"
                  << "rays=" << d.raysFired << " hits=" << d.rayHits << " rejected=" << d.pointsRejected
                  << " points=" << d.livePoints << "\n"
                  << "eye=(" << core.player().position().x << ", " << core.player().position().y << ", "
                  << core.player().position().z << ") grounded=" << (d.grounded ? "yes" : "no") << "\n";
    }

    void runFrames(Core& core, int frames, const MoveInput& input, const LookDelta& look = {})
    {
        for (int i = 0; i < frames; ++i)
            core.tick(kFrameDt, input, i == 0 ? look : LookDelta{});
    }

} // namespace

int main()
{
    try
    {
        CoreSettings settings;
        settings.scan.colorBySurface = true;

        Core core(settings);
        core.loadWorld(buildLevel());

        TICK(warmup);
        runFrames(core, 30, MoveInput{});
        TOCK(warmup);

        // Walk north over the low step, then turn and sprint
        MoveInput walk;
        walk.forward = true;

        TICK(walk);
        runFrames(core, 180, walk);

        walk.sprint = true;
        runFrames(core, 60, walk, LookDelta{0.6f, -0.1f});
        TOCK(walk);

        std::cout << "step-ups=" << core.player().stats().stepUps
                  << " rollbacks=" << core.player().stats().rollbacks << "\n";

        TICK(scan);
        core.scanner().fireBurst();
        core.scanner().scanView();
        core.scanner().startSweep();
        runFrames(core, 40, MoveInput{});
        TOCK(scan);

        const WorldQueryStats& q = core.query().stats();
        std::cout << "casts=" << q.casts << " indexed tests=" << q.indexedTests
                  << " brute-force tests=" << q.bruteForceTests << "\n";

        printDiagnostics(core);
    }
    catch (const std::exception& e)
    {
        std::cerr << "ScanBench: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
