//=============================================================================
// Core.hpp
//=============================================================================
#pragma once

#include <glm/glm.hpp>
#include <memory>
#include <string>
#include <vector>

#include "CoreTypes.hpp"
#include "PlayerSettings.hpp"
#include "ScanSettings.hpp"
#include "TriMesh.hpp"

class EmbreeDevice;
class MeshIndexBuilder;
class PlayerController;
class ScanController;
class World;
class WorldQueryIndexed;

/**
 * @brief One mesh handed to Core::loadWorld().
 */
struct WorldMeshDesc
{
    std::string name;
    TriMesh     geometry;
    glm::mat4   transform = glm::mat4(1.0f);
};

struct CoreSettings
{
    // --------------------------------------------------------
    // Index building
    // --------------------------------------------------------
    double      indexBudgetMs = 6.0; // per tick
    std::string embreeConfig;        // empty = Embree defaults

    // --------------------------------------------------------
    // Subsystems
    // --------------------------------------------------------
    PlayerSettings player;
    ScanSettings   scan;
    glm::vec3      spawnEye = glm::vec3(0.0f, 1.6f, 0.0f);
};

/**
 * @brief Central simulation controller.
 *
 * Core owns the world, the Embree device, the index builder, the ray query
 * service, the player and the scanner, and wires them together. Everything
 * runs on the caller's thread inside tick().
 *
 * Core is presentation-agnostic; a renderer reads the player transform and
 * the scanner's point buffer after each tick.
 */
class Core
{
public:
    explicit Core(CoreSettings settings = {});
    ~Core();

    Core(const Core&)            = delete;
    Core& operator=(const Core&) = delete;

    // ------------------------------------------------------------
    // World
    // ------------------------------------------------------------

    /**
     * @brief Replace the world with @p meshes and queue them for indexing.
     *
     * The player and the scanner switch to the new mesh set immediately;
     * queries answer by brute force until each index is built. Resident
     * points and any running sweep are discarded.
     */
    void loadWorld(const std::vector<WorldMeshDesc>& meshes);

    /** @brief Drop every mesh; the player falls back to free flight. */
    void unloadWorld();

    // ------------------------------------------------------------
    // Per-frame
    // ------------------------------------------------------------

    /**
     * @brief Advance one render tick.
     *
     * Order: index building under budget, look, mode flags, player
     * movement, scanner (sweep lines and fade).
     */
    void tick(float dt, const MoveInput& input, const LookDelta& look = {}, const PlayerModes& modes = {});

    /** @brief Camera lens shaping the scan sampling grids. */
    void setLens(const CameraLens& lens);

    // ------------------------------------------------------------
    // Subsystems
    // ------------------------------------------------------------

    [[nodiscard]] World&                   world() noexcept;
    [[nodiscard]] const WorldQueryIndexed& query() const noexcept;
    [[nodiscard]] MeshIndexBuilder&        indexBuilder() noexcept;
    [[nodiscard]] PlayerController&        player() noexcept;
    [[nodiscard]] ScanController&          scanner() noexcept;

    [[nodiscard]] const CoreSettings& settings() const noexcept { return m_settings; }

    [[nodiscard]] CoreDiagnostics diagnostics() const;

private:
    void attachMeshes();

    CoreSettings m_settings;

    // Declaration order is destruction order in reverse: the device must
    // outlive every index held by the world.
    std::unique_ptr<EmbreeDevice>      m_device;
    std::unique_ptr<World>             m_world;
    std::unique_ptr<WorldQueryIndexed> m_query;
    std::unique_ptr<MeshIndexBuilder>  m_builder;
    std::unique_ptr<PlayerController>  m_player;
    std::unique_ptr<ScanController>    m_scanner;
};
