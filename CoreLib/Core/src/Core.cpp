//=============================================================================
// Core.cpp
//=============================================================================
#include "Core.hpp"

#include <iostream>
#include <utility>

#include "EmbreeDevice.hpp"
#include "EmbreeMeshIndex.hpp"
#include "MeshIndexBuilder.hpp"
#include "PlayerController.hpp"
#include "ScanController.hpp"
#include "StaticMesh.hpp"
#include "World.hpp"
#include "WorldQueryIndexed.hpp"

Core::Core(CoreSettings settings) :
    m_settings{std::move(settings)},
    m_device{std::make_unique<EmbreeDevice>(m_settings.embreeConfig.empty() ? nullptr : m_settings.embreeConfig.c_str())},
    m_world{std::make_unique<World>()},
    m_query{std::make_unique<WorldQueryIndexed>()}
{
    const EmbreeDevice& device = *m_device;

    m_builder = std::make_unique<MeshIndexBuilder>([&device](const StaticMesh& mesh) {
        return std::make_unique<EmbreeMeshIndex>(device, mesh.geometry());
    });

    m_player  = std::make_unique<PlayerController>(*m_query, m_settings.player, m_settings.spawnEye);
    m_scanner = std::make_unique<ScanController>(*m_query, *m_player, m_settings.scan);
}

Core::~Core()
{
    // Detach everything that points into the world before it goes away
    if (m_builder)
        m_builder->clear();
}

// ------------------------------------------------------------
// World
// ------------------------------------------------------------

void Core::loadWorld(const std::vector<WorldMeshDesc>& meshes)
{
    // Points, sweep and rollback anchor all belong to the old mesh set
    m_builder->clear();
    m_player->setCollisionMeshes({});
    m_scanner->setMeshes({});
    m_scanner->clear();
    m_world->clear();

    for (const WorldMeshDesc& desc : meshes)
        m_world->addMesh(desc.name, desc.geometry, desc.transform);

    size_t queued = 0;
    for (StaticMesh* mesh : m_world->meshes())
    {
        if (m_builder->registerMesh(mesh))
            ++queued;
    }

    attachMeshes();

    std::cerr << "Core: loaded world meshes=" << m_world->size() << " triangles=" << m_world->triangleCount()
              << " queued for indexing=" << queued << "\n";
}

void Core::unloadWorld()
{
    loadWorld({});
}

void Core::attachMeshes()
{
    m_player->setCollisionMeshes(m_world->meshes());
    m_scanner->setMeshes(m_world->meshes());
}

// ------------------------------------------------------------
// Per-frame
// ------------------------------------------------------------

void Core::tick(float dt, const MoveInput& input, const LookDelta& look, const PlayerModes& modes)
{
    if (m_builder->pending() > 0)
        m_builder->build(m_settings.indexBudgetMs);

    m_player->look(look.yaw, look.pitch);

    if (modes.freeFly != m_player->freeFly())
        m_player->setFreeFly(modes.freeFly);

    m_player->update(dt, input);
    m_scanner->update(dt);
}

void Core::setLens(const CameraLens& lens)
{
    m_scanner->setLens(lens);
}

// ------------------------------------------------------------
// Subsystems
// ------------------------------------------------------------

World& Core::world() noexcept
{
    return *m_world;
}

const WorldQueryIndexed& Core::query() const noexcept
{
    return *m_query;
}

MeshIndexBuilder& Core::indexBuilder() noexcept
{
    return *m_builder;
}

PlayerController& Core::player() noexcept
{
    return *m_player;
}

ScanController& Core::scanner() noexcept
{
    return *m_scanner;
}

CoreDiagnostics Core::diagnostics() const
{
    const ScanStats& scan = m_scanner->stats();

    CoreDiagnostics d;
    d.meshes         = m_world->size();
    d.indexPending   = m_builder->pending();
    d.indexBuilt     = m_builder->builtCount();
    d.indexFailed    = m_builder->failedCount();
    d.raysFired      = scan.raysFired;
    d.rayHits        = scan.hits;
    d.pointsRejected = scan.rejected;
    d.livePoints     = m_scanner->points().liveCount();
    d.grounded       = m_player->grounded();
    d.velocity       = m_player->velocity();
    return d;
}
