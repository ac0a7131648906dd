//=============================================================================
// World.hpp
//=============================================================================
#pragma once

#include <cstdint>
#include <glm/glm.hpp>
#include <memory>
#include <string_view>
#include <vector>

#include "StaticMesh.hpp"

/**
 * @brief Owner of the static collision/scan geometry.
 *
 * World holds every StaticMesh by unique_ptr so the raw pointers handed to the
 * index builder and the query service stay stable until the next clear().
 * The mesh list may be empty before a level loads; it is then replaced
 * wholesale.
 */
class World
{
public:
    World()  = default;
    ~World() = default;

    World(const World&)            = delete;
    World& operator=(const World&) = delete;

    /** @brief Remove every mesh. Invalidates all StaticMesh pointers. */
    void clear();

    /**
     * @brief Create and add a new StaticMesh.
     * @param name          Mesh name (also drives its surface class)
     * @param localGeometry Geometry in mesh-local space
     * @param xform         Local-to-world transform baked into the mesh
     * @return Pointer to the created mesh (owned by the world)
     */
    StaticMesh* addMesh(std::string_view name, const TriMesh& localGeometry, const glm::mat4& xform = glm::mat4(1.0f));

    /** @brief All meshes, in insertion order. */
    [[nodiscard]] const std::vector<StaticMesh*>& meshes() const noexcept;

    [[nodiscard]] bool     empty() const noexcept;
    [[nodiscard]] size_t   size() const noexcept;
    [[nodiscard]] uint64_t triangleCount() const noexcept;

private:
    std::vector<std::unique_ptr<StaticMesh>> m_owned;
    std::vector<StaticMesh*>                 m_meshes;
};
