#pragma once

#include <cstdint>
#include <glm/glm.hpp>
#include <memory>
#include <string>

#include "MeshIndex.hpp"
#include "SurfaceClass.hpp"
#include "TriMesh.hpp"

/**
 * @brief Lifecycle of a mesh's spatial index.
 */
enum class IndexState : uint8_t
{
    None   = 0, ///< Not built yet (queued or never registered)
    Ready  = 1, ///< Index built and used by ray queries
    Failed = 2  ///< Build failed; permanently answered by brute force
};

/**
 * @brief Immutable world geometry with an optional lazily-built index.
 *
 * The local geometry is transformed once at construction; every query works
 * on the baked world-space copy. Geometry edits after load are unsupported.
 */
class StaticMesh
{
public:
    StaticMesh(std::string name, const TriMesh& localGeometry, const glm::mat4& xform = glm::mat4(1.0f));
    ~StaticMesh();

    StaticMesh(const StaticMesh&)            = delete;
    StaticMesh& operator=(const StaticMesh&) = delete;

    [[nodiscard]] const std::string& name() const noexcept;
    [[nodiscard]] const glm::mat4&   transform() const noexcept;

    /// World-space geometry.
    [[nodiscard]] const TriMesh& geometry() const noexcept;

    [[nodiscard]] uint32_t triangleCount() const noexcept;

    /// True if the geometry can be handed to an index builder.
    [[nodiscard]] bool indexable() const noexcept;

    [[nodiscard]] SurfaceClass surfaceClass() const noexcept;

    // ------------------------------------------------------------
    // Spatial index
    // ------------------------------------------------------------

    [[nodiscard]] IndexState indexState() const noexcept;

    /// Built index, or nullptr while none is usable.
    [[nodiscard]] const MeshIndex* index() const noexcept;

    /// Installs a freshly built index and marks the mesh Ready.
    void setIndex(std::unique_ptr<MeshIndex> index);

    /// Marks the mesh as permanently excluded from indexed queries.
    void markIndexFailed() noexcept;

private:
    std::string  m_name;
    glm::mat4    m_transform;
    TriMesh      m_world;
    SurfaceClass m_surface = SurfaceClass::Default;
    bool         m_indexable = false;

    std::unique_ptr<MeshIndex> m_index;
    IndexState                 m_indexState = IndexState::None;
};
