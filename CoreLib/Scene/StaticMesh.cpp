#include "StaticMesh.hpp"

#include <utility>

#include "CoreUtilities.hpp"

StaticMesh::StaticMesh(std::string name, const TriMesh& localGeometry, const glm::mat4& xform)
    : m_name(std::move(name)),
      m_transform(xform),
      m_world(localGeometry.transformed(xform)),
      m_surface(classifySurface(m_name))
{
    m_indexable = m_world.indexable();
}

StaticMesh::~StaticMesh() = default;

const std::string& StaticMesh::name() const noexcept
{
    return m_name;
}

const glm::mat4& StaticMesh::transform() const noexcept
{
    return m_transform;
}

const TriMesh& StaticMesh::geometry() const noexcept
{
    return m_world;
}

uint32_t StaticMesh::triangleCount() const noexcept
{
    return m_world.num_tris();
}

bool StaticMesh::indexable() const noexcept
{
    return m_indexable;
}

SurfaceClass StaticMesh::surfaceClass() const noexcept
{
    return m_surface;
}

IndexState StaticMesh::indexState() const noexcept
{
    return m_indexState;
}

const MeshIndex* StaticMesh::index() const noexcept
{
    return m_indexState == IndexState::Ready ? m_index.get() : nullptr;
}

void StaticMesh::setIndex(std::unique_ptr<MeshIndex> index)
{
    if (!index)
        throw lw::core_exception("StaticMesh::setIndex(): null index for mesh \"" + m_name + "\"");

    if (m_indexState != IndexState::None)
        throw lw::core_exception("StaticMesh::setIndex(): mesh \"" + m_name + "\" already has an index state");

    m_index      = std::move(index);
    m_indexState = IndexState::Ready;
}

void StaticMesh::markIndexFailed() noexcept
{
    m_index.reset();
    m_indexState = IndexState::Failed;
}
