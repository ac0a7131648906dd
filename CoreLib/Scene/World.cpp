//=============================================================================
// World.cpp
//=============================================================================
#include "World.hpp"

#include <string>

void World::clear()
{
    m_meshes.clear();
    m_owned.clear();
}

StaticMesh* World::addMesh(std::string_view name, const TriMesh& localGeometry, const glm::mat4& xform)
{
    auto mesh = std::make_unique<StaticMesh>(std::string(name), localGeometry, xform);

    StaticMesh* raw = mesh.get();
    m_owned.push_back(std::move(mesh));
    m_meshes.push_back(raw);

    return raw;
}

const std::vector<StaticMesh*>& World::meshes() const noexcept
{
    return m_meshes;
}

bool World::empty() const noexcept
{
    return m_meshes.empty();
}

size_t World::size() const noexcept
{
    return m_meshes.size();
}

uint64_t World::triangleCount() const noexcept
{
    uint64_t total = 0;
    for (const StaticMesh* mesh : m_meshes)
        total += mesh->triangleCount();
    return total;
}
