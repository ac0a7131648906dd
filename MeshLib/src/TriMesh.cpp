//
//  TriMesh.cpp
//  Mesh
//

#include "TriMesh.hpp"

#include <algorithm>
#include <cmath>
#include <glm/glm.hpp>

void TriMesh::clear() noexcept
{
    m_positions.clear();
    m_tris.clear();
}

uint32_t TriMesh::num_verts() const noexcept
{
    return static_cast<uint32_t>(m_positions.size());
}

int32_t TriMesh::create_vert(const glm::vec3& pos)
{
    m_positions.push_back(pos);
    return static_cast<int32_t>(m_positions.size()) - 1;
}

const glm::vec3& TriMesh::vert_position(int32_t vert_index) const noexcept
{
    return m_positions[static_cast<size_t>(vert_index)];
}

bool TriMesh::vert_valid(int32_t vert_index) const noexcept
{
    return vert_index >= 0 && static_cast<size_t>(vert_index) < m_positions.size();
}

uint32_t TriMesh::num_tris() const noexcept
{
    return static_cast<uint32_t>(m_tris.size());
}

int32_t TriMesh::create_tri(int32_t a, int32_t b, int32_t c)
{
    m_tris.push_back({a, b, c});
    return static_cast<int32_t>(m_tris.size()) - 1;
}

const TriVerts& TriMesh::tri_verts(int32_t tri_index) const noexcept
{
    return m_tris[static_cast<size_t>(tri_index)];
}

bool TriMesh::tri_valid(int32_t tri_index) const noexcept
{
    if (tri_index < 0 || static_cast<size_t>(tri_index) >= m_tris.size())
        return false;

    const TriVerts& t = m_tris[static_cast<size_t>(tri_index)];
    return vert_valid(t[0]) && vert_valid(t[1]) && vert_valid(t[2]);
}

glm::vec3 TriMesh::tri_normal(int32_t tri_index) const noexcept
{
    if (!tri_valid(tri_index))
        return glm::vec3(0.0f);

    const TriVerts&  t = m_tris[static_cast<size_t>(tri_index)];
    const glm::vec3& a = m_positions[static_cast<size_t>(t[0])];
    const glm::vec3& b = m_positions[static_cast<size_t>(t[1])];
    const glm::vec3& c = m_positions[static_cast<size_t>(t[2])];

    const glm::vec3 n   = glm::cross(b - a, c - a);
    const float     len = glm::length(n);
    if (!(len > 1e-12f))
        return glm::vec3(0.0f);

    return n / len;
}

bool TriMesh::indexable() const noexcept
{
    if (m_tris.empty())
        return false;

    for (const glm::vec3& p : m_positions)
    {
        if (!std::isfinite(p.x) || !std::isfinite(p.y) || !std::isfinite(p.z))
            return false;
    }

    for (const TriVerts& t : m_tris)
    {
        if (!vert_valid(t[0]) || !vert_valid(t[1]) || !vert_valid(t[2]))
            return false;
    }

    return true;
}

std::array<glm::vec3, 2> TriMesh::bounds() const noexcept
{
    if (m_positions.empty())
        return {glm::vec3(0.0f), glm::vec3(0.0f)};

    glm::vec3 lo = m_positions.front();
    glm::vec3 hi = m_positions.front();
    for (const glm::vec3& p : m_positions)
    {
        lo = glm::min(lo, p);
        hi = glm::max(hi, p);
    }
    return {lo, hi};
}

TriMesh TriMesh::transformed(const glm::mat4& xform) const
{
    TriMesh out;
    out.m_tris = m_tris;
    out.m_positions.reserve(m_positions.size());

    for (const glm::vec3& p : m_positions)
        out.m_positions.push_back(glm::vec3(xform * glm::vec4(p, 1.0f)));

    return out;
}

void TriMesh::append(const TriMesh& other)
{
    const int32_t base = static_cast<int32_t>(m_positions.size());

    m_positions.insert(m_positions.end(), other.m_positions.begin(), other.m_positions.end());

    m_tris.reserve(m_tris.size() + other.m_tris.size());
    for (const TriVerts& t : other.m_tris)
        m_tris.push_back({t[0] + base, t[1] + base, t[2] + base});
}

std::span<const glm::vec3> TriMesh::positions() const noexcept
{
    return m_positions;
}

std::span<const TriVerts> TriMesh::triangles() const noexcept
{
    return m_tris;
}
