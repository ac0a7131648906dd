//
//  TriMesh.hpp
//  Mesh
//

#ifndef TRI_MESH_HPP_INCLUDED
#define TRI_MESH_HPP_INCLUDED

#include <array>
#include <cstdint>
#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>
#include <span>
#include <vector>

using TriVerts = std::array<int32_t, 3>;

/**
 * @brief Flat indexed triangle soup.
 *
 * TriMesh is the geometry container handed over by the asset layer for static
 * world meshes. It stores vertex positions and triangle index triples in two
 * contiguous arrays so they can be uploaded to an acceleration structure
 * without conversion.
 *
 * Indices are not validated on insertion; indexable() reports whether the
 * whole mesh is well formed.
 */
class TriMesh
{
public:
    TriMesh() = default;

    TriMesh(const TriMesh&)            = default;
    TriMesh& operator=(const TriMesh&) = default;

    TriMesh(TriMesh&& other) noexcept            = default;
    TriMesh& operator=(TriMesh&& other) noexcept = default;

    /// Empties the mesh, removing all geometry.
    void clear() noexcept;

    /// Vertices ------------------------------------------

    /// @return The number of vertices in the mesh.
    [[nodiscard]] uint32_t num_verts() const noexcept;

    /// @return An index to a newly created vertex with the specified position.
    int32_t create_vert(const glm::vec3& pos);

    /// @return The position of the specified vertex.
    [[nodiscard]] const glm::vec3& vert_position(int32_t vert_index) const noexcept;

    /// @return True if the index addresses an existing vertex.
    [[nodiscard]] bool vert_valid(int32_t vert_index) const noexcept;

    /// Triangles -----------------------------------------

    /// @return The number of triangles in the mesh.
    [[nodiscard]] uint32_t num_tris() const noexcept;

    /// @return An index to a newly created triangle over the three vertices.
    int32_t create_tri(int32_t a, int32_t b, int32_t c);

    /// @return The vertex indices of the specified triangle.
    [[nodiscard]] const TriVerts& tri_verts(int32_t tri_index) const noexcept;

    /// @return True if all three corners of the triangle are valid vertices.
    [[nodiscard]] bool tri_valid(int32_t tri_index) const noexcept;

    /// @return The unit geometric normal (counter-clockwise winding), or zero if degenerate.
    [[nodiscard]] glm::vec3 tri_normal(int32_t tri_index) const noexcept;

    /// Whole mesh ----------------------------------------

    /// @return True if the mesh has at least one triangle, every index is in
    /// range and every vertex coordinate is finite.
    [[nodiscard]] bool indexable() const noexcept;

    /// @return Axis aligned bounds as {min, max}. Both zero on an empty mesh.
    [[nodiscard]] std::array<glm::vec3, 2> bounds() const noexcept;

    /// @return A copy with every vertex transformed by @p xform.
    [[nodiscard]] TriMesh transformed(const glm::mat4& xform) const;

    /// Appends another mesh, re-basing its indices.
    void append(const TriMesh& other);

    /// Raw access for acceleration structure upload.
    [[nodiscard]] std::span<const glm::vec3> positions() const noexcept;
    [[nodiscard]] std::span<const TriVerts>  triangles() const noexcept;

private:
    std::vector<glm::vec3> m_positions;
    std::vector<TriVerts>  m_tris;
};

#endif
