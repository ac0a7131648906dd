// TriMeshUtils.hpp
#pragma once

#include <cstdint>
#include <glm/vec3.hpp>

#include "TriMesh.hpp"

namespace tmu // Tri mesh utilities
{

    /**
     * @brief Append a quad as two triangles, wound so the face normal points along @p outward.
     *
     * Corners must be given in perimeter order (either direction).
     */
    void add_quad(TriMesh&         mesh,
                  const glm::vec3& a,
                  const glm::vec3& b,
                  const glm::vec3& c,
                  const glm::vec3& d,
                  const glm::vec3& outward);

    /**
     * @brief Horizontal grid facing +Y.
     *
     * Produces exactly 2 * cellsX * cellsZ triangles, which makes it the
     * usual way to build meshes of a known triangle count.
     *
     * @param center  Grid center.
     * @param sizeX   Extent along X.
     * @param sizeZ   Extent along Z.
     * @param cellsX  Cells along X (>= 1).
     * @param cellsZ  Cells along Z (>= 1).
     */
    TriMesh make_grid(const glm::vec3& center, float sizeX, float sizeZ, int32_t cellsX, int32_t cellsZ);

    /// Single-quad floor facing +Y.
    TriMesh make_plane(const glm::vec3& center, float sizeX, float sizeZ);

    /**
     * @brief Closed axis aligned box with outward facing triangles (12 tris).
     * @param center      Box center.
     * @param halfExtents Half size along each axis.
     */
    TriMesh make_box(const glm::vec3& center, const glm::vec3& halfExtents);

} // namespace tmu
