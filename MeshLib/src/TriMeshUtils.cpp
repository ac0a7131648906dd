#include "TriMeshUtils.hpp"

#include <algorithm>
#include <glm/glm.hpp>

namespace tmu
{

    void add_quad(TriMesh&         mesh,
                  const glm::vec3& a,
                  const glm::vec3& b,
                  const glm::vec3& c,
                  const glm::vec3& d,
                  const glm::vec3& outward)
    {
        const int32_t ia = mesh.create_vert(a);
        const int32_t ib = mesh.create_vert(b);
        const int32_t ic = mesh.create_vert(c);
        const int32_t id = mesh.create_vert(d);

        if (glm::dot(glm::cross(b - a, c - a), outward) >= 0.0f)
        {
            mesh.create_tri(ia, ib, ic);
            mesh.create_tri(ia, ic, id);
        }
        else
        {
            mesh.create_tri(ia, ic, ib);
            mesh.create_tri(ia, id, ic);
        }
    }

    TriMesh make_grid(const glm::vec3& center, float sizeX, float sizeZ, int32_t cellsX, int32_t cellsZ)
    {
        TriMesh mesh;

        cellsX = std::max(cellsX, 1);
        cellsZ = std::max(cellsZ, 1);

        const float x0 = center.x - sizeX * 0.5f;
        const float z0 = center.z - sizeZ * 0.5f;
        const float dx = sizeX / static_cast<float>(cellsX);
        const float dz = sizeZ / static_cast<float>(cellsZ);

        // (cellsX + 1) x (cellsZ + 1) lattice, row major along X
        for (int32_t iz = 0; iz <= cellsZ; ++iz)
        {
            for (int32_t ix = 0; ix <= cellsX; ++ix)
                mesh.create_vert({x0 + dx * static_cast<float>(ix), center.y, z0 + dz * static_cast<float>(iz)});
        }

        const int32_t stride = cellsX + 1;
        for (int32_t iz = 0; iz < cellsZ; ++iz)
        {
            for (int32_t ix = 0; ix < cellsX; ++ix)
            {
                const int32_t v00 = iz * stride + ix;
                const int32_t v10 = v00 + 1;
                const int32_t v01 = v00 + stride;
                const int32_t v11 = v01 + 1;

                // (z+, x+) ordering gives a +Y normal
                mesh.create_tri(v00, v01, v10);
                mesh.create_tri(v10, v01, v11);
            }
        }

        return mesh;
    }

    TriMesh make_plane(const glm::vec3& center, float sizeX, float sizeZ)
    {
        return make_grid(center, sizeX, sizeZ, 1, 1);
    }

    TriMesh make_box(const glm::vec3& center, const glm::vec3& halfExtents)
    {
        TriMesh mesh;

        const glm::vec3 lo = center - halfExtents;
        const glm::vec3 hi = center + halfExtents;

        // -X / +X
        add_quad(mesh, {lo.x, lo.y, lo.z}, {lo.x, hi.y, lo.z}, {lo.x, hi.y, hi.z}, {lo.x, lo.y, hi.z}, {-1, 0, 0});
        add_quad(mesh, {hi.x, lo.y, lo.z}, {hi.x, hi.y, lo.z}, {hi.x, hi.y, hi.z}, {hi.x, lo.y, hi.z}, {1, 0, 0});

        // -Y / +Y
        add_quad(mesh, {lo.x, lo.y, lo.z}, {hi.x, lo.y, lo.z}, {hi.x, lo.y, hi.z}, {lo.x, lo.y, hi.z}, {0, -1, 0});
        add_quad(mesh, {lo.x, hi.y, lo.z}, {hi.x, hi.y, lo.z}, {hi.x, hi.y, hi.z}, {lo.x, hi.y, hi.z}, {0, 1, 0});

        // -Z / +Z
        add_quad(mesh, {lo.x, lo.y, lo.z}, {hi.x, lo.y, lo.z}, {hi.x, hi.y, lo.z}, {lo.x, hi.y, lo.z}, {0, 0, -1});
        add_quad(mesh, {lo.x, lo.y, hi.z}, {hi.x, lo.y, hi.z}, {hi.x, hi.y, hi.z}, {lo.x, hi.y, hi.z}, {0, 0, 1});

        return mesh;
    }

} // namespace tmu
