#include "WorldQueryIndexed.hpp"

#include <cmath>
#include <glm/glm.hpp>

#include "CoreUtilities.hpp"
#include "StaticMesh.hpp"

// --------------------------------------------------------
// Internal helpers
// --------------------------------------------------------

namespace
{
    // Brute-force nearest hit on one mesh within maxDistance.
    IndexHit hitTrianglesOnMesh(const lw::ray& ray, float maxDistance, const TriMesh& geo) noexcept
    {
        IndexHit best;
        best.t = maxDistance;

        const auto positions = geo.positions();
        const auto tris      = geo.triangles();
        const auto nverts    = static_cast<int32_t>(positions.size());

        for (size_t ti = 0; ti < tris.size(); ++ti)
        {
            const TriVerts& tv = tris[ti];
            if (tv[0] < 0 || tv[1] < 0 || tv[2] < 0 || tv[0] >= nverts || tv[1] >= nverts || tv[2] >= nverts)
                continue;

            float t = 0.0f;
            if (!lw::ray_triangle_intersect(ray, positions[tv[0]], positions[tv[1]], positions[tv[2]], t))
                continue;

            if (t <= best.t)
            {
                best.t   = t;
                best.tri = static_cast<int32_t>(ti);
            }
        }

        if (best.valid())
            best.normal = geo.tri_normal(best.tri);

        return best;
    }

} // namespace

// --------------------------------------------------------
// WorldQueryIndexed implementation
// --------------------------------------------------------

WorldHit WorldQueryIndexed::cast(const lw::ray&                  ray,
                                 float                           maxDistance,
                                 const std::vector<StaticMesh*>& meshes) const
{
    WorldHit best;
    ++m_stats.casts;

    if (meshes.empty() || !(maxDistance > 0.0f))
        return best;

    float tFar = maxDistance;

    for (const StaticMesh* mesh : meshes)
    {
        if (!mesh)
            continue;

        IndexHit hit;
        if (const MeshIndex* index = mesh->index())
        {
            ++m_stats.indexedTests;
            hit = index->intersect(ray, tFar);
        }
        else
        {
            ++m_stats.bruteForceTests;
            hit = hitTrianglesOnMesh(ray, tFar, mesh->geometry());
        }

        if (!hit.valid() || hit.t > tFar)
            continue;

        if (!best.valid() || hit.t < best.dist)
        {
            best.mesh  = mesh;
            best.dist  = hit.t;
            best.tri   = hit.tri;
            best.point = ray.org + ray.dir * hit.t;

            if (lw::is_zero(hit.normal))
            {
                best.normal.reset();
            }
            else
            {
                // Face the ray origin so callers can push out along it directly
                best.normal = glm::dot(hit.normal, ray.dir) > 0.0f ? -hit.normal : hit.normal;
            }

            tFar = hit.t;
        }
    }

    return best;
}
