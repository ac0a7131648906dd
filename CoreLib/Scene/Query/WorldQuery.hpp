// Core/Scene/Query/WorldQuery.hpp
#pragma once

#include <cstdint>
#include <glm/vec3.hpp>
#include <limits>
#include <optional>
#include <vector>

class StaticMesh;
namespace lw
{
    struct ray;
} // namespace lw

/**
 * @brief A ray hit on static world geometry.
 */
struct WorldHit
{
    WorldHit() : mesh(nullptr), dist(std::numeric_limits<float>::max()), point(0.0f), tri(-1)
    {
    }

    const StaticMesh*        mesh;   ///< Mesh hit
    float                    dist;   ///< Distance from ray origin
    glm::vec3                point;  ///< World-space hit point
    std::optional<glm::vec3> normal; ///< Unit normal facing the ray origin, if defined
    int32_t                  tri;    ///< Triangle index within the mesh

    bool valid() const
    {
        return (mesh && tri > -1);
    }
};

/**
 * @brief Abstract ray query against a set of static meshes.
 *
 * Results follow first-hit semantics: the hit is *a* surface along the ray
 * within maxDistance, not necessarily the nearest one. Implementations may
 * stop at whatever intersection their acceleration structure reports first.
 * This is an approximation suitable for gameplay and visuals only; callers
 * must not rely on exact nearest-hit ordering.
 */
class WorldQuery
{
public:
    virtual ~WorldQuery() = default;

    /**
     * @brief Cast one ray against @p meshes.
     * @param ray         Ray with normalized direction.
     * @param maxDistance Search length (> 0).
     * @param meshes      Meshes to test. Empty means no hit.
     * @return A valid hit, or an invalid WorldHit for none.
     */
    virtual WorldHit cast(const lw::ray&                  ray,
                          float                           maxDistance,
                          const std::vector<StaticMesh*>& meshes) const = 0;

    /**
     * @brief Convenience overload taking a raw origin and direction.
     *
     * The direction is normalized here. Zero or non-finite directions and
     * non-positive distances return no hit.
     */
    WorldHit castFrom(const glm::vec3&                origin,
                      const glm::vec3&                direction,
                      float                           maxDistance,
                      const std::vector<StaticMesh*>& meshes) const;

protected:
    WorldQuery() = default;
};
