#include "WorldQuery.hpp"

#include <cmath>

#include "CoreUtilities.hpp"

WorldHit WorldQuery::castFrom(const glm::vec3&                origin,
                              const glm::vec3&                direction,
                              float                           maxDistance,
                              const std::vector<StaticMesh*>& meshes) const
{
    const glm::vec3 dir = lw::safe_normalize(direction);
    if (lw::is_zero(dir) || !lw::is_finite(origin))
        return {};

    if (!(maxDistance > 0.0f) || !std::isfinite(maxDistance))
        return {};

    return cast(lw::make_ray(origin, dir), maxDistance, meshes);
}
