// Core/Scene/MeshIndex.hpp
#pragma once

#include <cstdint>
#include <glm/vec3.hpp>
#include <limits>

namespace lw
{
    struct ray;
} // namespace lw

/**
 * @brief Result of intersecting one ray with one mesh index.
 */
struct IndexHit
{
    float     t      = std::numeric_limits<float>::max(); ///< Distance along the ray
    int32_t   tri    = -1;                                ///< Triangle index in the owning mesh
    glm::vec3 normal = glm::vec3(0.0f);                   ///< Unit geometric normal (world space)

    bool valid() const
    {
        return tri > -1;
    }
};

/**
 * @brief Abstract ray acceleration structure bound to one static mesh.
 *
 * An index is built once from a mesh's world-space geometry and is never
 * updated afterwards. Implementations may use Embree, a custom BVH, etc.
 */
class MeshIndex
{
public:
    virtual ~MeshIndex() = default;

    /// First intersection within [0, maxDistance], or an invalid hit.
    virtual IndexHit intersect(const lw::ray& ray, float maxDistance) const = 0;

    /// Number of triangles the index was built over.
    [[nodiscard]] virtual uint32_t triangleCount() const noexcept = 0;

protected:
    MeshIndex() = default;
};
