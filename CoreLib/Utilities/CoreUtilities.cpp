#include "CoreUtilities.hpp"

namespace lw
{
    bool ray_triangle_intersect(const ray&       r,
                                const glm::vec3& a,
                                const glm::vec3& b,
                                const glm::vec3& c,
                                float&           out_t) noexcept
    {
        constexpr float EPS = 1e-7f;

        const glm::vec3 e1  = b - a;
        const glm::vec3 e2  = c - a;
        const glm::vec3 p   = glm::cross(r.dir, e2);
        const float     det = glm::dot(e1, p);

        // Parallel to the triangle plane (or degenerate triangle)
        if (std::fabs(det) < EPS)
            return false;

        const float     invDet = 1.0f / det;
        const glm::vec3 tvec   = r.org - a;
        const float     u      = glm::dot(tvec, p) * invDet;
        if (u < 0.0f || u > 1.0f)
            return false;

        const glm::vec3 q = glm::cross(tvec, e1);
        const float     v = glm::dot(r.dir, q) * invDet;
        if (v < 0.0f || u + v > 1.0f)
            return false;

        const float t = glm::dot(e2, q) * invDet;
        if (t < 0.0f)
            return false;

        out_t = t;
        return true;
    }

} // namespace lw
