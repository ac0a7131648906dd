#include "EmbreeMeshIndex.hpp"

#include <embree4/rtcore_ray.h>
#include <glm/glm.hpp>
#include <string>

#include "CoreUtilities.hpp"
#include "EmbreeDevice.hpp"
#include "TriMesh.hpp"

// --------------------------------------------------------
// Internal helpers
// --------------------------------------------------------

namespace
{
    struct RTCFloat3
    {
        float x, y, z;
    };

    struct RTCTri
    {
        unsigned int v0, v1, v2;
    };

    RTCRayHit fromRay(const lw::ray& ray, float maxDistance)
    {
        RTCRayHit rh{};
        rh.ray.org_x = ray.org.x;
        rh.ray.org_y = ray.org.y;
        rh.ray.org_z = ray.org.z;

        rh.ray.dir_x = ray.dir.x;
        rh.ray.dir_y = ray.dir.y;
        rh.ray.dir_z = ray.dir.z;

        rh.ray.tnear = 0.0f;
        rh.ray.tfar  = maxDistance;
        rh.ray.mask  = 0xFFFFFFFFu;
        rh.ray.flags = 0;

        rh.hit.geomID = RTC_INVALID_GEOMETRY_ID;
        rh.hit.primID = RTC_INVALID_GEOMETRY_ID;
        return rh;
    }

} // namespace

// --------------------------------------------------------
// EmbreeMeshIndex implementation
// --------------------------------------------------------

EmbreeMeshIndex::EmbreeMeshIndex(const EmbreeDevice& device, const TriMesh& worldGeometry)
{
    if (!worldGeometry.indexable())
        throw lw::core_exception("mesh geometry is not indexable");

    const uint32_t vertCount = worldGeometry.num_verts();
    m_triCount               = worldGeometry.num_tris();

    // Drop any stale error left by earlier calls so failures here are ours
    (void)device.takeError();

    m_scene = rtcNewScene(device.handle());
    if (!m_scene)
        throw lw::core_exception("rtcNewScene failed");

    rtcSetSceneBuildQuality(m_scene, RTC_BUILD_QUALITY_MEDIUM);

    RTCGeometry geom = rtcNewGeometry(device.handle(), RTC_GEOMETRY_TYPE_TRIANGLE);
    if (!geom)
    {
        rtcReleaseScene(m_scene);
        m_scene = nullptr;
        throw lw::core_exception("rtcNewGeometry failed");
    }

    rtcSetGeometryBuildQuality(geom, RTC_BUILD_QUALITY_MEDIUM);

    auto* vbuf = reinterpret_cast<RTCFloat3*>(
        rtcSetNewGeometryBuffer(geom,
                                RTC_BUFFER_TYPE_VERTEX,
                                0,
                                RTC_FORMAT_FLOAT3,
                                sizeof(RTCFloat3),
                                vertCount));

    auto* ibuf = reinterpret_cast<RTCTri*>(
        rtcSetNewGeometryBuffer(geom,
                                RTC_BUFFER_TYPE_INDEX,
                                0,
                                RTC_FORMAT_UINT3,
                                sizeof(RTCTri),
                                m_triCount));

    if (!vbuf || !ibuf)
    {
        rtcReleaseGeometry(geom);
        rtcReleaseScene(m_scene);
        m_scene = nullptr;
        throw lw::core_exception("rtcSetNewGeometryBuffer failed");
    }

    const auto positions = worldGeometry.positions();
    for (uint32_t vi = 0; vi < vertCount; ++vi)
    {
        vbuf[vi].x = positions[vi].x;
        vbuf[vi].y = positions[vi].y;
        vbuf[vi].z = positions[vi].z;
    }

    const auto tris = worldGeometry.triangles();
    for (uint32_t ti = 0; ti < m_triCount; ++ti)
    {
        ibuf[ti].v0 = static_cast<unsigned int>(tris[ti][0]);
        ibuf[ti].v1 = static_cast<unsigned int>(tris[ti][1]);
        ibuf[ti].v2 = static_cast<unsigned int>(tris[ti][2]);
    }

    rtcCommitGeometry(geom);
    rtcAttachGeometry(m_scene, geom);
    rtcReleaseGeometry(geom);

    rtcCommitScene(m_scene);

    const RTCError code = device.takeError();
    if (code != RTC_ERROR_NONE)
    {
        rtcReleaseScene(m_scene);
        m_scene = nullptr;
        throw lw::core_exception("Embree error during scene commit: " + std::to_string(static_cast<int>(code)));
    }
}

EmbreeMeshIndex::~EmbreeMeshIndex()
{
    if (m_scene)
        rtcReleaseScene(m_scene);
}

IndexHit EmbreeMeshIndex::intersect(const lw::ray& ray, float maxDistance) const
{
    IndexHit best;

    if (!m_scene)
        return best;

    RTCRayHit rh = fromRay(ray, maxDistance);

    RTCIntersectArguments args;
    rtcInitIntersectArguments(&args);

    rtcIntersect1(m_scene, &rh, &args);

    if (rh.hit.geomID == RTC_INVALID_GEOMETRY_ID ||
        rh.hit.primID == RTC_INVALID_GEOMETRY_ID)
        return best;

    if (rh.hit.primID >= m_triCount)
        return best;

    best.t      = rh.ray.tfar;
    best.tri    = static_cast<int32_t>(rh.hit.primID);
    best.normal = lw::safe_normalize(glm::vec3(rh.hit.Ng_x, rh.hit.Ng_y, rh.hit.Ng_z));
    return best;
}
