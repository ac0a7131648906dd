#pragma once

#include <embree4/rtcore.h>

#include "MeshIndex.hpp"

class EmbreeDevice;
class TriMesh;

/**
 * @brief MeshIndex backed by a private Embree scene holding one triangle geometry.
 *
 * The constructor uploads and commits the geometry (the expensive part) and
 * throws std::runtime_error if Embree reports an error while doing so.
 */
class EmbreeMeshIndex : public MeshIndex
{
public:
    EmbreeMeshIndex(const EmbreeDevice& device, const TriMesh& worldGeometry);
    ~EmbreeMeshIndex() override;

    EmbreeMeshIndex(const EmbreeMeshIndex&)            = delete;
    EmbreeMeshIndex& operator=(const EmbreeMeshIndex&) = delete;

    IndexHit intersect(const lw::ray& ray, float maxDistance) const override;

    [[nodiscard]] uint32_t triangleCount() const noexcept override
    {
        return m_triCount;
    }

private:
    RTCScene m_scene    = nullptr;
    uint32_t m_triCount = 0;
};
