#include "MeshIndexBuilder.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

#include "CoreUtilities.hpp"
#include "StaticMesh.hpp"

namespace
{
    constexpr double kProgressLogIntervalMs = 1000.0;

    double steadyNowMs()
    {
        using namespace std::chrono;
        return duration<double, std::milli>(steady_clock::now().time_since_epoch()).count();
    }

} // namespace

MeshIndexBuilder::MeshIndexBuilder(IndexFactory factory, Clock clock)
    : m_factory(std::move(factory)),
      m_clock(clock ? std::move(clock) : Clock(steadyNowMs))
{
    if (!m_factory)
        throw lw::core_exception("MeshIndexBuilder requires an index factory");
}

bool MeshIndexBuilder::registerMesh(StaticMesh* mesh)
{
    if (!mesh)
        return false;

    if (mesh->indexState() != IndexState::None)
        return false;

    if (m_queued.contains(mesh))
        return false;

    if (!mesh->indexable())
    {
        std::cerr << "MeshIndexBuilder: mesh \"" << mesh->name()
                  << "\" has no indexable geometry, queries use brute force\n";
        return false;
    }

    // Insert after meshes of equal size so registration order breaks ties
    auto it = std::upper_bound(m_queue.begin(), m_queue.end(), mesh, [](const StaticMesh* a, const StaticMesh* b) {
        return a->triangleCount() < b->triangleCount();
    });

    m_queue.insert(it, mesh);
    m_queued.insert(mesh);
    return true;
}

size_t MeshIndexBuilder::build(double budgetMs)
{
    if (m_queue.empty())
        return 0;

    const double start     = m_clock();
    size_t       processed = 0;

    while (!m_queue.empty())
    {
        StaticMesh* mesh = m_queue.front();
        m_queue.erase(m_queue.begin());
        m_queued.erase(mesh);

        try
        {
            std::unique_ptr<MeshIndex> index = m_factory(*mesh);
            if (!index)
                throw lw::core_exception("index factory returned no index");

            mesh->setIndex(std::move(index));
            ++m_built;
            m_trianglesBuilt += mesh->triangleCount();
        }
        catch (const std::exception& e)
        {
            std::cerr << "MeshIndexBuilder: failed to build index for \"" << mesh->name()
                      << "\": " << e.what() << "\n";
            mesh->markIndexFailed();
            ++m_failed;
        }

        ++processed;

        if (m_clock() - start > budgetMs)
            break;
    }

    logProgress(m_clock());
    return processed;
}

void MeshIndexBuilder::clear()
{
    m_queue.clear();
    m_queued.clear();
}

size_t MeshIndexBuilder::pending() const noexcept
{
    return m_queue.size();
}

bool MeshIndexBuilder::isQueued(const StaticMesh* mesh) const noexcept
{
    return m_queued.contains(mesh);
}

const std::vector<StaticMesh*>& MeshIndexBuilder::queue() const noexcept
{
    return m_queue;
}

size_t MeshIndexBuilder::builtCount() const noexcept
{
    return m_built;
}

size_t MeshIndexBuilder::failedCount() const noexcept
{
    return m_failed;
}

uint64_t MeshIndexBuilder::trianglesBuilt() const noexcept
{
    return m_trianglesBuilt;
}

void MeshIndexBuilder::logProgress(double now)
{
    if (m_queue.empty())
    {
        std::cerr << "MeshIndexBuilder: queue drained, " << m_built << " built, "
                  << m_failed << " failed, " << m_trianglesBuilt << " triangles\n";
        m_lastLogMs = now;
        return;
    }

    if (now - m_lastLogMs < kProgressLogIntervalMs)
        return;

    std::cerr << "MeshIndexBuilder: " << m_queue.size() << " meshes pending, "
              << m_built << " built\n";
    m_lastLogMs = now;
}
