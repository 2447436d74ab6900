#include "SysMeshScene.hpp"

#include <cassert>
#include <memory>

#include "History.hpp"
#include "SysMesh.hpp"

SysMeshScene::SysMeshScene() :
    m_sceneHistory{nullptr}
{
}

SysMeshScene::~SysMeshScene()
{
    // Scene entries replay into the meshes, drop them first.
    m_sceneHistory.clear();
}

/// -------------------------------------------------------
/// Meshes
/// -------------------------------------------------------

int32_t SysMeshScene::create_mesh()
{
    MeshSlot slot;
    slot.mesh = std::make_unique<SysMesh>(&m_suppressDepth);
    slot.live = true;

    if (m_freeSlots.empty())
    {
        m_meshes.push_back(std::move(slot));
        return static_cast<int32_t>(m_meshes.size()) - 1;
    }

    const int32_t id = m_freeSlots.back();
    m_freeSlots.pop_back();

    assert(!m_meshes[id].live && !m_meshes[id].committed && "Reusing a slot that is still referenced");
    m_meshes[id] = std::move(slot);
    return id;
}

bool SysMeshScene::remove_mesh(int32_t id)
{
    if (!mesh(id))
        return false;

    MeshSlot& slot = m_meshes[id];
    slot.live      = false;

    // Retired meshes keep their id, scene history still points at them.
    if (!slot.committed)
    {
        slot.mesh.reset();
        m_freeSlots.push_back(id);
    }

    return true;
}

SysMesh* SysMeshScene::mesh(int32_t id) const noexcept
{
    if (id < 0 || id >= static_cast<int32_t>(m_meshes.size()))
        return nullptr;

    const MeshSlot& slot = m_meshes[id];
    return slot.live ? slot.mesh.get() : nullptr;
}

std::vector<SysMesh*> SysMeshScene::meshes() const
{
    std::vector<SysMesh*> result;
    result.reserve(m_meshes.size());

    for (const MeshSlot& slot : m_meshes)
    {
        if (slot.live)
            result.push_back(slot.mesh.get());
    }
    return result;
}

/// -------------------------------------------------------
/// History suppression
/// -------------------------------------------------------

void SysMeshScene::begin_history_suppression() noexcept
{
    ++m_suppressDepth;
}

void SysMeshScene::end_history_suppression() noexcept
{
    assert(m_suppressDepth > 0 && "Unbalanced end_history_suppression()");
    if (m_suppressDepth > 0)
        --m_suppressDepth;
}

/// -------------------------------------------------------
/// Transactions
/// -------------------------------------------------------

void SysMeshScene::open_transaction(std::string_view name)
{
    if (m_transactionDepth == 0)
        m_transactionName = name;

    ++m_transactionDepth;
}

bool SysMeshScene::close_transaction()
{
    assert(m_transactionDepth > 0 && "Unbalanced close_transaction()");
    if (m_transactionDepth == 0)
        return false;

    if (--m_transactionDepth > 0)
        return false;

    const std::string name = std::move(m_transactionName);
    m_transactionName.clear();

    return commitMeshChanges(name);
}

void SysMeshScene::cancel_transaction()
{
    assert(m_transactionDepth > 0 && "Unbalanced cancel_transaction()");

    abortMeshChanges();

    if (m_transactionDepth > 0 && --m_transactionDepth == 0)
        m_transactionName.clear();
}

bool SysMeshScene::commitMeshChanges(std::string_view name)
{
    if (in_transaction())
        return false;

    // Collect per-mesh histories into a single atomic action.
    auto sceneTransaction = std::make_unique<History>(nullptr);
    sceneTransaction->set_name(name);

    for (MeshSlot& slot : m_meshes)
    {
        if (!slot.live)
            continue;

        History* h = slot.mesh->history();
        if (!h || !h->can_undo())
            continue;

        sceneTransaction->insert(slot.mesh->release_history());
        slot.committed = true;
    }

    if (!sceneTransaction->can_undo())
        return false;

    m_sceneHistory.insert(std::move(sceneTransaction));
    return true;
}

void SysMeshScene::abortMeshChanges()
{
    for (SysMesh* mesh : meshes())
    {
        History* h = mesh->history();
        if (h)
            h->undo();
    }
}

bool SysMeshScene::hasPendingMeshChanges() const
{
    for (SysMesh* mesh : meshes())
    {
        History* h = mesh->history();
        if (h && h->can_undo())
            return true;
    }
    return false;
}
