#ifndef SYS_MESH_DATA_HPP_INCLUDED
#define SYS_MESH_DATA_HPP_INCLUDED

#include <EdgeSet.hpp>
#include <SlotList.hpp>
#include <SysCounter.hpp>
#include <cstdint>
#include <glm/vec3.hpp>
#include <memory>
#include <vector>

#include "History.hpp"
#include "SysMesh.hpp"

struct SysVert
{
    SysVertPolys polys;
    glm::vec3    pos{0.0f};
};

struct SysPoly
{
    SysPolyVerts verts;
    uint32_t     material_id{0};
};

struct SysFullPoly
{
    SysPoly data;
    int32_t index{-1};
};

struct SysMeshData
{
    SysMeshData() :
        history{nullptr},
        history_busy{false},
        local_suppress_depth{0},
        suppress_depth{&local_suppress_depth},
        change_counter{std::make_shared<SysCounter>()},
        topology_counter{std::make_shared<SysCounter>()},
        deform_counter{std::make_shared<SysCounter>()},
        select_counter{std::make_shared<SysCounter>()}
    {
        // Set the general change counter as the parent.
        topology_counter->addParent(change_counter);
        deform_counter->addParent(change_counter);
        select_counter->addParent(change_counter);
    }

    /// Verts and polys
    SlotList<SysVert> verts;
    SlotList<SysPoly> polys;

    /// Selections
    EdgeSet edge_selection;

    /// History
    std::unique_ptr<History> history;
    bool                     history_busy;

    /// Suppression depth watched by recording(). Points at local_suppress_depth
    /// unless the owner shares its own counter.
    int        local_suppress_depth;
    const int* suppress_depth;

    /// Change counters
    SysCounterPtr change_counter;
    SysCounterPtr topology_counter;
    SysCounterPtr deform_counter;
    SysCounterPtr select_counter;
};

#endif
