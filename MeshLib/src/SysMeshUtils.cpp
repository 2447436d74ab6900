#include "SysMeshUtils.hpp"

#include <algorithm>
#include <cmath>
#include <glm/gtx/norm.hpp>
#include <unordered_map>
#include <unordered_set>

namespace smu
{

    namespace
    {
        using AdjMap = std::unordered_map<int32_t, std::vector<int32_t>>;

        struct CellKey
        {
            int32_t x = 0;
            int32_t y = 0;
            int32_t z = 0;

            bool operator==(const CellKey& o) const noexcept
            {
                return x == o.x && y == o.y && z == o.z;
            }
        };

        struct CellKeyHash
        {
            size_t operator()(const CellKey& k) const noexcept
            {
                size_t h   = 1469598103934665603ull;
                auto   mix = [&](uint32_t v) {
                    h ^= (size_t)v + 0x9e3779b9 + (h << 6) + (h >> 2);
                };
                mix((uint32_t)k.x);
                mix((uint32_t)k.y);
                mix((uint32_t)k.z);
                return h;
            }
        };

        static CellKey cell_of(const glm::vec3& p, float cellSize) noexcept
        {
            const float inv = (cellSize > 0.0f) ? (1.0f / cellSize) : 1.0f;

            auto fi = [&](float v) -> int32_t {
                return (int32_t)std::floor(v * inv);
            };

            return CellKey{fi(p.x), fi(p.y), fi(p.z)};
        }

        // Drops consecutive repeats and a closing repeat (first == last).
        static void remove_consecutive_dupes(SysPolyVerts& pv) noexcept
        {
            if (pv.size() < 2)
                return;

            SysPolyVerts out = {};
            out.reserve(pv.size());

            for (int32_t v : pv)
            {
                if (!out.empty() && out.back() == v)
                    continue;
                out.push_back(v);
            }

            if (out.size() >= 2 && out.front() == out.back())
                out.pop_back();

            pv.swap(out);
        }

        // (v0 v1 v2 v3) -> (v0 v3 v2 v1)
        static SysPolyVerts reverse_keep_first(const SysPolyVerts& in)
        {
            SysPolyVerts out = {};
            if (in.size() < 3)
                return out;

            out.reserve(in.size());
            out.push_back(in[0]);
            for (int i = (int)in.size() - 1; i >= 1; --i)
                out.push_back(in[(size_t)i]);
            return out;
        }

    } // namespace

    bool order_boundary_loop(std::span<const IndexPair> edges, std::vector<int32_t>& outVerts)
    {
        outVerts.clear();
        if (edges.empty())
            return false;

        std::unordered_set<IndexPair, IndexPairHash> unique;
        unique.reserve(edges.size());

        AdjMap adj;
        adj.reserve(edges.size() * 2u);

        for (const IndexPair& e0 : edges)
        {
            if (e0.first < 0 || e0.second < 0 || e0.first == e0.second)
                return false;

            if (!unique.insert(SysMesh::sort_edge(e0)).second)
                continue;

            adj[e0.first].push_back(e0.second);
            adj[e0.second].push_back(e0.first);
        }

        // A simple cycle: every vertex has exactly two neighbors.
        for (const auto& [v, nbrs] : adj)
        {
            if (nbrs.size() != 2)
                return false;
        }

        const int32_t start = edges.front().first;

        outVerts.reserve(adj.size());
        outVerts.push_back(start);

        int32_t prev = -1;
        int32_t cur  = start;

        for (;;)
        {
            const std::vector<int32_t>& nbrs = adj[cur];

            const int32_t next = (nbrs[0] != prev) ? nbrs[0] : nbrs[1];
            if (next == start)
                break;

            outVerts.push_back(next);
            prev = cur;
            cur  = next;

            if (outVerts.size() > adj.size())
                break;
        }

        // The walk closed before covering every vertex: more than one cycle.
        if (outVerts.size() != adj.size())
        {
            outVerts.clear();
            return false;
        }

        return true;
    }

    std::vector<int32_t> append_mesh(SysMesh& target, const SysMesh& source)
    {
        std::vector<int32_t> remap(source.vert_buffer_size(), -1);

        for (int32_t v : source.all_verts())
            remap[v] = target.create_vert(source.vert_position(v));

        for (int32_t p : source.all_polys())
        {
            const SysPolyVerts& pv = source.poly_verts(p);

            SysPolyVerts newPv = {};
            newPv.reserve(pv.size());
            for (int32_t v : pv)
                newPv.push_back(remap[v]);

            target.create_poly(newPv, source.poly_material(p));
        }

        return remap;
    }

    int weld_verts(SysMesh& mesh, std::span<const int32_t> verts, float tolerance)
    {
        const float d  = tolerance;
        const float d2 = d * d;

        std::vector<int32_t> targets;
        targets.reserve(verts.size());
        for (int32_t v : verts)
        {
            if (mesh.vert_valid(v))
                targets.push_back(v);
        }

        if (targets.size() < 2)
            return 0;

        // Spatial hash: cell -> list of "kept" verts in that cell
        std::unordered_map<CellKey, std::vector<int32_t>, CellKeyHash> grid;
        grid.reserve(targets.size());

        // old -> keep
        std::unordered_map<int32_t, int32_t> weldTo;
        weldTo.reserve(targets.size());

        auto add_keep = [&](int32_t keepV) {
            grid[cell_of(mesh.vert_position(keepV), d)].push_back(keepV);
        };

        auto find_keep_for = [&](int32_t v) -> int32_t {
            const glm::vec3 p = mesh.vert_position(v);
            const CellKey   c = cell_of(p, d);

            // Search this cell + 26 neighbors
            for (int dz = -1; dz <= 1; ++dz)
            {
                for (int dy = -1; dy <= 1; ++dy)
                {
                    for (int dx = -1; dx <= 1; ++dx)
                    {
                        auto it = grid.find(CellKey{c.x + dx, c.y + dy, c.z + dz});
                        if (it == grid.end())
                            continue;

                        for (int32_t keepV : it->second)
                        {
                            if (glm::length2(mesh.vert_position(keepV) - p) <= d2)
                                return keepV;
                        }
                    }
                }
            }

            return -1;
        };

        int welded = 0;

        for (int32_t v : targets)
        {
            if (weldTo.contains(v))
                continue;

            const int32_t keep = find_keep_for(v);
            if (keep >= 0 && keep != v)
            {
                weldTo.emplace(v, keep);
                ++welded;
                continue;
            }

            weldTo.emplace(v, v);
            add_keep(v);
        }

        if (welded == 0)
            return 0;

        // Only polys touching a welded vert need rewriting.
        std::vector<int32_t> touched;
        for (const auto& [v, keep] : weldTo)
        {
            if (v == keep)
                continue;
            const SysVertPolys& vp = mesh.vert_polys(v);
            touched.insert(touched.end(), vp.begin(), vp.end());
        }

        std::sort(touched.begin(), touched.end());
        touched.erase(std::unique(touched.begin(), touched.end()), touched.end());

        for (int32_t pid : touched)
        {
            if (!mesh.poly_valid(pid))
                continue;

            SysPolyVerts newPv = mesh.poly_verts(pid);
            for (int32_t& v : newPv)
            {
                auto it = weldTo.find(v);
                if (it != weldTo.end())
                    v = it->second;
            }

            remove_consecutive_dupes(newPv);

            // Degenerate polys are dropped, others are rebuilt with the same material.
            if (newPv.size() >= 3)
                mesh.create_poly(newPv, mesh.poly_material(pid));

            mesh.remove_poly(pid);
        }

        // Remove merged verts that nothing references anymore.
        for (const auto& [v, keep] : weldTo)
        {
            if (v == keep || !mesh.vert_valid(v))
                continue;

            if (mesh.vert_polys(v).empty())
                mesh.remove_vert(v);
        }

        mesh.clear_selected_edges();

        return welded;
    }

    bool reverse_winding(SysMesh& mesh)
    {
        bool any = false;

        const std::vector<int32_t> polys = mesh.all_polys();
        for (int32_t pid : polys)
        {
            if (!mesh.poly_valid(pid))
                continue;

            const SysPolyVerts newPv = reverse_keep_first(mesh.poly_verts(pid));
            if (newPv.empty())
                continue;

            const uint32_t mat = mesh.poly_material(pid);

            mesh.remove_poly(pid);
            if (mesh.create_poly(newPv, mat) >= 0)
                any = true;
        }

        return any;
    }

} // namespace smu
