#ifndef EDGE_SET_HPP_INCLUDED
#define EDGE_SET_HPP_INCLUDED

#include <cstdint>
#include <set>
#include <utility>
#include <vector>

using IndexPair = std::pair<int32_t, int32_t>;

/**
 * @brief Set of undirected edges.
 *
 * Edges are stored normalized (lowest vertex index first), so (a,b) and (b,a)
 * address the same entry. Insertion order is kept alongside for callers that
 * want the edges back in the order they were added (selection order).
 */
class EdgeSet
{
public:
    EdgeSet() = default;

    [[nodiscard]] bool empty() const noexcept
    {
        return m_edges.empty();
    }

    [[nodiscard]] size_t size() const noexcept
    {
        return m_edges.size();
    }

    void clear() noexcept
    {
        m_edges.clear();
        m_order.clear();
    }

    // @return True if the set contains the specified edge.
    [[nodiscard]] bool contains(IndexPair edge) const noexcept
    {
        normalize(edge);
        return m_edges.contains(edge);
    }

    // Inserts the specified edge if it doesn't already exist.
    // @return True if the insertion was successful.
    bool insert(IndexPair edge)
    {
        normalize(edge);
        if (!m_edges.insert(edge).second)
            return false;

        m_order.push_back(edge);
        return true;
    }

    // Removes the specified edge if it exists in the set.
    // @return True if the removal was successful.
    bool erase(IndexPair edge)
    {
        normalize(edge);
        if (m_edges.erase(edge) == 0)
            return false;

        std::erase(m_order, edge);
        return true;
    }

    // @return Normalized edges in insertion order.
    [[nodiscard]] const std::vector<IndexPair>& ordered() const noexcept
    {
        return m_order;
    }

    // Normalize the edge to ensure the first element is always smaller than the second.
    static void normalize(IndexPair& edge) noexcept
    {
        if (edge.first > edge.second)
            std::swap(edge.first, edge.second);
    }

private:
    std::set<IndexPair>    m_edges;
    std::vector<IndexPair> m_order;
};

#endif // EDGE_SET_HPP_INCLUDED
