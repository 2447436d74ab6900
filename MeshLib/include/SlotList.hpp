#ifndef SLOT_LIST_HPP_INCLUDED
#define SLOT_LIST_HPP_INCLUDED

#include <cassert>
#include <cstdint>
#include <type_traits>
#include <utility>
#include <vector>

/**
 * @brief Append-only slot storage with tombstones.
 *
 * Elements are addressed by a stable int32_t slot index. insert() always
 * appends, so a batch of inserts lands on consecutive slots right after the
 * current slot range. remove() leaves a tombstone and restore() revives it,
 * which is what undo/redo use to bring an element back at its old index.
 */
template<typename T>
class SlotList
{
public:
    using value_type      = T;
    using reference       = T&;
    using const_reference = const T&;
    using size_type       = std::int32_t;

    SlotList()                               = default;
    SlotList(const SlotList&)                = default;
    SlotList(SlotList&&) noexcept            = default;
    SlotList& operator=(const SlotList&)     = default;
    SlotList& operator=(SlotList&&) noexcept = default;
    ~SlotList()                              = default;

    /// @return Number of live elements.
    [[nodiscard]] size_type size() const noexcept
    {
        return m_size;
    }

    /// @return Number of slots ever allocated (live + tombstones).
    [[nodiscard]] size_type slots() const noexcept
    {
        return static_cast<size_type>(m_elements.size());
    }

    [[nodiscard]] bool valid(int32_t index) const noexcept
    {
        return index >= 0 && index < slots() && m_live[index];
    }

    [[nodiscard]] reference operator[](int32_t index) noexcept
    {
        return m_elements[index];
    }

    [[nodiscard]] const_reference operator[](int32_t index) const noexcept
    {
        return m_elements[index];
    }

    template<typename Q = T>
    std::enable_if_t<std::is_copy_constructible_v<Q>, int32_t>
    insert(const T& element)
    {
        return insert_impl(element);
    }

    int32_t insert(T&& element)
    {
        return insert_impl(std::move(element));
    }

    /// Turns the slot into a tombstone. The element value is kept untouched.
    void remove(int32_t index)
    {
        assert(valid(index) && "SlotList::remove on a dead slot");

        m_live[index] = false;
        --m_size;
        m_dirty = true;
    }

    /// Revives a tombstone with the given value.
    void restore(int32_t index, T element)
    {
        assert(index >= 0 && index < slots() && "SlotList::restore out of range");
        assert(!m_live[index] && "SlotList::restore on a live slot");

        m_elements[index] = std::move(element);
        m_live[index]     = true;
        ++m_size;
        m_dirty = true;
    }

    void clear() noexcept
    {
        m_elements.clear();
        m_live.clear();
        m_cachedValidIndices.clear();
        m_dirty = true;
        m_size  = 0;
    }

    void reserve(size_type amount)
    {
        m_elements.reserve(amount);
        m_live.reserve(amount);
    }

    /// @return Live slot indices in ascending order (cached until the next structural change).
    [[nodiscard]] const std::vector<int32_t>& valid_indices() const
    {
        if (!m_dirty)
            return m_cachedValidIndices;

        m_cachedValidIndices.clear();
        m_cachedValidIndices.reserve(m_size);
        for (int32_t i = 0; i < slots(); ++i)
        {
            if (m_live[i])
                m_cachedValidIndices.push_back(i);
        }

        m_dirty = false;
        return m_cachedValidIndices;
    }

private:
    template<typename U>
    int32_t insert_impl(U&& element)
    {
        const int32_t index = slots();
        m_elements.push_back(std::forward<U>(element));
        m_live.push_back(true);
        ++m_size;
        m_dirty = true;
        return index;
    }

    std::vector<T>               m_elements;
    std::vector<bool>            m_live;
    mutable std::vector<int32_t> m_cachedValidIndices;
    mutable bool                 m_dirty = true;
    size_type                    m_size  = 0;
};

#endif // SLOT_LIST_HPP_INCLUDED
