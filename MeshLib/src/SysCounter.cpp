#include "SysCounter.hpp"

#include <algorithm>
#include <cassert>

void SysCounter::change()
{
    ++m_value;

    for (const SysCounterPtr& parent : m_parents)
    {
        if (parent)
            parent->change();
    }
}

void SysCounter::addParent(const SysCounterPtr& parent)
{
    assert(parent && "SysCounter::addParent called with null parent");

    if (std::find(m_parents.begin(), m_parents.end(), parent) != m_parents.end())
        return;

    m_parents.push_back(parent);
}

uint64_t SysCounter::value() const noexcept
{
    return m_value;
}

/// ---------------------------------------------
/// SysMonitor implementation
/// ---------------------------------------------

SysMonitor::SysMonitor(SysCounterPtr counter, bool startDirty) :
    m_counter{std::move(counter)},
    m_prevValue{0},
    m_dirty{startDirty}
{
    if (m_counter)
        m_prevValue = m_counter->value();
}

bool SysMonitor::changed() noexcept
{
    const bool result = peek();
    if (m_counter)
        m_prevValue = m_counter->value();
    m_dirty = false;
    return result;
}

bool SysMonitor::peek() const noexcept
{
    return m_dirty || (m_counter && m_counter->value() != m_prevValue);
}
