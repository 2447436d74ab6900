#ifndef SYS_COUNTER_HPP_INCLUDED
#define SYS_COUNTER_HPP_INCLUDED

#include <cstdint>
#include <memory>
#include <vector>

class SysCounter;
using SysCounterPtr = std::shared_ptr<SysCounter>;

/**
 * @brief Tracks changes using an internal version counter.
 *
 * Each call to `change()` increments the internal counter and propagates to
 * every parent counter, so a general "anything changed" counter can sit on
 * top of the topology/deform/select counters of a mesh.
 */
class SysCounter
{
public:
    SysCounter() = default;

    /// Increments the change counter and notifies all parent counters.
    void change();

    /// Adds a parent counter that will also be updated when this one changes.
    void addParent(const SysCounterPtr& parent);

    /// @return The internal version number.
    [[nodiscard]] uint64_t value() const noexcept;

private:
    std::vector<SysCounterPtr> m_parents;
    uint64_t                   m_value{0};
};

/**
 * @brief Monitors a SysCounter for modifications over time.
 *
 * A monitor is either created dirty (first changed() query reports true, the
 * usual choice for GPU/cache consumers) or clean (it only reports changes made
 * after construction, the choice for stale-state detection).
 */
class SysMonitor
{
public:
    SysMonitor() = default;

    /**
     * @param counter    The counter to monitor.
     * @param startDirty If true the first changed() query reports a change.
     */
    explicit SysMonitor(SysCounterPtr counter, bool startDirty = true);

    /// @return True if the counter changed since the last query (consumes the change).
    [[nodiscard]] bool changed() noexcept;

    /// @return True if the counter changed since the last query, without consuming it.
    [[nodiscard]] bool peek() const noexcept;

    /// @return True if this monitor watches a counter.
    [[nodiscard]] bool valid() const noexcept
    {
        return static_cast<bool>(m_counter);
    }

private:
    SysCounterPtr m_counter;
    uint64_t      m_prevValue{0};
    bool          m_dirty{false};
};

#endif // SYS_COUNTER_HPP_INCLUDED
