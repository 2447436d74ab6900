#include "History.hpp"

// ------------------------------------------------------------

History::History(void* idata, bool* externalBusyPtr) :
    m_data(idata),
    m_externalBusy(externalBusyPtr)
{
}

History::~History()
{
    clear();
}

// ------------------------------------------------------------

void History::set_busy(bool busy) noexcept
{
    m_busyFlag = busy;
    if (m_externalBusy)
        *m_externalBusy = busy;
}

bool History::is_busy() const noexcept
{
    return m_busyFlag || (m_externalBusy && *m_externalBusy);
}

bool History::can_undo() const noexcept
{
    return m_index >= 0;
}

bool History::can_redo() const noexcept
{
    return (m_index + 1) < static_cast<int>(m_actions.size());
}

int History::size() const noexcept
{
    return static_cast<int>(m_actions.size());
}

const std::string& History::name() const noexcept
{
    return m_name;
}

void History::set_name(std::string_view name)
{
    m_name = name;
}

std::string_view History::undo_name() const noexcept
{
    if (!can_undo())
        return {};

    const auto* nested = dynamic_cast<const History*>(m_actions[m_index].get());
    return nested ? std::string_view{nested->name()} : std::string_view{};
}

// ------------------------------------------------------------

void History::insert(std::unique_ptr<History> new_history)
{
    insert(std::unique_ptr<HistoryAction>(std::move(new_history)));
}

void History::insert(std::unique_ptr<HistoryAction> new_action)
{
    assert(new_action && "History::insert received null action");
    assert(!is_busy() && "History::insert called while undoing/redoing");

    // Drop redo tail if user branches new edits
    while ((m_index + 1) < static_cast<int>(m_actions.size()))
        m_actions.pop_back();

    m_index = static_cast<int>(m_actions.size());
    m_actions.push_back(std::move(new_action));
}

void History::clear()
{
    m_actions.clear();
    m_index = -1;
}

// ------------------------------------------------------------

void History::undo()
{
    while (undo_step())
    {
    }
}

void History::redo()
{
    while (redo_step())
    {
    }
}

// ------------------------------------------------------------

bool History::undo_step()
{
    if (!can_undo())
        return false;

    set_busy(true);
    assert(m_index >= 0 && m_index < static_cast<int>(m_actions.size()));
    m_actions[m_index]->undo(m_data);
    --m_index;
    set_busy(false);
    return true;
}

bool History::redo_step()
{
    if (!can_redo())
        return false;

    set_busy(true);
    const int next = m_index + 1;
    assert(next >= 0 && next < static_cast<int>(m_actions.size()));
    m_actions[next]->redo(m_data);
    ++m_index;
    set_busy(false);
    return true;
}
