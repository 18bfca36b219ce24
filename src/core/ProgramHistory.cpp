#include "planner/core/ProgramHistory.hpp"

namespace planner {
namespace core {

ProgramHistory::ProgramHistory(std::size_t limit)
    : m_limit(limit > 0 ? limit : 1)
{
}

ProgramHistory::~ProgramHistory() = default;

void ProgramHistory::record(QString label, data::ProgramState before, data::ProgramState after)
{
    // Drop redoable entries past the current index.
    if (m_index < m_entries.size()) {
        m_entries.erase(m_entries.begin() + static_cast<long>(m_index), m_entries.end());
    }

    if (m_entries.size() == m_limit) {
        m_entries.erase(m_entries.begin());
        if (m_index > 0) {
            --m_index;
        }
    }

    m_entries.push_back(Entry{std::move(label), std::move(before), std::move(after)});
    m_index = m_entries.size();
}

bool ProgramHistory::canUndo() const
{
    return m_index > 0;
}

bool ProgramHistory::canRedo() const
{
    return m_index < m_entries.size();
}

QString ProgramHistory::undo(data::ProgramState &target)
{
    if (!canUndo()) {
        return {};
    }
    const Entry &entry = m_entries[m_index - 1];
    target.copyFrom(entry.before);
    --m_index;
    return entry.label;
}

QString ProgramHistory::redo(data::ProgramState &target)
{
    if (!canRedo()) {
        return {};
    }
    const Entry &entry = m_entries[m_index];
    target.copyFrom(entry.after);
    ++m_index;
    return entry.label;
}

void ProgramHistory::clear()
{
    m_entries.clear();
    m_index = 0;
}

std::size_t ProgramHistory::count() const
{
    return m_entries.size();
}

std::size_t ProgramHistory::limit() const
{
    return m_limit;
}

} // namespace core
} // namespace planner
