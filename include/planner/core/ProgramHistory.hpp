#pragma once

#include <QString>
#include <cstddef>
#include <vector>

#include "planner/data/ProgramState.hpp"

namespace planner {
namespace core {

// Bounded undo/redo history of whole-state snapshots.
class ProgramHistory
{
public:
    explicit ProgramHistory(std::size_t limit = 100);
    ~ProgramHistory();

    void record(QString label, data::ProgramState before, data::ProgramState after);
    bool canUndo() const;
    bool canRedo() const;
    // Both restore into target and return the label of the change, or an empty string.
    QString undo(data::ProgramState &target);
    QString redo(data::ProgramState &target);
    void clear();
    std::size_t count() const;
    std::size_t limit() const;

private:
    struct Entry
    {
        QString label;
        data::ProgramState before;
        data::ProgramState after;
    };

    std::vector<Entry> m_entries;
    std::size_t m_index = 0;
    std::size_t m_limit = 0;
};

} // namespace core
} // namespace planner
