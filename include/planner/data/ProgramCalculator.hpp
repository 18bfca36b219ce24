#pragma once

#include <QVector>
#include <optional>

#include "planner/data/ProgramSummary.hpp"

namespace planner {
namespace data {

class ProgramState;

class ProgramCalculator
{
public:
    // Empty when the state has no range.
    std::optional<ProgramSummary> calculate(const ProgramState &state) const;

    // Selected dates of the range in chronological order.
    QVector<TrainingSession> selectedSessions(const ProgramState &state) const;

    static int weekOfProgram(const QDate &start, const QDate &date);
    static qint64 weeksBetween(const QDate &first, const QDate &last);
};

} // namespace data
} // namespace planner
