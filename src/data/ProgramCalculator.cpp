#include "planner/data/ProgramCalculator.hpp"

#include "planner/data/ProgramState.hpp"
#include "planner/data/Weekday.hpp"

#include <QSet>

namespace planner {
namespace data {

std::optional<ProgramSummary> ProgramCalculator::calculate(const ProgramState &state) const
{
    if (!state.hasRange()) {
        return std::nullopt;
    }

    ProgramSummary summary;
    summary.start = state.minDate();
    summary.end = state.maxDate();

    QSet<int> weeksWithAny;
    for (const TrainingSession &session : selectedSessions(state)) {
        ++summary.selectedDays;
        summary.totalMinutes += session.minutes;
        summary.minutesByMonth[YearMonth::of(session.date)] += session.minutes;

        const int week = weekOfProgram(summary.start, session.date);
        weeksWithAny.insert(week);
        summary.minutesByWeek[week] += session.minutes;
    }

    summary.weeksInRange = weeksBetween(summary.start, summary.end);
    summary.weeksWithTraining = weeksWithAny.size();
    return summary;
}

QVector<TrainingSession> ProgramCalculator::selectedSessions(const ProgramState &state) const
{
    QVector<TrainingSession> sessions;
    if (!state.hasRange()) {
        return sessions;
    }

    const QDate last = state.maxDate();
    for (QDate date = state.minDate(); date <= last; date = date.addDays(1)) {
        if (!state.isSelected(date)) {
            continue;
        }
        TrainingSession session;
        session.date = date;
        session.weekday = weekdayOf(date);
        const auto range = state.scheduleFor(session.weekday);
        session.scheduled = range.has_value();
        session.minutes = range ? range->minutes() : 0;
        sessions.append(session);
    }
    return sessions;
}

int ProgramCalculator::weekOfProgram(const QDate &start, const QDate &date)
{
    return static_cast<int>(start.daysTo(date) / 7) + 1;
}

qint64 ProgramCalculator::weeksBetween(const QDate &first, const QDate &last)
{
    const qint64 days = first.daysTo(last) + 1;
    return (days + 6) / 7;
}

} // namespace data
} // namespace planner
