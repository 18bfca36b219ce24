#pragma once

#include <QDate>
#include <QList>
#include <QMap>
#include <QSet>
#include <QVector>
#include <optional>

#include "planner/data/CalendarEvent.hpp"
#include "planner/data/TimeRange.hpp"

namespace planner {
namespace data {

// Training program: date range, weekday filter, per-weekday schedules,
// per-date overrides and events. Single source of truth for whether a
// date is selected. forceOn and forceOff never share a date.
class ProgramState
{
public:
    ProgramState();
    ~ProgramState();

    QDate start() const;
    QDate end() const;
    void setStart(const QDate &date);
    void setEnd(const QDate &date);

    bool hasRange() const;
    // Normalised anchors, invalid when no range is defined.
    QDate minDate() const;
    QDate maxDate() const;
    bool isInsideRange(const QDate &date) const;

    // Priority: forceOn, forceOff, range, weekday filter.
    bool isSelected(const QDate &date) const;

    void setRange(const QDate &first, const QDate &last);
    void beginRangeAt(const QDate &date);
    void closeRangeAt(const QDate &date);
    void adjustRangeWith(const QDate &date);

    void toggleException(const QDate &date);
    // pinnedDate is the caller-owned single outside-range pin, updated in place.
    void toggleOutsideSelection(const QDate &date, QDate &pinnedDate);
    void forceOn(const QDate &date);
    void forceOff(const QDate &date);
    bool isForcedOn(const QDate &date) const;
    bool isForcedOff(const QDate &date) const;
    QList<QDate> forcedOnDates() const;
    QList<QDate> forcedOffDates() const;

    void setTrainingDay(Qt::DayOfWeek day, bool enabled);
    bool isTrainingDay(Qt::DayOfWeek day) const;
    QList<Qt::DayOfWeek> trainingDays() const;

    void setSchedule(Qt::DayOfWeek day, const TimeRange &range);
    void clearSchedule(Qt::DayOfWeek day);
    std::optional<TimeRange> scheduleFor(Qt::DayOfWeek day) const;
    const QMap<Qt::DayOfWeek, TimeRange> &schedules() const;
    int scheduledMinutes(const QDate &date) const;

    bool addEvent(const QDate &date, CalendarEvent event);
    bool updateEvent(const QDate &date, int index, CalendarEvent event);
    bool removeEvent(const QDate &date, int index);
    void clearEvents(const QDate &date);
    void setEvents(const QDate &date, const QVector<CalendarEvent> &events);
    QVector<CalendarEvent> eventsOn(const QDate &date) const;
    const QMap<QDate, QVector<CalendarEvent>> &events() const;
    int eventCount() const;

    void copyFrom(const ProgramState &other);

    bool operator==(const ProgramState &other) const;
    bool operator!=(const ProgramState &other) const { return !(*this == other); }

private:
    static bool normalizeEvent(CalendarEvent &event);
    static void sortByStartTime(QVector<CalendarEvent> &events);

    QDate m_start;
    QDate m_end;
    QSet<Qt::DayOfWeek> m_trainingDays;
    QMap<Qt::DayOfWeek, TimeRange> m_timeByDay;
    QSet<QDate> m_forceOn;
    QSet<QDate> m_forceOff;
    QMap<QDate, QVector<CalendarEvent>> m_events;
};

} // namespace data
} // namespace planner
