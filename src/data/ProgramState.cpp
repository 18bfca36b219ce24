#include "planner/data/ProgramState.hpp"

#include "planner/data/Weekday.hpp"

#include <algorithm>

namespace planner {
namespace data {

namespace {
QList<QDate> sortedDates(const QSet<QDate> &dates)
{
    QList<QDate> list = dates.values();
    std::sort(list.begin(), list.end());
    return list;
}
} // namespace

ProgramState::ProgramState() = default;
ProgramState::~ProgramState() = default;

QDate ProgramState::start() const
{
    return m_start;
}

QDate ProgramState::end() const
{
    return m_end;
}

void ProgramState::setStart(const QDate &date)
{
    m_start = date;
}

void ProgramState::setEnd(const QDate &date)
{
    m_end = date;
}

bool ProgramState::hasRange() const
{
    return m_start.isValid() && m_end.isValid();
}

QDate ProgramState::minDate() const
{
    if (!hasRange()) {
        return {};
    }
    return std::min(m_start, m_end);
}

QDate ProgramState::maxDate() const
{
    if (!hasRange()) {
        return {};
    }
    return std::max(m_start, m_end);
}

bool ProgramState::isInsideRange(const QDate &date) const
{
    if (!hasRange() || !date.isValid()) {
        return false;
    }
    return date >= minDate() && date <= maxDate();
}

bool ProgramState::isSelected(const QDate &date) const
{
    if (m_forceOn.contains(date)) {
        return true;
    }
    if (m_forceOff.contains(date)) {
        return false;
    }
    if (!isInsideRange(date)) {
        return false;
    }
    if (m_trainingDays.isEmpty()) {
        return true;
    }
    return m_trainingDays.contains(weekdayOf(date));
}

void ProgramState::setRange(const QDate &first, const QDate &last)
{
    m_start = first;
    m_end = last;
}

void ProgramState::beginRangeAt(const QDate &date)
{
    m_start = date;
    m_end = QDate();
}

void ProgramState::closeRangeAt(const QDate &date)
{
    if (!m_start.isValid()) {
        beginRangeAt(date);
        return;
    }
    if (date < m_start) {
        m_end = m_start;
        m_start = date;
    } else {
        m_end = date;
    }
}

void ProgramState::adjustRangeWith(const QDate &date)
{
    if (!m_start.isValid()) {
        beginRangeAt(date);
        return;
    }
    if (!m_end.isValid()) {
        closeRangeAt(date);
        return;
    }
    // Full range: re-anchor with the same before/after rule.
    if (date < m_start) {
        m_end = m_start;
        m_start = date;
    } else {
        m_end = date;
    }
}

void ProgramState::toggleException(const QDate &date)
{
    if (isSelected(date)) {
        forceOff(date);
    } else {
        forceOn(date);
    }
}

void ProgramState::toggleOutsideSelection(const QDate &date, QDate &pinnedDate)
{
    if (isInsideRange(date)) {
        return;
    }

    if (pinnedDate.isValid() && pinnedDate != date && !isInsideRange(pinnedDate)) {
        m_forceOn.remove(pinnedDate);
        pinnedDate = QDate();
    }

    if (m_forceOn.contains(date)) {
        m_forceOn.remove(date);
        if (pinnedDate == date) {
            pinnedDate = QDate();
        }
    } else {
        forceOn(date);
        pinnedDate = date;
    }
}

void ProgramState::forceOn(const QDate &date)
{
    if (!date.isValid()) {
        return;
    }
    m_forceOff.remove(date);
    m_forceOn.insert(date);
}

void ProgramState::forceOff(const QDate &date)
{
    if (!date.isValid()) {
        return;
    }
    m_forceOn.remove(date);
    m_forceOff.insert(date);
}

bool ProgramState::isForcedOn(const QDate &date) const
{
    return m_forceOn.contains(date);
}

bool ProgramState::isForcedOff(const QDate &date) const
{
    return m_forceOff.contains(date);
}

QList<QDate> ProgramState::forcedOnDates() const
{
    return sortedDates(m_forceOn);
}

QList<QDate> ProgramState::forcedOffDates() const
{
    return sortedDates(m_forceOff);
}

void ProgramState::setTrainingDay(Qt::DayOfWeek day, bool enabled)
{
    if (enabled) {
        m_trainingDays.insert(day);
    } else {
        m_trainingDays.remove(day);
    }
}

bool ProgramState::isTrainingDay(Qt::DayOfWeek day) const
{
    return m_trainingDays.contains(day);
}

QList<Qt::DayOfWeek> ProgramState::trainingDays() const
{
    QList<Qt::DayOfWeek> days;
    for (Qt::DayOfWeek day : allWeekdays()) {
        if (m_trainingDays.contains(day)) {
            days.append(day);
        }
    }
    return days;
}

void ProgramState::setSchedule(Qt::DayOfWeek day, const TimeRange &range)
{
    m_timeByDay.insert(day, range);
}

void ProgramState::clearSchedule(Qt::DayOfWeek day)
{
    m_timeByDay.remove(day);
}

std::optional<TimeRange> ProgramState::scheduleFor(Qt::DayOfWeek day) const
{
    const auto it = m_timeByDay.constFind(day);
    if (it == m_timeByDay.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

const QMap<Qt::DayOfWeek, TimeRange> &ProgramState::schedules() const
{
    return m_timeByDay;
}

int ProgramState::scheduledMinutes(const QDate &date) const
{
    const auto range = scheduleFor(weekdayOf(date));
    return range ? range->minutes() : 0;
}

bool ProgramState::addEvent(const QDate &date, CalendarEvent event)
{
    if (!date.isValid() || !normalizeEvent(event)) {
        return false;
    }
    auto &list = m_events[date];
    list.append(std::move(event));
    sortByStartTime(list);
    return true;
}

bool ProgramState::updateEvent(const QDate &date, int index, CalendarEvent event)
{
    auto it = m_events.find(date);
    if (it == m_events.end() || index < 0 || index >= it->size()) {
        return false;
    }
    if (!normalizeEvent(event)) {
        return false;
    }
    (*it)[index] = std::move(event);
    sortByStartTime(*it);
    return true;
}

bool ProgramState::removeEvent(const QDate &date, int index)
{
    auto it = m_events.find(date);
    if (it == m_events.end() || index < 0 || index >= it->size()) {
        return false;
    }
    it->removeAt(index);
    if (it->isEmpty()) {
        m_events.erase(it);
    }
    return true;
}

void ProgramState::clearEvents(const QDate &date)
{
    m_events.remove(date);
}

void ProgramState::setEvents(const QDate &date, const QVector<CalendarEvent> &events)
{
    if (!date.isValid()) {
        return;
    }
    if (events.isEmpty()) {
        m_events.remove(date);
        return;
    }
    m_events.insert(date, events);
}

QVector<CalendarEvent> ProgramState::eventsOn(const QDate &date) const
{
    return m_events.value(date);
}

const QMap<QDate, QVector<CalendarEvent>> &ProgramState::events() const
{
    return m_events;
}

int ProgramState::eventCount() const
{
    int count = 0;
    for (const auto &list : m_events) {
        count += list.size();
    }
    return count;
}

void ProgramState::copyFrom(const ProgramState &other)
{
    if (this == &other) {
        return;
    }
    m_start = other.m_start;
    m_end = other.m_end;
    m_trainingDays = other.m_trainingDays;
    m_timeByDay = other.m_timeByDay;
    m_forceOn = other.m_forceOn;
    m_forceOff = other.m_forceOff;
    m_events = other.m_events;
}

bool ProgramState::operator==(const ProgramState &other) const
{
    return m_start == other.m_start && m_end == other.m_end && m_trainingDays == other.m_trainingDays
        && m_timeByDay == other.m_timeByDay && m_forceOn == other.m_forceOn && m_forceOff == other.m_forceOff
        && m_events == other.m_events;
}

bool ProgramState::normalizeEvent(CalendarEvent &event)
{
    event.title = event.title.trimmed();
    event.description = event.description.trimmed();
    event.location = event.location.trimmed();
    return !event.title.isEmpty();
}

void ProgramState::sortByStartTime(QVector<CalendarEvent> &events)
{
    std::stable_sort(events.begin(), events.end(), [](const CalendarEvent &lhs, const CalendarEvent &rhs) {
        return lhs.time.start < rhs.time.start;
    });
}

} // namespace data
} // namespace planner
