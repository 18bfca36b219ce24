#pragma once

#include <QDate>
#include <QMap>
#include <QVector>

namespace planner {
namespace data {

struct YearMonth
{
    int year = 0;
    int month = 0;

    static YearMonth of(const QDate &date) { return {date.year(), date.month()}; }

    bool operator<(const YearMonth &other) const
    {
        return year != other.year ? year < other.year : month < other.month;
    }
    bool operator==(const YearMonth &other) const { return year == other.year && month == other.month; }
};

// Derived statistics of a program with a defined range.
struct ProgramSummary
{
    QDate start;
    QDate end;
    int selectedDays = 0;
    int totalMinutes = 0;
    qint64 weeksInRange = 0;
    int weeksWithTraining = 0;
    QMap<YearMonth, int> minutesByMonth;
    // Keyed by 1-based program week counted from start.
    QMap<int, int> minutesByWeek;
};

// One selected date with the minutes its weekday schedule contributes.
struct TrainingSession
{
    QDate date;
    Qt::DayOfWeek weekday = Qt::Monday;
    int minutes = 0;
    bool scheduled = false;
};

} // namespace data
} // namespace planner
