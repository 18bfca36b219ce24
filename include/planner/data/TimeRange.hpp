#pragma once

#include <QTime>

namespace planner {
namespace data {

// Time-of-day window. An end before the start spans past midnight.
struct TimeRange
{
    QTime start;
    QTime end;

    int minutes() const;
    bool endsNextDay() const;

    bool operator==(const TimeRange &other) const
    {
        return start == other.start && end == other.end;
    }
    bool operator!=(const TimeRange &other) const { return !(*this == other); }
};

} // namespace data
} // namespace planner
