#pragma once

#include <QString>

#include "planner/data/TimeRange.hpp"

namespace planner {
namespace data {

// Free-form entry filed under a single date. No identity beyond its
// position in that date's list.
struct CalendarEvent
{
    QString title;
    QString description;
    QString location;
    TimeRange time;
    bool reminder = false;

    bool operator==(const CalendarEvent &other) const
    {
        return title == other.title && description == other.description && location == other.location
            && time == other.time && reminder == other.reminder;
    }
    bool operator!=(const CalendarEvent &other) const { return !(*this == other); }
};

} // namespace data
} // namespace planner
