#include "planner/data/TimeRange.hpp"

#include <QtGlobal>

namespace planner {
namespace data {

namespace {
constexpr int SECONDS_PER_DAY = 24 * 60 * 60;
}

int TimeRange::minutes() const
{
    if (!start.isValid() || !end.isValid()) {
        return 0;
    }
    int seconds = start.secsTo(end);
    if (endsNextDay()) {
        seconds += SECONDS_PER_DAY;
    }
    return qMax(0, seconds / 60);
}

bool TimeRange::endsNextDay() const
{
    return end < start;
}

} // namespace data
} // namespace planner
