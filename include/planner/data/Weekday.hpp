#pragma once

#include <QDate>
#include <QString>
#include <array>
#include <optional>

namespace planner {
namespace data {

// Monday first, the order used everywhere a weekday list is emitted.
const std::array<Qt::DayOfWeek, 7> &allWeekdays();

Qt::DayOfWeek weekdayOf(const QDate &date);

// Upper-case English name as stored in program documents ("MONDAY").
QString weekdayName(Qt::DayOfWeek day);
std::optional<Qt::DayOfWeek> weekdayFromName(const QString &name);

// Abbreviated Spanish name used in exported session titles ("lun.").
QString weekdayShortLabel(Qt::DayOfWeek day);

} // namespace data
} // namespace planner
