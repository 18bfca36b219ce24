#include "planner/data/Weekday.hpp"

#include <QLocale>

namespace planner {
namespace data {

namespace {
constexpr std::array<const char *, 7> WEEKDAY_NAMES = {
    "MONDAY", "TUESDAY", "WEDNESDAY", "THURSDAY", "FRIDAY", "SATURDAY", "SUNDAY",
};
} // namespace

const std::array<Qt::DayOfWeek, 7> &allWeekdays()
{
    static const std::array<Qt::DayOfWeek, 7> days = {
        Qt::Monday, Qt::Tuesday, Qt::Wednesday, Qt::Thursday, Qt::Friday, Qt::Saturday, Qt::Sunday,
    };
    return days;
}

Qt::DayOfWeek weekdayOf(const QDate &date)
{
    return static_cast<Qt::DayOfWeek>(date.dayOfWeek());
}

QString weekdayName(Qt::DayOfWeek day)
{
    return QString::fromLatin1(WEEKDAY_NAMES[static_cast<std::size_t>(day) - 1]);
}

std::optional<Qt::DayOfWeek> weekdayFromName(const QString &name)
{
    const QString normalized = name.trimmed().toUpper();
    for (std::size_t i = 0; i < WEEKDAY_NAMES.size(); ++i) {
        if (normalized == QLatin1String(WEEKDAY_NAMES[i])) {
            return allWeekdays()[i];
        }
    }
    return std::nullopt;
}

QString weekdayShortLabel(Qt::DayOfWeek day)
{
    static const QLocale spanish(QLocale::Spanish, QLocale::Spain);
    return spanish.dayName(day, QLocale::ShortFormat);
}

} // namespace data
} // namespace planner
