#include "planner/core/AppSettings.hpp"

#include <QSettings>
#include <QtGlobal>

namespace planner {
namespace core {

namespace {
const QString TIME_ZONE_KEY = QStringLiteral("export/timeZone");
const QString PRODUCT_ID_KEY = QStringLiteral("export/productId");
const QString SESSION_TITLE_KEY = QStringLiteral("export/sessionTitle");
const QString REMINDER_KEY = QStringLiteral("export/reminderMinutes");
const QString HISTORY_LIMIT_KEY = QStringLiteral("session/historyLimit");
const QString LAST_PROGRAM_KEY = QStringLiteral("storage/lastProgram");

constexpr int DEFAULT_HISTORY_LIMIT = 100;
} // namespace

AppSettings::AppSettings(QSettings &settings)
    : m_settings(settings)
{
}

data::IcsExportOptions AppSettings::icsExportOptions() const
{
    data::IcsExportOptions options;
    options.timeZoneId = m_settings.value(TIME_ZONE_KEY, options.timeZoneId).toString();
    options.productId = m_settings.value(PRODUCT_ID_KEY, options.productId).toString();
    options.sessionTitle = m_settings.value(SESSION_TITLE_KEY, options.sessionTitle).toString();
    const int reminder = m_settings.value(REMINDER_KEY, options.reminderMinutes).toInt();
    if (reminder > 0) {
        options.reminderMinutes = reminder;
    }
    return options;
}

void AppSettings::setIcsExportOptions(const data::IcsExportOptions &options)
{
    m_settings.setValue(TIME_ZONE_KEY, options.timeZoneId);
    m_settings.setValue(PRODUCT_ID_KEY, options.productId);
    m_settings.setValue(SESSION_TITLE_KEY, options.sessionTitle);
    m_settings.setValue(REMINDER_KEY, options.reminderMinutes);
}

std::size_t AppSettings::historyLimit() const
{
    const int stored = m_settings.value(HISTORY_LIMIT_KEY, DEFAULT_HISTORY_LIMIT).toInt();
    return static_cast<std::size_t>(qBound(1, stored, 10000));
}

void AppSettings::setHistoryLimit(std::size_t limit)
{
    m_settings.setValue(HISTORY_LIMIT_KEY, static_cast<int>(limit));
}

QString AppSettings::lastProgramPath() const
{
    return m_settings.value(LAST_PROGRAM_KEY).toString();
}

void AppSettings::setLastProgramPath(const QString &filePath)
{
    m_settings.setValue(LAST_PROGRAM_KEY, filePath);
}

} // namespace core
} // namespace planner
