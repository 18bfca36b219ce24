#include "planner/data/IcsExporter.hpp"

#include "planner/core/Logging.hpp"
#include "planner/data/ProgramState.hpp"
#include "planner/data/ProgramStorage.hpp"
#include "planner/data/Weekday.hpp"

#include <QObject>
#include <QTextStream>
#include <QTimeZone>
#include <QUuid>

namespace planner {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyyMMdd";
constexpr auto TIME_FORMAT = "hhmmss";
constexpr auto UTC_FORMAT = "yyyyMMdd'T'hhmmss'Z'";
constexpr auto CRLF = "\r\n";

QString prepareUid(const QDate &date, const char *infix)
{
    return date.toString(QLatin1String(DATE_FORMAT)) + QLatin1String(infix)
        + QUuid::createUuid().toString(QUuid::WithoutBraces);
}
} // namespace

IcsExporter::IcsExporter(IcsExportOptions options)
    : m_options(std::move(options))
{
}

const IcsExportOptions &IcsExporter::options() const
{
    return m_options;
}

void IcsExporter::setOptions(IcsExportOptions options)
{
    m_options = std::move(options);
}

void IcsExporter::setTimestamp(const QDateTime &timestamp)
{
    m_timestamp = timestamp;
}

std::optional<QString> IcsExporter::render(const ProgramState &state, QString *errorMessage) const
{
    if (!state.hasRange()) {
        if (errorMessage) {
            *errorMessage = QObject::tr("No hay rango definido para exportar.");
        }
        return std::nullopt;
    }

    QString ics;
    QTextStream stream(&ics);

    stream << "BEGIN:VCALENDAR" << CRLF;
    stream << "PRODID:" << m_options.productId << CRLF;
    stream << "VERSION:2.0" << CRLF;
    stream << "CALSCALE:GREGORIAN" << CRLF;
    stream << "METHOD:PUBLISH" << CRLF;

    const QString stamp = formatUtc(m_timestamp.isValid() ? m_timestamp : QDateTime::currentDateTimeUtc());

    for (const TrainingSession &session : m_calculator.selectedSessions(state)) {
        if (!session.scheduled) {
            continue;
        }
        const TimeRange range = *state.scheduleFor(session.weekday);
        const QString summary = QStringLiteral("%1 (%2)").arg(m_options.sessionTitle, weekdayShortLabel(session.weekday));

        stream << "BEGIN:VEVENT" << CRLF;
        stream << "UID:" << prepareUid(session.date, "-") << CRLF;
        stream << "SUMMARY:" << escapeText(summary) << CRLF;
        stream << "DTSTAMP:" << stamp << CRLF;
        writeTimes(stream, session.date, range);
        stream << "END:VEVENT" << CRLF;
    }

    const auto &events = state.events();
    for (auto it = events.constBegin(); it != events.constEnd(); ++it) {
        for (const CalendarEvent &event : it.value()) {
            stream << "BEGIN:VEVENT" << CRLF;
            stream << "UID:" << prepareUid(it.key(), "-evt-") << CRLF;
            stream << "SUMMARY:" << escapeText(event.title) << CRLF;
            if (!event.description.trimmed().isEmpty()) {
                stream << "DESCRIPTION:" << escapeText(event.description) << CRLF;
            }
            if (!event.location.trimmed().isEmpty()) {
                stream << "LOCATION:" << escapeText(event.location) << CRLF;
            }
            stream << "DTSTAMP:" << stamp << CRLF;
            writeEvent(stream, it.key(), event);
            stream << "END:VEVENT" << CRLF;
        }
    }

    stream << "END:VCALENDAR" << CRLF;
    stream.flush();
    return ics;
}

bool IcsExporter::exportTo(const ProgramState &state, const QString &filePath, QString *errorMessage) const
{
    const auto ics = render(state, errorMessage);
    if (!ics) {
        qCWarning(lcPlannerExport) << "ICS export refused: no range defined";
        return false;
    }
    if (!writeTextFile(filePath, *ics, errorMessage)) {
        return false;
    }
    qCInfo(lcPlannerExport) << "Exported calendar to" << filePath << "with" << state.eventCount() << "custom events";
    return true;
}

QString IcsExporter::escapeText(const QString &text)
{
    QString encoded = text;
    encoded.replace('\\', QLatin1String("\\\\"));
    encoded.replace(QLatin1String("\r\n"), QLatin1String("\n"));
    encoded.replace('\r', '\n');
    encoded.replace('\n', QLatin1String("\\n"));
    encoded.replace(',', QLatin1String("\\,"));
    encoded.replace(';', QLatin1String("\\;"));
    return encoded;
}

QString IcsExporter::formatLocal(const QDate &date, const QTime &time)
{
    return date.toString(QLatin1String(DATE_FORMAT)) + QLatin1Char('T') + time.toString(QLatin1String(TIME_FORMAT));
}

QString IcsExporter::formatUtc(const QDateTime &dateTime)
{
    return dateTime.toUTC().toString(QLatin1String(UTC_FORMAT));
}

QString IcsExporter::timeZoneId() const
{
    if (!m_options.timeZoneId.isEmpty()) {
        return m_options.timeZoneId;
    }
    return QString::fromUtf8(QTimeZone::systemTimeZoneId());
}

void IcsExporter::writeTimes(QTextStream &stream, const QDate &date, const TimeRange &range) const
{
    // Wall-clock times tagged with TZID; no zone conversion happens here.
    const QDate endDate = range.endsNextDay() ? date.addDays(1) : date;
    const QString tzid = timeZoneId();
    stream << "DTSTART;TZID=" << tzid << ':' << formatLocal(date, range.start) << CRLF;
    stream << "DTEND;TZID=" << tzid << ':' << formatLocal(endDate, range.end) << CRLF;
}

void IcsExporter::writeEvent(QTextStream &stream, const QDate &date, const CalendarEvent &event) const
{
    writeTimes(stream, date, event.time);
    if (!event.reminder) {
        return;
    }
    const int minutes = m_options.reminderMinutes > 0 ? m_options.reminderMinutes : 10;
    stream << "BEGIN:VALARM" << CRLF;
    stream << "TRIGGER:-PT" << minutes << 'M' << CRLF;
    stream << "ACTION:DISPLAY" << CRLF;
    stream << "DESCRIPTION:" << escapeText(event.title) << CRLF;
    stream << "END:VALARM" << CRLF;
}

} // namespace data
} // namespace planner
