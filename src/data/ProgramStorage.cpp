#include "planner/data/ProgramStorage.hpp"

#include "planner/core/Logging.hpp"
#include "planner/data/Weekday.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QObject>
#include <QSaveFile>
#include <QTextStream>

namespace planner {
namespace data {

namespace {
constexpr auto KEY_START = "start";
constexpr auto KEY_END = "end";
constexpr auto KEY_TRAINING_DAYS = "trainingDays";
constexpr auto KEY_TIME_BY_DAY = "timeByDay";
constexpr auto KEY_FORCE_ON = "forceOn";
constexpr auto KEY_FORCE_OFF = "forceOff";
constexpr auto KEY_EVENTS = "events";
constexpr auto KEY_TOTALS = "totals";

void setError(QString *errorMessage, const QString &message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
}

QJsonValue encodeOptionalDate(const QDate &date)
{
    if (!date.isValid()) {
        return QJsonValue(QJsonValue::Null);
    }
    return ProgramStorage::formatDate(date);
}

QDate decodeOptionalDate(const QJsonObject &root, const char *key)
{
    const QJsonValue value = root.value(QLatin1String(key));
    if (value.isNull() || value.isUndefined()) {
        return {};
    }
    const QDate date = ProgramStorage::parseDate(value.toString());
    if (!date.isValid()) {
        qCWarning(lcPlannerStorage) << "Ignoring malformed" << key << "date" << value;
    }
    return date;
}

QJsonArray encodeDates(const QList<QDate> &dates)
{
    QJsonArray array;
    for (const QDate &date : dates) {
        array.append(ProgramStorage::formatDate(date));
    }
    return array;
}

QList<QDate> decodeDates(const QJsonObject &root, const char *key)
{
    QList<QDate> dates;
    const QJsonArray array = root.value(QLatin1String(key)).toArray();
    for (const QJsonValue &value : array) {
        const QDate date = ProgramStorage::parseDate(value.toString());
        if (!date.isValid()) {
            qCWarning(lcPlannerStorage) << "Skipping malformed" << key << "entry" << value;
            continue;
        }
        dates.append(date);
    }
    return dates;
}

QJsonObject encodeSummary(const ProgramSummary &summary)
{
    QJsonObject totals;
    totals.insert(QStringLiteral("start"), ProgramStorage::formatDate(summary.start));
    totals.insert(QStringLiteral("end"), ProgramStorage::formatDate(summary.end));
    totals.insert(QStringLiteral("weeksInRange"), summary.weeksInRange);
    totals.insert(QStringLiteral("weeksWithTraining"), summary.weeksWithTraining);
    totals.insert(QStringLiteral("selectedDays"), summary.selectedDays);
    totals.insert(QStringLiteral("totalMinutes"), summary.totalMinutes);
    return totals;
}
} // namespace

ProgramStorage::ProgramStorage() = default;
ProgramStorage::~ProgramStorage() = default;

QByteArray ProgramStorage::toJson(const ProgramState &state, const std::optional<ProgramSummary> &summary) const
{
    QJsonObject root;
    root.insert(QLatin1String(KEY_START), encodeOptionalDate(state.start()));
    root.insert(QLatin1String(KEY_END), encodeOptionalDate(state.end()));

    QJsonArray trainingDays;
    for (Qt::DayOfWeek day : state.trainingDays()) {
        trainingDays.append(weekdayName(day));
    }
    root.insert(QLatin1String(KEY_TRAINING_DAYS), trainingDays);

    QJsonObject timeByDay;
    const auto &schedules = state.schedules();
    for (auto it = schedules.constBegin(); it != schedules.constEnd(); ++it) {
        timeByDay.insert(weekdayName(it.key()), encodeTimeRange(it.value()));
    }
    root.insert(QLatin1String(KEY_TIME_BY_DAY), timeByDay);

    root.insert(QLatin1String(KEY_FORCE_ON), encodeDates(state.forcedOnDates()));
    root.insert(QLatin1String(KEY_FORCE_OFF), encodeDates(state.forcedOffDates()));

    QJsonObject events;
    const auto &eventMap = state.events();
    for (auto it = eventMap.constBegin(); it != eventMap.constEnd(); ++it) {
        QJsonArray list;
        for (const CalendarEvent &event : it.value()) {
            QJsonObject entry;
            entry.insert(QStringLiteral("title"), event.title);
            entry.insert(QStringLiteral("description"), event.description);
            entry.insert(QStringLiteral("location"), event.location);
            entry.insert(QStringLiteral("time"), encodeTimeRange(event.time));
            entry.insert(QStringLiteral("reminder"), event.reminder);
            list.append(entry);
        }
        events.insert(formatDate(it.key()), list);
    }
    root.insert(QLatin1String(KEY_EVENTS), events);

    if (summary) {
        root.insert(QLatin1String(KEY_TOTALS), encodeSummary(*summary));
    }

    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

std::optional<ProgramState> ProgramStorage::fromJson(const QByteArray &json, QString *errorMessage) const
{
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setError(errorMessage, QObject::tr("Documento JSON no válido: %1").arg(parseError.errorString()));
        return std::nullopt;
    }
    if (!document.isObject()) {
        setError(errorMessage, QObject::tr("El documento no contiene un programa."));
        return std::nullopt;
    }

    const QJsonObject root = document.object();
    ProgramState state;
    state.setRange(decodeOptionalDate(root, KEY_START), decodeOptionalDate(root, KEY_END));

    const QJsonArray trainingDays = root.value(QLatin1String(KEY_TRAINING_DAYS)).toArray();
    for (const QJsonValue &value : trainingDays) {
        const auto day = weekdayFromName(value.toString());
        if (!day) {
            qCWarning(lcPlannerStorage) << "Skipping unknown training day" << value;
            continue;
        }
        state.setTrainingDay(*day, true);
    }

    const QJsonObject timeByDay = root.value(QLatin1String(KEY_TIME_BY_DAY)).toObject();
    for (auto it = timeByDay.constBegin(); it != timeByDay.constEnd(); ++it) {
        const auto day = weekdayFromName(it.key());
        const auto range = decodeTimeRange(it.value().toObject());
        if (!day || !range) {
            qCWarning(lcPlannerStorage) << "Skipping malformed schedule for" << it.key();
            continue;
        }
        state.setSchedule(*day, *range);
    }

    // forceOff first so a date listed twice ends up forced on, as isSelected would read it.
    for (const QDate &date : decodeDates(root, KEY_FORCE_OFF)) {
        state.forceOff(date);
    }
    for (const QDate &date : decodeDates(root, KEY_FORCE_ON)) {
        state.forceOn(date);
    }

    const QJsonObject events = root.value(QLatin1String(KEY_EVENTS)).toObject();
    for (auto it = events.constBegin(); it != events.constEnd(); ++it) {
        const QDate date = parseDate(it.key());
        if (!date.isValid()) {
            qCWarning(lcPlannerStorage) << "Skipping events filed under malformed date" << it.key();
            continue;
        }
        QVector<CalendarEvent> list;
        const QJsonArray entries = it.value().toArray();
        for (const QJsonValue &value : entries) {
            const QJsonObject entry = value.toObject();
            CalendarEvent event;
            event.title = entry.value(QStringLiteral("title")).toString();
            event.description = entry.value(QStringLiteral("description")).toString();
            event.location = entry.value(QStringLiteral("location")).toString();
            event.reminder = entry.value(QStringLiteral("reminder")).toBool();
            const QJsonValue time = entry.value(QStringLiteral("time"));
            if (time.isNull() || time.isUndefined()) {
                event.time = TimeRange{QTime(0, 0), QTime(0, 0)};
            } else {
                const auto range = decodeTimeRange(time.toObject());
                if (!range) {
                    qCWarning(lcPlannerStorage) << "Skipping event with malformed time on" << it.key();
                    continue;
                }
                event.time = *range;
            }
            list.append(event);
        }
        state.setEvents(date, list);
    }

    return state;
}

std::optional<QString> ProgramStorage::toCsv(const ProgramState &state, QString *errorMessage) const
{
    const auto summary = m_calculator.calculate(state);
    if (!summary) {
        setError(errorMessage, QObject::tr("No hay rango para exportar CSV."));
        return std::nullopt;
    }

    QString csv;
    QTextStream stream(&csv);
    stream << "fecha,dow,minutos\n";
    for (const TrainingSession &session : m_calculator.selectedSessions(state)) {
        stream << formatDate(session.date) << ',' << weekdayName(session.weekday) << ',' << session.minutes << '\n';
    }

    stream << "\nresumen,valor\n";
    stream << "semanas_del_rango," << summary->weeksInRange << '\n';
    stream << "semanas_con_entrenamiento," << summary->weeksWithTraining << '\n';
    stream << "dias_seleccionados," << summary->selectedDays << '\n';
    stream << "minutos_totales," << summary->totalMinutes << '\n';
    stream.flush();
    return csv;
}

bool ProgramStorage::saveJson(const ProgramState &state, const QString &filePath, QString *errorMessage) const
{
    const auto summary = m_calculator.calculate(state);
    const QByteArray json = toJson(state, summary);
    if (!writeTextFile(filePath, QString::fromUtf8(json), errorMessage)) {
        return false;
    }
    qCInfo(lcPlannerStorage) << "Saved program to" << filePath << "with" << (summary ? summary->selectedDays : 0)
                             << "selected days and" << state.eventCount() << "events";
    return true;
}

std::optional<ProgramState> ProgramStorage::loadJson(const QString &filePath, QString *errorMessage) const
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        setError(errorMessage, file.errorString());
        qCWarning(lcPlannerStorage) << "Cannot open" << filePath << file.errorString();
        return std::nullopt;
    }
    QString parseMessage;
    auto state = fromJson(file.readAll(), &parseMessage);
    if (!state) {
        qCWarning(lcPlannerStorage) << "Cannot load" << filePath << parseMessage;
        setError(errorMessage, parseMessage);
        return std::nullopt;
    }
    qCInfo(lcPlannerStorage) << "Loaded program from" << filePath << "with" << state->eventCount() << "events";
    return state;
}

bool ProgramStorage::saveCsv(const ProgramState &state, const QString &filePath, QString *errorMessage) const
{
    const auto csv = toCsv(state, errorMessage);
    if (!csv) {
        qCWarning(lcPlannerStorage) << "CSV export refused: no range defined";
        return false;
    }
    if (!writeTextFile(filePath, *csv, errorMessage)) {
        return false;
    }
    qCInfo(lcPlannerStorage) << "Saved summary table to" << filePath << "with"
                             << m_calculator.selectedSessions(state).size() << "selected days";
    return true;
}

QString ProgramStorage::formatDate(const QDate &date)
{
    return date.toString(Qt::ISODate);
}

QDate ProgramStorage::parseDate(const QString &value)
{
    return QDate::fromString(value.trimmed(), Qt::ISODate);
}

QString ProgramStorage::formatTime(const QTime &time)
{
    if (time.msec() != 0) {
        return time.toString(QStringLiteral("HH:mm:ss.zzz"));
    }
    if (time.second() != 0) {
        return time.toString(QStringLiteral("HH:mm:ss"));
    }
    return time.toString(QStringLiteral("HH:mm"));
}

QTime ProgramStorage::parseTime(const QString &value)
{
    const QString trimmed = value.trimmed();
    for (const auto *format : {"HH:mm", "HH:mm:ss", "HH:mm:ss.zzz"}) {
        const QTime time = QTime::fromString(trimmed, QLatin1String(format));
        if (time.isValid()) {
            return time;
        }
    }
    return {};
}

QJsonObject ProgramStorage::encodeTimeRange(const TimeRange &range)
{
    QJsonObject object;
    object.insert(QStringLiteral("start"), formatTime(range.start));
    object.insert(QStringLiteral("end"), formatTime(range.end));
    return object;
}

std::optional<TimeRange> ProgramStorage::decodeTimeRange(const QJsonObject &object)
{
    const QTime start = parseTime(object.value(QStringLiteral("start")).toString());
    const QTime end = parseTime(object.value(QStringLiteral("end")).toString());
    if (!start.isValid() || !end.isValid()) {
        return std::nullopt;
    }
    return TimeRange{start, end};
}

bool writeTextFile(const QString &filePath, const QString &content, QString *errorMessage)
{
    if (filePath.isEmpty()) {
        setError(errorMessage, QObject::tr("No se indicó un archivo de destino."));
        return false;
    }

    QFileInfo info(filePath);
    QDir dir = info.dir();
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        setError(errorMessage, file.errorString());
        qCWarning(lcPlannerStorage) << "Cannot write" << filePath << file.errorString();
        return false;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    stream << content;
    stream.flush();
    if (!file.commit()) {
        setError(errorMessage, file.errorString());
        qCWarning(lcPlannerStorage) << "Cannot commit" << filePath << file.errorString();
        return false;
    }
    return true;
}

QString withSuffix(const QString &filePath, const QString &suffix)
{
    const QString dotted = QLatin1Char('.') + suffix;
    if (filePath.endsWith(dotted, Qt::CaseInsensitive)) {
        return filePath;
    }
    return filePath + dotted;
}

} // namespace data
} // namespace planner
