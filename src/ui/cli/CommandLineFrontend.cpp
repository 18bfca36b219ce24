#include "planner/ui/cli/CommandLineFrontend.hpp"

#include "planner/core/AppSettings.hpp"
#include "planner/core/Logging.hpp"
#include "planner/core/ProgramSession.hpp"
#include "planner/data/ProgramStorage.hpp"
#include "planner/data/Weekday.hpp"
#include "planner/ui/viewmodels/ProgramSummaryViewModel.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QSettings>
#include <QTextStream>
#include <memory>

namespace planner {
namespace ui {

namespace {
const QString OPT_RANGE = QStringLiteral("range");
const QString OPT_BEGIN = QStringLiteral("begin");
const QString OPT_CLOSE = QStringLiteral("close");
const QString OPT_EXTEND = QStringLiteral("extend");
const QString OPT_DAYS = QStringLiteral("days");
const QString OPT_DROP_DAY = QStringLiteral("drop-day");
const QString OPT_SCHEDULE = QStringLiteral("schedule");
const QString OPT_FORCE_ON = QStringLiteral("force-on");
const QString OPT_FORCE_OFF = QStringLiteral("force-off");
const QString OPT_TOGGLE = QStringLiteral("toggle");
const QString OPT_PICK = QStringLiteral("pick");
const QString OPT_EVENT = QStringLiteral("event");
const QString OPT_REMIND = QStringLiteral("remind");
const QString OPT_SAVE = QStringLiteral("save");
const QString OPT_CSV = QStringLiteral("csv");
const QString OPT_ICS = QStringLiteral("ics");
const QString OPT_SUMMARY = QStringLiteral("summary");
const QString OPT_CONFIG = QStringLiteral("config");
const QString OPT_VERBOSE = QStringLiteral("verbose");

void addOptions(QCommandLineParser &parser)
{
    parser.setApplicationDescription(QObject::tr("Planificador de programas de entrenamiento."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("program"), QObject::tr("Programa JSON a cargar."),
                                 QStringLiteral("[program.json]"));
    parser.addOptions({
        {OPT_RANGE, QObject::tr("Define el rango completo."), QStringLiteral("inicio..fin")},
        {OPT_BEGIN, QObject::tr("Comienza el rango en la fecha."), QStringLiteral("fecha")},
        {OPT_CLOSE, QObject::tr("Termina el rango en la fecha."), QStringLiteral("fecha")},
        {OPT_EXTEND, QObject::tr("Ajusta el rango hasta la fecha."), QStringLiteral("fecha")},
        {OPT_DAYS, QObject::tr("Activa días de entrenamiento (MONDAY,...)."), QStringLiteral("días")},
        {OPT_DROP_DAY, QObject::tr("Desactiva un día y su horario."), QStringLiteral("día")},
        {OPT_SCHEDULE, QObject::tr("Horario de un día."), QStringLiteral("DÍA=HH:MM-HH:MM")},
        {OPT_FORCE_ON, QObject::tr("Fuerza la selección de la fecha."), QStringLiteral("fecha")},
        {OPT_FORCE_OFF, QObject::tr("Fuerza la deselección de la fecha."), QStringLiteral("fecha")},
        {OPT_TOGGLE, QObject::tr("Alterna la excepción de la fecha."), QStringLiteral("fecha")},
        {OPT_PICK, QObject::tr("Selección única fuera del rango."), QStringLiteral("fecha")},
        {OPT_EVENT, QObject::tr("Agrega un evento."), QStringLiteral("fecha|HH:MM-HH:MM|título[|lugar[|descripción]]")},
        {OPT_REMIND, QObject::tr("Los eventos agregados llevan recordatorio.")},
        {OPT_SAVE, QObject::tr("Guarda el programa en JSON."), QStringLiteral("archivo")},
        {OPT_CSV, QObject::tr("Guarda la tabla resumen en CSV."), QStringLiteral("archivo")},
        {OPT_ICS, QObject::tr("Exporta el calendario iCalendar."), QStringLiteral("archivo")},
        {OPT_SUMMARY, QObject::tr("Muestra el resumen del programa.")},
        {OPT_CONFIG, QObject::tr("Archivo INI de configuración."), QStringLiteral("archivo")},
        {OPT_VERBOSE, QObject::tr("Mensajes de depuración.")},
    });
}
} // namespace

CommandLineFrontend::CommandLineFrontend(QTextStream &out, QTextStream &err)
    : m_out(out)
    , m_err(err)
{
}

int CommandLineFrontend::run(const QStringList &arguments)
{
    QCommandLineParser parser;
    addOptions(parser);
    if (!parser.parse(arguments)) {
        fail(parser.errorText());
        return 1;
    }
    if (parser.isSet(QStringLiteral("help"))) {
        m_out << parser.helpText();
        m_out.flush();
        return 0;
    }
    if (parser.isSet(QStringLiteral("version"))) {
        m_out << QCoreApplication::applicationName() << ' ' << QCoreApplication::applicationVersion() << '\n';
        m_out.flush();
        return 0;
    }
    if (parser.isSet(OPT_VERBOSE)) {
        QLoggingCategory::setFilterRules(QStringLiteral("planner.*.debug=true"));
    }

    std::unique_ptr<QSettings> settings;
    if (parser.isSet(OPT_CONFIG)) {
        settings = std::make_unique<QSettings>(parser.value(OPT_CONFIG), QSettings::IniFormat);
    } else {
        settings = std::make_unique<QSettings>();
    }
    core::AppSettings appSettings(*settings);

    core::ProgramSession session(appSettings.icsExportOptions(), appSettings.historyLimit());

    const QStringList positional = parser.positionalArguments();
    if (positional.size() > 1) {
        fail(QObject::tr("Solo se admite un programa a cargar."));
        return 1;
    }
    if (!positional.isEmpty()) {
        QString error;
        if (!session.load(positional.front(), &error)) {
            fail(QObject::tr("Error al cargar.\n%1").arg(error));
            return 1;
        }
        appSettings.setLastProgramPath(positional.front());
    }

    if (!applyEdits(session, parser)) {
        return 1;
    }

    if (parser.isSet(OPT_SUMMARY)) {
        ProgramSummaryViewModel viewModel(session);
        m_out << viewModel.toPlainText();
        m_out.flush();
    }

    QString error;
    if (parser.isSet(OPT_SAVE)) {
        const QString target = data::withSuffix(parser.value(OPT_SAVE), QStringLiteral("json"));
        if (!session.saveJson(target, &error)) {
            fail(QObject::tr("Error al guardar.\n%1").arg(error));
            return 1;
        }
        appSettings.setLastProgramPath(target);
    }
    if (parser.isSet(OPT_CSV) && !session.saveCsv(parser.value(OPT_CSV), &error)) {
        fail(QObject::tr("Error al guardar.\n%1").arg(error));
        return 1;
    }
    if (parser.isSet(OPT_ICS) && !session.exportIcs(parser.value(OPT_ICS), &error)) {
        fail(QObject::tr("Error al exportar.\n%1").arg(error));
        return 1;
    }

    settings->sync();
    return 0;
}

std::optional<data::TimeRange> CommandLineFrontend::parseTimeRange(const QString &value)
{
    const QStringList parts = value.split(QLatin1Char('-'));
    if (parts.size() != 2) {
        return std::nullopt;
    }
    const QTime start = data::ProgramStorage::parseTime(parts.at(0));
    const QTime end = data::ProgramStorage::parseTime(parts.at(1));
    if (!start.isValid() || !end.isValid()) {
        return std::nullopt;
    }
    return data::TimeRange{start, end};
}

std::optional<std::pair<QDate, QDate>> CommandLineFrontend::parseDateRange(const QString &value)
{
    const QStringList parts = value.split(QStringLiteral(".."));
    if (parts.size() != 2) {
        return std::nullopt;
    }
    const QDate first = data::ProgramStorage::parseDate(parts.at(0));
    const QDate last = data::ProgramStorage::parseDate(parts.at(1));
    if (!first.isValid() || !last.isValid()) {
        return std::nullopt;
    }
    return std::make_pair(first, last);
}

std::optional<std::pair<QDate, data::CalendarEvent>> CommandLineFrontend::parseEvent(const QString &value)
{
    const QStringList parts = value.split(QLatin1Char('|'));
    if (parts.size() < 3 || parts.size() > 5) {
        return std::nullopt;
    }
    const QDate date = data::ProgramStorage::parseDate(parts.at(0));
    const auto time = parseTimeRange(parts.at(1));
    if (!date.isValid() || !time) {
        return std::nullopt;
    }
    data::CalendarEvent event;
    event.time = *time;
    event.title = parts.at(2);
    event.location = parts.value(3);
    event.description = parts.value(4);
    return std::make_pair(date, event);
}

bool CommandLineFrontend::applyEdits(core::ProgramSession &session, const QCommandLineParser &parser)
{
    if (parser.isSet(OPT_RANGE)) {
        const auto range = parseDateRange(parser.value(OPT_RANGE));
        if (!range) {
            return fail(QObject::tr("Rango no válido: %1").arg(parser.value(OPT_RANGE)));
        }
        session.setRange(range->first, range->second);
    }
    if (!applyDates(parser.values(OPT_BEGIN), OPT_BEGIN, [&](const QDate &d) { session.beginRangeAt(d); })
        || !applyDates(parser.values(OPT_CLOSE), OPT_CLOSE, [&](const QDate &d) { session.closeRangeAt(d); })
        || !applyDates(parser.values(OPT_EXTEND), OPT_EXTEND, [&](const QDate &d) { session.adjustRangeWith(d); })) {
        return false;
    }

    for (const QString &list : parser.values(OPT_DAYS)) {
        for (const QString &name : list.split(QLatin1Char(','), Qt::SkipEmptyParts)) {
            const auto day = data::weekdayFromName(name);
            if (!day) {
                return fail(QObject::tr("Día no válido: %1").arg(name));
            }
            session.setTrainingDay(*day, true);
        }
    }
    for (const QString &name : parser.values(OPT_DROP_DAY)) {
        const auto day = data::weekdayFromName(name);
        if (!day) {
            return fail(QObject::tr("Día no válido: %1").arg(name));
        }
        session.setTrainingDay(*day, false);
    }
    for (const QString &value : parser.values(OPT_SCHEDULE)) {
        const int separator = value.indexOf(QLatin1Char('='));
        const auto day = data::weekdayFromName(value.left(separator));
        const auto range = separator > 0 ? parseTimeRange(value.mid(separator + 1)) : std::nullopt;
        if (separator <= 0 || !day || !range) {
            return fail(QObject::tr("Horario no válido: %1").arg(value));
        }
        session.setSchedule(*day, *range);
    }

    if (!applyDates(parser.values(OPT_FORCE_ON), OPT_FORCE_ON, [&](const QDate &d) { session.forceOn(d); })
        || !applyDates(parser.values(OPT_FORCE_OFF), OPT_FORCE_OFF, [&](const QDate &d) { session.forceOff(d); })
        || !applyDates(parser.values(OPT_TOGGLE), OPT_TOGGLE, [&](const QDate &d) { session.toggleException(d); })
        || !applyDates(parser.values(OPT_PICK), OPT_PICK,
                       [&](const QDate &d) { session.toggleOutsideSelection(d); })) {
        return false;
    }

    const bool remind = parser.isSet(OPT_REMIND);
    for (const QString &value : parser.values(OPT_EVENT)) {
        auto parsed = parseEvent(value);
        if (!parsed) {
            return fail(QObject::tr("Evento no válido: %1").arg(value));
        }
        parsed->second.reminder = remind;
        if (!session.addEvent(parsed->first, parsed->second)) {
            return fail(QObject::tr("El título es obligatorio."));
        }
    }
    return true;
}

bool CommandLineFrontend::applyDates(const QStringList &values, const QString &option,
                                     const std::function<void(const QDate &)> &apply)
{
    for (const QString &value : values) {
        const QDate date = data::ProgramStorage::parseDate(value);
        if (!date.isValid()) {
            return fail(QObject::tr("Fecha no válida para --%1: %2").arg(option, value));
        }
        apply(date);
    }
    return true;
}

bool CommandLineFrontend::fail(const QString &message)
{
    qCWarning(lcPlannerCli) << message;
    m_err << message << '\n';
    m_err.flush();
    return false;
}

} // namespace ui
} // namespace planner
