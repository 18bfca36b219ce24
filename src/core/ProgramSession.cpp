#include "planner/core/ProgramSession.hpp"

#include "planner/core/Logging.hpp"
#include "planner/data/Weekday.hpp"

namespace planner {
namespace core {

ProgramSession::ProgramSession(data::IcsExportOptions exportOptions, std::size_t historyLimit, QObject *parent)
    : QObject(parent)
    , m_history(historyLimit)
    , m_exporter(std::move(exportOptions))
{
}

ProgramSession::~ProgramSession() = default;

template <typename Mutation>
bool ProgramSession::apply(const QString &label, Mutation &&mutation)
{
    data::ProgramState before = m_state;
    mutation(m_state);
    if (m_state == before) {
        return false;
    }
    m_history.record(label, std::move(before), m_state);
    qCDebug(lcPlannerSession) << label;
    emit stateChanged();
    return true;
}

const data::ProgramState &ProgramSession::state() const
{
    return m_state;
}

QDate ProgramSession::pinnedOutsideDate() const
{
    return m_pinnedOutsideDate;
}

std::optional<data::ProgramSummary> ProgramSession::summary() const
{
    return m_calculator.calculate(m_state);
}

void ProgramSession::setRange(const QDate &first, const QDate &last)
{
    apply(tr("Definir rango"), [&](data::ProgramState &state) { state.setRange(first, last); });
}

void ProgramSession::beginRangeAt(const QDate &date)
{
    apply(tr("Comenzar rango"), [&](data::ProgramState &state) { state.beginRangeAt(date); });
}

void ProgramSession::closeRangeAt(const QDate &date)
{
    apply(tr("Terminar rango"), [&](data::ProgramState &state) { state.closeRangeAt(date); });
}

void ProgramSession::adjustRangeWith(const QDate &date)
{
    apply(tr("Ajustar rango"), [&](data::ProgramState &state) { state.adjustRangeWith(date); });
}

void ProgramSession::toggleException(const QDate &date)
{
    releasePin(date);
    apply(tr("Alternar excepción"), [&](data::ProgramState &state) { state.toggleException(date); });
}

void ProgramSession::toggleOutsideSelection(const QDate &date)
{
    const QDate previousPin = m_pinnedOutsideDate;
    apply(tr("Selección fuera de rango"), [&](data::ProgramState &state) {
        state.toggleOutsideSelection(date, m_pinnedOutsideDate);
    });
    if (previousPin != m_pinnedOutsideDate) {
        qCDebug(lcPlannerSession) << "Outside pin moved from" << previousPin << "to" << m_pinnedOutsideDate;
    }
}

void ProgramSession::forceOn(const QDate &date)
{
    releasePin(date);
    apply(tr("Seleccionar día"), [&](data::ProgramState &state) { state.forceOn(date); });
}

void ProgramSession::forceOff(const QDate &date)
{
    releasePin(date);
    apply(tr("Deseleccionar día"), [&](data::ProgramState &state) { state.forceOff(date); });
}

void ProgramSession::setTrainingDay(Qt::DayOfWeek day, bool enabled)
{
    apply(tr("Día de entrenamiento %1").arg(data::weekdayName(day)), [&](data::ProgramState &state) {
        state.setTrainingDay(day, enabled);
        if (!enabled) {
            state.clearSchedule(day);
        }
    });
}

void ProgramSession::setSchedule(Qt::DayOfWeek day, const data::TimeRange &range)
{
    apply(tr("Asignar horario %1").arg(data::weekdayName(day)),
          [&](data::ProgramState &state) { state.setSchedule(day, range); });
}

void ProgramSession::clearSchedule(Qt::DayOfWeek day)
{
    apply(tr("Quitar horario %1").arg(data::weekdayName(day)),
          [&](data::ProgramState &state) { state.clearSchedule(day); });
}

bool ProgramSession::addEvent(const QDate &date, const data::CalendarEvent &event)
{
    bool accepted = false;
    apply(tr("Agregar evento"), [&](data::ProgramState &state) { accepted = state.addEvent(date, event); });
    return accepted;
}

bool ProgramSession::updateEvent(const QDate &date, int index, const data::CalendarEvent &event)
{
    bool accepted = false;
    apply(tr("Editar evento"), [&](data::ProgramState &state) { accepted = state.updateEvent(date, index, event); });
    return accepted;
}

bool ProgramSession::removeEvent(const QDate &date, int index)
{
    bool removed = false;
    apply(tr("Eliminar evento"), [&](data::ProgramState &state) { removed = state.removeEvent(date, index); });
    return removed;
}

void ProgramSession::clearEvents(const QDate &date)
{
    apply(tr("Eliminar eventos del día"), [&](data::ProgramState &state) { state.clearEvents(date); });
}

void ProgramSession::replaceState(const data::ProgramState &state)
{
    m_pinnedOutsideDate = QDate();
    apply(tr("Reemplazar programa"), [&](data::ProgramState &current) { current.copyFrom(state); });
}

bool ProgramSession::canUndo() const
{
    return m_history.canUndo();
}

bool ProgramSession::canRedo() const
{
    return m_history.canRedo();
}

bool ProgramSession::undo()
{
    if (!m_history.canUndo()) {
        return false;
    }
    const QString label = m_history.undo(m_state);
    m_pinnedOutsideDate = QDate();
    qCDebug(lcPlannerSession) << "Undo" << label;
    emit stateChanged();
    return true;
}

bool ProgramSession::redo()
{
    if (!m_history.canRedo()) {
        return false;
    }
    const QString label = m_history.redo(m_state);
    m_pinnedOutsideDate = QDate();
    qCDebug(lcPlannerSession) << "Redo" << label;
    emit stateChanged();
    return true;
}

bool ProgramSession::load(const QString &filePath, QString *errorMessage)
{
    const auto loaded = m_storage.loadJson(filePath, errorMessage);
    if (!loaded) {
        return false;
    }
    replaceState(*loaded);
    return true;
}

bool ProgramSession::saveJson(const QString &filePath, QString *errorMessage) const
{
    return m_storage.saveJson(m_state, data::withSuffix(filePath, QStringLiteral("json")), errorMessage);
}

bool ProgramSession::saveCsv(const QString &filePath, QString *errorMessage) const
{
    return m_storage.saveCsv(m_state, filePath, errorMessage);
}

bool ProgramSession::exportIcs(const QString &filePath, QString *errorMessage) const
{
    return m_exporter.exportTo(m_state, data::withSuffix(filePath, QStringLiteral("ics")), errorMessage);
}

data::IcsExporter &ProgramSession::exporter()
{
    return m_exporter;
}

void ProgramSession::releasePin(const QDate &date)
{
    if (m_pinnedOutsideDate.isValid() && m_pinnedOutsideDate == date) {
        qCDebug(lcPlannerSession) << "Outside pin released by explicit override" << date;
        m_pinnedOutsideDate = QDate();
    }
}

} // namespace core
} // namespace planner
