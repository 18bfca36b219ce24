#include "planner/ui/viewmodels/ProgramSummaryViewModel.hpp"

#include "planner/core/ProgramSession.hpp"

#include <QLocale>
#include <QTextStream>

namespace planner {
namespace ui {

ProgramSummaryViewModel::ProgramSummaryViewModel(core::ProgramSession &session, QObject *parent)
    : QObject(parent)
    , m_session(session)
{
    connect(&m_session, &core::ProgramSession::stateChanged, this, &ProgramSummaryViewModel::refresh);
    refresh();
}

void ProgramSummaryViewModel::refresh()
{
    m_totals.clear();
    m_months.clear();
    m_weeks.clear();

    const auto summary = m_session.summary();
    m_hasSummary = summary.has_value();
    if (summary) {
        rebuild(*summary);
    }
    emit summaryChanged();
}

bool ProgramSummaryViewModel::hasSummary() const
{
    return m_hasSummary;
}

QString ProgramSummaryViewModel::placeholder() const
{
    return tr("Selecciona un rango, días y horarios para ver el resumen.");
}

const QVector<SummaryRow> &ProgramSummaryViewModel::totals() const
{
    return m_totals;
}

const QVector<SummaryRow> &ProgramSummaryViewModel::months() const
{
    return m_months;
}

const QVector<SummaryRow> &ProgramSummaryViewModel::weeks() const
{
    return m_weeks;
}

QString ProgramSummaryViewModel::toPlainText() const
{
    if (!m_hasSummary) {
        return placeholder() + QLatin1Char('\n');
    }

    QString text;
    QTextStream stream(&text);
    auto writeSection = [&stream](const QString &title, const QVector<SummaryRow> &rows, const QString &empty) {
        stream << title << '\n';
        if (rows.isEmpty()) {
            stream << "  " << empty << '\n';
        }
        for (const SummaryRow &row : rows) {
            stream << "  " << row.label.leftJustified(28) << row.value << '\n';
        }
    };

    const QString noMinutes = tr("Sin minutos asignados.");
    writeSection(tr("Resumen del programa"), m_totals, noMinutes);
    stream << '\n';
    writeSection(tr("Tiempo por mes"), m_months, noMinutes);
    stream << '\n';
    writeSection(tr("Tiempo por semana del programa"), m_weeks, noMinutes);
    stream.flush();
    return text;
}

QString ProgramSummaryViewModel::formatClock(int minutes)
{
    return QStringLiteral("%1:%2")
        .arg(minutes / 60, 2, 10, QLatin1Char('0'))
        .arg(minutes % 60, 2, 10, QLatin1Char('0'));
}

QString ProgramSummaryViewModel::formatDuration(int minutes)
{
    const int hours = minutes / 60;
    const int rest = minutes % 60;
    if (hours == 0) {
        return QStringLiteral("%1 m").arg(rest);
    }
    if (rest == 0) {
        return QStringLiteral("%1 h").arg(hours);
    }
    return QStringLiteral("%1 h %2 m").arg(hours).arg(rest);
}

QString ProgramSummaryViewModel::monthName(int month)
{
    static const QLocale spanish(QLocale::Spanish, QLocale::Spain);
    const QString name = spanish.standaloneMonthName(month, QLocale::LongFormat);
    if (name.isEmpty()) {
        return name;
    }
    return name.at(0).toUpper() + name.mid(1);
}

void ProgramSummaryViewModel::rebuild(const data::ProgramSummary &summary)
{
    auto clockWithDuration = [](int minutes) {
        return QStringLiteral("%1  (%2)").arg(formatClock(minutes), formatDuration(minutes));
    };

    m_totals.append({tr("Semanas del programa"), QString::number(summary.weeksInRange)});
    m_totals.append({tr("Semanas con entrenamiento"), QString::number(summary.weeksWithTraining)});
    m_totals.append({tr("Días seleccionados"), QString::number(summary.selectedDays)});
    m_totals.append({tr("Total minutos"), QString::number(summary.totalMinutes)});
    m_totals.append({tr("Total horas"),
                     QStringLiteral("%1  (%2 h)")
                         .arg(formatClock(summary.totalMinutes))
                         .arg(summary.totalMinutes / 60.0, 0, 'f', 2)});

    const bool spansYears = summary.start.year() != summary.end.year();
    for (auto it = summary.minutesByMonth.constBegin(); it != summary.minutesByMonth.constEnd(); ++it) {
        QString label = monthName(it.key().month);
        if (spansYears) {
            label += QLatin1Char(' ') + QString::number(it.key().year);
        }
        m_months.append({label, clockWithDuration(it.value())});
    }

    for (auto it = summary.minutesByWeek.constBegin(); it != summary.minutesByWeek.constEnd(); ++it) {
        m_weeks.append({tr("Semana %1").arg(it.key()), clockWithDuration(it.value())});
    }
}

} // namespace ui
} // namespace planner
