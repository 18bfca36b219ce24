#pragma once

#include <QObject>
#include <QString>
#include <QVector>

#include "planner/data/ProgramSummary.hpp"

namespace planner {
namespace core {
class ProgramSession;
}

namespace ui {

struct SummaryRow
{
    QString label;
    QString value;
};

// Text rows describing the current program summary, refreshed on every
// session change.
class ProgramSummaryViewModel : public QObject
{
    Q_OBJECT

public:
    explicit ProgramSummaryViewModel(core::ProgramSession &session, QObject *parent = nullptr);

    void refresh();

    bool hasSummary() const;
    QString placeholder() const;
    const QVector<SummaryRow> &totals() const;
    const QVector<SummaryRow> &months() const;
    const QVector<SummaryRow> &weeks() const;

    QString toPlainText() const;

    static QString formatClock(int minutes);
    static QString formatDuration(int minutes);
    static QString monthName(int month);

signals:
    void summaryChanged();

private:
    void rebuild(const data::ProgramSummary &summary);

    core::ProgramSession &m_session;
    bool m_hasSummary = false;
    QVector<SummaryRow> m_totals;
    QVector<SummaryRow> m_months;
    QVector<SummaryRow> m_weeks;
};

} // namespace ui
} // namespace planner
