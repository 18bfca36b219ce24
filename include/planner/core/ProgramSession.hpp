#pragma once

#include <QDate>
#include <QObject>
#include <QString>
#include <cstddef>
#include <optional>

#include "planner/core/ProgramHistory.hpp"
#include "planner/data/IcsExporter.hpp"
#include "planner/data/ProgramCalculator.hpp"
#include "planner/data/ProgramState.hpp"
#include "planner/data/ProgramStorage.hpp"

namespace planner {
namespace core {

// One interactive editing session over a program. Owns the state, the
// outside-range pin and the undo history; every caller gesture maps to one
// operation here. Single-threaded.
class ProgramSession : public QObject
{
    Q_OBJECT

public:
    explicit ProgramSession(data::IcsExportOptions exportOptions = {}, std::size_t historyLimit = 100,
                            QObject *parent = nullptr);
    ~ProgramSession() override;

    const data::ProgramState &state() const;
    QDate pinnedOutsideDate() const;
    std::optional<data::ProgramSummary> summary() const;

    void setRange(const QDate &first, const QDate &last);
    void beginRangeAt(const QDate &date);
    void closeRangeAt(const QDate &date);
    void adjustRangeWith(const QDate &date);

    void toggleException(const QDate &date);
    void toggleOutsideSelection(const QDate &date);
    void forceOn(const QDate &date);
    void forceOff(const QDate &date);

    // Turning a weekday off also drops its schedule.
    void setTrainingDay(Qt::DayOfWeek day, bool enabled);
    void setSchedule(Qt::DayOfWeek day, const data::TimeRange &range);
    void clearSchedule(Qt::DayOfWeek day);

    bool addEvent(const QDate &date, const data::CalendarEvent &event);
    bool updateEvent(const QDate &date, int index, const data::CalendarEvent &event);
    bool removeEvent(const QDate &date, int index);
    void clearEvents(const QDate &date);

    void replaceState(const data::ProgramState &state);

    bool canUndo() const;
    bool canRedo() const;
    bool undo();
    bool redo();

    // The state is replaced only when the document loads.
    bool load(const QString &filePath, QString *errorMessage = nullptr);
    bool saveJson(const QString &filePath, QString *errorMessage = nullptr) const;
    bool saveCsv(const QString &filePath, QString *errorMessage = nullptr) const;
    bool exportIcs(const QString &filePath, QString *errorMessage = nullptr) const;

    data::IcsExporter &exporter();

signals:
    void stateChanged();

private:
    template <typename Mutation>
    bool apply(const QString &label, Mutation &&mutation);
    void releasePin(const QDate &date);

    data::ProgramState m_state;
    QDate m_pinnedOutsideDate;
    ProgramHistory m_history;
    data::ProgramCalculator m_calculator;
    data::ProgramStorage m_storage;
    data::IcsExporter m_exporter;
};

} // namespace core
} // namespace planner
