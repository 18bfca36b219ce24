#pragma once

#include <QDateTime>
#include <QString>
#include <optional>

#include "planner/data/ProgramCalculator.hpp"

class QTextStream;

namespace planner {
namespace data {

class ProgramState;
struct CalendarEvent;
struct TimeRange;

struct IcsExportOptions
{
    QString timeZoneId; // empty: system zone
    QString productId = QStringLiteral("-//Planificador de Entrenamiento//1.0//ES");
    QString sessionTitle = QStringLiteral("Entrenamiento");
    int reminderMinutes = 10;
};

class IcsExporter
{
public:
    explicit IcsExporter(IcsExportOptions options = {});

    const IcsExportOptions &options() const;
    void setOptions(IcsExportOptions options);

    // DTSTAMP of every event; current UTC time when unset.
    void setTimestamp(const QDateTime &timestamp);

    std::optional<QString> render(const ProgramState &state, QString *errorMessage = nullptr) const;
    bool exportTo(const ProgramState &state, const QString &filePath, QString *errorMessage = nullptr) const;

    static QString escapeText(const QString &text);
    static QString formatLocal(const QDate &date, const QTime &time);
    static QString formatUtc(const QDateTime &dateTime);

private:
    QString timeZoneId() const;
    void writeTimes(QTextStream &stream, const QDate &date, const TimeRange &range) const;
    void writeEvent(QTextStream &stream, const QDate &date, const CalendarEvent &event) const;

    IcsExportOptions m_options;
    QDateTime m_timestamp;
    ProgramCalculator m_calculator;
};

} // namespace data
} // namespace planner
