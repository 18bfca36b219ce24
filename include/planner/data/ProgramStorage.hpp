#pragma once

#include <QByteArray>
#include <QString>
#include <optional>

#include "planner/data/ProgramCalculator.hpp"
#include "planner/data/ProgramState.hpp"
#include "planner/data/ProgramSummary.hpp"

class QJsonObject;

namespace planner {
namespace data {

// JSON program documents and the flat CSV summary table.
class ProgramStorage
{
public:
    ProgramStorage();
    ~ProgramStorage();

    QByteArray toJson(const ProgramState &state, const std::optional<ProgramSummary> &summary) const;
    // Tokens that fail to parse are skipped; only a malformed document fails.
    std::optional<ProgramState> fromJson(const QByteArray &json, QString *errorMessage = nullptr) const;

    std::optional<QString> toCsv(const ProgramState &state, QString *errorMessage = nullptr) const;

    bool saveJson(const ProgramState &state, const QString &filePath, QString *errorMessage = nullptr) const;
    std::optional<ProgramState> loadJson(const QString &filePath, QString *errorMessage = nullptr) const;
    bool saveCsv(const ProgramState &state, const QString &filePath, QString *errorMessage = nullptr) const;

    static QString formatDate(const QDate &date);
    static QDate parseDate(const QString &value);
    static QString formatTime(const QTime &time);
    static QTime parseTime(const QString &value);

private:
    static QJsonObject encodeTimeRange(const TimeRange &range);
    static std::optional<TimeRange> decodeTimeRange(const QJsonObject &object);

    ProgramCalculator m_calculator;
};

// Writes text to filePath in one shot; the previous file stays intact on failure.
bool writeTextFile(const QString &filePath, const QString &content, QString *errorMessage);

// Appends ".suffix" unless filePath already ends with it (case-insensitive).
QString withSuffix(const QString &filePath, const QString &suffix);

} // namespace data
} // namespace planner
