#pragma once

#include <QDate>
#include <QStringList>
#include <functional>
#include <optional>
#include <utility>

#include "planner/data/CalendarEvent.hpp"
#include "planner/data/TimeRange.hpp"

class QCommandLineParser;
class QTextStream;

namespace planner {
namespace core {
class ProgramSession;
}

namespace ui {

// Non-interactive driver: load a program, apply the requested edits,
// print the summary and write the requested files.
class CommandLineFrontend
{
public:
    CommandLineFrontend(QTextStream &out, QTextStream &err);

    // arguments include the program name, as QCoreApplication::arguments() does.
    int run(const QStringList &arguments);

    // "HH:MM-HH:MM"
    static std::optional<data::TimeRange> parseTimeRange(const QString &value);
    // "yyyy-MM-dd..yyyy-MM-dd"
    static std::optional<std::pair<QDate, QDate>> parseDateRange(const QString &value);
    // "yyyy-MM-dd|HH:MM-HH:MM|title[|location[|description]]"
    static std::optional<std::pair<QDate, data::CalendarEvent>> parseEvent(const QString &value);

private:
    bool applyEdits(core::ProgramSession &session, const QCommandLineParser &parser);
    bool applyDates(const QStringList &values, const QString &option, const std::function<void(const QDate &)> &apply);
    bool fail(const QString &message);

    QTextStream &m_out;
    QTextStream &m_err;
};

} // namespace ui
} // namespace planner
