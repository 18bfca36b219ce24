#pragma once

#include <QString>
#include <cstddef>

#include "planner/data/IcsExporter.hpp"

class QSettings;

namespace planner {
namespace core {

// Typed view over the persistent QSettings store.
class AppSettings
{
public:
    explicit AppSettings(QSettings &settings);

    data::IcsExportOptions icsExportOptions() const;
    void setIcsExportOptions(const data::IcsExportOptions &options);

    std::size_t historyLimit() const;
    void setHistoryLimit(std::size_t limit);

    QString lastProgramPath() const;
    void setLastProgramPath(const QString &filePath);

private:
    QSettings &m_settings;
};

} // namespace core
} // namespace planner
