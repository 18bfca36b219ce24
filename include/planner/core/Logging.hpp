#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcPlannerStorage)
Q_DECLARE_LOGGING_CATEGORY(lcPlannerExport)
Q_DECLARE_LOGGING_CATEGORY(lcPlannerSession)
Q_DECLARE_LOGGING_CATEGORY(lcPlannerCli)
