#include "planner/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcPlannerStorage, "planner.storage")
Q_LOGGING_CATEGORY(lcPlannerExport, "planner.export")
Q_LOGGING_CATEGORY(lcPlannerSession, "planner.session")
Q_LOGGING_CATEGORY(lcPlannerCli, "planner.cli")
