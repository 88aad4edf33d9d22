#include "errandplan/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcPlanner, "errandplan.planner")
Q_LOGGING_CATEGORY(lcScheduler, "errandplan.scheduler")
Q_LOGGING_CATEGORY(lcPlacement, "errandplan.placement")
Q_LOGGING_CATEGORY(lcCascade, "errandplan.cascade")
Q_LOGGING_CATEGORY(lcTravel, "errandplan.travel")
Q_LOGGING_CATEGORY(lcRecurrence, "errandplan.recurrence")
