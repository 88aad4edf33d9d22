#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcPlanner)
Q_DECLARE_LOGGING_CATEGORY(lcScheduler)
Q_DECLARE_LOGGING_CATEGORY(lcPlacement)
Q_DECLARE_LOGGING_CATEGORY(lcCascade)
Q_DECLARE_LOGGING_CATEGORY(lcTravel)
Q_DECLARE_LOGGING_CATEGORY(lcRecurrence)
