#include "planner/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcDatabase, "planner.db")
Q_LOGGING_CATEGORY(lcCache, "planner.cache")
Q_LOGGING_CATEGORY(lcQueue, "planner.queue")
Q_LOGGING_CATEGORY(lcSync, "planner.sync")
Q_LOGGING_CATEGORY(lcRemote, "planner.remote")
Q_LOGGING_CATEGORY(lcDayBoundary, "planner.day")
Q_LOGGING_CATEGORY(lcRetention, "planner.retention")
