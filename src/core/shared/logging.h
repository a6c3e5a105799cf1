#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(drCore)
Q_DECLARE_LOGGING_CATEGORY(drConfig)
Q_DECLARE_LOGGING_CATEGORY(drRanking)
Q_DECLARE_LOGGING_CATEGORY(drScoring)
Q_DECLARE_LOGGING_CATEGORY(drFilters)
Q_DECLARE_LOGGING_CATEGORY(drCache)
Q_DECLARE_LOGGING_CATEGORY(drPerf)
Q_DECLARE_LOGGING_CATEGORY(drStore)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)

namespace dr {

struct LoggingConfig;

// Translates the logging section of the ranking config into Qt category
// filter rules. Replaces any rules previously installed by this function.
void applyLoggingConfig(const LoggingConfig& config);

// The filter rule string applyLoggingConfig() installs, exposed for tests.
QString loggingFilterRules(const LoggingConfig& config);

} // namespace dr
