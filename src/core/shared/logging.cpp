#include "core/shared/logging.h"
#include "core/shared/ranking_config.h"

#include <QStringList>

Q_LOGGING_CATEGORY(drCore, "dimrank.core")
Q_LOGGING_CATEGORY(drConfig, "dimrank.config")
Q_LOGGING_CATEGORY(drRanking, "dimrank.ranking")
Q_LOGGING_CATEGORY(drScoring, "dimrank.scoring")
Q_LOGGING_CATEGORY(drFilters, "dimrank.filters")
Q_LOGGING_CATEGORY(drCache, "dimrank.cache")
Q_LOGGING_CATEGORY(drPerf, "dimrank.perf")
Q_LOGGING_CATEGORY(drStore, "dimrank.store")

namespace dr {

namespace {

// Lowest enabled message type for a level name; unknown names were rejected
// when the config was loaded, so anything else maps to INFO here.
int levelRank(const QString& level)
{
    const QString upper = level.toUpper();
    if (upper == QLatin1String("DEBUG"))   return 0;
    if (upper == QLatin1String("WARNING")) return 2;
    if (upper == QLatin1String("ERROR"))   return 3;
    return 1;
}

QLatin1String flag(bool enabled)
{
    return enabled ? QLatin1String("true") : QLatin1String("false");
}

} // namespace

QString loggingFilterRules(const LoggingConfig& config)
{
    const int rank = levelRank(config.level);

    QStringList rules;
    rules << QStringLiteral("dimrank.*.debug=%1").arg(flag(rank <= 0));
    rules << QStringLiteral("dimrank.*.info=%1").arg(flag(rank <= 1));
    rules << QStringLiteral("dimrank.*.warning=%1").arg(flag(rank <= 2));
    rules << QStringLiteral("dimrank.*.critical=true");

    // Detail switches are applied after the level floor so they win.
    rules << QStringLiteral("dimrank.scoring.debug=%1")
                 .arg(flag(config.logScoringDetails));
    rules << QStringLiteral("dimrank.filters.debug=%1")
                 .arg(flag(config.logFilters));
    rules << QStringLiteral("dimrank.perf.info=%1")
                 .arg(flag(config.logPerformance));

    return rules.join(QLatin1Char('\n'));
}

void applyLoggingConfig(const LoggingConfig& config)
{
    QLoggingCategory::setFilterRules(loggingFilterRules(config));
}

} // namespace dr
