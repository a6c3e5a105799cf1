#include "core/shared/ranking_config.h"

#include <QRegularExpression>
#include <QSet>

#include <cmath>

namespace dr {

namespace {

bool fail(QString* errorOut, const QString& message)
{
    if (errorOut) {
        *errorOut = message;
    }
    return false;
}

bool inUnitRange(double value)
{
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

ProfileDefinition makeProfile(const char* id,
                              const char* description,
                              const QStringList& targetUsers,
                              FactorWeights weights,
                              std::map<QString, double> dimensions,
                              const QStringList& patterns)
{
    ProfileDefinition profile;
    profile.id = QString::fromLatin1(id);
    profile.description = QString::fromLatin1(description);
    profile.targetUsers = targetUsers;
    profile.weights = weights;
    profile.dimensions = std::move(dimensions);
    profile.patterns = patterns;
    return profile;
}

FilterMapping makeMapping(const char* phrase,
                          std::initializer_list<std::pair<const char*, ConstraintLevel>> constraints)
{
    FilterMapping mapping;
    mapping.phrase = QString::fromLatin1(phrase);
    for (const auto& [dimension, level] : constraints) {
        ConstraintSpec spec;
        spec.dimension = QString::fromLatin1(dimension);
        spec.level = level;
        mapping.constraints.push_back(spec);
    }
    return mapping;
}

} // namespace

QString rankingStrategyToString(RankingStrategy strategy)
{
    switch (strategy) {
    case RankingStrategy::VectorOnly:    return QStringLiteral("vector_only");
    case RankingStrategy::DimensionOnly: return QStringLiteral("dimension_only");
    case RankingStrategy::Hybrid:        return QStringLiteral("hybrid");
    case RankingStrategy::Adaptive:      return QStringLiteral("adaptive");
    }
    return QStringLiteral("hybrid");
}

std::optional<RankingStrategy> rankingStrategyFromString(const QString& str)
{
    if (str == QLatin1String("vector_only"))    return RankingStrategy::VectorOnly;
    if (str == QLatin1String("dimension_only")) return RankingStrategy::DimensionOnly;
    if (str == QLatin1String("hybrid"))         return RankingStrategy::Hybrid;
    if (str == QLatin1String("adaptive"))       return RankingStrategy::Adaptive;
    return std::nullopt;
}

QString rankingModeToString(RankingMode mode)
{
    switch (mode) {
    case RankingMode::Hybrid:        return QStringLiteral("hybrid");
    case RankingMode::DimensionOnly: return QStringLiteral("dimension_only");
    case RankingMode::VectorOnly:    return QStringLiteral("vector_only");
    }
    return QStringLiteral("hybrid");
}

QString alignmentMethodToString(AlignmentMethod method)
{
    switch (method) {
    case AlignmentMethod::Min:             return QStringLiteral("min");
    case AlignmentMethod::Max:             return QStringLiteral("max");
    case AlignmentMethod::Average:         return QStringLiteral("average");
    case AlignmentMethod::WeightedAverage: return QStringLiteral("weighted_average");
    }
    return QStringLiteral("min");
}

std::optional<AlignmentMethod> alignmentMethodFromString(const QString& str)
{
    if (str == QLatin1String("min"))              return AlignmentMethod::Min;
    if (str == QLatin1String("max"))              return AlignmentMethod::Max;
    if (str == QLatin1String("average"))          return AlignmentMethod::Average;
    if (str == QLatin1String("weighted_average")) return AlignmentMethod::WeightedAverage;
    return std::nullopt;
}

QString normalizationModeToString(NormalizationMode mode)
{
    switch (mode) {
    case NormalizationMode::None:        return QStringLiteral("none");
    case NormalizationMode::TotalWeight: return QStringLiteral("total_weight");
    case NormalizationMode::MaxWeight:   return QStringLiteral("max_weight");
    }
    return QStringLiteral("none");
}

std::optional<NormalizationMode> normalizationModeFromString(const QString& str)
{
    if (str == QLatin1String("none"))         return NormalizationMode::None;
    if (str == QLatin1String("total_weight")) return NormalizationMode::TotalWeight;
    if (str == QLatin1String("max_weight"))   return NormalizationMode::MaxWeight;
    return std::nullopt;
}

QString constraintLevelToString(ConstraintLevel level)
{
    switch (level) {
    case ConstraintLevel::Low:       return QStringLiteral("low");
    case ConstraintLevel::High:      return QStringLiteral("high");
    case ConstraintLevel::Threshold: return QStringLiteral("threshold");
    }
    return QStringLiteral("high");
}

RankingConfig RankingConfig::defaults()
{
    RankingConfig config;

    config.profiles.push_back(makeProfile(
        "general", "Balanced reasoning for everyday knowledge work",
        {QStringLiteral("knowledge workers"), QStringLiteral("students"),
         QStringLiteral("general public")},
        {0.4, 0.3, 0.2, 0.1},
        {{QStringLiteral("utility"), 1.2},
         {QStringLiteral("relevance"), 1.3},
         {QStringLiteral("clarity"), 1.1},
         {QStringLiteral("complexity"), 1.0},
         {QStringLiteral("credibility"), 1.1}},
        {}));

    config.profiles.push_back(makeProfile(
        "researcher", "Innovation and research-focused analysis",
        {QStringLiteral("researchers"), QStringLiteral("academics"),
         QStringLiteral("scientists"), QStringLiteral("R&D teams")},
        {0.3, 0.4, 0.2, 0.1},
        {{QStringLiteral("novelty"), 1.5},
         {QStringLiteral("technical_depth"), 1.3},
         {QStringLiteral("methodology"), 1.2},
         {QStringLiteral("impact"), 1.4},
         {QStringLiteral("reproducibility"), 1.1}},
        {QStringLiteral("\\b(?:research|study|analysis|investigation|experiment)\\b"),
         QStringLiteral("\\b(?:novel|innovative|breakthrough|cutting-edge)\\b"),
         QStringLiteral("\\b(?:methodology|algorithm|technical|scientific)\\b"),
         QStringLiteral("\\b(?:peer-reviewed|publication|journal|academic)\\b")}));

    config.profiles.push_back(makeProfile(
        "business", "Strategic and commercial analysis",
        {QStringLiteral("business analysts"), QStringLiteral("consultants"),
         QStringLiteral("managers"), QStringLiteral("entrepreneurs")},
        {0.35, 0.35, 0.2, 0.1},
        {{QStringLiteral("market_impact"), 1.4},
         {QStringLiteral("feasibility"), 1.3},
         {QStringLiteral("roi_potential"), 1.5},
         {QStringLiteral("risk"), 1.2},
         {QStringLiteral("scalability"), 1.1}},
        {QStringLiteral("\\b(?:market|business|commercial|revenue|profit)\\b"),
         QStringLiteral("\\b(?:ROI|investment|financial|cost|budget)\\b"),
         QStringLiteral("\\b(?:strategy|competitive|opportunity|growth)\\b"),
         QStringLiteral("\\b(?:feasible|viable|scalable|sustainable)\\b")}));

    config.profiles.push_back(makeProfile(
        "legal", "Compliance and regulatory analysis",
        {QStringLiteral("legal professionals"), QStringLiteral("compliance officers"),
         QStringLiteral("contract managers")},
        {0.3, 0.4, 0.15, 0.15},
        {{QStringLiteral("compliance_risk"), 1.5},
         {QStringLiteral("liability"), 1.4},
         {QStringLiteral("precedent"), 1.2},
         {QStringLiteral("contractual_impact"), 1.3},
         {QStringLiteral("ethical_considerations"), 1.1}},
        {QStringLiteral("\\b(?:legal|law|regulation|compliance|contract)\\b"),
         QStringLiteral("\\b(?:liability|risk|violation|breach|penalty)\\b"),
         QStringLiteral("\\b(?:court|judge|ruling|precedent|case)\\b"),
         QStringLiteral("\\b(?:ITAR|export|controlled|classified)\\b")}));

    using L = ConstraintLevel;
    auto& mappings = config.filters.mappings;
    mappings.push_back(makeMapping("high quality", {{"credibility", L::High}, {"utility", L::High}}));
    mappings.push_back(makeMapping("low quality", {{"credibility", L::Low}, {"utility", L::Low}}));
    mappings.push_back(makeMapping("safe content", {{"danger", L::Low}, {"risk", L::Low}}));
    mappings.push_back(makeMapping("risky content", {{"danger", L::High}, {"risk", L::High}}));
    mappings.push_back(makeMapping("simple", {{"complexity", L::Low}}));
    mappings.push_back(makeMapping("complex", {{"complexity", L::High}}));
    mappings.push_back(makeMapping("advanced", {{"complexity", L::High}, {"technical_depth", L::High}}));
    mappings.push_back(makeMapping("innovative", {{"novelty", L::High}, {"innovation_potential", L::High}}));
    mappings.push_back(makeMapping("traditional", {{"novelty", L::Low}}));
    mappings.push_back(makeMapping("profitable", {{"roi_potential", L::High}, {"market_impact", L::High}}));
    mappings.push_back(makeMapping("feasible", {{"feasibility", L::High}}));
    mappings.push_back(makeMapping("strategic", {{"market_impact", L::High}, {"strategic_value", L::High}}));

    return config;
}

bool validateProfileDefinition(const ProfileDefinition& profile, QString* errorOut)
{
    if (profile.id.trimmed().isEmpty()) {
        return fail(errorOut, QStringLiteral("profile with empty id"));
    }

    const FactorWeights& w = profile.weights;
    for (double weight : {w.semanticSimilarity, w.dimensionAlignment,
                          w.recencyScore, w.confidenceScore}) {
        if (!std::isfinite(weight) || weight < 0.0) {
            return fail(errorOut, QStringLiteral("profile '%1': factor weights must be "
                                                 "finite and non-negative").arg(profile.id));
        }
    }
    const double sum = w.sum();
    if (std::abs(sum - 1.0) > kWeightSumTolerance) {
        return fail(errorOut, QStringLiteral("profile '%1': factor weights sum to %2, "
                                             "expected 1.0")
                                  .arg(profile.id)
                                  .arg(sum, 0, 'g', 12));
    }

    for (const auto& [dimension, multiplier] : profile.dimensions) {
        if (dimension.trimmed().isEmpty()) {
            return fail(errorOut, QStringLiteral("profile '%1': empty dimension name")
                                      .arg(profile.id));
        }
        if (!std::isfinite(multiplier) || multiplier <= 0.0) {
            return fail(errorOut, QStringLiteral("profile '%1': multiplier for '%2' must be "
                                                 "positive, got %3")
                                      .arg(profile.id, dimension)
                                      .arg(multiplier));
        }
    }

    for (const QString& pattern : profile.patterns) {
        const QRegularExpression re(pattern);
        if (!re.isValid()) {
            return fail(errorOut, QStringLiteral("profile '%1': invalid pattern '%2': %3")
                                      .arg(profile.id, pattern, re.errorString()));
        }
    }

    return true;
}

bool validateRankingConfig(const RankingConfig& config, QString* errorOut)
{
    const RetrievalConfig& r = config.retrieval;
    if (r.maxCandidatesMultiplier < 1) {
        return fail(errorOut, QStringLiteral("max_candidates_multiplier must be >= 1"));
    }
    if (r.minCandidates < 0) {
        return fail(errorOut, QStringLiteral("min_candidates must be >= 0"));
    }
    if (r.maxProcessingTimeMs <= 0) {
        return fail(errorOut, QStringLiteral("max_processing_time_ms must be > 0"));
    }
    if (r.fallbackStrategy == RankingStrategy::Adaptive) {
        return fail(errorOut, QStringLiteral("fallback_strategy cannot be 'adaptive'"));
    }
    if (r.scoringThreads < 1) {
        return fail(errorOut, QStringLiteral("scoring_threads must be >= 1"));
    }
    if (r.adaptiveTimeoutThreshold < 1) {
        return fail(errorOut, QStringLiteral("adaptive_timeout_threshold must be >= 1"));
    }
    if (r.adaptiveRecoveryMs < 0) {
        return fail(errorOut, QStringLiteral("adaptive_recovery_ms must be >= 0"));
    }

    if (config.profiles.empty()) {
        return fail(errorOut, QStringLiteral("no profiles defined"));
    }
    QSet<QString> seen;
    bool hasGeneral = false;
    for (const ProfileDefinition& profile : config.profiles) {
        if (!validateProfileDefinition(profile, errorOut)) {
            return false;
        }
        if (seen.contains(profile.id)) {
            return fail(errorOut, QStringLiteral("duplicate profile id '%1'").arg(profile.id));
        }
        seen.insert(profile.id);
        hasGeneral = hasGeneral || profile.id == QLatin1String("general");
    }
    if (!hasGeneral) {
        return fail(errorOut, QStringLiteral("the 'general' profile is required"));
    }

    const FilterConfig& f = config.filters;
    if (!inUnitRange(f.confidenceThreshold) || !inUnitRange(f.filterStrength)
        || !inUnitRange(f.highThreshold) || !inUnitRange(f.lowThreshold)
        || !inUnitRange(f.defaultPhraseConfidence)) {
        return fail(errorOut, QStringLiteral("natural_language_filters values must lie in [0,1]"));
    }
    for (const FilterMapping& mapping : f.mappings) {
        if (mapping.phrase.trimmed().isEmpty()) {
            return fail(errorOut, QStringLiteral("filter mapping with empty phrase"));
        }
        if (mapping.constraints.empty()) {
            return fail(errorOut, QStringLiteral("filter phrase '%1' has no constraints")
                                      .arg(mapping.phrase));
        }
        if (mapping.confidence.has_value() && !inUnitRange(*mapping.confidence)) {
            return fail(errorOut, QStringLiteral("filter phrase '%1': confidence must lie in [0,1]")
                                      .arg(mapping.phrase));
        }
        for (const ConstraintSpec& spec : mapping.constraints) {
            if (spec.dimension.trimmed().isEmpty()) {
                return fail(errorOut, QStringLiteral("filter phrase '%1': empty dimension")
                                          .arg(mapping.phrase));
            }
            if (spec.level == ConstraintLevel::Threshold && !std::isfinite(spec.threshold)) {
                return fail(errorOut, QStringLiteral("filter phrase '%1': threshold for '%2' "
                                                     "is not a number")
                                          .arg(mapping.phrase, spec.dimension));
            }
        }
    }

    if (!inUnitRange(config.detection.confidenceThreshold)) {
        return fail(errorOut, QStringLiteral("auto_profile_detection.confidence_threshold "
                                             "must lie in [0,1]"));
    }

    const AlignmentConfig& a = config.alignment;
    if (!inUnitRange(a.confidenceBoost.maxBoost) || !inUnitRange(a.confidenceBoost.threshold)) {
        return fail(errorOut, QStringLiteral("confidence_boost values must lie in [0,1]"));
    }
    if (!inUnitRange(a.profileBonus.sameProfileBonus)
        || !inUnitRange(a.profileBonus.crossProfilePenalty)) {
        return fail(errorOut, QStringLiteral("profile_bonus values must lie in [0,1]"));
    }

    const CacheConfig& c = config.cache;
    if (c.cacheSize < 1 || c.queryCacheSize < 1) {
        return fail(errorOut, QStringLiteral("cache sizes must be >= 1"));
    }
    if (c.cacheTtlSeconds < 1 || c.queryCacheTtlSeconds < 1) {
        return fail(errorOut, QStringLiteral("cache TTLs must be >= 1 second"));
    }
    if (c.shardCount < 1) {
        return fail(errorOut, QStringLiteral("shard_count must be >= 1"));
    }

    const QString level = config.logging.level.toUpper();
    if (level != QLatin1String("DEBUG") && level != QLatin1String("INFO")
        && level != QLatin1String("WARNING") && level != QLatin1String("ERROR")) {
        return fail(errorOut, QStringLiteral("unknown logging level '%1'")
                                  .arg(config.logging.level));
    }

    return true;
}

} // namespace dr
