#include "core/shared/config_loader.h"
#include "core/shared/logging.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

#include <algorithm>
#include <cmath>
#include <limits>

namespace dr {

namespace {

// Small reader that records the first error it meets; later reads become
// no-ops so each section can be parsed without checking every call.
class JsonReader {
public:
    explicit JsonReader(QString* errorOut) : m_errorOut(errorOut) {}

    bool ok() const { return m_ok; }

    void fail(const QString& message)
    {
        if (!m_ok) {
            return;
        }
        m_ok = false;
        if (m_errorOut) {
            *m_errorOut = message;
        }
    }

    void readBool(const QJsonObject& obj, const char* key, const QString& section, bool& out)
    {
        const QJsonValue value = obj.value(QLatin1String(key));
        if (!m_ok || value.isUndefined()) {
            return;
        }
        if (!value.isBool()) {
            fail(QStringLiteral("%1.%2 must be a boolean").arg(section, QLatin1String(key)));
            return;
        }
        out = value.toBool();
    }

    void readDouble(const QJsonObject& obj, const char* key, const QString& section, double& out)
    {
        const QJsonValue value = obj.value(QLatin1String(key));
        if (!m_ok || value.isUndefined()) {
            return;
        }
        if (!value.isDouble()) {
            fail(QStringLiteral("%1.%2 must be a number").arg(section, QLatin1String(key)));
            return;
        }
        out = value.toDouble();
    }

    void readInt(const QJsonObject& obj, const char* key, const QString& section, int& out)
    {
        const QJsonValue value = obj.value(QLatin1String(key));
        if (!m_ok || value.isUndefined()) {
            return;
        }
        const double number = value.toDouble(0.5);
        if (!value.isDouble() || std::abs(number) > std::numeric_limits<int>::max()
            || number != std::floor(number)) {
            fail(QStringLiteral("%1.%2 must be an integer").arg(section, QLatin1String(key)));
            return;
        }
        out = static_cast<int>(number);
    }

    void readString(const QJsonObject& obj, const char* key, const QString& section, QString& out)
    {
        const QJsonValue value = obj.value(QLatin1String(key));
        if (!m_ok || value.isUndefined()) {
            return;
        }
        if (!value.isString()) {
            fail(QStringLiteral("%1.%2 must be a string").arg(section, QLatin1String(key)));
            return;
        }
        out = value.toString();
    }

    void readStringList(const QJsonObject& obj, const char* key, const QString& section,
                        QStringList& out)
    {
        const QJsonValue value = obj.value(QLatin1String(key));
        if (!m_ok || value.isUndefined()) {
            return;
        }
        if (!value.isArray()) {
            fail(QStringLiteral("%1.%2 must be an array of strings")
                     .arg(section, QLatin1String(key)));
            return;
        }
        QStringList list;
        for (const QJsonValue& item : value.toArray()) {
            if (!item.isString()) {
                fail(QStringLiteral("%1.%2 must be an array of strings")
                         .arg(section, QLatin1String(key)));
                return;
            }
            list.append(item.toString());
        }
        out = list;
    }

    QJsonObject section(const QJsonObject& root, const char* key)
    {
        const QJsonValue value = root.value(QLatin1String(key));
        if (value.isUndefined()) {
            return {};
        }
        if (!value.isObject()) {
            fail(QStringLiteral("'%1' must be an object").arg(QLatin1String(key)));
            return {};
        }
        return value.toObject();
    }

    template <typename Enum>
    void readEnum(const QJsonObject& obj, const char* key, const QString& section,
                  std::optional<Enum> (*parse)(const QString&), Enum& out)
    {
        QString name;
        const bool present = obj.contains(QLatin1String(key));
        readString(obj, key, section, name);
        if (!m_ok || !present) {
            return;
        }
        const std::optional<Enum> parsed = parse(name);
        if (!parsed.has_value()) {
            fail(QStringLiteral("%1.%2: unknown value '%3'")
                     .arg(section, QLatin1String(key), name));
            return;
        }
        out = *parsed;
    }

private:
    QString* m_errorOut = nullptr;
    bool m_ok = true;
};

void parseRetrieval(JsonReader& reader, const QJsonObject& obj, RetrievalConfig& out)
{
    const QString section = QStringLiteral("retrieval");
    reader.readBool(obj, "enable_dimension_ranking", section, out.enableDimensionRanking);
    reader.readEnum(obj, "default_strategy", section, &rankingStrategyFromString,
                    out.defaultStrategy);
    reader.readInt(obj, "max_candidates_multiplier", section, out.maxCandidatesMultiplier);
    reader.readInt(obj, "min_candidates", section, out.minCandidates);
    reader.readInt(obj, "max_processing_time_ms", section, out.maxProcessingTimeMs);
    reader.readBool(obj, "enable_fallback", section, out.enableFallback);
    reader.readEnum(obj, "fallback_strategy", section, &rankingStrategyFromString,
                    out.fallbackStrategy);
    reader.readInt(obj, "scoring_threads", section, out.scoringThreads);
    reader.readInt(obj, "adaptive_timeout_threshold", section, out.adaptiveTimeoutThreshold);
    reader.readInt(obj, "adaptive_recovery_ms", section, out.adaptiveRecoveryMs);
}

std::optional<ProfileDefinition> parseProfile(JsonReader& reader, const QJsonValue& value,
                                              int index)
{
    const QString section = QStringLiteral("profiles[%1]").arg(index);
    if (!value.isObject()) {
        reader.fail(QStringLiteral("%1 must be an object").arg(section));
        return std::nullopt;
    }
    const QJsonObject obj = value.toObject();

    ProfileDefinition profile;
    if (!obj.value(QStringLiteral("id")).isString()) {
        reader.fail(QStringLiteral("%1.id is required").arg(section));
        return std::nullopt;
    }
    reader.readString(obj, "id", section, profile.id);
    reader.readString(obj, "description", section, profile.description);
    reader.readStringList(obj, "target_users", section, profile.targetUsers);
    reader.readStringList(obj, "patterns", section, profile.patterns);

    // Weights have no defaults: a profile must state all four explicitly.
    const QJsonValue weightsValue = obj.value(QStringLiteral("weights"));
    if (!weightsValue.isObject()) {
        reader.fail(QStringLiteral("profile '%1': weights object is required").arg(profile.id));
        return std::nullopt;
    }
    const QJsonObject weights = weightsValue.toObject();
    const QString weightSection = QStringLiteral("profile '%1' weights").arg(profile.id);
    for (const char* key : {"semantic_similarity", "dimension_alignment",
                            "recency_score", "confidence_score"}) {
        if (!weights.value(QLatin1String(key)).isDouble()) {
            reader.fail(QStringLiteral("%1: '%2' must be a number")
                            .arg(weightSection, QLatin1String(key)));
            return std::nullopt;
        }
    }
    reader.readDouble(weights, "semantic_similarity", weightSection,
                      profile.weights.semanticSimilarity);
    reader.readDouble(weights, "dimension_alignment", weightSection,
                      profile.weights.dimensionAlignment);
    reader.readDouble(weights, "recency_score", weightSection, profile.weights.recencyScore);
    reader.readDouble(weights, "confidence_score", weightSection,
                      profile.weights.confidenceScore);

    const QJsonValue dimensionsValue = obj.value(QStringLiteral("dimensions"));
    if (!dimensionsValue.isUndefined()) {
        if (!dimensionsValue.isObject()) {
            reader.fail(QStringLiteral("profile '%1': dimensions must be an object")
                            .arg(profile.id));
            return std::nullopt;
        }
        const QJsonObject dimensions = dimensionsValue.toObject();
        for (auto it = dimensions.begin(); it != dimensions.end(); ++it) {
            if (!it.value().isDouble()) {
                reader.fail(QStringLiteral("profile '%1': multiplier for '%2' must be a number")
                                .arg(profile.id, it.key()));
                return std::nullopt;
            }
            profile.dimensions[it.key()] = it.value().toDouble();
        }
    }

    if (!reader.ok()) {
        return std::nullopt;
    }
    return profile;
}

void parseProfiles(JsonReader& reader, const QJsonObject& root,
                   std::vector<ProfileDefinition>& out)
{
    const QJsonValue value = root.value(QStringLiteral("profiles"));
    if (value.isUndefined()) {
        return;
    }
    if (!value.isArray()) {
        reader.fail(QStringLiteral("'profiles' must be an array"));
        return;
    }

    std::vector<ProfileDefinition> profiles;
    const QJsonArray array = value.toArray();
    for (int i = 0; i < array.size(); ++i) {
        std::optional<ProfileDefinition> profile = parseProfile(reader, array.at(i), i);
        if (!profile.has_value()) {
            return;
        }
        profiles.push_back(std::move(*profile));
    }
    out = std::move(profiles);
}

std::optional<ConstraintSpec> parseConstraint(JsonReader& reader, const QString& phrase,
                                              const QString& dimension, const QJsonValue& value)
{
    ConstraintSpec spec;
    spec.dimension = dimension;
    if (value.isDouble()) {
        spec.level = ConstraintLevel::Threshold;
        spec.threshold = value.toDouble();
        return spec;
    }
    const QString level = value.toString().toLower();
    if (level == QLatin1String("high")) {
        spec.level = ConstraintLevel::High;
        return spec;
    }
    if (level == QLatin1String("low")) {
        spec.level = ConstraintLevel::Low;
        return spec;
    }
    reader.fail(QStringLiteral("filter phrase '%1': '%2' must be \"high\", \"low\" or a number")
                    .arg(phrase, dimension));
    return std::nullopt;
}

void parseFilters(JsonReader& reader, const QJsonObject& obj, FilterConfig& out)
{
    const QString section = QStringLiteral("natural_language_filters");
    reader.readBool(obj, "enable_parsing", section, out.enableParsing);
    reader.readDouble(obj, "confidence_threshold", section, out.confidenceThreshold);
    reader.readDouble(obj, "filter_strength", section, out.filterStrength);
    reader.readDouble(obj, "high_threshold", section, out.highThreshold);
    reader.readDouble(obj, "low_threshold", section, out.lowThreshold);
    reader.readDouble(obj, "default_phrase_confidence", section, out.defaultPhraseConfidence);

    const QJsonValue mappingsValue = obj.value(QStringLiteral("filter_mappings"));
    if (!reader.ok() || mappingsValue.isUndefined()) {
        return;
    }
    if (!mappingsValue.isArray()) {
        reader.fail(QStringLiteral("%1.filter_mappings must be an array").arg(section));
        return;
    }

    std::vector<FilterMapping> mappings;
    for (const QJsonValue& entry : mappingsValue.toArray()) {
        const QJsonObject entryObj = entry.toObject();
        if (!entry.isObject() || !entryObj.value(QStringLiteral("phrase")).isString()
            || !entryObj.value(QStringLiteral("constraints")).isObject()) {
            reader.fail(QStringLiteral("%1.filter_mappings entries need a phrase and a "
                                       "constraints object").arg(section));
            return;
        }

        FilterMapping mapping;
        mapping.phrase = entryObj.value(QStringLiteral("phrase")).toString();
        const QJsonObject constraints = entryObj.value(QStringLiteral("constraints")).toObject();
        for (auto it = constraints.begin(); it != constraints.end(); ++it) {
            std::optional<ConstraintSpec> spec =
                parseConstraint(reader, mapping.phrase, it.key(), it.value());
            if (!spec.has_value()) {
                return;
            }
            mapping.constraints.push_back(*spec);
        }
        if (entryObj.contains(QStringLiteral("confidence"))) {
            double confidence = 0.0;
            reader.readDouble(entryObj, "confidence", section, confidence);
            mapping.confidence = confidence;
        }
        mappings.push_back(std::move(mapping));
    }
    if (reader.ok()) {
        out.mappings = std::move(mappings);
    }
}

void parseDetection(JsonReader& reader, const QJsonObject& obj, ProfileDetectionConfig& out,
                    std::vector<ProfileDefinition>& profiles)
{
    const QString section = QStringLiteral("auto_profile_detection");
    reader.readBool(obj, "enable", section, out.enabled);
    reader.readDouble(obj, "confidence_threshold", section, out.confidenceThreshold);

    // The original layout keeps patterns here, keyed by profile id. They
    // replace the patterns declared on the profile itself.
    const QJsonValue patternsValue = obj.value(QStringLiteral("patterns"));
    if (!reader.ok() || patternsValue.isUndefined()) {
        return;
    }
    if (!patternsValue.isObject()) {
        reader.fail(QStringLiteral("%1.patterns must be an object").arg(section));
        return;
    }
    const QJsonObject patterns = patternsValue.toObject();
    for (auto it = patterns.begin(); it != patterns.end(); ++it) {
        auto profileIt = std::find_if(profiles.begin(), profiles.end(),
                                      [&](const ProfileDefinition& p) {
                                          return p.id == it.key();
                                      });
        if (profileIt == profiles.end()) {
            reader.fail(QStringLiteral("%1.patterns references unknown profile '%2'")
                            .arg(section, it.key()));
            return;
        }
        reader.readStringList(patterns, it.key().toUtf8().constData(),
                              section + QStringLiteral(".patterns"), profileIt->patterns);
    }
}

void parseAlignment(JsonReader& reader, const QJsonObject& obj, AlignmentConfig& out)
{
    const QString section = QStringLiteral("dimension_alignment");
    reader.readEnum(obj, "alignment_method", section, &alignmentMethodFromString, out.method);
    reader.readEnum(obj, "normalization", section, &normalizationModeFromString,
                    out.normalization);

    const QJsonObject boost = reader.section(obj, "confidence_boost");
    const QString boostSection = section + QStringLiteral(".confidence_boost");
    reader.readBool(boost, "enable", boostSection, out.confidenceBoost.enabled);
    reader.readDouble(boost, "max_boost", boostSection, out.confidenceBoost.maxBoost);
    reader.readDouble(boost, "threshold", boostSection, out.confidenceBoost.threshold);

    const QJsonObject bonus = reader.section(obj, "profile_bonus");
    const QString bonusSection = section + QStringLiteral(".profile_bonus");
    reader.readBool(bonus, "enable", bonusSection, out.profileBonus.enabled);
    reader.readDouble(bonus, "same_profile_bonus", bonusSection,
                      out.profileBonus.sameProfileBonus);
    reader.readDouble(bonus, "cross_profile_penalty", bonusSection,
                      out.profileBonus.crossProfilePenalty);
}

void parseCaching(JsonReader& reader, const QJsonObject& obj, CacheConfig& out)
{
    const QString section = QStringLiteral("caching");
    reader.readBool(obj, "enable_dimension_cache", section, out.enableDimensionCache);
    reader.readInt(obj, "cache_size", section, out.cacheSize);
    reader.readInt(obj, "cache_ttl", section, out.cacheTtlSeconds);
    reader.readBool(obj, "enable_query_cache", section, out.enableQueryCache);
    reader.readInt(obj, "query_cache_size", section, out.queryCacheSize);
    reader.readInt(obj, "query_cache_ttl", section, out.queryCacheTtlSeconds);
    reader.readInt(obj, "shard_count", section, out.shardCount);
}

void parseLogging(JsonReader& reader, const QJsonObject& obj, LoggingConfig& out)
{
    const QString section = QStringLiteral("logging");
    reader.readString(obj, "level", section, out.level);
    reader.readBool(obj, "log_scoring_details", section, out.logScoringDetails);
    reader.readBool(obj, "log_performance", section, out.logPerformance);
    reader.readBool(obj, "log_filters", section, out.logFilters);
}

} // namespace

std::optional<RankingConfig> ConfigLoader::loadFromFile(const QString& path, QString* errorOut)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(drConfig, "ConfigLoader: cannot open %s", qUtf8Printable(path));
        if (errorOut) {
            *errorOut = QStringLiteral("cannot open %1").arg(path);
        }
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        const QString reason = parseError.error != QJsonParseError::NoError
            ? parseError.errorString()
            : QStringLiteral("root is not a JSON object");
        LOG_WARN(drConfig, "ConfigLoader: JSON parse error in %s: %s",
                 qUtf8Printable(path), qUtf8Printable(reason));
        if (errorOut) {
            *errorOut = QStringLiteral("%1: %2").arg(path, reason);
        }
        return std::nullopt;
    }

    return fromJson(doc.object(), errorOut);
}

std::optional<RankingConfig> ConfigLoader::fromJson(const QJsonObject& root, QString* errorOut)
{
    QString error;
    JsonReader reader(&error);
    RankingConfig config = RankingConfig::defaults();

    parseRetrieval(reader, reader.section(root, "retrieval"), config.retrieval);
    parseProfiles(reader, root, config.profiles);
    parseFilters(reader, reader.section(root, "natural_language_filters"), config.filters);
    parseDetection(reader, reader.section(root, "auto_profile_detection"), config.detection,
                   config.profiles);
    parseAlignment(reader, reader.section(root, "dimension_alignment"), config.alignment);
    parseCaching(reader, reader.section(root, "caching"), config.cache);
    parseLogging(reader, reader.section(root, "logging"), config.logging);

    if (reader.ok() && !validateRankingConfig(config, &error)) {
        reader.fail(error);
    }

    if (!reader.ok()) {
        LOG_ERROR(drConfig, "ConfigLoader: rejected configuration: %s", qUtf8Printable(error));
        if (errorOut) {
            *errorOut = error;
        }
        return std::nullopt;
    }

    LOG_INFO(drConfig, "ConfigLoader: loaded %zu profiles, %zu filter phrases",
             config.profiles.size(), config.filters.mappings.size());
    return config;
}

QJsonObject ConfigLoader::toJson(const RankingConfig& config)
{
    QJsonObject retrieval;
    retrieval.insert(QStringLiteral("enable_dimension_ranking"),
                     config.retrieval.enableDimensionRanking);
    retrieval.insert(QStringLiteral("default_strategy"),
                     rankingStrategyToString(config.retrieval.defaultStrategy));
    retrieval.insert(QStringLiteral("max_candidates_multiplier"),
                     config.retrieval.maxCandidatesMultiplier);
    retrieval.insert(QStringLiteral("min_candidates"), config.retrieval.minCandidates);
    retrieval.insert(QStringLiteral("max_processing_time_ms"),
                     config.retrieval.maxProcessingTimeMs);
    retrieval.insert(QStringLiteral("enable_fallback"), config.retrieval.enableFallback);
    retrieval.insert(QStringLiteral("fallback_strategy"),
                     rankingStrategyToString(config.retrieval.fallbackStrategy));
    retrieval.insert(QStringLiteral("scoring_threads"), config.retrieval.scoringThreads);
    retrieval.insert(QStringLiteral("adaptive_timeout_threshold"),
                     config.retrieval.adaptiveTimeoutThreshold);
    retrieval.insert(QStringLiteral("adaptive_recovery_ms"), config.retrieval.adaptiveRecoveryMs);

    QJsonArray profiles;
    for (const ProfileDefinition& profile : config.profiles) {
        QJsonObject weights;
        weights.insert(QStringLiteral("semantic_similarity"), profile.weights.semanticSimilarity);
        weights.insert(QStringLiteral("dimension_alignment"), profile.weights.dimensionAlignment);
        weights.insert(QStringLiteral("recency_score"), profile.weights.recencyScore);
        weights.insert(QStringLiteral("confidence_score"), profile.weights.confidenceScore);

        QJsonObject dimensions;
        for (const auto& [dimension, multiplier] : profile.dimensions) {
            dimensions.insert(dimension, multiplier);
        }

        QJsonObject obj;
        obj.insert(QStringLiteral("id"), profile.id);
        obj.insert(QStringLiteral("description"), profile.description);
        obj.insert(QStringLiteral("target_users"), QJsonArray::fromStringList(profile.targetUsers));
        obj.insert(QStringLiteral("weights"), weights);
        obj.insert(QStringLiteral("dimensions"), dimensions);
        obj.insert(QStringLiteral("patterns"), QJsonArray::fromStringList(profile.patterns));
        profiles.append(obj);
    }

    QJsonArray mappings;
    for (const FilterMapping& mapping : config.filters.mappings) {
        QJsonObject constraints;
        for (const ConstraintSpec& spec : mapping.constraints) {
            if (spec.level == ConstraintLevel::Threshold) {
                constraints.insert(spec.dimension, spec.threshold);
            } else {
                constraints.insert(spec.dimension, constraintLevelToString(spec.level));
            }
        }
        QJsonObject obj;
        obj.insert(QStringLiteral("phrase"), mapping.phrase);
        obj.insert(QStringLiteral("constraints"), constraints);
        if (mapping.confidence.has_value()) {
            obj.insert(QStringLiteral("confidence"), *mapping.confidence);
        }
        mappings.append(obj);
    }

    QJsonObject filters;
    filters.insert(QStringLiteral("enable_parsing"), config.filters.enableParsing);
    filters.insert(QStringLiteral("confidence_threshold"), config.filters.confidenceThreshold);
    filters.insert(QStringLiteral("filter_strength"), config.filters.filterStrength);
    filters.insert(QStringLiteral("high_threshold"), config.filters.highThreshold);
    filters.insert(QStringLiteral("low_threshold"), config.filters.lowThreshold);
    filters.insert(QStringLiteral("default_phrase_confidence"),
                   config.filters.defaultPhraseConfidence);
    filters.insert(QStringLiteral("filter_mappings"), mappings);

    QJsonObject detection;
    detection.insert(QStringLiteral("enable"), config.detection.enabled);
    detection.insert(QStringLiteral("confidence_threshold"), config.detection.confidenceThreshold);

    QJsonObject boost;
    boost.insert(QStringLiteral("enable"), config.alignment.confidenceBoost.enabled);
    boost.insert(QStringLiteral("max_boost"), config.alignment.confidenceBoost.maxBoost);
    boost.insert(QStringLiteral("threshold"), config.alignment.confidenceBoost.threshold);

    QJsonObject bonus;
    bonus.insert(QStringLiteral("enable"), config.alignment.profileBonus.enabled);
    bonus.insert(QStringLiteral("same_profile_bonus"),
                 config.alignment.profileBonus.sameProfileBonus);
    bonus.insert(QStringLiteral("cross_profile_penalty"),
                 config.alignment.profileBonus.crossProfilePenalty);

    QJsonObject alignment;
    alignment.insert(QStringLiteral("alignment_method"),
                     alignmentMethodToString(config.alignment.method));
    alignment.insert(QStringLiteral("normalization"),
                     normalizationModeToString(config.alignment.normalization));
    alignment.insert(QStringLiteral("confidence_boost"), boost);
    alignment.insert(QStringLiteral("profile_bonus"), bonus);

    QJsonObject caching;
    caching.insert(QStringLiteral("enable_dimension_cache"), config.cache.enableDimensionCache);
    caching.insert(QStringLiteral("cache_size"), config.cache.cacheSize);
    caching.insert(QStringLiteral("cache_ttl"), config.cache.cacheTtlSeconds);
    caching.insert(QStringLiteral("enable_query_cache"), config.cache.enableQueryCache);
    caching.insert(QStringLiteral("query_cache_size"), config.cache.queryCacheSize);
    caching.insert(QStringLiteral("query_cache_ttl"), config.cache.queryCacheTtlSeconds);
    caching.insert(QStringLiteral("shard_count"), config.cache.shardCount);

    QJsonObject logging;
    logging.insert(QStringLiteral("level"), config.logging.level);
    logging.insert(QStringLiteral("log_scoring_details"), config.logging.logScoringDetails);
    logging.insert(QStringLiteral("log_performance"), config.logging.logPerformance);
    logging.insert(QStringLiteral("log_filters"), config.logging.logFilters);

    QJsonObject root;
    root.insert(QStringLiteral("retrieval"), retrieval);
    root.insert(QStringLiteral("profiles"), profiles);
    root.insert(QStringLiteral("natural_language_filters"), filters);
    root.insert(QStringLiteral("auto_profile_detection"), detection);
    root.insert(QStringLiteral("dimension_alignment"), alignment);
    root.insert(QStringLiteral("caching"), caching);
    root.insert(QStringLiteral("logging"), logging);
    return root;
}

} // namespace dr
