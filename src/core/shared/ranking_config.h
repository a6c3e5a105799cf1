#pragma once

#include "core/shared/scoring_types.h"

#include <QString>
#include <QStringList>

#include <map>
#include <optional>
#include <vector>

namespace dr {

enum class RankingStrategy {
    VectorOnly,
    DimensionOnly,
    Hybrid,
    Adaptive,
};

// The path a single query actually takes
enum class RankingMode {
    Hybrid,         // Full blend of the four factors
    DimensionOnly,  // Composite score is the dimension alignment alone
    VectorOnly,     // Similarity order, no dimension scoring
};

enum class AlignmentMethod {
    Min,
    Max,
    Average,
    WeightedAverage,
};

enum class NormalizationMode {
    None,
    TotalWeight,
    MaxWeight,
};

enum class ConstraintLevel {
    Low,
    High,
    Threshold,
};

QString rankingStrategyToString(RankingStrategy strategy);
std::optional<RankingStrategy> rankingStrategyFromString(const QString& str);
QString rankingModeToString(RankingMode mode);
QString alignmentMethodToString(AlignmentMethod method);
std::optional<AlignmentMethod> alignmentMethodFromString(const QString& str);
QString normalizationModeToString(NormalizationMode mode);
std::optional<NormalizationMode> normalizationModeFromString(const QString& str);
QString constraintLevelToString(ConstraintLevel level);

// "retrieval" section
struct RetrievalConfig {
    bool enableDimensionRanking = true;
    RankingStrategy defaultStrategy = RankingStrategy::Hybrid;
    int maxCandidatesMultiplier = 4;   // Fetch N * multiplier candidates
    int minCandidates = 20;
    int maxProcessingTimeMs = 200;
    bool enableFallback = true;
    RankingStrategy fallbackStrategy = RankingStrategy::VectorOnly;

    // Engine knobs with no counterpart in the original file
    int scoringThreads = 1;
    int adaptiveTimeoutThreshold = 3;  // Consecutive timeouts before downgrade
    int adaptiveRecoveryMs = 30000;    // Downgrade length before a retry
};

struct ProfileDefinition {
    QString id;
    QString description;
    QStringList targetUsers;
    FactorWeights weights;
    std::map<QString, double> dimensions;   // dimension -> multiplier
    QStringList patterns;                   // Detection patterns, ordered
};

struct ConstraintSpec {
    QString dimension;
    ConstraintLevel level = ConstraintLevel::High;
    double threshold = 0.0;   // Only meaningful for ConstraintLevel::Threshold
};

struct FilterMapping {
    QString phrase;
    std::vector<ConstraintSpec> constraints;
    std::optional<double> confidence;   // Falls back to defaultPhraseConfidence
};

// "natural_language_filters" section
struct FilterConfig {
    bool enableParsing = true;
    double confidenceThreshold = 0.6;
    double filterStrength = 0.5;        // 0 = no penalty, 1 = zero out
    double highThreshold = 0.5;
    double lowThreshold = 0.5;
    double defaultPhraseConfidence = 0.8;
    std::vector<FilterMapping> mappings;
};

// "auto_profile_detection" section; patterns live on each profile
struct ProfileDetectionConfig {
    bool enabled = true;
    double confidenceThreshold = 0.7;
};

struct ConfidenceBoostConfig {
    bool enabled = true;
    double maxBoost = 0.1;
    double threshold = 0.5;
};

struct ProfileBonusConfig {
    bool enabled = true;
    double sameProfileBonus = 0.05;
    double crossProfilePenalty = 0.0;
};

// "dimension_alignment" section
struct AlignmentConfig {
    AlignmentMethod method = AlignmentMethod::Min;
    NormalizationMode normalization = NormalizationMode::TotalWeight;
    ConfidenceBoostConfig confidenceBoost;
    ProfileBonusConfig profileBonus;
};

// "caching" section
struct CacheConfig {
    bool enableDimensionCache = true;
    int cacheSize = 1000;
    int cacheTtlSeconds = 3600;
    bool enableQueryCache = true;
    int queryCacheSize = 100;
    int queryCacheTtlSeconds = 3600;
    int shardCount = 8;
};

// "logging" section
struct LoggingConfig {
    QString level = QStringLiteral("INFO");
    bool logScoringDetails = false;
    bool logPerformance = true;
    bool logFilters = false;
};

struct RankingConfig {
    RetrievalConfig retrieval;
    std::vector<ProfileDefinition> profiles;
    FilterConfig filters;
    ProfileDetectionConfig detection;
    AlignmentConfig alignment;
    CacheConfig cache;
    LoggingConfig logging;

    // Shipped defaults: four profiles, the stock filter phrases and
    // detection patterns.
    static RankingConfig defaults();
};

// Checks one profile: non-empty id, weights summing to 1.0 within
// kWeightSumTolerance, positive multipliers, compilable patterns.
bool validateProfileDefinition(const ProfileDefinition& profile, QString* errorOut = nullptr);

// Checks every invariant of the config, profiles included. Returns false and
// fills errorOut on the first violation.
bool validateRankingConfig(const RankingConfig& config, QString* errorOut = nullptr);

} // namespace dr
