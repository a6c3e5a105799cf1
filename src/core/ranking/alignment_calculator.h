#pragma once

#include "core/query/filter_parser.h"
#include "core/shared/chunk.h"
#include "core/shared/ranking_config.h"
#include "core/shared/scoring_types.h"

#include <QString>

#include <vector>

namespace dr {

struct Profile;
class ProfileRegistry;

struct AlignmentResult {
    double score = 0.0;   // Always within [0,1]
    AlignmentBreakdown breakdown;
};

// AlignmentCalculator -- how well a chunk's dimension scores match the
// active profile and the query's filter constraints.
//
//   1. per dimension: chunk value * profile multiplier, multiplied by
//      (1 - filterStrength) for every constraint the raw value fails
//   2. aggregate with the configured method (min/max/average/weighted)
//   3. normalize by total or max multiplier
//   4. confidence boost when the chunk's mean confidence clears the threshold
//   5. same-profile bonus / cross-profile penalty
//
// Dimensions the chunk carries no score for are skipped. The result is
// clamped to [0,1] after every step that can leave the range.
class AlignmentCalculator {
public:
    AlignmentCalculator(const AlignmentConfig& config, const FilterConfig& filterConfig);

    AlignmentResult compute(const DimensionScoreMap& scores,
                            const Profile& profile,
                            const std::vector<FilterConstraint>& constraints,
                            const ProfileRegistry& registry) const;

    // True when the raw dimension value satisfies the constraint
    bool constraintSatisfied(const FilterConstraint& constraint, double value) const;

    // Profile whose dimensions the chunk scores best on (multiplier-weighted
    // mean over the dimensions they share). Empty when the chunk shares no
    // dimension with any profile. Ties go to the profile declared first.
    static QString bestMatchingProfile(const DimensionScoreMap& scores,
                                       const ProfileRegistry& registry);

    const AlignmentConfig& config() const { return m_config; }

private:
    struct Contribution {
        double value = 0.0;
        double multiplier = 1.0;
    };

    double aggregate(const std::vector<Contribution>& contributions) const;
    double normalize(double aggregate, const std::vector<Contribution>& contributions) const;
    double confidenceBoost(const DimensionScoreMap& matched) const;

    AlignmentConfig m_config;
    double m_filterStrength = 0.5;
    double m_highThreshold = 0.5;
    double m_lowThreshold = 0.5;
};

} // namespace dr
