#include "core/ranking/alignment_calculator.h"
#include "core/profiles/profile_registry.h"
#include "core/shared/logging.h"

#include <QSet>

#include <algorithm>
#include <cmath>

namespace dr {

namespace {

double clampUnit(double value)
{
    if (!std::isfinite(value)) {
        return value > 0.0 ? 1.0 : 0.0;
    }
    return std::clamp(value, 0.0, 1.0);
}

double finiteOrZero(double value)
{
    return std::isfinite(value) ? value : 0.0;
}

} // namespace

AlignmentCalculator::AlignmentCalculator(const AlignmentConfig& config,
                                         const FilterConfig& filterConfig)
    : m_config(config)
    , m_filterStrength(filterConfig.filterStrength)
    , m_highThreshold(filterConfig.highThreshold)
    , m_lowThreshold(filterConfig.lowThreshold)
{
}

bool AlignmentCalculator::constraintSatisfied(const FilterConstraint& constraint,
                                              double value) const
{
    switch (constraint.level) {
    case ConstraintLevel::High:
        return value >= m_highThreshold;
    case ConstraintLevel::Low:
        return value <= m_lowThreshold;
    case ConstraintLevel::Threshold:
        return value >= constraint.threshold;
    }
    return true;
}

double AlignmentCalculator::aggregate(const std::vector<Contribution>& contributions) const
{
    if (contributions.empty()) {
        return 0.0;
    }

    switch (m_config.method) {
    case AlignmentMethod::Min: {
        double result = contributions.front().value;
        for (const Contribution& c : contributions) {
            result = std::min(result, c.value);
        }
        return result;
    }
    case AlignmentMethod::Max: {
        double result = contributions.front().value;
        for (const Contribution& c : contributions) {
            result = std::max(result, c.value);
        }
        return result;
    }
    case AlignmentMethod::Average: {
        double sum = 0.0;
        for (const Contribution& c : contributions) {
            sum += c.value;
        }
        return sum / static_cast<double>(contributions.size());
    }
    case AlignmentMethod::WeightedAverage: {
        double weightedSum = 0.0;
        double weightTotal = 0.0;
        for (const Contribution& c : contributions) {
            weightedSum += c.value * c.multiplier;
            weightTotal += c.multiplier;
        }
        return weightTotal > 0.0 ? weightedSum / weightTotal : 0.0;
    }
    }
    return 0.0;
}

double AlignmentCalculator::normalize(double aggregate,
                                      const std::vector<Contribution>& contributions) const
{
    switch (m_config.normalization) {
    case NormalizationMode::None:
        return aggregate;
    case NormalizationMode::TotalWeight: {
        double total = 0.0;
        for (const Contribution& c : contributions) {
            total += c.multiplier;
        }
        return total > 0.0 ? aggregate / total : 0.0;
    }
    case NormalizationMode::MaxWeight: {
        double largest = 0.0;
        for (const Contribution& c : contributions) {
            largest = std::max(largest, c.multiplier);
        }
        return largest > 0.0 ? aggregate / largest : 0.0;
    }
    }
    return aggregate;
}

double AlignmentCalculator::confidenceBoost(const DimensionScoreMap& matched) const
{
    const ConfidenceBoostConfig& boost = m_config.confidenceBoost;
    if (!boost.enabled || boost.maxBoost <= 0.0) {
        return 0.0;
    }

    const std::optional<double> average = averageConfidence(matched);
    if (!average.has_value() || !std::isfinite(*average) || *average < boost.threshold) {
        return 0.0;
    }

    const double headroom = 1.0 - boost.threshold;
    if (headroom <= 0.0) {
        return boost.maxBoost;
    }
    const double fraction = std::clamp((*average - boost.threshold) / headroom, 0.0, 1.0);
    return boost.maxBoost * fraction;
}

AlignmentResult AlignmentCalculator::compute(const DimensionScoreMap& scores,
                                             const Profile& profile,
                                             const std::vector<FilterConstraint>& constraints,
                                             const ProfileRegistry& registry) const
{
    AlignmentResult result;
    AlignmentBreakdown& breakdown = result.breakdown;

    // Profile dimensions first, then constrained dimensions the profile
    // does not name, in constraint order.
    std::vector<QString> considered;
    considered.reserve(profile.dimensions.size() + constraints.size());
    QSet<QString> seen;
    for (const auto& [dimension, multiplier] : profile.dimensions) {
        Q_UNUSED(multiplier);
        considered.push_back(dimension);
        seen.insert(dimension);
    }
    for (const FilterConstraint& constraint : constraints) {
        if (!seen.contains(constraint.dimension)) {
            considered.push_back(constraint.dimension);
            seen.insert(constraint.dimension);
        }
    }

    std::vector<Contribution> contributions;
    contributions.reserve(considered.size());
    DimensionScoreMap matched;
    for (const QString& dimension : considered) {
        const auto scoreIt = scores.find(dimension);
        if (scoreIt == scores.end()) {
            continue;
        }
        const double raw = finiteOrZero(scoreIt->second.value);
        const double multiplier = profile.multiplier(dimension);

        double factor = 1.0;
        for (const FilterConstraint& constraint : constraints) {
            if (constraint.dimension == dimension && !constraintSatisfied(constraint, raw)) {
                factor *= (1.0 - m_filterStrength);
                ++breakdown.penalizedDimensions;
                LOG_DEBUG(drFilters, "compute: '%s'=%.3f fails %s constraint from '%s'",
                          qUtf8Printable(dimension), raw,
                          qUtf8Printable(constraintLevelToString(constraint.level)),
                          qUtf8Printable(constraint.phrase));
            }
        }

        contributions.push_back({raw * multiplier * factor, multiplier});
        matched.emplace(dimension, scoreIt->second);
    }

    breakdown.matchedDimensions = static_cast<int>(contributions.size());
    if (contributions.empty()) {
        return result;
    }

    breakdown.aggregate = aggregate(contributions);
    breakdown.normalized = clampUnit(normalize(breakdown.aggregate, contributions));
    double score = breakdown.normalized;

    breakdown.confidenceBoost = confidenceBoost(matched);
    score = std::min(1.0, score + breakdown.confidenceBoost);

    const ProfileBonusConfig& bonus = m_config.profileBonus;
    if (bonus.enabled) {
        breakdown.bestMatchingProfile = bestMatchingProfile(scores, registry);
        if (!breakdown.bestMatchingProfile.isEmpty()) {
            breakdown.profileAdjustment = breakdown.bestMatchingProfile == profile.id
                ? bonus.sameProfileBonus
                : -bonus.crossProfilePenalty;
            score += breakdown.profileAdjustment;
        }
    }

    result.score = clampUnit(score);
    return result;
}

QString AlignmentCalculator::bestMatchingProfile(const DimensionScoreMap& scores,
                                                 const ProfileRegistry& registry)
{
    QString bestId;
    double bestScore = -1.0;
    for (const Profile& profile : registry.profiles()) {
        double weightedSum = 0.0;
        double weightTotal = 0.0;
        for (const auto& [dimension, multiplier] : profile.dimensions) {
            const auto scoreIt = scores.find(dimension);
            if (scoreIt == scores.end()) {
                continue;
            }
            weightedSum += finiteOrZero(scoreIt->second.value) * multiplier;
            weightTotal += multiplier;
        }
        if (weightTotal <= 0.0) {
            continue;
        }
        const double mean = weightedSum / weightTotal;
        if (mean > bestScore) {
            bestScore = mean;
            bestId = profile.id;
        }
    }
    return bestId;
}

} // namespace dr
