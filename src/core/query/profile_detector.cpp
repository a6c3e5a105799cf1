#include "core/query/profile_detector.h"
#include "core/profiles/profile_registry.h"
#include "core/shared/logging.h"

namespace dr {

namespace {

double coverage(const QString& queryText, const Profile& profile)
{
    if (profile.patterns.empty()) {
        return 0.0;
    }
    int matched = 0;
    for (const QRegularExpression& pattern : profile.patterns) {
        if (pattern.match(queryText).hasMatch()) {
            ++matched;
        }
    }
    return static_cast<double>(matched) / static_cast<double>(profile.patterns.size());
}

} // namespace

ProfileDetector::ProfileDetector(bool enabled, double confidenceThreshold)
    : m_enabled(enabled)
    , m_confidenceThreshold(confidenceThreshold)
{
}

ProfileDetection ProfileDetector::detect(const QString& queryText,
                                         const ProfileRegistry& registry) const
{
    ProfileDetection fallback;
    fallback.profileId = registry.defaultProfile().id;

    if (!m_enabled || queryText.trimmed().isEmpty()) {
        return fallback;
    }

    const Profile* best = nullptr;
    double bestConfidence = 0.0;
    for (const Profile& profile : registry.profiles()) {
        const double confidence = coverage(queryText, profile);
        // Strictly greater: the first declared profile keeps a tie.
        if (confidence > bestConfidence) {
            best = &profile;
            bestConfidence = confidence;
        }
    }

    if (!best || bestConfidence < m_confidenceThreshold) {
        LOG_DEBUG(drRanking, "detect: no profile reached %.2f (best=%.2f), using '%s'",
                  m_confidenceThreshold, bestConfidence, qUtf8Printable(fallback.profileId));
        fallback.confidence = bestConfidence;
        return fallback;
    }

    ProfileDetection detection;
    detection.profileId = best->id;
    detection.confidence = bestConfidence;
    detection.detected = true;
    LOG_DEBUG(drRanking, "detect: profile='%s' confidence=%.2f",
              qUtf8Printable(detection.profileId), detection.confidence);
    return detection;
}

double ProfileDetector::patternCoverage(const QString& queryText,
                                        const ProfileRegistry& registry,
                                        const QString& profileId)
{
    const Profile* profile = registry.find(profileId);
    return profile ? coverage(queryText, *profile) : 0.0;
}

} // namespace dr
