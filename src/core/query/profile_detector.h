#pragma once

#include <QString>

namespace dr {

class ProfileRegistry;

struct ProfileDetection {
    QString profileId;
    double confidence = 0.0;
    bool detected = false;   // False when the default profile was used
};

// ProfileDetector -- picks the profile whose detection patterns best cover
// the query.
//
// Confidence for a profile is the fraction of its distinct patterns that
// match, so profiles with many overlapping patterns gain no advantage. The
// best profile must reach the confidence threshold, otherwise the default
// profile is returned. Ties go to the profile declared first.
class ProfileDetector {
public:
    ProfileDetector(bool enabled, double confidenceThreshold);

    ProfileDetection detect(const QString& queryText, const ProfileRegistry& registry) const;

    // Fraction of the profile's patterns present in the text; 0 for a
    // profile without patterns or an unknown id.
    static double patternCoverage(const QString& queryText,
                                  const ProfileRegistry& registry,
                                  const QString& profileId);

private:
    bool m_enabled = true;
    double m_confidenceThreshold = 0.7;
};

} // namespace dr
