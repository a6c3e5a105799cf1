#pragma once

#include "core/shared/ranking_config.h"
#include "core/shared/scoring_types.h"

#include <QHash>
#include <QRegularExpression>
#include <QString>
#include <QStringList>

#include <cstdint>
#include <map>
#include <memory>
#include <vector>

namespace dr {

// A validated scoring profile with its detection patterns compiled.
struct Profile {
    QString id;
    QString description;
    QStringList targetUsers;
    FactorWeights weights;
    std::map<QString, double> dimensions;
    QStringList patternSources;
    std::vector<QRegularExpression> patterns;

    // Multiplier for a dimension; 1.0 when the profile does not name it.
    double multiplier(const QString& dimension) const;
    bool hasDimension(const QString& dimension) const;
};

// ProfileRegistry -- immutable snapshot of every loaded profile.
//
// Built once by create(); a reload builds a new snapshot and callers swap
// the shared pointer, so readers never lock and never see a half-built
// registry. Declaration order is preserved because detection tie-breaks
// depend on it.
class ProfileRegistry {
public:
    static constexpr const char* kDefaultProfileId = "general";

    // Validates every definition and compiles its patterns. Any violation
    // fails the whole load: returns nullptr and fills errorOut.
    static std::shared_ptr<const ProfileRegistry> create(
        const std::vector<ProfileDefinition>& definitions,
        QString* errorOut = nullptr);

    ProfileRegistry(const ProfileRegistry&) = delete;
    ProfileRegistry& operator=(const ProfileRegistry&) = delete;

    // nullptr when no profile has this id
    const Profile* find(const QString& profileId) const;
    bool contains(const QString& profileId) const;

    // The "general" profile, always present in a valid registry
    const Profile& defaultProfile() const;

    const std::vector<Profile>& profiles() const { return m_profiles; }

    // Unique per snapshot; part of the cache fingerprint so alignment scores
    // computed against an older snapshot are never reused.
    uint64_t generation() const { return m_generation; }

private:
    ProfileRegistry() = default;

    std::vector<Profile> m_profiles;
    QHash<QString, int> m_indexById;
    int m_defaultIndex = -1;
    uint64_t m_generation = 0;
};

} // namespace dr
