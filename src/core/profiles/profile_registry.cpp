#include "core/profiles/profile_registry.h"
#include "core/shared/logging.h"

#include <QSet>

#include <atomic>

namespace dr {

namespace {

std::atomic<uint64_t> g_nextGeneration{1};

} // namespace

double Profile::multiplier(const QString& dimension) const
{
    const auto it = dimensions.find(dimension);
    return it != dimensions.end() ? it->second : 1.0;
}

bool Profile::hasDimension(const QString& dimension) const
{
    return dimensions.find(dimension) != dimensions.end();
}

std::shared_ptr<const ProfileRegistry> ProfileRegistry::create(
    const std::vector<ProfileDefinition>& definitions,
    QString* errorOut)
{
    // Not make_shared: the constructor is private.
    std::shared_ptr<ProfileRegistry> registry(new ProfileRegistry());
    registry->m_profiles.reserve(definitions.size());

    for (const ProfileDefinition& definition : definitions) {
        QString error;
        if (!validateProfileDefinition(definition, &error)) {
            LOG_ERROR(drConfig, "ProfileRegistry: %s", qUtf8Printable(error));
            if (errorOut) {
                *errorOut = error;
            }
            return nullptr;
        }
        if (registry->m_indexById.contains(definition.id)) {
            const QString message =
                QStringLiteral("duplicate profile id '%1'").arg(definition.id);
            LOG_ERROR(drConfig, "ProfileRegistry: %s", qUtf8Printable(message));
            if (errorOut) {
                *errorOut = message;
            }
            return nullptr;
        }

        Profile profile;
        profile.id = definition.id;
        profile.description = definition.description;
        profile.targetUsers = definition.targetUsers;
        profile.weights = definition.weights;
        profile.dimensions = definition.dimensions;
        profile.patterns.reserve(static_cast<size_t>(definition.patterns.size()));
        // Detection confidence counts distinct patterns; a repeat would weigh twice.
        QSet<QString> seenPatterns;
        for (const QString& source : definition.patterns) {
            if (seenPatterns.contains(source)) {
                LOG_WARN(drConfig, "ProfileRegistry: '%s' repeats pattern '%s', ignoring",
                         qUtf8Printable(definition.id), qUtf8Printable(source));
                continue;
            }
            seenPatterns.insert(source);
            profile.patternSources.append(source);
            QRegularExpression re(source, QRegularExpression::CaseInsensitiveOption);
            re.optimize();
            profile.patterns.push_back(std::move(re));
        }

        registry->m_indexById.insert(profile.id, static_cast<int>(registry->m_profiles.size()));
        registry->m_profiles.push_back(std::move(profile));
    }

    const auto defaultIt = registry->m_indexById.constFind(QLatin1String(kDefaultProfileId));
    if (defaultIt == registry->m_indexById.constEnd()) {
        const QString message = QStringLiteral("the '%1' profile is required")
                                    .arg(QLatin1String(kDefaultProfileId));
        LOG_ERROR(drConfig, "ProfileRegistry: %s", qUtf8Printable(message));
        if (errorOut) {
            *errorOut = message;
        }
        return nullptr;
    }
    registry->m_defaultIndex = defaultIt.value();
    registry->m_generation = g_nextGeneration.fetch_add(1);

    LOG_INFO(drConfig, "ProfileRegistry: loaded %zu profiles (generation %llu)",
             registry->m_profiles.size(),
             static_cast<unsigned long long>(registry->m_generation));
    return registry;
}

const Profile* ProfileRegistry::find(const QString& profileId) const
{
    const auto it = m_indexById.constFind(profileId);
    if (it == m_indexById.constEnd()) {
        return nullptr;
    }
    return &m_profiles[static_cast<size_t>(it.value())];
}

bool ProfileRegistry::contains(const QString& profileId) const
{
    return m_indexById.contains(profileId);
}

const Profile& ProfileRegistry::defaultProfile() const
{
    return m_profiles[static_cast<size_t>(m_defaultIndex)];
}

} // namespace dr
