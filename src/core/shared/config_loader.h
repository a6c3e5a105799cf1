#pragma once

#include "core/shared/ranking_config.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace dr {

// ConfigLoader -- reads the ranking configuration from JSON.
//
// The layout mirrors the original YAML sections (retrieval, profiles,
// natural_language_filters, auto_profile_detection, dimension_alignment,
// caching, logging). Profiles and filter mappings are JSON arrays because
// their declaration order is significant. Absent sections and keys keep
// RankingConfig::defaults(); present keys with the wrong type, unknown enum
// names and invariant violations make the whole load fail.
class ConfigLoader {
public:
    static std::optional<RankingConfig> loadFromFile(const QString& path,
                                                     QString* errorOut = nullptr);
    static std::optional<RankingConfig> fromJson(const QJsonObject& root,
                                                 QString* errorOut = nullptr);

    static QJsonObject toJson(const RankingConfig& config);
};

} // namespace dr
