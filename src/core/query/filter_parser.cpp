#include "core/query/filter_parser.h"
#include "core/shared/logging.h"

#include <QStringList>

#include <algorithm>

namespace dr {

namespace {

bool sameConstraint(const FilterConstraint& lhs, const FilterConstraint& rhs)
{
    if (lhs.dimension != rhs.dimension || lhs.level != rhs.level) {
        return false;
    }
    return lhs.level != ConstraintLevel::Threshold || lhs.threshold == rhs.threshold;
}

} // namespace

FilterParser::FilterParser(const FilterConfig& config)
    : m_enabled(config.enableParsing)
    , m_confidenceThreshold(config.confidenceThreshold)
{
    m_mappings.reserve(config.mappings.size());
    for (const FilterMapping& mapping : config.mappings) {
        // Whitespace inside a phrase matches any run of whitespace.
        const QStringList words =
            mapping.phrase.simplified().split(QLatin1Char(' '), Qt::SkipEmptyParts);
        QStringList escaped;
        escaped.reserve(words.size());
        for (const QString& word : words) {
            escaped.append(QRegularExpression::escape(word));
        }

        CompiledMapping compiled;
        compiled.phrase = mapping.phrase;
        compiled.pattern = QRegularExpression(
            QStringLiteral("\\b%1\\b").arg(escaped.join(QStringLiteral("\\s+"))),
            QRegularExpression::CaseInsensitiveOption);
        compiled.pattern.optimize();
        compiled.constraints = mapping.constraints;
        compiled.confidence = mapping.confidence.value_or(config.defaultPhraseConfidence);
        m_mappings.push_back(std::move(compiled));
    }
}

std::vector<FilterConstraint> FilterParser::parse(const QString& queryText) const
{
    std::vector<FilterConstraint> constraints;
    if (!m_enabled || queryText.isEmpty()) {
        return constraints;
    }

    for (const CompiledMapping& mapping : m_mappings) {
        if (!mapping.pattern.match(queryText).hasMatch()) {
            continue;
        }
        if (mapping.confidence < m_confidenceThreshold) {
            LOG_DEBUG(drFilters, "parse: phrase='%s' below threshold (%.2f < %.2f)",
                      qUtf8Printable(mapping.phrase), mapping.confidence,
                      m_confidenceThreshold);
            continue;
        }

        for (const ConstraintSpec& spec : mapping.constraints) {
            FilterConstraint constraint;
            constraint.dimension = spec.dimension;
            constraint.level = spec.level;
            constraint.threshold = spec.threshold;
            constraint.phrase = mapping.phrase;
            constraint.confidence = mapping.confidence;

            const bool duplicate = std::any_of(
                constraints.begin(), constraints.end(),
                [&](const FilterConstraint& existing) {
                    return sameConstraint(existing, constraint);
                });
            if (!duplicate) {
                constraints.push_back(std::move(constraint));
            }
        }

        LOG_DEBUG(drFilters, "parse: phrase='%s' fired (%zu constraints so far)",
                  qUtf8Printable(mapping.phrase), constraints.size());
    }

    return constraints;
}

QStringList FilterParser::matchedPhrases(const QString& queryText) const
{
    QStringList phrases;
    for (const CompiledMapping& mapping : m_mappings) {
        if (mapping.pattern.match(queryText).hasMatch()) {
            phrases.append(mapping.phrase);
        }
    }
    return phrases;
}

} // namespace dr
