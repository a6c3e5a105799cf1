#pragma once

#include "core/shared/ranking_config.h"

#include <QRegularExpression>
#include <QString>
#include <QStringList>

#include <vector>

namespace dr {

// One active dimension constraint extracted from the query text.
struct FilterConstraint {
    QString dimension;
    ConstraintLevel level = ConstraintLevel::High;
    double threshold = 0.0;     // Only meaningful for ConstraintLevel::Threshold
    QString phrase;             // Phrase that produced the constraint
    double confidence = 0.0;
};

// FilterParser -- maps natural-language filter phrases ("high quality",
// "simple") to dimension constraints.
//
// Matching is case-insensitive whole-phrase matching against patterns
// compiled once from the configured mappings. Every phrase that occurs
// fires; constraints are unioned in declaration order.
class FilterParser {
public:
    explicit FilterParser(const FilterConfig& config);

    // Empty when parsing is disabled or no phrase clears the confidence
    // threshold. No side effects.
    std::vector<FilterConstraint> parse(const QString& queryText) const;

    // Phrases present in the text, regardless of confidence
    QStringList matchedPhrases(const QString& queryText) const;

    bool isEnabled() const { return m_enabled; }

private:
    struct CompiledMapping {
        QString phrase;
        QRegularExpression pattern;
        std::vector<ConstraintSpec> constraints;
        double confidence = 0.0;
    };

    bool m_enabled = true;
    double m_confidenceThreshold = 0.6;
    std::vector<CompiledMapping> m_mappings;
};

} // namespace dr
