#include "core/shared/chunk.h"

namespace dr {

std::optional<double> averageConfidence(const DimensionScoreMap& scores)
{
    double sum = 0.0;
    int count = 0;
    for (const auto& [dimension, score] : scores) {
        Q_UNUSED(dimension);
        if (score.confidence.has_value()) {
            sum += *score.confidence;
            ++count;
        }
    }
    if (count == 0) {
        return std::nullopt;
    }
    return sum / static_cast<double>(count);
}

} // namespace dr
