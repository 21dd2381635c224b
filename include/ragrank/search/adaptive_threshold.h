#pragma once

#include <ragrank/core/chunk.h>

#include <vector>

namespace ragrank::search {

/**
 * @brief Cut-off selection for single-signal (semantic) result batches
 *
 * The threshold follows the confidence of the best match:
 * - top score above highConfidenceScore: strictThreshold
 * - top score below lowConfidenceScore: lenientThreshold
 * - otherwise the caller's base threshold
 *
 * Never apply this to fused rankings; RRF scores live on a different scale.
 */
struct AdaptiveThresholdConfig {
    double highConfidenceScore = 0.7;
    double strictThreshold = 0.5;
    double lowConfidenceScore = 0.4;
    double lenientThreshold = 0.2;
};

struct ThresholdResult {
    double threshold = 0.0;
    std::vector<ScoredChunk> kept;
    size_t dropped = 0;
};

class AdaptiveThreshold {
public:
    explicit AdaptiveThreshold(const AdaptiveThresholdConfig& config = {});

    /**
     * @brief Choose the threshold for scores sorted in descending order
     *
     * An empty batch returns the base threshold unchanged.
     */
    double compute(const std::vector<double>& descendingScores, double baseThreshold = 0.3) const;

    /**
     * @brief Drop chunks whose score is below the adaptive threshold
     *
     * Chunks are expected highest score first; the first one decides the threshold.
     */
    ThresholdResult apply(std::vector<ScoredChunk> chunks, double baseThreshold = 0.3) const;

private:
    AdaptiveThresholdConfig config_;
};

} // namespace ragrank::search
