#include <ragrank/search/adaptive_threshold.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace ragrank::search {

AdaptiveThreshold::AdaptiveThreshold(const AdaptiveThresholdConfig& config) : config_(config) {}

double AdaptiveThreshold::compute(const std::vector<double>& descendingScores,
                                  double baseThreshold) const {
    if (descendingScores.empty()) {
        return baseThreshold;
    }

    const double topScore = descendingScores.front();

    if (topScore > config_.highConfidenceScore) {
        spdlog::debug("High top score ({:.3f}) - using stricter threshold: {}", topScore,
                      config_.strictThreshold);
        return config_.strictThreshold;
    }

    if (topScore < config_.lowConfidenceScore) {
        spdlog::debug("Low top score ({:.3f}) - using lenient threshold: {}", topScore,
                      config_.lenientThreshold);
        return config_.lenientThreshold;
    }

    spdlog::debug("Medium top score ({:.3f}) - using base threshold: {}", topScore, baseThreshold);
    return baseThreshold;
}

ThresholdResult AdaptiveThreshold::apply(std::vector<ScoredChunk> chunks,
                                         double baseThreshold) const {
    std::vector<double> scores;
    scores.reserve(chunks.size());
    for (const auto& c : chunks) {
        scores.push_back(c.score);
    }

    ThresholdResult result;
    result.threshold = compute(scores, baseThreshold);

    const size_t before = chunks.size();
    std::erase_if(chunks, [&](const ScoredChunk& c) { return c.score < result.threshold; });
    result.dropped = before - chunks.size();
    result.kept = std::move(chunks);
    return result;
}

} // namespace ragrank::search
