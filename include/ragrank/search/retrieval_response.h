#pragma once

#include <ragrank/core/chunk.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ragrank::search {

/**
 * @brief Result of a ranking stage that may fall back to its input order
 *
 * Stages that depend on an external model or on numerically fragile input
 * report a degraded outcome instead of failing the request. `reason` is empty
 * when the stage completed normally.
 */
struct StageOutcome {
    std::vector<ScoredChunk> chunks;
    bool degraded = false;
    std::string reason;

    static StageOutcome completed(std::vector<ScoredChunk> chunks) {
        return StageOutcome{std::move(chunks), false, {}};
    }

    static StageOutcome fallback(std::vector<ScoredChunk> chunks, std::string reason) {
        return StageOutcome{std::move(chunks), true, std::move(reason)};
    }
};

/**
 * @brief Complete output of one pipeline run, as stored in the response cache
 */
struct RetrievalResponse {
    std::vector<ScoredChunk> chunks;

    std::string processedQuery;
    std::vector<std::string> queryTerms;
    std::string searchMethod; // "hybrid", "vector" or "lexical"
    bool rerankerUsed = false;
    bool mmrUsed = false;
    bool cached = false;

    std::optional<double> adaptiveThreshold; // Semantic-only retrieval
    size_t candidateCount = 0;               // Chunks considered before truncation
    std::vector<std::string> degradedStages;
    int64_t executionTimeMs = 0;

    [[nodiscard]] bool hasResults() const { return !chunks.empty(); }
    [[nodiscard]] bool isDegraded() const { return !degradedStages.empty(); }
};

} // namespace ragrank::search
