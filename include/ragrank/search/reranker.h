#pragma once

#include <ragrank/core/types.h>
#include <ragrank/search/retrieval_response.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace ragrank::search {

/**
 * @brief Interface for cross-encoder document reranking
 *
 * Rerankers score query-document pairs jointly, which is more precise than
 * comparing independent embeddings. Used as a second stage after retrieval.
 *
 * Implementations must be thread-safe. With a deadline configured, a call
 * that overruns keeps running on a detached thread and can overlap the next
 * request's call on the same instance.
 */
class IReranker {
public:
    virtual ~IReranker() = default;

    /**
     * @brief Score documents against a query in one batch
     *
     * @return One score per document, same order as the input, or an error
     */
    virtual Result<std::vector<float>> scoreDocuments(const std::string& query,
                                                      const std::vector<std::string>& documents) = 0;

    /**
     * @brief Check if the reranker is ready to accept requests
     */
    virtual bool isReady() const = 0;
};

struct RerankConfig {
    /// Deadline for the scoring call; zero waits for completion
    std::chrono::milliseconds timeout{0};
};

/**
 * @brief Reorders a candidate batch with an external reranker
 *
 * Callers should over-fetch (about 3x the final count) before reranking. On
 * success every chunk gets `rerankerScore`, its previous score moves to
 * `originalScore`, and `score` becomes the reranker score; the list is sorted
 * and truncated to topK.
 *
 * If the reranker is missing, not ready, fails, returns a mismatched number of
 * scores, or misses the deadline, the first topK chunks are returned in input
 * order and the outcome is marked degraded. Nothing is partially reranked.
 */
class RerankOrchestrator {
public:
    explicit RerankOrchestrator(std::shared_ptr<IReranker> reranker, const RerankConfig& config = {});

    StageOutcome rerank(const std::string& query, std::vector<ScoredChunk> chunks,
                        size_t topK) const;

    bool available() const { return reranker_ && reranker_->isReady(); }

private:
    Result<std::vector<float>> invoke(const std::string& query,
                                      std::vector<std::string> documents) const;

    std::shared_ptr<IReranker> reranker_;
    RerankConfig config_;
};

} // namespace ragrank::search
