#pragma once

#include <ragrank/core/types.h>
#include <ragrank/search/retrieval_response.h>

#include <span>
#include <vector>

namespace ragrank::search {

/**
 * @brief Maximal Marginal Relevance re-selection
 *
 * Greedily picks the candidate maximizing
 *   lambda * cos(query, c) - (1 - lambda) * max_{s in selected} cos(c, s)
 * until topK are chosen. The redundancy term is 0 while nothing is selected.
 * The first candidate wins ties. Each pick records `mmrScore`; `score` is left
 * untouched.
 *
 * A candidate without an embedding uses its current `score` as relevance and
 * counts as 0 similarity against selected items.
 */
class MmrSelector {
public:
    static constexpr double kDefaultLambda = 0.7;

    explicit MmrSelector(double lambda = kDefaultLambda);

    /**
     * @brief Select up to topK diverse candidates
     *
     * Returns the candidates unchanged when there are no more than topK of
     * them. Any computational problem (missing query embedding, dimension
     * mismatch, non-finite score) yields the first topK of the input order as
     * a degraded outcome.
     */
    StageOutcome select(const std::vector<ScoredChunk>& candidates,
                        std::span<const float> queryEmbedding, size_t topK) const;

    double lambda() const { return lambda_; }

private:
    Result<std::vector<ScoredChunk>> selectGreedy(const std::vector<ScoredChunk>& candidates,
                                                  std::span<const float> queryEmbedding,
                                                  size_t topK) const;

    double lambda_;
};

} // namespace ragrank::search
