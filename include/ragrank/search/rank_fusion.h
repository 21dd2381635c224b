#pragma once

#include <ragrank/core/chunk.h>

#include <vector>

namespace ragrank::search {

/**
 * @brief Origin of a ranked list fed into fusion
 */
enum class RankSource { Vector, BM25, Other };

struct RankedList {
    RankSource source = RankSource::Other;
    std::vector<ScoredChunk> chunks; // Best first
};

/**
 * @brief Reciprocal Rank Fusion
 *
 * rrf(id) = sum over lists containing id of 1 / (k + rank), rank 1-based.
 * Output is sorted by rrf descending; ties keep the order in which chunks were
 * first seen, so the first list's ordering wins. `score` is replaced by the
 * rrf value and the per-source ranks are recorded.
 *
 * RRF values are small (about 0.01-0.05 for top hits with k = 60). Truncate the
 * fused list by position, never by comparing against a similarity threshold.
 */
class ReciprocalRankFusion {
public:
    static constexpr double kDefaultK = 60.0;

    explicit ReciprocalRankFusion(double k = kDefaultK);

    std::vector<ScoredChunk> fuse(const std::vector<RankedList>& lists) const;

    /**
     * @brief Fuse a vector ranking with a BM25 ranking
     */
    std::vector<ScoredChunk> fuse(const std::vector<ScoredChunk>& vectorResults,
                                  const std::vector<ScoredChunk>& bm25Results) const;

    double k() const { return k_; }

private:
    double k_;
};

} // namespace ragrank::search
