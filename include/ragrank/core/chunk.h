#pragma once

#include <ragrank/core/types.h>

#include <optional>
#include <string>
#include <vector>

namespace ragrank {

/**
 * @brief Indexed unit of document text
 *
 * Chunks are produced by the ingestion side and owned by the chunk store. The
 * retrieval pipeline only reads them. An empty embedding means the chunk has
 * not been embedded.
 */
struct Chunk {
    ChunkId id = 0;
    DocumentId docId;
    int64_t chunkIndex = 0; // Position within the owning document
    std::string text;
    std::vector<float> embedding;
    std::optional<int> page;

    // Denormalized document fields for display
    std::string title;
    std::string filename;

    [[nodiscard]] bool hasEmbedding() const { return !embedding.empty(); }
};

/**
 * @brief Chunk plus the scores accumulated across pipeline stages
 *
 * `score` is the active ranking score. It is overwritten by every stage that
 * reorders the list (vector/BM25, then RRF, then the reranker). MMR only
 * records `mmrScore`. Stages must tolerate any optional field being unset.
 */
struct ScoredChunk {
    Chunk chunk;
    double score = 0.0;

    std::optional<double> vectorScore;
    std::optional<double> bm25Score;
    std::optional<double> rrfScore;
    std::optional<double> rerankerScore;
    std::optional<double> originalScore; // Score before reranking
    std::optional<double> mmrScore;

    // 1-based positions in the source rankings, for diagnostics
    std::optional<size_t> vectorRank;
    std::optional<size_t> bm25Rank;

    // Highlighted excerpt attached by the pipeline
    std::string preview;

    ScoredChunk() = default;
    explicit ScoredChunk(Chunk c, double s = 0.0) : chunk(std::move(c)), score(s) {}
};

} // namespace ragrank
