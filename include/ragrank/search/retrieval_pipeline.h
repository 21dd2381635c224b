#pragma once

#include <ragrank/core/types.h>
#include <ragrank/search/adaptive_threshold.h>
#include <ragrank/search/bm25_scorer.h>
#include <ragrank/search/mmr_selector.h>
#include <ragrank/search/rank_fusion.h>
#include <ragrank/search/reranker.h>
#include <ragrank/search/response_cache.h>
#include <ragrank/search/retrieval_response.h>
#include <ragrank/storage/chunk_store.h>
#include <ragrank/vector/embedding_provider.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ragrank::search {

/**
 * @brief Pipeline settings
 */
struct RetrievalConfig {
    // Result counts
    size_t defaultTopK = 6;        // Used when the request does not set k
    size_t maxTopK = 20;           // Largest k a request may ask for
    size_t overfetchFactor = 3;    // Candidate multiplier when reranking or diversifying
    size_t rerankCandidateCap = 10; // Reranker keeps at most this many

    std::chrono::milliseconds rerankTimeout{0}; // 0 waits for the reranker
    std::chrono::milliseconds embedTimeout{0};  // 0 waits for the embedding model

    // Semantic-only filtering
    double minSimilarityScore = 0.3;
    AdaptiveThresholdConfig threshold;

    double rrfK = ReciprocalRankFusion::kDefaultK;
    double mmrLambda = MmrSelector::kDefaultLambda;
    BM25Params bm25;

    size_t embeddingDim = 384;

    // Score BM25 concurrently with query embedding and vector scoring
    bool enableParallelScoring = true;

    size_t previewLength = 200;
};

/**
 * @brief Check ranges and cross-field constraints
 *
 * @return ErrorCode::InvalidConfiguration describing the first bad field
 */
Result<void> validateRetrievalConfig(const RetrievalConfig& config);

enum class RetrievalMode {
    Vector, ///< Nearest-neighbour search with adaptive threshold
    Hybrid, ///< BM25 and vector rankings fused with RRF
    Lexical ///< BM25 only
};

inline constexpr const char* retrievalModeToString(RetrievalMode mode) noexcept {
    switch (mode) {
        case RetrievalMode::Vector:
            return "vector";
        case RetrievalMode::Hybrid:
            return "hybrid";
        case RetrievalMode::Lexical:
            return "lexical";
    }
    return "vector";
}

struct RetrievalRequest {
    std::string query;
    std::optional<size_t> topK;                      // Defaults to RetrievalConfig::defaultTopK
    std::optional<std::vector<DocumentId>> docIds;   // Empty means all documents
    bool useHybrid = false;
    bool useReranker = false;
    bool useMmr = false;
    bool lexicalOnly = false; // Takes precedence over useHybrid

    RetrievalMode mode() const {
        if (lexicalOnly)
            return RetrievalMode::Lexical;
        return useHybrid ? RetrievalMode::Hybrid : RetrievalMode::Vector;
    }
};

/**
 * @brief Multi-signal passage retrieval
 *
 * Flow for one request:
 * 1. Preprocess the query and consult the response cache
 * 2. Fetch candidates, over-fetching k * overfetchFactor when reranking or MMR
 *    is requested
 * 3. Hybrid: BM25 and vector rankings fused with RRF. Vector: similarity
 *    search followed by the adaptive threshold. Lexical: BM25 ranking
 * 4. Optional reranking down to min(rerankCandidateCap, n)
 * 5. Optional MMR when more than k remain, otherwise truncation to k
 * 6. Highlighted previews, then the response is cached when non-empty
 *
 * Reranker and MMR failures degrade to the incoming order and are listed in
 * `degradedStages`. Configuration and storage failures are returned as errors.
 * An empty chunk list is a valid "nothing relevant" answer.
 */
class RetrievalPipeline {
public:
    RetrievalPipeline(std::shared_ptr<storage::IChunkStore> store,
                      std::shared_ptr<vector::IEmbeddingProvider> embedder,
                      std::shared_ptr<IReranker> reranker, std::shared_ptr<ResponseCache> cache,
                      const RetrievalConfig& config = {});

    Result<RetrievalResponse> retrieve(const RetrievalRequest& request);

    /**
     * @brief Convenience form returning only the ranked chunks
     */
    Result<std::vector<ScoredChunk>> retrieve(const std::string& query, size_t k,
                                              const std::optional<std::vector<DocumentId>>& docIds,
                                              bool useHybrid, bool useReranker, bool useMmr);

    /**
     * @brief Cache key text: preprocessed query plus the mode suffixes
     */
    static std::string cacheQueryKey(const std::string& processedQuery,
                                     const RetrievalRequest& request);

private:
    struct Candidates {
        std::vector<ScoredChunk> chunks;
        std::optional<std::vector<float>> queryEmbedding;
    };

    Result<size_t> resolveTopK(const RetrievalRequest& request) const;
    Result<std::vector<float>> embedQuery(const std::string& query) const;

    Result<Candidates> hybridSearch(const std::string& query, size_t k,
                                    const std::optional<std::vector<DocumentId>>& docIds,
                                    RetrievalResponse& response) const;
    Result<Candidates> vectorSearch(const std::string& query, size_t k,
                                    const std::optional<std::vector<DocumentId>>& docIds,
                                    RetrievalResponse& response) const;
    Result<Candidates> lexicalSearch(const std::string& query, size_t k,
                                     const std::optional<std::vector<DocumentId>>& docIds,
                                     RetrievalResponse& response) const;

    std::vector<ScoredChunk> diversify(const std::string& query, Candidates candidates, size_t k,
                                       RetrievalResponse& response) const;

    std::shared_ptr<storage::IChunkStore> store_;
    std::shared_ptr<vector::IEmbeddingProvider> embedder_;
    std::shared_ptr<ResponseCache> cache_;
    RetrievalConfig config_;

    BM25Scorer bm25_;
    AdaptiveThreshold threshold_;
    ReciprocalRankFusion fusion_;
    RerankOrchestrator reranker_;
    MmrSelector mmr_;
};

/**
 * @brief Build a pipeline after checking the configuration and collaborators
 *
 * Fails with InvalidConfiguration for bad settings or a missing store or
 * embedding provider, and with DimensionMismatch when the provider's dimension
 * differs from `embeddingDim`. The reranker and cache are optional.
 */
Result<std::unique_ptr<RetrievalPipeline>>
createRetrievalPipeline(std::shared_ptr<storage::IChunkStore> store,
                        std::shared_ptr<vector::IEmbeddingProvider> embedder,
                        std::shared_ptr<IReranker> reranker, std::shared_ptr<ResponseCache> cache,
                        const RetrievalConfig& config = {});

} // namespace ragrank::search
