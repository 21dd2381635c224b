#pragma once

#include <ragrank/core/chunk.h>
#include <ragrank/core/types.h>

#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace ragrank::storage {

/**
 * @brief Read access to the indexed chunks of the corpus
 *
 * `docIds` restricts results to the listed documents; nullopt or an empty list
 * means no restriction. Storage failures are returned, never retried.
 */
class IChunkStore {
public:
    virtual ~IChunkStore() = default;

    /**
     * @brief All chunks eligible for the query, in storage order
     */
    virtual Result<std::vector<Chunk>>
    fetchCandidates(const std::optional<std::vector<DocumentId>>& docIds) = 0;

    /**
     * @brief Nearest chunks to the query vector, best first
     *
     * `score` and `vectorScore` hold the clamped cosine similarity. Chunks
     * without an embedding are never returned; a stored embedding of another
     * dimension is a DimensionMismatch error.
     */
    virtual Result<std::vector<ScoredChunk>>
    fetchTopKBySimilarity(std::span<const float> queryVector, size_t k,
                          const std::optional<std::vector<DocumentId>>& docIds) = 0;
};

/**
 * @brief Rank candidates by cosine similarity and keep the best k
 *
 * Shared by the store implementations so every store orders identically.
 * Fails with DimensionMismatch when a stored embedding differs in size from
 * the query vector.
 */
Result<std::vector<ScoredChunk>> selectTopKBySimilarity(std::span<const float> queryVector,
                                                        const std::vector<Chunk>& candidates,
                                                        size_t k);

/**
 * @brief Whether a chunk passes the document filter
 */
bool matchesDocumentFilter(const Chunk& chunk,
                           const std::optional<std::vector<DocumentId>>& docIds);

/**
 * @brief Thread-safe chunk store held entirely in memory
 */
class InMemoryChunkStore : public IChunkStore {
public:
    InMemoryChunkStore() = default;
    explicit InMemoryChunkStore(std::vector<Chunk> chunks);

    /**
     * @brief Add a chunk; fails if the id is already present
     */
    Result<void> add(Chunk chunk);

    /**
     * @brief Remove every chunk of a document
     * @return Number of chunks removed
     */
    size_t removeDocument(const DocumentId& docId);

    size_t size() const;

    Result<std::vector<Chunk>>
    fetchCandidates(const std::optional<std::vector<DocumentId>>& docIds) override;

    Result<std::vector<ScoredChunk>>
    fetchTopKBySimilarity(std::span<const float> queryVector, size_t k,
                          const std::optional<std::vector<DocumentId>>& docIds) override;

private:
    mutable std::mutex mutex_;
    std::vector<Chunk> chunks_;
};

} // namespace ragrank::storage
