#pragma once

#include <ragrank/core/chunk.h>

#include <span>
#include <vector>

namespace ragrank::search {

/**
 * @brief Cosine similarity in [-1,1]
 *
 * Returns 0 when the lengths differ or either vector has zero magnitude.
 * Accumulates in double precision.
 */
double rawCosineSimilarity(std::span<const float> a, std::span<const float> b);

/**
 * @brief Cosine similarity clamped to [0,1]
 *
 * This is the semantic relevance score. The batch scorer and the chunk stores'
 * nearest-neighbour path both use it, so the two paths agree exactly.
 */
double cosineSimilarity(std::span<const float> a, std::span<const float> b);

/**
 * @brief Score every chunk against the query vector, preserving input order
 *
 * Sets `vectorScore` and `score`. Chunks without an embedding score 0.
 */
std::vector<ScoredChunk> scoreByVector(std::span<const float> queryVector,
                                       const std::vector<Chunk>& chunks);

/**
 * @brief Score and rank chunks by cosine similarity, highest first
 *
 * Equal scores keep their input order.
 */
std::vector<ScoredChunk> rankByVector(std::span<const float> queryVector,
                                      const std::vector<Chunk>& chunks);

/**
 * @brief Stable descending sort on the active score
 */
void sortByScore(std::vector<ScoredChunk>& chunks);

/**
 * @brief Verify that every stored embedding matches the expected dimension
 *
 * Chunks without an embedding are skipped. A mismatch is a configuration
 * error and is reported as ErrorCode::DimensionMismatch.
 */
Result<void> validateEmbeddingDimensions(const std::vector<Chunk>& chunks, size_t expectedDim);

} // namespace ragrank::search
