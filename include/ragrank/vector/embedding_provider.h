#pragma once

#include <ragrank/core/types.h>

#include <string>
#include <vector>

namespace ragrank::vector {

/**
 * @brief External model that turns text into a fixed-dimension vector
 *
 * The dimension must match the embeddings stored with the chunks; a mismatch
 * is a deployment error, not something a request can recover from.
 * Implementations must be thread-safe: a call that overruns the pipeline's
 * embedding deadline finishes on a detached thread.
 */
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    virtual Result<std::vector<float>> embed(const std::string& text) = 0;

    virtual size_t dimension() const = 0;

    virtual bool isReady() const { return true; }
};

/**
 * @brief Check a produced vector against the expected dimension
 *
 * Empty vectors and mismatches are reported as ErrorCode::DimensionMismatch.
 */
Result<void> checkEmbeddingDimension(const std::vector<float>& embedding, size_t expected);

} // namespace ragrank::vector
