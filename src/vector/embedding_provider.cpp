#include <ragrank/vector/embedding_provider.h>

#include <spdlog/fmt/fmt.h>

namespace ragrank::vector {

Result<void> checkEmbeddingDimension(const std::vector<float>& embedding, size_t expected) {
    if (embedding.size() != expected) {
        return Error{ErrorCode::DimensionMismatch,
                     fmt::format("embedding has dimension {}, expected {}", embedding.size(),
                                 expected)};
    }
    return {};
}

} // namespace ragrank::vector
