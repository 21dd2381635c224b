#include <ragrank/search/vector_similarity.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace ragrank::search {

double rawCosineSimilarity(std::span<const float> a, std::span<const float> b) {
    if (a.size() != b.size() || a.empty()) {
        return 0.0;
    }

    double dot_product = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;

    for (size_t i = 0; i < a.size(); ++i) {
        dot_product += static_cast<double>(a[i]) * static_cast<double>(b[i]);
        norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
        norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
    }

    norm_a = std::sqrt(norm_a);
    norm_b = std::sqrt(norm_b);

    if (norm_a == 0.0 || norm_b == 0.0) {
        return 0.0;
    }

    return dot_product / (norm_a * norm_b);
}

double cosineSimilarity(std::span<const float> a, std::span<const float> b) {
    return std::clamp(rawCosineSimilarity(a, b), 0.0, 1.0);
}

std::vector<ScoredChunk> scoreByVector(std::span<const float> queryVector,
                                       const std::vector<Chunk>& chunks) {
    std::vector<ScoredChunk> scored;
    scored.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        const double similarity = cosineSimilarity(queryVector, chunk.embedding);
        ScoredChunk sc(chunk, similarity);
        sc.vectorScore = similarity;
        scored.push_back(std::move(sc));
    }
    return scored;
}

std::vector<ScoredChunk> rankByVector(std::span<const float> queryVector,
                                      const std::vector<Chunk>& chunks) {
    auto ranked = scoreByVector(queryVector, chunks);
    sortByScore(ranked);

    if (!ranked.empty()) {
        spdlog::debug("Vector scores: max={:.3f}, min={:.3f}", ranked.front().score,
                      ranked.back().score);
    }
    return ranked;
}

void sortByScore(std::vector<ScoredChunk>& chunks) {
    std::stable_sort(chunks.begin(), chunks.end(),
                     [](const ScoredChunk& a, const ScoredChunk& b) { return a.score > b.score; });
}

Result<void> validateEmbeddingDimensions(const std::vector<Chunk>& chunks, size_t expectedDim) {
    for (const auto& chunk : chunks) {
        if (chunk.hasEmbedding() && chunk.embedding.size() != expectedDim) {
            return Error{ErrorCode::DimensionMismatch,
                         fmt::format("Chunk {} has embedding dimension {}, expected {}", chunk.id,
                                     chunk.embedding.size(), expectedDim)};
        }
    }
    return {};
}

} // namespace ragrank::search
