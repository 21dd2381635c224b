#include <ragrank/search/mmr_selector.h>
#include <ragrank/search/vector_similarity.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace ragrank::search {

MmrSelector::MmrSelector(double lambda) : lambda_(lambda) {}

StageOutcome MmrSelector::select(const std::vector<ScoredChunk>& candidates,
                                 std::span<const float> queryEmbedding, size_t topK) const {
    if (candidates.size() <= topK) {
        return StageOutcome::completed(candidates);
    }

    spdlog::info("Applying MMR diversification: {} candidates -> {} diverse results (lambda={})",
                 candidates.size(), topK, lambda_);

    auto selected = selectGreedy(candidates, queryEmbedding, topK);
    if (!selected) {
        spdlog::warn("MMR diversification failed ({}); falling back to original ranking",
                     selected.error().message);
        std::vector<ScoredChunk> head(candidates.begin(),
                                      candidates.begin() + static_cast<ptrdiff_t>(topK));
        return StageOutcome::fallback(std::move(head), selected.error().message);
    }

    spdlog::info("MMR complete: selected {} diverse chunks", selected.value().size());
    return StageOutcome::completed(std::move(selected).value());
}

Result<std::vector<ScoredChunk>>
MmrSelector::selectGreedy(const std::vector<ScoredChunk>& candidates,
                          std::span<const float> queryEmbedding, size_t topK) const {
    if (queryEmbedding.empty()) {
        return Error{ErrorCode::InvalidArgument, "query embedding is empty"};
    }
    if (lambda_ < 0.0 || lambda_ > 1.0) {
        return Error{ErrorCode::InvalidArgument, fmt::format("lambda {} outside [0,1]", lambda_)};
    }

    // Relevance is fixed per candidate; compute it once
    std::vector<double> relevance;
    relevance.reserve(candidates.size());
    for (const auto& c : candidates) {
        if (!c.chunk.hasEmbedding()) {
            relevance.push_back(c.score);
            continue;
        }
        if (c.chunk.embedding.size() != queryEmbedding.size()) {
            return Error{ErrorCode::DimensionMismatch,
                         fmt::format("chunk {} embedding has dimension {}, query has {}",
                                     c.chunk.id, c.chunk.embedding.size(), queryEmbedding.size())};
        }
        relevance.push_back(rawCosineSimilarity(queryEmbedding, c.chunk.embedding));
    }

    std::vector<size_t> remaining(candidates.size());
    for (size_t i = 0; i < remaining.size(); ++i) {
        remaining[i] = i;
    }

    // Highest similarity of each candidate to anything selected so far; may be negative
    std::vector<double> maxSimilarity(candidates.size(),
                                      -std::numeric_limits<double>::infinity());

    std::vector<ScoredChunk> selected;
    selected.reserve(topK);

    while (selected.size() < topK && !remaining.empty()) {
        size_t bestPos = 0;
        double bestScore = -std::numeric_limits<double>::infinity();

        for (size_t pos = 0; pos < remaining.size(); ++pos) {
            const size_t idx = remaining[pos];
            const double redundancy = selected.empty() ? 0.0 : maxSimilarity[idx];
            const double mmr = lambda_ * relevance[idx] - (1.0 - lambda_) * redundancy;
            if (!std::isfinite(mmr)) {
                return Error{ErrorCode::InternalError,
                             fmt::format("non-finite MMR score for chunk {}",
                                         candidates[idx].chunk.id)};
            }
            if (mmr > bestScore) {
                bestScore = mmr;
                bestPos = pos;
            }
        }

        const size_t bestIdx = remaining[bestPos];
        remaining.erase(remaining.begin() + static_cast<ptrdiff_t>(bestPos));

        ScoredChunk pick = candidates[bestIdx];
        pick.mmrScore = bestScore;

        // A pair lacking an embedding on either side counts as 0 similarity
        for (size_t idx : remaining) {
            const auto& other = candidates[idx].chunk;
            const double sim = pick.chunk.hasEmbedding() && other.hasEmbedding()
                                   ? rawCosineSimilarity(other.embedding, pick.chunk.embedding)
                                   : 0.0;
            maxSimilarity[idx] = std::max(maxSimilarity[idx], sim);
        }

        selected.push_back(std::move(pick));
    }

    return selected;
}

} // namespace ragrank::search
