#include <ragrank/search/rank_fusion.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_map>

namespace ragrank::search {

namespace {

// Carry component scores seen in later lists onto the first-seen copy
void mergeComponentScores(ScoredChunk& target, const ScoredChunk& source) {
    if (!target.vectorScore && source.vectorScore) {
        target.vectorScore = source.vectorScore;
    }
    if (!target.bm25Score && source.bm25Score) {
        target.bm25Score = source.bm25Score;
    }
    if (!target.rerankerScore && source.rerankerScore) {
        target.rerankerScore = source.rerankerScore;
    }
}

} // namespace

ReciprocalRankFusion::ReciprocalRankFusion(double k) : k_(k) {}

std::vector<ScoredChunk> ReciprocalRankFusion::fuse(const std::vector<RankedList>& lists) const {
    std::vector<ScoredChunk> fused;
    std::unordered_map<ChunkId, size_t> positionById;

    size_t totalInput = 0;
    for (const auto& list : lists) {
        totalInput += list.chunks.size();
    }
    fused.reserve(totalInput);
    positionById.reserve(totalInput);

    for (const auto& list : lists) {
        for (size_t i = 0; i < list.chunks.size(); ++i) {
            const auto& candidate = list.chunks[i];
            const size_t rank = i + 1;

            auto [it, inserted] = positionById.try_emplace(candidate.chunk.id, fused.size());
            if (inserted) {
                fused.push_back(candidate);
                fused.back().rrfScore = 0.0;
            } else {
                mergeComponentScores(fused[it->second], candidate);
            }

            auto& entry = fused[it->second];
            *entry.rrfScore += 1.0 / (k_ + static_cast<double>(rank));

            switch (list.source) {
                case RankSource::Vector:
                    if (!entry.vectorRank) {
                        entry.vectorRank = rank;
                    }
                    break;
                case RankSource::BM25:
                    entry.bm25Rank = rank;
                    break;
                case RankSource::Other:
                    break;
            }
        }
    }

    for (auto& entry : fused) {
        entry.score = *entry.rrfScore;
    }

    std::stable_sort(fused.begin(), fused.end(), [](const ScoredChunk& a, const ScoredChunk& b) {
        return *a.rrfScore > *b.rrfScore;
    });

    spdlog::info("RRF fusion complete: {} lists, {} input entries, {} combined results",
                 lists.size(), totalInput, fused.size());
    if (!fused.empty()) {
        const auto& top = fused.front();
        spdlog::debug("Top result: RRF={:.4f}, vector_rank={}, bm25_rank={}", *top.rrfScore,
                      top.vectorRank ? std::to_string(*top.vectorRank) : "N/A",
                      top.bm25Rank ? std::to_string(*top.bm25Rank) : "N/A");
    }

    return fused;
}

std::vector<ScoredChunk> ReciprocalRankFusion::fuse(const std::vector<ScoredChunk>& vectorResults,
                                                    const std::vector<ScoredChunk>& bm25Results) const {
    std::vector<RankedList> lists;
    lists.push_back(RankedList{RankSource::Vector, vectorResults});
    lists.push_back(RankedList{RankSource::BM25, bm25Results});
    return fuse(lists);
}

} // namespace ragrank::search
