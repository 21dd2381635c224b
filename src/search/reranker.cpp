#include <ragrank/search/reranker.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <future>
#include <thread>

namespace ragrank::search {

namespace {

StageOutcome firstK(std::vector<ScoredChunk> chunks, size_t topK, std::string reason) {
    spdlog::warn("Reranking failed ({}); falling back to original ranking", reason);
    if (chunks.size() > topK) {
        chunks.resize(topK);
    }
    return StageOutcome::fallback(std::move(chunks), std::move(reason));
}

Result<std::vector<float>> callReranker(IReranker& reranker, const std::string& query,
                                        const std::vector<std::string>& documents) {
    try {
        return reranker.scoreDocuments(query, documents);
    } catch (const std::exception& e) {
        return Error{ErrorCode::ModelError, e.what()};
    }
}

} // namespace

RerankOrchestrator::RerankOrchestrator(std::shared_ptr<IReranker> reranker,
                                       const RerankConfig& config)
    : reranker_(std::move(reranker)), config_(config) {}

Result<std::vector<float>> RerankOrchestrator::invoke(const std::string& query,
                                                      std::vector<std::string> documents) const {
    if (config_.timeout.count() <= 0) {
        return callReranker(*reranker_, query, documents);
    }

    // The worker owns its inputs and is detached so a call that overruns the
    // deadline does not hold up the request.
    auto promise = std::make_shared<std::promise<Result<std::vector<float>>>>();
    auto future = promise->get_future();
    std::thread([reranker = reranker_, promise, query, docs = std::move(documents)]() {
        promise->set_value(callReranker(*reranker, query, docs));
    }).detach();

    if (future.wait_for(config_.timeout) != std::future_status::ready) {
        return Error{ErrorCode::Timeout,
                     fmt::format("reranker exceeded {} ms deadline", config_.timeout.count())};
    }
    return future.get();
}

StageOutcome RerankOrchestrator::rerank(const std::string& query, std::vector<ScoredChunk> chunks,
                                        size_t topK) const {
    if (chunks.empty()) {
        return StageOutcome::completed({});
    }

    if (!reranker_) {
        return firstK(std::move(chunks), topK, "reranker not configured");
    }
    if (!reranker_->isReady()) {
        return firstK(std::move(chunks), topK, "reranker not ready");
    }

    spdlog::info("Reranking {} chunks with cross-encoder", chunks.size());

    std::vector<std::string> documents;
    documents.reserve(chunks.size());
    for (const auto& c : chunks) {
        documents.push_back(c.chunk.text);
    }

    auto scores = invoke(query, std::move(documents));
    if (!scores) {
        return firstK(std::move(chunks), topK, scores.error().message);
    }
    if (scores.value().size() != chunks.size()) {
        return firstK(std::move(chunks), topK,
                      fmt::format("reranker returned {} scores for {} documents",
                                  scores.value().size(), chunks.size()));
    }

    const auto& values = scores.value();
    if (std::any_of(values.begin(), values.end(), [](float v) { return !std::isfinite(v); })) {
        return firstK(std::move(chunks), topK, "reranker returned a non-finite score");
    }
    for (size_t i = 0; i < chunks.size(); ++i) {
        auto& c = chunks[i];
        const auto s = static_cast<double>(values[i]);
        c.rerankerScore = s;
        c.originalScore = c.score;
        c.score = s;
    }

    std::stable_sort(chunks.begin(), chunks.end(), [](const ScoredChunk& a, const ScoredChunk& b) {
        return *a.rerankerScore > *b.rerankerScore;
    });
    if (chunks.size() > topK) {
        chunks.resize(topK);
    }

    if (!chunks.empty()) {
        spdlog::info("Reranking complete: top score={:.4f}, returned {} chunks",
                     *chunks.front().rerankerScore, chunks.size());
    }
    return StageOutcome::completed(std::move(chunks));
}

} // namespace ragrank::search
