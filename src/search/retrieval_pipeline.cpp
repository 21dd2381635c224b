#include <ragrank/search/highlighting.h>
#include <ragrank/search/query_preprocessor.h>
#include <ragrank/search/retrieval_pipeline.h>
#include <ragrank/search/vector_similarity.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <future>
#include <thread>

namespace ragrank::search {

namespace {

void truncate(std::vector<ScoredChunk>& chunks, size_t k) {
    if (chunks.size() > k) {
        chunks.resize(k);
    }
}

std::string preview(const std::string& text, size_t maxChars = 50) {
    return text.size() > maxChars ? text.substr(0, maxChars) + "..." : text;
}

Result<std::vector<float>> callEmbedder(vector::IEmbeddingProvider& embedder,
                                        const std::string& text) {
    try {
        return embedder.embed(text);
    } catch (const std::exception& e) {
        return Error{ErrorCode::ModelError, e.what()};
    }
}

} // namespace

Result<void> validateRetrievalConfig(const RetrievalConfig& config) {
    auto invalid = [](std::string message) {
        return Error{ErrorCode::InvalidConfiguration, std::move(message)};
    };

    if (config.maxTopK == 0) {
        return invalid("maxTopK must be at least 1");
    }
    if (config.defaultTopK == 0 || config.defaultTopK > config.maxTopK) {
        return invalid(fmt::format("defaultTopK {} must be within [1, {}]", config.defaultTopK,
                                   config.maxTopK));
    }
    if (config.overfetchFactor == 0) {
        return invalid("overfetchFactor must be at least 1");
    }
    if (config.rerankCandidateCap == 0) {
        return invalid("rerankCandidateCap must be at least 1");
    }
    if (config.rerankTimeout.count() < 0) {
        return invalid("rerankTimeout must not be negative");
    }
    if (config.embedTimeout.count() < 0) {
        return invalid("embedTimeout must not be negative");
    }
    if (config.minSimilarityScore < 0.0 || config.minSimilarityScore > 1.0) {
        return invalid(fmt::format("minSimilarityScore {} must be within [0, 1]",
                                   config.minSimilarityScore));
    }
    if (config.rrfK <= 0.0) {
        return invalid(fmt::format("rrfK {} must be positive", config.rrfK));
    }
    if (config.mmrLambda < 0.0 || config.mmrLambda > 1.0) {
        return invalid(fmt::format("mmrLambda {} must be within [0, 1]", config.mmrLambda));
    }
    if (config.bm25.k1 < 0.0 || config.bm25.b < 0.0 || config.bm25.b > 1.0 ||
        config.bm25.epsilon < 0.0) {
        return invalid("BM25 parameters require k1 >= 0, 0 <= b <= 1 and epsilon >= 0");
    }
    if (config.embeddingDim == 0) {
        return invalid("embeddingDim must be at least 1");
    }
    return {};
}

RetrievalPipeline::RetrievalPipeline(std::shared_ptr<storage::IChunkStore> store,
                                     std::shared_ptr<vector::IEmbeddingProvider> embedder,
                                     std::shared_ptr<IReranker> reranker,
                                     std::shared_ptr<ResponseCache> cache,
                                     const RetrievalConfig& config)
    : store_(std::move(store)), embedder_(std::move(embedder)), cache_(std::move(cache)),
      config_(config), bm25_(config.bm25), threshold_(config.threshold), fusion_(config.rrfK),
      reranker_(std::move(reranker), RerankConfig{config.rerankTimeout}), mmr_(config.mmrLambda) {}

std::string RetrievalPipeline::cacheQueryKey(const std::string& processedQuery,
                                             const RetrievalRequest& request) {
    std::string key = processedQuery;
    switch (request.mode()) {
        case RetrievalMode::Hybrid:
            key += "_hybrid";
            break;
        case RetrievalMode::Lexical:
            key += "_lexical";
            break;
        case RetrievalMode::Vector:
            break;
    }
    if (request.useReranker) {
        key += "_reranker";
    }
    if (request.useMmr) {
        key += "_mmr";
    }
    return key;
}

Result<size_t> RetrievalPipeline::resolveTopK(const RetrievalRequest& request) const {
    const size_t k = request.topK.value_or(config_.defaultTopK);
    if (k == 0 || k > config_.maxTopK) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("top_k {} must be within [1, {}]", k, config_.maxTopK)};
    }
    return k;
}

Result<std::vector<float>> RetrievalPipeline::embedQuery(const std::string& query) const {
    if (!embedder_ || !embedder_->isReady()) {
        spdlog::error("Embedding provider is not available");
        return Error{ErrorCode::NotInitialized, "embedding provider is not available"};
    }

    Result<std::vector<float>> embedding = Error{ErrorCode::ModelError};
    if (config_.embedTimeout.count() <= 0) {
        embedding = callEmbedder(*embedder_, query);
    } else {
        // Same deadline handling as the reranker: the detached worker owns its inputs
        auto promise = std::make_shared<std::promise<Result<std::vector<float>>>>();
        auto future = promise->get_future();
        std::thread([embedder = embedder_, promise, query]() {
            promise->set_value(callEmbedder(*embedder, query));
        }).detach();

        if (future.wait_for(config_.embedTimeout) == std::future_status::ready) {
            embedding = future.get();
        } else {
            embedding = Error{ErrorCode::Timeout,
                              fmt::format("embedding exceeded {} ms deadline",
                                          config_.embedTimeout.count())};
        }
    }
    if (!embedding) {
        spdlog::error("Failed to embed query: {}", embedding.error().message);
        return embedding.error();
    }

    if (auto dim = vector::checkEmbeddingDimension(embedding.value(), config_.embeddingDim); !dim) {
        spdlog::error("Query embedding rejected: {}", dim.error().message);
        return dim.error();
    }
    return embedding;
}

Result<RetrievalPipeline::Candidates>
RetrievalPipeline::hybridSearch(const std::string& query, size_t k,
                                const std::optional<std::vector<DocumentId>>& docIds,
                                RetrievalResponse& response) const {
    spdlog::info("Hybrid search: query='{}', k={}", preview(query), k);

    auto fetched = store_->fetchCandidates(docIds);
    if (!fetched) {
        spdlog::error("Failed to fetch candidate chunks: {}", fetched.error().message);
        return fetched.error();
    }
    const auto& candidates = fetched.value();
    response.candidateCount = candidates.size();

    if (candidates.empty()) {
        spdlog::warn("No chunks found for hybrid search");
        return Candidates{};
    }
    spdlog::info("Fetched {} candidate chunks", candidates.size());

    if (auto dims = validateEmbeddingDimensions(candidates, config_.embeddingDim); !dims) {
        spdlog::error("Stored embeddings do not match the deployment: {}", dims.error().message);
        return dims.error();
    }

    // BM25 is independent of the query embedding, so it overlaps with embedding + vector scoring
    std::future<std::vector<ScoredChunk>> bm25Future;
    std::vector<ScoredChunk> bm25Results;
    if (config_.enableParallelScoring) {
        bm25Future = std::async(std::launch::async,
                                [this, &query, &candidates]() { return bm25_.rank(query, candidates); });
    } else {
        bm25Results = bm25_.rank(query, candidates);
    }

    auto embedding = embedQuery(query);
    std::vector<ScoredChunk> vectorResults;
    if (embedding) {
        vectorResults = rankByVector(embedding.value(), candidates);
    }

    // Always join before returning; the task borrows `candidates`
    if (bm25Future.valid()) {
        try {
            bm25Results = bm25Future.get();
        } catch (const std::exception& e) {
            spdlog::error("BM25 scoring failed: {}", e.what());
            return Error{ErrorCode::InternalError, fmt::format("BM25 scoring failed: {}", e.what())};
        }
    }
    if (!embedding) {
        return embedding.error();
    }

    spdlog::info("Using RRF (Reciprocal Rank Fusion) to combine rankings");
    auto fused = fusion_.fuse(vectorResults, bm25Results);
    truncate(fused, k);

    if (!fused.empty()) {
        const auto& top = fused.front();
        spdlog::info("Hybrid search (RRF) returned {} chunks (top RRF score: {:.4f})", fused.size(),
                     top.rrfScore.value_or(0.0));
    }
    return Candidates{std::move(fused), std::move(embedding).value()};
}

Result<RetrievalPipeline::Candidates>
RetrievalPipeline::vectorSearch(const std::string& query, size_t k,
                                const std::optional<std::vector<DocumentId>>& docIds,
                                RetrievalResponse& response) const {
    spdlog::info("Vector search: query='{}', k={}", preview(query), k);

    auto embedding = embedQuery(query);
    if (!embedding) {
        return embedding.error();
    }

    auto found = store_->fetchTopKBySimilarity(embedding.value(), k, docIds);
    if (!found) {
        spdlog::error("Similarity search failed: {}", found.error().message);
        return found.error();
    }
    response.candidateCount = found.value().size();

    auto filtered = threshold_.apply(std::move(found).value(), config_.minSimilarityScore);
    response.adaptiveThreshold = filtered.threshold;

    spdlog::info("Retrieved {}/{} chunks above adaptive threshold {:.2f} (base: {:.2f})",
                 filtered.kept.size(), filtered.kept.size() + filtered.dropped, filtered.threshold,
                 config_.minSimilarityScore);
    if (!filtered.kept.empty()) {
        spdlog::info("Top score: {:.4f}", filtered.kept.front().score);
    }
    return Candidates{std::move(filtered.kept), std::move(embedding).value()};
}

Result<RetrievalPipeline::Candidates>
RetrievalPipeline::lexicalSearch(const std::string& query, size_t k,
                                 const std::optional<std::vector<DocumentId>>& docIds,
                                 RetrievalResponse& response) const {
    spdlog::info("Lexical search: query='{}', k={}", preview(query), k);

    auto fetched = store_->fetchCandidates(docIds);
    if (!fetched) {
        spdlog::error("Failed to fetch candidate chunks: {}", fetched.error().message);
        return fetched.error();
    }
    response.candidateCount = fetched.value().size();

    // Stored vectors still feed MMR, so a mismatch is a deployment error here too
    if (auto dims = validateEmbeddingDimensions(fetched.value(), config_.embeddingDim); !dims) {
        spdlog::error("Stored embeddings do not match the deployment: {}", dims.error().message);
        return dims.error();
    }

    auto ranked = bm25_.rank(query, fetched.value());
    // Chunks sharing no term with the query carry no lexical evidence
    std::erase_if(ranked, [](const ScoredChunk& c) { return c.score <= 0.0; });
    truncate(ranked, k);

    spdlog::info("Lexical search returned {} chunks", ranked.size());
    return Candidates{std::move(ranked), std::nullopt};
}

std::vector<ScoredChunk> RetrievalPipeline::diversify(const std::string& query,
                                                      Candidates candidates, size_t k,
                                                      RetrievalResponse& response) const {
    if (!candidates.queryEmbedding) {
        auto embedding = embedQuery(query);
        if (!embedding) {
            spdlog::warn("MMR skipped, query embedding unavailable: {}", embedding.error().message);
            response.degradedStages.push_back("mmr");
            truncate(candidates.chunks, k);
            return std::move(candidates.chunks);
        }
        candidates.queryEmbedding = std::move(embedding).value();
    }

    auto outcome = mmr_.select(candidates.chunks, *candidates.queryEmbedding, k);
    if (outcome.degraded) {
        response.degradedStages.push_back("mmr");
    } else {
        response.mmrUsed = true;
    }
    return std::move(outcome.chunks);
}

Result<RetrievalResponse> RetrievalPipeline::retrieve(const RetrievalRequest& request) {
    const auto start = std::chrono::steady_clock::now();
    auto elapsedMs = [&start]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now() - start)
            .count();
    };

    auto kResult = resolveTopK(request);
    if (!kResult) {
        return kResult.error();
    }
    const size_t k = kResult.value();

    const std::string processed = preprocessQuery(request.query);
    if (processed.empty()) {
        return Error{ErrorCode::InvalidArgument, "query must not be empty"};
    }
    if (processed != request.query) {
        spdlog::info("Preprocessed: '{}' -> '{}'", request.query, processed);
    }

    const auto signature =
        QuerySignature::fromQuery(cacheQueryKey(processed, request), request.docIds, k);
    if (cache_) {
        if (auto hit = cache_->get(signature)) {
            spdlog::info("Returning cached response for: '{}'", preview(request.query));
            RetrievalResponse cached = *hit;
            cached.cached = true;
            cached.executionTimeMs = elapsedMs();
            return cached;
        }
    }

    RetrievalResponse response;
    response.processedQuery = processed;
    response.queryTerms = extractKeywords(processed);
    response.searchMethod = retrievalModeToString(request.mode());

    const bool expand = request.useReranker || request.useMmr;
    const size_t initialK = expand ? k * config_.overfetchFactor : k;

    Result<Candidates> searched = Error{ErrorCode::InternalError};
    switch (request.mode()) {
        case RetrievalMode::Hybrid:
            spdlog::info("Using HYBRID search (BM25 + Vector)");
            searched = hybridSearch(processed, initialK, request.docIds, response);
            break;
        case RetrievalMode::Lexical:
            spdlog::info("Using LEXICAL-ONLY search");
            searched = lexicalSearch(processed, initialK, request.docIds, response);
            break;
        case RetrievalMode::Vector:
            spdlog::info("Using VECTOR-ONLY search");
            searched = vectorSearch(processed, initialK, request.docIds, response);
            break;
    }
    if (!searched) {
        return searched.error();
    }
    Candidates candidates = std::move(searched).value();

    if (request.useReranker && !candidates.chunks.empty()) {
        const size_t keep = std::min(config_.rerankCandidateCap, candidates.chunks.size());
        spdlog::info("Applying cross-encoder reranking: {} -> {}", candidates.chunks.size(), keep);
        auto outcome = reranker_.rerank(processed, std::move(candidates.chunks), keep);
        if (outcome.degraded) {
            response.degradedStages.push_back("reranker");
        } else {
            response.rerankerUsed = true;
        }
        candidates.chunks = std::move(outcome.chunks);
    }

    std::vector<ScoredChunk> chunks;
    if (request.useMmr && candidates.chunks.size() > k) {
        spdlog::info("Applying MMR diversification: {} -> {}", candidates.chunks.size(), k);
        chunks = diversify(processed, std::move(candidates), k, response);
    } else {
        chunks = std::move(candidates.chunks);
        truncate(chunks, k);
    }

    for (auto& c : chunks) {
        c.preview = highlightMatches(c.chunk.text, response.queryTerms, config_.previewLength);
    }
    response.chunks = std::move(chunks);
    response.executionTimeMs = elapsedMs();

    if (!response.hasResults()) {
        spdlog::info("No relevant chunks found for query '{}'", preview(request.query));
        return response;
    }

    if (response.isDegraded()) {
        spdlog::warn("Retrieval completed in degraded mode ({} stage(s) fell back)",
                     response.degradedStages.size());
    }
    spdlog::info("Retrieved {} chunks in {} ms ({} search)", response.chunks.size(),
                 response.executionTimeMs, response.searchMethod);

    if (cache_) {
        cache_->put(signature, response);
    }
    return response;
}

Result<std::vector<ScoredChunk>>
RetrievalPipeline::retrieve(const std::string& query, size_t k,
                            const std::optional<std::vector<DocumentId>>& docIds, bool useHybrid,
                            bool useReranker, bool useMmr) {
    RetrievalRequest request;
    request.query = query;
    request.topK = k;
    request.docIds = docIds;
    request.useHybrid = useHybrid;
    request.useReranker = useReranker;
    request.useMmr = useMmr;

    auto response = retrieve(request);
    if (!response) {
        return response.error();
    }
    return std::move(std::move(response).value().chunks);
}

Result<std::unique_ptr<RetrievalPipeline>>
createRetrievalPipeline(std::shared_ptr<storage::IChunkStore> store,
                        std::shared_ptr<vector::IEmbeddingProvider> embedder,
                        std::shared_ptr<IReranker> reranker, std::shared_ptr<ResponseCache> cache,
                        const RetrievalConfig& config) {
    if (auto valid = validateRetrievalConfig(config); !valid) {
        spdlog::error("Invalid retrieval configuration: {}", valid.error().message);
        return valid.error();
    }
    if (!store) {
        return Error{ErrorCode::InvalidConfiguration, "chunk store is required"};
    }
    if (!embedder) {
        return Error{ErrorCode::InvalidConfiguration, "embedding provider is required"};
    }
    if (embedder->dimension() != config.embeddingDim) {
        spdlog::error("Embedding provider dimension {} does not match configured {}",
                      embedder->dimension(), config.embeddingDim);
        return Error{ErrorCode::DimensionMismatch,
                     fmt::format("embedding provider dimension {} does not match configured {}",
                                 embedder->dimension(), config.embeddingDim)};
    }
    if (!reranker) {
        spdlog::info("No reranker configured; rerank requests will fall back to retrieval order");
    }

    return std::make_unique<RetrievalPipeline>(std::move(store), std::move(embedder),
                                               std::move(reranker), std::move(cache), config);
}

} // namespace ragrank::search
