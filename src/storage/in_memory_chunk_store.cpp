#include <ragrank/search/vector_similarity.h>
#include <ragrank/storage/chunk_store.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

namespace ragrank::storage {

bool matchesDocumentFilter(const Chunk& chunk,
                           const std::optional<std::vector<DocumentId>>& docIds) {
    if (!docIds || docIds->empty()) {
        return true;
    }
    return std::find(docIds->begin(), docIds->end(), chunk.docId) != docIds->end();
}

Result<std::vector<ScoredChunk>> selectTopKBySimilarity(std::span<const float> queryVector,
                                                        const std::vector<Chunk>& candidates,
                                                        size_t k) {
    if (auto dims = search::validateEmbeddingDimensions(candidates, queryVector.size()); !dims) {
        spdlog::error("Similarity search rejected: {}", dims.error().message);
        return dims.error();
    }

    std::vector<Chunk> embedded;
    embedded.reserve(candidates.size());
    std::copy_if(candidates.begin(), candidates.end(), std::back_inserter(embedded),
                 [](const Chunk& c) { return c.hasEmbedding(); });

    auto ranked = search::rankByVector(queryVector, embedded);
    if (ranked.size() > k) {
        ranked.resize(k);
    }
    return ranked;
}

InMemoryChunkStore::InMemoryChunkStore(std::vector<Chunk> chunks) : chunks_(std::move(chunks)) {}

Result<void> InMemoryChunkStore::add(Chunk chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto dup = std::find_if(chunks_.begin(), chunks_.end(),
                            [&](const Chunk& c) { return c.id == chunk.id; });
    if (dup != chunks_.end()) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("chunk {} already present", chunk.id)};
    }
    chunks_.push_back(std::move(chunk));
    return {};
}

size_t InMemoryChunkStore::removeDocument(const DocumentId& docId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(
        std::erase_if(chunks_, [&](const Chunk& c) { return c.docId == docId; }));
}

size_t InMemoryChunkStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
}

Result<std::vector<Chunk>>
InMemoryChunkStore::fetchCandidates(const std::optional<std::vector<DocumentId>>& docIds) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Chunk> out;
    std::copy_if(chunks_.begin(), chunks_.end(), std::back_inserter(out),
                 [&](const Chunk& c) { return matchesDocumentFilter(c, docIds); });
    spdlog::debug("Fetched {} candidate chunks from memory", out.size());
    return out;
}

Result<std::vector<ScoredChunk>>
InMemoryChunkStore::fetchTopKBySimilarity(std::span<const float> queryVector, size_t k,
                                          const std::optional<std::vector<DocumentId>>& docIds) {
    auto candidates = fetchCandidates(docIds);
    if (!candidates) {
        return candidates.error();
    }
    return selectTopKBySimilarity(queryVector, candidates.value(), k);
}

} // namespace ragrank::storage
