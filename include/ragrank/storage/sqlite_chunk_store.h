#pragma once

#include <ragrank/storage/chunk_store.h>
#include <ragrank/storage/database.h>

#include <mutex>
#include <string>

namespace ragrank::storage {

/**
 * @brief Document row joined onto every chunk read from the store
 */
struct DocumentRecord {
    DocumentId docId;
    std::string title;
    std::string filename;
};

/**
 * @brief Chunk store backed by a SQLite file
 *
 * Schema: `documents(doc_id, title, filename)` and
 * `chunks(id, doc_id, chunk_index, page, text, embedding)`; embeddings are
 * little-endian float32 blobs. Similarity search scans the filtered rows and
 * ranks them with the shared cosine function.
 */
class SqliteChunkStore : public IChunkStore {
public:
    SqliteChunkStore() = default;

    /**
     * @brief Open (creating if needed) the database and ensure the schema
     */
    Result<void> open(const std::string& path);
    void close();
    bool isOpen() const { return db_.isOpen(); }

    Result<void> upsertDocument(const DocumentRecord& document);

    /**
     * @brief Insert a chunk; a zero id lets SQLite assign one
     * @return The stored chunk id
     */
    Result<ChunkId> insertChunk(const Chunk& chunk);

    /**
     * @brief Delete a document and its chunks
     */
    Result<void> removeDocument(const DocumentId& docId);

    Result<size_t> chunkCount();

    Result<std::vector<Chunk>>
    fetchCandidates(const std::optional<std::vector<DocumentId>>& docIds) override;

    Result<std::vector<ScoredChunk>>
    fetchTopKBySimilarity(std::span<const float> queryVector, size_t k,
                          const std::optional<std::vector<DocumentId>>& docIds) override;

    static std::vector<std::byte> encodeEmbedding(std::span<const float> embedding);
    static Result<std::vector<float>> decodeEmbedding(std::span<const std::byte> blob);

private:
    Result<void> initializeSchema();

    std::mutex mutex_;
    Database db_;
};

} // namespace ragrank::storage
