#include <ragrank/storage/sqlite_chunk_store.h>

#include <spdlog/spdlog.h>

#include <bit>
#include <cstdint>

namespace ragrank::storage {

namespace {

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS documents (
    doc_id    TEXT PRIMARY KEY,
    title     TEXT,
    filename  TEXT
);
CREATE TABLE IF NOT EXISTS chunks (
    id           INTEGER PRIMARY KEY,
    doc_id       TEXT NOT NULL REFERENCES documents(doc_id) ON DELETE CASCADE,
    chunk_index  INTEGER NOT NULL,
    page         INTEGER,
    text         TEXT NOT NULL,
    embedding    BLOB
);
CREATE INDEX IF NOT EXISTS idx_chunks_doc ON chunks(doc_id);
)sql";

constexpr const char* kSelectChunks =
    "SELECT c.id, c.doc_id, c.chunk_index, c.page, c.text, c.embedding, "
    "COALESCE(d.title, ''), COALESCE(d.filename, '') "
    "FROM chunks c LEFT JOIN documents d ON c.doc_id = d.doc_id";

bool hasFilter(const std::optional<std::vector<DocumentId>>& docIds) {
    return docIds && !docIds->empty();
}

std::string buildCandidateQuery(const std::optional<std::vector<DocumentId>>& docIds) {
    std::string sql = kSelectChunks;
    if (hasFilter(docIds)) {
        sql += " WHERE c.doc_id IN (";
        for (size_t i = 0; i < docIds->size(); ++i) {
            sql += i == 0 ? "?" : ", ?";
        }
        sql += ")";
    }
    sql += " ORDER BY c.id";
    return sql;
}

} // namespace

Result<void> SqliteChunkStore::open(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto r = db_.open(path, ConnectionMode::Create);
    if (!r) {
        spdlog::error("Failed to open chunk store at {}: {}", path, r.error().message);
        return Error{ErrorCode::StorageError, r.error().message};
    }
    if (auto fk = db_.execute("PRAGMA foreign_keys = ON"); !fk) {
        return fk;
    }
    return initializeSchema();
}

void SqliteChunkStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    db_.close();
}

Result<void> SqliteChunkStore::initializeSchema() {
    auto r = db_.execute(kSchema);
    if (!r) {
        return r;
    }
    spdlog::debug("Chunk store schema ready (SQLite {})", Database::version());
    return {};
}

Result<void> SqliteChunkStore::upsertDocument(const DocumentRecord& document) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare("INSERT INTO documents (doc_id, title, filename) "
                                  "VALUES (?, ?, ?) "
                                  "ON CONFLICT(doc_id) DO UPDATE SET "
                                  "title = excluded.title, filename = excluded.filename");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bindAll(document.docId, document.title, document.filename);
    if (!bindResult)
        return bindResult;
    return stmt.execute();
}

Result<ChunkId> SqliteChunkStore::insertChunk(const Chunk& chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare("INSERT INTO chunks (id, doc_id, chunk_index, page, text, "
                                  "embedding) VALUES (?, ?, ?, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    Result<void> bound = chunk.id != 0 ? stmt.bind(1, chunk.id) : stmt.bind(1, nullptr);
    if (!bound)
        return bound.error();
    bound = stmt.bind(2, chunk.docId);
    if (!bound)
        return bound.error();
    bound = stmt.bind(3, chunk.chunkIndex);
    if (!bound)
        return bound.error();
    bound = chunk.page ? stmt.bind(4, *chunk.page) : stmt.bind(4, nullptr);
    if (!bound)
        return bound.error();
    bound = stmt.bind(5, chunk.text);
    if (!bound)
        return bound.error();

    const auto blob = encodeEmbedding(chunk.embedding);
    bound = chunk.hasEmbedding() ? stmt.bind(6, std::span<const std::byte>(blob))
                                 : stmt.bind(6, nullptr);
    if (!bound)
        return bound.error();

    auto exec = stmt.execute();
    if (!exec)
        return exec.error();
    return db_.lastInsertRowId();
}

Result<void> SqliteChunkStore::removeDocument(const DocumentId& docId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_.transaction([&]() -> Result<void> {
        for (const char* sql :
             {"DELETE FROM chunks WHERE doc_id = ?", "DELETE FROM documents WHERE doc_id = ?"}) {
            auto stmtResult = db_.prepare(sql);
            if (!stmtResult)
                return stmtResult.error();
            Statement stmt = std::move(stmtResult).value();
            if (auto b = stmt.bind(1, docId); !b)
                return b;
            if (auto e = stmt.execute(); !e)
                return e;
        }
        return {};
    });
}

Result<size_t> SqliteChunkStore::chunkCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare("SELECT COUNT(*) FROM chunks");
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    return static_cast<size_t>(stmt.getInt64(0));
}

Result<std::vector<Chunk>>
SqliteChunkStore::fetchCandidates(const std::optional<std::vector<DocumentId>>& docIds) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_.isOpen()) {
        return Error{ErrorCode::NotInitialized, "chunk store is not open"};
    }

    auto stmtResult = db_.prepare(buildCandidateQuery(docIds));
    if (!stmtResult) {
        spdlog::error("Failed to prepare candidate query: {}", stmtResult.error().message);
        return stmtResult.error();
    }
    Statement stmt = std::move(stmtResult).value();

    if (hasFilter(docIds)) {
        for (size_t i = 0; i < docIds->size(); ++i) {
            auto b = stmt.bind(static_cast<int>(i + 1), (*docIds)[i]);
            if (!b)
                return b.error();
        }
    }

    std::vector<Chunk> chunks;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult) {
            spdlog::error("Failed to read chunks: {}", stepResult.error().message);
            return stepResult.error();
        }
        if (!stepResult.value())
            break;

        Chunk chunk;
        chunk.id = stmt.getInt64(0);
        chunk.docId = stmt.getString(1);
        chunk.chunkIndex = stmt.getInt64(2);
        if (!stmt.isNull(3)) {
            chunk.page = stmt.getInt(3);
        }
        chunk.text = stmt.getString(4);
        if (!stmt.isNull(5)) {
            const auto blob = stmt.getBlob(5);
            auto embedding = decodeEmbedding(blob);
            if (!embedding) {
                return Error{ErrorCode::CorruptedData,
                             fmt::format("chunk {}: {}", chunk.id, embedding.error().message)};
            }
            chunk.embedding = std::move(embedding).value();
        }
        chunk.title = stmt.getString(6);
        chunk.filename = stmt.getString(7);
        chunks.push_back(std::move(chunk));
    }

    spdlog::debug("Fetched {} candidate chunks from {}", chunks.size(), db_.path());
    return chunks;
}

Result<std::vector<ScoredChunk>>
SqliteChunkStore::fetchTopKBySimilarity(std::span<const float> queryVector, size_t k,
                                        const std::optional<std::vector<DocumentId>>& docIds) {
    auto candidates = fetchCandidates(docIds);
    if (!candidates) {
        return candidates.error();
    }
    auto ranked = selectTopKBySimilarity(queryVector, candidates.value(), k);
    if (!ranked) {
        return ranked.error();
    }
    spdlog::info("Similarity search returned {} of {} chunks", ranked.value().size(),
                 candidates.value().size());
    return ranked;
}

std::vector<std::byte> SqliteChunkStore::encodeEmbedding(std::span<const float> embedding) {
    std::vector<std::byte> blob;
    blob.reserve(embedding.size() * sizeof(float));
    for (float value : embedding) {
        const auto bits = std::bit_cast<uint32_t>(value);
        for (int shift = 0; shift < 32; shift += 8) {
            blob.push_back(static_cast<std::byte>((bits >> shift) & 0xFFu));
        }
    }
    return blob;
}

Result<std::vector<float>> SqliteChunkStore::decodeEmbedding(std::span<const std::byte> blob) {
    if (blob.size() % sizeof(float) != 0) {
        return Error{ErrorCode::CorruptedData,
                     fmt::format("embedding blob of {} bytes is not float32 aligned", blob.size())};
    }
    std::vector<float> embedding;
    embedding.reserve(blob.size() / sizeof(float));
    for (size_t i = 0; i < blob.size(); i += sizeof(float)) {
        uint32_t bits = 0;
        for (size_t b = 0; b < sizeof(float); ++b) {
            bits |= static_cast<uint32_t>(std::to_integer<uint8_t>(blob[i + b])) << (8 * b);
        }
        embedding.push_back(std::bit_cast<float>(bits));
    }
    return embedding;
}

} // namespace ragrank::storage
