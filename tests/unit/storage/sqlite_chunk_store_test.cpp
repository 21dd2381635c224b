#include <gtest/gtest.h>
#include <ragrank/storage/sqlite_chunk_store.h>

#include "../../common/fakes.h"

#include <chrono>
#include <cmath>
#include <filesystem>
#include <limits>

using namespace ragrank;
using namespace ragrank::storage;
using ragrank::test::idsOf;
using ragrank::test::makeChunk;

namespace fs = std::filesystem;

class SqliteChunkStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("ragrank_store_test_" +
                std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(dir_);
        dbPath_ = (dir_ / "chunks.db").string();

        auto opened = store.open(dbPath_);
        ASSERT_TRUE(opened) << opened.error().message;

        ASSERT_TRUE(store.upsertDocument({"tesla-doc", "Tesla history", "tesla.pdf"}));
        ASSERT_TRUE(store.upsertDocument({"apple-doc", "Apple history", "apple.pdf"}));
    }

    void TearDown() override {
        store.close();
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void insert(Chunk chunk) {
        auto r = store.insertChunk(chunk);
        ASSERT_TRUE(r) << r.error().message;
    }

    fs::path dir_;
    std::string dbPath_;
    SqliteChunkStore store;
};

TEST_F(SqliteChunkStoreTest, RoundTripsChunksWithDocumentFields) {
    auto chunk = makeChunk(0, "Tesla was founded in 2003", {0.25f, -1.5f, 3.0f}, "tesla-doc");
    chunk.page = 4;
    insert(chunk);

    auto all = store.fetchCandidates(std::nullopt);
    ASSERT_TRUE(all) << all.error().message;
    ASSERT_EQ(all.value().size(), 1u);

    const auto& read = all.value()[0];
    EXPECT_GT(read.id, 0);
    EXPECT_EQ(read.docId, "tesla-doc");
    EXPECT_EQ(read.text, "Tesla was founded in 2003");
    EXPECT_EQ(read.page, 4);
    EXPECT_EQ(read.embedding, (std::vector<float>{0.25f, -1.5f, 3.0f}));
    EXPECT_EQ(read.title, "Tesla history");
    EXPECT_EQ(read.filename, "tesla.pdf");
}

TEST_F(SqliteChunkStoreTest, ChunkWithoutEmbeddingOrPage) {
    insert(makeChunk(7, "no vector", {}, "apple-doc"));
    auto all = store.fetchCandidates(std::nullopt);
    ASSERT_TRUE(all);
    ASSERT_EQ(all.value().size(), 1u);
    EXPECT_EQ(all.value()[0].id, 7);
    EXPECT_FALSE(all.value()[0].hasEmbedding());
    EXPECT_FALSE(all.value()[0].page.has_value());
}

TEST_F(SqliteChunkStoreTest, ChunkOfUnknownDocumentIsRejected) {
    auto r = store.insertChunk(makeChunk(1, "orphan", {}, "missing-doc"));
    EXPECT_FALSE(r);
}

TEST_F(SqliteChunkStoreTest, FiltersByDocumentAndRanksBySimilarity) {
    insert(makeChunk(1, "Tesla founded", {1.0f, 0.0f}, "tesla-doc"));
    insert(makeChunk(2, "Apple founded", {0.0f, 1.0f}, "apple-doc"));
    insert(makeChunk(3, "Tesla cars", {0.8f, 0.6f}, "tesla-doc"));
    insert(makeChunk(4, "Tesla draft", {}, "tesla-doc"));

    auto tesla = store.fetchCandidates(std::vector<DocumentId>{"tesla-doc"});
    ASSERT_TRUE(tesla);
    EXPECT_EQ(tesla.value().size(), 3u);

    std::vector<float> query = {1.0f, 0.0f};
    auto top = store.fetchTopKBySimilarity(query, 2, std::nullopt);
    ASSERT_TRUE(top) << top.error().message;
    EXPECT_EQ(idsOf(top.value()), (std::vector<ChunkId>{1, 3}));
    EXPECT_NEAR(top.value()[1].score, 0.8, 1e-6);

    auto apple = store.fetchTopKBySimilarity(query, 5, std::vector<DocumentId>{"apple-doc"});
    ASSERT_TRUE(apple);
    EXPECT_EQ(idsOf(apple.value()), (std::vector<ChunkId>{2}));
}

TEST_F(SqliteChunkStoreTest, RemoveDocumentDeletesItsChunks) {
    insert(makeChunk(1, "Tesla founded", {1.0f}, "tesla-doc"));
    insert(makeChunk(2, "Apple founded", {1.0f}, "apple-doc"));

    ASSERT_TRUE(store.removeDocument("tesla-doc"));
    auto count = store.chunkCount();
    ASSERT_TRUE(count);
    EXPECT_EQ(count.value(), 1u);
}

TEST_F(SqliteChunkStoreTest, DataSurvivesReopen) {
    insert(makeChunk(1, "persisted", {0.5f}, "tesla-doc"));
    store.close();
    EXPECT_FALSE(store.isOpen());

    auto notOpen = store.fetchCandidates(std::nullopt);
    ASSERT_FALSE(notOpen);
    EXPECT_EQ(notOpen.error().code, ErrorCode::NotInitialized);

    ASSERT_TRUE(store.open(dbPath_));
    auto count = store.chunkCount();
    ASSERT_TRUE(count);
    EXPECT_EQ(count.value(), 1u);
}

TEST_F(SqliteChunkStoreTest, WorksAsPipelineStore) {
    insert(makeChunk(1, "Tesla founded", {1.0f, 0.0f}, "tesla-doc"));
    IChunkStore& generic = store;
    auto all = generic.fetchCandidates(std::vector<DocumentId>{});
    ASSERT_TRUE(all);
    EXPECT_EQ(all.value().size(), 1u);
}

TEST(EmbeddingBlobTest, LittleEndianFloat32) {
    std::vector<float> values = {1.0f};
    auto blob = SqliteChunkStore::encodeEmbedding(values);
    ASSERT_EQ(blob.size(), 4u);
    // 1.0f == 0x3F800000
    EXPECT_EQ(std::to_integer<int>(blob[0]), 0x00);
    EXPECT_EQ(std::to_integer<int>(blob[2]), 0x80);
    EXPECT_EQ(std::to_integer<int>(blob[3]), 0x3F);
}

TEST(EmbeddingBlobTest, DecodePreservesSpecialValues) {
    std::vector<float> values = {0.0f, -0.0f, std::numeric_limits<float>::max(), 1e-30f};
    auto decoded = SqliteChunkStore::decodeEmbedding(SqliteChunkStore::encodeEmbedding(values));
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded.value(), values);
    EXPECT_TRUE(std::signbit(decoded.value()[1]));
}

TEST(EmbeddingBlobTest, MisalignedBlobIsCorrupt) {
    std::vector<std::byte> blob(6, std::byte{0});
    auto decoded = SqliteChunkStore::decodeEmbedding(blob);
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().code, ErrorCode::CorruptedData);
}
