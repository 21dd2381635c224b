#include <gtest/gtest.h>
#include <ragrank/storage/chunk_store.h>

#include "../../common/fakes.h"

using namespace ragrank;
using namespace ragrank::storage;
using ragrank::test::idsOf;
using ragrank::test::makeChunk;

class InMemoryChunkStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(store.add(makeChunk(1, "alpha", {1.0f, 0.0f}, "doc-a")));
        ASSERT_TRUE(store.add(makeChunk(2, "beta", {0.0f, 1.0f}, "doc-b")));
        ASSERT_TRUE(store.add(makeChunk(3, "gamma", {}, "doc-a")));
        ASSERT_TRUE(store.add(makeChunk(4, "delta", {0.6f, 0.8f}, "doc-c")));
    }

    InMemoryChunkStore store;
};

TEST_F(InMemoryChunkStoreTest, FetchAllInInsertionOrder) {
    auto all = store.fetchCandidates(std::nullopt);
    ASSERT_TRUE(all);
    ASSERT_EQ(all.value().size(), 4u);
    EXPECT_EQ(all.value()[0].id, 1);
    EXPECT_EQ(all.value()[3].id, 4);

    auto emptyFilter = store.fetchCandidates(std::vector<DocumentId>{});
    ASSERT_TRUE(emptyFilter);
    EXPECT_EQ(emptyFilter.value().size(), 4u);
}

TEST_F(InMemoryChunkStoreTest, FilterByDocument) {
    auto filtered = store.fetchCandidates(std::vector<DocumentId>{"doc-a", "doc-c"});
    ASSERT_TRUE(filtered);
    std::vector<ChunkId> ids;
    for (const auto& c : filtered.value()) {
        ids.push_back(c.id);
    }
    EXPECT_EQ(ids, (std::vector<ChunkId>{1, 3, 4}));

    auto none = store.fetchCandidates(std::vector<DocumentId>{"missing"});
    ASSERT_TRUE(none);
    EXPECT_TRUE(none.value().empty());
}

TEST_F(InMemoryChunkStoreTest, TopKBySimilaritySkipsUnembeddedChunks) {
    std::vector<float> query = {1.0f, 0.0f};
    auto top = store.fetchTopKBySimilarity(query, 10, std::nullopt);
    ASSERT_TRUE(top);
    EXPECT_EQ(idsOf(top.value()), (std::vector<ChunkId>{1, 4, 2}));
    EXPECT_NEAR(top.value()[1].score, 0.6, 1e-6);
    EXPECT_EQ(top.value()[1].vectorScore, top.value()[1].score);
}

TEST_F(InMemoryChunkStoreTest, TopKTruncatesAndFilters) {
    std::vector<float> query = {0.0f, 1.0f};
    auto top = store.fetchTopKBySimilarity(query, 1, std::nullopt);
    ASSERT_TRUE(top);
    EXPECT_EQ(idsOf(top.value()), (std::vector<ChunkId>{2}));

    auto filtered = store.fetchTopKBySimilarity(query, 5, std::vector<DocumentId>{"doc-a"});
    ASSERT_TRUE(filtered);
    EXPECT_EQ(idsOf(filtered.value()), (std::vector<ChunkId>{1}));
}

TEST_F(InMemoryChunkStoreTest, TopKRejectsEmbeddingsOfAnotherDimension) {
    std::vector<float> query = {1.0f, 0.0f, 0.0f};
    auto top = store.fetchTopKBySimilarity(query, 10, std::nullopt);
    ASSERT_FALSE(top);
    EXPECT_EQ(top.error().code, ErrorCode::DimensionMismatch);

    // Unembedded chunks alone never trigger the check
    auto unembedded = store.fetchTopKBySimilarity(query, 10, std::vector<DocumentId>{"missing"});
    ASSERT_TRUE(unembedded);
    EXPECT_TRUE(unembedded.value().empty());
}

TEST_F(InMemoryChunkStoreTest, DuplicateIdIsRejected) {
    auto r = store.add(makeChunk(1, "again"));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(store.size(), 4u);
}

TEST_F(InMemoryChunkStoreTest, RemoveDocument) {
    EXPECT_EQ(store.removeDocument("doc-a"), 2u);
    EXPECT_EQ(store.removeDocument("doc-a"), 0u);
    EXPECT_EQ(store.size(), 2u);
}

TEST(DocumentFilterTest, EmptyOrMissingFilterMatchesEverything) {
    auto chunk = makeChunk(1, "x", {}, "doc-z");
    EXPECT_TRUE(matchesDocumentFilter(chunk, std::nullopt));
    EXPECT_TRUE(matchesDocumentFilter(chunk, std::vector<DocumentId>{}));
    EXPECT_TRUE(matchesDocumentFilter(chunk, std::vector<DocumentId>{"doc-y", "doc-z"}));
    EXPECT_FALSE(matchesDocumentFilter(chunk, std::vector<DocumentId>{"doc-y"}));
}
