#include <gtest/gtest.h>
#include <ragrank/search/reranker.h>

#include "../../common/fakes.h"

#include <cmath>

using namespace ragrank;
using namespace ragrank::search;
using ragrank::test::FakeReranker;
using ragrank::test::idsOf;
using ragrank::test::makeScored;

namespace {

// Scores "chunk N" as N so the reranker reverses the incoming order
float scoreByNumber(const std::string&, const std::string& doc) {
    return std::stof(doc.substr(doc.find(' ') + 1));
}

} // namespace

class RerankOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        reranker = std::make_shared<FakeReranker>(scoreByNumber);
        for (ChunkId id = 1; id <= 10; ++id) {
            batch.push_back(makeScored(id, 1.0 - 0.05 * static_cast<double>(id)));
        }
    }

    void expectFallback(const StageOutcome& outcome) {
        EXPECT_TRUE(outcome.degraded);
        EXPECT_FALSE(outcome.reason.empty());
        EXPECT_EQ(idsOf(outcome.chunks), (std::vector<ChunkId>{1, 2, 3, 4, 5, 6}));
        for (const auto& c : outcome.chunks) {
            EXPECT_FALSE(c.rerankerScore.has_value());
        }
    }

    std::shared_ptr<FakeReranker> reranker;
    std::vector<ScoredChunk> batch;
};

TEST_F(RerankOrchestratorTest, ReordersAndTruncates) {
    RerankOrchestrator orchestrator(reranker);
    auto outcome = orchestrator.rerank("query", batch, 6);

    EXPECT_FALSE(outcome.degraded);
    EXPECT_EQ(idsOf(outcome.chunks), (std::vector<ChunkId>{10, 9, 8, 7, 6, 5}));
    const auto& top = outcome.chunks.front();
    EXPECT_EQ(top.rerankerScore, 10.0);
    EXPECT_EQ(top.score, 10.0);
    ASSERT_TRUE(top.originalScore.has_value());
    EXPECT_NEAR(*top.originalScore, 0.5, 1e-12);
    EXPECT_EQ(reranker->calls.load(), 1);
}

TEST_F(RerankOrchestratorTest, SmallBatchIsNotPadded) {
    RerankOrchestrator orchestrator(reranker);
    batch.resize(3);
    auto outcome = orchestrator.rerank("query", batch, 6);
    EXPECT_EQ(idsOf(outcome.chunks), (std::vector<ChunkId>{3, 2, 1}));
}

TEST_F(RerankOrchestratorTest, EmptyBatchSkipsReranker) {
    RerankOrchestrator orchestrator(reranker);
    auto outcome = orchestrator.rerank("query", {}, 6);
    EXPECT_FALSE(outcome.degraded);
    EXPECT_TRUE(outcome.chunks.empty());
    EXPECT_EQ(reranker->calls.load(), 0);
}

TEST_F(RerankOrchestratorTest, FallsBackWhenRerankerFails) {
    reranker->fail = true;
    expectFallback(RerankOrchestrator(reranker).rerank("query", batch, 6));
}

TEST_F(RerankOrchestratorTest, FallsBackWhenRerankerThrows) {
    reranker->throwOnCall = true;
    expectFallback(RerankOrchestrator(reranker).rerank("query", batch, 6));
}

TEST_F(RerankOrchestratorTest, FallsBackOnScoreCountMismatch) {
    reranker->dropLastScore = true;
    expectFallback(RerankOrchestrator(reranker).rerank("query", batch, 6));
}

TEST_F(RerankOrchestratorTest, FallsBackWhenNotReady) {
    reranker->ready = false;
    RerankOrchestrator orchestrator(reranker);
    EXPECT_FALSE(orchestrator.available());
    expectFallback(orchestrator.rerank("query", batch, 6));
    EXPECT_EQ(reranker->calls.load(), 0);
}

TEST_F(RerankOrchestratorTest, FallsBackWithoutReranker) {
    RerankOrchestrator orchestrator(nullptr);
    EXPECT_FALSE(orchestrator.available());
    expectFallback(orchestrator.rerank("query", batch, 6));
}

TEST_F(RerankOrchestratorTest, FallsBackOnNonFiniteScore) {
    auto nanReranker = std::make_shared<FakeReranker>(
        [](const std::string&, const std::string&) { return std::nanf(""); });
    expectFallback(RerankOrchestrator(nanReranker).rerank("query", batch, 6));
}

TEST_F(RerankOrchestratorTest, FallsBackWhenDeadlineMissed) {
    reranker->delay = std::chrono::milliseconds(300);
    RerankOrchestrator orchestrator(reranker, RerankConfig{std::chrono::milliseconds(20)});
    expectFallback(orchestrator.rerank("query", batch, 6));
}

TEST_F(RerankOrchestratorTest, DeadlineMetKeepsRerankedOrder) {
    RerankOrchestrator orchestrator(reranker, RerankConfig{std::chrono::milliseconds(2000)});
    auto outcome = orchestrator.rerank("query", batch, 6);
    EXPECT_FALSE(outcome.degraded);
    EXPECT_EQ(outcome.chunks.front().chunk.id, 10);
}
