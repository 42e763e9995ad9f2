#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>

#include "test_util/temp_dir.h"
#include "vecsync/query/query_engine.h"

namespace vecsync {
namespace query {
namespace {

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class MockQueryOptimizer : public QueryOptimizer {
public:
    MOCK_METHOD(std::string, optimize, (const std::string& query), (const, override));
};

class MockEmbeddingProvider : public embedding::EmbeddingProvider {
public:
    MOCK_METHOD(size_t, dimension, (), (const, override));
    MOCK_METHOD(core::Vector, embed, (const std::string& text), (const, override));
};

class QueryEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<testutil::ScopedTestDir>("vecsync_query_engine");
        core::IndexConfig config;
        config.dimension = 4;
        config.index_path = dir_->file("faiss.index");
        config.id_map_path = dir_->file("id_map.json");
        auto opened = index::VectorIndex::open(config, nullptr);
        ASSERT_TRUE(opened.ok()) << opened.error();
        index_ = opened.take_value();

        ASSERT_TRUE(index_->add(1, {1, 0, 0, 0}, meta("/docs/budget.txt")).ok());
        ASSERT_TRUE(index_->add(2, {0, 1, 0, 0}, meta("/docs/clinical.txt")).ok());
        ASSERT_TRUE(index_->add(3, {0, 0, 1, 0}, meta("/docs/recipes.md")).ok());

        ON_CALL(embedder_, dimension()).WillByDefault(Return(4));
    }

    static core::FileMetadata meta(const std::string& path) {
        core::FileMetadata m;
        m.path = path;
        m.filename = path.substr(path.find_last_of('/') + 1);
        m.file_type = "txt";
        return m;
    }

    std::unique_ptr<testutil::ScopedTestDir> dir_;
    std::unique_ptr<index::VectorIndex> index_;
    NiceMock<MockEmbeddingProvider> embedder_;
    NiceMock<MockQueryOptimizer> optimizer_;
};

TEST_F(QueryEngineTest, EmbedsOptimizedQuery) {
    EXPECT_CALL(optimizer_, optimize("find the clinical data"))
        .WillOnce(Return("clinical data"));
    EXPECT_CALL(embedder_, embed("clinical data"))
        .WillOnce(Return(core::Vector{0.1f, 0.9f, 0, 0}));

    QueryEngine engine(*index_, embedder_, &optimizer_, common::Logger::null());
    auto results = engine.search("find the clinical data", 2);

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].metadata.path, "/docs/clinical.txt");
    EXPECT_EQ(results[1].metadata.path, "/docs/budget.txt");
}

TEST_F(QueryEngineTest, OptimizeFlagOffBypassesOptimizer) {
    EXPECT_CALL(optimizer_, optimize(_)).Times(0);
    EXPECT_CALL(embedder_, embed("find the budget"))
        .WillOnce(Return(core::Vector{1, 0, 0, 0}));

    QueryEngine engine(*index_, embedder_, &optimizer_, common::Logger::null());
    auto results = engine.search("find the budget", 1, false);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].id, 1u);
}

TEST_F(QueryEngineTest, ThrowingOptimizerFallsBackToOriginal) {
    EXPECT_CALL(optimizer_, optimize(_)).WillOnce(Throw(std::runtime_error("model offline")));
    EXPECT_CALL(embedder_, embed("recipes"))
        .WillOnce(Return(core::Vector{0, 0, 1, 0}));

    QueryEngine engine(*index_, embedder_, &optimizer_, common::Logger::null());
    auto results = engine.search("recipes", 1);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].id, 3u);
}

TEST_F(QueryEngineTest, BlankRewriteFallsBackToOriginal) {
    EXPECT_CALL(optimizer_, optimize(_)).WillOnce(Return("  "));
    EXPECT_CALL(embedder_, embed("budget")).WillOnce(Return(core::Vector{1, 0, 0, 0}));

    QueryEngine engine(*index_, embedder_, &optimizer_, common::Logger::null());
    EXPECT_EQ(engine.search("budget", 1).size(), 1u);
}

TEST_F(QueryEngineTest, NullOptimizerUsesQueryAsIs) {
    EXPECT_CALL(embedder_, embed("budget")).WillOnce(Return(core::Vector{1, 0, 0, 0}));

    QueryEngine engine(*index_, embedder_, nullptr, common::Logger::null());
    EXPECT_EQ(engine.rewrite("budget"), "budget");
    EXPECT_EQ(engine.search("budget", 5).size(), 3u);
}

TEST_F(QueryEngineTest, BlankQueryOrNonPositiveTopKIsEmpty) {
    EXPECT_CALL(embedder_, embed(_)).Times(0);

    QueryEngine engine(*index_, embedder_, &optimizer_, common::Logger::null());
    EXPECT_TRUE(engine.search("", 5).empty());
    EXPECT_TRUE(engine.search(" \t ", 5).empty());
    EXPECT_TRUE(engine.search("budget", 0).empty());
    EXPECT_TRUE(engine.search("budget", -1).empty());
}

TEST_F(QueryEngineTest, DimensionMismatchYieldsEmpty) {
    EXPECT_CALL(embedder_, embed(_)).WillOnce(Return(core::Vector{1, 0}));

    QueryEngine engine(*index_, embedder_, nullptr, common::Logger::null());
    EXPECT_TRUE(engine.search("budget", 3).empty());
}

TEST_F(QueryEngineTest, ThrowingEmbedderYieldsEmpty) {
    EXPECT_CALL(embedder_, embed(_)).WillOnce(Throw(std::runtime_error("out of memory")));

    QueryEngine engine(*index_, embedder_, nullptr, common::Logger::null());
    EXPECT_TRUE(engine.search("budget", 3).empty());
}

TEST_F(QueryEngineTest, WorksWithRealComponents) {
    KeywordQueryOptimizer optimizer;
    embedding::HashingEmbeddingProvider embedder(4);

    QueryEngine engine(*index_, embedder, &optimizer, common::Logger::null());
    auto results = engine.search("give me the document that talks about budgets", 2);
    EXPECT_EQ(results.size(), 2u);
    EXPECT_EQ(engine.rewrite("give me the document that talks about budgets"), "budgets");
}

} // namespace
} // namespace query
} // namespace vecsync
