#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>

#include "test_util/temp_dir.h"
#include "vecsync/index/id_map_store.h"
#include "vecsync/index/vector_index.h"

namespace vecsync {
namespace integration {
namespace {

/**
 * @brief Index persistence across process restarts
 *
 * Scenarios:
 *
 * 1. ReopenRestoresEntries
 *    - Entries added and removed before close are exactly what reopen sees
 *    - Search results after reopen match those before close
 *
 * 2. MissingArtifactIsCorruption
 *    - Either artifact alone refuses to open instead of rebuilding silently
 *
 * 3. MismatchedArtifacts
 *    - Id map and snapshot that disagree on ids or dimension are rejected
 */
class IndexPersistenceTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<testutil::ScopedTestDir>("vecsync_persistence");
        config_.dimension = 8;
        config_.index_path = dir_->file("data/faiss.index");
        config_.id_map_path = dir_->file("data/id_map.json");
    }

    std::unique_ptr<index::VectorIndex> Open() {
        auto opened = index::VectorIndex::open(config_, common::Logger::null());
        EXPECT_TRUE(opened.ok()) << opened.error();
        return opened.ok() ? opened.take_value() : nullptr;
    }

    static core::Vector Basis(size_t i, size_t dim = 8) {
        core::Vector v(dim, 0.0f);
        v[i % dim] = 1.0f + static_cast<float>(i / dim);
        return v;
    }

    static core::FileMetadata Meta(core::RecordID id) {
        core::FileMetadata m;
        m.path = "/docs/file" + std::to_string(id) + ".txt";
        m.filename = "file" + std::to_string(id) + ".txt";
        m.file_type = "txt";
        m.size_bytes = id * 10;
        m.created_at = 1000 + static_cast<core::Timestamp>(id);
        m.last_modified = 2000 + static_cast<core::Timestamp>(id);
        return m;
    }

    std::unique_ptr<testutil::ScopedTestDir> dir_;
    core::IndexConfig config_;
};

TEST_F(IndexPersistenceTest, ReopenRestoresEntries) {
    std::vector<core::SearchResult> before;
    {
        auto index = Open();
        ASSERT_NE(index, nullptr);
        for (core::RecordID id = 1; id <= 40; ++id) {
            ASSERT_TRUE(index->add(id, Basis(id), Meta(id)).ok());
        }
        for (core::RecordID id = 1; id <= 40; id += 4) {
            ASSERT_TRUE(index->remove(id).ok());
        }
        auto replaced = Meta(2);
        replaced.size_bytes = 777;
        ASSERT_TRUE(index->add(2, Basis(2), replaced).ok());

        auto hits = index->search(Basis(3), 5);
        ASSERT_TRUE(hits.ok());
        before = hits.take_value();
    }

    auto index = Open();
    ASSERT_NE(index, nullptr);
    EXPECT_EQ(index->count(), 30u);
    EXPECT_FALSE(index->exists(1));
    EXPECT_FALSE(index->exists(37));
    ASSERT_TRUE(index->get(2).has_value());
    EXPECT_EQ(index->get(2)->size_bytes, 777u);
    EXPECT_EQ(*index->get(40), Meta(40));

    auto hits = index->search(Basis(3), 5);
    ASSERT_TRUE(hits.ok());
    ASSERT_EQ(hits.value().size(), before.size());
    for (size_t i = 0; i < before.size(); ++i) {
        EXPECT_EQ(hits.value()[i].id, before[i].id);
        EXPECT_FLOAT_EQ(hits.value()[i].distance, before[i].distance);
        EXPECT_EQ(hits.value()[i].metadata, before[i].metadata);
    }
}

TEST_F(IndexPersistenceTest, EmptyIndexSurvivesReopen) {
    { ASSERT_NE(Open(), nullptr); }
    auto index = Open();
    ASSERT_NE(index, nullptr);
    EXPECT_TRUE(index->isEmpty());
}

TEST_F(IndexPersistenceTest, MissingIdMapIsCorruption) {
    {
        auto index = Open();
        ASSERT_TRUE(index->add(1, Basis(1), Meta(1)).ok());
    }
    std::filesystem::remove(config_.id_map_path);

    auto opened = index::VectorIndex::open(config_, common::Logger::null());
    ASSERT_FALSE(opened.ok());
    EXPECT_EQ(opened.code(), core::Error::Code::INDEX_CORRUPTION);
    EXPECT_TRUE(std::filesystem::exists(config_.index_path));
}

TEST_F(IndexPersistenceTest, MissingSnapshotIsCorruption) {
    { ASSERT_NE(Open(), nullptr); }
    std::filesystem::remove(config_.index_path);

    auto opened = index::VectorIndex::open(config_, common::Logger::null());
    ASSERT_FALSE(opened.ok());
    EXPECT_EQ(opened.code(), core::Error::Code::INDEX_CORRUPTION);
}

TEST_F(IndexPersistenceTest, ConfiguredDimensionMustMatchSnapshot) {
    { ASSERT_NE(Open(), nullptr); }
    config_.dimension = 16;

    auto opened = index::VectorIndex::open(config_, common::Logger::null());
    ASSERT_FALSE(opened.ok());
    EXPECT_EQ(opened.code(), core::Error::Code::INDEX_CORRUPTION);
}

TEST_F(IndexPersistenceTest, IdSetsMustAgree) {
    {
        auto index = Open();
        ASSERT_TRUE(index->add(1, Basis(1), Meta(1)).ok());
        ASSERT_TRUE(index->add(2, Basis(2), Meta(2)).ok());
    }
    // Rewrite the id map with a different id set.
    index::IdMap other;
    other[1] = Meta(1);
    other[99] = Meta(99);
    ASSERT_TRUE(index::IdMapStore::save(config_.id_map_path, config_.dimension, other).ok());

    auto opened = index::VectorIndex::open(config_, common::Logger::null());
    ASSERT_FALSE(opened.ok());
    EXPECT_EQ(opened.code(), core::Error::Code::INDEX_CORRUPTION);
}

TEST_F(IndexPersistenceTest, GarbageSnapshotIsCorruption) {
    { ASSERT_NE(Open(), nullptr); }
    {
        std::ofstream out(config_.index_path, std::ios::binary | std::ios::trunc);
        out << "this is not a faiss index";
    }

    auto opened = index::VectorIndex::open(config_, common::Logger::null());
    ASSERT_FALSE(opened.ok());
    EXPECT_EQ(opened.code(), core::Error::Code::INDEX_CORRUPTION);
}

} // namespace
} // namespace integration
} // namespace vecsync
