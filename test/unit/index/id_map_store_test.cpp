#include <gtest/gtest.h>

#include "test_util/temp_dir.h"
#include "vecsync/index/id_map_store.h"

namespace vecsync {
namespace index {
namespace {

core::FileMetadata meta(const std::string& path, std::optional<uint32_t> pages = std::nullopt) {
    core::FileMetadata m;
    m.path = path;
    m.filename = path.substr(path.find_last_of('/') + 1);
    m.file_type = m.filename.substr(m.filename.find_last_of('.') + 1);
    m.size_bytes = 1234;
    m.created_at = 1700000000000;
    m.last_modified = 1700000005000;
    m.page_count = pages;
    return m;
}

TEST(IdMapStoreTest, SaveAndLoad) {
    testutil::ScopedTestDir dir("vecsync_idmap");
    IdMap map;
    map[11] = meta("/docs/a.txt");
    map[22] = meta("/docs/b.pdf", 7u);
    map[33] = meta("/docs/with \"quotes\" and ünïcode.md");

    const auto path = dir.file("id_map.json");
    ASSERT_TRUE(IdMapStore::save(path, 384, map).ok());
    EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));

    auto loaded = IdMapStore::load(path, 384);
    ASSERT_TRUE(loaded.ok()) << loaded.error();
    EXPECT_EQ(loaded.value(), map);
}

TEST(IdMapStoreTest, OutputIsSortedById) {
    IdMap map;
    map[300] = meta("/c.txt");
    map[100] = meta("/a.txt");
    map[200] = meta("/b.txt");

    const std::string json = IdMapStore::to_json(4, map);
    const auto first = json.find("/a.txt");
    const auto second = json.find("/b.txt");
    const auto third = json.find("/c.txt");
    ASSERT_NE(first, std::string::npos);
    EXPECT_LT(first, second);
    EXPECT_LT(second, third);
    EXPECT_EQ(json.find("page_count"), std::string::npos);
}

TEST(IdMapStoreTest, DimensionMismatchIsCorruption) {
    const std::string json = IdMapStore::to_json(4, IdMap{{1, meta("/a.txt")}});
    auto loaded = IdMapStore::from_json(json, 8);
    ASSERT_FALSE(loaded.ok());
    EXPECT_EQ(loaded.code(), core::Error::Code::INDEX_CORRUPTION);
}

TEST(IdMapStoreTest, MalformedContentIsCorruption) {
    const std::vector<std::string> bad = {
        "not json",
        "[]",
        R"({"version": 2, "dimension": 4, "entries": []})",
        R"({"version": 1, "entries": []})",
        R"({"version": 1, "dimension": 4})",
        R"({"version": 1, "dimension": 4, "entries": [{"id": 1}]})",
        R"({"version": 1, "dimension": 4, "entries": [
            {"id": 1, "path": "/a", "filename": "a", "file_type": "txt", "size_bytes": 1, "created_at": 0, "last_modified": 0},
            {"id": 1, "path": "/b", "filename": "b", "file_type": "txt", "size_bytes": 1, "created_at": 0, "last_modified": 0}]})",
    };
    for (const auto& json : bad) {
        auto loaded = IdMapStore::from_json(json, 4);
        EXPECT_FALSE(loaded.ok()) << json;
        EXPECT_EQ(loaded.code(), core::Error::Code::INDEX_CORRUPTION) << json;
    }
}

TEST(IdMapStoreTest, MissingFileIsPersistenceFailure) {
    auto loaded = IdMapStore::load("/nonexistent/id_map.json", 4);
    ASSERT_FALSE(loaded.ok());
    EXPECT_EQ(loaded.code(), core::Error::Code::PERSISTENCE_FAILED);
}

TEST(IdMapStoreTest, UnwritableDirectoryIsPersistenceFailure) {
    auto saved = IdMapStore::save("/nonexistent/dir/id_map.json", 4, IdMap{});
    ASSERT_FALSE(saved.ok());
    EXPECT_EQ(saved.code(), core::Error::Code::PERSISTENCE_FAILED);
}

} // namespace
} // namespace index
} // namespace vecsync
