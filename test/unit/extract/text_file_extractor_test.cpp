#include <gtest/gtest.h>

#include "test_util/temp_dir.h"
#include "vecsync/extract/text_file_extractor.h"

using namespace vecsync;
using namespace vecsync::extract;

class TextFileExtractorTest : public ::testing::Test {
protected:
    testutil::ScopedTestDir dir_{"vecsync_text_extractor"};
    TextFileExtractor extractor_;
};

TEST_F(TextFileExtractorTest, ExtractsTrimmedTextAndMetadata) {
    const auto path = dir_.path() / "notes.txt";
    testutil::WriteFile(path, "\n  clinical data review  \n\n");

    auto result = extractor_.extract(path);
    ASSERT_TRUE(result.ok()) << result.error();
    EXPECT_EQ(result.value().text, "clinical data review");

    const auto& meta = result.value().metadata;
    EXPECT_EQ(meta.path, std::filesystem::canonical(path).string());
    EXPECT_EQ(meta.filename, "notes.txt");
    EXPECT_EQ(meta.file_type, "txt");
    EXPECT_EQ(meta.size_bytes, 27u);
    EXPECT_GT(meta.last_modified, 0);
    EXPECT_FALSE(meta.page_count.has_value());
}

TEST_F(TextFileExtractorTest, ExtensionMatchIsCaseInsensitive) {
    const auto path = dir_.path() / "README.MD";
    testutil::WriteFile(path, "# Title");

    EXPECT_TRUE(extractor_.supports(path));
    auto result = extractor_.extract(path);
    ASSERT_TRUE(result.ok()) << result.error();
    EXPECT_EQ(result.value().metadata.file_type, "md");
}

TEST_F(TextFileExtractorTest, WhitespaceOnlyFileYieldsEmptyText) {
    const auto path = dir_.path() / "blank.txt";
    testutil::WriteFile(path, " \t\n ");

    auto result = extractor_.extract(path);
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.value().text.empty());
}

TEST_F(TextFileExtractorTest, UnsupportedExtension) {
    const auto path = dir_.path() / "image.png";
    testutil::WriteFile(path, "not really a png");

    EXPECT_FALSE(extractor_.supports(path));
    auto result = extractor_.extract(path);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.code(), core::Error::Code::UNSUPPORTED_TYPE);
}

TEST_F(TextFileExtractorTest, MissingFile) {
    auto result = extractor_.extract(dir_.path() / "missing.txt");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.code(), core::Error::Code::NOT_FOUND);
}

TEST_F(TextFileExtractorTest, DirectoryWithTextExtension) {
    std::filesystem::create_directories(dir_.path() / "folder.txt");
    auto result = extractor_.extract(dir_.path() / "folder.txt");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.code(), core::Error::Code::UNSUPPORTED_TYPE);
}

TEST_F(TextFileExtractorTest, BinaryContentFails) {
    const auto path = dir_.path() / "binary.txt";
    testutil::WriteFile(path, std::string("abc\0def", 7));

    auto result = extractor_.extract(path);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.code(), core::Error::Code::EXTRACTION_FAILED);
}

TEST_F(TextFileExtractorTest, OversizedFileFails) {
    core::ExtractorConfig config;
    config.max_file_size_mb = 0.001;  // ~1 KB
    TextFileExtractor small(config);

    const auto path = dir_.path() / "big.txt";
    testutil::WriteFile(path, std::string(4096, 'x'));

    auto result = small.extract(path);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.code(), core::Error::Code::EXTRACTION_FAILED);
}

TEST_F(TextFileExtractorTest, ReadMetadataWithoutContent) {
    const auto path = dir_.path() / "sub" / "doc.md";
    testutil::WriteFile(path, "hello");

    auto meta = TextFileExtractor::read_metadata(path);
    ASSERT_TRUE(meta.ok());
    EXPECT_EQ(meta.value().size_bytes, 5u);
    EXPECT_EQ(meta.value().filename, "doc.md");
}
