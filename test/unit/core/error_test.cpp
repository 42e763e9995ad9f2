#include <gtest/gtest.h>
#include "vecsync/core/error.h"
#include <set>
#include <string>

namespace vecsync {
namespace core {
namespace {

TEST(ErrorTest, Construction) {
    Error error("Invalid input", Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(error.code(), Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(error.what(), std::string("Invalid input"));
}

TEST(ErrorTest, DefaultCodeIsUnknown) {
    Error error("something");
    EXPECT_EQ(error.code(), Error::Code::UNKNOWN);
}

TEST(ErrorTest, CopyConstruction) {
    Error original("Index snapshot missing", Error::Code::INDEX_CORRUPTION);
    Error copy(original);

    EXPECT_EQ(copy.code(), original.code());
    EXPECT_STREQ(copy.what(), original.what());
}

TEST(ErrorTest, CatchAsRuntimeError) {
    try {
        throw Error("write failed", Error::Code::PERSISTENCE_FAILED);
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()), "write failed");
        return;
    }
    FAIL() << "Error was not caught as std::runtime_error";
}

TEST(ErrorTest, CodeNames) {
    EXPECT_STREQ(error_code_name(Error::Code::DIMENSION_MISMATCH), "DimensionMismatch");
    EXPECT_STREQ(error_code_name(Error::Code::NOT_FOUND), "NotFound");
    EXPECT_STREQ(error_code_name(Error::Code::UNSUPPORTED_TYPE), "UnsupportedType");
    EXPECT_STREQ(error_code_name(Error::Code::EXTRACTION_FAILED), "ExtractionFailed");
    EXPECT_STREQ(error_code_name(Error::Code::PERSISTENCE_FAILED), "PersistenceFailed");
    EXPECT_STREQ(error_code_name(Error::Code::INDEX_CORRUPTION), "IndexCorruption");
}

TEST(ErrorTest, CodeNamesAreDistinct) {
    std::set<std::string> names;
    for (int c = static_cast<int>(Error::Code::UNKNOWN); c <= static_cast<int>(Error::Code::INTERNAL); ++c) {
        names.insert(error_code_name(static_cast<Error::Code>(c)));
    }
    EXPECT_EQ(names.size(), static_cast<size_t>(Error::Code::INTERNAL) + 1);
}

TEST(ErrorTest, LongMessage) {
    std::string long_message(1000, 'x');
    Error error(long_message, Error::Code::INTERNAL);
    EXPECT_EQ(error.what(), long_message);
}

} // namespace
} // namespace core
} // namespace vecsync
