#ifndef VECSYNC_EXTRACT_CONTENT_EXTRACTOR_H_
#define VECSYNC_EXTRACT_CONTENT_EXTRACTOR_H_

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "vecsync/core/result.h"
#include "vecsync/core/types.h"

namespace vecsync {
namespace extract {

/**
 * @brief Text and metadata pulled out of one file
 */
struct ExtractedContent {
    core::FileMetadata metadata;
    std::string text;
};

/**
 * @brief Interface for turning a file into text plus metadata
 *
 * extract() fails with NOT_FOUND, UNSUPPORTED_TYPE or EXTRACTION_FAILED.
 * Implementations must be safe to call from several threads at once.
 */
class ContentExtractor {
public:
    virtual ~ContentExtractor() = default;

    virtual core::Result<ExtractedContent> extract(const std::filesystem::path& path) const = 0;

    // Lower case extensions with the dot.
    virtual std::vector<std::string> extensions() const = 0;

    virtual bool supports(const std::filesystem::path& path) const;
};

/**
 * @brief Dispatches to the first registered extractor supporting a path
 */
class ExtractorRegistry : public ContentExtractor {
public:
    void add(std::shared_ptr<ContentExtractor> extractor);

    core::Result<ExtractedContent> extract(const std::filesystem::path& path) const override;
    std::vector<std::string> extensions() const override;
    bool supports(const std::filesystem::path& path) const override;

private:
    std::vector<std::shared_ptr<ContentExtractor>> extractors_;
};

} // namespace extract
} // namespace vecsync

#endif // VECSYNC_EXTRACT_CONTENT_EXTRACTOR_H_
