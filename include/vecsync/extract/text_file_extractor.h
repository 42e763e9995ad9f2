#ifndef VECSYNC_EXTRACT_TEXT_FILE_EXTRACTOR_H_
#define VECSYNC_EXTRACT_TEXT_FILE_EXTRACTOR_H_

#include "vecsync/core/config.h"
#include "vecsync/extract/content_extractor.h"

namespace vecsync {
namespace extract {

/**
 * @brief Reads plain text and markdown files
 *
 * The text is returned with leading and trailing whitespace trimmed. Files
 * above max_file_size_mb fail with EXTRACTION_FAILED.
 */
class TextFileExtractor : public ContentExtractor {
public:
    explicit TextFileExtractor(const core::ExtractorConfig& config = core::ExtractorConfig::Default());

    core::Result<ExtractedContent> extract(const std::filesystem::path& path) const override;
    std::vector<std::string> extensions() const override;

    // Metadata from stat() alone, no content read.
    static core::Result<core::FileMetadata> read_metadata(const std::filesystem::path& path);

private:
    core::ExtractorConfig config_;
};

} // namespace extract
} // namespace vecsync

#endif // VECSYNC_EXTRACT_TEXT_FILE_EXTRACTOR_H_
