#include "vecsync/extract/content_extractor.h"

#include <algorithm>

#include "vecsync/common/path_id.h"

namespace vecsync {
namespace extract {

bool ContentExtractor::supports(const std::filesystem::path& path) const {
    const auto exts = extensions();
    return std::find(exts.begin(), exts.end(), common::lower_extension(path)) != exts.end();
}

void ExtractorRegistry::add(std::shared_ptr<ContentExtractor> extractor) {
    if (extractor) {
        extractors_.push_back(std::move(extractor));
    }
}

core::Result<ExtractedContent> ExtractorRegistry::extract(const std::filesystem::path& path) const {
    for (const auto& extractor : extractors_) {
        if (extractor->supports(path)) {
            return extractor->extract(path);
        }
    }
    return core::Result<ExtractedContent>::error(core::Error::Code::UNSUPPORTED_TYPE,
                                                 "No extractor for " + path.string());
}

std::vector<std::string> ExtractorRegistry::extensions() const {
    std::vector<std::string> all;
    for (const auto& extractor : extractors_) {
        for (const auto& ext : extractor->extensions()) {
            if (std::find(all.begin(), all.end(), ext) == all.end()) {
                all.push_back(ext);
            }
        }
    }
    return all;
}

bool ExtractorRegistry::supports(const std::filesystem::path& path) const {
    for (const auto& extractor : extractors_) {
        if (extractor->supports(path)) {
            return true;
        }
    }
    return false;
}

} // namespace extract
} // namespace vecsync
