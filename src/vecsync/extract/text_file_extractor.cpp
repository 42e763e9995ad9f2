#include "vecsync/extract/text_file_extractor.h"

#include <sys/stat.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

#include "vecsync/common/path_id.h"

namespace vecsync {
namespace extract {

namespace {

core::Timestamp to_millis(const struct timespec& ts) {
    return static_cast<core::Timestamp>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

} // namespace

TextFileExtractor::TextFileExtractor(const core::ExtractorConfig& config)
    : config_(config) {
}

std::vector<std::string> TextFileExtractor::extensions() const {
    return {".txt", ".md"};
}

core::Result<core::FileMetadata> TextFileExtractor::read_metadata(const std::filesystem::path& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        int err = errno;
        auto code = (err == ENOENT || err == ENOTDIR) ? core::Error::Code::NOT_FOUND
                                                      : core::Error::Code::EXTRACTION_FAILED;
        return core::Result<core::FileMetadata>::error(code,
            "Cannot stat " + path.string() + ": " + std::strerror(err));
    }
    if (!S_ISREG(st.st_mode)) {
        return core::Result<core::FileMetadata>::error(core::Error::Code::UNSUPPORTED_TYPE,
            "Not a regular file: " + path.string());
    }

    core::FileMetadata meta;
    meta.path = common::canonical_path(path);
    meta.filename = path.filename().string();
    meta.file_type = common::lower_extension(path);
    if (!meta.file_type.empty() && meta.file_type.front() == '.') {
        meta.file_type.erase(0, 1);
    }
    meta.size_bytes = static_cast<uint64_t>(st.st_size);
    meta.created_at = to_millis(st.st_ctim);
    meta.last_modified = to_millis(st.st_mtim);
    return core::Result<core::FileMetadata>(std::move(meta));
}

core::Result<ExtractedContent> TextFileExtractor::extract(const std::filesystem::path& path) const {
    if (!supports(path)) {
        return core::Result<ExtractedContent>::error(core::Error::Code::UNSUPPORTED_TYPE,
            "Not a text file: " + path.string());
    }

    auto meta = read_metadata(path);
    if (!meta.ok()) {
        return core::Result<ExtractedContent>::propagate(meta);
    }

    const double size_mb = static_cast<double>(meta.value().size_bytes) / (1024.0 * 1024.0);
    if (config_.max_file_size_mb > 0 && size_mb > config_.max_file_size_mb) {
        return core::Result<ExtractedContent>::error(core::Error::Code::EXTRACTION_FAILED,
            "File too large (" + std::to_string(size_mb) + " MB, limit " +
            std::to_string(config_.max_file_size_mb) + " MB): " + path.string());
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        // Vanished between stat() and open()
        if (!std::filesystem::exists(path)) {
            return core::Result<ExtractedContent>::error(core::Error::Code::NOT_FOUND,
                "File not found: " + path.string());
        }
        return core::Result<ExtractedContent>::error(core::Error::Code::EXTRACTION_FAILED,
            "Cannot open " + path.string());
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return core::Result<ExtractedContent>::error(core::Error::Code::EXTRACTION_FAILED,
            "Read error on " + path.string());
    }
    if (content.find('\0') != std::string::npos) {
        return core::Result<ExtractedContent>::error(core::Error::Code::EXTRACTION_FAILED,
            "Binary content in " + path.string());
    }

    ExtractedContent extracted;
    extracted.metadata = meta.take_value();
    extracted.text = trim(content);
    return core::Result<ExtractedContent>(std::move(extracted));
}

} // namespace extract
} // namespace vecsync
