#include "vecsync/core/types.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <unordered_set>

namespace vecsync {
namespace core {

Timestamp now_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string format_timestamp(Timestamp ts) {
    std::time_t seconds = static_cast<std::time_t>(ts / 1000);
    std::tm tm_buf{};
    localtime_r(&seconds, &tm_buf);
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    return ss.str();
}

bool FileMetadata::operator==(const FileMetadata& other) const {
    return path == other.path &&
           filename == other.filename &&
           file_type == other.file_type &&
           size_bytes == other.size_bytes &&
           created_at == other.created_at &&
           last_modified == other.last_modified &&
           page_count == other.page_count;
}

std::string FileMetadata::to_string() const {
    std::ostringstream ss;
    ss << "{path=" << path
       << ", filename=" << filename
       << ", type=" << file_type
       << ", size=" << size_bytes
       << ", created=" << format_timestamp(created_at)
       << ", modified=" << format_timestamp(last_modified);
    if (page_count) {
        ss << ", pages=" << *page_count;
    }
    ss << "}";
    return ss.str();
}

const char* change_kind_name(ChangeKind kind) {
    switch (kind) {
        case ChangeKind::CREATED: return "created";
        case ChangeKind::MODIFIED: return "modified";
        case ChangeKind::DELETED: return "deleted";
        case ChangeKind::MOVED: return "moved";
    }
    return "unknown";
}

ScanResult::ScanResult(std::vector<VectorRecord> scanned_files,
                       std::vector<std::string> scanned_paths,
                       std::vector<std::string> errors,
                       Timestamp scan_time,
                       Duration duration_ms)
    : scanned_files_(std::move(scanned_files)),
      scanned_paths_(std::move(scanned_paths)),
      errors_(std::move(errors)),
      scan_time_(scan_time),
      duration_ms_(duration_ms) {}

ScanResult ScanResult::failure(const std::string& path, const std::string& error) {
    return ScanResult({}, {path}, {error}, now_millis(), 0);
}

ScanResult ScanResult::merge(const std::vector<ScanResult>& results, Timestamp scan_time,
                             Duration duration_ms) {
    std::vector<VectorRecord> files;
    std::vector<std::string> paths;
    std::vector<std::string> errors;
    std::unordered_set<RecordID> seen;
    for (const auto& r : results) {
        for (const auto& record : r.scanned_files()) {
            if (seen.insert(record.id).second) {
                files.push_back(record);
            }
        }
        paths.insert(paths.end(), r.scanned_paths().begin(), r.scanned_paths().end());
        errors.insert(errors.end(), r.errors().begin(), r.errors().end());
    }
    return ScanResult(std::move(files), std::move(paths), std::move(errors),
                      scan_time, duration_ms);
}

} // namespace core
} // namespace vecsync
