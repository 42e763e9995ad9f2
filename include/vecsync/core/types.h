#ifndef VECSYNC_CORE_TYPES_H_
#define VECSYNC_CORE_TYPES_H_

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vecsync {
namespace core {

/**
 * @brief Identifier of an indexed file, derived from its canonical path
 */
using RecordID = uint64_t;

/**
 * @brief Represents a timestamp in milliseconds since Unix epoch
 */
using Timestamp = int64_t;

/**
 * @brief Represents a duration in milliseconds
 */
using Duration = int64_t;

/**
 * @brief Embedding vector
 */
using Vector = std::vector<float>;

Timestamp now_millis();

// ISO-8601 local time, e.g. "2024-03-01T12:30:05"
std::string format_timestamp(Timestamp ts);

/**
 * @brief Metadata describing one indexed file
 *
 * Produced by a content extractor and owned by the VectorIndex once stored.
 */
struct FileMetadata {
    std::string path;            // Canonical absolute path
    std::string filename;
    std::string file_type;       // Extension without the dot, e.g. "txt"
    uint64_t size_bytes = 0;
    Timestamp created_at = 0;
    Timestamp last_modified = 0;
    std::optional<uint32_t> page_count;  // Paged formats only

    bool operator==(const FileMetadata& other) const;
    bool operator!=(const FileMetadata& other) const { return !(*this == other); }

    std::string to_string() const;
};

/**
 * @brief A vector, its metadata and its identifier
 *
 * A record with an empty vector is the sentinel returned for files that
 * were skipped (unsupported type, no extractable text).
 */
struct VectorRecord {
    RecordID id = 0;
    Vector vector;
    FileMetadata metadata;

    bool indexed() const { return !vector.empty(); }
};

/**
 * @brief One ranked hit of a similarity search
 */
struct SearchResult {
    RecordID id = 0;
    float distance = 0.0f;
    FileMetadata metadata;
};

enum class ChangeKind {
    CREATED,
    MODIFIED,
    DELETED,
    MOVED
};

const char* change_kind_name(ChangeKind kind);

/**
 * @brief A filesystem change reported by a watch source
 */
struct ChangeEvent {
    std::string path;
    ChangeKind kind = ChangeKind::MODIFIED;
    Timestamp timestamp = 0;
    std::string dest_path;       // Set for MOVED
    bool is_directory = false;

    ChangeEvent() = default;
    ChangeEvent(std::string p, ChangeKind k, bool dir = false)
        : path(std::move(p)), kind(k), timestamp(now_millis()), is_directory(dir) {}
};

/**
 * @brief Immutable summary of one scan pass
 */
class ScanResult {
public:
    ScanResult() = default;
    ScanResult(std::vector<VectorRecord> scanned_files,
               std::vector<std::string> scanned_paths,
               std::vector<std::string> errors,
               Timestamp scan_time,
               Duration duration_ms);

    // Convenience for a pass that failed before visiting any file.
    static ScanResult failure(const std::string& path, const std::string& error);

    // Union of files (first occurrence of an id wins) and concatenation of
    // errors, in argument order.
    static ScanResult merge(const std::vector<ScanResult>& results, Timestamp scan_time,
                            Duration duration_ms);

    const std::vector<VectorRecord>& scanned_files() const { return scanned_files_; }
    const std::vector<std::string>& scanned_paths() const { return scanned_paths_; }
    const std::vector<std::string>& errors() const { return errors_; }
    Timestamp scan_time() const { return scan_time_; }
    Duration duration_ms() const { return duration_ms_; }

private:
    std::vector<VectorRecord> scanned_files_;
    std::vector<std::string> scanned_paths_;
    std::vector<std::string> errors_;
    Timestamp scan_time_ = 0;
    Duration duration_ms_ = 0;
};

// Human readable status line sink.
using ProgressCallback = std::function<void(const std::string&)>;

// Invoked once per successfully handled filesystem change.
using ChangeCallback = std::function<void(const std::string& path, ChangeKind kind)>;

} // namespace core
} // namespace vecsync

#endif // VECSYNC_CORE_TYPES_H_
