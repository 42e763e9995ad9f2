#ifndef VECSYNC_SCANNER_SCAN_LOG_H_
#define VECSYNC_SCANNER_SCAN_LOG_H_

#include <mutex>
#include <string>

#include "vecsync/core/result.h"
#include "vecsync/core/types.h"

namespace vecsync {
namespace scanner {

/**
 * @brief Append-only, human readable report of scan passes
 *
 * Each pass is written as a block:
 * ```
 * File System Scan Results
 * ==================================================
 * Scan started at: 2024-03-01 12:30:05
 * Duration: 42 ms
 * Scanned directories:
 * - /home/user/docs
 * ==================================================
 * {path=..., filename=..., ...}
 * ERROR /home/user/docs/locked: cannot read directory: Permission denied
 * ```
 * Appends are serialized; one ScanLog may be shared by the scanner and the
 * change monitor.
 */
class ScanLog {
public:
    explicit ScanLog(std::string path);

    core::Result<void> append(const core::ScanResult& result);

    // Single-file entry written by the change monitor.
    core::Result<void> appendChange(const core::VectorRecord& record, core::ChangeKind kind);

    const std::string& path() const { return path_; }

private:
    core::Result<void> write(const std::string& block);

    std::string path_;
    std::mutex mutex_;
};

} // namespace scanner
} // namespace vecsync

#endif // VECSYNC_SCANNER_SCAN_LOG_H_
