#ifndef VECSYNC_MONITOR_CHANGE_MONITOR_H_
#define VECSYNC_MONITOR_CHANGE_MONITOR_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "vecsync/common/logger.h"
#include "vecsync/common/worker_pool.h"
#include "vecsync/core/config.h"
#include "vecsync/core/result.h"
#include "vecsync/core/types.h"
#include "vecsync/index/vector_index.h"
#include "vecsync/monitor/change_source.h"
#include "vecsync/monitor/event_channel.h"
#include "vecsync/scanner/file_scanner.h"
#include "vecsync/scanner/scan_log.h"

namespace vecsync {
namespace monitor {

struct MonitorStats {
    std::atomic<uint64_t> events_received{0};
    std::atomic<uint64_t> events_ignored{0};
    std::atomic<uint64_t> events_debounced{0};
    std::atomic<uint64_t> files_processed{0};
    std::atomic<uint64_t> files_failed{0};
    std::atomic<uint64_t> files_removed{0};
};

struct MonitorStatsSnapshot {
    uint64_t events_received = 0;
    uint64_t events_ignored = 0;
    uint64_t events_debounced = 0;
    uint64_t files_processed = 0;
    uint64_t files_failed = 0;
    uint64_t files_removed = 0;
};

/**
 * @brief Keeps the index in step with changes under the monitored roots
 *
 * Events from the ChangeSource arrive on an EventChannel and are consumed
 * by one thread. CREATED/MODIFIED paths move Idle -> Pending -> Processing
 * -> Idle; a path that is already pending or processing, that was
 * dispatched less than `cooldown` ago, or that is MODIFIED within
 * `created_suppression` of its CREATED is dropped. Accepted paths are
 * re-indexed on the event pool after `settle_delay` through
 * FileScanner::scanFile. DELETED removes ids directly. MOVED removes the
 * source and treats the destination as CREATED.
 *
 * Cooldown and created suppression only drop events for a file whose size
 * and mtime still match what the last pass read. A change that lands while
 * the path is processing is replayed once the pass finishes, so the index
 * always ends on the file's final content.
 *
 * Suppression bookkeeping is pruned lazily on each event. Per-path state
 * is discarded by stop().
 */
class ChangeMonitor {
public:
    ChangeMonitor(scanner::FileScanner& scanner,
                  index::VectorIndex& index,
                  const core::MonitorConfig& config,
                  common::LoggerPtr logger,
                  std::unique_ptr<ChangeSource> source,
                  core::ChangeCallback callback = nullptr,
                  scanner::ScanLog* scan_log = nullptr);
    ~ChangeMonitor();

    ChangeMonitor(const ChangeMonitor&) = delete;
    ChangeMonitor& operator=(const ChangeMonitor&) = delete;

    core::Result<void> start(const std::vector<std::string>& roots);

    /**
     * @brief Stop watching and drain in-flight work
     *
     * In-flight tasks get at most shutdown_timeout; a running extraction is
     * never interrupted.
     */
    core::Result<void> stop();

    bool isRunning() const { return running_.load(); }

    // Entry point of the consumer loop; public so callers can inject events.
    void handleEvent(const core::ChangeEvent& event);

    /**
     * @brief Remove every indexed file under dir
     * @return One aggregated error if any removal failed
     */
    core::Result<void> removeSubtree(const std::string& dir);

    // Watch and scan a new root while running.
    core::Result<void> addRoot(const std::string& dir);

    // Stop watching a root and drop its files from the index.
    core::Result<void> removeRoot(const std::string& dir);

    std::vector<std::string> roots() const;

    bool shouldIgnore(const std::string& path) const;

    MonitorStatsSnapshot stats() const;

    /**
     * @brief Wait until no event is queued, pending or processing
     */
    core::Result<void> waitForIdle(std::chrono::milliseconds timeout);

private:
    using Clock = std::chrono::steady_clock;

    enum class PathState {
        IDLE,
        PENDING,
        PROCESSING
    };

    // Size and mtime of a file when a pass started reading it.
    struct FileStamp {
        bool valid = false;
        std::uintmax_t size = 0;
        std::filesystem::file_time_type mtime;
    };

    struct PathEntry {
        PathState state = PathState::IDLE;
        Clock::time_point last_dispatch;
        FileStamp read_stamp;
        bool rerun = false;
        core::ChangeKind rerun_kind = core::ChangeKind::MODIFIED;
    };

    void consumeLoop();
    void schedule(const std::string& path, core::ChangeKind kind);
    void dispatch(const std::string& path, core::ChangeKind kind);
    core::Result<void> process(const std::string& path, core::ChangeKind kind);
    void handleRemoval(const std::string& path, bool is_directory);
    void scheduleTree(const std::string& dir);
    void pruneLocked(Clock::time_point now);
    static FileStamp stampOf(const std::string& path);
    static bool changedSince(const std::string& path, const FileStamp& stamp);
    void finish(const std::string& path);
    bool underRoot(const std::string& path) const;
    void notify(const std::string& path, core::ChangeKind kind);

    scanner::FileScanner& scanner_;
    index::VectorIndex& index_;
    core::MonitorConfig config_;
    common::LoggerPtr logger_;
    std::unique_ptr<ChangeSource> source_;
    core::ChangeCallback callback_;
    scanner::ScanLog* scan_log_;

    EventChannel channel_;
    std::unique_ptr<common::WorkerPool> pool_;
    std::thread consumer_;
    std::atomic<bool> running_{false};

    mutable std::mutex roots_mutex_;
    std::vector<std::string> roots_;

    std::mutex state_mutex_;
    std::unordered_map<std::string, PathEntry> paths_;
    std::unordered_map<std::string, Clock::time_point> recently_created_;

    MonitorStats stats_;
};

} // namespace monitor
} // namespace vecsync

#endif // VECSYNC_MONITOR_CHANGE_MONITOR_H_
