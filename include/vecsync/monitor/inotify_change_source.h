#ifndef VECSYNC_MONITOR_INOTIFY_CHANGE_SOURCE_H_
#define VECSYNC_MONITOR_INOTIFY_CHANGE_SOURCE_H_

#include <sys/types.h>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "vecsync/common/logger.h"
#include "vecsync/core/config.h"
#include "vecsync/monitor/change_source.h"

namespace vecsync {
namespace monitor {

/**
 * @brief Linux inotify change source with recursive watches
 *
 * Every directory below a root gets its own watch. Kernel events map to:
 *   IN_CREATE                 -> new directories are watched and their
 *                                existing files reported as CREATED
 *   IN_CLOSE_WRITE            -> CREATED for the first close after the
 *                                file's IN_CREATE, MODIFIED otherwise
 *   IN_DELETE                 -> DELETED
 *   IN_MOVED_FROM/IN_MOVED_TO -> MOVED when paired by cookie in one read,
 *                                otherwise DELETED / CREATED
 * The reader thread polls the inotify descriptor with poll_interval as the
 * timeout so stop() is observed promptly.
 */
class InotifyChangeSource : public ChangeSource {
public:
    InotifyChangeSource(const core::MonitorConfig& config, common::LoggerPtr logger);
    ~InotifyChangeSource() override;

    InotifyChangeSource(const InotifyChangeSource&) = delete;
    InotifyChangeSource& operator=(const InotifyChangeSource&) = delete;

    core::Result<void> start(const std::vector<std::string>& roots, EventChannel& channel) override;
    void stop() override;

    core::Result<void> addRoot(const std::string& root) override;
    core::Result<void> removeRoot(const std::string& root) override;

    size_t watchCount() const;

private:
    struct PendingMove {
        std::string path;
        bool is_directory;
    };

    void readLoop();
    void processBuffer(const char* buffer, ssize_t length);

    // Watches dir and everything below it. With report_files, regular files
    // found on the way are pushed as CREATED.
    core::Result<void> watchTree(const std::string& dir, bool report_files);
    void unwatchTree(const std::string& dir);
    void renameWatches(const std::string& from, const std::string& to);
    std::string watchedPath(int wd) const;

    void emit(core::ChangeEvent event);

    core::MonitorConfig config_;
    common::LoggerPtr logger_;

    int fd_ = -1;
    EventChannel* channel_ = nullptr;
    std::atomic<bool> running_{false};
    std::thread reader_;

    mutable std::mutex watch_mutex_;
    std::unordered_map<int, std::string> watches_;  // wd -> directory

    // Files seen by IN_CREATE and not yet closed; reader thread only.
    std::unordered_set<std::string> creating_;
};

} // namespace monitor
} // namespace vecsync

#endif // VECSYNC_MONITOR_INOTIFY_CHANGE_SOURCE_H_
