#include "vecsync/monitor/change_monitor.h"

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <system_error>

#include "vecsync/common/path_id.h"

namespace vecsync {
namespace monitor {

namespace fs = std::filesystem;

namespace {

bool under(const std::string& path, const std::string& dir) {
    return path == dir ||
           (path.size() > dir.size() && path.compare(0, dir.size(), dir) == 0 && path[dir.size()] == '/');
}

} // namespace

ChangeMonitor::ChangeMonitor(scanner::FileScanner& scanner,
                             index::VectorIndex& index,
                             const core::MonitorConfig& config,
                             common::LoggerPtr logger,
                             std::unique_ptr<ChangeSource> source,
                             core::ChangeCallback callback,
                             scanner::ScanLog* scan_log)
    : scanner_(scanner),
      index_(index),
      config_(config),
      logger_(logger ? std::move(logger) : common::Logger::null()),
      source_(std::move(source)),
      callback_(std::move(callback)),
      scan_log_(scan_log) {
    if (!source_) {
        source_ = std::make_unique<ManualChangeSource>();
    }
}

ChangeMonitor::~ChangeMonitor() {
    auto result = stop();
    if (!result.ok()) {
        logger_->warn("Monitor shutdown: {}", result.error());
    }
}

core::Result<void> ChangeMonitor::start(const std::vector<std::string>& roots) {
    if (running_.load()) {
        return core::Result<void>::error(core::Error::Code::INVALID_ARGUMENT,
                                         "Monitor already running");
    }

    std::vector<std::string> canonical_roots;
    for (const auto& root : roots) {
        std::string canonical = common::canonical_path(root);
        std::error_code ec;
        if (!fs::is_directory(canonical, ec)) {
            return core::Result<void>::error(core::Error::Code::NOT_FOUND,
                                             "Not a directory: " + canonical);
        }
        if (std::find(canonical_roots.begin(), canonical_roots.end(), canonical) == canonical_roots.end()) {
            canonical_roots.push_back(canonical);
        }
    }
    {
        std::lock_guard<std::mutex> lock(roots_mutex_);
        roots_ = canonical_roots;
    }

    channel_.reset();

    common::WorkerPoolConfig pool_config;
    pool_config.name = "events";
    pool_config.num_workers = std::max<uint32_t>(1, config_.event_workers);
    pool_config.shutdown_timeout = config_.shutdown_timeout;
    pool_ = std::make_unique<common::WorkerPool>(pool_config, logger_);
    auto init = pool_->initialize();
    if (!init.ok()) {
        pool_.reset();
        return init;
    }

    auto started = source_->start(canonical_roots, channel_);
    if (!started.ok()) {
        auto stopped = pool_->shutdown();
        if (!stopped.ok()) {
            logger_->warn("Event pool shutdown: {}", stopped.error());
        }
        pool_.reset();
        logger_->error("Failed to start change source: {}", started.error());
        return started;
    }

    running_.store(true);
    consumer_ = std::thread(&ChangeMonitor::consumeLoop, this);
    logger_->info("Monitoring {} roots with {} event workers",
                  canonical_roots.size(), pool_config.num_workers);
    return core::Result<void>();
}

core::Result<void> ChangeMonitor::stop() {
    if (!running_.exchange(false)) {
        return core::Result<void>();
    }
    logger_->info("Stopping monitor");

    source_->stop();
    channel_.close();
    if (consumer_.joinable()) {
        consumer_.join();
    }

    core::Result<void> result;
    if (pool_) {
        result = pool_->shutdown();
        pool_.reset();
    }
    {
        // Tasks abandoned by a timed-out shutdown never reach finish().
        std::lock_guard<std::mutex> lock(state_mutex_);
        paths_.clear();
        recently_created_.clear();
    }

    auto s = stats();
    logger_->info("Monitor stopped: {} events, {} processed, {} removed, {} failed",
                  s.events_received, s.files_processed, s.files_removed, s.files_failed);
    return result;
}

void ChangeMonitor::consumeLoop() {
    while (true) {
        auto event = channel_.pop(config_.poll_interval);
        if (!event) {
            if (channel_.closed()) {
                break;
            }
            continue;
        }
        try {
            handleEvent(*event);
        } catch (const std::exception& e) {
            logger_->error("Handling {} event for {} threw: {}",
                           core::change_kind_name(event->kind), event->path, e.what());
        }
        channel_.ack();
    }
}

bool ChangeMonitor::shouldIgnore(const std::string& path) const {
    const std::string name = fs::path(path).filename().string();
    for (const auto& pattern : config_.ignore_patterns) {
        if (!pattern.empty() && name.find(pattern) != std::string::npos) {
            return true;
        }
    }
    return false;
}

void ChangeMonitor::handleEvent(const core::ChangeEvent& event) {
    stats_.events_received.fetch_add(1);

    switch (event.kind) {
        case core::ChangeKind::MOVED: {
            const bool src_ignored = shouldIgnore(event.path);
            const bool dest_ignored = event.dest_path.empty() || shouldIgnore(event.dest_path);
            if (src_ignored && dest_ignored) {
                stats_.events_ignored.fetch_add(1);
                return;
            }
            if (!src_ignored) {
                handleRemoval(event.path, event.is_directory);
            }
            const std::string dest = event.dest_path.empty() ? std::string()
                                                             : common::canonical_path(event.dest_path);
            if (dest_ignored || !underRoot(dest)) {
                notify(common::canonical_path(event.path), core::ChangeKind::MOVED);
                return;
            }
            if (event.is_directory) {
                scheduleTree(dest);
                notify(dest, core::ChangeKind::MOVED);
            } else {
                schedule(dest, core::ChangeKind::MOVED);
            }
            return;
        }

        case core::ChangeKind::DELETED:
            if (shouldIgnore(event.path)) {
                stats_.events_ignored.fetch_add(1);
                return;
            }
            handleRemoval(event.path, event.is_directory);
            notify(common::canonical_path(event.path), core::ChangeKind::DELETED);
            return;

        case core::ChangeKind::CREATED:
        case core::ChangeKind::MODIFIED:
            if (shouldIgnore(event.path)) {
                stats_.events_ignored.fetch_add(1);
                logger_->trace("Ignoring {}", event.path);
                return;
            }
            if (event.is_directory) {
                if (event.kind == core::ChangeKind::CREATED) {
                    scheduleTree(common::canonical_path(event.path));
                }
                return;
            }
            schedule(event.path, event.kind);
            return;
    }
}

void ChangeMonitor::schedule(const std::string& path, core::ChangeKind kind) {
    const std::string canonical = common::canonical_path(path);
    if (!scanner_.isSupported(canonical)) {
        stats_.events_ignored.fetch_add(1);
        return;
    }
    if (!pool_ || !pool_->isRunning()) {
        logger_->debug("Monitor not running, dropping {} for {}", core::change_kind_name(kind), canonical);
        return;
    }

    const auto now = Clock::now();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        pruneLocked(now);

        auto& entry = paths_[canonical];
        if (entry.state == PathState::PENDING) {
            // The queued pass has not read the file yet and will see this change.
            stats_.events_debounced.fetch_add(1);
            logger_->trace("Already queued: {}", canonical);
            return;
        }
        if (entry.state == PathState::PROCESSING) {
            stats_.events_debounced.fetch_add(1);
            if (!entry.rerun) {
                entry.rerun = true;
                entry.rerun_kind = kind;
            }
            logger_->trace("Changed while processing, replay queued: {}", canonical);
            return;
        }

        const bool unchanged = entry.read_stamp.valid && !changedSince(canonical, entry.read_stamp);
        if (kind == core::ChangeKind::MODIFIED && unchanged) {
            auto created = recently_created_.find(canonical);
            if (created != recently_created_.end() && now - created->second < config_.created_suppression) {
                stats_.events_debounced.fetch_add(1);
                logger_->trace("Suppressing modify right after create: {}", canonical);
                return;
            }
        }
        if (unchanged && entry.last_dispatch != Clock::time_point{} &&
            now - entry.last_dispatch < config_.cooldown) {
            stats_.events_debounced.fetch_add(1);
            logger_->trace("Within cooldown: {}", canonical);
            return;
        }

        if (kind != core::ChangeKind::MODIFIED) {
            recently_created_[canonical] = now;
        }
        entry.state = PathState::PENDING;
        entry.last_dispatch = now;
    }

    dispatch(canonical, kind);
}

void ChangeMonitor::dispatch(const std::string& path, core::ChangeKind kind) {
    auto submitted = pool_ ? pool_->submit(std::string(core::change_kind_name(kind)) + " " + path,
                                           [this, path, kind]() { return process(path, kind); })
                           : core::Result<void>::error(core::Error::Code::INTERNAL, "Event pool stopped");
    if (!submitted.ok()) {
        logger_->warn("Cannot queue {}: {}", path, submitted.error());
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto it = paths_.find(path);
        if (it != paths_.end()) {
            it->second.state = PathState::IDLE;
            it->second.rerun = false;
        }
    }
}

core::Result<void> ChangeMonitor::process(const std::string& path, core::ChangeKind kind) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto it = paths_.find(path);
        if (it != paths_.end()) {
            it->second.state = PathState::PROCESSING;
        }
    }

    try {
        if (config_.settle_delay.count() > 0) {
            std::this_thread::sleep_for(config_.settle_delay);
        }

        std::error_code ec;
        if (!fs::exists(path, ec)) {
            logger_->debug("{} vanished before processing", path);
            finish(path);
            return core::Result<void>();
        }

        const FileStamp stamp = stampOf(path);
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            auto it = paths_.find(path);
            if (it != paths_.end()) {
                it->second.read_stamp = stamp;
            }
        }

        auto record = scanner_.scanFile(path);
        if (!record.ok()) {
            stats_.files_failed.fetch_add(1);
            logger_->error("Failed to process {} ({}): {}", path, core::change_kind_name(kind), record.error());
            finish(path);
            return core::Result<void>();
        }

        // Deleted while it was being read; the delete handler ran first.
        if (!fs::exists(path, ec) && record.value().indexed()) {
            auto removed = index_.remove(record.value().id);
            if (!removed.ok()) {
                logger_->error("Failed to drop vanished {}: {}", path, removed.error());
            }
            finish(path);
            return core::Result<void>();
        }

        stats_.files_processed.fetch_add(1);
        logger_->info("Processed {} ({})", path, core::change_kind_name(kind));
        if (scan_log_ != nullptr && record.value().indexed()) {
            auto logged = scan_log_->appendChange(record.value(), kind);
            if (!logged.ok()) {
                logger_->warn("Scan log: {}", logged.error());
            }
        }
        notify(path, kind);
    } catch (const std::exception& e) {
        stats_.files_failed.fetch_add(1);
        logger_->error("Processing {} threw: {}", path, e.what());
    }

    finish(path);
    return core::Result<void>();
}

void ChangeMonitor::handleRemoval(const std::string& path, bool is_directory) {
    const std::string canonical = common::canonical_path(path);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (auto it = recently_created_.begin(); it != recently_created_.end();) {
            it = under(it->first, canonical) ? recently_created_.erase(it) : std::next(it);
        }
        for (auto it = paths_.begin(); it != paths_.end();) {
            // In-flight tasks notice the file is gone on their own.
            if (under(it->first, canonical) && it->second.state == PathState::IDLE) {
                it = paths_.erase(it);
            } else {
                ++it;
            }
        }
    }

    if (is_directory) {
        auto removed = removeSubtree(canonical);
        if (!removed.ok()) {
            logger_->error("{}", removed.error());
        }
        return;
    }

    const core::RecordID id = common::path_id(canonical);
    if (!index_.exists(id)) {
        logger_->debug("Deleted file was not indexed: {}", canonical);
        return;
    }
    auto removed = index_.remove(id);
    if (!removed.ok()) {
        stats_.files_failed.fetch_add(1);
        logger_->error("Failed to remove {}: {}", canonical, removed.error());
        return;
    }
    stats_.files_removed.fetch_add(1);
    logger_->info("Removed {}", canonical);
}

core::Result<void> ChangeMonitor::removeSubtree(const std::string& dir) {
    const std::string canonical = common::canonical_path(dir);
    const auto ids = index_.idsUnder(canonical);

    size_t removed = 0;
    std::vector<std::string> failures;
    core::Error::Code first_code = core::Error::Code::UNKNOWN;
    for (auto id : ids) {
        auto result = index_.remove(id);
        if (result.ok()) {
            ++removed;
            continue;
        }
        if (failures.empty()) {
            first_code = result.code();
        }
        failures.push_back(std::to_string(id) + ": " + result.error());
    }
    stats_.files_removed.fetch_add(removed);
    logger_->info("Removed {} entries under {}", removed, canonical);

    if (!failures.empty()) {
        stats_.files_failed.fetch_add(failures.size());
        std::string message = "Failed to remove " + std::to_string(failures.size()) + " of " +
                              std::to_string(ids.size()) + " entries under " + canonical;
        for (size_t i = 0; i < failures.size() && i < 3; ++i) {
            message += "; " + failures[i];
        }
        return core::Result<void>::error(first_code, message);
    }
    return core::Result<void>();
}

void ChangeMonitor::scheduleTree(const std::string& dir) {
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        logger_->warn("Cannot list {}: {}", dir, ec.message());
        return;
    }
    std::vector<std::string> files;
    for (fs::recursive_directory_iterator end; it != end;) {
        std::error_code entry_ec;
        if (it->is_symlink(entry_ec)) {
            it.disable_recursion_pending();
        } else if (it->is_regular_file(entry_ec) && !shouldIgnore(it->path().string())) {
            files.push_back(it->path().string());
        }
        it.increment(ec);
        if (ec) {
            logger_->warn("Listing {} interrupted: {}", dir, ec.message());
            break;
        }
    }
    std::sort(files.begin(), files.end());
    for (const auto& file : files) {
        schedule(file, core::ChangeKind::CREATED);
    }
}

void ChangeMonitor::pruneLocked(Clock::time_point now) {
    for (auto it = recently_created_.begin(); it != recently_created_.end();) {
        it = (now - it->second >= config_.created_suppression) ? recently_created_.erase(it) : std::next(it);
    }
    const auto keep = std::max<Clock::duration>(config_.cooldown, config_.created_suppression);
    for (auto it = paths_.begin(); it != paths_.end();) {
        if (it->second.state == PathState::IDLE && now - it->second.last_dispatch >= keep) {
            it = paths_.erase(it);
        } else {
            ++it;
        }
    }
}

void ChangeMonitor::finish(const std::string& path) {
    core::ChangeKind replay_kind = core::ChangeKind::MODIFIED;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto it = paths_.find(path);
        if (it == paths_.end()) {
            return;
        }
        auto& entry = it->second;
        const bool replay = entry.rerun && running_.load() &&
                            (!entry.read_stamp.valid || changedSince(path, entry.read_stamp));
        entry.rerun = false;
        if (!replay) {
            entry.state = PathState::IDLE;
            return;
        }
        replay_kind = entry.rerun_kind;
        entry.state = PathState::PENDING;
        entry.last_dispatch = Clock::now();
    }
    logger_->debug("Replaying {} for {} after a change during processing",
                   core::change_kind_name(replay_kind), path);
    dispatch(path, replay_kind);
}

ChangeMonitor::FileStamp ChangeMonitor::stampOf(const std::string& path) {
    FileStamp stamp;
    std::error_code size_ec;
    std::error_code time_ec;
    stamp.size = fs::file_size(path, size_ec);
    stamp.mtime = fs::last_write_time(path, time_ec);
    stamp.valid = !size_ec && !time_ec;
    return stamp;
}

bool ChangeMonitor::changedSince(const std::string& path, const FileStamp& stamp) {
    const FileStamp now = stampOf(path);
    return now.valid != stamp.valid || now.size != stamp.size || now.mtime != stamp.mtime;
}

bool ChangeMonitor::underRoot(const std::string& path) const {
    std::lock_guard<std::mutex> lock(roots_mutex_);
    for (const auto& root : roots_) {
        if (under(path, root)) {
            return true;
        }
    }
    return false;
}

void ChangeMonitor::notify(const std::string& path, core::ChangeKind kind) {
    if (!callback_) {
        return;
    }
    try {
        callback_(path, kind);
    } catch (const std::exception& e) {
        logger_->warn("Change callback threw for {}: {}", path, e.what());
    }
}

core::Result<void> ChangeMonitor::addRoot(const std::string& dir) {
    const std::string canonical = common::canonical_path(dir);
    std::error_code ec;
    if (!fs::is_directory(canonical, ec)) {
        return core::Result<void>::error(core::Error::Code::NOT_FOUND, "Not a directory: " + canonical);
    }
    {
        std::lock_guard<std::mutex> lock(roots_mutex_);
        if (std::find(roots_.begin(), roots_.end(), canonical) != roots_.end()) {
            return core::Result<void>();
        }
    }

    if (running_.load()) {
        auto watched = source_->addRoot(canonical);
        if (!watched.ok()) {
            return watched;
        }
    }
    {
        std::lock_guard<std::mutex> lock(roots_mutex_);
        roots_.push_back(canonical);
    }
    logger_->info("Added root {}", canonical);

    if (running_.load()) {
        auto result = scanner_.scanDirectory(canonical);
        if (scan_log_ != nullptr) {
            auto logged = scan_log_->append(result);
            if (!logged.ok()) {
                logger_->warn("Scan log: {}", logged.error());
            }
        }
    }
    return core::Result<void>();
}

core::Result<void> ChangeMonitor::removeRoot(const std::string& dir) {
    const std::string canonical = common::canonical_path(dir);
    {
        std::lock_guard<std::mutex> lock(roots_mutex_);
        auto it = std::find(roots_.begin(), roots_.end(), canonical);
        if (it == roots_.end()) {
            return core::Result<void>::error(core::Error::Code::NOT_FOUND,
                                             "Not a monitored root: " + canonical);
        }
        roots_.erase(it);
    }
    if (running_.load()) {
        auto unwatched = source_->removeRoot(canonical);
        if (!unwatched.ok()) {
            logger_->warn("Stop watching {}: {}", canonical, unwatched.error());
        }
    }
    logger_->info("Removed root {}", canonical);
    return removeSubtree(canonical);
}

std::vector<std::string> ChangeMonitor::roots() const {
    std::lock_guard<std::mutex> lock(roots_mutex_);
    return roots_;
}

MonitorStatsSnapshot ChangeMonitor::stats() const {
    MonitorStatsSnapshot snap;
    snap.events_received = stats_.events_received.load();
    snap.events_ignored = stats_.events_ignored.load();
    snap.events_debounced = stats_.events_debounced.load();
    snap.files_processed = stats_.files_processed.load();
    snap.files_failed = stats_.files_failed.load();
    snap.files_removed = stats_.files_removed.load();
    return snap;
}

core::Result<void> ChangeMonitor::waitForIdle(std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    while (true) {
        bool idle = channel_.drained();
        if (idle) {
            std::lock_guard<std::mutex> lock(state_mutex_);
            idle = std::none_of(paths_.begin(), paths_.end(), [](const auto& entry) {
                return entry.second.state != PathState::IDLE;
            });
        }
        if (idle) {
            return core::Result<void>();
        }
        if (Clock::now() >= deadline) {
            return core::Result<void>::error(core::Error::Code::INTERNAL, "Timed out waiting for monitor to go idle");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

} // namespace monitor
} // namespace vecsync
