#include "vecsync/monitor/inotify_change_source.h"

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <vector>

#include "vecsync/common/path_id.h"

namespace vecsync {
namespace monitor {

namespace fs = std::filesystem;

namespace {

constexpr uint32_t kWatchMask = IN_CREATE | IN_CLOSE_WRITE | IN_DELETE | IN_MOVED_FROM |
                                IN_MOVED_TO | IN_ONLYDIR | IN_DONT_FOLLOW | IN_EXCL_UNLINK;

bool under(const std::string& path, const std::string& dir) {
    return path == dir ||
           (path.size() > dir.size() && path.compare(0, dir.size(), dir) == 0 && path[dir.size()] == '/');
}

} // namespace

InotifyChangeSource::InotifyChangeSource(const core::MonitorConfig& config, common::LoggerPtr logger)
    : config_(config), logger_(logger ? std::move(logger) : common::Logger::null()) {
}

InotifyChangeSource::~InotifyChangeSource() {
    stop();
}

core::Result<void> InotifyChangeSource::start(const std::vector<std::string>& roots,
                                              EventChannel& channel) {
    if (running_.load()) {
        return core::Result<void>::error(core::Error::Code::INVALID_ARGUMENT,
                                         "inotify source already started");
    }

    fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd_ < 0) {
        return core::Result<void>::error(core::Error::Code::INTERNAL,
            std::string("inotify_init1 failed: ") + std::strerror(errno));
    }
    channel_ = &channel;

    for (const auto& root : roots) {
        auto watched = watchTree(common::canonical_path(root), false);
        if (!watched.ok()) {
            ::close(fd_);
            fd_ = -1;
            channel_ = nullptr;
            std::lock_guard<std::mutex> lock(watch_mutex_);
            watches_.clear();
            return watched;
        }
    }

    running_.store(true);
    reader_ = std::thread(&InotifyChangeSource::readLoop, this);
    logger_->info("Watching {} roots ({} directories)", roots.size(), watchCount());
    return core::Result<void>();
}

void InotifyChangeSource::stop() {
    if (running_.exchange(false) && reader_.joinable()) {
        reader_.join();
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    channel_ = nullptr;
    creating_.clear();
    std::lock_guard<std::mutex> lock(watch_mutex_);
    watches_.clear();
}

core::Result<void> InotifyChangeSource::addRoot(const std::string& root) {
    if (fd_ < 0) {
        return core::Result<void>::error(core::Error::Code::INVALID_ARGUMENT,
                                         "inotify source not started");
    }
    return watchTree(common::canonical_path(root), false);
}

core::Result<void> InotifyChangeSource::removeRoot(const std::string& root) {
    unwatchTree(common::canonical_path(root));
    return core::Result<void>();
}

size_t InotifyChangeSource::watchCount() const {
    std::lock_guard<std::mutex> lock(watch_mutex_);
    return watches_.size();
}

core::Result<void> InotifyChangeSource::watchTree(const std::string& dir, bool report_files) {
    int wd = ::inotify_add_watch(fd_, dir.c_str(), kWatchMask);
    if (wd < 0) {
        int err = errno;
        auto code = (err == ENOENT || err == ENOTDIR) ? core::Error::Code::NOT_FOUND
                                                      : core::Error::Code::INTERNAL;
        if (err == ENOSPC) {
            logger_->error("inotify watch limit reached at {}; raise fs.inotify.max_user_watches", dir);
        }
        return core::Result<void>::error(code,
            "Cannot watch " + dir + ": " + std::strerror(err));
    }
    {
        std::lock_guard<std::mutex> lock(watch_mutex_);
        watches_[wd] = dir;
    }

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        logger_->warn("Cannot list {}: {}", dir, ec.message());
        return core::Result<void>();
    }
    std::vector<fs::directory_entry> entries;
    for (fs::directory_iterator end; it != end;) {
        entries.push_back(*it);
        it.increment(ec);
        if (ec) {
            logger_->warn("Listing {} interrupted: {}", dir, ec.message());
            break;
        }
    }
    for (const auto& entry : entries) {
        std::error_code entry_ec;
        if (entry.is_symlink(entry_ec)) {
            continue;
        }
        const std::string child = entry.path().string();
        if (entry.is_directory(entry_ec)) {
            auto watched = watchTree(child, report_files);
            if (!watched.ok()) {
                logger_->warn("{}", watched.error());
            }
        } else if (report_files && entry.is_regular_file(entry_ec)) {
            emit(core::ChangeEvent(child, core::ChangeKind::CREATED));
        }
    }
    return core::Result<void>();
}

void InotifyChangeSource::unwatchTree(const std::string& dir) {
    std::lock_guard<std::mutex> lock(watch_mutex_);
    for (auto it = watches_.begin(); it != watches_.end();) {
        if (under(it->second, dir)) {
            if (fd_ >= 0) {
                ::inotify_rm_watch(fd_, it->first);
            }
            it = watches_.erase(it);
        } else {
            ++it;
        }
    }
}

void InotifyChangeSource::renameWatches(const std::string& from, const std::string& to) {
    std::lock_guard<std::mutex> lock(watch_mutex_);
    for (auto& entry : watches_) {
        if (under(entry.second, from)) {
            entry.second = to + entry.second.substr(from.size());
        }
    }
}

std::string InotifyChangeSource::watchedPath(int wd) const {
    std::lock_guard<std::mutex> lock(watch_mutex_);
    auto it = watches_.find(wd);
    return it == watches_.end() ? std::string() : it->second;
}

void InotifyChangeSource::readLoop() {
    alignas(struct inotify_event) char buffer[64 * 1024];
    const int timeout_ms = static_cast<int>(config_.poll_interval.count() > 0
                                                ? config_.poll_interval.count() : 200);

    while (running_.load()) {
        struct pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, timeout_ms);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            logger_->error("poll on inotify descriptor failed: {}", std::strerror(errno));
            break;
        }
        if (rc == 0) {
            continue;
        }

        ssize_t length = ::read(fd_, buffer, sizeof(buffer));
        if (length < 0) {
            if (errno == EAGAIN || errno == EINTR) {
                continue;
            }
            logger_->error("read on inotify descriptor failed: {}", std::strerror(errno));
            break;
        }
        processBuffer(buffer, length);
    }
    logger_->debug("inotify reader stopped");
}

void InotifyChangeSource::processBuffer(const char* buffer, ssize_t length) {
    std::unordered_map<uint32_t, PendingMove> moves;

    for (const char* ptr = buffer; ptr < buffer + length;) {
        const auto* event = reinterpret_cast<const struct inotify_event*>(ptr);
        ptr += sizeof(struct inotify_event) + event->len;

        if (event->mask & IN_Q_OVERFLOW) {
            logger_->warn("inotify queue overflowed; some changes were lost");
            continue;
        }
        if (event->mask & IN_IGNORED) {
            std::lock_guard<std::mutex> lock(watch_mutex_);
            watches_.erase(event->wd);
            continue;
        }
        if (event->len == 0) {
            continue;  // event on the watched directory itself
        }

        const std::string dir = watchedPath(event->wd);
        if (dir.empty()) {
            continue;
        }
        const std::string path = dir + "/" + event->name;
        const bool is_dir = (event->mask & IN_ISDIR) != 0;

        if (event->mask & IN_CREATE) {
            if (is_dir) {
                auto watched = watchTree(path, true);
                if (!watched.ok()) {
                    logger_->warn("{}", watched.error());
                }
            } else {
                // Reported once the writer closes it, so the content exists.
                creating_.insert(path);
            }
        } else if (event->mask & IN_CLOSE_WRITE) {
            const bool created = creating_.erase(path) > 0;
            emit(core::ChangeEvent(path, created ? core::ChangeKind::CREATED : core::ChangeKind::MODIFIED));
        } else if (event->mask & IN_DELETE) {
            creating_.erase(path);
            emit(core::ChangeEvent(path, core::ChangeKind::DELETED, is_dir));
        } else if (event->mask & IN_MOVED_FROM) {
            creating_.erase(path);
            moves[event->cookie] = PendingMove{path, is_dir};
        } else if (event->mask & IN_MOVED_TO) {
            auto from = moves.find(event->cookie);
            if (from != moves.end()) {
                core::ChangeEvent moved(from->second.path, core::ChangeKind::MOVED, is_dir);
                moved.dest_path = path;
                if (is_dir) {
                    renameWatches(from->second.path, path);
                }
                moves.erase(from);
                emit(std::move(moved));
            } else if (is_dir) {
                auto watched = watchTree(path, true);
                if (!watched.ok()) {
                    logger_->warn("{}", watched.error());
                }
            } else {
                emit(core::ChangeEvent(path, core::ChangeKind::CREATED));
            }
        }
    }

    // Moved out of the watched trees.
    for (auto& entry : moves) {
        if (entry.second.is_directory) {
            unwatchTree(entry.second.path);
        }
        emit(core::ChangeEvent(entry.second.path, core::ChangeKind::DELETED, entry.second.is_directory));
    }
}

void InotifyChangeSource::emit(core::ChangeEvent event) {
    logger_->trace("{} {}", core::change_kind_name(event.kind), event.path);
    if (channel_ == nullptr || !channel_->push(std::move(event))) {
        logger_->debug("Event channel closed, dropping event");
    }
}

} // namespace monitor
} // namespace vecsync
