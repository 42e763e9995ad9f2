#include "vecsync/scanner/file_scanner.h"

#include <algorithm>
#include <chrono>
#include <system_error>
#include <thread>

#include "vecsync/common/path_id.h"
#include "vecsync/common/worker_pool.h"

namespace vecsync {
namespace scanner {

namespace fs = std::filesystem;

FileScanner::FileScanner(index::VectorIndex& index,
                         const extract::ContentExtractor& extractor,
                         const embedding::EmbeddingProvider& embedder,
                         const core::ScannerConfig& config,
                         common::LoggerPtr logger,
                         core::ProgressCallback progress)
    : index_(index),
      extractor_(extractor),
      embedder_(embedder),
      config_(config),
      logger_(logger ? std::move(logger) : common::Logger::null()),
      progress_(std::move(progress)) {
    const auto handled = extractor_.extensions();
    std::string unhandled;
    for (const auto& ext : config_.supported_extensions) {
        std::string lower = common::lower_extension(fs::path("x" + ext));
        if (std::find(handled.begin(), handled.end(), lower) == handled.end()) {
            unhandled += (unhandled.empty() ? "" : ", ") + lower;
        } else if (std::find(extensions_.begin(), extensions_.end(), lower) == extensions_.end()) {
            extensions_.push_back(lower);
        }
    }
    if (!unhandled.empty()) {
        logger_->info("No extractor registered for {}; those files are skipped", unhandled);
    }
    if (extensions_.empty()) {
        logger_->warn("No configured extension is handled by the extractor; scans will index nothing");
    }
}

bool FileScanner::isSupported(const fs::path& path) const {
    const std::string ext = common::lower_extension(path);
    return !ext.empty() && std::find(extensions_.begin(), extensions_.end(), ext) != extensions_.end();
}

core::ScanResult FileScanner::scanDirectory(const std::string& root) {
    const auto start = std::chrono::steady_clock::now();
    const core::Timestamp scan_time = core::now_millis();
    const std::string canonical = common::canonical_path(root);

    std::error_code ec;
    if (!fs::exists(canonical, ec)) {
        logger_->warn("Scan root does not exist: {}", canonical);
        return core::ScanResult::failure(canonical, "Path does not exist: " + canonical);
    }
    if (!fs::is_directory(canonical, ec)) {
        logger_->warn("Scan root is not a directory: {}", canonical);
        return core::ScanResult::failure(canonical, "Not a directory: " + canonical);
    }

    reportProgress("Scanning " + canonical);
    logger_->info("Scanning {}", canonical);

    Pass pass;
    scanTree(canonical, pass);
    pruneStale(canonical, pass);

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    logger_->info("Scan of {} finished in {} ms: {} files, {} errors",
                  canonical, duration, pass.files.size(), pass.errors.size());
    reportProgress("Scan of " + canonical + " finished: " + std::to_string(pass.files.size()) +
                   " files, " + std::to_string(pass.errors.size()) + " errors");

    return core::ScanResult(std::move(pass.files), {canonical}, std::move(pass.errors),
                            scan_time, duration);
}

void FileScanner::scanTree(const fs::path& dir, Pass& pass) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        logger_->warn("Cannot read directory {}: {}", dir.string(), ec.message());
        pass.errors.push_back(dir.string() + ": cannot read directory: " + ec.message());
        return;
    }

    std::vector<fs::directory_entry> entries;
    for (fs::directory_iterator end; it != end;) {
        entries.push_back(*it);
        it.increment(ec);
        if (ec) {
            pass.errors.push_back(dir.string() + ": listing interrupted: " + ec.message());
            break;
        }
    }
    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path() < b.path();
              });

    for (const auto& entry : entries) {
        std::error_code entry_ec;
        if (entry.is_symlink(entry_ec)) {
            logger_->debug("Skipping symlink {}", entry.path().string());
            continue;
        }
        if (entry.is_directory(entry_ec)) {
            scanTree(entry.path(), pass);
        } else if (entry.is_regular_file(entry_ec)) {
            if (isSupported(entry.path())) {
                pass.seen.insert(common::path_id_for(entry.path()));
                visitFile(entry.path(), pass);
            }
        } else if (entry_ec && entry_ec != std::errc::no_such_file_or_directory) {
            pass.errors.push_back(entry.path().string() + ": " + entry_ec.message());
        }
    }
}

void FileScanner::visitFile(const fs::path& file, Pass& pass) {
    auto record = scanFile(file.string());
    if (!record.ok()) {
        if (record.code() == core::Error::Code::NOT_FOUND) {
            logger_->debug("File vanished during scan: {}", file.string());
            return;
        }
        pass.errors.push_back(file.string() + ": " + record.error());
        return;
    }
    if (record.value().indexed()) {
        pass.files.push_back(record.take_value());
    }
}

void FileScanner::pruneStale(const std::string& root, Pass& pass) {
    size_t removed = 0;
    for (auto id : index_.idsUnder(root)) {
        if (pass.seen.count(id) > 0) {
            continue;
        }
        auto metadata = index_.get(id);
        if (!metadata) {
            continue;
        }
        // Still on disk but not walked (unreadable directory, created mid-scan).
        std::error_code ec;
        if (fs::is_regular_file(fs::symlink_status(metadata->path, ec)) && isSupported(metadata->path)) {
            continue;
        }
        auto result = index_.remove(id);
        if (!result.ok()) {
            pass.errors.push_back(metadata->path + ": cannot drop stale entry: " + result.error());
            continue;
        }
        logger_->debug("Dropped stale entry {}", metadata->path);
        ++removed;
    }
    if (removed > 0) {
        logger_->info("Removed {} stale entries under {}", removed, root);
        reportProgress("Removed " + std::to_string(removed) + " stale entries under " + root);
    }
}

core::Result<core::VectorRecord> FileScanner::scanFile(const std::string& path) {
    const std::string canonical = common::canonical_path(path);
    if (!isSupported(canonical)) {
        return core::Result<core::VectorRecord>(core::VectorRecord{});
    }

    auto content = extractor_.extract(canonical);
    if (!content.ok()) {
        if (content.code() == core::Error::Code::UNSUPPORTED_TYPE) {
            return core::Result<core::VectorRecord>(core::VectorRecord{});
        }
        logger_->warn("Extraction failed for {}: {}", canonical, content.error());
        return core::Result<core::VectorRecord>::propagate(content);
    }
    auto extracted = content.take_value();
    if (extracted.text.empty()) {
        logger_->debug("No text in {}, skipping", canonical);
        return core::Result<core::VectorRecord>(core::VectorRecord{});
    }

    core::VectorRecord record;
    record.id = common::path_id(canonical);
    record.vector = embedder_.embed(extracted.text);
    record.metadata = std::move(extracted.metadata);
    record.metadata.path = canonical;

    // VectorIndex::add replaces an existing entry under its writer lock, so
    // readers never observe the id missing mid-update.
    auto added = index_.add(record.id, record.vector, record.metadata);
    if (!added.ok()) {
        logger_->error("Failed to index {}: {}", canonical, added.error());
        return core::Result<core::VectorRecord>::propagate(added);
    }

    reportProgress("Indexed " + canonical);
    return core::Result<core::VectorRecord>(std::move(record));
}

core::ScanResult FileScanner::scanDirectories(const std::vector<std::string>& roots) {
    const auto start = std::chrono::steady_clock::now();
    const core::Timestamp scan_time = core::now_millis();
    if (roots.empty()) {
        return core::ScanResult({}, {}, {}, scan_time, 0);
    }

    uint32_t workers = config_.scan_workers;
    if (workers == 0) {
        workers = std::max(1u, std::thread::hardware_concurrency());
    }
    workers = std::min<uint32_t>(workers, static_cast<uint32_t>(roots.size()));

    // One slot per root keeps the merge in argument order.
    std::vector<core::ScanResult> partial(roots.size());

    common::WorkerPoolConfig pool_config;
    pool_config.name = "scan";
    pool_config.num_workers = workers;
    common::WorkerPool pool(pool_config, logger_);
    auto init = pool.initialize();

    for (size_t i = 0; i < roots.size(); ++i) {
        auto task = [this, &partial, &roots, i]() -> core::Result<void> {
            partial[i] = scanDirectory(roots[i]);
            return core::Result<void>();
        };
        if (!init.ok() || !pool.submit("scan " + roots[i], task).ok()) {
            task();
        }
    }

    if (init.ok()) {
        while (!pool.waitForCompletion(std::chrono::seconds(1)).ok()) {
            logger_->debug("Waiting for {} scan tasks", pool.getQueueSize());
        }
        auto stopped = pool.shutdown();
        if (!stopped.ok()) {
            logger_->warn("Scan pool shutdown: {}", stopped.error());
        }
    }

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    auto merged = core::ScanResult::merge(partial, scan_time, duration);
    logger_->info("Scanned {} roots in {} ms: {} files, {} errors", roots.size(), duration,
                  merged.scanned_files().size(), merged.errors().size());
    return merged;
}

void FileScanner::reportProgress(const std::string& message) const {
    if (!progress_) {
        return;
    }
    try {
        progress_(message);
    } catch (const std::exception& e) {
        logger_->warn("Progress callback threw: {}", e.what());
    }
}

} // namespace scanner
} // namespace vecsync
