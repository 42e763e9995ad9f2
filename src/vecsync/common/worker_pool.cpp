#include "vecsync/common/worker_pool.h"

namespace vecsync {
namespace common {

WorkerPool::WorkerPool(const WorkerPoolConfig& config, LoggerPtr logger)
    : config_(config), logger_(logger ? std::move(logger) : Logger::null()) {
}

WorkerPool::~WorkerPool() {
    if (initialized_.load()) {
        auto result = shutdown();
        if (!result.ok()) {
            logger_->warn("[{}] {}", config_.name, result.error());
        }
    }
}

core::Result<void> WorkerPool::initialize() {
    if (initialized_.load()) {
        return core::Result<void>::error(core::Error::Code::INVALID_ARGUMENT,
                                         "WorkerPool already initialized");
    }
    if (config_.num_workers == 0) {
        return core::Result<void>::error(core::Error::Code::INVALID_ARGUMENT,
                                         "Invalid number of workers: 0");
    }
    if (config_.max_queue_size == 0) {
        return core::Result<void>::error(core::Error::Code::INVALID_ARGUMENT,
                                         "Invalid max queue size: 0");
    }

    stats_.reset();
    shutdown_requested_.store(false);
    abandon_queue_.store(false);

    workers_.reserve(config_.num_workers);
    for (uint32_t i = 0; i < config_.num_workers; ++i) {
        workers_.emplace_back(&WorkerPool::workerThread, this);
    }

    initialized_.store(true);
    logger_->debug("[{}] started {} workers", config_.name, config_.num_workers);
    return core::Result<void>();
}

core::Result<void> WorkerPool::shutdown() {
    if (!initialized_.load() || shutdown_requested_.exchange(true)) {
        return core::Result<void>();
    }
    queue_condition_.notify_all();

    // Let queued and running tasks finish within the bounded wait.
    bool drained = false;
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        drained = idle_condition_.wait_for(lock, config_.shutdown_timeout, [this] {
            return task_queue_.empty() && active_tasks_.load() == 0;
        });
    }
    if (!drained) {
        abandon_queue_.store(true);
        queue_condition_.notify_all();
    }

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    initialized_.store(false);

    uint64_t abandoned = stats_.tasks_abandoned.load();
    if (abandoned > 0) {
        return core::Result<void>::error(core::Error::Code::INTERNAL,
            "Shutdown timed out, dropped " + std::to_string(abandoned) + " queued tasks");
    }
    return core::Result<void>();
}

core::Result<void> WorkerPool::submit(std::string name, std::function<core::Result<void>()> task_func) {
    if (shutdown_requested_.load()) {
        stats_.tasks_rejected.fetch_add(1);
        return core::Result<void>::error(core::Error::Code::INTERNAL, "WorkerPool is shutting down");
    }
    if (!initialized_.load()) {
        stats_.tasks_rejected.fetch_add(1);
        return core::Result<void>::error(core::Error::Code::INTERNAL, "WorkerPool not initialized");
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (task_queue_.size() >= config_.max_queue_size) {
            stats_.tasks_rejected.fetch_add(1);
            return core::Result<void>::error(core::Error::Code::INTERNAL, "Queue is full");
        }
        task_queue_.push(std::make_unique<PoolTask>(std::move(name), std::move(task_func)));
        stats_.tasks_submitted.fetch_add(1);
    }
    queue_condition_.notify_one();
    return core::Result<void>();
}

core::Result<void> WorkerPool::waitForCompletion(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    bool idle = idle_condition_.wait_for(lock, timeout, [this] {
        return task_queue_.empty() && active_tasks_.load() == 0;
    });
    if (!idle) {
        return core::Result<void>::error(core::Error::Code::INTERNAL, "Wait for completion timed out");
    }
    return core::Result<void>();
}

WorkerPoolStatsSnapshot WorkerPool::getStats() const {
    WorkerPoolStatsSnapshot snap;
    snap.tasks_submitted = stats_.tasks_submitted.load();
    snap.tasks_processed = stats_.tasks_processed.load();
    snap.tasks_failed = stats_.tasks_failed.load();
    snap.tasks_rejected = stats_.tasks_rejected.load();
    snap.tasks_abandoned = stats_.tasks_abandoned.load();
    snap.queue_size = getQueueSize();
    return snap;
}

uint32_t WorkerPool::getQueueSize() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return static_cast<uint32_t>(task_queue_.size());
}

void WorkerPool::workerThread() {
    while (true) {
        auto task = getNextTask();
        if (task) {
            processTask(*task);
            continue;
        }
        if (shutdown_requested_.load()) {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (task_queue_.empty()) {
                break;
            }
        }
    }
}

void WorkerPool::processTask(PoolTask& task) {
    try {
        auto result = task.task_func();
        if (!result.ok()) {
            stats_.tasks_failed.fetch_add(1);
            logger_->warn("[{}] task '{}' failed: {}", config_.name, task.name, result.error());
        }
    } catch (const std::exception& e) {
        stats_.tasks_failed.fetch_add(1);
        logger_->error("[{}] task '{}' threw: {}", config_.name, task.name, e.what());
    }
    stats_.tasks_processed.fetch_add(1);

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        active_tasks_.fetch_sub(1);
    }
    idle_condition_.notify_all();
}

std::unique_ptr<PoolTask> WorkerPool::getNextTask() {
    std::unique_lock<std::mutex> lock(queue_mutex_);

    queue_condition_.wait_for(lock, config_.worker_wait_timeout, [this] {
        return !task_queue_.empty() || shutdown_requested_.load();
    });

    if (abandon_queue_.load()) {
        while (!task_queue_.empty()) {
            task_queue_.pop();
            stats_.tasks_abandoned.fetch_add(1);
        }
        idle_condition_.notify_all();
        return nullptr;
    }
    if (task_queue_.empty()) {
        return nullptr;
    }

    auto task = std::move(task_queue_.front());
    task_queue_.pop();
    active_tasks_.fetch_add(1);
    return task;
}

} // namespace common
} // namespace vecsync
