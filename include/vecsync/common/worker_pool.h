#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "vecsync/common/logger.h"
#include "vecsync/core/result.h"

namespace vecsync {
namespace common {

/**
 * @brief Unit of work executed by a WorkerPool
 */
struct PoolTask {
    std::string name;  // Used in failure logs
    std::function<core::Result<void>()> task_func;
    std::chrono::steady_clock::time_point created_time;

    PoolTask(std::string n, std::function<core::Result<void>()> func)
        : name(std::move(n)), task_func(std::move(func)),
          created_time(std::chrono::steady_clock::now()) {}
};

/**
 * @brief Worker pool configuration
 */
struct WorkerPoolConfig {
    std::string name = "pool";
    uint32_t num_workers = 4;
    uint32_t max_queue_size = 100000;
    std::chrono::milliseconds shutdown_timeout{5000};
    std::chrono::milliseconds worker_wait_timeout{100};

    WorkerPoolConfig() = default;
};

/**
 * @brief Worker pool statistics
 */
struct WorkerPoolStats {
    std::atomic<uint64_t> tasks_submitted{0};
    std::atomic<uint64_t> tasks_processed{0};
    std::atomic<uint64_t> tasks_failed{0};
    std::atomic<uint64_t> tasks_rejected{0};
    std::atomic<uint64_t> tasks_abandoned{0};

    void reset() {
        tasks_submitted.store(0);
        tasks_processed.store(0);
        tasks_failed.store(0);
        tasks_rejected.store(0);
        tasks_abandoned.store(0);
    }
};

struct WorkerPoolStatsSnapshot {
    uint64_t tasks_submitted = 0;
    uint64_t tasks_processed = 0;
    uint64_t tasks_failed = 0;
    uint64_t tasks_rejected = 0;
    uint64_t tasks_abandoned = 0;
    uint64_t queue_size = 0;
};

/**
 * @brief Bounded thread pool
 *
 * A fixed number of workers pull tasks from a FIFO queue. A task failing
 * (error result or exception) is logged and counted, it never stops a
 * worker. shutdown() lets queued and running tasks finish for at most
 * shutdown_timeout; tasks still queued after that are dropped, running
 * tasks are always waited for.
 */
class WorkerPool {
public:
    explicit WorkerPool(const WorkerPoolConfig& config, LoggerPtr logger);
    ~WorkerPool();

    // Disable copy
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Disable move
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    /**
     * @brief Start the worker threads
     * @return Result indicating success or failure
     */
    core::Result<void> initialize();

    /**
     * @brief Drain and stop the workers
     * @return Error if queued tasks had to be dropped
     */
    core::Result<void> shutdown();

    /**
     * @brief Queue a task
     * @return Error if the pool is not running or the queue is full
     */
    core::Result<void> submit(std::string name, std::function<core::Result<void>()> task_func);

    /**
     * @brief Block until the queue is empty and no task is running
     * @param timeout Maximum time to wait
     */
    core::Result<void> waitForCompletion(std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});

    WorkerPoolStatsSnapshot getStats() const;
    uint32_t getQueueSize() const;
    bool isRunning() const { return initialized_.load() && !shutdown_requested_.load(); }

    const WorkerPoolConfig& getConfig() const { return config_; }

private:
    void workerThread();
    void processTask(PoolTask& task);
    std::unique_ptr<PoolTask> getNextTask();

    WorkerPoolConfig config_;
    LoggerPtr logger_;
    WorkerPoolStats stats_;

    std::atomic<bool> initialized_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> abandon_queue_{false};
    std::atomic<uint32_t> active_tasks_{0};

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_condition_;
    std::condition_variable idle_condition_;
    std::queue<std::unique_ptr<PoolTask>> task_queue_;
    std::vector<std::thread> workers_;
};

} // namespace common
} // namespace vecsync
