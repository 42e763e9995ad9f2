#ifndef VECSYNC_MONITOR_EVENT_CHANNEL_H_
#define VECSYNC_MONITOR_EVENT_CHANNEL_H_

#include <chrono>
#include <cstddef>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

#include "vecsync/core/types.h"

namespace vecsync {
namespace monitor {

/**
 * @brief Unbounded multi-producer queue of change events
 *
 * After close() pushes are refused, while events already queued can still
 * be popped. pop() returns nullopt on timeout or once closed and drained.
 * Every popped event must be ack()ed once handled; drained() is true only
 * when nothing is queued or unacknowledged.
 */
class EventChannel {
public:
    EventChannel() = default;

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    // False if the channel is closed.
    bool push(core::ChangeEvent event);

    std::optional<core::ChangeEvent> pop(std::chrono::milliseconds timeout);

    void ack();
    bool drained() const;

    void close();

    // Re-open after close(); queued events are discarded.
    void reset();

    bool closed() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<core::ChangeEvent> queue_;
    size_t unacked_ = 0;
    bool closed_ = false;
};

} // namespace monitor
} // namespace vecsync

#endif // VECSYNC_MONITOR_EVENT_CHANNEL_H_
