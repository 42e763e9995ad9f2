#include "vecsync/monitor/event_channel.h"

namespace vecsync {
namespace monitor {

bool EventChannel::push(core::ChangeEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
    return true;
}

std::optional<core::ChangeEvent> EventChannel::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
        return std::nullopt;
    }
    core::ChangeEvent event = std::move(queue_.front());
    queue_.pop_front();
    ++unacked_;
    return event;
}

void EventChannel::ack() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (unacked_ > 0) {
        --unacked_;
    }
}

bool EventChannel::drained() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty() && unacked_ == 0;
}

void EventChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

void EventChannel::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.clear();
    unacked_ = 0;
    closed_ = false;
}

bool EventChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t EventChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace monitor
} // namespace vecsync
