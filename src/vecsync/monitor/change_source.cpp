#include "vecsync/monitor/change_source.h"

#include <algorithm>

namespace vecsync {
namespace monitor {

core::Result<void> ManualChangeSource::start(const std::vector<std::string>& roots,
                                             EventChannel& channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (channel_ != nullptr) {
        return core::Result<void>::error(core::Error::Code::INVALID_ARGUMENT,
                                         "Change source already started");
    }
    channel_ = &channel;
    roots_ = roots;
    return core::Result<void>();
}

void ManualChangeSource::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    channel_ = nullptr;
}

core::Result<void> ManualChangeSource::addRoot(const std::string& root) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(roots_.begin(), roots_.end(), root) == roots_.end()) {
        roots_.push_back(root);
    }
    return core::Result<void>();
}

core::Result<void> ManualChangeSource::removeRoot(const std::string& root) {
    std::lock_guard<std::mutex> lock(mutex_);
    roots_.erase(std::remove(roots_.begin(), roots_.end(), root), roots_.end());
    return core::Result<void>();
}

bool ManualChangeSource::emit(core::ChangeEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (channel_ == nullptr) {
        return false;
    }
    return channel_->push(std::move(event));
}

std::vector<std::string> ManualChangeSource::roots() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return roots_;
}

} // namespace monitor
} // namespace vecsync
