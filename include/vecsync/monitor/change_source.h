#ifndef VECSYNC_MONITOR_CHANGE_SOURCE_H_
#define VECSYNC_MONITOR_CHANGE_SOURCE_H_

#include <mutex>
#include <string>
#include <vector>

#include "vecsync/core/result.h"
#include "vecsync/core/types.h"
#include "vecsync/monitor/event_channel.h"

namespace vecsync {
namespace monitor {

/**
 * @brief Producer of filesystem change events for a set of roots
 *
 * A source pushes ChangeEvent values onto the channel given to start()
 * until stop() returns. Paths in events are absolute.
 */
class ChangeSource {
public:
    virtual ~ChangeSource() = default;

    virtual core::Result<void> start(const std::vector<std::string>& roots, EventChannel& channel) = 0;
    virtual void stop() = 0;

    virtual core::Result<void> addRoot(const std::string& root) = 0;
    virtual core::Result<void> removeRoot(const std::string& root) = 0;
};

/**
 * @brief Source driven by explicit emit() calls
 *
 * Used by tests and by embedders that receive change notifications from
 * somewhere other than the local kernel.
 */
class ManualChangeSource : public ChangeSource {
public:
    core::Result<void> start(const std::vector<std::string>& roots, EventChannel& channel) override;
    void stop() override;

    core::Result<void> addRoot(const std::string& root) override;
    core::Result<void> removeRoot(const std::string& root) override;

    // False when not started or the channel is closed.
    bool emit(core::ChangeEvent event);

    std::vector<std::string> roots() const;

private:
    mutable std::mutex mutex_;
    EventChannel* channel_ = nullptr;
    std::vector<std::string> roots_;
};

} // namespace monitor
} // namespace vecsync

#endif // VECSYNC_MONITOR_CHANGE_SOURCE_H_
