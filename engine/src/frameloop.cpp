#include "motive/frameloop.hpp"
#include <algorithm>

namespace motive {

FrameLoop& FrameLoop::shared() {
    static FrameLoop loop;
    return loop;
}

FrameLoop::Handle FrameLoop::schedule(Callback callback, bool keepAlive) {
    Handle h = nextHandle_++;
    next_.push_back(Entry{h, std::move(callback), keepAlive});
    return h;
}

void FrameLoop::cancel(Handle handle) {
    next_.erase(std::remove_if(next_.begin(), next_.end(), [handle](const Entry& e) { return e.handle == handle; }),
                next_.end());
    if (processing_) cancelled_.insert(handle);
}

void FrameLoop::process(double timestampMs) {
    if (processing_) return;

    frame_.delta = useDefaultElapsed_
                       ? kDefaultTimestep
                       : std::max(std::min(timestampMs - frame_.timestamp, kMaxElapsed), 1.0);
    frame_.timestamp = timestampMs;

    std::vector<Entry> current;
    current.swap(next_);
    processing_ = true;
    size_t i = 0;
    try {
        for (; i < current.size(); ++i) {
            Entry& entry = current[i];
            if (cancelled_.count(entry.handle)) continue;
            // Re-queue before running so a cancel from inside the callback removes it
            if (entry.keepAlive) next_.push_back(Entry{entry.handle, entry.callback, true});
            entry.callback(frame_);
        }
    } catch (...) {
        // Entries that never ran wait for the next frame
        for (size_t j = i + 1; j < current.size(); ++j) {
            if (!cancelled_.count(current[j].handle)) next_.push_back(std::move(current[j]));
        }
        processing_ = false;
        cancelled_.clear();
        useDefaultElapsed_ = next_.empty();
        throw;
    }
    processing_ = false;
    cancelled_.clear();

    // Idle loops restart with the default timestep
    useDefaultElapsed_ = next_.empty();
}

} // namespace motive
