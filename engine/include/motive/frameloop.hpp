#pragma once

#include <cstdint>
#include <functional>
#include <unordered_set>
#include <vector>

namespace motive {

struct FrameData {
    double delta {0.0};     // ms since the previous frame
    double timestamp {0.0}; // ms, host clock
};

// Per-frame callback scheduler. The host pumps process() once per display
// refresh; callbacks run in scheduling order. Not thread-safe.
class FrameLoop {
public:
    using Callback = std::function<void(const FrameData&)>;
    using Handle = uint64_t;

    static constexpr double kDefaultTimestep = 1000.0 / 60.0;
    static constexpr double kMaxElapsed = 40.0;

    // Process-wide loop used by the default driver.
    static FrameLoop& shared();

    // Runs callback on the next frame; keepAlive keeps it on every frame until cancelled.
    Handle schedule(Callback callback, bool keepAlive = false);
    // Safe to call from inside a running callback.
    void cancel(Handle handle);

    void process(double timestampMs);

    bool hasPending() const { return !next_.empty(); }
    const FrameData& frame() const { return frame_; }

private:
    struct Entry {
        Handle handle;
        Callback callback;
        bool keepAlive;
    };

    std::vector<Entry> next_;
    std::unordered_set<Handle> cancelled_; // handles cancelled mid-frame
    FrameData frame_;
    Handle nextHandle_ {1};
    bool processing_ {false};
    bool useDefaultElapsed_ {true};
};

} // namespace motive
