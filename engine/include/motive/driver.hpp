#pragma once

#include "motive/frameloop.hpp"
#include <functional>
#include <memory>

namespace motive {

// Receives elapsed-time deltas (ms) from a driver.
using UpdateFn = std::function<void(double delta)>;

// A tick source. After start() it calls its update function with a
// non-negative delta every tick until stop(). Destroying a driver stops it.
class Driver {
public:
    virtual ~Driver() = default;
    virtual void start() = 0;
    virtual void stop() = 0;
};

using DriverFactory = std::function<std::unique_ptr<Driver>(UpdateFn)>;

// Driver bound to a FrameLoop; forwards each frame's delta.
class FrameLoopDriver : public Driver {
public:
    FrameLoopDriver(FrameLoop& loop, UpdateFn update);
    ~FrameLoopDriver() override;

    FrameLoopDriver(const FrameLoopDriver&) = delete;
    FrameLoopDriver& operator=(const FrameLoopDriver&) = delete;

    void start() override;
    void stop() override;
    bool running() const { return handle_ != 0; }

private:
    FrameLoop& loop_;
    UpdateFn update_;
    FrameLoop::Handle handle_ {0};
};

// Default driver factory. Uses FrameLoop::shared() when no loop is given.
DriverFactory frameLoopDriver();
DriverFactory frameLoopDriver(FrameLoop& loop);

} // namespace motive
