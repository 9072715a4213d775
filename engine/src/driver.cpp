#include "motive/driver.hpp"

namespace motive {

FrameLoopDriver::FrameLoopDriver(FrameLoop& loop, UpdateFn update) : loop_(loop), update_(std::move(update)) {}

FrameLoopDriver::~FrameLoopDriver() { stop(); }

void FrameLoopDriver::start() {
    if (handle_ != 0) return;
    handle_ = loop_.schedule([this](const FrameData& frame) { update_(frame.delta); }, true);
}

void FrameLoopDriver::stop() {
    if (handle_ == 0) return;
    loop_.cancel(handle_);
    handle_ = 0;
}

DriverFactory frameLoopDriver() { return frameLoopDriver(FrameLoop::shared()); }

DriverFactory frameLoopDriver(FrameLoop& loop) {
    FrameLoop* target = &loop;
    return [target](UpdateFn update) -> std::unique_ptr<Driver> {
        return std::make_unique<FrameLoopDriver>(*target, std::move(update));
    };
}

} // namespace motive
