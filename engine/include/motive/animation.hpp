#pragma once

#include "motive/driver.hpp"
#include "motive/generator.hpp"
#include "motive/value.hpp"
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace motive {

enum class RepeatType : uint8_t {
    Loop = 0,    // restart the same cycle
    Reverse = 1, // alternate direction every cycle
    Mirror = 2,  // swap origin and target every cycle
};

// "loop", "reverse" or "mirror". Throws std::invalid_argument otherwise.
RepeatType parseRepeatType(const std::string& name);
const char* repeatTypeName(RepeatType type);

constexpr int kRepeatForever = std::numeric_limits<int>::max();

struct AnimationOptions {
    std::vector<Value> keyframes;   // origin first, target last
    std::optional<double> duration; // ms; inferred from the first completion when unset
    DriverFactory driver;           // empty: frameLoopDriver()
    double elapsed {0.0};           // initial offset, ms
    int repeat {0};
    RepeatType repeatType {RepeatType::Loop};
    double repeatDelay {0.0}; // ms
    bool autoplay {true};
    std::string type {"keyframes"}; // keyframes, tween, spring, decay

    // Forwarded to the generator
    std::vector<Easing> ease;
    std::vector<double> times;
    double velocity {0.0};
    double stiffness {100.0};
    double damping {10.0};
    double mass {1.0};
    double restSpeed {2.0};
    std::optional<double> restDelta;
    double power {0.8};
    double timeConstant {350.0};
    std::function<double(double)> modifyTarget;

    std::function<void()> onPlay;
    std::function<void()> onStop;
    std::function<void()> onComplete;
    std::function<void()> onRepeat;
    std::function<void(const Value&)> onUpdate;
};

// Elapsed-time helpers used by the repeat logic
double loopElapsed(double elapsed, double duration, double delay = 0.0);
double reverseElapsed(double elapsed, double duration = 0.0, double delay = 0.0, bool isForwardPlayback = true);
bool hasRepeatDelayElapsed(double elapsed, double duration, double delay, bool isForwardPlayback);

// Controller for one animation run. Owns the session state, the generator
// and the driver. Callbacks run synchronously inside the tick that triggers
// them; destroying the controls detaches from the driver.
class AnimationControls {
public:
    explicit AnimationControls(AnimationOptions options);
    ~AnimationControls();
    AnimationControls(AnimationControls&&) noexcept;
    AnimationControls& operator=(AnimationControls&&) noexcept;

    void play();
    void stop();

    // Resets to the initial elapsed time and runs one update of t ms.
    // Only meant for handing off from an external clock; it mutates the session.
    void setCurrentTime(double t);

    // Headless evaluation. Controlled sampling advances the running timeline by
    // t ms; otherwise the animation is fast-forwarded from its initial elapsed
    // time in coarse steps, so short cycles may be approximated.
    AnimationState sample(double t, bool isControlled = false);

    const AnimationState& state() const;
    double elapsed() const;
    int repeatCount() const;
    std::optional<double> computedDuration() const;
    bool isForwardPlayback() const;
    bool isComplete() const;
    bool isPlaying() const;

private:
    struct Session;
    std::unique_ptr<Session> session_;
};

// Builds the session and, when autoplay is set, starts playback.
AnimationControls animateValue(AnimationOptions options);

} // namespace motive
