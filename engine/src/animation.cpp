#include "motive/animation.hpp"
#include "motive/interpolate.hpp"
#include <algorithm>
#include <stdexcept>

namespace motive {

RepeatType parseRepeatType(const std::string& name) {
    if (name == "loop") return RepeatType::Loop;
    if (name == "reverse") return RepeatType::Reverse;
    if (name == "mirror") return RepeatType::Mirror;
    throw std::invalid_argument("unknown repeat type: " + name);
}

const char* repeatTypeName(RepeatType type) {
    switch (type) {
    case RepeatType::Loop: return "loop";
    case RepeatType::Reverse: return "reverse";
    case RepeatType::Mirror: return "mirror";
    }
    return "loop";
}

double loopElapsed(double elapsed, double duration, double delay) {
    return elapsed - duration - delay;
}

double reverseElapsed(double elapsed, double duration, double delay, bool isForwardPlayback) {
    return isForwardPlayback ? loopElapsed(duration + -elapsed, duration, delay)
                             : duration - (elapsed - duration) + delay;
}

bool hasRepeatDelayElapsed(double elapsed, double duration, double delay, bool isForwardPlayback) {
    return isForwardPlayback ? elapsed >= duration + delay : elapsed <= -delay;
}

namespace {

// Sampling resolution for headless fast-forwarding
constexpr double kMinSampleStep = 50.0;

GeneratorOptions generator_options(const AnimationOptions& o, std::vector<Value> keyframes) {
    GeneratorOptions g;
    g.keyframes = std::move(keyframes);
    g.duration = o.duration;
    g.ease = o.ease;
    g.times = o.times;
    g.velocity = o.velocity;
    g.stiffness = o.stiffness;
    g.damping = o.damping;
    g.mass = o.mass;
    g.restSpeed = o.restSpeed;
    g.restDelta = o.restDelta;
    g.power = o.power;
    g.timeConstant = o.timeConstant;
    g.modifyTarget = o.modifyTarget;
    return g;
}

} // namespace

struct AnimationControls::Session {
    explicit Session(AnimationOptions o);

    void update(double delta);
    void repeat();
    void complete();
    void play();
    void stop();
    AnimationState sample(double t, bool isControlled);

    AnimationOptions options;
    double elapsed;
    const double initialElapsed;
    int repeatCount {0};
    std::optional<double> computedDuration;
    bool isComplete {false};
    bool isForwardPlayback {true};
    bool playing {false};
    bool completionFired {false};
    AnimationState state;

    std::unique_ptr<Generator> generator;
    // Set when keyframes are non-numeric and the generator runs on [0,100]
    std::optional<Interpolator> interpolateFromNumber;
    // Declared last: destroyed first, so no tick can reach a half-destroyed session
    std::unique_ptr<Driver> driver;
};

AnimationControls::Session::Session(AnimationOptions o)
    : options(std::move(o)), elapsed(options.elapsed), initialElapsed(options.elapsed), computedDuration(options.duration) {
    if (options.keyframes.empty()) throw std::invalid_argument("animateValue requires keyframes");

    const GeneratorType& type = selectGeneratorType(options.type, options.keyframes.size());
    const Value origin = options.keyframes.front();
    const Value target = options.keyframes.back();
    state.value = origin;
    state.done = false;

    std::vector<Value> keyframes = options.keyframes;
    if (type.needsInterpolation && type.needsInterpolation(origin, target)) {
        InterpolateOptions io;
        io.clamp = false;
        interpolateFromNumber.emplace(std::vector<double>{0.0, 100.0}, std::vector<Value>{origin, target}, io);
        keyframes = {0.0, 100.0};
    }

    generator = type.create(generator_options(options, std::move(keyframes)));
}

void AnimationControls::Session::update(double delta) {
    if (!isForwardPlayback) delta = -delta;
    elapsed += delta;

    if (!isComplete) {
        state = generator->next(std::max(0.0, elapsed));
        if (interpolateFromNumber) state.value = (*interpolateFromNumber)(std::get<double>(state.value));
        isComplete = isForwardPlayback ? state.done : elapsed <= 0.0;
    }

    if (options.onUpdate) options.onUpdate(state.value);

    if (!isComplete) return;

    if (repeatCount == 0 && !computedDuration) computedDuration = elapsed;

    if (repeatCount < options.repeat) {
        if (hasRepeatDelayElapsed(elapsed, *computedDuration, options.repeatDelay, isForwardPlayback)) repeat();
    } else {
        complete();
    }
}

void AnimationControls::Session::repeat() {
    repeatCount++;

    if (options.repeatType == RepeatType::Reverse) {
        isForwardPlayback = repeatCount % 2 == 0;
        elapsed = reverseElapsed(elapsed, computedDuration.value_or(0.0), options.repeatDelay, isForwardPlayback);
    } else {
        elapsed = loopElapsed(elapsed, *computedDuration, options.repeatDelay);
        if (options.repeatType == RepeatType::Mirror) generator->flipTarget();
    }

    isComplete = false;
    if (options.onRepeat) options.onRepeat();
}

void AnimationControls::Session::complete() {
    if (driver) driver->stop();
    playing = false;
    if (completionFired) return;
    completionFired = true;
    if (options.onComplete) options.onComplete();
}

void AnimationControls::Session::play() {
    if (options.onPlay) options.onPlay();
    DriverFactory factory = options.driver ? options.driver : frameLoopDriver();
    driver = factory([this](double delta) { update(delta); });
    playing = true;
    driver->start();
}

void AnimationControls::Session::stop() {
    if (options.onStop) options.onStop();
    if (driver) driver->stop();
    playing = false;
}

AnimationState AnimationControls::Session::sample(double t, bool isControlled) {
    if (isControlled) {
        update(t);
        return state;
    }

    elapsed = initialElapsed;
    const double resolution =
        options.duration && *options.duration != 0.0 ? std::max(*options.duration * 0.5, kMinSampleStep) : kMinSampleStep;

    double sampleElapsed = 0.0;
    update(0.0);
    while (sampleElapsed <= t) {
        update(std::min(t - sampleElapsed, resolution));
        sampleElapsed += resolution;
    }
    return state;
}

AnimationControls::AnimationControls(AnimationOptions options) : session_(std::make_unique<Session>(std::move(options))) {}

AnimationControls::~AnimationControls() = default;
AnimationControls::AnimationControls(AnimationControls&&) noexcept = default;
AnimationControls& AnimationControls::operator=(AnimationControls&&) noexcept = default;

void AnimationControls::play() { session_->play(); }
void AnimationControls::stop() { session_->stop(); }

void AnimationControls::setCurrentTime(double t) {
    session_->elapsed = session_->initialElapsed;
    session_->update(t);
}

AnimationState AnimationControls::sample(double t, bool isControlled) { return session_->sample(t, isControlled); }

const AnimationState& AnimationControls::state() const { return session_->state; }
double AnimationControls::elapsed() const { return session_->elapsed; }
int AnimationControls::repeatCount() const { return session_->repeatCount; }
std::optional<double> AnimationControls::computedDuration() const { return session_->computedDuration; }
bool AnimationControls::isForwardPlayback() const { return session_->isForwardPlayback; }
bool AnimationControls::isComplete() const { return session_->isComplete; }
bool AnimationControls::isPlaying() const { return session_->playing; }

AnimationControls animateValue(AnimationOptions options) {
    bool autoplay = options.autoplay;
    AnimationControls controls(std::move(options));
    if (autoplay) controls.play();
    return controls;
}

} // namespace motive
