// Tests for the animation session: playback, repeats, sampling.
#include "manual_driver.hpp"
#include "motive/animation.hpp"
#include <cassert>
#include <cmath>
#include <string>
#include <vector>

using namespace motive;

static bool nearly(double a, double b, double eps = 1e-6) { return std::fabs(a - b) <= eps; }

static double num(const Value& v) { return std::get<double>(v); }

static AnimationOptions linear_tween(double duration) {
    AnimationOptions o;
    o.keyframes = {0.0, 100.0};
    o.duration = duration;
    o.ease = {ease::linear};
    o.autoplay = false;
    return o;
}

// Counts flips so mirrored repeats can be observed from outside.
struct FlipProbe {
    int flips {0};
    double limit {100.0};
    double stretch {0.0}; // added to the limit on every flip
};
static FlipProbe g_flip;

class FlipProbeGenerator : public Generator {
public:
    AnimationState next(double t) override {
        AnimationState s;
        s.value = g_flip.flips % 2 == 0 ? 0.0 : 1.0;
        s.done = t >= g_flip.limit;
        return s;
    }
    void flipTarget() override {
        g_flip.flips++;
        g_flip.limit += g_flip.stretch;
    }
};

static void register_flip_probe() {
    registerGeneratorType("flip-probe", GeneratorType{
        [](const GeneratorOptions&) -> std::unique_ptr<Generator> { return std::make_unique<FlipProbeGenerator>(); },
        {}});
}

static void test_forward_completes_once() {
    ManualProbe probe;
    AnimationOptions o = linear_tween(100.0);
    o.driver = manualDriver(probe);
    int completes = 0;
    std::vector<double> seen;
    o.onComplete = [&] { completes++; };
    o.onUpdate = [&](const Value& v) { seen.push_back(num(v)); };

    AnimationControls controls(std::move(o));
    controls.play();
    assert(probe.running);

    assert(probe.tick(25.0));
    assert(probe.tick(25.0));
    assert(probe.tick(25.0));
    assert(completes == 0);
    assert(!controls.isComplete());
    assert(probe.tick(25.0));
    assert(completes == 1);
    assert(controls.state().done);
    assert(nearly(num(controls.state().value), 100.0));
    assert(!probe.running);
    assert(!controls.isPlaying());
    assert(!probe.tick(25.0));

    assert(seen.size() == 4);
    assert(nearly(seen[0], 25.0) && nearly(seen[1], 50.0) && nearly(seen[2], 75.0));

    // Further headless evaluation keeps the terminal state without completing again
    controls.sample(500.0);
    assert(completes == 1);
    assert(controls.computedDuration().has_value() && nearly(*controls.computedDuration(), 100.0));
}

static void test_loop_repeat() {
    ManualProbe probe;
    AnimationOptions o = linear_tween(100.0);
    o.driver = manualDriver(probe);
    o.repeat = 3;
    o.repeatDelay = 20.0;

    AnimationControls* self = nullptr;
    std::string order;
    std::vector<double> after;
    o.onRepeat = [&] {
        order += 'r';
        after.push_back(self->elapsed());
    };
    o.onComplete = [&] { order += 'c'; };

    AnimationControls controls(std::move(o));
    self = &controls;
    controls.play();

    std::vector<double> before;
    int ticks = 0;
    while (probe.running && ticks < 1000) {
        double prev = controls.elapsed();
        int repeats = controls.repeatCount();
        probe.tick(25.0);
        if (controls.repeatCount() != repeats) before.push_back(prev + 25.0);
        // Held at the end of a cycle while the repeat delay runs
        if (controls.isComplete() && probe.running) assert(nearly(num(controls.state().value), 100.0));
        ticks++;
    }

    assert(order == "rrrc");
    assert(controls.repeatCount() == 3);
    assert(before.size() == 3 && after.size() == 3);
    for (size_t i = 0; i < before.size(); ++i) {
        assert(nearly(after[i], before[i] - 100.0 - 20.0));
    }
    // First cycle: completes at 100, held until 125 >= 120, then rolls over to 5
    assert(nearly(before[0], 125.0));
    assert(nearly(after[0], 5.0));
}

static void test_mirror_flips_target() {
    register_flip_probe();
    g_flip = FlipProbe{};

    ManualProbe probe;
    AnimationOptions o;
    o.keyframes = {0.0, 1.0};
    o.type = "flip-probe";
    o.duration = 100.0;
    o.repeat = 4;
    o.repeatType = RepeatType::Mirror;
    o.driver = manualDriver(probe);
    o.autoplay = false;

    AnimationControls* self = nullptr;
    int completes = 0;
    o.onRepeat = [&] { assert(g_flip.flips == self->repeatCount()); };
    o.onComplete = [&] { completes++; };

    AnimationControls controls(std::move(o));
    self = &controls;
    controls.play();
    while (probe.running) {
        probe.tick(50.0);
        // Mid-cycle values follow the current orientation
        if (controls.elapsed() > 0.0 && !controls.isComplete())
            assert(num(controls.state().value) == (g_flip.flips % 2 == 0 ? 0.0 : 1.0));
    }
    assert(g_flip.flips == 4);
    assert(completes == 1);

    // Loop repeats never flip
    g_flip = FlipProbe{};
    ManualProbe probe2;
    AnimationOptions l;
    l.keyframes = {0.0, 1.0};
    l.type = "flip-probe";
    l.duration = 100.0;
    l.repeat = 2;
    l.driver = manualDriver(probe2);
    AnimationControls looped = animateValue(std::move(l));
    while (probe2.running) probe2.tick(50.0);
    assert(looped.repeatCount() == 2);
    assert(g_flip.flips == 0);
}

static void test_mirror_tween_runs_backwards() {
    ManualProbe probe;
    AnimationOptions o = linear_tween(100.0);
    o.repeat = 1;
    o.repeatType = RepeatType::Mirror;
    o.driver = manualDriver(probe);
    AnimationControls controls(std::move(o));
    controls.play();

    probe.tick(50.0);
    assert(nearly(num(controls.state().value), 50.0));
    probe.tick(50.0);
    assert(controls.repeatCount() == 1);
    assert(nearly(controls.elapsed(), 0.0));
    assert(controls.isForwardPlayback());
    probe.tick(25.0);
    assert(nearly(num(controls.state().value), 75.0));
    probe.tick(75.0);
    assert(nearly(num(controls.state().value), 0.0));
    assert(!probe.running);
}

static void test_reverse_alternates_direction() {
    ManualProbe probe;
    AnimationOptions o = linear_tween(100.0);
    o.repeat = 3;
    o.repeatType = RepeatType::Reverse;
    o.driver = manualDriver(probe);

    AnimationControls* self = nullptr;
    std::vector<bool> directions;
    o.onRepeat = [&] {
        directions.push_back(self->isForwardPlayback());
        assert(self->isForwardPlayback() == (self->repeatCount() % 2 == 0));
    };
    bool completed = false;
    o.onComplete = [&] { completed = true; };

    AnimationControls controls(std::move(o));
    self = &controls;
    controls.play();

    for (int i = 0; i < 4; ++i) probe.tick(25.0);
    assert(controls.repeatCount() == 1);
    assert(!controls.isForwardPlayback());
    assert(nearly(controls.elapsed(), 100.0));

    probe.tick(25.0);
    assert(nearly(num(controls.state().value), 75.0));
    probe.tick(50.0);
    assert(nearly(num(controls.state().value), 25.0));
    probe.tick(25.0);
    assert(controls.repeatCount() == 2);
    assert(controls.isForwardPlayback());
    assert(nearly(controls.elapsed(), 0.0));

    int guard = 0;
    while (probe.running && guard++ < 100) probe.tick(25.0);
    assert(completed);
    assert(nearly(num(controls.state().value), 0.0));
    assert((directions == std::vector<bool>{false, true, false}));
}

static void test_reverse_with_delay() {
    ManualProbe probe;
    AnimationOptions o = linear_tween(100.0);
    o.repeat = 2;
    o.repeatType = RepeatType::Reverse;
    o.repeatDelay = 10.0;
    o.driver = manualDriver(probe);
    AnimationControls controls(std::move(o));
    controls.play();

    for (int i = 0; i < 4; ++i) probe.tick(25.0);
    assert(controls.repeatCount() == 0); // 100 < 110, waiting out the delay
    probe.tick(25.0);
    assert(controls.repeatCount() == 1);
    assert(nearly(controls.elapsed(), 85.0));

    for (int i = 0; i < 4; ++i) probe.tick(25.0); // 60, 35, 10, -15
    assert(controls.repeatCount() == 2);
    assert(controls.isForwardPlayback());
    assert(nearly(controls.elapsed(), 5.0));
}

static void test_elapsed_helpers() {
    assert(nearly(loopElapsed(130.0, 100.0, 20.0), 10.0));
    assert(nearly(loopElapsed(100.0, 100.0), 0.0));
    assert(hasRepeatDelayElapsed(120.0, 100.0, 20.0, true));
    assert(!hasRepeatDelayElapsed(119.0, 100.0, 20.0, true));
    assert(hasRepeatDelayElapsed(-20.0, 100.0, 20.0, false));
    assert(!hasRepeatDelayElapsed(-19.0, 100.0, 20.0, false));

    const double samples[] = {-35.0, 0.0, 12.5, 100.0, 137.0};
    for (double e : samples) {
        for (bool forward : {true, false}) {
            double once = reverseElapsed(e, 100.0, 15.0, forward);
            assert(nearly(reverseElapsed(once, 100.0, 15.0, forward), e));
        }
    }
    assert(nearly(reverseElapsed(100.0, 100.0, 0.0, false), 100.0));
    assert(nearly(reverseElapsed(0.0, 100.0, 0.0, true), 0.0));
}

static void test_duration_inferred_from_first_completion() {
    ManualProbe probe;
    AnimationOptions o;
    o.keyframes = {0.0, 100.0};
    o.type = "spring";
    o.repeat = 2;
    o.driver = manualDriver(probe);
    AnimationControls controls = animateValue(std::move(o));
    assert(!controls.computedDuration().has_value());

    double inferred = -1.0;
    int guard = 0;
    while (probe.running && guard++ < 10000) {
        double prev = controls.elapsed();
        int repeats = controls.repeatCount();
        probe.tick(10.0);
        if (repeats == 0 && controls.repeatCount() == 1) inferred = prev + 10.0;
        if (inferred > 0.0) assert(nearly(*controls.computedDuration(), inferred));
    }
    assert(inferred > 0.0);
    assert(controls.repeatCount() == 2);
    assert(nearly(*controls.computedDuration(), inferred));
    assert(nearly(num(controls.state().value), 100.0));

    // Later cycles that run longer do not move the inferred duration
    register_flip_probe();
    g_flip = FlipProbe{};
    g_flip.stretch = 50.0;
    ManualProbe probe2;
    AnimationOptions m;
    m.keyframes = {0.0, 1.0};
    m.type = "flip-probe";
    m.repeat = 2;
    m.repeatType = RepeatType::Mirror;
    m.driver = manualDriver(probe2);
    AnimationControls stretched = animateValue(std::move(m));
    for (int i = 0; i < 10; ++i) probe2.tick(10.0);
    assert(stretched.repeatCount() == 1);
    assert(nearly(*stretched.computedDuration(), 100.0));
    for (int i = 0; i < 15; ++i) probe2.tick(10.0); // second cycle needs 150
    assert(stretched.repeatCount() == 2);
    assert(nearly(stretched.elapsed(), 50.0));
    assert(nearly(*stretched.computedDuration(), 100.0));
}

static void test_sample_uncontrolled() {
    double previous = -1.0;
    for (double t = 0.0; t < 1000.0; t += 100.0) {
        AnimationOptions o;
        o.keyframes = {0.0, 100.0};
        o.duration = 1000.0;
        o.autoplay = false;
        AnimationControls controls(std::move(o));
        AnimationState s = controls.sample(t);
        assert(!s.done);
        assert(num(s.value) > previous);
        previous = num(s.value);
    }
    for (double t : {1000.0, 1200.0, 5000.0}) {
        AnimationOptions o;
        o.keyframes = {0.0, 100.0};
        o.duration = 1000.0;
        o.autoplay = false;
        AnimationControls controls(std::move(o));
        AnimationState s = controls.sample(t);
        assert(s.done);
        assert(nearly(num(s.value), 100.0, 1e-3));
    }
}

static void test_sample_controlled_matches_uncontrolled() {
    for (double total : {500.0, 1000.0}) {
        AnimationOptions a;
        a.keyframes = {0.0, 100.0};
        a.duration = 1000.0;
        a.autoplay = false;
        AnimationOptions b = a;

        AnimationControls stepped(std::move(a));
        AnimationState last;
        for (double t = 0.0; t < total; t += 100.0) last = stepped.sample(100.0, true);

        AnimationControls single(std::move(b));
        AnimationState once = single.sample(total);
        assert(last.done == once.done);
        assert(nearly(num(last.value), num(once.value)));
    }
}

static void test_sample_step_size() {
    // Fixed duration: steps of duration / 2, so the repeat at 500ms lands on the last step
    AnimationOptions tween = linear_tween(400.0);
    tween.repeat = 1;
    tween.repeatDelay = 50.0;
    AnimationControls stepped(std::move(tween));
    AnimationState s = stepped.sample(500.0);
    assert(stepped.repeatCount() == 1);
    assert(nearly(stepped.elapsed(), 50.0));
    assert(nearly(num(s.value), 100.0));

    // Short durations still step at least 50ms
    AnimationOptions quick = linear_tween(60.0);
    quick.repeat = 1;
    quick.repeatDelay = 30.0;
    AnimationControls coarse(std::move(quick));
    AnimationState q = coarse.sample(95.0);
    assert(coarse.repeatCount() == 1);
    assert(nearly(coarse.elapsed(), 5.0));
    assert(nearly(num(q.value), 100.0));

    // No duration: completion is found on a 50ms grid
    AnimationOptions spring;
    spring.type = "spring";
    spring.keyframes = {0.0, 100.0};
    spring.autoplay = false;
    AnimationControls settled(std::move(spring));
    AnimationState rest = settled.sample(5000.0);
    assert(rest.done);
    assert(settled.computedDuration());
    assert(*settled.computedDuration() > 0.0);
    assert(std::fmod(*settled.computedDuration(), 50.0) == 0.0);
}

static void test_non_numeric_keyframes_are_bridged() {
    const Color red = Color::fromHex("#ff0000");
    const Color blue = Color::fromHex("#0000ff");

    ManualProbe probe;
    AnimationOptions o;
    o.keyframes = {red, blue};
    o.type = "spring";
    o.driver = manualDriver(probe);
    int updates = 0;
    o.onUpdate = [&](const Value& v) {
        assert(std::holds_alternative<Color>(v));
        updates++;
    };
    AnimationControls controls = animateValue(std::move(o));

    probe.tick(16.0);
    const Color& early = std::get<Color>(controls.state().value);
    assert(early.r > early.b); // still close to the origin

    int guard = 0;
    while (probe.running && guard++ < 10000) probe.tick(16.0);
    assert(controls.state().done);
    const Color& end = std::get<Color>(controls.state().value);
    assert(nearly(end.r, blue.r, 1e-6) && nearly(end.b, blue.b, 1e-6) && nearly(end.a, 1.0, 1e-9));
    assert(updates > 2);

    // Keyframe tweens interpolate colours themselves
    AnimationOptions k;
    k.keyframes = {red, blue};
    k.duration = 100.0;
    k.autoplay = false;
    AnimationControls tween(std::move(k));
    AnimationState mid = tween.sample(50.0, true);
    assert(std::holds_alternative<Color>(mid.value));
    assert(std::get<Color>(mid.value).r > 0.0 && std::get<Color>(mid.value).b > 0.0);
}

static void test_stop_silences_callbacks() {
    FrameLoop loop;
    int updates = 0, stops = 0, completes = 0, repeats = 0;
    AnimationOptions o;
    o.keyframes = {0.0, 100.0};
    o.duration = 100.0;
    o.repeat = 5;
    o.driver = frameLoopDriver(loop);
    o.onUpdate = [&](const Value&) { updates++; };
    o.onStop = [&] { stops++; };
    o.onComplete = [&] { completes++; };
    o.onRepeat = [&] { repeats++; };
    AnimationControls controls = animateValue(std::move(o));
    assert(controls.isPlaying());

    loop.process(0.0);
    loop.process(16.0);
    loop.process(32.0);
    assert(updates == 3);
    controls.stop();
    assert(stops == 1);
    assert(!controls.isPlaying());
    assert(!loop.hasPending());
    for (double t = 48.0; t < 2000.0; t += 16.0) loop.process(t);
    assert(updates == 3);
    assert(repeats == 0 && completes == 0);
}

static void test_current_time_resets_to_initial_elapsed() {
    AnimationOptions o = linear_tween(100.0);
    AnimationControls controls(std::move(o));
    controls.setCurrentTime(50.0);
    assert(nearly(num(controls.state().value), 50.0));
    controls.setCurrentTime(20.0);
    assert(nearly(num(controls.state().value), 20.0));

    AnimationOptions offset = linear_tween(100.0);
    offset.elapsed = 10.0;
    AnimationControls shifted(std::move(offset));
    shifted.setCurrentTime(20.0);
    assert(nearly(num(shifted.state().value), 30.0));
}

static void test_negative_initial_elapsed_holds_origin() {
    ManualProbe probe;
    AnimationOptions o = linear_tween(100.0);
    o.elapsed = -50.0;
    o.driver = manualDriver(probe);
    int completes = 0;
    o.onComplete = [&] { completes++; };
    AnimationControls controls(std::move(o));
    controls.play();
    probe.tick(25.0);
    assert(nearly(num(controls.state().value), 0.0));
    int ticks = 1;
    while (probe.running) {
        probe.tick(25.0);
        ticks++;
    }
    assert(ticks == 6);
    assert(completes == 1);
}

static void test_autoplay_and_play_callbacks() {
    ManualProbe probe;
    int plays = 0;
    AnimationOptions o = linear_tween(100.0);
    o.autoplay = true;
    o.driver = manualDriver(probe);
    o.onPlay = [&] { plays++; };
    AnimationControls controls = animateValue(std::move(o));
    assert(plays == 1);
    assert(probe.starts == 1);
    assert(probe.running);

    AnimationOptions idle = linear_tween(100.0);
    ManualProbe idleProbe;
    idle.driver = manualDriver(idleProbe);
    AnimationControls paused = animateValue(std::move(idle));
    assert(idleProbe.starts == 0);
    assert(!paused.isPlaying());
}

static void test_repeat_forever_runs_until_stopped() {
    ManualProbe probe;
    AnimationOptions o = linear_tween(100.0);
    o.repeat = kRepeatForever;
    o.driver = manualDriver(probe);
    int completes = 0;
    o.onComplete = [&] { completes++; };
    AnimationControls controls = animateValue(std::move(o));
    controls.play();
    for (int i = 0; i < 500; ++i) probe.tick(20.0);
    assert(controls.repeatCount() == 100);
    assert(completes == 0);
    controls.stop();
    assert(!probe.tick(20.0));
}

static void test_destroying_controls_detaches() {
    FrameLoop loop;
    int updates = 0;
    {
        AnimationOptions o;
        o.keyframes = {0.0, 1.0};
        o.driver = frameLoopDriver(loop);
        o.onUpdate = [&](const Value&) { updates++; };
        AnimationControls controls = animateValue(std::move(o));
        loop.process(0.0);
        assert(updates == 1);
    }
    assert(!loop.hasPending());
    loop.process(16.0);
    assert(updates == 1);
}

int main() {
    test_forward_completes_once();
    test_loop_repeat();
    test_mirror_flips_target();
    test_mirror_tween_runs_backwards();
    test_reverse_alternates_direction();
    test_reverse_with_delay();
    test_elapsed_helpers();
    test_duration_inferred_from_first_completion();
    test_sample_uncontrolled();
    test_sample_controlled_matches_uncontrolled();
    test_sample_step_size();
    test_non_numeric_keyframes_are_bridged();
    test_stop_silences_callbacks();
    test_current_time_resets_to_initial_elapsed();
    test_negative_initial_elapsed_holds_origin();
    test_autoplay_and_play_callbacks();
    test_repeat_forever_runs_until_stopped();
    test_destroying_controls_detaches();
    return 0;
}
