#include "motive/animation.hpp"
#include "motive/runner_config.hpp"
#include <chrono>
#include <iostream>
#include <thread>

using namespace motive;

static void print_state(double t, const AnimationState& s) {
    std::cout << "t=" << t << " value=" << toString(s.value) << (s.done ? " done" : "") << "\n";
}

static int run_sample(RunnerConfig& cfg) {
    AnimationControls controls(std::move(cfg.animation));
    print_state(cfg.sampleAt, controls.sample(cfg.sampleAt));
    if (auto d = controls.computedDuration()) std::cout << "duration=" << *d << "\n";
    return 0;
}

static int run_step(RunnerConfig& cfg) {
    bool finished = false;
    cfg.animation.onRepeat = [] { std::cout << "# repeat\n"; };
    cfg.animation.onComplete = [&finished] {
        std::cout << "# complete\n";
        finished = true;
    };
    AnimationControls controls(std::move(cfg.animation));
    print_state(0.0, controls.sample(0.0, true));
    double t = 0.0;
    while (!finished && t < cfg.until) {
        t += cfg.step;
        print_state(t, controls.sample(cfg.step, true));
    }
    return 0;
}

static int run_play(RunnerConfig& cfg) {
    using Clock = std::chrono::steady_clock;
    bool finished = false;
    auto start = Clock::now();
    auto since_start = [&start] {
        return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
    };

    cfg.animation.driver = frameLoopDriver();
    cfg.animation.autoplay = true;
    cfg.animation.onPlay = [] { std::cout << "# play\n"; };
    cfg.animation.onStop = [] { std::cout << "# stop\n"; };
    cfg.animation.onRepeat = [] { std::cout << "# repeat\n"; };
    cfg.animation.onComplete = [&finished] {
        std::cout << "# complete\n";
        finished = true;
    };
    cfg.animation.onUpdate = [&since_start](const Value& v) {
        std::cout << "t=" << since_start() << " value=" << toString(v) << "\n";
    };

    AnimationControls controls = animateValue(std::move(cfg.animation));
    FrameLoop& loop = FrameLoop::shared();
    while (!finished && since_start() < cfg.until) {
        loop.process(since_start());
        std::this_thread::sleep_for(std::chrono::milliseconds(16));
    }
    if (!finished) controls.stop();
    return 0;
}

int main(int argc, char** argv) {
    // Demo runner: configure an animation from flags and sample, step or play it
    RunnerConfig cfg;
    try {
        cfg = parseRunnerConfig(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n" << runnerUsage(argv[0]);
        return 2;
    }
    if (cfg.help) {
        std::cout << runnerUsage(argv[0]);
        return 0;
    }

    try {
        switch (cfg.mode) {
        case RunMode::Sample: return run_sample(cfg);
        case RunMode::Step: return run_step(cfg);
        case RunMode::Play: return run_play(cfg);
        }
    } catch (const std::invalid_argument& e) {
        // Generators reject keyframes they cannot animate
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }
    return 0;
}
