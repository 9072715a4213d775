#pragma once

#include "motive/animation.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace motive {

enum class RunMode : uint8_t {
    Sample = 0, // one headless sample at a given time
    Step = 1,   // controlled sampling at a fixed step
    Play = 2,   // real-time playback through the shared frame loop
};

// Host configuration assembled from command-line flags.
struct RunnerConfig {
    AnimationOptions animation; // callbacks and driver are left to the host
    RunMode mode {RunMode::Step};
    double sampleAt {0.0};          // --sample
    double step {1000.0 / 60.0};    // --step
    double until {5000.0};          // --until, upper bound for Step and Play
    bool help {false};
};

// Value following `flag` ("--flag value"), if present.
std::optional<std::string> getArg(int argc, char** argv, const std::string& flag);
bool hasFlag(int argc, char** argv, const std::string& flag);

// Parsers used by the flags. All throw std::invalid_argument on bad input.
double parseNumber(const std::string& text, const std::string& what);
Value parseValue(const std::string& text); // number or #hex colour
std::vector<Value> parseKeyframes(const std::string& list); // comma separated
std::vector<Easing> parseEasing(const std::string& list);   // comma separated preset names
int parseRepeat(const std::string& text);                   // integer >= 0 or "inf"

RunnerConfig parseRunnerConfig(int argc, char** argv);

std::string runnerUsage(const char* program);

} // namespace motive
