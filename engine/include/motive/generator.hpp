#pragma once

#include "motive/easing.hpp"
#include "motive/value.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace motive {

// Output of one generator step.
struct AnimationState {
    Value value {0.0};
    bool done {false};
};

// Everything a generator may need. Each strategy reads the fields it understands.
struct GeneratorOptions {
    std::vector<Value> keyframes;
    std::optional<double> duration; // ms

    // keyframes / tween
    std::vector<Easing> ease;  // empty: easeInOut, one: all segments, else per segment
    std::vector<double> times; // offsets in [0,1], used when size matches keyframes

    // spring / decay
    double velocity {0.0}; // units per second
    double stiffness {100.0};
    double damping {10.0};
    double mass {1.0};
    double restSpeed {2.0};
    std::optional<double> restDelta; // spring 0.01, decay 0.5 when unset

    // decay
    double power {0.8};
    double timeConstant {350.0};
    std::function<double(double)> modifyTarget;
};

// A time-to-value sampling strategy. next() takes non-negative elapsed ms.
class Generator {
public:
    virtual ~Generator() = default;
    virtual AnimationState next(double t) = 0;
    // Swap origin and target. Strategies without a direction ignore it.
    virtual void flipTarget() {}
};

using GeneratorFactory = std::function<std::unique_ptr<Generator>(const GeneratorOptions&)>;
using NeedsInterpolation = std::function<bool(const Value&, const Value&)>;

// One entry of the dispatch table. An empty needsInterpolation means the
// strategy handles its keyframe values as given.
struct GeneratorType {
    GeneratorFactory create;
    NeedsInterpolation needsInterpolation;
};

// Picks the strategy for a keyframe sequence. More than two keyframes always
// use "keyframes"; unknown names fall back to "keyframes".
const GeneratorType& selectGeneratorType(const std::string& type, size_t keyframeCount);

// Adds or replaces a named strategy in the dispatch table.
void registerGeneratorType(const std::string& name, GeneratorType type);

// Built-in strategies
std::unique_ptr<Generator> createKeyframes(const GeneratorOptions& options);
std::unique_ptr<Generator> createSpring(const GeneratorOptions& options);
std::unique_ptr<Generator> createDecay(const GeneratorOptions& options);

constexpr double kDefaultTweenDuration = 300.0;

} // namespace motive
