#pragma once

#include "motive/easing.hpp"
#include "motive/value.hpp"
#include <vector>

namespace motive {

struct InterpolateOptions {
    bool clamp {true};
    // Either empty, one easing for every segment, or one per segment.
    std::vector<Easing> ease;
};

// Piecewise map from ascending input offsets to output values.
// Outside the input range the value is clamped, or the outer segments
// are extrapolated when clamp is false.
class Interpolator {
public:
    // Throws std::invalid_argument when input and output sizes differ or are empty.
    Interpolator(std::vector<double> input, std::vector<Value> output, InterpolateOptions options = {});

    Value operator()(double v) const;

private:
    size_t segmentFor(double v) const;

    std::vector<double> input_;
    std::vector<Value> output_;
    InterpolateOptions options_;
};

} // namespace motive
