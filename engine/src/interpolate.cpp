#include "motive/interpolate.hpp"
#include <algorithm>
#include <stdexcept>

namespace motive {

Interpolator::Interpolator(std::vector<double> input, std::vector<Value> output, InterpolateOptions options)
    : input_(std::move(input)), output_(std::move(output)), options_(std::move(options)) {
    if (input_.size() != output_.size()) throw std::invalid_argument("interpolator input and output must be the same length");
    if (input_.empty()) throw std::invalid_argument("interpolator requires at least one point");
    // Descending input ranges are flipped so the segment search can assume ascending order.
    // Easings stay indexed by segment from the low end.
    if (input_.size() > 1 && input_.front() > input_.back()) {
        std::reverse(input_.begin(), input_.end());
        std::reverse(output_.begin(), output_.end());
    }
    for (size_t i = 0; i + 1 < output_.size(); ++i) {
        if (output_[i].index() != output_[i + 1].index())
            throw std::invalid_argument("interpolator outputs must all be numbers or all be colours");
    }
}

size_t Interpolator::segmentFor(double v) const {
    if (v <= input_.front()) return 0;
    if (v >= input_.back()) return input_.size() - 2;
    size_t lo = 0, hi = input_.size() - 1;
    while (lo + 1 < hi) {
        size_t mid = (lo + hi) / 2;
        if (v < input_[mid]) hi = mid; else lo = mid;
    }
    return lo;
}

Value Interpolator::operator()(double v) const {
    if (input_.size() == 1) return output_.front();
    if (options_.clamp) v = std::min(std::max(v, input_.front()), input_.back());

    size_t i = segmentFor(v);
    double span = input_[i + 1] - input_[i];
    double progress = span != 0.0 ? (v - input_[i]) / span : 1.0;
    if (!options_.ease.empty()) {
        const Easing& e = options_.ease.size() == 1 ? options_.ease.front() : options_.ease[std::min(i, options_.ease.size() - 1)];
        if (e) progress = e(progress);
    }
    return mix(output_[i], output_[i + 1], progress);
}

} // namespace motive
