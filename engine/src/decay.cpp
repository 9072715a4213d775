#include "motive/generator.hpp"
#include <cmath>
#include <stdexcept>

namespace motive {

namespace {

// Exponential slow-down from the origin, as used for momentum scrolling.
class DecayGenerator : public Generator {
public:
    DecayGenerator(double origin, const GeneratorOptions& o)
        : timeConstant_(o.timeConstant), restDelta_(o.restDelta.value_or(0.5)) {
        amplitude_ = o.power * o.velocity;
        double ideal = origin + amplitude_;
        target_ = o.modifyTarget ? o.modifyTarget(ideal) : ideal;
        if (target_ != ideal) amplitude_ = target_ - origin;
    }

    AnimationState next(double t) override {
        double delta = -amplitude_ * std::exp(-t / timeConstant_);
        AnimationState s;
        s.done = !(delta > restDelta_ || delta < -restDelta_);
        s.value = s.done ? target_ : target_ + delta;
        return s;
    }

private:
    double amplitude_ {0.0};
    double target_ {0.0};
    double timeConstant_;
    double restDelta_;
};

} // namespace

std::unique_ptr<Generator> createDecay(const GeneratorOptions& options) {
    double origin = 0.0;
    if (!options.keyframes.empty()) {
        auto* n = std::get_if<double>(&options.keyframes.front());
        if (!n) throw std::invalid_argument("decay requires a numeric origin");
        origin = *n;
    }
    return std::make_unique<DecayGenerator>(origin, options);
}

} // namespace motive
