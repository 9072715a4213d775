#include "motive/generator.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace motive {

namespace {

constexpr double kVelocitySampleMs = 5.0;
constexpr double kMaxHyperbolicArg = 300.0; // keeps sinh/cosh finite

double numeric(const Value& v, const char* what) {
    if (auto* n = std::get_if<double>(&v)) return *n;
    throw std::invalid_argument(std::string("spring requires a numeric ") + what);
}

// Damped harmonic oscillator. Times in ms, velocities in units per second.
class SpringGenerator : public Generator {
public:
    explicit SpringGenerator(const GeneratorOptions& o)
        : origin_(numeric(o.keyframes.front(), "origin")),
          target_(numeric(o.keyframes.back(), "target")),
          velocity_(o.velocity),
          stiffness_(o.stiffness),
          damping_(o.damping),
          mass_(o.mass),
          restSpeed_(o.restSpeed),
          restDelta_(o.restDelta.value_or(0.01)) {
        build();
    }

    AnimationState next(double t) override {
        double current = position(t);
        double prevT = std::max(t - kVelocitySampleMs, 0.0);
        double frame = t - prevT;
        double speed = frame > 0.0 ? (current - position(prevT)) * (1000.0 / frame) : 0.0;

        AnimationState s;
        s.done = std::fabs(speed) <= restSpeed_ && std::fabs(target_ - current) <= restDelta_;
        s.value = s.done ? target_ : current;
        return s;
    }

    void flipTarget() override {
        velocity_ = -velocity_;
        std::swap(origin_, target_);
        build();
    }

private:
    void build() {
        v0_ = velocity_ != 0.0 ? -(velocity_ / 1000.0) : 0.0;
        delta0_ = target_ - origin_;
        zeta_ = damping_ / (2.0 * std::sqrt(stiffness_ * mass_));
        omega0_ = std::sqrt(stiffness_ / mass_) / 1000.0;
    }

    double position(double t) const {
        if (zeta_ < 1.0) {
            double omegaD = omega0_ * std::sqrt(1.0 - zeta_ * zeta_);
            double envelope = std::exp(-zeta_ * omega0_ * t);
            return target_ - envelope * (((v0_ + zeta_ * omega0_ * delta0_) / omegaD) * std::sin(omegaD * t) +
                                         delta0_ * std::cos(omegaD * t));
        }
        if (zeta_ == 1.0) {
            return target_ - std::exp(-omega0_ * t) * (delta0_ + (v0_ + omega0_ * delta0_) * t);
        }
        double omegaD = omega0_ * std::sqrt(zeta_ * zeta_ - 1.0);
        double envelope = std::exp(-zeta_ * omega0_ * t);
        double arg = std::min(omegaD * t, kMaxHyperbolicArg);
        return target_ - (envelope * ((v0_ + zeta_ * omega0_ * delta0_) * std::sinh(arg) +
                                      omegaD * delta0_ * std::cosh(arg))) / omegaD;
    }

    double origin_;
    double target_;
    double velocity_;
    double stiffness_;
    double damping_;
    double mass_;
    double restSpeed_;
    double restDelta_;

    double v0_ {0.0};
    double delta0_ {0.0};
    double zeta_ {0.0};
    double omega0_ {0.0};
};

} // namespace

std::unique_ptr<Generator> createSpring(const GeneratorOptions& options) {
    if (options.keyframes.empty()) throw std::invalid_argument("spring requires keyframes");
    return std::make_unique<SpringGenerator>(options);
}

} // namespace motive
