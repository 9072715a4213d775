#include "motive/generator.hpp"
#include "motive/interpolate.hpp"
#include <algorithm>
#include <stdexcept>

namespace motive {

namespace {

class KeyframesGenerator : public Generator {
public:
    explicit KeyframesGenerator(const GeneratorOptions& o)
        : values_(o.keyframes), duration_(o.duration.value_or(kDefaultTweenDuration)) {
        if (values_.size() < 2) throw std::invalid_argument("keyframes animation requires at least two keyframes");

        // Offsets default to an even spread over [0,1]
        std::vector<double> offsets = o.times;
        if (offsets.size() != values_.size()) {
            offsets.resize(values_.size());
            for (size_t i = 0; i < values_.size(); ++i) offsets[i] = double(i) / double(values_.size() - 1);
        }
        times_.reserve(offsets.size());
        for (double off : offsets) times_.push_back(off * duration_);

        ease_ = o.ease;
        if (ease_.empty()) ease_.push_back(ease::easeInOut);
        rebuild();
    }

    AnimationState next(double t) override {
        AnimationState s;
        s.value = (*interpolator_)(t);
        s.done = t >= duration_;
        return s;
    }

    void flipTarget() override {
        std::reverse(values_.begin(), values_.end());
        rebuild();
    }

private:
    void rebuild() {
        InterpolateOptions io;
        io.clamp = true;
        io.ease = ease_;
        interpolator_ = std::make_unique<Interpolator>(times_, values_, io);
    }

    std::vector<Value> values_;
    std::vector<double> times_;
    std::vector<Easing> ease_;
    double duration_;
    std::unique_ptr<Interpolator> interpolator_;
};

} // namespace

std::unique_ptr<Generator> createKeyframes(const GeneratorOptions& options) {
    return std::make_unique<KeyframesGenerator>(options);
}

} // namespace motive
