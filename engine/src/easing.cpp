#include "motive/easing.hpp"
#include <cmath>
#include <stdexcept>
#include <unordered_map>

namespace motive {

namespace {

// One axis of the bezier with endpoints fixed at 0 and 1:
// C0=0, C1=a1, C2=a2, C3=1 expanded into polynomial form.
inline double bezier_axis(double u, double a1, double a2) {
    return (((1.0 - 3.0 * a2 + 3.0 * a1) * u + (3.0 * a2 - 6.0 * a1)) * u + 3.0 * a1) * u;
}

inline double bezier_slope(double u, double a1, double a2) {
    return 3.0 * (1.0 - 3.0 * a2 + 3.0 * a1) * u * u + 2.0 * (3.0 * a2 - 6.0 * a1) * u + 3.0 * a1;
}

constexpr int kNewtonIterations = 4;
constexpr double kNewtonMinSlope = 1e-3;
constexpr double kSubdivisionPrecision = 1e-7;
constexpr int kSubdivisionMaxIterations = 30;

double solve_u_for_x(double x, double x1, double x2) {
    // Newton converges quickly unless the curve is flat in x
    double u = x;
    for (int i = 0; i < kNewtonIterations; ++i) {
        double slope = bezier_slope(u, x1, x2);
        if (std::fabs(slope) < kNewtonMinSlope) break;
        double err = bezier_axis(u, x1, x2) - x;
        if (std::fabs(err) < kSubdivisionPrecision) return u;
        u -= err / slope;
    }
    if (u >= 0.0 && u <= 1.0 && std::fabs(bezier_axis(u, x1, x2) - x) < kSubdivisionPrecision) return u;

    double lo = 0.0, hi = 1.0;
    double mid = x;
    for (int i = 0; i < kSubdivisionMaxIterations; ++i) {
        mid = lo + (hi - lo) * 0.5;
        double err = bezier_axis(mid, x1, x2) - x;
        if (std::fabs(err) <= kSubdivisionPrecision) break;
        if (err > 0.0) hi = mid; else lo = mid;
    }
    return mid;
}

const Easing& ease_in_curve() {
    static const Easing curve = cubicBezier(0.42, 0.0, 1.0, 1.0);
    return curve;
}
const Easing& ease_out_curve() {
    static const Easing curve = cubicBezier(0.0, 0.0, 0.58, 1.0);
    return curve;
}
const Easing& ease_in_out_curve() {
    static const Easing curve = cubicBezier(0.42, 0.0, 0.58, 1.0);
    return curve;
}
const Easing& back_out_curve() {
    static const Easing curve = cubicBezier(0.33, 1.53, 0.69, 0.99);
    return curve;
}

// Derived presets
const Easing& circ_out_curve() {
    static const Easing curve = reverseEasing(ease::circIn);
    return curve;
}
const Easing& circ_in_out_curve() {
    static const Easing curve = mirrorEasing(ease::circIn);
    return curve;
}
const Easing& back_in_curve() {
    static const Easing curve = reverseEasing(ease::backOut);
    return curve;
}
const Easing& back_in_out_curve() {
    static const Easing curve = mirrorEasing(ease::backIn);
    return curve;
}

} // namespace

Easing cubicBezier(double x1, double y1, double x2, double y2) {
    if (x1 == y1 && x2 == y2) return ease::linear;
    return [x1, y1, x2, y2](double p) {
        if (p == 0.0 || p == 1.0) return p;
        return bezier_axis(solve_u_for_x(p, x1, x2), y1, y2);
    };
}

Easing reverseEasing(Easing easing) {
    return [easing](double p) { return 1.0 - easing(1.0 - p); };
}

Easing mirrorEasing(Easing easing) {
    return [easing](double p) {
        return p <= 0.5 ? easing(2.0 * p) / 2.0 : (2.0 - easing(2.0 * (1.0 - p))) / 2.0;
    };
}

namespace ease {

double linear(double p) { return p; }
double easeIn(double p) { return ease_in_curve()(p); }
double easeOut(double p) { return ease_out_curve()(p); }
double easeInOut(double p) { return ease_in_out_curve()(p); }

double circIn(double p) { return 1.0 - std::sin(std::acos(p)); }
double circOut(double p) { return circ_out_curve()(p); }
double circInOut(double p) { return circ_in_out_curve()(p); }

double backOut(double p) { return back_out_curve()(p); }
double backIn(double p) { return back_in_curve()(p); }
double backInOut(double p) { return back_in_out_curve()(p); }

double anticipate(double p) {
    p *= 2.0;
    return p < 1.0 ? 0.5 * backIn(p) : 0.5 * (2.0 - std::pow(2.0, -10.0 * (p - 1.0)));
}

} // namespace ease

Easing easingByName(const std::string& name) {
    static const std::unordered_map<std::string, double (*)(double)> presets = {
        {"linear", ease::linear},
        {"easeIn", ease::easeIn},
        {"easeOut", ease::easeOut},
        {"easeInOut", ease::easeInOut},
        {"circIn", ease::circIn},
        {"circOut", ease::circOut},
        {"circInOut", ease::circInOut},
        {"backIn", ease::backIn},
        {"backOut", ease::backOut},
        {"backInOut", ease::backInOut},
        {"anticipate", ease::anticipate},
    };
    auto it = presets.find(name);
    if (it == presets.end()) throw std::invalid_argument("unknown easing: " + name);
    return it->second;
}

} // namespace motive
