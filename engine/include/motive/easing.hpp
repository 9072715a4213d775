#pragma once

#include <functional>
#include <string>

namespace motive {

// Maps linear progress in [0,1] to eased progress. Output may overshoot for back curves.
using Easing = std::function<double(double)>;

// CSS-style cubic-bezier timing curve with control points (x1,y1) and (x2,y2).
Easing cubicBezier(double x1, double y1, double x2, double y2);

// Derived curves
Easing reverseEasing(Easing easing); // ease-in <-> ease-out
Easing mirrorEasing(Easing easing);  // in-out built from an ease-in

namespace ease {

double linear(double p);
double easeIn(double p);
double easeOut(double p);
double easeInOut(double p);
double circIn(double p);
double circOut(double p);
double circInOut(double p);
double backIn(double p);
double backOut(double p);
double backInOut(double p);
double anticipate(double p);

} // namespace ease

// Looks up a preset by name ("linear", "easeIn", ..., "anticipate").
// Throws std::invalid_argument for unknown names.
Easing easingByName(const std::string& name);

} // namespace motive
