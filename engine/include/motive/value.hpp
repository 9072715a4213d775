#pragma once

#include <string>
#include <variant>

namespace motive {

// RGBA colour. Channels in 0..255, alpha in 0..1.
struct Color {
    double r {0.0};
    double g {0.0};
    double b {0.0};
    double a {1.0};

    // Accepts "#rgb", "#rgba", "#rrggbb" and "#rrggbbaa".
    static Color fromHex(const std::string& hex);

    bool operator==(const Color& o) const { return r == o.r && g == o.g && b == o.b && a == o.a; }
    bool operator!=(const Color& o) const { return !(*this == o); }
};

// Any value an animation can produce.
using Value = std::variant<double, Color>;

inline bool isNumber(const Value& v) { return std::holds_alternative<double>(v); }

// Linear blend for numbers (unclamped). Colours mix RGB in squared space and alpha linearly.
double mix(double from, double to, double progress);
Color mix(const Color& from, const Color& to, double progress);
// Throws std::invalid_argument when the alternatives differ.
Value mix(const Value& from, const Value& to, double progress);

// Human readable form: numbers as-is, colours as rgba(r, g, b, a).
std::string toString(const Value& v);

} // namespace motive
