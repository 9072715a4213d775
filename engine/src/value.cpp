#include "motive/value.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace motive {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    return -1;
}

// Squared-space channel mix keeps midpoints from going muddy.
inline double mix_channel(double from, double to, double p) {
    const double from2 = from * from;
    return std::sqrt(std::max(0.0, p * (to * to - from2) + from2));
}

} // namespace

Color Color::fromHex(const std::string& hex) {
    if (hex.empty() || hex[0] != '#') throw std::invalid_argument("colour must start with '#': " + hex);
    std::string digits = hex.substr(1);
    for (char c : digits) {
        if (hex_digit(c) < 0) throw std::invalid_argument("invalid hex digit in colour: " + hex);
    }
    // Expand short forms (#rgb, #rgba) to the long ones.
    if (digits.size() == 3 || digits.size() == 4) {
        std::string expanded;
        for (char c : digits) {
            expanded.push_back(c);
            expanded.push_back(c);
        }
        digits = expanded;
    }
    if (digits.size() != 6 && digits.size() != 8) throw std::invalid_argument("unsupported colour length: " + hex);

    auto byte_at = [&digits](size_t i) { return hex_digit(digits[i]) * 16 + hex_digit(digits[i + 1]); };
    Color c;
    c.r = byte_at(0);
    c.g = byte_at(2);
    c.b = byte_at(4);
    c.a = digits.size() == 8 ? byte_at(6) / 255.0 : 1.0;
    return c;
}

double mix(double from, double to, double progress) {
    return -progress * from + progress * to + from;
}

Color mix(const Color& from, const Color& to, double progress) {
    Color out;
    out.r = mix_channel(from.r, to.r, progress);
    out.g = mix_channel(from.g, to.g, progress);
    out.b = mix_channel(from.b, to.b, progress);
    out.a = mix(from.a, to.a, progress);
    return out;
}

Value mix(const Value& from, const Value& to, double progress) {
    if (from.index() != to.index()) throw std::invalid_argument("cannot mix a number with a colour");
    if (auto* a = std::get_if<double>(&from)) return mix(*a, std::get<double>(to), progress);
    return mix(std::get<Color>(from), std::get<Color>(to), progress);
}

std::string toString(const Value& v) {
    char buf[96];
    if (auto* n = std::get_if<double>(&v)) {
        std::snprintf(buf, sizeof(buf), "%g", *n);
    } else {
        const Color& c = std::get<Color>(v);
        std::snprintf(buf, sizeof(buf), "rgba(%.0f, %.0f, %.0f, %g)", c.r, c.g, c.b, c.a);
    }
    return std::string(buf);
}

} // namespace motive
