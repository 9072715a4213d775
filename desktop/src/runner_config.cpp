#include "motive/runner_config.hpp"
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace motive {

namespace {

std::vector<std::string> split(const std::string& list, char sep) {
    std::vector<std::string> out;
    std::string item;
    std::istringstream in(list);
    while (std::getline(in, item, sep)) {
        // trim spaces around each item
        auto b = item.find_first_not_of(' ');
        auto e = item.find_last_not_of(' ');
        out.push_back(b == std::string::npos ? std::string() : item.substr(b, e - b + 1));
    }
    return out;
}

void read_number(int argc, char** argv, const char* flag, double& out) {
    if (auto v = getArg(argc, argv, flag)) out = parseNumber(*v, flag);
}

} // namespace

std::optional<std::string> getArg(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc - 1; ++i) {
        if (flag == argv[i]) return std::string(argv[i + 1]);
    }
    return std::nullopt;
}

bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (flag == argv[i]) return true;
    }
    return false;
}

double parseNumber(const std::string& text, const std::string& what) {
    if (text.empty()) throw std::invalid_argument(what + ": expected a number");
    char* end = nullptr;
    double v = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(v))
        throw std::invalid_argument(what + ": expected a number, got '" + text + "'");
    return v;
}

Value parseValue(const std::string& text) {
    if (!text.empty() && text[0] == '#') return Color::fromHex(text);
    return parseNumber(text, "keyframe");
}

std::vector<Value> parseKeyframes(const std::string& list) {
    std::vector<Value> out;
    for (const auto& item : split(list, ',')) out.push_back(parseValue(item));
    if (out.empty()) throw std::invalid_argument("--keyframes: expected at least one value");
    return out;
}

std::vector<Easing> parseEasing(const std::string& list) {
    std::vector<Easing> out;
    for (const auto& item : split(list, ',')) out.push_back(easingByName(item));
    return out;
}

int parseRepeat(const std::string& text) {
    if (text == "inf" || text == "forever") return kRepeatForever;
    double v = parseNumber(text, "--repeat");
    if (v < 0.0 || v != std::floor(v)) throw std::invalid_argument("--repeat: expected a whole number >= 0 or 'inf'");
    if (v >= double(kRepeatForever)) return kRepeatForever;
    return static_cast<int>(v);
}

RunnerConfig parseRunnerConfig(int argc, char** argv) {
    RunnerConfig cfg;
    cfg.help = hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h");

    AnimationOptions& a = cfg.animation;
    a.keyframes = {0.0, 100.0};
    a.autoplay = false;

    if (auto v = getArg(argc, argv, "--type")) a.type = *v;
    if (auto v = getArg(argc, argv, "--keyframes")) a.keyframes = parseKeyframes(*v);
    if (auto v = getArg(argc, argv, "--duration")) {
        a.duration = parseNumber(*v, "--duration");
        if (*a.duration < 0.0) throw std::invalid_argument("--duration: must not be negative");
    }
    read_number(argc, argv, "--elapsed", a.elapsed);
    if (auto v = getArg(argc, argv, "--repeat")) a.repeat = parseRepeat(*v);
    if (auto v = getArg(argc, argv, "--repeat-type")) a.repeatType = parseRepeatType(*v);
    read_number(argc, argv, "--repeat-delay", a.repeatDelay);
    if (auto v = getArg(argc, argv, "--ease")) a.ease = parseEasing(*v);
    if (auto v = getArg(argc, argv, "--times")) {
        for (const auto& item : split(*v, ',')) a.times.push_back(parseNumber(item, "--times"));
    }

    read_number(argc, argv, "--velocity", a.velocity);
    read_number(argc, argv, "--stiffness", a.stiffness);
    read_number(argc, argv, "--damping", a.damping);
    read_number(argc, argv, "--mass", a.mass);
    read_number(argc, argv, "--rest-speed", a.restSpeed);
    if (auto v = getArg(argc, argv, "--rest-delta")) a.restDelta = parseNumber(*v, "--rest-delta");
    read_number(argc, argv, "--power", a.power);
    read_number(argc, argv, "--time-constant", a.timeConstant);
    if (a.mass <= 0.0 || a.stiffness <= 0.0) throw std::invalid_argument("--mass and --stiffness must be positive");
    if (a.timeConstant <= 0.0) throw std::invalid_argument("--time-constant must be positive");

    if (auto v = getArg(argc, argv, "--sample")) {
        cfg.mode = RunMode::Sample;
        cfg.sampleAt = parseNumber(*v, "--sample");
    }
    if (auto v = getArg(argc, argv, "--step")) {
        cfg.mode = RunMode::Step;
        cfg.step = parseNumber(*v, "--step");
        if (cfg.step <= 0.0) throw std::invalid_argument("--step: must be positive");
    }
    if (hasFlag(argc, argv, "--play")) cfg.mode = RunMode::Play;
    read_number(argc, argv, "--until", cfg.until);

    return cfg;
}

std::string runnerUsage(const char* program) {
    std::ostringstream out;
    out << "usage: " << program << " [options]\n"
        << "  --type NAME            keyframes | tween | spring | decay (default keyframes)\n"
        << "  --keyframes A,B,...    numbers or #hex colours (default 0,100)\n"
        << "  --duration MS          fixed cycle duration\n"
        << "  --elapsed MS           initial elapsed offset\n"
        << "  --repeat N|inf         repeat count\n"
        << "  --repeat-type NAME     loop | reverse | mirror\n"
        << "  --repeat-delay MS      pause between cycles\n"
        << "  --ease A,B,...         easing preset per segment\n"
        << "  --times A,B,...        keyframe offsets in [0,1]\n"
        << "  --velocity --stiffness --damping --mass --rest-speed --rest-delta\n"
        << "  --power --time-constant\n"
        << "  --sample MS            print one headless sample\n"
        << "  --step MS              print controlled samples every MS (default)\n"
        << "  --play                 play in real time on the frame loop\n"
        << "  --until MS             stop stepping or playing after MS (default 5000)\n";
    return out.str();
}

} // namespace motive
