#include "motive/generator.hpp"
#include <unordered_map>

namespace motive {

namespace {

bool either_non_numeric(const Value& a, const Value& b) { return !isNumber(a) || !isNumber(b); }

std::unordered_map<std::string, GeneratorType>& g_types() {
    static std::unordered_map<std::string, GeneratorType> types = {
        {"keyframes", GeneratorType{createKeyframes, {}}},
        {"tween", GeneratorType{createKeyframes, {}}},
        {"spring", GeneratorType{createSpring, either_non_numeric}},
        {"decay", GeneratorType{createDecay, {}}},
    };
    return types;
}

} // namespace

const GeneratorType& selectGeneratorType(const std::string& type, size_t keyframeCount) {
    auto& types = g_types();
    auto it = types.find(keyframeCount > 2 ? std::string("keyframes") : type);
    if (it == types.end() || !it->second.create) it = types.find("keyframes");
    return it->second;
}

void registerGeneratorType(const std::string& name, GeneratorType type) {
    g_types()[name] = std::move(type);
}

} // namespace motive
