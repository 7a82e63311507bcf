#include "Material.hpp"

#include "Config.hpp"
#include "Util.hpp"

#include <stdexcept>

const char* materialParamName(MaterialParam p) {
    switch (p) {
        case MaterialParam::BaseColor: return "base color";
        case MaterialParam::Roughness: return "roughness";
        case MaterialParam::Specular: return "specular";
    }
    return "unknown";
}

const std::vector<std::string>& inputAliases(MaterialParam p) {
    static const std::vector<std::string> baseColor = {cfg::INPUT_BASE_COLOR};
    static const std::vector<std::string> roughness = {cfg::INPUT_ROUGHNESS};
    // Renamed to "Specular IOR Level" in newer hosts.
    static const std::vector<std::string> specular = {
        cfg::INPUT_SPECULAR,
        cfg::INPUT_SPECULAR_IOR_LEVEL,
        cfg::INPUT_SPECULAR_IOR,
    };

    switch (p) {
        case MaterialParam::BaseColor: return baseColor;
        case MaterialParam::Roughness: return roughness;
        case MaterialParam::Specular: return specular;
    }
    throw std::invalid_argument("Unknown material parameter");
}

std::optional<std::string> resolveInput(const MaterialInputs& inputs, MaterialParam p) {
    for (const auto& alias : inputAliases(p)) {
        if (inputs.hasInput(alias)) return alias;
    }
    return std::nullopt;
}

template <typename Fn>
static bool assign(MaterialInputs& inputs, MaterialParam p, Fn&& set) {
    std::optional<std::string> input = resolveInput(inputs, p);
    if (!input) return false;

    try {
        set(*input);
    } catch (const std::exception& e) {
        util::logWarn(std::string("Material '") + inputs.name() + "': could not set " +
                      materialParamName(p) + " via '" + *input + "' (" + e.what() + ")");
        return false;
    }
    return true;
}

int applyMaterial(MaterialInputs& inputs, const MaterialSpec& spec) {
    int applied = 0;

    if (assign(inputs, MaterialParam::BaseColor,
               [&](const std::string& in) { inputs.setColor(in, spec.baseColor); })) {
        ++applied;
    }
    if (assign(inputs, MaterialParam::Specular,
               [&](const std::string& in) { inputs.setFloat(in, spec.specular); })) {
        ++applied;
    }
    if (assign(inputs, MaterialParam::Roughness,
               [&](const std::string& in) { inputs.setFloat(in, spec.roughness); })) {
        ++applied;
    }
    return applied;
}

std::vector<std::string> profileInputs(InputProfile profile) {
    switch (profile) {
        case InputProfile::Legacy:
            return {cfg::INPUT_BASE_COLOR, cfg::INPUT_SPECULAR, cfg::INPUT_ROUGHNESS};
        case InputProfile::Modern:
            return {cfg::INPUT_BASE_COLOR, cfg::INPUT_SPECULAR_IOR_LEVEL, cfg::INPUT_ROUGHNESS};
    }
    return {};
}
