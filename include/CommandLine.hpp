#pragma once

#include "CardScene.hpp"
#include "Material.hpp"

#include <string>
#include <vector>

namespace card {

struct AppOptions {
    CardSceneOptions scene;
    std::string outputPath = cfg::DEFAULT_OUTPUT;
    std::string format;               // empty: from outputPath
    InputProfile inputs = InputProfile::Modern;
    bool preview = false;
    bool help = false;
};

// Throws std::invalid_argument on unknown options, missing or malformed values.
AppOptions parseCommandLine(const std::vector<std::string>& args);

// Warnings for parameters outside the documented ranges. The builder accepts
// them anyway.
std::vector<std::string> parameterWarnings(const CardParams& params);

std::string usage(const std::string& program);

} // namespace card
