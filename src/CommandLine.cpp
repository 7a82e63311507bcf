#include "CommandLine.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace card {

static float parseFloat(const std::string& opt, const std::string& text) {
    size_t used = 0;
    float v = 0.0f;
    try {
        v = std::stof(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid number for " + opt + ": '" + text + "'");
    }
    if (used != text.size() || !std::isfinite(v)) {
        throw std::invalid_argument("Invalid number for " + opt + ": '" + text + "'");
    }
    return v;
}

static int parseInt(const std::string& opt, const std::string& text) {
    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid integer for " + opt + ": '" + text + "'");
    }
    if (used != text.size()) {
        throw std::invalid_argument("Invalid integer for " + opt + ": '" + text + "'");
    }
    return v;
}

static InputProfile parseProfile(const std::string& text) {
    if (text == "legacy") return InputProfile::Legacy;
    if (text == "modern") return InputProfile::Modern;
    throw std::invalid_argument("Unknown socket profile '" + text + "' (expected legacy or modern)");
}

AppOptions parseCommandLine(const std::vector<std::string>& args) {
    AppOptions opts;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string opt = args[i];
        std::string value;
        bool inlineValue = false;

        // --name=value
        auto eq = opt.find('=');
        if (opt.rfind("--", 0) == 0 && eq != std::string::npos) {
            value = opt.substr(eq + 1);
            opt = opt.substr(0, eq);
            inlineValue = true;
        }

        auto takeValue = [&]() -> std::string {
            if (inlineValue) return value;
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("Missing value for " + opt);
            }
            return args[++i];
        };

        auto noValue = [&]() {
            if (inlineValue) throw std::invalid_argument(opt + " takes no value");
        };

        CardParams& p = opts.scene.params;
        if (opt == "--width") {
            p.width = parseFloat(opt, takeValue());
        } else if (opt == "--height") {
            p.height = parseFloat(opt, takeValue());
        } else if (opt == "--radius") {
            p.radius = parseFloat(opt, takeValue());
        } else if (opt == "--thickness") {
            p.thickness = parseFloat(opt, takeValue());
        } else if (opt == "--steps") {
            p.cornerSteps = parseInt(opt, takeValue());
        } else if (opt == "--output" || opt == "-o") {
            opts.outputPath = takeValue();
        } else if (opt == "--format") {
            opts.format = takeValue();
        } else if (opt == "--sockets") {
            opts.inputs = parseProfile(takeValue());
        } else if (opt == "--preview") {
            noValue();
            opts.preview = true;
        } else if (opt == "--no-clear") {
            noValue();
            opts.scene.clearScene = false;
        } else if (opt == "--flat") {
            noValue();
            opts.scene.shadeSmooth = false;
        } else if (opt == "--help" || opt == "-h") {
            noValue();
            opts.help = true;
        } else {
            throw std::invalid_argument("Unknown option: " + opt);
        }
    }

    return opts;
}

std::vector<std::string> parameterWarnings(const CardParams& params) {
    std::vector<std::string> out;

    if (params.width <= 0.0f || params.height <= 0.0f) {
        out.push_back("width and height should be positive");
    }
    if (params.thickness <= 0.0f) {
        out.push_back("thickness should be positive");
    }
    if (params.radius < 0.0f) {
        out.push_back("radius should not be negative");
    }

    float maxRadius = 0.5f * std::min(params.width, params.height);
    if (params.radius > maxRadius) {
        out.push_back("radius " + std::to_string(params.radius) + " exceeds half the smaller extent (" +
                      std::to_string(maxRadius) + "); corner arcs overlap");
    }
    if (params.cornerSteps < 1) {
        out.push_back("steps < 1: corners are not rounded");
    }
    return out;
}

std::string usage(const std::string& program) {
    return "Usage: " + program + " [options]\n"
           "  --width W         card width (default " + std::to_string(cfg::CARD_WIDTH) + ")\n"
           "  --height H        card height (default " + std::to_string(cfg::CARD_HEIGHT) + ")\n"
           "  --radius R        corner radius (default " + std::to_string(cfg::CARD_RADIUS) + ")\n"
           "  --thickness T     extrusion depth (default " + std::to_string(cfg::CARD_THICKNESS) + ")\n"
           "  --steps N         segments per corner arc (default " + std::to_string(cfg::CARD_CORNER_STEPS) + ")\n"
           "  -o, --output PATH export file (default " + cfg::DEFAULT_OUTPUT + ")\n"
           "  --format ID       Assimp exporter id, e.g. obj, gltf2, glb2, fbx\n"
           "  --sockets P       material input profile: legacy | modern\n"
           "  --flat            flat shading instead of smooth\n"
           "  --no-clear        keep existing scene contents\n"
           "  --preview         open an OpenGL preview instead of exporting\n"
           "  -h, --help        show this message\n";
}

} // namespace card
