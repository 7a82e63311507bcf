#include "CardScene.hpp"
#include "CommandLine.hpp"
#include "Config.hpp"
#include "ExportHost.hpp"
#include "PreviewHost.hpp"
#include "Util.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

static int runPreview(const card::AppOptions& opts) {
    PreviewHost host(opts.inputs);
    card::buildCardScene(host, opts.scene);
    return host.run() ? 0 : 1;
}

static int runExport(const card::AppOptions& opts) {
    ExportHost host(opts.inputs);
    card::buildCardScene(host, opts.scene);
    return host.save(opts.outputPath, opts.format) ? 0 : 1;
}

int main(int argc, char** argv) {
    const std::string program = argc > 0 ? argv[0] : "Card3D";

    try {
        std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);
        card::AppOptions opts = card::parseCommandLine(args);

        if (opts.help) {
            std::cout << card::usage(program);
            return 0;
        }

        for (const auto& w : card::parameterWarnings(opts.scene.params)) {
            util::logWarn(w);
        }

        return opts.preview ? runPreview(opts) : runExport(opts);
    } catch (const std::invalid_argument& e) {
        util::logError(e.what());
        std::cerr << card::usage(program);
        return 1;
    } catch (const std::exception& e) {
        util::logError(e.what());
        return 1;
    }
}
