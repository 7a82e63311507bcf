#pragma once

#include "SceneHost.hpp"

#include <string>

// Scene host that shows its contents in an OpenGL window, seen through the
// first camera and lit by the first light.
class PreviewHost : public SceneHost {
public:
    explicit PreviewHost(InputProfile profile = InputProfile::Modern);

    // Blocks until the window is closed (Esc or close button). Returns false if
    // the window, GL context or shaders could not be created.
    bool run(int width = cfg::PREVIEW_WIDTH, int height = cfg::PREVIEW_HEIGHT,
             const std::string& title = cfg::PREVIEW_TITLE);
};
