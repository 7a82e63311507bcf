#pragma once

#include "Host.hpp"
#include "Types.hpp"

#include <cstddef>

namespace card {

struct CardSceneOptions {
    CardParams params;
    MaterialSpec material;
    CameraSpec camera;
    LightSpec light;
    bool clearScene = true;
    bool shadeSmooth = cfg::CARD_SHADE_SMOOTH;
};

struct CardSceneResult {
    ObjectId object = 0;
    size_t outlinePoints = 0;
    size_t vertices = 0;
    size_t faces = 0;
    int materialParamsApplied = 0;
};

// Builds the card solid into the host, gives it the material and places the
// camera and light.
CardSceneResult buildCardScene(Host& host, const CardSceneOptions& options);

} // namespace card
