#pragma once

#include "Config.hpp"

#include <glm/glm.hpp>

#include <cstdint>
#include <string>

// Rounded-rectangle card dimensions (world units).
struct CardParams {
    float width = cfg::CARD_WIDTH;
    float height = cfg::CARD_HEIGHT;
    float radius = cfg::CARD_RADIUS;
    float thickness = cfg::CARD_THICKNESS;
    int cornerSteps = cfg::CARD_CORNER_STEPS;
};

struct MaterialSpec {
    std::string name = cfg::MATERIAL_NAME;
    glm::vec4 baseColor = cfg::MATERIAL_BASE_COLOR;
    float roughness = cfg::MATERIAL_ROUGHNESS;
    float specular = cfg::MATERIAL_SPECULAR;
};

struct CameraSpec {
    std::string name = cfg::CAMERA_NAME;
    glm::vec3 location = cfg::CAMERA_LOCATION;
    glm::vec3 rotationEuler = glm::vec3(glm::radians(cfg::CAMERA_TILT_DEG), 0.0f, 0.0f); // XYZ, radians
    float horizontalFovDeg = cfg::CAMERA_HFOV_DEG;
    float clipNear = cfg::CAMERA_CLIP_NEAR;
    float clipFar = cfg::CAMERA_CLIP_FAR;
};

enum class LightType : uint8_t {
    Point,
    Sun,
    Spot,
    Area,
};

inline const char* lightTypeName(LightType t) {
    switch (t) {
        case LightType::Point: return "POINT";
        case LightType::Sun: return "SUN";
        case LightType::Spot: return "SPOT";
        case LightType::Area: return "AREA";
    }
    return "UNKNOWN";
}

struct LightSpec {
    std::string name = cfg::LIGHT_NAME;
    LightType type = LightType::Area;
    glm::vec3 location = cfg::LIGHT_LOCATION;
    glm::vec3 rotationEuler = glm::vec3(0.0f); // XYZ, radians; emits along local -Z
    glm::vec3 color = glm::vec3(1.0f);
    float energy = cfg::LIGHT_ENERGY;
    float size = cfg::LIGHT_SIZE;               // area lights only
};
