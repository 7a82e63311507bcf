#pragma once

#include <glm/glm.hpp>

#include <string>

namespace cfg {

// Card coordinate system
// - X: width (left->right)
// - Y: height (bottom->top)
// - Z: thickness axis, the card is centred on z = 0

inline constexpr float CARD_WIDTH = 1.0f;
inline constexpr float CARD_HEIGHT = 0.6f;
inline constexpr float CARD_RADIUS = 0.06f;     // corner radius
inline constexpr float CARD_THICKNESS = 0.01f;
inline constexpr int CARD_CORNER_STEPS = 24;    // segments per 90 degree arc

// Consecutive outline points closer than this are merged.
inline constexpr float OUTLINE_MERGE_EPS = 1e-7f;

inline const std::string CARD_OBJECT_NAME = "BlackCard";
inline const std::string CARD_MESH_NAME = "BlackCardMesh";
inline constexpr bool CARD_SHADE_SMOOTH = true;

inline const std::string MATERIAL_NAME = "BlackMaterial";
inline const glm::vec4 MATERIAL_BASE_COLOR = glm::vec4(0.0f, 0.0f, 0.0f, 1.0f);
inline constexpr float MATERIAL_ROUGHNESS = 0.6f;  // slightly matte
inline constexpr float MATERIAL_SPECULAR = 0.03f;

inline const std::string CAMERA_NAME = "Camera";
inline const glm::vec3 CAMERA_LOCATION = glm::vec3(0.0f, -1.6f, 0.5f);
inline constexpr float CAMERA_TILT_DEG = 70.0f;    // rotation about X
inline constexpr float CAMERA_HFOV_DEG = 39.6f;    // 50mm lens, 36mm sensor
inline constexpr float CAMERA_CLIP_NEAR = 0.1f;
inline constexpr float CAMERA_CLIP_FAR = 100.0f;

inline const std::string LIGHT_NAME = "KeyLight";
inline const glm::vec3 LIGHT_LOCATION = glm::vec3(1.2f, -0.8f, 1.2f);
inline constexpr float LIGHT_ENERGY = 500.0f;      // watts
inline constexpr float LIGHT_SIZE = 0.25f;

// Material input names as exposed by hosts.
inline const std::string INPUT_BASE_COLOR = "Base Color";
inline const std::string INPUT_ROUGHNESS = "Roughness";
inline const std::string INPUT_SPECULAR = "Specular";
inline const std::string INPUT_SPECULAR_IOR_LEVEL = "Specular IOR Level";
inline const std::string INPUT_SPECULAR_IOR = "Specular IOR";

// Export
inline const std::string DEFAULT_OUTPUT = "BlackCard.obj";

// Preview window
inline constexpr int PREVIEW_WIDTH = 1280;
inline constexpr int PREVIEW_HEIGHT = 720;
inline const std::string PREVIEW_TITLE = "Card3D (OpenGL) - Preview";
inline const std::string CARD_VERT_SHADER = "assets/shaders/card.vert";
inline const std::string CARD_FRAG_SHADER = "assets/shaders/card.frag";

// Watts -> shader intensity for the preview; the preview has no physical units.
inline constexpr float PREVIEW_LIGHT_SCALE = 1.0f / 250.0f;

} // namespace cfg
