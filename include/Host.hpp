#pragma once

#include "Material.hpp"
#include "MeshData.hpp"
#include "Types.hpp"

#include <glm/glm.hpp>

#include <cstddef>
#include <string>

using ObjectId = std::size_t;

// The scene a card is built into. Implementations own everything registered
// with them; unknown object ids and material names throw std::out_of_range.
class Host {
public:
    virtual ~Host() = default;

    virtual void clearScene() = 0;

    // Copies the solid into the host and links a new object for it.
    virtual ObjectId addSolid(const std::string& objectName, const std::string& meshName,
                              const SolidMesh& solid, const glm::vec3& location = glm::vec3(0.0f)) = 0;
    virtual void setShadeSmooth(ObjectId object, bool smooth) = 0;

    // The returned reference stays valid until clearScene() or destruction.
    virtual MaterialInputs& addMaterial(const std::string& name) = 0;
    virtual void assignMaterial(ObjectId object, const std::string& materialName) = 0;

    virtual void addCamera(const CameraSpec& camera) = 0;
    virtual void addLight(const LightSpec& light) = 0;
};
