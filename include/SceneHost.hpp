#pragma once

#include "Host.hpp"
#include "Material.hpp"

#include <glm/glm.hpp>

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

// Material with a fixed set of input sockets.
class SocketMaterial : public MaterialInputs {
public:
    SocketMaterial(std::string name, const std::vector<std::string>& inputs);

    const std::string& name() const override { return m_name; }
    bool hasInput(const std::string& input) const override;

    void setColor(const std::string& input, const glm::vec4& value) override;
    void setFloat(const std::string& input, float value) override;

    // nullptr if the input was never set
    const glm::vec4* color(const std::string& input) const;
    const float* value(const std::string& input) const;

    // Value of the first alias that was set for the parameter.
    const glm::vec4* color(MaterialParam p) const;
    const float* value(MaterialParam p) const;

private:
    std::string m_name;
    std::set<std::string> m_inputs;
    std::map<std::string, glm::vec4> m_colors;
    std::map<std::string, float> m_floats;

    void require(const std::string& input) const;
};

struct SceneObject {
    std::string name;
    std::string meshName;
    SolidMesh mesh;
    glm::vec3 location = glm::vec3(0.0f);
    std::string material; // empty if none
};

// In-memory host. Nothing is drawn or written; the recorded scene is read back
// through the accessors.
class SceneHost : public Host {
public:
    explicit SceneHost(InputProfile profile = InputProfile::Modern);
    explicit SceneHost(std::vector<std::string> materialInputs);

    void clearScene() override;

    ObjectId addSolid(const std::string& objectName, const std::string& meshName,
                      const SolidMesh& solid, const glm::vec3& location = glm::vec3(0.0f)) override;
    void setShadeSmooth(ObjectId object, bool smooth) override;

    MaterialInputs& addMaterial(const std::string& name) override;
    void assignMaterial(ObjectId object, const std::string& materialName) override;

    void addCamera(const CameraSpec& camera) override;
    void addLight(const LightSpec& light) override;

    const std::vector<SceneObject>& objects() const { return m_objects; }
    const SceneObject& object(ObjectId id) const;
    const std::vector<std::unique_ptr<SocketMaterial>>& materials() const { return m_materials; }
    const SocketMaterial* findMaterial(const std::string& name) const;
    const std::vector<CameraSpec>& cameras() const { return m_cameras; }
    const std::vector<LightSpec>& lights() const { return m_lights; }

protected:
    SceneObject& objectRef(ObjectId id);

private:
    std::vector<std::string> m_materialInputs;
    std::vector<SceneObject> m_objects;
    std::vector<std::unique_ptr<SocketMaterial>> m_materials;
    std::vector<CameraSpec> m_cameras;
    std::vector<LightSpec> m_lights;
};
