#include "SceneHost.hpp"

#include <cstdio>
#include <stdexcept>
#include <utility>

SocketMaterial::SocketMaterial(std::string name, const std::vector<std::string>& inputs)
    : m_name(std::move(name)), m_inputs(inputs.begin(), inputs.end()) {}

bool SocketMaterial::hasInput(const std::string& input) const {
    return m_inputs.count(input) > 0;
}

void SocketMaterial::require(const std::string& input) const {
    if (!hasInput(input)) {
        throw std::out_of_range("Material '" + m_name + "' has no input '" + input + "'");
    }
}

void SocketMaterial::setColor(const std::string& input, const glm::vec4& value) {
    require(input);
    m_colors[input] = value;
}

void SocketMaterial::setFloat(const std::string& input, float value) {
    require(input);
    m_floats[input] = value;
}

const glm::vec4* SocketMaterial::color(const std::string& input) const {
    auto it = m_colors.find(input);
    return it != m_colors.end() ? &it->second : nullptr;
}

const float* SocketMaterial::value(const std::string& input) const {
    auto it = m_floats.find(input);
    return it != m_floats.end() ? &it->second : nullptr;
}

const glm::vec4* SocketMaterial::color(MaterialParam p) const {
    for (const auto& alias : inputAliases(p)) {
        if (const glm::vec4* c = color(alias)) return c;
    }
    return nullptr;
}

const float* SocketMaterial::value(MaterialParam p) const {
    for (const auto& alias : inputAliases(p)) {
        if (const float* v = value(alias)) return v;
    }
    return nullptr;
}

SceneHost::SceneHost(InputProfile profile)
    : m_materialInputs(profileInputs(profile)) {}

SceneHost::SceneHost(std::vector<std::string> materialInputs)
    : m_materialInputs(std::move(materialInputs)) {}

void SceneHost::clearScene() {
    m_objects.clear();
    m_materials.clear();
    m_cameras.clear();
    m_lights.clear();
}

ObjectId SceneHost::addSolid(const std::string& objectName, const std::string& meshName,
                             const SolidMesh& solid, const glm::vec3& location) {
    SceneObject obj;
    obj.name = objectName;
    obj.meshName = meshName;
    obj.mesh = solid;
    obj.location = location;
    m_objects.push_back(std::move(obj));
    return m_objects.size() - 1;
}

const SceneObject& SceneHost::object(ObjectId id) const {
    if (id >= m_objects.size()) {
        throw std::out_of_range("Unknown object id " + std::to_string(id));
    }
    return m_objects[id];
}

SceneObject& SceneHost::objectRef(ObjectId id) {
    if (id >= m_objects.size()) {
        throw std::out_of_range("Unknown object id " + std::to_string(id));
    }
    return m_objects[id];
}

void SceneHost::setShadeSmooth(ObjectId object, bool smooth) {
    objectRef(object).mesh.smooth = smooth;
}

MaterialInputs& SceneHost::addMaterial(const std::string& name) {
    // Same naming rule as the content tools: "Name", "Name.001", ...
    std::string unique = name;
    for (int n = 1; findMaterial(unique); ++n) {
        char suffix[16];
        std::snprintf(suffix, sizeof(suffix), ".%03d", n);
        unique = name + suffix;
    }

    m_materials.push_back(std::make_unique<SocketMaterial>(unique, m_materialInputs));
    return *m_materials.back();
}

const SocketMaterial* SceneHost::findMaterial(const std::string& name) const {
    for (const auto& m : m_materials) {
        if (m->name() == name) return m.get();
    }
    return nullptr;
}

void SceneHost::assignMaterial(ObjectId object, const std::string& materialName) {
    if (!findMaterial(materialName)) {
        throw std::out_of_range("Unknown material '" + materialName + "'");
    }
    objectRef(object).material = materialName;
}

void SceneHost::addCamera(const CameraSpec& camera) {
    m_cameras.push_back(camera);
}

void SceneHost::addLight(const LightSpec& light) {
    m_lights.push_back(light);
}
