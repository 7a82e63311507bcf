#pragma once

#include "Types.hpp"

#include <glm/glm.hpp>

#include <optional>
#include <string>
#include <vector>

// Parameter sockets of a host material. Names differ between host versions,
// so callers go through resolveInput() instead of hard-coding one name.
class MaterialInputs {
public:
    virtual ~MaterialInputs() = default;

    virtual const std::string& name() const = 0;
    virtual bool hasInput(const std::string& input) const = 0;

    // Throw std::out_of_range for inputs the material does not have.
    virtual void setColor(const std::string& input, const glm::vec4& value) = 0;
    virtual void setFloat(const std::string& input, float value) = 0;
};

enum class MaterialParam {
    BaseColor,
    Roughness,
    Specular,
};

const char* materialParamName(MaterialParam p);

// Accepted input names for a logical parameter, most preferred first.
const std::vector<std::string>& inputAliases(MaterialParam p);

// First alias the material has, or nullopt if none match.
std::optional<std::string> resolveInput(const MaterialInputs& inputs, MaterialParam p);

// Assigns base color, roughness and specular. Parameters without a matching
// input are skipped. Returns the number of parameters assigned.
int applyMaterial(MaterialInputs& inputs, const MaterialSpec& spec);

// Input layouts of the two host generations the alias table covers.
enum class InputProfile {
    Legacy, // "Specular"
    Modern, // "Specular IOR Level"
};

std::vector<std::string> profileInputs(InputProfile profile);
