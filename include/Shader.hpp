#pragma once

#include <glad/gl.h>
#include <glm/glm.hpp>

#include <string>

// GLSL program. Constructors throw std::runtime_error on read, compile or
// link failure.
class Shader {
public:
    Shader() = default;
    Shader(const std::string& vertexPath, const std::string& fragmentPath);
    ~Shader();

    Shader(const Shader&) = delete;
    Shader& operator=(const Shader&) = delete;

    Shader(Shader&& other) noexcept;
    Shader& operator=(Shader&& other) noexcept;

    void use() const;

    void setMat4(const std::string& name, const glm::mat4& m) const;
    void setMat3(const std::string& name, const glm::mat3& m) const;
    void setVec3(const std::string& name, const glm::vec3& v) const;
    void setFloat(const std::string& name, float f) const;

private:
    GLuint m_program = 0;

    void link(const std::string& vertexSrc, const std::string& fragmentSrc);
    GLint location(const std::string& name) const;
};
