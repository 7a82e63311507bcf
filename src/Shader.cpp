#include "Shader.hpp"

#include "Util.hpp"

#include <stdexcept>

// 编译单个着色器
static GLuint compile(GLenum type, const std::string& src) {
    GLuint s = glCreateShader(type);
    const char* c = src.c_str();
    glShaderSource(s, 1, &c, nullptr);
    glCompileShader(s);

    GLint ok = 0;
    glGetShaderiv(s, GL_COMPILE_STATUS, &ok);
    if (!ok) {
        char log[2048];
        glGetShaderInfoLog(s, sizeof(log), nullptr, log);
        std::string msg = (type == GL_VERTEX_SHADER ? "Vertex" : "Fragment");
        msg += " shader compile failed: ";
        msg += log;
        glDeleteShader(s);
        throw std::runtime_error(msg);
    }
    return s;
}

Shader::Shader(const std::string& vertexPath, const std::string& fragmentPath) {
    link(util::readTextFile(vertexPath), util::readTextFile(fragmentPath));
}

void Shader::link(const std::string& vertexSrc, const std::string& fragmentSrc) {
    GLuint v = compile(GL_VERTEX_SHADER, vertexSrc);
    GLuint f = 0;
    try {
        f = compile(GL_FRAGMENT_SHADER, fragmentSrc);
    } catch (const std::exception&) {
        glDeleteShader(v);
        throw;
    }

    m_program = glCreateProgram();
    glAttachShader(m_program, v);
    glAttachShader(m_program, f);
    glLinkProgram(m_program);

    glDeleteShader(v);
    glDeleteShader(f);

    GLint ok = 0;
    glGetProgramiv(m_program, GL_LINK_STATUS, &ok);
    if (!ok) {
        char log[2048];
        glGetProgramInfoLog(m_program, sizeof(log), nullptr, log);
        glDeleteProgram(m_program);
        m_program = 0;
        throw std::runtime_error(std::string("Shader program link failed: ") + log);
    }
}

Shader::~Shader() {
    if (m_program) {
        glDeleteProgram(m_program);
        m_program = 0;
    }
}

Shader::Shader(Shader&& other) noexcept {
    m_program = other.m_program;
    other.m_program = 0;
}

Shader& Shader::operator=(Shader&& other) noexcept {
    if (this != &other) {
        if (m_program) glDeleteProgram(m_program);
        m_program = other.m_program;
        other.m_program = 0;
    }
    return *this;
}

void Shader::use() const {
    glUseProgram(m_program);
}

GLint Shader::location(const std::string& name) const {
    return glGetUniformLocation(m_program, name.c_str());
}

void Shader::setMat4(const std::string& name, const glm::mat4& m) const {
    glUniformMatrix4fv(location(name), 1, GL_FALSE, &m[0][0]);
}

void Shader::setMat3(const std::string& name, const glm::mat3& m) const {
    glUniformMatrix3fv(location(name), 1, GL_FALSE, &m[0][0]);
}

void Shader::setVec3(const std::string& name, const glm::vec3& v) const {
    glUniform3f(location(name), v.x, v.y, v.z);
}

void Shader::setFloat(const std::string& name, float f) const {
    glUniform1f(location(name), f);
}
