#include "gw/graphics/Shader.hpp"

#include <glm/gtc/type_ptr.hpp>
#include <vector>

#include "gw/core/Logger.hpp"

namespace gw::graphics {

Shader::~Shader() {
    release();
}

Shader::Shader(Shader&& other) noexcept
    : m_id(other.m_id),
      m_uniformCache(std::move(other.m_uniformCache)) {
    other.m_id = 0;
    other.m_uniformCache.clear();
}

Shader& Shader::operator=(Shader&& other) noexcept {
    if (this != &other) {
        release();
        m_id = other.m_id;
        m_uniformCache = std::move(other.m_uniformCache);
        other.m_id = 0;
        other.m_uniformCache.clear();
    }
    return *this;
}

void Shader::release() {
    if (m_id) {
        glDeleteProgram(m_id);
        m_id = 0;
    }
    m_uniformCache.clear();
}

GLuint Shader::compile(GLenum type, const char* src) {
    GLuint id = glCreateShader(type);
    glShaderSource(id, 1, &src, nullptr);
    glCompileShader(id);
    GLint ok = 0;
    glGetShaderiv(id, GL_COMPILE_STATUS, &ok);
    if (!ok) {
        GLint len = 0;
        glGetShaderiv(id, GL_INFO_LOG_LENGTH, &len);
        std::vector<char> log(static_cast<size_t>(len) + 1);
        glGetShaderInfoLog(id, len, nullptr, log.data());
        core::Logger::Error("[Shader] Compile failed: {}", log.data());
        glDeleteShader(id);
        return 0;
    }
    return id;
}

GLuint Shader::link(GLuint vs, GLuint fs) {
    GLuint prog = glCreateProgram();
    glAttachShader(prog, vs);
    glAttachShader(prog, fs);
    glLinkProgram(prog);
    GLint ok = 0;
    glGetProgramiv(prog, GL_LINK_STATUS, &ok);
    if (!ok) {
        GLint len = 0;
        glGetProgramiv(prog, GL_INFO_LOG_LENGTH, &len);
        std::vector<char> log(static_cast<size_t>(len) + 1);
        glGetProgramInfoLog(prog, len, nullptr, log.data());
        core::Logger::Error("[Shader] Link failed: {}", log.data());
        glDeleteProgram(prog);
        return 0;
    }
    return prog;
}

bool Shader::loadFromSource(std::string_view vertexSrc, std::string_view fragmentSrc) {
    const std::string vertex(vertexSrc);
    const std::string fragment(fragmentSrc);

    GLuint vs = compile(GL_VERTEX_SHADER, vertex.c_str());
    if (!vs)
        return false;
    GLuint fs = compile(GL_FRAGMENT_SHADER, fragment.c_str());
    if (!fs) {
        glDeleteShader(vs);
        return false;
    }

    GLuint prog = link(vs, fs);
    glDeleteShader(vs);
    glDeleteShader(fs);
    if (!prog)
        return false;

    release();
    m_id = prog;
    return true;
}

GLint Shader::uniformLoc(std::string_view name) const {
    if (!m_id || name.empty()) {
        return -1;
    }
    std::string key(name);
    auto it = m_uniformCache.find(key);
    if (it == m_uniformCache.end()) {
        const GLint location = glGetUniformLocation(m_id, key.c_str());
        it = m_uniformCache.emplace(std::move(key), location).first;
    }
    return it->second;
}

void Shader::SetInt(const char* name, int value) const {
    const GLint location = uniformLoc(name);
    if (location >= 0) {
        glUniform1i(location, value);
    }
}

void Shader::SetMat4(const char* name, const glm::mat4& mat) const {
    const GLint location = uniformLoc(name);
    if (location >= 0) {
        glUniformMatrix4fv(location, 1, GL_FALSE, glm::value_ptr(mat));
    }
}

} // namespace gw::graphics
