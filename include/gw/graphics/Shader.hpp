#pragma once
#include <glad/glad.h>
#include <glm/mat4x4.hpp>
#include <string>
#include <string_view>
#include <unordered_map>

namespace gw::graphics {

// OpenGL program wrapper. Requires a current GL context for every call.
class Shader {
public:
    Shader() = default;
    ~Shader();

    Shader(const Shader&) = delete;
    Shader& operator=(const Shader&) = delete;
    Shader(Shader&& other) noexcept;
    Shader& operator=(Shader&& other) noexcept;

    bool loadFromSource(std::string_view vertexSrc, std::string_view fragmentSrc);

    void Use() const { glUseProgram(m_id); }
    GLuint Id() const { return m_id; }
    bool IsValid() const { return m_id != 0; }

    GLint uniformLoc(std::string_view name) const;

    void SetInt(const char* name, int value) const;
    void SetMat4(const char* name, const glm::mat4& mat) const;

private:
    static GLuint compile(GLenum type, const char* src);
    static GLuint link(GLuint vs, GLuint fs);
    void release();

    GLuint m_id{0};
    // name -> location; cleared whenever the program is replaced
    mutable std::unordered_map<std::string, GLint> m_uniformCache;
};

} // namespace gw::graphics
