#pragma once

#include <glad/gl.h>
#include <glm/glm.hpp>

#include <string>
#include <unordered_map>

// GLSL 程序封装。编译或链接失败时构造函数抛出 std::runtime_error。
class Shader {
public:
    Shader() = default;
    Shader(const std::string& vertexPath, const std::string& fragmentPath);
    ~Shader();

    Shader(const Shader&) = delete;
    Shader& operator=(const Shader&) = delete;

    Shader(Shader&& other) noexcept;
    Shader& operator=(Shader&& other) noexcept;

    bool valid() const { return m_program != 0; }
    void use() const;

    void setMat4(const std::string& name, const glm::mat4& m) const;
    void setMat3(const std::string& name, const glm::mat3& m) const;
    void setVec3(const std::string& name, const glm::vec3& v) const;
    void setVec4(const std::string& name, const glm::vec4& v) const;
    void setFloat(const std::string& name, float f) const;
    void setInt(const std::string& name, int i) const;

private:
    GLuint m_program = 0;
    mutable std::unordered_map<std::string, GLint> m_locations;

    GLint location(const std::string& name) const;
};
