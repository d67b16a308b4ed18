#include "Shader.hpp"

#include "Util.hpp"

#include <stdexcept>
#include <utility>

// 编译单个着色器
static GLuint compile(GLenum type, const std::string& src, const std::string& path) {
    GLuint s = glCreateShader(type);
    const char* c = src.c_str();
    glShaderSource(s, 1, &c, nullptr);
    glCompileShader(s);

    GLint ok = 0;
    glGetShaderiv(s, GL_COMPILE_STATUS, &ok);
    if (!ok) {
        char log[2048];
        glGetShaderInfoLog(s, sizeof(log), nullptr, log);
        glDeleteShader(s);
        throw std::runtime_error("Shader compile failed: " + path + ": " + log);
    }
    return s;
}

Shader::Shader(const std::string& vertexPath, const std::string& fragmentPath) {
    GLuint v = compile(GL_VERTEX_SHADER, util::readTextFile(vertexPath), vertexPath);
    GLuint f = 0;
    try {
        f = compile(GL_FRAGMENT_SHADER, util::readTextFile(fragmentPath), fragmentPath);
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
    if (m_program) glDeleteProgram(m_program);
}

Shader::Shader(Shader&& other) noexcept
    : m_program(std::exchange(other.m_program, 0)),
      m_locations(std::move(other.m_locations)) {}

Shader& Shader::operator=(Shader&& other) noexcept {
    if (this != &other) {
        if (m_program) glDeleteProgram(m_program);
        m_program = std::exchange(other.m_program, 0);
        m_locations = std::move(other.m_locations);
    }
    return *this;
}

void Shader::use() const {
    glUseProgram(m_program);
}

// 变量位置缓存；不存在的变量返回 -1，GL 会忽略对 -1 的赋值
GLint Shader::location(const std::string& name) const {
    auto it = m_locations.find(name);
    if (it != m_locations.end()) return it->second;
    GLint loc = glGetUniformLocation(m_program, name.c_str());
    m_locations.emplace(name, loc);
    return loc;
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

void Shader::setVec4(const std::string& name, const glm::vec4& v) const {
    glUniform4f(location(name), v.x, v.y, v.z, v.w);
}

void Shader::setFloat(const std::string& name, float f) const {
    glUniform1f(location(name), f);
}

void Shader::setInt(const std::string& name, int i) const {
    glUniform1i(location(name), i);
}
