#pragma once

#include <glad/gl.h>
#include <glm/glm.hpp>

#include <vector>

struct VertexPN {
    glm::vec3 pos;
    glm::vec3 normal;
    glm::vec2 uv;
};

// GPU 三角网格（VAO + VBO + EBO），只可移动
class Mesh {
public:
    Mesh() = default;
    ~Mesh();

    Mesh(const Mesh&) = delete;
    Mesh& operator=(const Mesh&) = delete;

    Mesh(Mesh&& other) noexcept;
    Mesh& operator=(Mesh&& other) noexcept;

    static Mesh fromTriangles(const std::vector<VertexPN>& verts, const std::vector<unsigned int>& indices);

    bool valid() const { return m_vao != 0 && m_indexCount > 0; }

    void draw() const;

private:
    GLuint m_vao = 0;
    GLuint m_vbo = 0;
    GLuint m_ebo = 0;
    GLsizei m_indexCount = 0;

    void release();
};
