#pragma once

#include "Mesh.hpp"
#include "Texture.hpp"
#include "Types.hpp"

#include <glm/glm.hpp>
#include <string>
#include <vector>

// 一个网格及其材质的反照率纹理（-1 表示无纹理）
struct ModelPart {
    Mesh mesh;
    int albedo = -1;
};

// 模型加载与绘制
class Model {
public:
    Model() = default;
    explicit Model(const std::string& path);

    Model(Model&&) noexcept = default;
    Model& operator=(Model&&) noexcept = default;

    bool valid() const { return !m_parts.empty(); }

    const AABB& aabb() const { return m_aabb; }

    const std::vector<ModelPart>& parts() const { return m_parts; }
    const Texture2D* albedoFor(const ModelPart& part) const;

private:
    std::vector<ModelPart> m_parts;
    std::vector<Texture2D> m_textures;
    AABB m_aabb{{0,0,0},{0,0,0}};
};
