#include "Model.hpp"

#include "Util.hpp"

#include <assimp/Importer.hpp>
#include <assimp/ProgressHandler.hpp>
#include <assimp/postprocess.h>
#include <assimp/scene.h>
#include <assimp/material.h>

#include <cfloat>
#include <cstdlib>
#include <unordered_map>
#include <vector>

static glm::mat4 aiToGlm(const aiMatrix4x4& m) {
    // glm 是列主序：mat[col][row]
    glm::mat4 r;
    r[0][0] = m.a1; r[1][0] = m.a2; r[2][0] = m.a3; r[3][0] = m.a4;
    r[0][1] = m.b1; r[1][1] = m.b2; r[2][1] = m.b3; r[3][1] = m.b4;
    r[0][2] = m.c1; r[1][2] = m.c2; r[2][2] = m.c3; r[3][2] = m.c4;
    r[0][3] = m.d1; r[1][3] = m.d2; r[2][3] = m.d3; r[3][3] = m.d4;
    return r;
}

// 加载进度日志（每 25% 输出一次）
class LogProgressHandler : public Assimp::ProgressHandler {
public:
    explicit LogProgressHandler(std::string path) : m_path(std::move(path)) {}

    bool Update(float percentage) override {
        int step = (int)(percentage * 4.0f);
        if (step > m_lastStep) {
            m_lastStep = step;
            util::logInfo("Loading progress: " + m_path + " " + std::to_string(step * 25) + "%");
        }
        return true;
    }

private:
    std::string m_path;
    int m_lastStep = -1;
};

static Mesh processMesh(aiMesh* mesh, const glm::mat4& xform, AABB& aabb) {
    std::vector<VertexPN> verts;
    verts.reserve(mesh->mNumVertices);

    glm::mat3 nmat = glm::transpose(glm::inverse(glm::mat3(xform)));

    for (unsigned int i = 0; i < mesh->mNumVertices; ++i) {
        glm::vec3 p(mesh->mVertices[i].x, mesh->mVertices[i].y, mesh->mVertices[i].z);
        glm::vec3 tp = glm::vec3(xform * glm::vec4(p, 1.0f));

        VertexPN v{};
        v.pos = tp;
        v.normal = mesh->HasNormals()
            ? glm::normalize(nmat * glm::vec3(mesh->mNormals[i].x, mesh->mNormals[i].y, mesh->mNormals[i].z))
            : glm::vec3(0, 1, 0);
        v.uv = mesh->HasTextureCoords(0)
            ? glm::vec2(mesh->mTextureCoords[0][i].x, mesh->mTextureCoords[0][i].y)
            : glm::vec2(0.0f);

        aabb.min = glm::min(aabb.min, tp);
        aabb.max = glm::max(aabb.max, tp);

        verts.push_back(v);
    }

    std::vector<unsigned int> indices;
    indices.reserve(mesh->mNumFaces * 3);
    for (unsigned int i = 0; i < mesh->mNumFaces; ++i) {
        const aiFace& f = mesh->mFaces[i];
        for (unsigned int j = 0; j < f.mNumIndices; ++j) indices.push_back(f.mIndices[j]);
    }

    return Mesh::fromTriangles(verts, indices);
}

static Texture2D loadAlbedoFromMaterial(const aiScene* scene, const aiMaterial* mat, const std::string& modelPath) {
    aiString texPath;

    // glTF2 通常使用 BASE_COLOR，也可能用 DIFFUSE。
    bool found = (mat->GetTexture(aiTextureType_BASE_COLOR, 0, &texPath) == aiReturn_SUCCESS) ||
                 (mat->GetTexture(aiTextureType_DIFFUSE,   0, &texPath) == aiReturn_SUCCESS);
    if (!found) return Texture2D();

    std::string tpath = texPath.C_Str();
    if (tpath.empty()) return Texture2D();

    // GLB 内嵌纹理： "*0", "*1", ...
    if (tpath[0] == '*') {
        int idx = std::atoi(tpath.c_str() + 1);
        if (idx < 0 || idx >= (int)scene->mNumTextures || !scene->mTextures[idx]) return Texture2D();

        const aiTexture* t = scene->mTextures[idx];
        if (t->mHeight == 0) {
            // 压缩字节存于 pcData，长度为 mWidth
            return Texture2D::fromMemory(reinterpret_cast<const unsigned char*>(t->pcData), (int)t->mWidth, true);
        }

        // 原始像素存为 aiTexel (BGRA)
        std::vector<unsigned char> pixels((size_t)t->mWidth * (size_t)t->mHeight * 4);
        for (unsigned int i = 0; i < t->mWidth * t->mHeight; ++i) {
            const aiTexel& px = t->pcData[i];
            pixels[i * 4 + 0] = px.r;
            pixels[i * 4 + 1] = px.g;
            pixels[i * 4 + 2] = px.b;
            pixels[i * 4 + 3] = px.a;
        }
        return Texture2D::fromPixels(pixels.data(), (int)t->mWidth, (int)t->mHeight, 4, true);
    }

    // 外部纹理路径相对模型目录
    std::string modelDir = modelPath;
    auto slash = modelDir.find_last_of("/\\");
    modelDir = (slash != std::string::npos) ? modelDir.substr(0, slash) : ".";
    return Texture2D::fromFile(util::joinPath(modelDir, tpath), true);
}

namespace {

struct SceneBuilder {
    const aiScene* scene;
    std::string path;
    std::vector<ModelPart>& parts;
    std::vector<Texture2D>& textures;
    AABB aabb;
    // material index -> texture slot (-1: material has none)
    std::unordered_map<unsigned int, int> materialSlots;

    int albedoSlot(unsigned int materialIndex) {
        auto it = materialSlots.find(materialIndex);
        if (it != materialSlots.end()) return it->second;

        int slot = -1;
        if (materialIndex < scene->mNumMaterials && scene->mMaterials[materialIndex]) {
            Texture2D tex = loadAlbedoFromMaterial(scene, scene->mMaterials[materialIndex], path);
            if (tex.valid()) {
                slot = (int)textures.size();
                textures.push_back(std::move(tex));
            }
        }
        materialSlots.emplace(materialIndex, slot);
        return slot;
    }

    void processNode(const aiNode* node, const glm::mat4& parent) {
        glm::mat4 xform = parent * aiToGlm(node->mTransformation);

        for (unsigned int i = 0; i < node->mNumMeshes; ++i) {
            aiMesh* m = scene->mMeshes[node->mMeshes[i]];
            ModelPart part;
            part.mesh = processMesh(m, xform, aabb);
            part.albedo = albedoSlot(m->mMaterialIndex);
            parts.push_back(std::move(part));
        }

        for (unsigned int i = 0; i < node->mNumChildren; ++i) {
            processNode(node->mChildren[i], xform);
        }
    }
};

} // namespace

Model::Model(const std::string& path) {
    Assimp::Importer importer;
    // Importer 接管 handler 的所有权
    importer.SetProgressHandler(new LogProgressHandler(path));

    const aiScene* scene = importer.ReadFile(
        path,
        aiProcess_Triangulate |
        aiProcess_GenSmoothNormals |
        aiProcess_JoinIdenticalVertices
    );

    if (!scene || !scene->mRootNode || (scene->mFlags & AI_SCENE_FLAGS_INCOMPLETE)) {
        util::logError(std::string("Could not load model: ") + path + " (" + importer.GetErrorString() + ")");
        return;
    }

    SceneBuilder builder{scene, path, m_parts, m_textures, {}, {}};
    builder.aabb.min = glm::vec3( FLT_MAX,  FLT_MAX,  FLT_MAX);
    builder.aabb.max = glm::vec3(-FLT_MAX, -FLT_MAX, -FLT_MAX);
    builder.processNode(scene->mRootNode, glm::mat4(1.0f));

    if (m_parts.empty()) {
        util::logError("Model has no meshes: " + path);
        return;
    }
    m_aabb = builder.aabb;

    util::logInfo("Loaded model: " + path + " meshes=" + std::to_string(m_parts.size()) +
                  " textures=" + std::to_string(m_textures.size()));
}

const Texture2D* Model::albedoFor(const ModelPart& part) const {
    if (part.albedo < 0 || part.albedo >= (int)m_textures.size()) return nullptr;
    return &m_textures[(size_t)part.albedo];
}
