#include "Texture.hpp"
#include "Util.hpp"

#define STB_IMAGE_IMPLEMENTATION
#include <stb/stb_image.h>

// 通道数对应的像素格式
static GLenum formatFor(int channels) {
    switch (channels) {
        case 1: return GL_RED;
        case 2: return GL_RG;
        case 3: return GL_RGB;
        default: return GL_RGBA;
    }
}

static GLint internalFormatFor(int channels) {
    switch (channels) {
        case 1: return GL_R8;
        case 2: return GL_RG8;
        case 3: return GL_RGB8;
        default: return GL_RGBA8;
    }
}

// 上传 8 位像素数据并设置参数
static GLuint uploadTexture(const unsigned char* pixels, int w, int h, int channels, bool mip) {
    if (!pixels || w <= 0 || h <= 0 || channels <= 0) return 0;

    GLuint tex = 0;
    glGenTextures(1, &tex);
    glBindTexture(GL_TEXTURE_2D, tex);

    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_REPEAT);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_REPEAT);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, mip ? GL_LINEAR_MIPMAP_LINEAR : GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);

    // 行宽不一定是 4 字节对齐
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexImage2D(GL_TEXTURE_2D, 0, internalFormatFor(channels), w, h, 0, formatFor(channels), GL_UNSIGNED_BYTE, pixels);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 4);

    if (mip) glGenerateMipmap(GL_TEXTURE_2D);

    glBindTexture(GL_TEXTURE_2D, 0);
    return tex;
}

Texture2D::~Texture2D() {
    if (m_id) glDeleteTextures(1, &m_id);
}

Texture2D::Texture2D(Texture2D&& other) noexcept {
    m_id = other.m_id;
    m_w = other.m_w;
    m_h = other.m_h;
    other.m_id = 0;
}

Texture2D& Texture2D::operator=(Texture2D&& other) noexcept {
    if (this != &other) {
        if (m_id) glDeleteTextures(1, &m_id);
        m_id = other.m_id;
        m_w = other.m_w;
        m_h = other.m_h;
        other.m_id = 0;
    }
    return *this;
}

void Texture2D::bind(int unit) const {
    glActiveTexture(GL_TEXTURE0 + unit);
    glBindTexture(GL_TEXTURE_2D, m_id);
}

// glTF 的 UV 原点在左上角，与图片行序一致，因此不翻转
Texture2D Texture2D::fromFile(const std::string& path, bool mip) {
    Texture2D t;
    stbi_set_flip_vertically_on_load(0);

    int w = 0, h = 0, c = 0;
    unsigned char* data = stbi_load(path.c_str(), &w, &h, &c, 0);
    if (!data) {
        util::logError(std::string("Failed to load image: ") + path + " (" + stbi_failure_reason() + ")");
        return t;
    }

    t.m_id = uploadTexture(data, w, h, c, mip);
    t.m_w = w;
    t.m_h = h;
    stbi_image_free(data);

    if (t.m_id) util::logInfo(std::string("Loaded texture: ") + path);
    return t;
}

Texture2D Texture2D::fromMemory(const unsigned char* data, int sizeBytes, bool mip) {
    Texture2D t;
    stbi_set_flip_vertically_on_load(0);

    int w = 0, h = 0, c = 0;
    unsigned char* pixels = stbi_load_from_memory(data, sizeBytes, &w, &h, &c, 0);
    if (!pixels) {
        util::logWarn("Failed to decode embedded texture (stb_image).");
        return t;
    }

    t.m_id = uploadTexture(pixels, w, h, c, mip);
    t.m_w = w;
    t.m_h = h;
    stbi_image_free(pixels);
    return t;
}

Texture2D Texture2D::fromPixels(const unsigned char* pixels, int w, int h, int channels, bool mip) {
    Texture2D t;
    t.m_id = uploadTexture(pixels, w, h, channels, mip);
    if (t.m_id) {
        t.m_w = w;
        t.m_h = h;
    }
    return t;
}

Texture2D Texture2D::fromHdrFile(const std::string& path) {
    Texture2D t;
    stbi_set_flip_vertically_on_load(0);

    int w = 0, h = 0, c = 0;
    float* data = stbi_loadf(path.c_str(), &w, &h, &c, 3);
    if (!data) {
        util::logError(std::string("Failed to load HDR environment: ") + path + " (" + stbi_failure_reason() + ")");
        return t;
    }

    glGenTextures(1, &t.m_id);
    glBindTexture(GL_TEXTURE_2D, t.m_id);
    // 经度方向环绕，纬度方向夹紧
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_REPEAT);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR_MIPMAP_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGB16F, w, h, 0, GL_RGB, GL_FLOAT, data);
    glGenerateMipmap(GL_TEXTURE_2D);
    glBindTexture(GL_TEXTURE_2D, 0);

    stbi_image_free(data);
    t.m_w = w;
    t.m_h = h;

    util::logInfo("HDR environment loaded: " + path);
    return t;
}
