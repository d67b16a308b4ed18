#include "Renderer.hpp"

#include "Config.hpp"
#include "Primitives.hpp"
#include "Util.hpp"

#include <glm/gtc/matrix_transform.hpp>

#include <string>
#include <utility>

bool Renderer::init(int viewportW, int viewportH) {
    m_w = viewportW;
    m_h = viewportH;

    try {
        m_modelShader = Shader(cfg::MODEL_VERT_SHADER, cfg::MODEL_FRAG_SHADER);
        m_uiShader    = Shader(cfg::UI_VERT_SHADER,    cfg::UI_FRAG_SHADER);
    } catch (const std::exception& e) {
        util::logError(e.what());
        return false;
    }

    m_uiQuad = prim::makeUnitQuad();

    m_cam.fovDeg = cfg::CAMERA_FOV_DEG;
    m_cam.distance = cfg::CAMERA_START_DISTANCE;
    m_cam.nearPlane = cfg::FRAME_MIN_NEAR;
    m_cam.farPlane = cfg::FRAME_MIN_FAR;
    return true;
}

void Renderer::resize(int viewportW, int viewportH) {
    m_w = viewportW;
    m_h = viewportH;
    glViewport(0, 0, viewportW, viewportH);
}

bool Renderer::loadModel(const std::string& path, const std::optional<std::string>& overlayTexturePath) {
    util::logInfo("Loading model: " + path);

    if (!util::fileExists(path)) {
        util::logError("Could not load model, file not found: " + path);
        return false;
    }

    Model m(path);
    if (!m.valid()) {
        // Model logged the reason; keep showing whatever we had
        return false;
    }

    m_model = std::move(m);
    m_hasModel = true;
    m_overlay = Texture2D();

    if (overlayTexturePath) {
        m_overlay = Texture2D::fromFile(*overlayTexturePath, true);
        if (!m_overlay.valid()) {
            util::logWarn("Overlay texture not applied: " + *overlayTexturePath);
        } else {
            util::logInfo("Overlay texture " + std::to_string(m_overlay.width()) + "x" +
                          std::to_string(m_overlay.height()) + " for untextured materials");
        }
    }
    return true;
}

bool Renderer::loadEnvironment(const std::string& path) {
    if (!util::fileExists(path)) {
        util::logError("Failed to load HDR environment, file not found: " + path);
        return false;
    }
    Texture2D env = Texture2D::fromHdrFile(path);
    if (!env.valid()) return false;

    util::logInfo("Environment map " + std::to_string(env.width()) + "x" + std::to_string(env.height()));
    m_environment = std::move(env);
    return true;
}

FrameResult Renderer::frameModel() {
    FrameResult f = framing::frame(m_model.aabb(), glm::radians(m_cam.fovDeg));
    if (!m_hasModel) {
        f.center = glm::vec3(0.0f);
    }
    m_modelCenter = f.center;
    m_cam.apply(f);
    return f;
}

// Rotation is about the centre of the model's bounds, which sits at the origin.
glm::mat4 Renderer::modelMatrix(const Orientation& o) const {
    glm::mat4 M(1.0f);
    M = glm::rotate(M, o.pitch, glm::vec3(1.0f, 0.0f, 0.0f));
    M = glm::rotate(M, o.yaw, glm::vec3(0.0f, 1.0f, 0.0f));
    M = glm::translate(M, -m_modelCenter);
    return M;
}

void Renderer::draw(const FrameState& frame, const ControlBar& bar, int hoveredButton) {
    glViewport(0, 0, m_w, m_h);
    glClearColor(0.0f, 0.0f, 0.0f, 0.0f);
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

    if (m_hasModel && frame.hasModel) {
        drawModel(frame);
    }
    drawControls(bar, hoveredButton);
}

void Renderer::drawModel(const FrameState& frame) {
    glEnable(GL_DEPTH_TEST);
    glDisable(GL_CULL_FACE);
    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

    // While fading in, don't let hidden faces punch holes in the depth buffer
    const bool translucent = frame.opacity < 1.0f;
    glDepthMask(translucent ? GL_FALSE : GL_TRUE);

    const glm::mat4 M = modelMatrix(frame.orientation);
    const glm::mat4 V = m_cam.view();
    const glm::mat4 P = m_cam.projection((float)m_w / (float)m_h);

    m_modelShader.use();
    m_modelShader.setMat4("model", M);
    m_modelShader.setMat4("view", V);
    m_modelShader.setMat4("projection", P);
    m_modelShader.setMat3("normalMatrix", glm::transpose(glm::inverse(glm::mat3(M))));
    m_modelShader.setVec3("cameraPos", m_cam.position());

    // Hemisphere fill + sun, roughly the original stage lighting
    m_modelShader.setVec3("skyColor", glm::vec3(1.0f) * 0.7f);
    m_modelShader.setVec3("groundColor", glm::vec3(0.27f) * 0.7f);
    m_modelShader.setVec3("sunDir", glm::normalize(glm::vec3(-5.0f, -10.0f, -7.0f)));
    m_modelShader.setVec3("sunColor", glm::vec3(1.0f) * 3.0f / 3.14159265f);
    m_modelShader.setFloat("exposure", 1.0f);
    m_modelShader.setFloat("alpha", frame.opacity);

    m_modelShader.setInt("albedoMap", 0);
    m_modelShader.setInt("envMap", 1);
    if (m_environment.valid()) {
        m_environment.bind(1);
        m_modelShader.setInt("useEnv", 1);
    } else {
        m_modelShader.setInt("useEnv", 0);
    }

    for (const auto& part : m_model.parts()) {
        const Texture2D* tex = m_model.albedoFor(part);
        if (!tex && m_overlay.valid()) tex = &m_overlay;

        if (tex) {
            tex->bind(0);
            m_modelShader.setInt("useTexture", 1);
            m_modelShader.setVec3("baseColor", glm::vec3(1.0f));
        } else {
            m_modelShader.setInt("useTexture", 0);
            m_modelShader.setVec3("baseColor", glm::vec3(0.8f));
        }
        part.mesh.draw();
    }

    glActiveTexture(GL_TEXTURE1);
    glBindTexture(GL_TEXTURE_2D, 0);
    glActiveTexture(GL_TEXTURE0);
    glBindTexture(GL_TEXTURE_2D, 0);
    glDepthMask(GL_TRUE);
}

void Renderer::drawControls(const ControlBar& bar, int hoveredButton) {
    glDisable(GL_DEPTH_TEST);
    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

    glm::mat4 P = glm::ortho(0.0f, (float)m_w, 0.0f, (float)m_h);

    m_uiShader.use();
    m_uiShader.setMat4("projection", P);

    const auto& buttons = bar.buttons();
    for (size_t i = 0; i < buttons.size(); ++i) {
        const ControlButton& b = buttons[i];
        const bool hovered = (int)i == hoveredButton;

        m_uiShader.setVec4("rect", glm::vec4(b.rect.x, b.rect.y, b.rect.w, b.rect.h));
        m_uiShader.setVec4("color", glm::vec4(b.color * (hovered ? 1.15f : 0.85f), hovered ? 0.95f : 0.7f));
        m_uiQuad.draw();
    }

    glEnable(GL_DEPTH_TEST);
}
