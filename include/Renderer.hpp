#pragma once

#include "AnimationClock.hpp"
#include "Camera.hpp"
#include "CameraFramer.hpp"
#include "ControlBar.hpp"
#include "Mesh.hpp"
#include "Model.hpp"
#include "Shader.hpp"
#include "Texture.hpp"

#include <glm/glm.hpp>

#include <optional>
#include <string>

class Renderer {
public:
    bool init(int viewportW, int viewportH);
    void resize(int viewportW, int viewportH);

    // On failure the previous model (if any) stays current.
    bool loadModel(const std::string& path, const std::optional<std::string>& overlayTexturePath);
    bool loadEnvironment(const std::string& path);

    // Fit the camera to the current model and move the model to the origin.
    FrameResult frameModel();

    void draw(const FrameState& frame, const ControlBar& bar, int hoveredButton);

private:
    int m_w = 1;
    int m_h = 1;

    Shader m_modelShader;
    Shader m_uiShader;

    ViewCamera m_cam;

    Model m_model;
    bool m_hasModel = false;
    glm::vec3 m_modelCenter = glm::vec3(0.0f);

    Texture2D m_overlay;     // applied to meshes without their own base color map
    Texture2D m_environment; // equirectangular light probe

    Mesh m_uiQuad;

    glm::mat4 modelMatrix(const Orientation& o) const;
    void drawModel(const FrameState& frame);
    void drawControls(const ControlBar& bar, int hoveredButton);
};
