#include <glad/gl.h>

#include <GLFW/glfw3.h>

#include "ActionDispatcher.hpp"
#include "AnimationClock.hpp"
#include "AssetQuery.hpp"
#include "Config.hpp"
#include "ControlBar.hpp"
#include "MessageBridge.hpp"
#include "PointerRotation.hpp"
#include "Renderer.hpp"
#include "SnapRules.hpp"
#include "Util.hpp"

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// GLFW keeps delivering cursor events to the window while a button is held,
// so "capture" only has to remember which pointer owns the drag.
class GlfwPointerCapture : public PointerCapture {
public:
    void capture(int pointerId) override { m_captured = pointerId; }

    void release(int pointerId) override {
        if (m_captured != pointerId) {
            throw PointerCaptureError("pointer " + std::to_string(pointerId) + " is not captured");
        }
        m_captured.reset();
    }

    bool isCaptured() const override { return m_captured.has_value(); }

private:
    std::optional<int> m_captured;
};

struct KeyBinding {
    int key;
    ModelAction action;
};

static const KeyBinding kKeyBindings[] = {
    {GLFW_KEY_R,     ModelAction::ResetView},
    {GLFW_KEY_S,     ModelAction::Spin},
    {GLFW_KEY_LEFT,  ModelAction::TurnLeft},
    {GLFW_KEY_RIGHT, ModelAction::TurnRight},
    {GLFW_KEY_UP,    ModelAction::TiltForward},
    {GLFW_KEY_DOWN,  ModelAction::TiltBack},
    {GLFW_KEY_N,     ModelAction::TiltNeutral},
};

static constexpr int kMousePointerId = 1;

struct App {
    GLFWwindow* window = nullptr;
    int w = 1280;
    int h = 720;

    AssetQuery query;
    Renderer renderer;
    ControlBar controls;
    int hoveredButton = -1;

    AnimationClock clock{[] { return glfwGetTime(); },
                         ClampConfig{cfg::CLAMP_MIN_DEG, cfg::CLAMP_MAX_DEG}};
    ActionDispatcher dispatcher{clock, [this] { renderer.frameModel(); }};
    GlfwPointerCapture capture;
    PointerRotationController pointer{clock.state(), clock.clamp(), snap::defaultSettings(), capture};

    std::shared_ptr<MessageInbox> inbox = std::make_shared<MessageInbox>();
    LineMessageReader reader{std::cin, inbox};
    ReadyNotifier ready{std::cout};
};

static void updateWindowTitle(App& app) {
    static std::string last;
    std::string title = "EmbedViewer - " + app.query.model;
    if (app.hoveredButton >= 0) {
        title += std::string(" [") + actionName(app.controls.buttons()[(size_t)app.hoveredButton].action) + "]";
    }
    if (title != last) {
        glfwSetWindowTitle(app.window, title.c_str());
        last = std::move(title);
    }
}

// Loads a model and, only on success, makes it current.
static void loadModel(App& app, const std::string& path, const std::optional<std::string>& texture) {
    if (!app.renderer.loadModel(path, texture)) {
        return;
    }
    app.renderer.frameModel();
    app.clock.resetForModel(app.clock.now());
    app.dispatcher.onModelReady();
}

static void glfwErrorCallback(int error, const char* description) {
    util::logError(std::string("GLFW error ") + std::to_string(error) + ": " + (description ? description : ""));
}

static void framebufferSizeCallback(GLFWwindow* window, int w, int h) {
    if (w <= 0 || h <= 0) return;
    auto* app = (App*)glfwGetWindowUserPointer(window);
    if (!app) return;
    app->w = w;
    app->h = h;
    app->renderer.resize(w, h);
    app->controls.layout(w, h);
}

// Window coordinates -> bottom-left pixel space used by the control bar
static void cursorToUi(const App& app, double x, double y, float& ux, float& uy) {
    int winW = 1, winH = 1;
    glfwGetWindowSize(app.window, &winW, &winH);
    float sx = (winW > 0) ? (float)app.w / (float)winW : 1.0f;
    float sy = (winH > 0) ? (float)app.h / (float)winH : 1.0f;
    ux = (float)x * sx;
    uy = (float)app.h - (float)y * sy;
}

static void cursorPosCallback(GLFWwindow* window, double x, double y) {
    auto* app = (App*)glfwGetWindowUserPointer(window);
    if (!app) return;

    float ux = 0.0f, uy = 0.0f;
    cursorToUi(*app, x, y, ux, uy);
    app->hoveredButton = app->controls.indexAt(ux, uy);

    app->pointer.pointerMove(x, y);
}

static void cursorEnterCallback(GLFWwindow* window, int entered) {
    auto* app = (App*)glfwGetWindowUserPointer(window);
    if (!app || entered) return;

    app->hoveredButton = -1;
    // A captured pointer keeps dragging outside the window
    if (!app->capture.isCaptured()) {
        app->pointer.pointerLeave();
    }
}

static void mouseButtonCallback(GLFWwindow* window, int button, int action, int mods) {
    (void)mods;
    auto* app = (App*)glfwGetWindowUserPointer(window);
    if (!app || button != GLFW_MOUSE_BUTTON_LEFT) return;

    double mx = 0.0, my = 0.0;
    glfwGetCursorPos(window, &mx, &my);

    if (action == GLFW_PRESS) {
        float ux = 0.0f, uy = 0.0f;
        cursorToUi(*app, mx, my, ux, uy);
        if (auto a = app->controls.hitTest(ux, uy)) {
            app->dispatcher.dispatch(*a);
            return;
        }
        app->pointer.pointerDown(kMousePointerId, mx, my);
    } else if (action == GLFW_RELEASE) {
        app->pointer.pointerUp(kMousePointerId);
    }
}

static void keyCallback(GLFWwindow* window, int key, int scancode, int action, int mods) {
    (void)scancode;
    (void)mods;
    auto* app = (App*)glfwGetWindowUserPointer(window);
    if (!app || action != GLFW_PRESS) return;

    if (key == GLFW_KEY_ESCAPE) {
        glfwSetWindowShouldClose(window, GLFW_TRUE);
        return;
    }
    for (const auto& b : kKeyBindings) {
        if (b.key == key) {
            app->dispatcher.dispatch(b.action);
            return;
        }
    }
}

// Dropping a file on the window is an explicit request to load another model.
static void dropCallback(GLFWwindow* window, int count, const char** paths) {
    auto* app = (App*)glfwGetWindowUserPointer(window);
    if (!app || count <= 0 || !paths[0]) return;

    std::string path = paths[0];
    auto slash = path.find_last_of("/\\");
    app->query.model = (slash != std::string::npos) ? path.substr(slash + 1) : path;
    loadModel(*app, path, app->query.texturePath());
}

int main(int argc, char** argv) {
    glfwSetErrorCallback(glfwErrorCallback);

    if (!glfwInit()) {
        util::logError("Failed to init GLFW");
        return 1;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_TRANSPARENT_FRAMEBUFFER, GLFW_TRUE);
#if defined(__APPLE__)
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
#endif

    App app;
    app.query = AssetQuery::fromArgs(std::vector<std::string>(argv + 1, argv + argc));

    app.window = glfwCreateWindow(app.w, app.h, "EmbedViewer", nullptr, nullptr);
    if (!app.window) {
        util::logError("Failed to create window");
        glfwTerminate();
        return 1;
    }

    glfwMakeContextCurrent(app.window);
    glfwSwapInterval(1);

    if (!gladLoadGL((GLADloadfunc)glfwGetProcAddress)) {
        util::logError("Failed to load OpenGL via glad");
        glfwDestroyWindow(app.window);
        glfwTerminate();
        return 1;
    }

    glfwSetWindowUserPointer(app.window, &app);
    glfwSetFramebufferSizeCallback(app.window, framebufferSizeCallback);
    glfwSetCursorPosCallback(app.window, cursorPosCallback);
    glfwSetCursorEnterCallback(app.window, cursorEnterCallback);
    glfwSetMouseButtonCallback(app.window, mouseButtonCallback);
    glfwSetKeyCallback(app.window, keyCallback);
    glfwSetDropCallback(app.window, dropCallback);

    util::logInfo(std::string("OpenGL: ") + (const char*)glGetString(GL_VERSION));

    // Initial size (some platforms won't call framebuffer callback immediately)
    int fbw = 0, fbh = 0;
    glfwGetFramebufferSize(app.window, &fbw, &fbh);
    app.w = fbw > 0 ? fbw : app.w;
    app.h = fbh > 0 ? fbh : app.h;

    if (!app.renderer.init(app.w, app.h)) {
        util::logError("Renderer init failed");
        glfwDestroyWindow(app.window);
        glfwTerminate();
        return 1;
    }
    app.renderer.resize(app.w, app.h);
    app.controls.layout(app.w, app.h);

    // Host messages may arrive before anything is loaded; they queue up.
    app.reader.start();

    // Load sequence: environment, then the requested model. Failures are logged
    // and the viewer keeps running.
    if (!app.renderer.loadEnvironment(util::joinPath(cfg::ENVIRONMENTS_DIR, cfg::DEFAULT_ENVIRONMENT))) {
        util::logWarn("Continuing without environment lighting");
    }
    loadModel(app, app.query.modelPath(), app.query.texturePath());
    app.dispatcher.onLoadSequenceComplete();
    app.ready.notify();

    while (!glfwWindowShouldClose(app.window)) {
        for (const auto& msg : app.inbox->drain()) {
            protocol::route(msg, app.dispatcher);
        }

        FrameState frame = app.clock.tick();

        updateWindowTitle(app);
        app.renderer.draw(frame, app.controls, app.hoveredButton);

        glfwSwapBuffers(app.window);
        glfwPollEvents();
    }

    glfwDestroyWindow(app.window);
    glfwTerminate();
    return 0;
}
