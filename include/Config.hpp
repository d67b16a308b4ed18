#pragma once

#include <string>

namespace cfg {

// Orientation
// - yaw follows horizontal drag, pitch follows vertical drag
// - pitch is limited so the model can't flip over
inline constexpr float DRAG_SPEED = 0.005f;  // radians per pixel
inline constexpr float CLAMP_MIN_DEG = -45.0f;
inline constexpr float CLAMP_MAX_DEG = 110.0f;

// Snap-back after a drag. Rules are checked in this order.
inline constexpr bool SNAP_ENABLED = true;
inline constexpr float SNAP_FORWARD_THRESHOLD_DEG = 25.0f; // tilted past this...
inline constexpr float SNAP_FORWARD_TARGET_DEG = 90.0f;    // ...lie flat (looking straight down)
inline constexpr float SNAP_UPRIGHT_THRESHOLD_DEG = 5.0f;  // back under this...
inline constexpr float SNAP_UPRIGHT_TARGET_DEG = 0.0f;     // ...stand upright
inline constexpr float SNAP_EPSILON_DEG = 0.5f;
inline constexpr float SNAP_APPROACH_RATE = 0.15f;         // fraction of remaining delta per frame

// Camera framing
inline constexpr float CAMERA_FOV_DEG = 60.0f;
inline constexpr float CAMERA_START_DISTANCE = 5.0f;
inline constexpr float FRAME_PADDING = 1.5f;
inline constexpr float FRAME_FALLBACK_DISTANCE = 1.0f;
inline constexpr float FRAME_MIN_NEAR = 0.01f;
inline constexpr float FRAME_MIN_FAR = 2000.0f;

// Model intro played after every successful load
inline constexpr float INTRO_FADE_SECONDS = 1.5f;
inline constexpr float INTRO_SPIN_SECONDS = 3.0f;

// Remote-control actions
inline constexpr float SPIN_SECONDS = 2.0f;
inline constexpr float TURN_SECONDS = 1.25f;
inline constexpr float TURN_DEG = 90.0f;
inline constexpr float TILT_SECONDS = 1.0f;
inline constexpr float TILT_NEUTRAL_SECONDS = 0.9f;
inline constexpr float TILT_DEG = 25.0f;

// Control bar (bottom of the window, pixels)
inline constexpr float CONTROL_BUTTON_SIZE = 44.0f;
inline constexpr float CONTROL_BUTTON_GAP = 10.0f;
inline constexpr float CONTROL_BAR_MARGIN = 18.0f;

// Assets. Names coming from the command line are resolved against these folders.
inline const std::string MODELS_DIR = "assets/models";
inline const std::string TEXTURES_DIR = "assets/textures";
inline const std::string ENVIRONMENTS_DIR = "assets/environments";

inline const std::string DEFAULT_MODEL = "airwarp_body_01.glb";
inline const std::string DEFAULT_ENVIRONMENT = "park_music_stage_4k.hdr";

inline const std::string MODEL_VERT_SHADER = "assets/shaders/model.vert";
inline const std::string MODEL_FRAG_SHADER = "assets/shaders/model.frag";
inline const std::string UI_VERT_SHADER = "assets/shaders/ui.vert";
inline const std::string UI_FRAG_SHADER = "assets/shaders/ui.frag";

} // namespace cfg
