#pragma once

#include "Config.hpp"
#include "SnapRules.hpp"
#include "Types.hpp"
#include "ViewerState.hpp"

#include <stdexcept>

// Thrown by PointerCapture::release when the pointer is no longer captured.
class PointerCaptureError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Routes a pointer's events to the render surface while a drag is active.
class PointerCapture {
public:
    virtual ~PointerCapture() = default;

    virtual void capture(int pointerId) = 0;
    virtual void release(int pointerId) = 0;
    virtual bool isCaptured() const = 0;
};

enum class DragState {
    Idle,
    Dragging,
};

// Drag to rotate the model while the camera stays put.
//  - horizontal drag -> yaw, vertical drag -> pitch (clamped)
//  - releasing the drag evaluates the snap rules on the final pitch
class PointerRotationController {
public:
    PointerRotationController(ViewerState& state, ClampConfig clamp, SnapSettings snap,
                              PointerCapture& capture, float dragSpeed = cfg::DRAG_SPEED);

    // Returns false (and stays Idle) when no model is loaded.
    bool pointerDown(int pointerId, double x, double y);
    void pointerMove(double x, double y);
    void pointerUp(int pointerId);
    void pointerCancel(int pointerId);
    // Leaving the surface releases whichever pointer started the drag.
    void pointerLeave();

    DragState dragState() const { return m_drag; }

private:
    ViewerState& m_state;
    ClampConfig m_clamp;
    SnapSettings m_snap;
    PointerCapture& m_capture;
    float m_dragSpeed;

    DragState m_drag = DragState::Idle;
    int m_pointerId = 0;
    double m_lastX = 0.0;
    double m_lastY = 0.0;

    void endDrag();
    void releaseCapture(int pointerId);
};
