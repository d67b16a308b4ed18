#include "PointerRotation.hpp"

#include <utility>

PointerRotationController::PointerRotationController(ViewerState& state, ClampConfig clamp, SnapSettings snap,
                                                     PointerCapture& capture, float dragSpeed)
    : m_state(state), m_clamp(clamp), m_snap(std::move(snap)), m_capture(capture), m_dragSpeed(dragSpeed) {}

bool PointerRotationController::pointerDown(int pointerId, double x, double y) {
    if (!m_state.hasModel) return false;

    m_drag = DragState::Dragging;
    // 用户开始拖动时停止吸附
    m_state.snap.active = false;
    m_pointerId = pointerId;
    m_lastX = x;
    m_lastY = y;
    m_capture.capture(pointerId);
    return true;
}

void PointerRotationController::pointerMove(double x, double y) {
    if (m_drag != DragState::Dragging || !m_state.hasModel) return;

    double dx = x - m_lastX;
    double dy = y - m_lastY;

    Orientation& o = m_state.orientation;
    o.yaw += (float)dx * m_dragSpeed;
    o.pitch += (float)dy * m_dragSpeed;
    o.pitch = m_clamp.clampPitch(o.pitch);

    m_lastX = x;
    m_lastY = y;
}

// A second pointer lifting doesn't end the drag owned by the first.
void PointerRotationController::pointerUp(int pointerId) {
    if (m_drag == DragState::Dragging && pointerId != m_pointerId) return;
    endDrag();
    releaseCapture(pointerId);
}

void PointerRotationController::pointerCancel(int pointerId) {
    if (m_drag == DragState::Dragging && pointerId != m_pointerId) return;
    endDrag();
    releaseCapture(pointerId);
}

void PointerRotationController::pointerLeave() {
    if (m_drag != DragState::Dragging) return;
    endDrag();
    releaseCapture(m_pointerId);
}

void PointerRotationController::endDrag() {
    if (m_drag != DragState::Dragging) return;
    m_drag = DragState::Idle;

    if (!m_state.hasModel) return;
    m_state.snap = snap::evaluate(axisValue(m_state.orientation, m_snap.axis), m_snap);
}

// Best effort: the pointer may already have lost capture (e.g. after leaving
// the surface), in which case there is nothing left to release.
void PointerRotationController::releaseCapture(int pointerId) {
    try {
        m_capture.release(pointerId);
    } catch (const PointerCaptureError&) {
    }
}
