/// @file events.cpp
/// @brief Render event names

#include <lumen/render/events.hpp>

namespace lumen_render {

const char* state_kind_name(StateKind kind) {
    switch (kind) {
        case StateKind::Program: return "program";
        case StateKind::Buffer: return "buffer";
        case StateKind::VertexArray: return "vertex_array";
        case StateKind::TextureUnit: return "texture_unit";
        case StateKind::Texture: return "texture";
        case StateKind::Viewport: return "viewport";
        case StateKind::Blend: return "blend";
        case StateKind::DepthTest: return "depth_test";
        case StateKind::CullFace: return "cull_face";
        default: return "unknown";
    }
}

const char* performance_metric_name(PerformanceMetric metric) {
    switch (metric) {
        case PerformanceMetric::FrameTime: return "frame_time";
        case PerformanceMetric::StateChanges: return "state_changes";
        case PerformanceMetric::DrawCalls: return "draw_calls";
        default: return "unknown";
    }
}

} // namespace lumen_render
