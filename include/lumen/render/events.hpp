#pragma once

/// @file events.hpp
/// @brief Events published by the render layer

#include "fwd.hpp"
#include <lumen/gpu/types.hpp>

#include <cstddef>
#include <cstdint>

namespace lumen_render {

/// Tracked device state field
enum class StateKind : std::uint8_t {
    Program,
    Buffer,
    VertexArray,
    TextureUnit,
    Texture,
    Viewport,
    Blend,
    DepthTest,
    CullFace,
};

[[nodiscard]] const char* state_kind_name(StateKind kind);

/// Metric checked against its ceiling at end of frame
enum class PerformanceMetric : std::uint8_t {
    FrameTime,
    StateChanges,
    DrawCalls,
};

[[nodiscard]] const char* performance_metric_name(PerformanceMetric metric);

/// A state setter reached the device
struct StateChanged {
    StateKind kind = StateKind::Program;
    std::uint64_t change_count = 0;   // Changes since the last reset
};

/// Batches merged for submission
struct BatchOptimized {
    std::size_t before = 0;
    std::size_t after = 0;
};

/// A frame metric exceeded its ceiling
struct PerformanceWarning {
    PerformanceMetric metric = PerformanceMetric::FrameTime;
    double value = 0.0;
    double threshold = 0.0;
};

/// A buffer was handed out to a caller
struct BufferAllocated {
    lumen_gpu::BufferHandle handle;
    std::size_t size = 0;
    lumen_gpu::BufferType type = lumen_gpu::BufferType::Vertex;
    bool reused = false;
};

} // namespace lumen_render
