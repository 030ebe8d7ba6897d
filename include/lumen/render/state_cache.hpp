#pragma once

/// @file state_cache.hpp
/// @brief Device state mirror that drops redundant state calls
///
/// Every field starts unknown, so the first call for it always reaches the
/// device. Call invalidate() after code outside the cache touched the device.

#include "fwd.hpp"
#include "events.hpp"
#include <lumen/event/event_bus.hpp>
#include <lumen/gpu/device.hpp>

#include <cstdint>
#include <map>
#include <optional>

namespace lumen_render {

/// Last state the cache pushed to the device
struct DeviceState {
    std::optional<lumen_gpu::ProgramHandle> program;
    std::optional<lumen_gpu::BufferHandle> array_buffer;
    std::optional<lumen_gpu::BufferHandle> element_buffer;
    std::optional<lumen_gpu::VertexArrayHandle> vertex_array;
    std::optional<std::uint32_t> active_unit;
    std::map<std::uint32_t, lumen_gpu::TextureHandle> textures;
    std::optional<lumen_gpu::Viewport> viewport;
    std::optional<bool> blend;
    std::optional<bool> depth_test;
    std::optional<bool> cull_face;
};

/// Issued versus suppressed calls
struct StateCacheStats {
    std::uint64_t issued = 0;
    std::uint64_t skipped = 0;
    std::uint64_t state_changes = 0;   // Since the last reset
};

class StateCache {
public:
    StateCache(lumen_gpu::IGraphicsDevice& device, lumen_event::EventBus& events)
        : m_device(device), m_events(events) {}

    // Each setter returns true when the call reached the device

    bool use_program(lumen_gpu::ProgramHandle program);

    /// Uniform buffers are passed through untracked
    bool bind_buffer(lumen_gpu::BufferType target, lumen_gpu::BufferHandle buffer);

    bool bind_vertex_array(lumen_gpu::VertexArrayHandle vertex_array);
    bool active_texture(std::uint32_t unit);

    /// Select `unit` if needed, then bind the texture to it
    bool bind_texture(std::uint32_t unit, lumen_gpu::TextureHandle texture);

    bool set_viewport(const lumen_gpu::Viewport& viewport);
    bool set_blend_enabled(bool enabled);
    bool set_depth_test_enabled(bool enabled);
    bool set_cull_face_enabled(bool enabled);

    /// Return the change counter and zero it
    std::uint64_t reset_state_change_count() noexcept;

    [[nodiscard]] std::uint64_t state_change_count() const noexcept { return m_state_changes; }

    /// Forget everything; the next call for each field reaches the device
    void invalidate();

    [[nodiscard]] const DeviceState& state() const noexcept { return m_state; }
    [[nodiscard]] StateCacheStats stats() const noexcept;

private:
    bool set_capability(lumen_gpu::Capability cap, std::optional<bool>& current, bool enabled, StateKind kind);
    void changed(StateKind kind);

    bool skip() noexcept {
        ++m_skipped;
        return false;
    }

    lumen_gpu::IGraphicsDevice& m_device;
    lumen_event::EventBus& m_events;
    DeviceState m_state;
    std::uint64_t m_state_changes = 0;
    std::uint64_t m_issued = 0;
    std::uint64_t m_skipped = 0;
};

} // namespace lumen_render
