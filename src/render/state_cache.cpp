/// @file state_cache.cpp
/// @brief StateCache implementation

#include <lumen/render/state_cache.hpp>
#include <lumen/core/log.hpp>

namespace lumen_render {

bool StateCache::use_program(lumen_gpu::ProgramHandle program) {
    if (m_state.program == program) {
        return skip();
    }
    m_device.use_program(program);
    m_state.program = program;
    changed(StateKind::Program);
    return true;
}

bool StateCache::bind_buffer(lumen_gpu::BufferType target, lumen_gpu::BufferHandle buffer) {
    std::optional<lumen_gpu::BufferHandle>* slot = nullptr;
    switch (target) {
        case lumen_gpu::BufferType::Vertex: slot = &m_state.array_buffer; break;
        case lumen_gpu::BufferType::Index: slot = &m_state.element_buffer; break;
        case lumen_gpu::BufferType::Uniform: break;
    }

    if (!slot) {
        m_device.bind_buffer(target, buffer);
        ++m_issued;
        return true;
    }
    if (*slot == buffer) {
        return skip();
    }
    m_device.bind_buffer(target, buffer);
    *slot = buffer;
    changed(StateKind::Buffer);
    return true;
}

bool StateCache::bind_vertex_array(lumen_gpu::VertexArrayHandle vertex_array) {
    if (m_state.vertex_array == vertex_array) {
        return skip();
    }
    m_device.bind_vertex_array(vertex_array);
    m_state.vertex_array = vertex_array;
    // The element buffer binding belongs to the vertex array
    m_state.element_buffer.reset();
    changed(StateKind::VertexArray);
    return true;
}

bool StateCache::active_texture(std::uint32_t unit) {
    if (m_state.active_unit == unit) {
        return skip();
    }
    m_device.active_texture(unit);
    m_state.active_unit = unit;
    changed(StateKind::TextureUnit);
    return true;
}

bool StateCache::bind_texture(std::uint32_t unit, lumen_gpu::TextureHandle texture) {
    auto bound = m_state.textures.find(unit);
    if (bound != m_state.textures.end() && bound->second == texture) {
        return skip();
    }
    active_texture(unit);
    m_device.bind_texture(texture);
    m_state.textures[unit] = texture;
    changed(StateKind::Texture);
    return true;
}

bool StateCache::set_viewport(const lumen_gpu::Viewport& viewport) {
    if (m_state.viewport == viewport) {
        return skip();
    }
    m_device.set_viewport(viewport);
    m_state.viewport = viewport;
    changed(StateKind::Viewport);
    return true;
}

bool StateCache::set_blend_enabled(bool enabled) {
    return set_capability(lumen_gpu::Capability::Blend, m_state.blend, enabled, StateKind::Blend);
}

bool StateCache::set_depth_test_enabled(bool enabled) {
    return set_capability(lumen_gpu::Capability::DepthTest, m_state.depth_test, enabled, StateKind::DepthTest);
}

bool StateCache::set_cull_face_enabled(bool enabled) {
    return set_capability(lumen_gpu::Capability::CullFace, m_state.cull_face, enabled, StateKind::CullFace);
}

std::uint64_t StateCache::reset_state_change_count() noexcept {
    const auto count = m_state_changes;
    m_state_changes = 0;
    return count;
}

void StateCache::invalidate() {
    m_state = DeviceState{};
    lumen_core::render_logger()->trace("State cache invalidated");
}

StateCacheStats StateCache::stats() const noexcept {
    return StateCacheStats{m_issued, m_skipped, m_state_changes};
}

bool StateCache::set_capability(lumen_gpu::Capability cap, std::optional<bool>& current,
                                bool enabled, StateKind kind) {
    if (current == enabled) {
        return skip();
    }
    m_device.set_capability(cap, enabled);
    current = enabled;
    changed(kind);
    return true;
}

void StateCache::changed(StateKind kind) {
    ++m_issued;
    ++m_state_changes;
    m_events.publish(StateChanged{kind, m_state_changes});
}

} // namespace lumen_render
