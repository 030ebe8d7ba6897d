/// @file frame_orchestrator.cpp
/// @brief FrameOrchestrator implementation

#include <lumen/render/frame_orchestrator.hpp>
#include <lumen/core/log.hpp>
#include <lumen/shader/program.hpp>

namespace lumen_render {

using lumen_core::Err;
using lumen_core::FrameError;
using lumen_core::Ok;
using lumen_core::Result;

FrameOrchestrator::FrameOrchestrator(lumen_gpu::IGraphicsDevice& device,
                                     RenderConfig config,
                                     const lumen_core::TimeSource& time)
    : m_device(device)
    , m_time(time)
    , m_config(config.frame)
    , m_resources(device, m_events, config.resources, time)
    , m_shaders(device, m_events, config.shaders, lumen_shader::ShaderLibrary::with_builtins(), time)
    , m_buffers(device)
    , m_state(device, m_events)
    , m_frame_start(time.now()) {
    if (m_config.maintenance_interval == 0) {
        m_config.maintenance_interval = 1;
    }
    m_buffers.set_reuse_enabled(m_config.enable_buffer_pooling);
    lumen_core::render_logger()->info("Frame orchestrator ready on '{}' device", device.name());
}

FrameOrchestrator::~FrameOrchestrator() {
    dispose();
}

// =============================================================================
// Frame protocol
// =============================================================================

Result<void> FrameOrchestrator::begin_frame() {
    if (m_disposed) {
        return Err(FrameError::invalid_state("orchestrator is disposed"));
    }
    if (m_frame_state == FrameState::InFrame) {
        return Err(FrameError::invalid_state("begin_frame() called twice without end_frame()"));
    }

    m_frame_start = m_time.now();
    ++m_stats.frame_count;
    m_frame = FrameStats{};
    m_batches.clear();
    m_state.reset_state_change_count();
    m_frame_state = FrameState::InFrame;
    return Ok();
}

Result<void> FrameOrchestrator::end_frame() {
    auto ready = require_frame("end_frame");
    if (!ready) {
        return ready;
    }

    m_frame.frame_time_ms = lumen_core::to_millis(m_time.now() - m_frame_start);
    m_stats.last_frame = m_frame;

    update_memory_stats();
    check_performance_thresholds();

    if (m_stats.frame_count % m_config.maintenance_interval == 0) {
        perform_maintenance();
    }

    m_frame_state = FrameState::Idle;
    return Ok();
}

Result<void> FrameOrchestrator::require_frame(const char* operation) const {
    if (m_frame_state != FrameState::InFrame) {
        return Err(FrameError::invalid_state(std::string(operation) + "() outside begin_frame()/end_frame()"));
    }
    return Ok();
}

// =============================================================================
// Shaders and buffers
// =============================================================================

lumen_shader::ProgramResult FrameOrchestrator::get_optimized_shader(const std::string& template_id,
                                                                    const std::string& variant) {
    return m_shaders.get_program(template_id, variant);
}

std::size_t FrameOrchestrator::warmup_shaders(const std::vector<lumen_shader::ShaderVariantKey>& keys) {
    if (!m_config.enable_shader_warmup) {
        return 0;
    }
    const auto queued = m_shaders.warmup(keys);
    lumen_core::render_logger()->debug("Queued {} shader(s) for warmup", queued);
    return queued;
}

Result<PooledBuffer*> FrameOrchestrator::get_optimized_buffer(lumen_gpu::BufferType type,
                                                             std::size_t size,
                                                             lumen_gpu::BufferUsage usage) {
    auto buffer = m_buffers.acquire(type, size, usage);
    if (!buffer) {
        return buffer;
    }
    const PooledBuffer& acquired = **buffer;
    m_events.publish(BufferAllocated{acquired.handle, size, type, acquired.acquisitions > 1});
    return buffer;
}

bool FrameOrchestrator::release_buffer(const PooledBuffer* buffer) {
    return m_buffers.release(buffer);
}

// =============================================================================
// State
// =============================================================================

void FrameOrchestrator::use_program(lumen_gpu::ProgramHandle program) {
    ++m_stats.state_changes.shader_switches;
    if (m_config.enable_state_tracking) {
        count_state_change(m_state.use_program(program));
    } else {
        m_device.use_program(program);
        count_state_change(true);
    }
}

void FrameOrchestrator::bind_buffer(lumen_gpu::BufferType target, lumen_gpu::BufferHandle buffer) {
    ++m_stats.state_changes.buffer_binds;
    if (m_config.enable_state_tracking) {
        count_state_change(m_state.bind_buffer(target, buffer));
    } else {
        m_device.bind_buffer(target, buffer);
        count_state_change(true);
    }
}

void FrameOrchestrator::bind_texture(std::uint32_t unit, lumen_gpu::TextureHandle texture) {
    ++m_stats.state_changes.texture_binds;
    if (m_config.enable_state_tracking) {
        count_state_change(m_state.bind_texture(unit, texture));
    } else {
        m_device.active_texture(unit);
        m_device.bind_texture(texture);
        count_state_change(true);
    }
}

void FrameOrchestrator::bind_vertex_array(lumen_gpu::VertexArrayHandle vertex_array) {
    ++m_stats.state_changes.other;
    if (m_config.enable_state_tracking) {
        count_state_change(m_state.bind_vertex_array(vertex_array));
    } else {
        m_device.bind_vertex_array(vertex_array);
        count_state_change(true);
    }
}

void FrameOrchestrator::set_viewport(const lumen_gpu::Viewport& viewport) {
    ++m_stats.state_changes.other;
    if (m_config.enable_state_tracking) {
        count_state_change(m_state.set_viewport(viewport));
    } else {
        m_device.set_viewport(viewport);
        count_state_change(true);
    }
}

void FrameOrchestrator::set_blend_enabled(bool enabled) {
    ++m_stats.state_changes.other;
    if (m_config.enable_state_tracking) {
        count_state_change(m_state.set_blend_enabled(enabled));
    } else {
        m_device.set_capability(lumen_gpu::Capability::Blend, enabled);
        count_state_change(true);
    }
}

void FrameOrchestrator::set_depth_test_enabled(bool enabled) {
    ++m_stats.state_changes.other;
    if (m_config.enable_state_tracking) {
        count_state_change(m_state.set_depth_test_enabled(enabled));
    } else {
        m_device.set_capability(lumen_gpu::Capability::DepthTest, enabled);
        count_state_change(true);
    }
}

void FrameOrchestrator::set_cull_face_enabled(bool enabled) {
    ++m_stats.state_changes.other;
    if (m_config.enable_state_tracking) {
        count_state_change(m_state.set_cull_face_enabled(enabled));
    } else {
        m_device.set_capability(lumen_gpu::Capability::CullFace, enabled);
        count_state_change(true);
    }
}

void FrameOrchestrator::count_state_change(bool issued) {
    if (issued) {
        ++m_frame.state_changes;
    }
}

// =============================================================================
// Batches
// =============================================================================

Result<void> FrameOrchestrator::add_batch(RenderBatch batch) {
    auto ready = require_frame("add_batch");
    if (!ready) {
        return ready;
    }

    if (!m_config.enable_batch_optimization) {
        render_batch(batch);
        return Ok();
    }
    m_batches.add_batch(std::move(batch));
    return Ok();
}

Result<std::size_t> FrameOrchestrator::execute_optimized_render() {
    auto ready = require_frame("execute_optimized_render");
    if (!ready) {
        return Err<std::size_t>(ready.error());
    }
    if (!m_config.enable_batch_optimization) {
        return Ok(std::size_t{0});
    }

    const std::size_t before = m_batches.size();
    const auto merged = m_batches.merge_batches();
    for (const auto& batch : merged) {
        render_batch(batch);
    }
    m_batches.clear();

    m_stats.draw_calls.batched += merged.size();
    lumen_core::render_logger()->trace("Submitted {} batch(es) merged from {}", merged.size(), before);
    m_events.publish(BatchOptimized{before, merged.size()});
    return Ok(merged.size());
}

void FrameOrchestrator::render_batch(const RenderBatch& batch) {
    if (!batch.shader || !batch.shader->is_valid()) {
        ++m_stats.skipped_batches;
        lumen_core::render_logger()->error("Skipping batch '{}': its program is no longer valid", batch.id);
        return;
    }

    const auto& program = *batch.shader;
    use_program(program.handle());
    bind_vertex_array(batch.vertex_array);
    for (const auto& [unit, texture] : batch.textures) {
        bind_texture(unit, texture);
    }

    // Batch uniforms override the program defaults
    auto uniforms = program.default_uniforms();
    for (const auto& [name, value] : batch.uniforms) {
        uniforms[name] = value;
    }
    for (const auto& [name, value] : uniforms) {
        const auto location = program.uniform_location(name);
        if (location >= 0) {
            m_device.set_uniform(location, value);
        }
    }

    for (const auto& call : batch.draw_calls) {
        lumen_gpu::DrawCommand command;
        command.mode = call.mode;
        command.count = call.count;
        command.offset = call.offset;
        command.instances = call.instances;
        command.indexed = call.indexed;
        command.index_format = call.index_format;
        m_device.draw(command);

        ++m_stats.draw_calls.total;
        ++m_frame.draw_calls;
        if (call.is_instanced()) {
            ++m_stats.draw_calls.instanced;
        }
    }
}

// =============================================================================
// Frame statistics
// =============================================================================

void FrameOrchestrator::update_memory_stats() {
    const auto usage = m_resources.memory_usage();
    m_stats.memory.buffers = m_buffers.stats().total_bytes + usage.buffers;
    m_stats.memory.shaders = m_shaders.memory_usage();
    m_stats.memory.textures = usage.textures;
    m_stats.memory.other = usage.other;
}

void FrameOrchestrator::check_performance_thresholds() {
    if (m_frame.frame_time_ms > m_config.frame_time_budget_ms) {
        warn(PerformanceMetric::FrameTime, m_frame.frame_time_ms, m_config.frame_time_budget_ms);
    }
    if (m_frame.state_changes > m_config.max_state_changes) {
        warn(PerformanceMetric::StateChanges, static_cast<double>(m_frame.state_changes),
             static_cast<double>(m_config.max_state_changes));
    }
    if (m_frame.draw_calls > m_config.max_draw_calls) {
        warn(PerformanceMetric::DrawCalls, static_cast<double>(m_frame.draw_calls),
             static_cast<double>(m_config.max_draw_calls));
    }
}

void FrameOrchestrator::warn(PerformanceMetric metric, double value, double threshold) {
    lumen_core::render_logger()->warn("Frame {}: {} {:.2f} exceeds {:.2f}",
        m_stats.frame_count, performance_metric_name(metric), value, threshold);
    m_events.publish(PerformanceWarning{metric, value, threshold});
}

void FrameOrchestrator::perform_maintenance() {
    const auto freed = m_shaders.cleanup_cache(false);
    const auto dropped = m_buffers.cleanup();
    lumen_core::render_logger()->debug("Maintenance at frame {}: {} shader bytes freed, {} buffer(s) dropped",
                                       m_stats.frame_count, freed, dropped);
}

DetailedStats FrameOrchestrator::detailed_stats() const {
    DetailedStats stats;
    stats.render = m_stats;
    stats.shaders = m_shaders.stats();
    stats.buffers = m_buffers.stats();
    stats.resources = m_resources.resource_stats();
    stats.batches = m_batches.stats();
    stats.state = m_state.stats();
    return stats;
}

// =============================================================================
// Lifecycle
// =============================================================================

void FrameOrchestrator::update() {
    if (m_disposed) {
        return;
    }
    m_resources.update();
    m_shaders.update();
}

void FrameOrchestrator::update_config(const FrameOrchestratorConfig& config) {
    if (config.enable_state_tracking && !m_config.enable_state_tracking) {
        // The device was driven directly while tracking was off
        m_state.invalidate();
    }
    m_config = config;
    if (m_config.maintenance_interval == 0) {
        m_config.maintenance_interval = 1;
    }
    m_buffers.set_reuse_enabled(m_config.enable_buffer_pooling);
}

void FrameOrchestrator::dispose() {
    if (m_disposed) {
        return;
    }
    m_disposed = true;
    m_frame_state = FrameState::Idle;

    m_batches.clear();
    m_buffers.clear();
    m_shaders.dispose();
    m_resources.dispose();
    lumen_core::render_logger()->info("Frame orchestrator disposed after {} frame(s)", m_stats.frame_count);
}

} // namespace lumen_render
