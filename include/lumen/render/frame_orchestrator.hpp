#pragma once

/// @file frame_orchestrator.hpp
/// @brief Frame protocol over the resource manager, shader cache, buffer pool,
/// state cache and batch optimizer
///
/// Idle -> begin_frame() -> InFrame -> end_frame() -> Idle
///
/// Inside a frame callers fetch programs and buffers, set state through the
/// state setters and add batches; execute_optimized_render() merges and
/// submits them. end_frame() measures the frame, refreshes memory figures,
/// raises PerformanceWarning for each exceeded ceiling and runs cache and
/// pool maintenance every `maintenance_interval` frames.

#include "fwd.hpp"
#include "events.hpp"
#include "config.hpp"
#include "buffer_pool.hpp"
#include "state_cache.hpp"
#include "batch.hpp"

#include <lumen/core/error.hpp>
#include <lumen/core/time.hpp>
#include <lumen/event/event_bus.hpp>
#include <lumen/gpu/device.hpp>
#include <lumen/resource/resource_manager.hpp>
#include <lumen/shader/shader_cache.hpp>

#include <cstdint>
#include <vector>

namespace lumen_render {

// =============================================================================
// Statistics
// =============================================================================

struct DrawCallStats {
    std::uint64_t total = 0;
    std::uint64_t batched = 0;     // Merged batches submitted
    std::uint64_t instanced = 0;
};

/// State setter calls by kind (requested, not necessarily issued)
struct StateChangeStats {
    std::uint64_t shader_switches = 0;
    std::uint64_t buffer_binds = 0;
    std::uint64_t texture_binds = 0;
    std::uint64_t other = 0;
};

/// Bytes by owner, refreshed at end of frame
struct MemoryStats {
    std::size_t buffers = 0;
    std::size_t shaders = 0;
    std::size_t textures = 0;
    std::size_t other = 0;
};

struct FrameStats {
    double frame_time_ms = 0.0;
    std::uint64_t draw_calls = 0;
    std::uint64_t state_changes = 0;   // Calls that reached the device
};

struct RenderStats {
    std::uint64_t frame_count = 0;
    DrawCallStats draw_calls;
    StateChangeStats state_changes;
    MemoryStats memory;
    FrameStats last_frame;
    std::uint64_t skipped_batches = 0;
};

struct DetailedStats {
    RenderStats render;
    lumen_shader::ShaderCacheStats shaders;
    BufferPoolStats buffers;
    lumen_resource::ResourceStats resources;
    BatchStats batches;
    StateCacheStats state;
};

// =============================================================================
// FrameOrchestrator
// =============================================================================

enum class FrameState : std::uint8_t {
    Idle,
    InFrame,
};

class FrameOrchestrator {
public:
    explicit FrameOrchestrator(lumen_gpu::IGraphicsDevice& device,
                               RenderConfig config = {},
                               const lumen_core::TimeSource& time = lumen_core::system_time());
    ~FrameOrchestrator();

    FrameOrchestrator(const FrameOrchestrator&) = delete;
    FrameOrchestrator& operator=(const FrameOrchestrator&) = delete;

    // =========================================================================
    // Frame protocol
    // =========================================================================

    /// Start a frame: reset per-frame counters and drop last frame's batches
    [[nodiscard]] lumen_core::Result<void> begin_frame();

    /// Finish the frame: statistics, threshold checks, periodic maintenance
    [[nodiscard]] lumen_core::Result<void> end_frame();

    [[nodiscard]] FrameState frame_state() const noexcept { return m_frame_state; }
    [[nodiscard]] bool in_frame() const noexcept { return m_frame_state == FrameState::InFrame; }

    // =========================================================================
    // Shaders and buffers
    // =========================================================================

    /// Program from the shader cache
    [[nodiscard]] lumen_shader::ProgramResult get_optimized_shader(const std::string& template_id,
                                                                   const std::string& variant = {});

    /// Queue compiles ahead of use; no-op unless shader warmup is enabled
    std::size_t warmup_shaders(const std::vector<lumen_shader::ShaderVariantKey>& keys);

    /// Buffer from the pool (a fresh allocation when pooling is disabled)
    [[nodiscard]] lumen_core::Result<PooledBuffer*> get_optimized_buffer(
        lumen_gpu::BufferType type,
        std::size_t size,
        lumen_gpu::BufferUsage usage = lumen_gpu::BufferUsage::Static);

    bool release_buffer(const PooledBuffer* buffer);

    // =========================================================================
    // State
    // =========================================================================

    void use_program(lumen_gpu::ProgramHandle program);
    void bind_buffer(lumen_gpu::BufferType target, lumen_gpu::BufferHandle buffer);
    void bind_texture(std::uint32_t unit, lumen_gpu::TextureHandle texture);
    void bind_vertex_array(lumen_gpu::VertexArrayHandle vertex_array);
    void set_viewport(const lumen_gpu::Viewport& viewport);
    void set_blend_enabled(bool enabled);
    void set_depth_test_enabled(bool enabled);
    void set_cull_face_enabled(bool enabled);

    // =========================================================================
    // Batches
    // =========================================================================

    /// Queue a batch, or render it at once when batch optimization is off
    [[nodiscard]] lumen_core::Result<void> add_batch(RenderBatch batch);

    /// Merge and submit this frame's batches; returns batches submitted
    [[nodiscard]] lumen_core::Result<std::size_t> execute_optimized_render();

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Poll resource GC and shader cache timers
    void update();

    /// Release every owned component; safe to call more than once
    void dispose();

    [[nodiscard]] bool is_disposed() const noexcept { return m_disposed; }

    void update_config(const FrameOrchestratorConfig& config);
    [[nodiscard]] const FrameOrchestratorConfig& config() const noexcept { return m_config; }

    // =========================================================================
    // Statistics and components
    // =========================================================================

    [[nodiscard]] const RenderStats& stats() const noexcept { return m_stats; }
    [[nodiscard]] DetailedStats detailed_stats() const;

    [[nodiscard]] lumen_event::EventBus& events() noexcept { return m_events; }
    [[nodiscard]] lumen_resource::ResourceManager& resources() noexcept { return m_resources; }
    [[nodiscard]] lumen_shader::ShaderCache& shaders() noexcept { return m_shaders; }
    [[nodiscard]] BufferPool& buffers() noexcept { return m_buffers; }
    [[nodiscard]] StateCache& state() noexcept { return m_state; }
    [[nodiscard]] BatchOptimizer& batches() noexcept { return m_batches; }

private:
    [[nodiscard]] lumen_core::Result<void> require_frame(const char* operation) const;

    void render_batch(const RenderBatch& batch);
    void count_state_change(bool issued);
    void update_memory_stats();
    void check_performance_thresholds();
    void warn(PerformanceMetric metric, double value, double threshold);
    void perform_maintenance();

    // Declared first so components can publish until they are destroyed
    lumen_event::EventBus m_events;

    lumen_gpu::IGraphicsDevice& m_device;
    const lumen_core::TimeSource& m_time;
    FrameOrchestratorConfig m_config;

    lumen_resource::ResourceManager m_resources;
    lumen_shader::ShaderCache m_shaders;
    BufferPool m_buffers;
    StateCache m_state;
    BatchOptimizer m_batches;

    FrameState m_frame_state = FrameState::Idle;
    lumen_core::TimePoint m_frame_start;
    FrameStats m_frame;
    RenderStats m_stats;
    bool m_disposed = false;
};

} // namespace lumen_render
