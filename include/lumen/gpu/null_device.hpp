#pragma once

/// @file null_device.hpp
/// @brief Headless graphics device for tests and tooling
///
/// Keeps CPU-side records of every object so callers can inspect what
/// would have reached a driver:
/// - Per-call counters for every primitive
/// - Shader sources retained per stage, reflection parsed from them
/// - Compilation fails for sources containing `#error`, linking fails
///   when either stage contains `LINK_FAIL`
/// - Allocation failure and buffer loss can be injected

#include "device.hpp"

#include <array>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lumen_gpu {

/// Counted device entry points
enum class DeviceCall : std::uint8_t {
    CreateTexture,
    UpdateTexture,
    DestroyTexture,
    CreateFramebuffer,
    DestroyFramebuffer,
    CreateBuffer,
    WriteBuffer,
    DestroyBuffer,
    CreateVertexArray,
    DestroyVertexArray,
    CompileShader,
    DestroyShader,
    LinkProgram,
    DestroyProgram,
    UseProgram,
    BindBuffer,
    BindVertexArray,
    ActiveTexture,
    BindTexture,
    SetViewport,
    SetCapability,
    SetUniform,
    Draw,
    Count
};

class NullDevice : public IGraphicsDevice {
public:
    NullDevice();
    explicit NullDevice(const DeviceLimits& limits);
    ~NullDevice() override = default;

    // IGraphicsDevice interface
    [[nodiscard]] const char* name() const override { return "null"; }
    [[nodiscard]] const DeviceLimits& limits() const override { return m_limits; }

    lumen_core::Result<TextureHandle> create_texture(const TextureDesc& desc, const void* data) override;
    lumen_core::Result<void> update_texture(TextureHandle handle, const TextureRegion& region,
                                            const void* data) override;
    void destroy_texture(TextureHandle handle) override;

    lumen_core::Result<FramebufferHandle> create_framebuffer(const FramebufferDesc& desc) override;
    void destroy_framebuffer(FramebufferHandle handle) override;

    lumen_core::Result<BufferHandle> create_buffer(const BufferDesc& desc, const void* data) override;
    lumen_core::Result<void> write_buffer(BufferHandle handle, std::size_t offset,
                                          const void* data, std::size_t size) override;
    void destroy_buffer(BufferHandle handle) override;
    [[nodiscard]] bool is_buffer_valid(BufferHandle handle) const override;

    lumen_core::Result<VertexArrayHandle> create_vertex_array() override;
    void destroy_vertex_array(VertexArrayHandle handle) override;

    lumen_core::Result<ShaderStageHandle> compile_shader_stage(ShaderStage stage,
                                                               const std::string& source) override;
    void destroy_shader_stage(ShaderStageHandle handle) override;
    lumen_core::Result<ProgramHandle> link_program(ShaderStageHandle vertex,
                                                   ShaderStageHandle fragment) override;
    void destroy_program(ProgramHandle handle) override;
    [[nodiscard]] ProgramReflection reflect_program(ProgramHandle handle) const override;

    void use_program(ProgramHandle handle) override;
    void bind_buffer(BufferType target, BufferHandle handle) override;
    void bind_vertex_array(VertexArrayHandle handle) override;
    void active_texture(std::uint32_t unit) override;
    void bind_texture(TextureHandle handle) override;
    void set_viewport(const Viewport& viewport) override;
    void set_capability(Capability cap, bool enabled) override;
    void set_uniform(std::int32_t location, const UniformValue& value) override;

    void draw(const DrawCommand& command) override;

    // =========================================================================
    // Inspection
    // =========================================================================

    [[nodiscard]] std::uint64_t call_count(DeviceCall call) const noexcept {
        return m_calls[static_cast<std::size_t>(call)];
    }

    void reset_call_counts() noexcept { m_calls.fill(0); }

    [[nodiscard]] std::size_t live_textures() const noexcept { return m_textures.size(); }
    [[nodiscard]] std::size_t live_framebuffers() const noexcept { return m_framebuffers.size(); }
    [[nodiscard]] std::size_t live_buffers() const noexcept { return m_buffers.size(); }
    [[nodiscard]] std::size_t live_programs() const noexcept { return m_programs.size(); }
    [[nodiscard]] std::size_t live_shader_stages() const noexcept { return m_stages.size(); }

    /// Bytes held by live textures and buffers
    [[nodiscard]] std::size_t allocated_bytes() const noexcept;

    /// Source most recently handed to compile_shader_stage for a stage
    [[nodiscard]] const std::string& last_source(ShaderStage stage) const {
        return m_last_source[static_cast<std::size_t>(stage)];
    }

    [[nodiscard]] ProgramHandle current_program() const noexcept { return m_current_program; }
    [[nodiscard]] std::uint32_t current_texture_unit() const noexcept { return m_active_unit; }
    [[nodiscard]] const Viewport& current_viewport() const noexcept { return m_viewport; }
    [[nodiscard]] bool capability_enabled(Capability cap) const;

    /// Last value written to a uniform location
    [[nodiscard]] std::optional<UniformValue> uniform_value(std::int32_t location) const;

    /// Every draw submitted, in order
    [[nodiscard]] const std::vector<DrawCommand>& draws() const noexcept { return m_draws; }

    // =========================================================================
    // Fault injection
    // =========================================================================

    /// Make the next create_* call fail
    void fail_next_allocation() noexcept { m_fail_next_allocation = true; }

    /// Drop a buffer as if its context was lost (handle stays known but invalid)
    void lose_buffer(BufferHandle handle);

private:
    struct TextureRecord {
        TextureDesc desc;
        std::vector<std::uint8_t> pixels;
    };

    struct BufferRecord {
        BufferDesc desc;
        std::vector<std::uint8_t> data;
        bool lost = false;
    };

    struct StageRecord {
        ShaderStage stage;
        std::string source;
    };

    void record(DeviceCall call) noexcept { ++m_calls[static_cast<std::size_t>(call)]; }
    bool consume_allocation_failure() noexcept;

    DeviceLimits m_limits;
    std::uint64_t m_next_handle = 1;
    std::array<std::uint64_t, static_cast<std::size_t>(DeviceCall::Count)> m_calls{};

    std::unordered_map<std::uint64_t, TextureRecord> m_textures;
    std::unordered_map<std::uint64_t, FramebufferDesc> m_framebuffers;
    std::unordered_map<std::uint64_t, BufferRecord> m_buffers;
    std::unordered_map<std::uint64_t, bool> m_vertex_arrays;
    std::unordered_map<std::uint64_t, StageRecord> m_stages;
    std::unordered_map<std::uint64_t, ProgramReflection> m_programs;

    std::array<std::string, 2> m_last_source;
    ProgramHandle m_current_program;
    std::uint32_t m_active_unit = 0;
    Viewport m_viewport;
    std::map<Capability, bool> m_capabilities;
    std::map<std::int32_t, UniformValue> m_uniforms;
    std::vector<DrawCommand> m_draws;
    bool m_fail_next_allocation = false;
};

} // namespace lumen_gpu
