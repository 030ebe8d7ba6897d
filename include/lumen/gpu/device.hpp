#pragma once

/// @file device.hpp
/// @brief Graphics device boundary consumed by the resource and render layers
///
/// The device is a thin, stateless-looking facade over a driver. It does
/// no caching and no deduplication: every call reaches the driver. The
/// layers above decide when a call is worth making.
///
/// Object creation and uploads leave the current bindings untouched, so
/// a state mirror kept by the caller stays accurate across them.

#include "types.hpp"
#include "uniform.hpp"
#include <lumen/core/error.hpp>

#include <memory>
#include <string>

namespace lumen_gpu {

/// Driver-level primitives
class IGraphicsDevice {
public:
    virtual ~IGraphicsDevice() = default;

    /// Backend name for diagnostics
    [[nodiscard]] virtual const char* name() const = 0;

    /// Device limits
    [[nodiscard]] virtual const DeviceLimits& limits() const = 0;

    // =========================================================================
    // Textures
    // =========================================================================

    /// Create a 2D texture, optionally uploading tightly packed pixel data
    [[nodiscard]] virtual lumen_core::Result<TextureHandle> create_texture(
        const TextureDesc& desc, const void* data) = 0;

    /// Upload pixel data into a sub-region
    [[nodiscard]] virtual lumen_core::Result<void> update_texture(
        TextureHandle handle, const TextureRegion& region, const void* data) = 0;

    virtual void destroy_texture(TextureHandle handle) = 0;

    // =========================================================================
    // Framebuffers
    // =========================================================================

    /// Create a framebuffer over existing attachment textures
    [[nodiscard]] virtual lumen_core::Result<FramebufferHandle> create_framebuffer(
        const FramebufferDesc& desc) = 0;

    virtual void destroy_framebuffer(FramebufferHandle handle) = 0;

    // =========================================================================
    // Buffers
    // =========================================================================

    [[nodiscard]] virtual lumen_core::Result<BufferHandle> create_buffer(
        const BufferDesc& desc, const void* data) = 0;

    [[nodiscard]] virtual lumen_core::Result<void> write_buffer(
        BufferHandle handle, std::size_t offset, const void* data, std::size_t size) = 0;

    virtual void destroy_buffer(BufferHandle handle) = 0;

    /// False once the buffer was destroyed or lost with its context
    [[nodiscard]] virtual bool is_buffer_valid(BufferHandle handle) const = 0;

    // =========================================================================
    // Vertex arrays
    // =========================================================================

    [[nodiscard]] virtual lumen_core::Result<VertexArrayHandle> create_vertex_array() = 0;

    virtual void destroy_vertex_array(VertexArrayHandle handle) = 0;

    // =========================================================================
    // Shaders and programs
    // =========================================================================

    /// Compile one stage; the error carries the stage, source and info log
    [[nodiscard]] virtual lumen_core::Result<ShaderStageHandle> compile_shader_stage(
        ShaderStage stage, const std::string& source) = 0;

    virtual void destroy_shader_stage(ShaderStageHandle handle) = 0;

    /// Link two compiled stages; stages may be destroyed afterwards
    [[nodiscard]] virtual lumen_core::Result<ProgramHandle> link_program(
        ShaderStageHandle vertex, ShaderStageHandle fragment) = 0;

    virtual void destroy_program(ProgramHandle handle) = 0;

    /// Active attribute and uniform locations
    [[nodiscard]] virtual ProgramReflection reflect_program(ProgramHandle handle) const = 0;

    // =========================================================================
    // Binding and state
    // =========================================================================

    virtual void use_program(ProgramHandle handle) = 0;
    virtual void bind_buffer(BufferType target, BufferHandle handle) = 0;
    virtual void bind_vertex_array(VertexArrayHandle handle) = 0;
    virtual void active_texture(std::uint32_t unit) = 0;
    virtual void bind_texture(TextureHandle handle) = 0;
    virtual void set_viewport(const Viewport& viewport) = 0;
    virtual void set_capability(Capability cap, bool enabled) = 0;

    /// Set a uniform on the program in use
    virtual void set_uniform(std::int32_t location, const UniformValue& value) = 0;

    // =========================================================================
    // Drawing
    // =========================================================================

    virtual void draw(const DrawCommand& command) = 0;
};

// =============================================================================
// Factories
// =============================================================================

/// Headless device with no driver behind it
[[nodiscard]] std::unique_ptr<IGraphicsDevice> create_null_device();

/// OpenGL 3.3 core device; a context must be current on the calling thread
[[nodiscard]] lumen_core::Result<std::unique_ptr<IGraphicsDevice>> create_opengl_device();

} // namespace lumen_gpu
