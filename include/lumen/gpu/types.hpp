#pragma once

/// @file types.hpp
/// @brief Handles and descriptors for the graphics device boundary

#include "fwd.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace lumen_gpu {

// =============================================================================
// Handles
// =============================================================================

/// Opaque handle for device objects (0 is never a valid id)
template<typename Tag>
struct GpuHandle {
    std::uint64_t id = 0;

    [[nodiscard]] bool is_valid() const noexcept { return id != 0; }
    [[nodiscard]] static GpuHandle invalid() noexcept { return GpuHandle{0}; }

    bool operator==(const GpuHandle& other) const noexcept = default;
    auto operator<=>(const GpuHandle& other) const noexcept = default;
};

struct BufferTag {};
struct TextureTag {};
struct FramebufferTag {};
struct VertexArrayTag {};
struct ShaderStageTag {};
struct ProgramTag {};

using BufferHandle = GpuHandle<BufferTag>;
using TextureHandle = GpuHandle<TextureTag>;
using FramebufferHandle = GpuHandle<FramebufferTag>;
using VertexArrayHandle = GpuHandle<VertexArrayTag>;
using ShaderStageHandle = GpuHandle<ShaderStageTag>;
using ProgramHandle = GpuHandle<ProgramTag>;

// =============================================================================
// Textures
// =============================================================================

/// Texture pixel format
enum class TextureFormat : std::uint8_t {
    R8,
    Rg8,
    Rgb8,
    Rgba8,
    Rgba4,
    Rgb565,
    Rgba16F,
    Rgba32F,
    Depth16,
    Depth24,
    Depth24Stencil8,
    Depth32F,
};

/// Bytes per pixel of a format
[[nodiscard]] constexpr std::uint32_t bytes_per_pixel(TextureFormat format) noexcept {
    switch (format) {
        case TextureFormat::R8: return 1;
        case TextureFormat::Rg8: return 2;
        case TextureFormat::Rgb8: return 3;
        case TextureFormat::Rgba8: return 4;
        case TextureFormat::Rgba4: return 2;
        case TextureFormat::Rgb565: return 2;
        case TextureFormat::Rgba16F: return 8;
        case TextureFormat::Rgba32F: return 16;
        case TextureFormat::Depth16: return 2;
        case TextureFormat::Depth24: return 4;
        case TextureFormat::Depth24Stencil8: return 4;
        case TextureFormat::Depth32F: return 4;
    }
    return 4;
}

[[nodiscard]] constexpr bool is_depth_format(TextureFormat format) noexcept {
    return format == TextureFormat::Depth16
        || format == TextureFormat::Depth24
        || format == TextureFormat::Depth24Stencil8
        || format == TextureFormat::Depth32F;
}

[[nodiscard]] const char* texture_format_name(TextureFormat format);

/// Texture filter mode
enum class TextureFilter : std::uint8_t {
    Nearest,
    Linear,
};

/// Texture address mode
enum class TextureWrap : std::uint8_t {
    ClampToEdge,
    Repeat,
    MirroredRepeat,
};

/// 2D texture description
struct TextureDesc {
    std::uint32_t width = 1;
    std::uint32_t height = 1;
    TextureFormat format = TextureFormat::Rgba8;
    TextureFilter min_filter = TextureFilter::Linear;
    TextureFilter mag_filter = TextureFilter::Linear;
    TextureWrap wrap_s = TextureWrap::ClampToEdge;
    TextureWrap wrap_t = TextureWrap::ClampToEdge;
    bool generate_mipmaps = false;
};

/// Estimated GPU footprint of a texture; a full mip chain adds a third
[[nodiscard]] constexpr std::size_t texture_size_bytes(const TextureDesc& desc) noexcept {
    std::size_t base = static_cast<std::size_t>(desc.width) * desc.height * bytes_per_pixel(desc.format);
    return desc.generate_mipmaps ? base + base / 3 : base;
}

/// Sub-rectangle of a texture
struct TextureRegion {
    std::uint32_t x = 0;
    std::uint32_t y = 0;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
};

/// Region lies inside the texture; written so large offsets cannot wrap
[[nodiscard]] constexpr bool region_fits(const TextureRegion& region, const TextureDesc& desc) noexcept {
    return region.width <= desc.width && region.x <= desc.width - region.width
        && region.height <= desc.height && region.y <= desc.height - region.height;
}

// =============================================================================
// Framebuffers
// =============================================================================

/// Framebuffer assembled from existing textures
struct FramebufferDesc {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::vector<TextureHandle> color_attachments;
    TextureHandle depth_attachment;
};

// =============================================================================
// Buffers
// =============================================================================

/// Buffer bind target
enum class BufferType : std::uint8_t {
    Vertex,
    Index,
    Uniform,
};

/// Expected update frequency
enum class BufferUsage : std::uint8_t {
    Static,
    Dynamic,
    Stream,
};

[[nodiscard]] const char* buffer_type_name(BufferType type);
[[nodiscard]] const char* buffer_usage_name(BufferUsage usage);

/// Buffer description
struct BufferDesc {
    BufferType type = BufferType::Vertex;
    BufferUsage usage = BufferUsage::Static;
    std::size_t size = 0;
};

// =============================================================================
// Shaders
// =============================================================================

/// Programmable pipeline stage
enum class ShaderStage : std::uint8_t {
    Vertex,
    Fragment,
};

[[nodiscard]] const char* shader_stage_name(ShaderStage stage);

/// Active attributes and uniforms of a linked program
struct ProgramReflection {
    std::map<std::string, std::int32_t> attributes;
    std::map<std::string, std::int32_t> uniforms;
};

// =============================================================================
// Fixed-function state
// =============================================================================

/// Primitive assembly mode
enum class PrimitiveMode : std::uint8_t {
    Points,
    Lines,
    LineStrip,
    LineLoop,
    Triangles,
    TriangleStrip,
    TriangleFan,
};

/// Index element type
enum class IndexFormat : std::uint8_t {
    Uint16,
    Uint32,
};

/// Toggleable device capability
enum class Capability : std::uint8_t {
    Blend,
    DepthTest,
    CullFace,
    ScissorTest,
};

[[nodiscard]] const char* capability_name(Capability cap);

/// Viewport rectangle in pixels
struct Viewport {
    std::int32_t x = 0;
    std::int32_t y = 0;
    std::int32_t width = 0;
    std::int32_t height = 0;

    bool operator==(const Viewport& other) const noexcept = default;
};

/// One draw submission against the bound program and vertex array
struct DrawCommand {
    PrimitiveMode mode = PrimitiveMode::Triangles;
    std::int32_t count = 0;
    std::int32_t offset = 0;         // First vertex, or first index when indexed
    std::uint32_t instances = 1;
    bool indexed = false;
    IndexFormat index_format = IndexFormat::Uint16;
};

// =============================================================================
// Limits
// =============================================================================

/// Device limits queried once at startup
struct DeviceLimits {
    std::uint32_t max_texture_size = 4096;
    std::uint32_t max_texture_units = 16;
    std::uint32_t max_vertex_attributes = 16;
    std::uint32_t max_color_attachments = 4;
    std::uint32_t max_viewport_width = 4096;
    std::uint32_t max_viewport_height = 4096;
};

} // namespace lumen_gpu
