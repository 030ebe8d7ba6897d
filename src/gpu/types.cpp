/// @file types.cpp
/// @brief Name tables for lumen_gpu enums

#include <lumen/gpu/types.hpp>

namespace lumen_gpu {

const char* texture_format_name(TextureFormat format) {
    switch (format) {
        case TextureFormat::R8: return "R8";
        case TextureFormat::Rg8: return "Rg8";
        case TextureFormat::Rgb8: return "Rgb8";
        case TextureFormat::Rgba8: return "Rgba8";
        case TextureFormat::Rgba4: return "Rgba4";
        case TextureFormat::Rgb565: return "Rgb565";
        case TextureFormat::Rgba16F: return "Rgba16F";
        case TextureFormat::Rgba32F: return "Rgba32F";
        case TextureFormat::Depth16: return "Depth16";
        case TextureFormat::Depth24: return "Depth24";
        case TextureFormat::Depth24Stencil8: return "Depth24Stencil8";
        case TextureFormat::Depth32F: return "Depth32F";
        default: return "Unknown";
    }
}

const char* buffer_type_name(BufferType type) {
    switch (type) {
        case BufferType::Vertex: return "vertex";
        case BufferType::Index: return "index";
        case BufferType::Uniform: return "uniform";
        default: return "unknown";
    }
}

const char* buffer_usage_name(BufferUsage usage) {
    switch (usage) {
        case BufferUsage::Static: return "static";
        case BufferUsage::Dynamic: return "dynamic";
        case BufferUsage::Stream: return "stream";
        default: return "unknown";
    }
}

const char* shader_stage_name(ShaderStage stage) {
    switch (stage) {
        case ShaderStage::Vertex: return "vertex";
        case ShaderStage::Fragment: return "fragment";
        default: return "unknown";
    }
}

const char* capability_name(Capability cap) {
    switch (cap) {
        case Capability::Blend: return "blend";
        case Capability::DepthTest: return "depth_test";
        case Capability::CullFace: return "cull_face";
        case Capability::ScissorTest: return "scissor_test";
        default: return "unknown";
    }
}

} // namespace lumen_gpu
