#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for lumen_gpu module

#include <cstdint>

namespace lumen_gpu {

template<typename Tag>
struct GpuHandle;

enum class TextureFormat : std::uint8_t;
enum class BufferType : std::uint8_t;
enum class BufferUsage : std::uint8_t;
enum class ShaderStage : std::uint8_t;
enum class PrimitiveMode : std::uint8_t;
enum class Capability : std::uint8_t;

struct TextureDesc;
struct TextureRegion;
struct FramebufferDesc;
struct BufferDesc;
struct Viewport;
struct DrawCommand;
struct DeviceLimits;
struct ProgramReflection;

class IGraphicsDevice;
class NullDevice;

} // namespace lumen_gpu
