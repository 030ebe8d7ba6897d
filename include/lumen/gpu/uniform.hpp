#pragma once

/// @file uniform.hpp
/// @brief Tagged union of uniform shapes accepted by the device

#include <array>
#include <cstdint>
#include <variant>

namespace lumen_gpu {

using Vec2 = std::array<float, 2>;
using Vec3 = std::array<float, 3>;
using Vec4 = std::array<float, 4>;
using Mat3 = std::array<float, 9>;    // Column-major
using Mat4 = std::array<float, 16>;   // Column-major

/// Texture unit a sampler uniform reads from
struct SamplerUnit {
    std::int32_t unit = 0;

    bool operator==(const SamplerUnit& other) const noexcept = default;
};

/// Uniform value
using UniformValue = std::variant<
    float,
    std::int32_t,
    Vec2,
    Vec3,
    Vec4,
    Mat3,
    Mat4,
    SamplerUnit
>;

/// Uniform shape tag, index-aligned with UniformValue
enum class UniformType : std::uint8_t {
    Float,
    Int,
    Vec2,
    Vec3,
    Vec4,
    Mat3,
    Mat4,
    Sampler,
};

[[nodiscard]] inline UniformType uniform_type(const UniformValue& value) noexcept {
    return static_cast<UniformType>(value.index());
}

[[nodiscard]] inline const char* uniform_type_name(UniformType type) noexcept {
    switch (type) {
        case UniformType::Float: return "float";
        case UniformType::Int: return "int";
        case UniformType::Vec2: return "vec2";
        case UniformType::Vec3: return "vec3";
        case UniformType::Vec4: return "vec4";
        case UniformType::Mat3: return "mat3";
        case UniformType::Mat4: return "mat4";
        case UniformType::Sampler: return "sampler";
        default: return "unknown";
    }
}

/// Column-major identity matrices
[[nodiscard]] constexpr Mat3 identity_mat3() noexcept {
    return {1.0f, 0.0f, 0.0f,
            0.0f, 1.0f, 0.0f,
            0.0f, 0.0f, 1.0f};
}

[[nodiscard]] constexpr Mat4 identity_mat4() noexcept {
    return {1.0f, 0.0f, 0.0f, 0.0f,
            0.0f, 1.0f, 0.0f, 0.0f,
            0.0f, 0.0f, 1.0f, 0.0f,
            0.0f, 0.0f, 0.0f, 1.0f};
}

} // namespace lumen_gpu
