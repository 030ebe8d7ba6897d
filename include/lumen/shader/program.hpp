#pragma once

/// @file program.hpp
/// @brief Linked shader program owned by the shader cache

#include "fwd.hpp"
#include "types.hpp"
#include <lumen/gpu/types.hpp>
#include <lumen/gpu/uniform.hpp>

#include <map>
#include <string>

namespace lumen_shader {

/// Program handle plus reflected locations
///
/// Handed out as shared_ptr. The cache keeps the device object alive;
/// once the entry is evicted the program reports !is_valid() and its
/// handle must not be used.
class ShaderProgram {
public:
    ShaderProgram(ShaderVariantKey key,
                  lumen_gpu::ProgramHandle handle,
                  lumen_gpu::ProgramReflection reflection,
                  std::map<std::string, lumen_gpu::UniformValue> default_uniforms)
        : m_key(std::move(key))
        , m_handle(handle)
        , m_reflection(std::move(reflection))
        , m_default_uniforms(std::move(default_uniforms)) {}

    [[nodiscard]] const ShaderVariantKey& key() const noexcept { return m_key; }
    [[nodiscard]] lumen_gpu::ProgramHandle handle() const noexcept { return m_handle; }
    [[nodiscard]] bool is_valid() const noexcept { return m_valid; }

    /// Attribute location, or -1
    [[nodiscard]] std::int32_t attribute_location(const std::string& name) const {
        auto it = m_reflection.attributes.find(name);
        return it != m_reflection.attributes.end() ? it->second : -1;
    }

    /// Uniform location, or -1
    [[nodiscard]] std::int32_t uniform_location(const std::string& name) const {
        auto it = m_reflection.uniforms.find(name);
        return it != m_reflection.uniforms.end() ? it->second : -1;
    }

    [[nodiscard]] bool has_uniform(const std::string& name) const {
        return m_reflection.uniforms.find(name) != m_reflection.uniforms.end();
    }

    [[nodiscard]] const lumen_gpu::ProgramReflection& reflection() const noexcept { return m_reflection; }

    [[nodiscard]] const std::map<std::string, lumen_gpu::UniformValue>& default_uniforms() const noexcept {
        return m_default_uniforms;
    }

private:
    friend class ShaderCache;

    void invalidate() noexcept { m_valid = false; }

    ShaderVariantKey m_key;
    lumen_gpu::ProgramHandle m_handle;
    lumen_gpu::ProgramReflection m_reflection;
    std::map<std::string, lumen_gpu::UniformValue> m_default_uniforms;
    bool m_valid = true;
};

} // namespace lumen_shader
