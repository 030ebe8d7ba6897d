#pragma once

/// @file library.hpp
/// @brief Named source chunks for `#include` and the built-in 2D templates

#include "fwd.hpp"
#include "types.hpp"

#include <map>
#include <string>
#include <vector>

namespace lumen_shader {

// =============================================================================
// ShaderLibrary
// =============================================================================

/// Source chunks addressable by `#include "name"` or `#include <name>`
class ShaderLibrary {
public:
    ShaderLibrary() = default;

    /// Library preloaded with the built-in 2D chunks
    /// (precision, transform, color, sdf)
    [[nodiscard]] static ShaderLibrary with_builtins();

    /// Add or replace a chunk
    void add_chunk(const std::string& name, std::string source) {
        m_chunks[name] = std::move(source);
    }

    bool remove_chunk(const std::string& name) {
        return m_chunks.erase(name) > 0;
    }

    [[nodiscard]] bool has_chunk(const std::string& name) const {
        return m_chunks.find(name) != m_chunks.end();
    }

    [[nodiscard]] const std::string* find_chunk(const std::string& name) const {
        auto it = m_chunks.find(name);
        return it != m_chunks.end() ? &it->second : nullptr;
    }

    [[nodiscard]] std::vector<std::string> chunk_names() const;

    [[nodiscard]] std::size_t size() const noexcept { return m_chunks.size(); }

private:
    std::map<std::string, std::string> m_chunks;
};

// =============================================================================
// Built-in templates
// =============================================================================

/// basic_shape, solid_color, texture and sdf_circle, each with variants
[[nodiscard]] std::vector<ShaderTemplate> builtin_templates();

} // namespace lumen_shader
