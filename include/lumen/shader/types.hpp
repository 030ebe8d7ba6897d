#pragma once

/// @file types.hpp
/// @brief Shader templates, variants and cache configuration

#include "fwd.hpp"
#include <lumen/core/time.hpp>
#include <lumen/gpu/uniform.hpp>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace lumen_shader {

// =============================================================================
// Defines
// =============================================================================

/// Value of a preprocessor define; every alternative counts as "defined"
using DefineValue = std::variant<bool, std::int64_t, double, std::string>;

/// Defines in name order
using DefineMap = std::map<std::string, DefineValue>;

/// Render a define value as it appears after `#define NAME`
/// (booleans become 1/0, doubles always carry a decimal point)
[[nodiscard]] std::string define_value_string(const DefineValue& value);

// =============================================================================
// ShaderVariant
// =============================================================================

/// Named define set of a template
struct ShaderVariant {
    std::string name;
    DefineMap defines;
    std::vector<std::string> features;

    ShaderVariant() = default;
    explicit ShaderVariant(std::string n) : name(std::move(n)) {}

    ShaderVariant& with_define(const std::string& def_name, bool value = true) {
        defines[def_name] = value;
        return *this;
    }

    ShaderVariant& with_define(const std::string& def_name, int value) {
        defines[def_name] = static_cast<std::int64_t>(value);
        return *this;
    }

    ShaderVariant& with_define(const std::string& def_name, std::int64_t value) {
        defines[def_name] = value;
        return *this;
    }

    ShaderVariant& with_define(const std::string& def_name, double value) {
        defines[def_name] = value;
        return *this;
    }

    ShaderVariant& with_define(const std::string& def_name, const std::string& value) {
        defines[def_name] = value;
        return *this;
    }

    ShaderVariant& with_define(const std::string& def_name, const char* value) {
        defines[def_name] = std::string(value);
        return *this;
    }

    ShaderVariant& with_feature(std::string feature) {
        features.push_back(std::move(feature));
        return *this;
    }

    [[nodiscard]] bool has_define(const std::string& def_name) const {
        return defines.find(def_name) != defines.end();
    }

    /// `#define` lines for every define, in name order
    [[nodiscard]] std::string to_header() const;
};

// =============================================================================
// ShaderTemplate
// =============================================================================

/// Vertex/fragment source pair with its declared variants
struct ShaderTemplate {
    std::string id;
    std::string vertex_source;
    std::string fragment_source;
    std::vector<ShaderVariant> variants;
    std::map<std::string, lumen_gpu::UniformValue> default_uniforms;

    /// Variant by name; an empty name selects the first variant
    [[nodiscard]] const ShaderVariant* find_variant(const std::string& name) const {
        if (name.empty()) {
            return variants.empty() ? nullptr : &variants.front();
        }
        for (const auto& variant : variants) {
            if (variant.name == name) {
                return &variant;
            }
        }
        return nullptr;
    }
};

// =============================================================================
// ShaderVariantKey
// =============================================================================

/// Identifies one compiled program
struct ShaderVariantKey {
    std::string template_id;
    std::string variant;

    [[nodiscard]] std::string to_string() const { return template_id + "/" + variant; }

    auto operator<=>(const ShaderVariantKey&) const = default;
    bool operator==(const ShaderVariantKey&) const = default;
};

// =============================================================================
// Configuration and statistics
// =============================================================================

/// Shader cache settings
struct ShaderCacheConfig {
    std::size_t memory_limit = 50 * 1024 * 1024;
    bool hot_reload = false;
    bool precompile_common_variants = true;
    bool async_compilation = true;
    lumen_core::Milliseconds cleanup_interval{60000};
    lumen_core::Milliseconds expiration{300000};
    std::size_t precompile_variant_count = 3;
};

/// Per-program timings and usage
struct ShaderMetrics {
    double compile_ms = 0.0;
    double link_ms = 0.0;
    std::uint64_t use_count = 0;
    lumen_core::TimePoint last_used;
};

/// Cache-wide counters
struct ShaderCacheStats {
    std::size_t programs = 0;
    std::size_t memory_usage = 0;
    std::size_t memory_limit = 0;
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    double hit_rate = 0.0;
    std::size_t queued = 0;
};

} // namespace lumen_shader
