#pragma once

/// @file events.hpp
/// @brief Events published by the shader cache

#include "types.hpp"
#include <lumen/core/error.hpp>

namespace lumen_shader {

/// A variant was compiled and linked
struct ShaderCompiled {
    ShaderVariantKey key;
    double compile_ms = 0.0;
};

struct CacheHit {
    ShaderVariantKey key;
};

struct CacheMiss {
    ShaderVariantKey key;
};

/// Preprocessing, compilation or linking failed
struct ShaderFailed {
    ShaderVariantKey key;
    lumen_core::Error error;
};

struct CacheCleaned {
    std::size_t freed_bytes = 0;
    std::size_t freed_count = 0;
};

/// Outcome of recompiling every variant of a template
struct HotReload {
    std::string template_id;
    bool success = false;
};

} // namespace lumen_shader
