#pragma once

/// @file config.hpp
/// @brief Render layer configuration and its JSON form
///
/// Example document (every key optional):
/// ```json
/// {
///   "logging":   { "level": "debug", "console": true, "file": false, "directory": "logs" },
///   "resources": { "budget": { "total": 536870912, "textures": 268435456 },
///                  "gc": { "enabled": true, "interval_ms": 5000, "max_age_ms": 300000, "max_unused_ms": 60000 } },
///   "shaders":   { "memory_limit": 52428800, "hot_reload": false, "async_compilation": true },
///   "frame":     { "buffer_pooling": true, "max_draw_calls": 1000 }
/// }
/// ```

#include "fwd.hpp"
#include <lumen/core/error.hpp>
#include <lumen/core/log.hpp>
#include <lumen/resource/types.hpp>
#include <lumen/shader/types.hpp>

#include <cstdint>
#include <filesystem>
#include <string>

namespace lumen_render {

/// Frame orchestrator switches and per-frame ceilings
struct FrameOrchestratorConfig {
    bool enable_buffer_pooling = true;
    bool enable_state_tracking = true;
    bool enable_batch_optimization = true;
    bool enable_shader_warmup = true;
    double frame_time_budget_ms = 16.67;
    std::uint64_t max_state_changes = 100;
    std::uint64_t max_draw_calls = 1000;
    std::uint64_t maintenance_interval = 100;   // Frames between cache and pool maintenance
};

/// Configuration of every render layer component
struct RenderConfig {
    lumen_core::LogConfig logging;
    lumen_resource::ResourceManagerConfig resources;
    lumen_shader::ShaderCacheConfig shaders;
    FrameOrchestratorConfig frame;
};

/// Parse a JSON document; missing keys keep their defaults
[[nodiscard]] lumen_core::Result<RenderConfig> parse_render_config(const std::string& json_text);

/// Read and parse a JSON file
[[nodiscard]] lumen_core::Result<RenderConfig> load_render_config(const std::filesystem::path& path);

} // namespace lumen_render
