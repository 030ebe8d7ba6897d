/// @file config.cpp
/// @brief RenderConfig JSON loading

#include <lumen/render/config.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace lumen_render {

using lumen_core::Err;
using lumen_core::Error;
using lumen_core::ErrorCode;
using lumen_core::Ok;
using lumen_core::Result;

namespace {

lumen_core::Milliseconds millis(const nlohmann::json& j, const char* key, lumen_core::Milliseconds fallback) {
    return lumen_core::Milliseconds(j.value(key, static_cast<std::int64_t>(fallback.count())));
}

void read_logging(const nlohmann::json& j, lumen_core::LogConfig& config) {
    if (j.contains("level")) {
        const auto name = j["level"].get<std::string>();
        auto level = lumen_core::parse_log_level(name);
        if (!level) {
            throw std::invalid_argument("unknown log level '" + name + "'");
        }
        config.level = *level;
    }
    config.console_enabled = j.value("console", config.console_enabled);
    config.file_enabled = j.value("file", config.file_enabled);
    config.log_directory = j.value("directory", config.log_directory);
    config.max_file_size = j.value("max_file_size", config.max_file_size);
    config.max_files = j.value("max_files", config.max_files);
}

void read_resources(const nlohmann::json& j, lumen_resource::ResourceManagerConfig& config) {
    if (j.contains("budget") && j["budget"].is_object()) {
        const auto& budget = j["budget"];
        config.budget.total = budget.value("total", config.budget.total);
        config.budget.textures = budget.value("textures", config.budget.textures);
        config.budget.buffers = budget.value("buffers", config.budget.buffers);
        config.budget.other = budget.value("other", config.budget.other);
    }
    if (j.contains("gc") && j["gc"].is_object()) {
        const auto& gc = j["gc"];
        config.gc.enabled = gc.value("enabled", config.gc.enabled);
        config.gc.interval = millis(gc, "interval_ms", config.gc.interval);
        config.gc.max_age = millis(gc, "max_age_ms", config.gc.max_age);
        config.gc.max_unused = millis(gc, "max_unused_ms", config.gc.max_unused);
    }
}

void read_shaders(const nlohmann::json& j, lumen_shader::ShaderCacheConfig& config) {
    config.memory_limit = j.value("memory_limit", config.memory_limit);
    config.hot_reload = j.value("hot_reload", config.hot_reload);
    config.precompile_common_variants = j.value("precompile_common_variants", config.precompile_common_variants);
    config.async_compilation = j.value("async_compilation", config.async_compilation);
    config.cleanup_interval = millis(j, "cleanup_interval_ms", config.cleanup_interval);
    config.expiration = millis(j, "expiration_ms", config.expiration);
    config.precompile_variant_count = j.value("precompile_variant_count", config.precompile_variant_count);
}

void read_frame(const nlohmann::json& j, FrameOrchestratorConfig& config) {
    config.enable_buffer_pooling = j.value("buffer_pooling", config.enable_buffer_pooling);
    config.enable_state_tracking = j.value("state_tracking", config.enable_state_tracking);
    config.enable_batch_optimization = j.value("batch_optimization", config.enable_batch_optimization);
    config.enable_shader_warmup = j.value("shader_warmup", config.enable_shader_warmup);
    config.frame_time_budget_ms = j.value("frame_time_budget_ms", config.frame_time_budget_ms);
    config.max_state_changes = j.value("max_state_changes", config.max_state_changes);
    config.max_draw_calls = j.value("max_draw_calls", config.max_draw_calls);
    config.maintenance_interval = j.value("maintenance_interval", config.maintenance_interval);
}

} // anonymous namespace

Result<RenderConfig> parse_render_config(const std::string& json_text) {
    try {
        const auto j = nlohmann::json::parse(json_text);
        if (!j.is_object()) {
            return Err<RenderConfig>(Error(ErrorCode::ParseError, "Render config must be a JSON object"));
        }

        RenderConfig config;
        if (j.contains("logging") && j["logging"].is_object()) {
            read_logging(j["logging"], config.logging);
        }
        if (j.contains("resources") && j["resources"].is_object()) {
            read_resources(j["resources"], config.resources);
        }
        if (j.contains("shaders") && j["shaders"].is_object()) {
            read_shaders(j["shaders"], config.shaders);
        }
        if (j.contains("frame") && j["frame"].is_object()) {
            read_frame(j["frame"], config.frame);
        }

        if (config.frame.maintenance_interval == 0) {
            return Err<RenderConfig>(Error(ErrorCode::InvalidArgument,
                "frame.maintenance_interval must be at least 1"));
        }
        return Ok(std::move(config));
    } catch (const nlohmann::json::exception& e) {
        return Err<RenderConfig>(Error(ErrorCode::ParseError, std::string("Invalid render config: ") + e.what()));
    } catch (const std::invalid_argument& e) {
        return Err<RenderConfig>(Error(ErrorCode::InvalidArgument, std::string("Invalid render config: ") + e.what()));
    }
}

Result<RenderConfig> load_render_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<RenderConfig>(Error(ErrorCode::IOError, "Cannot open render config: " + path.string()));
    }

    std::ostringstream contents;
    contents << file.rdbuf();

    auto config = parse_render_config(contents.str());
    if (!config) {
        config.error().with_context("path", path.string());
    }
    return config;
}

} // namespace lumen_render
