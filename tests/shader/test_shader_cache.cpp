/// @file test_shader_cache.cpp
/// @brief Tests for lumen_shader ShaderCache

#include <catch2/catch_test_macros.hpp>
#include <lumen/shader/shader.hpp>
#include <lumen/gpu/null_device.hpp>

#include <chrono>
#include <string>
#include <vector>

using namespace lumen_shader;
using namespace std::chrono_literals;
using lumen_gpu::DeviceCall;
using lumen_gpu::NullDevice;

namespace {

const char* k_vertex = R"(#version 330 core
in vec2 a_position;
uniform mat3 u_transform;
void main() {
    gl_Position = vec4((u_transform * vec3(a_position, 1.0)).xy, 0.0, 1.0);
}
)";

const char* k_fragment = R"(#version 330 core
out vec4 frag_color;
#ifdef USE_TINT
uniform vec4 u_tint;
#endif
void main() {
#ifdef USE_TINT
    frag_color = u_tint;
#else
    frag_color = vec4(1.0);
#endif
}
)";

ShaderTemplate quad_template() {
    ShaderTemplate t;
    t.id = "quad";
    t.vertex_source = k_vertex;
    t.fragment_source = k_fragment;
    t.variants.emplace_back("plain");
    t.variants.push_back(ShaderVariant("tinted").with_define("USE_TINT"));
    t.default_uniforms["u_tint"] = lumen_gpu::Vec4{1.0f, 0.0f, 0.0f, 1.0f};
    return t;
}

ShaderCacheConfig sync_config() {
    ShaderCacheConfig config;
    config.async_compilation = false;
    config.precompile_common_variants = false;
    return config;
}

struct Fixture {
    NullDevice device;
    lumen_event::EventBus events;
    lumen_core::ManualTimeSource time;

    std::size_t hits = 0;
    std::size_t misses = 0;
    std::size_t compiled = 0;
    std::vector<ShaderFailed> failures;
    std::vector<CacheCleaned> cleanups;

    Fixture() {
        events.subscribe<CacheHit>([this](const CacheHit&) { ++hits; });
        events.subscribe<CacheMiss>([this](const CacheMiss&) { ++misses; });
        events.subscribe<ShaderCompiled>([this](const ShaderCompiled&) { ++compiled; });
        events.subscribe<ShaderFailed>([this](const ShaderFailed& e) { failures.push_back(e); });
        events.subscribe<CacheCleaned>([this](const CacheCleaned& e) { cleanups.push_back(e); });
    }
};

} // namespace

// =============================================================================
// Templates
// =============================================================================

TEST_CASE("ShaderCache: register template", "[shader][cache]") {
    Fixture f;
    ShaderCache cache(f.device, f.events, sync_config(), ShaderLibrary::with_builtins(), f.time);

    REQUIRE(cache.register_template(quad_template()).is_ok());
    REQUIRE(cache.has_template("quad"));
    REQUIRE(cache.find_template("quad")->variants.size() == 2);
    REQUIRE(cache.find_template("missing") == nullptr);
}

TEST_CASE("ShaderCache: template validation", "[shader][cache]") {
    Fixture f;
    ShaderCache cache(f.device, f.events, sync_config(), ShaderLibrary::with_builtins(), f.time);

    SECTION("empty id") {
        auto t = quad_template();
        t.id.clear();
        REQUIRE(cache.register_template(t).error().code() == lumen_core::ErrorCode::InvalidArgument);
    }

    SECTION("missing stage") {
        auto t = quad_template();
        t.fragment_source.clear();
        REQUIRE(cache.register_template(t).is_err());
    }

    SECTION("duplicate variant names") {
        auto t = quad_template();
        t.variants.emplace_back("plain");
        REQUIRE(cache.register_template(t).is_err());
    }

    SECTION("no variants gets a default") {
        auto t = quad_template();
        t.variants.clear();
        REQUIRE(cache.register_template(t).is_ok());
        REQUIRE(cache.find_template("quad")->variants.front().name == "default");
    }
}

TEST_CASE("ShaderCache: built-in templates compile", "[shader][cache]") {
    Fixture f;
    ShaderCache cache(f.device, f.events, sync_config(), ShaderLibrary::with_builtins(), f.time);
    REQUIRE(cache.register_builtin_templates().is_ok());

    auto program = cache.get_program("basic_shape", "global_alpha");
    REQUIRE(program.is_ok());
    REQUIRE((*program)->has_uniform("u_alpha"));
    REQUIRE((*program)->has_uniform("u_projection"));
    REQUIRE((*program)->attribute_location("a_position") >= 0);
    REQUIRE((*program)->attribute_location("v_color") == -1);

    auto fill = cache.get_program("sdf_circle");
    REQUIRE(fill.is_ok());
    REQUIRE((*fill)->key().variant == "fill");
    REQUIRE_FALSE((*fill)->has_uniform("u_stroke_width"));
}

// =============================================================================
// Program lookup
// =============================================================================

TEST_CASE("ShaderCache: one entry per variant", "[shader][cache]") {
    Fixture f;
    ShaderCache cache(f.device, f.events, sync_config(), ShaderLibrary::with_builtins(), f.time);
    REQUIRE(cache.register_template(quad_template()).is_ok());

    auto plain = cache.get_program("quad", "plain");
    auto tinted = cache.get_program("quad", "tinted");
    REQUIRE(plain.is_ok());
    REQUIRE(tinted.is_ok());
    REQUIRE(*plain != *tinted);
    REQUIRE(cache.program_count() == 2);
    REQUIRE(f.misses == 2);
    REQUIRE(f.hits == 0);

    auto again = cache.get_program("quad", "plain");
    REQUIRE(again.is_ok());
    REQUIRE(f.hits == 1);
    REQUIRE(cache.program_count() == 2);
}

TEST_CASE("ShaderCache: repeated lookups share the program", "[shader][cache]") {
    Fixture f;
    ShaderCache cache(f.device, f.events, sync_config(), ShaderLibrary::with_builtins(), f.time);
    REQUIRE(cache.register_template(quad_template()).is_ok());

    auto first = cache.get_program("quad", "tinted");
    auto second = cache.get_program("quad", "tinted");
    REQUIRE(first->get() == second->get());
    REQUIRE(f.device.call_count(DeviceCall::LinkProgram) == 1);
    REQUIRE(f.compiled == 1);

    auto metrics = cache.metrics(ShaderVariantKey{"quad", "tinted"});
    REQUIRE(metrics.has_value());
    REQUIRE(metrics->use_count == 1);

    auto stats = cache.stats();
    REQUIRE(stats.hits == 1);
    REQUIRE(stats.misses == 1);
    REQUIRE(stats.hit_rate == 0.5);
}

TEST_CASE("ShaderCache: variant defines reach the device", "[shader][cache]") {
    Fixture f;
    ShaderCache cache(f.device, f.events, sync_config(), ShaderLibrary::with_builtins(), f.time);
    REQUIRE(cache.register_template(quad_template()).is_ok());

    auto tinted = cache.get_program("quad", "tinted");
    REQUIRE(tinted.is_ok());

    const auto& fragment = f.device.last_source(lumen_gpu::ShaderStage::Fragment);
    REQUIRE(fragment.rfind("#version 330 core\n#define USE_TINT 1\n", 0) == 0);
    REQUIRE(fragment.find("frag_color = u_tint;") != std::string::npos);
    REQUIRE(fragment.find("vec4(1.0);") == std::string::npos);
    REQUIRE((*tinted)->has_uniform("u_tint"));
    REQUIRE((*tinted)->default_uniforms().count("u_tint") == 1);

    // Stages are released once linked
    REQUIRE(f.device.live_shader_stages() == 0);
    REQUIRE(f.device.live_programs() == 1);
}

TEST_CASE("ShaderCache: unknown template or variant", "[shader][cache]") {
    Fixture f;
    ShaderCache cache(f.device, f.events, sync_config(), ShaderLibrary::with_builtins(), f.time);
    REQUIRE(cache.register_template(quad_template()).is_ok());

    auto missing = cache.get_program("nope");
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().as<lumen_core::ShaderError>()->kind
            == lumen_core::ShaderError::Kind::TemplateNotFound);

    auto bad_variant = cache.get_program("quad", "sparkly");
    REQUIRE(bad_variant.is_err());
    REQUIRE(bad_variant.error().as<lumen_core::ShaderError>()->kind
            == lumen_core::ShaderError::Kind::VariantNotFound);
    REQUIRE(f.misses == 0);
}

// =============================================================================
// Failures
// =============================================================================

TEST_CASE("ShaderCache: compile failure", "[shader][cache]") {
    Fixture f;
    ShaderCache cache(f.device, f.events, sync_config(), ShaderLibrary::with_builtins(), f.time);

    auto t = quad_template();
    t.fragment_source = "#version 330 core\n#ifdef USE_TINT\n#error tint unsupported\n#endif\nvoid main() {}\n";
    REQUIRE(cache.register_template(t).is_ok());

    REQUIRE(cache.get_program("quad", "plain").is_ok());

    auto result = cache.get_program("quad", "tinted");
    REQUIRE(result.is_err());
    REQUIRE(result.error().code() == lumen_core::ErrorCode::CompileError);
    REQUIRE(*result.error().get_context("variant") == "tinted");

    REQUIRE(f.failures.size() == 1);
    REQUIRE(f.failures[0].key == ShaderVariantKey{"quad", "tinted"});
    REQUIRE_FALSE(cache.contains(ShaderVariantKey{"quad", "tinted"}));
    REQUIRE(f.device.live_shader_stages() == 0);
}

TEST_CASE("ShaderCache: link failure", "[shader][cache]") {
    Fixture f;
    ShaderCache cache(f.device, f.events, sync_config(), ShaderLibrary::with_builtins(), f.time);

    auto t = quad_template();
    t.vertex_source = std::string(k_vertex) + "// LINK_FAIL\n";
    REQUIRE(cache.register_template(t).is_ok());

    auto result = cache.get_program("quad", "plain");
    REQUIRE(result.is_err());
    REQUIRE(result.error().code() == lumen_core::ErrorCode::LinkError);
    REQUIRE(f.failures.size() == 1);
    REQUIRE(f.device.live_shader_stages() == 0);
    REQUIRE(f.device.live_programs() == 0);
}

TEST_CASE("ShaderCache: preprocess failure", "[shader][cache]") {
    Fixture f;
    ShaderCache cache(f.device, f.events, sync_config(), ShaderLibrary::with_builtins(), f.time);

    auto t = quad_template();
    t.vertex_source = "#version 330 core\n#include \"missing\"\nvoid main() {}\n";
    REQUIRE(cache.register_template(t).is_ok());

    auto result = cache.get_program("quad");
    REQUIRE(result.is_err());
    REQUIRE(f.failures.size() == 1);
    REQUIRE(f.device.call_count(DeviceCall::CompileShader) == 0);
}

// =============================================================================
// Async compilation
// =============================================================================

TEST_CASE("ShaderCache: async requests are queued", "[shader][cache]") {
    Fixture f;
    ShaderCacheConfig config;
    config.precompile_common_variants = false;
    ShaderCache cache(f.device, f.events, config, ShaderLibrary::with_builtins(), f.time);
    REQUIRE(cache.register_template(quad_template()).is_ok());

    auto first = cache.get_program_async("quad", "plain");
    auto duplicate = cache.get_program_async("quad", "plain");
    auto second = cache.get_program_async("quad", "tinted");

    REQUIRE(cache.queued_compiles() == 2);
    REQUIRE(f.device.call_count(DeviceCall::LinkProgram) == 0);
    REQUIRE(first.wait_for(0s) == std::future_status::timeout);

    REQUIRE(cache.process_compile_queue(1) == 1);
    REQUIRE(first.wait_for(0s) == std::future_status::ready);
    REQUIRE(duplicate.get().is_ok());
    REQUIRE(first.get().value().get() == duplicate.get().value().get());
    REQUIRE(second.wait_for(0s) == std::future_status::timeout);

    cache.update();
    REQUIRE(second.get().is_ok());
    REQUIRE(cache.queued_compiles() == 0);

    // Cached now, so the future is ready immediately
    auto cached = cache.get_program_async("quad", "plain");
    REQUIRE(cached.wait_for(0s) == std::future_status::ready);
    REQUIRE(f.hits == 1);
}

TEST_CASE("ShaderCache: synchronous get settles a queued request", "[shader][cache]") {
    Fixture f;
    ShaderCacheConfig config;
    config.precompile_common_variants = false;
    ShaderCache cache(f.device, f.events, config, ShaderLibrary::with_builtins(), f.time);
    REQUIRE(cache.register_template(quad_template()).is_ok());

    auto pending = cache.get_program_async("quad", "plain");
    auto program = cache.get_program("quad", "plain");

    REQUIRE(program.is_ok());
    REQUIRE(cache.queued_compiles() == 0);
    REQUIRE(pending.get().value().get() == program->get());
    REQUIRE(f.device.call_count(DeviceCall::LinkProgram) == 1);
}

TEST_CASE("ShaderCache: precompile and warmup", "[shader][cache]") {
    Fixture f;
    ShaderCacheConfig config;
    config.precompile_variant_count = 1;
    ShaderCache cache(f.device, f.events, config, ShaderLibrary::with_builtins(), f.time);

    REQUIRE(cache.register_template(quad_template()).is_ok());
    REQUIRE(cache.queued_compiles() == 1);

    REQUIRE(cache.precompile_shaders({"quad", "unknown"}) == 1);
    REQUIRE(cache.warmup({{"quad", "tinted"}, {"quad", "missing"}}) == 0);
    REQUIRE(cache.queued_compiles() == 2);

    REQUIRE(cache.drain_compile_queue() == 2);
    REQUIRE(cache.program_count() == 2);
    REQUIRE(f.misses == 0);
}

TEST_CASE("ShaderCache: dispose fails queued requests", "[shader][cache]") {
    Fixture f;
    ShaderCacheConfig config;
    config.precompile_common_variants = false;
    ShaderCache cache(f.device, f.events, config, ShaderLibrary::with_builtins(), f.time);
    REQUIRE(cache.register_template(quad_template()).is_ok());
    REQUIRE(cache.get_program("quad", "plain").is_ok());

    auto pending = cache.get_program_async("quad", "tinted");
    cache.dispose();

    REQUIRE(pending.get().is_err());
    REQUIRE(cache.program_count() == 0);
    REQUIRE(f.device.live_programs() == 0);
}

// =============================================================================
// Cleanup
// =============================================================================

TEST_CASE("ShaderCache: idle entries expire", "[shader][cache]") {
    Fixture f;
    auto config = sync_config();
    config.expiration = 1000ms;
    ShaderCache cache(f.device, f.events, config, ShaderLibrary::with_builtins(), f.time);
    REQUIRE(cache.register_template(quad_template()).is_ok());

    auto old_program = cache.get_program("quad", "plain");
    f.time.advance(800ms);
    auto fresh_program = cache.get_program("quad", "tinted");
    f.time.advance(400ms);

    REQUIRE(cache.cleanup_cache() > 0);
    REQUIRE_FALSE((*old_program)->is_valid());
    REQUIRE((*fresh_program)->is_valid());
    REQUIRE(cache.program_count() == 1);
    REQUIRE(f.cleanups.size() == 1);
    REQUIRE(f.cleanups[0].freed_count == 1);

    // Nothing left to free: no event
    REQUIRE(cache.cleanup_cache() == 0);
    REQUIRE(f.cleanups.size() == 1);
}

TEST_CASE("ShaderCache: forced cleanup empties the cache", "[shader][cache]") {
    Fixture f;
    ShaderCache cache(f.device, f.events, sync_config(), ShaderLibrary::with_builtins(), f.time);
    REQUIRE(cache.register_template(quad_template()).is_ok());
    REQUIRE(cache.get_program("quad", "plain").is_ok());
    REQUIRE(cache.get_program("quad", "tinted").is_ok());

    const auto usage = cache.memory_usage();
    REQUIRE(usage > 0);
    REQUIRE(cache.cleanup_cache(true) == usage);
    REQUIRE(cache.program_count() == 0);
    REQUIRE(cache.memory_usage() == 0);
    REQUIRE(f.device.live_programs() == 0);
}

TEST_CASE("ShaderCache: update runs cleanup on its interval", "[shader][cache]") {
    Fixture f;
    auto config = sync_config();
    config.expiration = 1000ms;
    config.cleanup_interval = 5000ms;
    ShaderCache cache(f.device, f.events, config, ShaderLibrary::with_builtins(), f.time);
    REQUIRE(cache.register_template(quad_template()).is_ok());
    REQUIRE(cache.get_program("quad").is_ok());

    f.time.advance(2000ms);
    cache.update();
    REQUIRE(cache.program_count() == 1);

    f.time.advance(3000ms);
    cache.update();
    REQUIRE(cache.program_count() == 0);
}

TEST_CASE("ShaderCache: over the limit evicts unused entries", "[shader][cache]") {
    Fixture f;
    auto config = sync_config();
    config.memory_limit = 1;
    ShaderCache cache(f.device, f.events, config, ShaderLibrary::with_builtins(), f.time);
    REQUIRE(cache.register_template(quad_template()).is_ok());

    auto plain = cache.get_program("quad", "plain");
    REQUIRE(cache.program_count() == 1);

    SECTION("unused entry is evicted") {
        auto tinted = cache.get_program("quad", "tinted");
        REQUIRE(tinted.is_ok());
        REQUIRE((*tinted)->is_valid());
        REQUIRE_FALSE((*plain)->is_valid());
        REQUIRE(cache.program_count() == 1);
        REQUIRE(f.cleanups.size() == 1);
    }

    SECTION("used entry survives") {
        REQUIRE(cache.get_program("quad", "plain").is_ok());
        REQUIRE(cache.get_program("quad", "tinted").is_ok());
        REQUIRE((*plain)->is_valid());
        REQUIRE(cache.program_count() == 2);
    }
}

// =============================================================================
// Hot reload
// =============================================================================

TEST_CASE("ShaderCache: hot reload disabled", "[shader][cache]") {
    Fixture f;
    ShaderCache cache(f.device, f.events, sync_config(), ShaderLibrary::with_builtins(), f.time);
    REQUIRE(cache.register_template(quad_template()).is_ok());

    auto result = cache.hot_reload_shader("quad");
    REQUIRE(result.is_err());
    REQUIRE(result.error().code() == lumen_core::ErrorCode::NotSupported);
}

TEST_CASE("ShaderCache: hot reload recompiles every variant", "[shader][cache]") {
    Fixture f;
    auto config = sync_config();
    config.hot_reload = true;
    ShaderCache cache(f.device, f.events, config, ShaderLibrary::with_builtins(), f.time);
    REQUIRE(cache.register_template(quad_template()).is_ok());

    std::vector<HotReload> reloads;
    f.events.subscribe<HotReload>([&reloads](const HotReload& e) { reloads.push_back(e); });

    auto before = cache.get_program("quad", "plain");
    REQUIRE(cache.hot_reload_shader("quad").is_ok());

    REQUIRE_FALSE((*before)->is_valid());
    REQUIRE(cache.program_count() == 2);
    REQUIRE(reloads.size() == 1);
    REQUIRE(reloads[0].success);

    auto after = cache.get_program("quad", "plain");
    REQUIRE(after->get() != before->get());
    REQUIRE((*after)->is_valid());

    SECTION("broken source reports failure") {
        REQUIRE(cache.update_template_sources("quad", "#version 330 core\n#error broken\n", k_fragment).is_ok());
        auto failed = cache.hot_reload_shader("quad");
        REQUIRE(failed.is_err());
        REQUIRE(reloads.size() == 2);
        REQUIRE_FALSE(reloads[1].success);
        REQUIRE_FALSE(f.failures.empty());
    }

    SECTION("unknown template") {
        REQUIRE(cache.hot_reload_shader("nope").is_err());
        REQUIRE(reloads.size() == 1);
    }
}
