/// @file test_time.cpp
/// @brief Tests for lumen_core time sources and logging helpers

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <lumen/core/time.hpp>
#include <lumen/core/log.hpp>

using namespace lumen_core;
using namespace std::chrono_literals;

// =============================================================================
// Time
// =============================================================================

TEST_CASE("ManualTimeSource: moves only when told", "[core][time]") {
    ManualTimeSource time;
    const auto start = time.now();
    REQUIRE(time.now() == start);

    time.advance(250ms);
    REQUIRE(time.now() - start == Duration(250ms));

    time.set(start + 5s);
    REQUIRE(to_millis(time.now() - start) == Catch::Approx(5000.0));
}

TEST_CASE("SystemTimeSource: monotonic", "[core][time]") {
    const TimeSource& time = system_time();
    const auto a = time.now();
    const auto b = time.now();
    REQUIRE(b >= a);
    REQUIRE(&system_time() == &time);
}

TEST_CASE("to_millis: fractional milliseconds", "[core][time]") {
    REQUIRE(to_millis(1500us) == Catch::Approx(1.5));
    REQUIRE(to_millis(Duration::zero()) == 0.0);
}

// =============================================================================
// Logging
// =============================================================================

TEST_CASE("Log level parsing", "[core][log]") {
    REQUIRE(parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("err") == spdlog::level::err);
    REQUIRE_FALSE(parse_log_level("loud").has_value());

    REQUIRE(std::string(log_level_name(spdlog::level::err)) == "error");
    REQUIRE(std::string(log_level_name(spdlog::level::trace)) == "trace");
}

TEST_CASE("Named loggers", "[core][log]") {
    REQUIRE(resource_logger()->name() == "lumen.resource");
    REQUIRE(shader_logger()->name() == "lumen.shader");
    REQUIRE(render_logger()->name() == "lumen.render");
    REQUIRE(get_logger("lumen.render") == render_logger());
}
