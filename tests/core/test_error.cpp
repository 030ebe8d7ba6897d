// lumen_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <lumen/core/error.hpp>
#include <string>
#include <vector>

using namespace lumen_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Test error");
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
    }

    SECTION("from code and message") {
        Error err(ErrorCode::InvalidArgument, "Bad argument");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.message() == "Bad argument");
    }

    SECTION("with context") {
        Error err = Error("Base error");
        err.with_context("key", "value");
        auto* ctx = err.get_context("key");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "value");
        REQUIRE(err.get_context("missing") == nullptr);
    }
}

TEST_CASE("Error factory methods", "[core][error]") {
    SECTION("ResourceError codes") {
        REQUIRE(Error(ResourceError::duplicate_id("atlas")).code() == ErrorCode::AlreadyExists);
        REQUIRE(Error(ResourceError::not_found("atlas")).code() == ErrorCode::NotFound);
        REQUIRE(Error(ResourceError::invalid_config("atlas", "zero size")).code() == ErrorCode::InvalidArgument);
        REQUIRE(Error(ResourceError::has_references("atlas", 2)).code() == ErrorCode::InvalidState);
    }

    SECTION("ResourceError keeps the id") {
        Error err = ResourceError::has_references("atlas", 2);
        REQUIRE(err.is<ResourceError>());
        REQUIRE(err.as<ResourceError>()->resource_id == "atlas");
        REQUIRE(err.message().find("2 reference(s)") != std::string::npos);
    }

    SECTION("ShaderError codes") {
        REQUIRE(Error(ShaderError::template_not_found("quad")).code() == ErrorCode::NotFound);
        REQUIRE(Error(ShaderError::variant_not_found("quad", "glow")).code() == ErrorCode::NotFound);
        REQUIRE(Error(ShaderError::include_not_found("sdf")).code() == ErrorCode::NotFound);
        REQUIRE(Error(ShaderError::preprocess_failed("unbalanced")).code() == ErrorCode::ParseError);
        REQUIRE(Error(ShaderError::compile_failed("fragment", "src", "log")).code() == ErrorCode::CompileError);
        REQUIRE(Error(ShaderError::link_failed("log")).code() == ErrorCode::LinkError);
    }

    SECTION("ShaderError for_variant") {
        Error err = ShaderError::compile_failed("vertex", "void main() {}", "syntax error")
            .for_variant("quad", "tinted");
        const auto* shader = err.as<ShaderError>();
        REQUIRE(shader != nullptr);
        REQUIRE(shader->template_id == "quad");
        REQUIRE(shader->variant == "tinted");
        REQUIRE(shader->stage == "vertex");
        REQUIRE(shader->log == "syntax error");
    }

    SECTION("DeviceError codes") {
        REQUIRE(Error(DeviceError::creation_failed("texture", "oom")).code() == ErrorCode::OutOfMemory);
        REQUIRE(Error(DeviceError::unsupported("float textures")).code() == ErrorCode::NotSupported);
        REQUIRE(Error(DeviceError::invalid_handle("buffer")).code() == ErrorCode::InvalidArgument);
    }

    SECTION("FrameError") {
        Error err = FrameError::invalid_state("nested begin_frame()");
        REQUIRE(err.code() == ErrorCode::InvalidState);
        REQUIRE(err.is<FrameError>());
        REQUIRE_FALSE(err.is<ShaderError>());
        REQUIRE(err.as<ShaderError>() == nullptr);
    }
}

TEST_CASE("Error chain", "[core][error]") {
    SECTION("plain message") {
        REQUIRE(build_error_chain(Error(ErrorCode::IOError, "disk gone")) == "[IOError] disk gone");
    }

    SECTION("shader details and context") {
        Error err = ShaderError::compile_failed("fragment", "src", "bad token").for_variant("quad", "tinted");
        err.with_context("frame", "12");
        const auto chain = build_error_chain(err);
        REQUIRE(chain.find("[CompileError]") == 0);
        REQUIRE(chain.find("[ShaderError]") != std::string::npos);
        REQUIRE(chain.find("template: quad, variant: tinted") != std::string::npos);
        REQUIRE(chain.find("stage: fragment") != std::string::npos);
        REQUIRE(chain.find("{frame=12}") != std::string::npos);
    }

    SECTION("resource id") {
        const auto chain = build_error_chain(ResourceError::not_found("atlas"));
        REQUIRE(chain.find("(id: atlas)") != std::string::npos);
    }
}

// =============================================================================
// Result<T> Tests
// =============================================================================

TEST_CASE("Result construction", "[core][result]") {
    SECTION("Ok with value") {
        Result<int> r = Ok(42);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
        REQUIRE(r.value() == 42);
    }

    SECTION("Ok void") {
        Result<void> r = Ok();
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
    }

    SECTION("Err with message") {
        Result<int> r = Err<int>("Something failed");
        REQUIRE(r.is_err());
        REQUIRE_FALSE(r.is_ok());
        REQUIRE(r.error().message() == "Something failed");
    }

    SECTION("Err with Error object") {
        Error err(ErrorCode::NotFound, "Not found");
        Result<int> r = Err<int>(err);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::NotFound);
    }

    SECTION("Err void") {
        Result<void> r = Err(FrameError::invalid_state("idle"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().is<FrameError>());
        REQUIRE_THROWS(r.unwrap());
    }
}

TEST_CASE("Result value access", "[core][result]") {
    SECTION("value on Ok") {
        Result<std::string> r = Ok(std::string("hello"));
        REQUIRE(r.value() == "hello");
        REQUIRE(r->size() == 5);
    }

    SECTION("value_or on Err") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE(r.value_or(0) == 0);
    }

    SECTION("unwrap") {
        Result<int> ok = Ok(42);
        REQUIRE(ok.unwrap() == 42);

        Result<int> err = Err<int>(Error("boom"));
        REQUIRE_THROWS_AS(err.unwrap(), std::runtime_error);
    }

    SECTION("move value out") {
        Result<std::string> r = Ok(std::string("hello"));
        std::string s = std::move(r).value();
        REQUIRE(s == "hello");
    }
}

TEST_CASE("Result map operations", "[core][result]") {
    SECTION("map on Ok") {
        Result<int> r = Ok(21);
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == 42);
    }

    SECTION("map on Err keeps the error") {
        Result<int> r = Err<int>(Error(ErrorCode::ParseError, "bad"));
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_err());
        REQUIRE(r2.error().code() == ErrorCode::ParseError);
    }

    SECTION("and_then on Ok") {
        Result<int> r = Ok(42);
        auto r2 = r.and_then([](int x) -> Result<std::string> {
            return Ok(std::to_string(x));
        });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == "42");
    }

    SECTION("and_then on Err") {
        Result<int> r = Err<int>(Error("error"));
        auto r2 = r.and_then([](int x) -> Result<std::string> {
            return Ok(std::to_string(x));
        });
        REQUIRE(r2.is_err());
    }
}

TEST_CASE("Result with complex types", "[core][result]") {
    Result<std::vector<int>> r = Ok(std::vector<int>{1, 2, 3});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 3);
}
