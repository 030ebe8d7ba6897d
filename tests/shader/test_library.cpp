/// @file test_library.cpp
/// @brief Tests for lumen_shader library and variant types

#include <catch2/catch_test_macros.hpp>
#include <lumen/shader/library.hpp>
#include <lumen/shader/preprocessor.hpp>
#include <set>
#include <string>

using namespace lumen_shader;

// =============================================================================
// ShaderVariant Tests
// =============================================================================

TEST_CASE("ShaderVariant: builder", "[shader][types]") {
    auto variant = ShaderVariant("lit")
        .with_define("USE_LIGHTS")
        .with_define("LIGHT_COUNT", 4)
        .with_define("GAMMA", 2.2)
        .with_define("TINT", "vec3(1.0)")
        .with_feature("lighting");

    REQUIRE(variant.name == "lit");
    REQUIRE(variant.has_define("USE_LIGHTS"));
    REQUIRE(std::get<bool>(variant.defines.at("USE_LIGHTS")));
    REQUIRE(std::get<std::int64_t>(variant.defines.at("LIGHT_COUNT")) == 4);
    REQUIRE(std::get<std::string>(variant.defines.at("TINT")) == "vec3(1.0)");
    REQUIRE(variant.features == std::vector<std::string>{"lighting"});
    REQUIRE_FALSE(variant.has_define("OTHER"));
}

TEST_CASE("ShaderVariant: header in name order", "[shader][types]") {
    auto variant = ShaderVariant("v").with_define("B", 2).with_define("A");
    REQUIRE(variant.to_header() == "#define A 1\n#define B 2\n");
}

TEST_CASE("ShaderTemplate: find_variant", "[shader][types]") {
    ShaderTemplate t;
    t.variants.emplace_back("first");
    t.variants.emplace_back("second");

    REQUIRE(t.find_variant("")->name == "first");
    REQUIRE(t.find_variant("second")->name == "second");
    REQUIRE(t.find_variant("third") == nullptr);

    ShaderTemplate empty;
    REQUIRE(empty.find_variant("") == nullptr);
}

TEST_CASE("ShaderVariantKey: ordering and text", "[shader][types]") {
    ShaderVariantKey a{"basic", "default"};
    ShaderVariantKey b{"basic", "premultiplied"};

    REQUIRE(a < b);
    REQUIRE(a == ShaderVariantKey{"basic", "default"});
    REQUIRE(a.to_string() == "basic/default");
}

// =============================================================================
// ShaderLibrary Tests
// =============================================================================

TEST_CASE("ShaderLibrary: chunk management", "[shader][library]") {
    ShaderLibrary library;
    REQUIRE(library.size() == 0);

    library.add_chunk("noise", "float noise(vec2 p);");
    REQUIRE(library.has_chunk("noise"));
    REQUIRE(*library.find_chunk("noise") == "float noise(vec2 p);");

    library.add_chunk("noise", "float noise(vec3 p);");
    REQUIRE(library.size() == 1);
    REQUIRE(*library.find_chunk("noise") == "float noise(vec3 p);");

    REQUIRE(library.remove_chunk("noise"));
    REQUIRE_FALSE(library.remove_chunk("noise"));
    REQUIRE(library.find_chunk("noise") == nullptr);
}

TEST_CASE("ShaderLibrary: built-in chunks", "[shader][library]") {
    auto library = ShaderLibrary::with_builtins();
    REQUIRE(library.chunk_names() == std::vector<std::string>{"color", "precision", "sdf", "transform"});
}

TEST_CASE("builtin_templates: ids and variants", "[shader][library]") {
    auto templates = builtin_templates();

    std::set<std::string> ids;
    for (const auto& t : templates) {
        ids.insert(t.id);
        REQUIRE_FALSE(t.variants.empty());
        REQUIRE(t.default_uniforms.count("u_transform") == 1);
        REQUIRE(t.default_uniforms.count("u_projection") == 1);
    }
    REQUIRE(ids == std::set<std::string>{"basic_shape", "solid_color", "texture", "sdf_circle"});

    const auto& texture = templates[2];
    REQUIRE(texture.id == "texture");
    REQUIRE(texture.find_variant("alpha_mask")->has_define("ALPHA_MASK"));
    REQUIRE(std::get<lumen_gpu::SamplerUnit>(texture.default_uniforms.at("u_texture")).unit == 0);
}

TEST_CASE("builtin_templates: every variant preprocesses", "[shader][library]") {
    auto library = ShaderLibrary::with_builtins();
    Preprocessor pre(library);

    for (const auto& t : builtin_templates()) {
        for (const auto& variant : t.variants) {
            INFO(t.id << "/" << variant.name);
            auto vs = pre.process(t.vertex_source, variant.defines);
            auto fs = pre.process(t.fragment_source, variant.defines);
            REQUIRE(vs.is_ok());
            REQUIRE(fs.is_ok());
            REQUIRE(vs->rfind("#version 330 core\n", 0) == 0);
            REQUIRE(fs->find("#include") == std::string::npos);
        }
    }
}
