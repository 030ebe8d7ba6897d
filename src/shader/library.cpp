/// @file library.cpp
/// @brief Built-in shader chunks and 2D templates

#include <lumen/shader/library.hpp>

namespace lumen_shader {

namespace {

// =============================================================================
// Chunks
// =============================================================================

const char* k_precision_chunk = R"(#ifdef GL_ES
precision mediump float;
#endif
)";

const char* k_transform_chunk = R"(uniform mat3 u_transform;
uniform mat3 u_projection;

vec4 lumen_project(vec2 position) {
    vec3 p = u_projection * u_transform * vec3(position, 1.0);
    return vec4(p.xy, 0.0, 1.0);
}
)";

const char* k_color_chunk = R"(vec4 lumen_premultiply(vec4 color) {
    return vec4(color.rgb * color.a, color.a);
}
)";

const char* k_sdf_chunk = R"(float lumen_sdf_circle(vec2 p, vec2 center, float radius) {
    return length(p - center) - radius;
}

float lumen_sdf_coverage(float distance) {
    float width = fwidth(distance);
    return 1.0 - smoothstep(-width, width, distance);
}
)";

// =============================================================================
// Templates
// =============================================================================

const char* k_basic_shape_vs = R"(#version 330 core
#include "transform"

in vec2 a_position;
in vec4 a_color;

out vec4 v_color;

void main() {
    gl_Position = lumen_project(a_position);
    v_color = a_color;
}
)";

const char* k_basic_shape_fs = R"(#version 330 core
#include "precision"
#include "color"

in vec4 v_color;
out vec4 frag_color;

#ifdef USE_GLOBAL_ALPHA
uniform float u_alpha;
#endif

void main() {
    vec4 color = v_color;
#ifdef USE_GLOBAL_ALPHA
    color.a *= u_alpha;
#endif
#ifdef PREMULTIPLIED_ALPHA
    color = lumen_premultiply(color);
#endif
    frag_color = color;
}
)";

const char* k_solid_color_vs = R"(#version 330 core
#include "transform"

in vec2 a_position;

void main() {
    gl_Position = lumen_project(a_position);
}
)";

const char* k_solid_color_fs = R"(#version 330 core
#include "precision"
#include "color"

uniform vec4 u_color;
out vec4 frag_color;

void main() {
#ifdef PREMULTIPLIED_ALPHA
    frag_color = lumen_premultiply(u_color);
#else
    frag_color = u_color;
#endif
}
)";

const char* k_texture_vs = R"(#version 330 core
#include "transform"

in vec2 a_position;
in vec2 a_tex_coord;
in vec4 a_color;

out vec2 v_tex_coord;
out vec4 v_color;

void main() {
    gl_Position = lumen_project(a_position);
    v_tex_coord = a_tex_coord;
    v_color = a_color;
}
)";

const char* k_texture_fs = R"(#version 330 core
#include "precision"
#include "color"

uniform sampler2D u_texture;

in vec2 v_tex_coord;
in vec4 v_color;
out vec4 frag_color;

void main() {
    vec4 color = texture(u_texture, v_tex_coord);
#ifdef ALPHA_MASK
    color = vec4(1.0, 1.0, 1.0, color.r);
#endif
#ifndef IGNORE_VERTEX_COLOR
    color *= v_color;
#endif
#ifdef PREMULTIPLIED_ALPHA
    color = lumen_premultiply(color);
#endif
    frag_color = color;
}
)";

const char* k_sdf_circle_vs = R"(#version 330 core
#include "transform"

in vec2 a_position;
in vec2 a_center;
in float a_radius;
in vec4 a_color;

out vec2 v_position;
out vec2 v_center;
out float v_radius;
out vec4 v_color;

void main() {
    gl_Position = lumen_project(a_position);
    v_position = a_position;
    v_center = a_center;
    v_radius = a_radius;
    v_color = a_color;
}
)";

const char* k_sdf_circle_fs = R"(#version 330 core
#include "precision"
#include "sdf"

in vec2 v_position;
in vec2 v_center;
in float v_radius;
in vec4 v_color;
out vec4 frag_color;

#ifdef USE_STROKE
uniform vec4 u_stroke_color;
uniform float u_stroke_width;
#endif

void main() {
    float d = lumen_sdf_circle(v_position, v_center, v_radius);
    vec4 color = v_color;
#ifdef USE_STROKE
    float inner = lumen_sdf_coverage(d + u_stroke_width);
    color = mix(u_stroke_color, v_color, inner);
#endif
    frag_color = vec4(color.rgb, color.a * lumen_sdf_coverage(d));
}
)";

std::map<std::string, lumen_gpu::UniformValue> transform_defaults() {
    return {
        {"u_transform", lumen_gpu::identity_mat3()},
        {"u_projection", lumen_gpu::identity_mat3()},
    };
}

} // anonymous namespace

// =============================================================================
// ShaderLibrary
// =============================================================================

ShaderLibrary ShaderLibrary::with_builtins() {
    ShaderLibrary library;
    library.add_chunk("precision", k_precision_chunk);
    library.add_chunk("transform", k_transform_chunk);
    library.add_chunk("color", k_color_chunk);
    library.add_chunk("sdf", k_sdf_chunk);
    return library;
}

std::vector<std::string> ShaderLibrary::chunk_names() const {
    std::vector<std::string> names;
    names.reserve(m_chunks.size());
    for (const auto& [name, source] : m_chunks) {
        names.push_back(name);
    }
    return names;
}

// =============================================================================
// Built-in templates
// =============================================================================

std::vector<ShaderTemplate> builtin_templates() {
    std::vector<ShaderTemplate> templates;

    {
        ShaderTemplate t;
        t.id = "basic_shape";
        t.vertex_source = k_basic_shape_vs;
        t.fragment_source = k_basic_shape_fs;
        t.variants.emplace_back("default");
        t.variants.push_back(ShaderVariant("global_alpha").with_define("USE_GLOBAL_ALPHA").with_feature("alpha"));
        t.variants.push_back(ShaderVariant("premultiplied").with_define("PREMULTIPLIED_ALPHA").with_feature("premultiplied"));
        t.default_uniforms = transform_defaults();
        t.default_uniforms["u_alpha"] = 1.0f;
        templates.push_back(std::move(t));
    }

    {
        ShaderTemplate t;
        t.id = "solid_color";
        t.vertex_source = k_solid_color_vs;
        t.fragment_source = k_solid_color_fs;
        t.variants.emplace_back("default");
        t.variants.push_back(ShaderVariant("premultiplied").with_define("PREMULTIPLIED_ALPHA").with_feature("premultiplied"));
        t.default_uniforms = transform_defaults();
        t.default_uniforms["u_color"] = lumen_gpu::Vec4{1.0f, 1.0f, 1.0f, 1.0f};
        templates.push_back(std::move(t));
    }

    {
        ShaderTemplate t;
        t.id = "texture";
        t.vertex_source = k_texture_vs;
        t.fragment_source = k_texture_fs;
        t.variants.emplace_back("default");
        t.variants.push_back(ShaderVariant("alpha_mask").with_define("ALPHA_MASK").with_feature("text"));
        t.variants.push_back(ShaderVariant("no_tint").with_define("IGNORE_VERTEX_COLOR"));
        t.variants.push_back(ShaderVariant("premultiplied").with_define("PREMULTIPLIED_ALPHA").with_feature("premultiplied"));
        t.default_uniforms = transform_defaults();
        t.default_uniforms["u_texture"] = lumen_gpu::SamplerUnit{0};
        templates.push_back(std::move(t));
    }

    {
        ShaderTemplate t;
        t.id = "sdf_circle";
        t.vertex_source = k_sdf_circle_vs;
        t.fragment_source = k_sdf_circle_fs;
        t.variants.emplace_back("fill");
        t.variants.push_back(ShaderVariant("stroke").with_define("USE_STROKE").with_feature("stroke"));
        t.default_uniforms = transform_defaults();
        t.default_uniforms["u_stroke_color"] = lumen_gpu::Vec4{0.0f, 0.0f, 0.0f, 1.0f};
        t.default_uniforms["u_stroke_width"] = 1.0f;
        templates.push_back(std::move(t));
    }

    return templates;
}

} // namespace lumen_shader
