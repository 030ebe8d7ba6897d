/// @file main.cpp
/// @brief Headless render layer demo
///
/// Drives the frame orchestrator against the null device: registers the
/// built-in shaders, allocates a texture and pooled buffers, submits a few
/// frames of sprite and circle batches and prints the resulting statistics.
///
/// Usage: lumen_render_demo [config.json] [frames]

#include <lumen/core/log.hpp>
#include <lumen/gpu/null_device.hpp>
#include <lumen/render/render.hpp>
#include <lumen/shader/program.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>

namespace {

lumen_render::RenderBatch make_batch(const std::string& id,
                                     const lumen_shader::ProgramPtr& program,
                                     lumen_gpu::VertexArrayHandle vertex_array,
                                     lumen_gpu::TextureHandle texture,
                                     std::uint32_t instances) {
    lumen_render::RenderBatch batch;
    batch.id = id;
    batch.shader = program;
    batch.vertex_array = vertex_array;
    if (texture.is_valid()) {
        batch.textures[0] = texture;
    }
    lumen_render::DrawCall call;
    call.count = 6;
    call.instances = instances;
    batch.draw_calls.push_back(call);
    return batch;
}

/// Print render layer statistics
void print_stats(const lumen_render::DetailedStats& stats) {
    spdlog::info("=== Render Statistics ===");
    spdlog::info("Frames: {}", stats.render.frame_count);
    spdlog::info("Draw calls: {} total, {} batched, {} instanced",
                 stats.render.draw_calls.total, stats.render.draw_calls.batched,
                 stats.render.draw_calls.instanced);
    spdlog::info("State calls: {} issued, {} skipped", stats.state.issued, stats.state.skipped);
    spdlog::info("Shaders: {} program(s), {} bytes, hit rate {:.2f}",
                 stats.shaders.programs, stats.shaders.memory_usage, stats.shaders.hit_rate);
    spdlog::info("Buffers: {} pooled, {} in use, {} bytes",
                 stats.buffers.total_buffers, stats.buffers.in_use, stats.buffers.total_bytes);
    spdlog::info("Resources: {} texture(s), {} buffer(s), {:.4f} of budget",
                 stats.resources.textures, stats.resources.buffers, stats.resources.utilization);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    lumen_render::RenderConfig config;
    if (argc > 1) {
        auto loaded = lumen_render::load_render_config(argv[1]);
        if (!loaded) {
            spdlog::error("{}", lumen_core::build_error_chain(loaded.error()));
            return EXIT_FAILURE;
        }
        config = std::move(*loaded);
    }
    const int frames = argc > 2 ? std::atoi(argv[2]) : 3;

    lumen_core::configure_logging(config.logging);
    spdlog::info("=== Lumen Render Demo ===");

    lumen_gpu::NullDevice device;
    lumen_render::FrameOrchestrator orchestrator(device, config);
    auto subscriptions = lumen_render::attach_event_logging(orchestrator.events());

    auto registered = orchestrator.shaders().register_builtin_templates();
    if (!registered) {
        spdlog::error("{}", lumen_core::build_error_chain(registered.error()));
        return EXIT_FAILURE;
    }
    orchestrator.warmup_shaders({{"texture", "default"}, {"sdf_circle", "fill"}});
    orchestrator.shaders().drain_compile_queue();

    lumen_resource::TextureConfig atlas_config;
    atlas_config.desc.width = 256;
    atlas_config.desc.height = 256;
    auto atlas = orchestrator.resources().create_texture("atlas", atlas_config);
    if (!atlas) {
        spdlog::error("{}", lumen_core::build_error_chain(atlas.error()));
        return EXIT_FAILURE;
    }

    auto vertex_array = device.create_vertex_array();
    if (!vertex_array) {
        spdlog::error("{}", lumen_core::build_error_chain(vertex_array.error()));
        return EXIT_FAILURE;
    }

    for (int frame = 0; frame < frames; ++frame) {
        auto begun = orchestrator.begin_frame();
        if (!begun) {
            spdlog::error("{}", lumen_core::build_error_chain(begun.error()));
            return EXIT_FAILURE;
        }

        orchestrator.set_viewport({0, 0, 1280, 720});
        orchestrator.set_blend_enabled(true);

        auto vertices = orchestrator.get_optimized_buffer(lumen_gpu::BufferType::Vertex, 4096,
                                                          lumen_gpu::BufferUsage::Dynamic);
        if (vertices) {
            orchestrator.bind_buffer(lumen_gpu::BufferType::Vertex, (*vertices)->handle);
        }

        auto sprite = orchestrator.get_optimized_shader("texture");
        auto circle = orchestrator.get_optimized_shader("sdf_circle", "stroke");
        if (!sprite || !circle) {
            spdlog::error("Shader lookup failed");
            return EXIT_FAILURE;
        }

        // Interleaved submissions; sorting groups them by program
        for (int i = 0; i < 4; ++i) {
            auto queued = orchestrator.add_batch(make_batch("sprite_" + std::to_string(i), *sprite,
                                                            *vertex_array, atlas->texture(), 1));
            if (queued) {
                queued = orchestrator.add_batch(make_batch("circle_" + std::to_string(i), *circle,
                                                           *vertex_array, lumen_gpu::TextureHandle{}, 8));
            }
            if (!queued) {
                spdlog::error("{}", lumen_core::build_error_chain(queued.error()));
                return EXIT_FAILURE;
            }
        }

        auto submitted = orchestrator.execute_optimized_render();
        if (!submitted) {
            spdlog::error("{}", lumen_core::build_error_chain(submitted.error()));
            return EXIT_FAILURE;
        }

        if (vertices) {
            orchestrator.release_buffer(*vertices);
        }

        auto ended = orchestrator.end_frame();
        if (!ended) {
            spdlog::error("{}", lumen_core::build_error_chain(ended.error()));
            return EXIT_FAILURE;
        }
        orchestrator.update();
    }

    print_stats(orchestrator.detailed_stats());
    spdlog::info("Device saw {} draw(s)", device.draws().size());

    lumen_render::detach_event_logging(orchestrator.events(), subscriptions);
    orchestrator.dispose();
    lumen_core::shutdown_logging();
    return EXIT_SUCCESS;
}
