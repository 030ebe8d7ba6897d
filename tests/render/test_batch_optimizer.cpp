/// @file test_batch_optimizer.cpp
/// @brief Tests for lumen_render BatchOptimizer

#include <catch2/catch_test_macros.hpp>
#include <lumen/render/batch.hpp>
#include <lumen/shader/program.hpp>

#include <memory>

using namespace lumen_render;

namespace {

lumen_shader::ProgramPtr make_program(const std::string& name, std::uint64_t handle) {
    return std::make_shared<lumen_shader::ShaderProgram>(
        lumen_shader::ShaderVariantKey{name, "default"},
        lumen_gpu::ProgramHandle{handle},
        lumen_gpu::ProgramReflection{},
        std::map<std::string, lumen_gpu::UniformValue>{});
}

RenderBatch make_batch(const std::string& id, lumen_shader::ProgramPtr shader, std::int32_t count,
                       std::string sort_key = "key") {
    RenderBatch batch;
    batch.id = id;
    batch.shader = std::move(shader);
    batch.vertex_array = lumen_gpu::VertexArrayHandle{1};
    batch.textures[0] = lumen_gpu::TextureHandle{5};
    batch.uniforms["u_alpha"] = 1.0f;
    batch.draw_calls.push_back(DrawCall{lumen_gpu::PrimitiveMode::Triangles, count, 0});
    batch.sort_key = std::move(sort_key);
    return batch;
}

} // namespace

TEST_CASE("BatchOptimizer: stable sort by key", "[render][batch]") {
    auto shader = make_program("quad", 1);
    BatchOptimizer optimizer;
    optimizer.add_batch(make_batch("b1", shader, 3, "b"));
    optimizer.add_batch(make_batch("a1", shader, 3, "a"));
    optimizer.add_batch(make_batch("b2", shader, 3, "b"));
    optimizer.add_batch(make_batch("a2", shader, 3, "a"));

    auto sorted = optimizer.optimize_batches();
    REQUIRE(sorted.size() == 4);
    REQUIRE(sorted[0].id == "a1");
    REQUIRE(sorted[1].id == "a2");
    REQUIRE(sorted[2].id == "b1");
    REQUIRE(sorted[3].id == "b2");

    // Insertion order is untouched
    REQUIRE(optimizer.batches()[0].id == "b1");
}

TEST_CASE("BatchOptimizer: identical batches merge in order", "[render][batch]") {
    auto shader = make_program("quad", 1);
    BatchOptimizer optimizer;
    optimizer.add_batch(make_batch("first", shader, 6));
    optimizer.add_batch(make_batch("second", shader, 12));

    auto merged = optimizer.merge_batches();
    REQUIRE(merged.size() == 1);
    REQUIRE(merged[0].id == "first");
    REQUIRE(merged[0].draw_calls.size() == 2);
    REQUIRE(merged[0].draw_calls[0].count == 6);
    REQUIRE(merged[0].draw_calls[1].count == 12);

    // Merging never alters the collected batches
    REQUIRE(optimizer.size() == 2);
    REQUIRE(optimizer.stats().total_draw_calls == 2);
}

TEST_CASE("BatchOptimizer: any difference keeps batches apart", "[render][batch]") {
    auto shader = make_program("quad", 1);
    BatchOptimizer optimizer;
    auto first = make_batch("first", shader, 6);
    auto second = make_batch("second", shader, 6);

    SECTION("shader") {
        second.shader = make_program("quad", 2);
    }
    SECTION("vertex array") {
        second.vertex_array = lumen_gpu::VertexArrayHandle{2};
    }
    SECTION("texture") {
        second.textures[0] = lumen_gpu::TextureHandle{6};
    }
    SECTION("extra texture unit") {
        second.textures[1] = lumen_gpu::TextureHandle{5};
    }
    SECTION("uniform value") {
        second.uniforms["u_alpha"] = 0.5f;
    }
    SECTION("uniform shape") {
        second.uniforms["u_alpha"] = std::int32_t{1};
    }

    REQUIRE_FALSE(can_merge(first, second));
    optimizer.add_batch(std::move(first));
    optimizer.add_batch(std::move(second));
    REQUIRE(optimizer.merge_batches().size() == 2);
}

TEST_CASE("BatchOptimizer: merge only considers neighbours", "[render][batch]") {
    auto quad = make_program("quad", 1);
    auto circle = make_program("circle", 2);

    BatchOptimizer optimizer;
    optimizer.add_batch(make_batch("q1", quad, 3, "1"));
    optimizer.add_batch(make_batch("c1", circle, 3, "2"));
    optimizer.add_batch(make_batch("q2", quad, 3, "3"));

    auto merged = optimizer.merge_batches();
    REQUIRE(merged.size() == 3);
    REQUIRE(merged[0].id == "q1");
    REQUIRE(merged[1].id == "c1");
    REQUIRE(merged[2].id == "q2");
}

TEST_CASE("BatchOptimizer: default sort key groups by program", "[render][batch]") {
    auto quad = make_program("quad", 1);
    auto circle = make_program("circle", 2);

    BatchOptimizer optimizer;
    optimizer.add_batch(make_batch("q1", quad, 3, ""));
    optimizer.add_batch(make_batch("c1", circle, 3, ""));
    optimizer.add_batch(make_batch("q2", quad, 3, ""));

    REQUIRE(optimizer.batches()[0].sort_key == make_sort_key(optimizer.batches()[0]));

    auto merged = optimizer.merge_batches();
    REQUIRE(merged.size() == 2);
    REQUIRE(merged[0].id == "c1");
    REQUIRE(merged[1].id == "q1");
    REQUIRE(merged[1].draw_calls.size() == 2);
}

TEST_CASE("BatchOptimizer: clear", "[render][batch]") {
    BatchOptimizer optimizer;
    optimizer.add_batch(make_batch("a", make_program("quad", 1), 3));
    REQUIRE_FALSE(optimizer.empty());

    optimizer.clear();
    REQUIRE(optimizer.empty());
    REQUIRE(optimizer.merge_batches().empty());
    REQUIRE(optimizer.stats().total_batches == 0);
}
