#pragma once

/// @file batch.hpp
/// @brief Render batches and the per-frame batch optimizer

#include "fwd.hpp"
#include <lumen/gpu/types.hpp>
#include <lumen/gpu/uniform.hpp>
#include <lumen/shader/fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace lumen_render {

// =============================================================================
// RenderBatch
// =============================================================================

/// One draw against the batch's vertex array
struct DrawCall {
    lumen_gpu::PrimitiveMode mode = lumen_gpu::PrimitiveMode::Triangles;
    std::int32_t count = 0;
    std::int32_t offset = 0;
    std::uint32_t instances = 1;   // More than one issues an instanced draw
    bool indexed = false;
    lumen_gpu::IndexFormat index_format = lumen_gpu::IndexFormat::Uint16;

    [[nodiscard]] bool is_instanced() const noexcept { return instances > 1; }

    bool operator==(const DrawCall& other) const noexcept = default;
};

/// Draw work sharing one program, vertex array, texture set and uniform set
struct RenderBatch {
    std::string id;
    lumen_shader::ProgramPtr shader;
    lumen_gpu::VertexArrayHandle vertex_array;
    std::map<std::uint32_t, lumen_gpu::TextureHandle> textures;   // Unit to texture
    std::map<std::string, lumen_gpu::UniformValue> uniforms;
    std::vector<DrawCall> draw_calls;
    std::string sort_key;
};

/// Sort key grouping by program, then textures, then vertex array
[[nodiscard]] std::string make_sort_key(const RenderBatch& batch);

/// Same program, vertex array, texture mapping and uniform mapping
[[nodiscard]] bool can_merge(const RenderBatch& a, const RenderBatch& b);

// =============================================================================
// BatchOptimizer
// =============================================================================

struct BatchStats {
    std::size_t total_batches = 0;
    std::size_t total_draw_calls = 0;
};

/// Collects a frame's batches and merges compatible neighbours
///
/// Merging compares each batch only with the last merged result, so two
/// compatible batches end up together only when their sort keys place them
/// next to each other.
class BatchOptimizer {
public:
    /// Append a batch; an empty sort key is filled from make_sort_key()
    void add_batch(RenderBatch batch);

    /// Batches stably sorted by sort key
    [[nodiscard]] std::vector<RenderBatch> optimize_batches() const;

    /// Sorted batches with adjacent compatible ones folded together,
    /// draw calls concatenated in order
    [[nodiscard]] std::vector<RenderBatch> merge_batches() const;

    void clear() noexcept { m_batches.clear(); }

    [[nodiscard]] const std::vector<RenderBatch>& batches() const noexcept { return m_batches; }
    [[nodiscard]] std::size_t size() const noexcept { return m_batches.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_batches.empty(); }
    [[nodiscard]] BatchStats stats() const noexcept;

private:
    std::vector<RenderBatch> m_batches;
};

} // namespace lumen_render
