/// @file batch.cpp
/// @brief Batch sorting and merging

#include <lumen/render/batch.hpp>
#include <lumen/shader/program.hpp>

#include <algorithm>

namespace lumen_render {

std::string make_sort_key(const RenderBatch& batch) {
    std::string key = batch.shader ? batch.shader->key().to_string() : std::string("-");
    key += '|';
    for (const auto& [unit, texture] : batch.textures) {
        key += std::to_string(unit) + ':' + std::to_string(texture.id) + ',';
    }
    key += '|';
    key += std::to_string(batch.vertex_array.id);
    return key;
}

bool can_merge(const RenderBatch& a, const RenderBatch& b) {
    return a.shader == b.shader
        && a.vertex_array == b.vertex_array
        && a.textures == b.textures
        && a.uniforms == b.uniforms;
}

void BatchOptimizer::add_batch(RenderBatch batch) {
    if (batch.sort_key.empty()) {
        batch.sort_key = make_sort_key(batch);
    }
    m_batches.push_back(std::move(batch));
}

std::vector<RenderBatch> BatchOptimizer::optimize_batches() const {
    std::vector<RenderBatch> sorted = m_batches;
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const RenderBatch& a, const RenderBatch& b) { return a.sort_key < b.sort_key; });
    return sorted;
}

std::vector<RenderBatch> BatchOptimizer::merge_batches() const {
    std::vector<RenderBatch> merged;
    for (auto& batch : optimize_batches()) {
        if (!merged.empty() && can_merge(merged.back(), batch)) {
            auto& target = merged.back().draw_calls;
            target.insert(target.end(), batch.draw_calls.begin(), batch.draw_calls.end());
            continue;
        }
        merged.push_back(std::move(batch));
    }
    return merged;
}

BatchStats BatchOptimizer::stats() const noexcept {
    BatchStats stats;
    stats.total_batches = m_batches.size();
    for (const auto& batch : m_batches) {
        stats.total_draw_calls += batch.draw_calls.size();
    }
    return stats;
}

} // namespace lumen_render
