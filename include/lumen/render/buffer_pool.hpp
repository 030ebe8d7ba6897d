#pragma once

/// @file buffer_pool.hpp
/// @brief Reusable device buffer allocations

#include "fwd.hpp"
#include <lumen/core/error.hpp>
#include <lumen/gpu/device.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace lumen_render {

/// Device buffer owned by the pool
///
/// Exclusively held by one caller between acquire() and release().
struct PooledBuffer {
    lumen_gpu::BufferHandle handle;
    lumen_gpu::BufferType type = lumen_gpu::BufferType::Vertex;
    lumen_gpu::BufferUsage usage = lumen_gpu::BufferUsage::Static;
    std::size_t size = 0;
    bool in_use = false;
    std::uint32_t acquisitions = 0;
};

/// Pool statistics
struct BufferPoolStats {
    std::size_t total_buffers = 0;
    std::size_t in_use = 0;
    std::size_t available = 0;
    std::size_t total_bytes = 0;
};

/// First-fit pool of device buffers keyed by type and usage
class BufferPool {
public:
    explicit BufferPool(lumen_gpu::IGraphicsDevice& device) : m_device(device) {}
    ~BufferPool();

    BufferPool(const BufferPool&) = delete;
    BufferPool& operator=(const BufferPool&) = delete;

    /// Idle buffer of matching type and usage with at least `min_size` bytes,
    /// or a new allocation when none fits
    [[nodiscard]] lumen_core::Result<PooledBuffer*> acquire(
        lumen_gpu::BufferType type,
        std::size_t min_size,
        lumen_gpu::BufferUsage usage = lumen_gpu::BufferUsage::Static);

    /// Return a buffer to the pool; false if it is not an in-use pool buffer.
    /// With reuse disabled the buffer is destroyed and the pointer dangles.
    bool release(const PooledBuffer* buffer);

    /// Drop idle entries whose device buffer is no longer valid
    std::size_t cleanup();

    /// Destroy every pooled buffer
    void clear();

    void set_reuse_enabled(bool enabled) noexcept { m_reuse = enabled; }
    [[nodiscard]] bool reuse_enabled() const noexcept { return m_reuse; }

    [[nodiscard]] BufferPoolStats stats() const;
    [[nodiscard]] std::size_t size() const noexcept { return m_buffers.size(); }

private:
    lumen_gpu::IGraphicsDevice& m_device;
    std::vector<std::unique_ptr<PooledBuffer>> m_buffers;
    bool m_reuse = true;
};

} // namespace lumen_render
