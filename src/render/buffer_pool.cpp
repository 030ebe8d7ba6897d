/// @file buffer_pool.cpp
/// @brief BufferPool implementation

#include <lumen/render/buffer_pool.hpp>
#include <lumen/core/log.hpp>

#include <algorithm>

namespace lumen_render {

using lumen_core::Err;
using lumen_core::Error;
using lumen_core::ErrorCode;
using lumen_core::Ok;
using lumen_core::Result;

BufferPool::~BufferPool() {
    clear();
}

Result<PooledBuffer*> BufferPool::acquire(lumen_gpu::BufferType type,
                                          std::size_t min_size,
                                          lumen_gpu::BufferUsage usage) {
    if (min_size == 0) {
        return Err<PooledBuffer*>(Error(ErrorCode::InvalidArgument, "Buffer size must be non-zero"));
    }

    if (m_reuse) {
        for (auto& buffer : m_buffers) {
            if (!buffer->in_use && buffer->type == type && buffer->usage == usage &&
                buffer->size >= min_size) {
                buffer->in_use = true;
                ++buffer->acquisitions;
                lumen_core::render_logger()->trace("Reusing {} buffer {} ({} bytes) for {} bytes",
                    lumen_gpu::buffer_type_name(type), buffer->handle.id, buffer->size, min_size);
                return Ok(buffer.get());
            }
        }
    }

    auto handle = m_device.create_buffer(lumen_gpu::BufferDesc{type, usage, min_size}, nullptr);
    if (!handle) {
        lumen_core::render_logger()->error("Buffer pool allocation of {} bytes failed: {}",
                                           min_size, handle.error().message());
        return Err<PooledBuffer*>(handle.error());
    }

    auto buffer = std::make_unique<PooledBuffer>();
    buffer->handle = *handle;
    buffer->type = type;
    buffer->usage = usage;
    buffer->size = min_size;
    buffer->in_use = true;
    buffer->acquisitions = 1;

    PooledBuffer* result = buffer.get();
    m_buffers.push_back(std::move(buffer));

    lumen_core::render_logger()->debug("Allocated {} {} buffer {} ({} bytes, pool size {})",
        lumen_gpu::buffer_usage_name(usage), lumen_gpu::buffer_type_name(type),
        result->handle.id, min_size, m_buffers.size());
    return Ok(result);
}

bool BufferPool::release(const PooledBuffer* buffer) {
    auto it = std::find_if(m_buffers.begin(), m_buffers.end(),
        [buffer](const std::unique_ptr<PooledBuffer>& entry) { return entry.get() == buffer; });
    if (it == m_buffers.end() || !(*it)->in_use) {
        lumen_core::render_logger()->warn("Released a buffer the pool does not hold in use");
        return false;
    }

    if (!m_reuse) {
        m_device.destroy_buffer((*it)->handle);
        m_buffers.erase(it);
        return true;
    }

    (*it)->in_use = false;
    return true;
}

std::size_t BufferPool::cleanup() {
    std::size_t removed = 0;
    for (auto it = m_buffers.begin(); it != m_buffers.end();) {
        auto& buffer = **it;
        if (buffer.in_use || m_device.is_buffer_valid(buffer.handle)) {
            ++it;
            continue;
        }
        m_device.destroy_buffer(buffer.handle);
        it = m_buffers.erase(it);
        ++removed;
    }

    if (removed > 0) {
        lumen_core::render_logger()->debug("Buffer pool dropped {} invalid buffer(s)", removed);
    }
    return removed;
}

void BufferPool::clear() {
    for (const auto& buffer : m_buffers) {
        m_device.destroy_buffer(buffer->handle);
    }
    m_buffers.clear();
}

BufferPoolStats BufferPool::stats() const {
    BufferPoolStats stats;
    stats.total_buffers = m_buffers.size();
    for (const auto& buffer : m_buffers) {
        if (buffer->in_use) {
            ++stats.in_use;
        }
        stats.total_bytes += buffer->size;
    }
    stats.available = stats.total_buffers - stats.in_use;
    return stats;
}

} // namespace lumen_render
