#pragma once

/// @file types.hpp
/// @brief GPU object records, resource configs and memory budgets

#include "fwd.hpp"
#include <lumen/core/time.hpp>
#include <lumen/gpu/types.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lumen_resource {

// =============================================================================
// Enums
// =============================================================================

/// Kind of driver-level object
enum class ObjectKind : std::uint8_t {
    Texture,
    Framebuffer,
    Buffer,
    Shader,
    Program,
};

/// Object lifecycle
enum class LifecycleState : std::uint8_t {
    Creating,
    Ready,
    Disposing,
    Disposed,
    Error,
};

/// Budget category an object is accounted under
enum class MemoryCategory : std::uint8_t {
    Textures,
    Buffers,
    Other,
};

/// Why a collection ran
enum class GcReason : std::uint8_t {
    Scheduled,
    MemoryPressure,
    Manual,
};

[[nodiscard]] const char* object_kind_name(ObjectKind kind);
[[nodiscard]] const char* lifecycle_state_name(LifecycleState state);
[[nodiscard]] const char* memory_category_name(MemoryCategory category);
[[nodiscard]] const char* gc_reason_name(GcReason reason);

/// Category an object kind is accounted under
[[nodiscard]] constexpr MemoryCategory category_for(ObjectKind kind) noexcept {
    switch (kind) {
        case ObjectKind::Texture: return MemoryCategory::Textures;
        case ObjectKind::Buffer: return MemoryCategory::Buffers;
        default: return MemoryCategory::Other;
    }
}

// =============================================================================
// ObjectRecord
// =============================================================================

/// Metadata for one live driver object
struct ObjectRecord {
    std::string id;
    ObjectKind kind = ObjectKind::Texture;
    LifecycleState state = LifecycleState::Creating;
    std::size_t size_bytes = 0;
    lumen_core::TimePoint created_at;
    lumen_core::TimePoint last_accessed;
    std::uint64_t access_count = 0;
    std::vector<std::string> tags;
    std::vector<std::string> dependents;   // Disposed together with this record
    std::string parent;                    // Owning record for attachments

    [[nodiscard]] bool is_attachment() const noexcept { return !parent.empty(); }
};

/// Device handle behind a record
using GpuObject = std::variant<
    std::monostate,
    lumen_gpu::TextureHandle,
    lumen_gpu::FramebufferHandle,
    lumen_gpu::BufferHandle
>;

/// Snapshot returned to callers of create/get
struct ObjectRef {
    std::string id;
    GpuObject object;
    ObjectRecord record;

    [[nodiscard]] lumen_gpu::TextureHandle texture() const {
        auto* h = std::get_if<lumen_gpu::TextureHandle>(&object);
        return h ? *h : lumen_gpu::TextureHandle::invalid();
    }

    [[nodiscard]] lumen_gpu::FramebufferHandle framebuffer() const {
        auto* h = std::get_if<lumen_gpu::FramebufferHandle>(&object);
        return h ? *h : lumen_gpu::FramebufferHandle::invalid();
    }

    [[nodiscard]] lumen_gpu::BufferHandle buffer() const {
        auto* h = std::get_if<lumen_gpu::BufferHandle>(&object);
        return h ? *h : lumen_gpu::BufferHandle::invalid();
    }
};

// =============================================================================
// Resource configs
// =============================================================================

/// Texture creation request
struct TextureConfig {
    lumen_gpu::TextureDesc desc;
    std::vector<std::string> tags;
};

/// Framebuffer creation request; attachments are created as textures
struct FramebufferConfig {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::vector<lumen_gpu::TextureFormat> color_formats{lumen_gpu::TextureFormat::Rgba8};
    std::optional<lumen_gpu::TextureFormat> depth_format;
    std::vector<std::string> tags;
};

/// Long-lived standalone buffer
struct BufferConfig {
    lumen_gpu::BufferDesc desc;
    std::vector<std::string> tags;
};

using ResourceConfig = std::variant<TextureConfig, FramebufferConfig, BufferConfig>;

/// Id of a framebuffer's i-th color attachment
[[nodiscard]] inline std::string color_attachment_id(const std::string& framebuffer_id, std::size_t index) {
    return framebuffer_id + "_color_" + std::to_string(index);
}

/// Id of a framebuffer's depth attachment
[[nodiscard]] inline std::string depth_attachment_id(const std::string& framebuffer_id) {
    return framebuffer_id + "_depth";
}

// =============================================================================
// Memory and GC configuration
// =============================================================================

/// Byte ceilings per category plus an overall ceiling
struct MemoryBudget {
    std::size_t total = 512 * 1024 * 1024;
    std::size_t textures = 256 * 1024 * 1024;
    std::size_t buffers = 128 * 1024 * 1024;
    std::size_t other = 128 * 1024 * 1024;

    [[nodiscard]] std::size_t for_category(MemoryCategory category) const noexcept {
        switch (category) {
            case MemoryCategory::Textures: return textures;
            case MemoryCategory::Buffers: return buffers;
            case MemoryCategory::Other: return other;
        }
        return other;
    }
};

/// Tracked bytes per category
struct MemoryUsage {
    std::size_t textures = 0;
    std::size_t buffers = 0;
    std::size_t other = 0;

    [[nodiscard]] std::size_t total() const noexcept { return textures + buffers + other; }

    [[nodiscard]] std::size_t for_category(MemoryCategory category) const noexcept {
        switch (category) {
            case MemoryCategory::Textures: return textures;
            case MemoryCategory::Buffers: return buffers;
            case MemoryCategory::Other: return other;
        }
        return other;
    }
};

/// Garbage collector settings
struct GcConfig {
    bool enabled = true;
    lumen_core::Milliseconds interval{5000};
    lumen_core::Milliseconds max_age{300000};
    lumen_core::Milliseconds max_unused{60000};
};

/// Resource manager settings
struct ResourceManagerConfig {
    MemoryBudget budget;
    GcConfig gc;
};

/// Outcome of one collection
struct GcReport {
    std::size_t freed_bytes = 0;
    std::size_t freed_count = 0;
};

/// Object counts and memory utilization
struct ResourceStats {
    std::size_t textures = 0;
    std::size_t framebuffers = 0;
    std::size_t buffers = 0;
    std::size_t total_memory = 0;
    double utilization = 0.0;   // total_memory / budget.total
};

} // namespace lumen_resource
