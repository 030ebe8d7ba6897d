#pragma once

/// @file resource_manager.hpp
/// @brief GPU object lifecycle: creation, ownership, budgets and collection
///
/// The manager is the only owner of device textures, framebuffers and
/// standalone buffers it creates. Consumers hold string ids and express
/// ownership through add_ref/release_ref; destroy() refuses to free an
/// object that is still referenced.
///
/// Collection runs when update() finds the GC interval elapsed, when a
/// creation pushes a budget over its ceiling, or on force_gc(). Each run
/// frees READY, unreferenced, top-level objects that are older than
/// max_age or idle longer than max_unused.

#include "types.hpp"
#include "events.hpp"
#include "object_store.hpp"
#include "ref_counter.hpp"

#include <lumen/core/error.hpp>
#include <lumen/core/time.hpp>
#include <lumen/event/event_bus.hpp>
#include <lumen/gpu/device.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lumen_resource {

class ResourceManager {
public:
    ResourceManager(lumen_gpu::IGraphicsDevice& device,
                    lumen_event::EventBus& events,
                    ResourceManagerConfig config = {},
                    const lumen_core::TimeSource& time = lumen_core::system_time());
    ~ResourceManager();

    ResourceManager(const ResourceManager&) = delete;
    ResourceManager& operator=(const ResourceManager&) = delete;

    // =========================================================================
    // Creation
    // =========================================================================

    /// Create an object from any resource config; `data` seeds textures and buffers
    [[nodiscard]] lumen_core::Result<ObjectRef> create(const std::string& id,
                                                       const ResourceConfig& config,
                                                       const void* data = nullptr);

    [[nodiscard]] lumen_core::Result<ObjectRef> create_texture(const std::string& id,
                                                               const TextureConfig& config,
                                                               const void* pixels = nullptr);

    [[nodiscard]] lumen_core::Result<ObjectRef> create_framebuffer(const std::string& id,
                                                                   const FramebufferConfig& config);

    [[nodiscard]] lumen_core::Result<ObjectRef> create_buffer(const std::string& id,
                                                              const BufferConfig& config,
                                                              const void* data = nullptr);

    // =========================================================================
    // Access
    // =========================================================================

    /// Look up an object and record the access
    [[nodiscard]] std::optional<ObjectRef> get(const std::string& id);

    /// Record without touching access metadata
    [[nodiscard]] const ObjectRecord* peek(const std::string& id) const;

    [[nodiscard]] bool contains(const std::string& id) const { return m_store.contains(id); }

    /// Upload a sub-region of a texture
    [[nodiscard]] lumen_core::Result<void> update_texture(const std::string& id,
                                                          const lumen_gpu::TextureRegion& region,
                                                          const void* pixels);

    /// Recreate a framebuffer and its attachments at a new size
    [[nodiscard]] lumen_core::Result<ObjectRef> resize_framebuffer(const std::string& id,
                                                                   std::uint32_t width,
                                                                   std::uint32_t height);

    // =========================================================================
    // Ownership
    // =========================================================================

    std::uint32_t add_ref(const std::string& id);
    std::uint32_t release_ref(const std::string& id);

    [[nodiscard]] std::uint32_t ref_count(const std::string& id) const { return m_refs.count(id); }

    /// Run a callback when the id's count next falls to zero
    void on_zero_references(const std::string& id, RefCounter::ZeroCallback callback);

    /// Free an unreferenced object; false if missing, referenced, or an attachment
    bool destroy(const std::string& id);

    // =========================================================================
    // Collection
    // =========================================================================

    /// Collect unreferenced objects past their age or idle limit
    GcReport perform_gc(GcReason reason = GcReason::Manual);

    GcReport force_gc() { return perform_gc(GcReason::Manual); }

    /// Run a scheduled collection if the interval elapsed
    void update();

    /// Free every live object; the manager is unusable afterwards
    void dispose();

    [[nodiscard]] bool is_disposed() const noexcept { return m_disposed; }

    // =========================================================================
    // Statistics
    // =========================================================================

    [[nodiscard]] MemoryUsage memory_usage() const { return m_store.usage(); }
    [[nodiscard]] const MemoryBudget& memory_budget() const noexcept { return m_config.budget; }
    [[nodiscard]] ResourceStats resource_stats() const;
    [[nodiscard]] const ResourceManagerConfig& config() const noexcept { return m_config; }

    /// Live top-level objects
    [[nodiscard]] std::size_t object_count() const;

private:
    /// Device objects of a framebuffer not yet in the store
    struct FramebufferAllocation {
        struct Attachment {
            std::string id;
            lumen_gpu::TextureDesc desc;
            lumen_gpu::TextureHandle handle;
        };
        std::vector<Attachment> attachments;
        lumen_gpu::FramebufferHandle framebuffer;
    };

    [[nodiscard]] lumen_core::Result<void> check_usable(const std::string& id) const;
    [[nodiscard]] ObjectRecord make_record(const std::string& id, ObjectKind kind,
                                           std::size_t size, std::vector<std::string> tags) const;
    [[nodiscard]] ObjectRef make_ref(const ObjectStore::Entry& entry) const;

    /// Store a READY entry and announce it
    [[nodiscard]] lumen_core::Result<ObjectRef> commit(ObjectRecord record, GpuObject object);

    /// Free the device object and its dependents, then erase; returns bytes freed
    std::size_t dispose_entry(const std::string& id);
    void destroy_device_object(const GpuObject& object);

    /// Create attachments and framebuffer on the device; nothing is left allocated on failure
    [[nodiscard]] lumen_core::Result<FramebufferAllocation> allocate_framebuffer(
        const std::string& id, const FramebufferConfig& config);
    [[nodiscard]] lumen_core::Result<ObjectRef> commit_framebuffer(
        const std::string& id, const FramebufferConfig& config, const FramebufferAllocation& allocation);

    void check_memory_pressure(MemoryCategory category);

    lumen_gpu::IGraphicsDevice& m_device;
    lumen_event::EventBus& m_events;
    ResourceManagerConfig m_config;
    const lumen_core::TimeSource& m_time;

    ObjectStore m_store;
    RefCounter m_refs;
    std::map<std::string, FramebufferConfig> m_framebuffer_configs;

    lumen_core::TimePoint m_last_gc;
    bool m_gc_running = false;
    bool m_disposed = false;
};

} // namespace lumen_resource
