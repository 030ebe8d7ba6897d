/// @file resource_manager.cpp
/// @brief ResourceManager implementation

#include <lumen/resource/resource_manager.hpp>
#include <lumen/core/log.hpp>

#include <type_traits>
#include <utility>

namespace lumen_resource {

using lumen_core::Err;
using lumen_core::Error;
using lumen_core::ErrorCode;
using lumen_core::Ok;
using lumen_core::ResourceError;
using lumen_core::Result;

namespace {

std::vector<std::string> attachment_ids(const std::string& id, const FramebufferConfig& config) {
    std::vector<std::string> ids;
    for (std::size_t i = 0; i < config.color_formats.size(); ++i) {
        ids.push_back(color_attachment_id(id, i));
    }
    if (config.depth_format) {
        ids.push_back(depth_attachment_id(id));
    }
    return ids;
}

} // anonymous namespace

ResourceManager::ResourceManager(lumen_gpu::IGraphicsDevice& device,
                                 lumen_event::EventBus& events,
                                 ResourceManagerConfig config,
                                 const lumen_core::TimeSource& time)
    : m_device(device)
    , m_events(events)
    , m_config(std::move(config))
    , m_time(time)
    , m_last_gc(time.now()) {
    lumen_core::resource_logger()->debug(
        "Resource manager ready (budget {} bytes, gc {})",
        m_config.budget.total, m_config.gc.enabled ? "on" : "off");
}

ResourceManager::~ResourceManager() {
    dispose();
}

// =============================================================================
// Creation
// =============================================================================

Result<ObjectRef> ResourceManager::create(const std::string& id,
                                          const ResourceConfig& config,
                                          const void* data) {
    return std::visit([&](const auto& cfg) -> Result<ObjectRef> {
        using T = std::decay_t<decltype(cfg)>;
        if constexpr (std::is_same_v<T, TextureConfig>) {
            return create_texture(id, cfg, data);
        } else if constexpr (std::is_same_v<T, FramebufferConfig>) {
            return create_framebuffer(id, cfg);
        } else {
            return create_buffer(id, cfg, data);
        }
    }, config);
}

Result<ObjectRef> ResourceManager::create_texture(const std::string& id,
                                                  const TextureConfig& config,
                                                  const void* pixels) {
    if (auto usable = check_usable(id); !usable) {
        return Err<ObjectRef>(usable.error());
    }
    if (config.desc.width == 0 || config.desc.height == 0) {
        return Err<ObjectRef>(ResourceError::invalid_config(id, "texture has zero extent"));
    }

    auto handle = m_device.create_texture(config.desc, pixels);
    if (!handle) {
        lumen_core::resource_logger()->error("Texture '{}' creation failed: {}",
                                             id, handle.error().message());
        return Err<ObjectRef>(std::move(handle.error()).with_context("resource", id));
    }

    auto ref = commit(make_record(id, ObjectKind::Texture,
                                  lumen_gpu::texture_size_bytes(config.desc), config.tags),
                      *handle);
    if (!ref) {
        m_device.destroy_texture(*handle);
        return ref;
    }

    lumen_core::resource_logger()->debug("Created texture '{}' {}x{} {} ({} bytes)",
        id, config.desc.width, config.desc.height,
        lumen_gpu::texture_format_name(config.desc.format), ref->record.size_bytes);

    check_memory_pressure(MemoryCategory::Textures);
    return ref;
}

Result<ObjectRef> ResourceManager::create_framebuffer(const std::string& id,
                                                      const FramebufferConfig& config) {
    if (auto usable = check_usable(id); !usable) {
        return Err<ObjectRef>(usable.error());
    }
    if (config.width == 0 || config.height == 0) {
        return Err<ObjectRef>(ResourceError::invalid_config(id, "framebuffer has zero extent"));
    }
    if (config.color_formats.empty() && !config.depth_format) {
        return Err<ObjectRef>(ResourceError::invalid_config(id, "framebuffer has no attachments"));
    }
    if (config.depth_format && !lumen_gpu::is_depth_format(*config.depth_format)) {
        return Err<ObjectRef>(ResourceError::invalid_config(id, "depth attachment needs a depth format"));
    }

    for (const auto& attachment_id : attachment_ids(id, config)) {
        if (m_store.contains(attachment_id)) {
            return Err<ObjectRef>(ResourceError::duplicate_id(attachment_id));
        }
    }

    auto allocation = allocate_framebuffer(id, config);
    if (!allocation) {
        return Err<ObjectRef>(allocation.error());
    }
    return commit_framebuffer(id, config, *allocation);
}

Result<ResourceManager::FramebufferAllocation> ResourceManager::allocate_framebuffer(
    const std::string& id, const FramebufferConfig& config) {
    FramebufferAllocation allocation;
    for (std::size_t i = 0; i < config.color_formats.size(); ++i) {
        lumen_gpu::TextureDesc desc;
        desc.width = config.width;
        desc.height = config.height;
        desc.format = config.color_formats[i];
        allocation.attachments.push_back({color_attachment_id(id, i), desc, {}});
    }
    if (config.depth_format) {
        lumen_gpu::TextureDesc desc;
        desc.width = config.width;
        desc.height = config.height;
        desc.format = *config.depth_format;
        desc.min_filter = lumen_gpu::TextureFilter::Nearest;
        desc.mag_filter = lumen_gpu::TextureFilter::Nearest;
        allocation.attachments.push_back({depth_attachment_id(id), desc, {}});
    }

    auto rollback = [this, &allocation]() {
        for (const auto& attachment : allocation.attachments) {
            if (attachment.handle.is_valid()) {
                m_device.destroy_texture(attachment.handle);
            }
        }
    };

    lumen_gpu::FramebufferDesc fb_desc;
    fb_desc.width = config.width;
    fb_desc.height = config.height;

    for (auto& attachment : allocation.attachments) {
        auto handle = m_device.create_texture(attachment.desc, nullptr);
        if (!handle) {
            lumen_core::resource_logger()->error("Attachment '{}' creation failed: {}",
                                                 attachment.id, handle.error().message());
            rollback();
            return Err<FramebufferAllocation>(std::move(handle.error()).with_context("resource", id));
        }
        attachment.handle = *handle;
        if (lumen_gpu::is_depth_format(attachment.desc.format)) {
            fb_desc.depth_attachment = attachment.handle;
        } else {
            fb_desc.color_attachments.push_back(attachment.handle);
        }
    }

    auto framebuffer = m_device.create_framebuffer(fb_desc);
    if (!framebuffer) {
        lumen_core::resource_logger()->error("Framebuffer '{}' creation failed: {}",
                                             id, framebuffer.error().message());
        rollback();
        return Err<FramebufferAllocation>(std::move(framebuffer.error()).with_context("resource", id));
    }
    allocation.framebuffer = *framebuffer;
    return Ok(std::move(allocation));
}

Result<ObjectRef> ResourceManager::commit_framebuffer(const std::string& id,
                                                      const FramebufferConfig& config,
                                                      const FramebufferAllocation& allocation) {
    std::size_t total_size = 0;
    std::vector<std::string> dependents;
    for (const auto& attachment : allocation.attachments) {
        auto record = make_record(attachment.id, ObjectKind::Texture,
                                  lumen_gpu::texture_size_bytes(attachment.desc), config.tags);
        record.parent = id;
        total_size += record.size_bytes;
        dependents.push_back(attachment.id);

        auto committed = commit(std::move(record), attachment.handle);
        if (!committed) {
            return committed;
        }
    }

    auto record = make_record(id, ObjectKind::Framebuffer, total_size, config.tags);
    record.dependents = std::move(dependents);
    auto ref = commit(std::move(record), allocation.framebuffer);
    if (!ref) {
        return ref;
    }
    m_framebuffer_configs[id] = config;

    lumen_core::resource_logger()->debug("Created framebuffer '{}' {}x{} with {} attachment(s) ({} bytes)",
        id, config.width, config.height, allocation.attachments.size(), total_size);

    check_memory_pressure(MemoryCategory::Other);
    return ref;
}

Result<ObjectRef> ResourceManager::create_buffer(const std::string& id,
                                                 const BufferConfig& config,
                                                 const void* data) {
    if (auto usable = check_usable(id); !usable) {
        return Err<ObjectRef>(usable.error());
    }
    if (config.desc.size == 0) {
        return Err<ObjectRef>(ResourceError::invalid_config(id, "buffer has zero size"));
    }

    auto handle = m_device.create_buffer(config.desc, data);
    if (!handle) {
        lumen_core::resource_logger()->error("Buffer '{}' creation failed: {}",
                                             id, handle.error().message());
        return Err<ObjectRef>(std::move(handle.error()).with_context("resource", id));
    }

    auto ref = commit(make_record(id, ObjectKind::Buffer, config.desc.size, config.tags), *handle);
    if (!ref) {
        m_device.destroy_buffer(*handle);
        return ref;
    }

    lumen_core::resource_logger()->debug("Created {} buffer '{}' ({} bytes)",
        lumen_gpu::buffer_type_name(config.desc.type), id, config.desc.size);

    check_memory_pressure(MemoryCategory::Buffers);
    return ref;
}

// =============================================================================
// Access
// =============================================================================

std::optional<ObjectRef> ResourceManager::get(const std::string& id) {
    if (!m_store.touch(id, m_time.now())) {
        return std::nullopt;
    }
    return make_ref(*m_store.find(id));
}

const ObjectRecord* ResourceManager::peek(const std::string& id) const {
    const auto* entry = m_store.find(id);
    return entry ? &entry->record : nullptr;
}

Result<void> ResourceManager::update_texture(const std::string& id,
                                             const lumen_gpu::TextureRegion& region,
                                             const void* pixels) {
    auto* entry = m_store.find(id);
    if (!entry) {
        return Err(ResourceError::not_found(id));
    }
    const auto* handle = std::get_if<lumen_gpu::TextureHandle>(&entry->object);
    if (!handle) {
        return Err(ResourceError::invalid_config(id, "not a texture"));
    }

    auto uploaded = m_device.update_texture(*handle, region, pixels);
    if (!uploaded) {
        lumen_core::resource_logger()->error("Texture '{}' upload failed: {}",
                                             id, uploaded.error().message());
        return uploaded;
    }

    m_store.touch(id, m_time.now());
    return Ok();
}

Result<ObjectRef> ResourceManager::resize_framebuffer(const std::string& id,
                                                      std::uint32_t width,
                                                      std::uint32_t height) {
    const auto* entry = m_store.find(id);
    if (!entry) {
        return Err<ObjectRef>(ResourceError::not_found(id));
    }
    auto config_it = m_framebuffer_configs.find(id);
    if (entry->record.kind != ObjectKind::Framebuffer || config_it == m_framebuffer_configs.end()) {
        return Err<ObjectRef>(ResourceError::invalid_config(id, "not a framebuffer"));
    }
    if (width == 0 || height == 0) {
        return Err<ObjectRef>(ResourceError::invalid_config(id, "framebuffer has zero extent"));
    }
    if (auto refs = m_refs.count(id); refs > 0) {
        return Err<ObjectRef>(ResourceError::has_references(id, refs));
    }

    FramebufferConfig config = config_it->second;
    config.width = width;
    config.height = height;

    auto allocation = allocate_framebuffer(id, config);
    if (!allocation) {
        lumen_core::resource_logger()->warn("Resize of framebuffer '{}' to {}x{} failed, keeping {}x{}",
            id, width, height, config_it->second.width, config_it->second.height);
        return Err<ObjectRef>(allocation.error());
    }

    dispose_entry(id);
    lumen_core::resource_logger()->debug("Resizing framebuffer '{}' to {}x{}", id, width, height);
    return commit_framebuffer(id, config, *allocation);
}

// =============================================================================
// Ownership
// =============================================================================

std::uint32_t ResourceManager::add_ref(const std::string& id) {
    if (!m_store.contains(id)) {
        lumen_core::resource_logger()->warn("add_ref on unknown resource '{}'", id);
        return 0;
    }
    return m_refs.add_ref(id);
}

std::uint32_t ResourceManager::release_ref(const std::string& id) {
    return m_refs.release_ref(id);
}

void ResourceManager::on_zero_references(const std::string& id, RefCounter::ZeroCallback callback) {
    m_refs.on_zero(id, std::move(callback));
}

bool ResourceManager::destroy(const std::string& id) {
    const auto* entry = m_store.find(id);
    if (!entry) {
        lumen_core::resource_logger()->debug("destroy: '{}' not found", id);
        return false;
    }

    if (auto refs = m_refs.count(id); refs > 0) {
        lumen_core::resource_logger()->warn("Refusing to delete '{}': {} reference(s) outstanding", id, refs);
        m_events.publish(DeleteRejected{id, refs, "resource is still referenced"});
        return false;
    }

    if (entry->record.is_attachment() && m_store.contains(entry->record.parent)) {
        lumen_core::resource_logger()->warn("Refusing to delete '{}': attachment of live framebuffer '{}'",
                                            id, entry->record.parent);
        m_events.publish(DeleteRejected{id, 0, "attachment of live framebuffer '" + entry->record.parent + "'"});
        return false;
    }

    dispose_entry(id);
    return true;
}

// =============================================================================
// Collection
// =============================================================================

GcReport ResourceManager::perform_gc(GcReason reason) {
    if (m_gc_running || m_disposed) {
        return {};
    }
    m_gc_running = true;
    m_events.publish(GcStarted{reason});

    const auto now = m_time.now();
    std::vector<std::string> candidates;
    m_store.for_each([&](const ObjectStore::Entry& entry) {
        const auto& record = entry.record;
        if (record.state != LifecycleState::Ready || record.is_attachment()
            || !m_refs.has_no_references(record.id)) {
            return;
        }
        const bool too_old = now - record.created_at > m_config.gc.max_age;
        const bool idle = now - record.last_accessed > m_config.gc.max_unused;
        if (too_old || idle) {
            candidates.push_back(record.id);
        }
    });

    GcReport report;
    for (const auto& id : candidates) {
        // Event handlers may have referenced or freed a candidate meanwhile
        if (!m_store.contains(id) || !m_refs.has_no_references(id)) {
            continue;
        }
        report.freed_bytes += dispose_entry(id);
        ++report.freed_count;
    }

    m_last_gc = now;
    m_gc_running = false;

    if (report.freed_count > 0) {
        lumen_core::resource_logger()->info("GC ({}) freed {} object(s), {} bytes",
            gc_reason_name(reason), report.freed_count, report.freed_bytes);
    } else {
        lumen_core::resource_logger()->debug("GC ({}) found nothing to free", gc_reason_name(reason));
    }

    m_events.publish(GcCompleted{reason, report.freed_bytes, report.freed_count});
    return report;
}

void ResourceManager::update() {
    if (m_disposed || !m_config.gc.enabled) {
        return;
    }
    if (m_time.now() - m_last_gc >= m_config.gc.interval) {
        perform_gc(GcReason::Scheduled);
    }
}

void ResourceManager::dispose() {
    if (m_disposed) {
        return;
    }

    std::size_t freed = 0;
    for (const auto& id : m_store.ids()) {
        const auto* entry = m_store.find(id);
        if (entry && !entry->record.is_attachment()) {
            dispose_entry(id);
            ++freed;
        }
    }
    // Anything left is an attachment whose parent is already gone
    for (const auto& id : m_store.ids()) {
        dispose_entry(id);
    }

    m_refs.clear();
    m_framebuffer_configs.clear();
    m_disposed = true;
    lumen_core::resource_logger()->debug("Resource manager disposed ({} object(s) freed)", freed);
}

// =============================================================================
// Statistics
// =============================================================================

ResourceStats ResourceManager::resource_stats() const {
    ResourceStats stats;
    stats.textures = m_store.count(ObjectKind::Texture);
    stats.framebuffers = m_store.count(ObjectKind::Framebuffer);
    stats.buffers = m_store.count(ObjectKind::Buffer);
    stats.total_memory = m_store.usage().total();
    stats.utilization = m_config.budget.total > 0
        ? static_cast<double>(stats.total_memory) / static_cast<double>(m_config.budget.total)
        : 0.0;
    return stats;
}

std::size_t ResourceManager::object_count() const {
    std::size_t n = 0;
    m_store.for_each([&n](const ObjectStore::Entry& entry) {
        if (!entry.record.is_attachment()) {
            ++n;
        }
    });
    return n;
}

// =============================================================================
// Internals
// =============================================================================

Result<void> ResourceManager::check_usable(const std::string& id) const {
    if (m_disposed) {
        return Err(Error(ErrorCode::InvalidState, "Resource manager has been disposed"));
    }
    if (id.empty()) {
        return Err(ResourceError::invalid_config(id, "empty id"));
    }
    if (m_store.contains(id)) {
        return Err(ResourceError::duplicate_id(id));
    }
    return Ok();
}

ObjectRecord ResourceManager::make_record(const std::string& id, ObjectKind kind,
                                          std::size_t size, std::vector<std::string> tags) const {
    ObjectRecord record;
    record.id = id;
    record.kind = kind;
    record.state = LifecycleState::Creating;
    record.size_bytes = size;
    record.created_at = m_time.now();
    record.last_accessed = record.created_at;
    record.tags = std::move(tags);
    return record;
}

ObjectRef ResourceManager::make_ref(const ObjectStore::Entry& entry) const {
    return ObjectRef{entry.record.id, entry.object, entry.record};
}

Result<ObjectRef> ResourceManager::commit(ObjectRecord record, GpuObject object) {
    record.state = LifecycleState::Ready;
    const std::string id = record.id;

    auto inserted = m_store.insert(std::move(record), std::move(object));
    if (!inserted) {
        return Err<ObjectRef>(inserted.error());
    }

    const auto* entry = m_store.find(id);
    m_events.publish(ResourceCreated{entry->record});
    return Ok(make_ref(*entry));
}

std::size_t ResourceManager::dispose_entry(const std::string& id) {
    auto* entry = m_store.find(id);
    if (!entry) {
        return 0;
    }

    entry->record.state = LifecycleState::Disposing;
    destroy_device_object(entry->object);
    const auto dependents = entry->record.dependents;

    for (const auto& dependent : dependents) {
        dispose_entry(dependent);
    }

    auto taken = m_store.take(id);
    if (!taken) {
        return 0;
    }
    taken->record.state = LifecycleState::Disposed;
    m_refs.forget(id);
    m_framebuffer_configs.erase(id);

    lumen_core::resource_logger()->trace("Disposed {} '{}'", object_kind_name(taken->record.kind), id);
    m_events.publish(ResourceDisposed{taken->record});

    return taken->record.is_attachment() ? 0 : taken->record.size_bytes;
}

void ResourceManager::destroy_device_object(const GpuObject& object) {
    std::visit([this](const auto& handle) {
        using T = std::decay_t<decltype(handle)>;
        if constexpr (std::is_same_v<T, lumen_gpu::TextureHandle>) {
            m_device.destroy_texture(handle);
        } else if constexpr (std::is_same_v<T, lumen_gpu::FramebufferHandle>) {
            m_device.destroy_framebuffer(handle);
        } else if constexpr (std::is_same_v<T, lumen_gpu::BufferHandle>) {
            m_device.destroy_buffer(handle);
        }
    }, object);
}

void ResourceManager::check_memory_pressure(MemoryCategory category) {
    if (m_gc_running) {
        return;
    }

    auto usage = m_store.usage();
    const std::size_t category_budget = m_config.budget.for_category(category);
    const bool over_category = usage.for_category(category) > category_budget;
    const bool over_total = usage.total() > m_config.budget.total;
    if (!over_category && !over_total) {
        return;
    }

    if (over_category) {
        lumen_core::resource_logger()->debug("Memory pressure on {}: {} / {} bytes",
            memory_category_name(category), usage.for_category(category), category_budget);
        m_events.publish(MemoryPressure{category, usage.for_category(category), category_budget});
    }
    if (over_total) {
        lumen_core::resource_logger()->debug("Memory pressure on total: {} / {} bytes",
            usage.total(), m_config.budget.total);
        m_events.publish(MemoryPressure{std::nullopt, usage.total(), m_config.budget.total});
    }

    if (m_config.gc.enabled) {
        perform_gc(GcReason::MemoryPressure);
    }

    usage = m_store.usage();
    if (usage.for_category(category) > category_budget || usage.total() > m_config.budget.total) {
        lumen_core::resource_logger()->warn(
            "Still over budget after GC: {} {} / {} bytes, total {} / {} bytes",
            memory_category_name(category), usage.for_category(category), category_budget,
            usage.total(), m_config.budget.total);
    }
}

} // namespace lumen_resource
