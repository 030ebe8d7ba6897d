/// @file object_store.cpp
/// @brief ObjectStore implementation

#include <lumen/resource/object_store.hpp>

namespace lumen_resource {

lumen_core::Result<void> ObjectStore::insert(ObjectRecord record, GpuObject object) {
    if (contains(record.id)) {
        return lumen_core::Err(lumen_core::ResourceError::duplicate_id(record.id));
    }
    std::string id = record.id;
    m_entries.emplace(std::move(id), Entry{std::move(record), std::move(object)});
    return lumen_core::Ok();
}

std::optional<ObjectStore::Entry> ObjectStore::take(const std::string& id) {
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    Entry entry = std::move(it->second);
    m_entries.erase(it);
    return entry;
}

ObjectStore::Entry* ObjectStore::find(const std::string& id) {
    auto it = m_entries.find(id);
    return it != m_entries.end() ? &it->second : nullptr;
}

const ObjectStore::Entry* ObjectStore::find(const std::string& id) const {
    auto it = m_entries.find(id);
    return it != m_entries.end() ? &it->second : nullptr;
}

bool ObjectStore::touch(const std::string& id, lumen_core::TimePoint now) {
    auto* entry = find(id);
    if (!entry) {
        return false;
    }
    entry->record.last_accessed = now;
    ++entry->record.access_count;
    return true;
}

void ObjectStore::for_each(const std::function<void(const Entry&)>& visitor) const {
    for (const auto& [id, entry] : m_entries) {
        visitor(entry);
    }
}

std::vector<std::string> ObjectStore::ids() const {
    std::vector<std::string> result;
    result.reserve(m_entries.size());
    for (const auto& [id, entry] : m_entries) {
        result.push_back(id);
    }
    return result;
}

std::size_t ObjectStore::count(ObjectKind kind) const {
    std::size_t n = 0;
    for (const auto& [id, entry] : m_entries) {
        if (entry.record.kind == kind && !entry.record.is_attachment()) {
            ++n;
        }
    }
    return n;
}

std::size_t ObjectStore::bytes(MemoryCategory category) const {
    std::size_t total = 0;
    for (const auto& [id, entry] : m_entries) {
        if (!entry.record.is_attachment() && category_for(entry.record.kind) == category) {
            total += entry.record.size_bytes;
        }
    }
    return total;
}

MemoryUsage ObjectStore::usage() const {
    MemoryUsage usage;
    usage.textures = bytes(MemoryCategory::Textures);
    usage.buffers = bytes(MemoryCategory::Buffers);
    usage.other = bytes(MemoryCategory::Other);
    return usage;
}

} // namespace lumen_resource
