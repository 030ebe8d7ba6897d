#pragma once

/// @file object_store.hpp
/// @brief Authoritative map of live GPU object records

#include "types.hpp"
#include <lumen/core/error.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace lumen_resource {

/// Map of id to record and device handle
///
/// Pure bookkeeping: the store never talks to the device. Iteration
/// order is id order.
class ObjectStore {
public:
    struct Entry {
        ObjectRecord record;
        GpuObject object;
    };

    ObjectStore() = default;

    /// Insert a new entry; fails with DuplicateId if the id is taken
    [[nodiscard]] lumen_core::Result<void> insert(ObjectRecord record, GpuObject object);

    /// Remove an entry, returning it
    std::optional<Entry> take(const std::string& id);

    [[nodiscard]] bool contains(const std::string& id) const {
        return m_entries.find(id) != m_entries.end();
    }

    [[nodiscard]] Entry* find(const std::string& id);
    [[nodiscard]] const Entry* find(const std::string& id) const;

    /// Record an access
    bool touch(const std::string& id, lumen_core::TimePoint now);

    /// Visit every entry in id order
    void for_each(const std::function<void(const Entry&)>& visitor) const;

    /// Ids of every entry in id order
    [[nodiscard]] std::vector<std::string> ids() const;

    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }

    [[nodiscard]] std::size_t count(ObjectKind kind) const;

    /// Bytes accounted under a category (attachments count through their parent)
    [[nodiscard]] std::size_t bytes(MemoryCategory category) const;

    [[nodiscard]] MemoryUsage usage() const;

    void clear() { m_entries.clear(); }

private:
    std::map<std::string, Entry> m_entries;
};

} // namespace lumen_resource
