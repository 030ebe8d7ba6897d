#pragma once

/// @file ref_counter.hpp
/// @brief Consumer ownership counts for object store entries

#include "fwd.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>

namespace lumen_resource {

/// Per-id reference counts with an optional zero callback
///
/// Counts never go below zero. A count falling from one to zero removes
/// the entry and then runs its callback once.
class RefCounter {
public:
    using ZeroCallback = std::function<void(const std::string& id)>;

    RefCounter() = default;

    /// Increment, returning the new count
    std::uint32_t add_ref(const std::string& id);

    /// Decrement, returning the new count; releasing an unreferenced id is a no-op
    std::uint32_t release_ref(const std::string& id);

    [[nodiscard]] std::uint32_t count(const std::string& id) const;

    [[nodiscard]] bool has_no_references(const std::string& id) const {
        return count(id) == 0;
    }

    /// Run a callback the next time the id's count reaches zero
    void on_zero(const std::string& id, ZeroCallback callback);

    /// Drop an id without running its callback
    void forget(const std::string& id);

    /// Ids currently tracked (referenced or waiting on a callback)
    [[nodiscard]] std::size_t tracked() const noexcept { return m_entries.size(); }

    void clear() { m_entries.clear(); }

private:
    struct Entry {
        std::uint32_t count = 0;
        ZeroCallback on_zero;
    };

    std::unordered_map<std::string, Entry> m_entries;
};

} // namespace lumen_resource
