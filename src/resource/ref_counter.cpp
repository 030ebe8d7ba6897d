/// @file ref_counter.cpp
/// @brief RefCounter implementation

#include <lumen/resource/ref_counter.hpp>

#include <utility>

namespace lumen_resource {

std::uint32_t RefCounter::add_ref(const std::string& id) {
    return ++m_entries[id].count;
}

std::uint32_t RefCounter::release_ref(const std::string& id) {
    auto it = m_entries.find(id);
    if (it == m_entries.end() || it->second.count == 0) {
        return 0;
    }

    if (--it->second.count > 0) {
        return it->second.count;
    }

    // Erase first so the callback may take a fresh reference
    ZeroCallback callback = std::move(it->second.on_zero);
    m_entries.erase(it);
    if (callback) {
        callback(id);
    }
    return 0;
}

std::uint32_t RefCounter::count(const std::string& id) const {
    auto it = m_entries.find(id);
    return it != m_entries.end() ? it->second.count : 0;
}

void RefCounter::on_zero(const std::string& id, ZeroCallback callback) {
    m_entries[id].on_zero = std::move(callback);
}

void RefCounter::forget(const std::string& id) {
    m_entries.erase(id);
}

} // namespace lumen_resource
