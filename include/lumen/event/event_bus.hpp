#pragma once

/// @file event_bus.hpp
/// @brief Synchronous typed event bus for lumen_event
///
/// Events are plain structs delivered the moment they are published,
/// so observers see them in the order the underlying state changed.

#include "fwd.hpp"

#include <algorithm>
#include <any>
#include <cstddef>
#include <functional>
#include <map>
#include <typeindex>
#include <utility>
#include <vector>

namespace lumen_event {

// =============================================================================
// Priority
// =============================================================================

/// Delivery order among subscribers of the same event type
enum class Priority : std::uint8_t {
    Low = 0,
    Normal = 1,
    High = 2
};

// =============================================================================
// SubscriberId
// =============================================================================

/// Unique identifier for a subscription
struct SubscriberId {
    std::uint64_t id = 0;

    constexpr SubscriberId() = default;
    constexpr explicit SubscriberId(std::uint64_t value) : id(value) {}

    [[nodiscard]] constexpr bool is_valid() const noexcept { return id != 0; }

    constexpr auto operator<=>(const SubscriberId&) const noexcept = default;
    constexpr bool operator==(const SubscriberId&) const noexcept = default;
};

// =============================================================================
// EventBus
// =============================================================================

/// Type-erased handler
using DynamicHandler = std::function<void(const std::any&)>;

/// Publish/subscribe hub with immediate, in-order delivery
///
/// Single-threaded: publish() runs every matching handler before it
/// returns. A handler may publish further events; those are delivered
/// depth-first. Subscribing or unsubscribing inside a handler takes
/// effect from the next publish.
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // =========================================================================
    // Publishing
    // =========================================================================

    /// Deliver an event to every subscriber of its type
    template<typename E>
    void publish(const E& event) {
        auto it = m_handlers.find(std::type_index(typeid(E)));
        if (it == m_handlers.end() || it->second.empty()) {
            ++m_unobserved;
            return;
        }

        std::vector<Entry> snapshot = it->second;
        const std::any data = event;
        for (const auto& entry : snapshot) {
            entry.handler(data);
        }
        ++m_published;
    }

    // =========================================================================
    // Subscribing
    // =========================================================================

    /// Subscribe to an event type with Normal priority
    template<typename E, typename F>
    SubscriberId subscribe(F&& handler) {
        return subscribe_with_priority<E>(std::forward<F>(handler), Priority::Normal);
    }

    /// Subscribe to an event type; higher priority runs first, ties keep subscription order
    template<typename E, typename F>
    SubscriberId subscribe_with_priority(F&& handler, Priority priority) {
        SubscriberId sub_id(m_next_subscriber_id++);

        DynamicHandler wrapped = [h = std::forward<F>(handler)](const std::any& data) {
            if (const E* event = std::any_cast<E>(&data)) {
                h(*event);
            }
        };

        auto& handlers = m_handlers[std::type_index(typeid(E))];
        handlers.push_back(Entry{sub_id, priority, std::move(wrapped)});
        std::stable_sort(handlers.begin(), handlers.end(),
            [](const Entry& a, const Entry& b) {
                return static_cast<int>(a.priority) > static_cast<int>(b.priority);
            });

        return sub_id;
    }

    /// Remove a subscription
    void unsubscribe(SubscriberId id) {
        for (auto& [type_id, handlers] : m_handlers) {
            handlers.erase(
                std::remove_if(handlers.begin(), handlers.end(),
                    [id](const Entry& entry) { return entry.id == id; }),
                handlers.end());
        }
    }

    /// Remove all subscriptions
    void clear() {
        m_handlers.clear();
    }

    // =========================================================================
    // Statistics
    // =========================================================================

    /// Subscriber count for an event type
    template<typename E>
    [[nodiscard]] std::size_t subscriber_count() const {
        auto it = m_handlers.find(std::type_index(typeid(E)));
        return it != m_handlers.end() ? it->second.size() : 0;
    }

    /// Events delivered to at least one subscriber
    [[nodiscard]] std::uint64_t published_count() const noexcept { return m_published; }

    /// Events published with no subscriber listening
    [[nodiscard]] std::uint64_t unobserved_count() const noexcept { return m_unobserved; }

private:
    struct Entry {
        SubscriberId id;
        Priority priority;
        DynamicHandler handler;
    };

    std::map<std::type_index, std::vector<Entry>> m_handlers;
    std::uint64_t m_next_subscriber_id = 1;
    std::uint64_t m_published = 0;
    std::uint64_t m_unobserved = 0;
};

} // namespace lumen_event
