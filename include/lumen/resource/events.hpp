#pragma once

/// @file events.hpp
/// @brief Events published by the resource manager

#include "types.hpp"

#include <optional>

namespace lumen_resource {

/// An object finished creation and is READY
struct ResourceCreated {
    ObjectRecord record;
};

/// An object was freed; the record is in the DISPOSED state
struct ResourceDisposed {
    ObjectRecord record;
};

/// Tracked usage exceeded a budget (category unset means the total budget)
struct MemoryPressure {
    std::optional<MemoryCategory> category;
    std::size_t used = 0;
    std::size_t budget = 0;
};

struct GcStarted {
    GcReason reason = GcReason::Manual;
};

struct GcCompleted {
    GcReason reason = GcReason::Manual;
    std::size_t freed_bytes = 0;
    std::size_t freed_count = 0;
};

/// destroy() refused to free an object
struct DeleteRejected {
    std::string id;
    std::uint32_t ref_count = 0;
    std::string reason;
};

} // namespace lumen_resource
