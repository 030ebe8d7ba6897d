#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for lumen_event module

#include <cstdint>

namespace lumen_event {

enum class Priority : std::uint8_t;
struct SubscriberId;
class EventBus;

} // namespace lumen_event
