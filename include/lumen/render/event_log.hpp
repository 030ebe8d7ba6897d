#pragma once

/// @file event_log.hpp
/// @brief Logging subscriber for events their publishers do not log

#include <lumen/event/event_bus.hpp>

#include <vector>

namespace lumen_render {

/// Subscribe loggers to GcStarted and StateChanged. The other events are
/// logged by the component that publishes them.
/// Returns the subscriptions so they can be detached.
std::vector<lumen_event::SubscriberId> attach_event_logging(lumen_event::EventBus& events);

/// Remove subscriptions made by attach_event_logging()
void detach_event_logging(lumen_event::EventBus& events, const std::vector<lumen_event::SubscriberId>& ids);

} // namespace lumen_render
