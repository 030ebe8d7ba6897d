/// @file event_log.cpp
/// @brief Event logging subscriber

#include <lumen/render/event_log.hpp>
#include <lumen/render/events.hpp>
#include <lumen/core/log.hpp>
#include <lumen/resource/events.hpp>

namespace lumen_render {

std::vector<lumen_event::SubscriberId> attach_event_logging(lumen_event::EventBus& events) {
    using namespace lumen_resource;

    std::vector<lumen_event::SubscriberId> ids;

    ids.push_back(events.subscribe<GcStarted>([](const GcStarted& e) {
        lumen_core::resource_logger()->debug("GC started ({})", gc_reason_name(e.reason));
    }));
    ids.push_back(events.subscribe<StateChanged>([](const StateChanged& e) {
        lumen_core::render_logger()->trace("State change: {} (#{})", state_kind_name(e.kind), e.change_count);
    }));

    return ids;
}

void detach_event_logging(lumen_event::EventBus& events, const std::vector<lumen_event::SubscriberId>& ids) {
    for (const auto id : ids) {
        events.unsubscribe(id);
    }
}

} // namespace lumen_render
