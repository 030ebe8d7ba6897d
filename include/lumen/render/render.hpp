#pragma once

/// @file render.hpp
/// @brief Main include header for lumen_render

#include "fwd.hpp"
#include "events.hpp"
#include "config.hpp"
#include "buffer_pool.hpp"
#include "state_cache.hpp"
#include "batch.hpp"
#include "event_log.hpp"
#include "frame_orchestrator.hpp"
