#pragma once

/// @file event.hpp
/// @brief Main include header for lumen_event

#include "fwd.hpp"
#include "event_bus.hpp"
