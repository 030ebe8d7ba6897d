#pragma once

/// @file resource.hpp
/// @brief Main include header for lumen_resource

#include "fwd.hpp"
#include "types.hpp"
#include "events.hpp"
#include "object_store.hpp"
#include "ref_counter.hpp"
#include "resource_manager.hpp"
