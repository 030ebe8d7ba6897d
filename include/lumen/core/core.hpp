#pragma once

/// @file core.hpp
/// @brief Main include header for lumen_core

#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"
#include "time.hpp"
