#pragma once

/// @file shader.hpp
/// @brief Main include header for lumen_shader

#include "fwd.hpp"
#include "types.hpp"
#include "events.hpp"
#include "library.hpp"
#include "preprocessor.hpp"
#include "program.hpp"
#include "shader_cache.hpp"
