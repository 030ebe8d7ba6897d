#pragma once

/// @file gpu.hpp
/// @brief Main include header for lumen_gpu

#include "fwd.hpp"
#include "types.hpp"
#include "uniform.hpp"
#include "device.hpp"
#include "null_device.hpp"
