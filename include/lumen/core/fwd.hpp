#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for lumen_core module

#include <cstdint>

namespace lumen_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct ResourceError;
struct ShaderError;
struct DeviceError;
struct FrameError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

// =============================================================================
// Time
// =============================================================================

class TimeSource;
class SystemTimeSource;
class ManualTimeSource;

} // namespace lumen_core
