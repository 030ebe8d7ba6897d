/// @file time.cpp
/// @brief Shared system time source

#include <lumen/core/time.hpp>

namespace lumen_core {

const TimeSource& system_time() {
    static const SystemTimeSource source;
    return source;
}

} // namespace lumen_core
