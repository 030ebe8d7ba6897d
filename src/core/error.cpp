/// @file error.cpp
/// @brief Error handling implementation for lumen_core
///
/// The error system is primarily template-based and header-only.
/// This file provides error formatting and explicit instantiations
/// for the Result types shared across modules.

#include <lumen/core/error.hpp>
#include <sstream>

namespace lumen_core {

namespace detail {

std::string format_resource_error(const ResourceError& err) {
    std::ostringstream oss;
    oss << "[ResourceError] " << err.message;
    if (!err.resource_id.empty()) {
        oss << " (id: " << err.resource_id << ")";
    }
    return oss.str();
}

std::string format_shader_error(const ShaderError& err) {
    std::ostringstream oss;
    oss << "[ShaderError] " << err.message;
    if (!err.template_id.empty()) {
        oss << " (template: " << err.template_id;
        if (!err.variant.empty()) {
            oss << ", variant: " << err.variant;
        }
        oss << ")";
    }
    if (!err.stage.empty()) {
        oss << " (stage: " << err.stage << ")";
    }
    return oss.str();
}

std::string format_device_error(const DeviceError& err) {
    std::ostringstream oss;
    oss << "[DeviceError] " << err.message;
    return oss.str();
}

std::string format_frame_error(const FrameError& err) {
    return "[FrameError] " + err.message;
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, ResourceError>) {
            oss << detail::format_resource_error(err);
        } else if constexpr (std::is_same_v<T, ShaderError>) {
            oss << detail::format_shader_error(err);
        } else if constexpr (std::is_same_v<T, DeviceError>) {
            oss << detail::format_device_error(err);
        } else if constexpr (std::is_same_v<T, FrameError>) {
            oss << detail::format_frame_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=" << value << "}";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::uint64_t, Error>;
template class Result<std::string, Error>;

} // namespace lumen_core
