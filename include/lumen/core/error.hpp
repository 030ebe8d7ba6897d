#pragma once

/// @file error.hpp
/// @brief Error handling types for lumen_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace lumen_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    CompileError,
    LinkError,
    OutOfMemory,
    NotSupported,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::CompileError: return "CompileError";
        case ErrorCode::LinkError: return "LinkError";
        case ErrorCode::OutOfMemory: return "OutOfMemory";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// GPU object store / resource manager errors
struct ResourceError {
    enum class Kind : std::uint8_t {
        DuplicateId,     // Id already present in the object store
        NotFound,        // No object with this id
        InvalidConfig,   // Zero-sized or otherwise unusable description
        HasReferences,   // Operation requires a zero reference count
    };

    Kind kind;
    std::string message;
    std::string resource_id;

    [[nodiscard]] static ResourceError duplicate_id(const std::string& id) {
        return ResourceError{Kind::DuplicateId, "Resource already exists: " + id, id};
    }

    [[nodiscard]] static ResourceError not_found(const std::string& id) {
        return ResourceError{Kind::NotFound, "Resource not found: " + id, id};
    }

    [[nodiscard]] static ResourceError invalid_config(const std::string& id, const std::string& reason) {
        return ResourceError{Kind::InvalidConfig, "Invalid config for '" + id + "': " + reason, id};
    }

    [[nodiscard]] static ResourceError has_references(const std::string& id, std::uint32_t count) {
        return ResourceError{Kind::HasReferences,
            "Resource '" + id + "' still has " + std::to_string(count) + " reference(s)", id};
    }
};

/// Shader template, preprocessing and program errors
struct ShaderError {
    enum class Kind : std::uint8_t {
        TemplateNotFound,   // Unknown template id
        VariantNotFound,    // Template has no such variant
        IncludeNotFound,    // #include target missing from the library
        PreprocessFailed,   // Unbalanced or malformed directives
        CompileFailed,      // Stage compilation failed
        LinkFailed,         // Program link failed
    };

    Kind kind;
    std::string message;
    std::string template_id;
    std::string variant;
    std::string stage;    // For CompileFailed
    std::string source;   // For CompileFailed (processed source)
    std::string log;      // Device info log

    [[nodiscard]] static ShaderError template_not_found(const std::string& id) {
        return ShaderError{Kind::TemplateNotFound, "Shader template not found: " + id, id, {}, {}, {}, {}};
    }

    [[nodiscard]] static ShaderError variant_not_found(const std::string& id, const std::string& variant) {
        return ShaderError{Kind::VariantNotFound,
            "Variant '" + variant + "' not found in template '" + id + "'", id, variant, {}, {}, {}};
    }

    [[nodiscard]] static ShaderError include_not_found(const std::string& include) {
        return ShaderError{Kind::IncludeNotFound, "Include not found: " + include, {}, {}, {}, {}, {}};
    }

    [[nodiscard]] static ShaderError preprocess_failed(const std::string& reason) {
        return ShaderError{Kind::PreprocessFailed, "Preprocess failed: " + reason, {}, {}, {}, {}, {}};
    }

    [[nodiscard]] static ShaderError compile_failed(const std::string& stage_name,
                                                    const std::string& processed_source,
                                                    const std::string& info_log) {
        return ShaderError{Kind::CompileFailed,
            "Failed to compile " + stage_name + " shader: " + info_log,
            {}, {}, stage_name, processed_source, info_log};
    }

    [[nodiscard]] static ShaderError link_failed(const std::string& info_log) {
        return ShaderError{Kind::LinkFailed, "Failed to link program: " + info_log, {}, {}, {}, {}, info_log};
    }

    /// Attach the variant key the failure belongs to
    [[nodiscard]] ShaderError for_variant(const std::string& id, const std::string& variant_name) && {
        template_id = id;
        variant = variant_name;
        return std::move(*this);
    }
};

/// Graphics device errors
struct DeviceError {
    enum class Kind : std::uint8_t {
        CreationFailed,   // Driver refused to create an object
        Unsupported,      // Feature or format not available
        InvalidHandle,    // Handle unknown to the device
    };

    Kind kind;
    std::string message;
    std::string object;

    [[nodiscard]] static DeviceError creation_failed(const std::string& what, const std::string& reason) {
        return DeviceError{Kind::CreationFailed, "Failed to create " + what + ": " + reason, what};
    }

    [[nodiscard]] static DeviceError unsupported(const std::string& what) {
        return DeviceError{Kind::Unsupported, "Unsupported: " + what, what};
    }

    [[nodiscard]] static DeviceError invalid_handle(const std::string& what) {
        return DeviceError{Kind::InvalidHandle, "Invalid " + what + " handle", what};
    }
};

/// Frame protocol errors
struct FrameError {
    enum class Kind : std::uint8_t {
        InvalidState,   // Call not allowed in the current frame state
    };

    Kind kind;
    std::string message;

    [[nodiscard]] static FrameError invalid_state(const std::string& reason) {
        return FrameError{Kind::InvalidState, "Invalid frame state: " + reason};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        ResourceError,
        ShaderError,
        DeviceError,
        FrameError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(ResourceError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ShaderError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(DeviceError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(FrameError err) : m_code(ErrorCode::InvalidState), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(ResourceError::Kind kind) {
        switch (kind) {
            case ResourceError::Kind::DuplicateId: return ErrorCode::AlreadyExists;
            case ResourceError::Kind::NotFound: return ErrorCode::NotFound;
            case ResourceError::Kind::InvalidConfig: return ErrorCode::InvalidArgument;
            case ResourceError::Kind::HasReferences: return ErrorCode::InvalidState;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ShaderError::Kind kind) {
        switch (kind) {
            case ShaderError::Kind::TemplateNotFound: return ErrorCode::NotFound;
            case ShaderError::Kind::VariantNotFound: return ErrorCode::NotFound;
            case ShaderError::Kind::IncludeNotFound: return ErrorCode::NotFound;
            case ShaderError::Kind::PreprocessFailed: return ErrorCode::ParseError;
            case ShaderError::Kind::CompileFailed: return ErrorCode::CompileError;
            case ShaderError::Kind::LinkFailed: return ErrorCode::LinkError;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(DeviceError::Kind kind) {
        switch (kind) {
            case DeviceError::Kind::CreationFailed: return ErrorCode::OutOfMemory;
            case DeviceError::Kind::Unsupported: return ErrorCode::NotSupported;
            case DeviceError::Kind::InvalidHandle: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type carrying either a value or an error
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    explicit operator bool() const noexcept { return m_value.has_value(); }

    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error: " + describe(m_error));
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error: " + describe(m_error));
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

private:
    static std::string describe(const E& error) {
        if constexpr (std::is_same_v<E, Error>) {
            return error.message();
        } else {
            return "error";
        }
    }

    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() : m_has_value(true) {}
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message including kind details and context
std::string build_error_chain(const Error& error);

} // namespace lumen_core
