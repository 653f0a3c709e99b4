#pragma once

/// @file error.hpp
/// @brief Error handling types for tableau_core

#include "fwd.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace tableau_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidGeometry,
    InvalidState,
    ResourceExhausted,
    ParseError,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidGeometry: return "InvalidGeometry";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::ResourceExhausted: return "ResourceExhausted";
        case ErrorCode::ParseError: return "ParseError";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Scene graph errors
struct SceneError {
    enum class Kind : std::uint8_t {
        NotFound,       // Sprite id not registered
        CycleDetected,  // Reparent would make a node its own ancestor
        MissingZPath,   // Reorder requested on a node without a Z-path
    };

    Kind kind;
    std::string message;
    std::int64_t sprite_id = 0;

    [[nodiscard]] static SceneError not_found(std::int64_t id) {
        return SceneError{Kind::NotFound, "Sprite not found: " + std::to_string(id), id};
    }

    [[nodiscard]] static SceneError cycle_detected(std::int64_t id, std::int64_t parent) {
        return SceneError{Kind::CycleDetected,
            "Sprite " + std::to_string(id) + " cannot be parented to descendant " + std::to_string(parent),
            id};
    }

    [[nodiscard]] static SceneError missing_zpath(std::int64_t id) {
        return SceneError{Kind::MissingZPath, "Sprite has no Z-path: " + std::to_string(id), id};
    }
};

/// Layer set errors
struct LayerError {
    enum class Kind : std::uint8_t {
        NotFound,           // Layer, cast or surface id unknown
        InvalidGeometry,    // Non-positive size or empty rectangle
        ResourceExhausted,  // Per-kind layer cap reached
    };

    Kind kind;
    std::string message;
    int surface_id = 0;

    [[nodiscard]] static LayerError not_found(int surface, const std::string& what) {
        return LayerError{Kind::NotFound, "Not found: " + what, surface};
    }

    [[nodiscard]] static LayerError invalid_geometry(int surface, int width, int height) {
        return LayerError{Kind::InvalidGeometry,
            "Invalid size " + std::to_string(width) + "x" + std::to_string(height), surface};
    }

    [[nodiscard]] static LayerError resource_exhausted(int surface, const std::string& kind_name, std::size_t limit) {
        return LayerError{Kind::ResourceExhausted,
            "Too many " + kind_name + " layers (limit " + std::to_string(limit) + ")", surface};
    }
};

/// Configuration errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        ParseError,    // Malformed document
        InvalidValue,  // Wrong type or out-of-range value
    };

    Kind kind;
    std::string message;
    std::string key;

    [[nodiscard]] static ConfigError parse_error(const std::string& reason) {
        return ConfigError{Kind::ParseError, "Config parse error: " + reason, {}};
    }

    [[nodiscard]] static ConfigError invalid_value(const std::string& key_name, const std::string& reason) {
        return ConfigError{Kind::InvalidValue, "Invalid value for '" + key_name + "': " + reason, key_name};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        SceneError,
        LayerError,
        ConfigError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(SceneError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(LayerError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}

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
    static ErrorCode to_error_code(SceneError::Kind kind) {
        switch (kind) {
            case SceneError::Kind::NotFound: return ErrorCode::NotFound;
            case SceneError::Kind::CycleDetected: return ErrorCode::InvalidArgument;
            case SceneError::Kind::MissingZPath: return ErrorCode::InvalidState;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(LayerError::Kind kind) {
        switch (kind) {
            case LayerError::Kind::NotFound: return ErrorCode::NotFound;
            case LayerError::Kind::InvalidGeometry: return ErrorCode::InvalidGeometry;
            case LayerError::Kind::ResourceExhausted: return ErrorCode::ResourceExhausted;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::ParseError: return ErrorCode::ParseError;
            case ConfigError::Kind::InvalidValue: return ErrorCode::InvalidArgument;
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

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
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

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool
    explicit operator bool() const noexcept { return m_has_value; }

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

/// Build a full error message with code, kind details and context
std::string build_error_chain(const Error& error);

} // namespace tableau_core
