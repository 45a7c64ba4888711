#pragma once

/// @file error.hpp
/// @brief Error handling types for vessel_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace vessel_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    Timeout,
    Disconnected,
    RemoteError,
    NotSupported,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::Disconnected: return "Disconnected";
        case ErrorCode::RemoteError: return "RemoteError";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Supervised plugin errors
struct PluginError {
    enum class Kind : std::uint8_t {
        InvalidExecutablePath,   // Executable escapes the bundle root
        ExecutableLaunchFailed,  // Executable missing, not runnable, or bad handshake
        StartTimeout,            // Handshake did not complete in time
        ChannelBroken,           // Plugin process or its transport went away
        HookInvocationError,     // Plugin returned an application error
        NotRunning,              // Supervisor not started or already stopped
    };

    Kind kind;
    std::string message;
    std::string plugin_id;
    std::string method;  // For HookInvocationError / ChannelBroken

    [[nodiscard]] static PluginError invalid_executable_path(const std::string& id, const std::string& path) {
        return PluginError{Kind::InvalidExecutablePath,
            "Executable path escapes bundle root: " + path, id, {}};
    }

    [[nodiscard]] static PluginError launch_failed(const std::string& id, const std::string& reason) {
        return PluginError{Kind::ExecutableLaunchFailed,
            "Plugin '" + id + "' failed to launch: " + reason, id, {}};
    }

    [[nodiscard]] static PluginError start_timeout(const std::string& id) {
        return PluginError{Kind::StartTimeout,
            "Timed out waiting for plugin '" + id + "' to start", id, {}};
    }

    [[nodiscard]] static PluginError channel_broken(const std::string& id, const std::string& method) {
        return PluginError{Kind::ChannelBroken,
            "Plugin '" + id + "' terminated during " + method, id, method};
    }

    [[nodiscard]] static PluginError hook_invocation(const std::string& id, const std::string& method,
                                                     const std::string& reason) {
        return PluginError{Kind::HookInvocationError, reason, id, method};
    }

    [[nodiscard]] static PluginError not_running(const std::string& id) {
        return PluginError{Kind::NotRunning, "Plugin '" + id + "' is not running", id, {}};
    }
};

/// Call channel errors
struct RpcError {
    enum class Kind : std::uint8_t {
        Broken,    // Transport closed or peer exited
        Timeout,   // No response within the caller's deadline
        Remote,    // Peer answered with an error
        Protocol,  // Malformed or oversized frame
    };

    Kind kind;
    std::string message;
    std::string method;

    [[nodiscard]] static RpcError broken(const std::string& method) {
        return RpcError{Kind::Broken, "Channel broken during " + method, method};
    }

    [[nodiscard]] static RpcError timeout(const std::string& method) {
        return RpcError{Kind::Timeout, "Timed out waiting for response to " + method, method};
    }

    [[nodiscard]] static RpcError remote(const std::string& method, const std::string& reason) {
        return RpcError{Kind::Remote, reason, method};
    }

    [[nodiscard]] static RpcError protocol(const std::string& reason) {
        return RpcError{Kind::Protocol, "Protocol error: " + reason, {}};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        PluginError,
        RpcError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(PluginError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(RpcError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
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

    /// All context values
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(PluginError::Kind kind) {
        switch (kind) {
            case PluginError::Kind::InvalidExecutablePath: return ErrorCode::InvalidArgument;
            case PluginError::Kind::ExecutableLaunchFailed: return ErrorCode::IOError;
            case PluginError::Kind::StartTimeout: return ErrorCode::Timeout;
            case PluginError::Kind::ChannelBroken: return ErrorCode::Disconnected;
            case PluginError::Kind::HookInvocationError: return ErrorCode::RemoteError;
            case PluginError::Kind::NotRunning: return ErrorCode::InvalidState;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(RpcError::Kind kind) {
        switch (kind) {
            case RpcError::Kind::Broken: return ErrorCode::Disconnected;
            case RpcError::Kind::Timeout: return ErrorCode::Timeout;
            case RpcError::Kind::Remote: return ErrorCode::RemoteError;
            case RpcError::Kind::Protocol: return ErrorCode::ParseError;
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

/// Result type (similar to Rust's Result<T, E>)
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

    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error: " + m_error.message());
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error: " + m_error.message());
        }
        return std::move(*m_value);
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

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

    /// Unwrap
    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error: " + m_error.message());
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

/// Build a full error message with code, kind details and context
std::string build_error_chain(const Error& error);

/// True if the error reports a lost plugin process or transport
[[nodiscard]] bool is_disconnect(const Error& error);

} // namespace vessel_core
