#pragma once

/// @file error.hpp
/// @brief Error handling types for relay_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>
#include <type_traits>

namespace relay_core {

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
    ValidationError,
    DependencyMissing,
    CycleDetected,
    LoadFailed,
    InstantiationFailed,
    Timeout,
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
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::DependencyMissing: return "DependencyMissing";
        case ErrorCode::CycleDetected: return "CycleDetected";
        case ErrorCode::LoadFailed: return "LoadFailed";
        case ErrorCode::InstantiationFailed: return "InstantiationFailed";
        case ErrorCode::Timeout: return "Timeout";
        default: return "Unknown";
    }
}

// =============================================================================
// KernelError
// =============================================================================

/// Errors raised by discovery, planning, instantiation and shutdown
struct KernelError {
    enum class Kind : std::uint8_t {
        Configuration,   // Malformed or unreadable descriptor/settings
        GraphCycle,      // Cycle in the discovered dependency graph
        Dependency,      // Missing dependency inside a closure
        Load,            // No implementation could be located
        Instantiation,   // Factory or constructor threw
        ShutdownHook,    // Teardown hook threw
        PhaseTimeout,    // Shutdown deadline exceeded
        NotFound,        // Unknown plugin name
    };

    Kind kind;
    std::string message;
    std::string plugin;      // Plugin the error concerns (may be empty)
    std::string detail;      // Dependency name, cycle path, phase name...

    [[nodiscard]] static KernelError configuration(const std::string& source, const std::string& reason) {
        return KernelError{Kind::Configuration, "Invalid configuration in " + source + ": " + reason, {}, source};
    }

    [[nodiscard]] static KernelError graph_cycle(const std::string& path) {
        return KernelError{Kind::GraphCycle, "Dependency cycle detected: " + path, {}, path};
    }

    [[nodiscard]] static KernelError dependency(const std::string& plugin, const std::string& dep,
                                                const std::string& reason = "missing dependency") {
        return KernelError{Kind::Dependency,
            "Plugin '" + plugin + "' " + reason + ": " + dep, plugin, dep};
    }

    [[nodiscard]] static KernelError load_failed(const std::string& plugin, const std::string& reason) {
        return KernelError{Kind::Load, "Plugin '" + plugin + "' load failed: " + reason, plugin, reason};
    }

    [[nodiscard]] static KernelError instantiation(const std::string& plugin, const std::string& reason) {
        return KernelError{Kind::Instantiation,
            "Plugin '" + plugin + "' instantiation failed: " + reason, plugin, reason};
    }

    [[nodiscard]] static KernelError shutdown_hook(const std::string& plugin, const std::string& reason) {
        return KernelError{Kind::ShutdownHook,
            "Plugin '" + plugin + "' shutdown hook failed: " + reason, plugin, reason};
    }

    [[nodiscard]] static KernelError phase_timeout(const std::string& phase) {
        return KernelError{Kind::PhaseTimeout, "Shutdown phase timed out: " + phase, {}, phase};
    }

    [[nodiscard]] static KernelError not_found(const std::string& plugin) {
        return KernelError{Kind::NotFound, "Plugin not found: " + plugin, plugin, {}};
    }
};

/// Get kernel error kind name
[[nodiscard]] inline const char* kernel_error_kind_name(KernelError::Kind kind) {
    switch (kind) {
        case KernelError::Kind::Configuration: return "ConfigurationError";
        case KernelError::Kind::GraphCycle: return "GraphCycleError";
        case KernelError::Kind::Dependency: return "DependencyError";
        case KernelError::Kind::Load: return "LoadError";
        case KernelError::Kind::Instantiation: return "InstantiationError";
        case KernelError::Kind::ShutdownHook: return "ShutdownHookError";
        case KernelError::Kind::PhaseTimeout: return "PhaseTimeout";
        case KernelError::Kind::NotFound: return "NotFound";
        default: return "Unknown";
    }
}

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        KernelError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(KernelError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
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

    /// Check for a specific kernel error kind
    [[nodiscard]] bool is_kind(KernelError::Kind kind) const {
        const auto* err = as<KernelError>();
        return err && err->kind == kind;
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

    /// Get all context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode to_error_code(KernelError::Kind kind) {
        switch (kind) {
            case KernelError::Kind::Configuration: return ErrorCode::ParseError;
            case KernelError::Kind::GraphCycle: return ErrorCode::CycleDetected;
            case KernelError::Kind::Dependency: return ErrorCode::DependencyMissing;
            case KernelError::Kind::Load: return ErrorCode::LoadFailed;
            case KernelError::Kind::Instantiation: return ErrorCode::InstantiationFailed;
            case KernelError::Kind::ShutdownHook: return ErrorCode::InvalidState;
            case KernelError::Kind::PhaseTimeout: return ErrorCode::Timeout;
            case KernelError::Kind::NotFound: return ErrorCode::NotFound;
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

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

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

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
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

/// Build a full error message with code, kind and context
std::string build_error_chain(const Error& error);

} // namespace relay_core
