#pragma once

/// @file error.hpp
/// @brief Error handling types for pulse_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace pulse_core {

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
    ValidationError,
    DependencyMissing,
    CircularDependency,
    HandlerFailed,
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
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::DependencyMissing: return "DependencyMissing";
        case ErrorCode::CircularDependency: return "CircularDependency";
        case ErrorCode::HandlerFailed: return "HandlerFailed";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Dependency resolution errors
struct DependencyError {
    enum class Kind : std::uint8_t {
        CircularDependency,  // Dependency relation contains a cycle
        UnknownDependency,   // A node references an id absent from the set
        UnknownNode,         // Queried node is absent from the set
    };

    Kind kind;
    std::string message;
    std::string node_id;                  // Requesting node (or queried node)
    std::string dependency;               // For UnknownDependency
    std::vector<std::string> cycle_path;      // For CircularDependency, root first and last
    std::vector<std::string> traversal_path;  // For CircularDependency, DFS path from its entry node

    /// @param cycle the cycle itself, repeated id first and last
    /// @param traversal full DFS path ending at the repeated id; defaults to @p cycle
    [[nodiscard]] static DependencyError circular(
        std::vector<std::string> cycle,
        std::vector<std::string> traversal = {})
    {
        if (traversal.empty()) {
            traversal = cycle;
        }
        std::string joined;
        for (std::size_t i = 0; i < traversal.size(); ++i) {
            if (i > 0) joined += " -> ";
            joined += traversal[i];
        }
        std::string root = cycle.empty() ? std::string{} : cycle.front();
        return DependencyError{Kind::CircularDependency,
            "Circular dependency detected: " + joined, std::move(root), {},
            std::move(cycle), std::move(traversal)};
    }

    [[nodiscard]] static DependencyError unknown_dependency(const std::string& requester, const std::string& dep) {
        return DependencyError{Kind::UnknownDependency,
            "Unknown dependency: " + dep + " (required by '" + requester + "')", requester, dep, {}, {}};
    }

    [[nodiscard]] static DependencyError unknown_node(const std::string& id) {
        return DependencyError{Kind::UnknownNode, "Unknown node: " + id, id, {}, {}, {}};
    }
};

/// Event processing errors
struct EventError {
    enum class Kind : std::uint8_t {
        HandlerFailed,  // Handler returned an error result
        HandlerThrew,   // Handler threw an exception
    };

    Kind kind;
    std::string message;
    std::string event_id;
    std::string event_type;
    std::string handler_id;

    [[nodiscard]] static EventError handler_failed(
        const std::string& event_type, const std::string& event_id,
        const std::string& handler_id, const std::string& reason)
    {
        return EventError{Kind::HandlerFailed,
            "Handler failed for '" + event_type + "': " + reason, event_id, event_type, handler_id};
    }

    [[nodiscard]] static EventError handler_threw(
        const std::string& event_type, const std::string& event_id,
        const std::string& handler_id, const std::string& what)
    {
        return EventError{Kind::HandlerThrew,
            "Handler threw for '" + event_type + "': " + what, event_id, event_type, handler_id};
    }
};

/// Configuration errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        ParseError,    // Document is not valid JSON
        InvalidValue,  // Key present with unusable value
        IOError,       // File could not be read
    };

    Kind kind;
    std::string message;
    std::string key;  // Offending key or file path

    [[nodiscard]] static ConfigError parse_error(const std::string& reason) {
        return ConfigError{Kind::ParseError, "Config parse error: " + reason, {}};
    }

    [[nodiscard]] static ConfigError invalid_value(const std::string& key, const std::string& reason) {
        return ConfigError{Kind::InvalidValue, "Invalid value for '" + key + "': " + reason, key};
    }

    [[nodiscard]] static ConfigError io_error(const std::string& path) {
        return ConfigError{Kind::IOError, "Cannot read config file: " + path, path};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        DependencyError,
        EventError,
        ConfigError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(DependencyError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(EventError err) : m_code(ErrorCode::HandlerFailed), m_error(std::move(err)) {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
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
    static ErrorCode to_error_code(DependencyError::Kind kind) {
        switch (kind) {
            case DependencyError::Kind::CircularDependency: return ErrorCode::CircularDependency;
            case DependencyError::Kind::UnknownDependency: return ErrorCode::DependencyMissing;
            case DependencyError::Kind::UnknownNode: return ErrorCode::NotFound;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::ParseError: return ErrorCode::ParseError;
            case ConfigError::Kind::InvalidValue: return ErrorCode::InvalidArgument;
            case ConfigError::Kind::IOError: return ErrorCode::IOError;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message including kind-specific details and context
std::string build_error_chain(const Error& error);

namespace detail {

inline std::string describe(const Error& error) {
    return build_error_chain(error);
}

template<typename E>
std::string describe(const E&) {
    return "unspecified error";
}

} // namespace detail

// =============================================================================
// Result<T, E>
// =============================================================================

/// Either a value or an error.
/// unwrap() and expect() throw std::runtime_error carrying the error chain.
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(T value) : m_storage(std::in_place_index<0>, std::move(value)) {}
    Result(E error) : m_storage(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_storage.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return m_storage.index() == 1; }
    explicit operator bool() const noexcept { return is_ok(); }

    /// Value access (undefined if error)
    [[nodiscard]] T& value() & { return *std::get_if<0>(&m_storage); }
    [[nodiscard]] const T& value() const& { return *std::get_if<0>(&m_storage); }
    [[nodiscard]] T&& value() && { return std::move(*std::get_if<0>(&m_storage)); }

    /// Error access (undefined if ok)
    [[nodiscard]] E& error() & { return *std::get_if<1>(&m_storage); }
    [[nodiscard]] const E& error() const& { return *std::get_if<1>(&m_storage); }

    [[nodiscard]] T value_or(T fallback) const {
        return is_ok() ? value() : std::move(fallback);
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T&& operator*() && { return std::move(*this).value(); }

    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] T& unwrap() & {
        return expect("Result contains error");
    }

    [[nodiscard]] T&& unwrap() && {
        return std::move(*this).expect("Result contains error");
    }

    /// Value, or throw with @p what prefixed to the error chain
    [[nodiscard]] T& expect(const std::string& what) & {
        if (is_err()) {
            throw std::runtime_error(what + ": " + detail::describe(error()));
        }
        return value();
    }

    [[nodiscard]] T&& expect(const std::string& what) && {
        if (is_err()) {
            throw std::runtime_error(what + ": " + detail::describe(error()));
        }
        return std::move(*this).value();
    }

    /// Transform the value, passing an error through
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (is_ok()) {
            return Result<U, E>(func(std::move(value())));
        }
        return Result<U, E>(std::move(error()));
    }

    /// Transform the error, passing a value through
    template<typename F>
    Result map_err(F&& func) && {
        if (is_err()) {
            return Result(func(std::move(error())));
        }
        return std::move(*this);
    }

    /// Continue with another fallible step
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        using Next = decltype(func(std::declval<T>()));
        if (is_ok()) {
            return func(std::move(value()));
        }
        return Next(std::move(error()));
    }

private:
    std::variant<T, E> m_storage;
};

/// Success-or-error without a value
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() = default;
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return !m_error.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return m_error.has_value(); }
    explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] E& error() & { return *m_error; }
    [[nodiscard]] const E& error() const& { return *m_error; }

    void unwrap() const {
        expect("Result contains error");
    }

    void expect(const std::string& what) const {
        if (m_error) {
            throw std::runtime_error(what + ": " + detail::describe(*m_error));
        }
    }

    template<typename F>
    Result map_err(F&& func) && {
        if (m_error) {
            return Result(func(std::move(*m_error)));
        }
        return Result();
    }

    template<typename F>
    auto and_then(F&& func) -> decltype(func()) {
        using Next = decltype(func());
        if (is_ok()) {
            return func();
        }
        return Next(std::move(*m_error));
    }

private:
    std::optional<E> m_error;
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

} // namespace pulse_core
