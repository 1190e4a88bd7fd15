/// @file error.cpp
/// @brief Error handling implementation for pulse_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Error formatting utilities
/// - Explicit template instantiations for common Result types

#include <pulse/core/error.hpp>
#include <sstream>
#include <vector>

namespace pulse_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

/// Format dependency error with full context
std::string format_dependency_error(const DependencyError& err) {
    std::ostringstream oss;
    oss << "[DependencyError] " << err.message;

    switch (err.kind) {
        case DependencyError::Kind::CircularDependency:
            oss << " (cycle length: " << (err.cycle_path.empty() ? 0 : err.cycle_path.size() - 1);
            if (!err.cycle_path.empty() && err.traversal_path.size() > err.cycle_path.size()) {
                oss << ", entered from: " << err.traversal_path.front();
            }
            oss << ")";
            break;
        case DependencyError::Kind::UnknownDependency:
            oss << " (node: " << err.node_id << ", missing: " << err.dependency << ")";
            break;
        case DependencyError::Kind::UnknownNode:
            break;
    }

    return oss.str();
}

/// Format event error with full context
std::string format_event_error(const EventError& err) {
    std::ostringstream oss;
    oss << "[EventError] " << err.message;

    if (!err.event_id.empty()) {
        oss << " (event: " << err.event_id << ")";
    }
    if (!err.handler_id.empty()) {
        oss << " (handler: " << err.handler_id << ")";
    }

    return oss.str();
}

/// Format config error with full context
std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;
    return oss.str();
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
        } else if constexpr (std::is_same_v<T, DependencyError>) {
            oss << detail::format_dependency_error(err);
        } else if constexpr (std::is_same_v<T, EventError>) {
            oss << detail::format_event_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
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
template class Result<std::string, Error>;
template class Result<std::vector<std::string>, Error>;

} // namespace pulse_core
