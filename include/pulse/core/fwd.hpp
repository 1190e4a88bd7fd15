#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for pulse_core module

#include <cstdint>

namespace pulse_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct DependencyError;
struct EventError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class ScopedLogLevel;

} // namespace pulse_core
