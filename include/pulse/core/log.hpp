#pragma once

/// @file log.hpp
/// @brief Logging for pulse
///
/// All pulse loggers share one set of sinks built from a LogConfig.
/// Reconfiguring replaces the sinks of every logger already handed out,
/// so loggers obtained before configure_logging() follow the new setup.
/// configure_logging() may run while other threads are logging.

#include "fwd.hpp"
#include "error.hpp"

#include <spdlog/spdlog.h>

#include <map>
#include <memory>
#include <optional>
#include <string>

// =============================================================================
// Logging Macros
// =============================================================================

#define PULSE_LOG_TRACE(...) ::pulse_core::core_logger()->trace(__VA_ARGS__)
#define PULSE_LOG_DEBUG(...) ::pulse_core::core_logger()->debug(__VA_ARGS__)
#define PULSE_LOG_INFO(...) ::pulse_core::core_logger()->info(__VA_ARGS__)
#define PULSE_LOG_WARN(...) ::pulse_core::core_logger()->warn(__VA_ARGS__)
#define PULSE_LOG_ERROR(...) ::pulse_core::core_logger()->error(__VA_ARGS__)

namespace pulse_core {

// =============================================================================
// Configuration
// =============================================================================

/// Sink and level setup shared by every pulse logger
struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;                     ///< Required when file_enabled
    std::string file_name = "pulse.log";
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
};

/// Rebuild the shared sinks and apply the level to all loggers.
/// Fails with IOError if the rotating file cannot be opened; the previous
/// configuration stays in effect in that case.
Result<void> configure_logging(const LogConfig& config);

/// Configuration currently in effect
[[nodiscard]] LogConfig current_log_config();

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger attached to the shared sinks
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Ambient utilities
std::shared_ptr<spdlog::logger> core_logger();

/// Dependency resolution and kernel lifecycle
std::shared_ptr<spdlog::logger> kernel_logger();

/// Event admission, dispatch and retry
std::shared_ptr<spdlog::logger> event_logger();

// =============================================================================
// Levels
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level);

/// Override the level of one logger until the next global change.
/// @return false if no logger of that name has been created
bool set_logger_level(const std::string& name, spdlog::level::level_enum level);

[[nodiscard]] spdlog::level::level_enum get_global_log_level();

/// Parse a level name, ignoring case ("warning" and "err" are accepted aliases)
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

[[nodiscard]] const char* log_level_name(spdlog::level::level_enum level);

/// Temporarily change one logger's level, restoring it on destruction
class ScopedLogLevel {
public:
    ScopedLogLevel(const std::string& logger_name, spdlog::level::level_enum level);
    ~ScopedLogLevel();

    ScopedLogLevel(const ScopedLogLevel&) = delete;
    ScopedLogLevel& operator=(const ScopedLogLevel&) = delete;

private:
    std::shared_ptr<spdlog::logger> m_logger;
    spdlog::level::level_enum m_previous;
};

// =============================================================================
// Structured Logging
// =============================================================================

/// Log @p message followed by key="value" pairs
void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields);

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers();

/// Flush and unregister every pulse logger
void shutdown_logging();

} // namespace pulse_core
