/// @file config.hpp
/// @brief Kernel configuration loaded from JSON
///
/// Example document (every key optional):
/// ```json
/// {
///   "router":     { "max_queue_size": 10000, "max_retries": 3 },
///   "logging":    { "level": "info", "console": true, "file": false, "directory": "logs", "file_name": "pulse.log" },
///   "validation": { "strict": false }
/// }
/// ```

#pragma once

#include "fwd.hpp"
#include "event_router.hpp"

#include <pulse/core/error.hpp>
#include <pulse/core/log.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace pulse_kernel {

/// Complete kernel configuration
struct KernelConfig {
    RouterConfig router;
    pulse_core::LogConfig logging;
    bool strict_validation = false;
};

/// Build a configuration from a parsed JSON document
[[nodiscard]] pulse_core::Result<KernelConfig> parse_kernel_config(const nlohmann::json& document);

/// Parse a configuration from JSON text
[[nodiscard]] pulse_core::Result<KernelConfig> parse_kernel_config_text(const std::string& text);

/// Read and parse a configuration file
[[nodiscard]] pulse_core::Result<KernelConfig> load_kernel_config(const std::string& path);

/// Render the effective configuration
[[nodiscard]] nlohmann::json to_json(const KernelConfig& config);

} // namespace pulse_kernel
