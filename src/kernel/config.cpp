/// @file config.cpp
/// @brief Kernel configuration parsing

#include <pulse/kernel/config.hpp>

#include <fstream>
#include <limits>
#include <sstream>

namespace pulse_kernel {

using pulse_core::ConfigError;
using pulse_core::Err;
using pulse_core::Ok;
using pulse_core::Result;

namespace {

Result<const nlohmann::json*> section(const nlohmann::json& document, const char* name) {
    auto it = document.find(name);
    if (it == document.end()) {
        return Ok<const nlohmann::json*>(nullptr);
    }
    if (!it->is_object()) {
        return Err<const nlohmann::json*>(ConfigError::invalid_value(name, "expected an object"));
    }
    return Ok<const nlohmann::json*>(&*it);
}

/// Read an optional integer field in [1, max]
Result<void> read_positive(const nlohmann::json& object, const std::string& key, std::uint64_t& out,
                           std::uint64_t max = std::numeric_limits<std::size_t>::max()) {
    auto it = object.find(key);
    if (it == object.end()) {
        return Ok();
    }
    if (!it->is_number_unsigned() || it->get<std::uint64_t>() == 0) {
        return Err(ConfigError::invalid_value(key, "expected a positive integer"));
    }
    if (it->get<std::uint64_t>() > max) {
        return Err(ConfigError::invalid_value(key, "must not exceed " + std::to_string(max)));
    }
    out = it->get<std::uint64_t>();
    return Ok();
}

Result<void> read_bool(const nlohmann::json& object, const std::string& key, bool& out) {
    auto it = object.find(key);
    if (it == object.end()) {
        return Ok();
    }
    if (!it->is_boolean()) {
        return Err(ConfigError::invalid_value(key, "expected a boolean"));
    }
    out = it->get<bool>();
    return Ok();
}

Result<void> read_string(const nlohmann::json& object, const std::string& key, std::string& out) {
    auto it = object.find(key);
    if (it == object.end()) {
        return Ok();
    }
    if (!it->is_string()) {
        return Err(ConfigError::invalid_value(key, "expected a string"));
    }
    out = it->get<std::string>();
    return Ok();
}

Result<void> apply_router(const nlohmann::json& object, RouterConfig& router) {
    std::uint64_t max_queue_size = router.max_queue_size;
    std::uint64_t max_retries = router.max_retries;

    if (auto r = read_positive(object, "max_queue_size", max_queue_size); !r) return r;
    if (auto r = read_positive(object, "max_retries", max_retries, std::numeric_limits<std::uint32_t>::max()); !r) {
        return r;
    }

    router.max_queue_size = static_cast<std::size_t>(max_queue_size);
    router.max_retries = static_cast<std::uint32_t>(max_retries);
    return Ok();
}

Result<void> apply_logging(const nlohmann::json& object, pulse_core::LogConfig& logging) {
    std::string level;
    if (auto r = read_string(object, "level", level); !r) return r;
    if (!level.empty()) {
        auto parsed = pulse_core::parse_log_level(level);
        if (!parsed) {
            return Err(ConfigError::invalid_value("level", "unknown log level '" + level + "'"));
        }
        logging.level = *parsed;
    }

    if (auto r = read_bool(object, "console", logging.console_enabled); !r) return r;
    if (auto r = read_bool(object, "file", logging.file_enabled); !r) return r;
    if (auto r = read_string(object, "directory", logging.log_directory); !r) return r;
    if (auto r = read_string(object, "file_name", logging.file_name); !r) return r;
    if (logging.file_enabled && logging.log_directory.empty()) {
        return Err(ConfigError::invalid_value("directory", "required when file logging is enabled"));
    }

    std::uint64_t max_file_size = logging.max_file_size;
    std::uint64_t max_files = logging.max_files;
    if (auto r = read_positive(object, "max_file_size", max_file_size); !r) return r;
    if (auto r = read_positive(object, "max_files", max_files); !r) return r;
    logging.max_file_size = static_cast<std::size_t>(max_file_size);
    logging.max_files = static_cast<std::size_t>(max_files);

    return Ok();
}

} // anonymous namespace

Result<KernelConfig> parse_kernel_config(const nlohmann::json& document) {
    if (!document.is_object()) {
        return Err<KernelConfig>(ConfigError::parse_error("top-level value must be an object"));
    }

    KernelConfig config;

    auto router = section(document, "router");
    if (!router) return Err<KernelConfig>(std::move(router.error()));
    if (*router) {
        if (auto r = apply_router(**router, config.router); !r) {
            return Err<KernelConfig>(std::move(r.error()));
        }
    }

    auto logging = section(document, "logging");
    if (!logging) return Err<KernelConfig>(std::move(logging.error()));
    if (*logging) {
        if (auto r = apply_logging(**logging, config.logging); !r) {
            return Err<KernelConfig>(std::move(r.error()));
        }
    }

    auto validation = section(document, "validation");
    if (!validation) return Err<KernelConfig>(std::move(validation.error()));
    if (*validation) {
        if (auto r = read_bool(**validation, "strict", config.strict_validation); !r) {
            return Err<KernelConfig>(std::move(r.error()));
        }
    }

    return Ok(std::move(config));
}

Result<KernelConfig> parse_kernel_config_text(const std::string& text) {
    nlohmann::json document = nlohmann::json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return Err<KernelConfig>(ConfigError::parse_error("malformed JSON"));
    }
    return parse_kernel_config(document);
}

Result<KernelConfig> load_kernel_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<KernelConfig>(ConfigError::io_error(path));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    return parse_kernel_config_text(buffer.str()).map_err([&path](pulse_core::Error error) {
        error.with_context("file", path);
        return error;
    });
}

nlohmann::json to_json(const KernelConfig& config) {
    nlohmann::json j;
    j["router"] = {
        {"max_queue_size", config.router.max_queue_size},
        {"max_retries", config.router.max_retries},
    };
    j["logging"] = {
        {"level", pulse_core::log_level_name(config.logging.level)},
        {"console", config.logging.console_enabled},
        {"file", config.logging.file_enabled},
        {"directory", config.logging.log_directory},
        {"file_name", config.logging.file_name},
        {"max_file_size", config.logging.max_file_size},
        {"max_files", config.logging.max_files},
    };
    j["validation"] = {{"strict", config.strict_validation}};
    return j;
}

} // namespace pulse_kernel
