/// @file log.cpp
/// @brief Shared-sink logger registry for pulse

#include <pulse/core/log.hpp>

#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <mutex>
#include <sstream>
#include <vector>

namespace pulse_core {

namespace {

constexpr const char* k_console_pattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
constexpr const char* k_file_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] [thread %t] %v";

// =============================================================================
// LoggerRegistry
// =============================================================================

/// Owns the shared sinks and every logger created through get_logger().
/// Each logger writes to one distributing sink; reconfiguring swaps that
/// sink's children under its own lock, so threads may keep logging.
class LoggerRegistry {
public:
    static LoggerRegistry& instance() {
        static LoggerRegistry registry;
        return registry;
    }

    Result<void> configure(const LogConfig& config) {
        auto sinks = build_sinks(config);
        if (!sinks) {
            return Err(std::move(sinks.error()));
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = config;
        m_output->set_sinks(std::move(*sinks));
        for (auto& [name, logger] : m_loggers) {
            logger->set_level(m_config.level);
        }
        return Ok();
    }

    [[nodiscard]] LogConfig config() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_config;
    }

    std::shared_ptr<spdlog::logger> get(const std::string& name) {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_loggers.find(name);
        if (it != m_loggers.end()) {
            return it->second;
        }

        auto logger = std::make_shared<spdlog::logger>(name, m_output);
        logger->set_level(m_config.level);
        m_loggers.emplace(name, logger);

        // Leave foreign registrations under the same name untouched
        if (!spdlog::get(name)) {
            spdlog::register_logger(logger);
        }
        return logger;
    }

    void set_level(spdlog::level::level_enum level) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config.level = level;
        for (auto& [name, logger] : m_loggers) {
            logger->set_level(level);
        }
    }

    bool set_logger_level(const std::string& name, spdlog::level::level_enum level) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_loggers.find(name);
        if (it == m_loggers.end()) {
            return false;
        }
        it->second->set_level(level);
        return true;
    }

    [[nodiscard]] spdlog::level::level_enum level() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_config.level;
    }

    void flush() {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& [name, logger] : m_loggers) {
            logger->flush();
        }
    }

    void shutdown() {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& [name, logger] : m_loggers) {
            logger->flush();
            if (spdlog::get(name) == logger) {
                spdlog::drop(name);
            }
        }
        m_loggers.clear();
    }

private:
    LoggerRegistry()
        : m_output(std::make_shared<spdlog::sinks::dist_sink_mt>())
    {
        auto sinks = build_sinks(m_config);
        if (sinks) {
            m_output->set_sinks(std::move(*sinks));
        }
    }

    static Result<std::vector<spdlog::sink_ptr>> build_sinks(const LogConfig& config) {
        std::vector<spdlog::sink_ptr> sinks;

        if (config.console_enabled) {
            auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console->set_pattern(k_console_pattern);
            sinks.push_back(std::move(console));
        }

        if (config.file_enabled) {
            if (config.log_directory.empty()) {
                return Err<std::vector<spdlog::sink_ptr>>(
                    Error(ErrorCode::InvalidArgument, "File logging enabled without a log directory"));
            }

            std::error_code ec;
            std::filesystem::create_directories(config.log_directory, ec);
            if (ec) {
                return Err<std::vector<spdlog::sink_ptr>>(
                    Error(ErrorCode::IOError, "Cannot create log directory: " + config.log_directory)
                        .with_context("reason", ec.message()));
            }

            auto path = std::filesystem::path(config.log_directory) / config.file_name;
            try {
                auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    path.string(), config.max_file_size, config.max_files);
                file->set_pattern(k_file_pattern);
                sinks.push_back(std::move(file));
            } catch (const spdlog::spdlog_ex& e) {
                return Err<std::vector<spdlog::sink_ptr>>(
                    Error(ErrorCode::IOError, "Cannot open log file: " + path.string())
                        .with_context("reason", e.what()));
            }
        }

        return Ok(std::move(sinks));
    }

    mutable std::mutex m_mutex;
    LogConfig m_config;
    std::shared_ptr<spdlog::sinks::dist_sink_mt> m_output;
    std::map<std::string, std::shared_ptr<spdlog::logger>> m_loggers;
};

std::string lowercase(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // anonymous namespace

// =============================================================================
// Configuration
// =============================================================================

Result<void> configure_logging(const LogConfig& config) {
    return LoggerRegistry::instance().configure(config);
}

LogConfig current_log_config() {
    return LoggerRegistry::instance().config();
}

// =============================================================================
// Named Loggers
// =============================================================================

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    return LoggerRegistry::instance().get(name);
}

std::shared_ptr<spdlog::logger> core_logger() {
    return get_logger("pulse_core");
}

std::shared_ptr<spdlog::logger> kernel_logger() {
    return get_logger("pulse_kernel");
}

std::shared_ptr<spdlog::logger> event_logger() {
    return get_logger("pulse_event");
}

// =============================================================================
// Levels
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level) {
    LoggerRegistry::instance().set_level(level);
}

bool set_logger_level(const std::string& name, spdlog::level::level_enum level) {
    return LoggerRegistry::instance().set_logger_level(name, level);
}

spdlog::level::level_enum get_global_log_level() {
    return LoggerRegistry::instance().level();
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    static const std::map<std::string, spdlog::level::level_enum> names = {
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"err", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    };

    auto it = names.find(lowercase(str));
    if (it == names.end()) {
        return std::nullopt;
    }
    return it->second;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

ScopedLogLevel::ScopedLogLevel(const std::string& logger_name, spdlog::level::level_enum level)
    : m_logger(get_logger(logger_name))
    , m_previous(m_logger->level())
{
    m_logger->set_level(level);
}

ScopedLogLevel::~ScopedLogLevel() {
    m_logger->set_level(m_previous);
}

// =============================================================================
// Structured Logging
// =============================================================================

void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields)
{
    std::ostringstream oss;
    oss << message;
    for (const auto& [key, value] : fields) {
        oss << ' ' << key << "=\"";
        for (char c : value) {
            if (c == '"' || c == '\\') {
                oss << '\\';
            }
            oss << c;
        }
        oss << '"';
    }

    get_logger(logger_name)->log(level, oss.str());
}

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers() {
    LoggerRegistry::instance().flush();
}

void shutdown_logging() {
    LoggerRegistry::instance().shutdown();
}

} // namespace pulse_core
