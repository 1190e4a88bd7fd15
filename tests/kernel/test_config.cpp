/// @file test_config.cpp
/// @brief Tests for kernel configuration loading

#include <catch2/catch_test_macros.hpp>
#include <pulse/kernel/config.hpp>
#include <pulse/core/id.hpp>

#include <filesystem>
#include <fstream>
#include <string>

using namespace pulse_kernel;
using pulse_core::ConfigError;
using pulse_core::ErrorCode;

namespace {

/// Temporary file removed at scope exit
class TempFile {
public:
    explicit TempFile(const std::string& contents)
        : m_path(std::filesystem::temp_directory_path() /
                 ("pulse_config_" + pulse_core::generate_uuid() + ".json"))
    {
        std::ofstream out(m_path);
        out << contents;
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
    }

    [[nodiscard]] std::string path() const { return m_path.string(); }

private:
    std::filesystem::path m_path;
};

} // anonymous namespace

TEST_CASE("KernelConfig: defaults", "[kernel][config]") {
    KernelConfig config;
    REQUIRE(config.router.max_queue_size == 10000);
    REQUIRE(config.router.max_retries == 3);
    REQUIRE(config.logging.level == spdlog::level::info);
    REQUIRE(config.logging.console_enabled);
    REQUIRE_FALSE(config.strict_validation);

    auto parsed = parse_kernel_config(nlohmann::json::object());
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed->router.max_queue_size == 10000);
    REQUIRE(parsed->router.max_retries == 3);
}

TEST_CASE("KernelConfig: full document", "[kernel][config]") {
    auto parsed = parse_kernel_config_text(R"({
        "router": { "max_queue_size": 64, "max_retries": 5 },
        "logging": { "level": "debug", "console": false, "file": true, "directory": "logs", "max_files": 2 },
        "validation": { "strict": true }
    })");

    REQUIRE(parsed.is_ok());
    REQUIRE(parsed->router.max_queue_size == 64);
    REQUIRE(parsed->router.max_retries == 5);
    REQUIRE(parsed->logging.level == spdlog::level::debug);
    REQUIRE_FALSE(parsed->logging.console_enabled);
    REQUIRE(parsed->logging.file_enabled);
    REQUIRE(parsed->logging.log_directory == "logs");
    REQUIRE(parsed->logging.max_files == 2);
    REQUIRE(parsed->strict_validation);
}

TEST_CASE("KernelConfig: partial sections keep defaults", "[kernel][config]") {
    auto parsed = parse_kernel_config_text(R"({ "router": { "max_retries": 1 } })");
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed->router.max_retries == 1);
    REQUIRE(parsed->router.max_queue_size == 10000);
    REQUIRE(parsed->logging.level == spdlog::level::info);
}

TEST_CASE("KernelConfig: invalid values", "[kernel][config]") {
    SECTION("zero capacity") {
        auto parsed = parse_kernel_config_text(R"({ "router": { "max_queue_size": 0 } })");
        REQUIRE(parsed.is_err());
        REQUIRE(parsed.error().code() == ErrorCode::InvalidArgument);
        REQUIRE(parsed.error().as<ConfigError>()->key == "max_queue_size");
    }

    SECTION("negative retries") {
        auto parsed = parse_kernel_config_text(R"({ "router": { "max_retries": -2 } })");
        REQUIRE(parsed.is_err());
        REQUIRE(parsed.error().as<ConfigError>()->key == "max_retries");
    }

    SECTION("retries beyond 32 bits") {
        auto parsed = parse_kernel_config_text(R"({ "router": { "max_retries": 4294967296 } })");
        REQUIRE(parsed.is_err());
        REQUIRE(parsed.error().code() == ErrorCode::InvalidArgument);
        REQUIRE(parsed.error().as<ConfigError>()->key == "max_retries");
    }

    SECTION("largest 32-bit retry count accepted") {
        auto parsed = parse_kernel_config_text(R"({ "router": { "max_retries": 4294967295 } })");
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed->router.max_retries == 4294967295u);
    }

    SECTION("wrong type") {
        auto parsed = parse_kernel_config_text(R"({ "validation": { "strict": "yes" } })");
        REQUIRE(parsed.is_err());
        REQUIRE(parsed.error().as<ConfigError>()->key == "strict");
    }

    SECTION("unknown log level") {
        auto parsed = parse_kernel_config_text(R"({ "logging": { "level": "loud" } })");
        REQUIRE(parsed.is_err());
        REQUIRE(parsed.error().as<ConfigError>()->key == "level");
        REQUIRE(parsed.error().message().find("loud") != std::string::npos);
    }

    SECTION("file logging without directory") {
        auto parsed = parse_kernel_config_text(R"({ "logging": { "file": true } })");
        REQUIRE(parsed.is_err());
        REQUIRE(parsed.error().as<ConfigError>()->key == "directory");
    }

    SECTION("section is not an object") {
        auto parsed = parse_kernel_config_text(R"({ "router": 5 })");
        REQUIRE(parsed.is_err());
        REQUIRE(parsed.error().as<ConfigError>()->key == "router");
    }
}

TEST_CASE("KernelConfig: malformed documents", "[kernel][config]") {
    SECTION("not JSON") {
        auto parsed = parse_kernel_config_text("{ router: ");
        REQUIRE(parsed.is_err());
        REQUIRE(parsed.error().code() == ErrorCode::ParseError);
    }

    SECTION("top level not an object") {
        auto parsed = parse_kernel_config_text("[1, 2, 3]");
        REQUIRE(parsed.is_err());
        REQUIRE(parsed.error().code() == ErrorCode::ParseError);
    }
}

TEST_CASE("KernelConfig: load from file", "[kernel][config]") {
    SECTION("existing file") {
        TempFile file(R"({ "router": { "max_queue_size": 8 } })");
        auto loaded = load_kernel_config(file.path());
        REQUIRE(loaded.is_ok());
        REQUIRE(loaded->router.max_queue_size == 8);
    }

    SECTION("missing file") {
        auto loaded = load_kernel_config("/nonexistent/pulse/kernel.json");
        REQUIRE(loaded.is_err());
        REQUIRE(loaded.error().code() == ErrorCode::IOError);
    }

    SECTION("malformed file carries path context") {
        TempFile file("{ not json");
        auto loaded = load_kernel_config(file.path());
        REQUIRE(loaded.is_err());
        REQUIRE(loaded.error().code() == ErrorCode::ParseError);
        const auto* ctx = loaded.error().get_context("file");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == file.path());
    }
}

TEST_CASE("KernelConfig: to_json reflects effective values", "[kernel][config]") {
    KernelConfig config;
    config.router.max_queue_size = 42;
    config.logging.level = spdlog::level::warn;
    config.strict_validation = true;

    auto j = to_json(config);
    REQUIRE(j["router"]["max_queue_size"] == 42);
    REQUIRE(j["router"]["max_retries"] == 3);
    REQUIRE(j["logging"]["level"] == "warn");
    REQUIRE(j["validation"]["strict"] == true);

    auto reparsed = parse_kernel_config(j);
    REQUIRE(reparsed.is_ok());
    REQUIRE(reparsed->router.max_queue_size == 42);
    REQUIRE(reparsed->logging.level == spdlog::level::warn);
    REQUIRE(reparsed->strict_validation);
}
