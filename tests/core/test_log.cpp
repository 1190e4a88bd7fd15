// pulse_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <pulse/core/id.hpp>
#include <pulse/core/log.hpp>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>

using namespace pulse_core;

TEST_CASE("parse_log_level", "[core][log]") {
    SECTION("canonical names") {
        REQUIRE(parse_log_level("trace") == spdlog::level::trace);
        REQUIRE(parse_log_level("debug") == spdlog::level::debug);
        REQUIRE(parse_log_level("info") == spdlog::level::info);
        REQUIRE(parse_log_level("warn") == spdlog::level::warn);
        REQUIRE(parse_log_level("error") == spdlog::level::err);
        REQUIRE(parse_log_level("critical") == spdlog::level::critical);
        REQUIRE(parse_log_level("off") == spdlog::level::off);
    }

    SECTION("aliases and case") {
        REQUIRE(parse_log_level("warning") == spdlog::level::warn);
        REQUIRE(parse_log_level("err") == spdlog::level::err);
        REQUIRE(parse_log_level("DEBUG") == spdlog::level::debug);
        REQUIRE(parse_log_level("Info") == spdlog::level::info);
    }

    SECTION("unknown") {
        REQUIRE_FALSE(parse_log_level("loud").has_value());
        REQUIRE_FALSE(parse_log_level("").has_value());
    }

    SECTION("names parse back") {
        for (auto level : {spdlog::level::trace, spdlog::level::debug, spdlog::level::info,
                           spdlog::level::warn, spdlog::level::err, spdlog::level::critical}) {
            REQUIRE(parse_log_level(log_level_name(level)) == level);
        }
    }
}

TEST_CASE("Named loggers", "[core][log]") {
    SECTION("same name returns same logger") {
        auto a = get_logger("pulse_test");
        auto b = get_logger("pulse_test");
        REQUIRE(a == b);
        REQUIRE(a->name() == "pulse_test");
    }

    SECTION("subsystem loggers") {
        REQUIRE(core_logger()->name() == "pulse_core");
        REQUIRE(kernel_logger()->name() == "pulse_kernel");
        REQUIRE(event_logger()->name() == "pulse_event");
    }

    SECTION("unknown logger level override") {
        REQUIRE_FALSE(set_logger_level("pulse_never_created", spdlog::level::debug));
    }
}

TEST_CASE("Log level management", "[core][log]") {
    auto previous = get_global_log_level();

    set_global_log_level(spdlog::level::err);
    REQUIRE(get_global_log_level() == spdlog::level::err);
    REQUIRE(kernel_logger()->level() == spdlog::level::err);

    REQUIRE(set_logger_level("pulse_kernel", spdlog::level::debug));
    REQUIRE(kernel_logger()->level() == spdlog::level::debug);
    REQUIRE(core_logger()->level() == spdlog::level::err);

    // A later global change overrides per-logger levels
    set_global_log_level(spdlog::level::warn);
    REQUIRE(kernel_logger()->level() == spdlog::level::warn);

    set_global_log_level(previous);
}

TEST_CASE("ScopedLogLevel restores on exit", "[core][log]") {
    auto logger = get_logger("pulse_scoped");
    auto before = logger->level();
    {
        ScopedLogLevel quiet("pulse_scoped", spdlog::level::off);
        REQUIRE(logger->level() == spdlog::level::off);
    }
    REQUIRE(logger->level() == before);
}

TEST_CASE("configure_logging", "[core][log]") {
    auto saved = current_log_config();

    SECTION("level applies to existing loggers") {
        auto logger = get_logger("pulse_configured");
        LogConfig config = saved;
        config.level = spdlog::level::critical;

        REQUIRE(configure_logging(config).is_ok());
        REQUIRE(logger->level() == spdlog::level::critical);
        REQUIRE(current_log_config().level == spdlog::level::critical);
    }

    SECTION("file sink writes structured entries") {
        auto dir = std::filesystem::temp_directory_path() / ("pulse_log_" + generate_uuid());
        LogConfig config;
        config.console_enabled = false;
        config.file_enabled = true;
        config.log_directory = dir.string();
        config.file_name = "test.log";
        config.level = spdlog::level::info;

        REQUIRE(configure_logging(config).is_ok());
        log_structured(spdlog::level::info, "pulse_file_test", "unit loaded",
            {{"id", "storage"}, {"note", "say \"hi\""}});
        flush_all_loggers();

        std::ifstream in(dir / "test.log");
        REQUIRE(in.is_open());
        std::stringstream content;
        content << in.rdbuf();
        REQUIRE(content.str().find("unit loaded id=\"storage\" note=\"say \\\"hi\\\"\"") != std::string::npos);
        REQUIRE(content.str().find("[pulse_file_test]") != std::string::npos);

        // Release the file before removing the directory
        REQUIRE(configure_logging(saved).is_ok());
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    SECTION("file logging without a directory is rejected") {
        LogConfig config = saved;
        config.file_enabled = true;
        config.log_directory.clear();

        auto result = configure_logging(config);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidArgument);
        REQUIRE_FALSE(current_log_config().file_enabled);
    }

    REQUIRE(configure_logging(saved).is_ok());
}

TEST_CASE("configure_logging while other threads log", "[core][log]") {
    auto saved = current_log_config();
    auto dir = std::filesystem::temp_directory_path() / ("pulse_log_" + generate_uuid());

    LogConfig to_file;
    to_file.console_enabled = false;
    to_file.file_enabled = true;
    to_file.log_directory = dir.string();
    to_file.file_name = "concurrent.log";
    to_file.level = spdlog::level::info;

    LogConfig silent = to_file;
    silent.file_enabled = false;

    REQUIRE(configure_logging(to_file).is_ok());

    std::atomic<bool> stop{false};
    std::atomic<int> written{0};
    std::thread writer([&] {
        auto logger = get_logger("pulse_concurrent");
        while (!stop.load()) {
            logger->info("line {}", written.fetch_add(1));
        }
    });

    bool all_ok = true;
    for (int i = 0; i < 200; ++i) {
        all_ok = configure_logging(i % 2 == 0 ? silent : to_file).is_ok() && all_ok;
    }
    REQUIRE(configure_logging(to_file).is_ok());
    get_logger("pulse_concurrent")->info("final line");
    stop.store(true);
    writer.join();
    flush_all_loggers();

    REQUIRE(all_ok);
    REQUIRE(written.load() > 0);

    std::ifstream in(dir / "concurrent.log");
    REQUIRE(in.is_open());
    std::stringstream content;
    content << in.rdbuf();
    REQUIRE(content.str().find("final line") != std::string::npos);

    REQUIRE(configure_logging(saved).is_ok());
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

TEST_CASE("Logging macros and shutdown", "[core][log]") {
    REQUIRE_NOTHROW(PULSE_LOG_DEBUG("macro {}", 1));
    REQUIRE_NOTHROW(flush_all_loggers());

    shutdown_logging();
    auto again = core_logger();
    REQUIRE(again != nullptr);
    REQUIRE(again->name() == "pulse_core");
}
