/// @file main.cpp
/// @brief Kernel Demo
///
/// Plans the startup order of a small set of units, then routes a burst of
/// events of mixed priority through the kernel, including one handler that
/// always fails so the retry bound is visible in the log.
///
/// Usage: kernel_demo [config.json]

#include <pulse/kernel/kernel.hpp>
#include <pulse/core/log.hpp>

#include <spdlog/spdlog.h>

#include <string>

namespace {

using pulse_core::Err;
using pulse_core::Error;
using pulse_core::Ok;
using pulse_core::Result;
using namespace pulse_kernel;

/// Print router counters
void print_stats(const EventRouter& router) {
    auto stats = router.stats();
    spdlog::info("=== Router Stats ===");
    spdlog::info("Pending:   {}", stats.pending);
    spdlog::info("Processed: {}", stats.processed);
    spdlog::info("Failed:    {}", stats.failed);
    spdlog::info("Retried:   {}", stats.retried);
    spdlog::info("Discarded: {}", stats.discarded);
    spdlog::info("Rejected:  {}", stats.rejected);
    spdlog::info("Avg latency: {:.2f}us", stats.average_latency_us);
}

} // anonymous namespace

int main(int argc, char** argv) {
    KernelConfig config;
    if (argc > 1) {
        auto loaded = load_kernel_config(argv[1]);
        if (!loaded) {
            spdlog::error("Failed to load config: {}", pulse_core::build_error_chain(loaded.error()));
            return 1;
        }
        config = std::move(*loaded);
    }

    if (auto logging = pulse_core::configure_logging(config.logging); !logging) {
        spdlog::error("Failed to configure logging: {}", pulse_core::build_error_chain(logging.error()));
        return 1;
    }
    spdlog::info("Effective config: {}", to_json(config).dump());

    KernelContext kernel(config);

    // Startup planning
    auto order = kernel.plan_startup({
        {"scheduler", {"storage", "events"}, "1.2.0"},
        {"storage", {}, "0.9.1"},
        {"events", {"storage"}, "1.0.0"},
        {"agents", {"scheduler", "models"}, "0.3.0"},
        {"models", {"storage"}, "2.1.0"},
    });
    if (!order) {
        return 1;
    }

    // Handlers
    auto audit = kernel.router().on(event_types::Wildcard, [](Event& e) -> Result<void> {
        spdlog::info("[audit] {} from {} ({})", e.event_type, e.source_id, to_string(e.priority));
        return Ok();
    }, 100);

    auto tasks = kernel.router().on(event_types::TaskCreate, [](Event& e) -> Result<void> {
        spdlog::info("[tasks] creating task {}", e.payload.value("name", std::string("unnamed")));
        return Ok();
    });

    auto flaky = kernel.router().on(event_types::ModelRequest, [](Event& e) -> Result<void> {
        return Err(Error("model backend unavailable (attempt " + std::to_string(e.retry_count + 1) + ")"));
    });

    // Events
    auto submit = [&kernel](const std::string& type, const std::string& source, SourceKind kind,
                            nlohmann::json payload, EventPriority priority) {
        auto result = kernel.submit(kernel.router().create_event(type, source, kind, std::move(payload), priority));
        if (!result) {
            spdlog::warn("Rejected: {}", pulse_core::build_error_chain(result.error()));
        } else if (!*result) {
            spdlog::warn("Queue full, dropped {}", type);
        }
    };

    if (auto r = kernel.emit_system_event(event_types::KernelInit, {{"units", order->size()}}, EventPriority::High); !r) {
        spdlog::error("{}", pulse_core::build_error_chain(r.error()));
    }
    submit(event_types::TaskCreate, "scheduler", SourceKind::Module, {{"name", "index"}}, EventPriority::Normal);
    submit(event_types::ModelRequest, "agents", SourceKind::Agent, {{"prompt", "summarize"}}, EventPriority::Low);
    submit(event_types::SystemAlert, "monitor", SourceKind::System, {{"disk", 0.93}}, EventPriority::Critical);
    submit(event_types::UserCommand, "", SourceKind::User, {{"cmd", "status"}}, EventPriority::Normal);

    auto processed = kernel.router().drain();
    spdlog::info("Drain processed {} events", processed);

    print_stats(kernel.router());

    tasks();
    flaky();
    audit();

    pulse_core::shutdown_logging();
    return 0;
}
