/// @file event.cpp
/// @brief Event model conversions

#include <pulse/kernel/event.hpp>
#include <pulse/core/id.hpp>

namespace pulse_kernel {

const char* to_string(EventPriority priority) {
    switch (priority) {
        case EventPriority::Low: return "low";
        case EventPriority::Normal: return "normal";
        case EventPriority::High: return "high";
        case EventPriority::Critical: return "critical";
        default: return "unknown";
    }
}

const char* to_string(SourceKind kind) {
    switch (kind) {
        case SourceKind::Kernel: return "kernel";
        case SourceKind::Module: return "module";
        case SourceKind::Agent: return "agent";
        case SourceKind::User: return "user";
        case SourceKind::System: return "system";
        default: return "unknown";
    }
}

const char* to_string(EventStatus status) {
    switch (status) {
        case EventStatus::Pending: return "pending";
        case EventStatus::Processing: return "processing";
        case EventStatus::Processed: return "processed";
        case EventStatus::Failed: return "failed";
        default: return "unknown";
    }
}

std::optional<EventPriority> parse_priority(std::string_view str) {
    if (str == "low") return EventPriority::Low;
    if (str == "normal") return EventPriority::Normal;
    if (str == "high") return EventPriority::High;
    if (str == "critical") return EventPriority::Critical;
    return std::nullopt;
}

std::optional<SourceKind> parse_source_kind(std::string_view str) {
    if (str == "kernel") return SourceKind::Kernel;
    if (str == "module") return SourceKind::Module;
    if (str == "agent") return SourceKind::Agent;
    if (str == "user") return SourceKind::User;
    if (str == "system") return SourceKind::System;
    return std::nullopt;
}

std::optional<EventStatus> parse_status(std::string_view str) {
    if (str == "pending") return EventStatus::Pending;
    if (str == "processing") return EventStatus::Processing;
    if (str == "processed") return EventStatus::Processed;
    if (str == "failed") return EventStatus::Failed;
    return std::nullopt;
}

ExecutionContext ExecutionContext::create() {
    ExecutionContext ctx;
    ctx.correlation_id = pulse_core::generate_uuid();
    return ctx;
}

namespace {

std::int64_t to_millis(EventTimestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

} // anonymous namespace

nlohmann::json Event::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["timestamp"] = to_millis(timestamp);
    j["event_type"] = event_type;
    j["source_id"] = source_id;
    j["source_kind"] = to_string(source_kind);
    j["priority"] = to_string(priority);
    j["payload"] = payload;

    nlohmann::json ctx;
    ctx["correlation_id"] = context.correlation_id;
    if (!context.parent_id.empty()) {
        ctx["parent_id"] = context.parent_id;
    }
    if (!context.session_id.empty()) {
        ctx["session_id"] = context.session_id;
    }
    ctx["metadata"] = context.metadata;
    j["context"] = std::move(ctx);

    j["status"] = to_string(status);
    j["retry_count"] = retry_count;
    if (processed_at) {
        j["processed_at"] = to_millis(*processed_at);
    }
    return j;
}

} // namespace pulse_kernel
