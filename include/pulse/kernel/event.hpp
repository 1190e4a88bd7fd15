/// @file event.hpp
/// @brief Event model for pulse_kernel
///
/// An Event is a prioritized unit of work routed by the EventRouter to
/// zero or more matching handlers. Events keep one stable identity for
/// their whole lifetime; retries only advance retry_count.

#pragma once

#include "fwd.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pulse_kernel {

// =============================================================================
// Enumerations
// =============================================================================

/// Event priority; higher values are dequeued first
enum class EventPriority : std::uint8_t {
    Low = 0,
    Normal = 1,
    High = 2,
    Critical = 3,
};

/// Number of distinct priority bands
inline constexpr std::size_t k_priority_count = 4;

/// Kind of component that produced an event
enum class SourceKind : std::uint8_t {
    Kernel,
    Module,
    Agent,
    User,
    System,
};

/// Event lifecycle status
enum class EventStatus : std::uint8_t {
    Pending,
    Processing,
    Processed,
    Failed,
};

[[nodiscard]] const char* to_string(EventPriority priority);
[[nodiscard]] const char* to_string(SourceKind kind);
[[nodiscard]] const char* to_string(EventStatus status);

[[nodiscard]] std::optional<EventPriority> parse_priority(std::string_view str);
[[nodiscard]] std::optional<SourceKind> parse_source_kind(std::string_view str);
[[nodiscard]] std::optional<EventStatus> parse_status(std::string_view str);

// =============================================================================
// Well-known event types
// =============================================================================

namespace event_types {

inline constexpr const char* KernelInit = "kernel:init";
inline constexpr const char* KernelStateChange = "kernel:state_change";
inline constexpr const char* KernelShutdown = "kernel:shutdown";
inline constexpr const char* TaskCreate = "task:create";
inline constexpr const char* TaskStart = "task:start";
inline constexpr const char* TaskComplete = "task:complete";
inline constexpr const char* TaskFail = "task:fail";
inline constexpr const char* TaskCancel = "task:cancel";
inline constexpr const char* ModuleLoad = "module:load";
inline constexpr const char* ModuleUnload = "module:unload";
inline constexpr const char* ModuleError = "module:error";
inline constexpr const char* AgentSpawn = "agent:spawn";
inline constexpr const char* AgentHeartbeat = "agent:heartbeat";
inline constexpr const char* AgentError = "agent:error";
inline constexpr const char* ModelRequest = "model:request";
inline constexpr const char* ModelResponse = "model:response";
inline constexpr const char* SecurityPermissionRequest = "security:permission_request";
inline constexpr const char* SecurityViolation = "security:violation";
inline constexpr const char* RecoveryFailure = "recovery:failure";
inline constexpr const char* RecoveryRestore = "recovery:restore";
inline constexpr const char* UserCommand = "user:command";
inline constexpr const char* SystemAlert = "system:alert";

/// Handler filter matching every event type
inline constexpr const char* Wildcard = "*";

} // namespace event_types

// =============================================================================
// Event
// =============================================================================

using EventClock = std::chrono::system_clock;
using EventTimestamp = EventClock::time_point;

/// Correlation data carried alongside an event
struct ExecutionContext {
    std::string correlation_id;
    std::string parent_id;   ///< Optional, empty if unset
    std::string session_id;  ///< Optional, empty if unset
    nlohmann::json metadata = nlohmann::json::object();

    /// Fresh context with a random correlation id and empty metadata
    [[nodiscard]] static ExecutionContext create();
};

/// Prioritized unit of work
struct Event {
    std::string id;
    EventTimestamp timestamp{};
    std::string event_type;
    std::string source_id;
    SourceKind source_kind = SourceKind::System;
    EventPriority priority = EventPriority::Normal;
    nlohmann::json payload = nlohmann::json::object();
    ExecutionContext context;
    EventStatus status = EventStatus::Pending;
    std::uint32_t retry_count = 0;
    std::optional<EventTimestamp> processed_at;

    /// Serialize for diagnostics
    [[nodiscard]] nlohmann::json to_json() const;
};

/// Numeric rank of a priority (Low = 0 .. Critical = 3)
[[nodiscard]] constexpr std::size_t priority_rank(EventPriority priority) noexcept {
    return static_cast<std::size_t>(priority);
}

/// False for values cast from integers outside Low..Critical
[[nodiscard]] constexpr bool is_valid_priority(EventPriority priority) noexcept {
    return priority_rank(priority) < k_priority_count;
}

} // namespace pulse_kernel
