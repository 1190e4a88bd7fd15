/// @file event_router.hpp
/// @brief Priority event router with bounded queueing and bounded retry
///
/// The router owns a bounded queue of events ordered by priority
/// (Critical first, FIFO within a priority band) and a registry of
/// handlers. drain() removes events one at a time and dispatches each to
/// every handler whose filter matches, strictly sequentially and in
/// descending registration priority.
///
/// Admission control is non-blocking: emit() returns false when the
/// queue is at capacity. A failed event is re-queued into its band until
/// it has been attempted max_retries times, then discarded.
///
/// At most one drain pass is active per router; a drain() issued while a
/// pass is running (from a handler or another thread) returns 0. Handlers
/// run without internal locks held and may emit, register or unsubscribe.

#pragma once

#include "fwd.hpp"
#include "event.hpp"

#include <pulse/core/error.hpp>

#include <array>
#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pulse_kernel {

/// Handler callback; an error result (or a thrown std::exception) fails the event
using EventHandler = std::function<pulse_core::Result<void>(Event&)>;

/// Router limits
struct RouterConfig {
    /// Maximum queued events; emit() beyond this is rejected
    std::size_t max_queue_size = 10000;
    /// Total attempts before a failing event is discarded
    std::uint32_t max_retries = 3;
};

/// Snapshot of router counters
struct RouterStats {
    std::size_t pending = 0;
    std::uint64_t processed = 0;   ///< Events that reached Processed
    std::uint64_t failed = 0;      ///< Failed processing attempts
    std::uint64_t retried = 0;     ///< Failed events re-queued by drain()
    std::uint64_t discarded = 0;   ///< Events dropped past the retry bound
    std::uint64_t rejected = 0;    ///< emit() calls refused at capacity
    double average_latency_us = 0.0;
};

namespace detail {
class HandlerRegistry;
} // namespace detail

/// Capability removing exactly one handler registration.
/// Invoking it more than once, or after the router is gone, does nothing.
class Unsubscriber {
public:
    Unsubscriber() = default;

    void operator()() const;

    /// Registration id this capability removes
    [[nodiscard]] const std::string& id() const noexcept { return m_id; }

private:
    friend class EventRouter;

    Unsubscriber(std::weak_ptr<detail::HandlerRegistry> registry, std::string id)
        : m_registry(std::move(registry)), m_id(std::move(id)) {}

    std::weak_ptr<detail::HandlerRegistry> m_registry;
    std::string m_id;
};

/// Routes events to registered handlers under strict priority ordering
class EventRouter {
public:
    explicit EventRouter(RouterConfig config = {});
    ~EventRouter();

    EventRouter(const EventRouter&) = delete;
    EventRouter& operator=(const EventRouter&) = delete;

    // =========================================================================
    // Registration
    // =========================================================================

    /// Register @p handler for @p event_type (or event_types::Wildcard).
    /// Higher @p priority handlers run first; ties run in registration order.
    Unsubscriber on(const std::string& event_type, EventHandler handler, std::int32_t priority = 0);

    // =========================================================================
    // Events
    // =========================================================================

    /// Build a pending event with a fresh id and timestamp.
    /// A missing @p context gets a fresh correlation id and empty metadata.
    [[nodiscard]] Event create_event(
        std::string event_type,
        std::string source_id,
        SourceKind source_kind,
        nlohmann::json payload,
        EventPriority priority = EventPriority::Normal,
        std::optional<ExecutionContext> context = std::nullopt) const;

    /// Queue @p event behind all events of equal or higher priority.
    /// Returns false, leaving the queue unchanged, when at capacity or when
    /// the priority is not one of the four defined values.
    [[nodiscard]] bool emit(Event event);

    /// Remove and return the queue head
    [[nodiscard]] std::optional<Event> dequeue();

    /// Run every matching handler on @p event. Stops at the first failure,
    /// marking the event Failed and advancing its retry count.
    pulse_core::Result<void> process_event(Event& event);

    /// Process queued events until the queue is empty.
    /// @return number of events that reached Processed during this call
    std::size_t drain();

    /// Discard all queued events without invoking handlers
    void clear_queue();

    // =========================================================================
    // Introspection
    // =========================================================================

    [[nodiscard]] std::size_t queue_length() const;

    /// Copy of the queue in dequeue order
    [[nodiscard]] std::vector<Event> queue_snapshot() const;

    [[nodiscard]] std::size_t handler_count() const;

    [[nodiscard]] bool is_draining() const noexcept {
        return m_draining.load(std::memory_order_acquire);
    }

    [[nodiscard]] RouterStats stats() const;

    [[nodiscard]] const RouterConfig& config() const noexcept { return m_config; }

private:
    using Band = std::deque<Event>;

    RouterConfig m_config;
    std::shared_ptr<detail::HandlerRegistry> m_handlers;

    mutable std::mutex m_queue_mutex;
    std::array<Band, k_priority_count> m_bands;  // indexed by priority rank
    std::size_t m_queue_size = 0;

    std::atomic<bool> m_draining{false};

    std::atomic<std::uint64_t> m_processed{0};
    std::atomic<std::uint64_t> m_failed{0};
    std::atomic<std::uint64_t> m_retried{0};
    std::atomic<std::uint64_t> m_discarded{0};
    std::atomic<std::uint64_t> m_rejected{0};
    std::atomic<std::uint64_t> m_total_latency_ns{0};
};

} // namespace pulse_kernel
