/// @file event_router.cpp
/// @brief EventRouter implementation

#include <pulse/kernel/event_router.hpp>
#include <pulse/core/id.hpp>
#include <pulse/core/log.hpp>

#include <algorithm>
#include <chrono>

namespace pulse_kernel {

using pulse_core::Err;
using pulse_core::Error;
using pulse_core::EventError;
using pulse_core::Ok;
using pulse_core::Result;

// =============================================================================
// HandlerRegistry
// =============================================================================

namespace detail {

struct HandlerEntry {
    std::string id;
    std::string event_type;
    EventHandler handler;
    std::int32_t priority = 0;

    [[nodiscard]] bool matches(const std::string& type) const {
        return event_type == event_types::Wildcard || event_type == type;
    }
};

using HandlerEntryPtr = std::shared_ptr<HandlerEntry>;

/// Handler registrations kept sorted by descending priority.
/// Entries are shared so dispatch invokes the registered callable itself,
/// and an entry removed mid-dispatch stays alive until its call returns.
class HandlerRegistry {
public:
    void add(HandlerEntryPtr entry) {
        std::lock_guard<std::mutex> lock(m_mutex);
        // Insert after every entry of equal or higher priority
        auto pos = std::upper_bound(m_entries.begin(), m_entries.end(), entry->priority,
            [](std::int32_t priority, const HandlerEntryPtr& e) { return priority > e->priority; });
        m_entries.insert(pos, std::move(entry));
    }

    bool remove(const std::string& id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::find_if(m_entries.begin(), m_entries.end(),
            [&id](const HandlerEntryPtr& e) { return e->id == id; });
        if (it == m_entries.end()) {
            return false;
        }
        m_entries.erase(it);
        return true;
    }

    [[nodiscard]] std::vector<HandlerEntryPtr> matching(const std::string& type) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<HandlerEntryPtr> out;
        for (const auto& entry : m_entries) {
            if (entry->matches(type)) {
                out.push_back(entry);
            }
        }
        return out;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_entries.size();
    }

private:
    mutable std::mutex m_mutex;
    std::vector<HandlerEntryPtr> m_entries;
};

} // namespace detail

// =============================================================================
// Unsubscriber
// =============================================================================

void Unsubscriber::operator()() const {
    if (auto registry = m_registry.lock()) {
        registry->remove(m_id);
    }
}

// =============================================================================
// Helpers
// =============================================================================

namespace {

/// Clears the single-flight flag when a drain pass ends
class DrainGuard {
public:
    explicit DrainGuard(std::atomic<bool>& flag) : m_flag(flag) {}
    ~DrainGuard() { m_flag.store(false, std::memory_order_release); }

    DrainGuard(const DrainGuard&) = delete;
    DrainGuard& operator=(const DrainGuard&) = delete;

private:
    std::atomic<bool>& m_flag;
};

Result<void> invoke_handler(detail::HandlerEntry& entry, Event& event) {
    try {
        auto result = entry.handler(event);
        if (!result) {
            Error err = EventError::handler_failed(
                event.event_type, event.id, entry.id, result.error().message());
            err.with_context("cause", pulse_core::error_code_name(result.error().code()));
            return Err(std::move(err));
        }
    } catch (const std::exception& e) {
        return Err(EventError::handler_threw(event.event_type, event.id, entry.id, e.what()));
    }
    return Ok();
}

} // anonymous namespace

// =============================================================================
// EventRouter
// =============================================================================

EventRouter::EventRouter(RouterConfig config)
    : m_config(config)
    , m_handlers(std::make_shared<detail::HandlerRegistry>())
{
}

EventRouter::~EventRouter() = default;

Unsubscriber EventRouter::on(const std::string& event_type, EventHandler handler, std::int32_t priority) {
    std::string id = pulse_core::generate_uuid();
    m_handlers->add(std::make_shared<detail::HandlerEntry>(
        detail::HandlerEntry{id, event_type, std::move(handler), priority}));
    return Unsubscriber(m_handlers, std::move(id));
}

Event EventRouter::create_event(
    std::string event_type,
    std::string source_id,
    SourceKind source_kind,
    nlohmann::json payload,
    EventPriority priority,
    std::optional<ExecutionContext> context) const
{
    Event event;
    event.id = pulse_core::generate_uuid();
    event.timestamp = EventClock::now();
    event.event_type = std::move(event_type);
    event.source_id = std::move(source_id);
    event.source_kind = source_kind;
    event.priority = priority;
    event.payload = std::move(payload);
    event.context = context ? std::move(*context) : ExecutionContext::create();
    event.status = EventStatus::Pending;
    event.retry_count = 0;
    return event;
}

bool EventRouter::emit(Event event) {
    if (!is_valid_priority(event.priority)) {
        m_rejected.fetch_add(1, std::memory_order_relaxed);
        pulse_core::event_logger()->error("Rejecting event {} ({}): priority value {} out of range",
            event.id, event.event_type, priority_rank(event.priority));
        return false;
    }

    std::unique_lock<std::mutex> lock(m_queue_mutex);
    if (m_queue_size >= m_config.max_queue_size) {
        lock.unlock();
        m_rejected.fetch_add(1, std::memory_order_relaxed);
        pulse_core::event_logger()->error("Event queue overflow, dropping event: {}", event.event_type);
        return false;
    }

    m_bands[priority_rank(event.priority)].push_back(std::move(event));
    ++m_queue_size;
    return true;
}

std::optional<Event> EventRouter::dequeue() {
    std::lock_guard<std::mutex> lock(m_queue_mutex);
    for (auto band = m_bands.rbegin(); band != m_bands.rend(); ++band) {
        if (!band->empty()) {
            Event event = std::move(band->front());
            band->pop_front();
            --m_queue_size;
            return event;
        }
    }
    return std::nullopt;
}

Result<void> EventRouter::process_event(Event& event) {
    auto handlers = m_handlers->matching(event.event_type);

    event.status = EventStatus::Processing;
    auto start = std::chrono::steady_clock::now();

    for (const auto& entry : handlers) {
        auto outcome = invoke_handler(*entry, event);
        if (!outcome) {
            event.status = EventStatus::Failed;
            ++event.retry_count;
            m_failed.fetch_add(1, std::memory_order_relaxed);
            pulse_core::event_logger()->error("Event processing error ({}): {}",
                event.event_type, pulse_core::build_error_chain(outcome.error()));
            return outcome;
        }
    }

    event.status = EventStatus::Processed;
    event.processed_at = EventClock::now();

    auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start);
    m_total_latency_ns.fetch_add(static_cast<std::uint64_t>(elapsed.count()), std::memory_order_relaxed);
    m_processed.fetch_add(1, std::memory_order_relaxed);

    pulse_core::event_logger()->trace("Event processed: {} ({} handlers)", event.event_type, handlers.size());
    return Ok();
}

std::size_t EventRouter::drain() {
    bool expected = false;
    if (!m_draining.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return 0;
    }
    DrainGuard guard(m_draining);

    std::size_t processed = 0;
    while (auto event = dequeue()) {
        if (process_event(*event)) {
            ++processed;
            continue;
        }

        if (event->retry_count < m_config.max_retries) {
            m_retried.fetch_add(1, std::memory_order_relaxed);
            pulse_core::event_logger()->warn("Retrying event {} ({}), attempt {} of {}",
                event->id, event->event_type, event->retry_count + 1, m_config.max_retries);
            if (!emit(std::move(*event))) {
                m_discarded.fetch_add(1, std::memory_order_relaxed);
            }
        } else {
            m_discarded.fetch_add(1, std::memory_order_relaxed);
            pulse_core::event_logger()->warn("Discarding event {} ({}) after {} attempts",
                event->id, event->event_type, event->retry_count);
        }
    }

    return processed;
}

void EventRouter::clear_queue() {
    std::lock_guard<std::mutex> lock(m_queue_mutex);
    for (auto& band : m_bands) {
        band.clear();
    }
    m_queue_size = 0;
}

std::size_t EventRouter::queue_length() const {
    std::lock_guard<std::mutex> lock(m_queue_mutex);
    return m_queue_size;
}

std::vector<Event> EventRouter::queue_snapshot() const {
    std::lock_guard<std::mutex> lock(m_queue_mutex);
    std::vector<Event> out;
    out.reserve(m_queue_size);
    for (auto band = m_bands.rbegin(); band != m_bands.rend(); ++band) {
        out.insert(out.end(), band->begin(), band->end());
    }
    return out;
}

std::size_t EventRouter::handler_count() const {
    return m_handlers->size();
}

RouterStats EventRouter::stats() const {
    RouterStats stats;
    stats.pending = queue_length();
    stats.processed = m_processed.load(std::memory_order_relaxed);
    stats.failed = m_failed.load(std::memory_order_relaxed);
    stats.retried = m_retried.load(std::memory_order_relaxed);
    stats.discarded = m_discarded.load(std::memory_order_relaxed);
    stats.rejected = m_rejected.load(std::memory_order_relaxed);
    if (stats.processed > 0) {
        auto total_ns = static_cast<double>(m_total_latency_ns.load(std::memory_order_relaxed));
        stats.average_latency_us = total_ns / static_cast<double>(stats.processed) / 1000.0;
    }
    return stats;
}

} // namespace pulse_kernel
