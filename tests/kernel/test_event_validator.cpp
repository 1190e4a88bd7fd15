/// @file test_event_validator.cpp
/// @brief Tests for EventValidator and the event model

#include <catch2/catch_test_macros.hpp>
#include <pulse/kernel/event_router.hpp>
#include <pulse/kernel/event_validator.hpp>

#include <algorithm>
#include <string>

using namespace pulse_kernel;

namespace {

Event valid_event(const std::string& type, EventPriority priority = EventPriority::Normal) {
    EventRouter router;
    return router.create_event(type, "tester", SourceKind::Module, {{"value", 1}}, priority);
}

bool contains(const std::vector<std::string>& messages, const std::string& needle) {
    return std::any_of(messages.begin(), messages.end(),
        [&needle](const std::string& m) { return m.find(needle) != std::string::npos; });
}

} // anonymous namespace

// =============================================================================
// Event model
// =============================================================================

TEST_CASE("Event: enum names round-trip", "[kernel][event]") {
    REQUIRE(std::string(to_string(EventPriority::Critical)) == "critical");
    REQUIRE(parse_priority("high") == EventPriority::High);
    REQUIRE_FALSE(parse_priority("urgent").has_value());

    REQUIRE(std::string(to_string(SourceKind::Agent)) == "agent");
    REQUIRE(parse_source_kind("user") == SourceKind::User);
    REQUIRE_FALSE(parse_source_kind("robot").has_value());

    REQUIRE(std::string(to_string(EventStatus::Processed)) == "processed");
    REQUIRE(parse_status("failed") == EventStatus::Failed);
}

TEST_CASE("Event: priority rank order", "[kernel][event]") {
    REQUIRE(priority_rank(EventPriority::Low) < priority_rank(EventPriority::Normal));
    REQUIRE(priority_rank(EventPriority::Normal) < priority_rank(EventPriority::High));
    REQUIRE(priority_rank(EventPriority::High) < priority_rank(EventPriority::Critical));
    REQUIRE(priority_rank(EventPriority::Critical) == k_priority_count - 1);
}

TEST_CASE("Event: to_json", "[kernel][event]") {
    auto event = valid_event(event_types::TaskCreate, EventPriority::High);
    event.context.parent_id = "parent-1";

    auto j = event.to_json();
    REQUIRE(j["id"] == event.id);
    REQUIRE(j["event_type"] == "task:create");
    REQUIRE(j["source_id"] == "tester");
    REQUIRE(j["source_kind"] == "module");
    REQUIRE(j["priority"] == "high");
    REQUIRE(j["status"] == "pending");
    REQUIRE(j["retry_count"] == 0);
    REQUIRE(j["payload"]["value"] == 1);
    REQUIRE(j["context"]["correlation_id"] == event.context.correlation_id);
    REQUIRE(j["context"]["parent_id"] == "parent-1");
    REQUIRE_FALSE(j["context"].contains("session_id"));
    REQUIRE_FALSE(j.contains("processed_at"));
    REQUIRE(j["timestamp"].get<std::int64_t>() > 0);
}

// =============================================================================
// Registry
// =============================================================================

TEST_CASE("EventValidator: built-in types", "[kernel][validator]") {
    EventValidator validator;

    REQUIRE(validator.has_event_type(event_types::KernelInit));
    REQUIRE(validator.has_event_type(event_types::SystemAlert));
    REQUIRE(validator.has_event_type(event_types::UserCommand));
    REQUIRE_FALSE(validator.has_event_type("made:up"));
    REQUIRE(validator.all_event_types().size() == 22);

    const auto* init = validator.event_type(event_types::KernelInit);
    REQUIRE(init != nullptr);
    REQUIRE(init->category == "kernel");
    REQUIRE(init->min_priority == EventPriority::High);

    auto tasks = validator.event_types_by_category("task");
    REQUIRE(tasks.size() == 5);
    for (const auto& def : tasks) {
        REQUIRE(def.category == "task");
    }
}

TEST_CASE("EventValidator: register custom type", "[kernel][validator]") {
    EventValidator validator;
    validator.register_event_type({"billing:charge", "billing", "Charge a customer", EventPriority::Normal});

    REQUIRE(validator.has_event_type("billing:charge"));
    REQUIRE(validator.event_types_by_category("billing").size() == 1);

    // Re-registering replaces
    validator.register_event_type({"billing:charge", "finance", "Charge", std::nullopt});
    REQUIRE(validator.event_type("billing:charge")->category == "finance");
    REQUIRE(validator.event_types_by_category("billing").empty());
}

// =============================================================================
// validate
// =============================================================================

TEST_CASE("EventValidator: valid event", "[kernel][validator]") {
    EventValidator validator;
    auto result = validator.validate(valid_event(event_types::TaskCreate));
    REQUIRE(result.valid);
    REQUIRE(result.errors.empty());
    REQUIRE(result.warnings.empty());
}

TEST_CASE("EventValidator: missing required fields", "[kernel][validator]") {
    EventValidator validator;
    Event event;

    auto result = validator.validate(event);
    REQUIRE_FALSE(result.valid);
    REQUIRE(contains(result.errors, "valid id"));
    REQUIRE(contains(result.errors, "valid event type"));
    REQUIRE(contains(result.errors, "valid source id"));
    REQUIRE(contains(result.errors, "valid timestamp"));
}

TEST_CASE("EventValidator: payload shape", "[kernel][validator]") {
    EventValidator validator;

    SECTION("null payload warns") {
        auto event = valid_event(event_types::TaskCreate);
        event.payload = nullptr;
        auto result = validator.validate(event);
        REQUIRE(result.valid);
        REQUIRE(contains(result.warnings, "no payload"));
    }

    SECTION("non-object payload fails") {
        auto event = valid_event(event_types::TaskCreate);
        event.payload = nlohmann::json::array({1, 2, 3});
        auto result = validator.validate(event);
        REQUIRE_FALSE(result.valid);
        REQUIRE(contains(result.errors, "payload must be an object"));
    }

    SECTION("non-object metadata fails") {
        auto event = valid_event(event_types::TaskCreate);
        event.context.metadata = "text";
        auto result = validator.validate(event);
        REQUIRE_FALSE(result.valid);
        REQUIRE(contains(result.errors, "metadata"));
    }
}

TEST_CASE("EventValidator: minimum priority", "[kernel][validator]") {
    EventValidator validator;

    auto low = validator.validate(valid_event(event_types::SecurityViolation, EventPriority::Normal));
    REQUIRE(low.valid);
    REQUIRE(contains(low.warnings, "below minimum"));

    auto ok = validator.validate(valid_event(event_types::SecurityViolation, EventPriority::Critical));
    REQUIRE(ok.valid);
    REQUIRE(ok.warnings.empty());
}

TEST_CASE("EventValidator: unknown type", "[kernel][validator]") {
    SECTION("lenient mode warns") {
        EventValidator validator;
        auto result = validator.validate(valid_event("custom:thing"));
        REQUIRE(result.valid);
        REQUIRE(contains(result.warnings, "Unknown event type: custom:thing"));
    }

    SECTION("strict mode rejects") {
        EventValidator validator(true);
        REQUIRE(validator.strict_mode());
        auto result = validator.validate(valid_event("custom:thing"));
        REQUIRE_FALSE(result.valid);
        REQUIRE(contains(result.errors, "Unknown event type: custom:thing"));
    }

    SECTION("mode can be toggled") {
        EventValidator validator;
        validator.set_strict_mode(true);
        REQUIRE_FALSE(validator.validate(valid_event("custom:thing")).valid);
        validator.set_strict_mode(false);
        REQUIRE(validator.validate(valid_event("custom:thing")).valid);
    }
}

TEST_CASE("EventValidator: out-of-range priority", "[kernel][validator]") {
    EventValidator validator;
    auto event = valid_event(event_types::SecurityViolation);
    event.priority = static_cast<EventPriority>(200);

    auto result = validator.validate(event);
    REQUIRE_FALSE(result.valid);
    REQUIRE(contains(result.errors, "priority is out of range"));
    REQUIRE_FALSE(contains(result.warnings, "below minimum"));
}
