/// @file event_validator.hpp
/// @brief Structural validation of events before admission

#pragma once

#include "fwd.hpp"
#include "event.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pulse_kernel {

/// Known event type and its admission constraints
struct EventTypeDefinition {
    std::string type;
    std::string category;
    std::string description;
    std::optional<EventPriority> min_priority;
};

/// Outcome of validating one event
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

/// Validates events against a registry of known event types.
///
/// In strict mode an unknown event type is an error; otherwise it only
/// produces a warning.
class EventValidator {
public:
    /// Create a validator seeded with the built-in event types
    explicit EventValidator(bool strict = false);

    /// Add or replace an event type definition
    void register_event_type(EventTypeDefinition definition);

    [[nodiscard]] bool has_event_type(const std::string& type) const;
    [[nodiscard]] const EventTypeDefinition* event_type(const std::string& type) const;
    [[nodiscard]] std::vector<EventTypeDefinition> all_event_types() const;
    [[nodiscard]] std::vector<EventTypeDefinition> event_types_by_category(const std::string& category) const;

    void set_strict_mode(bool strict) noexcept { m_strict = strict; }
    [[nodiscard]] bool strict_mode() const noexcept { return m_strict; }

    [[nodiscard]] ValidationResult validate(const Event& event) const;

private:
    std::map<std::string, EventTypeDefinition> m_types;
    bool m_strict;
};

} // namespace pulse_kernel
