/// @file event_validator.cpp
/// @brief EventValidator implementation

#include <pulse/kernel/event_validator.hpp>

namespace pulse_kernel {

namespace {

std::vector<EventTypeDefinition> builtin_event_types() {
    using namespace event_types;
    return {
        {KernelInit, "kernel", "Kernel initialized", EventPriority::High},
        {KernelStateChange, "kernel", "Kernel state transition", std::nullopt},
        {KernelShutdown, "kernel", "Kernel shutting down", EventPriority::High},
        {TaskCreate, "task", "Task created", std::nullopt},
        {TaskStart, "task", "Task started", std::nullopt},
        {TaskComplete, "task", "Task completed", std::nullopt},
        {TaskFail, "task", "Task failed", std::nullopt},
        {TaskCancel, "task", "Task cancelled", std::nullopt},
        {ModuleLoad, "module", "Module loaded", std::nullopt},
        {ModuleUnload, "module", "Module unloaded", std::nullopt},
        {ModuleError, "module", "Module error", std::nullopt},
        {AgentSpawn, "agent", "Agent spawned", std::nullopt},
        {AgentHeartbeat, "agent", "Agent heartbeat", std::nullopt},
        {AgentError, "agent", "Agent error", std::nullopt},
        {ModelRequest, "model", "Model request", std::nullopt},
        {ModelResponse, "model", "Model response", std::nullopt},
        {SecurityPermissionRequest, "security", "Permission requested", std::nullopt},
        {SecurityViolation, "security", "Security violation", EventPriority::High},
        {RecoveryFailure, "recovery", "Failure recorded for recovery", std::nullopt},
        {RecoveryRestore, "recovery", "State restored", std::nullopt},
        {UserCommand, "user", "User command", std::nullopt},
        {SystemAlert, "system", "System alert", EventPriority::High},
    };
}

} // anonymous namespace

EventValidator::EventValidator(bool strict)
    : m_strict(strict)
{
    for (auto& definition : builtin_event_types()) {
        register_event_type(std::move(definition));
    }
}

void EventValidator::register_event_type(EventTypeDefinition definition) {
    std::string key = definition.type;
    m_types[key] = std::move(definition);
}

bool EventValidator::has_event_type(const std::string& type) const {
    return m_types.find(type) != m_types.end();
}

const EventTypeDefinition* EventValidator::event_type(const std::string& type) const {
    auto it = m_types.find(type);
    return it != m_types.end() ? &it->second : nullptr;
}

std::vector<EventTypeDefinition> EventValidator::all_event_types() const {
    std::vector<EventTypeDefinition> out;
    out.reserve(m_types.size());
    for (const auto& [type, definition] : m_types) {
        out.push_back(definition);
    }
    return out;
}

std::vector<EventTypeDefinition> EventValidator::event_types_by_category(const std::string& category) const {
    std::vector<EventTypeDefinition> out;
    for (const auto& [type, definition] : m_types) {
        if (definition.category == category) {
            out.push_back(definition);
        }
    }
    return out;
}

ValidationResult EventValidator::validate(const Event& event) const {
    ValidationResult result;

    if (event.id.empty()) {
        result.errors.emplace_back("Event must have a valid id");
    }
    if (event.event_type.empty()) {
        result.errors.emplace_back("Event must have a valid event type");
    }
    if (event.source_id.empty()) {
        result.errors.emplace_back("Event must have a valid source id");
    }
    if (event.timestamp == EventTimestamp{}) {
        result.errors.emplace_back("Event must have a valid timestamp");
    }

    if (!is_valid_priority(event.priority)) {
        result.errors.emplace_back("Event priority is out of range");
    }

    if (const auto* definition = event_type(event.event_type)) {
        if (definition->min_priority && is_valid_priority(event.priority) && priority_rank(event.priority) < priority_rank(*definition->min_priority)) {
            result.warnings.push_back(
                std::string("Event priority ") + to_string(event.priority) +
                " is below minimum " + to_string(*definition->min_priority) +
                " for type " + event.event_type);
        }
    } else if (!event.event_type.empty()) {
        std::string message = "Unknown event type: " + event.event_type;
        if (m_strict) {
            result.errors.push_back(std::move(message));
        } else {
            result.warnings.push_back(std::move(message));
        }
    }

    if (event.payload.is_null()) {
        result.warnings.emplace_back("Event has no payload");
    } else if (!event.payload.is_object()) {
        result.errors.emplace_back("Event payload must be an object");
    }

    if (!event.context.metadata.is_null() && !event.context.metadata.is_object()) {
        result.errors.emplace_back("Execution context metadata must be an object");
    }

    result.valid = result.errors.empty();
    return result;
}

} // namespace pulse_kernel
