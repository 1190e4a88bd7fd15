/// @file kernel_context.cpp
/// @brief KernelContext implementation

#include <pulse/kernel/kernel_context.hpp>
#include <pulse/core/log.hpp>

#include <sstream>

namespace pulse_kernel {

using pulse_core::Err;
using pulse_core::Error;
using pulse_core::ErrorCode;
using pulse_core::Ok;
using pulse_core::Result;

KernelContext::KernelContext(KernelConfig config)
    : m_config(std::move(config))
    , m_router(m_config.router)
    , m_validator(m_config.strict_validation)
{
    pulse_core::kernel_logger()->debug("Kernel context created (queue capacity {}, max retries {})",
        m_config.router.max_queue_size, m_config.router.max_retries);
}

Result<std::vector<ResolvedDependency>> KernelContext::plan_startup(
    const std::vector<DependencyNode>& units) const
{
    auto order = m_resolver.resolve(units);
    if (!order) {
        pulse_core::kernel_logger()->error("Startup planning failed: {}",
            pulse_core::build_error_chain(order.error()));
        return order;
    }

    std::ostringstream oss;
    for (std::size_t i = 0; i < order->size(); ++i) {
        if (i > 0) oss << ", ";
        oss << (*order)[i].id << "@" << (*order)[i].level;
    }
    pulse_core::kernel_logger()->info("Startup order: [{}]", oss.str());
    return order;
}

Result<bool> KernelContext::submit(Event event) {
    auto validation = m_validator.validate(event);
    for (const auto& warning : validation.warnings) {
        pulse_core::kernel_logger()->warn("Event {} ({}): {}", event.id, event.event_type, warning);
    }

    if (!validation.valid) {
        std::ostringstream oss;
        oss << "Event '" << event.event_type << "' rejected:";
        for (const auto& error : validation.errors) {
            oss << " " << error << ";";
        }
        Error err(ErrorCode::ValidationError, oss.str());
        err.with_context("event_id", event.id);
        return Err<bool>(std::move(err));
    }

    return Ok(m_router.emit(std::move(event)));
}

Result<bool> KernelContext::emit_system_event(
    const std::string& event_type,
    nlohmann::json payload,
    EventPriority priority)
{
    return submit(m_router.create_event(event_type, "kernel", SourceKind::Kernel, std::move(payload), priority));
}

} // namespace pulse_kernel
