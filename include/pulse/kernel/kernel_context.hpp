/// @file kernel_context.hpp
/// @brief Explicit owner of the kernel primitives
///
/// The orchestrator constructs one KernelContext and passes it to the
/// call sites that need it. There is no process-wide instance: a fresh
/// kernel is obtained by constructing a new context.

#pragma once

#include "fwd.hpp"
#include "config.hpp"
#include "dependency_resolver.hpp"
#include "event_router.hpp"
#include "event_validator.hpp"

#include <pulse/core/error.hpp>

#include <string>
#include <vector>

namespace pulse_kernel {

/// Owns one resolver, router and validator built from a KernelConfig
class KernelContext {
public:
    explicit KernelContext(KernelConfig config = {});

    KernelContext(const KernelContext&) = delete;
    KernelContext& operator=(const KernelContext&) = delete;

    [[nodiscard]] DependencyResolver& resolver() noexcept { return m_resolver; }
    [[nodiscard]] EventRouter& router() noexcept { return m_router; }
    [[nodiscard]] EventValidator& validator() noexcept { return m_validator; }
    [[nodiscard]] const KernelConfig& config() const noexcept { return m_config; }

    /// Resolve the initialization order of @p units, logging the outcome
    [[nodiscard]] pulse_core::Result<std::vector<ResolvedDependency>> plan_startup(
        const std::vector<DependencyNode>& units) const;

    /// Validate @p event, then emit it.
    /// @return error on validation failure; Ok(false) if the queue rejected it
    [[nodiscard]] pulse_core::Result<bool> submit(Event event);

    /// Build a kernel-sourced event and submit it
    [[nodiscard]] pulse_core::Result<bool> emit_system_event(
        const std::string& event_type,
        nlohmann::json payload,
        EventPriority priority = EventPriority::Normal);

private:
    KernelConfig m_config;
    DependencyResolver m_resolver;
    EventRouter m_router;
    EventValidator m_validator;
};

} // namespace pulse_kernel
