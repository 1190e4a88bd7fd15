#pragma once

/// @file kernel.hpp
/// @brief Main include header for pulse_kernel
///
/// pulse_kernel provides the two primitives an orchestrator builds on:
/// - DependencyResolver: deterministic load order with cycle detection
/// - EventRouter: priority event dispatch with bounded queue and retry
///
/// ## Quick Start
///
/// ```cpp
/// pulse_kernel::KernelContext kernel;
///
/// // Order unit initialization
/// auto order = kernel.plan_startup({
///     {"storage", {}},
///     {"scheduler", {"storage"}},
/// });
///
/// // Register handlers, then admit events
/// auto unsubscribe = kernel.router().on("task:create", [](Event& e) {
///     return pulse_core::Ok();
/// });
///
/// auto event = kernel.router().create_event("task:create", "scheduler",
///     SourceKind::Module, {{"task", "index"}});
/// if (!kernel.router().emit(std::move(event))) {
///     // queue full
/// }
///
/// kernel.router().drain();
/// unsubscribe();
/// ```

#include "fwd.hpp"
#include "dependency_resolver.hpp"
#include "event.hpp"
#include "event_validator.hpp"
#include "event_router.hpp"
#include "config.hpp"
#include "kernel_context.hpp"

namespace pulse_kernel {

/// Prelude - commonly used types
namespace prelude {
    using pulse_kernel::DependencyNode;
    using pulse_kernel::ResolvedDependency;
    using pulse_kernel::DependencyResolver;
    using pulse_kernel::EventPriority;
    using pulse_kernel::SourceKind;
    using pulse_kernel::EventStatus;
    using pulse_kernel::Event;
    using pulse_kernel::ExecutionContext;
    using pulse_kernel::EventHandler;
    using pulse_kernel::EventRouter;
    using pulse_kernel::KernelConfig;
    using pulse_kernel::KernelContext;
} // namespace prelude

} // namespace pulse_kernel
