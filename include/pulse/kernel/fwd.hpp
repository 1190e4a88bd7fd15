/// @file fwd.hpp
/// @brief Forward declarations for pulse_kernel

#pragma once

#include <cstdint>

namespace pulse_kernel {

// =============================================================================
// Dependency Resolution
// =============================================================================

/// Named unit with declared dependencies
struct DependencyNode;

/// Node paired with its load-order level
struct ResolvedDependency;

/// Outcome of a missing-dependency scan
struct DependencyValidation;

/// Load-order resolver
class DependencyResolver;

// =============================================================================
// Events
// =============================================================================

enum class EventPriority : std::uint8_t;
enum class SourceKind : std::uint8_t;
enum class EventStatus : std::uint8_t;

struct ExecutionContext;
struct Event;

struct EventTypeDefinition;
struct ValidationResult;
class EventValidator;

// =============================================================================
// Routing
// =============================================================================

struct RouterConfig;
struct RouterStats;
class Unsubscriber;
class EventRouter;

// =============================================================================
// Kernel
// =============================================================================

struct KernelConfig;
class KernelContext;

} // namespace pulse_kernel
