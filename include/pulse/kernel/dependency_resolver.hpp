/// @file dependency_resolver.hpp
/// @brief Load-order resolution for interdependent named units
///
/// Given a set of nodes and their declared dependencies, the resolver
/// produces a load order in which every node follows all of its
/// dependencies. Each node is tagged with a level: the length of the
/// longest dependency chain from the node down to a dependency-free leaf.
///
/// Resolution is all-or-nothing: a cycle or a reference to an id outside
/// the supplied set fails the whole call with a DependencyError and no
/// partial order is returned.
///
/// All operations are pure with respect to the resolver; the instance
/// holds no state between calls.

#pragma once

#include "fwd.hpp"

#include <pulse/core/error.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace pulse_kernel {

/// Named unit with its declared dependencies
struct DependencyNode {
    std::string id;
    std::vector<std::string> dependencies;  ///< Referenced ids, not owned
    std::string version;                    ///< Informational only

    /// Check if this node directly depends on another
    [[nodiscard]] bool depends_on(const std::string& other) const;
};

/// Node id paired with its load-order level
struct ResolvedDependency {
    std::string id;
    std::uint32_t level = 0;  ///< 0 = no dependencies

    bool operator==(const ResolvedDependency&) const = default;
};

/// Result of a missing-dependency scan
struct DependencyValidation {
    bool valid = true;
    /// Offending node id -> dependency ids absent from the set
    std::map<std::string, std::vector<std::string>> missing;
};

/// Topological resolver with cycle detection
class DependencyResolver {
public:
    DependencyResolver() = default;

    /// Resolve the full node set into load order.
    /// Output is ordered by ascending level; ties keep visitation order.
    [[nodiscard]] pulse_core::Result<std::vector<ResolvedDependency>> resolve(
        const std::vector<DependencyNode>& nodes) const;

    /// True if resolution fails for any reason (cycle or unknown dependency)
    [[nodiscard]] bool has_circular_dependencies(const std::vector<DependencyNode>& nodes) const;

    /// True only if resolution fails because of a cycle
    [[nodiscard]] bool has_cycle(const std::vector<DependencyNode>& nodes) const;

    /// Every id reachable from @p id through dependency edges, excluding @p id.
    /// Ids absent from the set are not reported. Empty if @p id is unknown.
    [[nodiscard]] std::vector<std::string> transitive_dependencies(
        const std::string& id,
        const std::vector<DependencyNode>& nodes) const;

    /// Ids of nodes whose direct dependency list contains @p id
    [[nodiscard]] std::vector<std::string> dependents(
        const std::string& id,
        const std::vector<DependencyNode>& nodes) const;

    /// Collect, per node, the dependency ids absent from the set
    [[nodiscard]] DependencyValidation validate_dependencies(const std::vector<DependencyNode>& nodes) const;

    /// Resolve @p existing plus @p new_node and return the load order suffix
    /// starting at @p new_node
    [[nodiscard]] pulse_core::Result<std::vector<std::string>> load_order_for(
        const DependencyNode& new_node,
        const std::vector<DependencyNode>& existing) const;

    /// Check whether @p id and everything it reaches can be resolved
    [[nodiscard]] pulse_core::Result<void> can_load(
        const std::string& id,
        const std::vector<DependencyNode>& nodes) const;
};

} // namespace pulse_kernel
