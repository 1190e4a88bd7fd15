/// @file dependency_resolver.cpp
/// @brief DependencyResolver implementation

#include <pulse/kernel/dependency_resolver.hpp>
#include <pulse/core/log.hpp>

#include <algorithm>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace pulse_kernel {

using pulse_core::DependencyError;
using pulse_core::Err;
using pulse_core::Ok;
using pulse_core::Result;

bool DependencyNode::depends_on(const std::string& other) const {
    return std::find(dependencies.begin(), dependencies.end(), other) != dependencies.end();
}

namespace {

using NodeIndex = std::unordered_map<std::string, const DependencyNode*>;

/// Index nodes by id; a repeated id keeps its last declaration
NodeIndex index_nodes(const std::vector<DependencyNode>& nodes) {
    NodeIndex index;
    index.reserve(nodes.size());
    for (const auto& node : nodes) {
        index[node.id] = &node;
    }
    return index;
}

enum class VisitState : std::uint8_t {
    Unvisited,
    Visiting,
    Resolved,
};

/// Depth-first traversal with three-state cycle detection
class Traversal {
public:
    explicit Traversal(const NodeIndex& index) : m_index(index) {}

    [[nodiscard]] bool is_resolved(const std::string& id) const {
        auto it = m_state.find(id);
        return it != m_state.end() && it->second == VisitState::Resolved;
    }

    /// Visit @p id, which must be present in the index
    std::optional<DependencyError> visit(const std::string& id) {
        const DependencyNode* node = m_index.at(id);
        m_state[id] = VisitState::Visiting;
        m_path.push_back(id);

        std::uint32_t level = 0;
        for (const auto& dep : node->dependencies) {
            VisitState state = state_of(dep);

            if (state == VisitState::Visiting) {
                auto root = std::find(m_path.begin(), m_path.end(), dep);
                std::vector<std::string> cycle(root, m_path.end());
                cycle.push_back(dep);
                std::vector<std::string> traversal = m_path;
                traversal.push_back(dep);
                return DependencyError::circular(std::move(cycle), std::move(traversal));
            }

            if (state == VisitState::Unvisited) {
                if (m_index.find(dep) == m_index.end()) {
                    return DependencyError::unknown_dependency(id, dep);
                }
                if (auto err = visit(dep)) {
                    return err;
                }
            }

            level = std::max(level, m_levels.at(dep) + 1);
        }

        m_path.pop_back();
        m_state[id] = VisitState::Resolved;
        m_levels[id] = level;
        m_order.push_back(ResolvedDependency{id, level});
        return std::nullopt;
    }

    [[nodiscard]] std::vector<ResolvedDependency> take_order() { return std::move(m_order); }

private:
    [[nodiscard]] VisitState state_of(const std::string& id) const {
        auto it = m_state.find(id);
        return it == m_state.end() ? VisitState::Unvisited : it->second;
    }

    const NodeIndex& m_index;
    std::unordered_map<std::string, VisitState> m_state;
    std::unordered_map<std::string, std::uint32_t> m_levels;
    std::vector<std::string> m_path;
    std::vector<ResolvedDependency> m_order;
};

Result<std::vector<ResolvedDependency>> run_resolution(const std::vector<DependencyNode>& nodes) {
    NodeIndex index = index_nodes(nodes);
    Traversal traversal(index);

    for (const auto& node : nodes) {
        if (traversal.is_resolved(node.id)) {
            continue;
        }
        if (auto err = traversal.visit(node.id)) {
            return Err<std::vector<ResolvedDependency>>(std::move(*err));
        }
    }

    auto order = traversal.take_order();
    std::stable_sort(order.begin(), order.end(),
        [](const ResolvedDependency& a, const ResolvedDependency& b) {
            return a.level < b.level;
        });
    return Ok(std::move(order));
}

void collect_reachable(
    const NodeIndex& index,
    const std::string& id,
    std::unordered_set<std::string>& seen,
    std::vector<std::string>& out)
{
    auto it = index.find(id);
    if (it == index.end() || seen.count(id) > 0) {
        return;
    }
    seen.insert(id);
    out.push_back(id);
    for (const auto& dep : it->second->dependencies) {
        collect_reachable(index, dep, seen, out);
    }
}

} // anonymous namespace

// =============================================================================
// DependencyResolver
// =============================================================================

Result<std::vector<ResolvedDependency>> DependencyResolver::resolve(
    const std::vector<DependencyNode>& nodes) const
{
    auto result = run_resolution(nodes);
    if (!result) {
        pulse_core::kernel_logger()->warn("Dependency resolution failed: {}", result.error().message());
        return result;
    }

    pulse_core::kernel_logger()->debug("Resolved {} nodes (max level {})",
        result->size(), result->empty() ? 0u : result->back().level);
    return result;
}

bool DependencyResolver::has_circular_dependencies(const std::vector<DependencyNode>& nodes) const {
    return run_resolution(nodes).is_err();
}

bool DependencyResolver::has_cycle(const std::vector<DependencyNode>& nodes) const {
    auto result = run_resolution(nodes);
    if (result) {
        return false;
    }
    const auto* err = result.error().as<DependencyError>();
    return err != nullptr && err->kind == DependencyError::Kind::CircularDependency;
}

std::vector<std::string> DependencyResolver::transitive_dependencies(
    const std::string& id,
    const std::vector<DependencyNode>& nodes) const
{
    NodeIndex index = index_nodes(nodes);
    auto it = index.find(id);
    if (it == index.end()) {
        return {};
    }

    std::unordered_set<std::string> seen{id};
    std::vector<std::string> out;
    for (const auto& dep : it->second->dependencies) {
        collect_reachable(index, dep, seen, out);
    }
    return out;
}

std::vector<std::string> DependencyResolver::dependents(
    const std::string& id,
    const std::vector<DependencyNode>& nodes) const
{
    std::vector<std::string> out;
    for (const auto& node : nodes) {
        if (node.depends_on(id)) {
            out.push_back(node.id);
        }
    }
    return out;
}

DependencyValidation DependencyResolver::validate_dependencies(const std::vector<DependencyNode>& nodes) const {
    std::unordered_set<std::string> ids;
    ids.reserve(nodes.size());
    for (const auto& node : nodes) {
        ids.insert(node.id);
    }

    DependencyValidation validation;
    for (const auto& node : nodes) {
        std::vector<std::string> absent;
        for (const auto& dep : node.dependencies) {
            if (ids.count(dep) == 0) {
                absent.push_back(dep);
            }
        }
        if (!absent.empty()) {
            validation.missing[node.id] = std::move(absent);
        }
    }
    validation.valid = validation.missing.empty();
    return validation;
}

Result<std::vector<std::string>> DependencyResolver::load_order_for(
    const DependencyNode& new_node,
    const std::vector<DependencyNode>& existing) const
{
    std::vector<DependencyNode> all = existing;
    all.push_back(new_node);

    auto resolved = resolve(all);
    if (!resolved) {
        return Err<std::vector<std::string>>(std::move(resolved.error()));
    }

    auto it = std::find_if(resolved->begin(), resolved->end(),
        [&new_node](const ResolvedDependency& entry) { return entry.id == new_node.id; });

    std::vector<std::string> order;
    for (; it != resolved->end(); ++it) {
        order.push_back(it->id);
    }
    return Ok(std::move(order));
}

Result<void> DependencyResolver::can_load(
    const std::string& id,
    const std::vector<DependencyNode>& nodes) const
{
    NodeIndex index = index_nodes(nodes);
    auto it = index.find(id);
    if (it == index.end()) {
        return Err(DependencyError::unknown_node(id));
    }

    std::vector<DependencyNode> subgraph;
    subgraph.push_back(*it->second);
    for (const auto& dep : transitive_dependencies(id, nodes)) {
        subgraph.push_back(*index.at(dep));
    }

    return run_resolution(subgraph).and_then([](std::vector<ResolvedDependency>) -> Result<void> {
        return Ok();
    });
}

} // namespace pulse_kernel
