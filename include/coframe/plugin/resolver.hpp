#pragma once

/// @file resolver.hpp
/// @brief Plugin dependency ordering
///
/// The DependencySorter performs:
/// - Validation that every declared dependency exists
/// - Kahn topological sorting, ties broken by discovery order
/// - Cycle detection reporting exactly the plugins that sit on a cycle

#include "fwd.hpp"
#include <coframe/core/error.hpp>

#include <map>
#include <set>
#include <string>
#include <vector>

namespace coframe_plugin {

// =============================================================================
// DependencySorter
// =============================================================================

/// Orders plugins so that each comes after all of its dependencies
///
/// Thread-safety: NOT thread-safe.
class DependencySorter {
public:
    DependencySorter() = default;

    /// Add a plugin; call order defines discovery order
    void add(const std::string& name, const std::set<std::string>& depends_on);

    /// Remove every plugin
    void clear();

    // =========================================================================
    // Resolution
    // =========================================================================

    /// Check every dependency name refers to an added plugin
    ///
    /// @return Ok, or UnknownDependencyError listing the missing names per plugin
    [[nodiscard]] coframe_core::Result<void> validate_dependencies() const;

    /// Dependency-respecting total order
    ///
    /// @return Plugin names, or UnknownDependencyError / CircularDependencyError
    [[nodiscard]] coframe_core::Result<std::vector<std::string>> sort() const;

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] bool has(const std::string& name) const;

    /// Plugins that directly depend on `name`, in discovery order
    [[nodiscard]] std::vector<std::string> dependents_of(const std::string& name) const;

    /// Plugins sitting on a dependency cycle, in discovery order
    [[nodiscard]] std::vector<std::string> cyclic_members() const;

    /// Graphviz rendering of the dependency graph
    [[nodiscard]] std::string to_dot_graph() const;

    [[nodiscard]] std::size_t size() const noexcept { return m_order.size(); }

private:
    std::vector<std::string> m_order;                      // discovery order
    std::map<std::string, std::set<std::string>> m_deps;
};

// =============================================================================
// Plugin Ordering
// =============================================================================

/// Sort discovered plugins into merge order
[[nodiscard]] coframe_core::Result<std::vector<Plugin>> sort_plugins(std::vector<Plugin> plugins);

} // namespace coframe_plugin
