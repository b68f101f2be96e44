/// @file resolver.cpp
/// @brief Plugin dependency ordering implementation

#include <coframe/plugin/resolver.hpp>
#include <coframe/plugin/loader.hpp>
#include <coframe/core/log.hpp>

#include <algorithm>
#include <deque>
#include <sstream>

namespace coframe_plugin {

namespace {

std::string join(const std::vector<std::string>& items, const char* sep = ", ") {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) oss << sep;
        oss << items[i];
    }
    return oss.str();
}

} // anonymous namespace

// =============================================================================
// DependencySorter Implementation
// =============================================================================

void DependencySorter::add(const std::string& name, const std::set<std::string>& depends_on) {
    if (m_deps.find(name) == m_deps.end()) {
        m_order.push_back(name);
    }
    m_deps[name] = depends_on;
}

void DependencySorter::clear() {
    m_order.clear();
    m_deps.clear();
}

bool DependencySorter::has(const std::string& name) const {
    return m_deps.find(name) != m_deps.end();
}

coframe_core::Result<void> DependencySorter::validate_dependencies() const {
    std::vector<std::string> problems;
    std::string first_plugin;

    for (const auto& name : m_order) {
        std::vector<std::string> missing;
        for (const auto& dep : m_deps.at(name)) {
            if (!has(dep)) {
                missing.push_back(dep);
            }
        }
        if (!missing.empty()) {
            if (first_plugin.empty()) {
                first_plugin = name;
            }
            problems.push_back(name + " -> [" + join(missing) + "]");
        }
    }

    if (problems.empty()) {
        return coframe_core::Ok();
    }

    coframe_core::Error error(coframe_core::PluginError::unknown_dependency(first_plugin, join(problems, "; ")));
    error.with_context("plugin", first_plugin);
    return coframe_core::Err(std::move(error));
}

coframe_core::Result<std::vector<std::string>> DependencySorter::sort() const {
    auto valid = validate_dependencies();
    if (!valid) {
        return coframe_core::Err<std::vector<std::string>>(valid.error());
    }

    // Kahn: in-degree is the number of unmet dependencies
    std::map<std::string, std::size_t> in_degree;
    std::deque<std::string> ready;
    for (const auto& name : m_order) {
        in_degree[name] = m_deps.at(name).size();
        if (in_degree[name] == 0) {
            ready.push_back(name);
        }
    }

    std::vector<std::string> result;
    result.reserve(m_order.size());

    while (!ready.empty()) {
        std::string current = ready.front();
        ready.pop_front();
        result.push_back(current);

        for (const auto& dependent : dependents_of(current)) {
            if (--in_degree[dependent] == 0) {
                ready.push_back(dependent);
            }
        }
    }

    if (result.size() != m_order.size()) {
        std::vector<std::string> unresolved;
        for (const auto& name : m_order) {
            if (std::find(result.begin(), result.end(), name) == result.end()) {
                unresolved.push_back(name);
            }
        }

        coframe_core::Error error(coframe_core::PluginError::circular_dependency(join(cyclic_members())));
        error.with_context("unresolved", join(unresolved));
        return coframe_core::Err<std::vector<std::string>>(std::move(error));
    }

    coframe_core::plugin_logger()->debug("Plugin order: {}", join(result, " -> "));
    return coframe_core::Ok(std::move(result));
}

std::vector<std::string> DependencySorter::dependents_of(const std::string& name) const {
    std::vector<std::string> dependents;
    for (const auto& candidate : m_order) {
        if (m_deps.at(candidate).count(name)) {
            dependents.push_back(candidate);
        }
    }
    return dependents;
}

std::vector<std::string> DependencySorter::cyclic_members() const {
    std::vector<std::string> members;

    for (const auto& start : m_order) {
        // Depth-first over dependencies, looking for a way back to `start`
        std::set<std::string> visited;
        std::vector<std::string> stack(m_deps.at(start).begin(), m_deps.at(start).end());
        bool on_cycle = false;

        while (!stack.empty() && !on_cycle) {
            std::string current = stack.back();
            stack.pop_back();

            if (current == start) {
                on_cycle = true;
                break;
            }
            if (!visited.insert(current).second) {
                continue;
            }

            auto it = m_deps.find(current);
            if (it != m_deps.end()) {
                stack.insert(stack.end(), it->second.begin(), it->second.end());
            }
        }

        if (on_cycle) {
            members.push_back(start);
        }
    }

    return members;
}

std::string DependencySorter::to_dot_graph() const {
    std::ostringstream oss;
    oss << "digraph plugins {\n";
    oss << "  rankdir=LR;\n";

    for (const auto& name : m_order) {
        oss << "  \"" << name << "\";\n";
    }
    for (const auto& name : m_order) {
        for (const auto& dep : m_deps.at(name)) {
            oss << "  \"" << name << "\" -> \"" << dep << "\";\n";
        }
    }

    oss << "}\n";
    return oss.str();
}

// =============================================================================
// Plugin Ordering
// =============================================================================

coframe_core::Result<std::vector<Plugin>> sort_plugins(std::vector<Plugin> plugins) {
    DependencySorter sorter;
    for (const auto& plugin : plugins) {
        sorter.add(plugin.name(), plugin.depends_on());
    }

    auto order = sorter.sort();
    if (!order) {
        return coframe_core::Err<std::vector<Plugin>>(order.error());
    }

    std::map<std::string, Plugin> by_name;
    for (auto& plugin : plugins) {
        std::string name = plugin.name();
        by_name.emplace(std::move(name), std::move(plugin));
    }

    std::vector<Plugin> sorted;
    sorted.reserve(by_name.size());
    for (const auto& name : *order) {
        sorted.push_back(std::move(by_name.at(name)));
    }

    return coframe_core::Ok(std::move(sorted));
}

} // namespace coframe_plugin
