#pragma once

/// @file loader.hpp
/// @brief Plugin discovery
///
/// The PluginLoader scans root directories for plugin subdirectories. A
/// subdirectory is a plugin when it holds a plugin.json manifest; every other
/// *.json file beside it is a declaration document and *.py files are kept
/// as source references for the generated module.

#include "fwd.hpp"
#include "document.hpp"
#include "manifest.hpp"
#include <coframe/core/error.hpp>

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace coframe_plugin {

// =============================================================================
// Plugin
// =============================================================================

/// A discovered plugin. Immutable once the loader has produced it.
struct Plugin {
    PluginManifest manifest;
    std::filesystem::path directory;
    std::vector<Node> declarations;                       ///< Parsed documents, file-name order
    std::vector<std::filesystem::path> declaration_files; ///< Paths matching `declarations`
    std::vector<std::filesystem::path> source_refs;       ///< Non-declaration source files
    std::filesystem::file_time_type last_modified{};      ///< Newest regular file in the directory

    [[nodiscard]] const std::string& name() const noexcept { return manifest.name; }
    [[nodiscard]] const std::string& version() const noexcept { return manifest.version; }
    [[nodiscard]] const std::set<std::string>& depends_on() const noexcept {
        return manifest.depends_on;
    }
};

// =============================================================================
// PluginLoader
// =============================================================================

class PluginLoader {
public:
    PluginLoader() = default;

    // Non-copyable, movable
    PluginLoader(const PluginLoader&) = delete;
    PluginLoader& operator=(const PluginLoader&) = delete;
    PluginLoader(PluginLoader&&) = default;
    PluginLoader& operator=(PluginLoader&&) = default;

    // =========================================================================
    // Discovery
    // =========================================================================

    /// Discover every plugin under a root directory
    ///
    /// Subdirectories are visited in name order, so discovery order is stable.
    ///
    /// @param root Directory whose immediate children are plugin directories
    /// @return Ok, or NotFound / ParseError / DuplicatePluginError
    [[nodiscard]] coframe_core::Result<void> scan_directory(const std::filesystem::path& root);

    /// Build a plugin from one directory
    [[nodiscard]] static coframe_core::Result<Plugin> load_plugin(const std::filesystem::path& dir);

    /// Register a plugin; fails when the name is already taken
    [[nodiscard]] coframe_core::Result<void> add_plugin(Plugin plugin);

    // =========================================================================
    // Queries
    // =========================================================================

    /// Plugins in discovery order
    [[nodiscard]] const std::vector<Plugin>& plugins() const noexcept { return m_plugins; }

    [[nodiscard]] const Plugin* find(const std::string& name) const;

    [[nodiscard]] std::size_t size() const noexcept { return m_plugins.size(); }

    /// Newest modification time across every discovered plugin
    [[nodiscard]] std::filesystem::file_time_type latest_timestamp() const;

    /// Release the discovered plugins
    [[nodiscard]] std::vector<Plugin> take_plugins() && { return std::move(m_plugins); }

private:
    std::vector<Plugin> m_plugins;
};

/// Newest modification time of any regular file below `dir`
[[nodiscard]] std::filesystem::file_time_type latest_file_time(const std::filesystem::path& dir);

} // namespace coframe_plugin
