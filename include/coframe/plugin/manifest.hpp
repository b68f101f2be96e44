#pragma once

/// @file manifest.hpp
/// @brief Plugin manifest (plugin.json) parsing
///
/// A plugin directory is recognized by its manifest:
/// @code
/// {
///     "name": "audit",
///     "version": "1.0.0",
///     "description": "Audit trail",
///     "author": "",
///     "license": "MIT",
///     "depends_on": ["core"],
///     "source_imports": ["from .audit import hooks"]
/// }
/// @endcode
/// Every key is optional. `name` defaults to the directory name and
/// `depends_on` may also be a single string.

#include "fwd.hpp"
#include <coframe/core/error.hpp>

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace coframe_plugin {

/// File name identifying a plugin directory
inline constexpr const char* kManifestFileName = "plugin.json";

/// Version assigned when the manifest declares none
inline constexpr const char* kDefaultPluginVersion = "0.0.1";

// =============================================================================
// PluginManifest
// =============================================================================

struct PluginManifest {
    std::string name;
    std::string version = kDefaultPluginVersion;
    std::string description;
    std::string author;
    std::string license;
    std::set<std::string> depends_on;
    std::vector<std::string> source_imports;  ///< Extra import lines for the generated module

    std::filesystem::path source_path;        ///< Path of the manifest file

    /// Load a manifest; `name` falls back to the parent directory name
    [[nodiscard]] static coframe_core::Result<PluginManifest> load(
        const std::filesystem::path& path);

    /// Parse manifest JSON text
    [[nodiscard]] static coframe_core::Result<PluginManifest> from_json_string(
        const std::string& json_str,
        const std::string& default_name,
        const std::filesystem::path& source_path = {});

    /// Check the manifest is usable (non-empty name)
    [[nodiscard]] coframe_core::Result<void> validate() const;
};

// =============================================================================
// JSON Helpers
// =============================================================================

/// Read and parse a JSON file, keeping key order
[[nodiscard]] coframe_core::Result<Json> read_json_file(const std::filesystem::path& path);

} // namespace coframe_plugin
