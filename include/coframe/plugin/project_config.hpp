#pragma once

/// @file project_config.hpp
/// @brief Root project configuration (coframe.toml)
///
/// @code
/// [project]
/// name = "mytestapp"
///
/// [plugins]
/// paths = ["plugins"]
///
/// [merge]
/// strict = false
///
/// [logging]
/// level = "info"
/// file = ""
///
/// [codegen]
/// output = "model.py"
/// db_engine = "sqlite:///:memory:"
/// source_imports = []
/// source_add = ""
/// @endcode
///
/// Relative paths resolve against the directory holding the config file.

#include "fwd.hpp"
#include <coframe/core/error.hpp>
#include <coframe/core/log.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace coframe_plugin {

inline constexpr const char* kProjectConfigFileName = "coframe.toml";

struct ProjectConfig {
    // [project]
    std::string name = "myapp";
    std::string version = "0.0.1";
    std::string description;
    std::string author;
    std::string license;

    // [plugins]
    std::vector<std::filesystem::path> plugin_paths;

    // [merge]
    bool strict_merge = false;

    // [logging]
    spdlog::level::level_enum log_level = spdlog::level::info;
    std::filesystem::path log_file;

    // [codegen]
    std::filesystem::path output = "model.py";
    std::string db_engine = "sqlite:///:memory:";
    std::vector<std::string> source_imports;
    std::string source_add;

    std::filesystem::path base_dir;  ///< Directory relative paths resolve against

    /// Configuration used when no file is given; plugins live in `base_dir/plugins`
    [[nodiscard]] static ProjectConfig defaults(const std::filesystem::path& base_dir = ".");

    /// Load and parse a coframe.toml file
    [[nodiscard]] static coframe_core::Result<ProjectConfig> load(const std::filesystem::path& path);

    /// Parse TOML text
    [[nodiscard]] static coframe_core::Result<ProjectConfig> from_toml_string(
        const std::string& content,
        const std::filesystem::path& base_dir,
        const std::string& source_name = "coframe.toml");

    /// Logging settings derived from the [logging] section
    [[nodiscard]] coframe_core::LogConfig log_config() const;
};

} // namespace coframe_plugin
