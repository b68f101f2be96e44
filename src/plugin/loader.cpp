/// @file loader.cpp
/// @brief Plugin discovery implementation

#include <coframe/plugin/loader.hpp>
#include <coframe/core/log.hpp>

#include <algorithm>

namespace coframe_plugin {

namespace {

/// Sorted regular files of a directory (non-recursive)
coframe_core::Result<std::vector<std::filesystem::path>> list_files(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    for (auto it = std::filesystem::directory_iterator(dir, ec);
         !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        return coframe_core::Err<std::vector<std::filesystem::path>>(
            coframe_core::Error(coframe_core::ErrorCode::IOError,
                "Failed to list " + dir.string() + ": " + ec.message()));
    }
    std::sort(files.begin(), files.end());
    return coframe_core::Ok(std::move(files));
}

} // anonymous namespace

std::filesystem::file_time_type latest_file_time(const std::filesystem::path& dir) {
    std::filesystem::file_time_type latest = std::filesystem::file_time_type::min();
    std::error_code ec;
    for (auto it = std::filesystem::recursive_directory_iterator(
             dir, std::filesystem::directory_options::skip_permission_denied, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) {
            continue;
        }
        auto mtime = it->last_write_time(entry_ec);
        if (!entry_ec && mtime > latest) {
            latest = mtime;
        }
    }
    if (ec) {
        coframe_core::plugin_logger()->warn("Stopped scanning {} for timestamps: {}", dir.string(), ec.message());
    }
    return latest;
}

// =============================================================================
// PluginLoader Implementation
// =============================================================================

coframe_core::Result<void> PluginLoader::scan_directory(const std::filesystem::path& root) {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        return coframe_core::Err(
            coframe_core::Error(coframe_core::ErrorCode::NotFound,
                "Plugin directory not found: " + root.string()));
    }

    std::vector<std::filesystem::path> dirs;
    for (auto it = std::filesystem::directory_iterator(root, ec);
         !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_directory(entry_ec) &&
            std::filesystem::exists(it->path() / kManifestFileName, entry_ec)) {
            dirs.push_back(it->path());
        }
    }
    if (ec) {
        return coframe_core::Err(
            coframe_core::Error(coframe_core::ErrorCode::IOError,
                "Failed to list " + root.string() + ": " + ec.message()));
    }
    std::sort(dirs.begin(), dirs.end());

    for (const auto& dir : dirs) {
        auto plugin = load_plugin(dir);
        if (!plugin) {
            return coframe_core::Err(plugin.error());
        }

        auto added = add_plugin(std::move(plugin).value());
        if (!added) {
            return added;
        }
    }

    return coframe_core::Ok();
}

coframe_core::Result<Plugin> PluginLoader::load_plugin(const std::filesystem::path& dir) {
    auto manifest = PluginManifest::load(dir / kManifestFileName);
    if (!manifest) {
        return coframe_core::Err<Plugin>(manifest.error());
    }

    Plugin plugin;
    plugin.manifest = std::move(manifest).value();
    plugin.directory = dir;

    auto files = list_files(dir);
    if (!files) {
        return coframe_core::Err<Plugin>(files.error().with_context("plugin", plugin.name()));
    }

    for (const auto& file : files.value()) {
        const auto ext = file.extension();
        if (ext == ".json") {
            if (file.filename() == kManifestFileName) {
                continue;
            }

            auto json = read_json_file(file);
            if (!json) {
                return coframe_core::Err<Plugin>(
                    json.error().with_context("plugin", plugin.name()));
            }
            if (!json->is_object()) {
                return coframe_core::Err<Plugin>(
                    coframe_core::Error(coframe_core::ErrorCode::ParseError,
                        "Declaration document must be a JSON object: " + file.string())
                        .with_context("plugin", plugin.name()));
            }

            plugin.declarations.push_back(Node::from_json(*json));
            plugin.declaration_files.push_back(file);
        } else if (ext == ".py") {
            plugin.source_refs.push_back(file);
        }
    }

    plugin.last_modified = latest_file_time(dir);

    coframe_core::plugin_logger()->debug("Loaded plugin '{}' v{} ({} declaration(s), {} source file(s))",
        plugin.name(), plugin.version(), plugin.declarations.size(), plugin.source_refs.size());

    return coframe_core::Ok(std::move(plugin));
}

coframe_core::Result<void> PluginLoader::add_plugin(Plugin plugin) {
    if (const Plugin* existing = find(plugin.name())) {
        return coframe_core::Err(
            coframe_core::Error(coframe_core::PluginError::duplicate(
                plugin.name(), plugin.directory.string()))
                .with_context("first", existing->directory.string()));
    }

    m_plugins.push_back(std::move(plugin));
    return coframe_core::Ok();
}

const Plugin* PluginLoader::find(const std::string& name) const {
    auto it = std::find_if(m_plugins.begin(), m_plugins.end(),
        [&name](const Plugin& p) { return p.name() == name; });
    return it != m_plugins.end() ? &*it : nullptr;
}

std::filesystem::file_time_type PluginLoader::latest_timestamp() const {
    std::filesystem::file_time_type latest = std::filesystem::file_time_type::min();
    for (const auto& plugin : m_plugins) {
        latest = std::max(latest, plugin.last_modified);
    }
    return latest;
}

} // namespace coframe_plugin
