/// @file manifest.cpp
/// @brief Plugin manifest implementation

#include <coframe/plugin/manifest.hpp>

#include <fstream>
#include <sstream>

namespace coframe_plugin {

// =============================================================================
// JSON Helpers
// =============================================================================

coframe_core::Result<Json> read_json_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return coframe_core::Err<Json>(
            coframe_core::Error(coframe_core::ErrorCode::NotFound,
                "File not found: " + path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return coframe_core::Err<Json>(
            coframe_core::Error(coframe_core::ErrorCode::IOError,
                "Failed to open file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        return coframe_core::Ok(Json::parse(buffer.str()));
    } catch (const Json::parse_error& e) {
        return coframe_core::Err<Json>(
            coframe_core::Error(coframe_core::ErrorCode::ParseError,
                "JSON parse error in " + path.string() + ": " + e.what()));
    }
}

// =============================================================================
// PluginManifest Implementation
// =============================================================================

coframe_core::Result<PluginManifest> PluginManifest::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return coframe_core::Err<PluginManifest>(
            coframe_core::Error(coframe_core::ErrorCode::NotFound,
                "Manifest file not found: " + path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return coframe_core::Err<PluginManifest>(
            coframe_core::Error(coframe_core::ErrorCode::IOError,
                "Failed to open manifest file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return from_json_string(buffer.str(), path.parent_path().filename().string(), path);
}

coframe_core::Result<PluginManifest> PluginManifest::from_json_string(
    const std::string& json_str,
    const std::string& default_name,
    const std::filesystem::path& source_path) {

    Json j;
    try {
        j = Json::parse(json_str);
    } catch (const Json::parse_error& e) {
        return coframe_core::Err<PluginManifest>(
            coframe_core::Error(coframe_core::ErrorCode::ParseError,
                "JSON parse error in " + source_path.string() + ": " + e.what()));
    }

    if (!j.is_object()) {
        return coframe_core::Err<PluginManifest>(
            coframe_core::PluginError::invalid_manifest(default_name, "manifest must be a JSON object"));
    }

    PluginManifest manifest;
    manifest.source_path = source_path;
    manifest.name = default_name;

    if (j.contains("name")) {
        if (!j["name"].is_string()) {
            return coframe_core::Err<PluginManifest>(
                coframe_core::PluginError::invalid_manifest(default_name, "'name' must be a string"));
        }
        manifest.name = j["name"].get<std::string>();
    }

    if (j.contains("version") && j["version"].is_string()) {
        manifest.version = j["version"].get<std::string>();
    }
    if (j.contains("description") && j["description"].is_string()) {
        manifest.description = j["description"].get<std::string>();
    }
    if (j.contains("author") && j["author"].is_string()) {
        manifest.author = j["author"].get<std::string>();
    }
    if (j.contains("license") && j["license"].is_string()) {
        manifest.license = j["license"].get<std::string>();
    }

    // depends_on: "core" or ["core", "auth"]
    if (j.contains("depends_on")) {
        const auto& deps = j["depends_on"];
        if (deps.is_string()) {
            manifest.depends_on.insert(deps.get<std::string>());
        } else if (deps.is_array()) {
            for (const auto& dep : deps) {
                if (!dep.is_string()) {
                    return coframe_core::Err<PluginManifest>(
                        coframe_core::PluginError::invalid_manifest(manifest.name,
                            "'depends_on' entries must be strings"));
                }
                manifest.depends_on.insert(dep.get<std::string>());
            }
        } else if (!deps.is_null()) {
            return coframe_core::Err<PluginManifest>(
                coframe_core::PluginError::invalid_manifest(manifest.name,
                    "'depends_on' must be a string or a list"));
        }
    }

    if (j.contains("source_imports") && j["source_imports"].is_array()) {
        for (const auto& line : j["source_imports"]) {
            if (line.is_string()) {
                manifest.source_imports.push_back(line.get<std::string>());
            }
        }
    }

    auto valid = manifest.validate();
    if (!valid) {
        return coframe_core::Err<PluginManifest>(valid.error());
    }

    return coframe_core::Ok(std::move(manifest));
}

coframe_core::Result<void> PluginManifest::validate() const {
    if (name.empty()) {
        return coframe_core::Err(
            coframe_core::PluginError::invalid_manifest(source_path.string(), "empty plugin name"));
    }
    return coframe_core::Ok();
}

} // namespace coframe_plugin
