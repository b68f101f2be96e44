/// @file project_config.cpp
/// @brief Project configuration parsing implementation

#include <coframe/plugin/project_config.hpp>

#include <toml++/toml.hpp>

#include <fstream>
#include <sstream>

namespace coframe_plugin {

namespace {

std::filesystem::path resolve_path(const std::filesystem::path& base, const std::string& value) {
    std::filesystem::path p(value);
    if (p.is_absolute()) {
        return p;
    }
    return (base / p).lexically_normal();
}

std::vector<std::string> string_array(const toml::array* arr) {
    std::vector<std::string> result;
    if (!arr) {
        return result;
    }
    for (const auto& item : *arr) {
        if (auto str = item.value<std::string>()) {
            result.push_back(*str);
        }
    }
    return result;
}

} // anonymous namespace

ProjectConfig ProjectConfig::defaults(const std::filesystem::path& base_dir) {
    ProjectConfig config;
    config.base_dir = base_dir;
    config.plugin_paths.push_back(resolve_path(base_dir, "plugins"));
    config.output = resolve_path(base_dir, "model.py");
    return config;
}

coframe_core::Result<ProjectConfig> ProjectConfig::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return coframe_core::Err<ProjectConfig>(
            coframe_core::Error(coframe_core::ErrorCode::NotFound,
                "Config file not found: " + path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return coframe_core::Err<ProjectConfig>(
            coframe_core::Error(coframe_core::ErrorCode::IOError,
                "Failed to open config file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    std::filesystem::path base = path.parent_path();
    if (base.empty()) {
        base = ".";
    }
    return from_toml_string(buffer.str(), base, path.string());
}

coframe_core::Result<ProjectConfig> ProjectConfig::from_toml_string(
    const std::string& content,
    const std::filesystem::path& base_dir,
    const std::string& source_name)
{
    ProjectConfig config = defaults(base_dir);

    toml::table tbl;
    try {
        tbl = toml::parse(content, source_name);
    } catch (const toml::parse_error& err) {
        return coframe_core::Err<ProjectConfig>(
            coframe_core::Error(coframe_core::ErrorCode::ParseError,
                "TOML parse error: " + std::string(err.what()))
                .with_context("file", source_name));
    }

    // [project]
    if (auto project = tbl["project"].as_table()) {
        const auto& p = *project;
        if (auto name = p["name"].value<std::string>()) {
            config.name = *name;
        }
        if (auto ver = p["version"].value<std::string>()) {
            config.version = *ver;
        }
        if (auto desc = p["description"].value<std::string>()) {
            config.description = *desc;
        }
        if (auto author = p["author"].value<std::string>()) {
            config.author = *author;
        }
        if (auto license = p["license"].value<std::string>()) {
            config.license = *license;
        }
    }

    // [plugins]
    if (auto plugins = tbl["plugins"].as_table()) {
        if (auto paths = (*plugins)["paths"].as_array()) {
            config.plugin_paths.clear();
            for (const auto& entry : string_array(paths)) {
                config.plugin_paths.push_back(resolve_path(base_dir, entry));
            }
        }
    }

    // [merge]
    if (auto merge = tbl["merge"].as_table()) {
        if (auto strict = (*merge)["strict"].value<bool>()) {
            config.strict_merge = *strict;
        }
    }

    // [logging]
    if (auto logging = tbl["logging"].as_table()) {
        if (auto level = (*logging)["level"].value<std::string>()) {
            auto parsed = coframe_core::parse_log_level(*level);
            if (!parsed) {
                return coframe_core::Err<ProjectConfig>(
                    coframe_core::Error(coframe_core::ErrorCode::InvalidArgument,
                        "Unknown log level: " + *level)
                        .with_context("file", source_name));
            }
            config.log_level = *parsed;
        }
        if (auto file = (*logging)["file"].value<std::string>()) {
            if (!file->empty()) {
                config.log_file = resolve_path(base_dir, *file);
            }
        }
    }

    // [codegen]
    if (auto codegen = tbl["codegen"].as_table()) {
        const auto& c = *codegen;
        if (auto output = c["output"].value<std::string>()) {
            config.output = resolve_path(base_dir, *output);
        }
        if (auto engine = c["db_engine"].value<std::string>()) {
            config.db_engine = *engine;
        }
        config.source_imports = string_array(c["source_imports"].as_array());
        if (auto add = c["source_add"].value<std::string>()) {
            config.source_add = *add;
        }
    }

    return coframe_core::Ok(std::move(config));
}

coframe_core::LogConfig ProjectConfig::log_config() const {
    coframe_core::LogConfig log;
    log.level = log_level;
    log.log_file = log_file.string();
    return log;
}

} // namespace coframe_plugin
