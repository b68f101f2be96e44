/// @file schema.cpp
/// @brief Composition pipeline implementation

#include <coframe/schema/schema.hpp>
#include <coframe/schema/table_resolver.hpp>
#include <coframe/plugin/resolver.hpp>
#include <coframe/core/log.hpp>

#include <algorithm>

namespace coframe_schema {

// =============================================================================
// Schema
// =============================================================================

Schema::Schema(std::vector<coframe_plugin::Plugin> plugins,
               coframe_plugin::ComposedDocument document,
               TypeCatalog types,
               std::vector<TableDef> tables)
    : m_plugins(std::move(plugins))
    , m_document(std::move(document))
    , m_types(std::move(types))
    , m_tables(std::move(tables))
{
}

const TableDef* Schema::find_table(const std::string& name) const {
    auto it = std::find_if(m_tables.begin(), m_tables.end(),
        [&name](const TableDef& t) { return t.name == name; });
    return it != m_tables.end() ? &*it : nullptr;
}

std::filesystem::file_time_type Schema::latest_timestamp() const {
    std::filesystem::file_time_type latest = std::filesystem::file_time_type::min();
    for (const auto& plugin : m_plugins) {
        latest = std::max(latest, plugin.last_modified);
    }
    return latest;
}

std::vector<std::string> Schema::plugin_source_imports() const {
    std::vector<std::string> imports;
    for (const auto& plugin : m_plugins) {
        for (const auto& line : plugin.manifest.source_imports) {
            if (std::find(imports.begin(), imports.end(), line) == imports.end()) {
                imports.push_back(line);
            }
        }
    }
    return imports;
}

// =============================================================================
// Pipeline
// =============================================================================

coframe_core::Result<Schema> compose_schema(std::vector<coframe_plugin::Plugin> plugins,
                                            coframe_plugin::MergeOptions options) {
    auto log = coframe_core::schema_logger();

    std::vector<coframe_plugin::Plugin> sorted;
    {
        COFRAME_LOG_SCOPE("sort plugins", "schema");
        auto result = coframe_plugin::sort_plugins(std::move(plugins));
        if (!result) {
            return coframe_core::Err<Schema>(result.error());
        }
        sorted = std::move(result).value();
    }
    log->info("Composing {} plugin(s)", sorted.size());

    auto document = coframe_plugin::compose_plugins(sorted, options);
    if (!document) {
        return coframe_core::Err<Schema>(document.error());
    }

    TypeCatalog types;
    {
        COFRAME_LOG_SCOPE("resolve types", "schema");
        auto loaded = types.load(*document);
        if (!loaded) {
            return coframe_core::Err<Schema>(loaded.error());
        }
        auto resolved = types.resolve_all();
        if (!resolved) {
            return coframe_core::Err<Schema>(resolved.error());
        }
    }
    log->info("Resolved {} type(s) ({} declared by plugins)", types.size(), types.declared().size());

    std::vector<TableDef> tables;
    {
        COFRAME_LOG_SCOPE("resolve tables", "schema");
        TableResolver resolver(types);
        auto resolved = resolver.resolve(*document);
        if (!resolved) {
            return coframe_core::Err<Schema>(resolved.error());
        }
        tables = std::move(resolved).value();
    }
    log->info("Resolved {} table(s)", tables.size());

    return coframe_core::Ok(Schema(std::move(sorted), std::move(document).value(),
                                   std::move(types), std::move(tables)));
}

coframe_core::Result<Schema> compose_schema(const coframe_plugin::ProjectConfig& config) {
    coframe_plugin::PluginLoader loader;
    for (const auto& path : config.plugin_paths) {
        auto scanned = loader.scan_directory(path);
        if (!scanned) {
            return coframe_core::Err<Schema>(scanned.error());
        }
    }
    coframe_core::plugin_logger()->info("Discovered {} plugin(s)", loader.size());

    coframe_plugin::MergeOptions options;
    options.strict = config.strict_merge;
    return compose_schema(std::move(loader).take_plugins(), options);
}

} // namespace coframe_schema
