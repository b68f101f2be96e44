#pragma once

/// @file schema.hpp
/// @brief Composition pipeline and its result
///
/// compose_schema runs Loader -> Sorter -> Merge -> Types -> Tables, each
/// stage complete before the next starts. The first error aborts the run;
/// there is no partially resolved schema.

#include "fwd.hpp"
#include "table.hpp"
#include "types.hpp"
#include <coframe/core/error.hpp>
#include <coframe/plugin/loader.hpp>
#include <coframe/plugin/merge.hpp>
#include <coframe/plugin/project_config.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace coframe_schema {

// =============================================================================
// Schema
// =============================================================================

/// Fully resolved model. Immutable once produced; share it by reference.
class Schema {
public:
    Schema(std::vector<coframe_plugin::Plugin> plugins,
           coframe_plugin::ComposedDocument document,
           TypeCatalog types,
           std::vector<TableDef> tables);

    // Non-copyable, movable (tables hold pointers into their own storage)
    Schema(const Schema&) = delete;
    Schema& operator=(const Schema&) = delete;
    Schema(Schema&&) = default;
    Schema& operator=(Schema&&) = default;

    /// Plugins in dependency order
    [[nodiscard]] const std::vector<coframe_plugin::Plugin>& plugins() const noexcept { return m_plugins; }

    [[nodiscard]] const coframe_plugin::ComposedDocument& document() const noexcept { return m_document; }

    [[nodiscard]] const TypeCatalog& types() const noexcept { return m_types; }

    /// Tables in first-declaration order
    [[nodiscard]] const std::vector<TableDef>& tables() const noexcept { return m_tables; }

    [[nodiscard]] const TableDef* find_table(const std::string& name) const;

    /// Newest modification time across every plugin file
    [[nodiscard]] std::filesystem::file_time_type latest_timestamp() const;

    /// Every plugin's source_imports, deduplicated, dependency order
    [[nodiscard]] std::vector<std::string> plugin_source_imports() const;

private:
    std::vector<coframe_plugin::Plugin> m_plugins;
    coframe_plugin::ComposedDocument m_document;
    TypeCatalog m_types;
    std::vector<TableDef> m_tables;
};

// =============================================================================
// Pipeline
// =============================================================================

/// Compose already discovered plugins
[[nodiscard]] coframe_core::Result<Schema> compose_schema(
    std::vector<coframe_plugin::Plugin> plugins,
    coframe_plugin::MergeOptions options = {});

/// Discover plugins under every configured path and compose them
[[nodiscard]] coframe_core::Result<Schema> compose_schema(const coframe_plugin::ProjectConfig& config);

} // namespace coframe_schema
