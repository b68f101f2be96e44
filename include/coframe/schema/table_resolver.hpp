#pragma once

/// @file table_resolver.hpp
/// @brief Two-pass table and column resolution
///
/// Pass 1 (structure) builds every TableDef from the composed document:
/// columns get their types, composite types are expanded, mixins are pulled
/// in, and references to other tables are kept as unresolved stubs.
///
/// Pass 2 (references) runs only once every table exists. It consumes the
/// pass 1 tables and returns new ones with foreign keys and many-to-many
/// targets resolved, so declaration order never matters.

#include "fwd.hpp"
#include "table.hpp"
#include "types.hpp"
#include <coframe/core/error.hpp>
#include <coframe/plugin/fwd.hpp>

#include <string>
#include <vector>

namespace coframe_schema {

class TableResolver {
public:
    explicit TableResolver(const TypeCatalog& types) : m_types(types) {}

    // =========================================================================
    // Pass 1
    // =========================================================================

    /// Build every table of the `tables` section, in document order
    [[nodiscard]] coframe_core::Result<std::vector<TableDef>> build_structure(
        const coframe_plugin::ComposedDocument& document) const;

    /// Build one table from its merged node
    [[nodiscard]] coframe_core::Result<TableDef> build_table(
        const std::string& name,
        const coframe_plugin::Node& node,
        std::vector<std::string> owning_plugins) const;

    /// Build the column(s) one declaration produces, appending to `out`
    ///
    /// A composite type expands to one column per embedded column, each named
    /// `prefix + embedded name`.
    [[nodiscard]] coframe_core::Result<void> build_column(
        const ColumnSpec& declaration,
        const std::string& plugin,
        const std::string& table,
        std::vector<ColumnDef>& out) const;

    // =========================================================================
    // Pass 2
    // =========================================================================

    /// Resolve foreign keys and many-to-many targets
    ///
    /// @param tables Complete pass 1 output (left untouched)
    /// @return Resolved copies; references point into the returned vector
    [[nodiscard]] coframe_core::Result<std::vector<TableDef>> resolve_references(
        const std::vector<TableDef>& tables) const;

    /// Both passes
    [[nodiscard]] coframe_core::Result<std::vector<TableDef>> resolve(
        const coframe_plugin::ComposedDocument& document) const;

private:
    [[nodiscard]] coframe_core::Result<void> expand_column(
        const ColumnSpec& declaration,
        const std::string& plugin,
        const std::string& table,
        std::vector<ColumnDef>& out,
        std::vector<std::string>& expanding) const;

    const TypeCatalog& m_types;
};

} // namespace coframe_schema
