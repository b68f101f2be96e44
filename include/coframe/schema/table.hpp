#pragma once

/// @file table.hpp
/// @brief Resolved table and column definitions

#include "fwd.hpp"
#include "types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace coframe_schema {

// =============================================================================
// Attribute Buckets
// =============================================================================

/// Keys passed to the column constructor
[[nodiscard]] const std::vector<std::string>& field_constraint_keys();

/// Keys passed to the storage type constructor
[[nodiscard]] const std::vector<std::string>& type_parameter_keys();

/// Keys passed to the foreign key constructor
[[nodiscard]] const std::vector<std::string>& relation_parameter_keys();

// =============================================================================
// ForeignKeyRef
// =============================================================================

struct ForeignKeyRef {
    std::string target_table_name;
    std::string target_column_name;
    Json options = Json::object();              ///< onupdate / ondelete passthrough

    const TableDef* target_table = nullptr;     ///< Set by reference resolution
    const TypeDef* target_column_type = nullptr;

    [[nodiscard]] bool is_resolved() const noexcept {
        return target_table != nullptr && target_column_type != nullptr;
    }

    /// "Table.column"
    [[nodiscard]] std::string target() const {
        return target_table_name + "." + target_column_name;
    }

    /// Parse "Table.column"; nullopt when malformed
    [[nodiscard]] static std::optional<ForeignKeyRef> parse(const std::string& reference);
};

// =============================================================================
// ColumnDef
// =============================================================================

struct ColumnDef {
    std::string name;
    std::string plugin;                          ///< Contributing plugin
    Json raw_attributes = Json::object();        ///< Declaration plus inherited type attributes
    const TypeDef* resolved_type = nullptr;

    Json field_constraints = Json::object();
    Json type_parameters = Json::object();
    Json relation_parameters = Json::object();
    Json other_attributes = Json::object();

    std::optional<ForeignKeyRef> foreign_key;
    std::optional<std::string> many_to_many_tag; ///< "target1" / "target2" on join columns
    std::string mixin;                           ///< Composite type supplying it via `mixins`

    [[nodiscard]] bool is_foreign_key() const noexcept { return foreign_key.has_value(); }
    [[nodiscard]] bool is_primary_key() const;

    /// `nullable` as declared, else true unless primary key
    [[nodiscard]] bool is_nullable() const;

    /// Split raw attributes into the four buckets
    void bucket_attributes();
};

// =============================================================================
// ManyToManyDef
// =============================================================================

struct ManyToManyTarget {
    std::string table_name;                      ///< Referenced table (class name)
    std::string column_name;                     ///< Referenced column
    std::string join_column;                     ///< Column generated on the join table

    const TableDef* table = nullptr;
    const TypeDef* resolved_type = nullptr;
};

struct ManyToManyDef {
    ManyToManyTarget target1;
    ManyToManyTarget target2;
};

// =============================================================================
// TableDef
// =============================================================================

struct TableDef {
    std::string name;                            ///< Class name
    std::string physical_name;                   ///< __tablename__
    std::vector<std::string> owning_plugins;     ///< Contribution order
    Json attributes = Json::object();            ///< Without columns and provenance
    std::vector<ColumnDef> columns;              ///< First-declared order
    std::vector<std::string> mixins;
    std::optional<ManyToManyDef> many_to_many;

    [[nodiscard]] const ColumnDef* find_column(const std::string& column) const;

    /// Columns declared on the class itself (mixin columns excluded)
    [[nodiscard]] std::vector<const ColumnDef*> own_columns() const;
};

} // namespace coframe_schema
