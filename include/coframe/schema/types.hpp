#pragma once

/// @file types.hpp
/// @brief Column type catalog
///
/// The catalog holds the storage engine's built-in types and every type a
/// plugin declares under `types`. A plugin type either derives from another
/// type through `base` (or `inherits`):
/// @code
/// "ShortStr": { "base": "String", "length": 32 },
/// "SKU":      { "base": "ShortStr", "nullable": false }
/// @endcode
/// or is a composite column group used as a mixin or expanded in place:
/// @code
/// "TimeStamp": { "columns": [ { "name": "created_at", "type": "DateTime" } ] }
/// @endcode

#include "fwd.hpp"
#include <coframe/core/error.hpp>
#include <coframe/plugin/fwd.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace coframe_schema {

/// Owning plugin of engine built-in types
inline constexpr const char* kBuiltinPlugin = "builtin";

// =============================================================================
// Built-in Types
// =============================================================================

/// Static registration entry for an engine built-in type
struct BuiltinType {
    const char* name;           ///< Storage type name (SQLAlchemy class)
    const char* native_type;    ///< Python annotation
    const char* native_module;  ///< Module to import for the annotation, or ""
};

/// Every built-in type, sorted by name
[[nodiscard]] const std::vector<BuiltinType>& builtin_types();

// =============================================================================
// TypeDef
// =============================================================================

struct TypeDef {
    std::string name;
    std::string owning_plugin = kBuiltinPlugin;
    Json own_attributes = Json::object();   ///< As declared, minus base/inherits/columns
    Json attributes = Json::object();       ///< Own merged over every ancestor's
    std::optional<std::string> base_type_name;
    std::vector<std::string> inheritance;   ///< Nearest ancestor first
    std::string native_type;                ///< Empty for composite types
    std::string native_module;
    std::string storage_type;               ///< Terminal storage type name
    std::vector<ColumnSpec> embedded_columns;

    [[nodiscard]] bool is_builtin() const noexcept { return owning_plugin == kBuiltinPlugin; }

    /// Column group without a base type
    [[nodiscard]] bool is_composite() const noexcept {
        return !embedded_columns.empty() && !base_type_name.has_value();
    }

    /// Build a plugin type from its declaration
    [[nodiscard]] static coframe_core::Result<TypeDef> from_declaration(
        const std::string& name,
        const Json& declaration,
        const std::string& plugin);
};

// =============================================================================
// TypeCatalog
// =============================================================================

/// Built-in and plugin-declared column types
///
/// TypeDef addresses are stable for the lifetime of the catalog, moves
/// included, so resolved columns may point into it.
class TypeCatalog {
public:
    /// Catalog seeded with the built-in types
    TypeCatalog();

    // Non-copyable, movable
    TypeCatalog(const TypeCatalog&) = delete;
    TypeCatalog& operator=(const TypeCatalog&) = delete;
    TypeCatalog(TypeCatalog&&) = default;
    TypeCatalog& operator=(TypeCatalog&&) = default;

    // =========================================================================
    // Registration
    // =========================================================================

    /// Insert a type; fails with DuplicateTypeError if the name is taken
    [[nodiscard]] coframe_core::Result<void> add_type(TypeDef type);

    /// Read the `types` section of a composed document
    ///
    /// A name touched by more than one declaration is a DuplicateTypeError.
    [[nodiscard]] coframe_core::Result<void> load(const coframe_plugin::ComposedDocument& document);

    // =========================================================================
    // Resolution
    // =========================================================================

    /// Resolve the inheritance chain of one type
    ///
    /// Recomputes from the declared attributes, so calling it again yields
    /// the same chain and attributes.
    [[nodiscard]] coframe_core::Result<void> resolve(const std::string& name);

    /// Resolve every type
    [[nodiscard]] coframe_core::Result<void> resolve_all();

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] const TypeDef* find(const std::string& name) const;
    [[nodiscard]] bool contains(const std::string& name) const { return find(name) != nullptr; }

    [[nodiscard]] const std::map<std::string, TypeDef>& types() const noexcept { return m_types; }

    /// Plugin type names in declaration order
    [[nodiscard]] const std::vector<std::string>& declared() const noexcept { return m_declared; }

    [[nodiscard]] std::size_t size() const noexcept { return m_types.size(); }

private:
    std::map<std::string, TypeDef> m_types;
    std::vector<std::string> m_declared;
};

/// Merge `base` under `target`: keys already in `target` win, nested maps recurse
void deep_merge_under(Json& target, const Json& base);

} // namespace coframe_schema
