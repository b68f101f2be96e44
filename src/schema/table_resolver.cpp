/// @file table_resolver.cpp
/// @brief Two-pass table and column resolution implementation

#include <coframe/schema/table_resolver.hpp>
#include <coframe/plugin/merge.hpp>
#include <coframe/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <map>
#include <set>

namespace coframe_schema {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string string_attribute(const Json& j, const char* key) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return {};
}

/// Where a reference ends up after following foreign keys
struct ReferenceTarget {
    std::size_t table_index = 0;             ///< Directly referenced table
    const ColumnDef* terminal = nullptr;     ///< First non foreign key column on the chain
};

using TableIndex = std::map<std::string, std::size_t>;

coframe_core::Result<ReferenceTarget> follow_reference(const std::vector<TableDef>& tables,
                                                       const TableIndex& index,
                                                       const std::string& table_name,
                                                       const std::string& column_name,
                                                       const std::string& source_column,
                                                       const std::string& source_table,
                                                       std::set<std::string>& visited) {
    const std::string target = table_name + "." + column_name;

    auto table_it = index.find(table_name);
    if (table_it == index.end()) {
        return coframe_core::Err<ReferenceTarget>(
            coframe_core::Error(coframe_core::SchemaError::unknown_foreign_table(
                source_column, source_table, table_name))
                .with_context("table", source_table)
                .with_context("column", source_column));
    }

    const TableDef& table = tables[table_it->second];
    const ColumnDef* column = table.find_column(column_name);
    if (!column || !visited.insert(target).second) {
        return coframe_core::Err<ReferenceTarget>(
            coframe_core::Error(coframe_core::SchemaError::invalid_foreign_reference(
                source_column, source_table, target))
                .with_context("table", source_table)
                .with_context("column", source_column));
    }

    ReferenceTarget result;
    result.table_index = table_it->second;

    if (column->foreign_key) {
        auto next = follow_reference(tables, index,
            column->foreign_key->target_table_name, column->foreign_key->target_column_name,
            source_column, source_table, visited);
        if (!next) {
            return next;
        }
        result.terminal = next->terminal;
    } else {
        result.terminal = column;
    }

    if (!result.terminal->resolved_type) {
        return coframe_core::Err<ReferenceTarget>(
            coframe_core::Error(coframe_core::SchemaError::invalid_foreign_reference(
                source_column, source_table, target))
                .with_context("table", source_table)
                .with_context("column", source_column));
    }

    return coframe_core::Ok(result);
}

/// Copy storage type parameters the column does not set itself
void inherit_type_parameters(ColumnDef& column, const ColumnDef& terminal) {
    for (auto it = terminal.type_parameters.begin(); it != terminal.type_parameters.end(); ++it) {
        if (!column.type_parameters.contains(it.key())) {
            column.type_parameters[it.key()] = it.value();
        }
    }
}

coframe_core::Result<ManyToManyTarget> parse_many_to_many_target(const Json& declaration,
                                                                 const std::string& key,
                                                                 const std::string& table) {
    auto it = declaration.find(key);
    if (it == declaration.end()) {
        return coframe_core::Err<ManyToManyTarget>(
            coframe_core::SchemaError::invalid_many_to_many(table, "missing '" + key + "'"));
    }

    std::string reference;
    std::string join_column;
    if (it->is_string()) {
        reference = it->get<std::string>();
    } else if (it->is_object()) {
        reference = string_attribute(*it, "table");
        join_column = string_attribute(*it, "column");
    }

    auto ref = ForeignKeyRef::parse(reference);
    if (!ref) {
        return coframe_core::Err<ManyToManyTarget>(
            coframe_core::SchemaError::invalid_many_to_many(table,
                "'" + key + "' must reference 'Table.column'"));
    }

    ManyToManyTarget target;
    target.table_name = ref->target_table_name;
    target.column_name = ref->target_column_name;
    target.join_column = join_column.empty()
        ? to_lower(target.table_name) + "_" + target.column_name
        : join_column;
    return coframe_core::Ok(std::move(target));
}

} // anonymous namespace

// =============================================================================
// Pass 1
// =============================================================================

coframe_core::Result<std::vector<TableDef>> TableResolver::build_structure(
    const coframe_plugin::ComposedDocument& document) const {

    std::vector<TableDef> tables;
    const coframe_plugin::MapNode* section = document.section("tables");
    if (!section) {
        return coframe_core::Ok(std::move(tables));
    }

    tables.reserve(section->size());
    for (std::size_t i = 0; i < section->size(); ++i) {
        const std::string& name = section->keys[i];
        auto table = build_table(name, section->values[i], document.contributors("tables." + name));
        if (!table) {
            return coframe_core::Err<std::vector<TableDef>>(table.error());
        }
        tables.push_back(std::move(table).value());
    }

    coframe_core::schema_logger()->debug("Built {} table(s)", tables.size());
    return coframe_core::Ok(std::move(tables));
}

coframe_core::Result<TableDef> TableResolver::build_table(const std::string& name,
                                                          const coframe_plugin::Node& node,
                                                          std::vector<std::string> owning_plugins) const {
    const coframe_plugin::MapNode* map = node.as_map();
    if (!map) {
        return coframe_core::Err<TableDef>(
            coframe_core::Error(coframe_core::ErrorCode::ValidationError,
                "Table \"" + name + "\" must be a map")
                .with_context("table", name));
    }

    TableDef table;
    table.name = name;
    table.owning_plugins = std::move(owning_plugins);
    if (table.owning_plugins.empty() && !node.provenance().empty()) {
        table.owning_plugins.push_back(node.provenance());
    }

    const coframe_plugin::Node* columns = nullptr;
    for (std::size_t i = 0; i < map->size(); ++i) {
        if (map->keys[i] == "columns") {
            columns = &map->values[i];
        } else {
            table.attributes[map->keys[i]] = map->values[i].to_json();
        }
    }

    std::string physical = string_attribute(table.attributes, "name");
    table.physical_name = physical.empty() ? to_lower(name) : physical;

    // Declared columns
    if (columns) {
        const coframe_plugin::ListNode* list = columns->as_list();
        if (!list) {
            return coframe_core::Err<TableDef>(
                coframe_core::Error(coframe_core::ErrorCode::ValidationError,
                    "Columns of table \"" + name + "\" must be a list")
                    .with_context("table", name));
        }
        for (const auto& item : list->items) {
            const std::string plugin = item.provenance().empty() ? node.provenance() : item.provenance();
            auto built = build_column(item.to_json(), plugin, name, table.columns);
            if (!built) {
                return coframe_core::Err<TableDef>(built.error());
            }
        }
    }

    // Mixins
    auto mixins = table.attributes.find("mixins");
    if (mixins != table.attributes.end()) {
        std::vector<std::string> names;
        if (mixins->is_string()) {
            names.push_back(mixins->get<std::string>());
        } else if (mixins->is_array()) {
            for (const auto& entry : *mixins) {
                names.push_back(entry.is_string() ? entry.get<std::string>() : entry.dump());
            }
        }

        for (const auto& mixin : names) {
            const TypeDef* type = m_types.find(mixin);
            if (!type || !type->is_composite()) {
                return coframe_core::Err<TableDef>(
                    coframe_core::Error(coframe_core::SchemaError::unknown_type(mixin, "table: " + name, mixin))
                        .with_context("table", name)
                        .with_context("type", mixin));
            }

            std::vector<ColumnDef> mixed;
            for (const auto& spec : type->embedded_columns) {
                auto built = build_column(spec, type->owning_plugin, name, mixed);
                if (!built) {
                    return coframe_core::Err<TableDef>(built.error());
                }
            }
            for (auto& column : mixed) {
                column.mixin = mixin;
                table.columns.push_back(std::move(column));
            }
            table.mixins.push_back(mixin);
        }
    }

    // Duplicate names after expansion
    std::set<std::string> seen;
    for (const auto& column : table.columns) {
        if (!seen.insert(column.name).second) {
            return coframe_core::Err<TableDef>(
                coframe_core::Error(coframe_core::SchemaError::duplicate_column(column.name, name, column.plugin))
                    .with_context("table", name)
                    .with_context("column", column.name)
                    .with_context("plugin", column.plugin));
        }
    }

    // Many-to-many targets stay unresolved until pass 2
    auto m2m = table.attributes.find("many_to_many");
    if (m2m != table.attributes.end()) {
        if (!m2m->is_object()) {
            return coframe_core::Err<TableDef>(
                coframe_core::SchemaError::invalid_many_to_many(name, "'many_to_many' must be a map"));
        }
        auto target1 = parse_many_to_many_target(*m2m, "target1", name);
        if (!target1) {
            return coframe_core::Err<TableDef>(target1.error());
        }
        auto target2 = parse_many_to_many_target(*m2m, "target2", name);
        if (!target2) {
            return coframe_core::Err<TableDef>(target2.error());
        }
        table.many_to_many = ManyToManyDef{std::move(target1).value(), std::move(target2).value()};
    }

    return coframe_core::Ok(std::move(table));
}

coframe_core::Result<void> TableResolver::build_column(const ColumnSpec& declaration,
                                                       const std::string& plugin,
                                                       const std::string& table,
                                                       std::vector<ColumnDef>& out) const {
    std::vector<std::string> expanding;
    return expand_column(declaration, plugin, table, out, expanding);
}

coframe_core::Result<void> TableResolver::expand_column(const ColumnSpec& declaration,
                                                        const std::string& plugin,
                                                        const std::string& table,
                                                        std::vector<ColumnDef>& out,
                                                        std::vector<std::string>& expanding) const {
    const std::string caller = "table: " + table;
    const std::string name = string_attribute(declaration, "name");
    if (!declaration.is_object() || name.empty()) {
        return coframe_core::Err(
            coframe_core::Error(coframe_core::ErrorCode::ValidationError,
                "Column without a name in " + caller)
                .with_context("table", table)
                .with_context("plugin", plugin));
    }

    ColumnDef column;
    column.name = name;
    column.plugin = plugin;
    column.raw_attributes = declaration;

    auto fk = declaration.find("foreign_key");
    if (fk != declaration.end()) {
        // "foreign_key": "User.id" or { "target": "User.id", "onupdate": ... }
        std::string target = fk->is_string() ? fk->get<std::string>() : string_attribute(*fk, "target");
        auto ref = ForeignKeyRef::parse(target);
        if (!ref) {
            return coframe_core::Err(
                coframe_core::Error(coframe_core::SchemaError::invalid_foreign_reference(name, table, target))
                    .with_context("table", table)
                    .with_context("column", name));
        }
        if (fk->is_object()) {
            for (auto it = fk->begin(); it != fk->end(); ++it) {
                if (it.key() != "target") {
                    ref->options[it.key()] = it.value();
                }
            }
        }
        column.foreign_key = std::move(ref);
        column.bucket_attributes();
        out.push_back(std::move(column));
        return coframe_core::Ok();
    }

    const std::string type_name = string_attribute(declaration, "type");
    if (const TypeDef* type = m_types.find(type_name)) {
        if (type->is_composite()) {
            if (std::find(expanding.begin(), expanding.end(), type_name) != expanding.end()) {
                return coframe_core::Err(
                    coframe_core::Error(coframe_core::SchemaError::invalid_type(
                        type_name, type->owning_plugin, "composite type contains itself"))
                        .with_context("table", table)
                        .with_context("column", name));
            }

            const std::string prefix = string_attribute(declaration, "prefix");
            expanding.push_back(type_name);
            for (const auto& spec : type->embedded_columns) {
                ColumnSpec embedded = spec;
                embedded["name"] = prefix + string_attribute(spec, "name");
                auto result = expand_column(embedded, plugin, table, out, expanding);
                if (!result) {
                    return result;
                }
            }
            expanding.pop_back();
            return coframe_core::Ok();
        }

        for (auto it = type->attributes.begin(); it != type->attributes.end(); ++it) {
            if (!column.raw_attributes.contains(it.key())) {
                column.raw_attributes[it.key()] = it.value();
            }
        }
        column.resolved_type = type;
    } else if (auto ref = ForeignKeyRef::parse(type_name)) {
        column.foreign_key = std::move(ref);
    } else {
        return coframe_core::Err(
            coframe_core::Error(coframe_core::SchemaError::unknown_type(name, caller, type_name))
                .with_context("table", table)
                .with_context("column", name)
                .with_context("plugin", plugin));
    }

    column.bucket_attributes();
    out.push_back(std::move(column));
    return coframe_core::Ok();
}

// =============================================================================
// Pass 2
// =============================================================================

coframe_core::Result<std::vector<TableDef>> TableResolver::resolve_references(
    const std::vector<TableDef>& tables) const {

    TableIndex index;
    for (std::size_t i = 0; i < tables.size(); ++i) {
        index[tables[i].name] = i;
    }

    std::vector<TableDef> resolved = tables;

    // Foreign keys
    for (auto& table : resolved) {
        for (auto& column : table.columns) {
            if (!column.foreign_key) {
                continue;
            }

            std::set<std::string> visited;
            auto target = follow_reference(tables, index,
                column.foreign_key->target_table_name, column.foreign_key->target_column_name,
                column.name, table.name, visited);
            if (!target) {
                return coframe_core::Err<std::vector<TableDef>>(target.error());
            }

            column.foreign_key->target_table = &resolved[target->table_index];
            column.foreign_key->target_column_type = target->terminal->resolved_type;
            column.resolved_type = target->terminal->resolved_type;
            inherit_type_parameters(column, *target->terminal);
        }
    }

    // Many-to-many join columns
    for (auto& table : resolved) {
        if (!table.many_to_many) {
            continue;
        }

        std::vector<ColumnDef> join_columns;
        for (auto* target : {&table.many_to_many->target1, &table.many_to_many->target2}) {
            const char* tag = target == &table.many_to_many->target1 ? "target1" : "target2";

            std::set<std::string> visited;
            auto resolved_target = follow_reference(tables, index,
                target->table_name, target->column_name, target->join_column, table.name, visited);
            if (!resolved_target) {
                return coframe_core::Err<std::vector<TableDef>>(
                    coframe_core::Error(coframe_core::SchemaError::invalid_many_to_many(
                        table.name, resolved_target.error().message()))
                        .with_context("table", table.name));
            }

            const bool clashes_with_target1 = !join_columns.empty() &&
                join_columns.front().name == target->join_column;
            if (table.find_column(target->join_column) || clashes_with_target1) {
                return coframe_core::Err<std::vector<TableDef>>(
                    coframe_core::Error(coframe_core::SchemaError::invalid_many_to_many(
                        table.name, "join column '" + target->join_column + "' is already declared"))
                        .with_context("table", table.name)
                        .with_context("column", target->join_column));
            }

            target->table = &resolved[resolved_target->table_index];
            target->resolved_type = resolved_target->terminal->resolved_type;

            ColumnDef join;
            join.name = target->join_column;
            join.plugin = table.owning_plugins.empty() ? std::string() : table.owning_plugins.front();
            join.raw_attributes = Json{{"name", join.name}, {"primary_key", true}};
            ForeignKeyRef ref;
            ref.target_table_name = target->table_name;
            ref.target_column_name = target->column_name;
            ref.target_table = target->table;
            ref.target_column_type = target->resolved_type;
            join.foreign_key = std::move(ref);
            join.resolved_type = target->resolved_type;
            join.many_to_many_tag = tag;
            join.bucket_attributes();
            inherit_type_parameters(join, *resolved_target->terminal);

            join_columns.push_back(std::move(join));
        }

        table.columns.insert(table.columns.begin(),
            std::make_move_iterator(join_columns.begin()),
            std::make_move_iterator(join_columns.end()));
    }

    coframe_core::schema_logger()->debug("Resolved references of {} table(s)", resolved.size());
    return coframe_core::Ok(std::move(resolved));
}

coframe_core::Result<std::vector<TableDef>> TableResolver::resolve(
    const coframe_plugin::ComposedDocument& document) const {
    auto structure = build_structure(document);
    if (!structure) {
        return structure;
    }
    return resolve_references(*structure);
}

} // namespace coframe_schema
