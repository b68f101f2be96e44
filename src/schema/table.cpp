/// @file table.cpp
/// @brief Table and column definition helpers

#include <coframe/schema/table.hpp>

#include <algorithm>

namespace coframe_schema {

namespace {

bool contains_key(const std::vector<std::string>& keys, const std::string& key) {
    return std::find(keys.begin(), keys.end(), key) != keys.end();
}

} // anonymous namespace

const std::vector<std::string>& field_constraint_keys() {
    static const std::vector<std::string> keys = {
        "primary_key", "autoincrement", "unique", "nullable", "index", "default"};
    return keys;
}

const std::vector<std::string>& type_parameter_keys() {
    static const std::vector<std::string> keys = {"length", "precision", "scale", "timezone"};
    return keys;
}

const std::vector<std::string>& relation_parameter_keys() {
    static const std::vector<std::string> keys = {"onupdate", "ondelete"};
    return keys;
}

// =============================================================================
// ForeignKeyRef
// =============================================================================

std::optional<ForeignKeyRef> ForeignKeyRef::parse(const std::string& reference) {
    auto dot = reference.find('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == reference.size() ||
        reference.find('.', dot + 1) != std::string::npos) {
        return std::nullopt;
    }

    ForeignKeyRef ref;
    ref.target_table_name = reference.substr(0, dot);
    ref.target_column_name = reference.substr(dot + 1);
    return ref;
}

// =============================================================================
// ColumnDef
// =============================================================================

bool ColumnDef::is_primary_key() const {
    auto it = field_constraints.find("primary_key");
    return it != field_constraints.end() && it->is_boolean() && it->get<bool>();
}

bool ColumnDef::is_nullable() const {
    auto it = field_constraints.find("nullable");
    if (it != field_constraints.end() && it->is_boolean()) {
        return it->get<bool>();
    }
    return !is_primary_key();
}

void ColumnDef::bucket_attributes() {
    field_constraints = Json::object();
    type_parameters = Json::object();
    relation_parameters = Json::object();
    other_attributes = Json::object();

    for (auto it = raw_attributes.begin(); it != raw_attributes.end(); ++it) {
        const std::string& key = it.key();
        if (key == "name" || key == "type" || key == "foreign_key" || key == "prefix") {
            continue;
        }
        if (contains_key(field_constraint_keys(), key)) {
            field_constraints[key] = it.value();
        } else if (contains_key(type_parameter_keys(), key)) {
            type_parameters[key] = it.value();
        } else if (contains_key(relation_parameter_keys(), key)) {
            relation_parameters[key] = it.value();
        } else {
            other_attributes[key] = it.value();
        }
    }

    if (foreign_key) {
        for (auto it = foreign_key->options.begin(); it != foreign_key->options.end(); ++it) {
            if (contains_key(relation_parameter_keys(), it.key())) {
                relation_parameters[it.key()] = it.value();
            }
        }
    }
}

// =============================================================================
// TableDef
// =============================================================================

const ColumnDef* TableDef::find_column(const std::string& column) const {
    auto it = std::find_if(columns.begin(), columns.end(),
        [&column](const ColumnDef& c) { return c.name == column; });
    return it != columns.end() ? &*it : nullptr;
}

std::vector<const ColumnDef*> TableDef::own_columns() const {
    std::vector<const ColumnDef*> result;
    for (const auto& column : columns) {
        if (column.mixin.empty()) {
            result.push_back(&column);
        }
    }
    return result;
}

} // namespace coframe_schema
