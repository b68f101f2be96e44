/// @file types.cpp
/// @brief Column type catalog implementation

#include <coframe/schema/types.hpp>
#include <coframe/plugin/merge.hpp>
#include <coframe/core/log.hpp>

#include <set>
#include <sstream>

namespace coframe_schema {

// =============================================================================
// Built-in Types
// =============================================================================

const std::vector<BuiltinType>& builtin_types() {
    static const std::vector<BuiltinType> types = {
        {"BigInteger",   "int",                "" },
        {"Boolean",      "bool",               "" },
        {"Date",         "datetime.date",      "datetime"},
        {"DateTime",     "datetime.datetime",  "datetime"},
        {"Double",       "float",              "" },
        {"Enum",         "str",                "" },
        {"Float",        "float",              "" },
        {"Integer",      "int",                "" },
        {"Interval",     "datetime.timedelta", "datetime"},
        {"JSON",         "dict",               "" },
        {"LargeBinary",  "bytes",              "" },
        {"Numeric",      "decimal.Decimal",    "decimal"},
        {"SmallInteger", "int",                "" },
        {"String",       "str",                "" },
        {"Text",         "str",                "" },
        {"Time",         "datetime.time",      "datetime"},
        {"Unicode",      "str",                "" },
        {"UnicodeText",  "str",                "" },
        {"Uuid",         "uuid.UUID",          "uuid"},
    };
    return types;
}

void deep_merge_under(Json& target, const Json& base) {
    for (auto it = base.begin(); it != base.end(); ++it) {
        if (!target.contains(it.key())) {
            target[it.key()] = it.value();
        } else if (target[it.key()].is_object() && it.value().is_object()) {
            deep_merge_under(target[it.key()], it.value());
        }
    }
}

// =============================================================================
// TypeDef
// =============================================================================

coframe_core::Result<TypeDef> TypeDef::from_declaration(const std::string& name,
                                                        const Json& declaration,
                                                        const std::string& plugin) {
    if (!declaration.is_object()) {
        return coframe_core::Err<TypeDef>(
            coframe_core::SchemaError::invalid_type(name, plugin, "declaration must be a map"));
    }

    TypeDef type;
    type.name = name;
    type.owning_plugin = plugin;

    for (auto it = declaration.begin(); it != declaration.end(); ++it) {
        const std::string& key = it.key();
        if (key == "base" || key == "inherits") {
            if (!it.value().is_string()) {
                return coframe_core::Err<TypeDef>(
                    coframe_core::SchemaError::invalid_type(name, plugin, "'" + key + "' must be a type name"));
            }
            type.base_type_name = it.value().get<std::string>();
        } else if (key == "columns") {
            if (!it.value().is_array()) {
                return coframe_core::Err<TypeDef>(
                    coframe_core::SchemaError::invalid_type(name, plugin, "'columns' must be a list"));
            }
            for (const auto& column : it.value()) {
                if (!column.is_object() || !column.contains("name") || !column["name"].is_string()) {
                    return coframe_core::Err<TypeDef>(
                        coframe_core::SchemaError::invalid_type(name, plugin, "every column needs a name"));
                }
                type.embedded_columns.push_back(column);
            }
        } else {
            type.own_attributes[key] = it.value();
        }
    }

    if (type.base_type_name && !type.embedded_columns.empty()) {
        return coframe_core::Err<TypeDef>(
            coframe_core::SchemaError::invalid_type(name, plugin, "declares both a base type and columns"));
    }
    if (!type.base_type_name && type.embedded_columns.empty()) {
        return coframe_core::Err<TypeDef>(
            coframe_core::SchemaError::invalid_type(name, plugin, "needs a base type or columns"));
    }

    type.attributes = type.own_attributes;
    return coframe_core::Ok(std::move(type));
}

// =============================================================================
// TypeCatalog
// =============================================================================

TypeCatalog::TypeCatalog() {
    for (const auto& builtin : builtin_types()) {
        TypeDef type;
        type.name = builtin.name;
        type.native_type = builtin.native_type;
        type.native_module = builtin.native_module;
        type.storage_type = builtin.name;
        m_types.emplace(type.name, std::move(type));
    }
}

coframe_core::Result<void> TypeCatalog::add_type(TypeDef type) {
    auto it = m_types.find(type.name);
    if (it != m_types.end()) {
        return coframe_core::Err(
            coframe_core::Error(coframe_core::SchemaError::duplicate_type(
                type.name, it->second.owning_plugin + ", " + type.owning_plugin))
                .with_context("type", type.name));
    }

    if (!type.is_builtin()) {
        m_declared.push_back(type.name);
    }
    std::string name = type.name;
    m_types.emplace(std::move(name), std::move(type));
    return coframe_core::Ok();
}

coframe_core::Result<void> TypeCatalog::load(const coframe_plugin::ComposedDocument& document) {
    const coframe_plugin::MapNode* section = document.section("types");
    if (!section) {
        return coframe_core::Ok();
    }

    for (std::size_t i = 0; i < section->size(); ++i) {
        const std::string& name = section->keys[i];
        const coframe_plugin::Node& node = section->values[i];
        const std::string plugin = node.provenance();

        // Two declarations of the same name were merged into one node
        auto it = document.history().find("types." + name);
        if (it != document.history().end() && it->second.size() > 1) {
            std::ostringstream plugins;
            for (std::size_t p = 0; p < it->second.size(); ++p) {
                if (p > 0) plugins << ", ";
                plugins << it->second[p];
            }
            return coframe_core::Err(
                coframe_core::Error(coframe_core::SchemaError::duplicate_type(name, plugins.str()))
                    .with_context("type", name));
        }

        auto type = TypeDef::from_declaration(name, node.to_json(), plugin);
        if (!type) {
            return coframe_core::Err(type.error().with_context("type", name));
        }

        auto added = add_type(std::move(type).value());
        if (!added) {
            return added;
        }
    }

    coframe_core::schema_logger()->debug("Loaded {} plugin type(s)", m_declared.size());
    return coframe_core::Ok();
}

coframe_core::Result<void> TypeCatalog::resolve(const std::string& name) {
    auto self = m_types.find(name);
    if (self == m_types.end()) {
        return coframe_core::Err(
            coframe_core::Error(coframe_core::ErrorCode::NotFound, "Unknown type: " + name)
                .with_context("type", name));
    }

    TypeDef& type = self->second;

    // Start over from the declaration every time
    type.attributes = type.own_attributes;
    type.inheritance.clear();

    std::set<std::string> seen{name};
    const TypeDef* current = &type;

    while (current->base_type_name) {
        const std::string& base_name = *current->base_type_name;
        auto base = m_types.find(base_name);
        if (base == m_types.end()) {
            type.inheritance.clear();
            type.attributes = type.own_attributes;
            return coframe_core::Err(
                coframe_core::Error(coframe_core::SchemaError::unknown_base_type(
                    current->name, base_name, current->owning_plugin))
                    .with_context("type", current->name)
                    .with_context("plugin", current->owning_plugin));
        }

        if (!seen.insert(base_name).second) {
            std::ostringstream chain;
            chain << name;
            for (const auto& ancestor : type.inheritance) {
                chain << " -> " << ancestor;
            }
            chain << " -> " << base_name;
            type.inheritance.clear();
            type.attributes = type.own_attributes;
            return coframe_core::Err(
                coframe_core::Error(coframe_core::SchemaError::inheritance_cycle(name, chain.str()))
                    .with_context("type", name));
        }

        type.inheritance.push_back(base_name);
        deep_merge_under(type.attributes, base->second.own_attributes);
        current = &base->second;
    }

    if (current != &type) {
        if (current->is_composite()) {
            type.inheritance.clear();
            type.attributes = type.own_attributes;
            return coframe_core::Err(
                coframe_core::Error(coframe_core::SchemaError::invalid_type(
                    name, type.owning_plugin, "derives from composite type '" + current->name + "'"))
                    .with_context("type", name));
        }
        type.native_type = current->native_type;
        type.native_module = current->native_module;
        type.storage_type = current->storage_type.empty() ? current->name : current->storage_type;
    } else if (type.storage_type.empty() && !type.is_composite()) {
        type.storage_type = type.name;
    }

    return coframe_core::Ok();
}

coframe_core::Result<void> TypeCatalog::resolve_all() {
    for (const auto& entry : m_types) {
        auto result = resolve(entry.first);
        if (!result) {
            return result;
        }
    }
    return coframe_core::Ok();
}

const TypeDef* TypeCatalog::find(const std::string& name) const {
    auto it = m_types.find(name);
    return it != m_types.end() ? &it->second : nullptr;
}

} // namespace coframe_schema
