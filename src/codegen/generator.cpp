/// @file generator.cpp
/// @brief SQLAlchemy model module generation implementation

#include <coframe/codegen/generator.hpp>
#include <coframe/schema/schema.hpp>
#include <coframe/core/log.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace coframe_codegen {

namespace {

constexpr const char* kIndent = "    ";

std::string join(const std::vector<std::string>& items, const char* sep = ", ") {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) oss << sep;
        oss << items[i];
    }
    return oss.str();
}

/// Forward relationship name for a foreign key column: "user_id" -> "user"
std::string forward_name(const std::string& column) {
    const std::string suffix = "_id";
    if (column.size() > suffix.size() &&
        column.compare(column.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return column.substr(0, column.size() - suffix.size());
    }
    return column + "_rel";
}

} // anonymous namespace

// =============================================================================
// ImportSet
// =============================================================================

void ImportSet::add_module(const std::string& module) {
    if (!module.empty()) {
        m_modules.insert(module);
    }
}

void ImportSet::add_from(const std::string& module, const std::string& name) {
    m_from[module].insert(name);
}

void ImportSet::add_line(const std::string& line) {
    if (!line.empty()) {
        m_lines.insert(line);
    }
}

std::vector<std::string> ImportSet::lines() const {
    std::set<std::string> all = m_lines;
    for (const auto& module : m_modules) {
        all.insert("import " + module);
    }
    for (const auto& [module, names] : m_from) {
        all.insert("from " + module + " import " +
                   join(std::vector<std::string>(names.begin(), names.end())));
    }
    return std::vector<std::string>(all.begin(), all.end());
}

// =============================================================================
// Python Formatting
// =============================================================================

std::string python_literal(const coframe_schema::Json& value) {
    if (value.is_string()) {
        std::string quoted = "'";
        for (char c : value.get_ref<const std::string&>()) {
            if (c == '\\' || c == '\'') {
                quoted += '\\';
            }
            if (c == '\n') {
                quoted += "\\n";
                continue;
            }
            quoted += c;
        }
        return quoted + "'";
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "True" : "False";
    }
    if (value.is_null()) {
        return "None";
    }
    if (value.is_array()) {
        std::vector<std::string> items;
        for (const auto& item : value) {
            items.push_back(python_literal(item));
        }
        return "[" + join(items) + "]";
    }
    if (value.is_object()) {
        std::vector<std::string> items;
        for (auto it = value.begin(); it != value.end(); ++it) {
            items.push_back(python_literal(it.key()) + ": " + python_literal(it.value()));
        }
        return "{" + join(items) + "}";
    }
    return value.dump();
}

std::string python_expression(const coframe_schema::Json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return python_literal(value);
}

// =============================================================================
// ModelGenerator
// =============================================================================

ModelGenerator::ModelGenerator(const coframe_schema::Schema& schema, GeneratorOptions options)
    : m_schema(schema)
    , m_options(std::move(options))
{
}

std::string ModelGenerator::column_source(const coframe_schema::ColumnDef& column,
                                          ImportSet& imports) const {
    std::string native = "Any";
    std::string storage;
    if (const coframe_schema::TypeDef* type = column.resolved_type) {
        native = type->native_type;
        storage = type->storage_type;
        imports.add_module(type->native_module);
    } else {
        imports.add_from("typing", "Any");
    }

    std::string annotation = native;
    if (column.is_nullable()) {
        imports.add_from("typing", "Optional");
        annotation = "Optional[" + native + "]";
    }

    std::vector<std::string> args;

    if (!storage.empty()) {
        imports.add_from("sqlalchemy", storage);

        std::vector<std::string> params;
        const auto& tp = column.type_parameters;
        if (tp.contains("length")) {
            params.push_back(python_literal(tp["length"]));
        }
        if (tp.contains("precision")) {
            params.push_back(python_literal(tp["precision"]));
            if (tp.contains("scale")) {
                params.push_back(python_literal(tp["scale"]));
            }
        } else if (tp.contains("scale")) {
            params.push_back("scale=" + python_literal(tp["scale"]));
        }
        if (tp.contains("timezone")) {
            params.push_back("timezone=" + python_literal(tp["timezone"]));
        }
        args.push_back(params.empty() ? storage : storage + "(" + join(params) + ")");
    }

    std::vector<std::string> relation;
    for (auto it = column.relation_parameters.begin(); it != column.relation_parameters.end(); ++it) {
        relation.push_back(it.key() + "=" + python_expression(it.value()));
    }

    if (column.foreign_key) {
        imports.add_from("sqlalchemy", "ForeignKey");
        const auto& fk = *column.foreign_key;
        const std::string physical = fk.target_table
            ? fk.target_table->physical_name
            : fk.target_table_name;

        std::vector<std::string> fk_args{"'" + physical + "." + fk.target_column_name + "'"};
        fk_args.insert(fk_args.end(), relation.begin(), relation.end());
        args.push_back("ForeignKey(" + join(fk_args) + ")");
    }

    for (const auto& key : coframe_schema::field_constraint_keys()) {
        auto it = column.field_constraints.find(key);
        if (it != column.field_constraints.end()) {
            args.push_back(key + "=" + python_expression(*it));
        }
    }

    if (!column.foreign_key) {
        args.insert(args.end(), relation.begin(), relation.end());
    }

    return std::string(kIndent) + column.name + ": Mapped[" + annotation + "] = mapped_column(" +
           join(args) + ")\n";
}

std::string ModelGenerator::table_source(const coframe_schema::TableDef& table,
                                         ImportSet& imports) const {
    std::vector<std::string> bases{"Base"};
    bases.insert(bases.end(), table.mixins.begin(), table.mixins.end());

    std::ostringstream oss;
    oss << "class " << table.name << "(" << join(bases) << "):\n";
    oss << kIndent << "__tablename__ = '" << table.physical_name << "'\n";

    const auto columns = table.own_columns();
    if (!columns.empty()) {
        oss << "\n";
    }
    for (const auto* column : columns) {
        oss << column_source(*column, imports);
    }
    return oss.str();
}

std::string ModelGenerator::unique_relationship_name(const coframe_schema::TableDef& table,
                                                     const RelationshipMap& taken,
                                                     std::string candidate,
                                                     const std::string& suffix) const {
    auto is_taken = [&](const std::string& name) {
        if (table.find_column(name)) {
            return true;
        }
        auto it = taken.find(table.name);
        if (it == taken.end()) {
            return false;
        }
        return std::any_of(it->second.begin(), it->second.end(),
            [&name](const Relationship& r) { return r.name == name; });
    };

    if (!is_taken(candidate)) {
        return candidate;
    }
    candidate += suffix;

    std::string name = candidate;
    for (int n = 2; is_taken(name); ++n) {
        name = candidate + "_" + std::to_string(n);
    }
    return name;
}

void ModelGenerator::collect_relationships(RelationshipMap& out, ImportSet& imports) const {
    for (const auto& table : m_schema.tables()) {
        for (const auto& column : table.columns) {
            if (!column.foreign_key || !column.foreign_key->target_table) {
                continue;
            }

            imports.add_from("sqlalchemy.orm", "relationship");
            imports.add_from("typing", "List");

            const auto& fk = *column.foreign_key;
            const coframe_schema::TableDef& target = *fk.target_table;
            const std::string foreign_keys = "\"[" + table.name + "." + column.name + "]\"";

            const std::string forward = unique_relationship_name(table, out, forward_name(column.name), "_rel");
            out[table.name].push_back({forward, ""});
            const std::string backward = unique_relationship_name(target, out, table.physical_name, "_" + forward);

            std::string forward_type = "\"" + target.name + "\"";
            if (column.is_nullable()) {
                imports.add_from("typing", "Optional");
                forward_type = "Optional[" + forward_type + "]";
            }

            std::ostringstream fwd;
            fwd << kIndent << forward << ": Mapped[" << forward_type << "] = relationship(\""
                << target.name << "\", foreign_keys=" << foreign_keys
                << ", back_populates=\"" << backward << "\"";
            if (&target == &table) {
                fwd << ", remote_side=\"[" << target.name << "." << fk.target_column_name << "]\"";
            }
            fwd << ")\n";
            out[table.name].back().line = fwd.str();

            std::ostringstream bwd;
            bwd << kIndent << backward << ": Mapped[List[\"" << table.name << "\"]] = relationship(\""
                << table.name << "\", foreign_keys=" << foreign_keys
                << ", back_populates=\"" << forward << "\")\n";
            out[target.name].push_back({backward, bwd.str()});
        }

        if (!table.many_to_many) {
            continue;
        }

        const auto* first = table.many_to_many->target1.table;
        const auto* second = table.many_to_many->target2.table;
        if (!first || !second) {
            continue;
        }

        imports.add_from("sqlalchemy.orm", "relationship");
        imports.add_from("typing", "List");

        auto add_secondary = [&](const coframe_schema::TableDef& owner, const coframe_schema::TableDef& other) {
            const std::string name = unique_relationship_name(owner, out, other.physical_name,
                                                              "_" + table.physical_name);
            std::ostringstream line;
            line << kIndent << name << ": Mapped[List[\"" << other.name << "\"]] = relationship(\""
                 << other.name << "\", secondary=\"" << table.physical_name << "\", viewonly=True)\n";
            out[owner.name].push_back({name, line.str()});
        };

        add_secondary(*first, *second);
        add_secondary(*second, *first);
    }
}

std::string ModelGenerator::generate() const {
    ImportSet imports;
    imports.add_from("sqlalchemy", "create_engine");
    imports.add_from("sqlalchemy.orm", "DeclarativeBase");
    imports.add_from("sqlalchemy.orm", "Mapped");
    imports.add_from("sqlalchemy.orm", "mapped_column");
    for (const auto& line : m_options.source_imports) {
        imports.add_line(line);
    }
    for (const auto& line : m_schema.plugin_source_imports()) {
        imports.add_line(line);
    }

    RelationshipMap relationships;
    collect_relationships(relationships, imports);

    // Mixin classes, first use order
    std::vector<std::string> mixins;
    std::ostringstream mixin_source;
    for (const auto& table : m_schema.tables()) {
        for (const auto& mixin : table.mixins) {
            if (std::find(mixins.begin(), mixins.end(), mixin) != mixins.end()) {
                continue;
            }
            mixins.push_back(mixin);

            mixin_source << "class " << mixin << ":\n";
            for (const auto& column : table.columns) {
                if (column.mixin == mixin) {
                    mixin_source << column_source(column, imports);
                }
            }
            mixin_source << "\n\n";
        }
    }

    std::ostringstream table_source_text;
    for (const auto& table : m_schema.tables()) {
        table_source_text << table_source(table, imports);

        auto it = relationships.find(table.name);
        if (it != relationships.end() && !it->second.empty()) {
            table_source_text << "\n";
            for (const auto& relationship : it->second) {
                table_source_text << relationship.line;
            }
        }
        table_source_text << "\n\n";
    }

    std::ostringstream oss;
    oss << "# Model module for project '" << m_options.project_name << "'\n";
    oss << "# Generated by coframe_gen from plugin declarations. Do not edit.\n";
    oss << "\n";

    for (const auto& line : imports.lines()) {
        oss << line << "\n";
    }
    oss << "\n\n";

    oss << "class Base(DeclarativeBase):\n";
    oss << kIndent << "pass\n";
    oss << "\n\n";

    oss << mixin_source.str();
    oss << table_source_text.str();

    oss << "def initialize_db(db_url: str = " << python_literal(m_options.db_engine) << "):\n";
    oss << kIndent << "engine = create_engine(db_url)\n";
    oss << kIndent << "Base.metadata.create_all(engine)\n";
    oss << kIndent << "return engine\n";

    if (!m_options.source_add.empty()) {
        oss << "\n\n" << m_options.source_add;
        if (m_options.source_add.back() != '\n') {
            oss << "\n";
        }
    }

    return oss.str();
}

bool ModelGenerator::should_regenerate(const std::filesystem::path& artifact) const {
    std::error_code ec;
    if (!std::filesystem::exists(artifact, ec)) {
        return true;
    }

    auto generated = std::filesystem::last_write_time(artifact, ec);
    if (ec) {
        return true;
    }
    return generated < m_schema.latest_timestamp();
}

coframe_core::Result<void> ModelGenerator::write(const std::filesystem::path& artifact) const {
    std::error_code ec;
    if (artifact.has_parent_path()) {
        std::filesystem::create_directories(artifact.parent_path(), ec);
        if (ec) {
            return coframe_core::Err(
                coframe_core::Error(coframe_core::ErrorCode::IOError,
                    "Failed to create directory " + artifact.parent_path().string() + ": " + ec.message()));
        }
    }

    std::ofstream file(artifact, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return coframe_core::Err(
            coframe_core::Error(coframe_core::ErrorCode::IOError,
                "Failed to open output file: " + artifact.string()));
    }

    const std::string source = generate();
    file << source;
    file.close();
    if (!file) {
        return coframe_core::Err(
            coframe_core::Error(coframe_core::ErrorCode::IOError,
                "Failed to write output file: " + artifact.string()));
    }

    coframe_core::codegen_logger()->info("Generated {} ({} table(s), {} bytes)",
        artifact.string(), m_schema.tables().size(), source.size());
    return coframe_core::Ok();
}

} // namespace coframe_codegen
