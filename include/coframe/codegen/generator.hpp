#pragma once

/// @file generator.hpp
/// @brief SQLAlchemy model module generation
///
/// Emits one deterministic Python module from a resolved Schema:
/// header, import block, `Base`, mixin classes, table classes (in first
/// declaration order), `initialize_db(db_url)` and an optional trailing block.
///
/// Relationships are buffered per table and written after the table's own
/// fields:
/// - foreign key: forward reference on the referencing table, backward
///   collection on the target
/// - many-to-many: the join table's foreign keys behave as above, and both
///   targets get a `secondary` collection of each other

#include <coframe/core/error.hpp>
#include <coframe/schema/fwd.hpp>

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace coframe_codegen {

// =============================================================================
// GeneratorOptions
// =============================================================================

struct GeneratorOptions {
    std::string project_name = "myapp";
    std::string db_engine = "sqlite:///:memory:";   ///< Default argument of initialize_db
    std::vector<std::string> source_imports;        ///< Root-level extra import lines
    std::string source_add;                         ///< Raw code appended at the end
};

// =============================================================================
// ImportSet
// =============================================================================

/// Import requirements collected while emitting code
class ImportSet {
public:
    /// `import <module>`
    void add_module(const std::string& module);

    /// `from <module> import <name>`
    void add_from(const std::string& module, const std::string& name);

    /// Verbatim import line
    void add_line(const std::string& line);

    /// Deduplicated, sorted import lines
    [[nodiscard]] std::vector<std::string> lines() const;

private:
    std::set<std::string> m_modules;
    std::map<std::string, std::set<std::string>> m_from;
    std::set<std::string> m_lines;
};

// =============================================================================
// Python Formatting
// =============================================================================

/// Render a JSON value as a Python literal (strings quoted and escaped)
[[nodiscard]] std::string python_literal(const coframe_schema::Json& value);

/// Render a column or relation attribute as a Python expression
///
/// Strings are written verbatim: `"datetime.datetime.now"` is a callable
/// default, `"'A'"` a string constant. Everything else goes through
/// python_literal.
[[nodiscard]] std::string python_expression(const coframe_schema::Json& value);

// =============================================================================
// ModelGenerator
// =============================================================================

class ModelGenerator {
public:
    ModelGenerator(const coframe_schema::Schema& schema, GeneratorOptions options = {});

    /// Whole module text
    [[nodiscard]] std::string generate() const;

    /// True when `artifact` is missing or older than the newest plugin file
    [[nodiscard]] bool should_regenerate(const std::filesystem::path& artifact) const;

    /// Generate and write the module, creating parent directories
    [[nodiscard]] coframe_core::Result<void> write(const std::filesystem::path& artifact) const;

    // =========================================================================
    // Pieces (exposed for inspection)
    // =========================================================================

    /// `name: Mapped[T] = mapped_column(...)` for one column
    [[nodiscard]] std::string column_source(const coframe_schema::ColumnDef& column,
                                            ImportSet& imports) const;

    /// `class Name(Base, Mixin):` block without relationships
    [[nodiscard]] std::string table_source(const coframe_schema::TableDef& table,
                                           ImportSet& imports) const;

private:
    struct Relationship {
        std::string name;
        std::string line;
    };

    using RelationshipMap = std::map<std::string, std::vector<Relationship>>;

    void collect_relationships(RelationshipMap& out, ImportSet& imports) const;

    [[nodiscard]] std::string unique_relationship_name(const coframe_schema::TableDef& table,
                                                       const RelationshipMap& taken,
                                                       std::string candidate,
                                                       const std::string& suffix) const;

    const coframe_schema::Schema& m_schema;
    GeneratorOptions m_options;
};

} // namespace coframe_codegen
