// End-to-end composition tests: plugin tree on disk -> schema -> model module

#include <catch2/catch_test_macros.hpp>
#include <coframe/codegen/generator.hpp>
#include <coframe/plugin/project_config.hpp>
#include <coframe/schema/schema.hpp>
#include "support/fixtures.hpp"

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

coframe_plugin::ProjectConfig load_project(const coframe_test::TempDir& dir, const std::string& toml) {
    auto config = coframe_plugin::ProjectConfig::load(dir.write("coframe.toml", toml));
    REQUIRE(config.is_ok());
    return std::move(config).value();
}

void write_library(const coframe_test::TempDir& dir) {
    dir.write_plugin("core", R"({"name": "core", "version": "1.0.0"})", {
        {"types.json", R"({"types": {
            "ID": {"base": "Integer", "primary_key": true},
            "TimeStamp": {"columns": [{"name": "created_at", "type": "DateTime"}]}
        }})"},
        {"tables.json", R"({"tables": {
            "User": {"name": "users", "columns": [
                {"name": "id", "type": "ID"},
                {"name": "name", "type": "String", "length": 80, "nullable": false}
            ]}
        }})"},
    });
    dir.write_plugin("audit", R"({"name": "audit", "depends_on": ["core"],
                                  "source_imports": ["from .audit import hooks"]})", {
        {"audit.json", R"({"tables": {
            "User": {"columns": [{"name": "created_at", "type": "DateTime"}]}
        }})"},
    });
    dir.write_plugin("books", R"({"name": "books", "depends_on": ["core"]})", {
        {"books.json", R"({"tables": {
            "Book": {"mixins": ["TimeStamp"], "columns": [
                {"name": "id", "type": "ID"},
                {"name": "title", "type": "String", "length": 200},
                {"name": "owner_id", "foreign_key": "User.id"}
            ]},
            "Author": {"columns": [{"name": "id", "type": "ID"}]},
            "BookAuthor": {"many_to_many": {"target1": "Book.id", "target2": "Author.id"}}
        }})"},
    });
}

} // anonymous namespace

TEST_CASE("Plugin tree composes into one schema", "[integration]") {
    coframe_test::TempDir dir;
    write_library(dir);
    auto config = load_project(dir, "[project]\nname = \"library\"\n");

    auto schema = coframe_schema::compose_schema(config);
    REQUIRE(schema.is_ok());

    SECTION("dependencies merge first") {
        REQUIRE(schema->plugins().front().name() == "core");
        REQUIRE(schema->plugins().size() == 3);
    }

    SECTION("tables extended by later plugins") {
        const auto* user = schema->find_table("User");
        REQUIRE(user != nullptr);
        REQUIRE(user->columns.size() == 3);
        REQUIRE(user->columns[2].name == "created_at");
        REQUIRE(user->columns[2].plugin == "audit");
        REQUIRE(user->owning_plugins == std::vector<std::string>{"core", "audit"});
    }

    SECTION("cross-plugin references") {
        const auto* book = schema->find_table("Book");
        REQUIRE(book->find_column("owner_id")->foreign_key->target_table == schema->find_table("User"));
        REQUIRE(book->find_column("created_at")->mixin == "TimeStamp");
        REQUIRE(schema->find_table("BookAuthor")->columns.size() == 2);
    }

    SECTION("history names every contributor") {
        REQUIRE(schema->document().contributors("tables.User") == std::vector<std::string>{"core", "audit"});
    }
}

TEST_CASE("Model module from a plugin tree", "[integration]") {
    coframe_test::TempDir dir;
    write_library(dir);
    auto config = load_project(dir, R"toml(
[project]
name = "library"

[codegen]
output = "out/model.py"
db_engine = "sqlite:///library.db"
)toml");

    auto schema = coframe_schema::compose_schema(config);
    REQUIRE(schema.is_ok());

    coframe_codegen::GeneratorOptions options;
    options.project_name = config.name;
    options.db_engine = config.db_engine;
    options.source_imports = config.source_imports;
    coframe_codegen::ModelGenerator generator(schema.value(), options);

    REQUIRE(generator.should_regenerate(config.output));
    REQUIRE(generator.write(config.output).is_ok());
    REQUIRE_FALSE(generator.should_regenerate(config.output));

    std::string source = coframe_test::read_file(dir.path() / "out" / "model.py");
    REQUIRE(contains(source, "# Model module for project 'library'\n"));
    REQUIRE(contains(source, "from .audit import hooks\n"));
    REQUIRE(contains(source, "class User(Base):\n    __tablename__ = 'users'\n"));
    REQUIRE(contains(source, "class Book(Base, TimeStamp):\n"));
    REQUIRE(contains(source, "    owner_id: Mapped[Optional[int]] = mapped_column(Integer, ForeignKey('users.id'))\n"));
    REQUIRE(contains(source, "def initialize_db(db_url: str = 'sqlite:///library.db'):\n"));
}

TEST_CASE("Pipeline errors", "[integration]") {
    coframe_test::TempDir dir;

    SECTION("strict merge rejects overrides") {
        dir.write_plugin("a", R"({"name": "a"})", {{"t.json", R"({"tables": {"T": {"label": "A"}}})"}});
        dir.write_plugin("b", R"({"name": "b", "depends_on": ["a"]})", {{"t.json", R"({"tables": {"T": {"label": "B"}}})"}});
        auto config = load_project(dir, "[merge]\nstrict = true\n");

        auto schema = coframe_schema::compose_schema(config);
        REQUIRE(schema.is_err());
        REQUIRE(schema.error().code() == coframe_core::ErrorCode::Conflict);
    }

    SECTION("default merge lets the later plugin win") {
        dir.write_plugin("a", R"({"name": "a"})", {{"t.json", R"({"tables": {"T": {"label": "A"}}})"}});
        dir.write_plugin("b", R"({"name": "b", "depends_on": ["a"]})", {{"t.json", R"({"tables": {"T": {"label": "B"}}})"}});
        auto config = load_project(dir, "[project]\nname = \"x\"\n");

        auto schema = coframe_schema::compose_schema(config);
        REQUIRE(schema.is_ok());
        REQUIRE(schema->find_table("T")->attributes["label"] == "B");
    }

    SECTION("dependency cycle") {
        dir.write_plugin("a", R"({"name": "a", "depends_on": ["b"]})");
        dir.write_plugin("b", R"({"name": "b", "depends_on": ["a"]})");
        auto config = load_project(dir, "[project]\nname = \"x\"\n");

        auto schema = coframe_schema::compose_schema(config);
        REQUIRE(schema.is_err());
        REQUIRE(schema.error().code() == coframe_core::ErrorCode::DependencyCycle);
    }

    SECTION("missing dependency") {
        dir.write_plugin("a", R"({"name": "a", "depends_on": ["ghost"]})");
        auto config = load_project(dir, "[project]\nname = \"x\"\n");

        auto schema = coframe_schema::compose_schema(config);
        REQUIRE(schema.is_err());
        REQUIRE(schema.error().code() == coframe_core::ErrorCode::DependencyMissing);
    }

    SECTION("missing plugin directory") {
        auto config = load_project(dir, "[plugins]\npaths = [\"nowhere\"]\n");
        REQUIRE(coframe_schema::compose_schema(config).is_err());
    }
}
