// coframe_plugin merge engine tests

#include <catch2/catch_test_macros.hpp>
#include <coframe/plugin/merge.hpp>
#include <coframe/plugin/loader.hpp>

using namespace coframe_plugin;

namespace {

Node doc(const char* json) {
    return Node::from_json(Json::parse(json));
}

const Node* at(const Node& root, std::initializer_list<const char*> keys) {
    const Node* node = &root;
    for (const char* key : keys) {
        node = node->as_map()->find(key);
        if (!node) {
            return nullptr;
        }
    }
    return node;
}

} // anonymous namespace

TEST_CASE("glob_match", "[plugin][merge]") {
    REQUIRE(glob_match("tables.*.columns", "tables.User.columns"));
    REQUIRE(glob_match("tables.*.columns", "tables.a.b.columns"));
    REQUIRE_FALSE(glob_match("tables.*.columns", "types.User.columns"));
    REQUIRE(glob_match("tables.?ser", "tables.User"));
    REQUIRE_FALSE(glob_match("tables.?", "tables.User"));
    REQUIRE(glob_match("*", ""));
    REQUIRE(glob_match("exact", "exact"));
}

TEST_CASE("MergeEngine maps", "[plugin][merge]") {
    MergeEngine engine;

    REQUIRE(engine.merge_document(doc(R"({"tables": {"User": {"name": "users"}}})"), "users").is_ok());
    REQUIRE(engine.merge_document(doc(R"({"tables": {"Book": {"name": "books"}}})"), "books").is_ok());

    SECTION("disjoint keys are unioned") {
        const Node* tables = at(engine.document(), {"tables"});
        REQUIRE(tables->as_map()->size() == 2);
        REQUIRE(tables->as_map()->keys[0] == "User");
        REQUIRE(tables->as_map()->keys[1] == "Book");
    }

    SECTION("new maps are tagged with their plugin") {
        REQUIRE(at(engine.document(), {"tables", "User"})->provenance() == "users");
        REQUIRE(at(engine.document(), {"tables", "Book"})->provenance() == "books");
    }

    SECTION("history records every touched path") {
        const auto& history = engine.history();
        REQUIRE(history.at("tables") == std::vector<std::string>{"users", "books"});
        REQUIRE(history.at("tables.User") == std::vector<std::string>{"users"});
        REQUIRE(history.at("tables.User.name") == std::vector<std::string>{"users"});
    }
}

TEST_CASE("MergeEngine scalar overrides", "[plugin][merge]") {
    SECTION("later plugin wins by default") {
        MergeEngine engine;
        REQUIRE(engine.merge_document(doc(R"({"settings": {"level": 1}})"), "a").is_ok());
        REQUIRE(engine.merge_document(doc(R"({"settings": {"level": 2}})"), "b").is_ok());

        REQUIRE(at(engine.document(), {"settings", "level"})->as_scalar()->value == 2);
        REQUIRE(engine.history().at("settings.level") == std::vector<std::string>{"a", "b"});
    }

    SECTION("equal values are not a conflict in strict mode") {
        MergeEngine engine(MergeOptions{true});
        REQUIRE(engine.merge_document(doc(R"({"x": "same"})"), "a").is_ok());
        REQUIRE(engine.merge_document(doc(R"({"x": "same"})"), "b").is_ok());
    }

    SECTION("strict mode rejects overrides") {
        MergeEngine engine(MergeOptions{true});
        REQUIRE(engine.merge_document(doc(R"({"settings": {"level": 1}})"), "a").is_ok());

        auto result = engine.merge_document(doc(R"({"settings": {"level": 2}})"), "b");
        REQUIRE(result.is_err());
        const auto* err = result.error().as<coframe_core::MergeError>();
        REQUIRE(err != nullptr);
        REQUIRE(err->kind == coframe_core::MergeError::Kind::ValueOverride);
        REQUIRE(err->path == "settings.level");
        REQUIRE(err->existing_plugin == "a");
        REQUIRE(err->incoming_plugin == "b");
    }
}

TEST_CASE("MergeEngine type conflicts", "[plugin][merge]") {
    MergeEngine engine;
    REQUIRE(engine.merge_document(doc(R"({"tables": {"User": {"tags": ["a"]}}})"), "users").is_ok());

    auto result = engine.merge_document(doc(R"({"tables": {"User": {"tags": {"x": 1}}}})"), "other");
    REQUIRE(result.is_err());
    const auto* err = result.error().as<coframe_core::MergeError>();
    REQUIRE(err != nullptr);
    REQUIRE(err->kind == coframe_core::MergeError::Kind::TypeConflict);
    REQUIRE(err->path == "tables.User.tags");
    REQUIRE(err->existing_plugin == "users");
    REQUIRE(err->incoming_plugin == "other");
    REQUIRE(*result.error().get_context("path") == "tables.User.tags");
}

TEST_CASE("MergeEngine lists", "[plugin][merge]") {
    SECTION("default merge appends structurally new items") {
        MergeEngine engine;
        REQUIRE(engine.merge_document(doc(R"({"tags": ["a", "b"]})"), "p1").is_ok());
        REQUIRE(engine.merge_document(doc(R"({"tags": ["b", "c"]})"), "p2").is_ok());

        const auto& items = at(engine.document(), {"tags"})->as_list()->items;
        REQUIRE(items.size() == 3);
        REQUIRE(items[2].as_scalar()->value == "c");
    }

    SECTION("appended maps are tagged") {
        MergeEngine engine;
        REQUIRE(engine.merge_document(doc(R"({"indexes": [{"cols": ["a"]}]})"), "p1").is_ok());
        REQUIRE(engine.merge_document(doc(R"({"indexes": [{"cols": ["a"]}, {"cols": ["b"]}]})"), "p2").is_ok());

        const auto& items = at(engine.document(), {"indexes"})->as_list()->items;
        REQUIRE(items.size() == 2);
        REQUIRE(items[0].provenance() == "p1");
        REQUIRE(items[1].provenance() == "p2");
    }

    SECTION("custom handler for an exact path") {
        MergeEngine engine;
        engine.register_handler("order", [](ListNode& existing, const ListNode& incoming,
                                            const std::string&, const std::string&, MergeEngine&) {
            existing.items = incoming.items;
            return coframe_core::Ok();
        });

        REQUIRE(engine.merge_document(doc(R"({"order": [1, 2]})"), "p1").is_ok());
        REQUIRE(engine.merge_document(doc(R"({"order": [3]})"), "p2").is_ok());

        const auto& items = at(engine.document(), {"order"})->as_list()->items;
        REQUIRE(items.size() == 1);
        REQUIRE(items[0].as_scalar()->value == 3);
    }

    SECTION("exact registration wins over a pattern") {
        MergeEngine engine;
        int exact_calls = 0;
        engine.register_handler("tables.User.columns",
            [&exact_calls](ListNode&, const ListNode&, const std::string&, const std::string&, MergeEngine&) {
                ++exact_calls;
                return coframe_core::Ok();
            });

        REQUIRE(engine.find_handler("tables.User.columns") != nullptr);
        REQUIRE(engine.find_handler("tables.Book.columns") != nullptr);
        REQUIRE(engine.find_handler("tables.Book.indexes") == nullptr);

        REQUIRE(engine.merge_document(doc(R"({"tables": {"User": {"columns": [{"name": "id"}]}}})"), "p1").is_ok());
        REQUIRE(engine.merge_document(doc(R"({"tables": {"User": {"columns": [{"name": "x"}]}}})"), "p2").is_ok());
        REQUIRE(exact_calls == 1);
    }
}

TEST_CASE("Column lists merge by name", "[plugin][merge]") {
    MergeEngine engine;
    REQUIRE(engine.merge_document(doc(R"({
        "tables": {"User": {"columns": [
            {"name": "id", "type": "Integer"},
            {"name": "email", "type": "String"}
        ]}}
    })"), "users").is_ok());
    REQUIRE(engine.merge_document(doc(R"({
        "tables": {"User": {"columns": [
            {"name": "email", "unique": true},
            {"name": "last_login", "type": "DateTime"}
        ]}}
    })"), "audit").is_ok());

    const auto& columns = at(engine.document(), {"tables", "User", "columns"})->as_list()->items;

    SECTION("same name extends instead of duplicating") {
        REQUIRE(columns.size() == 3);
        const MapNode* email = columns[1].as_map();
        REQUIRE(email->get_string("name") == "email");
        REQUIRE(email->get_string("type") == "String");
        REQUIRE(email->find("unique")->as_scalar()->value == true);
    }

    SECTION("extended column carries the later plugin") {
        REQUIRE(columns[0].provenance() == "users");
        REQUIRE(columns[1].provenance() == "audit");
        REQUIRE(columns[2].provenance() == "audit");
    }

    SECTION("history per column") {
        const auto& history = engine.history();
        REQUIRE(history.at("tables.User.columns[id]") == std::vector<std::string>{"users"});
        REQUIRE(history.at("tables.User.columns[email]") == std::vector<std::string>{"users", "audit"});
        REQUIRE(history.at("tables.User.columns[email].type") == std::vector<std::string>{"users"});
        REQUIRE(history.at("tables.User.columns[email].unique") == std::vector<std::string>{"audit"});
        REQUIRE(history.at("tables.User.columns[last_login]") == std::vector<std::string>{"audit"});
        REQUIRE(history.at("tables.User.columns[last_login].type") == std::vector<std::string>{"audit"});
    }
}

TEST_CASE("Column history names the first declarer", "[plugin][merge]") {
    Plugin core;
    core.manifest.name = "core";
    core.declarations.push_back(doc(R"({"tables": {"User": {"columns": [{"name": "id", "type": "Integer"}]}}})"));

    Plugin audit;
    audit.manifest.name = "audit";
    audit.declarations.push_back(doc(R"({"tables": {"User": {"columns": [{"name": "id", "default": 1}]}}})"));

    auto result = compose_plugins({core, audit});
    REQUIRE(result.is_ok());
    REQUIRE(result->contributors("tables.User.columns[id]") == std::vector<std::string>{"core", "audit"});
    REQUIRE(result->format_history().find("tables.User.columns[id]: defined in [audit, core]\n") != std::string::npos);
}

TEST_CASE("Conflicts inside an extended column name both plugins", "[plugin][merge]") {
    MergeEngine engine;
    REQUIRE(engine.merge_document(doc(R"({"tables": {"User": {"columns": [{"name": "id", "type": "Integer"}]}}})"),
                                  "core").is_ok());

    SECTION("shape mismatch") {
        auto result = engine.merge_document(
            doc(R"({"tables": {"User": {"columns": [{"name": "id", "type": {"x": 1}}]}}})"), "audit");
        REQUIRE(result.is_err());
        const auto* err = result.error().as<coframe_core::MergeError>();
        REQUIRE(err != nullptr);
        REQUIRE(err->kind == coframe_core::MergeError::Kind::TypeConflict);
        REQUIRE(err->path == "tables.User.columns[id].type");
        REQUIRE(err->existing_plugin == "core");
        REQUIRE(err->incoming_plugin == "audit");
    }

    SECTION("strict override") {
        MergeEngine strict(MergeOptions{true});
        REQUIRE(strict.merge_document(doc(R"({"tables": {"User": {"columns": [{"name": "id", "type": "Integer"}]}}})"),
                                      "core").is_ok());
        auto result = strict.merge_document(
            doc(R"({"tables": {"User": {"columns": [{"name": "id", "type": "BigInteger"}]}}})"), "audit");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<coframe_core::MergeError>()->existing_plugin == "core");
    }
}

TEST_CASE("Column merge keeps same-name columns from one document", "[plugin][merge]") {
    MergeEngine engine;
    REQUIRE(engine.merge_document(doc(R"({
        "tables": {"T": {"columns": [{"name": "a"}, {"name": "a", "type": "String"}]}}
    })"), "p").is_ok());

    const auto& columns = at(engine.document(), {"tables", "T", "columns"})->as_list()->items;
    REQUIRE(columns.size() == 2);
}

TEST_CASE("ComposedDocument", "[plugin][merge]") {
    Plugin users;
    users.manifest.name = "users";
    users.declarations.push_back(doc(R"({"tables": {"User": {"name": "users"}}})"));

    Plugin audit;
    audit.manifest.name = "audit";
    audit.declarations.push_back(doc(R"({"tables": {"User": {"label": "Person"}}})"));

    auto result = compose_plugins({users, audit});
    REQUIRE(result.is_ok());
    const ComposedDocument& composed = result.value();

    SECTION("sections") {
        REQUIRE(composed.section("tables") != nullptr);
        REQUIRE(composed.section("types") == nullptr);
    }

    SECTION("contributors in merge order") {
        REQUIRE(composed.contributors("tables.User") == std::vector<std::string>{"users", "audit"});
        REQUIRE(composed.contributors("nope").empty());
    }

    SECTION("history report") {
        std::string report = composed.format_history();
        REQUIRE(report.rfind("Definition History:\n", 0) == 0);
        REQUIRE(report.find("tables.User: defined in [audit, users]\n") != std::string::npos);
    }

    SECTION("JSON dump carries provenance") {
        Json j = composed.to_json();
        REQUIRE(j["tables"]["User"]["_plugin"] == "users");
        REQUIRE(j["tables"]["User"]["label"] == "Person");
    }
}

TEST_CASE("merge_plugin reports the failing file", "[plugin][merge]") {
    Plugin plugin;
    plugin.manifest.name = "bad";
    plugin.declarations.push_back(doc(R"({"x": 1})"));
    plugin.declarations.push_back(doc(R"({"x": [1]})"));
    plugin.declaration_files = {"bad/a.json", "bad/b.json"};

    MergeEngine engine;
    auto result = engine.merge_plugin(plugin);
    REQUIRE(result.is_err());
    REQUIRE(*result.error().get_context("file") == "bad/b.json");
}
