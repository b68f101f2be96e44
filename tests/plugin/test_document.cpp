// coframe_plugin document tree tests

#include <catch2/catch_test_macros.hpp>
#include <coframe/plugin/document.hpp>

using namespace coframe_plugin;

TEST_CASE("Node from JSON", "[plugin][document]") {
    Json j = Json::parse(R"({
        "tables": {
            "User": {
                "name": "users",
                "columns": [ { "name": "id", "type": "Integer" } ]
            }
        },
        "version": 2
    })");

    Node root = Node::from_json(j);

    SECTION("kinds") {
        REQUIRE(root.is_map());
        const MapNode* map = root.as_map();
        REQUIRE(map->size() == 2);
        REQUIRE(map->find("tables")->is_map());
        REQUIRE(map->find("version")->is_scalar());
        REQUIRE(map->find("missing") == nullptr);
    }

    SECTION("key order is declaration order") {
        const MapNode* map = root.as_map();
        REQUIRE(map->keys[0] == "tables");
        REQUIRE(map->keys[1] == "version");
    }

    SECTION("nested access") {
        const Node* user = root.as_map()->find("tables")->as_map()->find("User");
        REQUIRE(user->as_map()->get_string("name") == "users");
        const Node* columns = user->as_map()->find("columns");
        REQUIRE(columns->is_list());
        REQUIRE(columns->as_list()->items.size() == 1);
    }

    SECTION("round trip without provenance") {
        REQUIRE(root.to_json() == j);
    }
}

TEST_CASE("Node provenance", "[plugin][document]") {
    SECTION("_plugin key becomes provenance") {
        Node node = Node::from_json(Json::parse(R"({"_plugin": "users", "type": "String"})"));
        REQUIRE(node.provenance() == "users");
        REQUIRE(node.as_map()->size() == 1);
        REQUIRE(node.as_map()->find(kProvenanceKey) == nullptr);
    }

    SECTION("to_json emits provenance on request") {
        Node node = Node::from_json(Json::parse(R"({"a": 1})"));
        node.set_provenance("core");
        REQUIRE_FALSE(node.to_json().contains(kProvenanceKey));
        REQUIRE(node.to_json(true)[kProvenanceKey] == "core");
    }

    SECTION("tag_untagged keeps existing tags") {
        Node node = Node::from_json(Json::parse(R"({
            "outer": { "_plugin": "first", "x": 1 },
            "list": [ { "y": 2 }, 3 ]
        })"));
        node.tag_untagged("second");

        REQUIRE(node.provenance() == "second");
        REQUIRE(node.as_map()->find("outer")->provenance() == "first");
        const auto& items = node.as_map()->find("list")->as_list()->items;
        REQUIRE(items[0].provenance() == "second");
        REQUIRE(items[1].provenance().empty());
    }

    SECTION("scalars carry no provenance") {
        Node scalar(ScalarNode{Json(5)});
        scalar.set_provenance("ignored");
        REQUIRE(scalar.provenance().empty());
    }
}

TEST_CASE("Node structural equality", "[plugin][document]") {
    SECTION("ignores provenance") {
        Node a = Node::from_json(Json::parse(R"({"_plugin": "a", "name": "id"})"));
        Node b = Node::from_json(Json::parse(R"({"_plugin": "b", "name": "id"})"));
        REQUIRE(a.structurally_equal(b));
    }

    SECTION("ignores map key order") {
        Node a = Node::from_json(Json::parse(R"({"name": "id", "type": "Integer"})"));
        Node b = Node::from_json(Json::parse(R"({"type": "Integer", "name": "id"})"));
        REQUIRE(a.structurally_equal(b));
    }

    SECTION("list order matters") {
        Node a = Node::from_json(Json::parse("[1, 2]"));
        Node b = Node::from_json(Json::parse("[2, 1]"));
        REQUIRE_FALSE(a.structurally_equal(b));
    }

    SECTION("different kinds") {
        Node a = Node::from_json(Json::parse("[1]"));
        Node b = Node::from_json(Json(1));
        REQUIRE_FALSE(a.structurally_equal(b));
    }
}

TEST_CASE("Node helpers", "[plugin][document]") {
    REQUIRE(std::string(node_kind_name(NodeKind::Map)) == "map");
    REQUIRE(std::string(node_kind_name(NodeKind::List)) == "list");
    REQUIRE(std::string(node_kind_name(NodeKind::Scalar)) == "scalar");

    REQUIRE(scalar_to_string(ScalarNode{Json("text")}) == "text");
    REQUIRE(scalar_to_string(ScalarNode{Json(true)}) == "true");
    REQUIRE(scalar_to_string(ScalarNode{Json(32)}) == "32");
}
