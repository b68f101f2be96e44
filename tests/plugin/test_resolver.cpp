// coframe_plugin dependency sorter tests

#include <catch2/catch_test_macros.hpp>
#include <coframe/plugin/resolver.hpp>
#include <coframe/plugin/loader.hpp>

#include <algorithm>

using namespace coframe_plugin;

namespace {

std::size_t position(const std::vector<std::string>& order, const std::string& name) {
    return static_cast<std::size_t>(std::find(order.begin(), order.end(), name) - order.begin());
}

Plugin make_plugin(const std::string& name, std::set<std::string> deps = {}) {
    Plugin plugin;
    plugin.manifest.name = name;
    plugin.manifest.depends_on = std::move(deps);
    return plugin;
}

} // anonymous namespace

TEST_CASE("DependencySorter ordering", "[plugin][resolver]") {
    DependencySorter sorter;

    SECTION("dependencies come first") {
        sorter.add("library", {"books", "users"});
        sorter.add("books", {"common"});
        sorter.add("users", {"common"});
        sorter.add("common", {});

        auto result = sorter.sort();
        REQUIRE(result.is_ok());
        const auto& order = result.value();
        REQUIRE(order.size() == 4);
        REQUIRE(order.front() == "common");
        REQUIRE(position(order, "books") < position(order, "library"));
        REQUIRE(position(order, "users") < position(order, "library"));
    }

    SECTION("ties broken by discovery order") {
        sorter.add("zeta", {});
        sorter.add("alpha", {});
        sorter.add("mid", {});

        auto result = sorter.sort();
        REQUIRE(result.is_ok());
        REQUIRE(result.value() == std::vector<std::string>{"zeta", "alpha", "mid"});
    }

    SECTION("dependents freed in discovery order") {
        sorter.add("base", {});
        sorter.add("second", {"base"});
        sorter.add("first", {"base"});

        auto result = sorter.sort();
        REQUIRE(result.is_ok());
        REQUIRE(result.value() == std::vector<std::string>{"base", "second", "first"});
    }

    SECTION("empty graph") {
        auto result = sorter.sort();
        REQUIRE(result.is_ok());
        REQUIRE(result.value().empty());
    }
}

TEST_CASE("DependencySorter errors", "[plugin][resolver]") {
    DependencySorter sorter;

    SECTION("unknown dependency lists missing names per plugin") {
        sorter.add("books", {"users", "authors"});
        sorter.add("users", {});
        sorter.add("shop", {"payments"});

        auto result = sorter.sort();
        REQUIRE(result.is_err());
        const auto* err = result.error().as<coframe_core::PluginError>();
        REQUIRE(err != nullptr);
        REQUIRE(err->kind == coframe_core::PluginError::Kind::UnknownDependency);
        REQUIRE(err->detail == "books -> [authors]; shop -> [payments]");
    }

    SECTION("cycle reports exactly the cyclic members") {
        sorter.add("a", {"b"});
        sorter.add("b", {"c"});
        sorter.add("c", {"a"});
        sorter.add("d", {"a"});
        sorter.add("e", {});

        auto result = sorter.sort();
        REQUIRE(result.is_err());
        const auto* err = result.error().as<coframe_core::PluginError>();
        REQUIRE(err != nullptr);
        REQUIRE(err->kind == coframe_core::PluginError::Kind::CircularDependency);
        REQUIRE(err->detail == "a, b, c");
        REQUIRE(*result.error().get_context("unresolved") == "a, b, c, d");
    }

    SECTION("self dependency is a cycle") {
        sorter.add("narcissus", {"narcissus"});

        auto result = sorter.sort();
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == coframe_core::ErrorCode::DependencyCycle);
        REQUIRE(sorter.cyclic_members() == std::vector<std::string>{"narcissus"});
    }
}

TEST_CASE("DependencySorter queries", "[plugin][resolver]") {
    DependencySorter sorter;
    sorter.add("core", {});
    sorter.add("users", {"core"});
    sorter.add("books", {"core"});

    REQUIRE(sorter.size() == 3);
    REQUIRE(sorter.has("users"));
    REQUIRE_FALSE(sorter.has("payments"));
    REQUIRE(sorter.dependents_of("core") == std::vector<std::string>{"users", "books"});
    REQUIRE(sorter.cyclic_members().empty());

    std::string dot = sorter.to_dot_graph();
    REQUIRE(dot.find("digraph plugins") != std::string::npos);
    REQUIRE(dot.find("\"users\" -> \"core\"") != std::string::npos);

    sorter.clear();
    REQUIRE(sorter.size() == 0);
}

TEST_CASE("sort_plugins", "[plugin][resolver]") {
    std::vector<Plugin> plugins;
    plugins.push_back(make_plugin("library", {"books"}));
    plugins.push_back(make_plugin("books", {"users"}));
    plugins.push_back(make_plugin("users"));

    auto result = sort_plugins(std::move(plugins));
    REQUIRE(result.is_ok());
    REQUIRE(result->size() == 3);
    REQUIRE((*result)[0].name() == "users");
    REQUIRE((*result)[1].name() == "books");
    REQUIRE((*result)[2].name() == "library");
}
