// coframe_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <coframe/core/log.hpp>
#include "support/fixtures.hpp"

using namespace coframe_core;

TEST_CASE("Log level parsing", "[core][log]") {
    SECTION("known names") {
        REQUIRE(parse_log_level("trace") == spdlog::level::trace);
        REQUIRE(parse_log_level("debug") == spdlog::level::debug);
        REQUIRE(parse_log_level("info") == spdlog::level::info);
        REQUIRE(parse_log_level("warning") == spdlog::level::warn);
        REQUIRE(parse_log_level("error") == spdlog::level::err);
        REQUIRE(parse_log_level("off") == spdlog::level::off);
    }

    SECTION("unknown name") {
        REQUIRE_FALSE(parse_log_level("loud").has_value());
    }

    SECTION("names round trip") {
        for (auto level : {spdlog::level::trace, spdlog::level::debug, spdlog::level::info,
                           spdlog::level::warn, spdlog::level::err, spdlog::level::critical}) {
            REQUIRE(parse_log_level(log_level_name(level)) == level);
        }
    }
}

TEST_CASE("Named loggers", "[core][log]") {
    SECTION("same name, same logger") {
        REQUIRE(get_logger("test_named") == get_logger("test_named"));
    }

    SECTION("subsystem loggers") {
        REQUIRE(plugin_logger()->name() == "plugins");
        REQUIRE(merge_logger()->name() == "merge");
        REQUIRE(schema_logger()->name() == "schema");
        REQUIRE(codegen_logger()->name() == "codegen");
    }
}

TEST_CASE("File sink", "[core][log]") {
    coframe_test::TempDir dir;
    auto log_file = dir.path() / "coframe.log";

    LogConfig config;
    config.console_enabled = false;
    config.log_file = log_file.string();
    config.level = spdlog::level::debug;
    configure_logging(config);

    REQUIRE(get_global_log_level() == spdlog::level::debug);

    auto logger = get_logger("test_file");
    logger->debug("composed {} plugins", 3);
    logger->trace("not written");
    flush_all_loggers();

    std::string content = coframe_test::read_file(log_file);
    REQUIRE(content.find("test_file|debug|composed 3 plugins") != std::string::npos);
    REQUIRE(content.find("not written") == std::string::npos);

    configure_logging(LogConfig{});
    REQUIRE(get_global_log_level() == spdlog::level::info);
}

TEST_CASE("Nested log scopes in one block", "[core][log]") {
    coframe_test::TempDir dir;
    auto log_file = dir.path() / "scopes.log";

    LogConfig config;
    config.console_enabled = false;
    config.log_file = log_file.string();
    config.level = spdlog::level::trace;
    configure_logging(config);

    {
        COFRAME_LOG_SCOPE("compose", "scopes");
        COFRAME_LOG_SCOPE("merge", "scopes");
    }
    flush_all_loggers();

    std::string content = coframe_test::read_file(log_file);
    auto enter_compose = content.find(">>> Entering compose");
    auto enter_merge = content.find(">>> Entering merge");
    auto exit_merge = content.find("<<< Exiting merge");
    auto exit_compose = content.find("<<< Exiting compose");
    REQUIRE(enter_compose != std::string::npos);
    REQUIRE(exit_compose != std::string::npos);
    REQUIRE(enter_compose < enter_merge);
    REQUIRE(enter_merge < exit_merge);
    REQUIRE(exit_merge < exit_compose);

    configure_logging(LogConfig{});
}
