// tableau_core logging tests

#include <catch2/catch.hpp>
#include <tableau_engine/core/log.hpp>

#include <string>

using namespace tableau_core;

TEST_CASE("parse_log_level", "[core][log]") {
    SECTION("canonical names") {
        REQUIRE(parse_log_level("trace") == spdlog::level::trace);
        REQUIRE(parse_log_level("debug") == spdlog::level::debug);
        REQUIRE(parse_log_level("info") == spdlog::level::info);
        REQUIRE(parse_log_level("warn") == spdlog::level::warn);
        REQUIRE(parse_log_level("error") == spdlog::level::err);
        REQUIRE(parse_log_level("critical") == spdlog::level::critical);
        REQUIRE(parse_log_level("off") == spdlog::level::off);
    }

    SECTION("aliases") {
        REQUIRE(parse_log_level("warning") == spdlog::level::warn);
        REQUIRE(parse_log_level("err") == spdlog::level::err);
        REQUIRE(parse_log_level("fatal") == spdlog::level::critical);
    }

    SECTION("unknown") {
        REQUIRE_FALSE(parse_log_level("").has_value());
        REQUIRE_FALSE(parse_log_level("DEBUG").has_value());
        REQUIRE_FALSE(parse_log_level("verbose").has_value());
    }
}

TEST_CASE("log_level_name", "[core][log]") {
    REQUIRE(std::string(log_level_name(spdlog::level::err)) == "error");
    REQUIRE(std::string(log_level_name(spdlog::level::off)) == "off");

    for (auto level : {spdlog::level::trace, spdlog::level::debug, spdlog::level::info,
                       spdlog::level::warn, spdlog::level::err, spdlog::level::critical}) {
        REQUIRE(parse_log_level(log_level_name(level)) == level);
    }
}

TEST_CASE("Named loggers", "[core][log]") {
    LogConfig config;
    config.console_enabled = false;
    config.level = spdlog::level::warn;
    configure_logging(config);

    auto logger = get_logger("tableau_test");
    REQUIRE(logger != nullptr);
    REQUIRE(logger->name() == "tableau_test");
    REQUIRE(get_logger("tableau_test") == logger);
    REQUIRE(logger->level() == spdlog::level::warn);

    SECTION("reconfiguring updates existing loggers") {
        config.level = spdlog::level::trace;
        configure_logging(config);
        REQUIRE(logger->level() == spdlog::level::trace);
    }

    SECTION("module loggers") {
        REQUIRE(scene_logger()->name() == "tableau_scene");
        REQUIRE(compositor_logger()->name() == "tableau_compositor");
    }

    SECTION("shutdown drops named loggers") {
        shutdown_logging();
        REQUIRE(spdlog::get("tableau_test") == nullptr);
        REQUIRE(get_logger("tableau_test") != logger);
    }

    shutdown_logging();
}
