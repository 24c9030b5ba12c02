// relay_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <relay/core/log.hpp>
#include <string>

using namespace relay_core;

TEST_CASE("Log level parsing", "[core][log]") {
    REQUIRE(parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("error") == spdlog::level::err);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE_FALSE(parse_log_level("loud").has_value());

    REQUIRE(std::string(log_level_name(spdlog::level::err)) == "error");
    REQUIRE(std::string(log_level_name(spdlog::level::warn)) == "warn");
}

TEST_CASE("Named loggers", "[core][log]") {
    SECTION("same name yields same logger") {
        auto a = get_logger("test.named");
        auto b = get_logger("test.named");
        REQUIRE(a == b);
        REQUIRE(a->name() == "test.named");
    }

    SECTION("subsystem loggers") {
        REQUIRE(host_logger()->name() == "relay");
        REQUIRE(kernel_logger()->name() == "kernel");
        REQUIRE(plugin_logger()->name() == "plugins");
    }
}

TEST_CASE("Child loggers", "[core][log]") {
    auto parent = get_logger("test.parent");

    SECTION("named after parent and scope") {
        auto child = child_logger(parent, "ticket_store");
        REQUIRE(child->name() == "test.parent.ticket_store");
        REQUIRE(child_logger(parent, "ticket_store") == child);
    }

    SECTION("shares parent sinks") {
        auto child = child_logger(parent, "sinks");
        REQUIRE(child->sinks().size() == parent->sinks().size());
        for (std::size_t i = 0; i < child->sinks().size(); ++i) {
            REQUIRE(child->sinks()[i] == parent->sinks()[i]);
        }
    }

    SECTION("inherits parent level") {
        parent->set_level(spdlog::level::err);
        auto child = child_logger(parent, "level");
        REQUIRE(child->level() == spdlog::level::err);
        parent->set_level(spdlog::level::info);
    }

    SECTION("null parent falls back to a named logger") {
        auto orphan = child_logger(nullptr, "test.orphan");
        REQUIRE(orphan->name() == "test.orphan");
    }
}

TEST_CASE("Global log level", "[core][log]") {
    auto previous = get_global_log_level();

    set_global_log_level(spdlog::level::warn);
    REQUIRE(get_global_log_level() == spdlog::level::warn);
    REQUIRE(get_logger("test.global")->level() == spdlog::level::warn);

    set_global_log_level(previous);
    REQUIRE(get_logger("test.global")->level() == previous);
}
