// relay_kernel component registry tests

#include <catch2/catch_test_macros.hpp>
#include <relay/core/log.hpp>
#include <relay/kernel/component_registry.hpp>

using namespace relay_kernel;
using relay_core::ErrorCode;

namespace {

class Tagged : public Component {
public:
    explicit Tagged(const Dependencies& deps) : tag(deps.plugin_name()) {}
    std::string tag;
};

ComponentFactory tagged_factory(std::string label) {
    return [label](const Dependencies&) -> std::shared_ptr<Component> {
        auto component = std::make_shared<Tagged>(Dependencies(label));
        return component;
    };
}

std::string tag_of(const ComponentFactory& factory) {
    auto component = std::dynamic_pointer_cast<Tagged>(factory(Dependencies("caller")));
    return component ? component->tag : std::string();
}

} // anonymous namespace

RELAY_REGISTER_COMPONENT("static_tagged", Tagged)

TEST_CASE("Component name normalization", "[kernel][registry]") {
    REQUIRE(normalize_component_name("Ticket_Store") == "ticketstore");
    REQUIRE(normalize_component_name("ticket-store.v2") == "ticketstorev2");
    REQUIRE(normalize_component_name("") == "");
}

TEST_CASE("ComponentRegistry registration", "[kernel][registry]") {
    ComponentRegistry registry;
    REQUIRE(registry.empty());

    SECTION("register and find") {
        REQUIRE(registry.register_factory("store", tagged_factory("store")).is_ok());
        REQUIRE(registry.has("store"));
        REQUIRE(registry.size() == 1);
        REQUIRE(tag_of(registry.find("store")) == "store");
        REQUIRE_FALSE(registry.find("absent"));
    }

    SECTION("duplicate names are rejected") {
        REQUIRE(registry.register_factory("store", tagged_factory("first")).is_ok());
        auto again = registry.register_factory("store", tagged_factory("second"));
        REQUIRE(again.is_err());
        REQUIRE(again.error().code() == ErrorCode::AlreadyExists);
        REQUIRE(tag_of(registry.find("store")) == "first");
    }

    SECTION("empty name or callable") {
        REQUIRE(registry.register_factory("", tagged_factory("x")).error().code() == ErrorCode::InvalidArgument);
        REQUIRE(registry.register_factory("x", ComponentFactory{}).error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("unregister and clear") {
        REQUIRE(registry.register_factory("a", tagged_factory("a")).is_ok());
        REQUIRE(registry.register_factory("b", tagged_factory("b")).is_ok());
        REQUIRE(registry.unregister("a"));
        REQUIRE_FALSE(registry.unregister("a"));
        REQUIRE(registry.names() == std::vector<std::string>{"b"});
        registry.clear();
        REQUIRE(registry.empty());
    }
}

TEST_CASE("ComponentRegistry resolution", "[kernel][registry]") {
    ComponentRegistry registry;

    SECTION("empty table") {
        auto result = registry.resolve("store");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::NotFound);
    }

    REQUIRE(registry.register_factory("FirstComponent", tagged_factory("first")).is_ok());
    REQUIRE(registry.register_factory("Ticket_Store", tagged_factory("ticket")).is_ok());
    REQUIRE(registry.register_factory("ticket_store", tagged_factory("exact")).is_ok());

    SECTION("exact name wins") {
        REQUIRE(tag_of(registry.resolve("ticket_store").value()) == "exact");
    }

    SECTION("normalized name in registration order") {
        REQUIRE(tag_of(registry.resolve("ticket-store").value()) == "ticket");
    }

    SECTION("falls back to the first registered factory") {
        REQUIRE(tag_of(registry.resolve("unrelated").value()) == "first");
    }

    SECTION("names keep registration order") {
        REQUIRE(registry.names() == (std::vector<std::string>{"FirstComponent", "Ticket_Store", "ticket_store"}));
    }
}

TEST_CASE("Static registration macro", "[kernel][registry]") {
    auto& global = global_component_registry();
    REQUIRE(global.has("static_tagged"));

    auto factory = global.find("static_tagged");
    auto component = std::dynamic_pointer_cast<Tagged>(factory(Dependencies("static_tagged")));
    REQUIRE(component);
    REQUIRE(component->tag == "static_tagged");
}

TEST_CASE("Logged registration reports duplicates", "[kernel][registry]") {
    ComponentRegistry registry;
    REQUIRE(detail::register_factory_logged(registry, "store", tagged_factory("first")));
    REQUIRE_FALSE(detail::register_factory_logged(registry, "store", tagged_factory("second")));
    REQUIRE_FALSE(detail::register_factory_logged(registry, "", tagged_factory("empty")));

    REQUIRE(registry.size() == 1);
    REQUIRE(tag_of(registry.find("store")) == "first");
}

TEST_CASE("Dependencies container", "[kernel][component]") {
    Dependencies deps("bot_hub", {{"poll_interval", 2}});
    REQUIRE(deps.plugin_name() == "bot_hub");
    REQUIRE(deps.settings()["poll_interval"] == 2);
    REQUIRE(deps.size() == 0);

    auto tagged = std::make_shared<Tagged>(Dependencies("db"));
    deps.set("db", tagged);

    REQUIRE(deps.has("db"));
    REQUIRE_FALSE(deps.has("cache"));
    REQUIRE(deps.get("db") == tagged);
    REQUIRE(deps.get<Tagged>("db") == tagged);
    REQUIRE(deps.get<LoggerComponent>("db") == nullptr);
    REQUIRE(deps.get("cache") == nullptr);
    REQUIRE(deps.names() == std::vector<std::string>{"db"});

    SECTION("logger falls back to a kernel child logger") {
        REQUIRE(deps.logger()->name() == "kernel.bot_hub");
    }

    SECTION("injected logger is preferred") {
        auto logger = relay_core::get_logger("test.injected");
        deps.set("logger", std::make_shared<LoggerComponent>(logger));
        REQUIRE(deps.logger() == logger);
    }
}

TEST_CASE("StopToken", "[kernel][component]") {
    SECTION("default token never stops") {
        StopToken token;
        REQUIRE_FALSE(token.stop_possible());
        REQUIRE_FALSE(token.stop_requested());
        REQUIRE_FALSE(token.wait_for(std::chrono::milliseconds(1)));
    }

    SECTION("copies share state") {
        auto token = StopToken::create();
        StopToken copy = token;
        REQUIRE(token.stop_possible());
        REQUIRE_FALSE(copy.wait_for(std::chrono::milliseconds(1)));

        token.request_stop();
        REQUIRE(copy.stop_requested());
        REQUIRE(copy.wait_for(std::chrono::milliseconds(1)));
    }
}
