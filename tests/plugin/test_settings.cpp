// relay_plugin settings tests

#include <catch2/catch_test_macros.hpp>
#include <relay/plugin/settings.hpp>

#include "../support/plugin_tree.hpp"

using namespace relay_plugin;
using namespace std::chrono_literals;
using relay_core::KernelError;

TEST_CASE("Settings defaults", "[plugin][settings]") {
    auto result = AppSettings::from_toml_string("");
    REQUIRE(result.is_ok());

    const auto& settings = result.value();
    REQUIRE(settings.plugins_root == "plugins");
    REQUIRE(settings.logging.level == spdlog::level::info);
    REQUIRE(settings.logging.console_enabled);
    REQUIRE_FALSE(settings.logging.file_enabled);
    REQUIRE(settings.shutdown.kernel_timeout == 5000ms);
    REQUIRE(settings.shutdown.tasks_timeout == 5000ms);
    REQUIRE_FALSE(settings.policy.services.default_enabled);
    REQUIRE(settings.policy.utilities.default_enabled);
    REQUIRE(settings.plugin_overrides.empty());
}

TEST_CASE("Settings sections", "[plugin][settings]") {
    auto result = AppSettings::from_toml_string(R"(
[app]
plugins_root = "/srv/relay/plugins"

[logging]
level = "debug"
console = false
file = true
directory = "logs"
max_files = 3

[shutdown]
kernel_timeout = 1.5
tasks_timeout = 2

[plugins.services]
enabled = ["bot_hub", "reporter"]
disabled = ["reporter"]

[plugins.utilities]
disabled = ["metrics"]
default_enabled = true

[settings.bot_hub]
poll_interval = 3
name = "hub"

[settings.bot_hub.limits]
burst = [1, 2]
)");
    REQUIRE(result.is_ok());
    const auto& settings = result.value();

    REQUIRE(settings.plugins_root == "/srv/relay/plugins");

    REQUIRE(settings.logging.level == spdlog::level::debug);
    REQUIRE_FALSE(settings.logging.console_enabled);
    REQUIRE(settings.logging.file_enabled);
    REQUIRE(settings.logging.log_directory == "logs");
    REQUIRE(settings.logging.max_files == 3);

    REQUIRE(settings.shutdown.kernel_timeout == 1500ms);
    REQUIRE(settings.shutdown.tasks_timeout == 2000ms);

    REQUIRE(settings.policy.is_enabled("bot_hub", PluginKind::Service));
    REQUIRE_FALSE(settings.policy.is_enabled("reporter", PluginKind::Service));
    REQUIRE_FALSE(settings.policy.is_enabled("other", PluginKind::Service));
    REQUIRE_FALSE(settings.policy.is_enabled("metrics", PluginKind::Utility));
    REQUIRE(settings.policy.is_enabled("database", PluginKind::Utility));

    const auto& hub = settings.plugin_overrides.at("bot_hub");
    REQUIRE(hub["poll_interval"] == 3);
    REQUIRE(hub["name"] == "hub");
    REQUIRE(hub["limits"]["burst"].size() == 2);
}

TEST_CASE("Settings validation", "[plugin][settings]") {
    auto expect_configuration_error = [](const std::string& toml) {
        auto result = AppSettings::from_toml_string(toml);
        REQUIRE(result.is_err());
        REQUIRE(result.error().is_kind(KernelError::Kind::Configuration));
    };

    SECTION("malformed TOML") { expect_configuration_error("[app\nplugins_root = "); }
    SECTION("unknown log level") { expect_configuration_error("[logging]\nlevel = \"loud\"\n"); }
    SECTION("negative timeout") { expect_configuration_error("[shutdown]\nkernel_timeout = -1.0\n"); }
    SECTION("infinite timeout") { expect_configuration_error("[shutdown]\nkernel_timeout = inf\n"); }
    SECTION("NaN timeout") { expect_configuration_error("[shutdown]\ntasks_timeout = nan\n"); }
    SECTION("timeout beyond one day") { expect_configuration_error("[shutdown]\nkernel_timeout = 1e20\n"); }
    SECTION("non-table plugin settings") { expect_configuration_error("[settings]\nbot_hub = 3\n"); }
}

TEST_CASE("Settings timeout bounds", "[plugin][settings]") {
    auto result = AppSettings::from_toml_string("[shutdown]\nkernel_timeout = 86400.0\ntasks_timeout = 0.25\n");
    REQUIRE(result.is_ok());
    REQUIRE(result->shutdown.kernel_timeout == std::chrono::hours(24));
    REQUIRE(result->shutdown.tasks_timeout == std::chrono::milliseconds(250));
}

TEST_CASE("Settings loading from disk", "[plugin][settings]") {
    relay_test::PluginTree tree;

    SECTION("existing file records its path") {
        auto path = tree.write_file("config/settings.toml", "[app]\nplugins_root = \"p\"\n");
        auto result = AppSettings::load(path);
        REQUIRE(result.is_ok());
        REQUIRE(result->plugins_root == "p");
        REQUIRE(result->source_path == path);
    }

    SECTION("missing file") {
        auto result = AppSettings::load(tree.root() / "absent.toml");
        REQUIRE(result.is_err());
    }
}

TEST_CASE("Plugin settings merge", "[plugin][settings]") {
    PluginDescriptor desc;
    desc.name = "bot_hub";
    desc.kind = PluginKind::Service;
    desc.settings = {
        {"poll_interval", {{"type", "integer"}, {"default", 5}}},
        {"greeting", "hello"},
        {"retries", 2},
    };

    AppSettings settings;

    SECTION("local defaults are unwrapped") {
        auto merged = settings.plugin_settings(desc);
        REQUIRE(merged["poll_interval"] == 5);
        REQUIRE(merged["greeting"] == "hello");
        REQUIRE(merged["retries"] == 2);
    }

    SECTION("global overrides win") {
        settings.plugin_overrides["bot_hub"] = {{"poll_interval", 1}, {"token", "abc"}};

        auto merged = settings.plugin_settings(desc);
        REQUIRE(merged["poll_interval"] == 1);
        REQUIRE(merged["token"] == "abc");
        REQUIRE(merged["greeting"] == "hello");
    }

    SECTION("overrides for other plugins are ignored") {
        settings.plugin_overrides["reporter"] = {{"greeting", "bye"}};
        REQUIRE(settings.plugin_settings(desc)["greeting"] == "hello");
    }
}
