#pragma once

/// @file settings.hpp
/// @brief Application settings (settings.toml)
///
/// All sections and keys are optional:
/// @code
/// [app]
/// plugins_root = "plugins"
///
/// [logging]
/// level = "info"
/// console = true
/// file = false
/// directory = "logs"
///
/// [shutdown]
/// kernel_timeout = 5.0
/// tasks_timeout = 5.0
///
/// [plugins.services]
/// enabled = ["bot_hub"]
///
/// [settings.bot_hub]
/// poll_interval = 2
/// @endcode

#include "fwd.hpp"
#include "descriptor.hpp"
#include "policy.hpp"
#include <relay/core/error.hpp>
#include <relay/core/log.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <map>
#include <string>

namespace relay_plugin {

/// Deadlines of the two shutdown phases
struct ShutdownSettings {
    std::chrono::milliseconds kernel_timeout{5000};
    std::chrono::milliseconds tasks_timeout{5000};
};

/// Parsed application settings
struct AppSettings {
    std::filesystem::path plugins_root = "plugins";
    relay_core::LogConfig logging;
    ShutdownSettings shutdown;
    EnablementPolicy policy;
    std::map<std::string, nlohmann::json> plugin_overrides;  ///< [settings.<plugin>]
    std::filesystem::path source_path;

    /// Load settings from a TOML file
    [[nodiscard]] static relay_core::Result<AppSettings> load(const std::filesystem::path& path);

    /// Parse settings from TOML text
    [[nodiscard]] static relay_core::Result<AppSettings> from_toml_string(
        const std::string& content,
        const std::string& source_name = "settings.toml");

    /// Merge a plugin's descriptor settings with the global overrides.
    /// Global values win; a local value given as {"default": x, ...} yields x.
    [[nodiscard]] nlohmann::json plugin_settings(const PluginDescriptor& descriptor) const;
};

} // namespace relay_plugin
