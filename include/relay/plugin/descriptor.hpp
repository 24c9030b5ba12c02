#pragma once

/// @file descriptor.hpp
/// @brief Plugin descriptor (plugin.json) parsing
///
/// Each plugin directory carries one descriptor file naming the plugin,
/// its kind, its dependency list and its singleton flag. The remaining
/// sections (settings, interface, actions, features) are kept opaque;
/// only `settings` is surfaced to the plugin's factory.
///
/// Example:
/// @code
/// {
///     "name": "ticket_store",
///     "kind": "utility",
///     "singleton": true,
///     "dependencies": { "utilities": ["logger", "database"] },
///     "settings": { "pool_size": { "type": "integer", "default": 4 } }
/// }
/// @endcode

#include "fwd.hpp"
#include <relay/core/error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace relay_plugin {

/// Name of the per-directory descriptor file
inline constexpr const char* k_descriptor_file_name = "plugin.json";

// =============================================================================
// PluginKind
// =============================================================================

/// Plugin kind
enum class PluginKind : std::uint8_t {
    Utility,  ///< Capability provider consumed by other plugins
    Service,  ///< Long-running plugin consumed by nothing inside the kernel
};

/// Get kind name ("utility" / "service")
[[nodiscard]] const char* plugin_kind_name(PluginKind kind);

/// Parse kind from string, accepting singular and plural forms
[[nodiscard]] std::optional<PluginKind> plugin_kind_from_string(const std::string& str);

// =============================================================================
// PluginDescriptor
// =============================================================================

/// Parsed plugin descriptor
struct PluginDescriptor {
    std::string name;                          ///< Unique plugin key
    PluginKind kind = PluginKind::Utility;
    std::filesystem::path path;                ///< Plugin directory
    std::vector<std::string> dependencies;     ///< Raw dependency names, in declared order
    bool singleton = false;
    bool enabled = true;

    nlohmann::json settings = nlohmann::json::object();   ///< Local settings section
    nlohmann::json interface_spec;                        ///< Opaque
    nlohmann::json actions;                               ///< Opaque
    nlohmann::json features;                              ///< Opaque

    /// Check whether a dependency is declared
    [[nodiscard]] bool depends_on(const std::string& dep) const;

    /// Load a descriptor from a plugin.json file.
    /// `default_kind` applies when the file carries no `kind` field.
    [[nodiscard]] static relay_core::Result<PluginDescriptor> load(
        const std::filesystem::path& path,
        std::optional<PluginKind> default_kind = std::nullopt);

    /// Parse a descriptor from JSON text.
    /// The name defaults to the directory name of `source_path`.
    [[nodiscard]] static relay_core::Result<PluginDescriptor> from_json_string(
        const std::string& json_str,
        const std::filesystem::path& source_path,
        std::optional<PluginKind> default_kind = std::nullopt);
};

/// Check if a path names a descriptor file
[[nodiscard]] bool is_descriptor_path(const std::filesystem::path& path);

} // namespace relay_plugin
