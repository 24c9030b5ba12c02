/// @file descriptor.cpp
/// @brief Plugin descriptor parsing implementation

#include <relay/plugin/descriptor.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace relay_plugin {

using relay_core::Err;
using relay_core::Error;
using relay_core::KernelError;
using relay_core::Result;

// =============================================================================
// PluginKind
// =============================================================================

const char* plugin_kind_name(PluginKind kind) {
    switch (kind) {
        case PluginKind::Utility: return "utility";
        case PluginKind::Service: return "service";
        default: return "unknown";
    }
}

std::optional<PluginKind> plugin_kind_from_string(const std::string& str) {
    if (str == "utility" || str == "utilities") return PluginKind::Utility;
    if (str == "service" || str == "services") return PluginKind::Service;
    return std::nullopt;
}

// =============================================================================
// PluginDescriptor
// =============================================================================

bool PluginDescriptor::depends_on(const std::string& dep) const {
    return std::find(dependencies.begin(), dependencies.end(), dep) != dependencies.end();
}

Result<PluginDescriptor> PluginDescriptor::load(
    const std::filesystem::path& path,
    std::optional<PluginKind> default_kind) {

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Err<PluginDescriptor>(Error(
            KernelError::configuration(path.string(), "descriptor file not found")));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<PluginDescriptor>(Error(
            KernelError::configuration(path.string(), "failed to open descriptor file")));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return from_json_string(buffer.str(), path, default_kind);
}

namespace {

/// Parse the dependency section: {"utilities": [...]} or a flat array
Result<std::vector<std::string>> parse_dependencies(
    const nlohmann::json& node,
    const std::string& source) {

    std::vector<std::string> deps;

    const nlohmann::json* list = nullptr;
    if (node.is_array()) {
        list = &node;
    } else if (node.is_object()) {
        if (!node.contains("utilities")) {
            return deps;
        }
        list = &node["utilities"];
        if (!list->is_array()) {
            return Err<std::vector<std::string>>(Error(
                KernelError::configuration(source, "'dependencies.utilities' must be an array")));
        }
    } else if (node.is_null()) {
        return deps;
    } else {
        return Err<std::vector<std::string>>(Error(
            KernelError::configuration(source, "'dependencies' must be an object or an array")));
    }

    for (const auto& entry : *list) {
        if (!entry.is_string()) {
            return Err<std::vector<std::string>>(Error(
                KernelError::configuration(source, "dependency names must be strings")));
        }
        auto name = entry.get<std::string>();
        // Duplicates collapse to the first declaration
        if (std::find(deps.begin(), deps.end(), name) == deps.end()) {
            deps.push_back(std::move(name));
        }
    }

    return deps;
}

} // anonymous namespace

Result<PluginDescriptor> PluginDescriptor::from_json_string(
    const std::string& json_str,
    const std::filesystem::path& source_path,
    std::optional<PluginKind> default_kind) {

    const std::string source = source_path.string();

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return Err<PluginDescriptor>(Error(
            KernelError::configuration(source, std::string("JSON parse error: ") + e.what())));
    }

    if (!j.is_object()) {
        return Err<PluginDescriptor>(Error(
            KernelError::configuration(source, "descriptor root must be an object")));
    }

    PluginDescriptor desc;
    desc.path = source_path.parent_path();

    // Name (defaults to the directory name)
    if (j.contains("name")) {
        if (!j["name"].is_string() || j["name"].get<std::string>().empty()) {
            return Err<PluginDescriptor>(Error(
                KernelError::configuration(source, "'name' must be a non-empty string")));
        }
        desc.name = j["name"].get<std::string>();
    } else {
        desc.name = desc.path.filename().string();
    }

    if (desc.name.empty()) {
        return Err<PluginDescriptor>(Error(
            KernelError::configuration(source, "plugin name could not be determined")));
    }

    // Kind (explicit field wins over the subtree it was found in)
    if (j.contains("kind")) {
        if (!j["kind"].is_string()) {
            return Err<PluginDescriptor>(Error(
                KernelError::configuration(source, "'kind' must be a string")));
        }
        auto kind_str = j["kind"].get<std::string>();
        auto kind = plugin_kind_from_string(kind_str);
        if (!kind) {
            return Err<PluginDescriptor>(Error(
                KernelError::configuration(source, "unknown plugin kind: " + kind_str)));
        }
        desc.kind = *kind;
    } else if (default_kind) {
        desc.kind = *default_kind;
    } else {
        return Err<PluginDescriptor>(Error(
            KernelError::configuration(source, "missing 'kind' outside utilities/ or services/")));
    }

    if (j.contains("enabled")) {
        if (!j["enabled"].is_boolean()) {
            return Err<PluginDescriptor>(Error(
                KernelError::configuration(source, "'enabled' must be a boolean")));
        }
        desc.enabled = j["enabled"].get<bool>();
    }

    if (j.contains("singleton")) {
        if (!j["singleton"].is_boolean()) {
            return Err<PluginDescriptor>(Error(
                KernelError::configuration(source, "'singleton' must be a boolean")));
        }
        desc.singleton = j["singleton"].get<bool>();
    }

    if (j.contains("dependencies")) {
        auto deps = parse_dependencies(j["dependencies"], source);
        if (!deps) {
            return Err<PluginDescriptor>(deps.error());
        }
        desc.dependencies = std::move(deps).value();
    }

    if (j.contains("settings") && j["settings"].is_object()) {
        desc.settings = j["settings"];
    }
    if (j.contains("interface")) {
        desc.interface_spec = j["interface"];
    }
    if (j.contains("actions")) {
        desc.actions = j["actions"];
    }
    if (j.contains("features")) {
        desc.features = j["features"];
    }

    return desc;
}

bool is_descriptor_path(const std::filesystem::path& path) {
    return path.filename() == k_descriptor_file_name;
}

} // namespace relay_plugin
