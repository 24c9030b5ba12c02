/// @file settings.cpp
/// @brief Application settings parsing implementation

#include <relay/plugin/settings.hpp>

#include <toml++/toml.hpp>

#include <cmath>
#include <cstdint>
#include <fstream>
#include <set>
#include <sstream>

namespace relay_plugin {

using relay_core::Err;
using relay_core::Error;
using relay_core::KernelError;
using relay_core::Result;

namespace {

/// Convert a TOML node to JSON so plugin settings share one representation
nlohmann::json toml_to_json(const toml::node& node) {
    if (auto tbl = node.as_table()) {
        nlohmann::json obj = nlohmann::json::object();
        for (const auto& [key, value] : *tbl) {
            obj[std::string(key.str())] = toml_to_json(value);
        }
        return obj;
    }
    if (auto arr = node.as_array()) {
        nlohmann::json list = nlohmann::json::array();
        for (const auto& value : *arr) {
            list.push_back(toml_to_json(value));
        }
        return list;
    }
    if (auto str = node.as_string()) {
        return str->get();
    }
    if (auto integer = node.as_integer()) {
        return integer->get();
    }
    if (auto fp = node.as_floating_point()) {
        return fp->get();
    }
    if (auto boolean = node.as_boolean()) {
        return boolean->get();
    }
    // Dates and times are passed through as their TOML text
    std::ostringstream oss;
    if (auto date = node.as_date()) {
        oss << *date;
    } else if (auto time = node.as_time()) {
        oss << *time;
    } else if (auto date_time = node.as_date_time()) {
        oss << *date_time;
    }
    return oss.str();
}

std::set<std::string> read_name_list(const toml::table& tbl, const char* key) {
    std::set<std::string> names;
    if (auto arr = tbl[key].as_array()) {
        for (const auto& entry : *arr) {
            if (auto str = entry.value<std::string>()) {
                names.insert(*str);
            }
        }
    }
    return names;
}

void parse_kind_policy(const toml::table& tbl, KindPolicy& policy) {
    policy.enabled = read_name_list(tbl, "enabled");
    policy.disabled = read_name_list(tbl, "disabled");
    policy.default_enabled = tbl["default_enabled"].value_or(policy.default_enabled);
}

/// Upper bound for a shutdown phase deadline (one day)
constexpr double k_max_timeout_seconds = 86400.0;

Result<std::chrono::milliseconds> read_timeout(
    const toml::table& tbl,
    const char* key,
    std::chrono::milliseconds fallback,
    const std::string& source) {

    auto seconds = tbl[key].value<double>();
    if (!seconds) {
        return fallback;
    }
    if (!std::isfinite(*seconds)) {
        return Err<std::chrono::milliseconds>(Error(KernelError::configuration(
            source, std::string("shutdown.") + key + " must be a finite number")));
    }
    if (*seconds < 0.0) {
        return Err<std::chrono::milliseconds>(Error(KernelError::configuration(
            source, std::string("shutdown.") + key + " must not be negative")));
    }
    if (*seconds > k_max_timeout_seconds) {
        return Err<std::chrono::milliseconds>(Error(KernelError::configuration(
            source, std::string("shutdown.") + key + " must not exceed "
                + std::to_string(static_cast<int>(k_max_timeout_seconds)) + " seconds")));
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(*seconds * 1000.0));
}

} // anonymous namespace

Result<AppSettings> AppSettings::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<AppSettings>(Error(
            KernelError::configuration(path.string(), "failed to open settings file")));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = from_toml_string(buffer.str(), path.string());
    if (result) {
        result->source_path = path;
    }
    return result;
}

Result<AppSettings> AppSettings::from_toml_string(
    const std::string& content,
    const std::string& source_name) {

    AppSettings settings;

    toml::table tbl;
    try {
        tbl = toml::parse(content, source_name);
    } catch (const toml::parse_error& err) {
        return Err<AppSettings>(Error(KernelError::configuration(
            source_name, "TOML parse error: " + std::string(err.description()))));
    }

    // [app]
    if (auto app = tbl["app"].as_table()) {
        if (auto root = (*app)["plugins_root"].value<std::string>()) {
            settings.plugins_root = *root;
        }
    }

    // [logging]
    if (auto logging = tbl["logging"].as_table()) {
        auto& log = settings.logging;
        if (auto level_str = (*logging)["level"].value<std::string>()) {
            auto level = relay_core::parse_log_level(*level_str);
            if (!level) {
                return Err<AppSettings>(Error(KernelError::configuration(
                    source_name, "unknown log level: " + *level_str)));
            }
            log.level = *level;
        }
        log.console_enabled = (*logging)["console"].value_or(log.console_enabled);
        log.file_enabled = (*logging)["file"].value_or(log.file_enabled);
        if (auto dir = (*logging)["directory"].value<std::string>()) {
            log.log_directory = *dir;
        }
        if (auto size = (*logging)["max_file_size"].value<std::int64_t>(); size && *size > 0) {
            log.max_file_size = static_cast<std::size_t>(*size);
        }
        if (auto files = (*logging)["max_files"].value<std::int64_t>(); files && *files > 0) {
            log.max_files = static_cast<std::size_t>(*files);
        }
    }

    // [shutdown]
    if (auto shutdown = tbl["shutdown"].as_table()) {
        auto kernel = read_timeout(*shutdown, "kernel_timeout", settings.shutdown.kernel_timeout, source_name);
        if (!kernel) {
            return Err<AppSettings>(kernel.error());
        }
        auto tasks = read_timeout(*shutdown, "tasks_timeout", settings.shutdown.tasks_timeout, source_name);
        if (!tasks) {
            return Err<AppSettings>(tasks.error());
        }
        settings.shutdown.kernel_timeout = *kernel;
        settings.shutdown.tasks_timeout = *tasks;
    }

    // [plugins.services] / [plugins.utilities]
    if (auto plugins = tbl["plugins"].as_table()) {
        if (auto services = (*plugins)["services"].as_table()) {
            parse_kind_policy(*services, settings.policy.services);
        }
        if (auto utilities = (*plugins)["utilities"].as_table()) {
            parse_kind_policy(*utilities, settings.policy.utilities);
        }
    }

    // [settings.<plugin>]
    if (auto overrides = tbl["settings"].as_table()) {
        for (const auto& [key, value] : *overrides) {
            if (!value.is_table()) {
                return Err<AppSettings>(Error(KernelError::configuration(
                    source_name, "settings." + std::string(key.str()) + " must be a table")));
            }
            settings.plugin_overrides[std::string(key.str())] = toml_to_json(value);
        }
    }

    return settings;
}

nlohmann::json AppSettings::plugin_settings(const PluginDescriptor& descriptor) const {
    nlohmann::json merged = nlohmann::json::object();

    if (descriptor.settings.is_object()) {
        for (const auto& [key, value] : descriptor.settings.items()) {
            if (value.is_object() && value.contains("default")) {
                merged[key] = value["default"];
            } else {
                merged[key] = value;
            }
        }
    }

    auto it = plugin_overrides.find(descriptor.name);
    if (it != plugin_overrides.end()) {
        for (const auto& [key, value] : it->second.items()) {
            merged[key] = value;
        }
    }

    return merged;
}

} // namespace relay_plugin
