#pragma once

/// @file policy.hpp
/// @brief Per-kind plugin enablement policy

#include "fwd.hpp"
#include "descriptor.hpp"

#include <set>
#include <string>

namespace relay_plugin {

/// Enablement rules for one plugin kind.
/// Precedence: disabled list > enabled list > default.
struct KindPolicy {
    std::set<std::string> disabled;
    std::set<std::string> enabled;
    bool default_enabled = false;

    [[nodiscard]] bool allows(const std::string& name) const {
        if (disabled.count(name)) return false;
        if (enabled.count(name)) return true;
        return default_enabled;
    }
};

/// Enablement rules for services and utilities
struct EnablementPolicy {
    KindPolicy services{{}, {}, false};
    KindPolicy utilities{{}, {}, true};

    [[nodiscard]] const KindPolicy& for_kind(PluginKind kind) const {
        return kind == PluginKind::Service ? services : utilities;
    }

    [[nodiscard]] KindPolicy& for_kind(PluginKind kind) {
        return kind == PluginKind::Service ? services : utilities;
    }

    [[nodiscard]] bool is_enabled(const std::string& name, PluginKind kind) const {
        return for_kind(kind).allows(name);
    }
};

} // namespace relay_plugin
