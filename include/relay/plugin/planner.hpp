#pragma once

/// @file planner.hpp
/// @brief Startup planning over discovered plugins
///
/// The StartupPlanner decides:
/// - Which services may start (policy, local cycle probe, dependency closure)
/// - Which utilities those services transitively require
/// - The order in which required utilities must be initialized
///
/// Planning degrades instead of failing: a service whose closure cannot be
/// satisfied is left out of the plan, and an empty plan is a valid outcome.

#include "fwd.hpp"
#include "discovery.hpp"
#include "policy.hpp"
#include <relay/core/error.hpp>

#include <array>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace relay_plugin {

/// Utilities constructed by the host before the kernel exists
inline constexpr std::array<std::string_view, 3> k_bootstrap_utilities = {
    "logger",
    "plugins_manager",
    "settings_manager",
};

/// Check whether a name is a host-provided bootstrap utility
[[nodiscard]] bool is_bootstrap_utility(const std::string& name);

// =============================================================================
// StartupPlan
// =============================================================================

/// Immutable result of planning
struct StartupPlan {
    std::vector<std::string> enabled_services;     ///< Services to start, sorted
    std::set<std::string> required_utilities;      ///< Utilities the services need
    std::vector<std::string> dependency_order;     ///< Initialization order of required utilities
    std::size_t total_services = 0;
    std::size_t total_utilities = 0;

    [[nodiscard]] bool empty() const noexcept {
        return enabled_services.empty() && required_utilities.empty();
    }

    bool operator==(const StartupPlan&) const = default;
};

// =============================================================================
// StartupPlanner
// =============================================================================

/// Computes and memoizes the startup plan
class StartupPlanner {
public:
    explicit StartupPlanner(const PluginDiscovery& discovery, EnablementPolicy policy = {});

    /// Get the plan, computing it on first use or after invalidate()
    [[nodiscard]] const StartupPlan& get_startup_plan();

    /// Drop the memoized plan
    void invalidate();

    /// Replace the policy. The memoized plan is kept until invalidate().
    void set_policy(EnablementPolicy policy);

    [[nodiscard]] const EnablementPolicy& policy() const noexcept { return m_policy; }

    /// Check whether a plugin is known, allowed by policy and free of local cycles
    [[nodiscard]] bool can_start(const std::string& name) const;

    /// Collect `name` and everything it transitively depends on.
    /// Returns a Dependency error if any dependency is unknown, not a utility
    /// or disabled by policy, and a GraphCycle error if a dependency path
    /// revisits itself. Either error discards the whole closure.
    [[nodiscard]] relay_core::Result<std::set<std::string>> collect_transitive_closure(
        const std::string& name) const;

    [[nodiscard]] bool has_plan() const noexcept { return m_plan.has_value(); }

private:
    StartupPlan compute_plan() const;

    bool probe_cycle(const std::string& name, std::vector<std::string>& path) const;

    relay_core::Result<void> closure_visit(
        const std::string& root,
        const std::string& name,
        std::set<std::string>& closure,
        std::vector<std::string>& path) const;

    const PluginDiscovery& m_discovery;
    EnablementPolicy m_policy;
    std::optional<StartupPlan> m_plan;
};

} // namespace relay_plugin
