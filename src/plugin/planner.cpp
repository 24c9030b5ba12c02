/// @file planner.cpp
/// @brief Startup planning implementation

#include <relay/plugin/planner.hpp>
#include <relay/core/log.hpp>

#include <algorithm>
#include <utility>

namespace relay_plugin {

using relay_core::Err;
using relay_core::Error;
using relay_core::KernelError;
using relay_core::Ok;
using relay_core::Result;

bool is_bootstrap_utility(const std::string& name) {
    return std::find(k_bootstrap_utilities.begin(), k_bootstrap_utilities.end(), name)
        != k_bootstrap_utilities.end();
}

// =============================================================================
// StartupPlanner
// =============================================================================

StartupPlanner::StartupPlanner(const PluginDiscovery& discovery, EnablementPolicy policy)
    : m_discovery(discovery)
    , m_policy(std::move(policy)) {}

const StartupPlan& StartupPlanner::get_startup_plan() {
    if (!m_plan) {
        m_plan = compute_plan();
    }
    return *m_plan;
}

void StartupPlanner::invalidate() {
    m_plan.reset();
}

void StartupPlanner::set_policy(EnablementPolicy policy) {
    m_policy = std::move(policy);
}

bool StartupPlanner::can_start(const std::string& name) const {
    const auto* desc = m_discovery.get(name);
    if (!desc) {
        return false;
    }

    if (!m_policy.is_enabled(name, desc->kind)) {
        return false;
    }

    std::vector<std::string> path;
    return !probe_cycle(name, path);
}

bool StartupPlanner::probe_cycle(const std::string& name, std::vector<std::string>& path) const {
    if (std::find(path.begin(), path.end(), name) != path.end()) {
        return true;
    }

    const auto* desc = m_discovery.get(name);
    if (!desc) {
        return false;
    }

    path.push_back(name);
    for (const auto& dep : desc->dependencies) {
        if (probe_cycle(dep, path)) {
            return true;
        }
    }
    path.pop_back();

    return false;
}

Result<std::set<std::string>> StartupPlanner::collect_transitive_closure(const std::string& name) const {
    if (!m_discovery.contains(name)) {
        return Err<std::set<std::string>>(Error(KernelError::not_found(name)));
    }

    std::set<std::string> closure;
    std::vector<std::string> path;

    auto result = closure_visit(name, name, closure, path);
    if (!result) {
        return Err<std::set<std::string>>(result.error());
    }

    return closure;
}

Result<void> StartupPlanner::closure_visit(
    const std::string& root,
    const std::string& name,
    std::set<std::string>& closure,
    std::vector<std::string>& path) const {

    if (std::find(path.begin(), path.end(), name) != path.end()) {
        std::vector<std::string> cycle(std::find(path.begin(), path.end(), name), path.end());
        cycle.push_back(name);
        return Err(Error(KernelError::graph_cycle(format_cycle_path(cycle))));
    }

    if (closure.count(name)) {
        return Ok();
    }

    path.push_back(name);
    closure.insert(name);

    const auto* desc = m_discovery.get(name);
    for (const auto& dep : desc->dependencies) {
        if (is_bootstrap_utility(dep)) {
            continue;
        }
        if (!m_discovery.is_utility(dep)) {
            return Err(Error(KernelError::dependency(root, dep,
                m_discovery.is_service(dep) ? "depends on a service" : "missing dependency")));
        }
        if (!m_policy.utilities.allows(dep)) {
            return Err(Error(KernelError::dependency(root, dep, "dependency disabled by policy")));
        }

        auto result = closure_visit(root, dep, closure, path);
        if (!result) {
            return result;
        }
    }

    path.pop_back();

    return Ok();
}

StartupPlan StartupPlanner::compute_plan() const {
    auto logger = relay_core::plugin_logger();
    StartupPlan plan;
    std::set<std::string> candidates;

    for (const auto& service : m_discovery.plugins_of_kind(PluginKind::Service)) {
        if (!can_start(service)) {
            logger->debug("Service '{}' is not startable", service);
            continue;
        }

        auto closure = collect_transitive_closure(service);
        if (!closure) {
            logger->warn("Service '{}' excluded from startup: {}", service, closure.error().message());
            continue;
        }

        plan.enabled_services.push_back(service);
        for (const auto& name : *closure) {
            if (name != service) {
                candidates.insert(name);
            }
        }
    }

    for (const auto& name : candidates) {
        if (is_bootstrap_utility(name)) {
            continue;
        }
        if (!m_policy.utilities.allows(name)) {
            logger->warn("Utility '{}' is disabled by policy and will not be initialized", name);
            continue;
        }
        plan.required_utilities.insert(name);
    }

    auto topo = m_discovery.topological_order(plan.required_utilities);
    if (topo.has_residual()) {
        logger->warn("Utilities left out of the initialization order due to a cycle: {}",
            format_cycle_path(std::vector<std::string>(topo.residual.begin(), topo.residual.end())));
    }
    plan.dependency_order = std::move(topo.order);

    plan.total_services = plan.enabled_services.size();
    plan.total_utilities = plan.required_utilities.size();

    logger->info("Startup plan: {} services, {} utilities",
        plan.total_services, plan.total_utilities);

    return plan;
}

} // namespace relay_plugin
