#pragma once

/// @file instance_kernel.hpp
/// @brief Plugin instantiation, dependency injection and teardown
///
/// The InstanceKernel owns four caches:
/// - utility instances (singletons) and utility factories (transients)
/// - service instances (singletons) and service factories (transients)
///
/// Host-provided bootstrap components (logger, plugins_manager,
/// settings_manager) live outside those caches and survive shutdown, so a
/// kernel can be initialized again after shutdown().
///
/// All caches are guarded by one recursive mutex; dependency resolution
/// re-enters the kernel while the lock is held.

#include "fwd.hpp"
#include "component.hpp"
#include "component_registry.hpp"
#include "dynamic_library.hpp"
#include <relay/core/error.hpp>
#include <relay/plugin/discovery.hpp>
#include <relay/plugin/planner.hpp>
#include <relay/plugin/settings.hpp>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace relay_kernel {

/// Resolves a dependency name to an instance (nullptr if unavailable)
using DependencyResolver = std::function<std::shared_ptr<Component>(const std::string&)>;

// =============================================================================
// InstanceKernel
// =============================================================================

class InstanceKernel {
public:
    /// @param discovery Descriptors to instantiate from; must outlive the kernel
    /// @param settings Application settings (defaults if null)
    /// @param registry Link-time factory table consulted before shared libraries
    explicit InstanceKernel(const relay_plugin::PluginDiscovery& discovery,
                            std::shared_ptr<const relay_plugin::AppSettings> settings = nullptr,
                            ComponentRegistry& registry = global_component_registry());

    ~InstanceKernel();

    // Non-copyable
    InstanceKernel(const InstanceKernel&) = delete;
    InstanceKernel& operator=(const InstanceKernel&) = delete;

    // =========================================================================
    // Setup
    // =========================================================================

    /// Register a host-constructed component under a bootstrap name
    void register_bootstrap(const std::string& name, std::shared_ptr<Component> component);

    /// Load and register every plugin in the plan: utilities in
    /// dependency_order, then services. A plugin that fails is marked failed;
    /// the others are unaffected.
    void initialize(const relay_plugin::StartupPlan& plan);

    // =========================================================================
    // Instantiation
    // =========================================================================

    /// Locate a plugin implementation: link-time registry first, then a
    /// shared library in the plugin directory
    [[nodiscard]] relay_core::Result<ComponentFactory> load(const relay_plugin::PluginDescriptor& descriptor);

    /// Build one instance. Declared dependencies are resolved through
    /// `resolver`; unresolved ones are omitted with a warning. Only a failing
    /// factory yields an error (Instantiation).
    [[nodiscard]] relay_core::Result<std::shared_ptr<Component>> create_instance(
        const std::string& name,
        const ComponentFactory& factory,
        const DependencyResolver& resolver);

    // =========================================================================
    // Lookup
    // =========================================================================

    /// Singleton: the cached instance. Transient: a fresh instance per call.
    /// Unknown names yield NotFound.
    [[nodiscard]] relay_core::Result<std::shared_ptr<Component>> get(const std::string& name);

    /// Get with a specific type (nullptr if unavailable or of another type)
    template<typename T>
    [[nodiscard]] std::shared_ptr<T> get_typed(const std::string& name) {
        auto result = get(name);
        if (!result) {
            return nullptr;
        }
        return std::dynamic_pointer_cast<T>(*result);
    }

    /// Get a plugin, loading and registering it if it was not planned.
    /// Returns nullptr if it cannot be obtained.
    [[nodiscard]] std::shared_ptr<Component> get_on_demand(const std::string& name);

    /// Every service: cached singletons plus one fresh instance per transient
    [[nodiscard]] std::map<std::string, std::shared_ptr<Component>> get_all_services();

    // =========================================================================
    // Shutdown
    // =========================================================================

    /// Run teardown hooks (utilities, then services) and clear all caches.
    /// Safe to call more than once.
    void shutdown();

    // =========================================================================
    // State
    // =========================================================================

    [[nodiscard]] bool is_initialized() const;
    [[nodiscard]] bool is_failed(const std::string& name) const;
    [[nodiscard]] std::set<std::string> failed_plugins() const;

    [[nodiscard]] std::size_t utility_instance_count() const;
    [[nodiscard]] std::size_t utility_factory_count() const;
    [[nodiscard]] std::size_t service_instance_count() const;
    [[nodiscard]] std::size_t service_factory_count() const;
    [[nodiscard]] std::size_t loaded_library_count() const;

    /// True when all four caches are empty
    [[nodiscard]] bool caches_empty() const;

private:
    void register_plugin(const std::string& name, const DependencyResolver& resolver);
    void store(const relay_plugin::PluginDescriptor& descriptor,
               std::shared_ptr<Component> instance,
               ComponentFactory factory);
    std::shared_ptr<Component> resolve_dependency(const std::string& name);
    std::shared_ptr<spdlog::logger> base_logger() const;
    void run_shutdown_hook(const std::string& name, const std::shared_ptr<Component>& instance);

    relay_core::Result<ComponentFactory> load_from_library(const relay_plugin::PluginDescriptor& descriptor);

    const relay_plugin::PluginDiscovery& m_discovery;
    std::shared_ptr<const relay_plugin::AppSettings> m_settings;
    ComponentRegistry& m_registry;

    mutable std::recursive_mutex m_mutex;

    std::map<std::string, std::shared_ptr<Component>> m_utility_instances;
    std::map<std::string, ComponentFactory> m_utility_factories;
    std::map<std::string, std::shared_ptr<Component>> m_service_instances;
    std::map<std::string, ComponentFactory> m_service_factories;

    std::vector<std::string> m_utility_order;   // Singleton creation order
    std::vector<std::string> m_service_order;

    std::map<std::string, std::shared_ptr<Component>> m_bootstrap;
    std::vector<std::shared_ptr<DynamicLibrary>> m_libraries;
    std::set<std::string> m_failed;
    std::set<std::string> m_on_demand_in_progress;
    bool m_initialized = false;
};

} // namespace relay_kernel
