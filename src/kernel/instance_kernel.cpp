/// @file instance_kernel.cpp
/// @brief InstanceKernel implementation

#include <relay/kernel/instance_kernel.hpp>
#include <relay/core/log.hpp>

#include <algorithm>

namespace relay_kernel {

using relay_core::Err;
using relay_core::Error;
using relay_core::KernelError;
using relay_core::Result;
using relay_plugin::PluginDescriptor;
using relay_plugin::PluginKind;

namespace {

/// Releases a library-allocated instance before the library handle
struct LibraryBoundDeleter {
    std::shared_ptr<DynamicLibrary> library;
    std::shared_ptr<Component> owner;

    void operator()(Component* component) {
        if (owner) {
            owner.reset();
        } else {
            delete component;
        }
    }
};

/// Factory whose code lives in a shared library. The library is declared
/// first so it is released after the wrapped callable.
struct LibraryBoundFactory {
    std::shared_ptr<DynamicLibrary> library;
    ComponentFactory inner;
    CreateComponentFn create = nullptr;

    std::shared_ptr<Component> operator()(const Dependencies& deps) const {
        if (inner) {
            std::shared_ptr<Component> instance = inner(deps);
            if (!instance) {
                return nullptr;
            }
            Component* raw = instance.get();
            return std::shared_ptr<Component>(raw, LibraryBoundDeleter{library, std::move(instance)});
        }

        Component* raw = create(&deps);
        if (!raw) {
            return nullptr;
        }
        return std::shared_ptr<Component>(raw, LibraryBoundDeleter{library, nullptr});
    }
};

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

InstanceKernel::InstanceKernel(
    const relay_plugin::PluginDiscovery& discovery,
    std::shared_ptr<const relay_plugin::AppSettings> settings,
    ComponentRegistry& registry)
    : m_discovery(discovery)
    , m_settings(settings ? std::move(settings) : std::make_shared<relay_plugin::AppSettings>())
    , m_registry(registry) {}

InstanceKernel::~InstanceKernel() {
    shutdown();
}

void InstanceKernel::register_bootstrap(const std::string& name, std::shared_ptr<Component> component) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_bootstrap[name] = std::move(component);
}

void InstanceKernel::initialize(const relay_plugin::StartupPlan& plan) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto logger = relay_core::kernel_logger();

    const DependencyResolver resolver = [this](const std::string& dep) {
        return resolve_dependency(dep);
    };

    for (const auto& name : plan.dependency_order) {
        register_plugin(name, resolver);
    }
    logger->info("Initialized utilities: {} instances, {} transient",
        m_utility_instances.size(), m_utility_factories.size());

    for (const auto& name : plan.enabled_services) {
        register_plugin(name, resolver);
    }
    logger->info("Initialized services: {} instances, {} transient",
        m_service_instances.size(), m_service_factories.size());

    if (!m_failed.empty()) {
        logger->warn("{} plugin(s) failed to initialize", m_failed.size());
    }

    m_initialized = true;
}

void InstanceKernel::register_plugin(const std::string& name, const DependencyResolver& resolver) {
    auto logger = relay_core::kernel_logger();

    const auto* desc = m_discovery.get(name);
    if (!desc) {
        logger->error("No descriptor for planned plugin '{}'", name);
        m_failed.insert(name);
        return;
    }

    auto factory = load(*desc);
    if (!factory) {
        logger->error("{}", factory.error().message());
        m_failed.insert(name);
        return;
    }

    if (!desc->singleton) {
        store(*desc, nullptr, std::move(factory).value());
        logger->debug("Registered transient {} '{}'", plugin_kind_name(desc->kind), name);
        return;
    }

    auto instance = create_instance(name, *factory, resolver);
    if (!instance) {
        logger->error("{}", instance.error().message());
        m_failed.insert(name);
        return;
    }

    store(*desc, std::move(instance).value(), nullptr);
    logger->debug("Created singleton {} '{}'", plugin_kind_name(desc->kind), name);
}

void InstanceKernel::store(
    const PluginDescriptor& descriptor,
    std::shared_ptr<Component> instance,
    ComponentFactory factory) {

    const bool utility = descriptor.kind == PluginKind::Utility;
    const auto& name = descriptor.name;

    if (instance) {
        auto& instances = utility ? m_utility_instances : m_service_instances;
        auto& order = utility ? m_utility_order : m_service_order;
        if (instances.emplace(name, std::move(instance)).second) {
            order.push_back(name);
        }
    } else {
        auto& factories = utility ? m_utility_factories : m_service_factories;
        factories[name] = std::move(factory);
    }
    m_failed.erase(name);
}

// =============================================================================
// Loading
// =============================================================================

Result<ComponentFactory> InstanceKernel::load(const PluginDescriptor& descriptor) {
    if (auto factory = m_registry.find(descriptor.name)) {
        return factory;
    }
    return load_from_library(descriptor);
}

Result<ComponentFactory> InstanceKernel::load_from_library(const PluginDescriptor& descriptor) {
    auto logger = relay_core::kernel_logger();

    auto path = find_plugin_library(descriptor.path, descriptor.name);
    if (!path) {
        return Err<ComponentFactory>(Error(KernelError::load_failed(descriptor.name,
            "no registered factory and no shared library in " + descriptor.path.string())));
    }

    auto lib_result = DynamicLibrary::load(*path);
    if (!lib_result) {
        return Err<ComponentFactory>(Error(KernelError::load_failed(descriptor.name,
            lib_result.error().message())));
    }
    auto library = std::make_shared<DynamicLibrary>(std::move(lib_result).value());

    LibraryBoundFactory bound{library, nullptr, nullptr};

    auto register_fn = library->get_function<RegisterComponentsFn>(k_register_components_symbol);
    if (register_fn) {
        ComponentRegistry local;
        (*register_fn)(&local);

        auto resolved = local.resolve(descriptor.name);
        if (resolved) {
            bound.inner = std::move(resolved).value();
        } else {
            logger->debug("Library {} registered no factories", path->string());
        }
    }

    if (!bound.inner) {
        auto create_fn = library->get_function<CreateComponentFn>(k_create_component_symbol);
        if (!create_fn) {
            return Err<ComponentFactory>(Error(KernelError::load_failed(descriptor.name,
                path->string() + " exports neither " + k_register_components_symbol +
                " nor " + k_create_component_symbol)));
        }
        bound.create = *create_fn;
    }

    logger->debug("Loaded '{}' from {}", descriptor.name, path->string());

    {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        m_libraries.push_back(library);
    }

    return ComponentFactory(std::move(bound));
}

// =============================================================================
// Instantiation
// =============================================================================

std::shared_ptr<spdlog::logger> InstanceKernel::base_logger() const {
    auto it = m_bootstrap.find("logger");
    if (it != m_bootstrap.end()) {
        if (auto host = std::dynamic_pointer_cast<LoggerComponent>(it->second)) {
            return host->shared();
        }
    }
    return relay_core::kernel_logger();
}

Result<std::shared_ptr<Component>> InstanceKernel::create_instance(
    const std::string& name,
    const ComponentFactory& factory,
    const DependencyResolver& resolver) {

    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto logger = relay_core::kernel_logger();

    const auto* desc = m_discovery.get(name);

    nlohmann::json settings = desc ? m_settings->plugin_settings(*desc) : nlohmann::json::object();
    Dependencies deps(name, std::move(settings));

    if (desc) {
        for (const auto& dep : desc->dependencies) {
            if (dep == "logger") {
                deps.set(dep, std::make_shared<LoggerComponent>(
                    relay_core::child_logger(base_logger(), name)));
                continue;
            }

            auto resolved = resolver ? resolver(dep) : nullptr;
            if (!resolved) {
                logger->warn("Plugin '{}': dependency '{}' unavailable, constructing without it", name, dep);
                continue;
            }
            deps.set(dep, std::move(resolved));
        }
    }

    std::shared_ptr<Component> instance;
    try {
        instance = factory(deps);
    } catch (const std::exception& e) {
        return Err<std::shared_ptr<Component>>(Error(KernelError::instantiation(name, e.what())));
    } catch (...) {
        return Err<std::shared_ptr<Component>>(Error(KernelError::instantiation(name, "unknown exception")));
    }

    if (!instance) {
        return Err<std::shared_ptr<Component>>(Error(
            KernelError::instantiation(name, "factory returned no instance")));
    }

    return Result<std::shared_ptr<Component>>(std::move(instance));
}

// =============================================================================
// Lookup
// =============================================================================

Result<std::shared_ptr<Component>> InstanceKernel::get(const std::string& name) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    if (auto it = m_bootstrap.find(name); it != m_bootstrap.end()) {
        return Result<std::shared_ptr<Component>>(it->second);
    }
    if (auto it = m_utility_instances.find(name); it != m_utility_instances.end()) {
        return Result<std::shared_ptr<Component>>(it->second);
    }
    if (auto it = m_service_instances.find(name); it != m_service_instances.end()) {
        return Result<std::shared_ptr<Component>>(it->second);
    }

    const DependencyResolver resolver = [this](const std::string& dep) {
        return resolve_dependency(dep);
    };

    if (auto it = m_utility_factories.find(name); it != m_utility_factories.end()) {
        ComponentFactory factory = it->second;
        return create_instance(name, factory, resolver);
    }
    if (auto it = m_service_factories.find(name); it != m_service_factories.end()) {
        ComponentFactory factory = it->second;
        return create_instance(name, factory, resolver);
    }

    return Err<std::shared_ptr<Component>>(Error(KernelError::not_found(name)));
}

std::shared_ptr<Component> InstanceKernel::resolve_dependency(const std::string& name) {
    auto result = get(name);
    if (!result) {
        if (!result.error().is_kind(KernelError::Kind::NotFound)) {
            relay_core::kernel_logger()->error("{}", result.error().message());
        }
        return nullptr;
    }
    return std::move(result).value();
}

std::shared_ptr<Component> InstanceKernel::get_on_demand(const std::string& name) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto logger = relay_core::kernel_logger();

    auto existing = get(name);
    if (existing) {
        return std::move(existing).value();
    }
    if (!existing.error().is_kind(KernelError::Kind::NotFound)) {
        logger->error("{}", existing.error().message());
        return nullptr;
    }

    const auto* desc = m_discovery.get(name);
    if (!desc) {
        logger->warn("On-demand request for unknown plugin '{}'", name);
        return nullptr;
    }

    if (m_on_demand_in_progress.count(name)) {
        logger->warn("On-demand request for '{}' re-entered while it is being built", name);
        return nullptr;
    }
    m_on_demand_in_progress.insert(name);

    auto factory = load(*desc);
    if (!factory) {
        m_on_demand_in_progress.erase(name);
        logger->error("{}", factory.error().message());
        m_failed.insert(name);
        return nullptr;
    }

    const DependencyResolver resolver = [this](const std::string& dep) {
        return get_on_demand(dep);
    };

    auto instance = create_instance(name, *factory, resolver);
    m_on_demand_in_progress.erase(name);
    if (!instance) {
        logger->error("{}", instance.error().message());
        m_failed.insert(name);
        return nullptr;
    }

    if (desc->singleton) {
        store(*desc, *instance, nullptr);
    } else {
        store(*desc, nullptr, std::move(factory).value());
    }

    logger->info("Initialized {} '{}' on demand", plugin_kind_name(desc->kind), name);
    return std::move(instance).value();
}

std::map<std::string, std::shared_ptr<Component>> InstanceKernel::get_all_services() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    std::map<std::string, std::shared_ptr<Component>> services = m_service_instances;

    for (const auto& [name, _] : m_service_factories) {
        auto instance = get(name);
        if (!instance) {
            relay_core::kernel_logger()->error("{}", instance.error().message());
            continue;
        }
        services[name] = std::move(instance).value();
    }

    return services;
}

// =============================================================================
// Shutdown
// =============================================================================

void InstanceKernel::run_shutdown_hook(const std::string& name, const std::shared_ptr<Component>& instance) {
    auto hook = std::dynamic_pointer_cast<ShutdownHook>(instance);
    if (!hook) {
        return;
    }

    try {
        hook->shutdown();
        relay_core::kernel_logger()->debug("Shut down '{}'", name);
    } catch (const std::exception& e) {
        relay_core::kernel_logger()->error("{}",
            KernelError::shutdown_hook(name, e.what()).message);
    } catch (...) {
        relay_core::kernel_logger()->error("{}",
            KernelError::shutdown_hook(name, "unknown exception").message);
    }
}

void InstanceKernel::shutdown() {
    std::map<std::string, std::shared_ptr<Component>> utilities;
    std::map<std::string, std::shared_ptr<Component>> services;
    std::map<std::string, ComponentFactory> utility_factories;
    std::map<std::string, ComponentFactory> service_factories;
    std::vector<std::string> utility_order;
    std::vector<std::string> service_order;
    std::vector<std::shared_ptr<DynamicLibrary>> libraries;

    // Hooks run without the lock held; a hook may call back into the kernel
    {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);

        if (!m_initialized && caches_empty() && m_libraries.empty()) {
            return;
        }

        utilities.swap(m_utility_instances);
        services.swap(m_service_instances);
        utility_factories.swap(m_utility_factories);
        service_factories.swap(m_service_factories);
        utility_order.swap(m_utility_order);
        service_order.swap(m_service_order);
        libraries.swap(m_libraries);
        m_failed.clear();
        m_on_demand_in_progress.clear();
        m_initialized = false;
    }

    auto logger = relay_core::kernel_logger();
    logger->info("Shutting down kernel");

    for (const auto& name : utility_order) {
        auto it = utilities.find(name);
        if (it != utilities.end()) {
            run_shutdown_hook(name, it->second);
        }
    }

    for (const auto& name : service_order) {
        auto it = services.find(name);
        if (it != services.end()) {
            run_shutdown_hook(name, it->second);
        }
    }

    // Instances and factories go before the libraries that provide their code
    utilities.clear();
    services.clear();
    utility_factories.clear();
    service_factories.clear();
    libraries.clear();

    logger->info("Kernel shutdown complete");
}

// =============================================================================
// State
// =============================================================================

bool InstanceKernel::is_initialized() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_initialized;
}

bool InstanceKernel::is_failed(const std::string& name) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_failed.count(name) > 0;
}

std::set<std::string> InstanceKernel::failed_plugins() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_failed;
}

std::size_t InstanceKernel::utility_instance_count() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_utility_instances.size();
}

std::size_t InstanceKernel::utility_factory_count() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_utility_factories.size();
}

std::size_t InstanceKernel::service_instance_count() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_service_instances.size();
}

std::size_t InstanceKernel::service_factory_count() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_service_factories.size();
}

std::size_t InstanceKernel::loaded_library_count() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_libraries.size();
}

bool InstanceKernel::caches_empty() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_utility_instances.empty() && m_utility_factories.empty()
        && m_service_instances.empty() && m_service_factories.empty();
}

} // namespace relay_kernel
