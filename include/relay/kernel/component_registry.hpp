#pragma once

/// @file component_registry.hpp
/// @brief Name -> factory table for plugin implementations
///
/// Implementations reach the kernel in one of two ways:
/// - Linked into the host: registered in global_component_registry() at
///   static-initialization time with RELAY_REGISTER_COMPONENT.
/// - Built as a shared library next to plugin.json: the library exports
///   `relay_register_components` (RELAY_DECLARE_PLUGIN) and/or
///   `relay_create_component` (RELAY_DECLARE_COMPONENT_FACTORY).

#include "fwd.hpp"
#include "component.hpp"
#include <relay/core/error.hpp>

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace relay_kernel {

/// Lowercase a name and strip '_', '-' and '.'
[[nodiscard]] std::string normalize_component_name(const std::string& name);

// =============================================================================
// ComponentRegistry
// =============================================================================

/// Thread-safe factory table that remembers registration order
class ComponentRegistry {
public:
    ComponentRegistry() = default;

    // Non-copyable
    ComponentRegistry(const ComponentRegistry&) = delete;
    ComponentRegistry& operator=(const ComponentRegistry&) = delete;

    /// Register a factory. Fails with AlreadyExists on a duplicate name.
    relay_core::Result<void> register_factory(const std::string& name, ComponentFactory factory);

    /// Remove a factory
    bool unregister(const std::string& name);

    /// Check if a factory is registered under exactly `name`
    [[nodiscard]] bool has(const std::string& name) const;

    /// Get the factory registered under exactly `name` (empty if none)
    [[nodiscard]] ComponentFactory find(const std::string& name) const;

    /// Pick the factory for a plugin: exact name, then normalized name,
    /// then the first factory registered. NotFound if the table is empty.
    [[nodiscard]] relay_core::Result<ComponentFactory> resolve(const std::string& plugin_name) const;

    /// Registered names in registration order
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool empty() const;
    void clear();

private:
    mutable std::mutex m_mutex;
    std::map<std::string, ComponentFactory> m_factories;
    std::vector<std::string> m_order;
};

/// Process-wide table for implementations linked into the host
[[nodiscard]] ComponentRegistry& global_component_registry();

// =============================================================================
// Library Entry Points
// =============================================================================

/// `extern "C" void relay_register_components(ComponentRegistry*)`
using RegisterComponentsFn = void (*)(ComponentRegistry* registry);

/// `extern "C" Component* relay_create_component(const Dependencies*)`
using CreateComponentFn = Component* (*)(const Dependencies* deps);

inline constexpr const char* k_register_components_symbol = "relay_register_components";
inline constexpr const char* k_create_component_symbol = "relay_create_component";

namespace detail {

/// Register into a table, logging instead of failing on duplicates
bool register_factory_logged(ComponentRegistry& registry, const char* name, ComponentFactory factory);

/// Register into the global table, logging instead of failing on duplicates
bool register_global_factory(const char* name, ComponentFactory factory);

} // namespace detail

} // namespace relay_kernel

// =============================================================================
// Registration Macros
// =============================================================================

#ifdef _WIN32
    #define RELAY_PLUGIN_API __declspec(dllexport)
#else
    #if __GNUC__ >= 4
        #define RELAY_PLUGIN_API __attribute__((visibility("default")))
    #else
        #define RELAY_PLUGIN_API
    #endif
#endif

#define RELAY_COMPONENT_CONCAT_INNER(a, b) a##b
#define RELAY_COMPONENT_CONCAT(a, b) RELAY_COMPONENT_CONCAT_INNER(a, b)

/// @brief Register a host-linked implementation under a plugin name
/// @code
/// RELAY_REGISTER_COMPONENT("ticket_store", TicketStore)
/// @endcode
#define RELAY_REGISTER_COMPONENT(plugin_name, ComponentClass) \
    namespace { \
    [[maybe_unused]] const bool RELAY_COMPONENT_CONCAT(relay_component_registered_, __LINE__) = \
        ::relay_kernel::detail::register_global_factory(plugin_name, \
            [](const ::relay_kernel::Dependencies& deps) -> std::shared_ptr<::relay_kernel::Component> { \
                return std::make_shared<ComponentClass>(deps); \
            }); \
    }

/// @brief Export `relay_register_components` from a plugin shared library
#define RELAY_DECLARE_PLUGIN(plugin_name, ComponentClass) \
    extern "C" RELAY_PLUGIN_API void relay_register_components(::relay_kernel::ComponentRegistry* registry) { \
        ::relay_kernel::detail::register_factory_logged(*registry, plugin_name, \
            [](const ::relay_kernel::Dependencies& deps) -> std::shared_ptr<::relay_kernel::Component> { \
                return std::make_shared<ComponentClass>(deps); \
            }); \
    }

/// @brief Export the module-level `relay_create_component` fallback
#define RELAY_DECLARE_COMPONENT_FACTORY(ComponentClass) \
    extern "C" RELAY_PLUGIN_API ::relay_kernel::Component* relay_create_component( \
        const ::relay_kernel::Dependencies* deps) { \
        return new ComponentClass(*deps); \
    }
