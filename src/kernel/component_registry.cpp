/// @file component_registry.cpp
/// @brief Component factory table implementation

#include <relay/kernel/component_registry.hpp>
#include <relay/core/log.hpp>

#include <algorithm>
#include <cctype>

namespace relay_kernel {

using relay_core::Err;
using relay_core::Error;
using relay_core::ErrorCode;
using relay_core::KernelError;
using relay_core::Ok;
using relay_core::Result;

std::string normalize_component_name(const std::string& name) {
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        if (c == '_' || c == '-' || c == '.') {
            continue;
        }
        result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return result;
}

// =============================================================================
// ComponentRegistry
// =============================================================================

Result<void> ComponentRegistry::register_factory(const std::string& name, ComponentFactory factory) {
    if (name.empty() || !factory) {
        return Err(Error(ErrorCode::InvalidArgument, "Component factory needs a name and a callable"));
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_factories.count(name)) {
        return Err(Error(ErrorCode::AlreadyExists, "Component already registered: " + name));
    }

    m_factories.emplace(name, std::move(factory));
    m_order.push_back(name);
    return Ok();
}

bool ComponentRegistry::unregister(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_factories.erase(name) == 0) {
        return false;
    }
    m_order.erase(std::remove(m_order.begin(), m_order.end(), name), m_order.end());
    return true;
}

bool ComponentRegistry::has(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_factories.count(name) > 0;
}

ComponentFactory ComponentRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_factories.find(name);
    return it != m_factories.end() ? it->second : ComponentFactory{};
}

Result<ComponentFactory> ComponentRegistry::resolve(const std::string& plugin_name) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto exact = m_factories.find(plugin_name);
    if (exact != m_factories.end()) {
        return exact->second;
    }

    const std::string wanted = normalize_component_name(plugin_name);
    for (const auto& name : m_order) {
        if (normalize_component_name(name) == wanted) {
            return m_factories.at(name);
        }
    }

    if (!m_order.empty()) {
        return m_factories.at(m_order.front());
    }

    return Err<ComponentFactory>(Error(KernelError::not_found(plugin_name)));
}

std::vector<std::string> ComponentRegistry::names() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_order;
}

std::size_t ComponentRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_factories.size();
}

bool ComponentRegistry::empty() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_factories.empty();
}

void ComponentRegistry::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_factories.clear();
    m_order.clear();
}

ComponentRegistry& global_component_registry() {
    static ComponentRegistry registry;
    return registry;
}

namespace detail {

bool register_factory_logged(ComponentRegistry& registry, const char* name, ComponentFactory factory) {
    auto result = registry.register_factory(name, std::move(factory));
    if (!result) {
        RELAY_LOG_WARN("Component '{}' not registered: {}", name, result.error().message());
        return false;
    }
    return true;
}

bool register_global_factory(const char* name, ComponentFactory factory) {
    return register_factory_logged(global_component_registry(), name, std::move(factory));
}

} // namespace detail

} // namespace relay_kernel
