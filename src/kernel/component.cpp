/// @file component.cpp
/// @brief Dependencies implementation

#include <relay/kernel/component.hpp>
#include <relay/core/log.hpp>

namespace relay_kernel {

Dependencies::Dependencies(std::string plugin_name, nlohmann::json settings)
    : m_plugin_name(std::move(plugin_name))
    , m_settings(std::move(settings)) {}

void Dependencies::set(const std::string& name, std::shared_ptr<Component> component) {
    m_components[name] = std::move(component);
}

bool Dependencies::has(const std::string& name) const {
    return m_components.count(name) > 0;
}

std::shared_ptr<Component> Dependencies::get(const std::string& name) const {
    auto it = m_components.find(name);
    return it != m_components.end() ? it->second : nullptr;
}

std::shared_ptr<spdlog::logger> Dependencies::logger() const {
    if (auto injected = get<LoggerComponent>("logger")) {
        return injected->shared();
    }
    return relay_core::child_logger(relay_core::kernel_logger(), m_plugin_name);
}

std::vector<std::string> Dependencies::names() const {
    std::vector<std::string> result;
    result.reserve(m_components.size());
    for (const auto& [name, _] : m_components) {
        result.push_back(name);
    }
    return result;
}

} // namespace relay_kernel
