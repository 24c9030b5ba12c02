/// @file factory_plugin.cpp
/// @brief Loadable plugin exporting only relay_create_component

#include "greeter.hpp"

#include <relay/kernel/component_registry.hpp>

namespace {

class FactoryGreeter : public relay_test::Greeter {
public:
    explicit FactoryGreeter(const relay_kernel::Dependencies& deps)
        : m_name(deps.plugin_name()) {}

    std::string greet(const std::string& who) const override {
        return "Hi " + who + " from " + m_name;
    }

    std::string origin() const override { return "factory"; }

private:
    std::string m_name;
};

} // anonymous namespace

RELAY_DECLARE_COMPONENT_FACTORY(FactoryGreeter)
