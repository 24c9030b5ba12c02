#pragma once

/// @file greeter.hpp
/// @brief Interface implemented by the loadable test plugins

#include <relay/kernel/component.hpp>

#include <string>

namespace relay_test {

class Greeter : public relay_kernel::Component {
public:
    [[nodiscard]] virtual std::string greet(const std::string& who) const = 0;
    [[nodiscard]] virtual std::string origin() const = 0;
};

} // namespace relay_test
