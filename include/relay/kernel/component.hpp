#pragma once

/// @file component.hpp
/// @brief Contract between the kernel and plugin implementations
///
/// A plugin implementation is a Component built by a factory that receives
/// its resolved Dependencies. Optional capabilities are expressed as extra
/// interfaces the kernel probes with dynamic_cast:
/// - ShutdownHook: called once when the kernel shuts down
/// - Runnable: long-running entry point, started on its own thread
///
/// Example:
/// @code
/// class TicketStore : public relay_kernel::Component, public relay_kernel::ShutdownHook {
/// public:
///     explicit TicketStore(const relay_kernel::Dependencies& deps)
///         : m_logger(deps.logger())
///         , m_database(deps.get<Database>("database")) {}
///
///     void shutdown() override { m_database.reset(); }
/// };
/// @endcode

#include "fwd.hpp"
#include <relay/plugin/fwd.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace relay_kernel {

// =============================================================================
// Component Interfaces
// =============================================================================

/// Base of every plugin instance
class Component {
public:
    virtual ~Component() = default;
};

/// Optional teardown capability
class ShutdownHook {
public:
    virtual ~ShutdownHook() = default;

    /// Release resources. Called once during kernel shutdown.
    virtual void shutdown() = 0;
};

// =============================================================================
// StopToken
// =============================================================================

/// Cooperative cancellation flag shared between a task and its owner
class StopToken {
public:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool stop_requested = false;
    };

    StopToken() = default;
    explicit StopToken(std::shared_ptr<State> state) : m_state(std::move(state)) {}

    /// Check if stop has been requested
    [[nodiscard]] bool stop_requested() const {
        if (!m_state) return false;
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return m_state->stop_requested;
    }

    /// Sleep up to `timeout`, waking early on a stop request.
    /// @return true if stop was requested
    template<typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
        if (!m_state) return false;
        std::unique_lock<std::mutex> lock(m_state->mutex);
        return m_state->cv.wait_for(lock, timeout, [this]() { return m_state->stop_requested; });
    }

    /// Block until stop is requested
    void wait() const {
        if (!m_state) return;
        std::unique_lock<std::mutex> lock(m_state->mutex);
        m_state->cv.wait(lock, [this]() { return m_state->stop_requested; });
    }

    /// Request stop and wake every waiter
    void request_stop() const {
        if (!m_state) return;
        {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            m_state->stop_requested = true;
        }
        m_state->cv.notify_all();
    }

    [[nodiscard]] bool stop_possible() const noexcept { return m_state != nullptr; }

    /// Create a token with fresh shared state
    [[nodiscard]] static StopToken create() { return StopToken(std::make_shared<State>()); }

private:
    std::shared_ptr<State> m_state;
};

/// Optional long-running entry point (services)
class Runnable {
public:
    virtual ~Runnable() = default;

    /// Run until `token` requests stop. Must return promptly after that.
    virtual void run(const StopToken& token) = 0;
};

// =============================================================================
// HostComponent
// =============================================================================

/// Wraps a host-owned object so it can be injected as a dependency
template<typename T>
class HostComponent : public Component {
public:
    explicit HostComponent(std::shared_ptr<T> value) : m_value(std::move(value)) {}

    [[nodiscard]] T& get() const { return *m_value; }
    [[nodiscard]] const std::shared_ptr<T>& shared() const noexcept { return m_value; }

private:
    std::shared_ptr<T> m_value;
};

/// The "logger" bootstrap utility
using LoggerComponent = HostComponent<spdlog::logger>;

/// The "plugins_manager" bootstrap utility
using DiscoveryComponent = HostComponent<const relay_plugin::PluginDiscovery>;

/// The "settings_manager" bootstrap utility
using SettingsComponent = HostComponent<const relay_plugin::AppSettings>;

// =============================================================================
// Dependencies
// =============================================================================

/// Resolved dependencies handed to a component factory
class Dependencies {
public:
    explicit Dependencies(std::string plugin_name,
                          nlohmann::json settings = nlohmann::json::object());

    /// Name of the plugin being constructed
    [[nodiscard]] const std::string& plugin_name() const noexcept { return m_plugin_name; }

    /// Merged plugin settings
    [[nodiscard]] const nlohmann::json& settings() const noexcept { return m_settings; }

    /// Add a resolved dependency
    void set(const std::string& name, std::shared_ptr<Component> component);

    /// Check if a dependency was resolved
    [[nodiscard]] bool has(const std::string& name) const;

    /// Get a dependency (nullptr if it was not resolved)
    [[nodiscard]] std::shared_ptr<Component> get(const std::string& name) const;

    /// Get a dependency with a specific type (nullptr if absent or of another type)
    template<typename T>
    [[nodiscard]] std::shared_ptr<T> get(const std::string& name) const {
        return std::dynamic_pointer_cast<T>(get(name));
    }

    /// The injected plugin logger, or a kernel child logger if none was declared
    [[nodiscard]] std::shared_ptr<spdlog::logger> logger() const;

    /// Names of the resolved dependencies
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] std::size_t size() const noexcept { return m_components.size(); }

private:
    std::string m_plugin_name;
    nlohmann::json m_settings;
    std::map<std::string, std::shared_ptr<Component>> m_components;
};

/// Builds a component from its dependencies. May throw.
using ComponentFactory = std::function<std::shared_ptr<Component>(const Dependencies&)>;

} // namespace relay_kernel
