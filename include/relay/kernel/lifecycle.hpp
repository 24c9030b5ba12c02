#pragma once

/// @file lifecycle.hpp
/// @brief Top-level orchestration: startup, run loop, bounded shutdown
///
/// State machine:
///   Created -> Starting -> Running -> ShuttingDown -> Stopped
///
/// Shutdown runs two phases, each bounded by its own deadline:
/// 1. Kernel teardown on a worker thread, abandoned after kernel_timeout
/// 2. Stop request to every service task, detached after tasks_timeout

#include "fwd.hpp"
#include "background_task.hpp"
#include "component_registry.hpp"
#include "instance_kernel.hpp"
#include <relay/core/error.hpp>
#include <relay/plugin/discovery.hpp>
#include <relay/plugin/planner.hpp>
#include <relay/plugin/settings.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace relay_kernel {

// =============================================================================
// LifecycleState
// =============================================================================

enum class LifecycleState : std::uint8_t {
    Created,
    Starting,
    Running,
    ShuttingDown,
    Stopped,
};

[[nodiscard]] const char* lifecycle_state_name(LifecycleState state);

/// Process exit codes
namespace exit_code {
inline constexpr int Success = 0;
inline constexpr int Failure = 1;
inline constexpr int Aborted = 2;
} // namespace exit_code

// =============================================================================
// LifecycleController
// =============================================================================

class LifecycleController {
public:
    explicit LifecycleController(std::shared_ptr<const relay_plugin::AppSettings> settings,
                                 ComponentRegistry& registry = global_component_registry());

    ~LifecycleController();

    // Non-copyable
    LifecycleController(const LifecycleController&) = delete;
    LifecycleController& operator=(const LifecycleController&) = delete;

    /// Discover, plan, initialize the kernel and spawn service tasks.
    /// On failure the partial startup is shut down before returning.
    [[nodiscard]] relay_core::Result<void> startup();

    /// startup(), then block until a signal or request_shutdown(), then shut
    /// down. @return process exit status
    int run();

    /// Ask run() to return. Safe from any thread.
    void request_shutdown();

    /// Two-phase bounded shutdown. Idempotent.
    void shutdown();

    /// Install SIGINT/SIGTERM handlers for the duration of run()
    void set_handle_signals(bool enabled) noexcept { m_handle_signals = enabled; }

    // =========================================================================
    // State
    // =========================================================================

    [[nodiscard]] LifecycleState state() const noexcept { return m_state.load(); }
    [[nodiscard]] bool shutdown_requested() const;

    [[nodiscard]] const relay_plugin::PluginDiscovery* discovery() const noexcept { return m_discovery.get(); }
    [[nodiscard]] const relay_plugin::StartupPlan* plan() const noexcept { return m_plan.get(); }
    [[nodiscard]] std::shared_ptr<InstanceKernel> kernel() const noexcept { return m_kernel; }
    [[nodiscard]] std::size_t task_count() const noexcept { return m_tasks.size(); }

    /// True if phase 1 hit its deadline during the last shutdown
    [[nodiscard]] bool kernel_shutdown_abandoned() const noexcept { return m_kernel_abandoned; }

    /// Number of tasks detached by phase 2 during the last shutdown
    [[nodiscard]] std::size_t detached_task_count() const noexcept { return m_detached_tasks; }

    /// True if the last shutdown left threads running past their deadline.
    /// The process must then exit without running static destructors.
    [[nodiscard]] bool has_detached_work() const noexcept {
        return m_kernel_abandoned || m_detached_tasks > 0;
    }

private:
    void shutdown_kernel_phase();
    void shutdown_tasks_phase();
    void spawn_service_tasks();

    std::shared_ptr<const relay_plugin::AppSettings> m_settings;
    ComponentRegistry& m_registry;

    std::shared_ptr<relay_plugin::PluginDiscovery> m_discovery;
    std::unique_ptr<relay_plugin::StartupPlanner> m_planner;
    std::unique_ptr<relay_plugin::StartupPlan> m_plan;
    std::shared_ptr<InstanceKernel> m_kernel;
    std::vector<std::unique_ptr<BackgroundTask>> m_tasks;

    std::atomic<LifecycleState> m_state{LifecycleState::Created};
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_shutdown_requested = false;
    bool m_handle_signals = true;
    bool m_kernel_abandoned = false;
    std::size_t m_detached_tasks = 0;
};

} // namespace relay_kernel
