/// @file lifecycle.cpp
/// @brief LifecycleController implementation

#include <relay/kernel/lifecycle.hpp>
#include <relay/core/log.hpp>

#include <csignal>
#include <cstdlib>
#include <exception>
#include <future>
#include <thread>

namespace relay_kernel {

using relay_core::Err;
using relay_core::Error;
using relay_core::KernelError;
using relay_core::Ok;
using relay_core::Result;

// =============================================================================
// Signal Handling
// =============================================================================

namespace {

std::atomic<int> g_signal_count{0};

using SignalHandler = void (*)(int);
SignalHandler g_previous_sigint = SIG_DFL;
SignalHandler g_previous_sigterm = SIG_DFL;
bool g_signals_installed = false;

void handle_termination_signal(int /*signal*/) {
    // Second signal before shutdown completes: operator override
    if (g_signal_count.fetch_add(1) >= 1) {
        std::_Exit(exit_code::Aborted);
    }
}

void install_signal_handlers() {
    g_signal_count.store(0);
    g_previous_sigint = std::signal(SIGINT, handle_termination_signal);
    g_previous_sigterm = std::signal(SIGTERM, handle_termination_signal);
    g_signals_installed = true;
}

void restore_signal_handlers() {
    if (!g_signals_installed) {
        return;
    }
    std::signal(SIGINT, g_previous_sigint == SIG_ERR ? SIG_DFL : g_previous_sigint);
    std::signal(SIGTERM, g_previous_sigterm == SIG_ERR ? SIG_DFL : g_previous_sigterm);
    g_signals_installed = false;
}

} // anonymous namespace

const char* lifecycle_state_name(LifecycleState state) {
    switch (state) {
        case LifecycleState::Created: return "Created";
        case LifecycleState::Starting: return "Starting";
        case LifecycleState::Running: return "Running";
        case LifecycleState::ShuttingDown: return "ShuttingDown";
        case LifecycleState::Stopped: return "Stopped";
        default: return "Unknown";
    }
}

// =============================================================================
// LifecycleController
// =============================================================================

LifecycleController::LifecycleController(
    std::shared_ptr<const relay_plugin::AppSettings> settings,
    ComponentRegistry& registry)
    : m_settings(settings ? std::move(settings) : std::make_shared<relay_plugin::AppSettings>())
    , m_registry(registry) {}

LifecycleController::~LifecycleController() {
    shutdown();
}

Result<void> LifecycleController::startup() {
    auto logger = relay_core::host_logger();

    if (m_state.load() != LifecycleState::Created) {
        return Err(Error(relay_core::ErrorCode::InvalidState,
            std::string("startup() called in state ") + lifecycle_state_name(m_state.load())));
    }
    m_state.store(LifecycleState::Starting);
    logger->info("Starting up (plugins root: {})", m_settings->plugins_root.string());

    m_discovery = std::make_shared<relay_plugin::PluginDiscovery>();
    auto discovered = m_discovery->discover(m_settings->plugins_root);
    if (!discovered) {
        logger->critical("Plugin discovery failed: {}", discovered.error().message());
        shutdown();
        return Err(discovered.error());
    }

    m_planner = std::make_unique<relay_plugin::StartupPlanner>(*m_discovery, m_settings->policy);
    m_plan = std::make_unique<relay_plugin::StartupPlan>(m_planner->get_startup_plan());

    if (m_plan->enabled_services.empty()) {
        logger->warn("No services enabled; running with an empty plan");
    }

    m_kernel = std::make_shared<InstanceKernel>(*m_discovery, m_settings, m_registry);
    m_kernel->register_bootstrap("logger", std::make_shared<LoggerComponent>(logger));
    m_kernel->register_bootstrap("plugins_manager",
        std::make_shared<DiscoveryComponent>(std::shared_ptr<const relay_plugin::PluginDiscovery>(m_discovery)));
    m_kernel->register_bootstrap("settings_manager", std::make_shared<SettingsComponent>(m_settings));

    try {
        m_kernel->initialize(*m_plan);
        spawn_service_tasks();
    } catch (const std::exception& e) {
        logger->critical("Startup failed: {}", e.what());
        shutdown();
        return Err(Error(relay_core::ErrorCode::InvalidState, std::string("Startup failed: ") + e.what()));
    } catch (...) {
        logger->critical("Startup failed: unknown exception");
        shutdown();
        return Err(Error(KernelError::instantiation("startup", "unknown exception")));
    }

    m_state.store(LifecycleState::Running);
    logger->info("Running: {} services, {} utilities, {} background tasks",
        m_plan->total_services, m_plan->total_utilities, m_tasks.size());

    return Ok();
}

void LifecycleController::spawn_service_tasks() {
    auto logger = relay_core::host_logger();

    for (const auto& name : m_plan->enabled_services) {
        if (m_kernel->is_failed(name)) {
            continue;
        }

        auto instance = m_kernel->get(name);
        if (!instance) {
            logger->error("Service '{}' unavailable: {}", name, instance.error().message());
            continue;
        }

        auto runnable = std::dynamic_pointer_cast<Runnable>(*instance);
        if (!runnable) {
            continue;
        }

        logger->info("Starting background task for '{}'", name);
        m_tasks.push_back(BackgroundTask::spawn(name, std::move(runnable)));
    }
}

int LifecycleController::run() {
    auto logger = relay_core::host_logger();

    if (m_handle_signals) {
        install_signal_handlers();
    }

    auto started = startup();
    if (!started) {
        logger->critical("Startup failed: {}", relay_core::build_error_chain(started.error()));
        shutdown();
        return exit_code::Failure;
    }

    {
        std::unique_lock<std::mutex> lock(m_mutex);
        while (!m_shutdown_requested) {
            if (m_handle_signals && g_signal_count.load() > 0) {
                logger->info("Termination signal received, shutting down");
                break;
            }
            m_cv.wait_for(lock, std::chrono::milliseconds(100));
        }
    }

    shutdown();
    return exit_code::Success;
}

void LifecycleController::request_shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shutdown_requested = true;
    }
    m_cv.notify_all();
}

bool LifecycleController::shutdown_requested() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_shutdown_requested;
}

// =============================================================================
// Shutdown
// =============================================================================

void LifecycleController::shutdown() {
    auto current = m_state.load();
    if (current == LifecycleState::ShuttingDown || current == LifecycleState::Stopped) {
        return;
    }
    m_state.store(LifecycleState::ShuttingDown);

    auto logger = relay_core::host_logger();
    logger->info("Shutting down");

    const auto started = std::chrono::steady_clock::now();

    shutdown_kernel_phase();
    shutdown_tasks_phase();

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    m_state.store(LifecycleState::Stopped);
    restore_signal_handlers();
    request_shutdown();

    logger->info("Shutdown complete in {} ms", elapsed.count());
    relay_core::flush_all_loggers();
}

void LifecycleController::shutdown_kernel_phase() {
    if (!m_kernel) {
        return;
    }

    auto logger = relay_core::host_logger();
    auto done = std::make_shared<std::promise<void>>();
    auto future = done->get_future();

    // The worker owns the kernel and its descriptors so it can outlive us
    std::thread([kernel = m_kernel, discovery = m_discovery, done]() {
        try {
            kernel->shutdown();
            done->set_value();
        } catch (...) {
            done->set_exception(std::current_exception());
        }
    }).detach();

    const auto timeout = m_settings->shutdown.kernel_timeout;
    if (future.wait_for(timeout) == std::future_status::timeout) {
        m_kernel_abandoned = true;
        logger->warn("{} after {} ms; abandoning it",
            KernelError::phase_timeout("kernel").message, timeout.count());
        return;
    }

    try {
        future.get();
    } catch (const std::exception& e) {
        logger->error("Kernel shutdown failed: {}", e.what());
    } catch (...) {
        logger->error("Kernel shutdown failed: unknown exception");
    }
}

void LifecycleController::shutdown_tasks_phase() {
    if (m_tasks.empty()) {
        return;
    }

    auto logger = relay_core::host_logger();

    for (auto& task : m_tasks) {
        task->request_stop();
    }

    const auto timeout = m_settings->shutdown.tasks_timeout;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    for (auto& task : m_tasks) {
        if (task->wait_until(deadline)) {
            continue;
        }
        logger->warn("Task '{}' did not stop within {} ms; detaching it", task->name(), timeout.count());
        task->detach();
        ++m_detached_tasks;
    }

    m_tasks.clear();
}

} // namespace relay_kernel
