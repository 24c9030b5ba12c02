#pragma once

/// @file background_task.hpp
/// @brief Thread running one service entry point with cooperative stop

#include "fwd.hpp"
#include "component.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace relay_kernel {

/// Handle to a long-running service entry point.
///
/// The body runs on its own thread and receives a StopToken. The owner
/// requests stop, waits up to a deadline, and detaches the thread if it has
/// not returned by then; it never kills it.
class BackgroundTask {
public:
    using Body = std::function<void(const StopToken&)>;

    BackgroundTask(std::string name, Body body);

    /// Requests stop and detaches if the thread is still running
    ~BackgroundTask();

    // Non-copyable, non-movable
    BackgroundTask(const BackgroundTask&) = delete;
    BackgroundTask& operator=(const BackgroundTask&) = delete;
    BackgroundTask(BackgroundTask&&) = delete;
    BackgroundTask& operator=(BackgroundTask&&) = delete;

    /// Start a task running `runnable->run(token)`
    [[nodiscard]] static std::unique_ptr<BackgroundTask> spawn(
        const std::string& name,
        std::shared_ptr<Runnable> runnable);

    /// Start the thread (no-op if already started)
    void start();

    /// Ask the body to return
    void request_stop();

    /// Wait until the body returns or `deadline` passes.
    /// Joins the thread on success. @return true if the body returned.
    bool wait_until(std::chrono::steady_clock::time_point deadline);

    /// Stop waiting for the thread; it keeps its shared state alive
    void detach();

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] StopToken token() const { return m_token; }
    [[nodiscard]] bool is_started() const noexcept { return m_started; }
    [[nodiscard]] bool is_finished() const;
    [[nodiscard]] bool is_detached() const noexcept { return m_detached; }

    /// Error message if the body threw
    [[nodiscard]] std::optional<std::string> error() const;

private:
    struct Completion {
        std::mutex mutex;
        std::condition_variable cv;
        bool finished = false;
        std::optional<std::string> error;
    };

    std::string m_name;
    Body m_body;
    StopToken m_token;
    std::shared_ptr<Completion> m_completion;
    std::thread m_thread;
    bool m_started = false;
    bool m_detached = false;
};

} // namespace relay_kernel
