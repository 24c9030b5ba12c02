/// @file background_task.cpp
/// @brief BackgroundTask implementation

#include <relay/kernel/background_task.hpp>
#include <relay/core/log.hpp>

namespace relay_kernel {

BackgroundTask::BackgroundTask(std::string name, Body body)
    : m_name(std::move(name))
    , m_body(std::move(body))
    , m_token(StopToken::create())
    , m_completion(std::make_shared<Completion>()) {}

BackgroundTask::~BackgroundTask() {
    request_stop();
    if (m_thread.joinable()) {
        if (is_finished()) {
            m_thread.join();
        } else {
            m_thread.detach();
        }
    }
}

std::unique_ptr<BackgroundTask> BackgroundTask::spawn(
    const std::string& name,
    std::shared_ptr<Runnable> runnable) {

    auto task = std::make_unique<BackgroundTask>(name,
        [runnable = std::move(runnable)](const StopToken& token) {
            runnable->run(token);
        });
    task->start();
    return task;
}

void BackgroundTask::start() {
    if (m_started) {
        return;
    }
    m_started = true;

    // The thread owns copies of everything it touches so it can outlive the handle
    m_thread = std::thread([name = m_name, body = m_body, token = m_token, completion = m_completion]() {
        auto logger = relay_core::kernel_logger();
        logger->debug("Task '{}' started", name);

        std::optional<std::string> error;
        try {
            body(token);
        } catch (const std::exception& e) {
            error = e.what();
            logger->error("Task '{}' failed: {}", name, e.what());
        } catch (...) {
            error = "unknown exception";
            logger->error("Task '{}' failed: unknown exception", name);
        }

        {
            std::lock_guard<std::mutex> lock(completion->mutex);
            completion->finished = true;
            completion->error = std::move(error);
        }
        completion->cv.notify_all();

        logger->debug("Task '{}' finished", name);
    });
}

void BackgroundTask::request_stop() {
    m_token.request_stop();
}

bool BackgroundTask::wait_until(std::chrono::steady_clock::time_point deadline) {
    if (!m_started) {
        return true;
    }

    bool finished = false;
    {
        std::unique_lock<std::mutex> lock(m_completion->mutex);
        finished = m_completion->cv.wait_until(lock, deadline, [this]() {
            return m_completion->finished;
        });
    }

    if (finished && m_thread.joinable()) {
        m_thread.join();
    }
    return finished;
}

void BackgroundTask::detach() {
    if (m_thread.joinable()) {
        m_thread.detach();
        m_detached = true;
    }
}

bool BackgroundTask::is_finished() const {
    std::lock_guard<std::mutex> lock(m_completion->mutex);
    return m_completion->finished;
}

std::optional<std::string> BackgroundTask::error() const {
    std::lock_guard<std::mutex> lock(m_completion->mutex);
    return m_completion->error;
}

} // namespace relay_kernel
