// relay_kernel background task tests

#include <catch2/catch_test_macros.hpp>
#include <relay/kernel/background_task.hpp>

#include <atomic>
#include <stdexcept>

using namespace relay_kernel;
using namespace std::chrono_literals;

namespace {

class CountingService : public Component, public Runnable {
public:
    void run(const StopToken& token) override {
        while (!token.wait_for(5ms)) {
            ++ticks;
        }
        stopped = true;
    }

    std::atomic<int> ticks{0};
    std::atomic<bool> stopped{false};
};

auto deadline_in(std::chrono::milliseconds ms) {
    return std::chrono::steady_clock::now() + ms;
}

} // anonymous namespace

TEST_CASE("BackgroundTask cooperative stop", "[kernel][task]") {
    auto service = std::make_shared<CountingService>();
    auto task = BackgroundTask::spawn("counter", service);

    REQUIRE(task->is_started());
    REQUIRE(task->name() == "counter");

    task->request_stop();
    REQUIRE(task->wait_until(deadline_in(2000ms)));
    REQUIRE(task->is_finished());
    REQUIRE(service->stopped.load());
    REQUIRE_FALSE(task->error().has_value());
}

TEST_CASE("BackgroundTask records a failing body", "[kernel][task]") {
    BackgroundTask task("failing", [](const StopToken&) {
        throw std::runtime_error("connection refused");
    });
    task.start();

    REQUIRE(task.wait_until(deadline_in(2000ms)));
    REQUIRE(task.error() == std::optional<std::string>("connection refused"));
}

TEST_CASE("BackgroundTask records a non-standard exception", "[kernel][task]") {
    BackgroundTask task("opaque", [](const StopToken&) {
        throw 42;
    });
    task.start();

    REQUIRE(task.wait_until(deadline_in(2000ms)));
    REQUIRE(task.is_finished());
    REQUIRE(task.error() == std::optional<std::string>("unknown exception"));
}

TEST_CASE("BackgroundTask deadline and detach", "[kernel][task]") {
    auto release = StopToken::create();
    auto finished = std::make_shared<std::atomic<bool>>(false);

    auto task = std::make_unique<BackgroundTask>("stubborn", [release, finished](const StopToken&) {
        // Ignores its own token until the test releases it
        release.wait();
        *finished = true;
    });
    task->start();
    task->request_stop();

    auto started = std::chrono::steady_clock::now();
    REQUIRE_FALSE(task->wait_until(deadline_in(50ms)));
    REQUIRE(std::chrono::steady_clock::now() - started < 1000ms);

    task->detach();
    REQUIRE(task->is_detached());
    task.reset();

    release.request_stop();
    for (int i = 0; i < 200 && !finished->load(); ++i) {
        std::this_thread::sleep_for(5ms);
    }
    REQUIRE(finished->load());
}

TEST_CASE("BackgroundTask that never started", "[kernel][task]") {
    BackgroundTask task("idle", [](const StopToken&) {});
    REQUIRE_FALSE(task.is_started());
    REQUIRE(task.wait_until(deadline_in(1ms)));
}
