// relay_kernel LifecycleController tests

#include <catch2/catch_test_macros.hpp>
#include <relay/kernel/lifecycle.hpp>

#include "../support/plugin_tree.hpp"

#include <atomic>
#include <thread>

#if !defined(_WIN32)
#include <csignal>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

using namespace relay_kernel;
using namespace std::chrono_literals;
using relay_core::ErrorCode;
using relay_core::KernelError;
using relay_plugin::AppSettings;

namespace {

struct Flags {
    std::atomic<bool> started{false};
    std::atomic<bool> stopped{false};
    std::atomic<bool> released{false};
};

/// Service that runs until its token stops it
class Poller : public Component, public Runnable {
public:
    explicit Poller(std::shared_ptr<Flags> flags) : m_flags(std::move(flags)) {}

    void run(const StopToken& token) override {
        m_flags->started = true;
        while (!token.wait_for(5ms)) {
        }
        m_flags->stopped = true;
    }

private:
    std::shared_ptr<Flags> m_flags;
};

/// Service that ignores its token until released
class Stubborn : public Component, public Runnable {
public:
    Stubborn(std::shared_ptr<Flags> flags, StopToken release)
        : m_flags(std::move(flags))
        , m_release(std::move(release)) {}

    void run(const StopToken&) override {
        m_flags->started = true;
        m_release.wait();
        m_flags->stopped = true;
    }

private:
    std::shared_ptr<Flags> m_flags;
    StopToken m_release;
};

/// Utility whose teardown outlasts the kernel deadline
class SlowTeardown : public Component, public ShutdownHook {
public:
    explicit SlowTeardown(std::shared_ptr<Flags> flags) : m_flags(std::move(flags)) {}
    ~SlowTeardown() override { m_flags->released = true; }

    void shutdown() override {
        m_flags->started = true;
        std::this_thread::sleep_for(500ms);
        m_flags->stopped = true;
    }

private:
    std::shared_ptr<Flags> m_flags;
};

class Plain : public Component {};

template<typename Predicate>
bool eventually(Predicate predicate, std::chrono::milliseconds limit = 3000ms) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

struct LifecycleFixture {
    relay_test::PluginTree tree;
    ComponentRegistry registry;
    std::shared_ptr<AppSettings> settings = std::make_shared<AppSettings>();

    LifecycleFixture() {
        settings->plugins_root = tree.root();
    }

    template<typename Factory>
    void add(const std::string& relative, const std::string& json, const std::string& name, Factory factory) {
        tree.add(relative, json);
        REQUIRE(registry.register_factory(name, [factory](const Dependencies& deps) -> std::shared_ptr<Component> {
            return factory(deps);
        }).is_ok());
    }

    void enable(const std::string& service) {
        settings->policy.services.enabled.insert(service);
    }

    std::unique_ptr<LifecycleController> controller() {
        auto c = std::make_unique<LifecycleController>(settings, registry);
        c->set_handle_signals(false);
        return c;
    }
};

} // anonymous namespace

TEST_CASE("Lifecycle state names", "[kernel][lifecycle]") {
    REQUIRE(std::string(lifecycle_state_name(LifecycleState::Created)) == "Created");
    REQUIRE(std::string(lifecycle_state_name(LifecycleState::ShuttingDown)) == "ShuttingDown");
    REQUIRE(std::string(lifecycle_state_name(LifecycleState::Stopped)) == "Stopped");
}

TEST_CASE("Lifecycle with an empty plugin tree", "[kernel][lifecycle]") {
    LifecycleFixture fx;
    auto controller = fx.controller();
    REQUIRE(controller->state() == LifecycleState::Created);

    REQUIRE(controller->startup().is_ok());
    REQUIRE(controller->state() == LifecycleState::Running);
    REQUIRE(controller->plan()->empty());
    REQUIRE(controller->task_count() == 0);

    SECTION("startup twice is rejected") {
        auto again = controller->startup();
        REQUIRE(again.is_err());
        REQUIRE(again.error().code() == ErrorCode::InvalidState);
    }

    SECTION("double shutdown") {
        controller->shutdown();
        REQUIRE(controller->state() == LifecycleState::Stopped);
        REQUIRE(controller->kernel()->caches_empty());

        controller->shutdown();
        REQUIRE(controller->state() == LifecycleState::Stopped);
        REQUIRE_FALSE(controller->kernel_shutdown_abandoned());
    }
}

TEST_CASE("Lifecycle starts planned plugins and service tasks", "[kernel][lifecycle]") {
    LifecycleFixture fx;
    auto flags = std::make_shared<Flags>();

    fx.add("utilities/database", R"({"singleton": true})", "database",
        [](const Dependencies&) { return std::make_shared<Plain>(); });
    fx.add("services/poller", R"({"singleton": true, "dependencies": ["database", "logger"]})", "poller",
        [flags](const Dependencies&) { return std::make_shared<Poller>(flags); });
    fx.add("services/dashboard", R"({"singleton": true})", "dashboard",
        [](const Dependencies&) { return std::make_shared<Plain>(); });
    fx.add("services/unused", R"({"singleton": true})", "unused",
        [](const Dependencies&) { return std::make_shared<Plain>(); });
    fx.enable("poller");
    fx.enable("dashboard");

    auto controller = fx.controller();
    REQUIRE(controller->startup().is_ok());

    REQUIRE(controller->discovery()->size() == 4);
    REQUIRE(controller->plan()->enabled_services == (std::vector<std::string>{"dashboard", "poller"}));
    REQUIRE(controller->plan()->dependency_order == std::vector<std::string>{"database"});
    REQUIRE(controller->task_count() == 1);
    REQUIRE(eventually([&] { return flags->started.load(); }));

    auto kernel = controller->kernel();
    REQUIRE(kernel->service_instance_count() == 2);
    REQUIRE(kernel->get("unused").is_err());

    auto discovery = kernel->get_typed<DiscoveryComponent>("plugins_manager");
    REQUIRE(discovery);
    REQUIRE(&discovery->get() == controller->discovery());
    REQUIRE(kernel->get_typed<SettingsComponent>("settings_manager"));
    REQUIRE(kernel->get_typed<LoggerComponent>("logger"));

    controller->shutdown();
    REQUIRE(controller->state() == LifecycleState::Stopped);
    REQUIRE(flags->stopped.load());
    REQUIRE(controller->detached_task_count() == 0);
    REQUIRE_FALSE(controller->has_detached_work());
    REQUIRE(controller->task_count() == 0);
    REQUIRE(kernel->caches_empty());
}

TEST_CASE("Lifecycle startup aborts on a dependency cycle", "[kernel][lifecycle]") {
    LifecycleFixture fx;
    fx.tree.add("utilities/a", R"({"dependencies": ["b"]})");
    fx.tree.add("utilities/b", R"({"dependencies": ["a"]})");

    SECTION("startup reports the cycle") {
        auto controller = fx.controller();
        auto result = controller->startup();
        REQUIRE(result.is_err());
        REQUIRE(result.error().is_kind(KernelError::Kind::GraphCycle));
        REQUIRE(controller->state() == LifecycleState::Stopped);
        REQUIRE(controller->kernel() == nullptr);
    }

    SECTION("run exits with failure") {
        auto controller = fx.controller();
        REQUIRE(controller->run() == exit_code::Failure);
    }
}

TEST_CASE("Lifecycle run returns after request_shutdown", "[kernel][lifecycle]") {
    LifecycleFixture fx;
    auto flags = std::make_shared<Flags>();
    fx.add("services/poller", R"({"singleton": true})", "poller",
        [flags](const Dependencies&) { return std::make_shared<Poller>(flags); });
    fx.enable("poller");

    auto controller = fx.controller();

    std::atomic<bool> saw_start{false};
    std::thread requester([&] {
        saw_start = eventually([&] { return flags->started.load(); });
        controller->request_shutdown();
    });

    const int status = controller->run();
    requester.join();

    REQUIRE(saw_start.load());
    REQUIRE(status == exit_code::Success);
    REQUIRE(controller->shutdown_requested());
    REQUIRE(controller->state() == LifecycleState::Stopped);
    REQUIRE(flags->stopped.load());
}

TEST_CASE("Kernel shutdown phase is bounded", "[kernel][lifecycle]") {
    LifecycleFixture fx;
    auto flags = std::make_shared<Flags>();
    fx.add("utilities/slow", R"({"singleton": true})", "slow",
        [flags](const Dependencies&) { return std::make_shared<SlowTeardown>(flags); });
    fx.add("services/front", R"({"singleton": true, "dependencies": ["slow"]})", "front",
        [](const Dependencies&) { return std::make_shared<Plain>(); });
    fx.enable("front");
    fx.settings->shutdown.kernel_timeout = 50ms;

    auto controller = fx.controller();
    REQUIRE(controller->startup().is_ok());

    const auto started = std::chrono::steady_clock::now();
    controller->shutdown();
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(elapsed < 400ms);
    REQUIRE(controller->kernel_shutdown_abandoned());
    REQUIRE(controller->has_detached_work());
    REQUIRE(controller->state() == LifecycleState::Stopped);

    // The abandoned teardown still completes in the background
    REQUIRE(eventually([&] { return flags->released.load(); }));
    REQUIRE(flags->stopped.load());
}

TEST_CASE("Task shutdown phase detaches stubborn services", "[kernel][lifecycle]") {
    LifecycleFixture fx;
    auto flags = std::make_shared<Flags>();
    auto release = StopToken::create();
    fx.add("services/stubborn", R"({"singleton": true})", "stubborn",
        [flags, release](const Dependencies&) { return std::make_shared<Stubborn>(flags, release); });
    fx.enable("stubborn");
    fx.settings->shutdown.tasks_timeout = 50ms;

    auto controller = fx.controller();
    REQUIRE(controller->startup().is_ok());
    REQUIRE(eventually([&] { return flags->started.load(); }));

    const auto started = std::chrono::steady_clock::now();
    controller->shutdown();
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(elapsed < 1000ms);
    REQUIRE(controller->detached_task_count() == 1);
    REQUIRE(controller->has_detached_work());
    REQUIRE_FALSE(flags->stopped.load());

    release.request_stop();
    REQUIRE(eventually([&] { return flags->stopped.load(); }));
}

#if !defined(_WIN32)

namespace {

void write_marker(int fd, char marker) {
    const ssize_t written = ::write(fd, &marker, 1);
    (void)written;
}

bool read_marker(int fd, char expected, std::chrono::milliseconds limit) {
    pollfd pfd{fd, POLLIN, 0};
    if (::poll(&pfd, 1, static_cast<int>(limit.count())) <= 0) {
        return false;
    }
    char marker = 0;
    return ::read(fd, &marker, 1) == 1 && marker == expected;
}

/// Service that reports once it is running
class Announcer : public Component, public Runnable {
public:
    explicit Announcer(int fd) : m_fd(fd) {}

    void run(const StopToken& token) override {
        write_marker(m_fd, 'r');
        token.wait();
    }

private:
    int m_fd;
};

/// Utility whose teardown hangs after reporting it started
class HangingTeardown : public Component, public ShutdownHook {
public:
    explicit HangingTeardown(int fd) : m_fd(fd) {}

    void shutdown() override {
        write_marker(m_fd, 'h');
        std::this_thread::sleep_for(20s);
    }

private:
    int m_fd;
};

} // anonymous namespace

TEST_CASE("Second termination signal aborts a hung shutdown", "[kernel][lifecycle][signal]") {
    int fds[2];
    REQUIRE(::pipe(fds) == 0);
    const int write_fd = fds[1];

    LifecycleFixture fx;
    fx.add("utilities/hanging", R"({"singleton": true})", "hanging",
        [write_fd](const Dependencies&) { return std::make_shared<HangingTeardown>(write_fd); });
    fx.add("services/announcer", R"({"singleton": true, "dependencies": ["hanging"]})", "announcer",
        [write_fd](const Dependencies&) { return std::make_shared<Announcer>(write_fd); });
    fx.enable("announcer");
    fx.settings->shutdown.kernel_timeout = 30s;
    fx.settings->shutdown.tasks_timeout = 30s;

    const pid_t child = ::fork();
    REQUIRE(child >= 0);

    if (child == 0) {
        ::close(fds[0]);
        int status = exit_code::Failure;
        {
            LifecycleController controller(fx.settings, fx.registry);
            controller.set_handle_signals(true);
            status = controller.run();
        }
        std::_Exit(status);
    }

    ::close(write_fd);
    const auto started = std::chrono::steady_clock::now();

    const bool running = read_marker(fds[0], 'r', 5000ms);
    if (running) {
        ::kill(child, SIGTERM);
    }
    const bool hung = running && read_marker(fds[0], 'h', 5000ms);
    ::kill(child, hung ? SIGTERM : SIGKILL);

    int status = 0;
    REQUIRE(::waitpid(child, &status, 0) == child);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    ::close(fds[0]);

    REQUIRE(running);
    REQUIRE(hung);
    REQUIRE(WIFEXITED(status));
    REQUIRE(WEXITSTATUS(status) == exit_code::Aborted);
    REQUIRE(elapsed < 10s);
}

#endif
