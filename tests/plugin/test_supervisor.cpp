// vessel_plugin Supervisor tests
//
// Each test launches real plugin processes built from tests/plugin/backends/.

#include <catch2/catch.hpp>
#include <vessel/plugin/supervisor.hpp>

#include "bundle_fixture.hpp"

#include <signal.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <fstream>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace vessel_plugin;
using namespace vessel_core;
using nlohmann::json;
using namespace std::chrono_literals;

namespace {

/// Host API whose answers steer the echo backend
class TestHostApi final : public HostApi {
public:
    Result<json> load_plugin_configuration() override {
        if (int expected = hold_for_callers.exchange(0); expected > 0) {
            // Keep the plugin busy until every caller has its request in flight
            auto deadline = std::chrono::steady_clock::now() + 5s;
            while (callers.load() < expected && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(5ms);
            }
            std::this_thread::sleep_for(100ms);
        }
        if (on_load) {
            on_load();
        }
        return json{{"crash", crash.load()}, {"valid", valid.load()}};
    }

    Result<void> log_message(spdlog::level::level_enum, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex);
        messages.push_back(message);
        return Ok();
    }

    std::atomic<bool> crash{false};
    std::atomic<bool> valid{true};

    std::atomic<int> hold_for_callers{0};
    std::atomic<int> callers{0};
    std::function<void()> on_load;

    std::mutex mutex;
    std::vector<std::string> messages;
};

SupervisorConfig test_config() {
    return SupervisorConfig{}
        .with_start_timeout(5000ms)
        .with_stop_grace_period(2000ms)
        .with_kill_wait(1000ms)
        .with_monitor_interval(20ms);
}

bool process_exists(pid_t pid) {
    return ::kill(pid, 0) == 0 || errno != ESRCH;
}

PluginError::Kind plugin_error_kind(const Error& error) {
    const auto* plugin = error.as<PluginError>();
    REQUIRE(plugin != nullptr);
    return plugin->kind;
}

std::unique_ptr<Supervisor> make_supervisor(const vessel_test::TempBundle& bundle,
                                            SupervisorConfig config = test_config()) {
    auto result = Supervisor::create(bundle.descriptor(), config);
    REQUIRE(result.is_ok());
    return std::move(result).value();
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

TEST_CASE("Supervisor rejects executables outside the bundle", "[plugin][supervisor]") {
    vessel_test::TempBundle bundle("escape", vessel_test::k_echo_backend);

    auto result = Supervisor::create(bundle.descriptor("../backend.exe"));
    REQUIRE(result.is_err());
    REQUIRE(plugin_error_kind(result.error()) == PluginError::Kind::InvalidExecutablePath);
}

TEST_CASE("Supervisor creation does not spawn", "[plugin][supervisor]") {
    vessel_test::TempBundle bundle("lazy");

    auto supervisor = make_supervisor(bundle);
    REQUIRE(supervisor->state() == SupervisorState::Created);
    REQUIRE_FALSE(supervisor->pid().has_value());
    REQUIRE(supervisor->executable().filename() == "backend.exe");

    auto result = supervisor->hooks().on_activate();
    REQUIRE(result.is_err());
    REQUIRE(plugin_error_kind(result.error()) == PluginError::Kind::NotRunning);
}

// =============================================================================
// Start
// =============================================================================

TEST_CASE("Supervisor start and stop", "[plugin][supervisor]") {
    vessel_test::TempBundle bundle("echo", vessel_test::k_echo_backend);
    auto api = std::make_shared<TestHostApi>();
    auto supervisor = make_supervisor(bundle);

    REQUIRE(supervisor->start(api).is_ok());
    REQUIRE(supervisor->state() == SupervisorState::Running);

    auto pid = supervisor->pid();
    REQUIRE(pid.has_value());
    REQUIRE(process_exists(*pid));

    {
        // Activation ran during start and called back into the host
        std::lock_guard<std::mutex> lock(api->mutex);
        REQUIRE(api->messages.size() == 1);
        REQUIRE(api->messages[0] == "[echo] echo plugin activated");
    }

    REQUIRE(supervisor->hooks().on_deactivate().is_ok());

    REQUIRE(supervisor->stop().is_ok());
    REQUIRE(supervisor->state() == SupervisorState::Stopped);
    REQUIRE_FALSE(supervisor->pid().has_value());
    REQUIRE_FALSE(process_exists(*pid));
    REQUIRE(supervisor->restart_count() == 0);
}

TEST_CASE("Supervisor start without a host API", "[plugin][supervisor]") {
    vessel_test::TempBundle bundle("no-api", vessel_test::k_echo_backend);
    auto supervisor = make_supervisor(bundle);

    REQUIRE(supervisor->start(nullptr).is_ok());

    // The backend asks for its configuration, which a null API cannot serve
    auto result = supervisor->hooks().on_configuration_change();
    REQUIRE(result.is_err());
    REQUIRE(plugin_error_kind(result.error()) == PluginError::Kind::HookInvocationError);

    REQUIRE(supervisor->stop().is_ok());
}

TEST_CASE("Supervisor start fails for a missing executable", "[plugin][supervisor]") {
    vessel_test::TempBundle bundle("missing");
    auto supervisor = make_supervisor(bundle);

    auto result = supervisor->start(std::make_shared<TestHostApi>());
    REQUIRE(result.is_err());
    REQUIRE(plugin_error_kind(result.error()) == PluginError::Kind::ExecutableLaunchFailed);
    REQUIRE(supervisor->state() == SupervisorState::Created);
    REQUIRE_FALSE(supervisor->pid().has_value());

    SECTION("start can be retried once the executable exists") {
        auto target = bundle.root() / "backend.exe";
        std::filesystem::copy_file(vessel_test::k_echo_backend, target);
        std::filesystem::permissions(target, std::filesystem::perms::owner_all,
            std::filesystem::perm_options::add);

        REQUIRE(supervisor->start(std::make_shared<TestHostApi>()).is_ok());
        REQUIRE(supervisor->state() == SupervisorState::Running);
        REQUIRE(supervisor->stop().is_ok());
    }
}

TEST_CASE("Supervisor start fails when the plugin exits early", "[plugin][supervisor]") {
    vessel_test::TempBundle bundle("quitter", vessel_test::k_exit_backend);
    auto supervisor = make_supervisor(bundle);

    auto result = supervisor->start(std::make_shared<TestHostApi>());
    REQUIRE(result.is_err());
    REQUIRE(plugin_error_kind(result.error()) == PluginError::Kind::ExecutableLaunchFailed);
    REQUIRE(supervisor->state() == SupervisorState::Created);
}

TEST_CASE("Supervisor start timeout kills the plugin", "[plugin][supervisor]") {
    vessel_test::TempBundle bundle("spin", vessel_test::k_spin_backend);
    auto supervisor = make_supervisor(bundle, test_config().with_start_timeout(500ms));

    auto begin = std::chrono::steady_clock::now();
    auto result = supervisor->start(std::make_shared<TestHostApi>());
    auto elapsed = std::chrono::steady_clock::now() - begin;

    REQUIRE(result.is_err());
    REQUIRE(plugin_error_kind(result.error()) == PluginError::Kind::StartTimeout);
    REQUIRE(elapsed < 3s);
    REQUIRE(supervisor->state() == SupervisorState::Created);

    pid_t pid = 0;
    std::ifstream(bundle.root() / "backend.pid") >> pid;
    REQUIRE(pid > 0);
    REQUIRE_FALSE(process_exists(pid));
}

// =============================================================================
// Hooks
// =============================================================================

TEST_CASE("Supervisor reports plugin errors without relaunching", "[plugin][supervisor]") {
    vessel_test::TempBundle bundle("picky", vessel_test::k_echo_backend);
    auto api = std::make_shared<TestHostApi>();
    auto supervisor = make_supervisor(bundle);
    REQUIRE(supervisor->start(api).is_ok());
    auto pid = supervisor->pid();

    api->valid = false;
    auto result = supervisor->hooks().on_configuration_change();
    REQUIRE(result.is_err());
    const auto* err = result.error().as<PluginError>();
    REQUIRE(err != nullptr);
    REQUIRE(err->kind == PluginError::Kind::HookInvocationError);
    REQUIRE(err->message == "configuration rejected");
    REQUIRE(err->method == protocol::k_on_configuration_change);

    REQUIRE(supervisor->state() == SupervisorState::Running);
    REQUIRE(supervisor->pid() == pid);

    api->valid = true;
    REQUIRE(supervisor->hooks().on_configuration_change().is_ok());
}

TEST_CASE("Supervisor execute_command", "[plugin][supervisor]") {
    vessel_test::TempBundle bundle("commands", vessel_test::k_echo_backend);
    auto supervisor = make_supervisor(bundle);
    REQUIRE(supervisor->start(std::make_shared<TestHostApi>()).is_ok());

    auto result = supervisor->hooks().execute_command(CommandArgs{"/echo", "alice", "town-square", "team"});
    REQUIRE(result.is_ok());
    REQUIRE(result.value().response_type == "in_channel");
    REQUIRE(result.value().text == "/echo from alice in town-square/team");
}

TEST_CASE("Supervisor serves concurrent callers", "[plugin][supervisor]") {
    vessel_test::TempBundle bundle("busy", vessel_test::k_echo_backend);
    auto supervisor = make_supervisor(bundle);
    REQUIRE(supervisor->start(std::make_shared<TestHostApi>()).is_ok());

    constexpr int k_threads = 8;
    constexpr int k_calls = 10;
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < k_threads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < k_calls; ++i) {
                std::string user = "user" + std::to_string(t) + "-" + std::to_string(i);
                auto result = supervisor->hooks().execute_command(CommandArgs{"/who", user, "c", "t"});
                if (!result || result.value().text != "/who from " + user + " in c/t") {
                    failures.fetch_add(1);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(failures.load() == 0);
}

// =============================================================================
// Crash Recovery
// =============================================================================

TEST_CASE("Supervisor relaunches after a crash during a call", "[plugin][supervisor]") {
    vessel_test::TempBundle bundle("crashy", vessel_test::k_echo_backend);
    auto api = std::make_shared<TestHostApi>();
    auto supervisor = make_supervisor(bundle);
    REQUIRE(supervisor->start(api).is_ok());
    auto first_pid = supervisor->pid();
    REQUIRE(first_pid.has_value());

    api->crash = true;
    auto crashed = supervisor->hooks().on_deactivate();
    REQUIRE(crashed.is_err());
    REQUIRE(plugin_error_kind(crashed.error()) == PluginError::Kind::ChannelBroken);

    api->crash = false;
    bool recovered = false;
    for (int attempt = 0; attempt < 30 && !recovered; ++attempt) {
        recovered = supervisor->hooks().on_deactivate().is_ok();
        if (!recovered) {
            std::this_thread::sleep_for(100ms);
        }
    }
    REQUIRE(recovered);

    REQUIRE(supervisor->state() == SupervisorState::Running);
    REQUIRE(supervisor->restart_count() >= 1);
    auto second_pid = supervisor->pid();
    REQUIRE(second_pid.has_value());
    REQUIRE(*second_pid != *first_pid);
    REQUIRE_FALSE(process_exists(*first_pid));

    REQUIRE(supervisor->stop().is_ok());
    REQUIRE_FALSE(process_exists(*second_pid));
}

TEST_CASE("Supervisor relaunches once for callers sharing a crash", "[plugin][supervisor]") {
    vessel_test::TempBundle bundle("crowd", vessel_test::k_echo_backend);
    auto api = std::make_shared<TestHostApi>();
    auto supervisor = make_supervisor(bundle, test_config().with_monitor_interval(1000ms));
    REQUIRE(supervisor->start(api).is_ok());
    auto first_pid = supervisor->pid();
    REQUIRE(first_pid.has_value());

    constexpr int k_callers = 8;
    api->crash = true;
    api->hold_for_callers = k_callers;

    std::atomic<int> broken{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < k_callers; ++t) {
        threads.emplace_back([&]() {
            api->callers.fetch_add(1);
            auto result = supervisor->hooks().on_deactivate();
            if (result.is_err()) {
                const auto* err = result.error().as<PluginError>();
                if (err && err->kind == PluginError::Kind::ChannelBroken) {
                    broken.fetch_add(1);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(broken.load() == k_callers);
    REQUIRE(supervisor->restart_count() == 1);
    REQUIRE(supervisor->state() == SupervisorState::Running);

    auto second_pid = supervisor->pid();
    REQUIRE(second_pid.has_value());
    REQUIRE(*second_pid != *first_pid);
    REQUIRE(process_exists(*second_pid));
    REQUIRE_FALSE(process_exists(*first_pid));

    api->crash = false;
    REQUIRE(supervisor->hooks().on_deactivate().is_ok());
    REQUIRE(supervisor->restart_count() == 1);
    REQUIRE(supervisor->pid() == second_pid);

    REQUIRE(supervisor->stop().is_ok());
}

TEST_CASE("Supervisor retries a failed relaunch on the next call", "[plugin][supervisor]") {
    vessel_test::TempBundle bundle("flaky", vessel_test::k_echo_backend);
    auto api = std::make_shared<TestHostApi>();
    auto supervisor = make_supervisor(bundle);
    REQUIRE(supervisor->start(api).is_ok());
    auto first_pid = supervisor->pid();

    auto executable = bundle.root() / "backend.exe";
    auto parked = bundle.root() / "backend.parked";
    std::filesystem::rename(executable, parked);

    api->crash = true;
    auto crashed = supervisor->hooks().on_deactivate();
    REQUIRE(crashed.is_err());
    REQUIRE(plugin_error_kind(crashed.error()) == PluginError::Kind::ChannelBroken);
    REQUIRE(supervisor->state() == SupervisorState::Crashed);
    api->crash = false;

    auto missing = supervisor->hooks().on_deactivate();
    REQUIRE(missing.is_err());
    REQUIRE(plugin_error_kind(missing.error()) == PluginError::Kind::ExecutableLaunchFailed);
    REQUIRE(supervisor->state() == SupervisorState::Crashed);
    REQUIRE_FALSE(supervisor->pid().has_value());
    REQUIRE(supervisor->restart_count() == 0);

    std::filesystem::rename(parked, executable);

    REQUIRE(supervisor->hooks().on_deactivate().is_ok());
    REQUIRE(supervisor->state() == SupervisorState::Running);
    REQUIRE(supervisor->restart_count() == 1);
    REQUIRE(supervisor->pid().has_value());
    REQUIRE(supervisor->pid() != first_pid);

    REQUIRE(supervisor->stop().is_ok());
}

TEST_CASE("Supervisor monitor notices a plugin that dies between calls", "[plugin][supervisor]") {
    vessel_test::TempBundle bundle("fragile", vessel_test::k_echo_backend);
    auto supervisor = make_supervisor(bundle);
    REQUIRE(supervisor->start(std::make_shared<TestHostApi>()).is_ok());

    REQUIRE(supervisor->hooks().execute_command(CommandArgs{"/exit-soon", "u", "c", "t"}).is_ok());

    bool crashed = false;
    for (int attempt = 0; attempt < 100 && !crashed; ++attempt) {
        std::this_thread::sleep_for(20ms);
        crashed = supervisor->state() == SupervisorState::Crashed;
    }
    REQUIRE(crashed);
    REQUIRE(supervisor->restart_count() == 0);

    // The next call relaunches first and is then served
    REQUIRE(supervisor->hooks().on_deactivate().is_ok());
    REQUIRE(supervisor->state() == SupervisorState::Running);
    REQUIRE(supervisor->restart_count() == 1);
}

// =============================================================================
// Stop
// =============================================================================

TEST_CASE("Supervisor stop is idempotent", "[plugin][supervisor]") {
    vessel_test::TempBundle bundle("twice", vessel_test::k_echo_backend);
    auto supervisor = make_supervisor(bundle);

    SECTION("after start") {
        REQUIRE(supervisor->start(std::make_shared<TestHostApi>()).is_ok());
        REQUIRE(supervisor->stop().is_ok());
        REQUIRE(supervisor->stop().is_ok());
    }

    SECTION("never started") {
        REQUIRE(supervisor->stop().is_ok());
        REQUIRE(supervisor->stop().is_ok());
    }

    REQUIRE(supervisor->state() == SupervisorState::Stopped);

    auto call = supervisor->hooks().on_activate();
    REQUIRE(call.is_err());
    REQUIRE(plugin_error_kind(call.error()) == PluginError::Kind::NotRunning);

    auto restart = supervisor->start(std::make_shared<TestHostApi>());
    REQUIRE(restart.is_err());
    REQUIRE(restart.error().code() == ErrorCode::InvalidState);
}

TEST_CASE("Supervisor stop escalates to kill", "[plugin][supervisor]") {
    vessel_test::TempBundle bundle("stubborn", vessel_test::k_echo_backend);
    auto supervisor = make_supervisor(bundle, test_config()
        .with_stop_grace_period(200ms)
        .with_kill_wait(500ms));
    REQUIRE(supervisor->start(std::make_shared<TestHostApi>()).is_ok());
    auto pid = supervisor->pid();

    REQUIRE(supervisor->hooks().execute_command(CommandArgs{"/stubborn", "u", "c", "t"}).is_ok());

    auto begin = std::chrono::steady_clock::now();
    REQUIRE(supervisor->stop().is_ok());
    REQUIRE(std::chrono::steady_clock::now() - begin < 3s);
    REQUIRE_FALSE(process_exists(*pid));
}

TEST_CASE("Supervisor refuses re-entry from a host API callback", "[plugin][supervisor]") {
    vessel_test::TempBundle bundle("reentrant", vessel_test::k_echo_backend);
    auto api = std::make_shared<TestHostApi>();
    auto supervisor = make_supervisor(bundle);
    REQUIRE(supervisor->start(api).is_ok());

    std::atomic<bool> stop_refused{false};
    std::atomic<bool> hook_refused{false};
    api->on_load = [&]() {
        auto stopped = supervisor->stop();
        stop_refused = stopped.is_err() && stopped.error().code() == ErrorCode::InvalidState;
        auto nested = supervisor->hooks().on_activate();
        hook_refused = nested.is_err() && nested.error().code() == ErrorCode::InvalidState;
    };

    // on_configuration_change loads the configuration through the host API
    REQUIRE(supervisor->hooks().on_configuration_change().is_ok());
    api->on_load = nullptr;

    REQUIRE(stop_refused.load());
    REQUIRE(hook_refused.load());
    REQUIRE(supervisor->state() == SupervisorState::Running);
    REQUIRE(supervisor->stop().is_ok());
}

TEST_CASE("Supervisor destructor stops the plugin", "[plugin][supervisor]") {
    vessel_test::TempBundle bundle("scoped", vessel_test::k_echo_backend);
    std::optional<pid_t> pid;
    {
        auto supervisor = make_supervisor(bundle);
        REQUIRE(supervisor->start(std::make_shared<TestHostApi>()).is_ok());
        pid = supervisor->pid();
    }
    REQUIRE(pid.has_value());
    REQUIRE_FALSE(process_exists(*pid));
}
