/// @file supervisor.hpp
/// @brief Supervision of one out-of-process plugin
///
/// The Supervisor owns a plugin process end to end:
/// - executable path validation at construction, before anything is spawned
/// - spawn + handshake + activation, bounded by a startup timeout
/// - a Hooks surface that forwards to the live process
/// - crash detection by a background liveness monitor
/// - call-driven relaunch: the call that observes a crash fails, later
///   calls reach the replacement process
/// - graceful shutdown escalating to a forced kill

#pragma once

#include "api.hpp"
#include "hook_proxy.hpp"
#include "types.hpp"

#include <vessel/core/error.hpp>
#include <vessel/rpc/channel.hpp>
#include <vessel/rpc/process.hpp>

#include <sys/types.h>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace vessel_plugin {

/// Supervisor for a single plugin process
class Supervisor final : private CallTarget {
public:
    /// Validate the bundle's executable path and create a supervisor in
    /// SupervisorState::Created. No process is spawned and the executable
    /// is not required to exist.
    [[nodiscard]] static vessel_core::Result<std::unique_ptr<Supervisor>> create(
        BundleDescriptor bundle,
        SupervisorConfig config = {});

    ~Supervisor() override;

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Launch the plugin and inject host_api (may be null). Blocks until the
    /// plugin is activated, fails to launch, or the start timeout elapses.
    /// On failure no process is left running.
    vessel_core::Result<void> start(std::shared_ptr<HostApi> host_api);

    /// Hooks of the running plugin. Usable from any thread.
    [[nodiscard]] Hooks& hooks() { return m_hooks; }

    /// Shut the plugin down. Idempotent; always ends in Stopped.
    /// Fails with InvalidState when called from this plugin's HostApi callback.
    vessel_core::Result<void> stop();

    // =========================================================================
    // Diagnostics
    // =========================================================================

    [[nodiscard]] SupervisorState state() const { return m_state.load(); }
    [[nodiscard]] const BundleDescriptor& bundle() const { return m_bundle; }
    [[nodiscard]] const std::filesystem::path& executable() const { return m_executable; }
    [[nodiscard]] const SupervisorConfig& config() const { return m_config; }

    /// Process id of the current plugin process, if one is attached
    [[nodiscard]] std::optional<pid_t> pid() const;

    /// Number of successful relaunches after crashes
    [[nodiscard]] std::uint32_t restart_count() const { return m_restart_count.load(); }

private:
    Supervisor(BundleDescriptor bundle, std::filesystem::path executable, SupervisorConfig config);

    vessel_core::Result<nlohmann::json> call(const std::string& method, const nlohmann::json& params) override;

    vessel_core::Result<void> launch();
    vessel_core::Result<void> handshake(vessel_rpc::CallChannel& channel,
                                        std::chrono::steady_clock::time_point deadline);
    vessel_core::Result<void> relaunch(std::optional<std::uint64_t> observed_generation);
    vessel_core::Error translate_call_error(const std::string& method, const vessel_core::Error& error) const;
    bool in_host_api_callback() const;

    void start_monitor();
    void stop_monitor();
    void check_process();

private:
    BundleDescriptor m_bundle;
    std::filesystem::path m_executable;
    SupervisorConfig m_config;
    std::shared_ptr<HostApi> m_host_api;

    std::atomic<SupervisorState> m_state{SupervisorState::Created};

    /// Serialises start, relaunch and stop
    std::mutex m_launch_mutex;

    /// Guards the current process, channel and generation
    mutable std::mutex m_mutex;
    std::unique_ptr<vessel_rpc::Process> m_process;
    std::shared_ptr<vessel_rpc::CallChannel> m_channel;
    std::uint64_t m_generation = 0;

    std::atomic<std::uint32_t> m_restart_count{0};
    std::atomic<std::uint64_t> m_launch_attempts{0};

    HookProxy m_hooks;

    // Monitoring thread
    std::thread m_monitor_thread;
    std::atomic<bool> m_monitor_running{false};
    std::mutex m_monitor_mutex;
    std::condition_variable m_monitor_cv;
};

} // namespace vessel_plugin
