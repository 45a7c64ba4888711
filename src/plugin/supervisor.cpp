/// @file supervisor.cpp
/// @brief Out-of-process plugin supervision implementation

#include <vessel/plugin/supervisor.hpp>
#include <vessel/plugin/bundle.hpp>
#include <vessel/core/log.hpp>

namespace vessel_plugin {

using nlohmann::json;

namespace {

/// Map a channel failure during spawn/handshake/activation to the start taxonomy
vessel_core::Error translate_start_error(const std::string& plugin_id, const std::string& method,
                                         const vessel_core::Error& error) {
    const auto* rpc = error.as<vessel_core::RpcError>();
    if (!rpc) {
        return error;
    }

    switch (rpc->kind) {
        case vessel_core::RpcError::Kind::Timeout:
            return vessel_core::PluginError::start_timeout(plugin_id);
        case vessel_core::RpcError::Kind::Broken:
            return vessel_core::PluginError::launch_failed(plugin_id, "process exited during " + method);
        case vessel_core::RpcError::Kind::Remote:
            return vessel_core::PluginError::hook_invocation(plugin_id, method, rpc->message);
        default:
            return vessel_core::PluginError::launch_failed(plugin_id, rpc->message);
    }
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

vessel_core::Result<std::unique_ptr<Supervisor>> Supervisor::create(
    BundleDescriptor bundle,
    SupervisorConfig config) {

    auto resolved = resolve_executable(bundle);
    if (!resolved) {
        vessel_core::supervisor_logger()->warn("Rejecting plugin '{}': {}",
            bundle.id, resolved.error().message());
        return vessel_core::Err<std::unique_ptr<Supervisor>>(resolved.error());
    }

    return std::unique_ptr<Supervisor>(
        new Supervisor(std::move(bundle), std::move(resolved).value(), config));
}

Supervisor::Supervisor(BundleDescriptor bundle, std::filesystem::path executable, SupervisorConfig config)
    : m_bundle(std::move(bundle))
    , m_executable(std::move(executable))
    , m_config(config)
    , m_hooks(*this) {
}

Supervisor::~Supervisor() {
    auto result = stop();
    if (!result) {
        vessel_core::supervisor_logger()->error("{}", vessel_core::build_error_chain(result.error()));
    }
}

std::optional<pid_t> Supervisor::pid() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_process) {
        return m_process->pid();
    }
    return std::nullopt;
}

// =============================================================================
// Lifecycle
// =============================================================================

vessel_core::Result<void> Supervisor::start(std::shared_ptr<HostApi> host_api) {
    VESSEL_LOG_SCOPE("Supervisor::start");
    std::lock_guard<std::mutex> launch_lock(m_launch_mutex);

    auto expected = SupervisorState::Created;
    if (!m_state.compare_exchange_strong(expected, SupervisorState::Starting)) {
        return vessel_core::Error(vessel_core::ErrorCode::InvalidState,
            "Plugin '" + m_bundle.id + "' cannot start from state " + to_string(expected));
    }

    m_host_api = std::move(host_api);
    vessel_core::supervisor_logger()->info("Starting plugin '{}' ({})", m_bundle.id, m_executable.string());

    auto result = launch();
    if (!result) {
        m_state.store(SupervisorState::Created);
        vessel_core::supervisor_logger()->error("{}", vessel_core::build_error_chain(result.error()));
        return result;
    }

    start_monitor();
    vessel_core::supervisor_logger()->info("Plugin '{}' running (pid={})", m_bundle.id, pid().value_or(-1));
    return vessel_core::Ok();
}

vessel_core::Result<void> Supervisor::stop() {
    if (in_host_api_callback()) {
        return vessel_core::Error(vessel_core::ErrorCode::InvalidState,
            "Plugin '" + m_bundle.id + "' cannot be stopped from its own host API callback");
    }

    std::lock_guard<std::mutex> launch_lock(m_launch_mutex);
    stop_monitor();

    std::unique_ptr<vessel_rpc::Process> process;
    std::shared_ptr<vessel_rpc::CallChannel> channel;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state.load() == SupervisorState::Stopped) {
            return vessel_core::Ok();
        }
        m_state.store(SupervisorState::Stopped);
        process = std::move(m_process);
        channel = std::move(m_channel);
    }

    vessel_core::Result<void> result = vessel_core::Ok();

    // EOF on the plugin's stdin asks it to exit
    if (channel) {
        channel->shutdown_write();
    }

    if (process && !process->wait_for_exit(m_config.stop_grace_period)) {
        vessel_core::supervisor_logger()->warn("Plugin '{}' (pid={}) ignored shutdown, terminating",
            m_bundle.id, process->pid());
        process->terminate();
        if (!process->wait_for_exit(m_config.kill_wait) && !process->kill(m_config.kill_wait)) {
            auto error = vessel_core::Error(vessel_core::ErrorCode::InvalidState,
                "Could not confirm exit of plugin '" + m_bundle.id + "'");
            error.with_context("pid", std::to_string(process->pid()));
            result = error;
        }
    }

    if (channel) {
        channel->close();
    }

    vessel_core::supervisor_logger()->info("Plugin '{}' stopped", m_bundle.id);
    return result;
}

// =============================================================================
// Launch
// =============================================================================

vessel_core::Result<void> Supervisor::launch() {
    m_launch_attempts.fetch_add(1);
    auto deadline = std::chrono::steady_clock::now() + m_config.start_timeout;

    vessel_rpc::ProcessOptions options;
    options.executable = m_executable;
    options.working_directory = std::filesystem::absolute(m_bundle.root_dir);

    auto spawned = vessel_rpc::Process::spawn(options);
    if (!spawned) {
        return vessel_core::Error(vessel_core::PluginError::launch_failed(m_bundle.id, spawned.error().message()));
    }
    auto process = std::move(spawned).value();

    auto channel = std::make_shared<vessel_rpc::CallChannel>(
        m_bundle.id, process->take_stdout(), process->take_stdin());
    channel->set_request_handler(ApiDispatcher(m_host_api, m_bundle.id));
    channel->start();

    auto result = handshake(*channel, deadline);
    if (!result) {
        if (!process->kill(m_config.kill_wait)) {
            vessel_core::supervisor_logger()->error("Failed to reap plugin '{}' (pid={}) after failed start",
                m_bundle.id, process->pid());
        }
        channel->close();
        result.error().with_context("pid", std::to_string(process->pid()));
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_process = std::move(process);
        m_channel = std::move(channel);
        ++m_generation;
        m_state.store(SupervisorState::Running);
    }
    return vessel_core::Ok();
}

vessel_core::Result<void> Supervisor::handshake(vessel_rpc::CallChannel& channel,
                                                std::chrono::steady_clock::time_point deadline) {
    ChannelCallTarget target(channel, deadline);

    json params = json::object();
    params["protocol_version"] = protocol::k_version;
    params["plugin_id"] = m_bundle.id;

    auto hello = target.call(protocol::k_handshake, params);
    if (!hello) {
        const auto* rpc = hello.error().as<vessel_core::RpcError>();
        if (rpc && rpc->kind == vessel_core::RpcError::Kind::Remote) {
            // Plugin refused the handshake, e.g. protocol version mismatch
            return vessel_core::Error(vessel_core::PluginError::launch_failed(m_bundle.id,
                "handshake rejected: " + rpc->message));
        }
        return translate_start_error(m_bundle.id, protocol::k_handshake, hello.error());
    }

    const json& reply = hello.value();
    auto version = reply.find("protocol_version");
    if (!reply.is_object() || version == reply.end() || !version->is_number_integer() ||
        version->get<int>() != protocol::k_version) {
        return vessel_core::Error(vessel_core::PluginError::launch_failed(m_bundle.id,
            "unsupported handshake reply " + reply.dump()));
    }

    // Activation is part of startup and shares its deadline
    HookProxy proxy(target);
    auto activated = proxy.on_activate();
    if (!activated) {
        return translate_start_error(m_bundle.id, protocol::k_on_activate, activated.error());
    }

    return vessel_core::Ok();
}

// =============================================================================
// Crash Recovery
// =============================================================================

vessel_core::Result<void> Supervisor::relaunch(std::optional<std::uint64_t> observed_generation) {
    auto attempts_before = m_launch_attempts.load();
    std::lock_guard<std::mutex> launch_lock(m_launch_mutex);

    std::unique_ptr<vessel_rpc::Process> old_process;
    std::shared_ptr<vessel_rpc::CallChannel> old_channel;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto state = m_state.load();
        if (state == SupervisorState::Created || state == SupervisorState::Stopped) {
            return vessel_core::Error(vessel_core::PluginError::not_running(m_bundle.id));
        }

        if (state == SupervisorState::Running) {
            if (!observed_generation || *observed_generation != m_generation) {
                // Another caller already replaced the process
                return vessel_core::Ok();
            }
            vessel_core::supervisor_logger()->warn("Plugin '{}' crashed (generation {})",
                m_bundle.id, m_generation);
            m_state.store(SupervisorState::Crashed);
        } else if (m_launch_attempts.load() != attempts_before) {
            // A relaunch ran and failed while we waited; don't stack another timeout on this caller
            return vessel_core::Error(vessel_core::PluginError::launch_failed(m_bundle.id,
                "relaunch attempt failed"));
        }

        old_process = std::move(m_process);
        old_channel = std::move(m_channel);
    }

    if (old_channel) {
        old_channel->close();
    }
    if (old_process) {
        if (!old_process->kill(m_config.kill_wait)) {
            vessel_core::supervisor_logger()->error("Failed to reap crashed plugin '{}' (pid={})",
                m_bundle.id, old_process->pid());
        } else if (auto code = old_process->exit_code()) {
            vessel_core::supervisor_logger()->info("Crashed plugin '{}' exited with status {}",
                m_bundle.id, *code);
        }
    }

    m_state.store(SupervisorState::Restarting);
    vessel_core::supervisor_logger()->info("Relaunching plugin '{}'", m_bundle.id);

    auto result = launch();
    if (!result) {
        m_state.store(SupervisorState::Crashed);
        vessel_core::supervisor_logger()->error("Relaunch failed: {}", vessel_core::build_error_chain(result.error()));
        return result;
    }

    m_restart_count.fetch_add(1);
    vessel_core::supervisor_logger()->info("Plugin '{}' relaunched (pid={}, restarts={})",
        m_bundle.id, pid().value_or(-1), m_restart_count.load());
    return vessel_core::Ok();
}

// =============================================================================
// Hook Forwarding
// =============================================================================

vessel_core::Result<json> Supervisor::call(const std::string& method, const json& params) {
    std::shared_ptr<vessel_rpc::CallChannel> channel;
    std::uint64_t generation = 0;

    auto acquire = [&]() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state.load() == SupervisorState::Running && m_channel) {
            channel = m_channel;
            generation = m_generation;
            return true;
        }
        return false;
    };

    if (!acquire()) {
        auto state = m_state.load();
        if (state == SupervisorState::Created || state == SupervisorState::Stopped) {
            return vessel_core::Err<json>(vessel_core::PluginError::not_running(m_bundle.id));
        }

        // Down since an earlier crash: recover first, then serve this call
        auto recovered = relaunch(std::nullopt);
        if (!recovered) {
            return vessel_core::Err<json>(recovered.error());
        }
        if (!acquire()) {
            return vessel_core::Err<json>(vessel_core::PluginError::not_running(m_bundle.id));
        }
    }

    if (channel->in_dispatch_thread()) {
        // The plugin is blocked on this callback and cannot serve a nested hook
        return vessel_core::Err<json>(vessel_core::Error(vessel_core::ErrorCode::InvalidState,
            "Hook " + method + " called from plugin '" + m_bundle.id + "' host API callback"));
    }

    auto result = channel->invoke(method, params);
    if (result) {
        return result;
    }

    if (vessel_core::is_disconnect(result.error())) {
        vessel_core::supervisor_logger()->warn("Plugin '{}' went away during {}", m_bundle.id, method);
        auto recovered = relaunch(generation);
        if (!recovered) {
            vessel_core::supervisor_logger()->warn("Plugin '{}' still down: {}",
                m_bundle.id, recovered.error().message());
        }
        // The call that observed the crash is not retried
        return vessel_core::Err<json>(vessel_core::PluginError::channel_broken(m_bundle.id, method));
    }

    return vessel_core::Err<json>(translate_call_error(method, result.error()));
}

bool Supervisor::in_host_api_callback() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_channel && m_channel->in_dispatch_thread();
}

vessel_core::Error Supervisor::translate_call_error(const std::string& method, const vessel_core::Error& error) const {
    const auto* rpc = error.as<vessel_core::RpcError>();
    if (rpc && rpc->kind == vessel_core::RpcError::Kind::Remote) {
        return vessel_core::PluginError::hook_invocation(m_bundle.id, method, rpc->message);
    }

    vessel_core::Error translated = error;
    translated.with_context("plugin", m_bundle.id);
    return translated;
}

// =============================================================================
// Monitoring
// =============================================================================

void Supervisor::start_monitor() {
    if (m_monitor_running.exchange(true)) {
        return;
    }

    m_monitor_thread = std::thread([this]() {
        while (m_monitor_running.load()) {
            check_process();

            std::unique_lock<std::mutex> lock(m_monitor_mutex);
            m_monitor_cv.wait_for(lock, m_config.monitor_interval, [this]() {
                return !m_monitor_running.load();
            });
        }
    });
}

void Supervisor::stop_monitor() {
    {
        std::lock_guard<std::mutex> lock(m_monitor_mutex);
        m_monitor_running.store(false);
    }
    m_monitor_cv.notify_all();
    if (m_monitor_thread.joinable()) {
        m_monitor_thread.join();
    }
}

void Supervisor::check_process() {
    std::shared_ptr<vessel_rpc::CallChannel> channel;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state.load() != SupervisorState::Running || !m_process) {
            return;
        }
        if (m_process->is_alive()) {
            return;
        }

        vessel_core::supervisor_logger()->warn("Plugin '{}' (pid={}) exited unexpectedly with status {}",
            m_bundle.id, m_process->pid(), m_process->exit_code().value_or(-1));
        m_state.store(SupervisorState::Crashed);
        channel = std::move(m_channel);
    }

    // Wakes any caller blocked on the dead process
    if (channel) {
        channel->close();
    }
}

} // namespace vessel_plugin
