/// @file runtime.hpp
/// @brief Plugin-side runtime: the process a Supervisor launches
///
/// A plugin executable derives from Plugin, overrides the hooks it cares
/// about, and hands itself to run_plugin():
///
/// @code
/// int main() {
///     MyPlugin plugin;
///     return vessel_plugin::run_plugin(plugin);
/// }
/// @endcode

#pragma once

#include "api.hpp"
#include "hook_proxy.hpp"
#include "hooks.hpp"

#include <vessel/core/error.hpp>
#include <vessel/rpc/channel.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace vessel_plugin {

// =============================================================================
// Plugin
// =============================================================================

/// Base class for plugin implementations. Every hook succeeds by default
/// except execute_command, which reports NotSupported.
class Plugin : public Hooks {
public:
    ~Plugin() override = default;

    vessel_core::Result<void> on_activate() override { return vessel_core::Ok(); }
    vessel_core::Result<void> on_deactivate() override { return vessel_core::Ok(); }
    vessel_core::Result<void> on_configuration_change() override { return vessel_core::Ok(); }
    vessel_core::Result<CommandResponse> execute_command(const CommandArgs& args) override;

    /// Host API injected at handshake; null before the handshake
    [[nodiscard]] HostApi* api() const { return m_api; }

    /// Id the host knows this plugin by; empty before the handshake
    [[nodiscard]] const std::string& plugin_id() const { return m_plugin_id; }

private:
    friend class PluginServer;

    HostApi* m_api = nullptr;
    std::string m_plugin_id;
};

// =============================================================================
// PluginServer
// =============================================================================

/// Serves handshake and hook requests from the host against a Plugin.
/// Installs itself as the channel's request handler; construct it before
/// the channel is started and keep it alive until the channel is closed.
class PluginServer {
public:
    PluginServer(Plugin& plugin, vessel_rpc::CallChannel& channel);
    ~PluginServer();

    PluginServer(const PluginServer&) = delete;
    PluginServer& operator=(const PluginServer&) = delete;

    /// Handle one request from the host
    vessel_core::Result<nlohmann::json> handle(const std::string& method, const nlohmann::json& params);

private:
    vessel_core::Result<nlohmann::json> handle_handshake(const nlohmann::json& params);
    vessel_core::Result<nlohmann::json> handle_execute_command(const nlohmann::json& params);

    Plugin& m_plugin;
    ChannelCallTarget m_target;
    RemoteHostApi m_api;
};

/// Serve the plugin over stdin/stdout until the host closes stdin.
/// Logging goes to stderr. Returns the process exit code.
int run_plugin(Plugin& plugin);

} // namespace vessel_plugin
