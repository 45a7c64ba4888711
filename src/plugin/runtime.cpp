/// @file runtime.cpp
/// @brief Plugin-side runtime implementation

#include <vessel/plugin/runtime.hpp>
#include <vessel/core/log.hpp>

#include <unistd.h>

namespace vessel_plugin {

using nlohmann::json;

// =============================================================================
// Plugin
// =============================================================================

vessel_core::Result<CommandResponse> Plugin::execute_command(const CommandArgs& args) {
    return vessel_core::Err<CommandResponse>(vessel_core::Error(vessel_core::ErrorCode::NotSupported,
        "Command not supported: " + args.command));
}

// =============================================================================
// PluginServer
// =============================================================================

PluginServer::PluginServer(Plugin& plugin, vessel_rpc::CallChannel& channel)
    : m_plugin(plugin)
    , m_target(channel)
    , m_api(m_target) {
    channel.set_request_handler([this](const std::string& method, const json& params) {
        return handle(method, params);
    });
}

PluginServer::~PluginServer() {
    if (m_plugin.m_api == &m_api) {
        m_plugin.m_api = nullptr;
    }
}

vessel_core::Result<json> PluginServer::handle(const std::string& method, const json& params) {
    if (method == protocol::k_handshake) {
        return handle_handshake(params);
    }
    if (method == protocol::k_execute_command) {
        return handle_execute_command(params);
    }

    vessel_core::Result<void> result = vessel_core::Ok();
    if (method == protocol::k_on_activate) {
        result = m_plugin.on_activate();
    } else if (method == protocol::k_on_deactivate) {
        result = m_plugin.on_deactivate();
    } else if (method == protocol::k_on_configuration_change) {
        result = m_plugin.on_configuration_change();
    } else {
        return vessel_core::Err<json>(vessel_core::Error(vessel_core::ErrorCode::NotFound,
            "Unknown hook: " + method));
    }

    if (!result) {
        vessel_core::plugin_logger()->debug("{} failed: {}", method, result.error().message());
        return vessel_core::Err<json>(result.error());
    }
    return json();
}

vessel_core::Result<json> PluginServer::handle_handshake(const json& params) {
    if (!params.is_object()) {
        return vessel_core::Err<json>(vessel_core::Error(vessel_core::ErrorCode::InvalidArgument,
            "Handshake parameters must be an object"));
    }

    int version = params.value("protocol_version", 0);
    if (version != protocol::k_version) {
        return vessel_core::Err<json>(vessel_core::Error(vessel_core::ErrorCode::NotSupported,
            "Unsupported protocol version " + std::to_string(version)));
    }

    m_plugin.m_plugin_id = params.value("plugin_id", std::string{});
    m_plugin.m_api = &m_api;
    vessel_core::plugin_logger()->info("Handshake complete for '{}' (pid={})", m_plugin.m_plugin_id, ::getpid());

    json reply = json::object();
    reply["protocol_version"] = protocol::k_version;
    return reply;
}

vessel_core::Result<json> PluginServer::handle_execute_command(const json& params) {
    CommandArgs args;
    try {
        args = params.get<CommandArgs>();
    } catch (const json::exception& e) {
        return vessel_core::Err<json>(vessel_core::Error(vessel_core::ErrorCode::ParseError,
            std::string("Malformed ExecuteCommand arguments: ") + e.what()));
    }

    auto result = m_plugin.execute_command(args);
    if (!result) {
        return vessel_core::Err<json>(result.error());
    }
    return json(result.value());
}

// =============================================================================
// Entry Point
// =============================================================================

int run_plugin(Plugin& plugin) {
    vessel_core::configure_logging(vessel_core::LogConfig::for_plugin_process());

    // Keep the channel on a private descriptor so stray writes to stdout land on stderr
    int channel_out = ::dup(STDOUT_FILENO);
    if (channel_out < 0 || ::dup2(STDERR_FILENO, STDOUT_FILENO) < 0) {
        vessel_core::plugin_logger()->critical("Failed to take over stdout for the call channel");
        return 1;
    }

    vessel_rpc::CallChannel channel("host", STDIN_FILENO, channel_out);
    PluginServer server(plugin, channel);
    channel.start();

    channel.wait_until_broken();
    channel.close();

    vessel_core::plugin_logger()->info("Host closed the channel, exiting");
    vessel_core::flush_all_loggers();
    return 0;
}

} // namespace vessel_plugin
