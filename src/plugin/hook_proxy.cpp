/// @file hook_proxy.cpp
/// @brief Hook forwarding over the call channel

#include <vessel/plugin/hook_proxy.hpp>

namespace vessel_plugin {

using nlohmann::json;

// =============================================================================
// ChannelCallTarget
// =============================================================================

ChannelCallTarget::ChannelCallTarget(
    vessel_rpc::CallChannel& channel,
    std::optional<std::chrono::steady_clock::time_point> deadline)
    : m_channel(channel)
    , m_deadline(deadline) {
}

vessel_core::Result<json> ChannelCallTarget::call(const std::string& method, const json& params) {
    if (!m_deadline) {
        return m_channel.invoke(method, params);
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        *m_deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
        return vessel_core::Err<json>(vessel_core::RpcError::timeout(method));
    }
    return m_channel.invoke(method, params, remaining);
}

// =============================================================================
// HookProxy
// =============================================================================

HookProxy::HookProxy(CallTarget& target)
    : m_target(target) {
}

vessel_core::Result<void> HookProxy::call_void(const char* method) {
    auto result = m_target.call(method, json::object());
    if (!result) {
        return result.error();
    }
    return vessel_core::Ok();
}

vessel_core::Result<void> HookProxy::on_activate() {
    return call_void(protocol::k_on_activate);
}

vessel_core::Result<void> HookProxy::on_deactivate() {
    return call_void(protocol::k_on_deactivate);
}

vessel_core::Result<void> HookProxy::on_configuration_change() {
    return call_void(protocol::k_on_configuration_change);
}

vessel_core::Result<CommandResponse> HookProxy::execute_command(const CommandArgs& args) {
    auto result = m_target.call(protocol::k_execute_command, json(args));
    if (!result) {
        return vessel_core::Err<CommandResponse>(result.error());
    }

    if (!result.value().is_object()) {
        return vessel_core::Err<CommandResponse>(vessel_core::Error(vessel_core::ErrorCode::ParseError,
            "ExecuteCommand returned a non-object response"));
    }

    try {
        return result.value().get<CommandResponse>();
    } catch (const json::exception& e) {
        return vessel_core::Err<CommandResponse>(vessel_core::Error(vessel_core::ErrorCode::ParseError,
            std::string("Malformed ExecuteCommand response: ") + e.what()));
    }
}

} // namespace vessel_plugin
