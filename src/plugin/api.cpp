/// @file api.cpp
/// @brief Host API dispatch (host side) and forwarding (plugin side)

#include <vessel/plugin/api.hpp>
#include <vessel/plugin/hook_proxy.hpp>
#include <vessel/core/log.hpp>

namespace vessel_plugin {

using nlohmann::json;

// =============================================================================
// HostApi
// =============================================================================

vessel_core::Result<void> HostApi::log_message(spdlog::level::level_enum level, const std::string& message) {
    vessel_core::plugin_logger()->log(level, message);
    return vessel_core::Ok();
}

// =============================================================================
// ApiDispatcher
// =============================================================================

ApiDispatcher::ApiDispatcher(std::shared_ptr<HostApi> api, std::string plugin_id)
    : m_api(std::move(api))
    , m_plugin_id(std::move(plugin_id)) {
}

vessel_core::Result<json> ApiDispatcher::operator()(const std::string& method, const json& params) const {
    if (method == protocol::k_log_message) {
        auto level = vessel_core::parse_log_level(params.value("level", std::string{"info"}))
            .value_or(spdlog::level::info);
        std::string message = "[" + m_plugin_id + "] " + params.value("message", std::string{});

        if (!m_api) {
            vessel_core::plugin_logger()->log(level, message);
            return json();
        }
        auto result = m_api->log_message(level, message);
        if (!result) {
            return vessel_core::Err<json>(result.error());
        }
        return json();
    }

    if (method == protocol::k_load_plugin_configuration) {
        if (!m_api) {
            return vessel_core::Err<json>(vessel_core::Error(vessel_core::ErrorCode::NotSupported,
                "Host API not available to plugin '" + m_plugin_id + "'"));
        }
        return m_api->load_plugin_configuration();
    }

    return vessel_core::Err<json>(vessel_core::Error(vessel_core::ErrorCode::NotFound,
        "Unknown host API method: " + method));
}

// =============================================================================
// RemoteHostApi
// =============================================================================

RemoteHostApi::RemoteHostApi(CallTarget& target)
    : m_target(target) {
}

vessel_core::Result<json> RemoteHostApi::load_plugin_configuration() {
    return m_target.call(protocol::k_load_plugin_configuration, json::object());
}

vessel_core::Result<void> RemoteHostApi::log_message(spdlog::level::level_enum level, const std::string& message) {
    json params = json::object();
    params["level"] = vessel_core::log_level_name(level);
    params["message"] = message;

    auto result = m_target.call(protocol::k_log_message, params);
    if (!result) {
        return result.error();
    }
    return vessel_core::Ok();
}

} // namespace vessel_plugin
