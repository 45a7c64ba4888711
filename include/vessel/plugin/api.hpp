/// @file api.hpp
/// @brief Host API surface injected into plugins
///
/// - HostApi: capabilities the host offers to a plugin
/// - ApiDispatcher: host side, serves plugin requests against a HostApi
/// - RemoteHostApi: plugin side, forwards HostApi calls to the host

#pragma once

#include "types.hpp"

#include <vessel/core/error.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace vessel_plugin {

class CallTarget;

// =============================================================================
// HostApi
// =============================================================================

/// Capabilities the host injects into a plugin at handshake.
/// Methods run on the plugin's channel thread while the plugin waits for the
/// answer: they must not call hooks of, stop, or destroy that plugin's
/// Supervisor. The first two fail with InvalidState.
class HostApi {
public:
    virtual ~HostApi() = default;

    /// The plugin's configuration as stored by the host
    virtual vessel_core::Result<nlohmann::json> load_plugin_configuration() = 0;

    /// Write a message to the host's log. Defaults to the plugins logger.
    virtual vessel_core::Result<void> log_message(spdlog::level::level_enum level, const std::string& message);
};

// =============================================================================
// ApiDispatcher
// =============================================================================

/// Routes "API.*" requests from a plugin process to a HostApi.
/// A null api still accepts log messages; every other call fails.
class ApiDispatcher {
public:
    ApiDispatcher(std::shared_ptr<HostApi> api, std::string plugin_id);

    vessel_core::Result<nlohmann::json> operator()(const std::string& method, const nlohmann::json& params) const;

private:
    std::shared_ptr<HostApi> m_api;
    std::string m_plugin_id;
};

// =============================================================================
// RemoteHostApi
// =============================================================================

/// Plugin-side HostApi that calls back into the host
class RemoteHostApi final : public HostApi {
public:
    explicit RemoteHostApi(CallTarget& target);

    vessel_core::Result<nlohmann::json> load_plugin_configuration() override;
    vessel_core::Result<void> log_message(spdlog::level::level_enum level, const std::string& message) override;

private:
    CallTarget& m_target;
};

} // namespace vessel_plugin
