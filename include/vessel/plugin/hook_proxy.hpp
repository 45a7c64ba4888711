/// @file hook_proxy.hpp
/// @brief Host-side Hooks implementation that forwards over a call channel

#pragma once

#include "hooks.hpp"

#include <vessel/core/error.hpp>
#include <vessel/rpc/channel.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace vessel_plugin {

// =============================================================================
// CallTarget
// =============================================================================

/// Something that can carry a remote call: a raw channel, or a Supervisor
/// that adds crash recovery around one
class CallTarget {
public:
    virtual ~CallTarget() = default;

    virtual vessel_core::Result<nlohmann::json> call(const std::string& method, const nlohmann::json& params) = 0;
};

/// CallTarget over one channel, optionally bounded by an absolute deadline
class ChannelCallTarget final : public CallTarget {
public:
    explicit ChannelCallTarget(
        vessel_rpc::CallChannel& channel,
        std::optional<std::chrono::steady_clock::time_point> deadline = std::nullopt);

    vessel_core::Result<nlohmann::json> call(const std::string& method, const nlohmann::json& params) override;

private:
    vessel_rpc::CallChannel& m_channel;
    std::optional<std::chrono::steady_clock::time_point> m_deadline;
};

// =============================================================================
// HookProxy
// =============================================================================

/// Marshals each hook into one remote method and decodes the reply.
/// Errors from the target are returned unchanged.
class HookProxy final : public Hooks {
public:
    explicit HookProxy(CallTarget& target);

    vessel_core::Result<void> on_activate() override;
    vessel_core::Result<void> on_deactivate() override;
    vessel_core::Result<void> on_configuration_change() override;
    vessel_core::Result<CommandResponse> execute_command(const CommandArgs& args) override;

private:
    vessel_core::Result<void> call_void(const char* method);

    CallTarget& m_target;
};

} // namespace vessel_plugin
