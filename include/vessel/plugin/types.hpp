/// @file types.hpp
/// @brief Core types for vessel_plugin
///
/// Provides the value types shared by the host and plugin sides:
/// - Bundle descriptor
/// - Supervisor state and configuration
/// - Command hook payloads
/// - Protocol method names

#pragma once

#include <vessel/core/error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace vessel_plugin {

// =============================================================================
// Bundle
// =============================================================================

/// A plugin's on-disk package as resolved by the host
struct BundleDescriptor {
    std::string id;
    std::filesystem::path root_dir;
    /// Backend executable, relative to root_dir
    std::string executable;
};

// =============================================================================
// Supervisor Types
// =============================================================================

/// Supervisor lifecycle state
enum class SupervisorState : std::uint8_t {
    Created,     ///< Path validated, nothing running
    Starting,    ///< Process spawned, handshake in progress
    Running,     ///< Handshake complete, hooks usable
    Crashed,     ///< Process exited unexpectedly or transport broke
    Restarting,  ///< Replacement process being launched
    Stopped,     ///< Terminal
};

/// Convert supervisor state to string
[[nodiscard]] const char* to_string(SupervisorState state);

/// Supervisor timing configuration
struct SupervisorConfig {
    /// Bound on spawn + handshake + activation, for start and every relaunch
    std::chrono::milliseconds start_timeout{3000};
    /// How long stop() waits for a graceful exit before signalling
    std::chrono::milliseconds stop_grace_period{2000};
    /// How long to wait for the reap after SIGTERM and after SIGKILL
    std::chrono::milliseconds kill_wait{1000};
    /// Liveness poll period of the background monitor
    std::chrono::milliseconds monitor_interval{100};

    SupervisorConfig& with_start_timeout(std::chrono::milliseconds t) { start_timeout = t; return *this; }
    SupervisorConfig& with_stop_grace_period(std::chrono::milliseconds t) { stop_grace_period = t; return *this; }
    SupervisorConfig& with_kill_wait(std::chrono::milliseconds t) { kill_wait = t; return *this; }
    SupervisorConfig& with_monitor_interval(std::chrono::milliseconds t) { monitor_interval = t; return *this; }

    /// Read "*_ms" keys from a JSON object; missing keys keep their defaults
    [[nodiscard]] static vessel_core::Result<SupervisorConfig> from_json(const nlohmann::json& j);
};

// =============================================================================
// Hook Payloads
// =============================================================================

/// Arguments of a slash command routed to a plugin
struct CommandArgs {
    std::string command;
    std::string user_id;
    std::string channel_id;
    std::string team_id;
};

/// Plugin's answer to a command
struct CommandResponse {
    std::string response_type = "ephemeral";
    std::string text;
};

void to_json(nlohmann::json& j, const CommandArgs& args);
void from_json(const nlohmann::json& j, CommandArgs& args);
void to_json(nlohmann::json& j, const CommandResponse& response);
void from_json(const nlohmann::json& j, CommandResponse& response);

// =============================================================================
// Protocol
// =============================================================================

namespace protocol {

inline constexpr int k_version = 1;

inline constexpr const char* k_handshake = "Plugin.Handshake";

inline constexpr const char* k_on_activate = "Hooks.OnActivate";
inline constexpr const char* k_on_deactivate = "Hooks.OnDeactivate";
inline constexpr const char* k_on_configuration_change = "Hooks.OnConfigurationChange";
inline constexpr const char* k_execute_command = "Hooks.ExecuteCommand";

inline constexpr const char* k_load_plugin_configuration = "API.LoadPluginConfiguration";
inline constexpr const char* k_log_message = "API.LogMessage";

} // namespace protocol

} // namespace vessel_plugin
