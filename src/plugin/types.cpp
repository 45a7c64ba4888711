/// @file types.cpp
/// @brief Implementation of vessel_plugin value types

#include <vessel/plugin/types.hpp>

namespace vessel_plugin {

// =============================================================================
// String Conversions
// =============================================================================

const char* to_string(SupervisorState state) {
    switch (state) {
        case SupervisorState::Created: return "Created";
        case SupervisorState::Starting: return "Starting";
        case SupervisorState::Running: return "Running";
        case SupervisorState::Crashed: return "Crashed";
        case SupervisorState::Restarting: return "Restarting";
        case SupervisorState::Stopped: return "Stopped";
        default: return "Unknown";
    }
}

// =============================================================================
// SupervisorConfig
// =============================================================================

namespace {

vessel_core::Result<void> read_duration(const nlohmann::json& j, const char* key,
                                        std::chrono::milliseconds& out) {
    auto it = j.find(key);
    if (it == j.end()) {
        return vessel_core::Ok();
    }
    if (!it->is_number_integer()) {
        return vessel_core::Error(vessel_core::ErrorCode::ParseError,
            std::string("'") + key + "' must be an integer number of milliseconds");
    }
    auto value = it->get<std::int64_t>();
    if (value <= 0) {
        return vessel_core::Error(vessel_core::ErrorCode::ParseError,
            std::string("'") + key + "' must be positive");
    }
    out = std::chrono::milliseconds(value);
    return vessel_core::Ok();
}

} // anonymous namespace

vessel_core::Result<SupervisorConfig> SupervisorConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return vessel_core::Err<SupervisorConfig>(vessel_core::Error(vessel_core::ErrorCode::ParseError,
            "Supervisor configuration must be a JSON object"));
    }

    SupervisorConfig config;
    for (auto [key, field] : {
            std::pair{"start_timeout_ms", &config.start_timeout},
            std::pair{"stop_grace_period_ms", &config.stop_grace_period},
            std::pair{"kill_wait_ms", &config.kill_wait},
            std::pair{"monitor_interval_ms", &config.monitor_interval},
        }) {
        auto result = read_duration(j, key, *field);
        if (!result) {
            return vessel_core::Err<SupervisorConfig>(result.error());
        }
    }
    return config;
}

// =============================================================================
// Hook Payloads
// =============================================================================

void to_json(nlohmann::json& j, const CommandArgs& args) {
    j = nlohmann::json{
        {"command", args.command},
        {"user_id", args.user_id},
        {"channel_id", args.channel_id},
        {"team_id", args.team_id},
    };
}

void from_json(const nlohmann::json& j, CommandArgs& args) {
    args.command = j.value("command", std::string{});
    args.user_id = j.value("user_id", std::string{});
    args.channel_id = j.value("channel_id", std::string{});
    args.team_id = j.value("team_id", std::string{});
}

void to_json(nlohmann::json& j, const CommandResponse& response) {
    j = nlohmann::json{
        {"response_type", response.response_type},
        {"text", response.text},
    };
}

void from_json(const nlohmann::json& j, CommandResponse& response) {
    response.response_type = j.value("response_type", std::string{"ephemeral"});
    response.text = j.value("text", std::string{});
}

} // namespace vessel_plugin
