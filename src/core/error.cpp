/// @file error.cpp
/// @brief Error handling implementation for vessel_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities

#include <vessel/core/error.hpp>
#include <sstream>

namespace vessel_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

const char* plugin_error_kind_name(PluginError::Kind kind) {
    switch (kind) {
        case PluginError::Kind::InvalidExecutablePath: return "InvalidExecutablePath";
        case PluginError::Kind::ExecutableLaunchFailed: return "ExecutableLaunchFailed";
        case PluginError::Kind::StartTimeout: return "StartTimeout";
        case PluginError::Kind::ChannelBroken: return "ChannelBroken";
        case PluginError::Kind::HookInvocationError: return "HookInvocationError";
        case PluginError::Kind::NotRunning: return "NotRunning";
        default: return "Unknown";
    }
}

/// Format plugin error with full context
std::string format_plugin_error(const PluginError& err) {
    std::ostringstream oss;
    oss << "[PluginError:" << plugin_error_kind_name(err.kind) << "] " << err.message;

    if (!err.plugin_id.empty()) {
        oss << " (plugin: " << err.plugin_id << ")";
    }
    if (!err.method.empty()) {
        oss << " (method: " << err.method << ")";
    }

    return oss.str();
}

/// Format channel error with full context
std::string format_rpc_error(const RpcError& err) {
    std::ostringstream oss;
    oss << "[RpcError] " << err.message;

    if (!err.method.empty() && err.kind == RpcError::Kind::Remote) {
        oss << " (method: " << err.method << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, PluginError>) {
            oss << detail::format_plugin_error(err);
        } else if constexpr (std::is_same_v<T, RpcError>) {
            oss << detail::format_rpc_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " " << key << "=" << value;
    }

    return oss.str();
}

bool is_disconnect(const Error& error) {
    if (const auto* rpc = error.as<RpcError>()) {
        return rpc->kind == RpcError::Kind::Broken;
    }
    if (const auto* plugin = error.as<PluginError>()) {
        return plugin->kind == PluginError::Kind::ChannelBroken;
    }
    return false;
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<int, Error>;
template class Result<std::string, Error>;

} // namespace vessel_core
