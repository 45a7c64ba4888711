/// @file hooks.hpp
/// @brief Capability set a plugin exposes to the host

#pragma once

#include "types.hpp"

#include <vessel/core/error.hpp>

namespace vessel_plugin {

/// Hooks the host invokes on a plugin.
///
/// Implemented plugin-side by Plugin and host-side by HookProxy, which
/// forwards every method across the call channel.
class Hooks {
public:
    virtual ~Hooks() = default;

    /// Plugin was started; the host API is available
    virtual vessel_core::Result<void> on_activate() = 0;

    /// Plugin is about to be disabled
    virtual vessel_core::Result<void> on_deactivate() = 0;

    /// The plugin's configuration changed on the host
    virtual vessel_core::Result<void> on_configuration_change() = 0;

    /// A slash command registered by the plugin was invoked
    virtual vessel_core::Result<CommandResponse> execute_command(const CommandArgs& args) = 0;
};

} // namespace vessel_plugin
