/// @file bundle.hpp
/// @brief Bundle executable resolution

#pragma once

#include "types.hpp"

#include <vessel/core/error.hpp>

#include <filesystem>

namespace vessel_plugin {

/// Resolve the bundle's executable to an absolute path inside its root.
///
/// An absolute executable path is taken relative to the root. ".." segments
/// are collapsed and symlinks along existing prefixes are followed; a result
/// outside the root fails with PluginError::Kind::InvalidExecutablePath.
/// The executable itself need not exist.
[[nodiscard]] vessel_core::Result<std::filesystem::path> resolve_executable(const BundleDescriptor& bundle);

/// Build a descriptor from <dir>/plugin.json:
/// {"id": "...", "backend": {"executable": "..."}}
[[nodiscard]] vessel_core::Result<BundleDescriptor> load_bundle(const std::filesystem::path& dir);

} // namespace vessel_plugin
