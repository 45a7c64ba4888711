#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for vessel_core module

#include <cstdint>

namespace vessel_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct PluginError;
struct RpcError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace vessel_core
