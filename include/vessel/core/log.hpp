#pragma once

/// @file log.hpp
/// @brief Logging for host and plugin processes
///
/// All loggers of a process share one set of sinks, so reconfiguring
/// redirects every logger at once, including ones already cached by callers.
/// A plugin process must never log to stdout: stdout carries its call channel.

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace vessel_core {

// =============================================================================
// Configuration
// =============================================================================

/// Console destination
enum class ConsoleTarget : std::uint8_t {
    None,
    Stdout,
    Stderr,
};

/// Logging setup for one process
struct LogConfig {
    ConsoleTarget console = ConsoleTarget::Stdout;
    /// Rotating log file shared by all loggers; empty disables file output
    std::string file_path;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;

    /// Console on stderr, level taken from VESSEL_LOG_LEVEL when set
    [[nodiscard]] static LogConfig for_plugin_process();
};

/// Replace the sinks and level of every logger in the process.
/// Call it before other threads start logging.
void configure_logging(const LogConfig& config);

// =============================================================================
// Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Supervisor lifecycle events (spawn, crash, relaunch, stop)
std::shared_ptr<spdlog::logger> supervisor_logger();

/// Call channel traffic and transport failures
std::shared_ptr<spdlog::logger> rpc_logger();

/// Plugin-originated messages, on either side of the channel
std::shared_ptr<spdlog::logger> plugin_logger();

/// Flush every logger
void flush_all_loggers();

// =============================================================================
// Levels
// =============================================================================

/// Parse "trace", "debug", "info", "warn", "error", "critical" or "off"
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Wire name of a level; parse_log_level accepts it back
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Scoped Timing
// =============================================================================

/// Logs entry and exit of a lifecycle step with its duration, at debug level
class LogScope {
public:
    explicit LogScope(std::string name, std::shared_ptr<spdlog::logger> logger = supervisor_logger());
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

#define VESSEL_DETAIL_CONCAT_IMPL(a, b) a##b
#define VESSEL_DETAIL_CONCAT(a, b) VESSEL_DETAIL_CONCAT_IMPL(a, b)
#define VESSEL_LOG_SCOPE(name) ::vessel_core::LogScope VESSEL_DETAIL_CONCAT(vessel_log_scope_, __LINE__)(name)

} // namespace vessel_core
