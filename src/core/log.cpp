/// @file log.cpp
/// @brief Logging implementation for vessel

#include <vessel/core/log.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <map>
#include <mutex>
#include <vector>

namespace vessel_core {

namespace {

constexpr const char* k_console_pattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
constexpr const char* k_file_pattern = "[%Y-%m-%d %H:%M:%S.%e] [pid %P] [%l] [%n] %v";

/// Process-wide logging state
struct LogState {
    std::mutex mutex;
    std::vector<spdlog::sink_ptr> sinks;
    spdlog::level::level_enum level = spdlog::level::info;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
};

std::vector<spdlog::sink_ptr> make_sinks(const LogConfig& config, std::string& file_error) {
    std::vector<spdlog::sink_ptr> sinks;

    switch (config.console) {
        case ConsoleTarget::Stdout:
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
            break;
        case ConsoleTarget::Stderr:
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
            break;
        case ConsoleTarget::None:
            break;
    }
    for (auto& sink : sinks) {
        sink->set_pattern(k_console_pattern);
    }

    if (!config.file_path.empty()) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path, config.max_file_size, config.max_files);
            file_sink->set_pattern(k_file_pattern);
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }

    return sinks;
}

// Never destroyed; detached plugin threads may log during static teardown
LogState& state() {
    static LogState* s = []() {
        auto* fresh = new LogState();
        std::string ignored;
        fresh->sinks = make_sinks(LogConfig{}, ignored);
        return fresh;
    }();
    return *s;
}

std::shared_ptr<spdlog::logger> make_logger(LogState& st, const std::string& name) {
    auto logger = std::make_shared<spdlog::logger>(name, st.sinks.begin(), st.sinks.end());
    logger->set_level(st.level);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

} // anonymous namespace

// =============================================================================
// Configuration
// =============================================================================

LogConfig LogConfig::for_plugin_process() {
    LogConfig config;
    config.console = ConsoleTarget::Stderr;
    if (const char* env = std::getenv("VESSEL_LOG_LEVEL")) {
        config.level = parse_log_level(env).value_or(config.level);
    }
    return config;
}

void configure_logging(const LogConfig& config) {
    auto& st = state();
    std::string file_error;
    std::shared_ptr<spdlog::logger> default_logger;
    {
        std::lock_guard<std::mutex> lock(st.mutex);
        st.sinks = make_sinks(config, file_error);
        st.level = config.level;

        for (auto& [name, logger] : st.loggers) {
            logger->sinks() = st.sinks;
            logger->set_level(st.level);
        }
        default_logger = make_logger(st, "vessel");
    }
    spdlog::set_default_logger(default_logger);

    if (!file_error.empty()) {
        default_logger->warn("Failed to open log file '{}': {}", config.file_path, file_error);
    }
}

// =============================================================================
// Loggers
// =============================================================================

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& st = state();
    std::lock_guard<std::mutex> lock(st.mutex);

    auto it = st.loggers.find(name);
    if (it != st.loggers.end()) {
        return it->second;
    }

    auto logger = make_logger(st, name);
    st.loggers.emplace(name, logger);
    return logger;
}

std::shared_ptr<spdlog::logger> supervisor_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("supervisor");
    return logger;
}

std::shared_ptr<spdlog::logger> rpc_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("rpc");
    return logger;
}

std::shared_ptr<spdlog::logger> plugin_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("plugins");
    return logger;
}

void flush_all_loggers() {
    auto& st = state();
    std::lock_guard<std::mutex> lock(st.mutex);
    for (auto& sink : st.sinks) {
        sink->flush();
    }
}

// =============================================================================
// Levels
// =============================================================================

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error" || str == "err") return spdlog::level::err;
    if (str == "critical") return spdlog::level::critical;
    if (str == "off") return spdlog::level::off;
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "info";
    }
}

// =============================================================================
// Scoped Timing
// =============================================================================

LogScope::LogScope(std::string name, std::shared_ptr<spdlog::logger> logger)
    : m_name(std::move(name))
    , m_logger(std::move(logger))
    , m_start(std::chrono::steady_clock::now()) {
    m_logger->debug("{} ...", m_name);
}

LogScope::~LogScope() {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - m_start);
    m_logger->debug("{} done in {}ms", m_name, elapsed.count());
}

} // namespace vessel_core
