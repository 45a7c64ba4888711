/// @file process.hpp
/// @brief Child process handle for out-of-process plugins
///
/// A Process owns one spawned executable:
/// - stdin/stdout connected to pipes handed to the call channel
/// - stderr inherited so plugin logs reach the host's console
/// - its own process group so a kill reaches everything it started
/// - launch failures (missing file, bad permissions, bad cwd) reported
///   synchronously by spawn()

#pragma once

#include <vessel/core/error.hpp>

#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vessel_rpc {

/// Spawn parameters
struct ProcessOptions {
    std::filesystem::path executable;
    std::filesystem::path working_directory;
    std::vector<std::string> args;
};

/// Handle for a spawned child process
class Process {
public:
    /// Spawn the executable. Fails without leaving a child behind.
    [[nodiscard]] static vessel_core::Result<std::unique_ptr<Process>> spawn(const ProcessOptions& options);

    /// Kills and reaps the child if it is still running
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    /// OS process id
    [[nodiscard]] pid_t pid() const { return m_pid; }

    /// Executable this process was started from
    [[nodiscard]] const std::filesystem::path& executable() const { return m_executable; }

    /// Hand over the write end of the child's stdin (caller owns it afterwards)
    [[nodiscard]] int take_stdin();

    /// Hand over the read end of the child's stdout (caller owns it afterwards)
    [[nodiscard]] int take_stdout();

    /// Non-blocking liveness check; reaps the child if it has exited
    [[nodiscard]] bool is_alive();

    /// Exit status once reaped (128 + signal for signalled exits)
    [[nodiscard]] std::optional<int> exit_code() const;

    /// Wait up to timeout for the child to exit. True once reaped.
    [[nodiscard]] bool wait_for_exit(std::chrono::milliseconds timeout);

    /// Ask the process group to exit (SIGTERM)
    void terminate();

    /// SIGKILL the process group and wait up to timeout for the reap.
    /// True if the child is confirmed gone.
    [[nodiscard]] bool kill(std::chrono::milliseconds timeout);

private:
    Process(pid_t pid, int stdin_fd, int stdout_fd, std::filesystem::path executable);

    bool reap_locked(bool block);
    void signal_group(int sig);

    pid_t m_pid;
    int m_stdin_fd;
    int m_stdout_fd;
    std::filesystem::path m_executable;

    mutable std::mutex m_mutex;
    bool m_reaped = false;
    std::optional<int> m_exit_code;
};

} // namespace vessel_rpc
