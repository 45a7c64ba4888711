/// @file process.cpp
/// @brief fork/exec based child process handle

#include <vessel/rpc/process.hpp>
#include <vessel/core/log.hpp>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

namespace vessel_rpc {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

/// Child side: report errno through the exec-status pipe and exit.
/// Only async-signal-safe calls are allowed here.
[[noreturn]] void report_exec_failure(int status_fd) {
    int err = errno;
    ssize_t written = ::write(status_fd, &err, sizeof(err));
    (void)written;
    ::_exit(127);
}

std::string errno_message(const std::string& what, int err) {
    return what + ": " + std::strerror(err);
}

} // anonymous namespace

// =============================================================================
// Spawning
// =============================================================================

vessel_core::Result<std::unique_ptr<Process>> Process::spawn(const ProcessOptions& options) {
    using ResultType = vessel_core::Result<std::unique_ptr<Process>>;

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    auto close_all = [&]() {
        close_fd(stdin_pipe[0]);
        close_fd(stdin_pipe[1]);
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        close_fd(status_pipe[0]);
        close_fd(status_pipe[1]);
    };

    if (::pipe2(stdin_pipe, O_CLOEXEC) < 0 ||
        ::pipe2(stdout_pipe, O_CLOEXEC) < 0 ||
        ::pipe2(status_pipe, O_CLOEXEC) < 0) {
        int err = errno;
        close_all();
        return ResultType(vessel_core::Error(vessel_core::ErrorCode::IOError,
            errno_message("Failed to create pipes", err)));
    }

    // Everything the child touches is prepared before fork
    const std::string exe = options.executable.string();
    const std::string cwd = options.working_directory.string();
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(exe.c_str()));
    for (const auto& arg : options.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        close_all();
        return ResultType(vessel_core::Error(vessel_core::ErrorCode::IOError,
            errno_message("fork() failed", err)));
    }

    if (pid == 0) {
        // New process group for clean group-kill on shutdown
        ::setpgid(0, 0);

        // The host ignores SIGPIPE; ignored dispositions survive execv
        ::signal(SIGPIPE, SIG_DFL);

        if (::dup2(stdin_pipe[0], STDIN_FILENO) < 0 ||
            ::dup2(stdout_pipe[1], STDOUT_FILENO) < 0) {
            report_exec_failure(status_pipe[1]);
        }
        if (!cwd.empty() && ::chdir(cwd.c_str()) < 0) {
            report_exec_failure(status_pipe[1]);
        }

        ::execv(exe.c_str(), argv.data());
        report_exec_failure(status_pipe[1]);
    }

    // Parent: mirror the child's setpgid; fails harmlessly once the child has exec'd
    if (::setpgid(pid, pid) < 0 && errno != EACCES && errno != ESRCH) {
        vessel_core::rpc_logger()->debug("setpgid({}) failed: {}", pid, std::strerror(errno));
    }

    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(status_pipe[1]);

    // The status pipe is close-on-exec: EOF means exec succeeded
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        close_all();
        return ResultType(vessel_core::Error(vessel_core::ErrorCode::IOError,
            errno_message("Cannot execute " + exe, child_errno)));
    }

    vessel_core::rpc_logger()->debug("Spawned {} (pid={}, cwd={})", exe, pid, cwd);

    return ResultType(std::unique_ptr<Process>(
        new Process(pid, stdin_pipe[1], stdout_pipe[0], options.executable)));
}

Process::Process(pid_t pid, int stdin_fd, int stdout_fd, std::filesystem::path executable)
    : m_pid(pid)
    , m_stdin_fd(stdin_fd)
    , m_stdout_fd(stdout_fd)
    , m_executable(std::move(executable)) {
}

Process::~Process() {
    close_fd(m_stdin_fd);
    close_fd(m_stdout_fd);

    if (!kill(std::chrono::seconds(1))) {
        vessel_core::rpc_logger()->error("Process {} (pid={}) did not exit after SIGKILL",
            m_executable.string(), m_pid);
    }
}

// =============================================================================
// Pipes
// =============================================================================

int Process::take_stdin() {
    std::lock_guard<std::mutex> lock(m_mutex);
    int fd = m_stdin_fd;
    m_stdin_fd = -1;
    return fd;
}

int Process::take_stdout() {
    std::lock_guard<std::mutex> lock(m_mutex);
    int fd = m_stdout_fd;
    m_stdout_fd = -1;
    return fd;
}

// =============================================================================
// Liveness
// =============================================================================

bool Process::reap_locked(bool block) {
    if (m_reaped) {
        return true;
    }

    int status = 0;
    pid_t result = 0;
    do {
        result = ::waitpid(m_pid, &status, block ? 0 : WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == m_pid) {
        if (WIFEXITED(status)) {
            m_exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            m_exit_code = 128 + WTERMSIG(status);
        }
        m_reaped = true;
        return true;
    }

    if (result < 0 && errno == ECHILD) {
        // Already collected elsewhere; nothing left to wait for
        m_reaped = true;
        return true;
    }

    return false;
}

bool Process::is_alive() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return !reap_locked(false);
}

std::optional<int> Process::exit_code() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_exit_code;
}

bool Process::wait_for_exit(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (reap_locked(false)) {
                return true;
            }
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

// =============================================================================
// Termination
// =============================================================================

void Process::signal_group(int sig) {
    if (::killpg(m_pid, sig) == 0) {
        return;
    }
    // Group may not exist yet if the child never reached setpgid
    if (::kill(m_pid, sig) < 0 && errno != ESRCH) {
        vessel_core::rpc_logger()->warn("Failed to signal pid {}: {}", m_pid, std::strerror(errno));
    }
}

void Process::terminate() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!reap_locked(false)) {
        signal_group(SIGTERM);
    }
}

bool Process::kill(std::chrono::milliseconds timeout) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (reap_locked(false)) {
            return true;
        }
        vessel_core::rpc_logger()->debug("Killing {} (pid={})", m_executable.string(), m_pid);
        signal_group(SIGKILL);
    }
    return wait_for_exit(timeout);
}

} // namespace vessel_rpc
