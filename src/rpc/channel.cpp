/// @file channel.cpp
/// @brief Newline-delimited JSON call channel

#include <vessel/rpc/channel.hpp>
#include <vessel/core/log.hpp>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace vessel_rpc {

using nlohmann::json;

namespace {

std::once_flag g_sigpipe_once;

/// Longest a blocked writer sleeps before rechecking for close or its deadline
constexpr int k_write_poll_ms = 100;

/// Writes to a dead peer must fail with EPIPE instead of killing the process
void ignore_sigpipe() {
    std::call_once(g_sigpipe_once, []() {
        ::signal(SIGPIPE, SIG_IGN);
    });
}

json make_error_frame(const json& id, const vessel_core::Error& error) {
    json frame = json::object();
    frame["id"] = id;
    frame["error"] = json{
        {"code", vessel_core::error_code_name(error.code())},
        {"message", error.message()},
    };
    return frame;
}

std::string remote_error_message(const json& error) {
    if (error.is_string()) {
        return error.get<std::string>();
    }
    if (error.is_object()) {
        auto it = error.find("message");
        if (it != error.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return error.dump();
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

CallChannel::CallChannel(std::string name, int read_fd, int write_fd)
    : m_name(std::move(name))
    , m_read_fd(read_fd)
    , m_write_fd(write_fd) {
    ignore_sigpipe();

    if (m_write_fd >= 0) {
        int flags = ::fcntl(m_write_fd, F_GETFL);
        if (flags < 0 || ::fcntl(m_write_fd, F_SETFL, flags | O_NONBLOCK) < 0) {
            vessel_core::rpc_logger()->warn("[{}] Cannot make writes non-blocking: {}", m_name, std::strerror(errno));
        }
    }
}

CallChannel::~CallChannel() {
    close();
}

void CallChannel::set_request_handler(RequestHandler handler) {
    m_handler = std::move(handler);
}

void CallChannel::start() {
    if (m_started.exchange(true)) {
        return;
    }

    m_reader_thread = std::thread([this]() { reader_loop(); });
    m_dispatch_thread = std::thread([this]() { dispatch_loop(); });
    m_dispatch_id.store(m_dispatch_thread.get_id());
}

// =============================================================================
// Outgoing Calls
// =============================================================================

vessel_core::Result<json> CallChannel::invoke(
    const std::string& method,
    const json& params,
    std::optional<std::chrono::milliseconds> timeout) {

    auto call = std::make_shared<PendingCall>();
    call->method = method;
    auto future = call->promise.get_future();

    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_broken.load()) {
            return vessel_core::Err<json>(vessel_core::RpcError::broken(method));
        }
        id = m_next_id++;
        m_pending[id] = call;
    }

    json frame = json::object();
    frame["id"] = id;
    frame["method"] = method;
    frame["params"] = params;

    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (timeout) {
        deadline = std::chrono::steady_clock::now() + *timeout;
    }

    auto written = write_frame(frame, deadline);
    if (written == WriteStatus::TimedOut) {
        // Nothing reached the peer, so the stream is still intact
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_pending.erase(id) > 0) {
            return vessel_core::Err<json>(vessel_core::RpcError::timeout(method));
        }
    } else if (written == WriteStatus::Failed) {
        // Fails every pending call, this one included
        mark_broken("write failed during " + method);
    }

    if (deadline) {
        if (future.wait_until(*deadline) == std::future_status::timeout) {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_pending.find(id);
            if (it != m_pending.end()) {
                m_pending.erase(it);
                return vessel_core::Err<json>(vessel_core::RpcError::timeout(method));
            }
            // The response raced the deadline; its value is already set
        }
    }

    return future.get();
}

CallChannel::WriteStatus CallChannel::write_frame(
    const json& frame,
    std::optional<std::chrono::steady_clock::time_point> deadline) {

    std::string data = frame.dump(-1, ' ', false, json::error_handler_t::replace);
    data.push_back('\n');

    std::lock_guard<std::mutex> lock(m_write_mutex);
    if (m_write_fd < 0) {
        return WriteStatus::Failed;
    }

    std::size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = ::write(m_write_fd, data.data() + offset, data.size() - offset);
        if (n > 0) {
            offset += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            // Peer is not draining the pipe
            if (m_closing.load() || m_broken.load() || m_write_shutdown.load()) {
                return WriteStatus::Failed;
            }

            int wait_ms = k_write_poll_ms;
            if (deadline) {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    *deadline - std::chrono::steady_clock::now()).count();
                if (remaining <= 0) {
                    if (offset == 0) {
                        return WriteStatus::TimedOut;
                    }
                    // A partial frame leaves the stream unusable
                    vessel_core::rpc_logger()->warn("[{}] write timed out mid-frame", m_name);
                    return WriteStatus::Failed;
                }
                wait_ms = static_cast<int>(std::min<long long>(wait_ms, remaining));
            }

            pollfd pfd{};
            pfd.fd = m_write_fd;
            pfd.events = POLLOUT;
            if (::poll(&pfd, 1, wait_ms) < 0 && errno != EINTR) {
                vessel_core::rpc_logger()->debug("[{}] poll for write failed: {}", m_name, std::strerror(errno));
                return WriteStatus::Failed;
            }
            continue;
        }
        vessel_core::rpc_logger()->debug("[{}] write failed: {}", m_name, std::strerror(errno));
        return WriteStatus::Failed;
    }
    return WriteStatus::Written;
}

// =============================================================================
// Incoming Frames
// =============================================================================

void CallChannel::reader_loop() {
    if (m_read_fd < 0) {
        mark_broken("no read descriptor");
        return;
    }

    std::string buffer;
    char chunk[8192];

    while (!m_closing.load()) {
        pollfd pfd{};
        pfd.fd = m_read_fd;
        pfd.events = POLLIN;

        int rc = ::poll(&pfd, 1, 100);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            mark_broken(std::string("poll failed: ") + std::strerror(errno));
            return;
        }
        if (rc == 0) {
            continue;
        }

        ssize_t n = ::read(m_read_fd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            mark_broken(std::string("read failed: ") + std::strerror(errno));
            return;
        }
        if (n == 0) {
            mark_broken("peer closed the channel");
            return;
        }

        buffer.append(chunk, static_cast<std::size_t>(n));

        std::size_t start = 0;
        std::size_t newline = 0;
        while ((newline = buffer.find('\n', start)) != std::string::npos) {
            if (newline > start) {
                handle_frame(buffer.substr(start, newline - start));
            }
            start = newline + 1;
        }
        buffer.erase(0, start);

        if (buffer.size() > k_max_frame_size) {
            vessel_core::rpc_logger()->error("[{}] {}", m_name,
                vessel_core::RpcError::protocol("frame exceeds size limit").message);
            mark_broken("oversized frame");
            return;
        }
    }
}

void CallChannel::handle_frame(const std::string& line) {
    json frame = json::parse(line, nullptr, false);
    if (frame.is_discarded() || !frame.is_object()) {
        vessel_core::rpc_logger()->warn("[{}] Dropping malformed frame ({} bytes)", m_name, line.size());
        return;
    }

    auto method = frame.find("method");
    if (method == frame.end()) {
        handle_response(frame);
        return;
    }

    if (!method->is_string()) {
        vessel_core::rpc_logger()->warn("[{}] Dropping request with non-string method", m_name);
        return;
    }

    IncomingRequest request;
    if (auto id = frame.find("id"); id != frame.end()) {
        request.id = *id;
    }
    request.method = method->get<std::string>();
    if (auto params = frame.find("params"); params != frame.end()) {
        request.params = *params;
    } else {
        request.params = json::object();
    }

    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        m_queue.push_back(std::move(request));
    }
    m_queue_cv.notify_one();
}

void CallChannel::handle_response(const json& frame) {
    auto id_it = frame.find("id");
    if (id_it == frame.end() || !id_it->is_number_unsigned()) {
        vessel_core::rpc_logger()->warn("[{}] Dropping response without a valid id", m_name);
        return;
    }

    std::uint64_t id = id_it->get<std::uint64_t>();
    std::shared_ptr<PendingCall> call;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_pending.find(id);
        if (it == m_pending.end()) {
            vessel_core::rpc_logger()->debug("[{}] Ignoring late response {}", m_name, id);
            return;
        }
        call = it->second;
        m_pending.erase(it);
    }

    auto error = frame.find("error");
    if (error != frame.end() && !error->is_null()) {
        call->promise.set_value(vessel_core::Err<json>(
            vessel_core::RpcError::remote(call->method, remote_error_message(*error))));
        return;
    }

    auto result = frame.find("result");
    call->promise.set_value(vessel_core::Result<json>(result != frame.end() ? *result : json()));
}

// =============================================================================
// Request Dispatch
// =============================================================================

void CallChannel::dispatch_loop() {
    while (true) {
        IncomingRequest request;
        {
            std::unique_lock<std::mutex> lock(m_queue_mutex);
            m_queue_cv.wait(lock, [this]() {
                return !m_queue.empty() || m_closing.load() || m_broken.load();
            });
            if (m_closing.load() || m_broken.load()) {
                return;
            }
            request = std::move(m_queue.front());
            m_queue.pop_front();
        }

        auto result = [&]() -> vessel_core::Result<json> {
            if (!m_handler) {
                return vessel_core::Err<json>(vessel_core::Error(vessel_core::ErrorCode::NotSupported,
                    "No handler for " + request.method));
            }
            try {
                return m_handler(request.method, request.params);
            } catch (const std::exception& e) {
                // Bad params surface as json type errors; report them to the caller
                vessel_core::rpc_logger()->warn("[{}] Handler for {} threw: {}", m_name, request.method, e.what());
                return vessel_core::Err<json>(vessel_core::Error(vessel_core::ErrorCode::InvalidArgument, e.what()));
            }
        }();

        if (!request.id) {
            continue;
        }

        json frame;
        if (result) {
            frame = json::object();
            frame["id"] = *request.id;
            frame["result"] = std::move(result).value();
        } else {
            frame = make_error_frame(*request.id, result.error());
        }

        if (write_frame(frame) != WriteStatus::Written) {
            mark_broken("write failed while answering " + request.method);
            return;
        }
    }
}

// =============================================================================
// Teardown
// =============================================================================

void CallChannel::mark_broken(const std::string& reason) {
    std::unordered_map<std::uint64_t, std::shared_ptr<PendingCall>> pending;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_broken.exchange(true)) {
            vessel_core::rpc_logger()->debug("[{}] Channel broken: {}", m_name, reason);
        }
        pending.swap(m_pending);
    }
    m_broken_cv.notify_all();

    for (auto& [id, call] : pending) {
        call->promise.set_value(vessel_core::Err<json>(vessel_core::RpcError::broken(call->method)));
    }

    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
    }
    m_queue_cv.notify_all();
}

void CallChannel::shutdown_write() {
    // Releases a writer waiting on a full pipe before taking its lock
    m_write_shutdown.store(true);
    std::lock_guard<std::mutex> lock(m_write_mutex);
    if (m_write_fd >= 0) {
        ::close(m_write_fd);
        m_write_fd = -1;
    }
}

void CallChannel::close() {
    if (in_dispatch_thread()) {
        // Cannot join ourselves; the owning thread finishes the teardown
        vessel_core::rpc_logger()->warn("[{}] close() called from a request handler", m_name);
        shutdown_write();
        mark_broken("channel closed by its own handler");
        return;
    }

    if (m_closing.exchange(true)) {
        return;
    }

    shutdown_write();
    mark_broken("channel closed");

    if (m_reader_thread.joinable()) {
        m_reader_thread.join();
    }
    if (m_dispatch_thread.joinable()) {
        m_dispatch_thread.join();
    }
    m_dispatch_id.store(std::thread::id{});

    if (m_read_fd >= 0) {
        ::close(m_read_fd);
        m_read_fd = -1;
    }
}

void CallChannel::wait_until_broken() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_broken_cv.wait(lock, [this]() { return m_broken.load(); });
}

bool CallChannel::in_dispatch_thread() const {
    return m_dispatch_id.load() == std::this_thread::get_id();
}

std::size_t CallChannel::pending_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.size();
}

} // namespace vessel_rpc
