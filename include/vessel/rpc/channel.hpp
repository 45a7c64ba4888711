/// @file channel.hpp
/// @brief Bidirectional request/response channel over a pair of file descriptors
///
/// Frames are newline-delimited JSON objects:
/// - request:  {"id": 7, "method": "Hooks.OnActivate", "params": {...}}
/// - response: {"id": 7, "result": ...} or {"id": 7, "error": {"code": ..., "message": ...}}
/// - a request without "id" is a notification and gets no response
///
/// Writes never block indefinitely on a peer that stops reading: they wait in
/// short slices and give up at the call's deadline, on close() or on
/// shutdown_write().
///
/// Either end may issue requests. Responses are matched to their request by
/// id, so concurrent invoke() calls never see each other's results. Loss of
/// the peer (EOF, read or write failure) fails every pending and future call
/// with RpcError::Kind::Broken.

#pragma once

#include <vessel/core/error.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

namespace vessel_rpc {

/// Largest accepted frame; anything bigger breaks the channel
inline constexpr std::size_t k_max_frame_size = 16 * 1024 * 1024;

/// Call channel between host and plugin
class CallChannel {
public:
    /// Handler for requests issued by the peer
    using RequestHandler = std::function<vessel_core::Result<nlohmann::json>(
        const std::string& method, const nlohmann::json& params)>;

    /// Takes ownership of both descriptors
    CallChannel(std::string name, int read_fd, int write_fd);
    ~CallChannel();

    CallChannel(const CallChannel&) = delete;
    CallChannel& operator=(const CallChannel&) = delete;

    /// Install the handler for incoming requests. Must be called before start().
    /// Handlers run on the dispatch thread and may invoke() on this channel,
    /// but must not destroy it.
    void set_request_handler(RequestHandler handler);

    /// Start the reader and dispatch threads
    void start();

    /// Issue a request and block until its response, transport loss, or timeout.
    /// The timeout also bounds writing the request.
    [[nodiscard]] vessel_core::Result<nlohmann::json> invoke(
        const std::string& method,
        const nlohmann::json& params = nlohmann::json::object(),
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Close our write side so the peer reads EOF; responses still arrive
    void shutdown_write();

    /// Tear the channel down; pending calls fail as broken. Idempotent.
    /// From a request handler this only breaks the channel; the threads are
    /// joined by a later close() on another thread or by the destructor.
    void close();

    /// Block until the peer goes away or close() is called
    void wait_until_broken();

    [[nodiscard]] bool is_broken() const { return m_broken.load(); }
    [[nodiscard]] const std::string& name() const { return m_name; }
    [[nodiscard]] std::size_t pending_count() const;

    /// True when called from this channel's request handler
    [[nodiscard]] bool in_dispatch_thread() const;

private:
    struct PendingCall {
        std::string method;
        std::promise<vessel_core::Result<nlohmann::json>> promise;
    };

    struct IncomingRequest {
        std::optional<nlohmann::json> id;
        std::string method;
        nlohmann::json params;
    };

    void reader_loop();
    void dispatch_loop();
    void handle_frame(const std::string& line);
    void handle_response(const nlohmann::json& frame);
    enum class WriteStatus : std::uint8_t {
        Written,
        Failed,
        TimedOut,
    };

    WriteStatus write_frame(const nlohmann::json& frame,
                            std::optional<std::chrono::steady_clock::time_point> deadline = std::nullopt);
    void mark_broken(const std::string& reason);

    std::string m_name;
    int m_read_fd;
    int m_write_fd;

    std::atomic<bool> m_started{false};
    std::atomic<bool> m_closing{false};
    std::atomic<bool> m_broken{false};
    std::atomic<bool> m_write_shutdown{false};

    std::mutex m_write_mutex;

    mutable std::mutex m_mutex;
    std::condition_variable m_broken_cv;
    std::uint64_t m_next_id = 1;
    std::unordered_map<std::uint64_t, std::shared_ptr<PendingCall>> m_pending;

    RequestHandler m_handler;
    std::mutex m_queue_mutex;
    std::condition_variable m_queue_cv;
    std::deque<IncomingRequest> m_queue;

    std::thread m_reader_thread;
    std::thread m_dispatch_thread;
    std::atomic<std::thread::id> m_dispatch_id{};
};

} // namespace vessel_rpc
