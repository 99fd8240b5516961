#pragma once

#include "common/config.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace httplib {
    class Server;
    class Request;
    class Response;
    class DataSink;
}

namespace rc_mcp {

class McpHandlers;

// HTTP transport. Serves many connections concurrently on httplib's worker
// pool; holds no per-client state between requests.
//
//   GET  /sse                    endpoint event, then ": ping" every keepalive_interval;
//                                503 once max_streams streams are open
//   POST /mcp, /message, /       one call envelope in, one response envelope out
//   OPTIONS *                    204 with permissive CORS headers
class McpServer {
public:
    McpServer(ServerConfig config, McpHandlers &handlers);
    ~McpServer();

    McpServer(const McpServer &) = delete;
    McpServer &operator=(const McpServer &) = delete;

    // Binds synchronously and serves on a background thread. Port 0 picks a
    // free port. Throws std::runtime_error when the address cannot be bound.
    void start();

    // Stops accepting, ends every SSE stream, then waits up to
    // shutdown_grace for in-flight requests before releasing the listener.
    void stop();

    bool is_running() const;

    uint16_t port() const { return config_.port; }

    std::string message_url() const { return config_.message_url(); }

    size_t active_streams() const { return active_streams_.load(); }

private:
    void setup_routes();
    void handle_message(const httplib::Request &req, httplib::Response &res);
    bool admit_stream();
    void handle_sse(const httplib::Request &req, httplib::Response &res);
    bool write_keepalive(httplib::DataSink &sink);
    void server_thread_func();

    ServerConfig config_;
    McpHandlers &handlers_;

    std::unique_ptr<httplib::Server> http_server_;
    std::unique_ptr<std::thread> server_thread_;
    std::future<void> listen_done_;
    std::atomic<bool> running_{false};

    std::mutex stream_mutex_;
    std::condition_variable stream_cv_;
    bool shutting_down_ = false;
    std::atomic<size_t> active_streams_{0};
};

} // namespace rc_mcp
