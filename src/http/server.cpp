#include "http/server.hpp"
#include "http/handlers.hpp"
#include "protocol/jsonrpc.hpp"
#include "common/log.hpp"

#include <httplib.h>

#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace rc_mcp {

namespace {
    constexpr const char *kMessagePaths = R"(/(mcp|message)?/?)";
    constexpr const char *kSsePath = R"(/sse/?)";
    constexpr auto kStreamPollSlice = std::chrono::milliseconds(500);

    void send_status(httplib::Response &res, int status, const std::string &message) {
        res.status = status;
        res.set_content(encode_error(nullptr, rpc_error::kInvalidRequest, message), "application/json");
    }

    void method_not_allowed(const httplib::Request &, httplib::Response &res) {
        send_status(res, 405, "Method not allowed");
    }
}

McpServer::McpServer(ServerConfig config, McpHandlers &handlers)
    : config_(std::move(config)), handlers_(handlers) {
}

McpServer::~McpServer() {
    stop();
}

void McpServer::start() {
    if (running_) {
        log_msg("Server already running on %s\n", message_url().c_str());
        return;
    }

    http_server_ = std::make_unique<httplib::Server>();
    {
        std::lock_guard<std::mutex> lock(stream_mutex_);
        shutting_down_ = false;
    }
    setup_routes();

    if (config_.port == 0) {
        int bound = http_server_->bind_to_any_port(config_.host);
        if (bound <= 0) {
            http_server_.reset();
            throw std::runtime_error("Failed to bind " + config_.host + " on any port");
        }
        config_.port = static_cast<uint16_t>(bound);
    } else if (!http_server_->bind_to_port(config_.host, config_.port)) {
        http_server_.reset();
        throw std::runtime_error("Failed to bind " + config_.host + ":" + std::to_string(config_.port));
    }

    running_ = true;
    std::packaged_task<void()> listen_task([this]() { server_thread_func(); });
    listen_done_ = listen_task.get_future();
    server_thread_ = std::make_unique<std::thread>(std::move(listen_task));

    log_msg("=== RC MCP Server Started ===\n");
    log_msg("SSE: http://%s:%u/sse\n", config_.host.c_str(), static_cast<unsigned>(config_.port));
    log_msg("Messages: %s\n", message_url().c_str());
}

void McpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(stream_mutex_);
        shutting_down_ = true;
    }
    stream_cv_.notify_all();

    // Closes the listener; the listen thread then drains httplib's worker pool.
    http_server_->stop();

    if (listen_done_.wait_for(config_.shutdown_grace) == std::future_status::ready) {
        server_thread_->join();
        server_thread_.reset();
        http_server_.reset();
        log_msg("Server stopped\n");
        return;
    }

    // Handlers are still blocked (usually on a long tool call). They keep
    // referencing the server, so it is handed to the straggling thread.
    log_warn("Requests still in flight after %lld ms, abandoning them\n",
             static_cast<long long>(config_.shutdown_grace.count()));
    server_thread_->detach();
    server_thread_.reset();
    static_cast<void>(http_server_.release());
}

bool McpServer::is_running() const {
    return running_;
}

void McpServer::server_thread_func() {
    try {
        if (!http_server_->listen_after_bind()) {
            log_warn("Listener exited with an error\n");
        }
    } catch (const std::exception &e) {
        log_error("Server error: %s\n", e.what());
    }
}

void McpServer::setup_routes() {
    // Each open stream pins a worker, so streams get their own share.
    const size_t workers = std::max<size_t>(1, config_.worker_threads) + std::max<size_t>(1, config_.max_streams);
    http_server_->new_task_queue = [workers] { return new httplib::ThreadPool(workers); };

    http_server_->set_default_headers({
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
        {"Access-Control-Allow-Headers", "Content-Type"}
    });

    http_server_->Options(".*", [](const httplib::Request &, httplib::Response &res) {
        res.status = 204;
    });

    http_server_->Get(kSsePath, [this](const httplib::Request &req, httplib::Response &res) {
        handle_sse(req, res);
    });

    http_server_->Post(kMessagePaths, [this](const httplib::Request &req, httplib::Response &res) {
        handle_message(req, res);
    });

    http_server_->Get(kMessagePaths, method_not_allowed);
    http_server_->Put(kMessagePaths, method_not_allowed);
    http_server_->Delete(kMessagePaths, method_not_allowed);
    http_server_->Patch(kMessagePaths, method_not_allowed);
    http_server_->Post(kSsePath, method_not_allowed);
    http_server_->Put(kSsePath, method_not_allowed);
    http_server_->Delete(kSsePath, method_not_allowed);
    http_server_->Patch(kSsePath, method_not_allowed);

    // Unmatched paths arrive here with an empty body.
    http_server_->set_error_handler([](const httplib::Request &, httplib::Response &res) {
        if (res.body.empty()) {
            send_status(res, res.status, res.status == 404 ? "Not found" : "Request failed");
        }
    });

    http_server_->set_exception_handler([](const httplib::Request &, httplib::Response &res,
                                           std::exception_ptr ep) {
        std::string message = "Internal error";
        try {
            if (ep) std::rethrow_exception(ep);
        } catch (const std::exception &e) {
            message = e.what();
        }
        log_error("Request error: %s\n", message.c_str());
        res.status = 500;
        res.set_content(encode_error(nullptr, rpc_error::kInternalError, message), "application/json");
    });
}

void McpServer::handle_message(const httplib::Request &req, httplib::Response &res) {
    log_debug("Message request received: %s %s\n", req.method.c_str(), req.path.c_str());

    auto response = handlers_.handle_message(req.body);
    if (!response) {
        res.status = 202;
        return;
    }

    res.status = 200;
    res.set_content(*response, "application/json");
}

bool McpServer::admit_stream() {
    const size_t limit = std::max<size_t>(1, config_.max_streams);
    size_t current = active_streams_.load();
    while (current < limit) {
        if (active_streams_.compare_exchange_weak(current, current + 1)) {
            return true;
        }
    }
    return false;
}

void McpServer::handle_sse(const httplib::Request &, httplib::Response &res) {
    if (!admit_stream()) {
        log_warn("Refusing SSE connection, %lu streams already open\n",
                 static_cast<unsigned long>(active_streams_.load()));
        res.status = 503;
        res.set_content(encode_error(nullptr, rpc_error::kInternalError, "Too many open streams"),
                        "application/json");
        return;
    }
    log_msg("SSE connection received\n");

    res.set_header("Cache-Control", "no-cache");
    res.set_header("X-Accel-Buffering", "no");

    const std::string endpoint_event = "event: endpoint\r\ndata: " + message_url() + "\r\n\r\n";
    auto endpoint_sent = std::make_shared<bool>(false);

    res.set_chunked_content_provider(
        "text/event-stream",
        [this, endpoint_event, endpoint_sent](size_t, httplib::DataSink &sink) {
            if (!*endpoint_sent) {
                *endpoint_sent = true;
                log_debug("Sending endpoint event: %s\n", message_url().c_str());
                return sink.write(endpoint_event.data(), endpoint_event.size());
            }
            return write_keepalive(sink);
        },
        [this](bool) {
            --active_streams_;
            log_msg("SSE connection closed\n");
        });
}

// Waits one keepalive interval, then emits a ping comment. Returns false to
// drop the connection once the client is gone; ends the stream on shutdown.
bool McpServer::write_keepalive(httplib::DataSink &sink) {
    const auto deadline = std::chrono::steady_clock::now() + config_.keepalive_interval;

    std::unique_lock<std::mutex> lock(stream_mutex_);
    while (!shutting_down_) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        stream_cv_.wait_for(lock, std::min<std::chrono::milliseconds>(remaining, kStreamPollSlice),
                            [this] { return shutting_down_; });
        if (!shutting_down_ && !sink.is_writable()) {
            return false;
        }
    }

    if (shutting_down_) {
        lock.unlock();
        sink.done();
        return true;
    }
    lock.unlock();

    static const std::string ping = ": ping\r\n\r\n";
    return sink.write(ping.data(), ping.size());
}

} // namespace rc_mcp
