#include <gtest/gtest.h>
#include <httplib.h>
#include "test_support.hpp"
#include "dispatch/affinity_executor.hpp"
#include "http/handlers.hpp"
#include "http/server.hpp"
#include "tools/tool_registry.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

namespace {

using rc_mcp::AffinityExecutor;
using rc_mcp::McpHandlers;
using rc_mcp::McpServer;
using rc_mcp::ServerConfig;
using rc_mcp::ToolRegistry;
using rc_mcp::testing::FaultProvider;
using rc_mcp::testing::SampleProvider;
using rc_mcp::testing::TimingProvider;

ServerConfig test_config() {
    ServerConfig config;
    config.host = "127.0.0.1";
    config.port = 0;
    config.keepalive_interval = std::chrono::milliseconds(100);
    config.shutdown_grace = std::chrono::milliseconds(2000);
    config.worker_threads = 2;
    config.max_streams = 2;
    return config;
}

class ServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_.register_provider(sample_);
        registry_.register_provider(timing_);
        registry_.register_provider(faults_);
        executor_.start();
        server_ = std::make_unique<McpServer>(test_config(), handlers_);
        server_->start();
    }

    void TearDown() override {
        server_->stop();
        executor_.stop();
    }

    httplib::Client client() const {
        httplib::Client cli("127.0.0.1", server_->port());
        cli.set_read_timeout(5, 0);
        return cli;
    }

    // Holds a /sse stream open until release is set; the next ping then closes it.
    std::future<void> open_stream(std::atomic<bool> &release) const {
        auto connected = std::make_shared<std::promise<void>>();
        auto ready = connected->get_future();
        auto stream = std::async(std::launch::async, [this, connected, &release]() {
            auto cli = client();
            bool signalled = false;
            cli.Get("/sse", [&](const char *, size_t) {
                if (!signalled) {
                    signalled = true;
                    connected->set_value();
                }
                return !release.load();
            });
            if (!signalled) {
                connected->set_value();
            }
        });
        ready.wait();
        return stream;
    }

    bool wait_for_streams(size_t expected) const {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
        while (server_->active_streams() != expected) {
            if (std::chrono::steady_clock::now() > deadline) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return true;
    }

    static std::string tool_call(const std::string &name, const nlohmann::json &arguments, int id = 1) {
        return nlohmann::json{{"jsonrpc", "2.0"}, {"id", id}, {"method", "tools/call"},
                              {"params", {{"name", name}, {"arguments", arguments}}}}.dump();
    }

    SampleProvider sample_;
    TimingProvider timing_;
    FaultProvider faults_;
    ToolRegistry registry_;
    AffinityExecutor executor_;
    McpHandlers handlers_{registry_, executor_};
    std::unique_ptr<McpServer> server_;
};

TEST_F(ServerTest, BindsEphemeralPort) {
    EXPECT_TRUE(server_->is_running());
    EXPECT_NE(server_->port(), 0);
    EXPECT_EQ(server_->message_url(), "http://127.0.0.1:" + std::to_string(server_->port()) + "/message");
}

TEST_F(ServerTest, MessageEndpointsAnswerWithEnvelope) {
    auto cli = client();
    for (const char *path: {"/mcp", "/message", "/", "/mcp/"}) {
        auto res = cli.Post(path, R"({"jsonrpc":"2.0","id":1,"method":"ping"})", "application/json");
        ASSERT_TRUE(res) << path;
        EXPECT_EQ(res->status, 200) << path;
        EXPECT_EQ(res->get_header_value("Content-Type"), "application/json");
        EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
        auto envelope = nlohmann::json::parse(res->body);
        EXPECT_EQ(envelope["id"], 1);
        EXPECT_EQ(envelope["result"], nlohmann::json::object());
    }
}

TEST_F(ServerTest, ProtocolErrorsUseStatus200) {
    auto cli = client();
    auto res = cli.Post("/mcp", tool_call("nope", nlohmann::json::object(), 12), "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto envelope = nlohmann::json::parse(res->body);
    EXPECT_EQ(envelope["id"], 12);
    EXPECT_EQ(envelope["error"]["code"], -32601);
    EXPECT_EQ(envelope["error"]["message"], "Unknown tool: nope");

    auto bad = cli.Post("/mcp", "not json", "application/json");
    ASSERT_TRUE(bad);
    EXPECT_EQ(bad->status, 200);
    EXPECT_EQ(nlohmann::json::parse(bad->body)["error"]["code"], -32700);
}

TEST_F(ServerTest, ToolCallOverHttp) {
    auto cli = client();
    auto res = cli.Post("/message", tool_call("echo", {{"text", "hi"}}), "application/json");
    ASSERT_TRUE(res);
    auto envelope = nlohmann::json::parse(res->body);
    auto payload = nlohmann::json::parse(envelope["result"]["content"][0]["text"].get<std::string>());
    EXPECT_EQ(payload["times"], 1);

    auto missing = cli.Post("/message", tool_call("echo", nlohmann::json::object()), "application/json");
    ASSERT_TRUE(missing);
    EXPECT_EQ(nlohmann::json::parse(missing->body)["error"]["code"], -32602);
}

TEST_F(ServerTest, NotificationIsAcceptedWithoutBody) {
    auto cli = client();
    auto res = cli.Post("/mcp", R"({"jsonrpc":"2.0","method":"notifications/initialized"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 202);
    EXPECT_TRUE(res->body.empty());
}

TEST_F(ServerTest, UnknownPathIs404) {
    auto cli = client();
    auto res = cli.Post("/elsewhere", "{}", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
}

TEST_F(ServerTest, WrongVerbIs405) {
    auto cli = client();
    auto get = cli.Get("/mcp");
    ASSERT_TRUE(get);
    EXPECT_EQ(get->status, 405);

    auto post = cli.Post("/sse", "{}", "application/json");
    ASSERT_TRUE(post);
    EXPECT_EQ(post->status, 405);
}

TEST_F(ServerTest, OptionsReturnsCorsHeaders) {
    auto cli = client();
    auto res = cli.Options("/mcp");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 204);
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Methods"), "GET, POST, OPTIONS");
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Headers"), "Content-Type");
}

TEST_F(ServerTest, SseSendsEndpointThenPings) {
    auto cli = client();
    std::string received;
    auto res = cli.Get("/sse", [&received](const char *data, size_t length) {
        received.append(data, length);
        return received.find(": ping") == std::string::npos;
    });

    EXPECT_NE(received.find("event: endpoint\r\ndata: " + server_->message_url() + "\r\n\r\n"), std::string::npos);
    EXPECT_NE(received.find(": ping\r\n\r\n"), std::string::npos);
    EXPECT_LT(received.find("event: endpoint"), received.find(": ping"));
}

TEST_F(ServerTest, ConcurrentToolCallsDoNotOverlap) {
    auto post_sleep = [this](int id) {
        auto cli = client();
        auto res = cli.Post("/mcp", tool_call("sleep_tool", {{"ms", 300}}, id), "application/json");
        return res && res->status == 200 && nlohmann::json::parse(res->body).contains("result");
    };

    auto first = std::async(std::launch::async, post_sleep, 1);
    auto second = std::async(std::launch::async, post_sleep, 2);
    EXPECT_TRUE(first.get());
    EXPECT_TRUE(second.get());

    auto spans = timing_.spans();
    ASSERT_EQ(spans.size(), 2u);
    std::sort(spans.begin(), spans.end(),
              [](const TimingProvider::Span &a, const TimingProvider::Span &b) { return a.begin < b.begin; });
    EXPECT_LE(spans[0].end, spans[1].begin);
    EXPECT_EQ(spans[0].thread, spans[1].thread);
}

TEST_F(ServerTest, StopEndsOpenStreamsPromptly) {
    std::promise<void> connected;
    auto stream = std::async(std::launch::async, [this, &connected]() {
        auto cli = client();
        bool signalled = false;
        cli.Get("/sse", [&](const char *, size_t) {
            if (!signalled) {
                signalled = true;
                connected.set_value();
            }
            return true;
        });
    });

    connected.get_future().wait();
    EXPECT_EQ(server_->active_streams(), 1u);

    auto begin = std::chrono::steady_clock::now();
    server_->stop();
    EXPECT_EQ(stream.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(3));
    EXPECT_FALSE(server_->is_running());
}

TEST_F(ServerTest, ToolThrowsAreInternalErrorsOverHttp) {
    auto cli = client();
    auto rpc = cli.Post("/mcp", tool_call("raise_rpc", nlohmann::json::object(), 7), "application/json");
    ASSERT_TRUE(rpc);
    EXPECT_EQ(rpc->status, 200);
    auto rpc_envelope = nlohmann::json::parse(rpc->body);
    EXPECT_EQ(rpc_envelope["id"], 7);
    EXPECT_EQ(rpc_envelope["error"]["code"], -32603);
    EXPECT_EQ(rpc_envelope["error"]["message"], "invalid identifier");

    auto raw = cli.Post("/mcp", tool_call("raise_int", nlohmann::json::object(), 8), "application/json");
    ASSERT_TRUE(raw);
    EXPECT_EQ(raw->status, 200);
    auto raw_envelope = nlohmann::json::parse(raw->body);
    EXPECT_EQ(raw_envelope["id"], 8);
    EXPECT_EQ(raw_envelope["error"]["code"], -32603);
}

TEST_F(ServerTest, ClosedClientReleasesStream) {
    std::atomic<bool> release{false};
    auto stream = open_stream(release);
    ASSERT_TRUE(wait_for_streams(1));

    release = true;
    EXPECT_EQ(stream.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    EXPECT_TRUE(wait_for_streams(0));
}

TEST_F(ServerTest, OpenStreamsDoNotStarveMessages) {
    std::atomic<bool> release{false};
    auto first = open_stream(release);
    auto second = open_stream(release);
    ASSERT_TRUE(wait_for_streams(2));

    auto cli = client();
    auto ping = cli.Post("/mcp", R"({"jsonrpc":"2.0","id":3,"method":"ping"})", "application/json");
    ASSERT_TRUE(ping);
    EXPECT_EQ(ping->status, 200);
    auto list = cli.Post("/mcp", R"({"jsonrpc":"2.0","id":4,"method":"tools/list"})", "application/json");
    ASSERT_TRUE(list);
    EXPECT_EQ(list->status, 200);

    auto refused = cli.Get("/sse");
    ASSERT_TRUE(refused);
    EXPECT_EQ(refused->status, 503);
    EXPECT_EQ(server_->active_streams(), 2u);

    release = true;
    first.wait();
    second.wait();
    EXPECT_TRUE(wait_for_streams(0));
}

} // namespace
