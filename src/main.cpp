#include "common/config.hpp"
#include "common/log.hpp"
#include "dispatch/affinity_executor.hpp"
#include "http/handlers.hpp"
#include "http/server.hpp"
#include "tools/process_tools.hpp"
#include "tools/server_tools.hpp"
#include "tools/tool_registry.hpp"

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <pthread.h>
#include <string>
#include <thread>

using namespace rc_mcp;

namespace {
    void print_usage(const char *argv0) {
        std::fprintf(stderr,
                     "Usage: %s [--config <file>] [--host <address>] [--port <port>] [--log-level <level>]\n",
                     argv0);
    }

    struct CliOptions {
        std::string config_path;
        std::string host;
        int port = -1;
        std::string log_level;
    };

    bool parse_args(int argc, char **argv, CliOptions &opts) {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            const bool has_value = i + 1 < argc;
            if (arg == "--config" && has_value) {
                opts.config_path = argv[++i];
            } else if (arg == "--host" && has_value) {
                opts.host = argv[++i];
            } else if (arg == "--port" && has_value) {
                char *end = nullptr;
                long port = std::strtol(argv[++i], &end, 10);
                if (*end != '\0' || port < 0 || port > 65535) {
                    return false;
                }
                opts.port = static_cast<int>(port);
            } else if (arg == "--log-level" && has_value) {
                opts.log_level = argv[++i];
            } else {
                return false;
            }
        }
        return true;
    }
}

int main(int argc, char **argv) {
    CliOptions opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage(argv[0]);
        return 2;
    }

    ServerConfig config = ServerConfig::load(opts.config_path);
    if (!opts.host.empty()) config.host = opts.host;
    if (opts.port >= 0) config.port = static_cast<uint16_t>(opts.port);
    if (!opts.log_level.empty()) config.log_level = opts.log_level;
    set_log_level(parse_log_level(config.log_level));

    // Signals are taken synchronously by one waiter thread; every other
    // thread inherits the blocked mask.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    ToolRegistry registry;
    ServerToolsProvider server_tools(registry, config);
    ProcessToolsProvider process_tools;
    registry.register_provider(server_tools);
    registry.register_provider(process_tools);

    AffinityExecutor executor;
    McpHandlers handlers(registry, executor);
    McpServer server(config, handlers);

    try {
        server.start();
    } catch (const std::exception &e) {
        log_error("Failed to start server: %s\n", e.what());
        return 1;
    }

    std::thread signal_waiter([&signals, &server, &executor]() {
        int received = 0;
        sigwait(&signals, &received);
        log_msg("Received %s, shutting down\n", received == SIGINT ? "SIGINT" : "SIGTERM");
        server.stop();
        executor.stop();
    });

    // The main thread owns the host state from here on.
    executor.run();

    signal_waiter.join();
    log_msg("Bye\n");
    return 0;
}
