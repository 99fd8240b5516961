#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace rc_mcp {

struct ServerConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 13338;
    std::chrono::milliseconds keepalive_interval{30000};
    std::chrono::milliseconds shutdown_grace{3000};
    // Workers for message requests. SSE streams get max_streams extra workers
    // of their own; streams beyond that are refused with 503.
    size_t worker_threads = 8;
    size_t max_streams = 8;
    std::string log_level = "info";

    // Reads an optional JSON file, then applies RCMCP_* environment overrides.
    // A missing file yields defaults; a malformed one is logged and ignored.
    static ServerConfig load(const std::string &path);

    static ServerConfig from_json(const nlohmann::json &j);
    nlohmann::json to_json() const;

    void apply_env();

    // Absolute URL the SSE endpoint event advertises. A wildcard host is
    // advertised as loopback; IPv6 literals are bracketed.
    std::string message_url() const;
};

} // namespace rc_mcp
