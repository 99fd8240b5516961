#include "common/config.hpp"
#include "common/log.hpp"

#include <cstdlib>
#include <fstream>

namespace rc_mcp {

namespace {
    bool parse_port(const std::string &text, uint16_t &out) {
        char *end = nullptr;
        long value = std::strtol(text.c_str(), &end, 10);
        if (text.empty() || end == nullptr || *end != '\0' || value < 0 || value > 65535) {
            return false;
        }
        out = static_cast<uint16_t>(value);
        return true;
    }
}

ServerConfig ServerConfig::from_json(const nlohmann::json &j) {
    ServerConfig cfg;
    if (!j.is_object()) {
        return cfg;
    }

    if (j.contains("host") && j["host"].is_string())
        cfg.host = j["host"].get<std::string>();
    if (j.contains("port") && j["port"].is_number_unsigned() && j["port"].get<uint64_t>() <= 65535)
        cfg.port = j["port"].get<uint16_t>();
    if (j.contains("keepalive_interval_ms") && j["keepalive_interval_ms"].is_number_unsigned())
        cfg.keepalive_interval = std::chrono::milliseconds(j["keepalive_interval_ms"].get<uint64_t>());
    if (j.contains("shutdown_grace_ms") && j["shutdown_grace_ms"].is_number_unsigned())
        cfg.shutdown_grace = std::chrono::milliseconds(j["shutdown_grace_ms"].get<uint64_t>());
    if (j.contains("worker_threads") && j["worker_threads"].is_number_unsigned() &&
        j["worker_threads"].get<uint64_t>() > 0)
        cfg.worker_threads = j["worker_threads"].get<size_t>();
    if (j.contains("max_streams") && j["max_streams"].is_number_unsigned() &&
        j["max_streams"].get<uint64_t>() > 0)
        cfg.max_streams = j["max_streams"].get<size_t>();
    if (j.contains("log_level") && j["log_level"].is_string())
        cfg.log_level = j["log_level"].get<std::string>();

    return cfg;
}

nlohmann::json ServerConfig::to_json() const {
    return {
        {"host", host},
        {"port", port},
        {"keepalive_interval_ms", static_cast<uint64_t>(keepalive_interval.count())},
        {"shutdown_grace_ms", static_cast<uint64_t>(shutdown_grace.count())},
        {"worker_threads", worker_threads},
        {"max_streams", max_streams},
        {"log_level", log_level}
    };
}

void ServerConfig::apply_env() {
    if (const char *v = std::getenv("RCMCP_HOST"))
        host = v;
    if (const char *v = std::getenv("RCMCP_PORT")) {
        if (!parse_port(v, port)) {
            log_warn("Ignoring invalid RCMCP_PORT: %s\n", v);
        }
    }
    if (const char *v = std::getenv("RCMCP_LOG_LEVEL"))
        log_level = v;
}

ServerConfig ServerConfig::load(const std::string &path) {
    ServerConfig cfg;

    if (!path.empty()) {
        std::ifstream file(path);
        if (file.is_open()) {
            try {
                cfg = from_json(nlohmann::json::parse(file));
            } catch (const nlohmann::json::exception &e) {
                log_warn("Malformed config %s, using defaults: %s\n", path.c_str(), e.what());
                cfg = ServerConfig();
            }
        } else {
            log_debug("No config file at %s, using defaults\n", path.c_str());
        }
    }

    cfg.apply_env();
    return cfg;
}

std::string ServerConfig::message_url() const {
    // Wildcard binds are reachable on loopback; a URL naming them is not.
    std::string advertised = host;
    if (advertised.empty() || advertised == "0.0.0.0") {
        advertised = "127.0.0.1";
    } else if (advertised == "::" || advertised == "[::]") {
        advertised = "[::1]";
    } else if (advertised.find(':') != std::string::npos && advertised.front() != '[') {
        advertised = "[" + advertised + "]";
    }
    return "http://" + advertised + ":" + std::to_string(port) + "/message";
}

} // namespace rc_mcp
