#pragma once

#include "protocol/jsonrpc.hpp"
#include "tools/capability_provider.hpp"
#include "tools/tool_result.hpp"

#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace rc_mcp::testing {

// echo(text: string, times: integer = 1), plus tools that fail in each layer.
class SampleProvider : public ICapabilityProvider {
public:
    std::string get_name() const override { return "sample"; }

    std::vector<ToolDefinition> get_tools() override {
        return {
            {
                "echo",
                "Echo text",
                {
                    required_param("text", ValueType::of(ValueKind::String)),
                    optional_param("times", ValueType::of(ValueKind::Integer), 1)
                },
                [](const nlohmann::json &args) {
                    return nlohmann::json{{"text", args.at("text")}, {"times", args.at("times")}};
                }
            },
            {
                "explode",
                "Always throws",
                {},
                [](const nlohmann::json &) -> nlohmann::json {
                    throw std::runtime_error("boom");
                }
            },
            {
                "read_target",
                "Reports a domain failure",
                {nullable_param("address", ValueType::of(ValueKind::Address))},
                [](const nlohmann::json &) { return tool_error("No process attached"); }
            }
        };
    }
};

// sleep_tool(ms: integer = 200) records when each body started and ended.
class TimingProvider : public ICapabilityProvider {
public:
    struct Span {
        std::chrono::steady_clock::time_point begin;
        std::chrono::steady_clock::time_point end;
        std::thread::id thread;
    };

    std::string get_name() const override { return "timing"; }

    std::vector<ToolDefinition> get_tools() override {
        return {
            {
                "sleep_tool",
                "Sleeps on the affinity context",
                {optional_param("ms", ValueType::of(ValueKind::Integer), 200)},
                [this](const nlohmann::json &args) {
                    Span span;
                    span.thread = std::this_thread::get_id();
                    span.begin = std::chrono::steady_clock::now();
                    std::this_thread::sleep_for(std::chrono::milliseconds(args.at("ms").get<int>()));
                    span.end = std::chrono::steady_clock::now();
                    {
                        std::lock_guard<std::mutex> lock(mutex_);
                        spans_.push_back(span);
                    }
                    return nlohmann::json{{"slept", args.at("ms")}};
                }
            }
        };
    }

    std::vector<Span> spans() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return spans_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Span> spans_;
};

// Tool bodies that throw a protocol error or a value outside std::exception.
class FaultProvider : public ICapabilityProvider {
public:
    std::string get_name() const override { return "faults"; }

    std::vector<ToolDefinition> get_tools() override {
        return {
            {
                "raise_rpc",
                "Throws McpError from inside the tool",
                {},
                [](const nlohmann::json &) -> nlohmann::json {
                    throw McpError(rpc_error::kInvalidParams, "invalid identifier");
                }
            },
            {
                "raise_int",
                "Throws a non-exception value",
                {},
                [](const nlohmann::json &) -> nlohmann::json {
                    throw 42;
                }
            }
        };
    }
};

} // namespace rc_mcp::testing
