#pragma once

#include "capability_provider.hpp"

#include <optional>
#include <string>

namespace rc_mcp {

// Target process selection backed by a procfs tree. The selected target is
// host state: it is only read or written from tool bodies, which all run on
// the affinity context.
class ProcessToolsProvider : public ICapabilityProvider {
public:
    explicit ProcessToolsProvider(std::string proc_root = "/proc");

    std::string get_name() const override { return "process"; }

    std::vector<ToolDefinition> get_tools() override;

    nlohmann::json list_processes(const nlohmann::json &args) const;
    nlohmann::json attach_process(const nlohmann::json &args);
    nlohmann::json detach_process(const nlohmann::json &args);
    nlohmann::json get_process_info(const nlohmann::json &args) const;

private:
    struct ProcessEntry {
        int64_t id = 0;
        std::string name;
        std::string path;
    };

    std::vector<ProcessEntry> enumerate() const;
    std::optional<ProcessEntry> read_process(int64_t pid) const;
    static nlohmann::json to_json(const ProcessEntry &entry);

    std::string proc_root_;
    std::optional<ProcessEntry> attached_;
};

} // namespace rc_mcp
