#include "tools/process_tools.hpp"
#include "tools/tool_result.hpp"
#include "common/pagination.hpp"
#include "common/log.hpp"
#include "common/string_util.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace rc_mcp {

namespace {
    bool is_pid(const std::string &s) {
        return !s.empty() && s.size() < 19 &&
               std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
    }
}

ProcessToolsProvider::ProcessToolsProvider(std::string proc_root)
    : proc_root_(std::move(proc_root)) {
}

std::vector<ToolDefinition> ProcessToolsProvider::get_tools() {
    return {
        {
            "list_processes",
            "List available processes for attachment",
            {
                optional_param("filter", ValueType::of(ValueKind::String), nullptr,
                               "Substring or glob pattern on the process name"),
                optional_param("offset", ValueType::of(ValueKind::Integer), 0),
                optional_param("count", ValueType::of(ValueKind::Integer), 100)
            },
            [this](const nlohmann::json &args) { return list_processes(args); }
        },
        {
            "attach_process",
            "Attach to a process by name or PID",
            {required_param("target", ValueType::of(ValueKind::String), "Process name or PID")},
            [this](const nlohmann::json &args) { return attach_process(args); }
        },
        {
            "detach_process",
            "Detach from the current process",
            {},
            [this](const nlohmann::json &args) { return detach_process(args); }
        },
        {
            "get_process_info",
            "Get current process information",
            {},
            [this](const nlohmann::json &args) { return get_process_info(args); }
        }
    };
}

std::optional<ProcessToolsProvider::ProcessEntry> ProcessToolsProvider::read_process(int64_t pid) const {
    const fs::path dir = fs::path(proc_root_) / std::to_string(pid);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return std::nullopt;
    }

    ProcessEntry entry;
    entry.id = pid;

    std::ifstream comm(dir / "comm");
    if (comm.is_open()) {
        std::getline(comm, entry.name);
    }

    // Unreadable for processes owned by other users.
    fs::path exe = fs::read_symlink(dir / "exe", ec);
    if (!ec) {
        entry.path = exe.string();
    }

    return entry;
}

std::vector<ProcessToolsProvider::ProcessEntry> ProcessToolsProvider::enumerate() const {
    std::vector<ProcessEntry> result;
    std::error_code ec;
    for (fs::directory_iterator it(proc_root_, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (!is_pid(name)) {
            continue;
        }
        if (auto entry = read_process(std::stoll(name))) {
            result.push_back(*entry);
        }
    }
    if (ec) {
        log_warn("Failed to enumerate %s: %s\n", proc_root_.c_str(), ec.message().c_str());
    }

    std::sort(result.begin(), result.end(),
              [](const ProcessEntry &a, const ProcessEntry &b) { return a.id < b.id; });
    return result;
}

nlohmann::json ProcessToolsProvider::to_json(const ProcessEntry &entry) {
    return {
        {"id", entry.id},
        {"name", entry.name},
        {"path", entry.path},
        {"isValid", !entry.name.empty()}
    };
}

nlohmann::json ProcessToolsProvider::list_processes(const nlohmann::json &args) const {
    const nlohmann::json &filter = args.at("filter");
    const std::string pattern = filter.is_string() ? filter.get<std::string>() : "";

    nlohmann::json processes = nlohmann::json::array();
    for (const auto &entry: enumerate()) {
        processes.push_back(to_json(entry));
    }

    processes = filter_items(processes, pattern, [](const nlohmann::json &item) {
        return item["name"].get<std::string>();
    });

    return paginate(processes, args.at("offset").get<int64_t>(), args.at("count").get<int64_t>());
}

nlohmann::json ProcessToolsProvider::attach_process(const nlohmann::json &args) {
    const std::string target = args.at("target").get<std::string>();
    if (target.empty()) {
        return tool_failure("Target cannot be empty");
    }

    std::optional<ProcessEntry> found;
    if (is_pid(target)) {
        found = read_process(std::stoll(target));
    } else {
        const std::string wanted = to_lower(target);
        for (const auto &entry: enumerate()) {
            if (to_lower(entry.name) == wanted) {
                found = entry;
                break;
            }
        }
    }

    if (!found) {
        return tool_failure("Process not found: " + target);
    }

    attached_ = found;
    log_msg("Attached to %s (%lld)\n", found->name.c_str(), static_cast<long long>(found->id));
    return tool_ok({{"process", to_json(*found)}});
}

nlohmann::json ProcessToolsProvider::detach_process(const nlohmann::json &) {
    if (!attached_) {
        return tool_failure("No process attached");
    }

    log_msg("Detached from %s (%lld)\n", attached_->name.c_str(), static_cast<long long>(attached_->id));
    attached_.reset();
    return tool_ok();
}

nlohmann::json ProcessToolsProvider::get_process_info(const nlohmann::json &) const {
    if (!attached_) {
        return tool_error("No process attached");
    }

    auto current = read_process(attached_->id);
    if (!current) {
        nlohmann::json result = tool_error("Attached process has exited");
        result["id"] = attached_->id;
        return result;
    }

    return to_json(*current);
}

} // namespace rc_mcp
