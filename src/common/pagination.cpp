#include "common/pagination.hpp"
#include "common/string_util.hpp"

#include <algorithm>
#include <cctype>

namespace rc_mcp {

namespace {
    char lower(char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    bool glob_match(const std::string &text, const std::string &pattern) {
        size_t t = 0, p = 0;
        size_t star = std::string::npos, mark = 0;

        while (t < text.size()) {
            if (p < pattern.size() && (pattern[p] == '?' || lower(pattern[p]) == lower(text[t]))) {
                ++t;
                ++p;
            } else if (p < pattern.size() && pattern[p] == '*') {
                star = p++;
                mark = t;
            } else if (star != std::string::npos) {
                p = star + 1;
                t = ++mark;
            } else {
                return false;
            }
        }

        while (p < pattern.size() && pattern[p] == '*') {
            ++p;
        }
        return p == pattern.size();
    }
}

nlohmann::json paginate(const nlohmann::json &items, int64_t offset, int64_t count) {
    if (offset < 0) offset = 0;
    if (count <= 0) count = kDefaultPageSize;
    if (count > kMaxPageSize) count = kMaxPageSize;

    const size_t total = items.is_array() ? items.size() : 0;
    nlohmann::json page = nlohmann::json::array();
    for (size_t i = static_cast<size_t>(offset); i < total && page.size() < static_cast<size_t>(count); ++i) {
        page.push_back(items[i]);
    }

    const bool has_more = static_cast<size_t>(offset) + page.size() < total;

    nlohmann::json result;
    result["items"] = page;
    result["total"] = total;
    result["offset"] = offset;
    result["count"] = page.size();
    result["hasMore"] = has_more;
    result["nextOffset"] = has_more ? nlohmann::json(offset + count) : nlohmann::json();
    return result;
}

bool matches_filter(const std::string &value, const std::string &raw_pattern) {
    std::string pattern = trim(raw_pattern);
    if (pattern.empty() || pattern == "*") {
        return true;
    }

    if (pattern.find_first_of("*?") != std::string::npos) {
        return glob_match(value, pattern);
    }

    auto it = std::search(value.begin(), value.end(), pattern.begin(), pattern.end(),
                          [](char a, char b) { return lower(a) == lower(b); });
    return it != value.end();
}

nlohmann::json filter_items(const nlohmann::json &items, const std::string &pattern,
                            const std::function<std::string(const nlohmann::json &)> &selector) {
    nlohmann::json result = nlohmann::json::array();
    if (!items.is_array()) {
        return result;
    }
    for (const auto &item: items) {
        if (matches_filter(selector(item), pattern)) {
            result.push_back(item);
        }
    }
    return result;
}

} // namespace rc_mcp
