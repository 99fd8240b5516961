#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include <nlohmann/json.hpp>

namespace rc_mcp {

constexpr int kDefaultPageSize = 50;
constexpr int kMaxPageSize = 1000;

// Returns {items, total, offset, count, hasMore, nextOffset}.
// offset < 0 becomes 0; count <= 0 becomes kDefaultPageSize; count is capped at kMaxPageSize.
nlohmann::json paginate(const nlohmann::json &items, int64_t offset = 0, int64_t count = kDefaultPageSize);

// Empty pattern or "*" matches everything. Patterns containing '*' or '?' are
// case-insensitive globs; anything else is a case-insensitive substring match.
bool matches_filter(const std::string &value, const std::string &pattern);

nlohmann::json filter_items(const nlohmann::json &items, const std::string &pattern,
                            const std::function<std::string(const nlohmann::json &)> &selector);

} // namespace rc_mcp
