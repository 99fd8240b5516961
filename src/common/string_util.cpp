#include "common/string_util.hpp"

#include <algorithm>
#include <cctype>

namespace rc_mcp {

std::string trim(const std::string &s) {
    const char *ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) {
        return {};
    }
    return s.substr(start, s.find_last_not_of(ws) - start + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace rc_mcp
