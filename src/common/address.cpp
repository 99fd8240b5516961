#include "common/address.hpp"
#include "common/string_util.hpp"

#include <cerrno>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace rc_mcp {

bool try_parse_address(const std::string &text, uint64_t &out) {
    std::string s = trim(text);
    if (s.empty()) {
        return false;
    }

    int base = 10;
    if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        s = s.substr(2);
        base = 16;
    }

    // strtoull would silently accept a leading sign
    if (s.empty() || s[0] == '-' || s[0] == '+') {
        return false;
    }

    errno = 0;
    char *end = nullptr;
    unsigned long long value = std::strtoull(s.c_str(), &end, base);
    if (errno == ERANGE || end == nullptr || *end != '\0') {
        return false;
    }

    out = static_cast<uint64_t>(value);
    return true;
}

uint64_t parse_address(const std::string &text) {
    uint64_t value = 0;
    if (trim(text).empty()) {
        throw std::invalid_argument("Address cannot be empty");
    }
    if (!try_parse_address(text, value)) {
        throw std::invalid_argument("Invalid address format: " + trim(text));
    }
    return value;
}

std::string format_address(uint64_t address) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::uppercase << std::setfill('0') << std::setw(16) << address;
    return oss.str();
}

} // namespace rc_mcp
