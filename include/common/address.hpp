#pragma once

#include <cstdint>
#include <string>

namespace rc_mcp {

// Parses "0x1234" / "0X1234" as hex and anything else as decimal.
// Throws std::invalid_argument on empty or malformed input.
uint64_t parse_address(const std::string &text);

bool try_parse_address(const std::string &text, uint64_t &out);

// "0x" followed by 16 upper-case hex digits.
std::string format_address(uint64_t address);

} // namespace rc_mcp
