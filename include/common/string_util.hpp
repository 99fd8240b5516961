#pragma once

#include <string>

namespace rc_mcp {

// Strips leading and trailing spaces, tabs, CR and LF.
std::string trim(const std::string &s);

std::string to_lower(std::string s);

} // namespace rc_mcp
