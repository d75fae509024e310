#pragma once

#include <cstddef>
#include <string>

namespace diagram_integrations {

// Number of leading spaces and tabs.
std::size_t leading_blanks(const std::string& line);

// `s` without surrounding spaces, tabs and carriage returns.
std::string trim_blanks(const std::string& s);

} // namespace diagram_integrations
