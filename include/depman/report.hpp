#pragma once

#include <depman/manager.hpp>
#include <string>
#include <vector>

namespace depman {

// One-line human summary, e.g. "3.10.2 installed, minor update needed".
std::string describe_status(const DependencyStatus& st);

// Anything other than Satisfied or Installed.
bool needs_attention(const DependencyStatus& st);

// "- <name>: <summary>" per entry, in the report's order.
std::string format_report(const RunReport& report);

} // namespace depman
