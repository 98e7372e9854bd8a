#pragma once

#include <depman/result.hpp>
#include <array>
#include <string>

namespace depman {

// Closed set of operating systems a manifest can target.
enum class Platform { Windows, Linux, Darwin };

constexpr std::array<Platform, 3> kAllPlatforms = {
    Platform::Windows, Platform::Linux, Platform::Darwin,
};

// "windows" | "linux" | "darwin"
const char* platform_name(Platform p);
Result<Platform> parse_platform(const std::string& name);

// Platform this binary was compiled for.
Platform host_platform();

// Separator used between PATH entries on `p`.
char path_list_separator(Platform p);

} // namespace depman
