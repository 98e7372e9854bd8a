#include <depman/platform.hpp>
#include <algorithm>
#include <cctype>

namespace depman {

const char* platform_name(Platform p) {
    switch (p) {
        case Platform::Windows: return "windows";
        case Platform::Linux:   return "linux";
        case Platform::Darwin:  return "darwin";
    }
    return "unknown";
}

Result<Platform> parse_platform(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "macos" || lower == "osx") lower = "darwin";

    for (Platform p : kAllPlatforms) {
        if (lower == platform_name(p)) return Result<Platform>::ok(p);
    }
    return DepmanError{DepmanError::InvalidArg,
        "unknown platform '" + name + "'",
        "expected one of: windows, linux, darwin"};
}

Platform host_platform() {
#if defined(_WIN32)
    return Platform::Windows;
#elif defined(__APPLE__)
    return Platform::Darwin;
#else
    return Platform::Linux;
#endif
}

char path_list_separator(Platform p) {
    return p == Platform::Windows ? ';' : ':';
}

} // namespace depman
