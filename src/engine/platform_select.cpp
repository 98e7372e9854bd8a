#include <depman/platform_select.hpp>

namespace depman {

Result<PlatformConfig> select_platform(const Dependency& dep, Platform platform) {
    auto it = dep.platforms.find(platform);
    if (it == dep.platforms.end()) {
        std::string available;
        for (const auto& [p, cfg] : dep.platforms) {
            if (!available.empty()) available += ", ";
            available += platform_name(p);
        }
        return DepmanError{DepmanError::UnsupportedPlatform,
            "dependency '" + dep.name + "' has no configuration for platform '" +
            platform_name(platform) + "'",
            available.empty() ? std::string("no platforms are defined")
                              : "defined for: " + available};
    }
    return Result<PlatformConfig>::ok(it->second);
}

} // namespace depman
