#pragma once

#include <depman/manifest.hpp>
#include <depman/platform.hpp>
#include <depman/result.hpp>

namespace depman {

// Exact key lookup of `platform` in the dependency's platform table; there
// is no fallback between platforms. A missing entry is UnsupportedPlatform.
Result<PlatformConfig> select_platform(const Dependency& dep, Platform platform);

} // namespace depman
