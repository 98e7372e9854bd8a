#pragma once

#include <depman/log.hpp>
#include <depman/manager.hpp>
#include <depman/platform.hpp>
#include <depman/result.hpp>
#include <optional>
#include <string>

namespace depman {

// Layered configuration: global -> project -> command line.
// Every field is optional; a layer only overrides the keys it sets.
struct Config {
    // [engine]
    std::optional<std::string> platform;
    std::optional<std::string> install_root;
    std::optional<std::string> download_dir;
    std::optional<int> command_timeout;
    std::optional<int> download_timeout;
    std::optional<int> download_retries;
    std::optional<int> retry_backoff_ms;
    std::optional<bool> keep_downloads;
    std::optional<std::string> upgrade;

    // [log]
    std::optional<std::string> log_level;
    std::optional<bool> log_color;

    // Load from a TOML config file (global or project-level)
    static Result<Config> load(const std::string& path);

    // Parse from TOML string; `source` only labels error messages
    static Result<Config> parse(const std::string& toml_str,
                                const std::string& source = "");

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project,
                            const std::optional<Config>& cli);

    // Fills in defaults and checks ranges.
    Result<EngineOptions> engine_options() const;

    // nullopt when no override is configured (use the host platform)
    Result<std::optional<Platform>> target_platform() const;

    Result<log::Level> level() const;
};

// ~/.depman/config.toml, empty when HOME is unset
std::string global_config_path();

// .depman.toml in the directory holding the manifest
std::string project_config_path(const std::string& manifest_path);

// Replaces a leading "~" or "~/" with $HOME.
std::string expand_home(const std::string& path);

} // namespace depman
