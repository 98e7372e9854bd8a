#include <depman/config.hpp>
#include <toml++/toml.hpp>
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace depman {

namespace {

const char* home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    return home;
}

DepmanError config_error(const std::string& source, const toml::node& node,
                         const std::string& msg) {
    return DepmanError{DepmanError::Config, msg, "",
                       source, static_cast<int>(node.source().begin.line)};
}

Status read_string(const toml::table& tbl, const char* key, const std::string& source,
                   const std::string& section, std::optional<std::string>& out) {
    const toml::node* node = tbl.get(key);
    if (!node) return ok_status();
    auto v = node->value<std::string>();
    if (!v) {
        return config_error(source, *node, section + "." + key + " must be a string");
    }
    out = *v;
    return ok_status();
}

Status read_bool(const toml::table& tbl, const char* key, const std::string& source,
                 const std::string& section, std::optional<bool>& out) {
    const toml::node* node = tbl.get(key);
    if (!node) return ok_status();
    auto v = node->value<bool>();
    if (!v) {
        return config_error(source, *node, section + "." + key + " must be a boolean");
    }
    out = *v;
    return ok_status();
}

Status read_int(const toml::table& tbl, const char* key, const std::string& source,
                const std::string& section, int min, std::optional<int>& out) {
    const toml::node* node = tbl.get(key);
    if (!node) return ok_status();
    if (!node->is_integer()) {
        return config_error(source, *node, section + "." + key + " must be an integer");
    }
    int64_t v = node->as_integer()->get();
    if (v < min || v > 86400 * 1000) {
        return config_error(source, *node, section + "." + key + " out of range (got " +
                                           std::to_string(v) + ", minimum " +
                                           std::to_string(min) + ")");
    }
    out = static_cast<int>(v);
    return ok_status();
}

void warn_unknown_keys(const toml::table& tbl, const std::string& section,
                       std::initializer_list<const char*> known) {
    for (const auto& [key, val] : tbl) {
        std::string k(key.str());
        bool found = std::any_of(known.begin(), known.end(),
                                 [&](const char* kk) { return k == kk; });
        if (!found) {
            log::warn("config: ignoring unknown key '%s.%s'", section.c_str(), k.c_str());
        }
    }
}

template<typename T>
void override_with(std::optional<T>& dst, const std::optional<T>& src) {
    if (src.has_value()) dst = src;
}

} // namespace

Result<Config> Config::parse(const std::string& toml_str, const std::string& source) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, source);
    } catch (const toml::parse_error& e) {
        return DepmanError{DepmanError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", source, static_cast<int>(e.source().begin.line)};
    }

    Config cfg;

    if (auto engine = doc["engine"].as_table()) {
        const std::string sec = "engine";
        DEPMAN_TRY(read_string(*engine, "platform", source, sec, cfg.platform));
        DEPMAN_TRY(read_string(*engine, "install-root", source, sec, cfg.install_root));
        DEPMAN_TRY(read_string(*engine, "download-dir", source, sec, cfg.download_dir));
        DEPMAN_TRY(read_int(*engine, "command-timeout", source, sec, 1, cfg.command_timeout));
        DEPMAN_TRY(read_int(*engine, "download-timeout", source, sec, 1, cfg.download_timeout));
        DEPMAN_TRY(read_int(*engine, "download-retries", source, sec, 0, cfg.download_retries));
        DEPMAN_TRY(read_int(*engine, "retry-backoff-ms", source, sec, 0, cfg.retry_backoff_ms));
        DEPMAN_TRY(read_bool(*engine, "keep-downloads", source, sec, cfg.keep_downloads));
        DEPMAN_TRY(read_string(*engine, "upgrade", source, sec, cfg.upgrade));
        warn_unknown_keys(*engine, sec,
            {"platform", "install-root", "download-dir", "command-timeout",
             "download-timeout", "download-retries", "retry-backoff-ms",
             "keep-downloads", "upgrade"});
    }

    if (auto lg = doc["log"].as_table()) {
        DEPMAN_TRY(read_string(*lg, "level", source, "log", cfg.log_level));
        DEPMAN_TRY(read_bool(*lg, "color", source, "log", cfg.log_color));
        warn_unknown_keys(*lg, "log", {"level", "color"});
    }

    // Fail early on values that would only be rejected later
    if (cfg.platform) {
        auto p = parse_platform(*cfg.platform);
        if (p.is_err()) {
            return DepmanError{DepmanError::Config, "engine.platform: " + p.error().message,
                               p.error().hint, source, 0};
        }
    }
    if (cfg.upgrade) {
        auto u = parse_upgrade_policy(*cfg.upgrade);
        if (u.is_err()) {
            auto err = std::move(u).error();
            err.file = source;
            return err;
        }
    }
    if (cfg.log_level) {
        auto l = log::parse_level(*cfg.log_level);
        if (l.is_err()) {
            return DepmanError{DepmanError::Config, "log.level: " + l.error().message,
                               l.error().hint, source, 0};
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return DepmanError{DepmanError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str(), path);
}

void Config::merge(const Config& other) {
    override_with(platform, other.platform);
    override_with(install_root, other.install_root);
    override_with(download_dir, other.download_dir);
    override_with(command_timeout, other.command_timeout);
    override_with(download_timeout, other.download_timeout);
    override_with(download_retries, other.download_retries);
    override_with(retry_backoff_ms, other.retry_backoff_ms);
    override_with(keep_downloads, other.keep_downloads);
    override_with(upgrade, other.upgrade);
    override_with(log_level, other.log_level);
    override_with(log_color, other.log_color);
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project,
                         const std::optional<Config>& cli) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    if (cli.has_value()) result.merge(cli.value());
    return result;
}

Result<EngineOptions> Config::engine_options() const {
    EngineOptions opts;

    if (command_timeout) {
        if (*command_timeout <= 0) {
            return DepmanError{DepmanError::Config, "command timeout must be positive"};
        }
        opts.command_timeout_seconds = *command_timeout;
    }
    if (download_timeout) {
        if (*download_timeout <= 0) {
            return DepmanError{DepmanError::Config, "download timeout must be positive"};
        }
        opts.install.fetch.timeout_seconds = *download_timeout;
    }
    if (download_retries) {
        if (*download_retries < 0) {
            return DepmanError{DepmanError::Config, "download retries must not be negative"};
        }
        if (*download_retries > kMaxDownloadRetries) {
            log::warn("download-retries %d capped at %d", *download_retries, kMaxDownloadRetries);
        }
        opts.install.download_retries = std::min(*download_retries, kMaxDownloadRetries);
    }
    if (retry_backoff_ms) opts.install.retry_backoff_ms = std::max(0, *retry_backoff_ms);
    if (keep_downloads) opts.install.keep_downloads = *keep_downloads;

    if (upgrade) {
        auto u = parse_upgrade_policy(*upgrade);
        if (u.is_err()) return std::move(u).error();
        opts.upgrade = u.value();
    }

    if (install_root) {
        opts.install.install_root = expand_home(*install_root);
    } else if (const char* home = home_dir()) {
        opts.install.install_root = fs::path(home) / ".depman" / "tools";
    } else {
        opts.install.install_root = fs::temp_directory_path() / "depman" / "tools";
    }

    if (download_dir) {
        opts.install.download_dir = expand_home(*download_dir);
    } else {
        std::error_code ec;
        fs::path tmp = fs::temp_directory_path(ec);
        if (ec) tmp = ".";
        opts.install.download_dir = tmp / "depman";
    }

    return Result<EngineOptions>::ok(std::move(opts));
}

Result<std::optional<Platform>> Config::target_platform() const {
    if (!platform) return Result<std::optional<Platform>>::ok(std::nullopt);
    auto p = parse_platform(*platform);
    if (p.is_err()) return std::move(p).error();
    return Result<std::optional<Platform>>::ok(p.value());
}

Result<log::Level> Config::level() const {
    if (!log_level) return Result<log::Level>::ok(log::Level::Info);
    return log::parse_level(*log_level);
}

std::string global_config_path() {
    const char* home = home_dir();
    if (!home) return "";
    return std::string(home) + "/.depman/config.toml";
}

std::string project_config_path(const std::string& manifest_path) {
    fs::path dir = fs::path(manifest_path).parent_path();
    return (dir / ".depman.toml").string();
}

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;
    const char* home = home_dir();
    if (!home) return path;
    return std::string(home) + path.substr(1);
}

} // namespace depman
