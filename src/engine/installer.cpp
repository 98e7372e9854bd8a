#include <depman/installer.hpp>
#include <depman/log.hpp>
#include <depman/sha256.hpp>

namespace fs = std::filesystem;

namespace depman {

ArtifactInstaller::ArtifactInstaller(const CommandExecutor& exec,
                                     Fetcher& fetcher,
                                     EnvironmentApplier& env,
                                     InstallOptions options)
    : exec_(exec), fetcher_(fetcher), env_(env), options_(std::move(options)) {}

fs::path ArtifactInstaller::install_dir(const Dependency& dep,
                                        const PlatformConfig& cfg) const {
    if (!cfg.installer.install_dir.empty()) return cfg.installer.install_dir;
    return options_.install_root / dep.name;
}

fs::path ArtifactInstaller::download_path(const Dependency& dep,
                                          const PlatformConfig& cfg) const {
    return options_.download_dir / dep.name / url_file_name(cfg.installer.url);
}

Substitutions ArtifactInstaller::substitutions(const Dependency& dep,
                                               const PlatformConfig& cfg,
                                               bool with_download) const {
    Substitutions subs;
    subs[kInstallDir] = install_dir(dep, cfg).string();
    subs[kProductId] = cfg.installer.product_id.empty() ? dep.name
                                                        : cfg.installer.product_id;
    if (with_download && !cfg.installer.url.empty()) {
        subs[kDownloadPath] = download_path(dep, cfg).string();
    }
    return subs;
}

Result<CommandOutput> ArtifactInstaller::probe(const Dependency& dep,
                                               const PlatformConfig& cfg) const {
    return exec_.probe(cfg.commands.verify, substitutions(dep, cfg, false));
}

Result<fs::path> ArtifactInstaller::fetch_artifact(const Dependency& dep,
                                                   const PlatformConfig& cfg) {
    const InstallerSpec& inst = cfg.installer;
    fs::path dest = download_path(dep, cfg);

    log::info("downloading %s", inst.url.c_str());
    auto st = fetch_with_retry(fetcher_, inst.url, dest, options_.fetch,
                               options_.download_retries, options_.retry_backoff_ms);
    if (st.is_err()) return std::move(st).error();

    if (!inst.checksum.empty()) {
        auto expected = parse_checksum(inst.checksum);
        if (expected.is_err()) return std::move(expected).error();

        auto actual = SHA256::hash_file(dest);
        if (actual.is_err()) return std::move(actual).error();

        if (actual.value() != expected.value()) {
            std::error_code ec;
            fs::remove(dest, ec);
            return DepmanError{DepmanError::ChecksumMismatch,
                "checksum mismatch for " + url_file_name(inst.url) + ": expected " +
                expected.value() + ", got " + actual.value(),
                "the download may be corrupt or the manifest checksum outdated"};
        }
        log::debug("sha256 ok: %s", actual.value().c_str());
    }
    return Result<fs::path>::ok(std::move(dest));
}

// Type-specific preparation between download and the install command.
Status ArtifactInstaller::prepare(const Dependency& dep, const PlatformConfig& cfg,
                                  const fs::path& artifact) {
    std::error_code ec;
    switch (cfg.installer.type) {
    case InstallerType::Package:
        return ok_status();

    case InstallerType::Binary:
        if (!artifact.empty()) {
            fs::permissions(artifact,
                            fs::perms::owner_exec | fs::perms::group_exec |
                            fs::perms::others_exec,
                            fs::perm_options::add, ec);
            if (ec) {
                return DepmanError{DepmanError::IO,
                    "cannot mark " + artifact.string() + " executable: " + ec.message()};
            }
        }
        [[fallthrough]];
    case InstallerType::Archive:
    case InstallerType::Msi:
    case InstallerType::Pkg:
    case InstallerType::Exe: {
        fs::path dir = install_dir(dep, cfg);
        fs::create_directories(dir, ec);
        if (ec) {
            return DepmanError{DepmanError::IO,
                "cannot create install directory " + dir.string() + ": " + ec.message(),
                "installation runs with the current user's privileges"};
        }
        return ok_status();
    }
    }
    return ok_status();
}

Status ArtifactInstaller::install(const Dependency& dep, const PlatformConfig& cfg) {
    Substitutions subs = substitutions(dep, cfg, true);
    Substitutions verify_subs = substitutions(dep, cfg, false);

    // Resolve every template up front
    DEPMAN_TRY(expand_command(cfg.commands.install, subs));
    DEPMAN_TRY(expand_command(cfg.commands.verify, verify_subs));
    for (const auto& entry : dep.environment.path) {
        DEPMAN_TRY(expand_template(entry, verify_subs));
    }
    for (const auto& [name, value] : dep.environment.variables) {
        DEPMAN_TRY(expand_template(value, verify_subs));
    }

    fs::path artifact;
    if (!cfg.installer.url.empty()) {
        auto fetched = fetch_artifact(dep, cfg);
        if (fetched.is_err()) return std::move(fetched).error();
        artifact = std::move(fetched).value();
    }

    auto cleanup = [&] {
        if (artifact.empty() || options_.keep_downloads) return;
        std::error_code ec;
        fs::remove(artifact, ec);
    };

    auto st = prepare(dep, cfg, artifact);
    if (st.is_err()) {
        cleanup();
        return st;
    }

    log::info("installing %s (%s)", dep.name.c_str(), installer_type_name(cfg.installer.type));
    auto installed = exec_.run(cfg.commands.install, subs);
    cleanup();
    if (installed.is_err()) {
        auto err = std::move(installed).error();
        err.message = "install of '" + dep.name + "' failed: " + err.message;
        return err;
    }

    auto verified = exec_.run(cfg.commands.verify, verify_subs);
    if (verified.is_err()) {
        auto err = std::move(verified).error();
        if (err.code == DepmanError::CommandFailed) {
            err.code = DepmanError::VerificationFailed;
            err.message = "'" + dep.name + "' installed but verification failed: " +
                          err.message;
        }
        return err;
    }
    return ok_status();
}

Status ArtifactInstaller::activate(const Dependency& dep, const PlatformConfig& cfg) {
    return apply_environment(dep.environment, substitutions(dep, cfg, false), env_);
}

Status ArtifactInstaller::uninstall(const Dependency& dep, const PlatformConfig& cfg) {
    if (cfg.commands.uninstall.empty()) {
        return DepmanError{DepmanError::NotFound,
            "dependency '" + dep.name + "' declares no uninstall command"};
    }
    log::info("uninstalling %s", dep.name.c_str());
    auto r = exec_.run(cfg.commands.uninstall, substitutions(dep, cfg, false));
    if (r.is_err()) return std::move(r).error();
    return ok_status();
}

} // namespace depman
