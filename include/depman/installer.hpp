#pragma once

#include <depman/command.hpp>
#include <depman/environment.hpp>
#include <depman/fetch.hpp>
#include <depman/manifest.hpp>
#include <depman/result.hpp>
#include <filesystem>
#include <string>

namespace depman {

struct InstallOptions {
    std::filesystem::path install_root;   // {install_dir} = install_root/<name>
    std::filesystem::path download_dir;   // artifacts land in download_dir/<name>/
    FetchOptions fetch;
    int download_retries = 2;
    int retry_backoff_ms = 500;
    bool keep_downloads = false;
};

// Installs one dependency on one platform:
//
//   1. download installer.url (if any) and check its sha256;
//   2. run commands.install;
//   3. run commands.verify (failure -> VerificationFailed).
//
// All templates, the environment spec's included, are expanded before the
// first side effect, so a TemplateError never leaves a half-done install
// behind. Any failure stops at that step. install() never touches the
// environment; activate() applies it once the caller has accepted the
// installed version.
class ArtifactInstaller {
public:
    ArtifactInstaller(const CommandExecutor& exec,
                      Fetcher& fetcher,
                      EnvironmentApplier& env,
                      InstallOptions options);

    Status install(const Dependency& dep, const PlatformConfig& cfg);

    // Applies the dependency's environment spec.
    Status activate(const Dependency& dep, const PlatformConfig& cfg);

    // Runs commands.uninstall; NotFound when none is declared.
    Status uninstall(const Dependency& dep, const PlatformConfig& cfg);

    // Runs commands.verify without {download_path}. Non-zero exit is
    // returned as-is; interpretation is the caller's.
    Result<CommandOutput> probe(const Dependency& dep, const PlatformConfig& cfg) const;

    std::filesystem::path install_dir(const Dependency& dep, const PlatformConfig& cfg) const;
    std::filesystem::path download_path(const Dependency& dep, const PlatformConfig& cfg) const;

    // {install_dir} and {product_id} always; {download_path} only when the
    // installer has a URL and `with_download` is set.
    Substitutions substitutions(const Dependency& dep, const PlatformConfig& cfg,
                                bool with_download) const;

private:
    Result<std::filesystem::path> fetch_artifact(const Dependency& dep,
                                                 const PlatformConfig& cfg);
    Status prepare(const Dependency& dep, const PlatformConfig& cfg,
                   const std::filesystem::path& artifact);

    const CommandExecutor& exec_;
    Fetcher& fetcher_;
    EnvironmentApplier& env_;
    InstallOptions options_;
};

} // namespace depman
