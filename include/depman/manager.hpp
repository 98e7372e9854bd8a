#pragma once

#include <depman/command.hpp>
#include <depman/environment.hpp>
#include <depman/fetch.hpp>
#include <depman/installer.hpp>
#include <depman/manifest.hpp>
#include <depman/platform.hpp>
#include <depman/result.hpp>
#include <depman/version_check.hpp>

#include <atomic>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace depman {

// Per-dependency lifecycle within one run:
//
//   Pending -> Checking -> Satisfied
//                       -> NeedsInstall -> Installing -> Installed | Failed
//
// plus Failed straight from Checking and Cancelled from Pending.
enum class DependencyState {
    Pending,
    Checking,
    Satisfied,
    NeedsInstall,
    Installing,
    Installed,
    Failed,
    Cancelled,
};

const char* state_name(DependencyState s);
bool is_terminal(DependencyState s);

struct DependencyStatus {
    DependencyState state = DependencyState::Pending;
    bool installed = false;
    std::string current_version;   // empty when not detected
    UpdateKind required_update = UpdateKind::NotInstalled;
    bool compatible = false;
    std::optional<DepmanError> error;

    bool operator==(const DependencyStatus& o) const;
    bool operator!=(const DependencyStatus& o) const { return !(*this == o); }
};

// Keyed by dependency name; always holds every manifest entry.
using StatusMap = std::map<std::string, DependencyStatus>;

// Outcome of a whole-manifest run: the resolved order and one status per
// dependency.
struct RunReport {
    std::vector<std::string> order;
    StatusMap statuses;
};

// What EnsureAll does with a dependency that is present but incompatible.
enum class UpgradePolicy {
    Install,     // run the install command over the existing version
    Reinstall,   // uninstall (when declared), then install
    Never,       // leave it; Failed with IncompatibleVersion
};

const char* upgrade_policy_name(UpgradePolicy p);
Result<UpgradePolicy> parse_upgrade_policy(const std::string& name);

struct EngineOptions {
    InstallOptions install;
    int command_timeout_seconds = 600;
    UpgradePolicy upgrade = UpgradePolicy::Install;
};

// Façade over the engine. Dependencies are processed one at a time in
// prerequisite order, so environment changes made by one installation are
// visible to the next only after it has finished.
//
// Only run-fatal conditions (unknown prerequisite, cycle, invalid options)
// come back as errors; everything else lands in a DependencyStatus.
class Manager {
public:
    Manager(CommandRunner& runner,
            Fetcher& fetcher,
            EnvironmentApplier& env,
            EngineOptions options = {});

    // Checked before each dependency. When set, the remaining entries are
    // reported as Cancelled. A running subprocess is never interrupted.
    void set_cancel_flag(const std::atomic<bool>* flag) { cancel_ = flag; }

    // Classifies every dependency; never installs anything.
    Result<RunReport> check_all(const Manifest& manifest,
                                std::optional<Platform> platform = std::nullopt);

    // check_all plus installation of whatever is missing or incompatible.
    // A dependency whose prerequisite Failed is marked Failed with
    // PrerequisiteFailed and its commands are not run.
    Result<RunReport> ensure_all(const Manifest& manifest,
                                 std::optional<Platform> platform = std::nullopt);

    Result<DependencyStatus> check_one(const Dependency& dep,
                                       std::optional<Platform> platform = std::nullopt);

    // Installs unconditionally; prerequisites are the caller's business.
    Status install_one(const Dependency& dep,
                       std::optional<Platform> platform = std::nullopt);

    Status uninstall_one(const Dependency& dep,
                         std::optional<Platform> platform = std::nullopt);

private:
    Status validate_options() const;
    bool cancelled() const;

    DependencyStatus check(const Dependency& dep, Platform platform);
    DependencyStatus ensure(const Dependency& dep, Platform platform,
                            const StatusMap& finished);
    DependencyStatus classify(const Dependency& dep, const PlatformConfig& cfg);
    Status upgrade(const Dependency& dep, const PlatformConfig& cfg);

    EngineOptions options_;
    CommandExecutor exec_;
    ArtifactInstaller installer_;
    const std::atomic<bool>* cancel_ = nullptr;
};

} // namespace depman
