#include <depman/manager.hpp>
#include <depman/dependency_graph.hpp>
#include <depman/log.hpp>
#include <depman/platform_select.hpp>

namespace depman {

// ---------------------------------------------------------------------------
// Names
// ---------------------------------------------------------------------------

const char* state_name(DependencyState s) {
    switch (s) {
        case DependencyState::Pending:      return "pending";
        case DependencyState::Checking:     return "checking";
        case DependencyState::Satisfied:    return "satisfied";
        case DependencyState::NeedsInstall: return "needs-install";
        case DependencyState::Installing:   return "installing";
        case DependencyState::Installed:    return "installed";
        case DependencyState::Failed:       return "failed";
        case DependencyState::Cancelled:    return "cancelled";
    }
    return "unknown";
}

bool is_terminal(DependencyState s) {
    switch (s) {
        case DependencyState::Satisfied:
        case DependencyState::Installed:
        case DependencyState::Failed:
        case DependencyState::Cancelled:
            return true;
        case DependencyState::Pending:
        case DependencyState::Checking:
        case DependencyState::NeedsInstall:
        case DependencyState::Installing:
            return false;
    }
    return false;
}

const char* upgrade_policy_name(UpgradePolicy p) {
    switch (p) {
        case UpgradePolicy::Install:   return "install";
        case UpgradePolicy::Reinstall: return "reinstall";
        case UpgradePolicy::Never:     return "never";
    }
    return "unknown";
}

Result<UpgradePolicy> parse_upgrade_policy(const std::string& name) {
    for (UpgradePolicy p : {UpgradePolicy::Install, UpgradePolicy::Reinstall,
                            UpgradePolicy::Never}) {
        if (name == upgrade_policy_name(p)) return Result<UpgradePolicy>::ok(p);
    }
    return DepmanError{DepmanError::Config,
        "unknown upgrade policy '" + name + "'",
        "expected one of: install, reinstall, never"};
}

bool DependencyStatus::operator==(const DependencyStatus& o) const {
    return state == o.state && installed == o.installed &&
           current_version == o.current_version &&
           required_update == o.required_update &&
           compatible == o.compatible && error == o.error;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

namespace {

void transition(const std::string& name, DependencyStatus& st, DependencyState to) {
    log::debug("%s: %s -> %s", name.c_str(), state_name(st.state), state_name(to));
    st.state = to;
}

void fail(const std::string& name, DependencyStatus& st, DepmanError err) {
    transition(name, st, DependencyState::Failed);
    st.error = std::move(err);
}

// Problems in the version requirement itself; installing cannot fix these.
std::optional<DepmanError> version_spec_error(const Dependency& dep) {
    auto req = Version::parse(dep.version.required);
    if (req.is_err()) {
        return DepmanError{DepmanError::InvalidVersionFormat,
            "dependency '" + dep.name + "': invalid required version '" +
            dep.version.required + "'"};
    }
    if (!dep.version.constraint.empty()) {
        auto range = VersionReq::parse(dep.version.constraint);
        if (range.is_err()) {
            auto err = std::move(range).error();
            err.message = "dependency '" + dep.name + "': " + err.message;
            return err;
        }
    }
    return std::nullopt;
}

std::string describe_requirement(const Dependency& dep) {
    if (dep.version.constraint.empty()) return dep.version.required;
    return dep.version.constraint + " (pinned " + dep.version.required + ")";
}

} // namespace

// ---------------------------------------------------------------------------
// Manager
// ---------------------------------------------------------------------------

Manager::Manager(CommandRunner& runner,
                 Fetcher& fetcher,
                 EnvironmentApplier& env,
                 EngineOptions options)
    : options_(std::move(options)),
      exec_(runner, options_.command_timeout_seconds),
      installer_(exec_, fetcher, env, options_.install) {}

Status Manager::validate_options() const {
    if (options_.command_timeout_seconds <= 0) {
        return DepmanError{DepmanError::Config,
            "command timeout must be positive",
            "set engine.command-timeout or pass --timeout"};
    }
    if (options_.install.fetch.timeout_seconds <= 0) {
        return DepmanError{DepmanError::Config,
            "download timeout must be positive",
            "set engine.download-timeout"};
    }
    return ok_status();
}

bool Manager::cancelled() const {
    return cancel_ && cancel_->load();
}

DependencyStatus Manager::classify(const Dependency& dep, const PlatformConfig& cfg) {
    DependencyStatus st;
    transition(dep.name, st, DependencyState::Checking);

    if (auto err = version_spec_error(dep)) {
        fail(dep.name, st, std::move(*err));
        return st;
    }

    auto probe = installer_.probe(dep, cfg);
    if (probe.is_err()) {
        fail(dep.name, st, std::move(probe).error());
        return st;
    }

    std::optional<std::string> current;
    if (probe.value().exit_code == 0) {
        st.installed = true;
        // Unparsable output still counts as "present"; classify_version
        // turns it into InvalidVersionFormat.
        current = extract_version(probe.value().output)
                      .value_or(probe.value().output);
    }

    VersionCheck vc = classify_version(current, dep.version.required,
                                       dep.version.constraint);
    st.compatible = vc.compatible;
    st.required_update = vc.update;
    st.error = vc.error;
    if (st.installed && !vc.error) {
        st.current_version = *current;
    }

    if (st.installed) {
        log::debug("%s: found %s (required %s)", dep.name.c_str(),
                   st.current_version.empty() ? "unknown version" : st.current_version.c_str(),
                   describe_requirement(dep).c_str());
    }

    transition(dep.name, st, st.compatible ? DependencyState::Satisfied
                                           : DependencyState::NeedsInstall);
    return st;
}

DependencyStatus Manager::check(const Dependency& dep, Platform platform) {
    auto cfg = select_platform(dep, platform);
    if (cfg.is_err()) {
        DependencyStatus st;
        fail(dep.name, st, std::move(cfg).error());
        return st;
    }
    return classify(dep, cfg.value());
}

Status Manager::upgrade(const Dependency& dep, const PlatformConfig& cfg) {
    if (options_.upgrade == UpgradePolicy::Reinstall && !cfg.commands.uninstall.empty()) {
        DEPMAN_TRY(installer_.uninstall(dep, cfg));
    }
    return installer_.install(dep, cfg);
}

DependencyStatus Manager::ensure(const Dependency& dep, Platform platform,
                                 const StatusMap& finished) {
    for (const auto& prereq : dep.dependencies) {
        auto it = finished.find(prereq);
        if (it != finished.end() &&
            (it->second.state == DependencyState::Failed ||
             it->second.state == DependencyState::Cancelled)) {
            DependencyStatus st;
            fail(dep.name, st, DepmanError{DepmanError::PrerequisiteFailed,
                "'" + dep.name + "' skipped: prerequisite '" + prereq + "' " +
                state_name(it->second.state)});
            return st;
        }
    }

    auto cfg_result = select_platform(dep, platform);
    if (cfg_result.is_err()) {
        DependencyStatus st;
        fail(dep.name, st, std::move(cfg_result).error());
        return st;
    }
    const PlatformConfig& cfg = cfg_result.value();

    DependencyStatus st = classify(dep, cfg);
    if (st.state != DependencyState::NeedsInstall) return st;

    if (st.installed && options_.upgrade == UpgradePolicy::Never) {
        fail(dep.name, st, DepmanError{DepmanError::IncompatibleVersion,
            "'" + dep.name + "' " +
            (st.current_version.empty() ? std::string("(unknown version)")
                                        : st.current_version) +
            " does not satisfy " + describe_requirement(dep),
            "upgrade policy is 'never'; upgrade it manually or change engine.upgrade"});
        return st;
    }

    transition(dep.name, st, DependencyState::Installing);
    auto installed = upgrade(dep, cfg);
    if (installed.is_err()) {
        fail(dep.name, st, std::move(installed).error());
        return st;
    }

    // Success is judged on what is on the machine now
    DependencyStatus after = classify(dep, cfg);
    if (after.state == DependencyState::Satisfied) {
        auto activated = installer_.activate(dep, cfg);
        if (activated.is_err()) {
            fail(dep.name, after, std::move(activated).error());
            return after;
        }
        transition(dep.name, after, DependencyState::Installed);
        return after;
    }
    if (after.state == DependencyState::Failed) return after;

    DepmanError err{DepmanError::VerificationFailed,
        "'" + dep.name + "' still does not satisfy " + describe_requirement(dep) +
        " after installation" +
        (after.current_version.empty() ? std::string()
                                       : " (found " + after.current_version + ")")};
    fail(dep.name, after, std::move(err));
    return after;
}

Result<RunReport> Manager::check_all(const Manifest& manifest,
                                     std::optional<Platform> platform) {
    DEPMAN_TRY(validate_options());
    auto order = order_dependencies(manifest);
    if (order.is_err()) return std::move(order).error();

    Platform target = platform.value_or(host_platform());
    log::debug("checking %zu dependencies for %s",
               order.value().size(), platform_name(target));

    RunReport report;
    report.order = std::move(order).value();
    StatusMap& statuses = report.statuses;
    for (const auto& name : report.order) {
        if (cancelled()) {
            DependencyStatus st;
            transition(name, st, DependencyState::Cancelled);
            st.error = DepmanError{DepmanError::Cancelled, "run cancelled before '" + name + "'"};
            statuses[name] = std::move(st);
            continue;
        }
        statuses[name] = check(*manifest.find(name), target);
    }
    return Result<RunReport>::ok(std::move(report));
}

Result<RunReport> Manager::ensure_all(const Manifest& manifest,
                                      std::optional<Platform> platform) {
    DEPMAN_TRY(validate_options());
    auto graph = DependencyGraph::build(manifest);
    if (graph.is_err()) return std::move(graph).error();
    auto order = graph.value().order();
    if (order.is_err()) return std::move(order).error();

    Platform target = platform.value_or(host_platform());
    log::info("ensuring %zu dependencies for %s",
              order.value().size(), platform_name(target));

    RunReport report;
    report.order = std::move(order).value();
    StatusMap& statuses = report.statuses;
    for (const auto& name : report.order) {
        if (cancelled()) {
            DependencyStatus st;
            transition(name, st, DependencyState::Cancelled);
            st.error = DepmanError{DepmanError::Cancelled, "run cancelled before '" + name + "'"};
            statuses[name] = std::move(st);
            continue;
        }

        DependencyStatus st = ensure(*manifest.find(name), target, statuses);
        if (st.state == DependencyState::Failed && st.error &&
            st.error->code != DepmanError::PrerequisiteFailed) {
            log::warn("%s: %s", name.c_str(), st.error->message.c_str());
            auto blocked = graph.value().dependents_of(name);
            if (!blocked.empty()) {
                std::string list;
                for (const auto& b : blocked) {
                    if (!list.empty()) list += ", ";
                    list += b;
                }
                log::warn("%s: blocks %s", name.c_str(), list.c_str());
            }
        } else if (st.state == DependencyState::Installed) {
            log::info("%s %s installed", name.c_str(), st.current_version.c_str());
        }
        statuses[name] = std::move(st);
    }
    return Result<RunReport>::ok(std::move(report));
}

Result<DependencyStatus> Manager::check_one(const Dependency& dep,
                                            std::optional<Platform> platform) {
    DEPMAN_TRY(validate_options());
    DEPMAN_TRY(dep.validate());
    return Result<DependencyStatus>::ok(check(dep, platform.value_or(host_platform())));
}

Status Manager::install_one(const Dependency& dep, std::optional<Platform> platform) {
    DEPMAN_TRY(validate_options());
    DEPMAN_TRY(dep.validate());
    auto cfg = select_platform(dep, platform.value_or(host_platform()));
    if (cfg.is_err()) return std::move(cfg).error();
    DEPMAN_TRY(installer_.install(dep, cfg.value()));
    return installer_.activate(dep, cfg.value());
}

Status Manager::uninstall_one(const Dependency& dep, std::optional<Platform> platform) {
    DEPMAN_TRY(validate_options());
    auto cfg = select_platform(dep, platform.value_or(host_platform()));
    if (cfg.is_err()) return std::move(cfg).error();
    return installer_.uninstall(dep, cfg.value());
}

} // namespace depman
