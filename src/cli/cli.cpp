#include "cli.hpp"

#include <depman/dependency_graph.hpp>
#include <depman/log.hpp>
#include <depman/manager.hpp>
#include <depman/manifest.hpp>
#include <depman/process.hpp>
#include <depman/report.hpp>

#include <CLI/CLI.hpp>

#include <atomic>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <unistd.h>

namespace depman::cli {

namespace {

constexpr const char* kVersion = "0.1.0";

constexpr int kExitOk = 0;
constexpr int kExitAttention = 1;
constexpr int kExitFatal = 2;

std::atomic<bool> g_cancel{false};

void on_signal(int) {
    g_cancel.store(true);
}

void install_signal_handlers() {
    struct sigaction sa {};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

int fatal(const DepmanError& err) {
    std::fprintf(stderr, "%s\n", err.format().c_str());
    return kExitFatal;
}

Result<std::optional<Config>> load_optional(const std::string& path) {
    if (path.empty() || !std::filesystem::exists(path)) {
        return Result<std::optional<Config>>::ok(std::nullopt);
    }
    auto cfg = Config::load(path);
    if (cfg.is_err()) return std::move(cfg).error();
    log::debug("loaded config %s", path.c_str());
    return Result<std::optional<Config>>::ok(std::move(cfg).value());
}

void print_list(const Manifest& manifest, bool tree) {
    std::printf("Application: %s\n", manifest.name.c_str());
    if (!manifest.description.empty()) {
        std::printf("Description: %s\n", manifest.description.c_str());
    }
    std::printf("Manifest version: %s\n\n", manifest.version.c_str());

    for (const auto& dep : manifest.dependencies) {
        std::printf("- %s", dep.name.c_str());
        if (!dep.description.empty()) std::printf(": %s", dep.description.c_str());
        std::printf("\n  version: %s", dep.version.required.c_str());
        if (!dep.version.constraint.empty()) {
            std::printf(" (constraint %s)", dep.version.constraint.c_str());
        }
        std::printf("\n  platforms:");
        for (const auto& [platform, cfg] : dep.platforms) {
            std::printf(" %s[%s]", platform_name(platform),
                        installer_type_name(cfg.installer.type));
        }
        std::printf("\n");
        if (!dep.dependencies.empty()) {
            std::string list;
            for (const auto& p : dep.dependencies) {
                if (!list.empty()) list += ", ";
                list += p;
            }
            std::printf("  depends on: %s\n", list.c_str());
        }
    }

    if (!tree) return;
    auto graph = DependencyGraph::build(manifest);
    if (graph.is_err()) {
        std::fprintf(stderr, "%s\n", graph.error().format().c_str());
        return;
    }
    std::printf("\n");
    for (const auto& dep : manifest.dependencies) {
        if (graph.value().dependents_of(dep.name).empty()) {
            std::printf("%s", graph.value().tree_display(dep.name).c_str());
        }
    }
}

} // namespace

std::optional<int> parse_args(int argc, char** argv, Args& args) {
    CLI::App app{"depman - bootstraps the external tools an application needs"};
    app.require_subcommand(1);

    std::string platform;
    std::string level;
    bool verbose = false;
    bool no_color = false;
    int timeout = 0;
    std::string install_root;

    app.add_option("-c,--config", args.manifest_path, "Path to the dependency manifest");
    app.add_option("-p,--platform", platform, "Override platform detection (windows, linux, darwin)");
    app.add_option("-l,--log-level", level, "Log level (trace, debug, info, warn, error)");
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");
    app.add_flag("--no-color", no_color, "Disable coloured log output");
    app.add_option("--timeout", timeout, "Per-command timeout in seconds")
        ->check(CLI::PositiveNumber);
    app.add_option("--install-root", install_root, "Root directory for {install_dir}");

    auto* check = app.add_subcommand("check", "Check dependencies without installing them");
    check->add_option("name", args.name, "Only check this dependency");
    check->callback([&args] { args.command = Command::Check; });

    auto* ensure = app.add_subcommand("ensure", "Install or upgrade whatever is missing");
    ensure->callback([&args] { args.command = Command::Ensure; });

    auto* install = app.add_subcommand("install", "Install one dependency");
    install->add_option("name", args.name, "Dependency name")->required();
    install->callback([&args] { args.command = Command::Install; });

    auto* uninstall = app.add_subcommand("uninstall", "Run a dependency's uninstall command");
    uninstall->add_option("name", args.name, "Dependency name")->required();
    uninstall->callback([&args] { args.command = Command::Uninstall; });

    auto* list = app.add_subcommand("list", "List the dependencies in the manifest");
    list->add_flag("--tree", args.tree, "Show the prerequisite tree");
    list->callback([&args] { args.command = Command::List; });

    auto* version = app.add_subcommand("version", "Show depman version");
    version->callback([&args] { args.command = Command::Version; });

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e);
        return code == 0 ? kExitOk : kExitFatal;
    }

    if (!platform.empty()) args.overrides.platform = platform;
    if (!level.empty()) args.overrides.log_level = level;
    if (verbose) args.overrides.log_level = "debug";
    if (no_color) args.overrides.log_color = false;
    if (timeout > 0) args.overrides.command_timeout = timeout;
    if (!install_root.empty()) args.overrides.install_root = install_root;
    return std::nullopt;
}

int run(const Args& args) {
    if (args.command == Command::Version) {
        std::printf("depman %s\n", kVersion);
        return kExitOk;
    }

    auto global = load_optional(global_config_path());
    if (global.is_err()) return fatal(global.error());
    auto project = load_optional(project_config_path(args.manifest_path));
    if (project.is_err()) return fatal(project.error());
    Config cfg = Config::effective(global.value(), project.value(), args.overrides);

    auto level = cfg.level();
    if (level.is_err()) return fatal(level.error());
    log::set_level(level.value());
    log::set_color_enabled(cfg.log_color.value_or(true) && isatty(STDERR_FILENO));

    auto platform = cfg.target_platform();
    if (platform.is_err()) return fatal(platform.error());
    auto options = cfg.engine_options();
    if (options.is_err()) return fatal(options.error());

    auto manifest_result = Manifest::load(args.manifest_path);
    if (manifest_result.is_err()) return fatal(manifest_result.error());
    const Manifest& manifest = manifest_result.value();

    if (args.command == Command::List) {
        print_list(manifest, args.tree);
        return kExitOk;
    }

    ProcessRunner runner;
    CurlFetcher fetcher;
    ProcessEnvironment env;
    Manager manager(runner, fetcher, env, options.value());

    install_signal_handlers();
    manager.set_cancel_flag(&g_cancel);

    const Dependency* single = nullptr;
    if (!args.name.empty()) {
        single = manifest.find(args.name);
        if (!single) {
            return fatal(DepmanError{DepmanError::NotFound,
                "no dependency named '" + args.name + "' in " + args.manifest_path});
        }
    }

    switch (args.command) {
        case Command::Check: {
            if (single) {
                auto st = manager.check_one(*single, platform.value());
                if (st.is_err()) return fatal(st.error());
                std::printf("- %s: %s\n", single->name.c_str(),
                            describe_status(st.value()).c_str());
                return needs_attention(st.value()) ? kExitAttention : kExitOk;
            }
            auto report = manager.check_all(manifest, platform.value());
            if (report.is_err()) return fatal(report.error());
            std::printf("%s", format_report(report.value()).c_str());
            for (const auto& [name, st] : report.value().statuses) {
                if (needs_attention(st)) return kExitAttention;
            }
            return kExitOk;
        }
        case Command::Ensure: {
            auto report = manager.ensure_all(manifest, platform.value());
            if (report.is_err()) return fatal(report.error());
            std::printf("%s", format_report(report.value()).c_str());
            for (const auto& [name, st] : report.value().statuses) {
                if (st.state == DependencyState::Failed ||
                    st.state == DependencyState::Cancelled) {
                    return kExitAttention;
                }
            }
            return kExitOk;
        }
        case Command::Install: {
            auto r = manager.install_one(*single, platform.value());
            if (r.is_err()) return fatal(r.error());
            log::info("%s installed", single->name.c_str());
            return kExitOk;
        }
        case Command::Uninstall: {
            auto r = manager.uninstall_one(*single, platform.value());
            if (r.is_err()) return fatal(r.error());
            log::info("%s uninstalled", single->name.c_str());
            return kExitOk;
        }
        case Command::List:
        case Command::Version:
            break;
    }
    return kExitOk;
}

} // namespace depman::cli
