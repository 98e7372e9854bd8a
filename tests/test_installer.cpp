#include <catch2/catch.hpp>
#include <depman/installer.hpp>
#include <depman/sha256.hpp>
#include "fakes.hpp"

using namespace depman;
using depman::testing::FakeFetcher;
using depman::testing::FakeRunner;
using depman::testing::TempDir;
namespace fs = std::filesystem;

namespace {

const char* kUrl = "https://example.com/releases/jq-linux64";

Dependency package_dep() {
    Dependency d;
    d.name = "jq";
    d.version.required = "1.7.1";
    PlatformConfig cfg;
    cfg.commands.install = {"apt-get", "install", "-y", "{product_id}"};
    cfg.commands.verify = {"jq", "--version"};
    d.platforms[Platform::Linux] = cfg;
    d.environment.path = {"{install_dir}/bin"};
    d.environment.variables["JQ_HOME"] = "{install_dir}";
    return d;
}

Dependency binary_dep(const std::string& checksum = "") {
    Dependency d = package_dep();
    PlatformConfig& cfg = d.platforms[Platform::Linux];
    cfg.installer.type = InstallerType::Binary;
    cfg.installer.url = kUrl;
    cfg.installer.checksum = checksum;
    cfg.commands.install = {"cp", "{download_path}", "{install_dir}/jq"};
    cfg.commands.verify = {"{install_dir}/jq", "--version"};
    return d;
}

struct Fixture {
    TempDir td;
    FakeRunner runner;
    FakeFetcher fetcher;
    RecordingEnvironment env;
    CommandExecutor exec{runner, 60};

    InstallOptions options(bool keep = false) {
        InstallOptions o;
        o.install_root = td.path / "tools";
        o.download_dir = td.path / "downloads";
        o.retry_backoff_ms = 0;
        o.keep_downloads = keep;
        return o;
    }
};

} // namespace

TEST_CASE("package install runs install and verify; activate applies the environment", "[installer]") {
    Fixture f;
    f.runner.on_output("apt-get", 0, "");
    f.runner.on_output("jq", 0, "jq-1.7.1");
    ArtifactInstaller inst(f.exec, f.fetcher, f.env, f.options());

    Dependency dep = package_dep();
    const PlatformConfig& cfg = dep.platforms.at(Platform::Linux);
    auto st = inst.install(dep, cfg);
    REQUIRE(st.is_ok());

    REQUIRE(f.runner.calls.size() == 2);
    REQUIRE(f.runner.calls[0] == std::vector<std::string>{"apt-get", "install", "-y", "jq"});
    REQUIRE(f.runner.calls[1][0] == "jq");
    REQUIRE(f.fetcher.urls.empty());
    REQUIRE(f.env.changes().empty());

    REQUIRE(inst.activate(dep, cfg).is_ok());
    std::string dir = (f.td.path / "tools" / "jq").string();
    REQUIRE(f.env.path() == std::vector<std::string>{dir + "/bin"});
    REQUIRE(f.env.get("JQ_HOME") == std::optional<std::string>(dir));
}

TEST_CASE("binary install downloads, checks and cleans up", "[installer]") {
    Fixture f;
    std::string content = "#!/bin/sh\necho jq-1.7.1\n";
    f.fetcher.serve(kUrl, content);

    fs::path seen_download;
    bool was_executable = false;
    f.runner.on("cp", [&](const std::vector<std::string>& argv) {
        seen_download = argv[1];
        auto perms = fs::status(seen_download).permissions();
        was_executable = (perms & fs::perms::owner_exec) != fs::perms::none;
        return Result<CommandOutput>::ok(CommandOutput{0, ""});
    });
    std::string verify_path = (f.td.path / "tools" / "jq" / "jq").string();
    f.runner.on_output(verify_path, 0, "jq-1.7.1");

    ArtifactInstaller inst(f.exec, f.fetcher, f.env, f.options());
    Dependency dep = binary_dep("sha256:" + SHA256::hash_hex(content));
    auto st = inst.install(dep, dep.platforms.at(Platform::Linux));
    REQUIRE(st.is_ok());

    REQUIRE(seen_download.string() ==
            (f.td.path / "downloads" / "jq" / "jq-linux64").string());
    REQUIRE(was_executable);
    REQUIRE(fs::is_directory(f.td.path / "tools" / "jq"));
    REQUIRE_FALSE(fs::exists(seen_download));
}

TEST_CASE("keep_downloads leaves the artifact", "[installer]") {
    Fixture f;
    f.fetcher.serve(kUrl, "bin");
    f.runner.on_output("cp", 0, "");
    f.runner.on_output((f.td.path / "tools" / "jq" / "jq").string(), 0, "1.7.1");

    ArtifactInstaller inst(f.exec, f.fetcher, f.env, f.options(true));
    Dependency dep = binary_dep();
    REQUIRE(inst.install(dep, dep.platforms.at(Platform::Linux)).is_ok());
    REQUIRE(fs::exists(f.td.path / "downloads" / "jq" / "jq-linux64"));
}

TEST_CASE("checksum mismatch stops before install", "[installer]") {
    Fixture f;
    f.fetcher.serve(kUrl, "tampered");
    f.runner.on_output("cp", 0, "");

    ArtifactInstaller inst(f.exec, f.fetcher, f.env, f.options());
    Dependency dep = binary_dep(std::string(64, 'a'));
    auto st = inst.install(dep, dep.platforms.at(Platform::Linux));
    REQUIRE(st.failed_with(DepmanError::ChecksumMismatch));
    REQUIRE(f.runner.calls.empty());
    REQUIRE_FALSE(fs::exists(f.td.path / "downloads" / "jq" / "jq-linux64"));
    REQUIRE(f.env.changes().empty());
}

TEST_CASE("download failure is reported after retries", "[installer]") {
    Fixture f;
    ArtifactInstaller inst(f.exec, f.fetcher, f.env, f.options());
    Dependency dep = binary_dep();
    auto st = inst.install(dep, dep.platforms.at(Platform::Linux));
    REQUIRE(st.failed_with(DepmanError::Network));
    REQUIRE(f.fetcher.urls.size() == 3);
    REQUIRE(f.runner.calls.empty());
}

TEST_CASE("failed install command skips verify and environment", "[installer]") {
    Fixture f;
    f.runner.on_output("apt-get", 100, "E: Unable to locate package jq");
    f.runner.on_output("jq", 0, "jq-1.7.1");

    ArtifactInstaller inst(f.exec, f.fetcher, f.env, f.options());
    Dependency dep = package_dep();
    auto st = inst.install(dep, dep.platforms.at(Platform::Linux));
    REQUIRE(st.is_err());
    REQUIRE(st.error().code == DepmanError::CommandFailed);
    REQUIRE(st.error().exit_code == 100);
    REQUIRE(st.error().output.find("Unable to locate") != std::string::npos);
    REQUIRE(f.runner.count("jq") == 0);
    REQUIRE(f.env.changes().empty());
}

TEST_CASE("failed verify is a verification failure", "[installer]") {
    Fixture f;
    f.runner.on_output("apt-get", 0, "");
    f.runner.on_output("jq", 1, "jq: error");

    ArtifactInstaller inst(f.exec, f.fetcher, f.env, f.options());
    Dependency dep = package_dep();
    auto st = inst.install(dep, dep.platforms.at(Platform::Linux));
    REQUIRE(st.failed_with(DepmanError::VerificationFailed));
    REQUIRE(st.error().exit_code == 1);
    REQUIRE(f.env.changes().empty());
}

TEST_CASE("template error happens before any side effect", "[installer]") {
    Fixture f;
    f.fetcher.serve(kUrl, "bin");
    ArtifactInstaller inst(f.exec, f.fetcher, f.env, f.options());

    Dependency dep = binary_dep();
    dep.environment.variables["BROKEN"] = "{unknown_token}";
    auto st = inst.install(dep, dep.platforms.at(Platform::Linux));
    REQUIRE(st.failed_with(DepmanError::TemplateError));
    REQUIRE(f.fetcher.urls.empty());
    REQUIRE(f.runner.calls.empty());
}

TEST_CASE("download_path is unavailable to verify", "[installer]") {
    Fixture f;
    f.fetcher.serve(kUrl, "bin");
    ArtifactInstaller inst(f.exec, f.fetcher, f.env, f.options());

    Dependency dep = binary_dep();
    dep.platforms[Platform::Linux].commands.verify = {"sha256sum", "{download_path}"};
    auto st = inst.install(dep, dep.platforms.at(Platform::Linux));
    REQUIRE(st.failed_with(DepmanError::TemplateError));
    REQUIRE(f.fetcher.urls.empty());
}

TEST_CASE("substitutions", "[installer]") {
    Fixture f;
    ArtifactInstaller inst(f.exec, f.fetcher, f.env, f.options());
    Dependency dep = binary_dep();
    PlatformConfig cfg = dep.platforms.at(Platform::Linux);

    auto subs = inst.substitutions(dep, cfg, true);
    REQUIRE(subs.at(kProductId) == "jq");
    REQUIRE(subs.count(kDownloadPath) == 1);
    REQUIRE(inst.substitutions(dep, cfg, false).count(kDownloadPath) == 0);

    cfg.installer.product_id = "JQ-PKG";
    cfg.installer.install_dir = "/opt/custom";
    subs = inst.substitutions(dep, cfg, true);
    REQUIRE(subs.at(kProductId) == "JQ-PKG");
    REQUIRE(subs.at(kInstallDir) == "/opt/custom");

    Dependency pkg = package_dep();
    REQUIRE(inst.substitutions(pkg, pkg.platforms.at(Platform::Linux), true)
                .count(kDownloadPath) == 0);
}

TEST_CASE("probe runs verify without raising on failure", "[installer]") {
    Fixture f;
    f.runner.on_output("jq", 127, "");
    ArtifactInstaller inst(f.exec, f.fetcher, f.env, f.options());
    Dependency dep = package_dep();
    auto r = inst.probe(dep, dep.platforms.at(Platform::Linux));
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 127);
}

TEST_CASE("uninstall", "[installer]") {
    Fixture f;
    f.runner.on_output("apt-get", 0, "");
    ArtifactInstaller inst(f.exec, f.fetcher, f.env, f.options());

    Dependency dep = package_dep();
    REQUIRE(inst.uninstall(dep, dep.platforms.at(Platform::Linux))
                .failed_with(DepmanError::NotFound));

    dep.platforms[Platform::Linux].commands.uninstall = {"apt-get", "remove", "-y", "{product_id}"};
    REQUIRE(inst.uninstall(dep, dep.platforms.at(Platform::Linux)).is_ok());
    REQUIRE(f.runner.calls.back() ==
            std::vector<std::string>{"apt-get", "remove", "-y", "jq"});
}

TEST_CASE("archive install creates the install directory before extracting", "[installer]") {
    Fixture f;
    const std::string url = "https://example.com/releases/tool-1.0.0.tar.gz";
    f.fetcher.serve(url, "archive-bytes");

    bool dir_ready = false;
    std::vector<std::string> tar_argv;
    f.runner.on("tar", [&](const std::vector<std::string>& argv) {
        tar_argv = argv;
        dir_ready = fs::is_directory(f.td.path / "tools" / "jq");
        return Result<CommandOutput>::ok(CommandOutput{0, ""});
    });
    f.runner.on_output("jq", 0, "jq-1.7.1");

    Dependency dep = package_dep();
    PlatformConfig& cfg = dep.platforms[Platform::Linux];
    cfg.installer.type = InstallerType::Archive;
    cfg.installer.url = url;
    cfg.commands.install = {"tar", "-xzf", "{download_path}", "-C", "{install_dir}"};

    ArtifactInstaller inst(f.exec, f.fetcher, f.env, f.options());
    auto st = inst.install(dep, dep.platforms.at(Platform::Linux));
    REQUIRE(st.is_ok());

    REQUIRE(dir_ready);
    REQUIRE(tar_argv.size() == 5);
    REQUIRE(tar_argv[2] == (f.td.path / "downloads" / "jq" / "tool-1.0.0.tar.gz").string());
    REQUIRE(tar_argv[4] == (f.td.path / "tools" / "jq").string());
}

TEST_CASE("activate expands templates before mutating", "[installer]") {
    Fixture f;
    ArtifactInstaller inst(f.exec, f.fetcher, f.env, f.options());
    Dependency dep = package_dep();
    dep.environment.variables["BROKEN"] = "{nope}";
    REQUIRE(inst.activate(dep, dep.platforms.at(Platform::Linux))
                .failed_with(DepmanError::TemplateError));
    REQUIRE(f.env.changes().empty());
}
