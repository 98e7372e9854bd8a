#include <catch2/catch.hpp>
#include <depman/manifest.hpp>
#include "fakes.hpp"

using namespace depman;
using depman::testing::TempDir;

static const char* kFullManifest = R"(
version = "1.0"
name = "my-app"
description = "Demo application"

[[dependencies]]
name = "openssl"
version = "3.0.13"
[dependencies.platforms.linux.commands]
install = ["apt-get", "install", "-y", "openssl"]
verify = ["openssl", "version"]

[[dependencies]]
name = "python"
description = "Python runtime"
dependencies = ["openssl"]

[dependencies.version]
required = "3.11.4"
constraint = "^3.11.0"

[dependencies.platforms.linux.installer]
type = "archive"
url = "https://example.com/python-3.11.4.tar.gz"
checksum = "sha256:E3B0C44298FC1C149AFBF4C8996FB92427AE41E4649B934CA495991B7852B855"

[dependencies.platforms.linux.commands]
install = ["tar", "-xzf", "{download_path}", "-C", "{install_dir}"]
verify = ["{install_dir}/bin/python3", "--version"]
uninstall = ["rm", "-rf", "{install_dir}"]

[dependencies.platforms.windows.installer]
type = "msi"
url = "https://example.com/python.msi"
product_id = "{ABC-123}"

[dependencies.platforms.windows.commands]
install = ["msiexec", "/i", "{download_path}", "/qn"]
verify = ["python", "--version"]

[dependencies.environment]
path = ["{install_dir}/bin"]
[dependencies.environment.variables]
PYTHONHOME = "{install_dir}"
)";

// ===== Parsing =====

TEST_CASE("parse full manifest", "[manifest]") {
    auto r = Manifest::parse(kFullManifest, "depman.toml");
    REQUIRE(r.is_ok());
    const auto& m = r.value();
    REQUIRE(m.name == "my-app");
    REQUIRE(m.version == "1.0");
    REQUIRE(m.dependencies.size() == 2);

    const Dependency* ssl = m.find("openssl");
    REQUIRE(ssl != nullptr);
    REQUIRE(ssl->version.required == "3.0.13");
    REQUIRE(ssl->version.constraint.empty());
    REQUIRE(ssl->platforms.at(Platform::Linux).installer.type == InstallerType::Package);

    const Dependency* py = m.find("python");
    REQUIRE(py != nullptr);
    REQUIRE(py->dependencies == std::vector<std::string>{"openssl"});
    REQUIRE(py->version.constraint == "^3.11.0");
    REQUIRE(py->platforms.size() == 2);

    const auto& linux_cfg = py->platforms.at(Platform::Linux);
    REQUIRE(linux_cfg.installer.type == InstallerType::Archive);
    REQUIRE(linux_cfg.commands.install.size() == 5);
    REQUIRE(linux_cfg.commands.uninstall.size() == 3);

    const auto& win = py->platforms.at(Platform::Windows);
    REQUIRE(win.installer.type == InstallerType::Msi);
    REQUIRE(win.installer.product_id == "{ABC-123}");

    REQUIRE(py->environment.path == std::vector<std::string>{"{install_dir}/bin"});
    REQUIRE(py->environment.variables.at("PYTHONHOME") == "{install_dir}");
    REQUIRE(m.find("nothing") == nullptr);
}

TEST_CASE("dependency line numbers are recorded", "[manifest]") {
    auto r = Manifest::parse(kFullManifest, "depman.toml");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().dependencies[0].line > 0);
    REQUIRE(r.value().dependencies[1].line > r.value().dependencies[0].line);
}

TEST_CASE("empty manifest has no dependencies", "[manifest]") {
    auto r = Manifest::parse("name = \"x\"\n");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().dependencies.empty());
}

TEST_CASE("invalid TOML is a parse error", "[manifest]") {
    auto r = Manifest::parse("[[dependencies]\nname = ", "bad.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == DepmanError::Parse);
    REQUIRE(r.error().file == "bad.toml");
}

// ===== Validation =====

static Result<Manifest> parse_one(const std::string& body) {
    return Manifest::parse("[[dependencies]]\n" + body, "depman.toml");
}

TEST_CASE("missing required version", "[manifest]") {
    auto r = parse_one(R"(
name = "git"
[dependencies.platforms.linux.commands]
install = ["true"]
verify = ["git", "--version"]
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == DepmanError::Manifest);
    REQUIRE(r.error().message.find("version.required") != std::string::npos);
    REQUIRE(r.error().file == "depman.toml");
}

TEST_CASE("missing name", "[manifest]") {
    auto r = parse_one(R"(
version = "1.0.0"
[dependencies.platforms.linux.commands]
install = ["true"]
verify = ["true"]
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == DepmanError::Manifest);
}

TEST_CASE("no platforms", "[manifest]") {
    auto r = parse_one("name = \"git\"\nversion = \"2.0.0\"\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("no platforms") != std::string::npos);
}

TEST_CASE("unknown platform key", "[manifest]") {
    auto r = parse_one(R"(
name = "git"
version = "2.0.0"
[dependencies.platforms.beos.commands]
install = ["true"]
verify = ["true"]
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == DepmanError::Manifest);
    REQUIRE(r.error().message.find("beos") != std::string::npos);
}

TEST_CASE("unknown installer type", "[manifest]") {
    auto r = parse_one(R"(
name = "git"
version = "2.0.0"
[dependencies.platforms.linux.installer]
type = "snap"
[dependencies.platforms.linux.commands]
install = ["true"]
verify = ["true"]
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("snap") != std::string::npos);
}

TEST_CASE("msi installer only on windows", "[manifest]") {
    auto r = parse_one(R"(
name = "git"
version = "2.0.0"
[dependencies.platforms.linux.installer]
type = "msi"
url = "https://example.com/git.msi"
[dependencies.platforms.linux.commands]
install = ["true"]
verify = ["true"]
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("cannot run on linux") != std::string::npos);
}

TEST_CASE("binary installer needs a url", "[manifest]") {
    auto r = parse_one(R"(
name = "jq"
version = "1.7.1"
[dependencies.platforms.linux.installer]
type = "binary"
[dependencies.platforms.linux.commands]
install = ["true"]
verify = ["jq", "--version"]
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("url is required") != std::string::npos);
}

TEST_CASE("empty verify command", "[manifest]") {
    auto r = parse_one(R"(
name = "jq"
version = "1.7.1"
[dependencies.platforms.linux.commands]
install = ["true"]
verify = []
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("verify is empty") != std::string::npos);
}

TEST_CASE("command must be an array of strings", "[manifest]") {
    auto r = parse_one(R"(
name = "jq"
version = "1.7.1"
[dependencies.platforms.linux.commands]
install = "apt-get install jq"
verify = ["jq"]
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == DepmanError::Manifest);
    REQUIRE(r.error().line > 0);
}

TEST_CASE("malformed checksum", "[manifest]") {
    auto r = parse_one(R"(
name = "jq"
version = "1.7.1"
[dependencies.platforms.linux.installer]
type = "binary"
url = "https://example.com/jq"
checksum = "sha256:1234"
[dependencies.platforms.linux.commands]
install = ["true"]
verify = ["jq"]
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("malformed sha256") != std::string::npos);
}

TEST_CASE("duplicate dependency names", "[manifest]") {
    std::string one = R"(
[[dependencies]]
name = "jq"
version = "1.7.1"
[dependencies.platforms.linux.commands]
install = ["true"]
verify = ["jq"]
)";
    auto r = Manifest::parse(one + one, "depman.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == DepmanError::Duplicate);
}

TEST_CASE("unknown prerequisite is left to the resolver", "[manifest]") {
    auto r = parse_one(R"(
name = "jq"
version = "1.7.1"
dependencies = ["ghost"]
[dependencies.platforms.linux.commands]
install = ["true"]
verify = ["jq"]
)");
    REQUIRE(r.is_ok());
}

// ===== Checksums =====

TEST_CASE("parse checksum forms", "[manifest]") {
    std::string hex(64, 'a');
    REQUIRE(parse_checksum("sha256:" + hex).value() == hex);
    REQUIRE(parse_checksum(std::string(64, 'A')).value() == hex);
    REQUIRE(parse_checksum("SHA256:" + hex).value() == hex);
    REQUIRE(parse_checksum("md5:" + hex).is_err());
    REQUIRE(parse_checksum(std::string(63, 'a')).is_err());
    REQUIRE(parse_checksum(std::string(64, 'g')).is_err());
}

// ===== Installer types =====

TEST_CASE("installer type names round trip", "[manifest]") {
    for (const char* name : {"package", "binary", "archive", "msi", "pkg", "exe"}) {
        auto t = parse_installer_type(name);
        REQUIRE(t.is_ok());
        REQUIRE(std::string(installer_type_name(t.value())) == name);
    }
    REQUIRE(installer_supported_on(InstallerType::Pkg, Platform::Darwin));
    REQUIRE_FALSE(installer_supported_on(InstallerType::Pkg, Platform::Linux));
    REQUIRE(installer_supported_on(InstallerType::Exe, Platform::Windows));
    REQUIRE(installer_supported_on(InstallerType::Archive, Platform::Darwin));
}

// ===== Loading =====

TEST_CASE("load manifest from file", "[manifest]") {
    TempDir td;
    auto path = td.write_file("depman.toml", kFullManifest);
    auto r = Manifest::load(path.string());
    REQUIRE(r.is_ok());
    REQUIRE(r.value().source == path.string());
    REQUIRE(r.value().dependencies.size() == 2);
}

TEST_CASE("load missing manifest", "[manifest]") {
    auto r = Manifest::load("/nonexistent/depman.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == DepmanError::IO);
}
