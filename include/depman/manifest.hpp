#pragma once

#include <depman/result.hpp>
#include <depman/platform.hpp>
#include <map>
#include <string>
#include <vector>

namespace depman {

// How an installer artifact is consumed. Closed set; every switch over it
// is exhaustive.
enum class InstallerType {
    Package,   // package manager invocation, URL optional
    Binary,    // downloaded file is the tool itself
    Archive,   // tarball / zip unpacked by the install command
    Msi,       // Windows installer database
    Pkg,       // macOS installer package
    Exe,       // Windows setup executable
};

const char* installer_type_name(InstallerType t);
Result<InstallerType> parse_installer_type(const std::string& name);

// Whether an installer of type `t` can run on `p` at all.
bool installer_supported_on(InstallerType t, Platform p);

// [dependencies.platforms.<os>.installer]
struct InstallerSpec {
    InstallerType type = InstallerType::Package;
    std::string url;
    std::string checksum;     // "sha256:<hex>" or bare hex, optional
    std::string product_id;   // fills {product_id}
    std::string install_dir;  // overrides <install-root>/<name>
};

// [dependencies.platforms.<os>.commands]
struct CommandSet {
    std::vector<std::string> install;
    std::vector<std::string> verify;
    std::vector<std::string> uninstall;  // optional
};

struct PlatformConfig {
    InstallerSpec installer;
    CommandSet commands;
};

// [dependencies.environment]
struct EnvironmentSpec {
    std::vector<std::string> path;                  // prepended in order
    std::map<std::string, std::string> variables;   // name -> value template

    bool empty() const { return path.empty() && variables.empty(); }
};

// [dependencies.version]
struct VersionSpec {
    std::string required;
    std::string constraint;  // empty = exact match only
};

// One [[dependencies]] entry
struct Dependency {
    std::string name;
    std::string description;
    VersionSpec version;
    std::map<Platform, PlatformConfig> platforms;
    EnvironmentSpec environment;
    std::vector<std::string> dependencies;  // prerequisite names

    int line = 0;  // line of the [[dependencies]] header, 0 if unknown

    // Shape checks that need nothing but this entry
    Status validate() const;
};

struct Manifest {
    std::string version;
    std::string name;
    std::string description;
    std::vector<Dependency> dependencies;  // declaration order

    std::string source;  // file the manifest came from, for diagnostics

    // Parse from TOML text. `source_name` is used in error locations.
    static Result<Manifest> parse(const std::string& toml_str,
                                  const std::string& source_name = "");

    // Parse from file path
    static Result<Manifest> load(const std::string& path);

    // Per-entry validation plus name uniqueness
    Status validate() const;

    const Dependency* find(const std::string& name) const;
};

// Splits "sha256:<hex>" / "<hex>" into a lowercase hex digest.
Result<std::string> parse_checksum(const std::string& checksum);

} // namespace depman
