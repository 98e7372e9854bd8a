#include <depman/manifest.hpp>
#include <toml++/toml.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace depman {

// ---------------------------------------------------------------------------
// InstallerType
// ---------------------------------------------------------------------------

const char* installer_type_name(InstallerType t) {
    switch (t) {
        case InstallerType::Package: return "package";
        case InstallerType::Binary:  return "binary";
        case InstallerType::Archive: return "archive";
        case InstallerType::Msi:     return "msi";
        case InstallerType::Pkg:     return "pkg";
        case InstallerType::Exe:     return "exe";
    }
    return "unknown";
}

Result<InstallerType> parse_installer_type(const std::string& name) {
    for (InstallerType t : {InstallerType::Package, InstallerType::Binary,
                            InstallerType::Archive, InstallerType::Msi,
                            InstallerType::Pkg, InstallerType::Exe}) {
        if (name == installer_type_name(t)) return Result<InstallerType>::ok(t);
    }
    return DepmanError{DepmanError::Manifest,
        "unknown installer type '" + name + "'",
        "expected one of: package, binary, archive, msi, pkg, exe"};
}

bool installer_supported_on(InstallerType t, Platform p) {
    switch (t) {
        case InstallerType::Package:
        case InstallerType::Binary:
        case InstallerType::Archive:
            return true;
        case InstallerType::Msi:
        case InstallerType::Exe:
            return p == Platform::Windows;
        case InstallerType::Pkg:
            return p == Platform::Darwin;
    }
    return false;
}

Result<std::string> parse_checksum(const std::string& checksum) {
    std::string hex = checksum;
    size_t colon = checksum.find(':');
    if (colon != std::string::npos) {
        std::string algo = checksum.substr(0, colon);
        std::transform(algo.begin(), algo.end(), algo.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (algo != "sha256") {
            return DepmanError{DepmanError::Manifest,
                "unsupported checksum algorithm '" + algo + "'",
                "only sha256 checksums are supported"};
        }
        hex = checksum.substr(colon + 1);
    }

    std::transform(hex.begin(), hex.end(), hex.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    bool is_hex = std::all_of(hex.begin(), hex.end(),
                              [](unsigned char c) { return std::isxdigit(c) != 0; });
    if (hex.size() != 64 || !is_hex) {
        return DepmanError{DepmanError::Manifest,
            "malformed sha256 checksum '" + checksum + "'",
            "expected 64 hex digits, optionally prefixed with 'sha256:'"};
    }
    return Result<std::string>::ok(std::move(hex));
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

Status Dependency::validate() const {
    auto fail = [&](const std::string& msg, const std::string& hint = "") {
        return Status::err(DepmanError{DepmanError::Manifest,
            "dependency '" + name + "': " + msg, hint});
    };

    if (name.empty()) {
        return DepmanError{DepmanError::Manifest, "dependency without a name"};
    }
    if (version.required.empty()) {
        return fail("missing version.required");
    }
    if (platforms.empty()) {
        return fail("no platforms defined",
                    "add a [dependencies.platforms.<os>] table");
    }

    for (const auto& [platform, cfg] : platforms) {
        std::string where = std::string("platforms.") + platform_name(platform);
        if (!installer_supported_on(cfg.installer.type, platform)) {
            return fail(std::string("installer type '") +
                        installer_type_name(cfg.installer.type) +
                        "' cannot run on " + platform_name(platform));
        }
        if (cfg.installer.type != InstallerType::Package && cfg.installer.url.empty()) {
            return fail(where + ".installer.url is required for '" +
                        installer_type_name(cfg.installer.type) + "' installers");
        }
        if (!cfg.installer.checksum.empty()) {
            if (cfg.installer.url.empty()) {
                return fail(where + ".installer.checksum given without a url");
            }
            auto sum = parse_checksum(cfg.installer.checksum);
            if (sum.is_err()) return fail(sum.error().message, sum.error().hint);
        }
        if (cfg.commands.install.empty()) {
            return fail(where + ".commands.install is empty");
        }
        if (cfg.commands.verify.empty()) {
            return fail(where + ".commands.verify is empty");
        }
    }
    return ok_status();
}

Status Manifest::validate() const {
    std::unordered_set<std::string> seen;
    for (const auto& dep : dependencies) {
        auto st = dep.validate();
        if (st.is_err()) {
            auto err = std::move(st).error();
            if (err.file.empty()) {
                err.file = source;
                err.line = dep.line;
            }
            return err;
        }
        if (!seen.insert(dep.name).second) {
            return DepmanError{DepmanError::Duplicate,
                "dependency '" + dep.name + "' is defined more than once",
                "dependency names must be unique", source, dep.line};
        }
    }
    return ok_status();
}

const Dependency* Manifest::find(const std::string& name) const {
    auto it = std::find_if(dependencies.begin(), dependencies.end(),
                           [&](const Dependency& d) { return d.name == name; });
    return it == dependencies.end() ? nullptr : &*it;
}

// ---------------------------------------------------------------------------
// TOML helpers
// ---------------------------------------------------------------------------

namespace {

struct Ctx {
    const std::string& source;

    DepmanError error(const std::string& msg, const toml::node* at = nullptr) const {
        int line = at ? static_cast<int>(at->source().begin.line) : 0;
        return DepmanError{DepmanError::Manifest, msg, "", source, line};
    }
};

std::string string_or(const toml::table& tbl, const char* key,
                      const std::string& fallback = "") {
    if (auto v = tbl[key].value<std::string>()) return *v;
    return fallback;
}

Result<std::vector<std::string>> string_array(const Ctx& ctx,
                                              const toml::table& tbl,
                                              const char* key,
                                              const std::string& where) {
    std::vector<std::string> out;
    const toml::node* node = tbl.get(key);
    if (!node) return Result<std::vector<std::string>>::ok(std::move(out));

    const toml::array* arr = node->as_array();
    if (!arr) {
        return ctx.error(where + "." + key + " must be an array of strings", node);
    }
    for (const auto& elem : *arr) {
        auto s = elem.value<std::string>();
        if (!s) {
            return ctx.error(where + "." + key + " must contain only strings", &elem);
        }
        out.push_back(*s);
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

Result<PlatformConfig> parse_platform_config(const Ctx& ctx,
                                             const toml::table& tbl,
                                             const std::string& where) {
    PlatformConfig cfg;

    if (const toml::node* node = tbl.get("installer")) {
        const toml::table* inst = node->as_table();
        if (!inst) return ctx.error(where + ".installer must be a table", node);

        auto type = parse_installer_type(string_or(*inst, "type", "package"));
        if (type.is_err()) {
            return ctx.error(where + ".installer: " + type.error().message, node);
        }
        cfg.installer.type = type.value();
        cfg.installer.url = string_or(*inst, "url");
        cfg.installer.checksum = string_or(*inst, "checksum");
        cfg.installer.product_id = string_or(*inst, "product_id");
        cfg.installer.install_dir = string_or(*inst, "install_dir");
    }

    if (const toml::node* node = tbl.get("commands")) {
        const toml::table* cmds = node->as_table();
        if (!cmds) return ctx.error(where + ".commands must be a table", node);

        std::string cw = where + ".commands";
        auto install = string_array(ctx, *cmds, "install", cw);
        if (install.is_err()) return std::move(install).error();
        auto verify = string_array(ctx, *cmds, "verify", cw);
        if (verify.is_err()) return std::move(verify).error();
        auto uninstall = string_array(ctx, *cmds, "uninstall", cw);
        if (uninstall.is_err()) return std::move(uninstall).error();

        cfg.commands.install = std::move(install).value();
        cfg.commands.verify = std::move(verify).value();
        cfg.commands.uninstall = std::move(uninstall).value();
    }

    return Result<PlatformConfig>::ok(std::move(cfg));
}

Result<Dependency> parse_dependency(const Ctx& ctx, const toml::table& tbl, size_t index) {
    Dependency dep;
    dep.line = static_cast<int>(tbl.source().begin.line);
    dep.name = string_or(tbl, "name");
    dep.description = string_or(tbl, "description");

    std::string where = dep.name.empty()
        ? "dependencies[" + std::to_string(index) + "]"
        : "dependency '" + dep.name + "'";

    if (const toml::node* node = tbl.get("version")) {
        if (auto s = node->value<std::string>()) {
            // Shorthand: version = "1.2.3"
            dep.version.required = *s;
        } else if (const toml::table* vt = node->as_table()) {
            dep.version.required = string_or(*vt, "required");
            dep.version.constraint = string_or(*vt, "constraint");
        } else {
            return ctx.error(where + ": version must be a string or table", node);
        }
    }

    auto prereqs = string_array(ctx, tbl, "dependencies", where);
    if (prereqs.is_err()) return std::move(prereqs).error();
    dep.dependencies = std::move(prereqs).value();

    if (const toml::node* node = tbl.get("platforms")) {
        const toml::table* plats = node->as_table();
        if (!plats) return ctx.error(where + ": platforms must be a table", node);

        for (const auto& [key, val] : *plats) {
            std::string os(key.str());
            auto platform = parse_platform(os);
            if (platform.is_err()) {
                return ctx.error(where + ": unknown platform '" + os +
                                 "' (expected windows, linux or darwin)", &val);
            }
            const toml::table* pt = val.as_table();
            if (!pt) return ctx.error(where + ": platforms." + os + " must be a table", &val);

            auto cfg = parse_platform_config(ctx, *pt, where + ": platforms." + os);
            if (cfg.is_err()) return std::move(cfg).error();
            dep.platforms[platform.value()] = std::move(cfg).value();
        }
    }

    if (const toml::node* node = tbl.get("environment")) {
        const toml::table* env = node->as_table();
        if (!env) return ctx.error(where + ": environment must be a table", node);

        auto path = string_array(ctx, *env, "path", where + ": environment");
        if (path.is_err()) return std::move(path).error();
        dep.environment.path = std::move(path).value();

        if (const toml::node* vars_node = env->get("variables")) {
            const toml::table* vars = vars_node->as_table();
            if (!vars) {
                return ctx.error(where + ": environment.variables must be a table", vars_node);
            }
            for (const auto& [k, v] : *vars) {
                auto s = v.value<std::string>();
                if (!s) {
                    return ctx.error(where + ": environment.variables." +
                                     std::string(k.str()) + " must be a string", &v);
                }
                dep.environment.variables[std::string(k.str())] = *s;
            }
        }
    }

    return Result<Dependency>::ok(std::move(dep));
}

} // namespace

// ---------------------------------------------------------------------------
// Manifest::parse / load
// ---------------------------------------------------------------------------

Result<Manifest> Manifest::parse(const std::string& toml_str,
                                 const std::string& source_name) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, source_name);
    } catch (const toml::parse_error& e) {
        return DepmanError{DepmanError::Parse,
            std::string("TOML parse error: ") + std::string(e.description()),
            "", source_name, static_cast<int>(e.source().begin.line)};
    }

    Manifest m;
    m.source = source_name;
    m.version = string_or(doc, "version");
    m.name = string_or(doc, "name");
    m.description = string_or(doc, "description");

    Ctx ctx{m.source};

    if (const toml::node* node = doc.get("dependencies")) {
        const toml::array* arr = node->as_array();
        if (!arr) {
            return ctx.error("dependencies must be an array of tables ([[dependencies]])", node);
        }
        for (size_t i = 0; i < arr->size(); ++i) {
            const toml::table* tbl = (*arr)[i].as_table();
            if (!tbl) return ctx.error("dependencies entries must be tables", &(*arr)[i]);

            auto dep = parse_dependency(ctx, *tbl, i);
            if (dep.is_err()) return std::move(dep).error();
            m.dependencies.push_back(std::move(dep).value());
        }
    }

    DEPMAN_TRY(m.validate());
    return Result<Manifest>::ok(std::move(m));
}

Result<Manifest> Manifest::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return DepmanError{DepmanError::IO,
            "cannot open manifest: " + path,
            "pass the manifest location with --config"};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Manifest::parse(ss.str(), path);
}

} // namespace depman
