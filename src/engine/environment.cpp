#include <depman/environment.hpp>
#include <depman/log.hpp>
#include <depman/platform.hpp>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace depman {

// ---------------------------------------------------------------------------
// ProcessEnvironment
// ---------------------------------------------------------------------------

ProcessEnvironment::ProcessEnvironment()
    : separator_(path_list_separator(host_platform())) {}

std::optional<std::string> ProcessEnvironment::get(const std::string& name) const {
    const char* v = std::getenv(name.c_str());
    if (!v) return std::nullopt;
    return std::string(v);
}

Status ProcessEnvironment::set_variable(const std::string& name, const std::string& value) {
    if (name.empty() || name.find('=') != std::string::npos) {
        return DepmanError{DepmanError::InvalidArg,
            "invalid environment variable name '" + name + "'"};
    }
#ifdef _WIN32
    int rc = _putenv_s(name.c_str(), value.c_str());
#else
    int rc = setenv(name.c_str(), value.c_str(), 1);
#endif
    if (rc != 0) {
        return DepmanError{DepmanError::IO,
            "cannot set " + name + ": " + std::strerror(errno)};
    }
    return ok_status();
}

Status ProcessEnvironment::prepend_path(const std::string& dir) {
    std::string current = get("PATH").value_or("");
    if (current == dir || current.rfind(dir + separator_, 0) == 0) {
        return ok_status();
    }
    std::string updated = current.empty() ? dir : dir + separator_ + current;
    return set_variable("PATH", updated);
}

// ---------------------------------------------------------------------------
// RecordingEnvironment
// ---------------------------------------------------------------------------

Status RecordingEnvironment::prepend_path(const std::string& dir) {
    if (!path_.empty() && path_.front() == dir) return ok_status();
    path_.insert(path_.begin(), dir);
    changes_.push_back({Change::PrependPath, "", dir});
    return ok_status();
}

Status RecordingEnvironment::set_variable(const std::string& name, const std::string& value) {
    vars_[name] = value;
    changes_.push_back({Change::SetVariable, name, value});
    return ok_status();
}

std::optional<std::string> RecordingEnvironment::get(const std::string& name) const {
    auto it = vars_.find(name);
    if (it == vars_.end()) return std::nullopt;
    return it->second;
}

// ---------------------------------------------------------------------------
// apply_environment
// ---------------------------------------------------------------------------

Status apply_environment(const EnvironmentSpec& spec,
                         const Substitutions& subs,
                         EnvironmentApplier& env) {
    std::vector<std::string> dirs;
    for (const auto& entry : spec.path) {
        auto dir = expand_template(entry, subs);
        if (dir.is_err()) return std::move(dir).error();
        dirs.push_back(std::move(dir).value());
    }

    std::map<std::string, std::string> vars;
    for (const auto& [name, tmpl] : spec.variables) {
        auto value = expand_template(tmpl, subs);
        if (value.is_err()) return std::move(value).error();
        vars[name] = std::move(value).value();
    }

    // Prepend in reverse so the first listed entry ends up first on PATH
    for (auto it = dirs.rbegin(); it != dirs.rend(); ++it) {
        DEPMAN_TRY(env.prepend_path(*it));
        log::debug("PATH += %s", it->c_str());
    }
    for (const auto& [name, value] : vars) {
        DEPMAN_TRY(env.set_variable(name, value));
        log::debug("set %s=%s", name.c_str(), value.c_str());
    }
    return ok_status();
}

} // namespace depman
