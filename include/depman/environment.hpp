#pragma once

#include <depman/command.hpp>
#include <depman/manifest.hpp>
#include <depman/result.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace depman {

// Process-wide environment mutation behind an interface, so that engine
// tests can record changes instead of touching the real environment.
class EnvironmentApplier {
public:
    virtual ~EnvironmentApplier() = default;

    // Puts `dir` in front of PATH (no-op when it is already first).
    virtual Status prepend_path(const std::string& dir) = 0;
    virtual Status set_variable(const std::string& name, const std::string& value) = 0;
    virtual std::optional<std::string> get(const std::string& name) const = 0;
};

// Mutates the environment of the current process; children spawned later
// inherit it. Nothing is persisted beyond the process lifetime. PATH is
// joined with the host's separator whatever platform is being targeted.
class ProcessEnvironment : public EnvironmentApplier {
public:
    ProcessEnvironment();

    Status prepend_path(const std::string& dir) override;
    Status set_variable(const std::string& name, const std::string& value) override;
    std::optional<std::string> get(const std::string& name) const override;

private:
    char separator_;
};

// In-memory environment. Records every mutation in order.
class RecordingEnvironment : public EnvironmentApplier {
public:
    struct Change {
        enum Kind { PrependPath, SetVariable } kind;
        std::string name;   // empty for PrependPath
        std::string value;
    };

    Status prepend_path(const std::string& dir) override;
    Status set_variable(const std::string& name, const std::string& value) override;
    std::optional<std::string> get(const std::string& name) const override;

    const std::vector<Change>& changes() const { return changes_; }
    const std::vector<std::string>& path() const { return path_; }

private:
    std::vector<Change> changes_;
    std::vector<std::string> path_;
    std::map<std::string, std::string> vars_;
};

// Expands the environment templates with `subs` and applies them. Everything
// is expanded before the first mutation, so a TemplateError leaves the
// environment untouched.
Status apply_environment(const EnvironmentSpec& spec,
                         const Substitutions& subs,
                         EnvironmentApplier& env);

} // namespace depman
