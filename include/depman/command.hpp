#pragma once

#include <depman/process.hpp>
#include <depman/result.hpp>
#include <map>
#include <string>
#include <vector>

namespace depman {

// Placeholder names understood inside command and environment templates
inline constexpr const char* kDownloadPath = "download_path";
inline constexpr const char* kInstallDir = "install_dir";
inline constexpr const char* kProductId = "product_id";

// placeholder name (without braces) -> replacement
using Substitutions = std::map<std::string, std::string>;

// Replaces every {name} in `tmpl`. A name missing from `subs` is a
// TemplateError. "${...}" (shell syntax) and "{}" are left untouched.
Result<std::string> expand_template(const std::string& tmpl,
                                    const Substitutions& subs);

// Expands each argument independently.
Result<std::vector<std::string>> expand_command(const std::vector<std::string>& tmpl,
                                                const Substitutions& subs);

// Runs templated commands through a CommandRunner. Every placeholder is
// resolved before anything is spawned. No retries.
class CommandExecutor {
public:
    CommandExecutor(CommandRunner& runner, int timeout_seconds);

    // Non-zero exit -> CommandFailed carrying exit code and output.
    Result<CommandOutput> run(const std::vector<std::string>& tmpl,
                              const Substitutions& subs) const;

    // Like run(), but a non-zero exit is returned as a normal result.
    Result<CommandOutput> probe(const std::vector<std::string>& tmpl,
                                const Substitutions& subs) const;

private:
    CommandRunner& runner_;
    int timeout_seconds_;
};

} // namespace depman
