#include <depman/command.hpp>
#include <depman/log.hpp>
#include <cctype>

namespace depman {

static bool is_placeholder_name(const std::string& s) {
    if (s.empty()) return false;
    if (!std::isalpha(static_cast<unsigned char>(s[0])) && s[0] != '_') return false;
    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
    }
    return true;
}

Result<std::string> expand_template(const std::string& tmpl,
                                    const Substitutions& subs) {
    std::string out;
    out.reserve(tmpl.size());

    size_t pos = 0;
    while (pos < tmpl.size()) {
        size_t open = tmpl.find('{', pos);
        if (open == std::string::npos) {
            out.append(tmpl, pos, std::string::npos);
            break;
        }
        out.append(tmpl, pos, open - pos);

        size_t close = tmpl.find('}', open + 1);
        bool shell_syntax = open > 0 && tmpl[open - 1] == '$';
        if (close == std::string::npos || shell_syntax) {
            out += '{';
            pos = open + 1;
            continue;
        }

        std::string name = tmpl.substr(open + 1, close - open - 1);
        if (!is_placeholder_name(name)) {
            out += '{';
            pos = open + 1;
            continue;
        }

        auto it = subs.find(name);
        if (it == subs.end()) {
            return DepmanError{DepmanError::TemplateError,
                "unresolved placeholder {" + name + "} in '" + tmpl + "'",
                "known placeholders: {download_path}, {install_dir}, {product_id}"};
        }
        out += it->second;
        pos = close + 1;
    }
    return Result<std::string>::ok(std::move(out));
}

Result<std::vector<std::string>> expand_command(const std::vector<std::string>& tmpl,
                                                const Substitutions& subs) {
    if (tmpl.empty()) {
        return DepmanError{DepmanError::TemplateError, "empty command"};
    }
    std::vector<std::string> argv;
    argv.reserve(tmpl.size());
    for (const auto& arg : tmpl) {
        auto expanded = expand_template(arg, subs);
        if (expanded.is_err()) return std::move(expanded).error();
        argv.push_back(std::move(expanded).value());
    }
    return Result<std::vector<std::string>>::ok(std::move(argv));
}

CommandExecutor::CommandExecutor(CommandRunner& runner, int timeout_seconds)
    : runner_(runner), timeout_seconds_(timeout_seconds) {}

Result<CommandOutput> CommandExecutor::probe(const std::vector<std::string>& tmpl,
                                             const Substitutions& subs) const {
    auto argv = expand_command(tmpl, subs);
    if (argv.is_err()) return std::move(argv).error();

    RunOptions opts;
    opts.timeout_seconds = timeout_seconds_;
    return runner_.run(argv.value(), opts);
}

Result<CommandOutput> CommandExecutor::run(const std::vector<std::string>& tmpl,
                                           const Substitutions& subs) const {
    auto result = probe(tmpl, subs);
    if (result.is_err()) return result;

    const CommandOutput& out = result.value();
    if (out.exit_code != 0) {
        std::string cmd = tmpl.front();
        log::debug("'%s' exited with %d", cmd.c_str(), out.exit_code);
        std::string msg = "'" + cmd + "' exited with code " + std::to_string(out.exit_code);
        if (out.exit_code == 127) {
            msg += " (command not found?)";
        }
        return DepmanError::command_failed(std::move(msg), out.exit_code, out.output);
    }
    return result;
}

} // namespace depman
