#pragma once

#include <depman/config.hpp>
#include <optional>
#include <string>

namespace depman::cli {

enum class Command { Check, Ensure, Install, Uninstall, List, Version };

struct Args {
    Command command = Command::Version;
    std::string manifest_path = "depman.toml";
    std::string name;        // check / install / uninstall target
    bool tree = false;       // list --tree
    Config overrides;        // command-line config layer
};

// Parses argv. Returns the process exit code when the program should stop
// right away (help, usage error).
std::optional<int> parse_args(int argc, char** argv, Args& args);

int run(const Args& args);

} // namespace depman::cli
