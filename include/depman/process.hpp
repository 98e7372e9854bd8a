#pragma once

#include <depman/result.hpp>
#include <string>
#include <vector>

namespace depman {

// Exit status and interleaved stdout+stderr of a finished subprocess
struct CommandOutput {
    int exit_code = 0;
    std::string output;
};

struct RunOptions {
    std::string working_dir;
    int timeout_seconds = 600;
};

// Seam between the engine and the operating system. The engine only ever
// spawns processes through this interface so tests can count and script
// invocations.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Runs argv[0] (looked up on PATH) to completion. A non-zero exit is
    // not an error at this level; failure to spawn, I/O failure and
    // timeouts are.
    virtual Result<CommandOutput> run(const std::vector<std::string>& argv,
                                      const RunOptions& options) = 0;
};

// fork/exec implementation. The child gets its own process group, which
// is killed wholesale on timeout. An executable that cannot be found
// exits with 127.
class ProcessRunner : public CommandRunner {
public:
    Result<CommandOutput> run(const std::vector<std::string>& argv,
                              const RunOptions& options) override;
};

} // namespace depman
