#include <depman/process.hpp>
#include <depman/log.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace depman {

namespace {

std::string describe(const std::vector<std::string>& argv) {
    std::string s;
    for (const auto& a : argv) {
        if (!s.empty()) s += ' ';
        s += a;
    }
    return s;
}

void drain(int fd, std::string& out) {
    char buf[4096];
    ssize_t n;
    while ((n = read(fd, buf, sizeof(buf))) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
}

} // namespace

Result<CommandOutput> ProcessRunner::run(const std::vector<std::string>& args,
                                         const RunOptions& options) {
    if (args.empty()) {
        return DepmanError{DepmanError::InvalidArg, "run: empty command"};
    }
    if (options.timeout_seconds <= 0) {
        return DepmanError{DepmanError::InvalidArg,
            "run: a positive timeout is required for '" + args[0] + "'"};
    }

    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    int pipefd[2];
    if (pipe(pipefd) != 0) {
        return DepmanError{DepmanError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }

    log::trace("spawn: %s", describe(args).c_str());

    pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]);
        close(pipefd[1]);
        return DepmanError{DepmanError::IO,
            std::string("fork() failed: ") + strerror(errno)};
    }

    if (pid == 0) {
        setpgid(0, 0);
        close(pipefd[0]);
        dup2(pipefd[1], STDOUT_FILENO);
        dup2(pipefd[1], STDERR_FILENO);
        close(pipefd[1]);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        if (!options.working_dir.empty() && chdir(options.working_dir.c_str()) != 0) {
            _exit(127);
        }

        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);
    }

    close(pipefd[1]);
    fcntl(pipefd[0], F_SETFL, O_NONBLOCK);

    std::string output;
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::seconds(options.timeout_seconds);

    for (;;) {
        if (std::chrono::steady_clock::now() >= deadline) {
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            close(pipefd[0]);
            DepmanError err{DepmanError::Timeout,
                "'" + describe(args) + "' timed out after " +
                std::to_string(options.timeout_seconds) + "s"};
            err.output = std::move(output);
            return err;
        }

        struct pollfd pfd{pipefd[0], POLLIN, 0};
        poll(&pfd, 1, 50);
        drain(pipefd[0], output);

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            drain(pipefd[0], output);
            close(pipefd[0]);

            int exit_code = -1;
            if (WIFEXITED(status)) {
                exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                exit_code = 128 + WTERMSIG(status);
            }
            log::trace("exit %d: %s", exit_code, describe(args).c_str());
            return Result<CommandOutput>::ok(CommandOutput{exit_code, std::move(output)});
        }
        if (w < 0 && errno != EINTR) {
            close(pipefd[0]);
            return DepmanError{DepmanError::IO,
                std::string("waitpid failed: ") + strerror(errno)};
        }
    }
}

} // namespace depman
