#pragma once

#include <string>

namespace depman {

struct DepmanError {
    enum Code {
        IO,
        Parse,
        Manifest,
        Config,
        Network,
        NotFound,
        Duplicate,
        InvalidArg,
        InvalidVersionFormat,
        IncompatibleVersion,
        UnsupportedPlatform,
        TemplateError,
        CommandFailed,
        ChecksumMismatch,
        VerificationFailed,
        CyclicDependency,
        UnknownDependency,
        PrerequisiteFailed,
        Timeout,
        Cancelled
    };

    Code code = IO;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    // CommandFailed / VerificationFailed only
    int exit_code = 0;
    std::string output;

    DepmanError() = default;
    DepmanError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    DepmanError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    DepmanError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    static DepmanError command_failed(std::string msg, int exit_code,
                                      std::string output);

    std::string format() const;
    static const char* code_name(Code c);

    bool operator==(const DepmanError& o) const;
    bool operator!=(const DepmanError& o) const { return !(*this == o); }
};

} // namespace depman
