#include <depman/error.hpp>

namespace depman {

const char* DepmanError::code_name(Code c) {
    switch (c) {
        case IO:                   return "IO";
        case Parse:                return "Parse";
        case Manifest:             return "Manifest";
        case Config:               return "Config";
        case Network:              return "Network";
        case NotFound:             return "NotFound";
        case Duplicate:            return "Duplicate";
        case InvalidArg:           return "InvalidArg";
        case InvalidVersionFormat: return "InvalidVersionFormat";
        case IncompatibleVersion:  return "IncompatibleVersion";
        case UnsupportedPlatform:  return "UnsupportedPlatform";
        case TemplateError:        return "TemplateError";
        case CommandFailed:        return "CommandFailed";
        case ChecksumMismatch:     return "ChecksumMismatch";
        case VerificationFailed:   return "VerificationFailed";
        case CyclicDependency:     return "CyclicDependency";
        case UnknownDependency:    return "UnknownDependency";
        case PrerequisiteFailed:   return "PrerequisiteFailed";
        case Timeout:              return "Timeout";
        case Cancelled:            return "Cancelled";
    }
    return "Unknown";
}

DepmanError DepmanError::command_failed(std::string msg, int exit_code,
                                        std::string output) {
    DepmanError e{CommandFailed, std::move(msg)};
    e.exit_code = exit_code;
    e.output = std::move(output);
    return e;
}

std::string DepmanError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (code == CommandFailed || code == VerificationFailed) {
        result += " (exit code " + std::to_string(exit_code) + ")";
    }

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

bool DepmanError::operator==(const DepmanError& o) const {
    return code == o.code && message == o.message && hint == o.hint &&
           file == o.file && line == o.line &&
           exit_code == o.exit_code && output == o.output;
}

} // namespace depman
