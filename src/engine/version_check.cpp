#include <depman/version_check.hpp>
#include <regex>

namespace depman {

const char* update_kind_name(UpdateKind kind) {
    switch (kind) {
        case UpdateKind::NoUpdate:     return "none";
        case UpdateKind::PatchUpdate:  return "patch update";
        case UpdateKind::MinorUpdate:  return "minor update";
        case UpdateKind::MajorUpdate:  return "major update";
        case UpdateKind::NotInstalled: return "not installed";
    }
    return "unknown";
}

UpdateKind update_kind(const Version& current, const Version& target) {
    if (current.major != target.major) return UpdateKind::MajorUpdate;
    if (current.minor != target.minor) return UpdateKind::MinorUpdate;
    if (current.patch != target.patch) return UpdateKind::PatchUpdate;
    if (current.prerelease != target.prerelease) return UpdateKind::PatchUpdate;
    return UpdateKind::NoUpdate;
}

VersionCheck classify_version(const std::optional<std::string>& current,
                              const std::string& required,
                              const std::string& constraint) {
    VersionCheck check;

    auto req = Version::parse(required);
    if (!current.has_value()) {
        check.update = UpdateKind::NotInstalled;
        if (req.is_err()) {
            check.error = DepmanError{DepmanError::InvalidVersionFormat,
                "invalid required version '" + required + "'"};
        }
        return check;
    }

    auto cur = Version::parse(*current);
    if (cur.is_err()) {
        // Installed, but nothing can be compared against it
        check.update = UpdateKind::MajorUpdate;
        check.error = DepmanError{DepmanError::InvalidVersionFormat,
            "cannot parse installed version '" + *current + "'"};
        return check;
    }
    if (req.is_err()) {
        check.update = UpdateKind::MajorUpdate;
        check.error = DepmanError{DepmanError::InvalidVersionFormat,
            "invalid required version '" + required + "'"};
        return check;
    }

    Version installed = cur.value();
    const Version& target = req.value();
    if (target.prerelease.empty()) {
        installed = installed.core();
    }

    check.update = update_kind(installed, target);

    if (constraint.empty()) {
        check.compatible = installed == target;
        return check;
    }

    auto range = VersionReq::parse(constraint);
    if (range.is_err()) {
        check.error = std::move(range).error();
        return check;
    }
    check.compatible = range.value().matches(installed);
    return check;
}

std::optional<std::string> extract_version(const std::string& output) {
    static const std::regex pattern(
        R"((\d+)\.(\d+)(?:\.(\d+))?(-[0-9A-Za-z][0-9A-Za-z.\-]*)?(\+[0-9A-Za-z.\-]+)?)");

    std::smatch m;
    if (!std::regex_search(output, m, pattern)) return std::nullopt;

    std::string v = m[1].str() + "." + m[2].str() + "." +
                    (m[3].matched ? m[3].str() : std::string("0"));
    if (m[4].matched) v += m[4].str();
    if (m[5].matched) v += m[5].str();
    return v;
}

} // namespace depman
