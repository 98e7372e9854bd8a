#include <depman/version.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace depman {

// Parses a run of decimal digits that must make up all of `s`.
static bool parse_component(const std::string& s, int& out) {
    if (s.empty() || s.size() > 9) return false;
    if (!std::all_of(s.begin(), s.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return false;
    }
    out = std::stoi(s);
    return true;
}

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

Result<Version> Version::parse(const std::string& input) {
    std::string s = trim(input);
    if (s.empty()) {
        return DepmanError{DepmanError::InvalidVersionFormat, "empty version string"};
    }

    Version v;

    size_t plus = s.find('+');
    if (plus != std::string::npos) {
        v.build = s.substr(plus + 1);
        if (v.build.empty()) {
            return DepmanError{DepmanError::InvalidVersionFormat,
                "empty build metadata after '+' in '" + input + "'"};
        }
        s = s.substr(0, plus);
    }

    size_t dash = s.find('-');
    if (dash != std::string::npos) {
        v.prerelease = s.substr(dash + 1);
        if (v.prerelease.empty()) {
            return DepmanError{DepmanError::InvalidVersionFormat,
                "empty prerelease after '-' in '" + input + "'"};
        }
        s = s.substr(0, dash);
    }

    std::vector<std::string> parts;
    std::istringstream stream(s);
    std::string part;
    while (std::getline(stream, part, '.')) {
        parts.push_back(part);
    }
    if (parts.size() != 3 || s.back() == '.') {
        return DepmanError{DepmanError::InvalidVersionFormat,
            "invalid version '" + input + "'",
            "expected format: major.minor.patch[-prerelease][+build]"};
    }

    if (!parse_component(parts[0], v.major) ||
        !parse_component(parts[1], v.minor) ||
        !parse_component(parts[2], v.patch)) {
        return DepmanError{DepmanError::InvalidVersionFormat,
            "non-numeric version component in '" + input + "'"};
    }

    return Result<Version>::ok(std::move(v));
}

std::string Version::to_string() const {
    std::string s = std::to_string(major) + "." +
                    std::to_string(minor) + "." +
                    std::to_string(patch);
    if (!prerelease.empty()) s += "-" + prerelease;
    if (!build.empty()) s += "+" + build;
    return s;
}

Version Version::core() const {
    Version v;
    v.major = major;
    v.minor = minor;
    v.patch = patch;
    return v;
}

// Build metadata does not take part in equality or ordering.
bool Version::operator==(const Version& o) const {
    return major == o.major && minor == o.minor &&
           patch == o.patch && prerelease == o.prerelease;
}

bool Version::operator!=(const Version& o) const { return !(*this == o); }

bool Version::operator<(const Version& o) const {
    if (major != o.major) return major < o.major;
    if (minor != o.minor) return minor < o.minor;
    if (patch != o.patch) return patch < o.patch;
    // A prerelease sorts before the release it precedes
    if (prerelease.empty() && !o.prerelease.empty()) return false;
    if (!prerelease.empty() && o.prerelease.empty()) return true;
    return prerelease < o.prerelease;
}

bool Version::operator<=(const Version& o) const { return !(o < *this); }
bool Version::operator>(const Version& o) const { return o < *this; }
bool Version::operator>=(const Version& o) const { return !(*this < o); }

// ---------------------------------------------------------------------------
// PartialVersion
// ---------------------------------------------------------------------------

Result<PartialVersion> PartialVersion::parse(const std::string& input) {
    std::string s = trim(input);
    if (s.empty()) {
        return DepmanError{DepmanError::InvalidVersionFormat,
            "empty partial version string"};
    }

    std::vector<std::string> parts;
    std::istringstream stream(s);
    std::string part;
    while (std::getline(stream, part, '.')) {
        parts.push_back(part);
    }
    if (parts.empty() || parts.size() > 3 || s.back() == '.') {
        return DepmanError{DepmanError::InvalidVersionFormat,
            "invalid partial version '" + input + "'"};
    }

    PartialVersion pv;
    bool ok = parse_component(parts[0], pv.major);
    if (ok && parts.size() > 1) ok = parse_component(parts[1], pv.minor);
    if (ok && parts.size() > 2) ok = parse_component(parts[2], pv.patch);
    if (!ok) {
        return DepmanError{DepmanError::InvalidVersionFormat,
            "invalid partial version '" + input + "'"};
    }
    return Result<PartialVersion>::ok(pv);
}

std::string PartialVersion::to_string() const {
    std::string s = std::to_string(major);
    if (minor >= 0) {
        s += "." + std::to_string(minor);
        if (patch >= 0) {
            s += "." + std::to_string(patch);
        }
    }
    return s;
}

// ---------------------------------------------------------------------------
// VersionConstraint
// ---------------------------------------------------------------------------

// First release past every version a partial version covers.
static Version partial_upper_bound(const PartialVersion& pv) {
    Version v;
    if (pv.minor < 0) {
        v.major = pv.major + 1;
    } else {
        v.major = pv.major;
        v.minor = pv.minor + 1;
    }
    return v;
}

bool VersionConstraint::matches(const Version& v) const {
    if (op == ConstraintOp::Any) return true;
    // Range operators never admit prereleases; callers strip them first
    // when the requirement itself is a release.
    if (!v.prerelease.empty()) return false;

    Version req;
    req.major = version.major;
    req.minor = version.minor >= 0 ? version.minor : 0;
    req.patch = version.patch >= 0 ? version.patch : 0;

    switch (op) {
    case ConstraintOp::Any:
        return true;

    case ConstraintOp::Exact:
        if (v.major != req.major) return false;
        if (version.minor >= 0 && v.minor != req.minor) return false;
        if (version.patch >= 0 && v.patch != req.patch) return false;
        return true;

    case ConstraintOp::Caret:
        // The leftmost non-zero component may not change:
        //   ^1.2.3 := >=1.2.3 <2.0.0
        //   ^0.2.3 := >=0.2.3 <0.3.0
        //   ^0.0.3 := =0.0.3
        //   ^0.0   := >=0.0.0 <0.1.0
        if (v < req) return false;
        if (req.major > 0 || version.minor < 0) {
            return v.major == req.major;
        }
        if (req.minor > 0 || version.patch < 0) {
            return v.major == 0 && v.minor == req.minor;
        }
        return v.major == 0 && v.minor == 0 && v.patch == req.patch;

    case ConstraintOp::Tilde:
        // ~1.2.3 := >=1.2.3 <1.3.0, ~1 := >=1.0.0 <2.0.0
        if (v < req) return false;
        if (version.minor < 0) return v.major == req.major;
        return v.major == req.major && v.minor == req.minor;

    case ConstraintOp::GreaterEq:
        return v >= req;

    case ConstraintOp::Greater:
        // >1.2 := >=1.3.0, >1 := >=2.0.0
        if (version.patch < 0) return v >= partial_upper_bound(version);
        return v > req;

    case ConstraintOp::LessEq:
        // <=1.2 := <1.3.0, <=1 := <2.0.0
        if (version.patch < 0) return v < partial_upper_bound(version);
        return v <= req;

    case ConstraintOp::Less:
        return v < req;
    }
    return false;
}

std::string VersionConstraint::to_string() const {
    std::string prefix;
    switch (op) {
    case ConstraintOp::Any:       return "*";
    case ConstraintOp::Exact:     prefix = "="; break;
    case ConstraintOp::Caret:     prefix = "^"; break;
    case ConstraintOp::Tilde:     prefix = "~"; break;
    case ConstraintOp::GreaterEq: prefix = ">="; break;
    case ConstraintOp::Greater:   prefix = ">"; break;
    case ConstraintOp::LessEq:    prefix = "<="; break;
    case ConstraintOp::Less:      prefix = "<"; break;
    }
    return prefix + version.to_string();
}

// ---------------------------------------------------------------------------
// VersionReq
// ---------------------------------------------------------------------------

static Result<VersionConstraint> parse_single_constraint(const std::string& raw) {
    std::string s = trim(raw);
    VersionConstraint vc;

    if (s == "*" || s == "x") {
        vc.op = ConstraintOp::Any;
        return Result<VersionConstraint>::ok(vc);
    }

    size_t pos = 0;
    vc.op = ConstraintOp::Caret;  // bare version behaves like ^
    if (s.compare(0, 2, ">=") == 0) {
        vc.op = ConstraintOp::GreaterEq;
        pos = 2;
    } else if (s.compare(0, 2, "<=") == 0) {
        vc.op = ConstraintOp::LessEq;
        pos = 2;
    } else if (!s.empty()) {
        switch (s[0]) {
        case '^': vc.op = ConstraintOp::Caret; pos = 1; break;
        case '~': vc.op = ConstraintOp::Tilde; pos = 1; break;
        case '=': vc.op = ConstraintOp::Exact; pos = 1; break;
        case '>': vc.op = ConstraintOp::Greater; pos = 1; break;
        case '<': vc.op = ConstraintOp::Less; pos = 1; break;
        default: break;
        }
    }

    std::string ver_str = trim(s.substr(pos));
    if (ver_str.empty()) {
        return DepmanError{DepmanError::InvalidVersionFormat,
            "missing version in constraint '" + raw + "'"};
    }

    auto pv = PartialVersion::parse(ver_str);
    if (pv.is_err()) {
        return DepmanError{DepmanError::InvalidVersionFormat,
            "invalid constraint '" + trim(raw) + "'",
            "expected e.g. ^1.2.3, ~1.2, >=1.0.0, <2"};
    }
    vc.version = pv.value();
    return Result<VersionConstraint>::ok(vc);
}

Result<VersionReq> VersionReq::parse(const std::string& s) {
    if (trim(s).empty()) {
        return DepmanError{DepmanError::InvalidVersionFormat,
            "empty version constraint"};
    }

    VersionReq req;
    std::istringstream stream(s);
    std::string token;

    while (std::getline(stream, token, ',')) {
        auto c = parse_single_constraint(token);
        if (c.is_err()) return std::move(c).error();
        req.constraints.push_back(std::move(c).value());
    }

    return Result<VersionReq>::ok(std::move(req));
}

bool VersionReq::matches(const Version& v) const {
    return std::all_of(constraints.begin(), constraints.end(),
        [&](const VersionConstraint& c) { return c.matches(v); });
}

std::string VersionReq::to_string() const {
    std::string s;
    for (size_t i = 0; i < constraints.size(); ++i) {
        if (i > 0) s += ", ";
        s += constraints[i].to_string();
    }
    return s;
}

} // namespace depman
