#pragma once

#include <depman/result.hpp>
#include <string>
#include <vector>

namespace depman {

// Semantic version: major.minor.patch[-prerelease][+build]
struct Version {
    int major = 0;
    int minor = 0;
    int patch = 0;
    std::string prerelease;  // e.g. "rc1"; empty for a release
    std::string build;       // metadata after '+', never compared

    static Result<Version> parse(const std::string& s);
    std::string to_string() const;

    // Same version with prerelease and build metadata dropped
    Version core() const;

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;
    bool operator<(const Version& o) const;
    bool operator<=(const Version& o) const;
    bool operator>(const Version& o) const;
    bool operator>=(const Version& o) const;
};

// Partial version used in constraints: "1", "1.2", "1.2.3"
struct PartialVersion {
    int major = 0;
    int minor = -1;  // -1 means unset
    int patch = -1;  // -1 means unset

    static Result<PartialVersion> parse(const std::string& s);
    std::string to_string() const;
};

enum class ConstraintOp {
    Any,         // *
    Exact,       // =1.2.3
    Caret,       // ^1.2.3
    Tilde,       // ~1.2.3
    GreaterEq,   // >=1.2.3
    Greater,     // >1.2.3, >1.2 := >=1.3.0
    LessEq,      // <=1.2.3, <=1.2 := <1.3.0
    Less,        // <1.2.3
};

struct VersionConstraint {
    ConstraintOp op = ConstraintOp::Any;
    PartialVersion version;

    bool matches(const Version& v) const;
    std::string to_string() const;
};

// Compound constraint, all parts must match: ">=1.0.0, <2.0.0"
struct VersionReq {
    std::vector<VersionConstraint> constraints;

    static Result<VersionReq> parse(const std::string& s);
    bool matches(const Version& v) const;
    std::string to_string() const;
};

} // namespace depman
