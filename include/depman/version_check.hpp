#pragma once

#include <depman/error.hpp>
#include <depman/version.hpp>
#include <optional>
#include <string>

namespace depman {

// How far an installed version is from the pinned `required` version.
enum class UpdateKind {
    NoUpdate,
    PatchUpdate,
    MinorUpdate,
    MajorUpdate,
    NotInstalled,
};

const char* update_kind_name(UpdateKind kind);

struct VersionCheck {
    bool compatible = false;
    UpdateKind update = UpdateKind::NotInstalled;
    std::optional<DepmanError> error;  // InvalidVersionFormat only
};

// Bump needed to move `current` to `target`, decided by the most
// significant differing component. Direction is not considered.
UpdateKind update_kind(const Version& current, const Version& target);

// Classifies an installed version against a dependency's version spec.
//
//  - `current` absent: NotInstalled, incompatible.
//  - empty `constraint`: compatible only on an exact match with `required`.
//  - otherwise: compatible when `current` satisfies `constraint`.
//
// `update` is always relative to `required`. Prerelease tags on `current`
// are ignored unless `required` carries one. Unparsable input yields an
// InvalidVersionFormat error and an incompatible result. Pure function.
VersionCheck classify_version(const std::optional<std::string>& current,
                              const std::string& required,
                              const std::string& constraint);

// First version-looking token in a tool's output ("Python 3.11.4",
// "git version 2.43.0", "v18.19.0"). Two-component versions are padded
// to three.
std::optional<std::string> extract_version(const std::string& output);

} // namespace depman
