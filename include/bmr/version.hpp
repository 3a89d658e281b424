#pragma once

#include <bmr/result.hpp>
#include <string>

namespace bmr {

// Semantic version: MAJOR.MINOR.PATCH[-PRERELEASE][+BUILD]
struct Version {
    int major = 0;
    int minor = 0;
    int patch = 0;
    std::string prerelease;  // e.g. "alpha.0", empty for release
    std::string build;       // ignored for ordering

    static Result<Version> parse(const std::string& s);
    std::string to_string() const;

    bool is_prerelease() const { return !prerelease.empty(); }

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;
    bool operator<(const Version& o) const;
    bool operator<=(const Version& o) const;
    bool operator>(const Version& o) const;
    bool operator>=(const Version& o) const;
};

// Shape check only; same acceptance as Version::parse
bool is_semver(const std::string& s);

} // namespace bmr
