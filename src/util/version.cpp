#include <bmr/version.hpp>
#include <cctype>
#include <vector>

namespace bmr {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// Numeric component: digits only, no leading zero unless exactly "0"
static bool parse_component(const std::string& s, int& out) {
    if (!all_digits(s)) return false;
    if (s.size() > 1 && s[0] == '0') return false;
    if (s.size() > 9) return false;
    out = std::stoi(s);
    return true;
}

// Dot-separated identifiers of [0-9A-Za-z-], none empty
static bool valid_identifiers(const std::string& s) {
    if (s.empty()) return false;
    size_t start = 0;
    while (start <= s.size()) {
        size_t dot = s.find('.', start);
        std::string ident = s.substr(start, dot == std::string::npos
                                                ? std::string::npos
                                                : dot - start);
        if (ident.empty()) return false;
        for (char c : ident) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') return false;
        }
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return true;
}

static std::vector<std::string> split_dots(const std::string& s) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t dot = s.find('.', start);
        parts.push_back(s.substr(start, dot == std::string::npos
                                            ? std::string::npos
                                            : dot - start));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return parts;
}

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

Result<Version> Version::parse(const std::string& s) {
    if (s.empty()) {
        return BmrError{BmrError::Version, "empty version string"};
    }

    Version v;
    std::string core = s;

    size_t plus = core.find('+');
    if (plus != std::string::npos) {
        v.build = core.substr(plus + 1);
        core = core.substr(0, plus);
        if (!valid_identifiers(v.build)) {
            return BmrError{BmrError::Version,
                "invalid build metadata in '" + s + "'"};
        }
    }

    size_t dash = core.find('-');
    if (dash != std::string::npos) {
        v.prerelease = core.substr(dash + 1);
        core = core.substr(0, dash);
        if (!valid_identifiers(v.prerelease)) {
            return BmrError{BmrError::Version,
                "invalid pre-release label in '" + s + "'"};
        }
    }

    auto parts = split_dots(core);
    if (parts.size() != 3) {
        return BmrError{BmrError::Version,
            "invalid version '" + s + "'",
            "expected format: major.minor.patch[-prerelease]"};
    }

    if (!parse_component(parts[0], v.major) ||
        !parse_component(parts[1], v.minor) ||
        !parse_component(parts[2], v.patch)) {
        return BmrError{BmrError::Version,
            "invalid numeric component in '" + s + "'",
            "expected format: major.minor.patch[-prerelease]"};
    }

    return Result<Version>::ok(std::move(v));
}

std::string Version::to_string() const {
    std::string s = std::to_string(major) + "." +
                    std::to_string(minor) + "." +
                    std::to_string(patch);
    if (!prerelease.empty()) {
        s += "-" + prerelease;
    }
    if (!build.empty()) {
        s += "+" + build;
    }
    return s;
}

bool Version::operator==(const Version& o) const {
    return major == o.major && minor == o.minor &&
           patch == o.patch && prerelease == o.prerelease;
}

bool Version::operator!=(const Version& o) const { return !(*this == o); }

bool Version::operator<(const Version& o) const {
    if (major != o.major) return major < o.major;
    if (minor != o.minor) return minor < o.minor;
    if (patch != o.patch) return patch < o.patch;
    // Pre-release sorts before the release it precedes
    if (prerelease.empty() || o.prerelease.empty()) {
        return !prerelease.empty() && o.prerelease.empty();
    }

    auto a = split_dots(prerelease);
    auto b = split_dots(o.prerelease);
    for (size_t i = 0; i < a.size() && i < b.size(); ++i) {
        if (a[i] == b[i]) continue;
        bool an = all_digits(a[i]);
        bool bn = all_digits(b[i]);
        if (an && bn) {
            if (a[i].size() != b[i].size()) return a[i].size() < b[i].size();
            return a[i] < b[i];
        }
        if (an != bn) return an;  // numeric identifiers sort first
        return a[i] < b[i];
    }
    return a.size() < b.size();
}

bool Version::operator<=(const Version& o) const { return !(o < *this); }
bool Version::operator>(const Version& o) const { return o < *this; }
bool Version::operator>=(const Version& o) const { return !(*this < o); }

bool is_semver(const std::string& s) {
    return Version::parse(s).is_ok();
}

} // namespace bmr
