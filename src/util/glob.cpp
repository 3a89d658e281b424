#include <bmr/glob.hpp>

namespace bmr {

// Parse the class starting at pat[pi] == '['. On return `pi` points past the
// closing ']'. A class without ']' is treated as a literal '['.
static bool match_class(const std::string& pat, size_t& pi, char c, bool& valid) {
    size_t i = pi + 1;
    bool negate = false;
    if (i < pat.size() && pat[i] == '!') {
        negate = true;
        i++;
    }

    bool matched = false;
    bool first = true;
    while (i < pat.size() && (pat[i] != ']' || first)) {
        first = false;
        char lo = pat[i];
        if (i + 2 < pat.size() && pat[i + 1] == '-' && pat[i + 2] != ']') {
            char hi = pat[i + 2];
            if (c >= lo && c <= hi) matched = true;
            i += 3;
        } else {
            if (c == lo) matched = true;
            i++;
        }
    }

    if (i >= pat.size()) {
        valid = false;
        return false;
    }

    valid = true;
    pi = i + 1;
    return matched != negate;
}

bool glob_match(const std::string& pattern, const std::string& name) {
    // Iterative matcher with single-star backtracking
    size_t pi = 0, si = 0;
    size_t star_pi = std::string::npos, star_si = 0;

    while (si < name.size()) {
        if (pi < pattern.size()) {
            char pc = pattern[pi];
            if (pc == '*') {
                star_pi = pi++;
                star_si = si;
                continue;
            }
            if (pc == '?') {
                pi++;
                si++;
                continue;
            }
            if (pc == '[') {
                size_t next = pi;
                bool valid = false;
                bool ok = match_class(pattern, next, name[si], valid);
                if (valid) {
                    if (ok) {
                        pi = next;
                        si++;
                        continue;
                    }
                } else if (name[si] == '[') {
                    pi++;
                    si++;
                    continue;
                }
            } else if (pc == name[si]) {
                pi++;
                si++;
                continue;
            }
        }

        if (star_pi == std::string::npos) return false;
        pi = star_pi + 1;
        si = ++star_si;
    }

    while (pi < pattern.size() && pattern[pi] == '*') pi++;
    return pi == pattern.size();
}

bool glob_match_any(const std::vector<std::string>& patterns,
                    const std::string& name) {
    for (const auto& p : patterns) {
        if (glob_match(p, name)) return true;
    }
    return false;
}

} // namespace bmr
