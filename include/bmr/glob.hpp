#pragma once

#include <string>
#include <vector>

namespace bmr {

// Match a glob pattern against a single path segment (a directory or file
// name, never containing '/').
// Supports: * (any run of chars), ? (one char), [abc], [a-z], [!0-9]
bool glob_match(const std::string& pattern, const std::string& name);

// True if any pattern matches `name`
bool glob_match_any(const std::vector<std::string>& patterns,
                    const std::string& name);

} // namespace bmr
