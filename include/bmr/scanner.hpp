#pragma once

#include <bmr/installation.hpp>
#include <string>
#include <vector>

namespace bmr {

struct ScanOptions {
    int max_depth = 3;
    std::vector<std::string> exclude;   // glob patterns on directory names
};

struct ScanResult {
    std::vector<Installation> installations;   // in discovery (BFS) order
    std::vector<ScanTraceEntry> trace;
    std::vector<std::string> warnings;
};

// Structural classification of a single directory
struct Classification {
    InstallKind kind = InstallKind::Unknown;
    std::string raw_version;
    std::vector<std::string> manifest_paths;
    std::vector<std::string> warnings;
};

// Breadth-first search for installation roots below a directory.
//
// Children of directories at depth 0 and 1 are always visited; deeper only
// directories whose name passes is_marker_name(). Hidden directories need the
// marker too, excluded ones are never entered, and classified roots are not
// descended into. Problems become trace entries and warnings, never errors.
class InstallationScanner {
public:
    explicit InstallationScanner(ScanOptions options);

    ScanResult scan(const std::string& root, Source source,
                    const std::string& origin = "") const;

    // v6 (_cfg/manifest.yaml) > v4 (install-manifest.yaml / core-config.yaml)
    // > custom (agents/ or workflows/, directory not named _cfg)
    static Classification classify(const std::string& dir);

    // Contains "bmad" (any case) or is agents, workflows, tasks, _cfg
    static bool is_marker_name(const std::string& name);

    const ScanOptions& options() const { return options_; }

private:
    ScanOptions options_;
};

} // namespace bmr
