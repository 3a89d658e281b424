#pragma once

#include <bmr/version.hpp>
#include <optional>
#include <string>
#include <vector>

namespace bmr {

enum class InstallKind { V4, V6, Custom, Unknown };

// Where an installation was found; earlier enumerators win
enum class Source { Explicit, Project, Git, User };

const char* kind_name(InstallKind k);
const char* source_name(Source s);

// v6 > v4 > custom > unknown
int kind_rank(InstallKind k);

struct Installation {
    std::string root_path;                 // canonical absolute path
    InstallKind kind = InstallKind::Unknown;
    std::optional<Version> version;        // set only when raw_version is semver
    std::string raw_version;
    int depth = 0;                         // below the scanned root
    Source source = Source::Explicit;
    std::string origin;                    // scanned path or remote spec
    std::vector<std::string> manifest_paths;
    std::vector<std::string> warnings;

    std::string version_string() const {
        return raw_version.empty() ? "unknown" : raw_version;
    }
};

enum class TraceVerdict { Accepted, Rejected, Skipped, Missing };

const char* verdict_name(TraceVerdict v);

// One line of the scan trace: a path the scanner looked at and what it decided
struct ScanTraceEntry {
    std::string path;
    int depth = 0;
    TraceVerdict verdict = TraceVerdict::Rejected;
    std::string reason;
    Source source = Source::Explicit;
};

} // namespace bmr
