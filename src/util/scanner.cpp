#include <bmr/scanner.hpp>
#include <bmr/glob.hpp>
#include <bmr/log.hpp>
#include <bmr/manifest.hpp>

#include <algorithm>
#include <deque>
#include <filesystem>
#include <set>

namespace fs = std::filesystem;

namespace bmr {

const char* kind_name(InstallKind k) {
    switch (k) {
        case InstallKind::V4:      return "v4";
        case InstallKind::V6:      return "v6";
        case InstallKind::Custom:  return "custom";
        case InstallKind::Unknown: return "unknown";
    }
    return "unknown";
}

const char* source_name(Source s) {
    switch (s) {
        case Source::Explicit: return "explicit";
        case Source::Project:  return "project";
        case Source::Git:      return "git";
        case Source::User:     return "user";
    }
    return "unknown";
}

int kind_rank(InstallKind k) {
    switch (k) {
        case InstallKind::V6:      return 3;
        case InstallKind::V4:      return 2;
        case InstallKind::Custom:  return 1;
        case InstallKind::Unknown: return 0;
    }
    return 0;
}

const char* verdict_name(TraceVerdict v) {
    switch (v) {
        case TraceVerdict::Accepted: return "accepted";
        case TraceVerdict::Rejected: return "rejected";
        case TraceVerdict::Skipped:  return "skipped";
        case TraceVerdict::Missing:  return "missing";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Classification
// ---------------------------------------------------------------------------

static bool is_file(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

static bool is_dir(const fs::path& p) {
    std::error_code ec;
    return fs::is_directory(p, ec);
}

static void check_version(Classification& c, const std::string& source_file) {
    if (c.raw_version.empty()) {
        c.warnings.push_back("no version in " + source_file);
    } else if (!is_semver(c.raw_version)) {
        c.warnings.push_back("version '" + c.raw_version + "' in " + source_file +
                             " is not a semantic version");
    }
}

bool InstallationScanner::is_marker_name(const std::string& name) {
    std::string lower;
    lower.reserve(name.size());
    for (char ch : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (lower.find("bmad") != std::string::npos) return true;
    return name == "agents" || name == "workflows" || name == "tasks" || name == "_cfg";
}

Classification InstallationScanner::classify(const std::string& dir) {
    Classification c;
    fs::path d(dir);

    // v6
    fs::path v6_manifest = d / "_cfg" / "manifest.yaml";
    if (is_file(v6_manifest)) {
        c.kind = InstallKind::V6;
        c.manifest_paths.push_back(v6_manifest.string());
        auto m = read_v6_manifest(v6_manifest.string());
        if (m.is_err()) {
            c.warnings.push_back("unreadable manifest " + v6_manifest.string() +
                                 ": " + m.error().message);
        } else {
            c.raw_version = m.value().version;
            check_version(c, v6_manifest.string());
        }
        for (const char* csv : {"agent-manifest.csv", "workflow-manifest.csv",
                                "task-manifest.csv"}) {
            fs::path p = d / "_cfg" / csv;
            if (is_file(p)) c.manifest_paths.push_back(p.string());
        }
        return c;
    }

    // v4
    fs::path install_manifest = d / "install-manifest.yaml";
    fs::path core_config = d / "core-config.yaml";
    bool has_install = is_file(install_manifest);
    bool has_core = is_file(core_config);
    if (has_install || has_core) {
        c.kind = InstallKind::V4;
        std::string version_file;
        if (has_install) {
            c.manifest_paths.push_back(install_manifest.string());
            auto m = read_v4_manifest(install_manifest.string());
            if (m.is_err()) {
                c.warnings.push_back("unreadable manifest " + install_manifest.string() +
                                     ": " + m.error().message);
            } else if (!m.value().version.empty()) {
                c.raw_version = m.value().version;
                version_file = install_manifest.string();
            }
        }
        if (has_core) {
            c.manifest_paths.push_back(core_config.string());
            auto v = read_core_config_version(core_config.string());
            if (v.is_err()) {
                c.warnings.push_back("unreadable config " + core_config.string() +
                                     ": " + v.error().message);
            } else if (!v.value().empty()) {
                c.raw_version = v.value();
                version_file = core_config.string();
            }
        }
        if (version_file.empty()) {
            version_file = has_install ? install_manifest.string() : core_config.string();
        }
        check_version(c, version_file);
        return c;
    }

    // custom
    if (d.filename() != "_cfg" && (is_dir(d / "agents") || is_dir(d / "workflows"))) {
        c.kind = InstallKind::Custom;
    }
    return c;
}

// ---------------------------------------------------------------------------
// Scan
// ---------------------------------------------------------------------------

InstallationScanner::InstallationScanner(ScanOptions options)
    : options_(std::move(options)) {}

ScanResult InstallationScanner::scan(const std::string& root, Source source,
                                     const std::string& origin) const {
    ScanResult result;
    std::string from = origin.empty() ? root : origin;

    auto record = [&](const std::string& path, int depth, TraceVerdict verdict,
                      std::string reason) {
        log::trace("scan %s [%s] %s: %s", path.c_str(), source_name(source),
                   verdict_name(verdict), reason.c_str());
        result.trace.push_back(ScanTraceEntry{path, depth, verdict, std::move(reason), source});
    };
    auto warn = [&](const std::string& msg) {
        log::warn("%s", msg.c_str());
        result.warnings.push_back(msg);
    };

    std::error_code ec;
    if (!fs::exists(root, ec)) {
        record(root, 0, TraceVerdict::Missing, "path does not exist");
        return result;
    }
    if (!fs::is_directory(root, ec)) {
        record(root, 0, TraceVerdict::Rejected, "not a directory");
        return result;
    }

    std::deque<std::pair<fs::path, int>> queue;
    std::set<fs::path> visited;
    queue.emplace_back(fs::path(root), 0);

    while (!queue.empty()) {
        auto [dir, depth] = queue.front();
        queue.pop_front();
        std::string dir_str = dir.string();

        fs::path canon = fs::canonical(dir, ec);
        if (ec) {
            record(dir_str, depth, TraceVerdict::Skipped, "unreadable: " + ec.message());
            warn("skipping unreadable directory " + dir_str + ": " + ec.message());
            continue;
        }
        if (!visited.insert(canon).second) {
            record(dir_str, depth, TraceVerdict::Skipped,
                   "already visited as " + canon.string());
            continue;
        }

        Classification c = classify(canon.string());
        if (c.kind != InstallKind::Unknown) {
            Installation inst;
            inst.root_path = canon.string();
            inst.kind = c.kind;
            inst.raw_version = c.raw_version;
            if (!c.raw_version.empty()) {
                auto v = Version::parse(c.raw_version);
                if (v.is_ok()) inst.version = v.value();
            }
            inst.depth = depth;
            inst.source = source;
            inst.origin = from;
            inst.manifest_paths = std::move(c.manifest_paths);
            inst.warnings = std::move(c.warnings);
            for (const auto& w : inst.warnings) {
                warn(inst.root_path + ": " + w);
            }

            log::debug("found %s installation at %s (depth %d, version %s)",
                       kind_name(inst.kind), inst.root_path.c_str(), depth,
                       inst.version_string().c_str());
            record(dir_str, depth, TraceVerdict::Accepted,
                   std::string(kind_name(inst.kind)) + " installation, version " +
                   inst.version_string());
            result.installations.push_back(std::move(inst));
            continue;
        }

        if (depth >= options_.max_depth) {
            record(dir_str, depth, TraceVerdict::Rejected,
                   "no installation markers (depth limit " +
                   std::to_string(options_.max_depth) + ")");
            continue;
        }

        std::vector<fs::path> children;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            record(dir_str, depth, TraceVerdict::Skipped, "cannot list: " + ec.message());
            warn("cannot list " + dir_str + ": " + ec.message());
            continue;
        }
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) break;
            std::error_code dec;
            if (it->is_directory(dec)) children.push_back(it->path());
        }
        if (ec) {
            warn("listing of " + dir_str + " ended early: " + ec.message());
        }
        std::sort(children.begin(), children.end());

        record(dir_str, depth, TraceVerdict::Rejected, "no installation markers");

        for (const auto& child : children) {
            std::string name = child.filename().string();
            std::string child_str = child.string();
            if (glob_match_any(options_.exclude, name)) {
                record(child_str, depth + 1, TraceVerdict::Skipped, "excluded");
                continue;
            }
            bool marker = is_marker_name(name);
            if (!name.empty() && name[0] == '.' && !marker) {
                record(child_str, depth + 1, TraceVerdict::Skipped, "hidden");
                continue;
            }
            if (depth >= 2 && !marker) {
                record(child_str, depth + 1, TraceVerdict::Skipped, "filtered by name");
                continue;
            }
            queue.emplace_back(child, depth + 1);
        }
    }

    log::debug("scan of %s found %zu installation(s)", root.c_str(),
               result.installations.size());
    return result;
}

} // namespace bmr
