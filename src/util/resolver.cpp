#include <bmr/resolver.hpp>
#include <bmr/log.hpp>
#include <bmr/remote.hpp>

#include <algorithm>
#include <set>
#include <sstream>

namespace bmr {

SourcePriorityResolver::SourcePriorityResolver(ResolverConfig config,
                                               GitCacheManager& cache)
    : config_(std::move(config)), cache_(cache) {}

void SourcePriorityResolver::sort_within_source(std::vector<Installation>& installations) {
    std::stable_sort(installations.begin(), installations.end(),
        [](const Installation& a, const Installation& b) {
            if (a.depth != b.depth) return a.depth < b.depth;
            int ra = kind_rank(a.kind), rb = kind_rank(b.kind);
            if (ra != rb) return ra > rb;
            return a.root_path < b.root_path;
        });
}

Result<ResolvedCatalog> SourcePriorityResolver::collect() {
    // Parse every remote before touching the filesystem or network
    std::vector<RemoteSpec> specs;
    for (const auto& text : config_.remotes) {
        auto spec = resolve_remote(text, config_.named_remotes);
        if (spec.is_err()) {
            return std::move(spec).context("configured remote: " + text).error();
        }
        specs.push_back(std::move(spec).value());
    }

    bool strict = config_.mode == DiscoveryMode::Strict;
    InstallationScanner scanner(ScanOptions{config_.max_depth, config_.exclude_dirs});
    ResolvedCatalog catalog;

    auto absorb = [&](ScanResult scan, std::vector<Installation>& group) {
        for (auto& inst : scan.installations) group.push_back(std::move(inst));
        for (auto& t : scan.trace) catalog.trace.push_back(std::move(t));
        for (auto& w : scan.warnings) catalog.warnings.push_back(std::move(w));
    };

    std::vector<std::vector<Installation>> groups;

    // explicit
    {
        std::vector<Installation> group;
        for (const auto& path : config_.explicit_paths) {
            absorb(scanner.scan(path, Source::Explicit), group);
        }
        groups.push_back(std::move(group));
    }

    // project
    if (!strict && !config_.project_root.empty()) {
        std::vector<Installation> group;
        absorb(scanner.scan(config_.project_root, Source::Project), group);
        groups.push_back(std::move(group));
    }

    // git
    {
        std::vector<Installation> group;
        for (const auto& spec : specs) {
            auto res = cache_.resolve(spec);
            if (res.is_err()) {
                return std::move(res).context("remote: " + spec.canonical()).error();
            }
            auto& cr = res.value();
            for (const auto& w : cr.warnings) catalog.warnings.push_back(w);
            absorb(scanner.scan(cr.content_path, Source::Git, spec.canonical()), group);
            catalog.remotes.push_back(std::move(cr));
        }
        groups.push_back(std::move(group));
    }

    // user
    if (!strict && config_.include_user && !config_.user_root.empty()) {
        std::vector<Installation> group;
        absorb(scanner.scan(config_.user_root, Source::User), group);
        groups.push_back(std::move(group));
    }

    std::set<std::string> seen;
    for (auto& group : groups) {
        sort_within_source(group);
        for (auto& inst : group) {
            if (!seen.insert(inst.root_path).second) {
                log::debug("dropping %s from %s source: already listed",
                           inst.root_path.c_str(), source_name(inst.source));
                catalog.trace.push_back(ScanTraceEntry{
                    inst.root_path, inst.depth, TraceVerdict::Skipped,
                    "duplicate of a higher-priority installation", inst.source});
                continue;
            }
            catalog.installations.push_back(std::move(inst));
        }
    }

    return Result<ResolvedCatalog>::ok(std::move(catalog));
}

Result<ResolvedCatalog> SourcePriorityResolver::resolve() {
    auto catalog = collect();
    if (catalog.is_err()) return catalog;

    if (catalog.value().empty()) {
        BmrError err{BmrError::NoInstallationFound,
            "no methodology installation found",
            "add a path to discovery.paths (or BMR_ROOT), or a remote to git.remotes"};
        for (const auto& t : catalog.value().trace) {
            if (t.verdict == TraceVerdict::Skipped && t.reason == "hidden") continue;
            err.with_context(t.path + " [" + source_name(t.source) + "]: " +
                             verdict_name(t.verdict) + ", " + t.reason);
        }
        if (config_.mode == DiscoveryMode::Strict) {
            err.with_context("strict mode: project and user directories not searched");
        }
        return err;
    }

    log::debug("catalog: %zu installation(s), active %s",
               catalog.value().installations.size(),
               catalog.value().installations.front().root_path.c_str());
    return catalog;
}

Result<DiagnosticReport> SourcePriorityResolver::diagnose() {
    auto catalog = collect();
    if (catalog.is_err()) return std::move(catalog).error();

    DiagnosticReport report;
    report.config = config_;
    report.catalog = std::move(catalog).value();
    if (const Installation* a = report.catalog.active()) {
        report.active = *a;
    }
    return Result<DiagnosticReport>::ok(std::move(report));
}

std::string DiagnosticReport::format() const {
    std::ostringstream out;
    out << "mode: " << mode_name(config.mode) << "\n";
    out << "project: " << (config.project_root.empty() ? "(none)" : config.project_root) << "\n";
    out << "user: " << (config.include_user ? config.user_root : "(disabled)") << "\n";
    out << "cache: " << config.cache.root << "\n";
    for (const auto& p : config.explicit_paths) {
        out << "path: " << p << "\n";
    }
    for (const auto& r : catalog.remotes) {
        out << "remote: " << r.spec.canonical() << " -> " << r.content_path
            << " (" << action_name(r.action) << ", "
            << r.entry.commit.substr(0, 12) << ")\n";
    }

    out << "\ninstallations:\n";
    if (catalog.installations.empty()) {
        out << "  (none)\n";
    }
    int n = 1;
    for (const auto& inst : catalog.installations) {
        out << "  " << n++ << ". " << inst.root_path << "\n"
            << "     " << kind_name(inst.kind) << " " << inst.version_string()
            << ", source " << source_name(inst.source)
            << ", depth " << inst.depth << "\n";
        if (inst.source == Source::Git) {
            out << "     from " << inst.origin << "\n";
        }
    }

    out << "\nactive: " << (active ? active->root_path : "(none)") << "\n";

    if (!catalog.warnings.empty()) {
        out << "\nwarnings:\n";
        for (const auto& w : catalog.warnings) out << "  " << w << "\n";
    }

    out << "\ntrace:\n";
    for (const auto& t : catalog.trace) {
        out << "  [" << verdict_name(t.verdict) << "] " << t.path
            << " (" << source_name(t.source) << ", depth " << t.depth << "): "
            << t.reason << "\n";
    }
    return out.str();
}

// ---------------------------------------------------------------------------
// Entry points
// ---------------------------------------------------------------------------

Result<ResolvedCatalog> resolve_catalog(const ResolverConfig& config) {
    GitCacheManager cache(config.cache);
    SourcePriorityResolver resolver(config, cache);
    return resolver.resolve();
}

Result<DiagnosticReport> diagnostics(const ResolverConfig& config) {
    GitCacheManager cache(config.cache);
    SourcePriorityResolver resolver(config, cache);
    return resolver.diagnose();
}

} // namespace bmr
