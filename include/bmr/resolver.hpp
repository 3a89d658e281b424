#pragma once

#include <bmr/result.hpp>
#include <bmr/cache.hpp>
#include <bmr/config.hpp>
#include <bmr/installation.hpp>
#include <bmr/scanner.hpp>

#include <optional>
#include <string>
#include <vector>

namespace bmr {

// Ordered installations for one request. Index 0 is the active installation;
// for any logical name the first installation containing it wins.
struct ResolvedCatalog {
    std::vector<Installation> installations;
    std::vector<ScanTraceEntry> trace;
    std::vector<std::string> warnings;
    std::vector<CacheResolution> remotes;    // one per configured remote, in order

    bool empty() const { return installations.empty(); }
    const Installation* active() const {
        return installations.empty() ? nullptr : &installations.front();
    }
};

struct DiagnosticReport {
    ResolverConfig config;
    ResolvedCatalog catalog;
    std::optional<Installation> active;

    std::string format() const;
};

// Merges scans of explicit paths, the project, cached remotes and the user
// root into one catalog ordered by (source, depth, kind rank, path).
class SourcePriorityResolver {
public:
    SourcePriorityResolver(ResolverConfig config, GitCacheManager& cache);

    // NoInstallationFound (with every checked path as context) when empty
    Result<ResolvedCatalog> resolve();

    // Same pass, but an empty catalog is reported rather than failed
    Result<DiagnosticReport> diagnose();

    // Orders installations of one source and drops repeated roots
    static void sort_within_source(std::vector<Installation>& installations);

private:
    ResolverConfig config_;
    GitCacheManager& cache_;

    Result<ResolvedCatalog> collect();
};

// Entry points with a cache manager built from config.cache
Result<ResolvedCatalog> resolve_catalog(const ResolverConfig& config);
Result<DiagnosticReport> diagnostics(const ResolverConfig& config);

} // namespace bmr
