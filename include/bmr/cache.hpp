#pragma once

#include <bmr/result.hpp>
#include <bmr/config.hpp>
#include <bmr/git.hpp>
#include <bmr/remote.hpp>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace bmr {

// Metadata persisted next to each clone in <clone>/.bmr-cache.toml
struct CacheEntry {
    std::string source;          // canonical remote spec
    GitProtocol protocol = GitProtocol::Https;
    std::string host;
    std::string org;
    std::string repo;
    std::string ref;             // empty = remote default branch
    std::string commit;
    std::string local_path;      // not persisted
    int64_t last_fetched_at = 0;
    int64_t last_validated_at = 0;
    uint64_t size_on_disk = 0;

    static constexpr const char* kSidecarName = ".bmr-cache.toml";

    // Read <clone_dir>/.bmr-cache.toml; CacheCorrupt when missing or unparsable
    static Result<CacheEntry> read(const std::string& clone_dir);
    Status write(const std::string& clone_dir) const;

    // Same host, org, repo and ref as the spec
    bool matches(const RemoteSpec& spec) const;
};

enum class CacheAction { Reused, Cloned, Updated, Recloned };

const char* action_name(CacheAction a);

struct CacheResolution {
    RemoteSpec spec;
    std::string local_path;     // clone root
    std::string content_path;   // clone root + subpath
    CacheAction action = CacheAction::Reused;
    CacheEntry entry;
    std::vector<std::string> warnings;
};

// Maps remote specs to local clones under a cache root.
//
// Layout:
//   <root>/<key>/                  clone (work tree), sidecar inside
//   <root>/.locks/<key>.lock       per-key advisory lock
//   <root>/.tmp/<key>+<pid>.<n>/   in-flight clones, renamed into place
//   <root>/.tmp/<key>+old+<pid>.<n>/  replaced tree awaiting removal
class GitCacheManager {
public:
    explicit GitCacheManager(CacheOptions options);

    // Default: ~/.bmad/cache/git
    static std::string default_cache_root();

    // Clone, update, or reuse the clone for `spec` under its key lock.
    // CloneFailed when no usable clone can be produced or the lock is not
    // obtained within timeout_seconds; update failures are returned as
    // warnings with the stale clone.
    Result<CacheResolution> resolve(const RemoteSpec& spec);

    // All entries with a readable sidecar, sorted by key
    Result<std::vector<CacheEntry>> list() const;

    // Remove the clone for `spec` (under its lock)
    Status evict(const RemoteSpec& spec);

    // Remove the entire cache root
    Status clean_all();

    std::string entry_path(const RemoteSpec& spec) const;
    std::string lock_path(const RemoteSpec& spec) const;

    GitCli& git() { return git_; }
    const CacheOptions& options() const { return options_; }
    const std::string& cache_root() const { return options_.root; }

private:
    CacheOptions options_;
    GitCli git_;
    std::atomic<unsigned> tmp_counter_{0};
    std::mutex git_check_mutex_;
    bool git_checked_ = false;

    // git --version once per manager; CloneFailed with a hint when missing or too old
    Status ensure_git();

    // Remove <root>/.tmp/<key>+* (caller holds the key lock)
    void remove_stale_temps(const std::string& key);

    // Clone into a fresh temporary directory and write its sidecar
    Result<CacheEntry> clone_to_temp(const RemoteSpec& spec, const std::string& key,
                                     std::string& tmp_path);

    // Clone and move into `dest`, replacing whatever is there
    Result<CacheEntry> clone_into_place(const RemoteSpec& spec, const std::string& key,
                                        const std::string& dest);

    std::string temp_path(const std::string& key, const char* tag);
};

} // namespace bmr
