#include <bmr/cache.hpp>
#include <bmr/lock.hpp>
#include <bmr/log.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>

#include <unistd.h>

namespace fs = std::filesystem;

namespace bmr {

static int64_t now_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

static uint64_t directory_size(const fs::path& root) {
    uint64_t total = 0;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code fec;
        if (it->is_regular_file(fec) && !it->is_symlink(fec)) {
            auto sz = it->file_size(fec);
            if (!fec) total += sz;
        }
    }
    return total;
}

const char* action_name(CacheAction a) {
    switch (a) {
        case CacheAction::Reused:   return "reused";
        case CacheAction::Cloned:   return "cloned";
        case CacheAction::Updated:  return "updated";
        case CacheAction::Recloned: return "recloned";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// CacheEntry sidecar
// ---------------------------------------------------------------------------

Result<CacheEntry> CacheEntry::read(const std::string& clone_dir) {
    fs::path path = fs::path(clone_dir) / kSidecarName;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return BmrError{BmrError::CacheCorrupt,
            "cache entry has no sidecar: " + path.string()};
    }

    toml::table tbl;
    try {
        tbl = toml::parse_file(path.string());
    } catch (const toml::parse_error& e) {
        return BmrError{BmrError::CacheCorrupt,
            "unparsable cache sidecar " + path.string() + ": " +
            std::string(e.description())};
    }

    CacheEntry entry;
    entry.local_path = clone_dir;

    auto require = [&](const char* key, std::string& out) -> bool {
        auto v = tbl[key].value<std::string>();
        if (!v) return false;
        out = *v;
        return true;
    };

    std::string protocol;
    if (!require("source", entry.source) || !require("protocol", protocol) ||
        !require("host", entry.host) || !require("org", entry.org) ||
        !require("repo", entry.repo) || !require("ref", entry.ref) ||
        !require("commit", entry.commit)) {
        return BmrError{BmrError::CacheCorrupt,
            "cache sidecar " + path.string() + " is missing required keys"};
    }
    if (protocol == "https") {
        entry.protocol = GitProtocol::Https;
    } else if (protocol == "ssh") {
        entry.protocol = GitProtocol::Ssh;
    } else {
        return BmrError{BmrError::CacheCorrupt,
            "cache sidecar " + path.string() + " has unknown protocol '" + protocol + "'"};
    }

    entry.last_fetched_at = tbl["last_fetched_at"].value_or<int64_t>(0);
    entry.last_validated_at = tbl["last_validated_at"].value_or<int64_t>(0);
    entry.size_on_disk = static_cast<uint64_t>(tbl["size_on_disk"].value_or<int64_t>(0));

    return Result<CacheEntry>::ok(std::move(entry));
}

Status CacheEntry::write(const std::string& clone_dir) const {
    toml::table tbl{
        {"source", source},
        {"protocol", std::string(protocol_name(protocol))},
        {"host", host},
        {"org", org},
        {"repo", repo},
        {"ref", ref},
        {"commit", commit},
        {"last_fetched_at", last_fetched_at},
        {"last_validated_at", last_validated_at},
        {"size_on_disk", static_cast<int64_t>(size_on_disk)},
    };

    fs::path path = fs::path(clone_dir) / kSidecarName;
    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp);
        if (!out) {
            return BmrError{BmrError::IO,
                "cannot write cache sidecar " + tmp.string()};
        }
        out << "# Managed by bmr. Do not edit.\n";
        out << tbl << "\n";
        if (!out) {
            return BmrError{BmrError::IO,
                "cannot write cache sidecar " + tmp.string()};
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        return BmrError{BmrError::IO,
            "cannot replace cache sidecar " + path.string() + ": " + ec.message()};
    }
    return ok_status();
}

bool CacheEntry::matches(const RemoteSpec& spec) const {
    return host == spec.host && org == spec.org && repo == spec.repo &&
           ref == spec.ref.value_or("");
}

// ---------------------------------------------------------------------------
// GitCacheManager
// ---------------------------------------------------------------------------

GitCacheManager::GitCacheManager(CacheOptions options)
    : options_(std::move(options)) {
    if (options_.root.empty()) options_.root = default_cache_root();
    git_.set_timeout(options_.timeout_seconds);
    for (const auto& [prefix, replacement] : options_.mirrors) {
        git_.add_url_rewrite(prefix, replacement);
    }
}

std::string GitCacheManager::default_cache_root() {
    const char* home = std::getenv("HOME");
    if (!home) home = "/tmp";
    return std::string(home) + "/.bmad/cache/git";
}

std::string GitCacheManager::entry_path(const RemoteSpec& spec) const {
    return (fs::path(options_.root) / derive_cache_key(spec)).string();
}

std::string GitCacheManager::lock_path(const RemoteSpec& spec) const {
    return (fs::path(options_.root) / ".locks" / (derive_cache_key(spec) + ".lock")).string();
}

// '+' is percent-encoded in keys, so "<key>+" never prefixes another key's names
std::string GitCacheManager::temp_path(const std::string& key, const char* tag) {
    unsigned n = tmp_counter_.fetch_add(1);
    return (fs::path(options_.root) / ".tmp" /
            (key + "+" + tag + std::to_string(getpid()) + "." + std::to_string(n))).string();
}

void GitCacheManager::remove_stale_temps(const std::string& key) {
    fs::path dir = fs::path(options_.root) / ".tmp";
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return;

    const std::string prefix = key + "+";
    std::vector<fs::path> stale;
    fs::directory_iterator it(dir, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (name.compare(0, prefix.size(), prefix) == 0) stale.push_back(it->path());
    }
    for (const auto& p : stale) {
        std::error_code rec;
        fs::remove_all(p, rec);
        if (rec) {
            log::warn("cannot remove leftover clone %s: %s",
                      p.string().c_str(), rec.message().c_str());
        } else {
            log::debug("removed leftover clone %s", p.string().c_str());
        }
    }
}

Status GitCacheManager::ensure_git() {
    std::lock_guard<std::mutex> lock(git_check_mutex_);
    if (git_checked_) return ok_status();

    auto version = git_.check_version();
    if (version.is_err()) {
        const auto& e = version.error();
        return BmrError{BmrError::CloneFailed,
            "git is not usable: " + e.message,
            e.hint.empty() ? "install git >= 2.20 and make sure it is on PATH" : e.hint};
    }
    log::debug("using git %s", version.value().c_str());
    git_checked_ = true;
    return ok_status();
}

Result<CacheEntry> GitCacheManager::clone_to_temp(const RemoteSpec& spec,
                                                  const std::string& key,
                                                  std::string& tmp_path) {
    BMR_TRY(ensure_git());

    tmp_path = temp_path(key, "");
    std::error_code ec;
    fs::remove_all(tmp_path, ec);
    fs::create_directories(fs::path(tmp_path).parent_path(), ec);
    if (ec) {
        return BmrError{BmrError::CloneFailed,
            "cannot create " + fs::path(tmp_path).parent_path().string() + ": " + ec.message()};
    }

    auto discard = [&]() {
        std::error_code rec;
        fs::remove_all(tmp_path, rec);
    };

    log::info("cloning %s", spec.canonical().c_str());
    auto cloned = git_.clone(spec.clone_url(), tmp_path, spec.ref.value_or(""),
                             spec.ref_is_commit());
    if (cloned.is_err()) {
        discard();
        return std::move(cloned).context(spec.canonical() + ": clone failed").error();
    }

    auto head = git_.head_commit(tmp_path);
    if (head.is_err()) {
        discard();
        return BmrError{BmrError::CloneFailed,
            "fresh clone of " + spec.canonical() + " has no HEAD: " + head.error().message};
    }

    auto excluded = git_.exclude_path(tmp_path, std::string("/") + CacheEntry::kSidecarName);
    if (excluded.is_err()) {
        discard();
        return BmrError{BmrError::CloneFailed, excluded.error().message};
    }

    int64_t now = now_seconds();
    CacheEntry entry;
    entry.source = spec.canonical();
    entry.protocol = spec.protocol;
    entry.host = spec.host;
    entry.org = spec.org;
    entry.repo = spec.repo;
    entry.ref = spec.ref.value_or("");
    entry.commit = head.value();
    entry.last_fetched_at = now;
    entry.last_validated_at = now;
    entry.size_on_disk = directory_size(tmp_path);

    auto written = entry.write(tmp_path);
    if (written.is_err()) {
        discard();
        return BmrError{BmrError::CloneFailed, written.error().message};
    }

    return Result<CacheEntry>::ok(std::move(entry));
}

Result<CacheEntry> GitCacheManager::clone_into_place(const RemoteSpec& spec,
                                                     const std::string& key,
                                                     const std::string& dest) {
    std::string tmp;
    auto cloned = clone_to_temp(spec, key, tmp);
    if (cloned.is_err()) return std::move(cloned).error();

    std::error_code ec;
    std::string old;
    if (fs::exists(fs::symlink_status(dest, ec))) {
        // Move the old tree aside first so the swap is a pair of renames
        old = temp_path(key, "old+");
        fs::rename(dest, old, ec);
        if (ec) {
            fs::remove_all(tmp, ec);
            return BmrError{BmrError::CloneFailed,
                "cannot move aside stale cache entry " + dest + ": " + ec.message()};
        }
    }

    fs::rename(tmp, dest, ec);
    if (ec) {
        std::string msg = ec.message();
        fs::remove_all(tmp, ec);
        return BmrError{BmrError::CloneFailed,
            "cannot move clone into " + dest + ": " + msg};
    }
    if (!old.empty()) {
        fs::remove_all(old, ec);
        if (ec) {
            log::warn("cannot remove replaced cache tree %s: %s",
                      old.c_str(), ec.message().c_str());
        }
    }

    auto entry = std::move(cloned).value();
    entry.local_path = dest;
    log::info("cached %s at %s (%s)", spec.canonical().c_str(), dest.c_str(),
              entry.commit.substr(0, 12).c_str());
    return Result<CacheEntry>::ok(std::move(entry));
}

Result<CacheResolution> GitCacheManager::resolve(const RemoteSpec& spec) {
    std::string key = derive_cache_key(spec);
    std::string path = entry_path(spec);

    auto lock = KeyLock::acquire(lock_path(spec), options_.timeout_seconds);
    if (lock.is_err()) {
        return BmrError{BmrError::CloneFailed,
            "cannot lock cache entry for " + spec.canonical() + ": " + lock.error().message,
            lock.error().hint};
    }
    // Clones a crashed process left behind; nobody else can own them now
    remove_stale_temps(key);

    CacheResolution res;
    res.spec = spec;
    res.local_path = path;

    auto reclone = [&](CacheAction action) -> Status {
        auto entry = clone_into_place(spec, key, path);
        if (entry.is_err()) return std::move(entry).error();
        res.entry = std::move(entry).value();
        res.action = action;
        return ok_status();
    };

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        BMR_TRY(reclone(CacheAction::Cloned));
    } else if (!git_.is_work_tree(path)) {
        std::string w = "cache entry " + path + " is not a git work tree; re-cloning";
        log::warn("%s", w.c_str());
        res.warnings.push_back(w);
        BMR_TRY(reclone(CacheAction::Recloned));
    } else {
        auto existing = CacheEntry::read(path);
        if (existing.is_err()) {
            std::string w = existing.error().message + "; re-cloning";
            log::warn("%s", w.c_str());
            res.warnings.push_back(w);
            BMR_TRY(reclone(CacheAction::Recloned));
        } else if (!existing.value().matches(spec)) {
            log::info("cache entry %s belongs to %s, not %s; re-cloning",
                      path.c_str(), existing.value().source.c_str(),
                      spec.canonical().c_str());
            BMR_TRY(reclone(CacheAction::Recloned));
        } else {
            res.entry = std::move(existing).value();
            res.action = CacheAction::Reused;
            int64_t now = now_seconds();

            bool stale = now - res.entry.last_fetched_at > options_.ttl_seconds;
            if (options_.auto_update && stale && !spec.ref_is_commit()) {
                log::info("updating %s", spec.canonical().c_str());
                auto updated = git_.fetch_fast_forward(path, spec.ref_or_head());
                if (updated.is_ok()) {
                    auto head = git_.head_commit(path);
                    if (head.is_ok()) {
                        if (head.value() != res.entry.commit) {
                            res.action = CacheAction::Updated;
                        }
                        res.entry.commit = head.value();
                    }
                    res.entry.last_fetched_at = now;
                    res.entry.size_on_disk = directory_size(path);
                } else {
                    std::string w = "update of " + spec.canonical() + " failed (" +
                        updated.error().message + "); serving cached commit " +
                        res.entry.commit.substr(0, 12);
                    log::warn("%s", w.c_str());
                    res.warnings.push_back(w);
                }
            }

            res.entry.last_validated_at = now;
            auto written = res.entry.write(path);
            if (written.is_err()) {
                log::warn("%s", written.error().message.c_str());
                res.warnings.push_back(written.error().message);
            }
        }
    }

    res.entry.local_path = path;
    res.content_path = path;
    if (spec.subpath) {
        res.content_path = (fs::path(path) / *spec.subpath).string();
    }
    log::debug("%s -> %s [%s]", spec.canonical().c_str(), res.content_path.c_str(),
               action_name(res.action));
    return Result<CacheResolution>::ok(std::move(res));
}

Result<std::vector<CacheEntry>> GitCacheManager::list() const {
    std::vector<CacheEntry> entries;
    std::error_code ec;
    if (!fs::exists(options_.root, ec)) {
        return Result<std::vector<CacheEntry>>::ok(std::move(entries));
    }

    fs::directory_iterator it(options_.root, ec);
    if (ec) {
        return BmrError{BmrError::IO,
            "cannot list cache root " + options_.root + ": " + ec.message()};
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::string name = it->path().filename().string();
        if (name.empty() || name[0] == '.') continue;
        std::error_code dec;
        if (!it->is_directory(dec)) continue;

        auto entry = CacheEntry::read(it->path().string());
        if (entry.is_err()) {
            log::debug("skipping %s: %s", name.c_str(), entry.error().message.c_str());
            continue;
        }
        entries.push_back(std::move(entry).value());
    }

    std::sort(entries.begin(), entries.end(),
              [](const CacheEntry& a, const CacheEntry& b) {
                  return a.local_path < b.local_path;
              });
    return Result<std::vector<CacheEntry>>::ok(std::move(entries));
}

Status GitCacheManager::evict(const RemoteSpec& spec) {
    auto lock = KeyLock::acquire(lock_path(spec), options_.timeout_seconds);
    if (lock.is_err()) return std::move(lock).error();
    remove_stale_temps(derive_cache_key(spec));

    std::string path = entry_path(spec);
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        return BmrError{BmrError::IO,
            "failed to evict " + path + ": " + ec.message()};
    }
    log::info("evicted %s", spec.canonical().c_str());
    return ok_status();
}

Status GitCacheManager::clean_all() {
    std::error_code ec;
    fs::remove_all(options_.root, ec);
    if (ec) {
        return BmrError{BmrError::IO,
            "failed to clean cache: " + ec.message()};
    }
    return ok_status();
}

} // namespace bmr
