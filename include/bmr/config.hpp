#pragma once

#include <bmr/result.hpp>
#include <bmr/log.hpp>
#include <bmr/remote.hpp>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bmr {

enum class DiscoveryMode { Normal, Strict };

const char* mode_name(DiscoveryMode m);

// Clone cache settings handed to GitCacheManager
struct CacheOptions {
    std::string root;
    bool auto_update = true;
    long ttl_seconds = 3600;
    int timeout_seconds = 120;
    // URL prefix -> replacement, applied by git (url.<replacement>.insteadOf)
    std::map<std::string, std::string> mirrors;
};

// Fully resolved configuration, passed by value to the resolver
struct ResolverConfig {
    std::vector<std::string> explicit_paths;
    std::vector<std::string> remotes;     // specs or "@name[:path]"
    NamedRemotes named_remotes;
    DiscoveryMode mode = DiscoveryMode::Normal;
    std::string project_root;
    std::string user_root;
    bool include_user = true;
    int max_depth = 3;
    std::vector<std::string> exclude_dirs;
    CacheOptions cache;
    log::Level log_level = log::Info;

    static std::vector<std::string> default_excludes();
};

// One configuration layer. Unset fields leave lower layers untouched on merge.
// Layers: global (~/.bmr/config.toml) -> project (<root>/.bmr.toml) -> environment
struct Config {
    std::optional<DiscoveryMode> mode;
    std::optional<std::vector<std::string>> paths;
    std::optional<int> max_depth;
    std::optional<std::vector<std::string>> exclude;
    std::optional<std::string> user_root;
    std::optional<bool> include_user;

    std::optional<std::vector<std::string>> remotes;
    std::optional<std::string> cache_dir;
    std::optional<bool> auto_update;
    std::optional<long> ttl_seconds;
    std::optional<int> timeout_seconds;
    std::map<std::string, std::string> mirrors;
    NamedRemotes named_remotes;

    std::optional<log::Level> log_level;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Read BMR_* variables through `lookup` (defaults to std::getenv)
    static Result<Config> from_env(
        const std::function<const char*(const char*)>& lookup = nullptr);

    // Merge another layer on top (other's set values override this)
    void merge(const Config& other);

    // Build effective layer: global -> project -> env
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project,
                            const std::optional<Config>& env);

    // Apply defaults and expand "~" and relative paths against project_root
    ResolverConfig resolve(const std::string& project_root) const;
};

// ~/.bmr/config.toml, or "" when HOME is unset
std::string global_config_path();

// <project_root>/.bmr.toml
std::string project_config_path(const std::string& project_root);

// Read global and project files (when present) plus the environment and
// resolve them for `project_root`.
Result<ResolverConfig> load_effective_config(const std::string& project_root);

// "~" or "~/x" -> $HOME or $HOME/x
std::string expand_home(const std::string& path);

} // namespace bmr
